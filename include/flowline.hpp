#pragma once

/*
===============================================================================
flowline — Public API Entry Point
===============================================================================

In-process message dispatcher and cooperative actor runtime.

  flowline::dispatcher   ring buffer publish/subscribe (offer, claim, poll,
                         block peek)
  flowline::actor        actor scheduler, actor control, futures
  flowline::config       defaults and JSON configuration loading
===============================================================================
*/

#include <flowline/error.hpp>
#include <flowline/actor/actor.hpp>
#include <flowline/actor/control.hpp>
#include <flowline/actor/future.hpp>
#include <flowline/actor/scheduler.hpp>
#include <flowline/buffer/claimed_fragment.hpp>
#include <flowline/buffer/fragment.hpp>
#include <flowline/config/loader.hpp>
#include <flowline/dispatcher/block_peek.hpp>
#include <flowline/dispatcher/builder.hpp>
#include <flowline/dispatcher/dispatcher.hpp>
#include <flowline/dispatcher/subscription.hpp>
#include <flowline/integrity/digest.hpp>
