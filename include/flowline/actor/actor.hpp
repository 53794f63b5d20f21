#pragma once

#include <string_view>

namespace flowline::actor {

class ActorControl;

/*
===============================================================================
Actor
===============================================================================

Capability interface of a unit of single-threaded logic run by the
ActorScheduler. Every hook runs as a job of the actor, never concurrently
with another job of the same actor, and receives the actor's control
surface.

Lifecycle hooks, in order:

  on_actor_starting          scheduled on submit_actor()
  on_actor_started           once the starting jobs (and awaits) drained
  on_actor_close_requested   close() accepted
  on_actor_closing           close-requested jobs drained
  on_actor_closed            last call; the actor never runs again

on_actor_failed runs when a job throws. The actor is then driven to CLOSED
without further user jobs.
===============================================================================
*/

class Actor {
public:
    virtual ~Actor() = default;

    [[nodiscard]] virtual std::string_view name() const noexcept = 0;

    virtual void on_actor_starting(ActorControl&) {}
    virtual void on_actor_started(ActorControl&) {}
    virtual void on_actor_close_requested(ActorControl&) {}
    virtual void on_actor_closing(ActorControl&) {}
    virtual void on_actor_closed(ActorControl&) {}
    virtual void on_actor_failed(ActorControl&, std::string_view /*reason*/) {}
};

} // namespace flowline::actor
