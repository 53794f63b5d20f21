#pragma once

#include <functional>
#include <utility>

namespace flowline::actor {

// One pending slice of actor logic.
// Discarded after it runs, unless it is an unfinished run-until-done job.
struct ActorJob {
    std::function<void()> fn;
    bool until_done = false;

    ActorJob() = default;

    ActorJob(std::function<void()> f, bool run_until_done = false)
        : fn(std::move(f))
        , until_done(run_until_done)
    {}
};

} // namespace flowline::actor
