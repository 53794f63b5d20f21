#pragma once

#include <chrono>
#include <cstddef>
#include <string>

#include "flowline/config/defaults.hpp"

namespace flowline::actor {

// -----------------------------------------------------------------------------
// Runtime configuration of an ActorScheduler
// -----------------------------------------------------------------------------
struct SchedulerConfig {
    std::string name = "scheduler";

    std::size_t worker_threads = config::default_worker_threads;

    // Jobs an actor may run per slice before it is requeued
    std::size_t job_budget = config::default_job_budget;

    // Busy workers poll consume conditions every N executed tasks
    std::size_t condition_poll_interval = config::default_condition_poll_interval;

    // Idle worker backoff (spin, then yield, then park with doubling timeout)
    std::size_t idle_spins = config::default_idle_spins;
    std::size_t idle_yields = config::default_idle_yields;
    std::chrono::microseconds min_park = config::default_min_park;
    std::chrono::microseconds max_park = config::default_max_park;

    // stop() waits this long for actors to close before joining workers
    std::chrono::milliseconds shutdown_timeout = config::default_shutdown_timeout;

    [[nodiscard]] bool is_valid() const noexcept {
        return worker_threads > 0
            && worker_threads <= config::max_worker_threads
            && job_budget > 0
            && condition_poll_interval > 0
            && min_park.count() > 0
            && max_park >= min_park
            && max_park <= config::max_park_limit
            && shutdown_timeout.count() >= 0
            && shutdown_timeout <= config::max_shutdown_timeout;
    }
};

} // namespace flowline::actor
