#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace flowline::telemetry {

// ============================================================================
// Scheduler Telemetry
//
// Mechanical facts observed by the worker pool and the actor tasks.
// ============================================================================

struct alignas(64) Scheduler final {
    // ---------------------------------------------------------------------
    // Actors
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter64 actors_submitted_total;
    lcr::metrics::atomic::counter64 actors_closed_total;
    lcr::metrics::atomic::counter64 actor_failures_total;

    // Jobs rejected with ActorClosed
    lcr::metrics::atomic::counter64 jobs_rejected_total;

    // ---------------------------------------------------------------------
    // Execution
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter64 jobs_executed_total;
    lcr::metrics::atomic::counter64 consumer_runs_total;
    lcr::metrics::atomic::counter64 slices_total;
    lcr::metrics::atomic::counter64 yields_total;

    // ---------------------------------------------------------------------
    // Workers
    // ---------------------------------------------------------------------
    lcr::metrics::atomic::counter64 condition_polls_total;
    lcr::metrics::atomic::counter64 condition_wakeups_total;
    lcr::metrics::atomic::counter64 parks_total;

    // Largest run queue depth observed
    lcr::metrics::atomic::counter64 run_queue_high_watermark;

    inline void copy_to(Scheduler& other) const noexcept {
        actors_submitted_total.copy_to(other.actors_submitted_total);
        actors_closed_total.copy_to(other.actors_closed_total);
        actor_failures_total.copy_to(other.actor_failures_total);
        jobs_rejected_total.copy_to(other.jobs_rejected_total);

        jobs_executed_total.copy_to(other.jobs_executed_total);
        consumer_runs_total.copy_to(other.consumer_runs_total);
        slices_total.copy_to(other.slices_total);
        yields_total.copy_to(other.yields_total);

        condition_polls_total.copy_to(other.condition_polls_total);
        condition_wakeups_total.copy_to(other.condition_wakeups_total);
        parks_total.copy_to(other.parks_total);
        run_queue_high_watermark.copy_to(other.run_queue_high_watermark);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Scheduler Telemetry ===\n";

        os << "Actors\n";
        os << "  Submitted             : " << lcr::format_number_exact(actors_submitted_total.load()) << '\n';
        os << "  Closed                : " << lcr::format_number_exact(actors_closed_total.load()) << '\n';
        os << "  Failed                : " << lcr::format_number_exact(actor_failures_total.load()) << '\n';
        os << "  Rejected jobs         : " << lcr::format_number_exact(jobs_rejected_total.load()) << '\n';

        os << "\nExecution\n";
        os << "  Jobs executed         : " << lcr::format_number_exact(jobs_executed_total.load()) << '\n';
        os << "  Consumer runs         : " << lcr::format_number_exact(consumer_runs_total.load()) << '\n';
        os << "  Slices                : " << lcr::format_number_exact(slices_total.load()) << '\n';
        os << "  Yields                : " << lcr::format_number_exact(yields_total.load()) << '\n';

        os << "\nWorkers\n";
        os << "  Condition polls       : " << lcr::format_number_exact(condition_polls_total.load()) << '\n';
        os << "  Condition wake-ups    : " << lcr::format_number_exact(condition_wakeups_total.load()) << '\n';
        os << "  Parks                 : " << lcr::format_number_exact(parks_total.load()) << '\n';
        os << "  Run queue high-water  : " << lcr::format_number_exact(run_queue_high_watermark.load()) << '\n';
    }
};

static_assert(std::is_standard_layout_v<Scheduler>, "telemetry::Scheduler must be standard layout");
static_assert(alignof(Scheduler) == 64, "telemetry::Scheduler must be cache-line aligned");

} // namespace flowline::telemetry
