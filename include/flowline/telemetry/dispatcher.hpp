#pragma once

#include <ostream>
#include <type_traits>

#include "lcr/metrics/atomic/counter.hpp"
#include "lcr/format.hpp"

namespace flowline::telemetry {

// ============================================================================
// Dispatcher Telemetry
//
// Mechanical facts observed by the ring buffer, dispatcher and subscriptions.
// Updated with relaxed atomics from producer and consumer threads.
// ============================================================================

struct alignas(64) Dispatcher final {
    // ---------------------------------------------------------------------
    // Producer side
    // ---------------------------------------------------------------------

    // Fragments published through offer()
    lcr::metrics::atomic::counter64 offers_total;

    // Reservations handed out by claim()
    lcr::metrics::atomic::counter64 claims_total;

    // Claims made visible / discarded
    lcr::metrics::atomic::counter64 commits_total;
    lcr::metrics::atomic::counter64 aborts_total;

    // Claims destroyed while still open (aborted on the producer's behalf)
    lcr::metrics::atomic::counter64 claims_leaked_total;

    // Padding frames written at the buffer boundary
    lcr::metrics::atomic::counter64 padding_frames_total;

    // Bytes reserved (headers, payload, padding)
    lcr::metrics::atomic::counter64 bytes_reserved_total;

    // Consumed bytes zeroed ahead of reuse
    lcr::metrics::atomic::counter64 bytes_cleaned_total;

    // ---------------------------------------------------------------------
    // Rejections
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter64 backpressure_total;
    lcr::metrics::atomic::counter64 insufficient_capacity_total;
    lcr::metrics::atomic::counter64 closed_rejections_total;

    // ---------------------------------------------------------------------
    // Consumer side
    // ---------------------------------------------------------------------

    // Fragments handed to poll() handlers and consumed
    lcr::metrics::atomic::counter64 fragments_consumed_total;

    // Fragments flagged FAILED by handlers or peeks
    lcr::metrics::atomic::counter64 fragments_failed_total;

    // Blocks resolved via mark_completed()
    lcr::metrics::atomic::counter64 blocks_completed_total;

    // poll()/peek_block() attempted while a peek was unresolved
    lcr::metrics::atomic::counter64 peek_violations_total;

    // ---------------------------------------------------------------------
    // Registry
    // ---------------------------------------------------------------------

    lcr::metrics::atomic::counter32 subscriptions_opened_total;
    lcr::metrics::atomic::counter32 subscriptions_closed_total;

    // ---------------------------------------------------------------------
    // Snapshot support
    // ---------------------------------------------------------------------

    inline void copy_to(Dispatcher& other) const noexcept {
        offers_total.copy_to(other.offers_total);
        claims_total.copy_to(other.claims_total);
        commits_total.copy_to(other.commits_total);
        aborts_total.copy_to(other.aborts_total);
        claims_leaked_total.copy_to(other.claims_leaked_total);
        padding_frames_total.copy_to(other.padding_frames_total);
        bytes_reserved_total.copy_to(other.bytes_reserved_total);
        bytes_cleaned_total.copy_to(other.bytes_cleaned_total);

        backpressure_total.copy_to(other.backpressure_total);
        insufficient_capacity_total.copy_to(other.insufficient_capacity_total);
        closed_rejections_total.copy_to(other.closed_rejections_total);

        fragments_consumed_total.copy_to(other.fragments_consumed_total);
        fragments_failed_total.copy_to(other.fragments_failed_total);
        blocks_completed_total.copy_to(other.blocks_completed_total);
        peek_violations_total.copy_to(other.peek_violations_total);

        subscriptions_opened_total.copy_to(other.subscriptions_opened_total);
        subscriptions_closed_total.copy_to(other.subscriptions_closed_total);
    }

    inline void debug_dump(std::ostream& os) const {
        os << "\n=== Dispatcher Telemetry ===\n";

        os << "Producers\n";
        os << "  Offers                : " << lcr::format_number_exact(offers_total.load()) << '\n';
        os << "  Claims                : " << lcr::format_number_exact(claims_total.load()) << '\n';
        os << "  Commits               : " << lcr::format_number_exact(commits_total.load()) << '\n';
        os << "  Aborts                : " << lcr::format_number_exact(aborts_total.load()) << '\n';
        os << "  Leaked claims         : " << lcr::format_number_exact(claims_leaked_total.load()) << '\n';
        os << "  Padding frames        : " << lcr::format_number_exact(padding_frames_total.load()) << '\n';
        os << "  Bytes reserved        : " << lcr::format_bytes_scaled(bytes_reserved_total.load()) << '\n';
        os << "  Bytes cleaned         : " << lcr::format_bytes_scaled(bytes_cleaned_total.load()) << '\n';

        os << "\nRejections\n";
        os << "  Backpressure          : " << lcr::format_number_exact(backpressure_total.load()) << '\n';
        os << "  Insufficient capacity : " << lcr::format_number_exact(insufficient_capacity_total.load()) << '\n';
        os << "  Closed                : " << lcr::format_number_exact(closed_rejections_total.load()) << '\n';

        os << "\nConsumers\n";
        os << "  Fragments consumed    : " << lcr::format_number_exact(fragments_consumed_total.load()) << '\n';
        os << "  Fragments failed      : " << lcr::format_number_exact(fragments_failed_total.load()) << '\n';
        os << "  Blocks completed      : " << lcr::format_number_exact(blocks_completed_total.load()) << '\n';
        os << "  Peek violations       : " << lcr::format_number_exact(peek_violations_total.load()) << '\n';

        os << "\nSubscriptions\n";
        os << "  Opened                : " << lcr::format_number_exact(subscriptions_opened_total.load()) << '\n';
        os << "  Closed                : " << lcr::format_number_exact(subscriptions_closed_total.load()) << '\n';
    }
};

// -------------------------------------------------------------------------
// Invariants
// -------------------------------------------------------------------------
static_assert(std::is_standard_layout_v<Dispatcher>, "telemetry::Dispatcher must be standard layout");
static_assert(!std::is_polymorphic_v<Dispatcher>, "telemetry::Dispatcher must not be polymorphic");
static_assert(alignof(Dispatcher) == 64, "telemetry::Dispatcher must be cache-line aligned");

} // namespace flowline::telemetry
