#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace flowline::config {

/*
===============================================================================
Compile-time defaults
===============================================================================

Every tunable of the buffer, dispatcher and scheduler has its default here.
Runtime structs (DispatcherConfig, SchedulerConfig) start from these values
and may be overridden programmatically or from a JSON document.
===============================================================================
*/

// -----------------------------------------------------------------------------
// Dispatcher / ring buffer
// -----------------------------------------------------------------------------
inline constexpr std::size_t default_buffer_size       = 1 << 20; // 1 MB
inline constexpr std::size_t min_buffer_size           = 1 << 10; // 1 KB
inline constexpr std::size_t max_buffer_size           = 1 << 30; // 1 GB
inline constexpr std::size_t default_max_subscriptions = 16;
inline constexpr std::size_t max_subscriptions_limit   = 1024;

// Largest framed fragment relative to capacity (C / 8)
inline constexpr std::size_t max_fragment_divisor      = 8;

// -----------------------------------------------------------------------------
// Actor scheduler
// -----------------------------------------------------------------------------
inline constexpr std::size_t default_worker_threads    = 2;
inline constexpr std::size_t max_worker_threads        = 1024;

// Jobs an actor may run before it goes back to the run queue
inline constexpr std::size_t default_job_budget        = 64;

// Busy workers poll consume conditions after this many executed tasks
inline constexpr std::size_t default_condition_poll_interval = 32;

// Idle worker backoff
inline constexpr std::size_t default_idle_spins        = 64;
inline constexpr std::size_t default_idle_yields       = 16;
inline constexpr std::chrono::microseconds default_min_park{20};
inline constexpr std::chrono::microseconds default_max_park{1000};
inline constexpr std::chrono::microseconds max_park_limit = std::chrono::seconds(1);

// Consume conditions that make no progress are skipped for 2^n poll rounds,
// n capped at this exponent.
inline constexpr std::uint32_t max_consume_backoff_exponent = 10;

inline constexpr std::chrono::milliseconds default_shutdown_timeout{5000};
inline constexpr std::chrono::milliseconds max_shutdown_timeout = std::chrono::hours(1);

} // namespace flowline::config
