#pragma once

#include <cstdint>
#include <string_view>

namespace flowline {

/*
===============================================================================
 flowline::Error
===============================================================================

Error classification shared by the buffer, dispatcher and actor runtime.

Buffer and dispatcher paths never throw: they report through sentinel
positions (see buffer::position) or by returning an Error. Actor-level
failures are caught at the job boundary and surface as Error::ActorFailure
on the affected futures.
===============================================================================
*/

enum class Error : std::uint8_t {
    None = 0,

    // --- Recoverable producer conditions (caller retries / yields) ----------
    Backpressure,         // Write would overtake the slowest subscription
    InsufficientCapacity, // Fragment can never fit into the buffer

    // --- Lifecycle ----------------------------------------------------------
    Closed,               // Dispatcher / subscription / scheduler already closed
    ActorClosed,          // Job submitted to an actor that no longer accepts work

    // --- Contract violations (caller responsibility) ------------------------
    ClaimNotCommitted,    // Claim released without commit() or abort()
    InvalidState,         // Operation not allowed in the current state
    InvalidConfig,        // Configuration rejected during validation

    // --- Failures -----------------------------------------------------------
    ActorFailure,         // Job raised an unhandled exception
    FragmentFailed,       // Consumer flagged a fragment as failed
    Timeout               // Bounded wait expired
};


[[nodiscard]]
inline constexpr std::string_view to_string(Error err) noexcept {
    switch (err) {
    case Error::None:                 return "None";
    case Error::Backpressure:         return "Backpressure";
    case Error::InsufficientCapacity: return "InsufficientCapacity";
    case Error::Closed:               return "Closed";
    case Error::ActorClosed:          return "ActorClosed";
    case Error::ClaimNotCommitted:    return "ClaimNotCommitted";
    case Error::InvalidState:         return "InvalidState";
    case Error::InvalidConfig:        return "InvalidConfig";
    case Error::ActorFailure:         return "ActorFailure";
    case Error::FragmentFailed:       return "FragmentFailed";
    case Error::Timeout:              return "Timeout";
    default:                          return "Unknown";
    }
}

} // namespace flowline
