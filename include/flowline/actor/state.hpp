#pragma once

#include <cstdint>
#include <string_view>

namespace flowline::actor {

// -----------------------------------------------------------------------------
// Actor lifecycle
// -----------------------------------------------------------------------------
// NEW → STARTING → STARTED → CLOSE_REQUESTED → CLOSING → CLOSED
//
// Transitions only move forward. A failing actor skips to CLOSE_REQUESTED
// (or straight to CLOSED when it fails while CLOSING).
enum class ActorState : std::uint8_t {
    New,
    Starting,
    Started,
    CloseRequested,
    Closing,
    Closed
};

[[nodiscard]]
inline constexpr std::string_view to_string(ActorState s) noexcept {
    switch (s) {
        case ActorState::New:            return "New";
        case ActorState::Starting:       return "Starting";
        case ActorState::Started:        return "Started";
        case ActorState::CloseRequested: return "CloseRequested";
        case ActorState::Closing:        return "Closing";
        case ActorState::Closed:         return "Closed";
        default:                         return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Scheduling state of an ActorTask
// -----------------------------------------------------------------------------
// Waiting → Queued happens through a CAS, so a task sits in the run queue at
// most once and runs on at most one worker at a time.
enum class SchedulingState : std::uint8_t {
    Waiting,
    Queued,
    Running
};

[[nodiscard]]
inline constexpr std::string_view to_string(SchedulingState s) noexcept {
    switch (s) {
        case SchedulingState::Waiting: return "Waiting";
        case SchedulingState::Queued:  return "Queued";
        case SchedulingState::Running: return "Running";
        default:                       return "Unknown";
    }
}

} // namespace flowline::actor
