#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <type_traits>

#include "flowline/buffer/frame.hpp"


namespace flowline::buffer {

// -----------------------------------------------------------------------------
// Handler verdict for one delivered fragment
// -----------------------------------------------------------------------------
enum class FragmentResult : std::uint8_t {
    Consume,    // advance past the fragment
    Postpone,   // stop polling; cursor stays on the fragment
    Failed      // flag the fragment FAILED and advance
};

[[nodiscard]]
inline constexpr std::string_view to_string(FragmentResult r) noexcept {
    switch (r) {
        case FragmentResult::Consume:  return "Consume";
        case FragmentResult::Postpone: return "Postpone";
        case FragmentResult::Failed:   return "Failed";
        default:                       return "Unknown";
    }
}

// -----------------------------------------------------------------------------
// Fragment
// -----------------------------------------------------------------------------
// Read-only view over one committed frame inside the ring buffer memory.
// Valid only for the duration of the handler call (poll) or until the
// owning BlockPeek is resolved.
class Fragment {
public:
    Fragment() noexcept = default;

    // frame points at the header; pos is the frame's buffer position
    Fragment(const std::byte* frame, std::int64_t pos) noexcept
        : frame_(frame)
        , position_(pos)
    {}

    [[nodiscard]] inline std::size_t length() const noexcept { return read_length(frame_); }

    [[nodiscard]] inline std::int32_t stream_id() const noexcept { return read_stream_id(frame_); }

    [[nodiscard]] inline std::span<const std::byte> payload() const noexcept {
        return { frame_ + HEADER_LENGTH, length() };
    }

    [[nodiscard]] inline const std::byte* data() const noexcept { return frame_ + HEADER_LENGTH; }

    [[nodiscard]] inline std::string_view as_string() const noexcept {
        return { reinterpret_cast<const char*>(data()), length() };
    }

    // Flagged FAILED by some subscription
    [[nodiscard]] inline bool is_failed() const noexcept {
        return (status_flags(load_status(frame_)) & flag::FAILED) != 0;
    }

    // Buffer position of the frame header
    [[nodiscard]] inline std::int64_t position() const noexcept { return position_; }

    // Position right after the frame
    [[nodiscard]] inline std::int64_t next_position() const noexcept {
        return position_ + static_cast<std::int64_t>(framed_length(length()));
    }

    [[nodiscard]] inline const std::byte* frame() const noexcept { return frame_; }

private:
    const std::byte* frame_ = nullptr;
    std::int64_t position_ = 0;
};

// -----------------------------------------------------------------------------
// Handler concept for Subscription::poll
// -----------------------------------------------------------------------------
template<class H>
concept FragmentHandler =
    std::invocable<H&, const Fragment&> &&
    std::same_as<std::invoke_result_t<H&, const Fragment&>, FragmentResult>;

} // namespace flowline::buffer
