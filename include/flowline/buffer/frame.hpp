/*
===============================================================================
 Fragment framing
===============================================================================

Every fragment written into the ring buffer is preceded by a 16-byte header:

    0               4               8                              16
    +---------------+---------------+-------------------------------+
    | length (u32)  | stream_id(i32)| status (u64, atomic)          |
    +---------------+---------------+-------------------------------+
    | payload ... (length bytes), zero-padded to FRAME_ALIGNMENT    |
    +---------------------------------------------------------------+

status = (lap << 32) | flags

  lap    = frame start position / capacity (truncated to 32 bits)
  flags  = COMMITTED [| PADDING] [| FAILED]

A frame is visible to readers only when the status word carries the lap of
the reader's position AND the COMMITTED bit. Headers left over from the
previous lap therefore stay invisible without the buffer ever being zeroed.

The status word is always the last thing a producer writes (release), and
the first thing a reader looks at (acquire).

A remainder at the end of the buffer that is shorter than a header cannot
carry a padding frame; readers skip it implicitly.
===============================================================================
*/

#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <cstring>


namespace flowline::buffer {

inline constexpr std::size_t FRAME_ALIGNMENT  = 8;
inline constexpr std::size_t HEADER_LENGTH    = 16;

inline constexpr std::size_t LENGTH_OFFSET    = 0;
inline constexpr std::size_t STREAM_ID_OFFSET = 4;
inline constexpr std::size_t STATUS_OFFSET    = 8;

// -----------------------------------------------------------------------------
// Status flags
// -----------------------------------------------------------------------------
namespace flag {
inline constexpr std::uint32_t COMMITTED = 1u << 0;  // visible; no other flag = NONE
inline constexpr std::uint32_t PADDING   = 1u << 1;  // skip, never deliver
inline constexpr std::uint32_t FAILED    = 1u << 2;  // consumer marked it failed
} // namespace flag

// -----------------------------------------------------------------------------
// Producer return codes
// -----------------------------------------------------------------------------
// Non-negative values are post-write positions.
namespace position {
inline constexpr std::int64_t INSUFFICIENT_CAPACITY = -1;
inline constexpr std::int64_t BACKPRESSURED         = -2;
inline constexpr std::int64_t CLOSED                = -3;
} // namespace position


[[nodiscard]]
inline constexpr std::size_t align_frame(std::size_t length) noexcept {
    return (length + (FRAME_ALIGNMENT - 1)) & ~(FRAME_ALIGNMENT - 1);
}

[[nodiscard]]
inline constexpr std::size_t framed_length(std::size_t payload_length) noexcept {
    return align_frame(HEADER_LENGTH + payload_length);
}

[[nodiscard]]
inline constexpr std::uint64_t make_status(std::uint32_t lap, std::uint32_t flags) noexcept {
    return (static_cast<std::uint64_t>(lap) << 32) | flags;
}

[[nodiscard]]
inline constexpr std::uint32_t status_lap(std::uint64_t status) noexcept {
    return static_cast<std::uint32_t>(status >> 32);
}

[[nodiscard]]
inline constexpr std::uint32_t status_flags(std::uint64_t status) noexcept {
    return static_cast<std::uint32_t>(status);
}

// -----------------------------------------------------------------------------
// Raw header accessors over the buffer memory
// -----------------------------------------------------------------------------
// Plain fields are written before the status release and read after the
// status acquire, so memcpy is sufficient for them.

[[nodiscard]]
inline std::uint32_t read_length(const std::byte* frame) noexcept {
    std::uint32_t v;
    std::memcpy(&v, frame + LENGTH_OFFSET, sizeof(v));
    return v;
}

[[nodiscard]]
inline std::int32_t read_stream_id(const std::byte* frame) noexcept {
    std::int32_t v;
    std::memcpy(&v, frame + STREAM_ID_OFFSET, sizeof(v));
    return v;
}

inline void write_length(std::byte* frame, std::uint32_t length) noexcept {
    std::memcpy(frame + LENGTH_OFFSET, &length, sizeof(length));
}

inline void write_stream_id(std::byte* frame, std::int32_t stream_id) noexcept {
    std::memcpy(frame + STREAM_ID_OFFSET, &stream_id, sizeof(stream_id));
}

[[nodiscard]]
inline std::atomic_ref<std::uint64_t> status_of(std::byte* frame) noexcept {
    return std::atomic_ref<std::uint64_t>(*reinterpret_cast<std::uint64_t*>(frame + STATUS_OFFSET));
}

[[nodiscard]]
inline std::uint64_t load_status(const std::byte* frame) noexcept {
    return status_of(const_cast<std::byte*>(frame)).load(std::memory_order_acquire);
}

static_assert(HEADER_LENGTH % FRAME_ALIGNMENT == 0, "header must keep frames aligned");
static_assert(STATUS_OFFSET % alignof(std::uint64_t) == 0, "status word must be naturally aligned");
static_assert(std::atomic_ref<std::uint64_t>::is_always_lock_free, "status word must be lock-free");

} // namespace flowline::buffer
