#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <utility>

namespace flowline::buffer {

class RingBuffer;

/*
===============================================================================
ClaimedFragment
===============================================================================

A producer-owned reservation inside the ring buffer, handed out by claim().

The reservation is a value: (ring, frame start position, payload length).
Until commit() or abort() the producer has exclusive write access to the
payload bytes, and readers cannot observe the frame.

  commit()  makes the fragment visible at its buffer position
  abort()   turns the frame into padding; readers skip it

Exactly one of the two must be called. A claim that is destroyed (or
reused for another claim) while still open is a ClaimNotCommitted
contract violation: it is logged, counted, and aborted so the space is
not lost.

Move-only. Not thread-safe; owned by the producer that claimed it.
===============================================================================
*/

class ClaimedFragment {
public:
    ClaimedFragment() noexcept = default;
    ~ClaimedFragment();

    ClaimedFragment(const ClaimedFragment&) = delete;
    ClaimedFragment& operator=(const ClaimedFragment&) = delete;

    ClaimedFragment(ClaimedFragment&& other) noexcept
        : ring_(std::exchange(other.ring_, nullptr))
        , frame_position_(other.frame_position_)
        , payload_(other.payload_)
    {}

    ClaimedFragment& operator=(ClaimedFragment&& other) noexcept;

    [[nodiscard]] inline bool is_open() const noexcept { return ring_ != nullptr; }

    // Writable payload region (empty once resolved)
    [[nodiscard]] inline std::span<std::byte> buffer() noexcept {
        return is_open() ? payload_ : std::span<std::byte>{};
    }

    [[nodiscard]] inline std::byte* data() noexcept { return buffer().data(); }

    [[nodiscard]] inline std::size_t length() const noexcept { return payload_.size(); }

    // Position of the frame header
    [[nodiscard]] inline std::int64_t frame_position() const noexcept { return frame_position_; }

    // Position right after this fragment (what claim() returned)
    [[nodiscard]] std::int64_t position() const noexcept;

    void commit() noexcept;
    void abort() noexcept;

private:
    friend class RingBuffer;

    // Called when an open claim is dropped without being resolved
    void release_unresolved_() noexcept;

    RingBuffer* ring_ = nullptr;
    std::int64_t frame_position_ = 0;
    std::span<std::byte> payload_{};
};

} // namespace flowline::buffer
