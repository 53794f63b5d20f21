#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <span>

#include "flowline/buffer/fragment.hpp"
#include "flowline/buffer/frame.hpp"
#include "flowline/error.hpp"


namespace flowline::dispatcher {

class Subscription;

/*
===============================================================================
BlockPeek
===============================================================================

Zero-copy view over a contiguous run of committed fragments, filled by
Subscription::peek_block().

  - The block starts at the subscription cursor and never crosses the end
    of the buffer, so data() is one contiguous byte range (headers included).
  - Iterating the block yields buffer::Fragment views.
  - The subscription cursor does not move while the peek is pending; poll()
    and peek_block() on the same subscription return 0 until it is resolved.

Resolution, exactly once per peek:

  mark_completed()               cursor advances past the block
  mark_failed(flag_fragments)    cursor unchanged; fragments optionally
                                 flagged FAILED

A second resolution returns Error::InvalidState. A BlockPeek destroyed while
pending releases the subscription with mark_failed(false). A subscription
destroyed first (with its dispatcher) detaches the peek: it stops being
pending and its data must no longer be read.

Not thread-safe; owned by the subscription's reader.
===============================================================================
*/

class BlockPeek {
public:
    // -------------------------------------------------------------------------
    // Fragment iteration
    // -------------------------------------------------------------------------
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = buffer::Fragment;
        using difference_type = std::ptrdiff_t;
        using pointer = void;
        using reference = buffer::Fragment;

        iterator() noexcept = default;

        iterator(const std::byte* frame, std::int64_t pos) noexcept
            : frame_(frame)
            , position_(pos)
        {}

        [[nodiscard]] buffer::Fragment operator*() const noexcept { return { frame_, position_ }; }

        iterator& operator++() noexcept {
            const std::size_t framed = buffer::framed_length(buffer::read_length(frame_));
            frame_ += framed;
            position_ += static_cast<std::int64_t>(framed);
            return *this;
        }

        iterator operator++(int) noexcept {
            iterator tmp = *this;
            ++(*this);
            return tmp;
        }

        [[nodiscard]] bool operator==(const iterator& other) const noexcept {
            return position_ == other.position_;
        }

    private:
        const std::byte* frame_ = nullptr;
        std::int64_t position_ = 0;
    };

    BlockPeek() noexcept = default;
    ~BlockPeek();

    BlockPeek(const BlockPeek&) = delete;
    BlockPeek& operator=(const BlockPeek&) = delete;

    // -------------------------------------------------------------------------
    // Accessors
    // -------------------------------------------------------------------------

    [[nodiscard]] inline bool is_pending() const noexcept { return subscription_ != nullptr; }

    // Raw block (frames with headers)
    [[nodiscard]] inline std::span<const std::byte> data() const noexcept {
        return { data_, length() };
    }

    [[nodiscard]] inline std::size_t length() const noexcept {
        return static_cast<std::size_t>(end_position_ - position_);
    }

    [[nodiscard]] inline std::size_t fragment_count() const noexcept { return fragment_count_; }

    [[nodiscard]] inline std::int32_t stream_id() const noexcept { return stream_id_; }

    [[nodiscard]] inline std::int64_t position() const noexcept { return position_; }

    [[nodiscard]] inline std::int64_t end_position() const noexcept { return end_position_; }

    [[nodiscard]] inline iterator begin() const noexcept { return { data_, position_ }; }

    [[nodiscard]] inline iterator end() const noexcept { return { data_ + length(), end_position_ }; }

    // -------------------------------------------------------------------------
    // Resolution
    // -------------------------------------------------------------------------

    Error mark_completed() noexcept;

    Error mark_failed(bool flag_fragments = true) noexcept;

private:
    friend class Subscription;

    void reset_(Subscription* subscription,
                const std::byte* data,
                std::int64_t position,
                std::int64_t end_position,
                std::size_t fragment_count,
                std::int32_t stream_id) noexcept
    {
        subscription_ = subscription;
        data_ = data;
        position_ = position;
        end_position_ = end_position;
        fragment_count_ = fragment_count;
        stream_id_ = stream_id;
    }

private:
    Subscription* subscription_ = nullptr;
    const std::byte* data_ = nullptr;
    std::int64_t position_ = 0;
    std::int64_t end_position_ = 0;
    std::size_t fragment_count_ = 0;
    std::int32_t stream_id_ = 0;
};

} // namespace flowline::dispatcher
