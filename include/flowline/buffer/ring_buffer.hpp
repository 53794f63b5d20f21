// -----------------------------------------------------------------------------
// Multi-producer, multi-subscriber byte ring buffer
//
// Producers reserve variable-length frames with a CAS on a 64-bit tail
// position; any number of subscribers read behind it through independent
// cursors registered in subscriber slots.
//
// Example:
//     RingBuffer ring{1 << 20, 1 << 17, 16, telemetry};
//     const int slot = ring.acquire_slot(cursor);
//     ring.offer(payload, stream_id);
//     ...
//     ring.close();
//
// Notes:
//   - Offer / claim / commit never block and never allocate
//   - Exactly one producer wins a given byte range (CAS on the tail)
//   - The status word of a frame is always its last write (see frame.hpp)
//   - Backpressure: the tail never runs more than capacity() bytes ahead
//     of the slowest registered subscriber cursor
//   - Consumed bytes are zeroed before they are reserved again, so a reader
//     never finds a previous lap's bytes between its cursor and the tail
//   - Slot acquisition and release must be serialised by the caller
//     (the dispatcher holds its registry mutex)
// -----------------------------------------------------------------------------
#pragma once

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <new>
#include <span>

#include "flowline/buffer/claimed_fragment.hpp"
#include "flowline/buffer/frame.hpp"
#include "flowline/error.hpp"
#include "flowline/telemetry/dispatcher.hpp"
#include "lcr/backoff.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::buffer {

// Maps a negative producer return code to its error (None for positions)
[[nodiscard]]
inline constexpr Error to_error(std::int64_t result) noexcept {
    if (result >= 0) return Error::None;
    switch (result) {
        case position::INSUFFICIENT_CAPACITY: return Error::InsufficientCapacity;
        case position::BACKPRESSURED:         return Error::Backpressure;
        case position::CLOSED:                return Error::Closed;
        default:                              return Error::InvalidState;
    }
}


class RingBuffer {
public:
    static constexpr std::size_t MEMORY_ALIGNMENT = 64;
    static constexpr int NO_SLOT = -1;

    using Cursor = std::atomic<std::int64_t>;

    // Active slot = non-null pointer to the subscriber's cursor
    struct alignas(64) SubscriberSlot {
        std::atomic<const Cursor*> cursor{nullptr};
    };

    // capacity is rounded down to FRAME_ALIGNMENT.
    // max_fragment_length is the largest payload accepted, clamped so that the
    // framed size stays within capacity / 2 (a frame plus its boundary padding
    // always fits).
    RingBuffer(std::size_t capacity,
               std::size_t max_fragment_length,
               std::size_t max_subscribers,
               telemetry::Dispatcher& telemetry)
        : capacity_(capacity & ~(FRAME_ALIGNMENT - 1))
        , max_payload_length_(std::min({max_fragment_length,
                                        align_down_(capacity_ / 2) - HEADER_LENGTH,
                                        std::size_t{std::numeric_limits<std::uint32_t>::max()}}))
        , max_subscribers_(max_subscribers)
        , memory_(allocate_(capacity_))
        , slots_(std::make_unique<SubscriberSlot[]>(max_subscribers))
        , clean_limit_(static_cast<std::int64_t>(capacity_))
        , telemetry_(telemetry)
    {
        assert(capacity_ >= 4 * HEADER_LENGTH && "ring capacity too small");
    }

    ~RingBuffer() = default;

    // Non-copyable / non-movable
    RingBuffer(const RingBuffer&) = delete;
    RingBuffer& operator=(const RingBuffer&) = delete;

    // ------------------------------------------------------------------------
    // Geometry
    // ------------------------------------------------------------------------

    [[nodiscard]] inline std::size_t capacity() const noexcept { return capacity_; }

    [[nodiscard]] inline std::size_t max_fragment_length() const noexcept { return max_payload_length_; }

    [[nodiscard]] inline std::size_t max_subscribers() const noexcept { return max_subscribers_; }

    [[nodiscard]] inline std::int64_t tail() const noexcept {
        return tail_.load(std::memory_order_acquire);
    }

    // Producers never reserve past this position; everything between the
    // tail and it reads as zero
    [[nodiscard]] inline std::int64_t clean_limit() const noexcept {
        return clean_limit_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::size_t offset_of(std::int64_t pos) const noexcept {
        return static_cast<std::size_t>(pos) % capacity_;
    }

    [[nodiscard]] inline std::uint32_t lap_of(std::int64_t pos) const noexcept {
        return static_cast<std::uint32_t>(static_cast<std::uint64_t>(pos) / capacity_);
    }

    [[nodiscard]] inline std::byte* frame_at(std::int64_t pos) noexcept {
        return memory_.get() + offset_of(pos);
    }

    [[nodiscard]] inline const std::byte* frame_at(std::int64_t pos) const noexcept {
        return memory_.get() + offset_of(pos);
    }

    [[nodiscard]] inline telemetry::Dispatcher& telemetry() noexcept { return telemetry_; }

    // ------------------------------------------------------------------------
    // Producer API
    // ------------------------------------------------------------------------

    // Copies payload into a new frame and commits it.
    // Returns the position after the frame, or a negative position:: code.
    [[nodiscard]]
    std::int64_t offer(std::span<const std::byte> payload, std::int32_t stream_id = 0) noexcept {
        const std::int64_t start = reserve_(payload.size());
        if (start < 0) {
            return start;
        }
        std::byte* frame = frame_at(start);
        write_length(frame, static_cast<std::uint32_t>(payload.size()));
        write_stream_id(frame, stream_id);
        if (!payload.empty()) {
            std::memcpy(frame + HEADER_LENGTH, payload.data(), payload.size());
        }
        status_of(frame).store(make_status(lap_of(start), flag::COMMITTED), std::memory_order_release);
        telemetry_.offers_total.inc();
        publisher_exit_();
        return start + static_cast<std::int64_t>(framed_length(payload.size()));
    }

    // Reserves a frame of `length` payload bytes and hands it to `claim`.
    // The header is pre-written with a pending status; commit() publishes it.
    [[nodiscard]]
    std::int64_t claim(ClaimedFragment& claim, std::size_t length, std::int32_t stream_id = 0) noexcept {
        if (claim.is_open()) {
            claim.release_unresolved_();
        }
        const std::int64_t start = reserve_(length);
        if (start < 0) {
            return start;
        }
        std::byte* frame = frame_at(start);
        write_length(frame, static_cast<std::uint32_t>(length));
        write_stream_id(frame, stream_id);
        status_of(frame).store(make_status(lap_of(start), 0), std::memory_order_relaxed);

        claim.ring_ = this;
        claim.frame_position_ = start;
        claim.payload_ = std::span<std::byte>(frame + HEADER_LENGTH, length);
        telemetry_.claims_total.inc();
        return start + static_cast<std::int64_t>(framed_length(length));
    }

    // ------------------------------------------------------------------------
    // Lifecycle
    // ------------------------------------------------------------------------

    // Refuses further offers/claims and waits until every in-flight offer
    // and claim has been resolved. Idempotent; callable from any thread.
    void close() noexcept {
        bool expected = false;
        if (closed_.compare_exchange_strong(expected, true, std::memory_order_seq_cst)) {
            FL_DEBUG("[BUFFER] Closing ring buffer (" << capacity_ << " bytes).");
        }

        const auto warn_at = std::chrono::steady_clock::now() + std::chrono::seconds(1);
        bool warned = false;
        (void)lcr::adaptive_backoff_until(
            [this] { return publishers_in_flight_.load(std::memory_order_seq_cst) == 0; },
            [&] {
                if (!warned && std::chrono::steady_clock::now() >= warn_at) {
                    warned = true;
                    FL_WARN("[BUFFER] Close is waiting for "
                            << publishers_in_flight_.load(std::memory_order_relaxed)
                            << " unresolved claim(s).");
                }
                return false;
            });
    }

    [[nodiscard]] inline bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline std::int32_t publishers_in_flight() const noexcept {
        return publishers_in_flight_.load(std::memory_order_acquire);
    }

    // ------------------------------------------------------------------------
    // Subscriber slots (caller serialises acquire/release)
    // ------------------------------------------------------------------------

    // Initialises `cursor` to the current tail and registers it in a free slot.
    // The tail is re-read after activation: any reservation that did not see
    // the slot has already completed its CAS, so the final cursor is never
    // more than capacity() bytes behind the tail.
    // Producers may still read a cursor right after its slot is released, so
    // the cursor must stay at a stable address for the ring's lifetime.
    // Holds the cleaner lock: a cleaning pass never overlaps a cursor that
    // is being placed.
    [[nodiscard]] int acquire_slot(Cursor& cursor) noexcept {
        while (cleaning_.exchange(true, std::memory_order_acquire)) {
            lcr::system::cpu_relax();
        }
        int index = NO_SLOT;
        for (std::size_t i = 0; i < max_subscribers_; ++i) {
            SubscriberSlot& slot = slots_[i];
            if (slot.cursor.load(std::memory_order_relaxed) != nullptr) {
                continue;
            }
            cursor.store(tail_.load(std::memory_order_seq_cst), std::memory_order_seq_cst);
            slot.cursor.store(&cursor, std::memory_order_seq_cst);
            cursor.store(tail_.load(std::memory_order_seq_cst), std::memory_order_seq_cst);
            index = static_cast<int>(i);
            break;
        }
        cleaning_.store(false, std::memory_order_release);
        return index;
    }

    void release_slot(int index) noexcept {
        assert(index >= 0 && static_cast<std::size_t>(index) < max_subscribers_);
        slots_[index].cursor.store(nullptr, std::memory_order_seq_cst);
    }

    [[nodiscard]] std::size_t active_slots() const noexcept {
        std::size_t n = 0;
        for (std::size_t i = 0; i < max_subscribers_; ++i) {
            n += slots_[i].cursor.load(std::memory_order_acquire) != nullptr ? 1 : 0;
        }
        return n;
    }

    // Slowest active cursor, or `fallback` when no slot is active
    [[nodiscard]]
    std::int64_t min_subscriber_position(std::int64_t fallback) const noexcept {
        std::int64_t min_pos = std::numeric_limits<std::int64_t>::max();
        for (std::size_t i = 0; i < max_subscribers_; ++i) {
            const Cursor* cursor = slots_[i].cursor.load(std::memory_order_seq_cst);
            if (cursor != nullptr) {
                min_pos = std::min(min_pos, cursor->load(std::memory_order_acquire));
            }
        }
        return (min_pos == std::numeric_limits<std::int64_t>::max()) ? fallback : min_pos;
    }

private:
    friend class ClaimedFragment;

    struct AlignedDelete {
        void operator()(std::byte* p) const noexcept {
            ::operator delete[](p, std::align_val_t{MEMORY_ALIGNMENT});
        }
    };

    static constexpr std::size_t align_down_(std::size_t n) noexcept {
        return n & ~(FRAME_ALIGNMENT - 1);
    }

    static std::unique_ptr<std::byte[], AlignedDelete> allocate_(std::size_t capacity) {
        auto* p = static_cast<std::byte*>(::operator new[](capacity, std::align_val_t{MEMORY_ALIGNMENT}));
        std::memset(p, 0, capacity);
        return std::unique_ptr<std::byte[], AlignedDelete>(p);
    }

    // Registers a publisher and reserves a frame.
    // On success the publisher stays registered until the frame is resolved.
    [[nodiscard]]
    std::int64_t reserve_(std::size_t length) noexcept {
        publishers_in_flight_.fetch_add(1, std::memory_order_seq_cst);
        if (closed_.load(std::memory_order_seq_cst)) [[unlikely]] {
            publisher_exit_();
            telemetry_.closed_rejections_total.inc();
            return position::CLOSED;
        }

        if (length > max_payload_length_) [[unlikely]] {
            publisher_exit_();
            telemetry_.insufficient_capacity_total.inc();
            return position::INSUFFICIENT_CAPACITY;
        }

        const std::size_t framed = framed_length(length);
        std::int64_t tail = tail_.load(std::memory_order_seq_cst);
        bool cleaned = false;
        while (true) {
            const std::size_t remaining = capacity_ - offset_of(tail);
            const std::size_t padding = (framed <= remaining) ? 0 : remaining;
            const std::int64_t new_tail = tail + static_cast<std::int64_t>(padding + framed);

            // The clean limit never passes the slowest cursor + capacity
            if (new_tail > clean_limit_.load(std::memory_order_acquire)) {
                if (!cleaned) {
                    cleaned = true;
                    clean_();
                    tail = tail_.load(std::memory_order_seq_cst);
                    continue;
                }
                publisher_exit_();
                telemetry_.backpressure_total.inc();
                return position::BACKPRESSURED;
            }

            if (tail_.compare_exchange_weak(tail, new_tail, std::memory_order_seq_cst, std::memory_order_seq_cst)) {
                if (padding != 0) {
                    write_padding_(tail, padding);
                }
                telemetry_.bytes_reserved_total.inc(padding + framed);
                return tail + static_cast<std::int64_t>(padding);
            }
            // CAS failed → another producer advanced the tail → retry with updated tail
        }
    }

    // Zeroes the committed bytes every cursor has passed (all committed
    // bytes when no subscriber is registered) and moves the clean limit one
    // capacity past them. One cleaner at a time; a producer that finds the
    // lock taken simply re-checks the limit.
    void clean_() noexcept {
        if (cleaning_.exchange(true, std::memory_order_acquire)) {
            return;
        }
        const std::int64_t from = clean_limit_.load(std::memory_order_relaxed) - static_cast<std::int64_t>(capacity_);
        const std::int64_t tail = tail_.load(std::memory_order_seq_cst);
        const std::int64_t to = committed_prefix_(from, std::min(min_subscriber_position(tail), tail));
        if (to > from) {
            zero_range_(from, to);
            clean_limit_.store(to + static_cast<std::int64_t>(capacity_), std::memory_order_release);
            telemetry_.bytes_cleaned_total.inc(static_cast<std::uint64_t>(to - from));
        }
        cleaning_.store(false, std::memory_order_release);
    }

    // End of the run of committed frames starting at `from`, capped at `bound`.
    // Every status word in the run was written in its own lap: the bytes were
    // zeroed before they were reserved.
    [[nodiscard]]
    std::int64_t committed_prefix_(std::int64_t from, std::int64_t bound) const noexcept {
        std::int64_t pos = from;
        while (pos < bound) {
            const std::size_t remaining = capacity_ - offset_of(pos);
            if (remaining < HEADER_LENGTH) {
                pos += static_cast<std::int64_t>(remaining); // implicit padding
                continue;
            }
            const std::byte* frame = frame_at(pos);
            const std::uint64_t status = load_status(frame);
            if (status_lap(status) != lap_of(pos) || (status_flags(status) & flag::COMMITTED) == 0) {
                break;
            }
            pos += static_cast<std::int64_t>(framed_length(read_length(frame)));
        }
        return std::min(pos, bound);
    }

    void zero_range_(std::int64_t from, std::int64_t to) noexcept {
        const std::size_t offset = offset_of(from);
        const std::size_t n = static_cast<std::size_t>(to - from);
        const std::size_t first = std::min(n, capacity_ - offset);
        std::memset(memory_.get() + offset, 0, first);
        if (n > first) {
            std::memset(memory_.get(), 0, n - first);
        }
    }

    void write_padding_(std::int64_t pos, std::size_t remaining) noexcept {
        if (remaining < HEADER_LENGTH) {
            return; // implicit padding
        }
        std::byte* frame = frame_at(pos);
        write_length(frame, static_cast<std::uint32_t>(remaining - HEADER_LENGTH));
        write_stream_id(frame, 0);
        status_of(frame).store(make_status(lap_of(pos), flag::COMMITTED | flag::PADDING), std::memory_order_release);
        telemetry_.padding_frames_total.inc();
    }

    void resolve_(std::int64_t frame_position, std::uint32_t flags) noexcept {
        status_of(frame_at(frame_position)).store(make_status(lap_of(frame_position), flags), std::memory_order_release);
        publisher_exit_();
    }

    inline void publisher_exit_() noexcept {
        publishers_in_flight_.fetch_sub(1, std::memory_order_seq_cst);
    }

private:
    const std::size_t capacity_;
    const std::size_t max_payload_length_;
    const std::size_t max_subscribers_;

    std::unique_ptr<std::byte[], AlignedDelete> memory_;
    std::unique_ptr<SubscriberSlot[]> slots_;

    alignas(64) std::atomic<std::int64_t> tail_{0};
    alignas(64) std::atomic<std::int32_t> publishers_in_flight_{0};
    std::atomic<bool> closed_{false};

    // Guarded by cleaning_ for writes, read by every producer
    alignas(64) std::atomic<std::int64_t> clean_limit_;
    std::atomic<bool> cleaning_{false};

    telemetry::Dispatcher& telemetry_;
};


// ============================================================================
// ClaimedFragment (needs the complete RingBuffer)
// ============================================================================

inline ClaimedFragment::~ClaimedFragment() {
    if (is_open()) {
        release_unresolved_();
    }
}

inline ClaimedFragment& ClaimedFragment::operator=(ClaimedFragment&& other) noexcept {
    if (this != &other) {
        if (is_open()) {
            release_unresolved_();
        }
        ring_ = std::exchange(other.ring_, nullptr);
        frame_position_ = other.frame_position_;
        payload_ = other.payload_;
    }
    return *this;
}

inline std::int64_t ClaimedFragment::position() const noexcept {
    return frame_position_ + static_cast<std::int64_t>(framed_length(payload_.size()));
}

inline void ClaimedFragment::commit() noexcept {
    assert(is_open() && "commit() on a resolved claim");
    if (!is_open()) return;
    RingBuffer* ring = std::exchange(ring_, nullptr);
    ring->resolve_(frame_position_, flag::COMMITTED);
    ring->telemetry_.commits_total.inc();
}

inline void ClaimedFragment::abort() noexcept {
    assert(is_open() && "abort() on a resolved claim");
    if (!is_open()) return;
    RingBuffer* ring = std::exchange(ring_, nullptr);
    ring->resolve_(frame_position_, flag::COMMITTED | flag::PADDING);
    ring->telemetry_.aborts_total.inc();
}

inline void ClaimedFragment::release_unresolved_() noexcept {
    FL_ERROR("[BUFFER] " << to_string(Error::ClaimNotCommitted)
             << ": claim at position " << frame_position_ << " (" << payload_.size()
             << " bytes) released without commit/abort -> aborting.");
    ring_->telemetry_.claims_leaked_total.inc();
    RingBuffer* ring = std::exchange(ring_, nullptr);
    ring->resolve_(frame_position_, flag::COMMITTED | flag::PADDING);
    ring->telemetry_.aborts_total.inc();
}

} // namespace flowline::buffer
