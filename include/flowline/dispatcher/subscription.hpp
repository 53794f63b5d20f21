#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <utility>

#include "flowline/actor/consumable.hpp"
#include "flowline/buffer/fragment.hpp"
#include "flowline/buffer/frame.hpp"
#include "flowline/buffer/ring_buffer.hpp"
#include "flowline/dispatcher/block_peek.hpp"
#include "flowline/error.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::dispatcher {

class Dispatcher;

/*
===============================================================================
Subscription
===============================================================================

Independent read cursor over the dispatcher's ring buffer.

  poll(handler, max)                 fragment by fragment delivery
  peek_block(peek, max_len, aware)   zero-copy contiguous block

The cursor only moves forward and never passes the producer tail. It is
registered in a ring buffer subscriber slot, so a slow subscription
backpressures producers.

Partitioned subscriptions
-------------------------
open_partitioned_subscription(name, n) yields n subscriptions sharing the
name. Partition i delivers exactly the fragments whose stream id maps to i
(stream_id mod n) and skips the others, so every fragment reaches exactly
one partition.

Threading
---------
  - poll() / peek_block() are single-reader: one thread (or one actor) at a
    time per subscription.
  - has_available() / progress() / position() are safe from any thread.
  - A closed subscription stays alive until the dispatcher is destroyed and
    simply returns 0 from poll() / peek_block().
===============================================================================
*/

class Subscription final : public actor::Consumable {
public:
    // Detaches a still pending BlockPeek, which then reports !is_pending()
    ~Subscription() override;

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // -------------------------------------------------------------------------
    // Identity
    // -------------------------------------------------------------------------

    [[nodiscard]] inline const std::string& name() const noexcept { return name_; }

    [[nodiscard]] inline std::uint32_t partition() const noexcept { return partition_; }

    [[nodiscard]] inline std::uint32_t partition_count() const noexcept { return partition_count_; }

    [[nodiscard]] inline std::int64_t position() const noexcept {
        return cursor_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline bool is_closed() const noexcept {
        return closed_.load(std::memory_order_acquire);
    }

    [[nodiscard]] inline bool is_peek_pending() const noexcept { return pending_peek_ != nullptr; }

    // True if stream_id belongs to this partition
    [[nodiscard]] inline bool owns(std::int32_t stream_id) const noexcept {
        if (partition_count_ <= 1) {
            return true;
        }
        const std::int64_t n = partition_count_;
        return static_cast<std::uint32_t>(((stream_id % n) + n) % n) == partition_;
    }

    // -------------------------------------------------------------------------
    // Consumption
    // -------------------------------------------------------------------------

    // Delivers up to max_fragments committed fragments to handler.
    // Returns the number of fragments consumed or failed.
    template<buffer::FragmentHandler Handler>
    int poll(Handler&& handler, int max_fragments) {
        if (!enter_read_("poll")) {
            return 0;
        }

        const std::int64_t start = cursor_.load(std::memory_order_relaxed);
        const std::int64_t tail = ring_.tail();

        std::int64_t pos = start;
        int processed = 0;
        std::uint64_t consumed = 0;

        while (processed < max_fragments) {
            const Probe p = probe_(pos, tail);
            if (p.kind == Probe::Kind::Empty) {
                break;
            }
            if (p.kind == Probe::Kind::Skip) {
                pos += static_cast<std::int64_t>(p.framed);
                continue;
            }

            const buffer::Fragment fragment(p.frame, pos);
            const buffer::FragmentResult result = std::invoke(handler, fragment);
            if (result == buffer::FragmentResult::Postpone) {
                break;
            }
            if (result == buffer::FragmentResult::Failed) {
                flag_failed_(p.frame);
            }
            else {
                ++consumed;
            }

            pos += static_cast<std::int64_t>(p.framed);
            ++processed;
            cursor_.store(pos, std::memory_order_release);
        }

        if (pos != cursor_.load(std::memory_order_relaxed)) {
            cursor_.store(pos, std::memory_order_release);
        }
        if (consumed != 0) {
            ring_.telemetry().fragments_consumed_total.inc(consumed);
        }
        return processed;
    }

    // Fills `peek` with committed fragments starting at the cursor.
    // Returns the block length in bytes (headers included), 0 if nothing is
    // available. See BlockPeek for the resolution contract.
    [[nodiscard]] std::size_t peek_block(BlockPeek& peek, std::size_t max_length, bool stream_aware = false) noexcept;

    // -------------------------------------------------------------------------
    // actor::Consumable
    // -------------------------------------------------------------------------

    [[nodiscard]] bool has_available() const noexcept override;

    [[nodiscard]] std::int64_t progress() const noexcept override { return position(); }

private:
    friend class Dispatcher;
    friend class BlockPeek;

    Subscription(std::string name,
                 buffer::RingBuffer& ring,
                 std::uint32_t partition,
                 std::uint32_t partition_count)
        : name_(std::move(name))
        , ring_(ring)
        , partition_(partition)
        , partition_count_(partition_count)
    {}

    // --- Registry (dispatcher, under its registry mutex) ---------------------
    [[nodiscard]] bool open_() noexcept;
    void close_() noexcept;

    // --- Frame inspection ----------------------------------------------------
    struct Probe {
        enum class Kind : std::uint8_t { Empty, Skip, Deliver };
        Kind kind = Kind::Empty;
        std::size_t framed = 0;
        const std::byte* frame = nullptr;
    };

    [[nodiscard]] Probe probe_(std::int64_t pos, std::int64_t tail) const noexcept;

    [[nodiscard]] bool enter_read_(const char* operation) noexcept;

    void flag_failed_(const std::byte* frame) noexcept;

    // --- BlockPeek resolution ------------------------------------------------
    void complete_peek_(std::int64_t end_position) noexcept;
    void fail_peek_(const BlockPeek& peek, bool flag_fragments) noexcept;

private:
    const std::string name_;
    buffer::RingBuffer& ring_;
    const std::uint32_t partition_;
    const std::uint32_t partition_count_;

    alignas(64) buffer::RingBuffer::Cursor cursor_{0};

    int slot_ = buffer::RingBuffer::NO_SLOT;
    std::atomic<bool> closed_{false};

    // Reader-owned
    BlockPeek* pending_peek_ = nullptr;
};

} // namespace flowline::dispatcher
