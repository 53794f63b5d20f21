#include "flowline/dispatcher/subscription.hpp"

#include <utility>

#include "flowline/dispatcher/block_peek.hpp"


namespace flowline::dispatcher {

using namespace flowline::buffer;

// ============================================================================
// Registry
// ============================================================================

Subscription::~Subscription() {
    if (pending_peek_ != nullptr) {
        FL_DEBUG("[SUBSCRIPTION] '" << name_ << "' destroyed with a pending block peek -> peek detached.");
        pending_peek_->subscription_ = nullptr;
        pending_peek_ = nullptr;
    }
}

bool Subscription::open_() noexcept {
    slot_ = ring_.acquire_slot(cursor_);
    return slot_ != RingBuffer::NO_SLOT;
}

void Subscription::close_() noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    if (slot_ != RingBuffer::NO_SLOT) {
        ring_.release_slot(slot_);
        slot_ = RingBuffer::NO_SLOT;
    }
}

// ============================================================================
// Frame inspection
// ============================================================================

Subscription::Probe Subscription::probe_(std::int64_t pos, std::int64_t tail) const noexcept {
    Probe p;
    if (pos >= tail) {
        return p;
    }

    const std::size_t remaining = ring_.capacity() - ring_.offset_of(pos);
    if (remaining < HEADER_LENGTH) {
        // Implicit padding up to the buffer end
        p.kind = Probe::Kind::Skip;
        p.framed = remaining;
        return p;
    }

    const std::byte* frame = ring_.frame_at(pos);
    const std::uint64_t status = load_status(frame);
    const std::uint32_t flags = status_flags(status);
    constexpr std::uint32_t known = flag::COMMITTED | flag::PADDING | flag::FAILED;

    if (status_lap(status) != ring_.lap_of(pos) || (flags & flag::COMMITTED) == 0 || (flags & ~known) != 0) {
        return p; // reserved, not yet committed
    }

    const std::size_t framed = framed_length(read_length(frame));
    if (framed > remaining) {
        return p;
    }

    p.frame = frame;
    p.framed = framed;
    p.kind = ((flags & flag::PADDING) != 0 || !owns(read_stream_id(frame))) ? Probe::Kind::Skip
                                                                            : Probe::Kind::Deliver;
    return p;
}

bool Subscription::enter_read_(const char* operation) noexcept {
    if (is_closed()) {
        return false;
    }
    if (pending_peek_ != nullptr) {
        ring_.telemetry().peek_violations_total.inc();
        FL_DEBUG("[SUBSCRIPTION] '" << name_ << "' " << operation
                 << "() while a block peek is unresolved -> ignored.");
        return false;
    }
    return true;
}

void Subscription::flag_failed_(const std::byte* frame) noexcept {
    status_of(const_cast<std::byte*>(frame)).fetch_or(flag::FAILED, std::memory_order_acq_rel);
    ring_.telemetry().fragments_failed_total.inc();
}

// ============================================================================
// Block peek
// ============================================================================

std::size_t Subscription::peek_block(BlockPeek& peek, std::size_t max_length, bool stream_aware) noexcept {
    if (!enter_read_("peek_block")) {
        return 0;
    }
    if (peek.is_pending()) {
        ring_.telemetry().peek_violations_total.inc();
        FL_DEBUG("[SUBSCRIPTION] '" << name_ << "' peek_block() into an unresolved BlockPeek -> ignored.");
        return 0;
    }

    const std::int64_t tail = ring_.tail();
    std::int64_t pos = cursor_.load(std::memory_order_relaxed);

    // Skipping padding / foreign partitions is not a delivery
    Probe p = probe_(pos, tail);
    while (p.kind == Probe::Kind::Skip) {
        pos += static_cast<std::int64_t>(p.framed);
        p = probe_(pos, tail);
    }
    if (pos != cursor_.load(std::memory_order_relaxed)) {
        cursor_.store(pos, std::memory_order_release);
    }
    if (p.kind == Probe::Kind::Empty) {
        return 0;
    }

    const std::int64_t block_start = pos;
    const std::int64_t buffer_end = pos + static_cast<std::int64_t>(ring_.capacity() - ring_.offset_of(pos));
    const std::int32_t stream_id = read_stream_id(p.frame);

    std::size_t length = 0;
    std::size_t count = 0;
    while (p.kind == Probe::Kind::Deliver) {
        if (count > 0) {
            if (stream_aware && read_stream_id(p.frame) != stream_id) {
                break;
            }
            if (length + p.framed > max_length) {
                break;
            }
        }
        length += p.framed;
        pos += static_cast<std::int64_t>(p.framed);
        ++count;
        if (pos >= buffer_end) {
            break;
        }
        p = probe_(pos, tail);
    }

    peek.reset_(this, ring_.frame_at(block_start), block_start, pos, count, stream_id);
    pending_peek_ = &peek;
    return length;
}

void Subscription::complete_peek_(std::int64_t end_position) noexcept {
    cursor_.store(end_position, std::memory_order_release);
    pending_peek_ = nullptr;
}

void Subscription::fail_peek_(const BlockPeek& peek, bool flag_fragments) noexcept {
    if (flag_fragments) {
        for (const Fragment fragment : peek) {
            flag_failed_(fragment.frame());
        }
    }
    pending_peek_ = nullptr;
}

// ============================================================================
// actor::Consumable
// ============================================================================

bool Subscription::has_available() const noexcept {
    if (is_closed()) {
        return false;
    }
    const std::int64_t pos = cursor_.load(std::memory_order_acquire);
    if (pos >= ring_.tail()) {
        return false;
    }
    if (ring_.capacity() - ring_.offset_of(pos) < HEADER_LENGTH) {
        return true;
    }
    // Ready once the frame at the cursor is committed
    const std::uint64_t status = load_status(ring_.frame_at(pos));
    return status_lap(status) == ring_.lap_of(pos) && (status_flags(status) & flag::COMMITTED) != 0;
}

// ============================================================================
// BlockPeek
// ============================================================================

BlockPeek::~BlockPeek() {
    if (is_pending()) {
        FL_WARN("[SUBSCRIPTION] '" << subscription_->name()
                << "' block peek destroyed unresolved -> released without advancing.");
        subscription_->ring_.telemetry().peek_violations_total.inc();
        Subscription* s = std::exchange(subscription_, nullptr);
        s->fail_peek_(*this, false);
    }
}

Error BlockPeek::mark_completed() noexcept {
    if (!is_pending()) {
        return Error::InvalidState;
    }
    Subscription* s = std::exchange(subscription_, nullptr);
    s->complete_peek_(end_position_);
    auto& telemetry = s->ring_.telemetry();
    telemetry.blocks_completed_total.inc();
    telemetry.fragments_consumed_total.inc(fragment_count_);
    return Error::None;
}

Error BlockPeek::mark_failed(bool flag_fragments) noexcept {
    if (!is_pending()) {
        return Error::InvalidState;
    }
    Subscription* s = std::exchange(subscription_, nullptr);
    s->fail_peek_(*this, flag_fragments);
    return Error::None;
}

} // namespace flowline::dispatcher
