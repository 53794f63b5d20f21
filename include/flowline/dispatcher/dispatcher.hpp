#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "flowline/actor/future.hpp"
#include "flowline/actor/scheduler.hpp"
#include "flowline/buffer/claimed_fragment.hpp"
#include "flowline/buffer/ring_buffer.hpp"
#include "flowline/dispatcher/conductor.hpp"
#include "flowline/dispatcher/config.hpp"
#include "flowline/dispatcher/subscription.hpp"
#include "flowline/error.hpp"
#include "flowline/telemetry/dispatcher.hpp"


namespace flowline::dispatcher {

/*
===============================================================================
Dispatcher
===============================================================================

In-process publish/subscribe hub over one multi-producer ring buffer.

Producer API (any thread, lock-free, never blocks):

  offer(payload, stream_id)           copy + commit in one call
  claim(claim, length, stream_id)     reserve; caller commits or aborts

  Both return the post-write position (>= 0) or a negative
  buffer::position sentinel (INSUFFICIENT_CAPACITY, BACKPRESSURED, CLOSED).
  buffer::to_error() maps the sentinel to flowline::Error.

Registry (mutex, never on the data path):

  open_subscription(name)                   nullptr on duplicate / no slot
  open_partitioned_subscription(name, n)    n cooperating partitions
  open_subscription_async(name)             via the conductor actor
  close_subscription[_async](subscription)
  get_subscription(name)

Closed subscriptions stay in the registry until the dispatcher is destroyed,
so a reader never observes a destroyed subscription.

close() refuses new offers and claims, waits until every in-flight offer
and claim is resolved, then closes all subscriptions. Idempotent, callable
from any thread.
===============================================================================
*/

class Dispatcher {
public:
    // config must be valid (DispatcherConfig::validate); use DispatcherBuilder
    // for validated construction.
    explicit Dispatcher(DispatcherConfig config, actor::ActorScheduler* scheduler = nullptr);
    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    // -------------------------------------------------------------------------
    // Producer API
    // -------------------------------------------------------------------------

    [[nodiscard]]
    inline std::int64_t offer(std::span<const std::byte> payload, std::int32_t stream_id = 0) noexcept {
        return ring_.offer(payload, stream_id);
    }

    [[nodiscard]]
    inline std::int64_t offer(std::string_view payload, std::int32_t stream_id = 0) noexcept {
        return ring_.offer(std::as_bytes(std::span<const char>(payload.data(), payload.size())), stream_id);
    }

    [[nodiscard]]
    inline std::int64_t claim(buffer::ClaimedFragment& claim, std::size_t length, std::int32_t stream_id = 0) noexcept {
        return ring_.claim(claim, length, stream_id);
    }

    // -------------------------------------------------------------------------
    // Subscription registry
    // -------------------------------------------------------------------------

    [[nodiscard]] Subscription* open_subscription(std::string_view name);

    // Empty on duplicate name, not enough free slots or partitions == 0
    [[nodiscard]] std::vector<Subscription*> open_partitioned_subscription(std::string_view name,
                                                                           std::uint32_t partitions);

    // Completes with nullptr on duplicate / no slot, fails with Closed once
    // the dispatcher is closed.
    [[nodiscard]] actor::ActorFuture<Subscription*> open_subscription_async(std::string name);

    // None on success or if already closed; InvalidState for a foreign or
    // null subscription.
    Error close_subscription(Subscription* subscription);

    [[nodiscard]] actor::ActorFuture<void> close_subscription_async(Subscription* subscription);

    // First open subscription with this name (partition 0 of a partitioned one)
    [[nodiscard]] Subscription* get_subscription(std::string_view name) const;

    [[nodiscard]] std::size_t subscription_count() const;

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    void close() noexcept;

    [[nodiscard]] inline bool is_closed() const noexcept { return closed_.load(std::memory_order_acquire); }

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    [[nodiscard]] inline const std::string& name() const noexcept { return config_.name; }

    [[nodiscard]] inline const DispatcherConfig& config() const noexcept { return config_; }

    [[nodiscard]] inline std::size_t capacity() const noexcept { return ring_.capacity(); }

    [[nodiscard]] inline std::size_t max_fragment_length() const noexcept { return ring_.max_fragment_length(); }

    [[nodiscard]] inline std::int64_t tail() const noexcept { return ring_.tail(); }

    [[nodiscard]] inline const telemetry::Dispatcher& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] inline bool has_conductor() const noexcept { return conductor_ != nullptr; }

    // Completes once the conductor actor started (never completes without a scheduler)
    [[nodiscard]] inline actor::ActorFuture<void> conductor_started() const { return conductor_started_; }

private:
    [[nodiscard]] Subscription* open_locked_(std::string_view name, std::uint32_t partition, std::uint32_t count);
    [[nodiscard]] bool is_open_name_locked_(std::string_view name) const;

private:
    const DispatcherConfig config_;

    telemetry::Dispatcher telemetry_;
    buffer::RingBuffer ring_;

    mutable std::mutex registry_mutex_;
    std::vector<std::unique_ptr<Subscription>> subscriptions_;

    std::atomic<bool> closed_{false};

    std::shared_ptr<DispatcherConductor> conductor_;
    actor::ActorFuture<void> conductor_started_;
};

} // namespace flowline::dispatcher
