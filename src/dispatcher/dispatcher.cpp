#include "flowline/dispatcher/dispatcher.hpp"

#include <algorithm>
#include <cassert>
#include <sstream>
#include <utility>

#include "lcr/format.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::dispatcher {

Dispatcher::Dispatcher(DispatcherConfig config, actor::ActorScheduler* scheduler)
    : config_(std::move(config))
    , ring_(config_.buffer_size,
            config_.effective_max_fragment_length(),
            config_.max_subscriptions,
            telemetry_)
{
    assert(config_.validate() == Error::None && "invalid DispatcherConfig");

    FL_INFO("[DISPATCHER] '" << config_.name << "' created (buffer "
            << lcr::format_bytes_scaled(ring_.capacity()) << ", max fragment "
            << ring_.max_fragment_length() << " bytes, max " << config_.max_subscriptions
            << " subscriptions" << (scheduler ? ", conductor on '" + scheduler->config().name + "'" : std::string{})
            << ").");

    for (const auto& name : config_.subscriptions) {
        if (open_subscription(name) == nullptr) {
            FL_ERROR("[DISPATCHER] '" << config_.name << "' failed to open initial subscription '" << name << "'.");
        }
    }

    if (scheduler != nullptr) {
        conductor_ = std::make_shared<DispatcherConductor>(*this, config_.name + "-conductor");
        conductor_started_ = scheduler->submit_actor(conductor_);
    }
}

Dispatcher::~Dispatcher() {
    close();
}

// ============================================================================
// Registry
// ============================================================================

bool Dispatcher::is_open_name_locked_(std::string_view name) const {
    return std::any_of(subscriptions_.begin(), subscriptions_.end(), [name](const auto& s) {
        return !s->is_closed() && s->name() == name;
    });
}

Subscription* Dispatcher::open_locked_(std::string_view name, std::uint32_t partition, std::uint32_t count) {
    std::unique_ptr<Subscription> subscription(new Subscription(std::string(name), ring_, partition, count));
    if (!subscription->open_()) {
        return nullptr;
    }
    Subscription* raw = subscription.get();
    subscriptions_.push_back(std::move(subscription));
    telemetry_.subscriptions_opened_total.inc();
    FL_DEBUG("[DISPATCHER] '" << config_.name << "' opened subscription '" << name << "'"
             << (count > 1 ? " partition " + std::to_string(partition) + "/" + std::to_string(count) : std::string{})
             << " at position " << raw->position() << ".");
    return raw;
}

Subscription* Dispatcher::open_subscription(std::string_view name) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (is_closed()) {
        FL_WARN("[DISPATCHER] '" << config_.name << "' is closed, cannot open subscription '" << name << "'.");
        return nullptr;
    }
    if (name.empty() || is_open_name_locked_(name)) {
        FL_WARN("[DISPATCHER] '" << config_.name << "' rejected subscription '" << name
                << "' (empty or duplicate name).");
        return nullptr;
    }
    Subscription* subscription = open_locked_(name, 0, 1);
    if (subscription == nullptr) {
        FL_WARN("[DISPATCHER] '" << config_.name << "' has no free subscriber slot for '" << name
                << "' (max " << ring_.max_subscribers() << ").");
    }
    return subscription;
}

std::vector<Subscription*> Dispatcher::open_partitioned_subscription(std::string_view name, std::uint32_t partitions) {
    std::vector<Subscription*> result;
    std::lock_guard<std::mutex> lock(registry_mutex_);
    if (is_closed() || partitions == 0 || name.empty() || is_open_name_locked_(name)) {
        FL_WARN("[DISPATCHER] '" << config_.name << "' rejected partitioned subscription '" << name
                << "' (" << partitions << " partitions).");
        return result;
    }
    if (ring_.max_subscribers() - ring_.active_slots() < partitions) {
        FL_WARN("[DISPATCHER] '" << config_.name << "' has not enough free subscriber slots for '" << name
                << "' (" << partitions << " partitions, max " << ring_.max_subscribers() << ").");
        return result;
    }

    result.reserve(partitions);
    for (std::uint32_t i = 0; i < partitions; ++i) {
        Subscription* subscription = open_locked_(name, i, partitions);
        assert(subscription != nullptr && "free slot count checked under the registry mutex");
        result.push_back(subscription);
    }
    return result;
}

actor::ActorFuture<Subscription*> Dispatcher::open_subscription_async(std::string name) {
    if (conductor_ == nullptr) {
        actor::ActorFuture<Subscription*> future;
        if (is_closed()) {
            future.complete_exceptionally(Error::Closed, "dispatcher closed");
        }
        else {
            future.complete(open_subscription(name));
        }
        return future;
    }
    return conductor_->submit<Subscription*>(
        [name = std::move(name)](Dispatcher& dispatcher) -> DispatcherConductor::Completion<Subscription*> {
            if (dispatcher.is_closed()) {
                return [](actor::ActorFuture<Subscription*>& future) {
                    future.complete_exceptionally(Error::Closed, "dispatcher closed");
                };
            }
            Subscription* subscription = dispatcher.open_subscription(name);
            return [subscription](actor::ActorFuture<Subscription*>& future) { future.complete(subscription); };
        });
}

Error Dispatcher::close_subscription(Subscription* subscription) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    const bool known = subscription != nullptr &&
        std::any_of(subscriptions_.begin(), subscriptions_.end(),
                    [subscription](const auto& s) { return s.get() == subscription; });
    if (!known) {
        return Error::InvalidState;
    }
    if (subscription->is_closed()) {
        return Error::None;
    }
    subscription->close_();
    telemetry_.subscriptions_closed_total.inc();
    FL_DEBUG("[DISPATCHER] '" << config_.name << "' closed subscription '" << subscription->name()
             << "' at position " << subscription->position() << ".");
    return Error::None;
}

actor::ActorFuture<void> Dispatcher::close_subscription_async(Subscription* subscription) {
    auto finish = [subscription](Dispatcher& dispatcher) -> DispatcherConductor::Completion<void> {
        const Error err = dispatcher.close_subscription(subscription);
        return [err](actor::ActorFuture<void>& future) {
            if (err == Error::None) {
                future.complete();
            }
            else {
                future.complete_exceptionally(err, "unknown subscription");
            }
        };
    };

    if (conductor_ == nullptr) {
        actor::ActorFuture<void> future;
        finish(*this)(future);
        return future;
    }
    return conductor_->submit<void>(std::move(finish));
}

Subscription* Dispatcher::get_subscription(std::string_view name) const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto& s : subscriptions_) {
        if (!s->is_closed() && s->name() == name) {
            return s.get();
        }
    }
    return nullptr;
}

std::size_t Dispatcher::subscription_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return static_cast<std::size_t>(std::count_if(subscriptions_.begin(), subscriptions_.end(),
        [](const auto& s) { return !s->is_closed(); }));
}

// ============================================================================
// Lifecycle
// ============================================================================

void Dispatcher::close() noexcept {
    bool expected = false;
    const bool first = closed_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);

    // Every caller returns only once in-flight claims are resolved
    ring_.close();
    if (!first) {
        return;
    }

    FL_INFO("[DISPATCHER] Closing '" << config_.name << "' at position " << ring_.tail() << ".");

    if (conductor_ != nullptr) {
        conductor_->detach();
        conductor_->request_close();
    }

    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        for (auto& s : subscriptions_) {
            if (!s->is_closed()) {
                s->close_();
                telemetry_.subscriptions_closed_total.inc();
            }
        }
    }

    if (lcr::log::Logger::instance().enabled(lcr::log::Level::Debug)) {
        std::ostringstream oss;
        telemetry_.debug_dump(oss);
        FL_DEBUG("[DISPATCHER] '" << config_.name << "' final telemetry:" << oss.str());
    }
}

} // namespace flowline::dispatcher
