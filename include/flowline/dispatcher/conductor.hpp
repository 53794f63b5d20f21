#pragma once

#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flowline/actor/actor.hpp"
#include "flowline/actor/control.hpp"
#include "flowline/actor/future.hpp"
#include "flowline/actor/job.hpp"
#include "flowline/error.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::dispatcher {

class Dispatcher;

// -----------------------------------------------------------------------------
// DispatcherConductor
// -----------------------------------------------------------------------------
// Actor that serialises asynchronous registry changes of one dispatcher.
//
// Holds a non-owning Dispatcher pointer. Dispatcher::close() detaches it
// under the conductor mutex; every job runs its dispatcher access under the
// same mutex, so a job either completes before detach returns or observes
// the detached state and fails its future with Error::Closed. Futures are
// always completed with the mutex released.
//
// Requests made before the actor started are parked and handed to the actor
// in on_actor_starting().
// -----------------------------------------------------------------------------
class DispatcherConductor final : public actor::Actor {
public:
    DispatcherConductor(Dispatcher& dispatcher, std::string name)
        : name_(std::move(name))
        , dispatcher_(&dispatcher)
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    void on_actor_starting(actor::ActorControl& control) override {
        std::lock_guard<std::mutex> lock(mutex_);
        control_ = &control;
        for (auto& job : parked_) {
            control.run(std::move(job));
        }
        parked_.clear();
    }

    void on_actor_closed(actor::ActorControl&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        control_ = nullptr;
        closed_ = true;
    }

    // Completes a request's future once the conductor mutex is released
    template<class T>
    using Completion = std::function<void(actor::ActorFuture<T>&)>;

    // Runs fn(dispatcher) on the conductor under the conductor mutex and then
    // the Completion it returns without the mutex, so future callbacks may
    // call back into the dispatcher. Fails with Error::Closed once the
    // dispatcher is detached.
    template<class T, class F>
    actor::ActorFuture<T> submit(F fn) {
        actor::ActorFuture<T> future;
        actor::ActorJob job{[this, future, fn = std::move(fn)]() mutable {
            Completion<T> complete;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (dispatcher_ != nullptr) {
                    complete = fn(*dispatcher_);
                }
            }
            if (!complete) {
                future.complete_exceptionally(Error::Closed, "dispatcher closed");
                return;
            }
            complete(future);
        }};

        Error rejected = Error::None;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_ || dispatcher_ == nullptr) {
                rejected = Error::Closed;
            }
            else if (control_ == nullptr) {
                parked_.push_back(std::move(job));
                return future;
            }
            else {
                rejected = control_->submit(std::move(job));
            }
        }
        if (rejected != Error::None) {
            future.complete_exceptionally(rejected, "dispatcher conductor rejected the request");
        }
        return future;
    }

    // Stops all further dispatcher access; waits for a running job
    void detach() {
        std::vector<actor::ActorJob> parked;
        actor::ActorControl* control = nullptr;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            dispatcher_ = nullptr;
            parked.swap(parked_);
            control = control_;
        }
        // Parked jobs observe the detached dispatcher and fail their futures
        for (auto& job : parked) {
            job.fn();
        }
        if (control != nullptr) {
            FL_DEBUG("[DISPATCHER] Conductor '" << name_ << "' detached.");
        }
    }

    // Requests close of the conductor actor (no-op when not running)
    void request_close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (control_ != nullptr) {
            close_future_ = control_->close();
        }
    }

private:
    const std::string name_;

    std::mutex mutex_;
    Dispatcher* dispatcher_;
    actor::ActorControl* control_ = nullptr;
    std::vector<actor::ActorJob> parked_;
    bool closed_ = false;
    actor::ActorFuture<void> close_future_;
};

} // namespace flowline::dispatcher
