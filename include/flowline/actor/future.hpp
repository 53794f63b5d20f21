#pragma once

#include <cassert>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "flowline/error.hpp"


namespace flowline::actor {

// -----------------------------------------------------------------------------
// Worker thread marker
// -----------------------------------------------------------------------------
// Set by the scheduler on its worker threads. Blocking waits are forbidden
// there: a worker that blocks on a future can starve the actor that would
// complete it.
namespace detail {
inline bool& on_worker_thread() noexcept {
    thread_local bool flag = false;
    return flag;
}
} // namespace detail

[[nodiscard]] inline bool is_worker_thread() noexcept { return detail::on_worker_thread(); }


// Failure payload of an exceptionally completed future
struct Failure {
    Error error = Error::None;
    std::string message;
};


/*
===============================================================================
ActorFuture<T>
===============================================================================

Completable future shared between the completer and any number of holders.

  complete(value)              → done, value available
  complete_exceptionally(f)    → done, failure available
  on_complete(callback)        → callback runs once the future is done
                                 (immediately, on the caller's thread, when
                                 it already is; otherwise on the completer's
                                 thread)

The first completion wins; later completions return false.

Inside actors, futures are consumed with ActorControl::await(). join() is
for non-worker threads only (tests, main, shutdown).

Copies share the same state. ActorFuture<void> stores std::monostate.
===============================================================================
*/

template<class T>
class ActorFuture {
public:
    using value_type = T;
    using storage_type = std::conditional_t<std::is_void_v<T>, std::monostate, T>;
    using Callback = std::function<void(const ActorFuture<T>&)>;

    ActorFuture()
        : state_(std::make_shared<State>())
    {}

    // -------------------------------------------------------------------------
    // Completion
    // -------------------------------------------------------------------------

    template<class U = T>
        requires (!std::is_void_v<U>)
    bool complete(U value) {
        return finish_(storage_type(std::move(value)), std::nullopt);
    }

    template<class U = T>
        requires std::is_void_v<U>
    bool complete() {
        return finish_(std::monostate{}, std::nullopt);
    }

    bool complete_exceptionally(Failure failure) {
        return finish_(std::nullopt, std::move(failure));
    }

    bool complete_exceptionally(Error error, std::string message) {
        return complete_exceptionally(Failure{error, std::move(message)});
    }

    // -------------------------------------------------------------------------
    // Observation
    // -------------------------------------------------------------------------

    void on_complete(Callback callback) {
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (!state_->done) {
                state_->callbacks.push_back(std::move(callback));
                return;
            }
        }
        callback(*this);
    }

    [[nodiscard]] bool is_done() const noexcept {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->done;
    }

    [[nodiscard]] bool is_failed() const noexcept {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->done && state_->failure.has_value();
    }

    // Precondition: is_done() && !is_failed()
    [[nodiscard]] const storage_type& value() const noexcept {
        std::lock_guard<std::mutex> lock(state_->mutex);
        assert(state_->value.has_value() && "ActorFuture::value() on a pending or failed future");
        return *state_->value;
    }

    // Precondition: is_failed()
    [[nodiscard]] const Failure& failure() const noexcept {
        std::lock_guard<std::mutex> lock(state_->mutex);
        assert(state_->failure.has_value() && "ActorFuture::failure() on a future that did not fail");
        return *state_->failure;
    }

    // Error of a failed future, Error::None otherwise
    [[nodiscard]] Error error() const noexcept {
        std::lock_guard<std::mutex> lock(state_->mutex);
        return state_->failure ? state_->failure->error : Error::None;
    }

    // Blocks until done or timeout. Returns is_done().
    // Must not be called from a scheduler worker thread.
    bool join(std::chrono::milliseconds timeout) const {
        assert(!is_worker_thread() && "ActorFuture::join() on a worker thread, use ActorControl::await()");
        std::unique_lock<std::mutex> lock(state_->mutex);
        return state_->cv.wait_for(lock, timeout, [this] { return state_->done; });
    }

private:
    struct State {
        mutable std::mutex mutex;
        std::condition_variable cv;
        bool done = false;
        std::optional<storage_type> value;
        std::optional<Failure> failure;
        std::vector<Callback> callbacks;
    };

    bool finish_(std::optional<storage_type> value, std::optional<Failure> failure) {
        std::vector<Callback> callbacks;
        {
            std::lock_guard<std::mutex> lock(state_->mutex);
            if (state_->done) {
                return false;
            }
            state_->done = true;
            state_->value = std::move(value);
            state_->failure = std::move(failure);
            callbacks.swap(state_->callbacks);
        }
        state_->cv.notify_all();
        for (auto& cb : callbacks) {
            cb(*this);
        }
        return true;
    }

    std::shared_ptr<State> state_;
};

} // namespace flowline::actor
