#include "flowline/actor/scheduler.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <string>
#include <utility>

#include "lcr/backoff.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::actor {

ActorScheduler::ActorScheduler(SchedulerConfig config)
    : config_(std::move(config))
{
    assert(config_.is_valid() && "invalid SchedulerConfig");
}

ActorScheduler::~ActorScheduler() {
    if (!stop()) {
        FL_WARN("[SCHEDULER] '" << config_.name << "' destroyed with actors still open.");
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

void ActorScheduler::start() {
    if (stopped_.load(std::memory_order_acquire)) {
        FL_WARN("[SCHEDULER] '" << config_.name << "' cannot be restarted after stop().");
        return;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return;
    }

    FL_INFO("[SCHEDULER] Starting '" << config_.name << "' with "
            << config_.worker_threads << " worker thread(s).");

    workers_.reserve(config_.worker_threads);
    for (std::size_t i = 0; i < config_.worker_threads; ++i) {
        workers_.emplace_back([this, i] { worker_loop_(i); });
    }
}

bool ActorScheduler::stop() {
    bool expected = false;
    if (!stopped_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        return true;
    }
    assert(!is_worker_thread() && "ActorScheduler::stop() on a worker thread");

    std::vector<std::shared_ptr<ActorTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        tasks = tasks_;
    }

    bool all_closed = true;
    if (!tasks.empty()) {
        FL_DEBUG("[SCHEDULER] Closing " << tasks.size() << " actor(s).");
        std::vector<ActorFuture<void>> closing;
        closing.reserve(tasks.size());
        for (auto& task : tasks) {
            closing.push_back(task->request_close());
        }

        if (running_.load(std::memory_order_acquire)) {
            const auto deadline = std::chrono::steady_clock::now() + config_.shutdown_timeout;
            for (auto& future : closing) {
                const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                    deadline - std::chrono::steady_clock::now());
                if (!future.join(std::max(left, std::chrono::milliseconds::zero()))) {
                    all_closed = false;
                }
            }
        }
        else {
            all_closed = false; // never started: nobody can drive them to CLOSED
        }

        if (!all_closed) {
            FL_WARN("[SCHEDULER] '" << config_.name << "': " << actor_count()
                    << " actor(s) did not close within " << config_.shutdown_timeout.count() << " ms.");
        }
    }

    if (running_.exchange(false, std::memory_order_acq_rel)) {
        {
            std::lock_guard<std::mutex> lock(queue_mutex_);
        }
        queue_cv_.notify_all();
        for (auto& worker : workers_) {
            if (worker.joinable()) {
                worker.join();
            }
        }
        workers_.clear();
        FL_INFO("[SCHEDULER] '" << config_.name << "' stopped.");
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        run_queue_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        tasks_.clear();
    }
    return all_closed;
}

ActorFuture<void> ActorScheduler::submit_actor(std::shared_ptr<Actor> actor) {
    assert(actor && "submit_actor(nullptr)");
    if (stopped_.load(std::memory_order_acquire)) {
        ActorFuture<void> rejected;
        rejected.complete_exceptionally(Error::Closed, "scheduler stopped");
        return rejected;
    }

    auto task = std::make_shared<ActorTask>(*this, std::move(actor));
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        tasks_.push_back(task);
    }
    telemetry_.actors_submitted_total.inc();
    return task->start();
}

std::size_t ActorScheduler::actor_count() const {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    return static_cast<std::size_t>(std::count_if(tasks_.begin(), tasks_.end(),
        [](const auto& task) { return task->state() != ActorState::Closed; }));
}

// ============================================================================
// ActorTask hooks
// ============================================================================

void ActorScheduler::enqueue_(std::shared_ptr<ActorTask> task) {
    std::size_t depth = 0;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        run_queue_.push_back(std::move(task));
        depth = run_queue_.size();
    }
    telemetry_.run_queue_high_watermark.raise_to(depth);
    queue_cv_.notify_one();
}

void ActorScheduler::deregister_(const ActorTask* task) {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    std::erase_if(tasks_, [task](const auto& t) { return t.get() == task; });
}

// ============================================================================
// Workers
// ============================================================================

std::shared_ptr<ActorTask> ActorScheduler::try_pop_() {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (run_queue_.empty()) {
        return nullptr;
    }
    auto task = std::move(run_queue_.front());
    run_queue_.pop_front();
    return task;
}

bool ActorScheduler::poll_conditions_() {
    std::unique_lock<std::mutex> lock(registry_mutex_, std::try_to_lock);
    if (!lock.owns_lock()) {
        return false; // another worker is polling
    }

    const std::uint64_t round = round_.fetch_add(1, std::memory_order_acq_rel) + 1;
    telemetry_.condition_polls_total.inc();

    bool woke = false;
    for (const auto& task : tasks_) {
        if (task->scheduling_state() != SchedulingState::Waiting) {
            continue;
        }
        if (task->has_ready_consumer(round) && task->try_wake()) {
            telemetry_.condition_wakeups_total.inc();
            woke = true;
        }
    }
    return woke;
}

void ActorScheduler::worker_loop_(std::size_t index) {
    lcr::log::set_thread_tag(config_.name + "-worker-" + std::to_string(index));
    detail::on_worker_thread() = true;
    FL_DEBUG("[SCHEDULER] Worker " << index << " started.");

    lcr::adaptive_idle idle(config_.idle_spins, config_.idle_yields, config_.min_park, config_.max_park);
    std::size_t since_poll = 0;

    while (running_.load(std::memory_order_acquire)) {
        if (auto task = try_pop_()) {
            idle.reset();
            task->execute();
            if (++since_poll >= config_.condition_poll_interval) {
                since_poll = 0;
                poll_conditions_();
            }
            continue;
        }

        since_poll = 0;
        if (poll_conditions_()) {
            idle.reset();
            continue;
        }

        const auto park = idle.idle();
        if (park.count() > 0) {
            telemetry_.parks_total.inc();
            std::unique_lock<std::mutex> lock(queue_mutex_);
            queue_cv_.wait_for(lock, park, [this] {
                return !run_queue_.empty() || !running_.load(std::memory_order_acquire);
            });
        }
    }

    FL_DEBUG("[SCHEDULER] Worker " << index << " stopped.");
    detail::on_worker_thread() = false;
}

} // namespace flowline::actor
