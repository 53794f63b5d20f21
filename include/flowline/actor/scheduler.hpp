#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "flowline/actor/actor.hpp"
#include "flowline/actor/config.hpp"
#include "flowline/actor/future.hpp"
#include "flowline/actor/task.hpp"
#include "flowline/telemetry/scheduler.hpp"


namespace flowline::actor {

/*
===============================================================================
ActorScheduler
===============================================================================

Fixed pool of worker threads executing ActorTasks from a shared run queue.

Workers
-------
  - pop a task and execute one slice of it
  - every condition_poll_interval tasks, poll the consume conditions of
    waiting actors and wake those with data
  - when the queue is empty: poll conditions, then back off (spin, yield,
    park on the queue condition variable with a doubling timeout capped at
    max_park)

Conditions are polled in rounds. Consume backoff is expressed in rounds, so
a stalled consumer costs nothing between its scheduled retries.

Lifecycle
---------
  start()   spawns the workers; actors submitted earlier start running
  stop()    requests close of every actor, waits up to shutdown_timeout for
            them to reach CLOSED, then joins the workers. Idempotent.

Must be stopped from a non-worker thread.
===============================================================================
*/

class ActorScheduler {
public:
    explicit ActorScheduler(SchedulerConfig config = {});
    ~ActorScheduler();

    ActorScheduler(const ActorScheduler&) = delete;
    ActorScheduler& operator=(const ActorScheduler&) = delete;

    void start();

    // Returns false if some actor did not close within shutdown_timeout
    bool stop();

    // Completes when the actor reaches STARTED; fails with ActorFailure if it
    // fails while starting, with Closed once the scheduler was stopped.
    ActorFuture<void> submit_actor(std::shared_ptr<Actor> actor);

    [[nodiscard]] const telemetry::Scheduler& telemetry() const noexcept { return telemetry_; }

    [[nodiscard]] std::size_t thread_count() const noexcept { return config_.worker_threads; }

    [[nodiscard]] const SchedulerConfig& config() const noexcept { return config_; }

    [[nodiscard]] bool is_running() const noexcept { return running_.load(std::memory_order_acquire); }

    // Number of registered actors not yet CLOSED
    [[nodiscard]] std::size_t actor_count() const;

    // Condition poll round counter
    [[nodiscard]] std::uint64_t round() const noexcept { return round_.load(std::memory_order_acquire); }

private:
    friend class ActorTask;

    // Called by ActorTask
    void enqueue_(std::shared_ptr<ActorTask> task);
    void deregister_(const ActorTask* task);
    [[nodiscard]] telemetry::Scheduler& mutable_telemetry_() noexcept { return telemetry_; }

    void worker_loop_(std::size_t index);
    std::shared_ptr<ActorTask> try_pop_();

    // Returns true if at least one waiting actor was woken
    bool poll_conditions_();

private:
    const SchedulerConfig config_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<std::shared_ptr<ActorTask>> run_queue_;

    mutable std::mutex registry_mutex_;
    std::vector<std::shared_ptr<ActorTask>> tasks_;

    std::atomic<std::uint64_t> round_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> stopped_{false};
    std::vector<std::thread> workers_;

    telemetry::Scheduler telemetry_;
};

} // namespace flowline::actor
