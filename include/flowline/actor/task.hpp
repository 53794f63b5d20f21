#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "flowline/actor/actor.hpp"
#include "flowline/actor/consumable.hpp"
#include "flowline/actor/control.hpp"
#include "flowline/actor/future.hpp"
#include "flowline/actor/job.hpp"
#include "flowline/actor/state.hpp"
#include "flowline/error.hpp"


namespace flowline::actor {

class ActorScheduler;

/*
===============================================================================
ActorTask
===============================================================================

Runtime side of one submitted actor: job queue, consume conditions,
lifecycle state machine and scheduling state.

Scheduling
----------
  Waiting  → Queued   try_wake() (CAS), task pushed to the run queue
  Queued   → Running  a worker picked the task (execute())
  Running  → Queued   slice ended by yield() / unfinished run-until-done
  Running  → Waiting  otherwise; runnable work is re-checked after the
                      store so a concurrent submit is never lost

Slice
-----
  1. Run up to job_budget jobs from the front of the queue.
  2. When the queue is empty and nothing is awaited, advance the lifecycle
     (each step may queue a hook job, then goto 1).
  3. Run every eligible consume condition that reports data, once.

Failure
-------
An exception escaping a job is caught here. Jobs, awaits and consume
conditions are dropped and the actor is driven to CLOSED.
===============================================================================
*/

class ActorTask : public std::enable_shared_from_this<ActorTask> {
public:
    ActorTask(ActorScheduler& scheduler, std::shared_ptr<Actor> actor);

    ActorTask(const ActorTask&) = delete;
    ActorTask& operator=(const ActorTask&) = delete;

    // -------------------------------------------------------------------------
    // Scheduler interface
    // -------------------------------------------------------------------------

    // NEW → STARTING; queues on_actor_starting. Returns the start future.
    ActorFuture<void> start();

    // Runs one slice. Called by a worker after dequeuing the task.
    void execute();

    // Waiting → Queued. Returns false if the task is already queued/running.
    bool try_wake();

    // True if a consume condition is eligible at `round` and has data
    [[nodiscard]] bool has_ready_consumer(std::uint64_t round) const;

    // Accepted from any state before CLOSE_REQUESTED; idempotent
    ActorFuture<void> request_close();

    // -------------------------------------------------------------------------
    // Observers
    // -------------------------------------------------------------------------

    [[nodiscard]] ActorState state() const noexcept { return state_.load(std::memory_order_acquire); }

    [[nodiscard]] SchedulingState scheduling_state() const noexcept {
        return scheduling_.load(std::memory_order_acquire);
    }

    [[nodiscard]] std::string_view name() const noexcept { return actor_->name(); }

    [[nodiscard]] ActorControl& control() noexcept { return control_; }

    [[nodiscard]] ActorFuture<void> close_future() const { return close_future_; }

    // Task whose job is running on the calling thread (nullptr outside jobs)
    [[nodiscard]] static ActorTask* current() noexcept;

private:
    friend class ActorControl;

    // The job is shared so a run survives consumers_ being modified by it
    struct ConsumerEntry {
        Consumable* condition = nullptr;
        std::shared_ptr<ActorJob> job;
        std::uint32_t stalled_runs = 0;
        std::uint64_t skip_until_round = 0;
    };

    // --- Job queue -----------------------------------------------------------
    Error submit_(ActorJob job, bool external);
    void push_front_(ActorJob job);
    Error add_consumer_(Consumable& condition, ActorJob job);

    // --- Await ---------------------------------------------------------------
    std::uint64_t begin_await_();
    void resume_(std::uint64_t epoch, ActorJob continuation);

    // --- Slice ---------------------------------------------------------------
    void run_slice_();
    bool run_job_(ActorJob& job);
    bool advance_lifecycle_();
    void run_consumers_();
    [[nodiscard]] bool has_runnable_work_() const;
    [[nodiscard]] bool lifecycle_pending_locked_() const;

    // --- Failure / close -----------------------------------------------------
    void fail_(std::string_view reason);
    void finish_close_();
    template<class Hook>
    void invoke_hook_(const char* hook_name, Hook&& hook);

private:
    ActorScheduler& scheduler_;
    std::shared_ptr<Actor> actor_;
    ActorControl control_;

    std::atomic<SchedulingState> scheduling_{SchedulingState::Waiting};
    std::atomic<ActorState> state_{ActorState::New};

    // Guards everything below
    mutable std::mutex mutex_;
    std::deque<ActorJob> jobs_;
    std::vector<ConsumerEntry> consumers_;
    std::size_t pending_awaits_ = 0;
    std::uint64_t await_epoch_ = 0;
    bool close_after_start_ = false;
    bool failed_ = false;

    // Slice-local flags, only touched by the running worker
    bool yield_requested_ = false;
    bool in_until_done_ = false;
    bool done_called_ = false;

    ActorFuture<void> start_future_;
    ActorFuture<void> close_future_;
};

} // namespace flowline::actor
