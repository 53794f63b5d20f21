#include "flowline/actor/task.hpp"

#include <algorithm>
#include <cassert>
#include <exception>
#include <string>
#include <utility>

#include "flowline/actor/scheduler.hpp"
#include "flowline/config/defaults.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::actor {

namespace {

thread_local ActorTask* current_task = nullptr;

// Marks the calling worker as running `task` for the duration of a slice
class CurrentTaskScope {
public:
    explicit CurrentTaskScope(ActorTask* task) noexcept
        : previous_(current_task)
    {
        current_task = task;
    }

    ~CurrentTaskScope() { current_task = previous_; }

    CurrentTaskScope(const CurrentTaskScope&) = delete;
    CurrentTaskScope& operator=(const CurrentTaskScope&) = delete;

private:
    ActorTask* previous_;
};

} // namespace


ActorTask* ActorTask::current() noexcept {
    return current_task;
}

ActorTask::ActorTask(ActorScheduler& scheduler, std::shared_ptr<Actor> actor)
    : scheduler_(scheduler)
    , actor_(std::move(actor))
    , control_(*this)
{}

// ============================================================================
// Scheduler interface
// ============================================================================

ActorFuture<void> ActorTask::start() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        assert(state_.load(std::memory_order_relaxed) == ActorState::New && "actor started twice");
        state_.store(ActorState::Starting, std::memory_order_release);
        jobs_.emplace_back([this] { actor_->on_actor_starting(control_); });
    }
    FL_DEBUG("[ACTOR] '" << name() << "' starting.");
    try_wake();
    return start_future_;
}

bool ActorTask::try_wake() {
    SchedulingState expected = SchedulingState::Waiting;
    if (!scheduling_.compare_exchange_strong(expected, SchedulingState::Queued,
                                             std::memory_order_acq_rel, std::memory_order_acquire)) {
        return false;
    }
    scheduler_.enqueue_(shared_from_this());
    return true;
}

void ActorTask::execute() {
    scheduling_.store(SchedulingState::Running, std::memory_order_release);
    {
        CurrentTaskScope scope(this);
        run_slice_();
    }
    scheduler_.mutable_telemetry_().slices_total.inc();

    if (state() == ActorState::Closed) {
        scheduling_.store(SchedulingState::Waiting, std::memory_order_release);
        return;
    }

    if (yield_requested_) {
        yield_requested_ = false;
        scheduler_.mutable_telemetry_().yields_total.inc();
        scheduling_.store(SchedulingState::Queued, std::memory_order_release);
        scheduler_.enqueue_(shared_from_this());
        return;
    }

    scheduling_.store(SchedulingState::Waiting, std::memory_order_seq_cst);
    if (has_runnable_work_()) {
        try_wake();
    }
}

bool ActorTask::has_ready_consumer(std::uint64_t round) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const ActorState s = state_.load(std::memory_order_relaxed);
    if (s != ActorState::Started && s != ActorState::CloseRequested) {
        return false;
    }
    if (pending_awaits_ != 0) {
        return false;
    }
    for (const auto& entry : consumers_) {
        if (entry.skip_until_round <= round && entry.condition->has_available()) {
            return true;
        }
    }
    return false;
}

ActorFuture<void> ActorTask::request_close() {
    bool wake = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        switch (state_.load(std::memory_order_relaxed)) {
            case ActorState::New:
            case ActorState::Starting:
                close_after_start_ = true;
                break;
            case ActorState::Started:
                state_.store(ActorState::CloseRequested, std::memory_order_release);
                jobs_.emplace_back([this] { actor_->on_actor_close_requested(control_); });
                wake = true;
                break;
            default:
                break;
        }
    }
    if (wake) {
        FL_DEBUG("[ACTOR] '" << name() << "' close requested.");
        try_wake();
    }
    return close_future_;
}

// ============================================================================
// Job queue
// ============================================================================

Error ActorTask::submit_(ActorJob job, bool external) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const ActorState s = state_.load(std::memory_order_relaxed);
        if (s == ActorState::Closed || (external && s >= ActorState::CloseRequested)) {
            scheduler_.mutable_telemetry_().jobs_rejected_total.inc();
            return Error::ActorClosed;
        }
        jobs_.push_back(std::move(job));
    }
    if (current_task != this) {
        try_wake();
    }
    return Error::None;
}

void ActorTask::push_front_(ActorJob job) {
    std::lock_guard<std::mutex> lock(mutex_);
    jobs_.push_front(std::move(job));
}

Error ActorTask::add_consumer_(Consumable& condition, ActorJob job) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.load(std::memory_order_relaxed) >= ActorState::Closing) {
        scheduler_.mutable_telemetry_().jobs_rejected_total.inc();
        return Error::ActorClosed;
    }
    consumers_.push_back(ConsumerEntry{&condition, std::make_shared<ActorJob>(std::move(job)), 0, 0});
    return Error::None;
}

// ============================================================================
// Await
// ============================================================================

std::uint64_t ActorTask::begin_await_() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++pending_awaits_;
    return await_epoch_;
}

void ActorTask::resume_(std::uint64_t epoch, ActorJob continuation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (epoch != await_epoch_ || state_.load(std::memory_order_relaxed) == ActorState::Closed) {
            // Awaits were dropped by a failure or close
            FL_DEBUG("[ACTOR] '" << name() << "' discarding stale await continuation.");
            return;
        }
        jobs_.push_front(std::move(continuation));
        if (pending_awaits_ > 0) {
            --pending_awaits_;
        }
    }
    if (current_task != this) {
        try_wake();
    }
}

// ============================================================================
// Slice
// ============================================================================

void ActorTask::run_slice_() {
    std::size_t budget = scheduler_.config().job_budget;
    bool consumers_ran = false;

    while (budget > 0) {
        ActorJob job;
        bool have_job = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (state_.load(std::memory_order_relaxed) == ActorState::Closed || pending_awaits_ != 0) {
                return;
            }
            if (!jobs_.empty()) {
                job = std::move(jobs_.front());
                jobs_.pop_front();
                have_job = true;
            }
        }

        if (have_job) {
            --budget;
            if (!run_job_(job)) {
                continue; // failure already routed into the closing sequence
            }
            if (job.until_done && !done_called_) {
                push_front_(std::move(job));
                yield_requested_ = true;
                return;
            }
            if (yield_requested_) {
                return;
            }
            continue;
        }

        // Queue drained
        if (advance_lifecycle_()) {
            continue;
        }
        if (consumers_ran) {
            return;
        }
        consumers_ran = true;
        run_consumers_();
        if (yield_requested_) {
            return;
        }
    }
}

bool ActorTask::run_job_(ActorJob& job) {
    in_until_done_ = job.until_done;
    done_called_ = false;

    bool ok = true;
    try {
        job.fn();
    }
    catch (const std::exception& e) {
        ok = false;
        fail_(e.what());
    }
    catch (...) {
        ok = false;
        fail_("unknown exception");
    }

    in_until_done_ = false;
    scheduler_.mutable_telemetry_().jobs_executed_total.inc();
    return ok;
}

bool ActorTask::advance_lifecycle_() {
    std::unique_lock<std::mutex> lock(mutex_);
    if (pending_awaits_ != 0) {
        return false;
    }
    if (!jobs_.empty()) {
        return true; // submitted concurrently
    }

    switch (state_.load(std::memory_order_relaxed)) {
        case ActorState::Starting:
            state_.store(ActorState::Started, std::memory_order_release);
            jobs_.emplace_back([this] { actor_->on_actor_started(control_); });
            lock.unlock();
            FL_DEBUG("[ACTOR] '" << name() << "' started.");
            start_future_.complete();
            return true;

        case ActorState::Started:
            if (!close_after_start_) {
                return false;
            }
            close_after_start_ = false;
            state_.store(ActorState::CloseRequested, std::memory_order_release);
            jobs_.emplace_back([this] { actor_->on_actor_close_requested(control_); });
            return true;

        case ActorState::CloseRequested:
            state_.store(ActorState::Closing, std::memory_order_release);
            consumers_.clear();
            jobs_.emplace_back([this] { actor_->on_actor_closing(control_); });
            return true;

        case ActorState::Closing:
            lock.unlock();
            finish_close_();
            return true;

        default:
            return false;
    }
}

void ActorTask::run_consumers_() {
    const std::uint64_t round = scheduler_.round();

    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        count = consumers_.size();
    }

    for (std::size_t i = 0; i < count; ++i) {
        Consumable* condition = nullptr;
        std::shared_ptr<ActorJob> job;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (i >= consumers_.size() || pending_awaits_ != 0) {
                return;
            }
            const ConsumerEntry& entry = consumers_[i];
            if (entry.skip_until_round > round) {
                continue;
            }
            condition = entry.condition;
            job = entry.job;
        }

        if (!condition->has_available()) {
            continue;
        }

        const std::int64_t before = condition->progress();
        if (!run_job_(*job)) {
            return;
        }
        scheduler_.mutable_telemetry_().consumer_runs_total.inc();
        const std::int64_t after = condition->progress();

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (i < consumers_.size() && consumers_[i].condition == condition) {
                ConsumerEntry& entry = consumers_[i];
                if (after != before) {
                    entry.stalled_runs = 0;
                    entry.skip_until_round = 0;
                }
                else {
                    ++entry.stalled_runs;
                    const std::uint32_t exponent =
                        std::min(entry.stalled_runs, config::max_consume_backoff_exponent);
                    entry.skip_until_round = round + (std::uint64_t{1} << exponent);
                }
            }
        }

        if (yield_requested_) {
            return;
        }
    }
}

bool ActorTask::has_runnable_work_() const {
    const std::uint64_t round = scheduler_.round();
    std::lock_guard<std::mutex> lock(mutex_);
    const ActorState s = state_.load(std::memory_order_relaxed);
    if (s == ActorState::Closed || pending_awaits_ != 0) {
        return false;
    }
    if (!jobs_.empty() || lifecycle_pending_locked_()) {
        return true;
    }
    if (s != ActorState::Started && s != ActorState::CloseRequested) {
        return false;
    }
    for (const auto& entry : consumers_) {
        if (entry.skip_until_round <= round && entry.condition->has_available()) {
            return true;
        }
    }
    return false;
}

bool ActorTask::lifecycle_pending_locked_() const {
    switch (state_.load(std::memory_order_relaxed)) {
        case ActorState::Starting:
        case ActorState::CloseRequested:
        case ActorState::Closing:
            return true;
        case ActorState::Started:
            return close_after_start_;
        default:
            return false;
    }
}

// ============================================================================
// Failure / close
// ============================================================================

template<class Hook>
void ActorTask::invoke_hook_(const char* hook_name, Hook&& hook) {
    try {
        hook();
    }
    catch (const std::exception& e) {
        scheduler_.mutable_telemetry_().actor_failures_total.inc();
        FL_ERROR("[ACTOR] '" << name() << "' " << hook_name << " threw: " << e.what());
    }
    catch (...) {
        scheduler_.mutable_telemetry_().actor_failures_total.inc();
        FL_ERROR("[ACTOR] '" << name() << "' " << hook_name << " threw an unknown exception.");
    }
}

void ActorTask::fail_(std::string_view reason) {
    FL_ERROR("[ACTOR] '" << name() << "' failed in state " << to_string(state()) << ": " << reason);
    scheduler_.mutable_telemetry_().actor_failures_total.inc();

    ActorState failed_in;
    std::size_t dropped_jobs = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_ = true;
        dropped_jobs = jobs_.size();
        jobs_.clear();
        consumers_.clear();
        pending_awaits_ = 0;
        ++await_epoch_;
        close_after_start_ = false;
        failed_in = state_.load(std::memory_order_relaxed);
        if (failed_in != ActorState::Closing && failed_in != ActorState::Closed) {
            state_.store(ActorState::CloseRequested, std::memory_order_release);
        }
    }
    yield_requested_ = false;
    if (dropped_jobs != 0) {
        FL_DEBUG("[ACTOR] '" << name() << "' dropped " << dropped_jobs << " pending job(s).");
    }

    start_future_.complete_exceptionally(Error::ActorFailure, std::string(reason));

    invoke_hook_("on_actor_failed", [&] { actor_->on_actor_failed(control_, reason); });

    if (failed_in == ActorState::Closing) {
        finish_close_();
    }
}

void ActorTask::finish_close_() {
    state_.store(ActorState::Closed, std::memory_order_release);

    invoke_hook_("on_actor_closed", [this] { actor_->on_actor_closed(control_); });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        jobs_.clear();
        consumers_.clear();
        pending_awaits_ = 0;
        ++await_epoch_;
    }

    scheduler_.mutable_telemetry_().actors_closed_total.inc();
    FL_DEBUG("[ACTOR] '" << name() << "' closed" << (failed_ ? " (after failure)." : "."));

    start_future_.complete_exceptionally(Error::ActorClosed, "actor closed before it started");
    close_future_.complete();
    scheduler_.deregister_(this);
}

// ============================================================================
// ActorControl
// ============================================================================

Error ActorControl::run(ActorJob job) {
    return task_.submit_(std::move(job), !on_actor_thread_());
}

Error ActorControl::submit(ActorJob job) {
    return task_.submit_(std::move(job), !on_actor_thread_());
}

void ActorControl::yield() noexcept {
    assert(on_actor_thread_() && "yield() outside the actor's own job");
    task_.yield_requested_ = true;
}

Error ActorControl::run_until_done(ActorJob job) {
    job.until_done = true;
    return task_.submit_(std::move(job), !on_actor_thread_());
}

void ActorControl::done() noexcept {
    assert(task_.in_until_done_ && "done() outside a run-until-done job");
    task_.done_called_ = true;
}

Error ActorControl::consume(Consumable& condition, ActorJob job) {
    return task_.add_consumer_(condition, std::move(job));
}

ActorFuture<void> ActorControl::close() {
    return task_.request_close();
}

ActorState ActorControl::state() const noexcept {
    return task_.state();
}

std::string_view ActorControl::name() const noexcept {
    return task_.name();
}

Error ActorControl::submit_(ActorJob job, bool external) {
    return task_.submit_(std::move(job), external);
}

bool ActorControl::on_actor_thread_() const noexcept {
    return current_task == &task_;
}

std::uint64_t ActorControl::begin_await_() {
    return task_.begin_await_();
}

std::shared_ptr<ActorTask> ActorControl::task_ref_() {
    return task_.shared_from_this();
}

void ActorControl::resume_(const std::shared_ptr<ActorTask>& task, std::uint64_t epoch, ActorJob continuation) {
    task->resume_(epoch, std::move(continuation));
}

} // namespace flowline::actor
