#pragma once

#include <cstdint>
#include <exception>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

#include "flowline/actor/consumable.hpp"
#include "flowline/actor/future.hpp"
#include "flowline/actor/job.hpp"
#include "flowline/actor/state.hpp"
#include "flowline/error.hpp"


namespace flowline::actor {

class ActorTask;

/*
===============================================================================
ActorControl
===============================================================================

Control surface of one actor, passed to every lifecycle hook.

Scheduling primitives (valid from the actor's own jobs):

  run(job)                 append a job to the actor's queue
  yield()                  end the current slice after this job; the actor
                           goes to the back of the run queue
  run_until_done(job)      re-run job, one invocation per slice and nothing
                           else of the actor in between, until it calls done()
  await(future, cont)      suspend the actor's queue until future completes,
                           then run cont before anything else
  consume(cond, job)       run job whenever cond reports data; runs that make
                           no progress back off exponentially (poll rounds)

Thread-safe entry points (any thread):

  submit(job)              ActorClosed once close was requested
  call(fn)                 run fn on the actor, result through a future
  close()                  request close; future completes at CLOSED

run() from a foreign thread behaves like submit().
===============================================================================
*/

class ActorControl {
public:
    explicit ActorControl(ActorTask& task) noexcept
        : task_(task)
    {}

    ActorControl(const ActorControl&) = delete;
    ActorControl& operator=(const ActorControl&) = delete;

    // -------------------------------------------------------------------------
    // Jobs
    // -------------------------------------------------------------------------

    // Never fails when called from the actor's own jobs before CLOSED
    Error run(ActorJob job);

    [[nodiscard]] Error submit(ActorJob job);

    void yield() noexcept;

    Error run_until_done(ActorJob job);

    // Marks the running run-until-done job as finished
    void done() noexcept;

    // ActorClosed once the actor is CLOSING
    Error consume(Consumable& condition, ActorJob job);

    template<class T>
    void await(ActorFuture<T> future, std::function<void(const ActorFuture<T>&)> continuation) {
        const std::uint64_t epoch = begin_await_();
        std::shared_ptr<ActorTask> task = task_ref_();
        future.on_complete(
            [task = std::move(task), epoch, continuation = std::move(continuation)](const ActorFuture<T>& completed) {
                ActorControl::resume_(task, epoch, ActorJob{[continuation, completed] { continuation(completed); }});
            });
    }

    // Runs fn on the actor. A std::exception thrown by fn fails the future
    // with ActorFailure and leaves the actor running; any other exception
    // fails the future and then the actor.
    template<class F>
    [[nodiscard]] auto call(F fn) -> ActorFuture<std::invoke_result_t<F&>> {
        using R = std::invoke_result_t<F&>;
        ActorFuture<R> future;
        const Error err = submit_(ActorJob{[fn = std::move(fn), future]() mutable {
            try {
                if constexpr (std::is_void_v<R>) {
                    fn();
                    future.complete();
                }
                else {
                    future.complete(fn());
                }
            }
            catch (const std::exception& e) {
                future.complete_exceptionally(Error::ActorFailure, e.what());
            }
            catch (...) {
                future.complete_exceptionally(Error::ActorFailure, "unknown exception");
                throw;
            }
        }}, !on_actor_thread_());
        if (err != Error::None) {
            future.complete_exceptionally(err, "actor no longer accepts jobs");
        }
        return future;
    }

    // -------------------------------------------------------------------------
    // Lifecycle
    // -------------------------------------------------------------------------

    ActorFuture<void> close();

    [[nodiscard]] ActorState state() const noexcept;

    [[nodiscard]] std::string_view name() const noexcept;

private:
    [[nodiscard]] Error submit_(ActorJob job, bool external);
    [[nodiscard]] bool on_actor_thread_() const noexcept;
    [[nodiscard]] std::uint64_t begin_await_();
    [[nodiscard]] std::shared_ptr<ActorTask> task_ref_();

    static void resume_(const std::shared_ptr<ActorTask>& task, std::uint64_t epoch, ActorJob continuation);

    ActorTask& task_;
};

} // namespace flowline::actor
