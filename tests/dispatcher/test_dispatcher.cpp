/*
===============================================================================
 dispatcher::Dispatcher - Group D Unit Tests
===============================================================================

Scope:
------
These tests validate construction, the subscription registry and the
dispatcher lifecycle, with and without a conductor actor.

Covered Contracts:
------------------
D1. DispatcherBuilder rejects invalid configurations
D2. Registry: unique names, bounded slots, idempotent close, reuse
D3. Partitioned subscriptions are all-or-nothing
D4. close() refuses producers and closes every subscription
D5. Asynchronous registry calls without a scheduler complete inline
D6. Asynchronous registry calls through the conductor actor
D7. Completion callbacks of async registry calls may call back into the
    dispatcher (open, close subscription, close)
D8. A block peek still pending when its dispatcher is destroyed is detached

===============================================================================
*/

#include <atomic>
#include <chrono>
#include <iostream>
#include <string>
#include <vector>

#include "flowline/actor/scheduler.hpp"
#include "flowline/dispatcher/builder.hpp"
#include "common/test_check.hpp"

using namespace flowline;
using namespace flowline::dispatcher;
using namespace std::chrono_literals;


// -----------------------------------------------------------------------------
// D1. Builder validation
// -----------------------------------------------------------------------------
void test_builder_validation() {
    std::cout << "[TEST] Group D1: builder validates the configuration\n";

    TEST_CHECK(DispatcherBuilder::create("").build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").buffer_size(512).build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").buffer_size(4100).build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").max_subscriptions(0).build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").buffer_size(4096).max_fragment_length(4096).build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").subscriptions({"a", "a"}).build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").subscriptions({"a", ""}).build() == nullptr);
    TEST_CHECK(DispatcherBuilder::create("d").max_subscriptions(1).subscriptions({"a", "b"}).build() == nullptr);

    auto d = DispatcherBuilder::create("records")
        .buffer_size(4096)
        .max_subscriptions(4)
        .subscriptions({"exporter", "processor"})
        .build();
    TEST_CHECK(d != nullptr);
    TEST_CHECK(d->name() == "records");
    TEST_CHECK(d->capacity() == 4096);
    TEST_CHECK(d->max_fragment_length() == 4096 / 8);
    TEST_CHECK(d->subscription_count() == 2);
    TEST_CHECK(d->get_subscription("exporter") != nullptr);
    TEST_CHECK(d->get_subscription("processor") != nullptr);
    TEST_CHECK(d->get_subscription("missing") == nullptr);
    TEST_CHECK(!d->has_conductor());
    TEST_CHECK(!d->is_closed());

    DispatcherConfig cfg;
    cfg.name = "from-config";
    cfg.buffer_size = 8192;
    cfg.max_fragment_length = 100;
    auto e = DispatcherBuilder::from_config(cfg).build();
    TEST_CHECK(e != nullptr);
    TEST_CHECK(e->max_fragment_length() == 100);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D2. Registry
// -----------------------------------------------------------------------------
void test_registry() {
    std::cout << "[TEST] Group D2: subscription registry\n";
    auto d = DispatcherBuilder::create("reg").buffer_size(4096).max_subscriptions(2).build();
    TEST_CHECK(d != nullptr);

    Subscription* a = d->open_subscription("a");
    TEST_CHECK(a != nullptr);
    TEST_CHECK(a->name() == "a");
    TEST_CHECK(d->open_subscription("a") == nullptr);   // duplicate
    TEST_CHECK(d->open_subscription("") == nullptr);    // empty

    Subscription* b = d->open_subscription("b");
    TEST_CHECK(b != nullptr);
    TEST_CHECK(d->open_subscription("c") == nullptr);   // no slot left
    TEST_CHECK(d->subscription_count() == 2);

    TEST_CHECK(d->close_subscription(a) == Error::None);
    TEST_CHECK(a->is_closed());
    TEST_CHECK(d->close_subscription(a) == Error::None); // idempotent
    TEST_CHECK(d->close_subscription(nullptr) == Error::InvalidState);
    TEST_CHECK(d->subscription_count() == 1);
    TEST_CHECK(d->get_subscription("a") == nullptr);

    // Slot and name are reusable
    Subscription* a2 = d->open_subscription("a");
    TEST_CHECK(a2 != nullptr);
    TEST_CHECK(a2 != a);
    TEST_CHECK(d->get_subscription("a") == a2);

    // Subscriptions of another dispatcher are foreign
    auto other = DispatcherBuilder::create("other").buffer_size(4096).build();
    Subscription* foreign = other->open_subscription("a");
    TEST_CHECK(d->close_subscription(foreign) == Error::InvalidState);
    TEST_CHECK(!foreign->is_closed());

    TEST_CHECK(d->telemetry().subscriptions_opened_total.load() == 3);
    TEST_CHECK(d->telemetry().subscriptions_closed_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D3. Partitioned subscriptions
// -----------------------------------------------------------------------------
void test_partitioned_registry() {
    std::cout << "[TEST] Group D3: partitioned subscriptions are all-or-nothing\n";
    auto d = DispatcherBuilder::create("part").buffer_size(4096).max_subscriptions(4).build();
    TEST_CHECK(d != nullptr);

    TEST_CHECK(d->open_partitioned_subscription("p", 0).empty());
    TEST_CHECK(d->open_partitioned_subscription("p", 5).empty());
    TEST_CHECK(d->subscription_count() == 0);

    auto parts = d->open_partitioned_subscription("p", 3);
    TEST_CHECK(parts.size() == 3);
    for (std::uint32_t i = 0; i < 3; ++i) {
        TEST_CHECK(parts[i]->name() == "p");
        TEST_CHECK(parts[i]->partition() == i);
        TEST_CHECK(parts[i]->partition_count() == 3);
    }
    TEST_CHECK(d->get_subscription("p") == parts[0]);
    TEST_CHECK(d->open_partitioned_subscription("p", 1).empty());
    TEST_CHECK(d->open_partitioned_subscription("q", 2).empty()); // only one slot left
    TEST_CHECK(d->subscription_count() == 3);

    TEST_CHECK(d->open_subscription("q") != nullptr);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D4. close()
// -----------------------------------------------------------------------------
void test_dispatcher_close() {
    std::cout << "[TEST] Group D4: close refuses producers and closes subscriptions\n";
    auto d = DispatcherBuilder::create("closing").buffer_size(4096).build();
    Subscription* s = d->open_subscription("s");
    TEST_CHECK(d->offer("x") > 0);

    d->close();
    TEST_CHECK(d->is_closed());
    TEST_CHECK(s->is_closed());
    TEST_CHECK(d->subscription_count() == 0);
    TEST_CHECK(d->offer("y") == buffer::position::CLOSED);

    buffer::ClaimedFragment claim;
    TEST_CHECK(d->claim(claim, 8) == buffer::position::CLOSED);
    TEST_CHECK(!claim.is_open());

    TEST_CHECK(d->open_subscription("t") == nullptr);
    TEST_CHECK(d->open_partitioned_subscription("u", 2).empty());
    TEST_CHECK(s->poll([](const buffer::Fragment&) { return buffer::FragmentResult::Consume; }, 10) == 0);

    d->close(); // idempotent
    TEST_CHECK(d->telemetry().subscriptions_closed_total.load() == 1);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D5. Asynchronous registry without a scheduler
// -----------------------------------------------------------------------------
void test_async_without_scheduler() {
    std::cout << "[TEST] Group D5: async registry calls complete inline without a scheduler\n";
    auto d = DispatcherBuilder::create("inline").buffer_size(4096).build();

    auto opened = d->open_subscription_async("s");
    TEST_CHECK(opened.is_done());
    TEST_CHECK(!opened.is_failed());
    Subscription* s = opened.value();
    TEST_CHECK(s != nullptr);

    auto duplicate = d->open_subscription_async("s");
    TEST_CHECK(duplicate.is_done());
    TEST_CHECK(duplicate.value() == nullptr);

    auto closed = d->close_subscription_async(s);
    TEST_CHECK(closed.is_done());
    TEST_CHECK(!closed.is_failed());
    TEST_CHECK(s->is_closed());

    auto invalid = d->close_subscription_async(nullptr);
    TEST_CHECK(invalid.is_failed());
    TEST_CHECK(invalid.error() == Error::InvalidState);

    d->close();
    auto late = d->open_subscription_async("late");
    TEST_CHECK(late.is_failed());
    TEST_CHECK(late.error() == Error::Closed);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D6. Asynchronous registry through the conductor
// -----------------------------------------------------------------------------
void test_async_with_conductor() {
    std::cout << "[TEST] Group D6: async registry calls through the conductor actor\n";
    actor::SchedulerConfig cfg;
    cfg.name = "d6";
    cfg.worker_threads = 2;
    actor::ActorScheduler scheduler(cfg);

    auto d = DispatcherBuilder::create("async")
        .buffer_size(4096)
        .actor_scheduler(scheduler)
        .build();
    TEST_CHECK(d != nullptr);
    TEST_CHECK(d->has_conductor());

    // Requested before the scheduler runs: parked until the conductor starts
    auto early = d->open_subscription_async("early");
    TEST_CHECK(!early.is_done());

    scheduler.start();
    TEST_CHECK(d->conductor_started().join(2s));
    TEST_CHECK(early.join(2s));
    TEST_CHECK(!early.is_failed());
    Subscription* s = early.value();
    TEST_CHECK(s != nullptr);
    TEST_CHECK(d->get_subscription("early") == s);

    auto duplicate = d->open_subscription_async("early");
    TEST_CHECK(duplicate.join(2s));
    TEST_CHECK(duplicate.value() == nullptr);

    auto closed = d->close_subscription_async(s);
    TEST_CHECK(closed.join(2s));
    TEST_CHECK(!closed.is_failed());
    TEST_CHECK(s->is_closed());

    d->close();
    auto late = d->open_subscription_async("late");
    TEST_CHECK(late.join(2s));
    TEST_CHECK(late.is_failed());
    TEST_CHECK(late.error() == Error::Closed);

    TEST_CHECK(scheduler.stop());
    TEST_CHECK(scheduler.actor_count() == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D7. Re-entrant completion callbacks
// -----------------------------------------------------------------------------
void test_reentrant_completion_callbacks() {
    std::cout << "[TEST] Group D7: completion callbacks re-enter the dispatcher\n";
    actor::SchedulerConfig cfg;
    cfg.name = "d7";
    cfg.worker_threads = 2;
    actor::ActorScheduler scheduler(cfg);

    auto d = DispatcherBuilder::create("reentrant")
        .buffer_size(4096)
        .actor_scheduler(scheduler)
        .build();
    TEST_CHECK(d != nullptr);

    // Parked until the conductor starts, so the callback runs on the conductor
    auto first = d->open_subscription_async("first");
    TEST_CHECK(!first.is_done());

    actor::ActorFuture<Subscription*> second;
    actor::ActorFuture<void> first_closed;
    std::atomic<bool> chained{false};
    first.on_complete([&](const actor::ActorFuture<Subscription*>& opened) {
        second = d->open_subscription_async("second");
        first_closed = d->close_subscription_async(opened.value());
        chained.store(true, std::memory_order_release);
    });

    scheduler.start();
    TEST_CHECK(test::wait_until([&] { return chained.load(std::memory_order_acquire); }, 2s));

    TEST_CHECK(second.join(2s));
    TEST_CHECK(!second.is_failed());
    TEST_CHECK(second.value() != nullptr);
    TEST_CHECK(first_closed.join(2s));
    TEST_CHECK(!first_closed.is_failed());
    TEST_CHECK(d->get_subscription("first") == nullptr);
    TEST_CHECK(d->get_subscription("second") == second.value());

    // close() from a callback
    std::atomic<bool> closed_from_callback{false};
    auto third = d->open_subscription_async("third");
    third.on_complete([&](const actor::ActorFuture<Subscription*>&) {
        d->close();
        closed_from_callback.store(true, std::memory_order_release);
    });
    TEST_CHECK(test::wait_until([&] { return closed_from_callback.load(std::memory_order_acquire); }, 2s));
    TEST_CHECK(d->is_closed());
    TEST_CHECK(d->subscription_count() == 0);

    TEST_CHECK(scheduler.stop());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// D8. Pending peek outliving its dispatcher
// -----------------------------------------------------------------------------
void test_peek_outlives_dispatcher() {
    std::cout << "[TEST] Group D8: a pending peek is detached when its dispatcher goes away\n";
    BlockPeek peek;

    auto d = DispatcherBuilder::create("short-lived").buffer_size(4096).build();
    TEST_CHECK(d != nullptr);
    Subscription* s = d->open_subscription("reader");
    TEST_CHECK(s != nullptr);
    TEST_CHECK(d->offer("payload") > 0);
    TEST_CHECK(s->peek_block(peek, 1024) > 0);
    TEST_CHECK(peek.is_pending());

    d.reset();
    TEST_CHECK(!peek.is_pending());
    TEST_CHECK(peek.mark_completed() == Error::InvalidState);
    TEST_CHECK(peek.mark_failed() == Error::InvalidState);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    test_builder_validation();
    test_registry();
    test_partitioned_registry();
    test_dispatcher_close();
    test_async_without_scheduler();
    test_async_with_conductor();
    test_reentrant_completion_callbacks();
    test_peek_outlives_dispatcher();

    std::cout << "\n[TEST] ALL DISPATCHER TESTS PASSED\n";
    return 0;
}
