/*
===============================================================================
 Dispatcher + ActorScheduler - Group G Integration Tests
===============================================================================

Scope:
------
End-to-end ordering and loss checks: one producer actor publishes
10,000,000 sequential 4-byte counters through a 10 MB dispatcher, consumer
actors registered with consume() verify every value.

Covered Contracts:
------------------
G1. offer(): each observed counter equals the previous one + 1
G2. claim() + commit(): same ordering guarantee
G3. peek_block() observes the identical sequence as poll(), only batched
G4. Consumers are driven by data readiness, never signalled by producers
G5. claim() + stream-aware peek_block() resolved in a later slice through
    run_until_done() observes the same sequence

Non-Goals:
----------
- Throughput measurement (see the throughput example)

===============================================================================
*/

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <vector>

#include "flowline.hpp"
#include "common/test_check.hpp"

using namespace flowline;
using namespace std::chrono_literals;

namespace {

constexpr std::uint32_t COUNTERS = 10'000'000;
constexpr std::size_t BUFFER_SIZE = 10 * 1024 * 1024;
constexpr std::uint32_t BURST = 4096;

enum class Publish { Offer, Claim };

// Poll: poll() batches; Peek: peek_block() resolved in the consume job;
// DeferredPeek: stream-aware peek_block() resolved by a run_until_done() job
enum class Read { Poll, Peek, DeferredPeek };

constexpr std::size_t MAX_BLOCK = 64 * 1024;

// -----------------------------------------------------------------------------
// Producer: publishes 0..COUNTERS-1 in bursts, yields on backpressure
// -----------------------------------------------------------------------------
class CounterProducer final : public actor::Actor {
public:
    CounterProducer(dispatcher::Dispatcher& dispatcher, Publish mode)
        : dispatcher_(dispatcher), mode_(mode) {}

    [[nodiscard]] std::string_view name() const noexcept override { return "counter-producer"; }

    void on_actor_started(actor::ActorControl& ctl) override {
        TEST_CHECK(ctl.run_until_done(actor::ActorJob{[this, &ctl] { burst_(ctl); }}) == Error::None);
    }

    [[nodiscard]] actor::ActorFuture<void> finished() const { return finished_; }

    std::uint64_t backpressured = 0;

private:
    void burst_(actor::ActorControl& ctl) {
        const std::uint32_t end = std::min(next_ + BURST, COUNTERS);
        while (next_ < end) {
            std::int64_t rc = 0;
            if (mode_ == Publish::Offer) {
                rc = dispatcher_.offer(std::as_bytes(std::span<const std::uint32_t>(&next_, 1)));
            }
            else {
                buffer::ClaimedFragment claim;
                rc = dispatcher_.claim(claim, sizeof(next_));
                if (rc >= 0) {
                    std::memcpy(claim.data(), &next_, sizeof(next_));
                    claim.commit();
                }
            }
            if (rc == buffer::position::BACKPRESSURED) {
                ++backpressured;
                ctl.yield();
                return;
            }
            TEST_CHECK(rc > 0);
            ++next_;
        }
        if (next_ == COUNTERS) {
            ctl.done();
            finished_.complete();
        }
    }

    dispatcher::Dispatcher& dispatcher_;
    const Publish mode_;
    std::uint32_t next_ = 0;
    actor::ActorFuture<void> finished_;
};

// -----------------------------------------------------------------------------
// Consumer: opens its subscription asynchronously, then consumes on readiness
// -----------------------------------------------------------------------------
class CounterConsumer final : public actor::Actor {
public:
    CounterConsumer(dispatcher::Dispatcher& dispatcher, std::string name, Read mode)
        : dispatcher_(dispatcher), name_(std::move(name)), mode_(mode) {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    void on_actor_starting(actor::ActorControl& ctl) override {
        ctl.await<dispatcher::Subscription*>(dispatcher_.open_subscription_async(name_),
            [this](const actor::ActorFuture<dispatcher::Subscription*>& opened) {
                TEST_CHECK(!opened.is_failed());
                subscription_ = opened.value();
                TEST_CHECK(subscription_ != nullptr);
            });
    }

    void on_actor_started(actor::ActorControl& ctl) override {
        TEST_CHECK(ctl.consume(*subscription_, actor::ActorJob{[this, &ctl] {
            switch (mode_) {
                case Read::Poll: {
                    const int n = subscription_->poll([this](const buffer::Fragment& fragment) {
                        observe_(fragment);
                        return buffer::FragmentResult::Consume;
                    }, 1024);
                    if (n > 0) {
                        ++batches;
                    }
                    break;
                }
                case Read::Peek:
                    if (subscription_->peek_block(peek_, MAX_BLOCK) > 0) {
                        process_peek_();
                    }
                    break;
                case Read::DeferredPeek:
                    if (!peek_.is_pending() && subscription_->peek_block(peek_, MAX_BLOCK, true) > 0) {
                        TEST_CHECK(ctl.run_until_done(actor::ActorJob{[this, &ctl] {
                            process_peek_();
                            ctl.done();
                            finish_if_complete_(ctl);
                        }}) == Error::None);
                        return;
                    }
                    break;
            }
            finish_if_complete_(ctl);
        }}) == Error::None);
    }

    [[nodiscard]] actor::ActorFuture<void> finished() const { return finished_; }

    std::uint64_t received = 0;
    std::uint64_t gaps = 0;
    std::uint64_t batches = 0;
    integrity::ChainedDigest digest;

private:
    void process_peek_() {
        for (const buffer::Fragment fragment : peek_) {
            TEST_CHECK(fragment.stream_id() == peek_.stream_id());
            observe_(fragment);
        }
        ++batches;
        TEST_CHECK(peek_.mark_completed() == Error::None);
    }

    void finish_if_complete_(actor::ActorControl& ctl) {
        if (received == COUNTERS && !finished_.is_done()) {
            finished_.complete();
            (void)ctl.close();
        }
    }

    void observe_(const buffer::Fragment& fragment) {
        TEST_CHECK(fragment.length() == sizeof(std::uint32_t));
        std::uint32_t value = 0;
        std::memcpy(&value, fragment.data(), sizeof(value));
        if (value != expected_) {
            ++gaps;
        }
        expected_ = value + 1;
        digest.update(fragment.payload());
        ++received;
    }

    dispatcher::Dispatcher& dispatcher_;
    const std::string name_;
    const Read mode_;
    dispatcher::Subscription* subscription_ = nullptr;
    dispatcher::BlockPeek peek_;
    std::uint32_t expected_ = 0;
    actor::ActorFuture<void> finished_;
};

struct Outcome {
    std::vector<std::shared_ptr<CounterConsumer>> consumers;
    std::uint64_t offers = 0;
    std::uint64_t commits = 0;
    std::uint64_t consumer_runs = 0;
};

Outcome run_scenario(Publish mode, const std::vector<std::pair<std::string, Read>>& readers) {
    actor::SchedulerConfig cfg;
    cfg.name = "counters";
    cfg.worker_threads = 3;
    actor::ActorScheduler scheduler(cfg);
    scheduler.start();

    auto dispatcher = dispatcher::DispatcherBuilder::create("counters")
        .buffer_size(BUFFER_SIZE)
        .actor_scheduler(scheduler)
        .build();
    TEST_CHECK(dispatcher != nullptr);

    Outcome outcome;
    for (const auto& [name, read] : readers) {
        auto consumer = std::make_shared<CounterConsumer>(*dispatcher, name, read);
        // Subscribed before the first counter is published
        TEST_CHECK(scheduler.submit_actor(consumer).join(10s));
        outcome.consumers.push_back(consumer);
    }

    auto producer = std::make_shared<CounterProducer>(*dispatcher, mode);
    (void)scheduler.submit_actor(producer);

    TEST_CHECK(producer->finished().join(120s));
    for (const auto& consumer : outcome.consumers) {
        TEST_CHECK(consumer->finished().join(120s));
    }

    dispatcher->close();
    TEST_CHECK(scheduler.stop());

    outcome.offers = dispatcher->telemetry().offers_total.load();
    outcome.commits = dispatcher->telemetry().commits_total.load();
    outcome.consumer_runs = scheduler.telemetry().consumer_runs_total.load();
    return outcome;
}

} // namespace


// -----------------------------------------------------------------------------
// G1. offer()
// -----------------------------------------------------------------------------
void test_offer_counters() {
    std::cout << "[TEST] Group G1: 10M counters through offer()\n";
    const Outcome o = run_scenario(Publish::Offer, {{"poll", Read::Poll}});
    const auto& c = *o.consumers.front();
    TEST_CHECK(c.received == COUNTERS);
    TEST_CHECK(c.gaps == 0);
    TEST_CHECK(o.offers == COUNTERS);
    TEST_CHECK(o.consumer_runs > 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// G2. claim() + commit()
// -----------------------------------------------------------------------------
void test_claim_counters() {
    std::cout << "[TEST] Group G2: 10M counters through claim() + commit()\n";
    const Outcome o = run_scenario(Publish::Claim, {{"poll", Read::Poll}});
    const auto& c = *o.consumers.front();
    TEST_CHECK(c.received == COUNTERS);
    TEST_CHECK(c.gaps == 0);
    TEST_CHECK(o.commits == COUNTERS);
    TEST_CHECK(o.offers == 0);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// G3. peek_block() vs poll()
// -----------------------------------------------------------------------------
void test_peek_matches_poll() {
    std::cout << "[TEST] Group G3: block peek observes the same sequence as poll\n";
    const Outcome o = run_scenario(Publish::Offer, {{"poll", Read::Poll}, {"peek", Read::Peek}});
    const auto& polled = *o.consumers[0];
    const auto& peeked = *o.consumers[1];

    TEST_CHECK(polled.received == COUNTERS);
    TEST_CHECK(peeked.received == COUNTERS);
    TEST_CHECK(polled.gaps == 0);
    TEST_CHECK(peeked.gaps == 0);
    TEST_CHECK(polled.digest == peeked.digest);

    // Same data, fewer deliveries
    TEST_CHECK(peeked.batches > 0);
    TEST_CHECK(peeked.batches < COUNTERS);
    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// G5. claim() + deferred stream-aware peek
// -----------------------------------------------------------------------------
void test_claim_with_deferred_peek() {
    std::cout << "[TEST] Group G5: claimed counters through a peek resolved in a later slice\n";
    const Outcome o = run_scenario(Publish::Claim, {{"poll", Read::Poll}, {"deferred-peek", Read::DeferredPeek}});
    const auto& polled = *o.consumers[0];
    const auto& peeked = *o.consumers[1];

    TEST_CHECK(polled.received == COUNTERS);
    TEST_CHECK(peeked.received == COUNTERS);
    TEST_CHECK(peeked.gaps == 0);
    TEST_CHECK(polled.digest == peeked.digest);
    TEST_CHECK(o.commits == COUNTERS);

    TEST_CHECK(peeked.batches > 0);
    TEST_CHECK(peeked.batches < COUNTERS);
    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    lcr::log::Logger::instance().set_level(lcr::log::Level::Warn);

    test_offer_counters();
    test_claim_counters();
    test_peek_matches_poll();
    test_claim_with_deferred_peek();

    std::cout << "\n[TEST] ALL INTEGRATION TESTS PASSED\n";
    return 0;
}
