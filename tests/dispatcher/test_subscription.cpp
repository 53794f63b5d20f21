/*
===============================================================================
 dispatcher::Subscription - Group B Unit Tests
===============================================================================

Scope:
------
These tests validate fragment-by-fragment delivery through poll().

Covered Contracts:
------------------
B1. A subscription starts at the tail and sees fragments in publish order
B2. poll() honours max_fragments
B3. Postpone stops delivery and keeps the cursor on the fragment
B4. Failed flags the fragment for every subscription and advances
B5. Padding and aborted claims are never delivered
B6. An uncommitted claim blocks delivery of later fragments until resolved
B7. Delivery survives many wraps of the buffer
B8. Partitioned subscriptions split streams by stream_id modulo count
B9. has_available() / progress() reflect the cursor
B10. A slow subscription backpressures producers
B11. Concurrent producers whose payloads look like frame headers: every
     delivered fragment is one that was published, in order, intact

Non-Goals:
----------
- Block peek (see test_block_peek.cpp)

===============================================================================
*/

#include <chrono>
#include <cstdint>
#include <cstring>
#include <iostream>
#include <span>
#include <string>
#include <thread>
#include <vector>

#include "flowline/dispatcher/builder.hpp"
#include "common/test_check.hpp"

using namespace flowline;
using namespace flowline::dispatcher;
using buffer::Fragment;
using buffer::FragmentResult;

namespace {

std::unique_ptr<Dispatcher> make_dispatcher(std::size_t buffer_size = 4096, std::size_t max_subscriptions = 8) {
    auto d = DispatcherBuilder::create("test")
        .buffer_size(buffer_size)
        .max_subscriptions(max_subscriptions)
        .build();
    TEST_CHECK(d != nullptr);
    return d;
}

// Collects payloads as strings
struct Collector {
    std::vector<std::string> payloads;
    std::vector<std::int32_t> streams;

    FragmentResult operator()(const Fragment& f) {
        payloads.emplace_back(f.as_string());
        streams.push_back(f.stream_id());
        return FragmentResult::Consume;
    }
};

} // namespace


// -----------------------------------------------------------------------------
// B1. Start position and ordering
// -----------------------------------------------------------------------------
void test_poll_in_order() {
    std::cout << "[TEST] Group B1: poll delivers in publish order from the tail\n";
    auto d = make_dispatcher();

    TEST_CHECK(d->offer("before") > 0);

    Subscription* s = d->open_subscription("reader");
    TEST_CHECK(s != nullptr);
    TEST_CHECK(s->position() == d->tail());

    TEST_CHECK(d->offer("one", 1) > 0);
    TEST_CHECK(d->offer("two", 2) > 0);
    TEST_CHECK(d->offer("three", 3) > 0);

    Collector c;
    TEST_CHECK(s->poll(c, 100) == 3);
    TEST_CHECK((c.payloads == std::vector<std::string>{"one", "two", "three"}));
    TEST_CHECK((c.streams == std::vector<std::int32_t>{1, 2, 3}));
    TEST_CHECK(s->position() == d->tail());
    TEST_CHECK(d->telemetry().fragments_consumed_total.load() == 3);

    // Nothing left
    TEST_CHECK(s->poll(c, 100) == 0);
    TEST_CHECK(c.payloads.size() == 3);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B2. max_fragments
// -----------------------------------------------------------------------------
void test_poll_limit() {
    std::cout << "[TEST] Group B2: poll honours max_fragments\n";
    auto d = make_dispatcher();
    Subscription* s = d->open_subscription("reader");

    for (int i = 0; i < 5; ++i) {
        TEST_CHECK(d->offer(std::to_string(i)) > 0);
    }

    Collector c;
    TEST_CHECK(s->poll(c, 2) == 2);
    TEST_CHECK(s->poll(c, 10) == 3);
    TEST_CHECK((c.payloads == std::vector<std::string>{"0", "1", "2", "3", "4"}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B3. Postpone
// -----------------------------------------------------------------------------
void test_postpone_keeps_cursor() {
    std::cout << "[TEST] Group B3: postpone keeps the cursor on the fragment\n";
    auto d = make_dispatcher();
    Subscription* s = d->open_subscription("reader");

    const std::int64_t first_end = d->offer("first");
    TEST_CHECK(first_end > 0);
    TEST_CHECK(d->offer("second") > 0);

    int calls = 0;
    const int n = s->poll([&](const Fragment& f) {
        ++calls;
        return f.as_string() == "second" ? FragmentResult::Postpone : FragmentResult::Consume;
    }, 10);
    TEST_CHECK(n == 1);
    TEST_CHECK(calls == 2);
    TEST_CHECK(s->position() == first_end);

    Collector c;
    TEST_CHECK(s->poll(c, 10) == 1);
    TEST_CHECK(c.payloads.front() == "second");

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B4. Failed
// -----------------------------------------------------------------------------
void test_failed_flags_fragment() {
    std::cout << "[TEST] Group B4: failed fragments are flagged for every reader\n";
    auto d = make_dispatcher();
    Subscription* a = d->open_subscription("a");
    Subscription* b = d->open_subscription("b");

    TEST_CHECK(d->offer("bad") > 0);
    TEST_CHECK(d->offer("good") > 0);

    const int n = a->poll([](const Fragment& f) {
        return f.as_string() == "bad" ? FragmentResult::Failed : FragmentResult::Consume;
    }, 10);
    TEST_CHECK(n == 2);
    TEST_CHECK(a->position() == d->tail());
    TEST_CHECK(d->telemetry().fragments_failed_total.load() == 1);
    TEST_CHECK(d->telemetry().fragments_consumed_total.load() == 1);

    // The other subscription still receives it, flagged
    std::vector<bool> failed;
    TEST_CHECK(b->poll([&](const Fragment& f) {
        failed.push_back(f.is_failed());
        return FragmentResult::Consume;
    }, 10) == 2);
    TEST_CHECK((failed == std::vector<bool>{true, false}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B5. Padding and aborted claims
// -----------------------------------------------------------------------------
void test_aborted_claims_skipped() {
    std::cout << "[TEST] Group B5: aborted claims are skipped\n";
    auto d = make_dispatcher();
    Subscription* s = d->open_subscription("reader");

    buffer::ClaimedFragment claim;
    TEST_CHECK(d->claim(claim, 32, 5) > 0);
    claim.abort();
    TEST_CHECK(d->offer("after") > 0);

    Collector c;
    TEST_CHECK(s->poll(c, 10) == 1);
    TEST_CHECK(c.payloads.front() == "after");
    TEST_CHECK(s->position() == d->tail());

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B6. Uncommitted claims block later fragments
// -----------------------------------------------------------------------------
void test_open_claim_blocks_delivery() {
    std::cout << "[TEST] Group B6: an open claim holds back later fragments\n";
    auto d = make_dispatcher();
    Subscription* s = d->open_subscription("reader");

    buffer::ClaimedFragment claim;
    TEST_CHECK(d->claim(claim, 5, 1) > 0);
    TEST_CHECK(d->offer("later", 2) > 0);

    Collector c;
    TEST_CHECK(!s->has_available());
    TEST_CHECK(s->poll(c, 10) == 0);
    TEST_CHECK(s->position() == 0);

    std::memcpy(claim.data(), "early", 5);
    claim.commit();

    TEST_CHECK(s->has_available());
    TEST_CHECK(s->poll(c, 10) == 2);
    TEST_CHECK((c.payloads == std::vector<std::string>{"early", "later"}));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B7. Wrap-around
// -----------------------------------------------------------------------------
void test_delivery_across_wraps() {
    std::cout << "[TEST] Group B7: delivery across many buffer wraps\n";
    auto d = make_dispatcher(1024);
    Subscription* s = d->open_subscription("reader");

    std::uint64_t expected = 0;
    std::uint64_t sent = 0;
    std::vector<std::byte> payload(100);

    while (sent < 1000) {
        // Varying sizes exercise both explicit and implicit padding
        const std::size_t length = 8 + (sent % 13) * 7;
        std::memcpy(payload.data(), &sent, sizeof(sent));
        const std::int64_t rc = d->offer(std::span<const std::byte>(payload.data(), length), 0);
        if (rc == buffer::position::BACKPRESSURED) {
            TEST_CHECK(s->poll([&](const Fragment& f) {
                std::uint64_t seq = 0;
                std::memcpy(&seq, f.data(), sizeof(seq));
                TEST_CHECK(seq == expected);
                TEST_CHECK(f.length() == 8 + (seq % 13) * 7);
                ++expected;
                return FragmentResult::Consume;
            }, 1000) > 0);
            continue;
        }
        TEST_CHECK(rc > 0);
        ++sent;
    }
    (void)s->poll([&](const Fragment& f) {
        std::uint64_t seq = 0;
        std::memcpy(&seq, f.data(), sizeof(seq));
        TEST_CHECK(seq == expected);
        ++expected;
        return FragmentResult::Consume;
    }, 1000);

    TEST_CHECK(expected == 1000);
    TEST_CHECK(s->position() == d->tail());
    TEST_CHECK(d->tail() > static_cast<std::int64_t>(10 * d->capacity()));
    TEST_CHECK(d->telemetry().padding_frames_total.load() > 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B8. Partitions
// -----------------------------------------------------------------------------
void test_partitioned_delivery() {
    std::cout << "[TEST] Group B8: partitions split streams by stream id\n";
    auto d = make_dispatcher();
    auto parts = d->open_partitioned_subscription("workers", 3);
    TEST_CHECK(parts.size() == 3);

    for (std::int32_t sid = -1; sid < 9; ++sid) {
        TEST_CHECK(d->offer(std::to_string(sid), sid) > 0);
    }

    std::vector<std::vector<std::int32_t>> seen(3);
    for (std::uint32_t p = 0; p < 3; ++p) {
        TEST_CHECK(parts[p]->partition() == p);
        TEST_CHECK(parts[p]->partition_count() == 3);
        (void)parts[p]->poll([&](const Fragment& f) {
            seen[p].push_back(f.stream_id());
            return FragmentResult::Consume;
        }, 100);
        TEST_CHECK(parts[p]->position() == d->tail());
    }

    TEST_CHECK((seen[0] == std::vector<std::int32_t>{0, 3, 6}));
    TEST_CHECK((seen[1] == std::vector<std::int32_t>{1, 4, 7}));
    TEST_CHECK((seen[2] == std::vector<std::int32_t>{-1, 2, 5, 8}));

    TEST_CHECK(parts[2]->owns(-1));
    TEST_CHECK(!parts[0]->owns(-1));

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B9. has_available / progress
// -----------------------------------------------------------------------------
void test_consumable_view() {
    std::cout << "[TEST] Group B9: has_available and progress follow the cursor\n";
    auto d = make_dispatcher();
    Subscription* s = d->open_subscription("reader");

    TEST_CHECK(!s->has_available());
    const std::int64_t before = s->progress();

    TEST_CHECK(d->offer("x") > 0);
    TEST_CHECK(s->has_available());

    Collector c;
    TEST_CHECK(s->poll(c, 1) == 1);
    TEST_CHECK(!s->has_available());
    TEST_CHECK(s->progress() > before);

    TEST_CHECK(d->offer("y") > 0);
    TEST_CHECK(d->close_subscription(s) == Error::None);
    TEST_CHECK(s->is_closed());
    TEST_CHECK(!s->has_available());
    TEST_CHECK(s->poll(c, 1) == 0);

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B10. Backpressure from a slow subscription
// -----------------------------------------------------------------------------
void test_slow_subscription_backpressures() {
    std::cout << "[TEST] Group B10: slow subscription backpressures producers\n";
    auto d = make_dispatcher(1024);
    Subscription* s = d->open_subscription("slow");

    const std::string payload(100, 'p');
    int accepted = 0;
    while (d->offer(payload) > 0) {
        ++accepted;
        TEST_CHECK(accepted < 100);
    }
    TEST_CHECK(accepted == 8);
    TEST_CHECK(d->offer(payload) == buffer::position::BACKPRESSURED);

    Collector c;
    // One fragment consumed frees exactly the padding + frame the next offer needs
    TEST_CHECK(s->poll(c, 1) == 1);
    TEST_CHECK(d->offer(payload) == 1144);
    TEST_CHECK(d->offer(payload) == buffer::position::BACKPRESSURED);

    TEST_CHECK(s->poll(c, 100) == 8);
    TEST_CHECK(s->position() == d->tail());
    TEST_CHECK(d->offer(payload) > 0);

    // A closed subscription no longer holds producers back
    TEST_CHECK(d->close_subscription(s) == Error::None);
    for (int i = 0; i < 50; ++i) {
        TEST_CHECK(d->offer(payload) > 0);
    }

    std::cout << "[TEST] OK\n";
}

// -----------------------------------------------------------------------------
// B11. Header-shaped payloads under concurrent wrap-around
// -----------------------------------------------------------------------------
void test_header_like_payloads_under_concurrency() {
    std::cout << "[TEST] Group B11: header-shaped payloads never surface as fragments\n";
    constexpr int PRODUCERS = 2;
    constexpr std::uint64_t PER_PRODUCER = 20'000;

    auto d = make_dispatcher(4096);
    Subscription* s = d->open_subscription("reader");
    const std::int64_t capacity = static_cast<std::int64_t>(d->capacity());

    std::vector<std::thread> producers;
    for (int p = 0; p < PRODUCERS; ++p) {
        producers.emplace_back([&d, p, capacity] {
            std::vector<std::uint64_t> words(32);
            std::uint64_t seq = 0;
            while (seq < PER_PRODUCER) {
                // Word 0 carries the sequence, the rest read as committed
                // statuses of the current and the next lap
                const auto lap = static_cast<std::uint32_t>(d->tail() / capacity);
                const std::size_t count = 2 + seq % 24;
                words[0] = seq;
                for (std::size_t i = 1; i < count; ++i) {
                    words[i] = buffer::make_status(lap + static_cast<std::uint32_t>(i % 2), buffer::flag::COMMITTED);
                }
                const auto bytes = std::as_bytes(std::span<const std::uint64_t>(words.data(), count));
                const std::int64_t rc = d->offer(bytes, p);
                if (rc == buffer::position::BACKPRESSURED) {
                    std::this_thread::yield();
                    continue;
                }
                TEST_CHECK(rc > 0);
                ++seq;
            }
        });
    }

    std::vector<std::uint64_t> next(PRODUCERS, 0);
    std::uint64_t received = 0;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(60);
    while (received < PRODUCERS * PER_PRODUCER && std::chrono::steady_clock::now() < deadline) {
        (void)s->poll([&](const Fragment& f) {
            const std::int32_t sid = f.stream_id();
            TEST_CHECK(sid >= 0 && sid < PRODUCERS);
            TEST_CHECK(f.length() >= 16 && f.length() % 8 == 0);
            std::uint64_t seq = 0;
            std::memcpy(&seq, f.data(), sizeof(seq));
            TEST_CHECK(seq == next[sid]);
            TEST_CHECK(f.length() == 8 * (2 + seq % 24));
            ++next[sid];
            ++received;
            return FragmentResult::Consume;
        }, 256);
    }
    for (auto& t : producers) {
        t.join();
    }

    TEST_CHECK(received == PRODUCERS * PER_PRODUCER);
    TEST_CHECK(s->position() == d->tail());
    TEST_CHECK(d->tail() > 100 * capacity);
    TEST_CHECK(d->telemetry().bytes_cleaned_total.load() > 0);

    std::cout << "[TEST] OK\n";
}


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main() {
    test_poll_in_order();
    test_poll_limit();
    test_postpone_keeps_cursor();
    test_failed_flags_fragment();
    test_aborted_claims_skipped();
    test_open_claim_blocks_delivery();
    test_delivery_across_wraps();
    test_partitioned_delivery();
    test_consumable_view();
    test_slow_subscription_backpressures();
    test_header_like_payloads_under_concurrency();

    std::cout << "\n[TEST] ALL SUBSCRIPTION TESTS PASSED\n";
    return 0;
}
