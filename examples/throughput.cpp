#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <span>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "flowline.hpp"

#include "common/cli/throughput_params.hpp"

using namespace flowline;
using namespace lcr::log;

namespace cli = flowline::examples::cli;

namespace {

// -----------------------------------------------------------------------------
// Payload layout: [sequence u64][stream id repeated as filler byte ...]
// -----------------------------------------------------------------------------
inline void fill_payload(std::span<std::byte> out, std::uint64_t sequence, std::int32_t stream_id) noexcept {
    std::memcpy(out.data(), &sequence, sizeof(sequence));
    std::memset(out.data() + sizeof(sequence), static_cast<unsigned char>(stream_id), out.size() - sizeof(sequence));
}

[[nodiscard]]
inline std::uint64_t read_sequence(std::span<const std::byte> payload) noexcept {
    std::uint64_t sequence = 0;
    std::memcpy(&sequence, payload.data(), sizeof(sequence));
    return sequence;
}


// -----------------------------------------------------------------------------
// Producer actor: publishes `count` sequenced payloads on its own stream
// -----------------------------------------------------------------------------
class Producer final : public actor::Actor {
public:
    static constexpr std::uint64_t BURST = 256;

    Producer(dispatcher::Dispatcher& dispatcher, const cli::throughput::Params& params, std::int32_t stream_id)
        : dispatcher_(dispatcher)
        , params_(params)
        , stream_id_(stream_id)
        , name_("producer-" + std::to_string(stream_id))
        , scratch_(params.message_size)
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return name_; }

    void on_actor_started(actor::ActorControl& ctl) override {
        const Error err = ctl.run_until_done(actor::ActorJob{[this, &ctl] { publish_burst_(ctl); }});
        if (err != Error::None) {
            FL_ERROR("[PRODUCER] " << name_ << " cannot schedule publishing: " << to_string(err));
            finished_.complete_exceptionally(err, "publishing not scheduled");
        }
    }

    void on_actor_closed(actor::ActorControl&) override {
        if (sent_ < params_.count) {
            finished_.complete_exceptionally(Error::Closed, "closed before all messages were sent");
        }
    }

    void on_actor_failed(actor::ActorControl&, std::string_view reason) override {
        finished_.complete_exceptionally(Error::ActorFailure, std::string(reason));
    }

    [[nodiscard]] actor::ActorFuture<void> finished() const { return finished_; }

    [[nodiscard]] const integrity::ChainedDigest& digest() const noexcept { return digest_; }

    [[nodiscard]] std::uint64_t backpressured() const noexcept { return backpressured_; }

private:
    void publish_burst_(actor::ActorControl& ctl) {
        const std::uint64_t end = std::min(sent_ + BURST, params_.count);
        while (sent_ < end) {
            const std::int64_t result = publish_one_();
            if (result == buffer::position::BACKPRESSURED) {
                ++backpressured_;
                ctl.yield();
                return;
            }
            if (result < 0) {
                FL_ERROR("[PRODUCER] " << name_ << " publish failed at sequence " << sent_
                         << ": " << to_string(buffer::to_error(result)));
                finished_.complete_exceptionally(buffer::to_error(result), "publish failed");
                ctl.done();
                return;
            }
            ++sent_;
        }
        if (sent_ == params_.count) {
            FL_DEBUG("[PRODUCER] " << name_ << " published " << sent_ << " messages.");
            ctl.done();
            finished_.complete();
        }
    }

    [[nodiscard]] std::int64_t publish_one_() noexcept {
        if (params_.mode == "offer") {
            fill_payload(scratch_, sent_, stream_id_);
            const std::int64_t result = dispatcher_.offer(std::span<const std::byte>(scratch_), stream_id_);
            if (result >= 0) {
                digest_.update(scratch_);
            }
            return result;
        }

        buffer::ClaimedFragment claim;
        const std::int64_t result = dispatcher_.claim(claim, params_.message_size, stream_id_);
        if (result < 0) {
            return result;
        }
        fill_payload(claim.buffer(), sent_, stream_id_);
        digest_.update(claim.buffer());
        claim.commit();
        return result;
    }

private:
    dispatcher::Dispatcher& dispatcher_;
    const cli::throughput::Params& params_;
    const std::int32_t stream_id_;
    const std::string name_;

    std::vector<std::byte> scratch_;
    std::uint64_t sent_ = 0;
    std::uint64_t backpressured_ = 0;
    integrity::ChainedDigest digest_;
    actor::ActorFuture<void> finished_;
};


// -----------------------------------------------------------------------------
// Consumer actor: verifies sequences and digests every stream
// -----------------------------------------------------------------------------
class Consumer final : public actor::Actor {
public:
    Consumer(dispatcher::Dispatcher& dispatcher, const cli::throughput::Params& params)
        : dispatcher_(dispatcher)
        , params_(params)
        , expected_total_(params.count * params.producers)
        , digests_(params.producers)
        , next_sequence_(params.producers, 0)
    {}

    [[nodiscard]] std::string_view name() const noexcept override { return "verifier"; }

    void on_actor_starting(actor::ActorControl& ctl) override {
        ctl.await<dispatcher::Subscription*>(
            dispatcher_.open_subscription_async("verifier"),
            [this, &ctl](const actor::ActorFuture<dispatcher::Subscription*>& opened) {
                if (opened.is_failed() || opened.value() == nullptr) {
                    FL_ERROR("[CONSUMER] Cannot open subscription 'verifier'.");
                    finished_.complete_exceptionally(Error::InvalidState, "subscription not opened");
                    ctl.close();
                    return;
                }
                subscription_ = opened.value();
            });
    }

    void on_actor_started(actor::ActorControl& ctl) override {
        if (subscription_ == nullptr) {
            return;
        }
        const Error err = ctl.consume(*subscription_, actor::ActorJob{[this, &ctl] {
            if (params_.mode == "peek") {
                drain_block_();
            }
            else {
                (void)subscription_->poll([this](const buffer::Fragment& f) { return verify_(f); }, 1024);
            }
            if (received_ == expected_total_) {
                finished_.complete();
                ctl.close();
            }
        }});
        if (err != Error::None) {
            finished_.complete_exceptionally(err, "consumer not scheduled");
        }
    }

    void on_actor_closed(actor::ActorControl&) override {
        if (received_ < expected_total_) {
            finished_.complete_exceptionally(Error::Closed, "closed before all messages were received");
        }
    }

    void on_actor_failed(actor::ActorControl&, std::string_view reason) override {
        finished_.complete_exceptionally(Error::ActorFailure, std::string(reason));
    }

    [[nodiscard]] actor::ActorFuture<void> finished() const { return finished_; }

    [[nodiscard]] const integrity::ChainedDigest& digest(std::size_t stream) const noexcept { return digests_[stream]; }

    [[nodiscard]] std::uint64_t received() const noexcept { return received_; }

    [[nodiscard]] std::uint64_t out_of_order() const noexcept { return out_of_order_; }

    [[nodiscard]] std::uint64_t blocks() const noexcept { return blocks_; }

private:
    buffer::FragmentResult verify_(const buffer::Fragment& fragment) noexcept {
        const std::int32_t sid = fragment.stream_id();
        if (sid < 0 || static_cast<std::size_t>(sid) >= digests_.size() || fragment.length() != params_.message_size) {
            ++out_of_order_;
            return buffer::FragmentResult::Failed;
        }
        const auto stream = static_cast<std::size_t>(sid);
        if (read_sequence(fragment.payload()) != next_sequence_[stream]) {
            ++out_of_order_;
        }
        next_sequence_[stream] = read_sequence(fragment.payload()) + 1;
        digests_[stream].update(fragment.payload());
        ++received_;
        return buffer::FragmentResult::Consume;
    }

    void drain_block_() {
        const std::size_t length = subscription_->peek_block(peek_, params_.peek_block_size);
        if (length == 0) {
            return;
        }
        for (const buffer::Fragment fragment : peek_) {
            (void)verify_(fragment);
        }
        ++blocks_;
        if (const Error err = peek_.mark_completed(); err != Error::None) {
            FL_ERROR("[CONSUMER] Block resolution failed: " << to_string(err));
        }
    }

private:
    dispatcher::Dispatcher& dispatcher_;
    const cli::throughput::Params& params_;
    const std::uint64_t expected_total_;

    dispatcher::Subscription* subscription_ = nullptr;
    dispatcher::BlockPeek peek_;

    std::vector<integrity::ChainedDigest> digests_;
    std::vector<std::uint64_t> next_sequence_;
    std::uint64_t received_ = 0;
    std::uint64_t out_of_order_ = 0;
    std::uint64_t blocks_ = 0;
    actor::ActorFuture<void> finished_;
};

} // namespace


// -----------------------------------------------------------------------------
// Main
// -----------------------------------------------------------------------------
int main(int argc, char** argv) {
    // -------------------------------------------------------------
    // CLI parsing
    // -------------------------------------------------------------
    auto params = cli::throughput::configure(argc, argv,
        "Flowline - Dispatcher Throughput Example\n"
        "Producer actors publish sequenced payloads through one dispatcher; a verifier actor consumes them.\n"
    );

    // -------------------------------------------------------------
    // Runtime configuration (file first, command line overrides)
    // -------------------------------------------------------------
    config::RuntimeConfig runtime;
    runtime.log_level = parse_level(params.log_level);
    runtime.scheduler.name = "throughput";
    runtime.dispatcher.name = "records";
    runtime.dispatcher.buffer_size = params.buffer_size;
    runtime.scheduler.worker_threads = params.threads;

    if (!params.config_path.empty()) {
        const config::Result r = config::load_file(params.config_path, runtime);
        if (r != config::Result::Ok) {
            std::cerr << "[ERROR] Cannot load " << params.config_path << ": " << config::to_string(r) << std::endl;
            return EXIT_FAILURE;
        }
        Logger::instance().set_level(runtime.log_level);
        if (!params.buffer_size_set) {
            params.buffer_size = runtime.dispatcher.buffer_size;
        }
        if (!params.threads_set) {
            params.threads = runtime.scheduler.worker_threads;
        }
    }
    runtime.dispatcher.buffer_size = params.buffer_size;
    runtime.scheduler.worker_threads = params.threads;

    params.dump("=== Throughput Parameters ===", std::cout);

    // -------------------------------------------------------------
    // Scheduler + dispatcher
    // -------------------------------------------------------------
    if (!runtime.scheduler.is_valid()) {
        std::cerr << "[ERROR] Invalid scheduler configuration" << std::endl;
        return EXIT_FAILURE;
    }
    actor::ActorScheduler scheduler(runtime.scheduler);
    scheduler.start();

    auto dispatcher = dispatcher::DispatcherBuilder::from_config(runtime.dispatcher)
        .actor_scheduler(scheduler)
        .build();
    if (!dispatcher) {
        (void)scheduler.stop();
        return EXIT_FAILURE;
    }
    if (params.message_size > dispatcher->max_fragment_length()) {
        std::cerr << "[ERROR] Message size " << params.message_size << " exceeds max fragment length "
                  << dispatcher->max_fragment_length() << std::endl;
        (void)scheduler.stop();
        return EXIT_FAILURE;
    }

    // -------------------------------------------------------------
    // Actors
    // -------------------------------------------------------------
    auto consumer = std::make_shared<Consumer>(*dispatcher, params);
    const auto consumer_started = scheduler.submit_actor(consumer);
    if (!consumer_started.join(std::chrono::seconds(10)) || consumer_started.is_failed()) {
        std::cerr << "[ERROR] Verifier did not start" << std::endl;
        dispatcher->close();
        (void)scheduler.stop();
        return EXIT_FAILURE;
    }

    const auto started_at = std::chrono::steady_clock::now();

    std::vector<std::shared_ptr<Producer>> producers;
    for (std::uint32_t i = 0; i < params.producers; ++i) {
        producers.push_back(std::make_shared<Producer>(*dispatcher, params, static_cast<std::int32_t>(i)));
        (void)scheduler.submit_actor(producers.back());
    }

    // -------------------------------------------------------------
    // Wait for completion
    // -------------------------------------------------------------
    bool ok = true;
    for (const auto& producer : producers) {
        const auto finished = producer->finished();
        if (!finished.join(std::chrono::minutes(10)) || finished.is_failed()) {
            std::cerr << "[ERROR] " << producer->name() << " did not finish" << std::endl;
            ok = false;
        }
    }
    const auto consumed = consumer->finished();
    if (!consumed.join(std::chrono::minutes(10)) || consumed.is_failed()) {
        std::cerr << "[ERROR] verifier did not receive every message" << std::endl;
        ok = false;
    }

    const auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at).count();

    // Joined actors are quiescent; shutting down makes their state visible here
    dispatcher->close();
    if (!scheduler.stop()) {
        std::cerr << "[WARN] some actors did not close within the shutdown timeout" << std::endl;
    }

    // -------------------------------------------------------------
    // Integrity
    // -------------------------------------------------------------
    std::uint64_t backpressured = 0;
    for (std::uint32_t i = 0; i < params.producers; ++i) {
        const auto& produced = producers[i]->digest();
        const auto& received = consumer->digest(i);
        const bool match = produced == received;
        ok = ok && match;
        backpressured += producers[i]->backpressured();
        std::cout << "  stream " << i << ": produced " << produced.count() << " (xxh64 0x" << std::hex
                  << produced.value() << "), received " << std::dec << received.count() << " (xxh64 0x"
                  << std::hex << received.value() << std::dec << ") -> " << (match ? "OK" : "MISMATCH") << "\n";
    }
    if (consumer->out_of_order() != 0) {
        std::cout << "  out of order / malformed: " << consumer->out_of_order() << "\n";
        ok = false;
    }

    // -------------------------------------------------------------
    // Report
    // -------------------------------------------------------------
    const double messages = static_cast<double>(consumer->received());
    std::cout << "\n=== Throughput Summary ===\n"
              << "  Messages      : " << lcr::format_number_exact(consumer->received()) << "\n"
              << "  Elapsed       : " << elapsed << " s\n"
              << "  Rate          : " << lcr::format_throughput(elapsed > 0 ? messages / elapsed : 0.0) << "\n"
              << "  Bandwidth     : " << lcr::format_throughput(elapsed > 0 ? messages * params.message_size / elapsed : 0.0, "B/s") << "\n"
              << "  Backpressured : " << backpressured << "\n";
    if (params.mode == "peek") {
        std::cout << "  Blocks        : " << consumer->blocks() << "\n";
    }

    std::ostringstream dispatcher_dump;
    dispatcher->telemetry().debug_dump(dispatcher_dump);
    std::ostringstream scheduler_dump;
    scheduler.telemetry().debug_dump(scheduler_dump);
    std::cout << "\n=== Dispatcher Telemetry ===" << dispatcher_dump.str()
              << "\n=== Scheduler Telemetry ===" << scheduler_dump.str() << std::endl;

    std::cout << (ok ? "[SUCCESS] All streams verified." : "[FAILURE] Integrity check failed.") << std::endl;
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
