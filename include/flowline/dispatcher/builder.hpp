#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "flowline/actor/scheduler.hpp"
#include "flowline/dispatcher/config.hpp"
#include "flowline/dispatcher/dispatcher.hpp"
#include "flowline/error.hpp"
#include "lcr/log/logger.hpp"


namespace flowline::dispatcher {

// -----------------------------------------------------------------------------
// DispatcherBuilder
// -----------------------------------------------------------------------------
// Fluent construction of a validated Dispatcher.
//
//     auto dispatcher = DispatcherBuilder::create("records")
//         .buffer_size(10 * 1024 * 1024)
//         .actor_scheduler(scheduler)
//         .subscriptions({"exporter", "processor"})
//         .build();
//
// build() returns nullptr (and logs InvalidConfig) when the configuration
// is rejected.
// -----------------------------------------------------------------------------
class DispatcherBuilder {
public:
    [[nodiscard]] static DispatcherBuilder create(std::string name) {
        DispatcherBuilder b;
        b.config_.name = std::move(name);
        return b;
    }

    [[nodiscard]] static DispatcherBuilder from_config(DispatcherConfig config) {
        DispatcherBuilder b;
        b.config_ = std::move(config);
        return b;
    }

    DispatcherBuilder& buffer_size(std::size_t bytes) noexcept {
        config_.buffer_size = bytes;
        return *this;
    }

    DispatcherBuilder& max_subscriptions(std::size_t n) noexcept {
        config_.max_subscriptions = n;
        return *this;
    }

    DispatcherBuilder& max_fragment_length(std::size_t bytes) noexcept {
        config_.max_fragment_length = bytes;
        return *this;
    }

    DispatcherBuilder& subscriptions(std::vector<std::string> names) {
        config_.subscriptions = std::move(names);
        return *this;
    }

    DispatcherBuilder& actor_scheduler(actor::ActorScheduler& scheduler) noexcept {
        scheduler_ = &scheduler;
        return *this;
    }

    [[nodiscard]] const DispatcherConfig& config() const noexcept { return config_; }

    [[nodiscard]] std::unique_ptr<Dispatcher> build() const {
        const Error err = config_.validate();
        if (err != Error::None) {
            FL_ERROR("[DISPATCHER] Cannot build '" << config_.name << "': " << to_string(err)
                     << " (buffer_size=" << config_.buffer_size
                     << ", max_subscriptions=" << config_.max_subscriptions
                     << ", max_fragment_length=" << config_.effective_max_fragment_length()
                     << ", subscriptions=" << config_.subscriptions.size() << ")");
            return nullptr;
        }
        return std::make_unique<Dispatcher>(config_, scheduler_);
    }

private:
    DispatcherBuilder() = default;

    DispatcherConfig config_;
    actor::ActorScheduler* scheduler_ = nullptr;
};

} // namespace flowline::dispatcher
