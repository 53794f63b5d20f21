#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "flowline/buffer/frame.hpp"
#include "flowline/config/defaults.hpp"
#include "flowline/error.hpp"

namespace flowline::dispatcher {

// -----------------------------------------------------------------------------
// Runtime configuration of a Dispatcher
// -----------------------------------------------------------------------------
struct DispatcherConfig {
    std::string name = "dispatcher";

    // Ring buffer capacity in bytes (multiple of the frame alignment)
    std::size_t buffer_size = config::default_buffer_size;

    std::size_t max_subscriptions = config::default_max_subscriptions;

    // Largest payload accepted by offer()/claim(); 0 = buffer_size / 8
    std::size_t max_fragment_length = 0;

    // Opened synchronously when the dispatcher is built
    std::vector<std::string> subscriptions;

    [[nodiscard]] std::size_t effective_max_fragment_length() const noexcept {
        return max_fragment_length != 0 ? max_fragment_length
                                        : buffer_size / config::max_fragment_divisor;
    }

    [[nodiscard]] Error validate() const {
        if (name.empty()) {
            return Error::InvalidConfig;
        }
        if (buffer_size < config::min_buffer_size || buffer_size > config::max_buffer_size
            || buffer_size % buffer::FRAME_ALIGNMENT != 0) {
            return Error::InvalidConfig;
        }
        if (max_subscriptions == 0 || max_subscriptions > config::max_subscriptions_limit
            || subscriptions.size() > max_subscriptions) {
            return Error::InvalidConfig;
        }
        // A frame plus its boundary padding must always fit
        if (buffer::framed_length(effective_max_fragment_length()) > buffer_size / 2) {
            return Error::InvalidConfig;
        }
        std::unordered_set<std::string> seen;
        for (const auto& s : subscriptions) {
            if (s.empty() || !seen.insert(s).second) {
                return Error::InvalidConfig;
            }
        }
        return Error::None;
    }
};

} // namespace flowline::dispatcher
