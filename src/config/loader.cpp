#include "flowline/config/loader.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <utility>

#include "flowline/config/helpers.hpp"
#include "lcr/log/logger.hpp"

#include "simdjson.h"


namespace flowline::config {

namespace {

[[nodiscard]]
bool is_known_level(std::string_view name) noexcept {
    return name == "trace" || name == "debug" || name == "info"
        || name == "warn"  || name == "error" || name == "fatal";
}

// Assigns an optional unsigned field; false on wrong type.
// Values beyond T saturate to its maximum and fail validation afterwards.
template<class T>
[[nodiscard]] bool read_unsigned(const simdjson::dom::element& obj, const char* key, T& out) noexcept {
    std::uint64_t value = 0;
    bool present = false;
    if (!helper::parse_uint64_optional(obj, key, value, present)) {
        return false;
    }
    if (present) {
        constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<T>::max());
        out = static_cast<T>(std::min(value, max));
    }
    return true;
}

template<class Duration>
[[nodiscard]] bool read_duration(const simdjson::dom::element& obj, const char* key, Duration& out) noexcept {
    using rep = typename Duration::rep;
    std::uint64_t value = 0;
    bool present = false;
    if (!helper::parse_uint64_optional(obj, key, value, present)) {
        return false;
    }
    if (present) {
        constexpr auto max = static_cast<std::uint64_t>(std::numeric_limits<rep>::max());
        out = Duration{static_cast<rep>(std::min(value, max))};
    }
    return true;
}

[[nodiscard]]
Result parse_scheduler(const simdjson::dom::element& obj, actor::SchedulerConfig& out) {
    bool present = false;
    if (!helper::parse_string_optional(obj, "name", out.name, present)
        || !read_unsigned(obj, "worker_threads", out.worker_threads)
        || !read_unsigned(obj, "job_budget", out.job_budget)
        || !read_unsigned(obj, "condition_poll_interval", out.condition_poll_interval)
        || !read_unsigned(obj, "idle_spins", out.idle_spins)
        || !read_unsigned(obj, "idle_yields", out.idle_yields)
        || !read_duration(obj, "min_park_us", out.min_park)
        || !read_duration(obj, "max_park_us", out.max_park)
        || !read_duration(obj, "shutdown_timeout_ms", out.shutdown_timeout)) {
        FL_WARN("[CONFIG] 'scheduler' has a field of the wrong type.");
        return Result::InvalidSchema;
    }
    if (!out.is_valid()) {
        FL_WARN("[CONFIG] 'scheduler' rejected (worker_threads=" << out.worker_threads
                << ", job_budget=" << out.job_budget
                << ", condition_poll_interval=" << out.condition_poll_interval
                << ", min_park_us=" << out.min_park.count()
                << ", max_park_us=" << out.max_park.count()
                << ", shutdown_timeout_ms=" << out.shutdown_timeout.count() << ").");
        return Result::InvalidValue;
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_dispatcher(const simdjson::dom::element& obj, dispatcher::DispatcherConfig& out) {
    bool present = false;
    if (!helper::parse_string_optional(obj, "name", out.name, present)
        || !read_unsigned(obj, "buffer_size", out.buffer_size)
        || !read_unsigned(obj, "max_subscriptions", out.max_subscriptions)
        || !read_unsigned(obj, "max_fragment_length", out.max_fragment_length)
        || !helper::parse_string_list_optional(obj, "subscriptions", out.subscriptions, present)) {
        FL_WARN("[CONFIG] 'dispatcher' has a field of the wrong type.");
        return Result::InvalidSchema;
    }
    const Error err = out.validate();
    if (err != Error::None) {
        FL_WARN("[CONFIG] 'dispatcher' rejected: " << to_string(err)
                << " (buffer_size=" << out.buffer_size
                << ", max_subscriptions=" << out.max_subscriptions
                << ", max_fragment_length=" << out.max_fragment_length
                << ", subscriptions=" << out.subscriptions.size() << ").");
        return Result::InvalidValue;
    }
    return Result::Ok;
}

[[nodiscard]]
Result parse_root(const simdjson::dom::element& root, RuntimeConfig& out) {
    if (!helper::require_object(root)) {
        FL_WARN("[CONFIG] Root is not a JSON object.");
        return Result::InvalidSchema;
    }

    RuntimeConfig cfg = out;

    std::string level;
    bool present = false;
    if (!helper::parse_string_optional(root, "log_level", level, present)) {
        FL_WARN("[CONFIG] 'log_level' must be a string.");
        return Result::InvalidSchema;
    }
    if (present) {
        if (!is_known_level(level)) {
            FL_WARN("[CONFIG] Unknown log level '" << level << "'.");
            return Result::InvalidValue;
        }
        cfg.log_level = lcr::log::parse_level(level);
    }

    simdjson::dom::element section;
    if (!helper::parse_object_optional(root, "scheduler", section, present)) {
        FL_WARN("[CONFIG] 'scheduler' must be an object.");
        return Result::InvalidSchema;
    }
    if (present) {
        if (const Result r = parse_scheduler(section, cfg.scheduler); r != Result::Ok) {
            return r;
        }
    }

    if (!helper::parse_object_optional(root, "dispatcher", section, present)) {
        FL_WARN("[CONFIG] 'dispatcher' must be an object.");
        return Result::InvalidSchema;
    }
    if (present) {
        if (const Result r = parse_dispatcher(section, cfg.dispatcher); r != Result::Ok) {
            return r;
        }
    }

    out = std::move(cfg);
    return Result::Ok;
}

} // namespace


Result parse(std::string_view json, RuntimeConfig& out) {
    simdjson::dom::parser parser;
    simdjson::dom::element root;
    const simdjson::padded_string padded(json);
    if (const auto err = parser.parse(padded).get(root); err) {
        FL_WARN("[CONFIG] Invalid JSON: " << simdjson::error_message(err));
        return Result::InvalidJson;
    }
    return parse_root(root, out);
}

Result load_file(const std::string& path, RuntimeConfig& out) {
    simdjson::padded_string json;
    if (const auto err = simdjson::padded_string::load(path).get(json); err) {
        FL_WARN("[CONFIG] Cannot read '" << path << "': " << simdjson::error_message(err));
        return Result::IoError;
    }

    simdjson::dom::parser parser;
    simdjson::dom::element root;
    if (const auto err = parser.parse(json).get(root); err) {
        FL_WARN("[CONFIG] Invalid JSON in '" << path << "': " << simdjson::error_message(err));
        return Result::InvalidJson;
    }

    const Result r = parse_root(root, out);
    if (r == Result::Ok) {
        FL_INFO("[CONFIG] Loaded '" << path << "'.");
    }
    return r;
}

} // namespace flowline::config
