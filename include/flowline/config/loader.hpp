#pragma once

#include <string>
#include <string_view>

#include "flowline/actor/config.hpp"
#include "flowline/config/result.hpp"
#include "flowline/dispatcher/config.hpp"
#include "lcr/log/logger.hpp"

namespace flowline::config {

/*
===============================================================================
Runtime configuration document
===============================================================================

{
  "log_level": "info",
  "scheduler": {
    "name": "scheduler",
    "worker_threads": 3,
    "job_budget": 64,
    "condition_poll_interval": 32,
    "idle_spins": 64,
    "idle_yields": 16,
    "min_park_us": 20,
    "max_park_us": 1000,
    "shutdown_timeout_ms": 5000
  },
  "dispatcher": {
    "name": "records",
    "buffer_size": 10485760,
    "max_subscriptions": 16,
    "max_fragment_length": 0,
    "subscriptions": ["exporter"]
  }
}

Every section and field is optional; absent fields keep their defaults.
Unknown fields are ignored. On any failure `out` is left unchanged.
===============================================================================
*/

struct RuntimeConfig {
    lcr::log::Level log_level = lcr::log::Level::Info;
    actor::SchedulerConfig scheduler;
    dispatcher::DispatcherConfig dispatcher;
};

[[nodiscard]] Result parse(std::string_view json, RuntimeConfig& out);

[[nodiscard]] Result load_file(const std::string& path, RuntimeConfig& out);

} // namespace flowline::config
