#pragma once

#include <string>

#include <CLI/CLI.hpp>


namespace flowline::examples::cli {

// -------------------------------------------------------------
// Publication mode validator
// -------------------------------------------------------------
inline auto mode_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "offer" || value == "claim" || value == "peek") {
            return {};
        }
        return "Mode must be one of: offer, claim, peek";
    },
    "Publication mode validator"
);


// -------------------------------------------------------------
// Log level validator
// -------------------------------------------------------------
inline auto log_level_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        if (value == "trace" || value == "debug" || value == "info" ||
            value == "warn"  || value == "error" || value == "fatal") {
            return {};
        }
        return "Log level must be one of: trace, debug, info, warn, error, fatal";
    },
    "Log level validator"
);


// -------------------------------------------------------------
// Buffer size validator (multiple of 8, at least 1 KB)
// -------------------------------------------------------------
inline auto buffer_size_validator = CLI::Validator(
    [](std::string& value) -> std::string {
        try {
            const auto n = std::stoull(value);
            if (n >= 1024 && n % 8 == 0) {
                return {};
            }
            return "Buffer size must be a multiple of 8 and at least 1024 bytes";
        } catch (const std::exception&) {
            return "Buffer size must be a valid integer";
        }
    },
    "Buffer size validator"
);

} // namespace flowline::examples::cli
