#pragma once

#include <cstdint>
#include <string_view>

namespace flowline::config {

// Outcome of loading a configuration document
enum class Result : std::uint8_t {
    Ok            = 0,
    IoError       = 1,   // File missing or unreadable
    InvalidJson   = 2,   // Structural failure
    InvalidSchema = 3,   // Wrong type / unexpected shape
    InvalidValue  = 4    // Field present but rejected by validation
};

[[nodiscard]]
inline constexpr std::string_view to_string(Result r) noexcept {
    switch (r) {
        case Result::Ok:            return "Ok";
        case Result::IoError:       return "IoError";
        case Result::InvalidJson:   return "InvalidJson";
        case Result::InvalidSchema: return "InvalidSchema";
        case Result::InvalidValue:  return "InvalidValue";
        default:                    return "Unknown";
    }
}

} // namespace flowline::config
