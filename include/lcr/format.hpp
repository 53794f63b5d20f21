#pragma once

#include <string>
#include <format>
#include <cstdint>
#include <algorithm>


namespace lcr {

// Format an integer with thousands separators
// Example: 6436311 -> "6,436,311"
inline std::string format_number_exact(std::uint64_t value) {
    const std::string raw = std::to_string(value);
    std::string formatted;
    formatted.reserve(raw.size() + raw.size() / 3);

    int count = 0;
    for (auto it = raw.rbegin(); it != raw.rend(); ++it) {
        if (count == 3) {
            formatted.push_back(',');
            count = 0;
        }
        formatted.push_back(*it);
        ++count;
    }
    std::reverse(formatted.begin(), formatted.end());
    return formatted;
}

// Format bytes as a scaled human-readable value (binary units)
// Example: 10485760 -> "10.0 MB"
inline std::string format_bytes_scaled(std::uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double value = static_cast<double>(bytes);
    int unit_index = 0;
    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        ++unit_index;
    }
    const int precision = (value < 10.0) ? 2 : (value < 100.0) ? 1 : 0;
    return std::format("{:.{}f} {}", value, precision, units[unit_index]);
}

// Format a rate as a throughput string (e.g., "1.23 M msg/s")
inline std::string format_throughput(double value, const char* suffix = "msg/s") {
    static const char* units[] = {"", "K", "M", "G", "T"};
    int unit_index = 0;
    while (value >= 1000.0 && unit_index < 4) {
        value /= 1000.0;
        ++unit_index;
    }
    const int precision = (value < 10.0) ? 2 : (value < 100.0) ? 1 : 0;
    return std::format("{:.{}f} {}{}", value, precision, units[unit_index], suffix);
}

} // namespace lcr
