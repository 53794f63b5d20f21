#pragma once

#include <atomic>
#include <mutex>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>

namespace lcr {
namespace log {

// ---------------------------------------------------------
// Log level
// ---------------------------------------------------------
enum class Level : uint8_t {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Fatal
};

// Parses "trace" | "debug" | "info" | "warn" | "error" | "fatal".
// Unknown names fall back to Info.
[[nodiscard]]
inline Level parse_level(std::string_view name) noexcept {
    if (name == "trace") return Level::Trace;
    if (name == "debug") return Level::Debug;
    if (name == "warn")  return Level::Warn;
    if (name == "error") return Level::Error;
    if (name == "fatal") return Level::Fatal;
    return Level::Info;
}

// ---------------------------------------------------------
// Per-thread tag printed next to the level.
// Worker pools name their threads so interleaved output
// can be attributed.
// ---------------------------------------------------------
inline std::string& thread_tag() noexcept {
    thread_local std::string tag;
    return tag;
}

inline void set_thread_tag(std::string tag) {
    thread_tag() = std::move(tag);
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]] bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_ = on; }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const std::string& tag = thread_tag();
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color_enabled_) os << color_code(lvl);
        os << timestamp() << " [" << level_name(lvl) << "]";
        if (!tag.empty()) os << " (" << tag << ")";
        os << ' ' << msg;
        if (color_enabled_) os << "\033[0m";
        os << std::endl;
    }

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    static const char* level_name(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "TRACE";
            case Level::Debug: return "DEBUG";
            case Level::Info:  return "INFO";
            case Level::Warn:  return "WARN";
            case Level::Error: return "ERROR";
            case Level::Fatal: return "FATAL";
        }
        return "?????";
    }

    static constexpr const char* color_code(Level lvl) {
        switch (lvl) {
            case Level::Trace: return "\033[37m";     // light gray
            case Level::Debug: return "\033[36m";     // cyan
            case Level::Info:  return "\033[32m";     // green
            case Level::Warn:  return "\033[33m";     // yellow
            case Level::Error: return "\033[31m";     // red
            case Level::Fatal: return "\033[1;31m";   // bold bright red
        }
        return "\033[0m";
    }

    // Wall clock with millisecond resolution
    static std::string timestamp() {
        using namespace std::chrono;
        const auto now = system_clock::now();
        const auto t = system_clock::to_time_t(now);
        const auto ms = duration_cast<milliseconds>(now.time_since_epoch()).count() % 1000;
        std::tm tm{};
    #ifdef _WIN32
        localtime_s(&tm, &t);
    #else
        localtime_r(&t, &tm);
    #endif
        char buf[64];
        const std::size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(ms));
        return buf;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    bool color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    template<typename T>
    LogStream& operator<<(const T& v) {
        ss_ << v;
        return *this;
    }

    ~LogStream() {
        Logger::instance().log(lvl_, ss_.str());
    }

private:
    Level lvl_;
    std::ostringstream ss_;
};

} // namespace log
} // namespace lcr


// ---------------------------------------------------------
// Macros for easy logging.
// The level check happens before the message is formatted.
// ---------------------------------------------------------
#define FL_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define FL_TRACE(msg)  FL_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define FL_DEBUG(msg)  FL_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define FL_INFO(msg)   FL_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define FL_WARN(msg)   FL_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define FL_ERROR(msg)  FL_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define FL_FATAL(msg)  FL_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
