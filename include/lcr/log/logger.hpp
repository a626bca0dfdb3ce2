#pragma once

#include <mutex>
#include <atomic>
#include <cstdint>
#include <ctime>
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <chrono>
#include <cstdio>

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

// Maps "trace" | "debug" | "info" | "warn" | "error" | "fatal" onto a Level.
// Leaves `out` untouched and returns false on unknown input.
[[nodiscard]]
inline bool parse_level(std::string_view text, Level& out) noexcept {
    if (text == "trace")      { out = Level::Trace; return true; }
    if (text == "debug")      { out = Level::Debug; return true; }
    if (text == "info")       { out = Level::Info;  return true; }
    if (text == "warn")       { out = Level::Warn;  return true; }
    if (text == "error")      { out = Level::Error; return true; }
    if (text == "fatal")      { out = Level::Fatal; return true; }
    return false;
}

// ---------------------------------------------------------
// Thread-safe global logger
// ---------------------------------------------------------
//
// Level and colour flags are atomics: the supervision thread logs while the
// owning thread may still be reconfiguring the logger.
//
class Logger {
public:
    static Logger& instance() {
        static Logger inst;
        return inst;
    }

    void set_level(Level lvl) noexcept { level_.store(lvl, std::memory_order_relaxed); }

    Level level() const noexcept { return level_.load(std::memory_order_relaxed); }

    [[nodiscard]]
    bool enabled(Level lvl) const noexcept { return lvl >= level(); }

    // Enable or disable colored output
    void enable_color(bool on) noexcept { color_enabled_.store(on, std::memory_order_relaxed); }

    // Thread-safe sink setter (stdout by default)
    void set_output(std::ostream* os) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        out_ = os ? os : &std::cout;
    }

    // ---------------------------------------------------------
    // Core logging function (thread-safe)
    // ---------------------------------------------------------
    void log(Level lvl, const std::string& msg) {
        if (!enabled(lvl)) return;
        const bool color = color_enabled_.load(std::memory_order_relaxed);
        const std::string ts = timestamp();
        std::lock_guard<std::mutex> lock(mutex_);
        auto& os = *out_;
        if (color) os << color_code(lvl);
        os << ts << " [" << level_name(lvl) << "] " << msg;
        if (color) os << "\033[0m";
        os << std::endl;
    }

    // Human-readable severity names
    static const char* level_name(Level lvl) noexcept {
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

private:
    Logger()
        : out_(&std::cout),
          level_(Level::Info),
          color_enabled_(false)
    {}

    // ANSI color mappings
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

    // Wall-clock timestamp with millisecond precision
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
        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm);
        char out[40];
        std::snprintf(out, sizeof(out), "%s.%03d", buf, static_cast<int>(ms));
        return out;
    }

private:
    std::ostream* out_;
    std::atomic<Level> level_;
    std::atomic<bool> color_enabled_;
    std::mutex mutex_;
};

// ---------------------------------------------------------
// Streaming log wrapper (collects << into a string)
// ---------------------------------------------------------
class LogStream {
public:
    explicit LogStream(Level lvl) : lvl_(lvl) {}

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

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
// Macros for easy logging
// ---------------------------------------------------------
// The level check happens before the message is formatted.
#define VG_LOG_LEVEL(lvl) \
    if (!::lcr::log::Logger::instance().enabled((lvl))) {} else ::lcr::log::LogStream((lvl))

#define VG_TRACE(msg)  VG_LOG_LEVEL(::lcr::log::Level::Trace) << msg
#define VG_DEBUG(msg)  VG_LOG_LEVEL(::lcr::log::Level::Debug) << msg
#define VG_INFO(msg)   VG_LOG_LEVEL(::lcr::log::Level::Info)  << msg
#define VG_WARN(msg)   VG_LOG_LEVEL(::lcr::log::Level::Warn)  << msg
#define VG_ERROR(msg)  VG_LOG_LEVEL(::lcr::log::Level::Error) << msg
#define VG_FATAL(msg)  VG_LOG_LEVEL(::lcr::log::Level::Fatal) << msg
