#ifndef FORMULIZE_LOG_HPP
#define FORMULIZE_LOG_HPP

#include <cstdio>
#include <cstdarg>
#include <atomic>

namespace formulize {
namespace log {

enum class Level : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

// Callback function type for log output routing
// The callback receives the level and a formatted string (no newline at end)
using LogCallback = void (*)(Level level, const char* message);

// Global log callback - set by the host application to route messages
// When null, messages go to stderr
inline std::atomic<LogCallback> g_log_callback{nullptr};

// Messages below this level are dropped
inline std::atomic<int> g_min_level{static_cast<int>(Level::Warn)};

inline void set_log_callback(LogCallback cb) {
    g_log_callback.store(cb, std::memory_order_release);
}

inline void clear_log_callback() {
    g_log_callback.store(nullptr, std::memory_order_release);
}

inline void set_min_level(Level level) {
    g_min_level.store(static_cast<int>(level), std::memory_order_release);
}

inline const char* level_name(Level level) {
    switch (level) {
        case Level::Debug: return "DEBUG";
        case Level::Info:  return "INFO";
        case Level::Warn:  return "WARN";
        case Level::Error: return "ERROR";
    }
    return "LOG";
}

// Internal: format and output a message
inline void log_output(Level level, const char* fmt, ...) {
    if (static_cast<int>(level) < g_min_level.load(std::memory_order_acquire)) {
        return;
    }

    char buffer[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(buffer, sizeof(buffer), fmt, args);
    va_end(args);

    LogCallback cb = g_log_callback.load(std::memory_order_acquire);
    if (cb) {
        cb(level, buffer);
    } else {
        fprintf(stderr, "[%s] %s\n", level_name(level), buffer);
        fflush(stderr);
    }
}

} // namespace log
} // namespace formulize

// Debug logging compiles away unless ENABLE_DEBUG_OUTPUT is defined
#ifdef ENABLE_DEBUG_OUTPUT
    #define FORMULIZE_LOG_DEBUG(fmt, ...) ::formulize::log::log_output(::formulize::log::Level::Debug, fmt, ##__VA_ARGS__)
#else
    #define FORMULIZE_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define FORMULIZE_LOG_INFO(fmt, ...) ::formulize::log::log_output(::formulize::log::Level::Info, fmt, ##__VA_ARGS__)
#define FORMULIZE_LOG_WARN(fmt, ...) ::formulize::log::log_output(::formulize::log::Level::Warn, fmt, ##__VA_ARGS__)
#define FORMULIZE_LOG_ERROR(fmt, ...) ::formulize::log::log_output(::formulize::log::Level::Error, fmt, ##__VA_ARGS__)

#endif // FORMULIZE_LOG_HPP
