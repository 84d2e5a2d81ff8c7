#pragma once

#include <cstdio>
#include <cstdarg>
#include <string>

namespace piot {

// Log levels
enum class LogLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG = 4,
    TRACE = 5
};

// Global log level - can be changed at runtime
// Default to INFO for release, DEBUG for debug builds
#ifdef NDEBUG
inline LogLevel g_log_level = LogLevel::INFO;
#else
inline LogLevel g_log_level = LogLevel::DEBUG;
#endif

// Log category enable flags for fine-grained control
struct LogCategories {
    bool codec = true;      // Payload / frame codec
    bool stream = true;     // Frame file reader / writer
    bool algo = false;      // Per-frame classification (one line per frame)
    bool pipe = true;       // Pipeline driver
};

inline LogCategories g_log_categories;

// Set log level
inline void setLogLevel(LogLevel level) {
    g_log_level = level;
}

// Parse "none", "error", "warn", "info", "debug", "trace"
inline bool parseLogLevel(const std::string& name, LogLevel& level) {
    if (name == "none")  { level = LogLevel::NONE;  return true; }
    if (name == "error") { level = LogLevel::ERROR; return true; }
    if (name == "warn")  { level = LogLevel::WARN;  return true; }
    if (name == "info")  { level = LogLevel::INFO;  return true; }
    if (name == "debug") { level = LogLevel::DEBUG; return true; }
    if (name == "trace") { level = LogLevel::TRACE; return true; }
    return false;
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::NONE:  return "none";
        case LogLevel::ERROR: return "error";
        case LogLevel::WARN:  return "warn";
        case LogLevel::INFO:  return "info";
        case LogLevel::DEBUG: return "debug";
        case LogLevel::TRACE: return "trace";
        default:              return "info";
    }
}

// Core logging function
inline void log(LogLevel level, const char* category, const char* format, ...) {
    if (level > g_log_level) return;

    const char* level_str = "";
    switch (level) {
        case LogLevel::ERROR: level_str = "ERROR"; break;
        case LogLevel::WARN:  level_str = "WARN "; break;
        case LogLevel::INFO:  level_str = "INFO "; break;
        case LogLevel::DEBUG: level_str = "DEBUG"; break;
        case LogLevel::TRACE: level_str = "TRACE"; break;
        default: break;
    }

    fprintf(stderr, "[%s][%s] ", level_str, category);

    va_list args;
    va_start(args, format);
    vfprintf(stderr, format, args);
    va_end(args);

    fprintf(stderr, "\n");
}

// Convenience macros - these compile to nothing when PIOT_LOG_DISABLE is defined
#ifdef PIOT_LOG_DISABLE

#define LOG_ERROR(cat, fmt, ...)
#define LOG_WARN(cat, fmt, ...)
#define LOG_INFO(cat, fmt, ...)
#define LOG_DEBUG(cat, fmt, ...)
#define LOG_TRACE(cat, fmt, ...)

#else

#define LOG_ERROR(cat, fmt, ...) \
    piot::log(piot::LogLevel::ERROR, cat, fmt, ##__VA_ARGS__)

#define LOG_WARN(cat, fmt, ...) \
    piot::log(piot::LogLevel::WARN, cat, fmt, ##__VA_ARGS__)

#define LOG_INFO(cat, fmt, ...) \
    piot::log(piot::LogLevel::INFO, cat, fmt, ##__VA_ARGS__)

#define LOG_DEBUG(cat, fmt, ...) \
    do { if (piot::g_log_level >= piot::LogLevel::DEBUG) \
        piot::log(piot::LogLevel::DEBUG, cat, fmt, ##__VA_ARGS__); } while(0)

#define LOG_TRACE(cat, fmt, ...) \
    do { if (piot::g_log_level >= piot::LogLevel::TRACE) \
        piot::log(piot::LogLevel::TRACE, cat, fmt, ##__VA_ARGS__); } while(0)

#endif

// Category-specific logging macros
#define LOG_CODEC(level, fmt, ...) \
    do { if (piot::g_log_categories.codec) LOG_##level("CODEC", fmt, ##__VA_ARGS__); } while(0)

#define LOG_STREAM(level, fmt, ...) \
    do { if (piot::g_log_categories.stream) LOG_##level("STREAM", fmt, ##__VA_ARGS__); } while(0)

#define LOG_ALGO(level, fmt, ...) \
    do { if (piot::g_log_categories.algo) LOG_##level("ALGO", fmt, ##__VA_ARGS__); } while(0)

#define LOG_PIPE(level, fmt, ...) \
    do { if (piot::g_log_categories.pipe) LOG_##level("PIPE", fmt, ##__VA_ARGS__); } while(0)

} // namespace piot
