#ifndef CJAIL_LOG_H
#define CJAIL_LOG_H

#include <iostream>
#include <iomanip>
#include <chrono>
#include <sstream>
#include <ctime>

namespace utils {

enum class LogLevel {
    VERBOSE,
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Default log level - can be overridden at compile time
// Example: -DCJAIL_LOG_LEVEL_DEFAULT=::utils::LogLevel::INFO to hide VERBOSE and DEBUG
#ifndef CJAIL_LOG_LEVEL_DEFAULT
    #define CJAIL_LOG_LEVEL_DEFAULT ::utils::LogLevel::WARNING
#endif

// Global maximum log level - logs below this level are suppressed
inline LogLevel& maxLogLevel() {
    static LogLevel level = CJAIL_LOG_LEVEL_DEFAULT;
    return level;
}

// Set the maximum log level at runtime
inline void setLogLevel(LogLevel level) {
    maxLogLevel() = level;
}

// Get the current maximum log level
inline LogLevel getLogLevel() {
    return maxLogLevel();
}

inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::VERBOSE: return "VERBOSE";
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
        default:                return "UNKNOWN";
    }
}

inline std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_time_t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << now_ms.count();
    return oss.str();
}

inline const char* extractFilename(const char* path) {
    const char* filename = path;
    for (const char* p = path; *p; ++p) {
        if (*p == '/') {
            filename = p + 1;
        }
    }
    return filename;
}

/**
 * @brief Write one log record
 *
 * All records go to stderr: stdout carries the command output of the CLI
 * (engine command line in debug mode, profile list, configuration dump).
 */
inline void log(LogLevel level, const char* file, int line, const std::string& message) {
    if (level < maxLogLevel()) {
        return;
    }

    std::ostringstream oss;
    oss << "[" << getCurrentTimestamp() << "] "
        << "[" << logLevelToString(level) << "] "
        << "[" << extractFilename(file) << ":" << line << "] "
        << message;

    std::cerr << oss.str() << std::endl;
}

} // namespace utils

/**
 * @brief Log Level Filtering
 *
 * Usage:
 * 1. Set log level at compile time (in CMakeLists.txt):
 *    add_compile_definitions(CJAIL_LOG_LEVEL_DEFAULT=::utils::LogLevel::INFO)
 *
 * 2. Set log level at runtime:
 *    utils::setLogLevel(utils::LogLevel::INFO);  // Hide VERBOSE and DEBUG
 *
 * Log levels (from lowest to highest):
 *   VERBOSE < DEBUG < INFO < WARNING < ERROR < FATAL
 */

// Log macros
#define LOGV(msg) ::utils::log(::utils::LogLevel::VERBOSE, __FILE__, __LINE__, msg)
#define LOGD(msg) ::utils::log(::utils::LogLevel::DEBUG, __FILE__, __LINE__, msg)
#define LOGI(msg) ::utils::log(::utils::LogLevel::INFO, __FILE__, __LINE__, msg)
#define LOGW(msg) ::utils::log(::utils::LogLevel::WARNING, __FILE__, __LINE__, msg)
#define LOGE(msg) ::utils::log(::utils::LogLevel::ERROR, __FILE__, __LINE__, msg)
#define LOGF(msg) ::utils::log(::utils::LogLevel::FATAL, __FILE__, __LINE__, msg)

// Formatted log macros (support for stream-style formatting)
#define LOGV_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGV(_oss.str()); }
#define LOGD_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGD(_oss.str()); }
#define LOGI_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGI(_oss.str()); }
#define LOGW_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGW(_oss.str()); }
#define LOGE_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGE(_oss.str()); }
#define LOGF_FMT(msg) { std::ostringstream _oss; _oss << msg; LOGF(_oss.str()); }

#endif // CJAIL_LOG_H
