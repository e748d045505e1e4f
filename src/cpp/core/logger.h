#pragma once

#include <cstdio>
#include <cstdint>
#include <ctime>
#include <atomic>
#include <mutex>
#include <string_view>

/**
 * Leveled, tagged logger for hellosvc
 *
 * Features:
 * - Zero-cost when disabled (compile-time)
 * - Tagged subsystem logging (Server, HTTP1, Request, Error, ...)
 * - Levels DEBUG, INFO, WARN, ERROR with runtime filtering by level and tag
 * - Development format (with source location) and production format
 * - Redirectable output (stderr or file)
 *
 * Usage:
 *   LOG_INFO("Server", "Listening on %s:%d", host, port);
 *   LOG_WARN("Config", "PORT %d outside recommended range", port);
 *   LOG_ERROR("Server", "bind failed: %s", strerror(errno));
 *
 * Build-time control:
 *   Define HELLOSVC_ENABLE_LOGGING to enable logging.
 *   If undefined, all LOG_* macros compile to nothing.
 */

namespace hellosvc {
namespace core {

enum class LogLevel : uint8_t {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3,
    NONE = 255  // Disable all logging
};

/**
 * Line layout.
 *
 * DEVELOPMENT: "2026-01-01 12:00:00.000 [INFO ] [Server] message (file.cpp:42)"
 * PRODUCTION:  "2026-01-01T12:00:00.000Z [INFO ] [Server] message"
 */
enum class LogFormat : uint8_t {
    DEVELOPMENT = 0,
    PRODUCTION = 1
};

/**
 * Parse "error" | "warn" | "info" | "debug" (case-insensitive).
 *
 * @return true and sets out on success, false for any other string
 */
bool parse_log_level(std::string_view text, LogLevel& out) noexcept;

const char* log_level_name(LogLevel level) noexcept;

/**
 * Thread-safe logger singleton
 */
class Logger {
public:
    static Logger& instance() noexcept {
        static Logger logger;
        return logger;
    }

    /**
     * Log a message (called by macros, not meant for direct use)
     *
     * @param level Log level
     * @param tag Subsystem tag (e.g., "Server", "Request")
     * @param file Source file name
     * @param line Source line number
     * @param fmt Printf-style format string
     */
    void log(LogLevel level, const char* tag, const char* file, int line,
             const char* fmt, ...) noexcept __attribute__((format(printf, 6, 7)));

    void set_level(LogLevel level) noexcept {
        min_level_.store(static_cast<uint8_t>(level), std::memory_order_relaxed);
    }

    LogLevel get_level() const noexcept {
        return static_cast<LogLevel>(min_level_.load(std::memory_order_relaxed));
    }

    void set_format(LogFormat format) noexcept {
        format_.store(static_cast<uint8_t>(format), std::memory_order_relaxed);
    }

    LogFormat get_format() const noexcept {
        return static_cast<LogFormat>(format_.load(std::memory_order_relaxed));
    }

    /**
     * Enable/disable a specific tag
     *
     * @param tag Tag to enable/disable (e.g., "Request")
     * @param enabled true to enable, false to disable
     */
    void set_tag_enabled(const char* tag, bool enabled) noexcept;

    bool is_tag_enabled(const char* tag) const noexcept;

    /**
     * Redirect output to a file (appending)
     *
     * @param path File path (nullptr for stderr)
     * @return true on success, false on failure
     */
    bool set_output_file(const char* path) noexcept;

    /**
     * Close output file and revert to stderr
     */
    void close_output_file() noexcept;

    /**
     * Restore level, format and tag filters to their startup values.
     */
    void reset() noexcept;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

private:
    Logger() noexcept;
    ~Logger() noexcept;

    std::atomic<uint8_t> min_level_{static_cast<uint8_t>(LogLevel::INFO)};
    std::atomic<uint8_t> format_{static_cast<uint8_t>(LogFormat::DEVELOPMENT)};
    mutable std::mutex output_mutex_;  // Protects output and tag table
    FILE* output_file_{stderr};
    bool owns_file_{false};

    static constexpr size_t MAX_TAGS = 32;
    struct TagFilter {
        char name[16];
        bool enabled;
    };
    TagFilter tag_filters_[MAX_TAGS]{};
    size_t tag_count_{0};

    void format_timestamp(char* buf, size_t size, LogFormat format) const noexcept;
};

} // namespace core
} // namespace hellosvc

// ============================================================================
// Logging Macros
// ============================================================================

#ifdef HELLOSVC_ENABLE_LOGGING

#define LOG_DEBUG(tag, fmt, ...) \
    ::hellosvc::core::Logger::instance().log( \
        ::hellosvc::core::LogLevel::DEBUG, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_INFO(tag, fmt, ...) \
    ::hellosvc::core::Logger::instance().log( \
        ::hellosvc::core::LogLevel::INFO, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_WARN(tag, fmt, ...) \
    ::hellosvc::core::Logger::instance().log( \
        ::hellosvc::core::LogLevel::WARN, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#define LOG_ERROR(tag, fmt, ...) \
    ::hellosvc::core::Logger::instance().log( \
        ::hellosvc::core::LogLevel::ERROR, tag, __FILE__, __LINE__, fmt, ##__VA_ARGS__)

#else

#define LOG_DEBUG(tag, fmt, ...) ((void)0)
#define LOG_INFO(tag, fmt, ...)  ((void)0)
#define LOG_WARN(tag, fmt, ...)  ((void)0)
#define LOG_ERROR(tag, fmt, ...) ((void)0)

#endif // HELLOSVC_ENABLE_LOGGING
