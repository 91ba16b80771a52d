/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for mcdisc.
 *
 * Zero external dependencies. Provides structured logging with
 * configurable levels, component tags, and timestamps.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#pragma once

#include "mcdisc/utils/export.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace mcdisc {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    OFF = 5
};

/**
 * @brief Parse a level name ("TRACE", "debug", ...).
 * @return The matching level, or INFO if the name is unknown.
 */
MCDISC_UTILS_API LogLevel logLevelFromString(const std::string& name);

/**
 * @brief Receives every formatted line that passes the level filter.
 */
using LogSink = std::function<void(LogLevel level, const std::string& line)>;

/**
 * @class Logger
 * @brief Thread-safe singleton logger with configurable output.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Runner", "Found service {} at {}", kind, endpoint);
 * LOG_ERROR("UdpSocket", "Send failed: error {}", err);
 * @endcode
 */
class MCDISC_UTILS_API Logger {
public:
    /**
     * @brief Get the singleton logger instance.
     */
    static Logger& instance();

    /**
     * @brief Name of a level without padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    /**
     * @brief Check if a level would be logged.
     */
    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable colored output (ANSI terminals).
     * Has no effect on lines delivered to a custom sink.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output away from stderr.
     * @param sink Line consumer, or an empty function to restore stderr.
     */
    void setSink(LogSink sink);

    /**
     * @brief Log a message with the given level and component.
     *
     * Each "{}" in @p format is replaced by the next argument.
     */
    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::ostringstream oss;
        formatMessage(oss, format, std::forward<Args>(args)...);
        write(level, component, oss.str());
    }

private:
    Logger();
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void write(LogLevel level, const char* component, const std::string& message);

    static void formatMessage(std::ostringstream& oss, const char* format) {
        oss << format;
    }

    template<typename T, typename... Args>
    static void formatMessage(std::ostringstream& oss, const char* format,
                              T&& value, Args&&... args) {
        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                formatMessage(oss, format + 2, std::forward<Args>(args)...);
                return;
            }
            oss << *format++;
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    LogSink sink_;
};

}  // namespace utils
}  // namespace mcdisc

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::mcdisc::utils::Logger::instance().log(::mcdisc::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::mcdisc::utils::Logger::instance().log(::mcdisc::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::mcdisc::utils::Logger::instance().log(::mcdisc::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::mcdisc::utils::Logger::instance().log(::mcdisc::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::mcdisc::utils::Logger::instance().log(::mcdisc::utils::LogLevel::ERROR, component, __VA_ARGS__)
