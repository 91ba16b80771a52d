/**
 * @file logger.cpp
 * @brief Logger implementation.
 *
 * @copyright Copyright (c) 2024 mcdisc Contributors
 * @license MIT License
 */

#include "mcdisc/utils/logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace mcdisc {
namespace utils {

namespace {

const char* paddedLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        default:              return "";
    }
}

}  // namespace

LogLevel logLevelFromString(const std::string& name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "OFF") return LogLevel::OFF;
    return LogLevel::INFO;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
{}

std::string Logger::levelName(LogLevel level) {
    std::string name(paddedLevel(level));
    name.erase(name.find_last_not_of(' ') + 1);
    return name;
}

void Logger::setSink(LogSink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::write(LogLevel level, const char* component, const std::string& message) {
    // Timestamp: [YYYY-MM-DD HH:MM:SS.mmm]
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t_now);
#else
    localtime_r(&time_t_now, &tm_buf);
#endif

    std::ostringstream prefix;
    prefix << "["
           << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count()
           << "] ";

    std::lock_guard<std::mutex> lock(mutex_);

    if (sink_) {
        sink_(level, prefix.str() + "[" + paddedLevel(level) + "] [" + component + "] " + message);
        return;
    }

    const bool color = colorEnabled_.load(std::memory_order_relaxed);
    std::cerr << prefix.str()
              << (color ? colorCode(level) : "")
              << "[" << paddedLevel(level) << "]"
              << (color ? "\033[0m" : "")
              << " [" << component << "] "
              << message << std::endl;
}

}  // namespace utils
}  // namespace mcdisc
