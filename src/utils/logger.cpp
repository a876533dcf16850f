/**
 * @file logger.cpp
 * @brief Logger line formatting and output.
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#include "meshscout/utils/logger.hpp"
#include "meshscout/utils/string_utils.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace meshscout {
namespace utils {

namespace {

const char* paddedLevel(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
    }
    return "?????";
}

const char* colorCode(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bold Magenta
        default:              return "";
    }
}

}  // namespace

std::optional<LogLevel> parseLogLevel(const std::string& name) {
    const std::string upper = to_upper(trim(name));
    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    if (upper == "OFF") return LogLevel::OFF;
    return std::nullopt;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger()
    : level_(static_cast<int>(LogLevel::INFO))
    , colorEnabled_(true)
{}

void Logger::setSink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = std::move(sink);
}

void Logger::resetSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = nullptr;
}

std::string Logger::levelName(LogLevel level) {
    return trim(paddedLevel(level));
}

void Logger::write(LogLevel level, const std::string& component,
                   const std::string& message) {
    // [YYYY-MM-DD HH:MM:SS.mmm]
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

    std::lock_guard<std::mutex> lock(mutex_);

    // Sinks get plain text; colour only makes sense on a terminal.
    const bool color = !sink_ && colorEnabled_.load(std::memory_order_relaxed);

    std::ostringstream line;
    line << "[" << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
         << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    if (color) {
        line << colorCode(level);
    }
    line << "[" << paddedLevel(level) << "]";
    if (color) {
        line << "\033[0m";
    }
    line << " [" << component << "] " << message;

    if (sink_) {
        sink_(level, line.str());
    } else {
        std::cerr << line.str() << std::endl;
    }
}

}  // namespace utils
}  // namespace meshscout
