/**
 * @file logger.hpp
 * @brief Thread-safe logging for meshscout.
 *
 * Component-tagged log lines with `{}` placeholders, a process-wide
 * minimum level and a replaceable output sink (stderr by default).
 *
 * @copyright Copyright (c) 2024 meshscout Contributors
 * @license MIT License
 */

#pragma once

#include "meshscout/export.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <utility>

namespace meshscout {
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
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Parse a level name ("trace" .. "fatal", "off"), ignoring case.
 * @return The level, or nullopt for an unknown name.
 */
MESHSCOUT_UTILS_API std::optional<LogLevel> parseLogLevel(const std::string& name);

/**
 * @class Logger
 * @brief Process-wide logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Discovery", "Scan started with filter '{}'", expr);
 * LOG_ERROR("Session", "Open failed: {}", e.what());
 * @endcode
 *
 * A `{}` in the format is replaced by the next argument streamed with
 * operator<<. Placeholders without an argument are printed as-is and
 * surplus arguments are dropped.
 */
class MESHSCOUT_UTILS_API Logger {
public:
    /// Receives every emitted line (already formatted, no trailing newline).
    using Sink = std::function<void(LogLevel level, const std::string& line)>;

    static Logger& instance();

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colours on the level tag.
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Redirect output to @p sink instead of stderr.
     */
    void setSink(Sink sink);

    /**
     * @brief Restore the default stderr output.
     */
    void resetSink();

    /**
     * @brief Level name without padding ("INFO", "WARN", ...).
     */
    static std::string levelName(LogLevel level);

    template<typename... Args>
    void log(LogLevel level, const std::string& component,
             const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::ostringstream message;
        formatInto(message, format, std::forward<Args>(args)...);
        write(level, component, message.str());
    }

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

private:
    Logger();
    ~Logger() = default;

    void write(LogLevel level, const std::string& component,
               const std::string& message);

    static void formatInto(std::ostringstream& out, const char* format) {
        out << format;
    }

    template<typename T, typename... Rest>
    static void formatInto(std::ostringstream& out, const char* format,
                           T&& value, Rest&&... rest) {
        for (; *format; ++format) {
            if (format[0] == '{' && format[1] == '}') {
                out << value;
                formatInto(out, format + 2, std::forward<Rest>(rest)...);
                return;
            }
            out << *format;
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    Sink sink_;
};

}  // namespace utils
}  // namespace meshscout

#define LOG_TRACE(component, ...) \
    ::meshscout::utils::Logger::instance().log(::meshscout::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::meshscout::utils::Logger::instance().log(::meshscout::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::meshscout::utils::Logger::instance().log(::meshscout::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::meshscout::utils::Logger::instance().log(::meshscout::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::meshscout::utils::Logger::instance().log(::meshscout::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::meshscout::utils::Logger::instance().log(::meshscout::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Arguments are not evaluated unless the condition holds and the level is enabled.
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::meshscout::utils::Logger::instance().isEnabled(level)) { \
            ::meshscout::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while (0)
