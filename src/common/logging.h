#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace common {

enum class LogLevel {
    Trace = 0,
    Debug,
    Info,
    Warn,
    Error,
};

// Accepts the level names printed in log lines, case-insensitively
// ("trace", "debug", "info", "warn"/"warning", "error").
std::optional<LogLevel> parse_log_level(std::string_view name);

class Logger {
public:
    static Logger& instance();

    void setMinimumLevel(LogLevel level);
    LogLevel minimumLevel() const;

    // Redirects all output to |stream| instead of stdout/stderr. Passing
    // nullptr restores the default split between the two.
    void setSink(std::ostream* stream);

    void log(LogLevel level, const std::string& message);

    static const char* levelTag(LogLevel level);

private:
    Logger() = default;

    static std::string timestamp();

    mutable std::mutex mutex_;
    LogLevel minimumLevel_{LogLevel::Info};
    std::ostream* sink_{nullptr};
};

}  // namespace common

#define LOG_TRACE(message) ::common::Logger::instance().log(::common::LogLevel::Trace, (message))
#define LOG_DEBUG(message) ::common::Logger::instance().log(::common::LogLevel::Debug, (message))
#define LOG_INFO(message) ::common::Logger::instance().log(::common::LogLevel::Info, (message))
#define LOG_WARN(message) ::common::Logger::instance().log(::common::LogLevel::Warn, (message))
#define LOG_ERROR(message) ::common::Logger::instance().log(::common::LogLevel::Error, (message))
