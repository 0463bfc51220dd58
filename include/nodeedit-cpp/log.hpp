/// @file log.hpp
/// @brief Tagged, levelled logger with a replaceable sink.

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <source_location>
#include <string>
#include <string_view>

namespace nodeedit_cpp {

/// Severity of a log record.
enum class LogLevel : std::uint8_t {
    debug,
    info,
    warning,
    error,
};

/// Convert a LogLevel to its string representation.
constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::debug:   return "DEBUG";
        case LogLevel::info:    return "INFO";
        case LogLevel::warning: return "WARNING";
        case LogLevel::error:   return "ERROR";
    }
    return "UNKNOWN";
}

/// One emitted log line, before formatting.
struct LogRecord {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level{LogLevel::info};
    std::string tag;
    std::string message;
    std::source_location location;
};

/// Render a record as `YYYY-MM-DD HH:MM:SS.mmm [LEVEL][tag] [dir/file:line] message`.
auto format_record(const LogRecord& record) -> std::string;

/// A synchronous logger.
///
/// Records below the minimum level, or emitted while logging is disabled,
/// are dropped before they reach the sink. The default sink writes each
/// formatted record as one line to stderr.
///
/// @code
/// logger().log(LogLevel::error, "save", "document is not valid JSON");
/// @endcode
class Logger {
public:
    using Sink = std::function<void(const LogRecord&)>;

    Logger();

    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;
    Logger(Logger&&) = delete;
    auto operator=(Logger&&) -> Logger& = delete;

    /// Emit a record if it passes the level and enable filters.
    void log(LogLevel level, std::string_view tag, std::string message,
             std::source_location location = std::source_location::current());

    /// Drop records below this level.
    void set_level(LogLevel level) { level_ = level; }
    auto level() const -> LogLevel { return level_; }

    void set_enabled(bool enabled) { enabled_ = enabled; }
    auto enabled() const -> bool { return enabled_; }

    /// Route records to a custom sink instead of stderr.
    void set_sink(Sink sink);

    /// Restore the stderr sink.
    void reset_sink();

private:
    Sink sink_;
    LogLevel level_{LogLevel::info};
    bool enabled_{true};
};

/// The process-wide logger.
auto logger() -> Logger&;

}  // namespace nodeedit_cpp
