#include <nodeedit-cpp/log.hpp>

#include <cstdio>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

namespace nodeedit_cpp {

namespace {

auto short_path(const char* filepath) -> std::string {
    namespace fs = std::filesystem;
    auto p = fs::path{filepath};
    if (p.has_parent_path()) {
        auto parent = p.parent_path().filename();
        return (parent / p.filename()).string();
    }
    return p.filename().string();
}

void write_to_stderr(const LogRecord& record) {
    auto line = format_record(record);
    line.push_back('\n');
    std::fputs(line.c_str(), stderr);
    std::fflush(stderr);
}

}  // anonymous namespace

auto format_record(const LogRecord& record) -> std::string {
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        record.timestamp.time_since_epoch()) % 1000;
    const auto time = std::chrono::system_clock::to_time_t(record.timestamp);
    auto tm = std::tm{};
    localtime_r(&time, &tm);

    auto oss = std::ostringstream{};
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis.count() << ' ';
    oss << '[' << to_string_view(record.level) << "][" << record.tag << "] ";
    oss << '[' << short_path(record.location.file_name()) << ':'
        << record.location.line() << "] ";
    oss << record.message;
    return oss.str();
}

Logger::Logger() : sink_{write_to_stderr} {}

void Logger::log(LogLevel level, std::string_view tag, std::string message,
                 std::source_location location) {
    if (!enabled_ || level < level_) return;
    sink_(LogRecord{
        std::chrono::system_clock::now(),
        level,
        std::string{tag},
        std::move(message),
        location,
    });
}

void Logger::set_sink(Sink sink) {
    if (!sink) {
        reset_sink();
        return;
    }
    sink_ = std::move(sink);
}

void Logger::reset_sink() {
    sink_ = write_to_stderr;
}

auto logger() -> Logger& {
    static auto instance = Logger{};
    return instance;
}

}  // namespace nodeedit_cpp
