#include <remotesync-cpp/logging.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

namespace remotesync_cpp {

namespace {

auto format_timestamp() -> std::string {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::time_point_cast<std::chrono::seconds>(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now - seconds).count();
    const std::time_t now_c = std::chrono::system_clock::to_time_t(seconds);

    std::tm tm{};
#if defined(_WIN32)
    gmtime_s(&tm, &now_c);
#else
    gmtime_r(&now_c, &tm);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return oss.str();
}

}  // namespace

auto parse_log_level(std::string_view name) -> std::optional<LogLevel> {
    if (name == "debug") return LogLevel::debug;
    if (name == "info") return LogLevel::info;
    if (name == "warning") return LogLevel::warning;
    if (name == "error") return LogLevel::error;
    return std::nullopt;
}

auto Logger::instance() -> Logger& {
    static auto logger = Logger{};
    return logger;
}

void Logger::log(LogLevel level, std::string_view event, nlohmann::json fields) {
    auto record = nlohmann::json{
        {"ts", format_timestamp()},
        {"level", to_string_view(level)},
        {"event", event},
    };
    if (!fields.is_null() && !fields.empty()) {
        record["fields"] = std::move(fields);
    }
    // Invalid UTF-8 in a message must not turn a log call into a failure
    auto line = record.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    line.push_back('\n');

    auto lock = std::scoped_lock{mutex_};
    if (!enabled_ || level < level_) return;
    if (sink_) {
        sink_(line);
    } else {
        std::clog << line;
        std::clog.flush();
    }
}

auto Logger::should_log(LogLevel level) const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return enabled_ && level >= level_;
}

void Logger::set_enabled(bool enabled) {
    auto lock = std::scoped_lock{mutex_};
    enabled_ = enabled;
}

auto Logger::enabled() const -> bool {
    auto lock = std::scoped_lock{mutex_};
    return enabled_;
}

void Logger::set_level(LogLevel level) {
    auto lock = std::scoped_lock{mutex_};
    level_ = level;
}

auto Logger::level() const -> LogLevel {
    auto lock = std::scoped_lock{mutex_};
    return level_;
}

void Logger::set_sink(Sink sink) {
    auto lock = std::scoped_lock{mutex_};
    sink_ = std::move(sink);
}

}  // namespace remotesync_cpp
