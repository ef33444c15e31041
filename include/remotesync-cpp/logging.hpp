/// @file logging.hpp
/// @brief Process-wide structured logger emitting one JSON object per line.

#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace remotesync_cpp {

enum class LogLevel : std::uint8_t {
    debug,
    info,
    warning,
    error,
};

constexpr auto to_string_view(LogLevel level) noexcept -> std::string_view {
    switch (level) {
        case LogLevel::debug:   return "debug";
        case LogLevel::info:    return "info";
        case LogLevel::warning: return "warning";
        case LogLevel::error:   return "error";
    }
    return "info";
}

/// Parse "debug", "info", "warning" or "error".
auto parse_log_level(std::string_view name) -> std::optional<LogLevel>;

/// Structured logger shared by every protocol stage.
///
/// Disabled by default. Each record is written to the sink as
/// `{"ts":"...","level":"...","event":"...","fields":{...}}` followed by a
/// newline. The default sink is std::clog.
///
/// @code
/// Logger::instance().set_enabled(true);
/// Logger::instance().log(LogLevel::info, "wishlist_end", {{"requested", 12}});
/// @endcode
class Logger {
public:
    using Sink = std::function<void(std::string_view line)>;

    static auto instance() -> Logger&;

    void log(LogLevel level, std::string_view event, nlohmann::json fields = nlohmann::json::object());

    /// True if a record at `level` would be written. Lets callers skip
    /// building fields for suppressed records.
    auto should_log(LogLevel level) const -> bool;

    void set_enabled(bool enabled);
    auto enabled() const -> bool;

    void set_level(LogLevel level);
    auto level() const -> LogLevel;

    /// Replace the output sink. An empty function restores std::clog.
    void set_sink(Sink sink);

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    auto operator=(const Logger&) -> Logger& = delete;

    mutable std::mutex mutex_;
    bool enabled_ = false;
    LogLevel level_ = LogLevel::info;
    Sink sink_;
};

/// Shorthand for Logger::instance().log(...).
inline void log_event(LogLevel level, std::string_view event,
                      nlohmann::json fields = nlohmann::json::object()) {
    auto& logger = Logger::instance();
    if (logger.should_log(level)) logger.log(level, event, std::move(fields));
}

}  // namespace remotesync_cpp
