#pragma once

#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Debug = 0,
    Info  = 1,
    Warn  = 2,
    Error = 3,
    Off   = 4
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off:   return "off";
    }
    return "unknown";
}

struct LogRecord {
    LogLevel level;
    std::string message;
    std::source_location location;
};

/// Format string that remembers where the log call was written.
template<typename... Args>
struct LogFormat {
    template<typename Text>
    consteval LogFormat(const Text& text, std::source_location loc = std::source_location::current())
        : format(text)
        , location(loc)
    {}

    std::format_string<Args...> format;
    std::source_location location;
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────
// Sink for the library's diagnostics: retry warnings, re-authentication
// results, keep-alive failures. Nothing is printed unless the host installs a
// logger with set_logger(); the default discards everything.
//
//   set_logger(make_spdlog_console_logger(LogLevel::Info));
//   get_logger().warn("{} retrying in {}ms", path, delay.count());
//
// Implementations must accept calls from several threads at once, since the
// keep-alive thread logs alongside adapter threads.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool enabled(LogLevel level) const noexcept = 0;

    template<typename... Args>
    void debug(LogFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
        emit(LogLevel::Debug, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info(LogFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
        emit(LogLevel::Info, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn(LogFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
        emit(LogLevel::Warn, fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error(LogFormat<std::type_identity_t<Args>...> fmt, Args&&... args) {
        emit(LogLevel::Error, fmt, std::forward<Args>(args)...);
    }

private:
    // Formatting is skipped entirely for disabled levels
    template<typename Format, typename... Args>
    void emit(LogLevel level, const Format& fmt, Args&&... args) {
        if (enabled(level)) {
            log(LogRecord{level, std::format(fmt.format, std::forward<Args>(args)...), fmt.location});
        }
    }
};

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool enabled(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

/// The process-wide logger. Install it before creating sessions; the
/// reference must not be held across set_logger().
[[nodiscard]] ILogger& get_logger() noexcept;

/// nullptr reinstalls the discarding default.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

}  // namespace ibcp
