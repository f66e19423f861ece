#include "ibcp/log/spdlog_logger.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <utility>

namespace ibcp {

namespace {

constexpr const char* kPattern = "[%H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

spdlog::level::level_enum spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

}  // namespace

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel level)
    : logger_(std::make_shared<spdlog::logger>("ibcp", sinks.begin(), sinks.end()))
    , level_(level)
{
    logger_->set_level(spdlog_level(level));
    logger_->set_pattern(kPattern);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (enabled(record.level) == false) {
        return;
    }
    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        spdlog_level(record.level),
        "{}",
        record.message);

    // Flush at warn and above
    if (record.level >= LogLevel::Warn) {
        logger_->flush();
    }
}

bool SpdlogLogger::enabled(LogLevel level) const noexcept {
    const LogLevel threshold = level_.load(std::memory_order_relaxed);
    return threshold != LogLevel::Off && level >= threshold;
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel level) {
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()};
    return std::make_unique<SpdlogLogger>(std::move(sinks), level);
}

}  // namespace ibcp
