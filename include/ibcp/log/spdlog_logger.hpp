#pragma once

#include "ibcp/log/logger.hpp"

#include <spdlog/logger.h>

#include <atomic>
#include <memory>
#include <vector>

namespace ibcp {

// ILogger over an unregistered spdlog::logger. Lines read
// "[12:00:01.250] [warn] [gateway_transport.cpp:174] POST /tickle: ..."
class SpdlogLogger final : public ILogger {
public:
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel level);

    void log(const LogRecord& record) override;

    [[nodiscard]] bool enabled(LogLevel level) const noexcept override;

private:
    std::shared_ptr<spdlog::logger> logger_;
    std::atomic<LogLevel> level_;
};

/// Coloured stderr sink, keeping stdout free for command output.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel level);

}  // namespace ibcp
