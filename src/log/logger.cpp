#include "ibcp/log/logger.hpp"

#include <mutex>

namespace ibcp {

namespace {

struct GlobalLogger {
    std::mutex mutex;
    std::unique_ptr<ILogger> logger = std::make_unique<NullLogger>();
};

GlobalLogger& global() {
    static GlobalLogger instance;
    return instance;
}

}  // namespace

ILogger& get_logger() noexcept {
    auto& g = global();
    std::lock_guard<std::mutex> lock(g.mutex);
    return *g.logger;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    auto& g = global();
    std::lock_guard<std::mutex> lock(g.mutex);
    g.logger = (logger != nullptr) ? std::move(logger) : std::make_unique<NullLogger>();
}

}  // namespace ibcp
