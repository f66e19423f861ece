#include "ibcp/session/keep_alive.hpp"
#include "ibcp/log/logger.hpp"

#include <stdexcept>

namespace ibcp {

KeepAliveTask::KeepAliveTask(std::chrono::milliseconds interval, Ping ping)
    : interval_(interval)
    , ping_(std::move(ping))
{
    if (interval_.count() <= 0) {
        throw std::invalid_argument("KeepAliveTask: interval must be positive");
    }
    if (ping_ == nullptr) {
        throw std::invalid_argument("KeepAliveTask: ping cannot be empty");
    }
}

KeepAliveTask::~KeepAliveTask() {
    stop();
}

void KeepAliveTask::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (thread_.joinable() || stop_requested_) {
        return;
    }
    running_.store(true);
    thread_ = std::thread([this]() {
        run();
    });
}

void KeepAliveTask::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_requested_ = true;
    }
    wake_.notify_all();

    // Only the owner calls stop(), never the loop thread itself
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool KeepAliveTask::wait_for_stop(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return wake_.wait_for(lock, timeout, [this]() {
        return stop_requested_;
    });
}

bool KeepAliveTask::is_running() const noexcept {
    return running_.load();
}

std::size_t KeepAliveTask::ping_count() const noexcept {
    return pings_.load();
}

void KeepAliveTask::run() {
    get_logger().info("Keep-alive loop started (every {}ms)", interval_.count());

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        const bool cancelled = wake_.wait_for(lock, interval_, [this]() {
            return stop_requested_;
        });
        if (cancelled) {
            break;
        }

        // Ping without the lock so stop() can request cancellation meanwhile
        lock.unlock();
        pings_.fetch_add(1);
        ping_(*this);
        lock.lock();
    }

    running_.store(false);
    get_logger().info("Keep-alive loop cancelled");
}

}  // namespace ibcp
