#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <thread>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// KeepAliveTask
// ─────────────────────────────────────────────────────────────────────────────
// Supervised periodic task: sleep `interval`, run `ping`, repeat, until
// stop() is called. stop() wakes the sleeping thread and joins it, so once it
// returns no further ping can start. A ping already in flight is allowed to
// finish first; a ping that has to wait (between retries) should do so
// through wait_for_stop() so stop() cuts the wait short.
//
// The ping callback owns its own error handling; the loop never inspects a
// result and never exits on its own.

class KeepAliveTask {
public:
    using Ping = std::function<void(KeepAliveTask& task)>;

    /// Throws std::invalid_argument unless interval is positive and ping is set.
    KeepAliveTask(std::chrono::milliseconds interval, Ping ping);

    // Stops and joins
    ~KeepAliveTask();

    KeepAliveTask(const KeepAliveTask&) = delete;
    KeepAliveTask& operator=(const KeepAliveTask&) = delete;
    KeepAliveTask(KeepAliveTask&&) = delete;
    KeepAliveTask& operator=(KeepAliveTask&&) = delete;

    /// Start the loop thread. No-op if already started.
    void start();

    /// Cancel and wait for the loop thread to exit. Idempotent.
    void stop();

    /// Sleep up to `timeout`, returning early with true once stop() is called.
    /// For use from inside the ping.
    [[nodiscard]] bool wait_for_stop(std::chrono::milliseconds timeout);

    [[nodiscard]] bool is_running() const noexcept;

    /// Pings attempted so far.
    [[nodiscard]] std::size_t ping_count() const noexcept;

private:
    void run();

    const std::chrono::milliseconds interval_;
    const Ping ping_;

    std::mutex mutex_;
    std::condition_variable wake_;
    bool stop_requested_{false};
    std::thread thread_;

    std::atomic<bool> running_{false};
    std::atomic<std::size_t> pings_{0};
};

}  // namespace ibcp
