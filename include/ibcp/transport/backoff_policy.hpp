#ifndef IBCP_TRANSPORT_BACKOFF_POLICY_HPP
#define IBCP_TRANSPORT_BACKOFF_POLICY_HPP

#include <algorithm>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <random>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// IBackoffPolicy
// ─────────────────────────────────────────────────────────────────────────────
// How long to wait before retry number `attempt` (0 = first retry). Injected
// through GatewayConfig so tests can retry without sleeping.

struct IBackoffPolicy {
    virtual ~IBackoffPolicy() = default;

    virtual std::chrono::milliseconds next_delay(std::size_t attempt) = 0;
};

// ─────────────────────────────────────────────────────────────────────────────
// ExponentialBackoff
// ─────────────────────────────────────────────────────────────────────────────
// delay = min(base * multiplier^attempt, max), optionally scaled by a random
// factor in [1 - jitter, 1 + jitter].
//
// With the gateway defaults (1s base, 2x, no jitter): 1s, 2s, 4s.
//
// Shared by every thread using the transport; the jitter engine is locked.

class ExponentialBackoff : public IBackoffPolicy {
public:
    ExponentialBackoff(
        std::chrono::milliseconds base,
        double multiplier,
        std::chrono::milliseconds max = std::chrono::milliseconds{60'000},
        double jitter_factor = 0.0
    )
        : base_(base)
        , multiplier_(multiplier)
        , max_(max)
        , jitter_factor_(jitter_factor)
        , rng_(std::random_device{}())
    {}

    std::chrono::milliseconds next_delay(std::size_t attempt) override {
        const double raw_ms = static_cast<double>(base_.count()) *
                              std::pow(multiplier_, static_cast<double>(attempt));
        double delay_ms = std::min(raw_ms, static_cast<double>(max_.count()));

        if (jitter_factor_ > 0.0) {
            std::uniform_real_distribution<double> dist(1.0 - jitter_factor_, 1.0 + jitter_factor_);
            std::lock_guard<std::mutex> lock(rng_mutex_);
            delay_ms *= dist(rng_);
        }

        return std::chrono::milliseconds{static_cast<std::int64_t>(std::max(0.0, delay_ms))};
    }

private:
    std::chrono::milliseconds base_;
    double multiplier_;
    std::chrono::milliseconds max_;
    double jitter_factor_;
    std::mutex rng_mutex_;
    std::mt19937 rng_;
};

// ─────────────────────────────────────────────────────────────────────────────
// NoBackoff - retry immediately (tests)
// ─────────────────────────────────────────────────────────────────────────────

class NoBackoff : public IBackoffPolicy {
public:
    std::chrono::milliseconds next_delay(std::size_t /*attempt*/) override {
        return std::chrono::milliseconds{0};
    }
};

}  // namespace ibcp

#endif  // IBCP_TRANSPORT_BACKOFF_POLICY_HPP
