#ifndef IBCP_TRANSPORT_RETRY_POLICY_HPP
#define IBCP_TRANSPORT_RETRY_POLICY_HPP

#include "ibcp/transport/transport_error.hpp"

#include <chrono>
#include <cstddef>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// RetryPolicy
// ─────────────────────────────────────────────────────────────────────────────
// Immutable once handed to the transport. Decides *whether* an attempt is
// retried; IBackoffPolicy decides *how long* to wait first.
//
// Retried:      status >= 500, connection failures, timeouts
// Never retried: 401, 403, other 4xx, malformed JSON, rejected paths
//
// A request makes at most max_retries + 1 attempts.

class RetryPolicy {
public:
    RetryPolicy() = default;

    RetryPolicy(std::size_t max_retries, std::chrono::milliseconds base_delay, double backoff_multiplier)
        : max_retries_(max_retries)
        , base_delay_(base_delay)
        , backoff_multiplier_(backoff_multiplier)
    {}

    RetryPolicy& with_max_retries(std::size_t retries) {
        max_retries_ = retries;
        return *this;
    }

    RetryPolicy& with_base_delay(std::chrono::milliseconds delay) {
        base_delay_ = delay;
        return *this;
    }

    RetryPolicy& with_backoff_multiplier(double multiplier) {
        backoff_multiplier_ = multiplier;
        return *this;
    }

    [[nodiscard]] std::size_t max_retries() const noexcept { return max_retries_; }
    [[nodiscard]] std::chrono::milliseconds base_delay() const noexcept { return base_delay_; }
    [[nodiscard]] double backoff_multiplier() const noexcept { return backoff_multiplier_; }

    [[nodiscard]] static bool is_retryable_status(int status_code) noexcept {
        return status_code >= 500;
    }

    [[nodiscard]] static bool is_retryable(const HttpClientError& error) noexcept {
        switch (error.code) {
            case HttpClientError::Code::ConnectionFailed:
            case HttpClientError::Code::Timeout:
            case HttpClientError::Code::SslError:
            case HttpClientError::Code::Unknown:
                return true;
            case HttpClientError::Code::InvalidRequest:
                return false;
        }
        return false;
    }

    /// `retry` is the 0-based index of the retry about to be made.
    [[nodiscard]] bool has_budget(std::size_t retry) const noexcept {
        return retry < max_retries_;
    }

private:
    std::size_t max_retries_{3};
    std::chrono::milliseconds base_delay_{1000};
    double backoff_multiplier_{2.0};
};

}  // namespace ibcp

#endif  // IBCP_TRANSPORT_RETRY_POLICY_HPP
