#ifndef IBCP_TRANSPORT_GATEWAY_CONFIG_HPP
#define IBCP_TRANSPORT_GATEWAY_CONFIG_HPP

#include "ibcp/transport/http_types.hpp"
#include "ibcp/transport/retry_policy.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace ibcp {

struct IBackoffPolicy;

// Upper bound for every interval, delay and timeout
inline constexpr std::chrono::milliseconds kMaxGatewayInterval = std::chrono::hours{24};

// Upper bound for IBCP_MAX_RETRIES
inline constexpr std::size_t kMaxEnvRetries = 20;

// ─────────────────────────────────────────────────────────────────────────────
// GatewayConfig
// ─────────────────────────────────────────────────────────────────────────────
// Everything the transport and session manager need to talk to one Client
// Portal gateway. Resolve it once at startup (gateway_config_from_env() or
// by hand) and pass it to the constructors; nothing reads the environment
// per call.

struct GatewayConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Endpoint
    // ─────────────────────────────────────────────────────────────────────────

    // Including the API prefix. Request paths are appended to it.
    std::string base_url{"https://localhost:8765/v1/api"};

    HeaderMap default_headers;

    // The gateway serves a self-signed certificate on localhost, so peer
    // verification is off by default. Turn it on for any other deployment.
    bool verify_ssl{false};

    // ─────────────────────────────────────────────────────────────────────────
    // Timeouts
    // ─────────────────────────────────────────────────────────────────────────

    std::chrono::milliseconds connect_timeout{10'000};

    // Per attempt, not per request
    std::chrono::milliseconds request_timeout{30'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Retry
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_retries{3};
    std::chrono::milliseconds retry_base_delay{1000};
    double backoff_multiplier{2.0};

    // Overrides the exponential schedule derived from the fields above
    std::shared_ptr<IBackoffPolicy> backoff_policy;

    // ─────────────────────────────────────────────────────────────────────────
    // Session
    // ─────────────────────────────────────────────────────────────────────────

    // How long a successful auth-status check is trusted
    std::chrono::milliseconds auth_check_interval{300'000};

    // Period of the /tickle keep-alive
    std::chrono::milliseconds keep_alive_interval{60'000};

    // ─────────────────────────────────────────────────────────────────────────
    // Builder-style helpers
    // ─────────────────────────────────────────────────────────────────────────

    GatewayConfig& with_base_url(const std::string& url);
    GatewayConfig& with_header(const std::string& name, const std::string& value);
    GatewayConfig& with_verify_ssl(bool verify);
    GatewayConfig& with_request_timeout(std::chrono::milliseconds timeout);
    GatewayConfig& with_max_retries(std::size_t retries);
    GatewayConfig& with_retry_base_delay(std::chrono::milliseconds delay);
    GatewayConfig& with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy);
    GatewayConfig& with_auth_check_interval(std::chrono::milliseconds interval);
    GatewayConfig& with_keep_alive_interval(std::chrono::milliseconds interval);

    [[nodiscard]] RetryPolicy retry_policy() const {
        return RetryPolicy{max_retries, retry_base_delay, backoff_multiplier};
    }

    /// Empty when the configuration is usable.
    [[nodiscard]] std::string validation_error() const;
};

/// Defaults overridden by IB_BASE, IBCP_AUTH_CHECK_INTERVAL_S,
/// IBCP_KEEP_ALIVE_INTERVAL_S, IBCP_MAX_RETRIES, IBCP_RETRY_BASE_DELAY_MS and
/// IBCP_REQUEST_TIMEOUT_MS. Unparsable or out-of-range values keep the
/// default and log a warning: the keep-alive interval must be at least one
/// second, the retry count at most kMaxEnvRetries, and no duration may exceed
/// kMaxGatewayInterval.
[[nodiscard]] GatewayConfig gateway_config_from_env();

}  // namespace ibcp

#endif  // IBCP_TRANSPORT_GATEWAY_CONFIG_HPP
