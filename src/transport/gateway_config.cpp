#include "ibcp/transport/gateway_config.hpp"
#include "ibcp/log/logger.hpp"

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <string_view>
#include <system_error>

namespace ibcp {

GatewayConfig& GatewayConfig::with_base_url(const std::string& url) {
    base_url = url;
    return *this;
}

GatewayConfig& GatewayConfig::with_header(const std::string& name, const std::string& value) {
    default_headers[name] = value;
    return *this;
}

GatewayConfig& GatewayConfig::with_verify_ssl(bool verify) {
    verify_ssl = verify;
    return *this;
}

GatewayConfig& GatewayConfig::with_request_timeout(std::chrono::milliseconds timeout) {
    request_timeout = timeout;
    return *this;
}

GatewayConfig& GatewayConfig::with_max_retries(std::size_t retries) {
    max_retries = retries;
    return *this;
}

GatewayConfig& GatewayConfig::with_retry_base_delay(std::chrono::milliseconds delay) {
    retry_base_delay = delay;
    return *this;
}

GatewayConfig& GatewayConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

GatewayConfig& GatewayConfig::with_auth_check_interval(std::chrono::milliseconds interval) {
    auth_check_interval = interval;
    return *this;
}

GatewayConfig& GatewayConfig::with_keep_alive_interval(std::chrono::milliseconds interval) {
    keep_alive_interval = interval;
    return *this;
}

std::string GatewayConfig::validation_error() const {
    if (parse_url(base_url).has_value() == false) {
        return "Invalid base_url: " + base_url;
    }
    if (request_timeout.count() <= 0 || request_timeout > kMaxGatewayInterval) {
        return "request_timeout must be positive and at most 24h";
    }
    if (keep_alive_interval.count() <= 0 || keep_alive_interval > kMaxGatewayInterval) {
        return "keep_alive_interval must be positive and at most 24h";
    }
    if (auth_check_interval.count() < 0 || auth_check_interval > kMaxGatewayInterval) {
        return "auth_check_interval must be between 0 and 24h";
    }
    if (retry_base_delay.count() < 0 || retry_base_delay > kMaxGatewayInterval) {
        return "retry_base_delay must be between 0 and 24h";
    }
    if (backoff_multiplier < 1.0) {
        return "backoff_multiplier must be at least 1.0";
    }
    return "";
}

// ─────────────────────────────────────────────────────────────────────────────
// Environment
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

constexpr std::int64_t kMaxIntervalSeconds =
    std::chrono::duration_cast<std::chrono::seconds>(kMaxGatewayInterval).count();
constexpr std::int64_t kMaxIntervalMillis = kMaxGatewayInterval.count();

// Integer in [min, max], or nullopt with a warning
std::optional<std::int64_t> get_env_count(const char* name, std::int64_t min, std::int64_t max) {
    const auto raw = get_env(name);
    if (raw.has_value() == false) {
        return std::nullopt;
    }

    std::int64_t value = 0;
    const auto* first = raw->data();
    const auto* last = raw->data() + raw->size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || value < min || value > max) {
        get_logger().warn("Ignoring {}='{}': expected an integer in [{}, {}]", name, *raw, min, max);
        return std::nullopt;
    }
    return value;
}

}  // namespace

GatewayConfig gateway_config_from_env() {
    GatewayConfig config;

    if (auto base = get_env("IB_BASE")) {
        config.base_url = std::move(*base);
    }
    if (auto seconds = get_env_count("IBCP_AUTH_CHECK_INTERVAL_S", 0, kMaxIntervalSeconds)) {
        config.auth_check_interval = std::chrono::seconds{*seconds};
    }
    if (auto seconds = get_env_count("IBCP_KEEP_ALIVE_INTERVAL_S", 1, kMaxIntervalSeconds)) {
        config.keep_alive_interval = std::chrono::seconds{*seconds};
    }
    if (auto retries = get_env_count("IBCP_MAX_RETRIES", 0, static_cast<std::int64_t>(kMaxEnvRetries))) {
        config.max_retries = static_cast<std::size_t>(*retries);
    }
    if (auto millis = get_env_count("IBCP_RETRY_BASE_DELAY_MS", 0, kMaxIntervalMillis)) {
        config.retry_base_delay = std::chrono::milliseconds{*millis};
    }
    if (auto millis = get_env_count("IBCP_REQUEST_TIMEOUT_MS", 1, kMaxIntervalMillis)) {
        config.request_timeout = std::chrono::milliseconds{*millis};
    }

    return config;
}

}  // namespace ibcp
