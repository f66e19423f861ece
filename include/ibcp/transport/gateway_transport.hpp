#pragma once

#include "ibcp/transport/backoff_policy.hpp"
#include "ibcp/transport/gateway_config.hpp"
#include "ibcp/transport/http_client.hpp"
#include "ibcp/transport/http_types.hpp"
#include "ibcp/transport/retry_policy.hpp"
#include "ibcp/transport/transport_error.hpp"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace ibcp {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// GatewayTransport
// ─────────────────────────────────────────────────────────────────────────────
// Executes one gateway call with bounded automatic retry and classifies the
// outcome. Knows nothing about sessions: 401 is reported, never acted on.
//
//   401            -> AuthenticationRequired, no retry
//   403            -> AccessForbidden, no retry
//   >= 500         -> retried; then ServerError(last status)
//   network/timeout-> retried; then NetworkError
//   other non-2xx  -> HttpError(status), no retry
//   2xx, empty     -> {} (empty object)
//   2xx, body      -> parsed JSON; malformed -> ParseError, no retry
//
// Thread-safe: the keep-alive thread and any number of adapter threads may
// call request() concurrently.
//
// Between retries the transport sleeps for the backoff delay. A caller that
// must stay cancellable passes a RetryWait; when it returns false the request
// ends with Cancelled instead of retrying.
//
// Usage:
//   GatewayTransport transport(gateway_config_from_env());
//   auto positions = transport.get("/portfolio/U123/positions/0");
//   if (!positions) { ... positions.error().code ... }

class GatewayTransport {
public:
    /// Waits out `delay` before a retry; false abandons the request.
    using RetryWait = std::function<bool(std::chrono::milliseconds delay)>;

    /// Throws std::invalid_argument for an unparsable base_url.
    explicit GatewayTransport(GatewayConfig config);

    // Custom HTTP client (tests, alternative backends). Must not be null.
    GatewayTransport(GatewayConfig config, std::unique_ptr<IHttpClient> client);

    GatewayTransport(const GatewayTransport&) = delete;
    GatewayTransport& operator=(const GatewayTransport&) = delete;

    [[nodiscard]] GatewayResult<Json> request(
        HttpMethod method,
        const std::string& path,
        const QueryParams& params = {},
        const std::optional<Json>& body = std::nullopt,
        const RetryWait& wait = {}
    );

    [[nodiscard]] GatewayResult<Json> get(const std::string& path, const QueryParams& params = {});

    [[nodiscard]] GatewayResult<Json> post(
        const std::string& path,
        const std::optional<Json>& body = std::nullopt,
        const QueryParams& params = {}
    );

    [[nodiscard]] GatewayResult<Json> del(const std::string& path, const QueryParams& params = {});

    [[nodiscard]] const GatewayConfig& config() const noexcept { return config_; }
    [[nodiscard]] const RetryPolicy& retry_policy() const noexcept { return retry_policy_; }

    /// Total HTTP attempts made, retries included.
    [[nodiscard]] std::size_t attempt_count() const noexcept { return attempts_.load(); }

private:
    [[nodiscard]] GatewayResult<Json> classify(const HttpClientRequest& request,
                                               const HttpClientResponse& response);
    [[nodiscard]] bool wait_before_retry(const HttpClientRequest& request, std::size_t retry,
                                         const std::string& reason, const RetryWait& wait);

    GatewayConfig config_;
    UrlComponents url_;
    RetryPolicy retry_policy_;
    std::shared_ptr<IBackoffPolicy> backoff_policy_;
    std::unique_ptr<IHttpClient> http_client_;
    std::atomic<std::size_t> attempts_{0};
};

}  // namespace ibcp
