#include "ibcp/transport/gateway_transport.hpp"
#include "ibcp/json/json_decoder.hpp"
#include "ibcp/log/logger.hpp"

#include <stdexcept>
#include <thread>

namespace ibcp {

namespace {

constexpr std::size_t kMaxBodyInMessage = 200;

std::string describe(const HttpClientRequest& request) {
    return to_string(request.method) + " " + request.path;
}

std::string truncated(const std::string& body) {
    if (body.size() <= kMaxBodyInMessage) {
        return body;
    }
    return body.substr(0, kMaxBodyInMessage) + "...";
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

GatewayTransport::GatewayTransport(GatewayConfig config)
    : GatewayTransport(std::move(config), make_http_client())
{}

GatewayTransport::GatewayTransport(GatewayConfig config, std::unique_ptr<IHttpClient> client)
    : config_(std::move(config))
    , retry_policy_(config_.retry_policy())
    , http_client_(std::move(client))
{
    if (http_client_ == nullptr) {
        throw std::invalid_argument("GatewayTransport: HTTP client cannot be null");
    }

    auto parsed = parse_url(config_.base_url);
    if (parsed.has_value() == false) {
        throw std::invalid_argument("Invalid base_url: " + config_.base_url);
    }
    url_ = std::move(*parsed);

    if (config_.backoff_policy != nullptr) {
        backoff_policy_ = config_.backoff_policy;
    } else {
        backoff_policy_ = std::make_shared<ExponentialBackoff>(
            retry_policy_.base_delay(), retry_policy_.backoff_multiplier());
    }

    http_client_->set_base_url(url_.base());
    http_client_->set_default_headers(config_.default_headers);
    http_client_->set_connect_timeout(config_.connect_timeout);
    http_client_->set_read_timeout(config_.request_timeout);
    http_client_->set_verify_ssl(config_.verify_ssl);

    if (config_.verify_ssl == false && url_.host != "localhost" && url_.host != "127.0.0.1") {
        get_logger().warn("TLS verification disabled for non-local gateway {}", url_.origin());
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Requests
// ─────────────────────────────────────────────────────────────────────────────

GatewayResult<Json> GatewayTransport::get(const std::string& path, const QueryParams& params) {
    return request(HttpMethod::Get, path, params);
}

GatewayResult<Json> GatewayTransport::post(
    const std::string& path,
    const std::optional<Json>& body,
    const QueryParams& params
) {
    return request(HttpMethod::Post, path, params, body);
}

GatewayResult<Json> GatewayTransport::del(const std::string& path, const QueryParams& params) {
    return request(HttpMethod::Delete, path, params);
}

GatewayResult<Json> GatewayTransport::request(
    HttpMethod method,
    const std::string& path,
    const QueryParams& params,
    const std::optional<Json>& body,
    const RetryWait& wait
) {
    HttpClientRequest req;
    req.method = method;
    req.path = path;
    req.params = params;
    req.headers["Accept"] = "application/json";
    if (body.has_value()) {
        req.body = body->dump();
    }

    const std::size_t max_retries = retry_policy_.max_retries();

    for (std::size_t attempt = 0; attempt <= max_retries; ++attempt) {
        attempts_.fetch_add(1, std::memory_order_relaxed);
        auto response = http_client_->perform(req);

        if (response.has_value() == false) {
            const auto& error = response.error();
            const bool retryable = RetryPolicy::is_retryable(error);
            if (retryable && retry_policy_.has_budget(attempt)) {
                if (wait_before_retry(req, attempt, error.message, wait) == false) {
                    return tl::unexpected(GatewayError::cancelled(describe(req) + " cancelled before retry"));
                }
                continue;
            }
            if (retryable) {
                get_logger().error("{} failed after {} retries: {}",
                    describe(req), max_retries, error.message);
            }
            return tl::unexpected(GatewayError::from_client_error(error));
        }

        const int status = response->status_code;
        if (RetryPolicy::is_retryable_status(status)) {
            if (retry_policy_.has_budget(attempt)) {
                if (wait_before_retry(req, attempt, "server error " + std::to_string(status), wait) == false) {
                    return tl::unexpected(GatewayError::cancelled(describe(req) + " cancelled before retry"));
                }
                continue;
            }
            get_logger().error("{} failed after {} retries: server error {}",
                describe(req), max_retries, status);
            return tl::unexpected(GatewayError::server_error(status));
        }

        return classify(req, *response);
    }

    // Every iteration returns or continues with budget left
    return tl::unexpected(GatewayError::retries_exhausted(max_retries));
}

GatewayResult<Json> GatewayTransport::classify(
    const HttpClientRequest& request,
    const HttpClientResponse& response
) {
    const int status = response.status_code;

    if (status == 401) {
        get_logger().debug("{} -> 401", describe(request));
        return tl::unexpected(GatewayError::authentication_required("Authentication required"));
    }

    if (status == 403) {
        get_logger().debug("{} -> 403", describe(request));
        return tl::unexpected(GatewayError::access_forbidden());
    }

    if (response.is_success() == false) {
        return tl::unexpected(GatewayError::http_error(
            status,
            "HTTP " + std::to_string(status) + " from " + describe(request) + ": " +
                truncated(response.body)));
    }

    auto decoded = decode_response_body(response.body);
    if (decoded.has_value() == false) {
        return tl::unexpected(GatewayError::parse_error(
            "Malformed JSON from " + describe(request) + ": " + decoded.error().message));
    }
    return std::move(*decoded);
}

bool GatewayTransport::wait_before_retry(
    const HttpClientRequest& request,
    std::size_t retry,
    const std::string& reason,
    const RetryWait& wait
) {
    const auto delay = backoff_policy_->next_delay(retry);
    get_logger().warn("{}: {}, retrying in {}ms (retry {}/{})",
        describe(request), reason, delay.count(), retry + 1, retry_policy_.max_retries());

    if (wait) {
        return wait(delay);
    }
    std::this_thread::sleep_for(delay);
    return true;
}

}  // namespace ibcp
