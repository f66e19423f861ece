#pragma once

#include "ibcp/transport/http_types.hpp"

#include <tl/expected.hpp>

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Client Error
// ─────────────────────────────────────────────────────────────────────────────
// Failures below the HTTP layer: no status code was received.

struct HttpClientError {
    enum class Code {
        ConnectionFailed,
        Timeout,
        SslError,
        InvalidRequest,   // rejected before any I/O (bad path)
        Unknown
    };

    Code code;
    std::string message;

    static HttpClientError connection_failed(const std::string& msg) {
        return {Code::ConnectionFailed, msg};
    }
    static HttpClientError timeout(const std::string& msg) {
        return {Code::Timeout, msg};
    }
    static HttpClientError ssl_error(const std::string& msg) {
        return {Code::SslError, msg};
    }
    static HttpClientError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg};
    }
    static HttpClientError unknown(const std::string& msg) {
        return {Code::Unknown, msg};
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Request / Response
// ─────────────────────────────────────────────────────────────────────────────

struct HttpClientRequest {
    HttpMethod method{HttpMethod::Get};
    std::string path;                 // relative to the base URL, e.g. "/tickle"
    QueryParams params;
    std::optional<std::string> body;  // serialised JSON, POST only
    HeaderMap headers;
};

struct HttpClientResponse {
    int status_code{0};
    HeaderMap headers;
    std::string body;

    [[nodiscard]] bool is_success() const {
        return (status_code >= 200) && (status_code < 300);
    }
};

template <typename T>
using HttpClientResult = tl::expected<T, HttpClientError>;

// ─────────────────────────────────────────────────────────────────────────────
// IHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// One blocking HTTP exchange per perform() call. Implementations must allow
// concurrent perform() calls once configured: the keep-alive thread and
// adapter threads share one client.

class IHttpClient {
public:
    virtual ~IHttpClient() = default;

    // Configuration, applied before the first request

    // e.g. "https://localhost:8765/v1/api"
    virtual void set_base_url(const std::string& url) = 0;

    virtual void set_default_headers(const HeaderMap& headers) = 0;

    virtual void set_connect_timeout(std::chrono::milliseconds timeout) = 0;

    // Bounds one attempt end to end
    virtual void set_read_timeout(std::chrono::milliseconds timeout) = 0;

    virtual void set_verify_ssl(bool verify) = 0;

    [[nodiscard]] virtual HttpClientResult<HttpClientResponse> perform(
        const HttpClientRequest& request
    ) = 0;
};

/// Default implementation (cpr / libcurl).
std::unique_ptr<IHttpClient> make_http_client();

}  // namespace ibcp
