#include "ibcp/transport/http_client.hpp"

#include <cpr/cpr.h>

#include <algorithm>
#include <cctype>

namespace ibcp {

namespace {

// Paths are appended verbatim to the base URL, so anything that could walk
// out of the API prefix or smuggle a second request line is refused.
std::optional<std::string> path_violation(const std::string& path) {
    if (path.empty() || path.front() != '/') {
        return "Request path must start with '/'";
    }

    for (const unsigned char c : path) {
        if (c < 0x20 || c == 0x7F) {
            return "Request path contains control characters";
        }
    }

    std::string lower = path;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    const bool traversal =
        (lower.find("..") != std::string::npos) ||
        (lower.find("%2e%2e") != std::string::npos) ||
        (lower.find("%2e.") != std::string::npos) ||
        (lower.find(".%2e") != std::string::npos) ||
        (lower.find("%252e") != std::string::npos) ||
        (lower.find('\\') != std::string::npos) ||
        (lower.find("%5c") != std::string::npos);
    if (traversal) {
        return "Path traversal pattern detected in request path";
    }

    return std::nullopt;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CprHttpClient
// ─────────────────────────────────────────────────────────────────────────────
// cpr::Session is not shared: each perform() builds its own, so concurrent
// calls never touch the same curl handle.

class CprHttpClient : public IHttpClient {
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    void set_base_url(const std::string& url) override {
        base_url_ = url;
    }

    void set_default_headers(const HeaderMap& headers) override {
        default_headers_ = headers;
    }

    void set_connect_timeout(std::chrono::milliseconds timeout) override {
        connect_timeout_ = timeout;
    }

    void set_read_timeout(std::chrono::milliseconds timeout) override {
        read_timeout_ = timeout;
    }

    void set_verify_ssl(bool verify) override {
        verify_ssl_ = verify;
    }

    HttpClientResult<HttpClientResponse> perform(const HttpClientRequest& request) override {
        const auto violation = path_violation(request.path);
        if (violation.has_value()) {
            return tl::unexpected(HttpClientError::invalid_request(*violation));
        }

        cpr::Session session;
        session.SetUrl(cpr::Url{base_url_ + request.path});
        session.SetConnectTimeout(cpr::ConnectTimeout{connect_timeout_});
        session.SetTimeout(cpr::Timeout{read_timeout_});
        session.SetVerifySsl(cpr::VerifySsl{verify_ssl_});

        cpr::Header headers;
        for (const auto& [name, value] : default_headers_) {
            headers[name] = value;
        }
        for (const auto& [name, value] : request.headers) {
            headers[name] = value;
        }

        if (request.params.empty() == false) {
            cpr::Parameters parameters;
            for (const auto& [key, value] : request.params) {
                parameters.Add(cpr::Parameter{key, value});
            }
            session.SetParameters(parameters);
        }

        if (request.body.has_value()) {
            headers["Content-Type"] = "application/json";
            session.SetBody(cpr::Body{*request.body});
        }
        session.SetHeader(headers);

        cpr::Response response;
        switch (request.method) {
            case HttpMethod::Get:
                response = session.Get();
                break;
            case HttpMethod::Post:
                response = session.Post();
                break;
            case HttpMethod::Delete:
                response = session.Delete();
                break;
        }
        return convert_response(response);
    }

private:
    static HttpClientResult<HttpClientResponse> convert_response(const cpr::Response& response) {
        if (response.error.code != cpr::ErrorCode::OK) {
            return tl::unexpected(map_error(response.error));
        }

        HttpClientResponse result;
        result.status_code = static_cast<int>(response.status_code);
        result.body = response.text;
        for (const auto& [name, value] : response.header) {
            result.headers[name] = value;
        }
        return result;
    }

    static HttpClientError map_error(const cpr::Error& error) {
        const std::string& msg = error.message;
        const bool mentions_tls =
            (msg.find("SSL") != std::string::npos) ||
            (msg.find("certificate") != std::string::npos) ||
            (msg.find("TLS") != std::string::npos);
        if (mentions_tls) {
            return HttpClientError::ssl_error(msg);
        }

        switch (error.code) {
            case cpr::ErrorCode::OPERATION_TIMEDOUT:
                return HttpClientError::timeout(msg);
            case cpr::ErrorCode::SSL_CONNECT_ERROR:
                return HttpClientError::ssl_error(msg);
            default:
                // Refused, reset, unresolvable host...
                return HttpClientError::connection_failed(msg);
        }
    }

    std::string base_url_;
    HeaderMap default_headers_;
    std::chrono::milliseconds connect_timeout_{10'000};
    std::chrono::milliseconds read_timeout_{30'000};
    bool verify_ssl_{true};
};

std::unique_ptr<IHttpClient> make_http_client() {
    return std::make_unique<CprHttpClient>();
}

}  // namespace ibcp
