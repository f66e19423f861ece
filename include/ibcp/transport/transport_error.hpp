#ifndef IBCP_TRANSPORT_TRANSPORT_ERROR_HPP
#define IBCP_TRANSPORT_TRANSPORT_ERROR_HPP

#include "ibcp/transport/http_client.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// GatewayError
// ─────────────────────────────────────────────────────────────────────────────
// Error taxonomy shared by the transport, the session manager and adapters.
//
//   AuthenticationRequired  401, or an auth-status payload saying
//                           "not authenticated". Never retried by transport.
//   AccessForbidden         403. Never retried.
//   ServerError             5xx, after the retry budget is spent.
//   NetworkError            connect/TLS/timeout, after the retry budget.
//   ReauthenticationFailed  /iserver/reauthenticate failed, or the status
//                           check still failed after it. Manual login needed.
//   HttpError               any other non-2xx status. Not retried.
//   ParseError              2xx with a malformed JSON body. Not retried.
//   InvalidRequest          request rejected before any I/O.
//   RetriesExhausted        retry loop ended without a classified outcome.
//   Cancelled               the caller gave up during a retry wait.

struct GatewayError {
    enum class Code {
        AuthenticationRequired,
        AccessForbidden,
        ServerError,
        NetworkError,
        ReauthenticationFailed,
        HttpError,
        ParseError,
        InvalidRequest,
        RetriesExhausted,
        Cancelled
    };

    Code code;
    std::string message;
    std::optional<int> http_status;

    static GatewayError authentication_required(const std::string& msg, std::optional<int> status = 401) {
        return {Code::AuthenticationRequired, msg, status};
    }

    static GatewayError access_forbidden() {
        return {Code::AccessForbidden, "Access forbidden", 403};
    }

    static GatewayError server_error(int status) {
        return {Code::ServerError, "Server error: " + std::to_string(status), status};
    }

    static GatewayError network_error(const std::string& msg) {
        return {Code::NetworkError, msg, std::nullopt};
    }

    static GatewayError reauthentication_failed(const std::string& detail) {
        return {Code::ReauthenticationFailed,
                "Reauthentication failed, manual login required: " + detail,
                std::nullopt};
    }

    static GatewayError http_error(int status, const std::string& msg) {
        return {Code::HttpError, msg, status};
    }

    static GatewayError parse_error(const std::string& msg) {
        return {Code::ParseError, msg, std::nullopt};
    }

    static GatewayError invalid_request(const std::string& msg) {
        return {Code::InvalidRequest, msg, std::nullopt};
    }

    static GatewayError retries_exhausted(std::size_t max_retries) {
        return {Code::RetriesExhausted,
                "Max retries (" + std::to_string(max_retries) + ") exceeded",
                std::nullopt};
    }

    static GatewayError cancelled(const std::string& msg) {
        return {Code::Cancelled, msg, std::nullopt};
    }

    static GatewayError from_client_error(const HttpClientError& err) {
        switch (err.code) {
            case HttpClientError::Code::InvalidRequest:
                return invalid_request(err.message);
            case HttpClientError::Code::Timeout:
                return network_error("Request timed out: " + err.message);
            case HttpClientError::Code::ConnectionFailed:
            case HttpClientError::Code::SslError:
            case HttpClientError::Code::Unknown:
                return network_error("Request failed: " + err.message);
        }
        return network_error(err.message);
    }

    /// True for the two codes that mean "log in again".
    [[nodiscard]] bool is_auth_failure() const noexcept {
        return code == Code::AuthenticationRequired || code == Code::ReauthenticationFailed;
    }
};

[[nodiscard]] constexpr std::string_view to_string(GatewayError::Code code) noexcept {
    switch (code) {
        case GatewayError::Code::AuthenticationRequired: return "AuthenticationRequired";
        case GatewayError::Code::AccessForbidden:        return "AccessForbidden";
        case GatewayError::Code::ServerError:            return "ServerError";
        case GatewayError::Code::NetworkError:           return "NetworkError";
        case GatewayError::Code::ReauthenticationFailed: return "ReauthenticationFailed";
        case GatewayError::Code::HttpError:              return "HttpError";
        case GatewayError::Code::ParseError:             return "ParseError";
        case GatewayError::Code::InvalidRequest:         return "InvalidRequest";
        case GatewayError::Code::RetriesExhausted:       return "RetriesExhausted";
        case GatewayError::Code::Cancelled:              return "Cancelled";
    }
    return "Unknown";
}

template <typename T>
using GatewayResult = tl::expected<T, GatewayError>;

}  // namespace ibcp

#endif  // IBCP_TRANSPORT_TRANSPORT_ERROR_HPP
