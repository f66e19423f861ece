#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ibcp {

// ─────────────────────────────────────────────────────────────────────────────
// Headers
// ─────────────────────────────────────────────────────────────────────────────

using HeaderMap = std::unordered_map<std::string, std::string>;

/// Case-insensitive header lookup (RFC 7230).
inline std::optional<std::string> get_header(const HeaderMap& headers, std::string_view name) {
    const auto it = std::ranges::find_if(headers, [&name](const auto& entry) {
        return std::ranges::equal(entry.first, name, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) ==
                   std::tolower(static_cast<unsigned char>(b));
        });
    });
    if (it == headers.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ─────────────────────────────────────────────────────────────────────────────
// Query Parameters
// ─────────────────────────────────────────────────────────────────────────────
// Ordered, duplicates allowed (e.g. fields=31&fields=84).

using QueryParams = std::vector<std::pair<std::string, std::string>>;

// ─────────────────────────────────────────────────────────────────────────────
// HTTP Method
// ─────────────────────────────────────────────────────────────────────────────
// The gateway API only needs these three.

enum class HttpMethod {
    Get,
    Post,
    Delete
};

inline std::string to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Delete: return "DELETE";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// URL Components
// ─────────────────────────────────────────────────────────────────────────────

struct UrlComponents {
    std::string scheme;   // "http" or "https"
    std::string host;
    std::uint16_t port{0};
    std::string path;     // "/v1/api", no trailing slash; empty for root

    [[nodiscard]] bool is_secure() const {
        return scheme == "https";
    }

    /// scheme://host:port
    [[nodiscard]] std::string origin() const {
        return scheme + "://" + host + ":" + std::to_string(port);
    }

    /// scheme://host:port/prefix, the value handed to the HTTP client
    [[nodiscard]] std::string base() const {
        return origin() + path;
    }
};

/// Parse an http(s) base URL with ada-url. Query and fragment are rejected
/// since every request path is appended to the base.
[[nodiscard]] std::optional<UrlComponents> parse_url(const std::string& url);

}  // namespace ibcp
