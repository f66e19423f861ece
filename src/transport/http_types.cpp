#include "ibcp/transport/http_types.hpp"

#include <ada.h>

namespace ibcp {

std::optional<UrlComponents> parse_url(const std::string& url) {
    auto parsed = ada::parse<ada::url_aggregator>(url);
    if (parsed.has_value() == false) {
        return std::nullopt;
    }

    // ada reports the protocol with its trailing colon
    std::string scheme(parsed->get_protocol());
    if (scheme.empty() == false && scheme.back() == ':') {
        scheme.pop_back();
    }
    const bool is_https = (scheme == "https");
    if (scheme != "http" && is_https == false) {
        return std::nullopt;
    }

    std::string host(parsed->get_hostname());
    if (host.empty()) {
        return std::nullopt;
    }

    const bool has_query = (parsed->get_search().empty() == false);
    const bool has_fragment = (parsed->get_hash().empty() == false);
    if (has_query || has_fragment) {
        return std::nullopt;
    }

    UrlComponents result;
    result.scheme = std::move(scheme);
    result.host = std::move(host);

    const auto port = parsed->get_port();
    if (port.empty()) {
        result.port = is_https ? 443 : 80;
    } else {
        result.port = static_cast<std::uint16_t>(std::stoi(std::string(port)));
    }

    std::string path(parsed->get_pathname());
    while (path.empty() == false && path.back() == '/') {
        path.pop_back();
    }
    result.path = std::move(path);

    return result;
}

}  // namespace ibcp
