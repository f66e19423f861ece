#include "ibcp/client/gateway_client.hpp"

#include <stdexcept>

namespace ibcp {

GatewayClient::GatewayClient(
    std::shared_ptr<GatewayTransport> transport,
    std::shared_ptr<SessionManager> session
)
    : transport_(std::move(transport))
    , session_(std::move(session))
{
    if (transport_ == nullptr || session_ == nullptr) {
        throw std::invalid_argument("GatewayClient: transport and session are required");
    }
}

std::shared_ptr<GatewayClient> GatewayClient::create(GatewayConfig config) {
    const auto problem = config.validation_error();
    if (problem.empty() == false) {
        throw std::invalid_argument(problem);
    }

    auto transport = std::make_shared<GatewayTransport>(std::move(config));
    auto session = std::make_shared<SessionManager>(transport);
    return std::make_shared<GatewayClient>(std::move(transport), std::move(session));
}

GatewayResult<Json> GatewayClient::get(const std::string& path, const QueryParams& params) {
    return call(HttpMethod::Get, path, params, std::nullopt);
}

GatewayResult<Json> GatewayClient::post(
    const std::string& path,
    const std::optional<Json>& body,
    const QueryParams& params
) {
    return call(HttpMethod::Post, path, params, body);
}

GatewayResult<Json> GatewayClient::del(const std::string& path, const QueryParams& params) {
    return call(HttpMethod::Delete, path, params, std::nullopt);
}

GatewayResult<Json> GatewayClient::call(
    HttpMethod method,
    const std::string& path,
    const QueryParams& params,
    const std::optional<Json>& body
) {
    auto live = session_->ensure_live();
    if (live.has_value() == false) {
        return tl::unexpected(live.error());
    }
    return transport_->request(method, path, params, body);
}

}  // namespace ibcp
