#pragma once

#include "ibcp/session/session_manager.hpp"
#include "ibcp/transport/gateway_config.hpp"
#include "ibcp/transport/gateway_transport.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace ibcp {

// ═══════════════════════════════════════════════════════════════════════════
// GatewayClient
// ═══════════════════════════════════════════════════════════════════════════
// The one object adapters are built on. It pairs a shared transport with the
// shared session for the same gateway; every domain call first makes sure the
// session is live, then goes through the transport.
//
// Adapters hold a std::shared_ptr<GatewayClient> (or a reference) and never
// carry session state of their own, so N adapters still mean one auth cache
// and one keep-alive thread.
//
//   auto client = GatewayClient::create(gateway_config_from_env());
//   AccountsAdapter accounts(client);
//   OrdersAdapter orders(client);   // same session

class GatewayClient {
public:
    GatewayClient(std::shared_ptr<GatewayTransport> transport,
                  std::shared_ptr<SessionManager> session);

    /// Transport (cpr) plus session for one gateway.
    [[nodiscard]] static std::shared_ptr<GatewayClient> create(GatewayConfig config);

    [[nodiscard]] GatewayResult<Json> get(const std::string& path, const QueryParams& params = {});

    [[nodiscard]] GatewayResult<Json> post(
        const std::string& path,
        const std::optional<Json>& body = std::nullopt,
        const QueryParams& params = {}
    );

    [[nodiscard]] GatewayResult<Json> del(const std::string& path, const QueryParams& params = {});

    [[nodiscard]] SessionManager& session() noexcept { return *session_; }
    [[nodiscard]] GatewayTransport& transport() noexcept { return *transport_; }

private:
    [[nodiscard]] GatewayResult<Json> call(
        HttpMethod method,
        const std::string& path,
        const QueryParams& params,
        const std::optional<Json>& body
    );

    std::shared_ptr<GatewayTransport> transport_;
    std::shared_ptr<SessionManager> session_;
};

}  // namespace ibcp
