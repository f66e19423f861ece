#pragma once

#include "ibcp/client/gateway_client.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ibcp {

struct Account {
    std::string id;
    std::string type;
    std::string desc;
    bool covestor{false};
};

/// Portfolio accounts, GET /portfolio/accounts and /portfolio/{id}/summary.
class AccountsAdapter {
public:
    explicit AccountsAdapter(std::shared_ptr<GatewayClient> client);

    [[nodiscard]] GatewayResult<std::vector<Account>> get_accounts();

    /// Summary payload as returned by the gateway.
    [[nodiscard]] GatewayResult<Json> get_account_summary(const std::string& account_id);

    /// One array entry: objects use id/accountId and type/accountVan, bare
    /// strings are ids of type "UNKNOWN".
    [[nodiscard]] static Account parse_account(const Json& entry);

private:
    std::shared_ptr<GatewayClient> client_;
};

}  // namespace ibcp
