#include "ibcp/client/accounts_adapter.hpp"
#include "ibcp/log/logger.hpp"

#include <initializer_list>
#include <stdexcept>
#include <string>

namespace ibcp {

namespace {

// First of `keys` holding a string, else ""
std::string string_field(const Json& object, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        const auto it = object.find(key);
        if (it != object.end() && it->is_string()) {
            return it->get<std::string>();
        }
    }
    return "";
}

}  // namespace

AccountsAdapter::AccountsAdapter(std::shared_ptr<GatewayClient> client)
    : client_(std::move(client))
{
    if (client_ == nullptr) {
        throw std::invalid_argument("AccountsAdapter: client cannot be null");
    }
}

Account AccountsAdapter::parse_account(const Json& entry) {
    Account account;

    if (entry.is_object() == false) {
        account.id = entry.is_string() ? entry.get<std::string>() : entry.dump();
        account.type = "UNKNOWN";
        return account;
    }

    account.id = string_field(entry, {"id", "accountId"});
    account.type = string_field(entry, {"type", "accountVan"});
    account.desc = string_field(entry, {"desc"});
    const auto covestor = entry.find("covestor");
    account.covestor = (covestor != entry.end()) && covestor->is_boolean() && covestor->get<bool>();
    return account;
}

GatewayResult<std::vector<Account>> AccountsAdapter::get_accounts() {
    auto data = client_->get("/portfolio/accounts");
    if (data.has_value() == false) {
        get_logger().error("Failed to get accounts: {}", data.error().message);
        return tl::unexpected(data.error());
    }

    if (data->is_array() == false) {
        return tl::unexpected(GatewayError::parse_error(
            "Expected an array from /portfolio/accounts, got " + std::string(data->type_name())));
    }

    std::vector<Account> accounts;
    accounts.reserve(data->size());
    for (const auto& entry : *data) {
        accounts.push_back(parse_account(entry));
    }

    get_logger().info("Found {} accounts", accounts.size());
    return accounts;
}

GatewayResult<Json> AccountsAdapter::get_account_summary(const std::string& account_id) {
    if (account_id.empty()) {
        return tl::unexpected(GatewayError::invalid_request("Account id is required"));
    }

    auto summary = client_->get("/portfolio/" + account_id + "/summary");
    if (summary.has_value() == false) {
        get_logger().error("Failed to get summary for {}: {}", account_id, summary.error().message);
    }
    return summary;
}

}  // namespace ibcp
