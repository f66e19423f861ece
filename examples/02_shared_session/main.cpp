// Example 02: Shared Session
//
// Several adapters over one GatewayClient: concurrent calls from different
// threads cost a single auth-status request, and one keep-alive serves all.

#include <ibcp/client/accounts_adapter.hpp>
#include <ibcp/client/gateway_client.hpp>
#include <ibcp/log/spdlog_logger.hpp>

#include <iostream>
#include <thread>
#include <vector>

using namespace ibcp;

int main() {
    set_logger(make_spdlog_console_logger(LogLevel::Info));

    auto client = GatewayClient::create(gateway_config_from_env());

    AccountsAdapter accounts(client);

    std::vector<std::thread> workers;
    for (int i = 0; i < 4; ++i) {
        workers.emplace_back([&accounts, i]() {
            auto result = accounts.get_accounts();
            if (!result) {
                std::cerr << "[worker " << i << "] " << result.error().message << "\n";
                return;
            }
            std::cout << "[worker " << i << "] " << result->size() << " accounts\n";
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    std::cout << "HTTP attempts: " << client->transport().attempt_count() << "\n";

    client->session().logout();
    client.reset();
    set_logger(nullptr);
    return 0;
}
