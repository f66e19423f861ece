// ─────────────────────────────────────────────────────────────────────────────
// ibcp-cli - Client Portal Gateway Diagnostic Tool
// ─────────────────────────────────────────────────────────────────────────────
// Exercises the session and transport against a running gateway.
//
// Usage:
//   ibcp-cli --status
//   ibcp-cli --base-url https://localhost:5000/v1/api --accounts
//   ibcp-cli --get /iserver/accounts
//   ibcp-cli --get /iserver/marketdata/snapshot -p conids=265598 -p fields=31
//   ibcp-cli --tickle --verbose
//   ibcp-cli --logout
//
// The gateway defaults come from the environment (IB_BASE, IBCP_*), flags
// override them.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "ibcp/client/accounts_adapter.hpp"
#include "ibcp/client/gateway_client.hpp"
#include "ibcp/log/spdlog_logger.hpp"
#include "ibcp/transport/gateway_config.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace ibcp;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset  = "\033[0m";
    const char* bold   = "\033[1m";
    const char* red    = "\033[31m";
    const char* green  = "\033[32m";
    const char* yellow = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& message) {
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << message << "\n";
}

int report_failure(const GatewayError& error) {
    print_error(std::string(to_string(error.code)) + ": " + error.message);
    if (error.is_auth_failure()) {
        std::cerr << color::c(color::yellow)
                  << "Log in through the gateway web page, then retry."
                  << color::c(color::reset) << "\n";
    }
    return 1;
}

void print_json(const Json& value) {
    std::cout << value.dump(2) << "\n";
}

// "name=value" -> {name, value}; a bare name gets an empty value
std::pair<std::string, std::string> parse_param(const std::string& param) {
    const auto eq = param.find('=');
    if (eq == std::string::npos) {
        return {param, ""};
    }
    return {param.substr(0, eq), param.substr(eq + 1)};
}

// ═══════════════════════════════════════════════════════════════════════════
// Commands
// ═══════════════════════════════════════════════════════════════════════════

int cmd_status(GatewayClient& client) {
    auto info = client.session().get_session_info();
    if (!info) {
        return report_failure(info.error());
    }

    std::cout << color::c(color::green) << "Session authenticated" << color::c(color::reset) << "\n";
    print_json(*info);
    return 0;
}

int cmd_tickle(GatewayClient& client) {
    auto result = client.transport().post(SessionManager::kTicklePath);
    if (!result) {
        return report_failure(result.error());
    }
    print_json(*result);
    return 0;
}

int cmd_get(GatewayClient& client, const std::string& path, const QueryParams& params) {
    auto result = client.get(path, params);
    if (!result) {
        return report_failure(result.error());
    }
    print_json(*result);
    return 0;
}

int cmd_accounts(const std::shared_ptr<GatewayClient>& client) {
    AccountsAdapter adapter(client);

    auto accounts = adapter.get_accounts();
    if (!accounts) {
        return report_failure(accounts.error());
    }

    if (accounts->empty()) {
        std::cout << "No accounts\n";
        return 0;
    }

    std::cout << color::c(color::bold) << "Accounts (" << accounts->size() << "):"
              << color::c(color::reset) << "\n";
    for (const auto& account : *accounts) {
        std::cout << "  " << account.id << "  " << account.type;
        if (!account.desc.empty()) {
            std::cout << "  " << account.desc;
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_logout(GatewayClient& client) {
    client.session().logout();
    std::cout << "Logged out\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("ibcp-cli", "Client Portal Gateway Diagnostic Tool");

    options.add_options()
        // Gateway
        ("b,base-url", "Gateway base URL including the API prefix", cxxopts::value<std::string>())
        ("verify-ssl", "Verify the gateway TLS certificate")
        ("r,retries", "Maximum retries per request", cxxopts::value<std::size_t>())

        // Commands
        ("s,status", "Check the session and print the auth status (default)")
        ("tickle", "Send one keep-alive ping")
        ("g,get", "GET an API path, e.g. /iserver/accounts", cxxopts::value<std::string>())
        ("p,param", "Query parameter for --get (repeatable, format: name=value)",
            cxxopts::value<std::vector<std::string>>()->default_value(""))
        ("a,accounts", "List portfolio accounts")
        ("logout", "End the gateway session")

        // Output
        ("no-color", "Disable colored output")
        ("v,verbose", "Enable debug logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        set_logger(make_spdlog_console_logger(result.count("verbose") ? LogLevel::Debug : LogLevel::Warn));

        GatewayConfig config = gateway_config_from_env();
        if (result.count("base-url")) {
            config.with_base_url(result["base-url"].as<std::string>());
        }
        if (result.count("verify-ssl")) {
            config.with_verify_ssl(true);
        }
        if (result.count("retries")) {
            config.with_max_retries(result["retries"].as<std::size_t>());
        }

        const auto problem = config.validation_error();
        if (!problem.empty()) {
            print_error(problem);
            return 1;
        }

        auto client = GatewayClient::create(std::move(config));

        int exit_code = 0;
        if (result.count("logout")) {
            exit_code = cmd_logout(*client);
        } else if (result.count("tickle")) {
            exit_code = cmd_tickle(*client);
        } else if (result.count("get")) {
            QueryParams params;
            for (const auto& param : result["param"].as<std::vector<std::string>>()) {
                if (!param.empty()) {
                    params.push_back(parse_param(param));
                }
            }
            exit_code = cmd_get(*client, result["get"].as<std::string>(), params);
        } else if (result.count("accounts")) {
            exit_code = cmd_accounts(client);
        } else {
            exit_code = cmd_status(*client);
        }

        client.reset();
        set_logger(nullptr);
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    } catch (const std::invalid_argument& e) {
        print_error(e.what());
        return 1;
    }
}
