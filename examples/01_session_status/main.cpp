// Example 01: Session Status
//
// Builds a transport and session manager by hand, checks the session, and
// logs out. Pass a base URL to override IB_BASE / the default.

#include <ibcp/log/spdlog_logger.hpp>
#include <ibcp/session/session_manager.hpp>
#include <ibcp/transport/gateway_config.hpp>
#include <ibcp/transport/gateway_transport.hpp>

#include <iostream>
#include <memory>
#include <stdexcept>

using namespace ibcp;

int main(int argc, char* argv[]) {
    set_logger(make_spdlog_console_logger(LogLevel::Debug));

    GatewayConfig config = gateway_config_from_env();
    if (argc > 1) {
        config.with_base_url(argv[1]);
    }

    std::cout << "=== Client Portal Session Example ===\n\n";
    std::cout << "Gateway: " << config.base_url << "\n\n";

    // 1. Transport and session, shared by everything that talks to this gateway
    std::shared_ptr<SessionManager> session;
    try {
        auto transport = std::make_shared<GatewayTransport>(config);
        session = std::make_shared<SessionManager>(transport);
    } catch (const std::invalid_argument& e) {
        std::cerr << "ERROR: " << e.what() << "\n";
        return 2;
    }

    session->on_state_change([](SessionState from, SessionState to) {
        std::cout << "  [state] " << to_string(from) << " -> " << to_string(to) << "\n";
    });

    // 2. First check: status request, maybe one re-auth, keep-alive starts
    auto live = session->ensure_live();
    if (!live) {
        std::cerr << "ERROR: " << to_string(live.error().code) << ": " << live.error().message << "\n";
        return 1;
    }

    // 3. Within the check interval this is answered from the cache
    auto info = session->get_session_info();
    if (info) {
        std::cout << "\nAuth status:\n" << info->dump(2) << "\n\n";
    }
    std::cout << "Keep-alive running: " << (session->keep_alive_running() ? "yes" : "no") << "\n";

    // 4. Stop the keep-alive and end the gateway session
    session->logout();
    std::cout << "Keep-alive running: " << (session->keep_alive_running() ? "yes" : "no") << "\n";

    set_logger(nullptr);
    return 0;
}
