#include <catch2/catch_test_macros.hpp>

#include "ibcp/transport/backoff_policy.hpp"
#include "ibcp/transport/gateway_transport.hpp"
#include "ibcp/transport/retry_policy.hpp"
#include "mocks/mock_gateway.hpp"

#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

using namespace ibcp;
using namespace ibcp::testing;
using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// RetryPolicy Unit Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("RetryPolicy default configuration", "[retry][policy]") {
    RetryPolicy policy;

    REQUIRE(policy.max_retries() == 3);
    REQUIRE(policy.base_delay() == 1000ms);
    REQUIRE(policy.backoff_multiplier() == 2.0);
}

TEST_CASE("RetryPolicy budget", "[retry][policy]") {
    RetryPolicy policy;
    policy.with_max_retries(2);

    REQUIRE(policy.has_budget(0));
    REQUIRE(policy.has_budget(1));
    REQUIRE_FALSE(policy.has_budget(2));

    policy.with_max_retries(0);
    REQUIRE_FALSE(policy.has_budget(0));
}

TEST_CASE("RetryPolicy HTTP status code handling", "[retry][policy]") {
    SECTION("5xx errors are retryable") {
        REQUIRE(RetryPolicy::is_retryable_status(500));
        REQUIRE(RetryPolicy::is_retryable_status(502));
        REQUIRE(RetryPolicy::is_retryable_status(503));
        REQUIRE(RetryPolicy::is_retryable_status(599));
    }

    SECTION("4xx and 2xx are not") {
        REQUIRE_FALSE(RetryPolicy::is_retryable_status(200));
        REQUIRE_FALSE(RetryPolicy::is_retryable_status(400));
        REQUIRE_FALSE(RetryPolicy::is_retryable_status(401));
        REQUIRE_FALSE(RetryPolicy::is_retryable_status(403));
        REQUIRE_FALSE(RetryPolicy::is_retryable_status(429));
    }
}

TEST_CASE("RetryPolicy client error handling", "[retry][policy]") {
    REQUIRE(RetryPolicy::is_retryable(HttpClientError::connection_failed("refused")));
    REQUIRE(RetryPolicy::is_retryable(HttpClientError::timeout("slow")));
    REQUIRE(RetryPolicy::is_retryable(HttpClientError::ssl_error("handshake")));
    REQUIRE_FALSE(RetryPolicy::is_retryable(HttpClientError::invalid_request("bad path")));
}

// ═══════════════════════════════════════════════════════════════════════════
// Backoff Policy Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("ExponentialBackoff doubles from the base delay", "[retry][backoff]") {
    ExponentialBackoff backoff(1000ms, 2.0);

    REQUIRE(backoff.next_delay(0) == 1000ms);
    REQUIRE(backoff.next_delay(1) == 2000ms);
    REQUIRE(backoff.next_delay(2) == 4000ms);
}

TEST_CASE("ExponentialBackoff is capped", "[retry][backoff]") {
    ExponentialBackoff backoff(1000ms, 2.0, 3000ms);

    REQUIRE(backoff.next_delay(1) == 2000ms);
    REQUIRE(backoff.next_delay(2) == 3000ms);
    REQUIRE(backoff.next_delay(10) == 3000ms);
}

TEST_CASE("ExponentialBackoff jitter stays within bounds", "[retry][backoff]") {
    ExponentialBackoff backoff(1000ms, 2.0, 60'000ms, 0.25);

    for (int i = 0; i < 50; ++i) {
        const auto delay = backoff.next_delay(1);
        REQUIRE(delay >= 1500ms);
        REQUIRE(delay <= 2500ms);
    }
}

TEST_CASE("ExponentialBackoff jitter can be drawn from several threads", "[retry][backoff]") {
    ExponentialBackoff backoff(100ms, 2.0, 60'000ms, 0.5);
    std::atomic<int> out_of_range{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 500; ++i) {
                const auto delay = backoff.next_delay(0);
                if (delay < 50ms || delay > 150ms) {
                    out_of_range.fetch_add(1);
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(out_of_range.load() == 0);
}

TEST_CASE("NoBackoff never waits", "[retry][backoff]") {
    NoBackoff backoff;
    REQUIRE(backoff.next_delay(0) == 0ms);
    REQUIRE(backoff.next_delay(5) == 0ms);
}

// ═══════════════════════════════════════════════════════════════════════════
// GatewayTransport Retry Behavior
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Transport retries 5xx and returns the eventual success", "[retry][transport]") {
    auto backoff = std::make_shared<RecordingBackoff>(1000ms, 2.0);
    MockGateway gw(test_config().with_backoff_policy(backoff));

    gw.http->queue_response(500, "");
    gw.http->queue_response(500, "");
    gw.http->queue_json_response(200, R"({"ok":true})");

    auto result = gw.transport->get("/portfolio/accounts");

    REQUIRE(result.has_value());
    REQUIRE((*result)["ok"] == true);
    REQUIRE(gw.http->request_count() == 3);
    REQUIRE(gw.transport->attempt_count() == 3);

    const auto delays = backoff->delays();
    REQUIRE(delays.size() == 2);
    REQUIRE(delays[0] == 1000ms);
    REQUIRE(delays[1] == 2000ms);
}

TEST_CASE("Transport waits between retries", "[retry][transport][timing]") {
    GatewayConfig config = test_config();
    config.backoff_policy.reset();
    config.with_retry_base_delay(40ms).with_max_retries(2);
    MockGateway gw(config);

    gw.http->queue_response(503);
    gw.http->queue_response(503);
    gw.http->queue_response(200, R"([])");

    auto result = gw.transport->get("/portfolio/accounts");
    REQUIRE(result.has_value());

    const auto requests = gw.http->requests();
    REQUIRE(requests.size() == 3);
    REQUIRE(requests[1].at - requests[0].at >= 40ms);
    REQUIRE(requests[2].at - requests[1].at >= 80ms);
}

TEST_CASE("Transport uses the default one and two second backoff", "[retry][transport][timing]") {
    GatewayConfig config = test_config();
    config.backoff_policy.reset();
    MockGateway gw(config);

    gw.http->queue_response(500);
    gw.http->queue_response(500);
    gw.http->queue_json_response(200, R"({"ok":true})");

    const auto begin = std::chrono::steady_clock::now();
    auto result = gw.transport->get("/iserver/accounts");
    const auto elapsed = std::chrono::steady_clock::now() - begin;

    REQUIRE(result.has_value());
    REQUIRE((*result)["ok"] == true);
    REQUIRE(gw.http->request_count() == 3);
    REQUIRE(elapsed >= 3000ms);
}

TEST_CASE("Transport gives up on 5xx after the retry budget", "[retry][transport]") {
    MockGateway gw(test_config().with_max_retries(3));

    gw.http->queue_response(500);
    gw.http->queue_response(502);
    gw.http->queue_response(500);
    gw.http->queue_response(503);

    auto result = gw.transport->get("/iserver/accounts");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == GatewayError::Code::ServerError);
    REQUIRE(result.error().http_status == 503);
    REQUIRE(gw.http->request_count() == 4);
}

TEST_CASE("Transport with zero retries makes one attempt", "[retry][transport]") {
    MockGateway gw(test_config().with_max_retries(0));

    gw.http->queue_response(500);
    gw.http->queue_response(200, "{}");

    auto result = gw.transport->get("/tickle");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == GatewayError::Code::ServerError);
    REQUIRE(gw.http->request_count() == 1);
}

TEST_CASE("Transport never retries auth failures", "[retry][transport]") {
    MockGateway gw;

    SECTION("401") {
        gw.http->queue_response(401, R"({"error":"not authenticated"})");
        gw.http->queue_response(200, "{}");

        auto result = gw.transport->post("/iserver/auth/status");

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == GatewayError::Code::AuthenticationRequired);
        REQUIRE(result.error().http_status == 401);
        REQUIRE(gw.http->request_count() == 1);
    }

    SECTION("403") {
        gw.http->queue_response(403);
        gw.http->queue_response(200, "{}");

        auto result = gw.transport->get("/iserver/account/orders");

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == GatewayError::Code::AccessForbidden);
        REQUIRE(gw.http->request_count() == 1);
    }
}

TEST_CASE("Transport retries network failures", "[retry][transport]") {
    MockGateway gw;

    SECTION("Recovers after a connection failure and a timeout") {
        gw.http->queue_connection_error();
        gw.http->queue_timeout();
        gw.http->queue_response(200, R"({"session":"abc"})");

        auto result = gw.transport->post("/tickle");

        REQUIRE(result.has_value());
        REQUIRE((*result)["session"] == "abc");
        REQUIRE(gw.http->request_count() == 3);
    }

    SECTION("Reports NetworkError when failures persist") {
        for (int i = 0; i < 4; ++i) {
            gw.http->queue_connection_error();
        }

        auto result = gw.transport->post("/tickle");

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == GatewayError::Code::NetworkError);
        REQUIRE_FALSE(result.error().http_status.has_value());
        REQUIRE(gw.http->request_count() == 4);
    }

    SECTION("Rejected paths are not retried") {
        gw.http->queue_error(HttpClientError::Code::InvalidRequest, "bad path");

        auto result = gw.transport->get("/../etc");

        REQUIRE_FALSE(result.has_value());
        REQUIRE(result.error().code == GatewayError::Code::InvalidRequest);
        REQUIRE(gw.http->request_count() == 1);
    }
}

TEST_CASE("Transport does not retry malformed JSON", "[retry][transport]") {
    MockGateway gw;

    gw.http->queue_response(200, R"({"authenticated": tru)");
    gw.http->queue_response(200, "{}");

    auto result = gw.transport->post("/iserver/auth/status");

    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.error().code == GatewayError::Code::ParseError);
    REQUIRE(gw.http->request_count() == 1);
}
