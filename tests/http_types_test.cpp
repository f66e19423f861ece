#include <catch2/catch_test_macros.hpp>

#include "ibcp/transport/http_types.hpp"

using namespace ibcp;

TEST_CASE("parse_url splits a gateway base URL", "[http][url]") {
    const auto url = parse_url("https://localhost:5000/v1/api");

    REQUIRE(url.has_value());
    REQUIRE(url->scheme == "https");
    REQUIRE(url->host == "localhost");
    REQUIRE(url->port == 5000);
    REQUIRE(url->path == "/v1/api");
    REQUIRE(url->is_secure());
    REQUIRE(url->origin() == "https://localhost:5000");
    REQUIRE(url->base() == "https://localhost:5000/v1/api");
}

TEST_CASE("parse_url applies default ports and strips trailing slashes", "[http][url]") {
    const auto https = parse_url("https://gateway.example.com/v1/api/");
    REQUIRE(https.has_value());
    REQUIRE(https->port == 443);
    REQUIRE(https->path == "/v1/api");

    const auto http = parse_url("http://127.0.0.1");
    REQUIRE(http.has_value());
    REQUIRE(http->port == 80);
    REQUIRE(http->path.empty());
    REQUIRE(http->base() == "http://127.0.0.1:80");
}

TEST_CASE("parse_url rejects unusable base URLs", "[http][url]") {
    REQUIRE_FALSE(parse_url("").has_value());
    REQUIRE_FALSE(parse_url("localhost:5000").has_value());
    REQUIRE_FALSE(parse_url("ftp://localhost/v1/api").has_value());
    REQUIRE_FALSE(parse_url("https://localhost:5000/v1/api?x=1").has_value());
    REQUIRE_FALSE(parse_url("https://localhost:5000/v1/api#frag").has_value());
}

TEST_CASE("get_header is case-insensitive", "[http]") {
    HeaderMap headers{{"Content-Type", "application/json"}};

    REQUIRE(get_header(headers, "content-type") == "application/json");
    REQUIRE(get_header(headers, "CONTENT-TYPE") == "application/json");
    REQUIRE_FALSE(get_header(headers, "Accept").has_value());
}

TEST_CASE("HttpMethod names", "[http]") {
    REQUIRE(to_string(HttpMethod::Get) == "GET");
    REQUIRE(to_string(HttpMethod::Post) == "POST");
    REQUIRE(to_string(HttpMethod::Delete) == "DELETE");
}
