#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Response body decoding
// ─────────────────────────────────────────────────────────────────────────────
// Gateway responses are parsed with simdjson's on-demand API and materialised
// as nlohmann::json, which is what adapters work with. Outgoing bodies are
// built and serialised with nlohmann directly.

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace ibcp {

using Json = nlohmann::json;

struct JsonDecodeError {
    std::string message;
};

using JsonDecodeResult = tl::expected<Json, JsonDecodeError>;

class JsonDecoder {
public:
    static constexpr std::size_t kDefaultMaxDepth = 64;

    JsonDecoder() = default;
    explicit JsonDecoder(std::size_t max_depth) : max_depth_(max_depth) {}

    /// Parse a complete JSON document. Not safe to share between threads.
    [[nodiscard]] JsonDecodeResult decode(std::string_view text);

    [[nodiscard]] std::size_t max_depth() const noexcept { return max_depth_; }

private:
    [[nodiscard]] JsonDecodeResult to_json(simdjson::ondemand::value value, std::size_t depth);

    simdjson::ondemand::parser parser_;
    std::size_t max_depth_{kDefaultMaxDepth};
};

/// Decode an HTTP response body. An empty (or whitespace-only) body is an
/// empty object, since the gateway answers several POSTs with no content.
[[nodiscard]] JsonDecodeResult decode_response_body(std::string_view body);

}  // namespace ibcp
