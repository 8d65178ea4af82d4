#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Wire JSON - inbound parsing with simdjson
// ─────────────────────────────────────────────────────────────────────────────
// Everything a server sends (stdio lines, SSE payloads) goes through
// simdjson's on-demand parser and comes out as nlohmann::json, which the rest
// of the code builds and inspects. Outgoing messages are serialized with
// nlohmann directly.

#include <cstddef>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace mcpchat {

using Json = nlohmann::json;

struct WireJsonError {
    std::string message;
};

using WireJsonResult = tl::expected<Json, WireJsonError>;

/// Nesting deeper than this is rejected rather than recursed into.
inline constexpr std::size_t kMaxWireJsonDepth = 64;

/// Parses one complete JSON document. Trailing content is an error.
/// Uses a per-thread parser; safe from any thread.
[[nodiscard]] WireJsonResult parse_wire_json(std::string_view text, std::size_t max_depth = kMaxWireJsonDepth);

/// Name of the simdjson kernel selected for this CPU ("haswell", "fallback", ...).
[[nodiscard]] std::string wire_json_backend();

}  // namespace mcpchat
