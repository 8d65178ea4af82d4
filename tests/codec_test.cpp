#include <catch2/catch_test_macros.hpp>

#include "mcpchat/protocol/codec.hpp"
#include "mcpchat/protocol/mcp_types.hpp"
#include "mcpchat/protocol/wire_json.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

using namespace mcpchat;

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("encode_request assigns increasing ids", "[codec]") {
    const auto first = encode_request("tools/list");
    const auto second = encode_request("tools/list");

    REQUIRE(first.id.has_value());
    REQUIRE(second.id.has_value());
    REQUIRE(*second.id > *first.id);
    REQUIRE(first.is_notification() == false);
}

TEST_CASE("encode_notification omits the id", "[codec]") {
    const auto message = encode_notification("notifications/initialized");
    const Json wire = message.to_json();

    REQUIRE(message.is_notification());
    REQUIRE(wire.contains("id") == false);
    REQUIRE(wire["jsonrpc"] == "2.0");
    REQUIRE(wire["method"] == "notifications/initialized");
    REQUIRE(wire["params"].is_object());
}

TEST_CASE("serialize produces one compact line", "[codec]") {
    const auto message = encode_request("tools/call", {{"name", "echo"}, {"arguments", {{"text", "a\nb"}}}});
    const std::string line = message.serialize();

    REQUIRE(line.find('\n') == std::string::npos);
    REQUIRE(Json::parse(line)["params"]["name"] == "echo");
}

TEST_CASE("request ids stay unique across threads", "[codec]") {
    constexpr int kThreads = 8;
    constexpr int kPerThread = 500;
    std::vector<std::vector<RequestId>> seen(kThreads);

    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&seen, t] {
            RequestId last = 0;
            for (int i = 0; i < kPerThread; ++i) {
                const RequestId id = next_request_id();
                REQUIRE(id > last);
                last = id;
                seen[t].push_back(id);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    std::vector<RequestId> all;
    for (const auto& ids : seen) {
        all.insert(all.end(), ids.begin(), ids.end());
    }
    std::sort(all.begin(), all.end());
    REQUIRE(std::adjacent_find(all.begin(), all.end()) == all.end());
    REQUIRE(all.front() >= 1);
}

TEST_CASE("encode_error builds a JSON-RPC error response", "[codec]") {
    const Json response = encode_error(7, kMethodNotFound, "no such method");

    REQUIRE(response["id"] == 7);
    REQUIRE(response["error"]["code"] == -32601);
    REQUIRE(response["error"]["message"] == "no such method");
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("decode classifies results", "[codec]") {
    auto decoded = decode(R"({"jsonrpc":"2.0","id":3,"result":{"tools":[]}})");

    REQUIRE(decoded.has_value());
    REQUIRE(decoded->kind == DecodedKind::Result);
    REQUIRE(decoded->id == 3);
    REQUIRE(decoded->payload["tools"].is_array());
    REQUIRE(decoded->is_response());
}

TEST_CASE("decode classifies errors including null ids", "[codec]") {
    auto with_id = decode(R"({"jsonrpc":"2.0","id":4,"error":{"code":-32000,"message":"boom"}})");
    REQUIRE(with_id.has_value());
    REQUIRE(with_id->kind == DecodedKind::Error);
    REQUIRE(with_id->id == 4);

    auto null_id = decode(R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"parse"}})");
    REQUIRE(null_id.has_value());
    REQUIRE(null_id->kind == DecodedKind::Error);
    REQUIRE(null_id->id.has_value() == false);
}

TEST_CASE("decode classifies notifications and server requests", "[codec]") {
    auto notification = decode(R"({"jsonrpc":"2.0","method":"notifications/progress","params":{"progress":1}})");
    REQUIRE(notification.has_value());
    REQUIRE(notification->kind == DecodedKind::Notification);
    REQUIRE(notification->method == "notifications/progress");
    REQUIRE(notification->params["progress"] == 1);

    auto request = decode(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    REQUIRE(request.has_value());
    REQUIRE(request->kind == DecodedKind::Request);
    REQUIRE(request->raw_id == "srv-1");
}

TEST_CASE("decode fills in missing params", "[codec]") {
    auto decoded = decode(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");

    REQUIRE(decoded.has_value());
    REQUIRE(decoded->params.is_object());
    REQUIRE(decoded->params.empty());
}

TEST_CASE("decode accepts already-parsed JSON", "[codec]") {
    const Json message = {{"jsonrpc", "2.0"}, {"id", 9}, {"result", {{"ok", true}}}};
    auto decoded = decode(message);

    REQUIRE(decoded.has_value());
    REQUIRE(decoded->kind == DecodedKind::Result);
    REQUIRE(decoded->payload["ok"] == true);
}

TEST_CASE("decode reports malformed input without throwing", "[codec]") {
    SECTION("garbage text") {
        auto decoded = decode("{not json");
        REQUIRE(decoded.has_value() == false);
        REQUIRE(decoded.error().code == DecodeError::Code::InvalidJson);
    }
    SECTION("non-object") {
        auto decoded = decode("[1,2,3]");
        REQUIRE(decoded.has_value() == false);
        REQUIRE(decoded.error().code == DecodeError::Code::NotAnObject);
    }
    SECTION("wrong version") {
        auto decoded = decode(R"({"jsonrpc":"1.0","id":1,"result":{}})");
        REQUIRE(decoded.has_value() == false);
        REQUIRE(decoded.error().code == DecodeError::Code::InvalidVersion);
    }
    SECTION("object id") {
        auto decoded = decode(R"({"jsonrpc":"2.0","id":{"x":1},"result":{}})");
        REQUIRE(decoded.has_value() == false);
        REQUIRE(decoded.error().code == DecodeError::Code::InvalidId);
    }
    SECTION("nothing recognizable") {
        auto decoded = decode(R"({"jsonrpc":"2.0","hello":"world"})");
        REQUIRE(decoded.has_value() == false);
        REQUIRE(decoded.error().code == DecodeError::Code::Unrecognized);
    }
    SECTION("empty input") {
        REQUIRE(decode("").has_value() == false);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// MCP types
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ServerCapabilities reads an initialize result", "[codec][types]") {
    const Json result = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", {{"tools", Json::object()}, {"resources", {{"subscribe", true}}}}},
        {"serverInfo", {{"name", "files"}, {"version", "2.1"}}}
    };

    const auto caps = ServerCapabilities::from_initialize_result(result);

    REQUIRE(caps.supports_tools);
    REQUIRE(caps.supports_resources);
    REQUIRE(caps.resources_subscribe);
    REQUIRE(caps.supports_prompts == false);
    REQUIRE(caps.server_info.name == "files");
}

TEST_CASE("parse_tools_list tags tools with their server", "[codec][types]") {
    const Json result = {{"tools", Json::array({
        {{"name", "read_file"}, {"description", "Read a file"}, {"inputSchema", {{"type", "object"}}}},
        {{"name", "list_directory"}}
    })}};

    const auto tools = parse_tools_list(result, "fs");

    REQUIRE(tools.size() == 2);
    REQUIRE(tools[0].server_name == "fs");
    REQUIRE(tools[0].name == "read_file");
    REQUIRE(tools[0].input_schema["type"] == "object");
    REQUIRE(tools[1].description.empty());
}

// ─────────────────────────────────────────────────────────────────────────────
// Wire JSON
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("parse_wire_json converts every value type", "[codec][wire_json]") {
    auto parsed = parse_wire_json(
        R"({"s":"téxt","i":-7,"u":18446744073709551615,"d":1.5,"b":true,"n":null,"a":[1,{"k":[]}],"o":{}})");

    REQUIRE(parsed.has_value());
    const Json& doc = *parsed;
    REQUIRE(doc["s"] == "téxt");
    REQUIRE(doc["i"].get<std::int64_t>() == -7);
    REQUIRE(doc["u"].get<std::uint64_t>() == 18446744073709551615ULL);
    REQUIRE(doc["d"].get<double>() == 1.5);
    REQUIRE(doc["b"] == true);
    REQUIRE(doc["n"].is_null());
    REQUIRE(doc["a"][1]["k"].is_array());
    REQUIRE(doc["o"].is_object());
}

TEST_CASE("parse_wire_json accepts scalar documents", "[codec][wire_json]") {
    REQUIRE(parse_wire_json("42").value() == 42);
    REQUIRE(parse_wire_json("\"x\"").value() == "x");
}

TEST_CASE("parse_wire_json rejects malformed input", "[codec][wire_json]") {
    REQUIRE(parse_wire_json("").has_value() == false);
    REQUIRE(parse_wire_json("{\"a\":").has_value() == false);
    REQUIRE(parse_wire_json("{\"a\":1} trailing").has_value() == false);
}

TEST_CASE("parse_wire_json enforces the nesting limit", "[codec][wire_json]") {
    const std::string deep = std::string(10, '[') + std::string(10, ']');

    REQUIRE(parse_wire_json(deep, 16).has_value());

    auto rejected = parse_wire_json(deep, 4);
    REQUIRE(rejected.has_value() == false);
    REQUIRE(rejected.error().message.find("nesting") != std::string::npos);
}

TEST_CASE("wire_json_backend names a simdjson kernel", "[codec][wire_json]") {
    REQUIRE(wire_json_backend().empty() == false);
}
