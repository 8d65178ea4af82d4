#include <catch2/catch_test_macros.hpp>

#include "mcpchat/transport/sse_channel.hpp"
#include "mcpchat/transport/sse_parser.hpp"

#include <string>

using namespace mcpchat;

TEST_CASE("SseParser parses a single event", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("data: hello world\n\n");

    REQUIRE(events.has_value());
    REQUIRE(events->size() == 1);
    REQUIRE((*events)[0].data == "hello world");
    REQUIRE((*events)[0].id.has_value() == false);
    REQUIRE((*events)[0].type() == "message");
}

TEST_CASE("SseParser reads every field", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("event: endpoint\nid: 42\nretry: 1500\ndata: /message?sessionId=abc\n\n");

    REQUIRE(events->size() == 1);
    const auto& event = events->front();
    REQUIRE(event.type() == "endpoint");
    REQUIRE(event.id == "42");
    REQUIRE(event.retry == 1500u);
    REQUIRE(event.data == "/message?sessionId=abc");
}

TEST_CASE("SseParser joins multiple data lines", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("data: {\"a\":\ndata: 1}\n\n");

    REQUIRE(events->front().data == "{\"a\":\n1}");
}

TEST_CASE("SseParser holds partial lines across chunks", "[sse][parser]") {
    SseParser parser;

    REQUIRE(parser.feed("data: {\"jsonrpc\":")->empty());
    REQUIRE(parser.buffer_size() > 0);
    REQUIRE(parser.feed("\"2.0\",\"id\":1}")->empty());
    REQUIRE(parser.feed("\n")->empty());

    auto events = parser.feed("\n");
    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data == R"({"jsonrpc":"2.0","id":1})");
    REQUIRE(parser.buffer_size() == 0);
}

TEST_CASE("SseParser accepts CRLF line endings", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("event: message\r\ndata: x\r\n\r\n");

    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data == "x");
    REQUIRE(events->front().type() == "message");
}

TEST_CASE("SseParser skips comments and events without data", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed(": keep-alive\n\nevent: ping\n\ndata: real\n\n");

    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data == "real");
}

TEST_CASE("SseParser keeps empty data", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("data:\n\n");

    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data.empty());
}

TEST_CASE("SseParser returns several events from one chunk", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("data: one\n\ndata: two\n\ndata: thr");

    REQUIRE(events->size() == 2);
    REQUIRE((*events)[1].data == "two");
    REQUIRE(parser.feed("ee\n\n")->front().data == "three");
}

TEST_CASE("SseParser ignores a malformed retry", "[sse][parser]") {
    SseParser parser;

    auto events = parser.feed("retry: soon\ndata: x\n\n");

    REQUIRE(events->front().retry.has_value() == false);
}

TEST_CASE("SseParser rejects unterminated lines past the buffer limit", "[sse][parser]") {
    SseParserConfig config;
    config.max_buffer_size = 64;
    SseParser parser(config);

    REQUIRE(parser.feed("data: " + std::string(40, 'a')).has_value());
    auto overflow = parser.feed(std::string(40, 'b'));

    REQUIRE(overflow.has_value() == false);
    REQUIRE(overflow.error().limit == 64);
    REQUIRE(overflow.error().buffered > 64);
    REQUIRE(parser.buffer_size() == 0);

    // The parser recovers after the reset.
    auto events = parser.feed("data: ok\n\n");
    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data == "ok");
}

TEST_CASE("SseParser drops events larger than max_event_size", "[sse][parser]") {
    SseParserConfig config;
    config.max_event_size = 8;
    SseParser parser(config);

    auto events = parser.feed("data: way too large\n\ndata: small\n\n");

    REQUIRE(events->size() == 1);
    REQUIRE(events->front().data == "small");
}

// ═══════════════════════════════════════════════════════════════════════════
// Endpoint resolution
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SseChannel strips trailing slashes from the base URL", "[sse][channel]") {
    REQUIRE(SseChannel::normalize_base_url("http://localhost:8080/") == "http://localhost:8080");
    REQUIRE(SseChannel::normalize_base_url("http://host/mcp//") == "http://host/mcp");
    REQUIRE(SseChannel::normalize_base_url("http://host") == "http://host");
}

TEST_CASE("SseChannel resolves endpoint events against the base URL", "[sse][channel]") {
    const std::string base = "http://localhost:8080/mcp";

    SECTION("absolute URL is used as is") {
        REQUIRE(SseChannel::resolve_endpoint(base, "https://other/post") == "https://other/post");
    }

    SECTION("absolute path keeps only the origin") {
        REQUIRE(SseChannel::resolve_endpoint(base, "/message?sessionId=7")
                == "http://localhost:8080/message?sessionId=7");
    }

    SECTION("relative path is appended") {
        REQUIRE(SseChannel::resolve_endpoint(base, "message") == "http://localhost:8080/mcp/message");
    }
}

TEST_CASE("SseChannel posts to /message until an endpoint arrives", "[sse][channel]") {
    SseServerConfig config;
    config.url = "http://localhost:9/";
    SseChannel channel(config);

    REQUIRE(channel.endpoint_url() == "http://localhost:9/message");
    REQUIRE(channel.is_open() == false);
}
