#include <catch2/catch_test_macros.hpp>

#include "mcpchat/transport/mcp_connection.hpp"
#include "mcpchat/transport/stdio_channel.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace mcpchat;
using namespace std::chrono_literals;

namespace {

// A one-line MCP server: answers every request with an initialize result.
StdioServerConfig sed_server() {
    StdioServerConfig config;
    config.command = "sed";
    config.args = {
        "-u", "-n",
        R"(s/.*"id":\([0-9]*\).*/{"jsonrpc":"2.0","id":\1,"result":{"protocolVersion":"2024-11-05","capabilities":{"tools":{}},"serverInfo":{"name":"sed","version":"1"}}}/p)"
    };
    return config;
}

}  // namespace

TEST_CASE("is_safe_command rejects shell metacharacters", "[stdio]") {
    REQUIRE(StdioChannel::is_safe_command("npx"));
    REQUIRE(StdioChannel::is_safe_command("/usr/local/bin/mcp-server-fs"));

    REQUIRE(StdioChannel::is_safe_command("") == false);
    REQUIRE(StdioChannel::is_safe_command("rm -rf /; echo") == false);
    REQUIRE(StdioChannel::is_safe_command("cat | sh") == false);
    REQUIRE(StdioChannel::is_safe_command("$(whoami)") == false);
    REQUIRE(StdioChannel::is_safe_command("a`b`") == false);
}

TEST_CASE("Opening an unsafe command fails without spawning", "[stdio]") {
    StdioServerConfig config;
    config.command = "echo;reboot";
    StdioChannel channel(config);

    auto opened = channel.open([](const Json&) {}, [](const std::string&) {});

    REQUIRE(opened.has_value() == false);
    REQUIRE(channel.is_open() == false);
    REQUIRE(channel.pid() == -1);
}

TEST_CASE("A subprocess server completes the handshake", "[stdio][integration]") {
    auto connection = McpConnection::establish(
        "sed", std::make_unique<StdioChannel>(sed_server()), 5000ms, {});

    REQUIRE(connection.has_value());
    REQUIRE((*connection)->is_alive());
    REQUIRE((*connection)->capabilities().server_info.name == "sed");
    REQUIRE((*connection)->capabilities().supports_tools);

    // Any request gets an answer, so tools/list resolves with no tools.
    auto tools = (*connection)->list_tools();
    REQUIRE(tools.has_value());
    REQUIRE(tools->empty());

    (*connection)->disconnect();
    REQUIRE((*connection)->is_alive() == false);
}

TEST_CASE("A throwing message handler does not stop the reader", "[stdio][integration]") {
    StdioServerConfig config;
    config.command = "printf";
    config.args = {R"({"jsonrpc":"2.0","method":"a"}\n{"jsonrpc":"2.0","method":"b"}\n)"};
    StdioChannel channel(config);

    std::atomic<int> seen{0};
    std::atomic<bool> closed{false};
    auto opened = channel.open(
        [&seen](const Json&) {
            if (++seen == 1) {
                throw std::runtime_error("handler failed");
            }
        },
        [&closed](const std::string&) { closed = true; });
    REQUIRE(opened.has_value());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while ((seen.load() < 2 || closed.load() == false) && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }
    REQUIRE(seen.load() == 2);
    REQUIRE(closed.load());
}

TEST_CASE("A subprocess that exits before answering fails the handshake", "[stdio][integration]") {
    StdioServerConfig config;
    config.command = "true";

    auto connection = McpConnection::establish(
        "true", std::make_unique<StdioChannel>(config), 2000ms, {});

    REQUIRE(connection.has_value() == false);
    REQUIRE(connection.error().category != TransportError::Category::Rpc);
}

TEST_CASE("A missing executable fails to connect", "[stdio][integration]") {
    StdioServerConfig config;
    config.command = "mcpchat-no-such-server";

    auto connection = McpConnection::establish(
        "missing", std::make_unique<StdioChannel>(config), 2000ms, {});

    REQUIRE(connection.has_value() == false);
}

TEST_CASE("The connector picks the stdio channel from config", "[stdio][integration]") {
    McpConnector connector;
    ServerConfig config;
    config.transport = sed_server();
    config.request_timeout = 5000ms;

    auto connection = connector.connect("sed", config, {});

    REQUIRE(connection.has_value());
    REQUIRE((*connection)->capabilities().server_info.name == "sed");
    (*connection)->disconnect();
}
