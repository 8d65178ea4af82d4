#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Transport Contract
// ═══════════════════════════════════════════════════════════════════════════
// What the rest of the system needs from a tool-server connection. The
// registry only ever sees IServerConnector and IServerConnection; the stdio
// and SSE implementations live behind them.

#include "mcpchat/protocol/mcp_types.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace mcpchat {

using Json = nlohmann::json;
using HeaderMap = std::unordered_map<std::string, std::string>;

// ─────────────────────────────────────────────────────────────────────────────
// Errors
// ─────────────────────────────────────────────────────────────────────────────

struct TransportError {
    enum class Category {
        Network,    // spawn, pipe, socket or HTTP failure
        Timeout,    // no reply within the request timeout
        Protocol,   // malformed or unexpected message, handshake mismatch
        Rpc,        // the server answered with a JSON-RPC error
        Closed      // the connection is gone
    };

    Category category{Category::Network};
    std::string message;
    std::optional<int> status_code{};   // HTTP status, when there is one
    std::optional<int> rpc_code{};      // JSON-RPC error code, when Category::Rpc

    [[nodiscard]] static TransportError network(std::string msg) {
        return {Category::Network, std::move(msg)};
    }
    [[nodiscard]] static TransportError timeout(std::string msg) {
        return {Category::Timeout, std::move(msg)};
    }
    [[nodiscard]] static TransportError protocol(std::string msg) {
        return {Category::Protocol, std::move(msg)};
    }
    [[nodiscard]] static TransportError rpc(int code, std::string msg) {
        return {Category::Rpc, std::move(msg), std::nullopt, code};
    }
    [[nodiscard]] static TransportError closed(std::string msg = "connection closed") {
        return {Category::Closed, std::move(msg)};
    }
    [[nodiscard]] static TransportError http(int status, std::string msg) {
        return {Category::Network, std::move(msg), status};
    }

    [[nodiscard]] std::string describe() const;
};

[[nodiscard]] constexpr std::string_view to_string(TransportError::Category category) noexcept {
    switch (category) {
        case TransportError::Category::Network:  return "network";
        case TransportError::Category::Timeout:  return "timeout";
        case TransportError::Category::Protocol: return "protocol";
        case TransportError::Category::Rpc:      return "rpc";
        case TransportError::Category::Closed:   return "closed";
    }
    return "unknown";
}

template <typename T>
using TransportResult = tl::expected<T, TransportError>;

// ─────────────────────────────────────────────────────────────────────────────
// Server Configuration
// ─────────────────────────────────────────────────────────────────────────────

/// Local subprocess speaking line-delimited JSON-RPC on stdin/stdout.
struct StdioServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;   // merged over the parent environment
    std::size_t max_message_size{4 << 20};
};

/// Remote server: event stream at `{url}/sse`, requests POSTed to `{url}/message`.
struct SseServerConfig {
    std::string url;
    HeaderMap headers;
    std::chrono::milliseconds connect_timeout{10'000};
    bool verify_ssl{true};
};

struct ServerConfig {
    std::variant<StdioServerConfig, SseServerConfig> transport;
    std::chrono::milliseconds request_timeout{30'000};
    bool auto_connect{true};

    [[nodiscard]] bool is_stdio() const noexcept {
        return std::holds_alternative<StdioServerConfig>(transport);
    }

    /// "stdio: cmd arg..." or "sse: url", for listings and logs.
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] static ServerConfig stdio(std::string command, std::vector<std::string> args = {}) {
        ServerConfig config;
        config.transport = StdioServerConfig{std::move(command), std::move(args), {}};
        return config;
    }

    [[nodiscard]] static ServerConfig sse(std::string url) {
        ServerConfig config;
        SseServerConfig sse_config;
        sse_config.url = std::move(url);
        config.transport = std::move(sse_config);
        return config;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Connection Handle
// ─────────────────────────────────────────────────────────────────────────────

/// Callbacks a connection raises out-of-band. Both may run on a transport
/// thread and must not block on the connection that raised them.
struct ConnectionCallbacks {
    std::function<void(const std::string& method, const Json& params)> on_notification;
    std::function<void(const std::string& reason)> on_closed;
};

/// A live, initialized session with one tool server. All calls are
/// synchronous and bounded by the server's request timeout.
class IServerConnection {
public:
    virtual ~IServerConnection() = default;

    [[nodiscard]] virtual TransportResult<std::vector<ToolInfo>> list_tools() = 0;
    [[nodiscard]] virtual TransportResult<Json> call_tool(const std::string& name, const Json& arguments) = 0;

    [[nodiscard]] virtual TransportResult<std::vector<ResourceInfo>> list_resources() = 0;
    [[nodiscard]] virtual TransportResult<Json> read_resource(const std::string& uri) = 0;
    [[nodiscard]] virtual TransportResult<void> subscribe_resource(const std::string& uri) = 0;

    [[nodiscard]] virtual TransportResult<std::vector<PromptInfo>> list_prompts() = 0;
    [[nodiscard]] virtual TransportResult<Json> get_prompt(const std::string& name, const Json& arguments) = 0;

    /// What the server advertised during the handshake.
    [[nodiscard]] virtual const ServerCapabilities& capabilities() const noexcept = 0;

    [[nodiscard]] virtual bool is_alive() const noexcept = 0;

    /// Idempotent. Pending requests fail with Category::Closed.
    virtual void disconnect() = 0;
};

using ConnectionHandle = std::shared_ptr<IServerConnection>;

/// Creates connections from configuration.
class IServerConnector {
public:
    virtual ~IServerConnector() = default;

    [[nodiscard]] virtual TransportResult<ConnectionHandle> connect(
        const std::string& server_name,
        const ServerConfig& config,
        ConnectionCallbacks callbacks
    ) = 0;
};

}  // namespace mcpchat
