#pragma once

#include "mcpchat/transport/message_channel.hpp"
#include "mcpchat/transport/rpc_session.hpp"
#include "mcpchat/transport/transport.hpp"

#include <atomic>
#include <memory>
#include <string>

namespace mcpchat {

// ═══════════════════════════════════════════════════════════════════════════
// McpConnection
// ═══════════════════════════════════════════════════════════════════════════
// An initialized MCP session over any IMessageChannel. Owns the channel;
// destroying the connection closes it.

class McpConnection final : public IServerConnection {
public:
    /// Opens the channel, performs the initialize handshake and sends
    /// notifications/initialized. On failure the channel is closed.
    [[nodiscard]] static TransportResult<std::shared_ptr<McpConnection>> establish(
        std::string server_name,
        std::unique_ptr<IMessageChannel> channel,
        std::chrono::milliseconds request_timeout,
        ConnectionCallbacks callbacks
    );

    McpConnection(
        std::string server_name,
        std::unique_ptr<IMessageChannel> channel,
        std::chrono::milliseconds request_timeout,
        ConnectionCallbacks callbacks
    );
    ~McpConnection() override;

    McpConnection(const McpConnection&) = delete;
    McpConnection& operator=(const McpConnection&) = delete;

    [[nodiscard]] TransportResult<std::vector<ToolInfo>> list_tools() override;
    [[nodiscard]] TransportResult<Json> call_tool(const std::string& name, const Json& arguments) override;

    [[nodiscard]] TransportResult<std::vector<ResourceInfo>> list_resources() override;
    [[nodiscard]] TransportResult<Json> read_resource(const std::string& uri) override;
    [[nodiscard]] TransportResult<void> subscribe_resource(const std::string& uri) override;

    [[nodiscard]] TransportResult<std::vector<PromptInfo>> list_prompts() override;
    [[nodiscard]] TransportResult<Json> get_prompt(const std::string& name, const Json& arguments) override;

    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept override { return capabilities_; }
    [[nodiscard]] bool is_alive() const noexcept override;
    void disconnect() override;

    [[nodiscard]] const std::string& server_name() const noexcept { return server_name_; }

private:
    [[nodiscard]] TransportResult<void> start();
    [[nodiscard]] TransportResult<void> initialize();
    void on_channel_closed(const std::string& reason);

    std::string server_name_;
    std::unique_ptr<IMessageChannel> channel_;
    RpcSession session_;
    ConnectionCallbacks callbacks_;
    ServerCapabilities capabilities_;
    std::atomic<bool> disconnected_{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// McpConnector
// ═══════════════════════════════════════════════════════════════════════════
// Picks StdioChannel or SseChannel from the server configuration.

class McpConnector final : public IServerConnector {
public:
    [[nodiscard]] TransportResult<ConnectionHandle> connect(
        const std::string& server_name,
        const ServerConfig& config,
        ConnectionCallbacks callbacks
    ) override;
};

}  // namespace mcpchat
