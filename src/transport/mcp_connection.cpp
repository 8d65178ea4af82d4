#include "mcpchat/transport/mcp_connection.hpp"
#include "mcpchat/log/logger.hpp"
#include "mcpchat/transport/sse_channel.hpp"
#include "mcpchat/transport/stdio_channel.hpp"

namespace mcpchat {

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

McpConnection::McpConnection(
    std::string server_name,
    std::unique_ptr<IMessageChannel> channel,
    std::chrono::milliseconds request_timeout,
    ConnectionCallbacks callbacks
)
    : server_name_(std::move(server_name))
    , channel_(std::move(channel))
    , session_(*channel_, request_timeout)
    , callbacks_(std::move(callbacks))
{}

McpConnection::~McpConnection() {
    disconnect();
}

TransportResult<std::shared_ptr<McpConnection>> McpConnection::establish(
    std::string server_name,
    std::unique_ptr<IMessageChannel> channel,
    std::chrono::milliseconds request_timeout,
    ConnectionCallbacks callbacks
) {
    auto connection = std::make_shared<McpConnection>(
        std::move(server_name), std::move(channel), request_timeout, std::move(callbacks));

    auto started = connection->start();
    if (started.has_value() == false) {
        connection->disconnect();
        return tl::unexpected(started.error());
    }
    return connection;
}

TransportResult<void> McpConnection::start() {
    session_.set_notification_handler([this](const std::string& method, const Json& params) {
        if (callbacks_.on_notification) {
            callbacks_.on_notification(method, params);
        }
    });

    auto opened = channel_->open(
        [this](const Json& message) { session_.handle_incoming(message); },
        [this](const std::string& reason) { on_channel_closed(reason); }
    );
    if (opened.has_value() == false) {
        return opened;
    }
    return initialize();
}

TransportResult<void> McpConnection::initialize() {
    const Json params = {
        {"protocolVersion", MCP_PROTOCOL_VERSION},
        {"capabilities", Json::object()},
        {"clientInfo", {{"name", CLIENT_NAME}, {"version", CLIENT_VERSION}}}
    };

    auto result = session_.request("initialize", params);
    if (result.has_value() == false) {
        return tl::unexpected(result.error());
    }
    if (result->is_object() == false) {
        return tl::unexpected(TransportError::protocol("initialize result is not an object"));
    }

    capabilities_ = ServerCapabilities::from_initialize_result(*result);
    get_logger().debug_fmt("Server '{}' is {} {} (protocol {})",
                           server_name_,
                           capabilities_.server_info.name,
                           capabilities_.server_info.version,
                           capabilities_.server_info.protocol_version);

    return session_.notify("notifications/initialized");
}

void McpConnection::on_channel_closed(const std::string& reason) {
    session_.fail_all(TransportError::closed(reason));
    if (disconnected_.exchange(true) == false && callbacks_.on_closed) {
        // Copy first: the callback may drop the last reference to us.
        auto on_closed = callbacks_.on_closed;
        on_closed(reason);
    }
}

bool McpConnection::is_alive() const noexcept {
    return disconnected_.load() == false && channel_->is_open();
}

void McpConnection::disconnect() {
    disconnected_.store(true);
    session_.fail_all(TransportError::closed("disconnected"));
    channel_->close();
}

// ─────────────────────────────────────────────────────────────────────────────
// MCP Operations
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<std::vector<ToolInfo>> McpConnection::list_tools() {
    return session_.request("tools/list").map([this](const Json& result) {
        return parse_tools_list(result, server_name_);
    });
}

TransportResult<Json> McpConnection::call_tool(const std::string& name, const Json& arguments) {
    return session_.request("tools/call", {{"name", name}, {"arguments", arguments}});
}

TransportResult<std::vector<ResourceInfo>> McpConnection::list_resources() {
    return session_.request("resources/list").map([this](const Json& result) {
        return parse_resources_list(result, server_name_);
    });
}

TransportResult<Json> McpConnection::read_resource(const std::string& uri) {
    return session_.request("resources/read", {{"uri", uri}});
}

TransportResult<void> McpConnection::subscribe_resource(const std::string& uri) {
    auto result = session_.request("resources/subscribe", {{"uri", uri}});
    if (result.has_value() == false) {
        return tl::unexpected(result.error());
    }
    return {};
}

TransportResult<std::vector<PromptInfo>> McpConnection::list_prompts() {
    return session_.request("prompts/list").map([this](const Json& result) {
        return parse_prompts_list(result, server_name_);
    });
}

TransportResult<Json> McpConnection::get_prompt(const std::string& name, const Json& arguments) {
    return session_.request("prompts/get", {{"name", name}, {"arguments", arguments}});
}

// ─────────────────────────────────────────────────────────────────────────────
// McpConnector
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<ConnectionHandle> McpConnector::connect(
    const std::string& server_name,
    const ServerConfig& config,
    ConnectionCallbacks callbacks
) {
    std::unique_ptr<IMessageChannel> channel;
    if (const auto* stdio_config = std::get_if<StdioServerConfig>(&config.transport)) {
        channel = std::make_unique<StdioChannel>(*stdio_config);
    } else {
        channel = std::make_unique<SseChannel>(std::get<SseServerConfig>(config.transport));
    }

    get_logger().debug_fmt("Connecting to '{}' ({})", server_name, config.describe());

    auto connection = McpConnection::establish(
        server_name, std::move(channel), config.request_timeout, std::move(callbacks));
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }
    return ConnectionHandle(std::move(*connection));
}

}  // namespace mcpchat
