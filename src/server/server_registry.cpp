#include "mcpchat/server/server_registry.hpp"
#include "mcpchat/log/logger.hpp"

#include <chrono>
#include <optional>

namespace mcpchat {

// Identifies which connection a callback belongs to. Filled in once the
// connector returns; callbacks may fire from a transport thread.
struct ServerRegistry::ConnectionSlot {
    std::mutex mutex;
    const IServerConnection* connection{nullptr};

    void set(const IServerConnection* value) {
        std::lock_guard<std::mutex> lock(mutex);
        connection = value;
    }

    [[nodiscard]] const IServerConnection* get() {
        std::lock_guard<std::mutex> lock(mutex);
        return connection;
    }
};

ServerRegistry::ServerRegistry(std::shared_ptr<IServerConnector> connector)
    : connector_(std::move(connector))
{}

ServerRegistry::~ServerRegistry() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        establishing_done_.wait(lock, [this] { return establishing_ == 0; });
    }
    disconnect_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────────────────────────────────────

ServerResult<void> ServerRegistry::register_server(const std::string& name, ServerConfig config) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (servers_.contains(name)) {
        return tl::unexpected(ServerError::already_registered(name));
    }
    servers_.emplace(name, Server(name, std::move(config)));
    get_logger().debug_fmt("Registered server '{}'", name);
    return {};
}

ServerResult<EstablishedConnection> ServerRegistry::establish_connection(
    const std::string& name,
    const AcceptConnection& accept
) {
    ServerConfig config;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        if (it == servers_.end()) {
            return tl::unexpected(ServerError::not_found(name));
        }
        config = it->second.config();
        establishing_ += 1;
    }

    struct Finished {
        ServerRegistry& registry;
        ~Finished() {
            std::lock_guard<std::mutex> lock(registry.mutex_);
            registry.establishing_ -= 1;
            registry.establishing_done_.notify_all();
        }
    } finished{*this};

    auto slot = std::make_shared<ConnectionSlot>();
    ConnectionCallbacks callbacks;
    callbacks.on_notification = [this, name, slot](const std::string& method, const Json& params) {
        on_notification(name, slot->get(), method, params);
    };
    callbacks.on_closed = [this, name, slot](const std::string& reason) {
        on_connection_closed(name, slot->get(), reason);
    };

    auto connected = connector_->connect(name, config, std::move(callbacks));
    if (connected.has_value() == false) {
        return tl::unexpected(ServerError::from_transport(connected.error()));
    }

    ConnectionHandle connection = std::move(*connected);
    slot->set(connection.get());

    ServerCapabilities capabilities = discover(name, *connection);
    if (accept && accept(connection) == false) {
        get_logger().debug_fmt("Closing unwanted connection to '{}'", name);
        connection->disconnect();
        return tl::unexpected(ServerError::abandoned(name));
    }
    return EstablishedConnection{std::move(connection), std::move(capabilities)};
}

ServerCapabilities ServerRegistry::discover(const std::string& name, IServerConnection& connection) const {
    ServerCapabilities capabilities = connection.capabilities();

    if (capabilities.supports_tools == true) {
        auto tools = connection.list_tools();
        if (tools.has_value()) {
            capabilities.tools = std::move(*tools);
        } else {
            get_logger().warn_fmt("Tool discovery on '{}' failed: {}", name, tools.error().message);
        }
    }
    if (capabilities.supports_resources == true) {
        auto resources = connection.list_resources();
        if (resources.has_value()) {
            capabilities.resources = std::move(*resources);
        } else {
            get_logger().warn_fmt("Resource discovery on '{}' failed: {}", name, resources.error().message);
        }
    }
    if (capabilities.supports_prompts == true) {
        auto prompts = connection.list_prompts();
        if (prompts.has_value()) {
            capabilities.prompts = std::move(*prompts);
        } else {
            get_logger().warn_fmt("Prompt discovery on '{}' failed: {}", name, prompts.error().message);
        }
    }

    get_logger().debug_fmt("Server '{}' offers {} tools, {} resources, {} prompts",
                           name, capabilities.tools.size(), capabilities.resources.size(),
                           capabilities.prompts.size());
    return capabilities;
}

ServerResult<void> ServerRegistry::connect_server(const std::string& name) {
    auto established = establish_connection(name);
    if (established.has_value() == false) {
        if (established.error().code == ServerErrorCode::Transport) {
            (void)mark_failed(name, established.error().message);
        }
        return tl::unexpected(established.error());
    }

    ConnectionHandle connection = established->connection;
    auto marked = mark_connected(name, connection, std::move(established->capabilities));
    if (marked.has_value() == false) {
        get_logger().debug_fmt("Discarding late connection to '{}': {}", name, marked.error().message);
        connection->disconnect();
        return marked;
    }
    return {};
}

ServerResult<void> ServerRegistry::mark_connected(
    const std::string& name,
    ConnectionHandle connection,
    ServerCapabilities capabilities
) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    auto marked = it->second.mark_connected(std::move(connection), std::move(capabilities));
    if (marked.has_value()) {
        get_logger().info_fmt("Server '{}' connected", name);
    }
    return marked;
}

ServerResult<void> ServerRegistry::mark_failed(const std::string& name, std::string error) {
    ConnectionHandle dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        if (it == servers_.end()) {
            return tl::unexpected(ServerError::not_found(name));
        }
        dropped = it->second.connection();
        auto marked = it->second.mark_failed(error);
        if (marked.has_value() == false) {
            return marked;
        }
    }
    get_logger().warn_fmt("Server '{}' failed: {}", name, error);
    if (dropped != nullptr) {
        dropped->disconnect();
    }
    return {};
}

ServerResult<void> ServerRegistry::mark_disconnected(const std::string& name) {
    ConnectionHandle dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        if (it == servers_.end()) {
            return tl::unexpected(ServerError::not_found(name));
        }
        dropped = it->second.connection();
        auto marked = it->second.mark_disconnected();
        if (marked.has_value() == false) {
            return marked;
        }
    }
    get_logger().info_fmt("Server '{}' disconnected", name);
    if (dropped != nullptr) {
        dropped->disconnect();
    }
    return {};
}

ServerResult<void> ServerRegistry::remove_server(const std::string& name) {
    ConnectionHandle dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        if (it == servers_.end()) {
            return tl::unexpected(ServerError::not_found(name));
        }
        dropped = it->second.connection();
        servers_.erase(it);
    }
    if (dropped != nullptr) {
        dropped->disconnect();
    }
    get_logger().info_fmt("Removed server '{}'", name);
    return {};
}

ServerResult<void> ServerRegistry::reconnect_server(const std::string& name) {
    ConnectionHandle dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        if (it == servers_.end()) {
            return tl::unexpected(ServerError::not_found(name));
        }
        dropped = it->second.connection();
        ServerConfig config = it->second.config();
        it->second = Server(name, std::move(config));
    }
    if (dropped != nullptr) {
        dropped->disconnect();
    }
    get_logger().info_fmt("Reconnecting server '{}'", name);
    return connect_server(name);
}

void ServerRegistry::disconnect_all() {
    std::vector<ConnectionHandle> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [name, server] : servers_) {
            if (server.connection() != nullptr) {
                dropped.push_back(server.connection());
                (void)server.mark_disconnected();
            }
        }
    }
    for (auto& connection : dropped) {
        connection->disconnect();
    }
}

void ServerRegistry::on_connection_closed(
    const std::string& name,
    const IServerConnection* closed,
    const std::string& reason
) {
    ConnectionHandle dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        if (it == servers_.end() || closed == nullptr) {
            return;
        }
        // A stale connection from an earlier lifecycle must not touch the
        // current record.
        if (it->second.connection().get() != closed) {
            return;
        }
        dropped = it->second.connection();
        (void)it->second.mark_disconnected();
    }
    get_logger().warn_fmt("Lost connection to '{}': {}", name, reason);
    // `dropped` may hold the last reference; it is released here, outside
    // the lock.
}

void ServerRegistry::on_notification(
    const std::string& name,
    const IServerConnection* source,
    const std::string& method,
    const Json& params
) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        // Only the server's current connection speaks for it.
        if (it == servers_.end() || source == nullptr || it->second.connection().get() != source) {
            get_logger().trace_fmt("Dropping {} from a connection '{}' no longer uses", method, name);
            return;
        }
    }

    NotificationSink sink;
    {
        std::lock_guard<std::mutex> lock(sink_mutex_);
        sink = sink_;
    }
    if (sink) {
        sink(name, method, params);
    }
}

void ServerRegistry::set_notification_sink(NotificationSink sink) {
    std::lock_guard<std::mutex> lock(sink_mutex_);
    sink_ = std::move(sink);
}

void ServerRegistry::set_lazy_connect(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    lazy_connect_ = enabled;
}

bool ServerRegistry::lazy_connect() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lazy_connect_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────────────────────────────────────

ServerResult<void> ServerRegistry::record_success(const std::string& name, Millis duration) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    it->second.record_success(duration);
    return {};
}

ServerResult<void> ServerRegistry::record_failure(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    it->second.record_failure();
    return {};
}

ServerResult<HealthStatus> ServerRegistry::health_status(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    return it->second.health_status();
}

ServerResult<void> ServerRegistry::disable_server(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    it->second.set_disabled(true);
    return {};
}

ServerResult<void> ServerRegistry::enable_server(const std::string& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    it->second.set_disabled(false);
    return {};
}

ServerResult<void> ServerRegistry::probe(const std::string& name) {
    auto connection = routable_connection(name, Routing::IncludeDisabled);
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }

    auto probed = probe_connection(**connection);
    if (probed.has_value() == false) {
        return tl::unexpected(ServerError::from_transport(probed.error()));
    }
    return {};
}

TransportResult<void> ServerRegistry::probe_connection(IServerConnection& connection) {
    auto listed = connection.list_tools();
    if (listed.has_value() == false && listed.error().category != TransportError::Category::Rpc) {
        return tl::unexpected(listed.error());
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Routed Operations
// ─────────────────────────────────────────────────────────────────────────────

ServerResult<ConnectionHandle> ServerRegistry::routable_connection(const std::string& name, Routing routing) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    const Server& server = it->second;
    if (server.is_connected() == false) {
        return tl::unexpected(ServerError::not_connected(name));
    }
    if (routing == Routing::ActiveOnly && server.disabled() == true) {
        return tl::unexpected(ServerError::disabled(name));
    }
    return server.connection();
}

ServerResult<ConnectionHandle> ServerRegistry::connection_for(const std::string& name, Routing routing) {
    bool never_attempted = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = servers_.find(name);
        never_attempted = lazy_connect_ && it != servers_.end() && it->second.status() == ServerStatus::Connecting;
    }
    if (never_attempted) {
        auto connected = connect_on_demand(name);
        if (connected.has_value() == false) {
            return tl::unexpected(connected.error());
        }
    }
    return routable_connection(name, routing);
}

// Concurrent first calls share one attempt.
ServerResult<void> ServerRegistry::connect_on_demand(const std::string& name) {
    std::shared_future<ServerResult<void>> pending;
    std::optional<std::promise<ServerResult<void>>> attempt;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_connects_.find(name);
        if (it != pending_connects_.end()) {
            pending = it->second;
        } else {
            attempt.emplace();
            pending = attempt->get_future().share();
            pending_connects_.emplace(name, pending);
        }
    }

    if (attempt.has_value()) {
        get_logger().info_fmt("Connecting '{}' on first use", name);
        ServerResult<void> connected = connect_server(name);
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_connects_.erase(name);
        }
        attempt->set_value(std::move(connected));
    }
    return pending.get();
}

template <typename Op>
ServerResult<Json> ServerRegistry::timed_call(const std::string& name, Op&& op) {
    auto connection = connection_for(name, Routing::ActiveOnly);
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }

    const auto started = std::chrono::steady_clock::now();
    TransportResult<Json> result = op(**connection);
    const Millis elapsed = std::chrono::steady_clock::now() - started;

    if (result.has_value()) {
        (void)record_success(name, elapsed);
        return std::move(*result);
    }
    (void)record_failure(name);
    return tl::unexpected(ServerError::from_transport(result.error()));
}

ServerResult<Json> ServerRegistry::call_tool(const std::string& name, const std::string& tool, const Json& arguments) {
    get_logger().debug_fmt("Calling {}:{}", name, tool);
    return timed_call(name, [&](IServerConnection& connection) {
        return connection.call_tool(tool, arguments);
    });
}

ServerResult<Json> ServerRegistry::read_resource(const std::string& name, const std::string& uri) {
    return timed_call(name, [&](IServerConnection& connection) {
        return connection.read_resource(uri);
    });
}

ServerResult<Json> ServerRegistry::get_prompt(const std::string& name, const std::string& prompt, const Json& arguments) {
    return timed_call(name, [&](IServerConnection& connection) {
        return connection.get_prompt(prompt, arguments);
    });
}

ServerResult<void> ServerRegistry::subscribe_resource(const std::string& name, const std::string& uri) {
    auto connection = connection_for(name, Routing::ActiveOnly);
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }
    if ((*connection)->capabilities().resources_subscribe == false) {
        get_logger().trace_fmt("'{}' does not support resource subscriptions", name);
        return {};
    }
    auto subscribed = (*connection)->subscribe_resource(uri);
    if (subscribed.has_value() == false) {
        return tl::unexpected(ServerError::from_transport(subscribed.error()));
    }
    return {};
}

ServerResult<void> ServerRegistry::refresh_capabilities(const std::string& name) {
    auto connection = routable_connection(name, Routing::IncludeDisabled);
    if (connection.has_value() == false) {
        return tl::unexpected(connection.error());
    }

    ServerCapabilities refreshed = discover(name, **connection);

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    // The server may have reconnected while discovery ran.
    if (it->second.connection() == *connection) {
        it->second.update_capabilities(std::move(refreshed));
    }
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

ServerResult<Server> ServerRegistry::get_server(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = servers_.find(name);
    if (it == servers_.end()) {
        return tl::unexpected(ServerError::not_found(name));
    }
    return it->second;
}

std::vector<Server> ServerRegistry::list_servers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Server> snapshot;
    snapshot.reserve(servers_.size());
    for (const auto& [name, server] : servers_) {
        snapshot.push_back(server);
    }
    return snapshot;
}

std::vector<std::string> ServerRegistry::connected_server_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    for (const auto& [name, server] : servers_) {
        if (server.is_connected() && server.disabled() == false) {
            names.push_back(name);
        }
    }
    return names;
}

bool ServerRegistry::contains(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return servers_.contains(name);
}

std::vector<ToolInfo> ServerRegistry::list_all_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ToolInfo> all;
    for (const auto& [name, server] : servers_) {
        if (server.is_connected() && server.disabled() == false) {
            const auto& tools = server.capabilities().tools;
            all.insert(all.end(), tools.begin(), tools.end());
        }
    }
    return all;
}

std::vector<ResourceInfo> ServerRegistry::list_all_resources() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<ResourceInfo> all;
    for (const auto& [name, server] : servers_) {
        if (server.is_connected() && server.disabled() == false) {
            const auto& resources = server.capabilities().resources;
            all.insert(all.end(), resources.begin(), resources.end());
        }
    }
    return all;
}

std::vector<PromptInfo> ServerRegistry::list_all_prompts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<PromptInfo> all;
    for (const auto& [name, server] : servers_) {
        if (server.is_connected() && server.disabled() == false) {
            const auto& prompts = server.capabilities().prompts;
            all.insert(all.end(), prompts.begin(), prompts.end());
        }
    }
    return all;
}

}  // namespace mcpchat
