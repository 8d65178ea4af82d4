#pragma once

#include "mcpchat/server/server.hpp"
#include "mcpchat/transport/transport.hpp"

#include <condition_variable>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat {

/// Receives every notification pushed by any connected server.
using NotificationSink = std::function<void(
    const std::string& server_name,
    const std::string& method,
    const Json& params
)>;

struct EstablishedConnection {
    ConnectionHandle connection;
    ServerCapabilities capabilities;
};

// ═══════════════════════════════════════════════════════════════════════════
// ServerRegistry
// ═══════════════════════════════════════════════════════════════════════════
// Name -> Server map shared by every other component. One mutex guards the
// map; transport I/O always happens with it released. call_tool() times and
// records against the target's health; the executor and the health monitor
// take a handle from connection_for() and record their own outcomes.
//
// Connections call back into the registry when they close, so the registry
// must outlive every component that connects through it. The destructor
// waits for connect attempts still in establish_connection().
//
// With lazy connect on, a server registered but never attempted is
// connected by the first routed call that targets it.

class ServerRegistry {
public:
    enum class Routing { ActiveOnly, IncludeDisabled };

    /// Decides whether a freshly established connection is still wanted.
    using AcceptConnection = std::function<bool(const ConnectionHandle&)>;

    explicit ServerRegistry(std::shared_ptr<IServerConnector> connector);
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;
    ServerRegistry(ServerRegistry&&) = delete;
    ServerRegistry& operator=(ServerRegistry&&) = delete;

    // ─────────────────────────────────────────────────────────────────────────
    // Lifecycle
    // ─────────────────────────────────────────────────────────────────────────

    /// Adds a server in `connecting`. Fails if the name is taken.
    [[nodiscard]] ServerResult<void> register_server(const std::string& name, ServerConfig config);

    /// Connects and discovers capabilities without changing any state. When
    /// `accept` rejects the result the connection is closed and an Abandoned
    /// error returned.
    [[nodiscard]] ServerResult<EstablishedConnection> establish_connection(
        const std::string& name, const AcceptConnection& accept = {});

    /// establish_connection() followed by mark_connected() or mark_failed().
    /// A connection that arrives after the server left `connecting` is closed.
    [[nodiscard]] ServerResult<void> connect_server(const std::string& name);

    [[nodiscard]] ServerResult<void> mark_connected(
        const std::string& name, ConnectionHandle connection, ServerCapabilities capabilities);
    [[nodiscard]] ServerResult<void> mark_failed(const std::string& name, std::string error);

    /// Moves a connected server to `disconnected` and closes its transport.
    [[nodiscard]] ServerResult<void> mark_disconnected(const std::string& name);

    /// Explicit user-requested disconnect; same as mark_disconnected().
    [[nodiscard]] ServerResult<void> disconnect_server(const std::string& name) {
        return mark_disconnected(name);
    }

    [[nodiscard]] ServerResult<void> remove_server(const std::string& name);

    /// Replaces the record with a fresh one in `connecting` and connects it.
    [[nodiscard]] ServerResult<void> reconnect_server(const std::string& name);

    /// Disconnects every server; used on shutdown.
    void disconnect_all();

    // ─────────────────────────────────────────────────────────────────────────
    // Health
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ServerResult<void> record_success(const std::string& name, Millis duration);
    [[nodiscard]] ServerResult<void> record_failure(const std::string& name);
    [[nodiscard]] ServerResult<HealthStatus> health_status(const std::string& name) const;

    /// Takes a server out of (or back into) rotation without touching its
    /// connection.
    [[nodiscard]] ServerResult<void> disable_server(const std::string& name);
    [[nodiscard]] ServerResult<void> enable_server(const std::string& name);

    /// One `tools/list` round trip, not recorded. A JSON-RPC error reply
    /// still proves the server is responsive and counts as success.
    [[nodiscard]] ServerResult<void> probe(const std::string& name);
    [[nodiscard]] static TransportResult<void> probe_connection(IServerConnection& connection);

    // ─────────────────────────────────────────────────────────────────────────
    // Routed Operations
    // ─────────────────────────────────────────────────────────────────────────

    /// The connection a routed call would use now, connecting lazily when
    /// enabled. Callers that go to the connection directly record health
    /// themselves.
    [[nodiscard]] ServerResult<ConnectionHandle> connection_for(
        const std::string& name, Routing routing = Routing::ActiveOnly);

    [[nodiscard]] ServerResult<Json> call_tool(const std::string& name, const std::string& tool, const Json& arguments);
    [[nodiscard]] ServerResult<Json> read_resource(const std::string& name, const std::string& uri);
    [[nodiscard]] ServerResult<Json> get_prompt(const std::string& name, const std::string& prompt, const Json& arguments);

    /// Sends resources/subscribe when the server supports it; a no-op otherwise.
    [[nodiscard]] ServerResult<void> subscribe_resource(const std::string& name, const std::string& uri);

    /// Re-runs discovery on the live connection.
    [[nodiscard]] ServerResult<void> refresh_capabilities(const std::string& name);

    // ─────────────────────────────────────────────────────────────────────────
    // Queries (snapshots)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ServerResult<Server> get_server(const std::string& name) const;
    [[nodiscard]] std::vector<Server> list_servers() const;
    [[nodiscard]] std::vector<std::string> connected_server_names() const;
    [[nodiscard]] bool contains(const std::string& name) const;

    [[nodiscard]] std::vector<ToolInfo> list_all_tools() const;
    [[nodiscard]] std::vector<ResourceInfo> list_all_resources() const;
    [[nodiscard]] std::vector<PromptInfo> list_all_prompts() const;

    void set_notification_sink(NotificationSink sink);

    void set_lazy_connect(bool enabled);
    [[nodiscard]] bool lazy_connect() const;

private:
    struct ConnectionSlot;

    [[nodiscard]] ServerResult<ConnectionHandle> routable_connection(const std::string& name, Routing routing) const;
    [[nodiscard]] ServerResult<void> connect_on_demand(const std::string& name);

    template <typename Op>
    [[nodiscard]] ServerResult<Json> timed_call(const std::string& name, Op&& op);

    [[nodiscard]] ServerCapabilities discover(const std::string& name, IServerConnection& connection) const;

    void on_connection_closed(const std::string& name, const IServerConnection* closed, const std::string& reason);
    void on_notification(const std::string& name, const IServerConnection* source,
                         const std::string& method, const Json& params);

    std::shared_ptr<IServerConnector> connector_;

    mutable std::mutex mutex_;
    std::map<std::string, Server> servers_;
    bool lazy_connect_{false};
    std::map<std::string, std::shared_future<ServerResult<void>>> pending_connects_;
    std::size_t establishing_{0};
    std::condition_variable establishing_done_;

    mutable std::mutex sink_mutex_;
    NotificationSink sink_;
};

}  // namespace mcpchat
