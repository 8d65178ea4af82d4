#pragma once

#include "mcpchat/protocol/codec.hpp"
#include "mcpchat/transport/message_channel.hpp"

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace mcpchat {

// ═══════════════════════════════════════════════════════════════════════════
// RpcSession
// ═══════════════════════════════════════════════════════════════════════════
// Request/response correlation over one IMessageChannel. Callers block on a
// future for at most the request timeout; the channel's reader thread
// resolves it through handle_incoming(). Server-initiated requests are
// answered here so the peer never waits on us.

class RpcSession {
public:
    using NotificationHandler = std::function<void(const std::string& method, const Json& params)>;

    RpcSession(IMessageChannel& channel, std::chrono::milliseconds default_timeout);

    RpcSession(const RpcSession&) = delete;
    RpcSession& operator=(const RpcSession&) = delete;

    void set_notification_handler(NotificationHandler handler);

    /// Sends a request and waits for its result. JSON-RPC errors come back
    /// as TransportError::Category::Rpc.
    [[nodiscard]] TransportResult<Json> request(
        const std::string& method,
        Json params = Json::object(),
        std::optional<std::chrono::milliseconds> timeout = std::nullopt
    );

    [[nodiscard]] TransportResult<void> notify(const std::string& method, Json params = Json::object());

    /// Entry point for every inbound message.
    void handle_incoming(const Json& message);

    /// Fails all pending requests and rejects new ones.
    void fail_all(const TransportError& error);

    [[nodiscard]] std::size_t pending_count() const;

private:
    using Promise = std::promise<TransportResult<Json>>;

    void resolve(RequestId id, TransportResult<Json> outcome);
    void answer_server_request(const DecodedMessage& request);

    IMessageChannel& channel_;
    std::chrono::milliseconds default_timeout_;

    mutable std::mutex mutex_;
    std::unordered_map<RequestId, std::shared_ptr<Promise>> pending_;
    std::optional<TransportError> closed_;
    NotificationHandler on_notification_;
};

}  // namespace mcpchat
