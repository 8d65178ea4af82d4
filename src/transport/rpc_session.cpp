#include "mcpchat/transport/rpc_session.hpp"
#include "mcpchat/log/logger.hpp"

#include <vector>

namespace mcpchat {

RpcSession::RpcSession(IMessageChannel& channel, std::chrono::milliseconds default_timeout)
    : channel_(channel)
    , default_timeout_(default_timeout)
{}

void RpcSession::set_notification_handler(NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    on_notification_ = std::move(handler);
}

// ─────────────────────────────────────────────────────────────────────────────
// Outbound
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<Json> RpcSession::request(
    const std::string& method,
    Json params,
    std::optional<std::chrono::milliseconds> timeout
) {
    const Message message = encode_request(method, std::move(params));
    const RequestId id = *message.id;

    auto promise = std::make_shared<Promise>();
    auto future = promise->get_future();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.has_value()) {
            return tl::unexpected(*closed_);
        }
        pending_.emplace(id, promise);
    }

    auto sent = channel_.send(message.to_json());
    if (sent.has_value() == false) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(id);
        return tl::unexpected(sent.error());
    }

    const auto limit = timeout.value_or(default_timeout_);
    if (future.wait_for(limit) == std::future_status::timeout) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            pending_.erase(id);
        }
        get_logger().debug_fmt("Request {} '{}' timed out after {}ms", id, method, limit.count());
        return tl::unexpected(TransportError::timeout(
            "'" + method + "' timed out after " + std::to_string(limit.count()) + "ms"));
    }
    return future.get();
}

TransportResult<void> RpcSession::notify(const std::string& method, Json params) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.has_value()) {
            return tl::unexpected(*closed_);
        }
    }
    return channel_.send(encode_notification(method, std::move(params)).to_json());
}

// ─────────────────────────────────────────────────────────────────────────────
// Inbound
// ─────────────────────────────────────────────────────────────────────────────

void RpcSession::handle_incoming(const Json& message) {
    auto decoded = decode(message);
    if (decoded.has_value() == false) {
        get_logger().debug_fmt("Dropping undecodable message: {}", decoded.error().message);
        return;
    }

    switch (decoded->kind) {
        case DecodedKind::Result:
            if (decoded->id.has_value()) {
                resolve(*decoded->id, std::move(decoded->payload));
            }
            return;

        case DecodedKind::Error: {
            // Malformed error members degrade to defaults; the reply still
            // settles its request.
            const Json& error = decoded->payload;
            int code = kInternalError;
            std::string text = "unknown error";
            if (error.is_object() && error.contains("code") && error["code"].is_number_integer()) {
                code = error["code"].get<int>();
            }
            if (error.is_object() && error.contains("message") && error["message"].is_string()) {
                text = error["message"].get<std::string>();
            }
            if (decoded->id.has_value()) {
                resolve(*decoded->id, tl::unexpected(TransportError::rpc(code, std::move(text))));
            } else {
                get_logger().warn_fmt("Server reported error without id: {}", text);
            }
            return;
        }

        case DecodedKind::Request:
            answer_server_request(*decoded);
            return;

        case DecodedKind::Notification: {
            NotificationHandler handler;
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handler = on_notification_;
            }
            if (handler) {
                handler(decoded->method, decoded->params);
            }
            return;
        }
    }
}

void RpcSession::resolve(RequestId id, TransportResult<Json> outcome) {
    std::shared_ptr<Promise> promise;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto it = pending_.find(id);
        if (it == pending_.end()) {
            // Late reply to a request that already timed out.
            get_logger().trace_fmt("No pending request for id {}", id);
            return;
        }
        promise = std::move(it->second);
        pending_.erase(it);
    }
    promise->set_value(std::move(outcome));
}

void RpcSession::answer_server_request(const DecodedMessage& request) {
    Json reply;
    if (request.method == "ping") {
        reply = encode_result(request.raw_id, Json::object());
    } else {
        get_logger().debug_fmt("Rejecting server request '{}'", request.method);
        reply = encode_error(request.raw_id, kMethodNotFound, "Method not found: " + request.method);
    }

    auto sent = channel_.send(reply);
    if (sent.has_value() == false) {
        get_logger().debug_fmt("Could not answer '{}': {}", request.method, sent.error().message);
    }
}

void RpcSession::fail_all(const TransportError& error) {
    std::unordered_map<RequestId, std::shared_ptr<Promise>> orphans;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_.has_value() == false) {
            closed_ = error;
        }
        orphans.swap(pending_);
    }
    for (auto& [id, promise] : orphans) {
        promise->set_value(tl::unexpected(error));
    }
}

std::size_t RpcSession::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

}  // namespace mcpchat
