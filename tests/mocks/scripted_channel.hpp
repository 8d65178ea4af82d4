#ifndef MCPCHAT_TESTS_SCRIPTED_CHANNEL_HPP
#define MCPCHAT_TESTS_SCRIPTED_CHANNEL_HPP

#include "mcpchat/transport/message_channel.hpp"

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat::testing {

// ─────────────────────────────────────────────────────────────────────────────
// ScriptedChannel - in-memory peer for RpcSession and McpConnection
// ─────────────────────────────────────────────────────────────────────────────
// Every sent message is recorded and offered to the responder; a reply is
// delivered straight back through the message handler.

class ScriptedChannel final : public IMessageChannel {
public:
    using Responder = std::function<std::optional<Json>(const Json& request)>;

    explicit ScriptedChannel(Responder responder = {})
        : responder_(std::move(responder))
    {}

    [[nodiscard]] TransportResult<void> open(MessageHandler on_message, CloseHandler on_close) override {
        if (refuse_open) {
            return tl::unexpected(TransportError::network("refused"));
        }
        on_message_ = std::move(on_message);
        on_close_ = std::move(on_close);
        open_ = true;
        return {};
    }

    [[nodiscard]] TransportResult<void> send(const Json& message) override {
        if (open_ == false) {
            return tl::unexpected(TransportError::closed());
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(message);
        }
        if (responder_) {
            if (auto reply = responder_(message); reply.has_value()) {
                on_message_(*reply);
            }
        }
        return {};
    }

    void close() override { open_ = false; }

    [[nodiscard]] bool is_open() const noexcept override { return open_.load(); }

    /// Delivers a message as if the peer sent it unprompted.
    void push(const Json& message) { on_message_(message); }

    /// The peer hangs up.
    void peer_close(const std::string& reason) {
        open_ = false;
        if (on_close_) {
            on_close_(reason);
        }
    }

    [[nodiscard]] std::vector<Json> sent() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return sent_;
    }

    std::atomic<bool> refuse_open{false};

private:
    Responder responder_;
    MessageHandler on_message_;
    CloseHandler on_close_;
    std::atomic<bool> open_{false};
    mutable std::mutex mutex_;
    std::vector<Json> sent_;
};

/// Answers like a minimal MCP server with one tool.
inline std::optional<Json> minimal_server(const Json& request) {
    if (request.contains("id") == false) {
        return std::nullopt;
    }
    const auto method = request.value("method", "");
    Json result = Json::object();
    if (method == "initialize") {
        result = {
            {"protocolVersion", MCP_PROTOCOL_VERSION},
            {"capabilities", {{"tools", Json::object()}}},
            {"serverInfo", {{"name", "scripted"}, {"version", "0.1"}}}
        };
    } else if (method == "tools/list") {
        result = {{"tools", Json::array({{{"name", "echo"}, {"description", "Echo back"}}})}};
    } else if (method == "tools/call") {
        result = {{"content", Json::array({{{"type", "text"}, {"text", request["params"]["arguments"].dump()}}})}};
    } else {
        return Json{{"jsonrpc", "2.0"}, {"id", request["id"]},
                    {"error", {{"code", kMethodNotFound}, {"message", "no " + method}}}};
    }
    return Json{{"jsonrpc", "2.0"}, {"id", request["id"]}, {"result", result}};
}

}  // namespace mcpchat::testing

#endif  // MCPCHAT_TESTS_SCRIPTED_CHANNEL_HPP
