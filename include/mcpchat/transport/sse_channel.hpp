#pragma once

#include "mcpchat/transport/message_channel.hpp"
#include "mcpchat/transport/sse_parser.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace mcpchat {

// ═══════════════════════════════════════════════════════════════════════════
// SseChannel
// ═══════════════════════════════════════════════════════════════════════════
// HTTP + Server-Sent Events transport built on cpr.
//
//   GET  {base}/sse      long-lived event stream (server -> client)
//   POST {base}/message  one JSON-RPC message per request (client -> server)
//
// An "endpoint" event on the stream replaces the POST target. "message"
// events carry JSON-RPC payloads; "connected" and "ping" are keep-alives.
// A JSON body returned directly by a POST is delivered like a message event.

class SseChannel final : public IMessageChannel {
public:
    explicit SseChannel(SseServerConfig config);
    ~SseChannel() override;

    SseChannel(const SseChannel&) = delete;
    SseChannel& operator=(const SseChannel&) = delete;

    [[nodiscard]] TransportResult<void> open(MessageHandler on_message, CloseHandler on_close) override;
    [[nodiscard]] TransportResult<void> send(const Json& message) override;
    void close() override;
    [[nodiscard]] bool is_open() const noexcept override;

    [[nodiscard]] std::string endpoint_url() const;

    /// `url` without trailing slashes.
    [[nodiscard]] static std::string normalize_base_url(std::string url);

    /// Resolves an "endpoint" event value against the base URL.
    [[nodiscard]] static std::string resolve_endpoint(const std::string& base, const std::string& endpoint);

private:
    enum class StreamState { Pending, Streaming, Failed };

    void stream_loop();
    void handle_event(const SseEvent& event);
    void deliver_payload(const std::string& text);
    void set_stream_state(StreamState state, std::string failure = {});

    SseServerConfig config_;
    std::string base_url_;
    MessageHandler on_message_;
    CloseHandler on_close_;
    SseParser parser_;

    std::atomic<bool> running_{false};

    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    StreamState stream_state_{StreamState::Pending};
    std::string stream_failure_;
    std::string endpoint_url_;

    std::thread stream_thread_;
};

}  // namespace mcpchat
