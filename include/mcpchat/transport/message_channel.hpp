#pragma once

#include "mcpchat/transport/transport.hpp"

#include <functional>
#include <string>

namespace mcpchat {

// ─────────────────────────────────────────────────────────────────────────────
// IMessageChannel - moves whole JSON-RPC messages in both directions
// ─────────────────────────────────────────────────────────────────────────────
// Channels deliver every inbound message on their own reader thread. They
// raise the close handler only when the peer goes away; an explicit close()
// is silent.

class IMessageChannel {
public:
    using MessageHandler = std::function<void(const Json& message)>;
    using CloseHandler = std::function<void(const std::string& reason)>;

    virtual ~IMessageChannel() = default;

    [[nodiscard]] virtual TransportResult<void> open(MessageHandler on_message, CloseHandler on_close) = 0;
    [[nodiscard]] virtual TransportResult<void> send(const Json& message) = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool is_open() const noexcept = 0;
};

}  // namespace mcpchat
