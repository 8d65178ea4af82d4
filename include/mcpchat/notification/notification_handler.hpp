#pragma once

#include "mcpchat/notification/notification_types.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>

namespace mcpchat {

/// Handler state is plain JSON, owned by the registry per registration.
using HandlerState = Json;

struct HandlerError {
    std::string message;
    std::optional<HandlerState> state;   // state to keep despite the failure

    [[nodiscard]] static HandlerError failed(std::string message) {
        return {std::move(message), std::nullopt};
    }

    [[nodiscard]] static HandlerError failed(std::string message, HandlerState state) {
        return {std::move(message), std::move(state)};
    }
};

using HandlerResult = tl::expected<HandlerState, HandlerError>;

// ─────────────────────────────────────────────────────────────────────────────
// INotificationHandler
// ─────────────────────────────────────────────────────────────────────────────
// Handlers are stateless objects; everything they remember between events
// lives in the HandlerState the registry threads through them.

class INotificationHandler {
public:
    virtual ~INotificationHandler() = default;

    [[nodiscard]] virtual std::string name() const = 0;

    /// Builds the initial state for one registration.
    [[nodiscard]] virtual HandlerResult init(const Json& args) = 0;

    /// Returns the new state, or an error that may carry the state to keep.
    [[nodiscard]] virtual HandlerResult handle_notification(const NotificationEvent& event, HandlerState state) = 0;

    virtual void terminate(const HandlerState& /*state*/) {}
};

}  // namespace mcpchat
