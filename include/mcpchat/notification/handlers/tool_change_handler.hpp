#pragma once

#include "mcpchat/notification/notification_handler.hpp"
#include "mcpchat/server/server_registry.hpp"

namespace mcpchat {

/// Re-discovers a server's capabilities when its tool or prompt list
/// changes. State: {"refreshes": N}.
class ToolChangeHandler final : public INotificationHandler {
public:
    explicit ToolChangeHandler(ServerRegistry& registry);

    [[nodiscard]] std::string name() const override { return "tool_change"; }
    [[nodiscard]] HandlerResult init(const Json& args) override;
    [[nodiscard]] HandlerResult handle_notification(const NotificationEvent& event, HandlerState state) override;

private:
    ServerRegistry& registry_;
};

}  // namespace mcpchat
