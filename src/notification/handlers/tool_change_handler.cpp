#include "mcpchat/notification/handlers/tool_change_handler.hpp"
#include "mcpchat/log/logger.hpp"

namespace mcpchat {

ToolChangeHandler::ToolChangeHandler(ServerRegistry& registry)
    : registry_(registry)
{}

HandlerResult ToolChangeHandler::init(const Json& /*args*/) {
    return Json{{"refreshes", 0}};
}

HandlerResult ToolChangeHandler::handle_notification(const NotificationEvent& event, HandlerState state) {
    switch (event.type) {
        case NotificationType::ToolsListChanged:
        case NotificationType::ToolAdded:
        case NotificationType::ToolRemoved:
        case NotificationType::PromptsListChanged:
            break;
        default:
            return state;
    }

    auto refreshed = registry_.refresh_capabilities(event.server_name);
    if (refreshed.has_value() == false) {
        return tl::unexpected(HandlerError::failed(
            "refreshing " + event.server_name + ": " + refreshed.error().message, std::move(state)));
    }

    get_logger().info_fmt("Refreshed capabilities of {} after {}", event.server_name, to_string(event.type));
    state["refreshes"] = state.value("refreshes", 0) + 1;
    return state;
}

}  // namespace mcpchat
