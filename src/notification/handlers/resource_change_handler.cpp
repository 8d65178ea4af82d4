#include "mcpchat/notification/handlers/resource_change_handler.hpp"
#include "mcpchat/log/logger.hpp"

namespace mcpchat {

ResourceChangeHandler::ResourceChangeHandler(ResourceCache& cache)
    : cache_(cache)
{}

HandlerResult ResourceChangeHandler::init(const Json& /*args*/) {
    return Json{{"invalidated", 0}, {"cleared", 0}};
}

HandlerResult ResourceChangeHandler::handle_notification(const NotificationEvent& event, HandlerState state) {
    switch (event.type) {
        case NotificationType::ResourcesUpdated: {
            for (const auto& params : event.payloads()) {
                if (params.contains("uri") == false || params["uri"].is_string() == false) {
                    return tl::unexpected(HandlerError::failed("resources/updated without uri", std::move(state)));
                }
                const auto uri = params["uri"].get<std::string>();
                get_logger().info_fmt("Resource changed: {} {}", event.server_name, uri);
                if (cache_.invalidate_resource(event.server_name, uri)) {
                    state["invalidated"] = state.value("invalidated", 0) + 1;
                }
            }
            return state;
        }

        case NotificationType::ResourcesListChanged:
            (void)cache_.clear_server_cache(event.server_name);
            state["cleared"] = state.value("cleared", 0) + 1;
            return state;

        default:
            return state;
    }
}

}  // namespace mcpchat
