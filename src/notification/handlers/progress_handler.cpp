#include "mcpchat/notification/handlers/progress_handler.hpp"
#include "mcpchat/log/logger.hpp"

#include <chrono>
#include <cstdint>

namespace mcpchat {

namespace {

[[nodiscard]] std::int64_t now_millis() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

[[nodiscard]] std::string token_of(const Json& params) {
    if (params.contains("progressToken") == false) {
        return "unknown";
    }
    const auto& token = params["progressToken"];
    return token.is_string() ? token.get<std::string>() : token.dump();
}

}  // namespace

ProgressHandler::ProgressHandler(DisplayCallback display)
    : display_(std::move(display))
{}

HandlerResult ProgressHandler::init(const Json& /*args*/) {
    return Json{{"active", Json::object()}, {"completed", 0}};
}

HandlerResult ProgressHandler::handle_notification(const NotificationEvent& event, HandlerState state) {
    if (event.type != NotificationType::Progress) {
        return state;
    }

    for (const auto& params : event.payloads()) {
        auto next = apply(event.server_name, params, std::move(state));
        if (next.has_value() == false) {
            return next;
        }
        state = std::move(*next);
    }
    return state;
}

HandlerResult ProgressHandler::apply(const std::string& server_name, const Json& params, HandlerState state) const {
    if (params.contains("progress") == false || params["progress"].is_number() == false) {
        return tl::unexpected(HandlerError::failed("progress notification without numeric progress", std::move(state)));
    }

    ProgressUpdate update;
    update.server_name = server_name;
    update.token = token_of(params);
    update.progress = params["progress"].get<double>();
    if (params.contains("total") && params["total"].is_number()) {
        update.total = params["total"].get<double>();
    }

    auto& server_ops = state["active"][server_name];
    auto& op = server_ops[update.token];
    if (op.is_null()) {
        op = Json{{"started_at", now_millis()}};
    }
    op["progress"] = update.progress;
    op["total"] = update.total.has_value() ? Json(*update.total) : Json(nullptr);
    op["updated_at"] = now_millis();

    if (update.finished()) {
        server_ops.erase(update.token);
        if (server_ops.empty()) {
            state["active"].erase(server_name);
        }
        state["completed"] = state.value("completed", 0) + 1;
        get_logger().debug_fmt("Operation {} on {} completed", update.token, server_name);
    }

    if (display_) {
        display_(update);
    }
    return state;
}

}  // namespace mcpchat
