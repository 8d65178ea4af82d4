#pragma once

#include "mcpchat/protocol/codec.hpp"

#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpchat {

// ─────────────────────────────────────────────────────────────────────────────
// Notification Types
// ─────────────────────────────────────────────────────────────────────────────

enum class NotificationType {
    Progress,
    ResourcesListChanged,
    ResourcesUpdated,
    ResourceAdded,
    ResourceRemoved,
    ToolsListChanged,
    ToolAdded,
    ToolRemoved,
    PromptsListChanged,
    ServerConnected,
    ServerDisconnected,
    ServerError
};

[[nodiscard]] constexpr std::string_view to_string(NotificationType type) noexcept {
    switch (type) {
        case NotificationType::Progress:             return "progress";
        case NotificationType::ResourcesListChanged: return "resources_list_changed";
        case NotificationType::ResourcesUpdated:     return "resources_updated";
        case NotificationType::ResourceAdded:        return "resource_added";
        case NotificationType::ResourceRemoved:      return "resource_removed";
        case NotificationType::ToolsListChanged:     return "tools_list_changed";
        case NotificationType::ToolAdded:            return "tool_added";
        case NotificationType::ToolRemoved:          return "tool_removed";
        case NotificationType::PromptsListChanged:   return "prompts_list_changed";
        case NotificationType::ServerConnected:      return "server_connected";
        case NotificationType::ServerDisconnected:   return "server_disconnected";
        case NotificationType::ServerError:          return "server_error";
    }
    return "unknown";
}

/// Wire method -> type. Anything not listed here is dropped by dispatch.
inline constexpr std::array<std::pair<std::string_view, NotificationType>, 12> kNotificationMethods = {{
    {"notifications/progress",               NotificationType::Progress},
    {"notifications/resources/list_changed", NotificationType::ResourcesListChanged},
    {"notifications/resources/updated",      NotificationType::ResourcesUpdated},
    {"notifications/resource/added",         NotificationType::ResourceAdded},
    {"notifications/resource/removed",       NotificationType::ResourceRemoved},
    {"notifications/tools/list_changed",     NotificationType::ToolsListChanged},
    {"notifications/tool/added",             NotificationType::ToolAdded},
    {"notifications/tool/removed",           NotificationType::ToolRemoved},
    {"notifications/prompts/list_changed",   NotificationType::PromptsListChanged},
    {"notifications/server/connected",       NotificationType::ServerConnected},
    {"notifications/server/disconnected",    NotificationType::ServerDisconnected},
    {"notifications/server/error",           NotificationType::ServerError},
}};

[[nodiscard]] constexpr std::optional<NotificationType> notification_type_from_method(std::string_view method) noexcept {
    for (const auto& [name, type] : kNotificationMethods) {
        if (name == method) {
            return type;
        }
    }
    return std::nullopt;
}

[[nodiscard]] constexpr std::optional<NotificationType> notification_type_from_string(std::string_view text) noexcept {
    for (const auto& [name, type] : kNotificationMethods) {
        if (to_string(type) == text) {
            return type;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// NotificationEvent
// ─────────────────────────────────────────────────────────────────────────────

struct NotificationEvent {
    std::string server_name;
    NotificationType type{NotificationType::Progress};
    std::string method;
    Json params = Json::object();
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
    std::size_t count{1};
    bool batched{false};    // params = {"count": N, "events": [params...]}

    /// The individual params this event carries: one, or each batched event.
    [[nodiscard]] std::vector<Json> payloads() const {
        if (batched && params.contains("events") && params["events"].is_array()) {
            return params["events"].get<std::vector<Json>>();
        }
        return {params};
    }

    [[nodiscard]] Json to_json() const {
        return {
            {"server", server_name},
            {"type", to_string(type)},
            {"method", method},
            {"params", params},
            {"count", count},
            {"batched", batched}
        };
    }
};

}  // namespace mcpchat
