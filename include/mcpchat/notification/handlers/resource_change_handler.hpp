#pragma once

#include "mcpchat/cache/resource_cache.hpp"
#include "mcpchat/notification/notification_handler.hpp"

namespace mcpchat {

/// Keeps the resource cache in step with the server: drops one entry on
/// resources_updated and the server's whole cache on resources_list_changed.
/// State counts both: {"invalidated": N, "cleared": M}.
class ResourceChangeHandler final : public INotificationHandler {
public:
    explicit ResourceChangeHandler(ResourceCache& cache);

    [[nodiscard]] std::string name() const override { return "resource_change"; }
    [[nodiscard]] HandlerResult init(const Json& args) override;
    [[nodiscard]] HandlerResult handle_notification(const NotificationEvent& event, HandlerState state) override;

private:
    ResourceCache& cache_;
};

}  // namespace mcpchat
