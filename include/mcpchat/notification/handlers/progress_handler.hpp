#pragma once

#include "mcpchat/notification/notification_handler.hpp"

#include <functional>
#include <optional>
#include <string>

namespace mcpchat {

/// One progress update as seen by the display callback.
struct ProgressUpdate {
    std::string server_name;
    std::string token;
    double progress{0.0};
    std::optional<double> total;

    [[nodiscard]] bool finished() const noexcept {
        return total.has_value() && progress >= *total;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ProgressHandler
// ─────────────────────────────────────────────────────────────────────────────
// State: {"active": {server: {token: {progress, total, started_at, updated_at}}},
//         "completed": N}
// An operation leaves "active" once progress reaches total.

class ProgressHandler final : public INotificationHandler {
public:
    using DisplayCallback = std::function<void(const ProgressUpdate&)>;

    explicit ProgressHandler(DisplayCallback display = {});

    [[nodiscard]] std::string name() const override { return "progress"; }
    [[nodiscard]] HandlerResult init(const Json& args) override;
    [[nodiscard]] HandlerResult handle_notification(const NotificationEvent& event, HandlerState state) override;

private:
    [[nodiscard]] HandlerResult apply(const std::string& server_name, const Json& params, HandlerState state) const;

    DisplayCallback display_;
};

}  // namespace mcpchat
