#pragma once

#include "mcpchat/protocol/mcp_types.hpp"
#include "mcpchat/server/server_error.hpp"
#include "mcpchat/transport/transport.hpp"

#include <chrono>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>

namespace mcpchat {

// ═══════════════════════════════════════════════════════════════════════════
// Status
// ═══════════════════════════════════════════════════════════════════════════

enum class ServerStatus { Connecting, Connected, Failed, Disconnected };

[[nodiscard]] constexpr std::string_view to_string(ServerStatus status) noexcept {
    switch (status) {
        case ServerStatus::Connecting:   return "connecting";
        case ServerStatus::Connected:    return "connected";
        case ServerStatus::Failed:       return "failed";
        case ServerStatus::Disconnected: return "disconnected";
    }
    return "unknown";
}

enum class HealthStatus { Healthy, Unhealthy, Unknown };

[[nodiscard]] constexpr std::string_view to_string(HealthStatus status) noexcept {
    switch (status) {
        case HealthStatus::Healthy:   return "healthy";
        case HealthStatus::Unhealthy: return "unhealthy";
        case HealthStatus::Unknown:   return "unknown";
    }
    return "unknown";
}

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using Millis = std::chrono::duration<double, std::milli>;

/// Consecutive failures at which a server stops counting as healthy.
inline constexpr std::uint32_t kUnhealthyAfterFailures = 3;

// ═══════════════════════════════════════════════════════════════════════════
// HealthRecord
// ═══════════════════════════════════════════════════════════════════════════

struct HealthRecord {
    std::optional<TimePoint> uptime_start;
    std::uint64_t total_requests{0};
    std::uint64_t successful_requests{0};
    std::uint64_t failed_requests{0};
    double avg_response_time{0.0};          // ms, successes only
    std::uint32_t consecutive_failures{0};
    bool is_healthy{true};
    std::optional<TimePoint> last_ping;

    [[nodiscard]] Json to_json() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// Server
// ═══════════════════════════════════════════════════════════════════════════
// One registered tool server. Allowed transitions:
//
//   connecting -> connected | failed
//   connected  -> disconnected | failed
//
// A connection handle is held exactly while connected. Copies are
// snapshots that share the handle.

class Server {
public:
    Server(std::string name, ServerConfig config);

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const ServerConfig& config() const noexcept { return config_; }
    [[nodiscard]] ServerStatus status() const noexcept { return status_; }
    [[nodiscard]] const ConnectionHandle& connection() const noexcept { return connection_; }
    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept { return capabilities_; }
    [[nodiscard]] const std::optional<std::string>& error() const noexcept { return error_; }
    [[nodiscard]] std::optional<TimePoint> connected_at() const noexcept { return connected_at_; }
    [[nodiscard]] TimePoint last_attempt() const noexcept { return last_attempt_; }
    [[nodiscard]] const HealthRecord& health() const noexcept { return health_; }
    [[nodiscard]] bool disabled() const noexcept { return disabled_; }

    // ─────────────────────────────────────────────────────────────────────────
    // Transitions
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ServerResult<void> mark_connected(ConnectionHandle connection, ServerCapabilities capabilities);
    [[nodiscard]] ServerResult<void> mark_failed(std::string error);
    [[nodiscard]] ServerResult<void> mark_disconnected();

    /// Replaces discovered capabilities on a live connection.
    void update_capabilities(ServerCapabilities capabilities) { capabilities_ = std::move(capabilities); }

    void set_disabled(bool disabled) noexcept { disabled_ = disabled; }

    // ─────────────────────────────────────────────────────────────────────────
    // Health
    // ─────────────────────────────────────────────────────────────────────────

    void record_success(Millis duration);
    void record_failure();

    /// Healthy/unhealthy while connected, unknown otherwise.
    [[nodiscard]] HealthStatus health_status() const noexcept;

    /// Percentage of successful requests; 0 before the first request.
    [[nodiscard]] double success_rate() const noexcept;

    [[nodiscard]] std::optional<std::chrono::seconds> uptime() const;

    /// "[CONNECTING]", "[CONNECTED]", "[FAILED: reason]" or "[DISCONNECTED]".
    [[nodiscard]] std::string status_display() const;

    [[nodiscard]] bool is_connected() const noexcept {
        return status_ == ServerStatus::Connected && connection_ != nullptr;
    }

private:
    [[nodiscard]] ServerResult<void> require(ServerStatus target, std::initializer_list<ServerStatus> allowed) const;

    std::string name_;
    ServerConfig config_;
    ServerStatus status_{ServerStatus::Connecting};
    ConnectionHandle connection_;
    ServerCapabilities capabilities_;
    std::optional<std::string> error_;
    std::optional<TimePoint> connected_at_;
    TimePoint last_attempt_;
    HealthRecord health_;
    bool disabled_{false};
};

}  // namespace mcpchat
