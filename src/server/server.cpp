#include "mcpchat/server/server.hpp"

#include <algorithm>

namespace mcpchat {

namespace {

Json time_or_null(const std::optional<TimePoint>& tp) {
    if (tp.has_value() == false) {
        return nullptr;
    }
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp->time_since_epoch()).count();
}

}  // namespace

Json HealthRecord::to_json() const {
    return {
        {"uptime_start", time_or_null(uptime_start)},
        {"total_requests", total_requests},
        {"successful_requests", successful_requests},
        {"failed_requests", failed_requests},
        {"avg_response_time", avg_response_time},
        {"consecutive_failures", consecutive_failures},
        {"is_healthy", is_healthy},
        {"last_ping", time_or_null(last_ping)}
    };
}

Server::Server(std::string name, ServerConfig config)
    : name_(std::move(name))
    , config_(std::move(config))
    , last_attempt_(Clock::now())
{}

// ─────────────────────────────────────────────────────────────────────────────
// Transitions
// ─────────────────────────────────────────────────────────────────────────────

ServerResult<void> Server::require(ServerStatus target, std::initializer_list<ServerStatus> allowed) const {
    const bool permitted = std::find(allowed.begin(), allowed.end(), status_) != allowed.end();
    if (permitted == false) {
        return tl::unexpected(ServerError::invalid_transition(to_string(status_), to_string(target)));
    }
    return {};
}

ServerResult<void> Server::mark_connected(ConnectionHandle connection, ServerCapabilities capabilities) {
    auto allowed = require(ServerStatus::Connected, {ServerStatus::Connecting});
    if (allowed.has_value() == false) {
        return allowed;
    }

    const auto now = Clock::now();
    status_ = ServerStatus::Connected;
    connection_ = std::move(connection);
    capabilities_ = std::move(capabilities);
    error_.reset();
    connected_at_ = now;
    last_attempt_ = now;
    health_.uptime_start = now;
    health_.consecutive_failures = 0;
    health_.is_healthy = true;
    return {};
}

ServerResult<void> Server::mark_failed(std::string error) {
    auto allowed = require(ServerStatus::Failed, {ServerStatus::Connecting, ServerStatus::Connected});
    if (allowed.has_value() == false) {
        return allowed;
    }

    status_ = ServerStatus::Failed;
    error_ = std::move(error);
    connection_.reset();
    capabilities_ = ServerCapabilities{};
    last_attempt_ = Clock::now();
    return {};
}

ServerResult<void> Server::mark_disconnected() {
    auto allowed = require(ServerStatus::Disconnected, {ServerStatus::Connected});
    if (allowed.has_value() == false) {
        return allowed;
    }

    status_ = ServerStatus::Disconnected;
    connection_.reset();
    capabilities_ = ServerCapabilities{};
    return {};
}

// ─────────────────────────────────────────────────────────────────────────────
// Health
// ─────────────────────────────────────────────────────────────────────────────

void Server::record_success(Millis duration) {
    health_.total_requests += 1;
    health_.successful_requests += 1;

    // Incremental mean over successful calls only.
    const double n = static_cast<double>(health_.successful_requests);
    health_.avg_response_time += (duration.count() - health_.avg_response_time) / n;

    health_.consecutive_failures = 0;
    health_.is_healthy = true;
    health_.last_ping = Clock::now();
}

void Server::record_failure() {
    health_.total_requests += 1;
    health_.failed_requests += 1;
    health_.consecutive_failures += 1;
    if (health_.consecutive_failures >= kUnhealthyAfterFailures) {
        health_.is_healthy = false;
    }
}

HealthStatus Server::health_status() const noexcept {
    if (status_ != ServerStatus::Connected) {
        return HealthStatus::Unknown;
    }
    return health_.is_healthy ? HealthStatus::Healthy : HealthStatus::Unhealthy;
}

double Server::success_rate() const noexcept {
    if (health_.total_requests == 0) {
        return 0.0;
    }
    return static_cast<double>(health_.successful_requests)
         / static_cast<double>(health_.total_requests) * 100.0;
}

std::optional<std::chrono::seconds> Server::uptime() const {
    if (health_.uptime_start.has_value() == false) {
        return std::nullopt;
    }
    return std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - *health_.uptime_start);
}

std::string Server::status_display() const {
    switch (status_) {
        case ServerStatus::Connecting:   return "[CONNECTING]";
        case ServerStatus::Connected:    return disabled_ ? "[CONNECTED, DISABLED]" : "[CONNECTED]";
        case ServerStatus::Failed:       return "[FAILED: " + error_.value_or("unknown error") + "]";
        case ServerStatus::Disconnected: return "[DISCONNECTED]";
    }
    return "[UNKNOWN]";
}

}  // namespace mcpchat
