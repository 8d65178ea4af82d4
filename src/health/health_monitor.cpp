#include "mcpchat/health/health_monitor.hpp"
#include "mcpchat/log/logger.hpp"

namespace mcpchat {

HealthSnapshot HealthSnapshot::of(const Server& server) {
    HealthSnapshot snapshot;
    snapshot.server_name = server.name();
    snapshot.status = server.status();
    snapshot.health_status = server.health_status();
    snapshot.record = server.health();
    snapshot.success_rate = server.success_rate();
    snapshot.uptime = server.uptime();
    snapshot.disabled = server.disabled();
    return snapshot;
}

Json HealthSnapshot::to_json() const {
    return {
        {"server", server_name},
        {"status", to_string(status)},
        {"health", to_string(health_status)},
        {"success_rate", success_rate},
        {"uptime_seconds", uptime.has_value() ? Json(uptime->count()) : Json(nullptr)},
        {"disabled", disabled},
        {"record", record.to_json()}
    };
}

HealthMonitor::HealthMonitor(ServerRegistry& registry, HealthMonitorConfig config)
    : registry_(registry)
    , config_(config)
    , pool_(config.max_concurrency)
{}

HealthMonitor::~HealthMonitor() {
    stop();
}

// ─────────────────────────────────────────────────────────────────────────────
// Scheduling
// ─────────────────────────────────────────────────────────────────────────────

void HealthMonitor::start(asio::any_io_executor executor) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (timer_ != nullptr && timer_->is_running()) {
        return;
    }
    timer_ = std::make_unique<PeriodicTimer>(std::move(executor), config_.check_interval, [this] {
        (void)force_health_check();
    });
    timer_->start();
    get_logger().info_fmt("Health monitoring every {}ms", config_.check_interval.count());
}

void HealthMonitor::stop() {
    std::unique_ptr<PeriodicTimer> timer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        timer = std::move(timer_);
    }
    if (timer != nullptr) {
        timer->stop();
    }
}

bool HealthMonitor::is_running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return timer_ != nullptr && timer_->is_running();
}

void HealthMonitor::on_auto_disable(AutoDisableCallback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto_disable_callbacks_.push_back(std::move(callback));
}

// ─────────────────────────────────────────────────────────────────────────────
// Probing
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ProbeResult> HealthMonitor::force_health_check() {
    std::lock_guard<std::mutex> round(round_mutex_);

    const std::vector<std::string> names = registry_.connected_server_names();
    std::vector<ProbeResult> results(names.size());

    pool_.run_bounded(names.size(), [&](std::size_t index) {
        results[index] = probe_one(names[index]);
    });

    std::size_t failed = 0;
    for (const auto& result : results) {
        if (result.success == false) {
            ++failed;
        }
    }
    get_logger().debug_fmt("Health check: {} probed, {} failed", results.size(), failed);
    return results;
}

ProbeResult HealthMonitor::probe_one(const std::string& name) {
    ProbeResult result;
    result.server_name = name;

    auto connection = registry_.connection_for(name, ServerRegistry::Routing::IncludeDisabled);
    if (connection.has_value() == false) {
        // Disconnected between listing and probing; nothing to record.
        result.error = connection.error().message;
        return result;
    }

    auto outcome = pool_.run_with_timeout(
        [target = *connection] { return ServerRegistry::probe_connection(*target); },
        config_.probe_timeout);
    result.duration = outcome.duration;

    if (outcome.ok() && outcome.value->has_value()) {
        result.success = true;
        (void)registry_.record_success(name, outcome.duration);
        return result;
    }

    if (outcome.ok()) {
        result.error = outcome.value->error().describe();
    } else {
        result.error = outcome.error;
    }
    get_logger().debug_fmt("Health probe of '{}' failed: {}", name, result.error);
    (void)registry_.record_failure(name);

    const auto status = registry_.health_status(name);
    if (config_.auto_disable == false || status.has_value() == false || *status != HealthStatus::Unhealthy) {
        return result;
    }

    if (registry_.disable_server(name).has_value() == false) {
        return result;
    }
    result.auto_disabled = true;

    auto server = registry_.get_server(name);
    const HealthRecord record = server.has_value() ? server->health() : HealthRecord{};
    get_logger().warn_fmt("Auto-disabling unhealthy server '{}' after {} consecutive failures",
                          name, record.consecutive_failures);

    std::vector<AutoDisableCallback> callbacks;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        callbacks = auto_disable_callbacks_;
    }
    for (const auto& callback : callbacks) {
        callback(name, record);
    }
    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Snapshots
// ─────────────────────────────────────────────────────────────────────────────

std::vector<HealthSnapshot> HealthMonitor::snapshot() const {
    std::vector<HealthSnapshot> snapshots;
    for (const auto& server : registry_.list_servers()) {
        snapshots.push_back(HealthSnapshot::of(server));
    }
    return snapshots;
}

ServerResult<HealthSnapshot> HealthMonitor::server_health(const std::string& name) const {
    auto server = registry_.get_server(name);
    if (server.has_value() == false) {
        return tl::unexpected(server.error());
    }
    return HealthSnapshot::of(*server);
}

}  // namespace mcpchat
