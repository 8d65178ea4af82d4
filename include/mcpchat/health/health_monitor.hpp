#pragma once

#include "mcpchat/async/periodic_timer.hpp"
#include "mcpchat/async/task_pool.hpp"
#include "mcpchat/server/server_registry.hpp"

#include <asio/any_io_executor.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace mcpchat {

struct HealthMonitorConfig {
    std::chrono::milliseconds check_interval{30'000};
    std::chrono::milliseconds probe_timeout{5'000};
    std::size_t max_concurrency{4};
    bool auto_disable{true};
};

struct ProbeResult {
    std::string server_name;
    bool success{false};
    Millis duration{0};
    std::string error;
    bool auto_disabled{false};   // this probe took the server out of rotation
};

/// Read-only view of one server's health.
struct HealthSnapshot {
    std::string server_name;
    ServerStatus status{ServerStatus::Connecting};
    HealthStatus health_status{HealthStatus::Unknown};
    HealthRecord record;
    double success_rate{0.0};
    std::optional<std::chrono::seconds> uptime;
    bool disabled{false};

    [[nodiscard]] static HealthSnapshot of(const Server& server);
    [[nodiscard]] Json to_json() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// HealthMonitor
// ═══════════════════════════════════════════════════════════════════════════
// Every check_interval, probes each connected, enabled server once with
// `tools/list`, bounded by probe_timeout. Probe outcomes feed the same
// health record as real calls. A server whose record turns unhealthy is
// auto-disabled: it stays connected but receives no new calls until it is
// enabled again or reconnected.

class HealthMonitor {
public:
    using AutoDisableCallback = std::function<void(const std::string& server_name, const HealthRecord& record)>;

    explicit HealthMonitor(ServerRegistry& registry, HealthMonitorConfig config = {});
    ~HealthMonitor();

    HealthMonitor(const HealthMonitor&) = delete;
    HealthMonitor& operator=(const HealthMonitor&) = delete;

    /// Starts periodic checks on `executor`. The first check runs one
    /// interval from now.
    void start(asio::any_io_executor executor);
    void stop();
    [[nodiscard]] bool is_running() const;

    /// Runs one full round now and returns its outcomes.
    std::vector<ProbeResult> force_health_check();

    [[nodiscard]] std::vector<HealthSnapshot> snapshot() const;
    [[nodiscard]] ServerResult<HealthSnapshot> server_health(const std::string& name) const;

    void on_auto_disable(AutoDisableCallback callback);

    [[nodiscard]] const HealthMonitorConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ProbeResult probe_one(const std::string& name);

    ServerRegistry& registry_;
    HealthMonitorConfig config_;
    TaskPool pool_;

    std::mutex round_mutex_;
    mutable std::mutex mutex_;
    std::unique_ptr<PeriodicTimer> timer_;
    std::vector<AutoDisableCallback> auto_disable_callbacks_;
};

}  // namespace mcpchat
