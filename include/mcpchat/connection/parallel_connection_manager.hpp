#pragma once

#include "mcpchat/async/task_pool.hpp"
#include "mcpchat/server/server_registry.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpchat {

/// How start-up brings servers up.
///   Eager       connect everything before returning
///   Background  register everything, connect on a worker thread
///   Lazy        register everything, connect each on its first routed call
enum class ConnectionMode { Eager, Background, Lazy };

[[nodiscard]] constexpr std::string_view to_string(ConnectionMode mode) noexcept {
    switch (mode) {
        case ConnectionMode::Eager:      return "eager";
        case ConnectionMode::Background: return "background";
        case ConnectionMode::Lazy:       return "lazy";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ConnectionMode> connection_mode_from_string(std::string_view text);

struct ParallelConnectionConfig {
    ConnectionMode mode{ConnectionMode::Eager};
    std::size_t max_concurrency{10};
    std::chrono::milliseconds connection_timeout{30'000};   // per attempt
    std::uint32_t retry_attempts{2};                        // total attempts per server
    std::chrono::milliseconds retry_delay{100};
};

enum class ConnectionPhase { Starting, Connecting, Completed };

[[nodiscard]] constexpr std::string_view to_string(ConnectionPhase phase) noexcept {
    switch (phase) {
        case ConnectionPhase::Starting:   return "starting";
        case ConnectionPhase::Connecting: return "connecting";
        case ConnectionPhase::Completed:  return "completed";
    }
    return "unknown";
}

/// Starting: completed=0. Connecting: one event per resolved server, with
/// running totals. Completed: `completed` counts successes.
struct ConnectionProgress {
    ConnectionPhase phase{ConnectionPhase::Starting};
    std::size_t total{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::string current_server;
    Millis elapsed{0};
};

enum class ConnectionStatus { Success, Failed };

struct ConnectionResult {
    std::string server_name;
    ServerConfig config;
    ConnectionStatus status{ConnectionStatus::Failed};
    std::optional<std::string> error;
    Millis duration{0};
    std::uint32_t attempts{0};
    bool timed_out{false};

    [[nodiscard]] bool ok() const noexcept { return status == ConnectionStatus::Success; }
};

struct ConnectionSummary {
    std::size_t total{0};
    std::size_t successful{0};
    std::size_t failed{0};
    double success_rate{0.0};
    Millis average_duration{0};
};

// ═══════════════════════════════════════════════════════════════════════════
// ParallelConnectionManager
// ═══════════════════════════════════════════════════════════════════════════
// Brings up many servers at once. At most max_concurrency attempts are in
// flight; each is bounded by connection_timeout and a slow one never holds
// back the rest. Connect errors are retried, timeouts are not: the attempt
// is abandoned, the server marked failed, and whatever the attempt produces
// later is closed.

class ParallelConnectionManager {
public:
    using ProgressCallback = std::function<void(const ConnectionProgress&)>;

    explicit ParallelConnectionManager(ServerRegistry& registry, ParallelConnectionConfig config = {});

    /// Joins a background start-up still in progress.
    ~ParallelConnectionManager();

    ParallelConnectionManager(const ParallelConnectionManager&) = delete;
    ParallelConnectionManager& operator=(const ParallelConnectionManager&) = delete;

    /// Registers and connects every entry. Returns once all attempts have
    /// resolved, with results in input order.
    std::vector<ConnectionResult> connect_servers_parallel(
        const std::vector<std::pair<std::string, ServerConfig>>& servers,
        ProgressCallback on_progress = {}
    );

    /// Starts servers the way config().mode says. Only Eager returns results;
    /// Background and Lazy return once every entry is registered. Entries
    /// that fail to register are reported as failed results in every mode.
    std::vector<ConnectionResult> connect_with_mode(
        const std::vector<std::pair<std::string, ServerConfig>>& servers,
        ProgressCallback on_progress = {}
    );

    /// Results of a background start-up, waiting for it if needed. Empty when
    /// none was started.
    std::vector<ConnectionResult> wait_for_background();

    [[nodiscard]] static ConnectionSummary summarize(const std::vector<ConnectionResult>& results);

    [[nodiscard]] const ParallelConnectionConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] ConnectionResult connect_one(const std::string& name, const ServerConfig& config);
    [[nodiscard]] ServerResult<void> ensure_registered(const std::string& name, const ServerConfig& config);
    [[nodiscard]] std::vector<ConnectionResult> register_all(
        const std::vector<std::pair<std::string, ServerConfig>>& servers,
        std::vector<std::pair<std::string, ServerConfig>>& registered);

    ServerRegistry& registry_;
    ParallelConnectionConfig config_;
    TaskPool pool_;

    std::mutex background_mutex_;
    std::future<std::vector<ConnectionResult>> background_;
};

}  // namespace mcpchat
