#include "mcpchat/connection/parallel_connection_manager.hpp"
#include "mcpchat/log/logger.hpp"

#include <algorithm>
#include <future>
#include <mutex>
#include <thread>

namespace mcpchat {

namespace {

// Settles the race between an attempt finishing and its caller giving up.
// Whichever side arrives second closes the connection.
class AttemptHandoff {
public:
    [[nodiscard]] bool deliver(const ConnectionHandle& connection) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (abandoned_) {
            return false;
        }
        delivered_ = connection;
        return true;
    }

    void abandon() {
        ConnectionHandle late;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            abandoned_ = true;
            late = std::move(delivered_);
        }
        if (late != nullptr) {
            late->disconnect();
        }
    }

private:
    std::mutex mutex_;
    bool abandoned_{false};
    ConnectionHandle delivered_;
};

}  // namespace

std::optional<ConnectionMode> connection_mode_from_string(std::string_view text) {
    for (const auto mode : {ConnectionMode::Eager, ConnectionMode::Background, ConnectionMode::Lazy}) {
        if (to_string(mode) == text) {
            return mode;
        }
    }
    return std::nullopt;
}

ParallelConnectionManager::ParallelConnectionManager(ServerRegistry& registry, ParallelConnectionConfig config)
    : registry_(registry)
    , config_(config)
    , pool_(config.max_concurrency)
{}

ParallelConnectionManager::~ParallelConnectionManager() {
    std::lock_guard<std::mutex> lock(background_mutex_);
    if (background_.valid()) {
        background_.wait();
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Start-up modes
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ConnectionResult> ParallelConnectionManager::connect_with_mode(
    const std::vector<std::pair<std::string, ServerConfig>>& servers,
    ProgressCallback on_progress
) {
    if (config_.mode == ConnectionMode::Eager) {
        return connect_servers_parallel(servers, std::move(on_progress));
    }

    std::vector<std::pair<std::string, ServerConfig>> registered;
    std::vector<ConnectionResult> rejected = register_all(servers, registered);

    if (config_.mode == ConnectionMode::Lazy) {
        registry_.set_lazy_connect(true);
        get_logger().info_fmt("Registered {} servers; each connects on first use", registered.size());
        return rejected;
    }

    std::lock_guard<std::mutex> lock(background_mutex_);
    if (background_.valid()) {
        get_logger().warn("A background start-up is already running; waiting for it first");
        background_.wait();
    }
    get_logger().info_fmt("Connecting {} servers in the background", registered.size());
    background_ = std::async(std::launch::async,
        [this, pending = std::move(registered), progress = std::move(on_progress)] {
            return connect_servers_parallel(pending, progress);
        });
    return rejected;
}

std::vector<ConnectionResult> ParallelConnectionManager::wait_for_background() {
    std::lock_guard<std::mutex> lock(background_mutex_);
    if (background_.valid() == false) {
        return {};
    }
    return background_.get();
}

std::vector<ConnectionResult> ParallelConnectionManager::register_all(
    const std::vector<std::pair<std::string, ServerConfig>>& servers,
    std::vector<std::pair<std::string, ServerConfig>>& registered
) {
    std::vector<ConnectionResult> rejected;
    for (const auto& [name, config] : servers) {
        auto ok = ensure_registered(name, config);
        if (ok.has_value()) {
            registered.emplace_back(name, config);
            continue;
        }
        ConnectionResult result;
        result.server_name = name;
        result.config = config;
        result.error = ok.error().message;
        rejected.push_back(std::move(result));
    }
    return rejected;
}

std::vector<ConnectionResult> ParallelConnectionManager::connect_servers_parallel(
    const std::vector<std::pair<std::string, ServerConfig>>& servers,
    ProgressCallback on_progress
) {
    const auto started = std::chrono::steady_clock::now();
    const std::size_t total = servers.size();

    get_logger().info_fmt("Connecting {} servers (max {} at once)", total, pool_.max_concurrency());

    std::mutex progress_mutex;
    std::size_t resolved = 0;
    std::size_t failed = 0;

    if (on_progress) {
        on_progress(ConnectionProgress{ConnectionPhase::Starting, total, 0, 0, {}, Millis{0}});
    }

    std::vector<ConnectionResult> results(total);
    pool_.run_bounded(total, [&](std::size_t index) {
        const auto& [name, config] = servers[index];
        results[index] = connect_one(name, config);

        std::lock_guard<std::mutex> lock(progress_mutex);
        resolved += 1;
        if (results[index].ok() == false) {
            failed += 1;
        }
        if (on_progress) {
            on_progress(ConnectionProgress{
                ConnectionPhase::Connecting, total, resolved, failed, name,
                std::chrono::steady_clock::now() - started});
        }
    });

    const ConnectionSummary summary = summarize(results);
    const Millis elapsed = std::chrono::steady_clock::now() - started;
    if (on_progress) {
        on_progress(ConnectionProgress{
            ConnectionPhase::Completed, total, summary.successful, summary.failed, {}, elapsed});
    }

    get_logger().info_fmt("Connected {}/{} servers in {:.0f}ms", summary.successful, total, elapsed.count());
    return results;
}

ServerResult<void> ParallelConnectionManager::ensure_registered(const std::string& name, const ServerConfig& config) {
    auto registered = registry_.register_server(name, config);
    if (registered.has_value()) {
        return {};
    }
    if (registered.error().code != ServerErrorCode::AlreadyRegistered) {
        return registered;
    }

    // A record still waiting for its first attempt can be reused.
    auto existing = registry_.get_server(name);
    if (existing.has_value() && existing->status() == ServerStatus::Connecting) {
        return {};
    }
    return registered;
}

ConnectionResult ParallelConnectionManager::connect_one(const std::string& name, const ServerConfig& config) {
    ConnectionResult result;
    result.server_name = name;
    result.config = config;
    const auto started = std::chrono::steady_clock::now();

    auto finish = [&](ConnectionStatus status, std::optional<std::string> error) {
        result.status = status;
        result.error = std::move(error);
        result.duration = std::chrono::steady_clock::now() - started;
        return result;
    };

    auto registered = ensure_registered(name, config);
    if (registered.has_value() == false) {
        return finish(ConnectionStatus::Failed, registered.error().message);
    }

    ServerRegistry* registry = &registry_;
    const std::uint32_t max_attempts = std::max<std::uint32_t>(1, config_.retry_attempts);
    std::string last_error;

    for (std::uint32_t attempt = 1; attempt <= max_attempts; ++attempt) {
        result.attempts = attempt;

        auto handoff = std::make_shared<AttemptHandoff>();
        auto outcome = pool_.run_with_timeout(
            [registry, name, handoff] {
                return registry->establish_connection(name, [handoff](const ConnectionHandle& connection) {
                    return handoff->deliver(connection);
                });
            },
            config_.connection_timeout);

        if (outcome.status == TaskStatus::TimedOut) {
            handoff->abandon();
            result.timed_out = true;
            last_error = "connection timed out after " + std::to_string(config_.connection_timeout.count()) + "ms";
            (void)registry_.mark_failed(name, last_error);
            return finish(ConnectionStatus::Failed, last_error);
        }

        if (outcome.ok() && outcome.value->has_value()) {
            EstablishedConnection& established = **outcome.value;
            auto marked = registry_.mark_connected(name, established.connection, std::move(established.capabilities));
            if (marked.has_value() == false) {
                established.connection->disconnect();
                return finish(ConnectionStatus::Failed, marked.error().message);
            }
            return finish(ConnectionStatus::Success, std::nullopt);
        }

        last_error = outcome.ok() ? outcome.value->error().message : outcome.error;
        get_logger().debug_fmt("Attempt {}/{} for '{}' failed: {}", attempt, max_attempts, name, last_error);

        if (outcome.ok() && outcome.value->error().code == ServerErrorCode::ServerNotFound) {
            break;
        }
        if (attempt < max_attempts) {
            std::this_thread::sleep_for(config_.retry_delay);
        }
    }

    (void)registry_.mark_failed(name, last_error);
    return finish(ConnectionStatus::Failed, last_error);
}

ConnectionSummary ParallelConnectionManager::summarize(const std::vector<ConnectionResult>& results) {
    ConnectionSummary summary;
    summary.total = results.size();
    Millis total_duration{0};
    for (const auto& result : results) {
        if (result.ok()) {
            summary.successful += 1;
        } else {
            summary.failed += 1;
        }
        total_duration += result.duration;
    }
    if (summary.total > 0) {
        summary.success_rate = static_cast<double>(summary.successful) / static_cast<double>(summary.total) * 100.0;
        summary.average_duration = total_duration / static_cast<double>(summary.total);
    }
    return summary;
}

}  // namespace mcpchat
