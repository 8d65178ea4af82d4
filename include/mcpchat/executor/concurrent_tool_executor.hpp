#pragma once

#include "mcpchat/async/task_pool.hpp"
#include "mcpchat/server/server_registry.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mcpchat {

struct ToolCall {
    std::string server_name;
    std::string tool_name;
    Json arguments = Json::object();
};

struct ExecutorConfig {
    std::size_t max_concurrency{4};
    std::chrono::milliseconds timeout{30'000};   // per call
    bool same_server_sequential{true};
    bool safety_checks{true};
};

/// False for tools that look like they mutate state: any name containing
/// delete, write, create, update, modify, remove or set_ (case-insensitive),
/// plus a fixed deny-list. Always true when safety checks are off.
[[nodiscard]] bool tool_safe_for_concurrency(std::string_view tool_name, const ExecutorConfig& config);

enum class ExecutionStatus { Success, Failed };

[[nodiscard]] constexpr std::string_view to_string(ExecutionStatus status) noexcept {
    switch (status) {
        case ExecutionStatus::Success: return "success";
        case ExecutionStatus::Failed:  return "failed";
    }
    return "unknown";
}

struct ExecutionResult {
    std::string id;   // exec_<index>_<unique>
    std::string server_name;
    std::string tool_name;
    ExecutionStatus status{ExecutionStatus::Failed};
    std::optional<Json> result;
    std::optional<std::string> error;
    Millis duration{0};
    bool timed_out{false};

    [[nodiscard]] bool ok() const noexcept { return status == ExecutionStatus::Success; }
    [[nodiscard]] Json to_json() const;
};

enum class ExecutionPhase { Starting, Executing, Completed };

[[nodiscard]] constexpr std::string_view to_string(ExecutionPhase phase) noexcept {
    switch (phase) {
        case ExecutionPhase::Starting:  return "starting";
        case ExecutionPhase::Executing: return "executing";
        case ExecutionPhase::Completed: return "completed";
    }
    return "unknown";
}

struct ExecutionProgress {
    ExecutionPhase phase{ExecutionPhase::Starting};
    std::size_t total{0};
    std::size_t completed{0};
    std::size_t failed{0};
    std::string current_tool;   // "server:tool"
    Millis elapsed{0};
};

struct ExecutionStats {
    std::size_t total_executions{0};
    std::size_t successful{0};
    std::size_t failed{0};
    double success_rate{0.0};
    Millis average_duration{0};
    std::size_t peak_concurrency{0};

    [[nodiscard]] Json to_json() const;
};

// ═══════════════════════════════════════════════════════════════════════════
// ConcurrentToolExecutor
// ═══════════════════════════════════════════════════════════════════════════
// Runs a batch of tool calls through the registry. Calls are split into
// groups; each group is a chain executed in submission order, and groups
// run side by side on at most max_concurrency workers.
//
//   same_server_sequential   one chain per server
//   otherwise                every safe call alone, all unsafe calls in a
//                            single chain

class ConcurrentToolExecutor {
public:
    using ProgressCallback = std::function<void(const ExecutionProgress&)>;

    explicit ConcurrentToolExecutor(ServerRegistry& registry, ExecutorConfig config = {});

    /// Results in submission order.
    std::vector<ExecutionResult> execute_concurrent(
        const std::vector<ToolCall>& calls,
        ProgressCallback on_progress = {}
    );

    [[nodiscard]] ExecutionStats get_execution_stats() const;

    [[nodiscard]] const ExecutorConfig& config() const noexcept { return config_; }

    /// Indices of `calls` grouped into chains, ordered by first member.
    [[nodiscard]] static std::vector<std::vector<std::size_t>> plan_groups(
        const std::vector<ToolCall>& calls, const ExecutorConfig& config);

private:
    [[nodiscard]] ExecutionResult execute_one(std::size_t index, const ToolCall& call);
    void record(const ExecutionResult& result);

    ServerRegistry& registry_;
    ExecutorConfig config_;
    TaskPool pool_;

    mutable std::mutex stats_mutex_;
    ExecutionStats stats_;
    Millis total_duration_{0};
    std::size_t in_flight_{0};
};

}  // namespace mcpchat
