#include "mcpchat/executor/concurrent_tool_executor.hpp"
#include "mcpchat/log/logger.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <cstdint>
#include <map>

namespace mcpchat {

namespace {

constexpr std::array<std::string_view, 7> kUnsafePatterns = {
    "delete", "write", "create", "update", "modify", "remove", "set_"
};

constexpr std::array<std::string_view, 13> kUnsafeTools = {
    "write_file", "delete_file", "move_file", "create_directory",
    "set_config", "update_settings", "reset_state", "restart_service",
    "shutdown", "kill_process", "create_table", "drop_table", "truncate_table"
};

[[nodiscard]] std::string lowercase(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    return out;
}

[[nodiscard]] std::string next_execution_id(std::size_t index) {
    static std::atomic<std::uint64_t> sequence{1};
    return "exec_" + std::to_string(index) + "_" + std::to_string(sequence.fetch_add(1));
}

}  // namespace

bool tool_safe_for_concurrency(std::string_view tool_name, const ExecutorConfig& config) {
    if (config.safety_checks == false) {
        return true;
    }

    const std::string lowered = lowercase(tool_name);
    for (const auto pattern : kUnsafePatterns) {
        if (lowered.find(pattern) != std::string::npos) {
            return false;
        }
    }
    return std::find(kUnsafeTools.begin(), kUnsafeTools.end(), lowered) == kUnsafeTools.end();
}

Json ExecutionResult::to_json() const {
    Json j = {
        {"id", id},
        {"server", server_name},
        {"tool", tool_name},
        {"status", to_string(status)},
        {"duration_ms", duration.count()}
    };
    if (result.has_value()) {
        j["result"] = *result;
    }
    if (error.has_value()) {
        j["error"] = *error;
    }
    return j;
}

Json ExecutionStats::to_json() const {
    return {
        {"total_executions", total_executions},
        {"successful", successful},
        {"failed", failed},
        {"success_rate", success_rate},
        {"average_duration_ms", average_duration.count()},
        {"peak_concurrency", peak_concurrency}
    };
}

ConcurrentToolExecutor::ConcurrentToolExecutor(ServerRegistry& registry, ExecutorConfig config)
    : registry_(registry)
    , config_(config)
    , pool_(config.max_concurrency)
{}

// ─────────────────────────────────────────────────────────────────────────────
// Grouping
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::vector<std::size_t>> ConcurrentToolExecutor::plan_groups(
    const std::vector<ToolCall>& calls, const ExecutorConfig& config
) {
    std::vector<std::vector<std::size_t>> groups;

    if (config.same_server_sequential) {
        std::map<std::string, std::size_t> group_of_server;
        for (std::size_t i = 0; i < calls.size(); ++i) {
            auto [it, inserted] = group_of_server.try_emplace(calls[i].server_name, groups.size());
            if (inserted) {
                groups.emplace_back();
            }
            groups[it->second].push_back(i);
        }
        return groups;
    }

    std::optional<std::size_t> unsafe_group;
    for (std::size_t i = 0; i < calls.size(); ++i) {
        if (tool_safe_for_concurrency(calls[i].tool_name, config)) {
            groups.push_back({i});
            continue;
        }
        if (unsafe_group.has_value() == false) {
            unsafe_group = groups.size();
            groups.emplace_back();
        }
        groups[*unsafe_group].push_back(i);
    }
    return groups;
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

std::vector<ExecutionResult> ConcurrentToolExecutor::execute_concurrent(
    const std::vector<ToolCall>& calls,
    ProgressCallback on_progress
) {
    const auto started = std::chrono::steady_clock::now();
    const std::size_t total = calls.size();
    const auto groups = plan_groups(calls, config_);

    get_logger().debug_fmt("Executing {} tool calls in {} groups", total, groups.size());

    if (on_progress) {
        on_progress(ExecutionProgress{ExecutionPhase::Starting, total, 0, 0, {}, Millis{0}});
    }

    std::mutex progress_mutex;
    std::size_t done = 0;
    std::size_t failed = 0;
    std::vector<ExecutionResult> results(total);

    pool_.run_bounded(groups.size(), [&](std::size_t group_index) {
        for (const std::size_t index : groups[group_index]) {
            results[index] = execute_one(index, calls[index]);

            std::lock_guard<std::mutex> lock(progress_mutex);
            done += 1;
            if (results[index].ok() == false) {
                failed += 1;
            }
            if (on_progress) {
                on_progress(ExecutionProgress{
                    ExecutionPhase::Executing, total, done, failed,
                    calls[index].server_name + ":" + calls[index].tool_name,
                    std::chrono::steady_clock::now() - started});
            }
        }
    });

    if (on_progress) {
        on_progress(ExecutionProgress{
            ExecutionPhase::Completed, total, total - failed, failed, {},
            std::chrono::steady_clock::now() - started});
    }
    return results;
}

ExecutionResult ConcurrentToolExecutor::execute_one(std::size_t index, const ToolCall& call) {
    ExecutionResult result;
    result.id = next_execution_id(index);
    result.server_name = call.server_name;
    result.tool_name = call.tool_name;

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        in_flight_ += 1;
        stats_.peak_concurrency = std::max(stats_.peak_concurrency, in_flight_);
    }

    auto connection = registry_.connection_for(call.server_name);
    if (connection.has_value() == false) {
        // Nothing was sent, so the server's health is left alone.
        result.error = connection.error().message;
        get_logger().debug_fmt("Tool {}:{} not routed: {}", call.server_name, call.tool_name, *result.error);
        record(result);
        return result;
    }

    get_logger().debug_fmt("Calling {}:{}", call.server_name, call.tool_name);

    // The job holds the connection, not the registry, and is the only place
    // the outcome is seen. A reply arriving after the deadline is dropped
    // with the abandoned job and never reaches the health record.
    auto outcome = pool_.run_with_timeout(
        [target = *connection, call] { return target->call_tool(call.tool_name, call.arguments); },
        config_.timeout);

    result.duration = outcome.duration;
    if (outcome.status == TaskStatus::TimedOut) {
        result.timed_out = true;
        result.error = "tool call timed out after " + std::to_string(config_.timeout.count()) + "ms";
    } else if (outcome.ok() == false) {
        result.error = outcome.error;
    } else if (outcome.value->has_value()) {
        result.status = ExecutionStatus::Success;
        result.result = std::move(**outcome.value);
    } else {
        result.error = outcome.value->error().describe();
    }

    if (result.ok()) {
        (void)registry_.record_success(call.server_name, result.duration);
    } else {
        (void)registry_.record_failure(call.server_name);
    }

    if (result.ok() == false) {
        get_logger().debug_fmt("Tool {}:{} failed: {}", call.server_name, call.tool_name, *result.error);
    }

    record(result);
    return result;
}

void ConcurrentToolExecutor::record(const ExecutionResult& result) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    in_flight_ -= 1;
    stats_.total_executions += 1;
    if (result.ok()) {
        stats_.successful += 1;
    } else {
        stats_.failed += 1;
    }
    total_duration_ += result.duration;
}

ExecutionStats ConcurrentToolExecutor::get_execution_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    ExecutionStats stats = stats_;
    if (stats.total_executions > 0) {
        const auto total = static_cast<double>(stats.total_executions);
        stats.success_rate = static_cast<double>(stats.successful) / total * 100.0;
        stats.average_duration = total_duration_ / total;
    }
    return stats;
}

}  // namespace mcpchat
