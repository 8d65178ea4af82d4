#include <catch2/catch_test_macros.hpp>

#include "mcpchat/executor/concurrent_tool_executor.hpp"

#include "mocks/fake_server.hpp"

#include <chrono>
#include <set>
#include <thread>
#include <vector>

using namespace mcpchat;
using namespace mcpchat::testing;
using namespace std::chrono_literals;

namespace {

struct ExecutorFixture {
    std::shared_ptr<FakeConnector> connector = std::make_shared<FakeConnector>();
    ServerRegistry registry{connector};

    void add_connected(const std::string& name, FakeServerScript script = {}) {
        connector->script(name, std::move(script));
        REQUIRE(registry.register_server(name, fake_config(name)).has_value());
        REQUIRE(registry.connect_server(name).has_value());
    }
};

ToolCall call(std::string server, std::string tool, Json arguments = Json::object()) {
    return ToolCall{std::move(server), std::move(tool), std::move(arguments)};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Safety classification
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Mutating tool names are unsafe", "[executor][safety]") {
    const ExecutorConfig config;

    REQUIRE(tool_safe_for_concurrency("read_file", config));
    REQUIRE(tool_safe_for_concurrency("search", config));
    REQUIRE(tool_safe_for_concurrency("list_directory", config));

    REQUIRE(tool_safe_for_concurrency("write_file", config) == false);
    REQUIRE(tool_safe_for_concurrency("DeleteRecord", config) == false);
    REQUIRE(tool_safe_for_concurrency("user_update", config) == false);
    REQUIRE(tool_safe_for_concurrency("set_mode", config) == false);
    REQUIRE(tool_safe_for_concurrency("move_file", config) == false);
    REQUIRE(tool_safe_for_concurrency("shutdown", config) == false);
    REQUIRE(tool_safe_for_concurrency("drop_table", config) == false);
}

TEST_CASE("Disabling safety checks makes everything safe", "[executor][safety]") {
    ExecutorConfig config;
    config.safety_checks = false;

    REQUIRE(tool_safe_for_concurrency("delete_everything", config));
    REQUIRE(tool_safe_for_concurrency("shutdown", config));
}

// ─────────────────────────────────────────────────────────────────────────────
// Grouping
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Same-server mode chains calls per server", "[executor][groups]") {
    const std::vector<ToolCall> calls = {
        call("a", "read"), call("b", "read"), call("a", "write_file"), call("c", "x"), call("b", "y")
    };

    const auto groups = ConcurrentToolExecutor::plan_groups(calls, ExecutorConfig{});

    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0] == std::vector<std::size_t>{0, 2});
    REQUIRE(groups[1] == std::vector<std::size_t>{1, 4});
    REQUIRE(groups[2] == std::vector<std::size_t>{3});
}

TEST_CASE("Without same-server mode unsafe calls share one chain", "[executor][groups]") {
    ExecutorConfig config;
    config.same_server_sequential = false;
    const std::vector<ToolCall> calls = {
        call("a", "read"), call("a", "write_file"), call("b", "search"), call("b", "delete_row")
    };

    const auto groups = ConcurrentToolExecutor::plan_groups(calls, config);

    REQUIRE(groups.size() == 3);
    REQUIRE(groups[0] == std::vector<std::size_t>{0});
    REQUIRE(groups[1] == std::vector<std::size_t>{1, 3});
    REQUIRE(groups[2] == std::vector<std::size_t>{2});
}

// ─────────────────────────────────────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Calls to one server run in submission order", "[executor]") {
    ExecutorFixture f;
    FakeServerScript script;
    script.call_latency = 10ms;
    f.add_connected("a", script);
    f.add_connected("b", script);

    ExecutorConfig config;
    config.max_concurrency = 4;
    ConcurrentToolExecutor executor(f.registry, config);

    const std::vector<ToolCall> calls = {
        call("a", "t1"), call("b", "t1"), call("a", "t2"), call("b", "t2"), call("a", "t3")
    };
    const auto results = executor.execute_concurrent(calls);

    REQUIRE(results.size() == 5);
    for (std::size_t i = 0; i < calls.size(); ++i) {
        REQUIRE(results[i].ok());
        REQUIRE(results[i].server_name == calls[i].server_name);
        REQUIRE(results[i].tool_name == calls[i].tool_name);
    }

    auto& log = f.connector->calls();
    std::vector<std::string> on_a;
    for (const auto& started : log.started) {
        if (started.rfind("a:", 0) == 0) {
            on_a.push_back(started);
        }
    }
    REQUIRE(on_a == std::vector<std::string>{"a:t1", "a:t2", "a:t3"});
    REQUIRE(log.server_peak["a"] == 1);
    REQUIRE(log.server_peak["b"] == 1);
}

TEST_CASE("Different servers run side by side", "[executor]") {
    ExecutorFixture f;
    FakeServerScript script;
    script.call_latency = 80ms;
    f.add_connected("a", script);
    f.add_connected("b", script);
    f.add_connected("c", script);

    ConcurrentToolExecutor executor(f.registry);
    const auto started = std::chrono::steady_clock::now();
    const auto results = executor.execute_concurrent({call("a", "x"), call("b", "x"), call("c", "x")});
    const auto elapsed = std::chrono::steady_clock::now() - started;

    REQUIRE(results.size() == 3);
    REQUIRE(elapsed < 220ms);
    REQUIRE(executor.get_execution_stats().peak_concurrency >= 2);
}

TEST_CASE("Failures and timeouts are reported per call", "[executor]") {
    ExecutorFixture f;
    FakeServerScript broken;
    broken.calls_fail = true;
    f.add_connected("broken", broken);
    FakeServerScript slow;
    slow.call_latency = 400ms;
    f.add_connected("slow", slow);
    f.add_connected("ok");

    ExecutorConfig config;
    config.timeout = 100ms;
    ConcurrentToolExecutor executor(f.registry, config);

    const auto results = executor.execute_concurrent({
        call("broken", "x"), call("slow", "x"), call("ok", "x"), call("missing", "x")
    });

    REQUIRE(results[0].status == ExecutionStatus::Failed);
    REQUIRE(results[0].error->find("failed") != std::string::npos);

    REQUIRE(results[1].status == ExecutionStatus::Failed);
    REQUIRE(results[1].timed_out);

    REQUIRE(results[2].ok());
    REQUIRE(results[2].result.has_value());
    REQUIRE((*results[2].result)["content"][0]["text"] == "ok:x");

    REQUIRE(results[3].ok() == false);
    REQUIRE(results[3].error->find("not found") != std::string::npos);
}

TEST_CASE("A timed-out call counts once as a failure", "[executor][health]") {
    ExecutorFixture f;
    FakeServerScript slow;
    slow.call_latency = 400ms;
    f.add_connected("slow", slow);

    ExecutorConfig config;
    config.timeout = 100ms;
    ConcurrentToolExecutor executor(f.registry, config);

    const auto results = executor.execute_concurrent({call("slow", "x")});
    REQUIRE(results[0].timed_out);

    auto record = f.registry.get_server("slow")->health();
    REQUIRE(record.failed_requests == 1);
    REQUIRE(record.successful_requests == 0);
    REQUIRE(record.consecutive_failures == 1);

    // The reply still arrives once the latency has passed.
    std::this_thread::sleep_for(500ms);

    record = f.registry.get_server("slow")->health();
    REQUIRE(record.failed_requests == 1);
    REQUIRE(record.successful_requests == 0);
    REQUIRE(record.total_requests == 1);
}

TEST_CASE("Executed calls update the target's health", "[executor][health]") {
    ExecutorFixture f;
    FakeServerScript broken;
    broken.calls_fail = true;
    f.add_connected("a");
    f.add_connected("broken", broken);
    ConcurrentToolExecutor executor(f.registry);

    (void)executor.execute_concurrent({call("a", "x"), call("broken", "y"), call("missing", "z")});

    REQUIRE(f.registry.get_server("a")->health().successful_requests == 1);
    REQUIRE(f.registry.get_server("broken")->health().failed_requests == 1);
    REQUIRE(f.registry.contains("missing") == false);
}

TEST_CASE("Execution ids are unique across batches", "[executor]") {
    ExecutorFixture f;
    f.add_connected("a");
    ConcurrentToolExecutor executor(f.registry);

    const auto first = executor.execute_concurrent({call("a", "x"), call("a", "y")});
    const auto second = executor.execute_concurrent({call("a", "x")});

    std::set<std::string> ids{first[0].id, first[1].id, second[0].id};
    REQUIRE(ids.size() == 3);
    REQUIRE(first[0].id.rfind("exec_0_", 0) == 0);
    REQUIRE(first[1].id.rfind("exec_1_", 0) == 0);
}

TEST_CASE("Progress reports every call", "[executor]") {
    ExecutorFixture f;
    FakeServerScript broken;
    broken.calls_fail = true;
    f.add_connected("a");
    f.add_connected("broken", broken);
    ConcurrentToolExecutor executor(f.registry);

    std::vector<ExecutionProgress> events;
    (void)executor.execute_concurrent({call("a", "x"), call("broken", "y"), call("a", "z")},
                                      [&events](const ExecutionProgress& p) { events.push_back(p); });

    REQUIRE(events.size() == 5);
    REQUIRE(events.front().phase == ExecutionPhase::Starting);
    REQUIRE(events[3].completed == 3);
    REQUIRE(events.back().phase == ExecutionPhase::Completed);
    REQUIRE(events.back().completed == 2);
    REQUIRE(events.back().failed == 1);
}

TEST_CASE("Stats accumulate across batches", "[executor]") {
    ExecutorFixture f;
    FakeServerScript broken;
    broken.calls_fail = true;
    f.add_connected("a");
    f.add_connected("broken", broken);
    ConcurrentToolExecutor executor(f.registry);

    REQUIRE(executor.get_execution_stats().total_executions == 0);
    REQUIRE(executor.get_execution_stats().success_rate == 0.0);

    (void)executor.execute_concurrent({call("a", "x"), call("a", "y"), call("a", "z")});
    (void)executor.execute_concurrent({call("broken", "x")});

    const auto stats = executor.get_execution_stats();
    REQUIRE(stats.total_executions == 4);
    REQUIRE(stats.successful == 3);
    REQUIRE(stats.failed == 1);
    REQUIRE(stats.success_rate == 75.0);
    REQUIRE(stats.to_json()["peak_concurrency"].get<std::size_t>() >= 1);
}

TEST_CASE("An empty batch returns no results", "[executor]") {
    ExecutorFixture f;
    ConcurrentToolExecutor executor(f.registry);

    REQUIRE(executor.execute_concurrent({}).empty());
}
