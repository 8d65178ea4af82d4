#include <catch2/catch_test_macros.hpp>

#include "mcpchat/async/runtime.hpp"
#include "mcpchat/health/health_monitor.hpp"

#include "mocks/fake_server.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace mcpchat;
using namespace mcpchat::testing;
using namespace std::chrono_literals;

namespace {

struct MonitorFixture {
    std::shared_ptr<FakeConnector> connector = std::make_shared<FakeConnector>();
    ServerRegistry registry{connector};

    void add_connected(const std::string& name, FakeServerScript script = {}) {
        connector->script(name, std::move(script));
        REQUIRE(registry.register_server(name, fake_config(name)).has_value());
        REQUIRE(registry.connect_server(name).has_value());
    }
};

}  // namespace

TEST_CASE("A healthy round records one success per server", "[health]") {
    MonitorFixture f;
    f.add_connected("a");
    f.add_connected("b");
    HealthMonitor monitor(f.registry);

    const auto results = monitor.force_health_check();

    REQUIRE(results.size() == 2);
    for (const auto& result : results) {
        REQUIRE(result.success);
        REQUIRE(result.auto_disabled == false);
    }
    REQUIRE(f.registry.get_server("a")->health().successful_requests == 1);
    REQUIRE(f.registry.get_server("a")->health().last_ping.has_value());
}

TEST_CASE("Three failed probes disable the server", "[health]") {
    MonitorFixture f;
    FakeServerScript script;
    script.probes_fail = true;
    f.add_connected("flaky", script);
    f.add_connected("steady");

    HealthMonitor monitor(f.registry);
    std::vector<std::string> disabled;
    std::uint32_t failures_seen = 0;
    monitor.on_auto_disable([&](const std::string& name, const HealthRecord& record) {
        disabled.push_back(name);
        failures_seen = record.consecutive_failures;
    });

    (void)monitor.force_health_check();
    (void)monitor.force_health_check();
    REQUIRE(disabled.empty());
    REQUIRE(f.registry.health_status("flaky").value() == HealthStatus::Healthy);

    const auto third = monitor.force_health_check();

    REQUIRE(disabled == std::vector<std::string>{"flaky"});
    REQUIRE(failures_seen == 3);
    REQUIRE(f.registry.health_status("flaky").value() == HealthStatus::Unhealthy);
    REQUIRE(f.registry.get_server("flaky")->disabled());
    REQUIRE(f.registry.get_server("flaky")->status() == ServerStatus::Connected);
    REQUIRE(f.registry.call_tool("flaky", "echo", Json::object()).error().code == ServerErrorCode::ServerDisabled);
    REQUIRE(f.registry.call_tool("steady", "echo", Json::object()).has_value());

    bool flagged = false;
    for (const auto& result : third) {
        if (result.server_name == "flaky") {
            flagged = result.auto_disabled;
        }
    }
    REQUIRE(flagged);

    // A disabled server is not probed again.
    REQUIRE(monitor.force_health_check().size() == 1);
}

TEST_CASE("Auto-disable can be turned off", "[health]") {
    MonitorFixture f;
    FakeServerScript script;
    script.probes_fail = true;
    f.add_connected("flaky", script);

    HealthMonitorConfig config;
    config.auto_disable = false;
    HealthMonitor monitor(f.registry, config);

    for (int i = 0; i < 4; ++i) {
        (void)monitor.force_health_check();
    }

    REQUIRE(f.registry.health_status("flaky").value() == HealthStatus::Unhealthy);
    REQUIRE(f.registry.get_server("flaky")->disabled() == false);
}

TEST_CASE("Failed probes are recorded with their reason", "[health]") {
    MonitorFixture f;
    f.add_connected("slow");

    HealthMonitorConfig config;
    config.probe_timeout = 50ms;
    HealthMonitor monitor(f.registry, config);

    f.connector->connection("slow")->fail_probes.store(true);
    const auto results = monitor.force_health_check();

    REQUIRE(results.size() == 1);
    REQUIRE(results.front().success == false);
    REQUIRE(results.front().error.empty() == false);
    REQUIRE(f.registry.get_server("slow")->health().failed_requests == 1);
}

TEST_CASE("Snapshots report every registered server", "[health]") {
    MonitorFixture f;
    f.add_connected("a");
    REQUIRE(f.registry.register_server("pending", fake_config("pending")).has_value());
    HealthMonitor monitor(f.registry);

    const auto snapshots = monitor.snapshot();
    REQUIRE(snapshots.size() == 2);

    auto pending = monitor.server_health("pending");
    REQUIRE(pending.has_value());
    REQUIRE(pending->health_status == HealthStatus::Unknown);
    REQUIRE(pending->to_json()["status"] == "connecting");

    REQUIRE(monitor.server_health("missing").has_value() == false);
}

TEST_CASE("Periodic checks run on the runtime", "[health][async]") {
    MonitorFixture f;
    f.add_connected("a");

    Runtime runtime(1);
    runtime.start();

    HealthMonitorConfig config;
    config.check_interval = 20ms;
    HealthMonitor monitor(f.registry, config);
    monitor.start(runtime.executor());
    REQUIRE(monitor.is_running());

    const auto deadline = std::chrono::steady_clock::now() + 2s;
    while (f.registry.get_server("a")->health().successful_requests < 2
           && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(10ms);
    }

    monitor.stop();
    runtime.stop();

    REQUIRE(monitor.is_running() == false);
    REQUIRE(f.registry.get_server("a")->health().successful_requests >= 2);
}
