#ifndef MCPCHAT_TESTS_FAKE_SERVER_HPP
#define MCPCHAT_TESTS_FAKE_SERVER_HPP

#include "mcpchat/transport/transport.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace mcpchat::testing {

// ─────────────────────────────────────────────────────────────────────────────
// Call instrumentation shared by every connection of one FakeConnector
// ─────────────────────────────────────────────────────────────────────────────

struct CallLog {
    std::mutex mutex;
    std::vector<std::string> started;   // "server:tool" in start order
    std::size_t in_flight{0};
    std::size_t peak_in_flight{0};
    std::map<std::string, std::size_t> server_in_flight;
    std::map<std::string, std::size_t> server_peak;

    void begin(const std::string& server, const std::string& tool) {
        std::lock_guard<std::mutex> lock(mutex);
        started.push_back(server + ":" + tool);
        in_flight += 1;
        peak_in_flight = std::max(peak_in_flight, in_flight);
        auto& current = server_in_flight[server];
        current += 1;
        server_peak[server] = std::max(server_peak[server], current);
    }

    void end(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex);
        in_flight -= 1;
        server_in_flight[server] -= 1;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// FakeServerScript - how one named server behaves
// ─────────────────────────────────────────────────────────────────────────────

struct FakeServerScript {
    std::chrono::milliseconds connect_latency{0};
    int connect_failures{0};             // first N attempts fail with a network error
    std::chrono::milliseconds call_latency{0};
    bool calls_fail{false};
    bool probes_fail{false};
    bool resources_subscribe{false};
    std::vector<std::string> tools{"echo"};
    std::vector<std::string> resources;
    std::vector<std::string> prompts;
    std::function<TransportResult<Json>(const std::string& tool, const Json& args)> on_call;
};

// ─────────────────────────────────────────────────────────────────────────────
// FakeConnection
// ─────────────────────────────────────────────────────────────────────────────

class FakeConnection final : public IServerConnection {
public:
    FakeConnection(std::string server, const FakeServerScript& script, ConnectionCallbacks callbacks,
                   std::shared_ptr<CallLog> log)
        : server_(std::move(server))
        , callbacks_(std::move(callbacks))
        , log_(std::move(log))
        , call_latency_(script.call_latency)
        , on_call_(script.on_call)
    {
        fail_calls.store(script.calls_fail);
        fail_probes.store(script.probes_fail);

        capabilities_.supports_tools = true;
        capabilities_.supports_resources = script.resources.empty() == false;
        capabilities_.supports_prompts = script.prompts.empty() == false;
        capabilities_.resources_subscribe = script.resources_subscribe;
        capabilities_.server_info.name = server_;
        for (const auto& tool : script.tools) {
            tools_.push_back(ToolInfo{server_, tool, "fake " + tool, Json::object()});
        }
        for (const auto& uri : script.resources) {
            resources_.push_back(ResourceInfo{server_, uri, uri, "", "text/plain"});
        }
        for (const auto& prompt : script.prompts) {
            prompts_.push_back(PromptInfo{server_, prompt, "", Json::array()});
        }
    }

    [[nodiscard]] TransportResult<std::vector<ToolInfo>> list_tools() override {
        list_tools_calls.fetch_add(1);
        if (alive_.load() == false) {
            return tl::unexpected(TransportError::closed());
        }
        if (fail_probes.load()) {
            return tl::unexpected(TransportError::timeout("tools/list timed out"));
        }
        std::lock_guard<std::mutex> lock(mutex_);
        return tools_;
    }

    [[nodiscard]] TransportResult<Json> call_tool(const std::string& name, const Json& arguments) override {
        log_->begin(server_, name);
        if (call_latency_.count() > 0) {
            std::this_thread::sleep_for(call_latency_);
        }
        log_->end(server_);

        if (alive_.load() == false) {
            return tl::unexpected(TransportError::closed());
        }
        if (on_call_) {
            return on_call_(name, arguments);
        }
        if (fail_calls.load()) {
            return tl::unexpected(TransportError::rpc(-32000, "tool " + name + " failed"));
        }
        return Json{{"content", Json::array({{{"type", "text"}, {"text", server_ + ":" + name}}})},
                    {"arguments", arguments}};
    }

    [[nodiscard]] TransportResult<std::vector<ResourceInfo>> list_resources() override {
        return resources_;
    }

    [[nodiscard]] TransportResult<Json> read_resource(const std::string& uri) override {
        read_calls.fetch_add(1);
        return Json{{"contents", Json::array({{{"uri", uri}, {"text", "content of " + uri}}})}};
    }

    [[nodiscard]] TransportResult<void> subscribe_resource(const std::string& uri) override {
        std::lock_guard<std::mutex> lock(mutex_);
        subscriptions.push_back(uri);
        return {};
    }

    [[nodiscard]] TransportResult<std::vector<PromptInfo>> list_prompts() override {
        return prompts_;
    }

    [[nodiscard]] TransportResult<Json> get_prompt(const std::string& name, const Json& /*arguments*/) override {
        return Json{{"messages", Json::array({{{"role", "user"}, {"content", name}}})}};
    }

    [[nodiscard]] const ServerCapabilities& capabilities() const noexcept override {
        return capabilities_;
    }

    [[nodiscard]] bool is_alive() const noexcept override { return alive_.load(); }

    void disconnect() override { alive_.store(false); }

    // ─────────────────────────────────────────────────────────────────────────
    // Test controls
    // ─────────────────────────────────────────────────────────────────────────

    /// Pushes a notification as if the server sent it.
    void notify(const std::string& method, const Json& params) {
        if (callbacks_.on_notification) {
            callbacks_.on_notification(method, params);
        }
    }

    /// Simulates the transport dying underneath the registry.
    void drop(const std::string& reason = "process exited") {
        alive_.store(false);
        if (callbacks_.on_closed) {
            callbacks_.on_closed(reason);
        }
    }

    void set_tools(std::vector<std::string> names) {
        std::lock_guard<std::mutex> lock(mutex_);
        tools_.clear();
        for (auto& tool : names) {
            tools_.push_back(ToolInfo{server_, std::move(tool), "", Json::object()});
        }
    }

    std::atomic<bool> fail_calls{false};
    std::atomic<bool> fail_probes{false};
    std::atomic<int> list_tools_calls{0};
    std::atomic<int> read_calls{0};
    std::vector<std::string> subscriptions;

private:
    std::string server_;
    ConnectionCallbacks callbacks_;
    std::shared_ptr<CallLog> log_;
    std::chrono::milliseconds call_latency_;
    std::function<TransportResult<Json>(const std::string&, const Json&)> on_call_;
    ServerCapabilities capabilities_;
    std::mutex mutex_;
    std::vector<ToolInfo> tools_;
    std::vector<ResourceInfo> resources_;
    std::vector<PromptInfo> prompts_;
    std::atomic<bool> alive_{true};
};

// ─────────────────────────────────────────────────────────────────────────────
// FakeConnector
// ─────────────────────────────────────────────────────────────────────────────
// Hands out FakeConnections according to per-server scripts and counts how
// many connects are in flight at once.

class FakeConnector final : public IServerConnector {
public:
    void script(const std::string& server, FakeServerScript script) {
        std::lock_guard<std::mutex> lock(mutex_);
        scripts_[server] = std::move(script);
    }

    [[nodiscard]] TransportResult<ConnectionHandle> connect(
        const std::string& server_name,
        const ServerConfig& /*config*/,
        ConnectionCallbacks callbacks
    ) override {
        FakeServerScript script;
        int attempt = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (scripts_.contains(server_name)) {
                script = scripts_[server_name];
            }
            attempt = ++attempts_[server_name];
            in_flight_ += 1;
            peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
        }

        if (script.connect_latency.count() > 0) {
            std::this_thread::sleep_for(script.connect_latency);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        in_flight_ -= 1;
        if (attempt <= script.connect_failures) {
            return tl::unexpected(TransportError::network("connection refused"));
        }
        auto connection = std::make_shared<FakeConnection>(server_name, script, std::move(callbacks), calls_);
        connections_[server_name] = connection;
        return ConnectionHandle(connection);
    }

    [[nodiscard]] int attempts(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        return attempts_[server];
    }

    [[nodiscard]] std::size_t peak_in_flight() {
        std::lock_guard<std::mutex> lock(mutex_);
        return peak_in_flight_;
    }

    /// The most recent connection handed out for `server`.
    [[nodiscard]] std::shared_ptr<FakeConnection> connection(const std::string& server) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = connections_.find(server);
        return it == connections_.end() ? nullptr : it->second;
    }

    [[nodiscard]] CallLog& calls() noexcept { return *calls_; }

private:
    std::mutex mutex_;
    std::map<std::string, FakeServerScript> scripts_;
    std::map<std::string, int> attempts_;
    std::map<std::string, std::shared_ptr<FakeConnection>> connections_;
    std::size_t in_flight_{0};
    std::size_t peak_in_flight_{0};
    std::shared_ptr<CallLog> calls_ = std::make_shared<CallLog>();
};

/// A registry-ready config; the fake connector ignores its contents.
[[nodiscard]] inline ServerConfig fake_config(const std::string& name) {
    return ServerConfig::stdio("fake-" + name);
}

}  // namespace mcpchat::testing

#endif  // MCPCHAT_TESTS_FAKE_SERVER_HPP
