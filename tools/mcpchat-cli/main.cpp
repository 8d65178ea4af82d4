// ─────────────────────────────────────────────────────────────────────────────
// mcpchat-cli - MCP tool-server console
// ─────────────────────────────────────────────────────────────────────────────
// Connects to every server in a config file in parallel, then lists their
// capabilities, runs tool calls, reads resources through the cache, or
// watches health and notifications.
//
// Usage:
//   mcpchat-cli -c servers.json --list-tools
//   mcpchat-cli -c servers.json --call fs:read_file --args '{"path":"/tmp/a"}'
//   mcpchat-cli -c servers.json --call fs:list_directory --call web:fetch \
//               --args '{"path":"/tmp"}' --args '{"url":"https://example.com"}'
//   mcpchat-cli -c servers.json --read fs:file:///tmp/a
//   mcpchat-cli -c servers.json --health --watch 60

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "mcpchat/async/runtime.hpp"
#include "mcpchat/cache/resource_cache.hpp"
#include "mcpchat/config/config.hpp"
#include "mcpchat/connection/parallel_connection_manager.hpp"
#include "mcpchat/executor/concurrent_tool_executor.hpp"
#include "mcpchat/health/health_monitor.hpp"
#include "mcpchat/log/spdlog_logger.hpp"
#include "mcpchat/notification/handlers/progress_handler.hpp"
#include "mcpchat/notification/handlers/resource_change_handler.hpp"
#include "mcpchat/notification/handlers/tool_change_handler.hpp"
#include "mcpchat/notification/notification_registry.hpp"
#include "mcpchat/protocol/wire_json.hpp"
#include "mcpchat/server/server_registry.hpp"
#include "mcpchat/transport/mcp_connection.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using namespace mcpchat;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";
    const char* cyan    = "\033[36m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

std::mutex output_mutex;

void print_error(const std::string& msg) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << color::c(color::red) << "Error: " << color::c(color::reset) << msg << "\n";
}

void print_header(const std::string& title) {
    std::cout << "\n" << color::c(color::bold) << color::c(color::cyan)
              << "═══ " << title << " ═══" << color::c(color::reset) << "\n\n";
}

void print_json(const Json& j) {
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cout << j.dump(2) << "\n";
}

std::string status_color(ServerStatus status) {
    switch (status) {
        case ServerStatus::Connected:    return color::c(color::green);
        case ServerStatus::Connecting:   return color::c(color::yellow);
        case ServerStatus::Failed:       return color::c(color::red);
        case ServerStatus::Disconnected: return color::c(color::dim);
    }
    return color::c(color::reset);
}

/// "server:rest" -> {server, rest}; rest may itself contain ':' (URIs).
std::optional<std::pair<std::string, std::string>> split_target(const std::string& target) {
    const auto colon = target.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == target.size()) {
        return std::nullopt;
    }
    return std::make_pair(target.substr(0, colon), target.substr(colon + 1));
}

// ═══════════════════════════════════════════════════════════════════════════
// Watch Handler
// ═══════════════════════════════════════════════════════════════════════════

// Prints every notification while --watch is active.
class EventPrinter final : public INotificationHandler {
public:
    explicit EventPrinter(bool json_output)
        : json_output_(json_output)
    {}

    [[nodiscard]] std::string name() const override { return "event_printer"; }

    [[nodiscard]] HandlerResult init(const Json& /*args*/) override {
        return Json{{"printed", 0}};
    }

    [[nodiscard]] HandlerResult handle_notification(const NotificationEvent& event, HandlerState state) override {
        if (json_output_) {
            print_json(event.to_json());
        } else {
            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << color::c(color::cyan) << "↯ [" << event.server_name << "] "
                      << to_string(event.type) << color::c(color::reset);
            if (event.count > 1) {
                std::cout << " ×" << event.count;
            }
            std::cout << " " << color::c(color::dim) << event.params.dump() << color::c(color::reset) << "\n";
        }
        state["printed"] = state.value("printed", 0) + 1;
        return state;
    }

private:
    bool json_output_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_list_servers(const ServerRegistry& registry, bool json_output) {
    const auto servers = registry.list_servers();
    if (json_output) {
        Json output = Json::array();
        for (const auto& server : servers) {
            output.push_back({
                {"name", server.name()},
                {"status", to_string(server.status())},
                {"transport", server.config().describe()},
                {"disabled", server.disabled()},
                {"tools", server.capabilities().tools.size()},
                {"error", server.error().has_value() ? Json(*server.error()) : Json(nullptr)}
            });
        }
        print_json(output);
        return 0;
    }

    print_header("Servers");
    for (const auto& server : servers) {
        std::cout << color::c(color::bold) << server.name() << color::c(color::reset) << " "
                  << status_color(server.status()) << server.status_display() << color::c(color::reset) << "\n"
                  << "  " << color::c(color::dim) << server.config().describe() << color::c(color::reset) << "\n";
        if (server.is_connected()) {
            const auto& caps = server.capabilities();
            std::cout << "  " << caps.tools.size() << " tools, " << caps.resources.size() << " resources, "
                      << caps.prompts.size() << " prompts\n";
        }
    }
    return 0;
}

int cmd_list_tools(const ServerRegistry& registry, bool json_output) {
    const auto tools = registry.list_all_tools();
    if (json_output) {
        Json output = Json::array();
        for (const auto& tool : tools) {
            output.push_back(tool.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Tools");
    if (tools.empty()) {
        std::cout << color::c(color::dim) << "(no tools available)" << color::c(color::reset) << "\n";
    }
    for (const auto& tool : tools) {
        std::cout << color::c(color::bold) << color::c(color::yellow) << "• " << tool.server_name << ":"
                  << tool.name << color::c(color::reset);
        if (tool.description.empty() == false) {
            std::cout << "\n  " << color::c(color::dim) << tool.description << color::c(color::reset);
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_list_resources(const ServerRegistry& registry, bool json_output) {
    const auto resources = registry.list_all_resources();
    if (json_output) {
        Json output = Json::array();
        for (const auto& resource : resources) {
            output.push_back(resource.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Resources");
    if (resources.empty()) {
        std::cout << color::c(color::dim) << "(no resources available)" << color::c(color::reset) << "\n";
    }
    for (const auto& resource : resources) {
        std::cout << color::c(color::bold) << "• " << resource.server_name << ":" << resource.uri
                  << color::c(color::reset);
        if (resource.name.empty() == false) {
            std::cout << " " << color::c(color::dim) << "(" << resource.name << ")" << color::c(color::reset);
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_list_prompts(const ServerRegistry& registry, bool json_output) {
    const auto prompts = registry.list_all_prompts();
    if (json_output) {
        Json output = Json::array();
        for (const auto& prompt : prompts) {
            output.push_back(prompt.to_json());
        }
        print_json(output);
        return 0;
    }

    print_header("Prompts");
    if (prompts.empty()) {
        std::cout << color::c(color::dim) << "(no prompts available)" << color::c(color::reset) << "\n";
    }
    for (const auto& prompt : prompts) {
        std::cout << color::c(color::bold) << "• " << prompt.server_name << ":" << prompt.name
                  << color::c(color::reset);
        if (prompt.description.empty() == false) {
            std::cout << "\n  " << color::c(color::dim) << prompt.description << color::c(color::reset);
        }
        std::cout << "\n";
    }
    return 0;
}

int cmd_call_tools(
    ServerRegistry& registry,
    ExecutorConfig config,
    const std::vector<std::string>& targets,
    const std::vector<std::string>& args,
    bool json_output
) {
    std::vector<ToolCall> calls;
    for (std::size_t i = 0; i < targets.size(); ++i) {
        auto target = split_target(targets[i]);
        if (target.has_value() == false) {
            print_error("Expected server:tool, got '" + targets[i] + "'");
            return 1;
        }

        Json arguments = Json::object();
        if (i < args.size() && args[i].empty() == false) {
            arguments = Json::parse(args[i], nullptr, false);
            if (arguments.is_discarded() || arguments.is_object() == false) {
                print_error("Arguments for " + targets[i] + " must be a JSON object");
                return 1;
            }
        }
        calls.push_back(ToolCall{target->first, target->second, std::move(arguments)});
    }

    ConcurrentToolExecutor executor(registry, config);
    auto results = executor.execute_concurrent(calls, [json_output](const ExecutionProgress& progress) {
        if (json_output || progress.phase != ExecutionPhase::Executing) {
            return;
        }
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << color::c(color::dim) << "[" << progress.completed << "/" << progress.total << "] "
                  << progress.current_tool << color::c(color::reset) << "\n";
    });

    int exit_code = 0;
    Json output = Json::array();
    for (const auto& result : results) {
        if (result.ok() == false) {
            exit_code = 1;
        }
        if (json_output) {
            output.push_back(result.to_json());
            continue;
        }
        print_header(result.server_name + ":" + result.tool_name);
        if (result.ok()) {
            std::cout << result.result->dump(2) << "\n";
        } else {
            print_error(result.error.value_or("unknown error"));
        }
        std::cout << color::c(color::dim) << std::fixed << std::setprecision(1)
                  << result.duration.count() << "ms" << color::c(color::reset) << "\n";
    }

    if (json_output) {
        print_json({{"results", output}, {"stats", executor.get_execution_stats().to_json()}});
    }
    return exit_code;
}

int cmd_read(ServerRegistry& registry, ResourceCache& cache, const std::string& target_text, bool json_output) {
    auto target = split_target(target_text);
    if (target.has_value() == false) {
        print_error("Expected server:uri, got '" + target_text + "'");
        return 1;
    }
    const auto& [server, uri] = *target;

    auto content = cache.get_resource(server, uri, [&registry, server = server, uri = uri] {
        return registry.read_resource(server, uri);
    });
    if (content.has_value() == false) {
        print_error(content.error().message);
        return 1;
    }

    if (json_output) {
        print_json(*content);
        return 0;
    }

    print_header(uri);
    if (content->contains("contents") && (*content)["contents"].is_array()) {
        for (const auto& item : (*content)["contents"]) {
            if (item.contains("text")) {
                std::cout << item["text"].get<std::string>() << "\n";
            } else {
                std::cout << color::c(color::dim) << "(binary " << item.value("mimeType", "content") << ")"
                          << color::c(color::reset) << "\n";
            }
        }
    } else {
        std::cout << content->dump(2) << "\n";
    }
    return 0;
}

int cmd_health(const HealthMonitor& monitor, bool json_output) {
    const auto snapshots = monitor.snapshot();
    if (json_output) {
        Json output = Json::array();
        for (const auto& snapshot : snapshots) {
            output.push_back(snapshot.to_json());
        }
        print_json(output);
        return 0;
    }

    std::lock_guard<std::mutex> lock(output_mutex);
    print_header("Health");
    for (const auto& snapshot : snapshots) {
        const bool healthy = snapshot.health_status == HealthStatus::Healthy;
        std::cout << color::c(color::bold) << snapshot.server_name << color::c(color::reset) << " "
                  << (healthy ? color::c(color::green) : color::c(color::yellow))
                  << to_string(snapshot.health_status) << color::c(color::reset);
        if (snapshot.disabled) {
            std::cout << color::c(color::red) << " (disabled)" << color::c(color::reset);
        }
        std::cout << "\n  " << std::fixed << std::setprecision(1)
                  << snapshot.success_rate << "% success over " << snapshot.record.total_requests
                  << " requests, avg " << snapshot.record.avg_response_time << "ms";
        if (snapshot.uptime.has_value()) {
            std::cout << ", up " << snapshot.uptime->count() << "s";
        }
        std::cout << "\n";
    }
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("mcpchat-cli", "MCP tool-server console");

    options.add_options()
        ("c,config", "Configuration file (JSON)", cxxopts::value<std::string>()->default_value("mcpchat.json"))
        ("connection-mode", "eager, background or lazy (overrides the config)", cxxopts::value<std::string>())

        // Listings
        ("list-servers", "List configured servers and their status")
        ("list-tools", "List tools of all connected servers")
        ("list-resources", "List resources of all connected servers")
        ("list-prompts", "List prompts of all connected servers")

        // Calls
        ("call", "Call a tool, format server:tool (can be repeated)", cxxopts::value<std::vector<std::string>>())
        ("args", "JSON arguments for the matching --call (can be repeated)", cxxopts::value<std::vector<std::string>>())
        ("sequential", "Run calls to the same server in order")
        ("no-sequential", "Let calls to the same server overlap")
        ("no-safety", "Treat every tool as safe to run concurrently")
        ("read", "Read a resource through the cache, format server:uri", cxxopts::value<std::string>())

        // Monitoring
        ("health", "Show server health")
        ("watch", "Keep running for SECONDS, printing notifications and health", cxxopts::value<int>())

        // Output
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-level", "trace, debug, info, warn, error or off", cxxopts::value<std::string>()->default_value("warn"))
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        const LogLevel level = parse_log_level(result["log-level"].as<std::string>());
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_console_logger(level));
        }
        get_logger().debug_fmt("JSON parser backend: simdjson {}", wire_json_backend());

        auto loaded = load_config(result["config"].as<std::string>());
        if (loaded.has_value() == false) {
            print_error(std::string(to_string(loaded.error().code)) + ": " + loaded.error().message);
            return 1;
        }
        AppConfig config = std::move(*loaded);

        if (result.count("no-sequential")) {
            config.concurrent_tools.same_server_sequential = false;
        }
        if (result.count("sequential")) {
            config.concurrent_tools.same_server_sequential = true;
        }
        if (result.count("no-safety")) {
            config.concurrent_tools.safety_checks = false;
        }
        if (result.count("connection-mode")) {
            const auto mode = connection_mode_from_string(result["connection-mode"].as<std::string>());
            if (mode.has_value() == false) {
                print_error("--connection-mode must be eager, background or lazy");
                return 1;
            }
            config.startup.mode = *mode;
        }

        // ─────────────────────────────────────────────────────────────────────
        // Wiring
        // ─────────────────────────────────────────────────────────────────────

        Runtime runtime(2);
        runtime.start();

        ServerRegistry registry(std::make_shared<McpConnector>());
        NotificationRegistry notifications(config.notifications);
        ResourceCache cache(config.resource_cache);
        HealthMonitor monitor(registry, config.health);

        notifications.start(runtime.executor());
        registry.set_notification_sink([&notifications](const std::string& server, const std::string& method, const Json& params) {
            notifications.post(server, method, params);
        });

        cache.set_subscribe_hook([&registry](const std::string& server, const std::string& uri) {
            auto subscribed = registry.subscribe_resource(server, uri);
            if (subscribed.has_value() == false) {
                get_logger().warn_fmt("Failed to subscribe to {} {}: {}", server, uri, subscribed.error().message);
            }
        });
        cache.start_cleanup(runtime.executor());

        monitor.on_auto_disable([](const std::string& server, const HealthRecord& record) {
            print_error("Server '" + server + "' disabled after " + std::to_string(record.consecutive_failures)
                        + " failed health checks");
        });

        auto register_or_warn = [&notifications](HandlerPtr handler, std::vector<NotificationType> types) {
            const std::string name = handler->name();
            auto registered = notifications.register_handler(std::move(handler), std::move(types));
            if (registered.has_value() == false) {
                get_logger().warn_fmt("Handler {} not registered: {}", name, registered.error().message);
            }
        };

        register_or_warn(
            std::make_shared<ProgressHandler>([json_output](const ProgressUpdate& update) {
                if (json_output) {
                    return;
                }
                std::lock_guard<std::mutex> lock(output_mutex);
                std::cout << color::c(color::dim) << "⏳ [" << update.server_name << "] " << update.token << ": "
                          << update.progress;
                if (update.total.has_value()) {
                    std::cout << "/" << *update.total;
                }
                std::cout << color::c(color::reset) << "\n";
            }),
            {NotificationType::Progress});
        register_or_warn(
            std::make_shared<ResourceChangeHandler>(cache),
            {NotificationType::ResourcesUpdated, NotificationType::ResourcesListChanged});
        register_or_warn(
            std::make_shared<ToolChangeHandler>(registry),
            {NotificationType::ToolsListChanged, NotificationType::ToolAdded,
             NotificationType::ToolRemoved, NotificationType::PromptsListChanged});

        if (result.count("watch")) {
            std::vector<NotificationType> all;
            for (const auto& [method, type] : kNotificationMethods) {
                all.push_back(type);
            }
            register_or_warn(std::make_shared<EventPrinter>(json_output), std::move(all));
        }

        // ─────────────────────────────────────────────────────────────────────
        // Connect
        // ─────────────────────────────────────────────────────────────────────

        std::vector<std::pair<std::string, ServerConfig>> to_connect;
        for (auto& entry : config.server_list()) {
            if (entry.second.auto_connect) {
                to_connect.push_back(std::move(entry));
            } else {
                (void)registry.register_server(entry.first, entry.second);
            }
        }

        ParallelConnectionManager manager(registry, config.startup);
        auto connections = manager.connect_with_mode(to_connect, [json_output](const ConnectionProgress& progress) {
            if (json_output) {
                return;
            }
            std::lock_guard<std::mutex> lock(output_mutex);
            switch (progress.phase) {
                case ConnectionPhase::Starting:
                    std::cout << color::c(color::dim) << "Connecting to " << progress.total << " servers..."
                              << color::c(color::reset) << "\n";
                    break;
                case ConnectionPhase::Connecting:
                    std::cout << color::c(color::dim) << "  [" << progress.completed << "/" << progress.total
                              << "] " << progress.current_server << color::c(color::reset) << "\n";
                    break;
                case ConnectionPhase::Completed:
                    std::cout << color::c(color::green) << "✓ " << progress.completed << "/" << progress.total
                              << " connected" << color::c(color::reset);
                    if (progress.failed > 0) {
                        std::cout << color::c(color::red) << ", " << progress.failed << " failed" << color::c(color::reset);
                    }
                    std::cout << " in " << std::fixed << std::setprecision(0) << progress.elapsed.count() << "ms\n";
                    break;
            }
        });

        // Commands run once, so they need the servers a background start-up
        // is still bringing up.
        if (config.startup.mode == ConnectionMode::Background) {
            auto finished = manager.wait_for_background();
            connections.insert(connections.end(), finished.begin(), finished.end());
        }

        for (const auto& connection : connections) {
            if (connection.ok() == false && json_output == false) {
                print_error(connection.server_name + ": " + connection.error.value_or("connection failed"));
            }
        }

        // ─────────────────────────────────────────────────────────────────────
        // Commands
        // ─────────────────────────────────────────────────────────────────────

        int exit_code = 0;
        bool ran_command = false;
        auto run = [&](int code) {
            ran_command = true;
            if (code != 0) {
                exit_code = code;
            }
        };

        if (result.count("list-servers")) {
            run(cmd_list_servers(registry, json_output));
        }
        if (result.count("list-tools")) {
            run(cmd_list_tools(registry, json_output));
        }
        if (result.count("list-resources")) {
            run(cmd_list_resources(registry, json_output));
        }
        if (result.count("list-prompts")) {
            run(cmd_list_prompts(registry, json_output));
        }
        if (result.count("call")) {
            const auto targets = result["call"].as<std::vector<std::string>>();
            const auto args = result.count("args")
                ? result["args"].as<std::vector<std::string>>()
                : std::vector<std::string>{};
            run(cmd_call_tools(registry, config.concurrent_tools, targets, args, json_output));
        }
        if (result.count("read")) {
            run(cmd_read(registry, cache, result["read"].as<std::string>(), json_output));
        }
        if (result.count("watch")) {
            const int seconds = result["watch"].as<int>();
            monitor.start(runtime.executor());
            std::this_thread::sleep_for(std::chrono::seconds(std::max(seconds, 0)));
            monitor.stop();
            (void)notifications.flush_batches();
            run(cmd_health(monitor, json_output));
        } else if (result.count("health")) {
            (void)monitor.force_health_check();
            run(cmd_health(monitor, json_output));
        }
        if (ran_command == false) {
            run(cmd_list_servers(registry, json_output));
        }

        // ─────────────────────────────────────────────────────────────────────
        // Shutdown
        // ─────────────────────────────────────────────────────────────────────

        monitor.stop();
        cache.stop_cleanup();
        registry.set_notification_sink({});
        notifications.stop();
        registry.disconnect_all();
        runtime.stop();
        return exit_code;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
