#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Application Configuration
// ═══════════════════════════════════════════════════════════════════════════
// JSON configuration for the whole subsystem. Every section and field is
// optional; durations are milliseconds.

#include "mcpchat/cache/resource_cache.hpp"
#include "mcpchat/connection/parallel_connection_manager.hpp"
#include "mcpchat/executor/concurrent_tool_executor.hpp"
#include "mcpchat/health/health_monitor.hpp"
#include "mcpchat/notification/notification_registry.hpp"
#include "mcpchat/transport/transport.hpp"

#include <tl/expected.hpp>

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mcpchat {

enum class ConfigErrorCode {
    FileNotFound,
    ParseError,
    InvalidValue
};

[[nodiscard]] constexpr std::string_view to_string(ConfigErrorCode code) noexcept {
    switch (code) {
        case ConfigErrorCode::FileNotFound: return "file_not_found";
        case ConfigErrorCode::ParseError:   return "parse_error";
        case ConfigErrorCode::InvalidValue: return "invalid_value";
    }
    return "unknown";
}

struct ConfigError {
    ConfigErrorCode code;
    std::string message;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return {ConfigErrorCode::FileNotFound, "cannot open config file: " + path};
    }

    [[nodiscard]] static ConfigError parse_error(std::string detail) {
        return {ConfigErrorCode::ParseError, std::move(detail)};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& field, const std::string& reason) {
        return {ConfigErrorCode::InvalidValue, field + ": " + reason};
    }
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

struct ServerEntry {
    std::string name;
    ServerConfig config;
};

struct AppConfig {
    std::vector<ServerEntry> servers;
    ParallelConnectionConfig startup;
    ExecutorConfig concurrent_tools;
    ResourceCacheConfig resource_cache;
    HealthMonitorConfig health;
    NotificationRegistryConfig notifications;

    /// (name, config) pairs in file order, as connect_servers_parallel takes them.
    [[nodiscard]] std::vector<std::pair<std::string, ServerConfig>> server_list() const;
};

[[nodiscard]] ConfigResult<AppConfig> parse_config(const Json& document);
[[nodiscard]] ConfigResult<AppConfig> load_config(const std::string& path);

}  // namespace mcpchat
