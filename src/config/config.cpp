#include "mcpchat/config/config.hpp"
#include "mcpchat/log/logger.hpp"

#include <fstream>
#include <set>

namespace mcpchat {

namespace {

[[nodiscard]] ConfigResult<const Json*> section(const Json& parent, const char* key, const std::string& path) {
    if (parent.contains(key) == false || parent[key].is_null()) {
        return nullptr;
    }
    if (parent[key].is_object() == false) {
        return tl::unexpected(ConfigError::invalid_value(path, "must be an object"));
    }
    return &parent[key];
}

[[nodiscard]] ConfigResult<void> read_millis(
    const Json& obj, const char* key, const std::string& path, std::chrono::milliseconds& out, bool allow_zero
) {
    if (obj.contains(key) == false) {
        return {};
    }
    const auto& value = obj[key];
    if (value.is_number_integer() == false) {
        return tl::unexpected(ConfigError::invalid_value(path + "." + key, "must be an integer (milliseconds)"));
    }
    const auto ms = value.get<std::int64_t>();
    if (ms < 0 || (ms == 0 && allow_zero == false)) {
        return tl::unexpected(ConfigError::invalid_value(path + "." + key, "must be positive"));
    }
    out = std::chrono::milliseconds{ms};
    return {};
}

template <typename T>
[[nodiscard]] ConfigResult<void> read_count(const Json& obj, const char* key, const std::string& path, T& out) {
    if (obj.contains(key) == false) {
        return {};
    }
    const auto& value = obj[key];
    if (value.is_number_integer() == false || value.get<std::int64_t>() < 1) {
        return tl::unexpected(ConfigError::invalid_value(path + "." + key, "must be a positive integer"));
    }
    out = value.get<T>();
    return {};
}

[[nodiscard]] ConfigResult<void> read_bool(const Json& obj, const char* key, const std::string& path, bool& out) {
    if (obj.contains(key) == false) {
        return {};
    }
    if (obj[key].is_boolean() == false) {
        return tl::unexpected(ConfigError::invalid_value(path + "." + key, "must be true or false"));
    }
    out = obj[key].get<bool>();
    return {};
}

[[nodiscard]] ConfigResult<std::map<std::string, std::string>> read_string_map(const Json& obj, const std::string& path) {
    std::map<std::string, std::string> out;
    if (obj.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_value(path, "must be an object of strings"));
    }
    for (const auto& [key, value] : obj.items()) {
        if (value.is_string() == false) {
            return tl::unexpected(ConfigError::invalid_value(path + "." + key, "must be a string"));
        }
        out[key] = value.get<std::string>();
    }
    return out;
}

[[nodiscard]] ConfigResult<ServerEntry> parse_server(const Json& obj, std::size_t index) {
    const std::string path = "mcp.servers[" + std::to_string(index) + "]";
    if (obj.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_value(path, "must be an object"));
    }
    if (obj.contains("name") == false || obj["name"].is_string() == false || obj["name"].get<std::string>().empty()) {
        return tl::unexpected(ConfigError::invalid_value(path + ".name", "is required"));
    }

    ServerEntry entry;
    entry.name = obj["name"].get<std::string>();

    const bool has_command = obj.contains("command");
    const bool has_url = obj.contains("url");
    if (has_command == has_url) {
        return tl::unexpected(ConfigError::invalid_value(path, "needs exactly one of command or url"));
    }

    if (has_command) {
        if (obj["command"].is_string() == false || obj["command"].get<std::string>().empty()) {
            return tl::unexpected(ConfigError::invalid_value(path + ".command", "must be a non-empty string"));
        }
        StdioServerConfig stdio;
        stdio.command = obj["command"].get<std::string>();
        if (obj.contains("args")) {
            if (obj["args"].is_array() == false) {
                return tl::unexpected(ConfigError::invalid_value(path + ".args", "must be an array of strings"));
            }
            for (const auto& arg : obj["args"]) {
                if (arg.is_string() == false) {
                    return tl::unexpected(ConfigError::invalid_value(path + ".args", "must be an array of strings"));
                }
                stdio.args.push_back(arg.get<std::string>());
            }
        }
        if (obj.contains("env")) {
            auto env = read_string_map(obj["env"], path + ".env");
            if (env.has_value() == false) {
                return tl::unexpected(env.error());
            }
            stdio.env = std::move(*env);
        }
        entry.config.transport = std::move(stdio);
    } else {
        if (obj["url"].is_string() == false || obj["url"].get<std::string>().empty()) {
            return tl::unexpected(ConfigError::invalid_value(path + ".url", "must be a non-empty string"));
        }
        SseServerConfig sse;
        sse.url = obj["url"].get<std::string>();
        if (obj.contains("headers")) {
            auto headers = read_string_map(obj["headers"], path + ".headers");
            if (headers.has_value() == false) {
                return tl::unexpected(headers.error());
            }
            for (auto& [key, value] : *headers) {
                sse.headers[key] = std::move(value);
            }
        }
        if (auto r = read_millis(obj, "connect_timeout", path, sse.connect_timeout, false); r.has_value() == false) {
            return tl::unexpected(r.error());
        }
        if (auto r = read_bool(obj, "verify_ssl", path, sse.verify_ssl); r.has_value() == false) {
            return tl::unexpected(r.error());
        }
        entry.config.transport = std::move(sse);
    }

    if (auto r = read_millis(obj, "request_timeout", path, entry.config.request_timeout, false); r.has_value() == false) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_bool(obj, "auto_connect", path, entry.config.auto_connect); r.has_value() == false) {
        return tl::unexpected(r.error());
    }
    return entry;
}

// Collapses a chain of ConfigResult<void> checks into the first failure.
#define MCPCHAT_CONFIG_TRY(expr) \
    do { auto _r = (expr); if (_r.has_value() == false) return tl::unexpected(_r.error()); } while (false)

}  // namespace

std::vector<std::pair<std::string, ServerConfig>> AppConfig::server_list() const {
    std::vector<std::pair<std::string, ServerConfig>> out;
    out.reserve(servers.size());
    for (const auto& entry : servers) {
        out.emplace_back(entry.name, entry.config);
    }
    return out;
}

ConfigResult<AppConfig> parse_config(const Json& document) {
    if (document.is_object() == false) {
        return tl::unexpected(ConfigError::invalid_value("<root>", "must be an object"));
    }

    AppConfig config;

    auto mcp = section(document, "mcp", "mcp");
    MCPCHAT_CONFIG_TRY(mcp);
    if (*mcp != nullptr && (*mcp)->contains("servers")) {
        const auto& servers = (**mcp)["servers"];
        if (servers.is_array() == false) {
            return tl::unexpected(ConfigError::invalid_value("mcp.servers", "must be an array"));
        }
        std::set<std::string> names;
        for (std::size_t i = 0; i < servers.size(); ++i) {
            auto entry = parse_server(servers[i], i);
            if (entry.has_value() == false) {
                return tl::unexpected(entry.error());
            }
            if (names.insert(entry->name).second == false) {
                return tl::unexpected(ConfigError::invalid_value(
                    "mcp.servers[" + std::to_string(i) + "].name", "duplicate server name '" + entry->name + "'"));
            }
            config.servers.push_back(std::move(*entry));
        }
    }

    auto startup = section(document, "startup", "startup");
    MCPCHAT_CONFIG_TRY(startup);
    if (*startup != nullptr) {
        if ((*startup)->contains("mcp_connection_mode")) {
            const Json& mode = (**startup)["mcp_connection_mode"];
            const auto parsed = mode.is_string()
                ? connection_mode_from_string(mode.get<std::string>())
                : std::nullopt;
            if (parsed.has_value() == false) {
                return tl::unexpected(ConfigError::invalid_value(
                    "startup.mcp_connection_mode", "must be one of eager, background, lazy"));
            }
            config.startup.mode = *parsed;
        }

        auto parallel = section(**startup, "parallel", "startup.parallel");
        MCPCHAT_CONFIG_TRY(parallel);
        if (*parallel != nullptr) {
            const Json& p = **parallel;
            const std::string path = "startup.parallel";
            MCPCHAT_CONFIG_TRY(read_count(p, "max_concurrency", path, config.startup.max_concurrency));
            MCPCHAT_CONFIG_TRY(read_millis(p, "connection_timeout", path, config.startup.connection_timeout, false));
            MCPCHAT_CONFIG_TRY(read_count(p, "retry_attempts", path, config.startup.retry_attempts));
            MCPCHAT_CONFIG_TRY(read_millis(p, "retry_delay", path, config.startup.retry_delay, true));
        }
    }

    auto tools = section(document, "concurrent_tools", "concurrent_tools");
    MCPCHAT_CONFIG_TRY(tools);
    if (*tools != nullptr) {
        const Json& t = **tools;
        const std::string path = "concurrent_tools";
        MCPCHAT_CONFIG_TRY(read_count(t, "max_concurrency", path, config.concurrent_tools.max_concurrency));
        MCPCHAT_CONFIG_TRY(read_millis(t, "timeout", path, config.concurrent_tools.timeout, false));
        MCPCHAT_CONFIG_TRY(read_bool(t, "same_server_sequential", path, config.concurrent_tools.same_server_sequential));
        MCPCHAT_CONFIG_TRY(read_bool(t, "safety_checks", path, config.concurrent_tools.safety_checks));
    }

    auto cache = section(document, "resource_cache", "resource_cache");
    MCPCHAT_CONFIG_TRY(cache);
    if (*cache != nullptr) {
        const Json& c = **cache;
        const std::string path = "resource_cache";
        MCPCHAT_CONFIG_TRY(read_millis(c, "ttl", path, config.resource_cache.ttl, false));
        MCPCHAT_CONFIG_TRY(read_count(c, "max_size", path, config.resource_cache.max_size));
        MCPCHAT_CONFIG_TRY(read_millis(c, "cleanup_interval", path, config.resource_cache.cleanup_interval, false));
    }

    auto health = section(document, "health", "health");
    MCPCHAT_CONFIG_TRY(health);
    if (*health != nullptr) {
        const Json& h = **health;
        const std::string path = "health";
        MCPCHAT_CONFIG_TRY(read_millis(h, "check_interval", path, config.health.check_interval, false));
        MCPCHAT_CONFIG_TRY(read_millis(h, "probe_timeout", path, config.health.probe_timeout, false));
        MCPCHAT_CONFIG_TRY(read_count(h, "max_concurrency", path, config.health.max_concurrency));
        MCPCHAT_CONFIG_TRY(read_bool(h, "auto_disable", path, config.health.auto_disable));
    }

    auto notifications = section(document, "notifications", "notifications");
    MCPCHAT_CONFIG_TRY(notifications);
    if (*notifications != nullptr) {
        const Json& n = **notifications;
        const std::string path = "notifications";
        MCPCHAT_CONFIG_TRY(read_millis(n, "handler_timeout", path, config.notifications.handler_timeout, true));
        MCPCHAT_CONFIG_TRY(read_millis(n, "batch_flush_interval", path, config.notifications.batch_flush_interval, false));
    }

    return config;
}

#undef MCPCHAT_CONFIG_TRY

ConfigResult<AppConfig> load_config(const std::string& path) {
    std::ifstream in(path);
    if (in.is_open() == false) {
        return tl::unexpected(ConfigError::file_not_found(path));
    }

    Json document = Json::parse(in, nullptr, false);
    if (document.is_discarded()) {
        return tl::unexpected(ConfigError::parse_error("invalid JSON in " + path));
    }

    auto config = parse_config(document);
    if (config.has_value()) {
        get_logger().debug_fmt("Loaded {} servers from {}", config->servers.size(), path);
    }
    return config;
}

}  // namespace mcpchat
