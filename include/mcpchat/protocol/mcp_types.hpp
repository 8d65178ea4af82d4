#ifndef MCPCHAT_PROTOCOL_MCP_TYPES_HPP
#define MCPCHAT_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace mcpchat {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Constants
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";
inline constexpr const char* CLIENT_NAME = "mcpchat";
inline constexpr const char* CLIENT_VERSION = "0.1.0";

// ═══════════════════════════════════════════════════════════════════════════
// Server Identity
// ═══════════════════════════════════════════════════════════════════════════

struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
    std::optional<std::string> instructions;

    static ServerInfo from_initialize_result(const Json& j) {
        ServerInfo info;
        info.protocol_version = j.value("protocolVersion", "");
        if (j.contains("serverInfo") && j["serverInfo"].is_object()) {
            info.name = j["serverInfo"].value("name", "");
            info.version = j["serverInfo"].value("version", "");
        }
        if (j.contains("instructions") && j["instructions"].is_string()) {
            info.instructions = j["instructions"].get<std::string>();
        }
        return info;
    }

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}, {"protocolVersion", protocol_version}};
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Discovered Items
// ═══════════════════════════════════════════════════════════════════════════
// Each item remembers which server advertised it so aggregated listings can
// route calls back.

struct ToolInfo {
    std::string server_name;
    std::string name;
    std::string description;
    Json input_schema = Json::object();

    static ToolInfo from_json(const Json& j, std::string server = {}) {
        ToolInfo tool;
        tool.server_name = std::move(server);
        tool.name = j.value("name", "");
        tool.description = j.value("description", "");
        if (j.contains("inputSchema")) {
            tool.input_schema = j["inputSchema"];
        }
        return tool;
    }

    [[nodiscard]] Json to_json() const {
        return {
            {"server", server_name},
            {"name", name},
            {"description", description},
            {"inputSchema", input_schema}
        };
    }
};

struct ResourceInfo {
    std::string server_name;
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;

    static ResourceInfo from_json(const Json& j, std::string server = {}) {
        ResourceInfo resource;
        resource.server_name = std::move(server);
        resource.uri = j.value("uri", "");
        resource.name = j.value("name", "");
        resource.description = j.value("description", "");
        resource.mime_type = j.value("mimeType", "");
        return resource;
    }

    [[nodiscard]] Json to_json() const {
        return {
            {"server", server_name},
            {"uri", uri},
            {"name", name},
            {"description", description},
            {"mimeType", mime_type}
        };
    }
};

struct PromptInfo {
    std::string server_name;
    std::string name;
    std::string description;
    Json arguments = Json::array();

    static PromptInfo from_json(const Json& j, std::string server = {}) {
        PromptInfo prompt;
        prompt.server_name = std::move(server);
        prompt.name = j.value("name", "");
        prompt.description = j.value("description", "");
        if (j.contains("arguments") && j["arguments"].is_array()) {
            prompt.arguments = j["arguments"];
        }
        return prompt;
    }

    [[nodiscard]] Json to_json() const {
        return {
            {"server", server_name},
            {"name", name},
            {"description", description},
            {"arguments", arguments}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Capabilities
// ═══════════════════════════════════════════════════════════════════════════

/// What a server advertised in `initialize` plus what discovery found.
struct ServerCapabilities {
    bool supports_tools = false;
    bool supports_resources = false;
    bool supports_prompts = false;
    bool resources_subscribe = false;

    ServerInfo server_info;
    std::vector<ToolInfo> tools;
    std::vector<ResourceInfo> resources;
    std::vector<PromptInfo> prompts;

    /// Reads the `capabilities` and `serverInfo` of an initialize result.
    static ServerCapabilities from_initialize_result(const Json& j) {
        ServerCapabilities caps;
        caps.server_info = ServerInfo::from_initialize_result(j);
        if (j.contains("capabilities") && j["capabilities"].is_object()) {
            const Json& c = j["capabilities"];
            caps.supports_tools = c.contains("tools");
            caps.supports_prompts = c.contains("prompts");
            if (c.contains("resources")) {
                caps.supports_resources = true;
                if (c["resources"].is_object()) {
                    caps.resources_subscribe = c["resources"].value("subscribe", false);
                }
            }
        }
        return caps;
    }

    [[nodiscard]] Json to_json() const {
        Json j = {
            {"serverInfo", server_info.to_json()},
            {"tools", Json::array()},
            {"resources", Json::array()},
            {"prompts", Json::array()}
        };
        for (const auto& t : tools) j["tools"].push_back(t.to_json());
        for (const auto& r : resources) j["resources"].push_back(r.to_json());
        for (const auto& p : prompts) j["prompts"].push_back(p.to_json());
        return j;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// List result parsing
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] inline std::vector<ToolInfo> parse_tools_list(const Json& result, const std::string& server) {
    std::vector<ToolInfo> tools;
    if (result.contains("tools") && result["tools"].is_array()) {
        for (const auto& t : result["tools"]) {
            tools.push_back(ToolInfo::from_json(t, server));
        }
    }
    return tools;
}

[[nodiscard]] inline std::vector<ResourceInfo> parse_resources_list(const Json& result, const std::string& server) {
    std::vector<ResourceInfo> resources;
    if (result.contains("resources") && result["resources"].is_array()) {
        for (const auto& r : result["resources"]) {
            resources.push_back(ResourceInfo::from_json(r, server));
        }
    }
    return resources;
}

[[nodiscard]] inline std::vector<PromptInfo> parse_prompts_list(const Json& result, const std::string& server) {
    std::vector<PromptInfo> prompts;
    if (result.contains("prompts") && result["prompts"].is_array()) {
        for (const auto& p : result["prompts"]) {
            prompts.push_back(PromptInfo::from_json(p, server));
        }
    }
    return prompts;
}

}  // namespace mcpchat

#endif  // MCPCHAT_PROTOCOL_MCP_TYPES_HPP
