#include "mcpchat/transport/transport.hpp"

#include <format>

namespace mcpchat {

std::string TransportError::describe() const {
    std::string text = std::format("{} error: {}", to_string(category), message);
    if (status_code.has_value()) {
        text += std::format(" (HTTP {})", *status_code);
    }
    if (rpc_code.has_value()) {
        text += std::format(" (code {})", *rpc_code);
    }
    return text;
}

std::string ServerConfig::describe() const {
    if (const auto* stdio_config = std::get_if<StdioServerConfig>(&transport)) {
        std::string text = "stdio: " + stdio_config->command;
        for (const auto& arg : stdio_config->args) {
            text += ' ';
            text += arg;
        }
        return text;
    }
    return "sse: " + std::get<SseServerConfig>(transport).url;
}

}  // namespace mcpchat
