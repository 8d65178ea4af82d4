#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Error
// ═══════════════════════════════════════════════════════════════════════════
// Errors raised by the server registry and everything that routes through
// it. Lookup failures never carry a transport error; call failures always do.

#include "mcpchat/transport/transport.hpp"

#include <tl/expected.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcpchat {

enum class ServerErrorCode {
    ServerNotFound,      ///< No server registered under that name
    ServerNotConnected,  ///< Registered but not in the connected state
    ServerDisabled,      ///< Taken out of rotation by health monitoring
    AlreadyRegistered,   ///< Name collision on register
    InvalidTransition,   ///< Status change not allowed from the current state
    Abandoned,           ///< A connect attempt finished after its caller gave up
    Transport            ///< The server was reached and the call failed
};

[[nodiscard]] constexpr std::string_view to_string(ServerErrorCode code) noexcept {
    switch (code) {
        case ServerErrorCode::ServerNotFound:     return "server_not_found";
        case ServerErrorCode::ServerNotConnected: return "server_not_connected";
        case ServerErrorCode::ServerDisabled:     return "server_disabled";
        case ServerErrorCode::AlreadyRegistered:  return "already_registered";
        case ServerErrorCode::InvalidTransition:  return "invalid_transition";
        case ServerErrorCode::Abandoned:          return "abandoned";
        case ServerErrorCode::Transport:          return "transport";
    }
    return "unknown";
}

struct ServerError {
    ServerErrorCode code;
    std::string message;
    std::optional<TransportError> transport;

    /// True for errors decided before any I/O happened.
    [[nodiscard]] bool is_lookup_error() const noexcept {
        return code == ServerErrorCode::ServerNotFound
            || code == ServerErrorCode::ServerNotConnected
            || code == ServerErrorCode::ServerDisabled;
    }

    [[nodiscard]] static ServerError not_found(const std::string& name) {
        return {ServerErrorCode::ServerNotFound, "server '" + name + "' not found", std::nullopt};
    }

    [[nodiscard]] static ServerError not_connected(const std::string& name) {
        return {ServerErrorCode::ServerNotConnected, "server '" + name + "' is not connected", std::nullopt};
    }

    [[nodiscard]] static ServerError disabled(const std::string& name) {
        return {ServerErrorCode::ServerDisabled, "server '" + name + "' is disabled", std::nullopt};
    }

    [[nodiscard]] static ServerError already_registered(const std::string& name) {
        return {ServerErrorCode::AlreadyRegistered, "server '" + name + "' is already registered", std::nullopt};
    }

    [[nodiscard]] static ServerError invalid_transition(std::string_view from, std::string_view to) {
        return {ServerErrorCode::InvalidTransition,
                "cannot move from " + std::string(from) + " to " + std::string(to),
                std::nullopt};
    }

    [[nodiscard]] static ServerError abandoned(const std::string& name) {
        return {ServerErrorCode::Abandoned, "connect attempt for '" + name + "' was abandoned", std::nullopt};
    }

    [[nodiscard]] static ServerError from_transport(TransportError error) {
        std::string text = error.describe();
        return {ServerErrorCode::Transport, std::move(text), std::move(error)};
    }
};

template <typename T>
using ServerResult = tl::expected<T, ServerError>;

}  // namespace mcpchat
