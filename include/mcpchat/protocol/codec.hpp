#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace mcpchat {

using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// Request Ids
// ═══════════════════════════════════════════════════════════════════════════

using RequestId = std::int64_t;

/// Process-wide, strictly increasing, starting at 1. Safe from any thread.
[[nodiscard]] RequestId next_request_id() noexcept;

// ═══════════════════════════════════════════════════════════════════════════
// Outgoing Messages
// ═══════════════════════════════════════════════════════════════════════════

struct Message {
    std::optional<RequestId> id;   // absent for notifications
    std::string method;
    Json params = Json::object();

    [[nodiscard]] bool is_notification() const noexcept { return id.has_value() == false; }

    [[nodiscard]] Json to_json() const;

    /// Compact single-line text, suitable for line-delimited transports.
    [[nodiscard]] std::string serialize() const;
};

[[nodiscard]] Message encode_request(std::string method, Json params = Json::object());
[[nodiscard]] Message encode_notification(std::string method, Json params = Json::object());

/// Responses to server-initiated requests.
[[nodiscard]] Json encode_result(const Json& id, Json result);
[[nodiscard]] Json encode_error(const Json& id, int code, std::string_view message);

// JSON-RPC error codes used by this client.
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInternalError = -32603;

// ═══════════════════════════════════════════════════════════════════════════
// Decoding
// ═══════════════════════════════════════════════════════════════════════════

struct DecodeError {
    enum class Code {
        InvalidJson,
        NotAnObject,
        InvalidVersion,
        InvalidId,
        Unrecognized
    };

    Code code{Code::Unrecognized};
    std::string message;
};

[[nodiscard]] constexpr std::string_view to_string(DecodeError::Code code) noexcept {
    switch (code) {
        case DecodeError::Code::InvalidJson:    return "InvalidJson";
        case DecodeError::Code::NotAnObject:    return "NotAnObject";
        case DecodeError::Code::InvalidVersion: return "InvalidVersion";
        case DecodeError::Code::InvalidId:      return "InvalidId";
        case DecodeError::Code::Unrecognized:   return "Unrecognized";
    }
    return "Unknown";
}

template <typename T>
using DecodeResult = tl::expected<T, DecodeError>;

enum class DecodedKind {
    Notification,   // method, no id
    Result,         // result + id
    Error,          // error + id (id may be null)
    Request         // method + id, initiated by the server
};

[[nodiscard]] constexpr std::string_view to_string(DecodedKind kind) noexcept {
    switch (kind) {
        case DecodedKind::Notification: return "notification";
        case DecodedKind::Result:       return "result";
        case DecodedKind::Error:        return "error";
        case DecodedKind::Request:      return "request";
    }
    return "unknown";
}

struct DecodedMessage {
    DecodedKind kind{DecodedKind::Notification};
    std::string method;             // Notification / Request
    Json params = Json::object();   // Notification / Request
    Json payload;                   // Result value or error object
    Json raw_id;                    // id as received (null when absent)
    std::optional<RequestId> id;    // integer ids only

    [[nodiscard]] bool is_response() const noexcept {
        return kind == DecodedKind::Result || kind == DecodedKind::Error;
    }
};

/// Classifies one wire message. Never throws.
[[nodiscard]] DecodeResult<DecodedMessage> decode(std::string_view text);
[[nodiscard]] DecodeResult<DecodedMessage> decode(const Json& message);

}  // namespace mcpchat
