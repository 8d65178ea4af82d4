#include "mcpchat/protocol/codec.hpp"
#include "mcpchat/protocol/wire_json.hpp"

#include <atomic>

namespace mcpchat {
namespace {

constexpr std::string_view kJsonRpcVersion{"2.0"};

std::atomic<RequestId>& id_counter() {
    static std::atomic<RequestId> counter{0};
    return counter;
}

tl::unexpected<DecodeError> fail(DecodeError::Code code, std::string message) {
    return tl::unexpected(DecodeError{code, std::move(message)});
}

// Integer ids map to RequestId; string ids are kept only in raw_id.
DecodeResult<std::optional<RequestId>> parse_id(const Json& id_node) {
    if (id_node.is_number_integer() == true) {
        return std::optional<RequestId>{id_node.get<RequestId>()};
    }
    if (id_node.is_string() == true || id_node.is_null() == true) {
        return std::optional<RequestId>{};
    }
    return fail(DecodeError::Code::InvalidId, "id must be an integer, string or null");
}

Json params_or_empty(const Json& message) {
    const auto it = message.find("params");
    if (it == message.end() || it->is_null() == true) {
        return Json::object();
    }
    return *it;
}

}  // namespace

RequestId next_request_id() noexcept {
    return id_counter().fetch_add(1, std::memory_order_relaxed) + 1;
}

// ─────────────────────────────────────────────────────────────────────────────
// Encoding
// ─────────────────────────────────────────────────────────────────────────────

Json Message::to_json() const {
    Json payload = Json::object();
    payload["jsonrpc"] = kJsonRpcVersion;
    if (id.has_value()) {
        payload["id"] = *id;
    }
    payload["method"] = method;
    payload["params"] = params;
    return payload;
}

std::string Message::serialize() const {
    return to_json().dump();
}

Message encode_request(std::string method, Json params) {
    return Message{next_request_id(), std::move(method), std::move(params)};
}

Message encode_notification(std::string method, Json params) {
    return Message{std::nullopt, std::move(method), std::move(params)};
}

Json encode_result(const Json& id, Json result) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"result", std::move(result)}
    };
}

Json encode_error(const Json& id, int code, std::string_view message) {
    return Json{
        {"jsonrpc", kJsonRpcVersion},
        {"id", id},
        {"error", {{"code", code}, {"message", message}}}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// Decoding
// ─────────────────────────────────────────────────────────────────────────────

DecodeResult<DecodedMessage> decode(std::string_view text) {
    auto parsed = parse_wire_json(text);
    if (parsed.has_value() == false) {
        return fail(DecodeError::Code::InvalidJson, "message is not valid JSON: " + parsed.error().message);
    }
    return decode(*parsed);
}

DecodeResult<DecodedMessage> decode(const Json& message) {
    if (message.is_object() == false) {
        return fail(DecodeError::Code::NotAnObject, "message must be a JSON object");
    }

    const auto version = message.find("jsonrpc");
    if (version != message.end()) {
        if (version->is_string() == false || version->get<std::string>() != kJsonRpcVersion) {
            return fail(DecodeError::Code::InvalidVersion, "jsonrpc must equal \"2.0\"");
        }
    }

    DecodedMessage decoded;
    const bool has_id = message.contains("id");
    if (has_id == true) {
        decoded.raw_id = message.at("id");
        auto id = parse_id(decoded.raw_id);
        if (id.has_value() == false) {
            return tl::unexpected(id.error());
        }
        decoded.id = *id;
    }

    const bool id_present = has_id == true && decoded.raw_id.is_null() == false;

    if (message.contains("result") == true && id_present == true) {
        decoded.kind = DecodedKind::Result;
        decoded.payload = message.at("result");
        return decoded;
    }

    if (message.contains("error") == true && has_id == true) {
        decoded.kind = DecodedKind::Error;
        decoded.payload = message.at("error");
        return decoded;
    }

    const auto method = message.find("method");
    if (method != message.end() && method->is_string() == true) {
        decoded.method = method->get<std::string>();
        decoded.params = params_or_empty(message);
        decoded.kind = (id_present == true) ? DecodedKind::Request : DecodedKind::Notification;
        return decoded;
    }

    return fail(DecodeError::Code::Unrecognized,
                "message is neither a request, a response nor a notification");
}

}  // namespace mcpchat
