#include "mcpchat/transport/sse_channel.hpp"
#include "mcpchat/log/logger.hpp"
#include "mcpchat/protocol/wire_json.hpp"

#include <cpr/cpr.h>

#include <cstdint>

namespace mcpchat {

namespace {

cpr::Header to_cpr_headers(const HeaderMap& headers) {
    cpr::Header result;
    for (const auto& [name, value] : headers) {
        result[name] = value;
    }
    return result;
}

TransportError map_cpr_error(const cpr::Error& error) {
    if (error.code == cpr::ErrorCode::OPERATION_TIMEDOUT) {
        return TransportError::timeout(error.message);
    }
    return TransportError::network(error.message);
}

}  // namespace

SseChannel::SseChannel(SseServerConfig config)
    : config_(std::move(config))
    , base_url_(normalize_base_url(config_.url))
    , endpoint_url_(base_url_ + "/message")
{}

SseChannel::~SseChannel() {
    close();
}

std::string SseChannel::normalize_base_url(std::string url) {
    while (url.empty() == false && url.back() == '/') {
        url.pop_back();
    }
    return url;
}

std::string SseChannel::resolve_endpoint(const std::string& base, const std::string& endpoint) {
    if (endpoint.rfind("http://", 0) == 0 || endpoint.rfind("https://", 0) == 0) {
        return endpoint;
    }
    if (endpoint.empty() == false && endpoint.front() == '/') {
        // Absolute path: keep only scheme://host[:port] of the base.
        const auto scheme_end = base.find("://");
        const auto path_start = (scheme_end == std::string::npos)
            ? base.find('/')
            : base.find('/', scheme_end + 3);
        const std::string origin = (path_start == std::string::npos) ? base : base.substr(0, path_start);
        return origin + endpoint;
    }
    return base + "/" + endpoint;
}

std::string SseChannel::endpoint_url() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return endpoint_url_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Open / Close
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> SseChannel::open(MessageHandler on_message, CloseHandler on_close) {
    if (running_.exchange(true) == true) {
        return tl::unexpected(TransportError::protocol("channel already open"));
    }
    if (base_url_.empty() == true) {
        running_.store(false);
        return tl::unexpected(TransportError::protocol("SSE server url is empty"));
    }

    on_message_ = std::move(on_message);
    on_close_ = std::move(on_close);
    parser_.reset();
    set_stream_state(StreamState::Pending);

    stream_thread_ = std::thread([this] { stream_loop(); });

    // Wait for the first bytes of the stream. A quiet but healthy stream is
    // accepted once the connect timeout passes.
    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait_for(lock, config_.connect_timeout, [this] {
        return stream_state_ != StreamState::Pending;
    });

    if (stream_state_ == StreamState::Failed) {
        const std::string failure = stream_failure_;
        lock.unlock();
        close();
        return tl::unexpected(TransportError::network("SSE stream failed: " + failure));
    }

    get_logger().info_fmt("SSE stream open at {}/sse", base_url_);
    return {};
}

void SseChannel::close() {
    running_.store(false);
    state_cv_.notify_all();

    if (stream_thread_.joinable()) {
        if (stream_thread_.get_id() == std::this_thread::get_id()) {
            stream_thread_.detach();
        } else {
            stream_thread_.join();
        }
    }
}

bool SseChannel::is_open() const noexcept {
    return running_.load();
}

void SseChannel::set_stream_state(StreamState state, std::string failure) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        stream_state_ = state;
        stream_failure_ = std::move(failure);
    }
    state_cv_.notify_all();
}

// ─────────────────────────────────────────────────────────────────────────────
// Event Stream
// ─────────────────────────────────────────────────────────────────────────────

void SseChannel::stream_loop() {
    HeaderMap headers = config_.headers;
    headers["Accept"] = "text/event-stream";
    headers["Cache-Control"] = "no-cache";

    bool saw_data = false;

    auto on_chunk = [this, &saw_data](std::string_view data, std::intptr_t /*userdata*/) -> bool {
        if (saw_data == false) {
            saw_data = true;
            set_stream_state(StreamState::Streaming);
        }
        auto events = parser_.feed(data);
        if (events.has_value() == false) {
            get_logger().warn_fmt("SSE parse error: {}", events.error().message);
            return running_.load();
        }
        for (const auto& event : *events) {
            handle_event(event);
        }
        return running_.load();
    };

    // libcurl polls this even on an idle stream; returning false aborts.
    auto keep_going = [this](auto, auto, auto, auto, std::intptr_t) -> bool {
        return running_.load();
    };

    const cpr::Response response = cpr::Get(
        cpr::Url{base_url_ + "/sse"},
        to_cpr_headers(headers),
        cpr::ConnectTimeout{config_.connect_timeout},
        cpr::VerifySsl{config_.verify_ssl},
        cpr::WriteCallback{on_chunk},
        cpr::ProgressCallback{keep_going}
    );

    std::string reason;
    if (response.error.code != cpr::ErrorCode::OK) {
        reason = response.error.message;
    } else if (response.status_code >= 400) {
        reason = "HTTP " + std::to_string(response.status_code);
    } else {
        reason = "server closed the event stream";
    }

    if (saw_data == false) {
        set_stream_state(StreamState::Failed, reason);
    }

    // Same contract as the stdio channel: only an unexpected end is reported,
    // and nothing after the handler touches members.
    if (running_.exchange(false) == true && saw_data == true) {
        get_logger().warn_fmt("SSE stream at {} ended: {}", base_url_, reason);
        CloseHandler handler = on_close_;
        if (handler) {
            handler(reason);
        }
    }
}

void SseChannel::handle_event(const SseEvent& event) {
    const std::string_view type = event.type();

    if (type == "endpoint") {
        std::lock_guard<std::mutex> lock(state_mutex_);
        endpoint_url_ = resolve_endpoint(base_url_, event.data);
        get_logger().debug_fmt("SSE endpoint set to {}", endpoint_url_);
        return;
    }
    if (type == "message") {
        deliver_payload(event.data);
        return;
    }
    if (type == "connected" || type == "ping") {
        return;
    }
    get_logger().debug_fmt("Ignoring SSE event '{}'", type);
}

void SseChannel::deliver_payload(const std::string& text) {
    auto parsed = parse_wire_json(text);
    if (parsed.has_value() == false) {
        get_logger().debug_fmt("Ignoring non-JSON SSE payload from {}: {}", base_url_, parsed.error().message);
        return;
    }
    if (on_message_ == nullptr) {
        return;
    }

    auto deliver = [this](const Json& message) {
        try {
            on_message_(message);
        } catch (const std::exception& e) {
            get_logger().error_fmt("Message handler for {} threw: {}", base_url_, e.what());
        }
    };
    if (parsed->is_array() == true) {
        for (const auto& item : *parsed) {
            deliver(item);
        }
    } else {
        deliver(*parsed);
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Send
// ─────────────────────────────────────────────────────────────────────────────

TransportResult<void> SseChannel::send(const Json& message) {
    if (running_.load() == false) {
        return tl::unexpected(TransportError::closed("SSE channel is closed"));
    }

    HeaderMap headers = config_.headers;
    headers["Content-Type"] = "application/json";
    headers["Accept"] = "application/json, text/event-stream";

    const cpr::Response response = cpr::Post(
        cpr::Url{endpoint_url()},
        to_cpr_headers(headers),
        cpr::Body{message.dump()},
        cpr::ConnectTimeout{config_.connect_timeout},
        cpr::VerifySsl{config_.verify_ssl}
    );

    if (response.error.code != cpr::ErrorCode::OK) {
        return tl::unexpected(map_cpr_error(response.error));
    }
    if (response.status_code >= 400) {
        return tl::unexpected(TransportError::http(
            static_cast<int>(response.status_code),
            "POST rejected with HTTP " + std::to_string(response.status_code)));
    }

    // Servers that answer inline skip the event stream for the reply.
    if (response.text.empty() == false) {
        deliver_payload(response.text);
    }
    return {};
}

}  // namespace mcpchat
