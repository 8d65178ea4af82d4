#include "mcpchat/transport/sse_parser.hpp"

#include <charconv>

namespace mcpchat {

SseResult<std::vector<SseEvent>> SseParser::feed(std::string_view chunk) {
    std::vector<SseEvent> events;

    while (chunk.empty() == false) {
        const auto newline = chunk.find('\n');
        if (newline == std::string_view::npos) {
            if (pending_line_.size() + chunk.size() > config_.max_buffer_size) {
                const std::size_t buffered = pending_line_.size() + chunk.size();
                reset();
                return tl::unexpected(SseParseError{
                    buffered,
                    config_.max_buffer_size,
                    "SSE line exceeds " + std::to_string(config_.max_buffer_size) + " bytes"});
            }
            pending_line_.append(chunk);
            break;
        }

        pending_line_.append(chunk.substr(0, newline));
        chunk.remove_prefix(newline + 1);

        std::string_view line(pending_line_);
        if (line.empty() == false && line.back() == '\r') {
            line.remove_suffix(1);
        }

        if (take_line(line) == true) {
            if (has_data_ == true && current_.data.size() <= config_.max_event_size) {
                events.push_back(std::move(current_));
            }
            clear_event();
        }
        pending_line_.clear();
    }

    return events;
}

void SseParser::reset() {
    pending_line_.clear();
    clear_event();
}

void SseParser::clear_event() {
    current_ = SseEvent{};
    has_data_ = false;
}

bool SseParser::take_line(std::string_view line) {
    if (line.empty() == true) {
        return true;
    }
    if (line.front() == ':') {
        return false;
    }

    std::string_view field = line;
    std::string_view value;
    const auto colon = line.find(':');
    if (colon != std::string_view::npos) {
        field = line.substr(0, colon);
        value = line.substr(colon + 1);
        if (value.empty() == false && value.front() == ' ') {
            value.remove_prefix(1);
        }
    }

    if (field == "data") {
        if (has_data_ == true) {
            current_.data.push_back('\n');
        }
        current_.data.append(value);
        has_data_ = true;
    } else if (field == "event") {
        current_.event = std::string(value);
    } else if (field == "id") {
        current_.id = std::string(value);
    } else if (field == "retry") {
        std::uint32_t retry_ms = 0;
        const auto [end, ec] = std::from_chars(value.data(), value.data() + value.size(), retry_ms);
        if (ec == std::errc{} && end == value.data() + value.size()) {
            current_.retry = retry_ms;
        }
    }
    return false;
}

}  // namespace mcpchat
