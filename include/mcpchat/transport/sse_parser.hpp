#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <tl/expected.hpp>

namespace mcpchat {

// ─────────────────────────────────────────────────────────────────────────────
// Server-Sent Events
// ─────────────────────────────────────────────────────────────────────────────
// Wire format: "field: value" lines, events terminated by a blank line,
// ':' starts a comment, multiple data lines join with '\n'.

struct SseEvent {
    std::optional<std::string> id;
    std::optional<std::string> event;
    std::string data;
    std::optional<std::uint32_t> retry;

    /// Event type with the protocol default applied.
    [[nodiscard]] std::string_view type() const noexcept {
        return event.has_value() ? std::string_view(*event) : std::string_view("message");
    }
};

struct SseParserConfig {
    std::size_t max_buffer_size{1024 * 1024};
    std::size_t max_event_size{512 * 1024};
};

struct SseParseError {
    std::size_t buffered{0};
    std::size_t limit{0};
    std::string message;
};

template <typename T>
using SseResult = tl::expected<T, SseParseError>;

/// Incremental parser: partial lines are held until the next feed().
class SseParser {
public:
    SseParser() = default;
    explicit SseParser(SseParserConfig config) : config_(config) {}

    /// Returns the events completed by this chunk. Fails when an unterminated
    /// line would grow past max_buffer_size; the parser resets in that case.
    [[nodiscard]] SseResult<std::vector<SseEvent>> feed(std::string_view chunk);

    void reset();

    [[nodiscard]] std::size_t buffer_size() const noexcept { return pending_line_.size(); }

private:
    /// True when `line` was the blank line that ends an event.
    bool take_line(std::string_view line);
    void clear_event();

    SseParserConfig config_;
    std::string pending_line_;
    SseEvent current_;
    bool has_data_{false};
};

}  // namespace mcpchat
