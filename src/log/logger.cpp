#include "mcpchat/log/logger.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>
#include <utility>

namespace mcpchat {

namespace {

// Indexed by LogLevel; Off never reaches the console.
constexpr std::array<std::string_view, 7> kLevelColors = {
    "\033[90m",     // trace
    "\033[36m",     // debug
    "\033[32m",     // info
    "\033[33m",     // warn
    "\033[31m",     // error
    "\033[1;35m",   // fatal
    "",
};
constexpr std::string_view kDim = "\033[2m";
constexpr std::string_view kPlain = "\033[0m";

constexpr std::array<std::pair<std::string_view, LogLevel>, 9> kLevelNames = {{
    {"trace", LogLevel::Trace},
    {"debug", LogLevel::Debug},
    {"info", LogLevel::Info},
    {"warn", LogLevel::Warn},
    {"warning", LogLevel::Warn},
    {"error", LogLevel::Error},
    {"fatal", LogLevel::Fatal},
    {"critical", LogLevel::Fatal},
    {"off", LogLevel::Off},
}};

// HH:MM:SS.mmm in local time, matching the spdlog pattern.
[[nodiscard]] std::string wall_clock(std::chrono::system_clock::time_point when) {
    const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(when.time_since_epoch()) % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis.count());
}

[[nodiscard]] std::string_view file_name_only(std::string_view path) noexcept {
    const auto slash = path.rfind('/');
    return slash == std::string_view::npos ? path : path.substr(slash + 1);
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    auto same = [name](std::string_view candidate) {
        return std::ranges::equal(name, candidate, [](char a, char b) {
            return std::tolower(static_cast<unsigned char>(a)) == b;
        });
    };
    for (const auto& [candidate, level] : kLevelNames) {
        if (same(candidate)) {
            return level;
        }
    }
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

std::string ConsoleLogger::format(const LogRecord& record) const {
    const std::string time = wall_clock(record.timestamp);
    const std::string_view file = file_name_only(record.location.file_name());
    const auto line = record.location.line();

    if (colors_enabled_ == false) {
        return std::format("{} {:<5} {} ({}:{})\n", time, to_string(record.level), record.message, file, line);
    }
    const std::string_view color = kLevelColors[static_cast<std::size_t>(record.level)];
    return std::format("{}{}{} {}{:<5}{} {} {}({}:{}){}\n",
                       kDim, time, kPlain,
                       color, to_string(record.level), kPlain,
                       record.message,
                       kDim, file, line, kPlain);
}

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }
    const std::string text = format(record);

    // One write per record keeps lines from different threads whole.
    static std::mutex stderr_mutex;
    std::lock_guard<std::mutex> lock(stderr_mutex);
    std::cerr << text << std::flush;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct LoggerHolder {
    std::mutex mutex;
    std::unique_ptr<ILogger> current = std::make_unique<NullLogger>();
};

LoggerHolder& holder() {
    static LoggerHolder instance;
    return instance;
}

}  // namespace

ILogger& get_logger() noexcept {
    LoggerHolder& h = holder();
    std::lock_guard<std::mutex> lock(h.mutex);
    return *h.current;
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    LoggerHolder& h = holder();
    std::lock_guard<std::mutex> lock(h.mutex);
    h.current = logger != nullptr ? std::move(logger) : std::make_unique<NullLogger>();
}

}  // namespace mcpchat
