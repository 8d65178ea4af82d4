#include "mcpchat/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <stdexcept>

namespace mcpchat {

namespace {

// Short timestamps: the file sink is read next to a chat transcript.
constexpr const char* kPattern = "%H:%M:%S.%e %^%-5l%$ %v (%s:%#)";

// Indexed by LogLevel; the enum values are contiguous from Trace to Off.
constexpr std::array<spdlog::level::level_enum, 7> kToSpdlog{
    spdlog::level::trace,
    spdlog::level::debug,
    spdlog::level::info,
    spdlog::level::warn,
    spdlog::level::err,
    spdlog::level::critical,
    spdlog::level::off,
};

// spdlog names must be unique even though we never register them.
std::string unique_logger_name(std::string_view base) {
    static std::atomic<std::uint64_t> counter{0};
    return std::string(base) + "_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

std::shared_ptr<spdlog::logger> build(std::string_view base, std::vector<spdlog::sink_ptr> sinks, LogLevel level) {
    auto logger = std::make_shared<spdlog::logger>(unique_logger_name(base), sinks.begin(), sinks.end());
    logger->set_level(SpdlogLogger::to_spdlog_level(level));
    logger->set_pattern(kPattern);
    return logger;
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return index < kToSpdlog.size() ? kToSpdlog[index] : spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kToSpdlog.size(); ++i) {
        if (kToSpdlog[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::stderr_color_sink_mt>()}, min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (logger_ == nullptr) {
        throw std::invalid_argument("SpdlogLogger needs a logger");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(build("mcpchat", std::move(sinks), min_level))
    , min_level_(min_level)
{}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "{}",
        record.message
    );
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    auto logger = std::make_unique<SpdlogLogger>(
        std::vector<spdlog::sink_ptr>{std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename)}, min_level);
    // Warnings about servers going away should survive a crash.
    logger->get_spdlog_logger()->flush_on(spdlog::level::warn);
    return logger;
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level,
    bool console_to_stderr
) {
    spdlog::sink_ptr console;
    if (console_to_stderr) {
        console = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    } else {
        console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    }
    auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename);
    auto logger = std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{console, file}, min_level);
    logger->get_spdlog_logger()->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace mcpchat
