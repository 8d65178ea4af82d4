#include <catch2/catch_test_macros.hpp>

#include "mcpchat/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace mcpchat;

namespace {

std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    return buffer.str();
}

}  // namespace

TEST_CASE("Level conversion round-trips", "[log][spdlog]") {
    for (const auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                             LogLevel::Warn, LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
}

TEST_CASE("SpdlogLogger writes through its sinks", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    SpdlogLogger logger({sink}, LogLevel::Info);
    logger.set_pattern("%l %v");

    logger.debug("hidden");
    logger.info("server fs connected");
    logger.warn_fmt("{} retries left", 2);
    logger.flush();

    const std::string text = out.str();
    REQUIRE(text.find("hidden") == std::string::npos);
    REQUIRE(text.find("info server fs connected") != std::string::npos);
    REQUIRE(text.find("warning 2 retries left") != std::string::npos);
}

TEST_CASE("SpdlogLogger level can be lowered", "[log][spdlog]") {
    std::ostringstream out;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(out);
    SpdlogLogger logger({sink}, LogLevel::Warn);
    logger.set_pattern("%v");

    logger.debug("first");
    logger.set_level(LogLevel::Debug);
    logger.debug("second");
    logger.flush();

    REQUIRE(out.str() == "second\n");
}

TEST_CASE("Wrapping an existing spdlog logger adopts its level", "[log][spdlog]") {
    auto inner = std::make_shared<spdlog::logger>("wrapped_test",
        std::make_shared<spdlog::sinks::ostream_sink_mt>(std::cout));
    inner->set_level(spdlog::level::err);

    SpdlogLogger logger(inner);

    REQUIRE(logger.should_log(LogLevel::Warn) == false);
    REQUIRE(logger.should_log(LogLevel::Error));
    REQUIRE(logger.get_spdlog_logger() == inner);
}

TEST_CASE("The file logger appends to its file", "[log][spdlog][file]") {
    const auto path = std::filesystem::temp_directory_path() / "mcpchat_spdlog_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_file_logger(path.string(), LogLevel::Debug);
        logger->debug("probe of fs failed");
        logger->flush();
    }

    REQUIRE(read_file(path).find("probe of fs failed") != std::string::npos);
    std::filesystem::remove(path);
}
