// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "memcp/log/spdlog_logger.hpp"

#include <spdlog/sinks/ostream_sink.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

using namespace memcp;

namespace {

struct StreamLogger {
    std::ostringstream stream;
    std::unique_ptr<SpdlogLogger> logger;

    explicit StreamLogger(LogLevel level) {
        auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
        logger = std::make_unique<SpdlogLogger>(std::vector<spdlog::sink_ptr>{sink}, level);
    }
};

std::string read_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Levels
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger stderr factory honours the minimum level", "[log][spdlog]") {
    auto logger = make_spdlog_stderr_logger(LogLevel::Warn);
    REQUIRE(logger != nullptr);

    REQUIRE_FALSE(logger->should_log(LogLevel::Info));
    REQUIRE(logger->should_log(LogLevel::Warn));
    REQUIRE(logger->should_log(LogLevel::Fatal));
}

TEST_CASE("SpdlogLogger level can be changed", "[log][spdlog]") {
    StreamLogger capture(LogLevel::Info);
    REQUIRE_FALSE(capture.logger->should_log(LogLevel::Debug));

    capture.logger->set_level(LogLevel::Debug);
    REQUIRE(capture.logger->should_log(LogLevel::Debug));
    REQUIRE(capture.logger->get_spdlog_logger()->level() == spdlog::level::debug);
}

TEST_CASE("SpdlogLogger level conversion is symmetric", "[log][spdlog]") {
    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info, LogLevel::Warn,
                       LogLevel::Error, LogLevel::Fatal, LogLevel::Off}) {
        REQUIRE(SpdlogLogger::from_spdlog_level(SpdlogLogger::to_spdlog_level(level)) == level);
    }
    REQUIRE(SpdlogLogger::to_spdlog_level(LogLevel::Fatal) == spdlog::level::critical);
}

// ═══════════════════════════════════════════════════════════════════════════
// Output
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger writes messages with level and source", "[log][spdlog]") {
    StreamLogger capture(LogLevel::Info);

    capture.logger->debug("hidden");
    capture.logger->info("Memory instance initialized");
    capture.logger->flush();

    const std::string output = capture.stream.str();
    REQUIRE(output.find("Memory instance initialized") != std::string::npos);
    REQUIRE(output.find("[info]") != std::string::npos);
    REQUIRE(output.find("spdlog_logger_test") != std::string::npos);
    REQUIRE(output.find("hidden") == std::string::npos);
}

TEST_CASE("SpdlogLogger works as the global logger", "[log][spdlog]") {
    StreamLogger capture(LogLevel::Trace);
    auto& stream = capture.stream;
    set_logger(std::move(capture.logger));

    MEMCP_LOG_WARN("Failed to get user_id from config: unset, using default");
    set_logger(nullptr);

    REQUIRE(stream.str().find("using default") != std::string::npos);
    REQUIRE(stream.str().find("[warning]") != std::string::npos);
}

TEST_CASE("SpdlogLogger wraps an existing spdlog logger", "[log][spdlog]") {
    std::ostringstream stream;
    auto sink = std::make_shared<spdlog::sinks::ostream_sink_mt>(stream);
    auto inner = std::make_shared<spdlog::logger>("memcp_wrapped", sink);
    inner->set_level(spdlog::level::err);

    SpdlogLogger logger(inner);
    REQUIRE(logger.should_log(LogLevel::Error));
    REQUIRE_FALSE(logger.should_log(LogLevel::Warn));
    REQUIRE(logger.get_spdlog_logger() == inner);
}

TEST_CASE("SpdlogLogger rejects a null spdlog logger", "[log][spdlog]") {
    REQUIRE_THROWS_AS(SpdlogLogger(std::shared_ptr<spdlog::logger>{}), std::invalid_argument);
}

// ═══════════════════════════════════════════════════════════════════════════
// File Logging
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("SpdlogLogger appends to a log file", "[log][spdlog][file]") {
    const auto path = std::filesystem::temp_directory_path() / "memcp_spdlog_logger_test.log";
    std::filesystem::remove(path);

    {
        auto logger = make_spdlog_stderr_file_logger(path.string(), LogLevel::Info);
        logger->info("first line");
        logger->error("second line");
        logger->flush();
    }

    const std::string contents = read_file(path);
    REQUIRE(contents.find("first line") != std::string::npos);
    REQUIRE(contents.find("second line") != std::string::npos);

    std::filesystem::remove(path);
}
