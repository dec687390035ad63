#include "memcp/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <atomic>
#include <cstdint>
#include <stdexcept>
#include <utility>

namespace memcp {

namespace {
    constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    // Indexed by LogLevel
    constexpr std::array<spdlog::level::level_enum, 7> kLevelMap = {
        spdlog::level::trace,
        spdlog::level::debug,
        spdlog::level::info,
        spdlog::level::warn,
        spdlog::level::err,
        spdlog::level::critical,
        spdlog::level::off
    };

    // Loggers stay out of spdlog's registry; the suffix keeps names distinct
    // in spdlog's own error messages.
    std::string next_logger_name() {
        static std::atomic<std::uint64_t> counter{0};
        return "memcp_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
    }

    spdlog::sink_ptr stderr_sink() {
        return std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    }
}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    const auto index = static_cast<std::size_t>(level);
    return (index < kLevelMap.size()) ? kLevelMap[index] : spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    for (std::size_t i = 0; i < kLevelMap.size(); ++i) {
        if (kLevelMap[i] == level) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

SpdlogLogger::SpdlogLogger(LogLevel min_level)
    : SpdlogLogger(std::vector<spdlog::sink_ptr>{stderr_sink()}, min_level)
{}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , min_level_(LogLevel::Info)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    min_level_ = from_spdlog_level(logger_->level());
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(next_logger_name(), sinks.begin(), sinks.end()))
    , min_level_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kPattern);
    // Warnings and above reach the file even if the process dies right after
    logger_->flush_on(spdlog::level::warn);
}

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Implementation
// ─────────────────────────────────────────────────────────────────────────────

void SpdlogLogger::log(const LogRecord& record) {
    if (!should_log(record.level)) {
        return;
    }

    const spdlog::source_loc where{
        record.location.file_name(),
        static_cast<int>(record.location.line()),
        record.location.function_name()
    };
    logger_->log(where, to_spdlog_level(record.level), "{}", record.message);
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
}

void SpdlogLogger::set_level(LogLevel level) noexcept {
    min_level_ = level;
    logger_->set_level(to_spdlog_level(level));
}

void SpdlogLogger::flush() {
    logger_->flush();
}

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

std::unique_ptr<SpdlogLogger> make_spdlog_stderr_logger(LogLevel min_level) {
    return std::make_unique<SpdlogLogger>(min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_stderr_file_logger(const std::string& filename, LogLevel min_level) {
    // Appends; basic_file_sink creates missing parent directories
    std::vector<spdlog::sink_ptr> sinks{
        stderr_sink(),
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename, false)
    };
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

}  // namespace memcp
