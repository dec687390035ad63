#pragma once

#include "memcp/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace memcp {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// spdlog backend for ILogger. Console output always goes to stderr: stdout
// carries the JSON-RPC stream and must not receive anything else.

class SpdlogLogger final : public ILogger {
public:
    /// stderr sink
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wraps an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Custom sinks
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;
    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

/// stderr only
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_stderr_logger(LogLevel min_level = LogLevel::Info);

/// stderr plus an appending file sink. Throws spdlog::spdlog_ex when the file
/// cannot be opened.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_stderr_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace memcp
