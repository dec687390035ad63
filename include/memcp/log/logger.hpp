#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace memcp {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Per-message protocol traffic
    Debug = 1,  // Dispatch decisions, engine call timings
    Info  = 2,  // Lifecycle (start, binding, shutdown)
    Warn  = 3,  // Degraded but handled (fallbacks)
    Error = 4,  // Request or tool call failed
    Fatal = 5,  // Server cannot continue
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Accepts level names case-insensitively ("warning" and "critical" too).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Trace, msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Fatal, msg, loc);
    }

private:
    void write(LogLevel level, std::string_view msg, const std::source_location& loc) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default until the server installs a real backend
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ILogger& get_logger() noexcept;

/// Installs a new global logger; nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// The message expression is only evaluated when the level is enabled.

#define MEMCP_LOG_TRACE(msg) \
    do { if (::memcp::get_logger().should_log(::memcp::LogLevel::Trace)) \
         ::memcp::get_logger().trace(msg); } while(false)

#define MEMCP_LOG_DEBUG(msg) \
    do { if (::memcp::get_logger().should_log(::memcp::LogLevel::Debug)) \
         ::memcp::get_logger().debug(msg); } while(false)

#define MEMCP_LOG_INFO(msg) \
    do { if (::memcp::get_logger().should_log(::memcp::LogLevel::Info)) \
         ::memcp::get_logger().info(msg); } while(false)

#define MEMCP_LOG_WARN(msg) \
    do { if (::memcp::get_logger().should_log(::memcp::LogLevel::Warn)) \
         ::memcp::get_logger().warn(msg); } while(false)

#define MEMCP_LOG_ERROR(msg) \
    do { if (::memcp::get_logger().should_log(::memcp::LogLevel::Error)) \
         ::memcp::get_logger().error(msg); } while(false)

#define MEMCP_LOG_FATAL(msg) \
    do { if (::memcp::get_logger().should_log(::memcp::LogLevel::Fatal)) \
         ::memcp::get_logger().fatal(msg); } while(false)

}  // namespace memcp
