#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Server Configuration
// ═══════════════════════════════════════════════════════════════════════════
// Settings for memcp-server. Sources are layered in increasing priority:
//
//   1. defaults (below)
//   2. JSON config file            load_file()
//   3. .env file                   load_env_file(), never overrides the
//                                  process environment
//   4. environment variables       apply_environment()
//   5. command-line flags          applied by the caller
//
// The JSON file is strict: unknown keys and wrong value types are errors.

#include "memcp/log/logger.hpp"
#include "memcp/protocol/mcp_types.hpp"
#include "memcp/server/identity.hpp"
#include "memcp/transport/stdio_transport.hpp"
#include "memcp/value/sanitizer.hpp"

#include <cstddef>
#include <optional>
#include <string>

#include <tl/expected.hpp>

namespace memcp {

inline constexpr const char* kDefaultUserIdEnv = "MEMCP_USER_ID";
inline constexpr const char* kLogLevelEnv = "MEMCP_LOG_LEVEL";
inline constexpr const char* kLogFileEnv = "MEMCP_LOG_FILE";
inline constexpr const char* kDefaultUserIdOverrideEnv = "MEMCP_DEFAULT_USER_ID";

struct ConfigError {
    enum class Code {
        FileNotFound,
        ParseError,
        UnknownKey,
        InvalidValue
    };

    Code code;
    std::string message;
};

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

struct ServerConfig {
    // ─────────────────────────────────────────────────────────────────────────
    // Server Identity
    // ─────────────────────────────────────────────────────────────────────────

    std::string server_name{"memcp"};
    std::string server_version{"0.1.0"};
    std::string protocol_version{MCP_PROTOCOL_VERSION};

    // ─────────────────────────────────────────────────────────────────────────
    // User Identity
    // ─────────────────────────────────────────────────────────────────────────

    // When set, every call without a user_id argument uses this value and
    // user_id_env is ignored.
    std::optional<std::string> default_user_id;

    // Environment variable consulted for the default user id.
    std::string user_id_env{kDefaultUserIdEnv};

    // Used when no default can be determined.
    std::string fallback_user_id{kFallbackUserId};

    // ─────────────────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────────────────

    LogLevel log_level{LogLevel::Info};

    // Log file in addition to stderr. Never stdout.
    std::optional<std::string> log_file;

    // ─────────────────────────────────────────────────────────────────────────
    // Limits
    // ─────────────────────────────────────────────────────────────────────────

    std::size_t max_line_length{kDefaultMaxLineLength};
    std::size_t max_sanitize_passes{kDefaultMaxSanitizePasses};

    // 0 = unbounded
    std::size_t engine_capacity{0};

    // ─────────────────────────────────────────────────────────────────────────
    // Loading
    // ─────────────────────────────────────────────────────────────────────────

    /// Applies the keys of a JSON object on top of base.
    [[nodiscard]] static ConfigResult<ServerConfig> from_json(const Json& json, ServerConfig base = {});

    /// Reads and applies a JSON config file on top of base.
    [[nodiscard]] static ConfigResult<ServerConfig> load_file(const std::string& path, ServerConfig base = {});

    /// Applies MEMCP_LOG_LEVEL, MEMCP_LOG_FILE and MEMCP_DEFAULT_USER_ID.
    [[nodiscard]] ConfigResult<void> apply_environment();
};

/// Loads KEY=VALUE lines into the process environment. Blank lines and
/// lines starting with '#' are skipped, an optional "export " prefix is
/// accepted and matching single or double quotes around the value are
/// removed. Variables that are already set are left alone. Returns the
/// number of variables set.
[[nodiscard]] ConfigResult<std::size_t> load_env_file(const std::string& path);

}  // namespace memcp
