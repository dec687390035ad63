#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Dispatcher
// ═══════════════════════════════════════════════════════════════════════════
// Routes decoded JSON-RPC requests to their handlers and builds the response
// envelope. One request at a time; the caller serializes access.
//
//   method                     result
//   ─────────────────────────  ──────────────────────────────────────────────
//   initialize                 binds the engine, returns server info
//   ping                       {}
//   tools/list                 catalog tools
//   tools/call                 tool payload as text content
//   resources/list             catalog resources
//   resources/read             memory store summary
//   prompts/list               {"prompts": []}
//   notifications/*            no response
//   anything else              error -32601
//
// Tool failures (validation, identity, engine) stay inside the tool result:
// the response is a normal result whose content reports
// {success: false, error, error_type} and which carries isError. Anything
// that escapes a handler becomes error -32603.

#include "memcp/engine/engine_binding.hpp"
#include "memcp/protocol/json_rpc.hpp"
#include "memcp/protocol/mcp_types.hpp"
#include "memcp/server/engine_adapter.hpp"
#include "memcp/server/identity.hpp"
#include "memcp/server/tool_catalog.hpp"
#include "memcp/value/sanitizer.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

namespace memcp {

struct DispatcherConfig {
    Implementation server_info{"memcp", "0.1.0"};
    std::string protocol_version{MCP_PROTOCOL_VERSION};
    std::size_t max_sanitize_passes{kDefaultMaxSanitizePasses};
};

class Dispatcher {
public:
    Dispatcher(DispatcherConfig config, EngineBinding& binding, IdentityResolver& identity);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    /// Complete response envelope, or nullopt when the method is a
    /// notification. Never throws for std::exception failures.
    [[nodiscard]] std::optional<Json> dispatch(const JsonRpcRequest& request);

    /// Result object for a method, or a JSON-RPC error for unknown methods.
    /// Unexpected failures propagate as exceptions.
    [[nodiscard]] tl::expected<Json, JsonRpcError> handle(std::string_view method, const Json& params);

    [[nodiscard]] CallToolResult call_tool(const Json& params);

    [[nodiscard]] ReadResourceResult read_resource(const Json& params);

    [[nodiscard]] static bool is_notification(std::string_view method) noexcept;

    [[nodiscard]] const DispatcherConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] Json initialize();
    [[nodiscard]] CallToolResult run_tool(ToolKind kind, const Json& arguments);
    [[nodiscard]] Json encode(const Value& value) const;
    [[nodiscard]] Json memory_store_summary();

    DispatcherConfig config_;
    IdentityResolver& identity_;
    EngineAdapter adapter_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Tool Result Helpers
// ─────────────────────────────────────────────────────────────────────────────

/// Single text item holding payload as JSON indented by 2.
[[nodiscard]] CallToolResult make_tool_result(const Json& payload, bool is_error = false);

/// {success: false, error: <message>, error_type: <kind>} with isError.
[[nodiscard]] CallToolResult make_tool_failure(const std::exception& error);

}  // namespace memcp
