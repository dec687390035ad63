#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Engine Adapter
// ═══════════════════════════════════════════════════════════════════════════
// Projects tool-call arguments onto engine requests and forwards them to the
// bound engine. Required arguments are taken from the tool's input schema
// (see tool_catalog.hpp); one that is absent, null or an empty string is a
// ValidationError. Optional arguments the client did not send are left
// disengaged. user_id always goes through the IdentityResolver.
//
// Integer arguments (memory_id, limit, offset) accept any JSON scalar that
// denotes an integer: integers, finite floats (truncated toward zero) and
// decimal strings with an optional sign and surrounding whitespace.

#include "memcp/engine/engine_binding.hpp"
#include "memcp/server/identity.hpp"
#include "memcp/server/tool_catalog.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace memcp {

// ─────────────────────────────────────────────────────────────────────────────
// Argument Coercion
// ─────────────────────────────────────────────────────────────────────────────

/// Throws ValidationError "<name> must be a valid integer, got: <value>".
[[nodiscard]] std::int64_t coerce_integer(const Json& value, std::string_view name);

/// Throws ValidationError naming the first missing required argument.
void validate_required(const ToolDescriptor& tool, const Json& arguments);

/// True when the argument counts as not supplied (absent, null or "").
[[nodiscard]] bool is_missing(const Json& arguments, std::string_view name);

// ─────────────────────────────────────────────────────────────────────────────
// Request Projection
// ─────────────────────────────────────────────────────────────────────────────
// Each function validates arguments and builds the engine request. Throws
// ValidationError on bad input.

[[nodiscard]] AddRequest make_add_request(const Json& arguments, const Identity& identity);
[[nodiscard]] SearchRequest make_search_request(const Json& arguments, const Identity& identity);
[[nodiscard]] GetRequest make_get_request(const Json& arguments, const Identity& identity);
[[nodiscard]] UpdateRequest make_update_request(const Json& arguments, const Identity& identity);
[[nodiscard]] DeleteRequest make_delete_request(const Json& arguments, const Identity& identity);
[[nodiscard]] DeleteAllRequest make_delete_all_request(const Json& arguments, const Identity& identity);
[[nodiscard]] ListRequest make_list_request(const Json& arguments, const Identity& identity);

// ─────────────────────────────────────────────────────────────────────────────
// EngineAdapter
// ─────────────────────────────────────────────────────────────────────────────

class EngineAdapter {
public:
    EngineAdapter(EngineBinding& binding, IdentityResolver& identity);

    /// Validates, resolves identity, builds the request and calls the engine.
    /// Engine exceptions propagate unchanged.
    [[nodiscard]] Value add_memory(const Json& arguments);
    [[nodiscard]] Value search_memories(const Json& arguments);
    [[nodiscard]] Value get_memory(const Json& arguments);
    [[nodiscard]] Value update_memory(const Json& arguments);

    /// Returns the id that was deleted.
    std::int64_t delete_memory(const Json& arguments);

    void delete_all_memories(const Json& arguments);
    [[nodiscard]] Value list_memories(const Json& arguments);

    /// Engine for direct use (resource reads); binds on first use.
    [[nodiscard]] MemoryEngine& engine();

    [[nodiscard]] bool is_bound() const;

private:
    [[nodiscard]] Identity prepare(ToolKind kind, const Json& arguments);

    EngineBinding& binding_;
    IdentityResolver& identity_;
};

}  // namespace memcp
