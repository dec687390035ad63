#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Tool Catalog
// ═══════════════════════════════════════════════════════════════════════════
// Static registry of the tools and resources the server exposes. The set of
// tools is closed: ToolKind enumerates them and the dispatcher switches over
// it exhaustively. Descriptors are built once and listed in declaration
// order.
//
// The "required" list of each input schema is also what the engine adapter
// validates against, so the two cannot drift apart.

#include "memcp/protocol/mcp_types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memcp {

enum class ToolKind {
    AddMemory,
    SearchMemories,
    GetMemory,
    UpdateMemory,
    DeleteMemory,
    DeleteAllMemories,
    ListMemories
};

inline constexpr std::array<ToolKind, 7> kAllToolKinds{
    ToolKind::AddMemory,
    ToolKind::SearchMemories,
    ToolKind::GetMemory,
    ToolKind::UpdateMemory,
    ToolKind::DeleteMemory,
    ToolKind::DeleteAllMemories,
    ToolKind::ListMemories
};

/// Wire name of the tool
[[nodiscard]] constexpr std::string_view to_string(ToolKind kind) noexcept {
    switch (kind) {
        case ToolKind::AddMemory:         return "add_memory";
        case ToolKind::SearchMemories:    return "search_memories";
        case ToolKind::GetMemory:         return "get_memory";
        case ToolKind::UpdateMemory:      return "update_memory";
        case ToolKind::DeleteMemory:      return "delete_memory";
        case ToolKind::DeleteAllMemories: return "delete_all_memories";
        case ToolKind::ListMemories:      return "list_memories";
    }
    return "unknown";
}

[[nodiscard]] std::optional<ToolKind> parse_tool_kind(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// Descriptors
// ─────────────────────────────────────────────────────────────────────────────

struct ToolDescriptor {
    ToolKind kind;
    std::string name;
    std::string description;
    Json input_schema;
    ToolAnnotations annotations;

    /// Names listed under "required" in the input schema.
    [[nodiscard]] std::vector<std::string> required() const;

    [[nodiscard]] bool is_required(std::string_view argument) const;

    /// Names of every declared property, in declaration order.
    [[nodiscard]] std::vector<std::string> properties() const;

    /// MCP tool shape: name, description, inputSchema, annotations.
    [[nodiscard]] Json to_json() const;
};

struct ResourceDescriptor {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type;

    [[nodiscard]] Json to_json() const {
        return {
            {"uri", uri},
            {"name", name},
            {"description", description},
            {"mimeType", mime_type}
        };
    }
};

inline constexpr std::string_view kMemoryStoreUri = "memcp://memory";

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Access
// ─────────────────────────────────────────────────────────────────────────────

/// All tools in declaration order (one per ToolKind).
[[nodiscard]] const std::vector<ToolDescriptor>& list_tools();

[[nodiscard]] const std::vector<ResourceDescriptor>& list_resources();

[[nodiscard]] const ToolDescriptor& tool_descriptor(ToolKind kind);

/// nullptr when no tool has this name.
[[nodiscard]] const ToolDescriptor* find_tool(std::string_view name);

}  // namespace memcp
