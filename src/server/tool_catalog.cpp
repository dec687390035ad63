#include "memcp/server/tool_catalog.hpp"

#include <algorithm>
#include <stdexcept>

namespace memcp {
namespace {

Json property(const Json& type, std::string_view description) {
    return {{"type", type}, {"description", description}};
}

Json property_with_default(std::string_view type, std::string_view description, int default_value) {
    Json p = property(type, description);
    p["default"] = default_value;
    return p;
}

Json object_schema(Json properties, std::vector<std::string> required = {}) {
    Json schema = {{"type", "object"}, {"properties", std::move(properties)}};
    if (required.empty() == false) {
        schema["required"] = std::move(required);
    }
    return schema;
}

ToolAnnotations annotate(std::string_view title, bool read_only, bool destructive, bool idempotent) {
    ToolAnnotations a;
    a.title = std::string(title);
    a.read_only_hint = read_only;
    a.destructive_hint = destructive;
    a.idempotent_hint = idempotent;
    a.open_world_hint = false;
    return a;
}

std::vector<ToolDescriptor> build_tools() {
    std::vector<ToolDescriptor> tools;
    tools.reserve(kAllToolKinds.size());

    tools.push_back(ToolDescriptor{
        ToolKind::AddMemory,
        "add_memory",
        "Add a new memory to the memory store. Can accept text, a message dict, or a list of messages.",
        object_schema({
            {"messages", property(Json::array({"string", "object", "array"}),
                "The content to store. Can be a string, a message dict with 'role' and 'content', or a list of message dicts.")},
            {"user_id", property("string", "Optional user identifier for the memory")},
            {"agent_id", property("string", "Optional agent identifier for multi-agent scenarios")},
            {"run_id", property("string", "Optional run/thread identifier for grouping related memories")},
            {"metadata", property("object", "Optional metadata dictionary to attach to the memory")},
            {"scope", property("string", "Optional scope for the memory (e.g., 'user', 'agent', 'session')")},
            {"memory_type", property("string", "Optional memory type classification")},
            {"filters", property("object", "Optional filters dictionary for advanced filtering")}
        }, {"messages"}),
        annotate("Add Memory", false, false, false)
    });

    tools.push_back(ToolDescriptor{
        ToolKind::SearchMemories,
        "search_memories",
        "Search for memories using semantic similarity and keyword matching",
        object_schema({
            {"query", property("string", "The search query text")},
            {"user_id", property("string", "Optional user identifier to filter memories")},
            {"agent_id", property("string", "Optional agent identifier to filter memories")},
            {"run_id", property("string", "Optional run/thread identifier to filter memories")},
            {"limit", property_with_default("integer", "Maximum number of results to return (default: 10)", 10)},
            {"filters", property("object", "Optional metadata filters for advanced search")},
            {"threshold", property("number", "Optional similarity threshold (0.0-1.0) for filtering results")}
        }, {"query"}),
        annotate("Search Memories", true, false, true)
    });

    tools.push_back(ToolDescriptor{
        ToolKind::GetMemory,
        "get_memory",
        "Retrieve a specific memory by its ID",
        object_schema({
            {"memory_id", property("integer", "The unique identifier of the memory to retrieve")},
            {"user_id", property("string", "Optional user identifier for permission check")},
            {"agent_id", property("string", "Optional agent identifier for permission check")}
        }, {"memory_id"}),
        annotate("Get Memory", true, false, true)
    });

    tools.push_back(ToolDescriptor{
        ToolKind::UpdateMemory,
        "update_memory",
        "Update an existing memory's content and/or metadata",
        object_schema({
            {"memory_id", property("integer", "The unique identifier of the memory to update")},
            {"content", property("string", "The new content for the memory")},
            {"user_id", property("string", "Optional user identifier for permission check")},
            {"agent_id", property("string", "Optional agent identifier for permission check")},
            {"metadata", property("object", "Optional metadata dictionary to update")}
        }, {"memory_id", "content"}),
        annotate("Update Memory", false, false, true)
    });

    tools.push_back(ToolDescriptor{
        ToolKind::DeleteMemory,
        "delete_memory",
        "Delete a memory by its ID",
        object_schema({
            {"memory_id", property("integer", "The unique identifier of the memory to delete")},
            {"user_id", property("string", "Optional user identifier for permission check")},
            {"agent_id", property("string", "Optional agent identifier for permission check")}
        }, {"memory_id"}),
        annotate("Delete Memory", false, true, true)
    });

    tools.push_back(ToolDescriptor{
        ToolKind::DeleteAllMemories,
        "delete_all_memories",
        "Delete all memories for a user and/or agent",
        object_schema({
            {"user_id", property("string", "Optional user identifier to filter memories for deletion")},
            {"agent_id", property("string", "Optional agent identifier to filter memories for deletion")},
            {"run_id", property("string", "Optional run/thread identifier to filter memories for deletion")}
        }),
        annotate("Delete All Memories", false, true, true)
    });

    tools.push_back(ToolDescriptor{
        ToolKind::ListMemories,
        "list_memories",
        "List all memories with optional filters",
        object_schema({
            {"user_id", property("string", "Optional user identifier to filter memories")},
            {"agent_id", property("string", "Optional agent identifier to filter memories")},
            {"run_id", property("string", "Optional run/thread identifier to filter memories")},
            {"limit", property_with_default("integer", "Maximum number of results to return (default: 100)", 100)},
            {"offset", property_with_default("integer", "Offset for pagination (default: 0)", 0)},
            {"filters", property("object", "Optional metadata filters for advanced filtering")}
        }),
        annotate("List Memories", true, false, true)
    });

    return tools;
}

}  // namespace

std::optional<ToolKind> parse_tool_kind(std::string_view name) noexcept {
    for (const auto kind : kAllToolKinds) {
        if (to_string(kind) == name) {
            return kind;
        }
    }
    return std::nullopt;
}

// ─────────────────────────────────────────────────────────────────────────────
// ToolDescriptor
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> ToolDescriptor::required() const {
    std::vector<std::string> names;
    const auto it = input_schema.find("required");
    if ((it != input_schema.end()) && it->is_array()) {
        for (const auto& name : *it) {
            names.push_back(name.get<std::string>());
        }
    }
    return names;
}

bool ToolDescriptor::is_required(std::string_view argument) const {
    const auto names = required();
    return std::find(names.begin(), names.end(), argument) != names.end();
}

std::vector<std::string> ToolDescriptor::properties() const {
    std::vector<std::string> names;
    const auto it = input_schema.find("properties");
    if ((it != input_schema.end()) && it->is_object()) {
        for (const auto& [name, schema] : it->items()) {
            names.push_back(name);
        }
    }
    return names;
}

Json ToolDescriptor::to_json() const {
    Json j = {
        {"name", name},
        {"description", description},
        {"inputSchema", input_schema}
    };
    if (annotations.empty() == false) {
        j["annotations"] = annotations.to_json();
    }
    return j;
}

// ─────────────────────────────────────────────────────────────────────────────
// Catalog Access
// ─────────────────────────────────────────────────────────────────────────────

const std::vector<ToolDescriptor>& list_tools() {
    static const std::vector<ToolDescriptor> tools = build_tools();
    return tools;
}

const std::vector<ResourceDescriptor>& list_resources() {
    static const std::vector<ResourceDescriptor> resources{
        ResourceDescriptor{
            std::string(kMemoryStoreUri),
            "Memory Store",
            "Access to the memcp memory store",
            "application/json"
        }
    };
    return resources;
}

const ToolDescriptor& tool_descriptor(ToolKind kind) {
    for (const auto& tool : list_tools()) {
        if (tool.kind == kind) {
            return tool;
        }
    }
    throw std::logic_error("tool kind missing from catalog");
}

const ToolDescriptor* find_tool(std::string_view name) {
    const auto kind = parse_tool_kind(name);
    if (!kind) {
        return nullptr;
    }
    return &tool_descriptor(*kind);
}

}  // namespace memcp
