#include "memcp/server/dispatcher.hpp"

#include "memcp/log/logger.hpp"
#include "memcp/value/json_encoding.hpp"

#include <format>

namespace memcp {
namespace {

constexpr const char* kTotalUnknown = "Unknown (check with list_memories tool)";
constexpr const char* kTotalUnavailable = "unavailable";

// Entry of an engine result map, or an empty array when it is absent.
Json entries_of(const Json& data, const char* key) {
    if (data.is_array()) {
        return data;
    }
    if (data.is_object()) {
        const auto it = data.find(key);
        if ((it != data.end()) && it->is_array()) {
            return *it;
        }
    }
    return Json::array();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Tool Result Helpers
// ─────────────────────────────────────────────────────────────────────────────

CallToolResult make_tool_result(const Json& payload, bool is_error) {
    CallToolResult result;
    result.content.push_back(TextContent{dump_text(payload, 2)});
    result.is_error = is_error;
    return result;
}

CallToolResult make_tool_failure(const std::exception& error) {
    Json payload = {
        {"success", false},
        {"error", error.what()},
        {"error_type", error_kind(error)}
    };
    return make_tool_result(payload, true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Dispatcher
// ─────────────────────────────────────────────────────────────────────────────

Dispatcher::Dispatcher(DispatcherConfig config, EngineBinding& binding, IdentityResolver& identity)
    : config_(std::move(config))
    , identity_(identity)
    , adapter_(binding, identity)
{
    if (config_.max_sanitize_passes == 0) {
        config_.max_sanitize_passes = 1;
    }
}

bool Dispatcher::is_notification(std::string_view method) noexcept {
    return method.starts_with("notifications/");
}

std::optional<Json> Dispatcher::dispatch(const JsonRpcRequest& request) {
    const std::string& method = request.method();

    if (is_notification(method)) {
        MEMCP_LOG_DEBUG(std::format("Notification {} (no response)", method));
        return std::nullopt;
    }

    MEMCP_LOG_DEBUG(std::format("Handling {}", method));
    try {
        auto result = handle(method, request.params());
        if (result.has_value() == false) {
            return make_error_response(request.response_id(), result.error());
        }
        return make_result_response(request.response_id(), std::move(*result));
    } catch (const std::exception& e) {
        MEMCP_LOG_ERROR(std::format("Error processing request {}: {}", method, e.what()));
        return make_error_response(request.response_id(), JsonRpcError{
            ErrorCode::InternalError,
            std::format("Internal error: {}", e.what())});
    }
}

tl::expected<Json, JsonRpcError> Dispatcher::handle(std::string_view method, const Json& params) {
    if (method == "initialize") {
        return initialize();
    }
    if (method == "ping") {
        return Json::object();
    }
    if (method == "tools/list") {
        Json tools = Json::array();
        for (const auto& tool : list_tools()) {
            tools.push_back(tool.to_json());
        }
        return Json{{"tools", std::move(tools)}};
    }
    if (method == "tools/call") {
        return call_tool(params).to_json();
    }
    if (method == "resources/list") {
        Json resources = Json::array();
        for (const auto& resource : list_resources()) {
            resources.push_back(resource.to_json());
        }
        return Json{{"resources", std::move(resources)}};
    }
    if (method == "resources/read") {
        return read_resource(params).to_json();
    }
    if (method == "prompts/list") {
        return Json{{"prompts", Json::array()}};
    }

    return tl::unexpected(JsonRpcError{
        ErrorCode::MethodNotFound,
        std::format("Method not found: {}", method)});
}

Json Dispatcher::initialize() {
    (void)adapter_.engine();

    InitializeResult result;
    result.protocol_version = config_.protocol_version;
    result.capabilities.tools = true;
    result.capabilities.resources = true;
    result.capabilities.prompts = true;
    result.server_info = config_.server_info;
    return result.to_json();
}

Json Dispatcher::encode(const Value& value) const {
    return encode_result(value, config_.max_sanitize_passes);
}

// ─────────────────────────────────────────────────────────────────────────────
// tools/call
// ─────────────────────────────────────────────────────────────────────────────

CallToolResult Dispatcher::call_tool(const Json& params) {
    std::string name;
    const auto name_it = params.find("name");
    if ((name_it != params.end()) && name_it->is_string()) {
        name = name_it->get<std::string>();
    }

    Json arguments = Json::object();
    const auto args_it = params.find("arguments");
    if ((args_it != params.end()) && (args_it->is_null() == false)) {
        arguments = *args_it;
    }

    // Binding failures are not tool failures
    (void)adapter_.engine();

    try {
        const auto kind = parse_tool_kind(name);
        if (!kind) {
            throw UnknownToolError(std::format("Unknown tool: {}", name));
        }
        return run_tool(*kind, arguments);
    } catch (const std::exception& e) {
        MEMCP_LOG_ERROR(std::format("Error executing tool {}: {} ({})", name, e.what(), error_kind(e)));
        return make_tool_failure(e);
    }
}

CallToolResult Dispatcher::run_tool(ToolKind kind, const Json& arguments) {
    switch (kind) {
        case ToolKind::AddMemory: {
            Json data = encode(adapter_.add_memory(arguments));
            Json memory_id = nullptr;
            if (data.is_object() && data.contains("id")) {
                memory_id = data["id"];
            }
            return make_tool_result({
                {"success", true},
                {"memory_id", std::move(memory_id)},
                {"message", "Memory added successfully"},
                {"data", std::move(data)}
            });
        }

        case ToolKind::SearchMemories: {
            const Json data = encode(adapter_.search_memories(arguments));
            Json results = entries_of(data, "results");
            Json relations = data.is_object() ? entries_of(data, "relations") : Json::array();
            const auto count = results.size();
            return make_tool_result({
                {"success", true},
                {"count", count},
                {"results", std::move(results)},
                {"relations", std::move(relations)}
            });
        }

        case ToolKind::GetMemory: {
            const Value memory = adapter_.get_memory(arguments);
            if (memory.is_null()) {
                return make_tool_result({
                    {"success", false},
                    {"message", "Memory not found"}
                }, true);
            }
            return make_tool_result({
                {"success", true},
                {"data", encode(memory)}
            });
        }

        case ToolKind::UpdateMemory: {
            Json data = encode(adapter_.update_memory(arguments));
            return make_tool_result({
                {"success", true},
                {"message", "Memory updated successfully"},
                {"data", std::move(data)}
            });
        }

        case ToolKind::DeleteMemory: {
            const auto deleted_id = adapter_.delete_memory(arguments);
            return make_tool_result({
                {"success", true},
                {"message", "Memory deleted successfully"},
                {"deleted_id", deleted_id}
            });
        }

        case ToolKind::DeleteAllMemories: {
            adapter_.delete_all_memories(arguments);
            return make_tool_result({
                {"success", true},
                {"message", "All memories deleted successfully"}
            });
        }

        case ToolKind::ListMemories: {
            Json memories = entries_of(encode(adapter_.list_memories(arguments)), "results");
            const auto count = memories.size();
            return make_tool_result({
                {"success", true},
                {"count", count},
                {"memories", std::move(memories)}
            });
        }
    }

    throw UnknownToolError(std::format("Unknown tool: {}", to_string(kind)));
}

// ─────────────────────────────────────────────────────────────────────────────
// resources/read
// ─────────────────────────────────────────────────────────────────────────────

ReadResourceResult Dispatcher::read_resource(const Json& params) {
    std::string uri;
    const auto uri_it = params.find("uri");
    if ((uri_it != params.end()) && uri_it->is_string()) {
        uri = uri_it->get<std::string>();
    }

    ReadResourceResult result;
    if (uri != kMemoryStoreUri) {
        MEMCP_LOG_DEBUG(std::format("Unknown resource: {}", uri));
        result.is_error = true;
        return result;
    }

    result.contents.push_back(ResourceContents{
        uri,
        "application/json",
        dump_text(memory_store_summary(), 2)
    });
    return result;
}

// Queries the engine for a count. The query never fails the read: on error
// the count degrades to a placeholder.
Json Dispatcher::memory_store_summary() {
    Json stats = {
        {"total_memories", 0},
        {"description", "memcp memory store"}
    };

    try {
        ListRequest count_query;
        count_query.user_id = identity_.default_user_id();
        count_query.limit = 1;
        const Json listing = encode(adapter_.engine().get_all(count_query));

        if (listing.is_object() && listing.contains("total") && listing["total"].is_number_integer()) {
            stats["total_memories"] = listing["total"];
        } else if (listing.is_object() && listing.contains("results")) {
            stats["total_memories"] = kTotalUnknown;
        }
    } catch (const std::exception& e) {
        MEMCP_LOG_WARN(std::format("Memory store count failed: {}", e.what()));
        stats["total_memories"] = kTotalUnavailable;
    }

    return stats;
}

}  // namespace memcp
