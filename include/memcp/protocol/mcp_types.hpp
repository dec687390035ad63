#ifndef MEMCP_PROTOCOL_MCP_TYPES_HPP
#define MEMCP_PROTOCOL_MCP_TYPES_HPP

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace memcp {

using Json = nlohmann::ordered_json;

// ═══════════════════════════════════════════════════════════════════════════
// MCP Protocol Version
// ═══════════════════════════════════════════════════════════════════════════

inline constexpr const char* MCP_PROTOCOL_VERSION = "2024-11-05";

// ═══════════════════════════════════════════════════════════════════════════
// Server Info
// ═══════════════════════════════════════════════════════════════════════════

struct Implementation {
    std::string name;
    std::string version;

    [[nodiscard]] Json to_json() const {
        return {{"name", name}, {"version", version}};
    }
};

// Each advertised capability serializes as an empty object. The server
// sends no list-changed or subscription notifications, so there are no flags.
struct ServerCapabilities {
    bool tools = false;
    bool resources = false;
    bool prompts = false;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (tools) j["tools"] = Json::object();
        if (resources) j["resources"] = Json::object();
        if (prompts) j["prompts"] = Json::object();
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Initialize Response
// ═══════════════════════════════════════════════════════════════════════════

struct InitializeResult {
    std::string protocol_version = MCP_PROTOCOL_VERSION;
    ServerCapabilities capabilities;
    Implementation server_info;

    [[nodiscard]] Json to_json() const {
        return {
            {"protocolVersion", protocol_version},
            {"capabilities", capabilities.to_json()},
            {"serverInfo", server_info.to_json()}
        };
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Tools
// ═══════════════════════════════════════════════════════════════════════════

// Hints about tool behavior for clients to make informed decisions.
struct ToolAnnotations {
    std::optional<std::string> title;

    // If true, tool may irreversibly remove data
    std::optional<bool> destructive_hint;

    // If true, repeated calls with same args have no additional effect
    std::optional<bool> idempotent_hint;

    // If true, tool only reads data without side effects
    std::optional<bool> read_only_hint;

    // False: the tool touches only the local memory store
    std::optional<bool> open_world_hint;

    [[nodiscard]] Json to_json() const {
        Json j = Json::object();
        if (title) j["title"] = *title;
        if (read_only_hint) j["readOnlyHint"] = *read_only_hint;
        if (destructive_hint) j["destructiveHint"] = *destructive_hint;
        if (idempotent_hint) j["idempotentHint"] = *idempotent_hint;
        if (open_world_hint) j["openWorldHint"] = *open_world_hint;
        return j;
    }

    [[nodiscard]] bool empty() const {
        return !title && !destructive_hint && !idempotent_hint &&
               !read_only_hint && !open_world_hint;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Content Types
// ═══════════════════════════════════════════════════════════════════════════

struct TextContent {
    std::string text;

    [[nodiscard]] Json to_json() const {
        return {{"type", "text"}, {"text", text}};
    }
};

struct CallToolResult {
    std::vector<TextContent> content;
    bool is_error = false;

    [[nodiscard]] Json to_json() const {
        Json items = Json::array();
        for (const auto& c : content) {
            items.push_back(c.to_json());
        }
        Json j = {{"content", std::move(items)}};
        if (is_error) {
            j["isError"] = true;
        }
        return j;
    }
};

// ═══════════════════════════════════════════════════════════════════════════
// Resources
// ═══════════════════════════════════════════════════════════════════════════

struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::string text;

    [[nodiscard]] Json to_json() const {
        Json j = {{"uri", uri}};
        if (mime_type) j["mimeType"] = *mime_type;
        j["text"] = text;
        return j;
    }
};

struct ReadResourceResult {
    std::vector<ResourceContents> contents;
    bool is_error = false;

    [[nodiscard]] Json to_json() const {
        Json items = Json::array();
        for (const auto& c : contents) {
            items.push_back(c.to_json());
        }
        Json j = {{"contents", std::move(items)}};
        if (is_error) {
            j["isError"] = true;
        }
        return j;
    }
};

}  // namespace memcp

#endif  // MEMCP_PROTOCOL_MCP_TYPES_HPP
