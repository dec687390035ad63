#include <catch2/catch_test_macros.hpp>

#include "memcp/protocol/mcp_types.hpp"

using namespace memcp;

// ─────────────────────────────────────────────────────────────────────────────
// Initialize
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Implementation serializes name and version", "[mcp][types]") {
    const Implementation info{"memcp", "0.1.0"};
    REQUIRE(info.to_json() == Json{{"name", "memcp"}, {"version", "0.1.0"}});
}

TEST_CASE("ServerCapabilities advertises present capabilities as objects", "[mcp][types]") {
    ServerCapabilities caps;
    REQUIRE(caps.to_json() == Json::object());

    caps.tools = true;
    caps.resources = true;

    const auto j = caps.to_json();
    REQUIRE(j["tools"] == Json::object());
    REQUIRE(j["resources"] == Json::object());
    REQUIRE_FALSE(j.contains("prompts"));
}

TEST_CASE("InitializeResult uses MCP member names", "[mcp][types]") {
    InitializeResult result;
    result.server_info = Implementation{"memcp", "0.1.0"};
    result.capabilities.tools = true;

    const auto j = result.to_json();
    REQUIRE(j["protocolVersion"] == MCP_PROTOCOL_VERSION);
    REQUIRE(j["protocolVersion"] == "2024-11-05");
    REQUIRE(j["serverInfo"]["name"] == "memcp");
    REQUIRE(j["capabilities"]["tools"].is_object());
    REQUIRE(j.size() == 3);
}

// ─────────────────────────────────────────────────────────────────────────────
// Tools
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ToolAnnotations serializes set hints only", "[mcp][types][tools]") {
    ToolAnnotations annotations;
    REQUIRE(annotations.empty());
    REQUIRE(annotations.to_json() == Json::object());

    annotations.read_only_hint = true;
    annotations.destructive_hint = false;

    const auto j = annotations.to_json();
    REQUIRE_FALSE(annotations.empty());
    REQUIRE(j["readOnlyHint"] == true);
    REQUIRE(j["destructiveHint"] == false);
    REQUIRE_FALSE(j.contains("idempotentHint"));

    annotations.title = "Search Memories";
    annotations.open_world_hint = false;
    REQUIRE(annotations.to_json()["title"] == "Search Memories");
    REQUIRE(annotations.to_json()["openWorldHint"] == false);
}

TEST_CASE("CallToolResult wraps text content", "[mcp][types][tools]") {
    CallToolResult result;
    result.content.push_back(TextContent{"{\"success\": true}"});

    auto j = result.to_json();
    REQUIRE(j["content"].size() == 1);
    REQUIRE(j["content"][0]["type"] == "text");
    REQUIRE(j["content"][0]["text"] == "{\"success\": true}");
    REQUIRE_FALSE(j.contains("isError"));

    result.is_error = true;
    j = result.to_json();
    REQUIRE(j["isError"] == true);
}

// ─────────────────────────────────────────────────────────────────────────────
// Resources
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("ReadResourceResult lists contents", "[mcp][types][resources]") {
    ReadResourceResult result;
    result.contents.push_back(ResourceContents{"memcp://memory", "application/json", "{}"});

    const auto j = result.to_json();
    REQUIRE(j["contents"][0]["uri"] == "memcp://memory");
    REQUIRE(j["contents"][0]["mimeType"] == "application/json");
    REQUIRE(j["contents"][0]["text"] == "{}");
    REQUIRE_FALSE(j.contains("isError"));
}

TEST_CASE("ReadResourceResult reports an error with empty contents", "[mcp][types][resources]") {
    ReadResourceResult result;
    result.is_error = true;

    const auto j = result.to_json();
    REQUIRE(j["contents"] == Json::array());
    REQUIRE(j["isError"] == true);
}

TEST_CASE("ResourceContents omits an unset mime type", "[mcp][types][resources]") {
    const ResourceContents contents{"memcp://memory", std::nullopt, "x"};
    REQUIRE_FALSE(contents.to_json().contains("mimeType"));
}
