#include <catch2/catch_test_macros.hpp>

#include "memcp/engine/in_memory_engine.hpp"
#include "memcp/server/dispatcher.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_memory_engine.hpp"

#include <chrono>
#include <stdexcept>

using namespace memcp;
using memcp::testing::MockMemoryEngine;
using memcp::testing::ScopedCapture;

namespace {

const Timestamp kFixedTime = Timestamp{std::chrono::sys_days{std::chrono::year{2025} / 3 / 14}} +
                             std::chrono::hours{9};

// Dispatcher wired to an engine, with "default-user" as the default identity.
struct DispatcherFixture {
    explicit DispatcherFixture(std::shared_ptr<MemoryEngine> engine)
        : binding(std::move(engine))
    {}

    explicit DispatcherFixture(EngineBinding::Factory factory)
        : binding(std::move(factory))
    {}

    EngineBinding binding;
    IdentityResolver identity{std::make_shared<StaticIdentityProvider>("default-user")};
    Dispatcher dispatcher{DispatcherConfig{}, binding, identity};

    Json request(const std::string& method, Json params = Json::object(), Json id = 1) {
        auto response = dispatcher.dispatch(JsonRpcRequest(method, std::move(params), std::move(id)));
        REQUIRE(response.has_value());
        return *response;
    }

    // Decoded payload of a tools/call response.
    Json call(const std::string& tool, Json arguments = Json::object()) {
        const Json response = request("tools/call", {{"name", tool}, {"arguments", std::move(arguments)}});
        REQUIRE(response.contains("result"));
        return payload_of(response["result"]);
    }

    static Json payload_of(const Json& result) {
        REQUIRE(result["content"].size() == 1);
        REQUIRE(result["content"][0]["type"] == "text");
        return Json::parse(result["content"][0]["text"].get<std::string>());
    }
};

std::shared_ptr<InMemoryEngine> make_store() {
    InMemoryEngineConfig config;
    config.clock = [] { return kFixedTime; };
    return std::make_shared<InMemoryEngine>(config);
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Protocol Methods
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Dispatcher answers initialize with server info", "[dispatcher]") {
    bool created = false;
    DispatcherFixture fixture([&created]() -> std::shared_ptr<MemoryEngine> {
        created = true;
        return std::make_shared<MockMemoryEngine>();
    });

    const Json response = fixture.request("initialize", {{"protocolVersion", "2024-11-05"}}, 0);
    REQUIRE(response["jsonrpc"] == "2.0");
    REQUIRE(response["id"] == 0);

    const Json& result = response["result"];
    REQUIRE(result["protocolVersion"] == "2024-11-05");
    REQUIRE(result["serverInfo"]["name"] == "memcp");
    REQUIRE(result["capabilities"]["tools"].is_object());
    REQUIRE(result["capabilities"]["resources"].is_object());
    REQUIRE(result["capabilities"]["prompts"].is_object());
    REQUIRE(created);
}

TEST_CASE("Dispatcher uses the configured server identity", "[dispatcher]") {
    EngineBinding binding(std::make_shared<MockMemoryEngine>());
    IdentityResolver identity(nullptr);
    DispatcherConfig config;
    config.server_info = Implementation{"memory-service", "2.3.4"};
    config.max_sanitize_passes = 0;
    Dispatcher dispatcher(config, binding, identity);

    REQUIRE(dispatcher.config().max_sanitize_passes == 1);
    const auto response = dispatcher.dispatch(JsonRpcRequest("initialize", Json::object(), Json("init")));
    REQUIRE(response.has_value());
    REQUIRE((*response)["id"] == "init");
    REQUIRE((*response)["result"]["serverInfo"]["version"] == "2.3.4");
}

TEST_CASE("Dispatcher answers the listing methods", "[dispatcher]") {
    DispatcherFixture fixture(std::make_shared<MockMemoryEngine>());

    SECTION("ping") {
        REQUIRE(fixture.request("ping")["result"] == Json::object());
    }

    SECTION("tools/list") {
        const Json tools = fixture.request("tools/list")["result"]["tools"];
        REQUIRE(tools.size() == 7);
        REQUIRE(tools[0]["name"] == "add_memory");
        REQUIRE(tools[6]["name"] == "list_memories");
        REQUIRE(tools[2]["inputSchema"]["required"] == Json::array({"memory_id"}));
    }

    SECTION("resources/list") {
        const Json resources = fixture.request("resources/list")["result"]["resources"];
        REQUIRE(resources.size() == 1);
        REQUIRE(resources[0]["uri"] == "memcp://memory");
    }

    SECTION("prompts/list") {
        REQUIRE(fixture.request("prompts/list")["result"] == Json{{"prompts", Json::array()}});
    }
}

TEST_CASE("Dispatcher ignores notifications", "[dispatcher]") {
    DispatcherFixture fixture(std::make_shared<MockMemoryEngine>());

    REQUIRE(Dispatcher::is_notification("notifications/initialized"));
    REQUIRE(Dispatcher::is_notification("notifications/cancelled"));
    REQUIRE_FALSE(Dispatcher::is_notification("tools/list"));

    REQUIRE_FALSE(fixture.dispatcher.dispatch(JsonRpcRequest("notifications/initialized")).has_value());
}

TEST_CASE("Dispatcher rejects unknown methods", "[dispatcher]") {
    DispatcherFixture fixture(std::make_shared<MockMemoryEngine>());

    const Json response = fixture.request("memories/compact", Json::object(), 9);
    REQUIRE(response["id"] == 9);
    REQUIRE(response["error"]["code"] == ErrorCode::MethodNotFound);
    REQUIRE(response["error"]["message"] == "Method not found: memories/compact");
    REQUIRE_FALSE(response.contains("result"));
}

TEST_CASE("Dispatcher answers a request without id with a null id", "[dispatcher]") {
    DispatcherFixture fixture(std::make_shared<MockMemoryEngine>());

    const auto response = fixture.dispatcher.dispatch(JsonRpcRequest("ping"));
    REQUIRE(response.has_value());
    REQUIRE((*response)["id"].is_null());
}

TEST_CASE("Dispatcher reports engine binding failures as internal errors", "[dispatcher]") {
    ScopedCapture capture;
    DispatcherFixture fixture([]() -> std::shared_ptr<MemoryEngine> {
        throw std::runtime_error("vector store unreachable");
    });

    SECTION("initialize") {
        const Json response = fixture.request("initialize");
        REQUIRE(response["error"]["code"] == ErrorCode::InternalError);
        REQUIRE(response["error"]["message"] == "Internal error: vector store unreachable");
    }

    SECTION("tools/call") {
        const Json response = fixture.request("tools/call", {{"name", "list_memories"}});
        REQUIRE(response["error"]["code"] == ErrorCode::InternalError);
    }

    REQUIRE(capture.logger().contains(LogLevel::Error, "vector store unreachable"));
}

// ═══════════════════════════════════════════════════════════════════════════
// tools/call
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Dispatcher runs the memory lifecycle", "[dispatcher][tools]") {
    DispatcherFixture fixture(make_store());

    const Json added = fixture.call("add_memory", {{"messages", "I prefer window seats on flights"},
                                                   {"metadata", {{"topic", "travel"}}}});
    REQUIRE(added["success"] == true);
    REQUIRE(added["memory_id"] == 1);
    REQUIRE(added["message"] == "Memory added successfully");
    REQUIRE(added["data"]["user_id"] == "default-user");
    REQUIRE(added["data"]["created_at"] == "2025-03-14T09:00:00+00:00");

    (void)fixture.call("add_memory", {{"messages", "Dinner with Sam on Friday"}});

    const Json found = fixture.call("search_memories", {{"query", "flights"}});
    REQUIRE(found["success"] == true);
    REQUIRE(found["count"] == 1);
    REQUIRE(found["results"][0]["memory"] == "I prefer window seats on flights");
    REQUIRE(found["relations"] == Json::array());

    const Json listed = fixture.call("list_memories", {{"limit", "10"}});
    REQUIRE(listed["count"] == 2);
    REQUIRE(listed["memories"].size() == 2);

    const Json updated = fixture.call("update_memory", {{"memory_id", "1"}, {"content", "I prefer aisle seats"}});
    REQUIRE(updated["message"] == "Memory updated successfully");
    REQUIRE(updated["data"]["memory"] == "I prefer aisle seats");

    const Json fetched = fixture.call("get_memory", {{"memory_id", 1}});
    REQUIRE(fetched["success"] == true);
    REQUIRE(fetched["data"]["memory"] == "I prefer aisle seats");
    REQUIRE(fetched["data"]["metadata"]["topic"] == "travel");

    const Json deleted = fixture.call("delete_memory", {{"memory_id", 1.0}});
    REQUIRE(deleted["deleted_id"] == 1);
    REQUIRE(deleted["message"] == "Memory deleted successfully");

    const Json cleared = fixture.call("delete_all_memories");
    REQUIRE(cleared == Json{{"success", true}, {"message", "All memories deleted successfully"}});
    REQUIRE(fixture.call("list_memories")["count"] == 0);
}

TEST_CASE("Dispatcher scopes tool calls to the user_id argument", "[dispatcher][tools]") {
    DispatcherFixture fixture(make_store());

    (void)fixture.call("add_memory", {{"messages", "alice likes jazz"}, {"user_id", "alice"}});
    (void)fixture.call("add_memory", {{"messages", "default likes jazz"}});

    REQUIRE(fixture.call("search_memories", {{"query", "jazz"}, {"user_id", "alice"}})["count"] == 1);
    REQUIRE(fixture.call("search_memories", {{"query", "jazz"}})["count"] == 1);
    REQUIRE(fixture.call("search_memories", {{"query", "jazz"}, {"user_id", "nobody"}})["count"] == 0);
}

TEST_CASE("Dispatcher reports a missing memory inside the tool result", "[dispatcher][tools]") {
    DispatcherFixture fixture(make_store());

    const Json response = fixture.request("tools/call", {{"name", "get_memory"}, {"arguments", {{"memory_id", "42"}}}});
    REQUIRE(response["result"]["isError"] == true);

    const Json payload = DispatcherFixture::payload_of(response["result"]);
    REQUIRE(payload == Json{{"success", false}, {"message", "Memory not found"}});
}

TEST_CASE("Dispatcher formats tool payloads as indented JSON text", "[dispatcher][tools]") {
    DispatcherFixture fixture(make_store());

    const Json response = fixture.request("tools/call", {{"name", "delete_all_memories"}});
    const auto text = response["result"]["content"][0]["text"].get<std::string>();
    REQUIRE(text.find("{\n  \"success\": true") == 0);
    REQUIRE_FALSE(response["result"].contains("isError"));
}

TEST_CASE("Dispatcher reports tool failures with their kind", "[dispatcher][tools]") {
    ScopedCapture capture;
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    const auto failure = [&fixture](const std::string& tool, Json arguments) {
        const Json response = fixture.request("tools/call", {{"name", tool}, {"arguments", std::move(arguments)}});
        REQUIRE_FALSE(response.contains("error"));
        REQUIRE(response["result"]["isError"] == true);
        const Json payload = DispatcherFixture::payload_of(response["result"]);
        REQUIRE(payload["success"] == false);
        return payload;
    };

    SECTION("unknown tool") {
        const Json payload = failure("forget_everything", Json::object());
        REQUIRE(payload["error_type"] == "UnknownToolError");
        REQUIRE(payload["error"] == "Unknown tool: forget_everything");
    }

    SECTION("missing required argument") {
        const Json payload = failure("add_memory", Json::object());
        REQUIRE(payload["error_type"] == "ValidationError");
        REQUIRE(payload["error"] == "messages parameter is required");
    }

    SECTION("non-integer memory id") {
        const Json payload = failure("delete_memory", {{"memory_id", "abc"}});
        REQUIRE(payload["error"] == "memory_id must be a valid integer, got: abc");
    }

    SECTION("arguments not an object") {
        const Json payload = failure("list_memories", Json::array({1, 2}));
        REQUIRE(payload["error_type"] == "ValidationError");
    }

    SECTION("engine error") {
        engine->throw_on_call(EngineError("NotFound", "Memory 5 not found"));
        const Json payload = failure("delete_memory", {{"memory_id", 5}});
        REQUIRE(payload["error_type"] == "NotFound");
        REQUIRE(payload["error"] == "Memory 5 not found");
    }

    SECTION("unexpected engine exception") {
        engine->throw_on_call(std::runtime_error("disk full"));
        const Json payload = failure("add_memory", {{"messages", "x"}});
        REQUIRE(payload["error_type"] == "RuntimeError");
        REQUIRE(payload["error"] == "disk full");
    }

    REQUIRE(capture.logger().contains(LogLevel::Error, "Error executing tool"));
}

TEST_CASE("Dispatcher treats null arguments as empty", "[dispatcher][tools]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    const Json payload = fixture.call("list_memories", nullptr);
    REQUIRE(payload["success"] == true);
    REQUIRE(payload["count"] == 0);
    REQUIRE(engine->last_list->limit == 100);
}

TEST_CASE("Dispatcher applies defaults for omitted optional arguments", "[dispatcher][tools]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    const Json search = fixture.call("search_memories", {{"query", "tea"}});
    REQUIRE(search["success"] == true);
    REQUIRE(engine->last_search->limit == 10);
    REQUIRE_FALSE(engine->last_search->threshold.has_value());
    REQUIRE_FALSE(engine->last_search->filters.has_value());

    const Json list = fixture.call("list_memories", Json::object());
    REQUIRE(list["success"] == true);
    REQUIRE(engine->last_list->limit == 100);
    REQUIRE(engine->last_list->offset == 0);
    REQUIRE_FALSE(engine->last_list->filters.has_value());
    REQUIRE(engine->last_list->user_id == "default-user");
}

TEST_CASE("Dispatcher sanitizes engine results before encoding", "[dispatcher][tools]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    Value result = Value::map();
    Value results = Value::list();
    result.set("results", results);
    results.push_back(result);
    engine->set_result(result);

    const Json payload = fixture.call("search_memories", {{"query", "loop"}});
    REQUIRE(payload["count"] == 1);
    REQUIRE(payload["results"][0] == "[Circular]");
    REQUIRE(payload["relations"] == Json::array());

    results.items().clear();
}

TEST_CASE("Dispatcher extracts add_memory ids only from maps", "[dispatcher][tools]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    engine->set_result(Value::list({Value("event")}));
    const Json payload = fixture.call("add_memory", {{"messages", "x"}});
    REQUIRE(payload["memory_id"].is_null());
    REQUIRE(payload["data"] == Json::array({"event"}));
}

TEST_CASE("Dispatcher accepts bare lists from list engines", "[dispatcher][tools]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    engine->set_result(Value::list({Value::map({{"id", 1}}), Value::map({{"id", 2}})}));
    const Json payload = fixture.call("list_memories");
    REQUIRE(payload["count"] == 2);
    REQUIRE(payload["memories"][1]["id"] == 2);
}

// ═══════════════════════════════════════════════════════════════════════════
// resources/read
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("Dispatcher reads the memory store summary", "[dispatcher][resources]") {
    DispatcherFixture fixture(make_store());
    (void)fixture.call("add_memory", {{"messages", "one"}});
    (void)fixture.call("add_memory", {{"messages", "two"}});
    (void)fixture.call("add_memory", {{"messages", "other"}, {"user_id", "bob"}});

    const Json result = fixture.request("resources/read", {{"uri", "memcp://memory"}})["result"];
    REQUIRE(result["contents"].size() == 1);
    REQUIRE(result["contents"][0]["uri"] == "memcp://memory");
    REQUIRE(result["contents"][0]["mimeType"] == "application/json");

    const Json summary = Json::parse(result["contents"][0]["text"].get<std::string>());
    REQUIRE(summary["total_memories"] == 2);
    REQUIRE(summary["description"] == "memcp memory store");
}

TEST_CASE("Dispatcher degrades the summary count", "[dispatcher][resources]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    DispatcherFixture fixture(engine);

    const auto total = [&fixture]() {
        const Json result = fixture.request("resources/read", {{"uri", "memcp://memory"}})["result"];
        return Json::parse(result["contents"][0]["text"].get<std::string>())["total_memories"];
    };

    SECTION("results without total") {
        engine->set_result(Value::map({{"results", Value::list()}}));
        REQUIRE(total() == "Unknown (check with list_memories tool)");
    }

    SECTION("count failure") {
        ScopedCapture capture;
        engine->throw_on_call(std::runtime_error("timeout"));
        REQUIRE(total() == "unavailable");
        REQUIRE(capture.logger().contains(LogLevel::Warn, "timeout"));
    }

    SECTION("count uses the default identity") {
        engine->set_result(Value::map({{"total", 4}}));
        REQUIRE(total() == 4);
        REQUIRE(engine->last_list->user_id == "default-user");
        REQUIRE(engine->last_list->limit == 1);
    }
}

TEST_CASE("Dispatcher rejects unknown resource URIs", "[dispatcher][resources]") {
    DispatcherFixture fixture(std::make_shared<MockMemoryEngine>());

    const Json result = fixture.request("resources/read", {{"uri", "memcp://other"}})["result"];
    REQUIRE(result == Json{{"contents", Json::array()}, {"isError", true}});

    const Json missing = fixture.request("resources/read")["result"];
    REQUIRE(missing["isError"] == true);
}
