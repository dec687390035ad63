#include <catch2/catch_test_macros.hpp>

#include "memcp/engine/instrumented_engine.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_memory_engine.hpp"

#include <stdexcept>

using namespace memcp;
using memcp::testing::MockMemoryEngine;
using memcp::testing::ScopedCapture;

TEST_CASE("InstrumentedEngine requires an inner engine", "[engine][instrumented]") {
    REQUIRE_THROWS_AS(InstrumentedEngine(nullptr), std::invalid_argument);
}

TEST_CASE("InstrumentedEngine forwards calls and results", "[engine][instrumented]") {
    auto inner = std::make_shared<MockMemoryEngine>();
    inner->set_result(Value::map({{"id", 5}}));
    InstrumentedEngine engine(inner);

    AddRequest add;
    add.messages = "remember this";
    add.user_id = "alice";
    const Value result = engine.add(add);

    REQUIRE(result.find("id")->as_int() == 5);
    REQUIRE(inner->last_add.has_value());
    REQUIRE(inner->last_add->user_id == "alice");

    SearchRequest search;
    search.query = "this";
    (void)engine.search(search);

    ListRequest list;
    (void)engine.get_all(list);
    (void)engine.get_all(list);

    REQUIRE(inner->calls() == std::vector<std::string>{"add", "search", "get_all", "get_all"});
    REQUIRE(engine.stats(EngineOperation::Add).calls == 1);
    REQUIRE(engine.stats(EngineOperation::GetAll).calls == 2);
    REQUIRE(engine.stats(EngineOperation::Delete).calls == 0);
    REQUIRE(engine.total_calls() == 4);
}

TEST_CASE("InstrumentedEngine counts failures and rethrows them unchanged", "[engine][instrumented]") {
    auto inner = std::make_shared<MockMemoryEngine>();
    inner->throw_on_call(EngineError("NotFound", "Memory 3 not found"));
    InstrumentedEngine engine(inner);

    DeleteRequest request;
    request.memory_id = 3;

    try {
        (void)engine.remove(request);
        FAIL("expected EngineError");
    } catch (const EngineError& e) {
        REQUIRE(e.kind() == "NotFound");
        REQUIRE(std::string(e.what()) == "Memory 3 not found");
    }

    const auto stats = engine.stats(EngineOperation::Delete);
    REQUIRE(stats.calls == 1);
    REQUIRE(stats.failures == 1);
}

TEST_CASE("InstrumentedEngine logs each call at debug level", "[engine][instrumented]") {
    ScopedCapture capture(LogLevel::Debug);
    auto inner = std::make_shared<MockMemoryEngine>();
    InstrumentedEngine engine(inner);

    GetRequest get;
    (void)engine.get(get);

    inner->throw_on_call(std::runtime_error("backend offline"));
    DeleteAllRequest remove_all;
    REQUIRE_THROWS_AS(engine.remove_all(remove_all), std::runtime_error);

    REQUIRE(capture.logger().contains(LogLevel::Debug, "engine.get completed"));
    REQUIRE(capture.logger().contains(LogLevel::Debug, "engine.delete_all failed"));
    REQUIRE(capture.logger().contains(LogLevel::Debug, "backend offline"));
}

TEST_CASE("InstrumentedEngine::log_summary reports called operations", "[engine][instrumented]") {
    ScopedCapture capture;
    auto inner = std::make_shared<MockMemoryEngine>();
    InstrumentedEngine engine(inner);

    UpdateRequest update;
    (void)engine.update(update);
    (void)engine.update(update);
    inner->throw_on_call(EngineError("NotFound", "Memory 1 not found"));
    REQUIRE_THROWS_AS(engine.get(GetRequest{}), EngineError);

    engine.log_summary();

    REQUIRE(capture.logger().contains(LogLevel::Info, "engine.update: 2 calls, 0 failed"));
    REQUIRE(capture.logger().contains(LogLevel::Info, "engine.get: 1 calls, 1 failed"));
    REQUIRE(capture.logger().contains(LogLevel::Info, "engine: 3 calls in total"));
    REQUIRE_FALSE(capture.logger().contains(LogLevel::Info, "engine.search"));
}

TEST_CASE("EngineOperation names match the engine calls", "[engine][instrumented]") {
    REQUIRE(to_string(EngineOperation::Add) == "add");
    REQUIRE(to_string(EngineOperation::DeleteAll) == "delete_all");
    REQUIRE(to_string(EngineOperation::GetAll) == "get_all");
}
