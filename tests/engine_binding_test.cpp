#include <catch2/catch_test_macros.hpp>

#include "memcp/engine/engine_binding.hpp"
#include "mocks/capturing_logger.hpp"
#include "mocks/mock_memory_engine.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace memcp;
using memcp::testing::MockMemoryEngine;
using memcp::testing::ScopedCapture;

TEST_CASE("EngineBinding rejects empty handles", "[engine][binding]") {
    REQUIRE_THROWS_AS(EngineBinding(EngineBinding::Factory{}), std::invalid_argument);
    REQUIRE_THROWS_AS(EngineBinding(std::shared_ptr<MemoryEngine>{}), std::invalid_argument);
}

TEST_CASE("EngineBinding with an engine is bound immediately", "[engine][binding]") {
    auto engine = std::make_shared<MockMemoryEngine>();
    EngineBinding binding(engine);

    REQUIRE(binding.is_bound());
    REQUIRE(&binding.get() == engine.get());
}

TEST_CASE("EngineBinding creates the engine on first use only", "[engine][binding]") {
    ScopedCapture capture;
    int created = 0;
    EngineBinding binding([&created]() -> std::shared_ptr<MemoryEngine> {
        ++created;
        return std::make_shared<MockMemoryEngine>();
    });

    REQUIRE_FALSE(binding.is_bound());
    REQUIRE(created == 0);

    MemoryEngine& first = binding.get();
    MemoryEngine& second = binding.get();

    REQUIRE(created == 1);
    REQUIRE(&first == &second);
    REQUIRE(binding.is_bound());
    REQUIRE(capture.logger().contains(LogLevel::Info, "Memory instance initialized"));
}

TEST_CASE("EngineBinding retries after a failed factory", "[engine][binding]") {
    int attempts = 0;
    EngineBinding binding([&attempts]() -> std::shared_ptr<MemoryEngine> {
        if (++attempts == 1) {
            throw std::runtime_error("database unreachable");
        }
        return std::make_shared<MockMemoryEngine>();
    });

    REQUIRE_THROWS_WITH(binding.get(), "database unreachable");
    REQUIRE_FALSE(binding.is_bound());

    REQUIRE_NOTHROW(binding.get());
    REQUIRE(binding.is_bound());
    REQUIRE(attempts == 2);
}

TEST_CASE("EngineBinding reports a factory that returns nothing", "[engine][binding]") {
    EngineBinding binding([]() -> std::shared_ptr<MemoryEngine> { return nullptr; });

    REQUIRE_THROWS_AS(binding.get(), std::runtime_error);
    REQUIRE_FALSE(binding.is_bound());
}

TEST_CASE("EngineBinding binds once under concurrent first use", "[engine][binding][concurrency]") {
    std::atomic<int> created{0};
    EngineBinding binding([&created]() -> std::shared_ptr<MemoryEngine> {
        created.fetch_add(1);
        return std::make_shared<MockMemoryEngine>();
    });

    std::vector<std::thread> threads;
    std::vector<MemoryEngine*> seen(8, nullptr);
    for (std::size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&binding, &seen, i] { seen[i] = &binding.get(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(created.load() == 1);
    for (auto* engine : seen) {
        REQUIRE(engine == seen.front());
    }
}
