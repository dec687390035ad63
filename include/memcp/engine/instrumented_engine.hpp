#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Instrumented Engine
// ═══════════════════════════════════════════════════════════════════════════
// Decorator around any MemoryEngine. Every call is forwarded unchanged to
// the wrapped engine; the decorator counts calls and failures, accumulates
// latency per operation and logs each call at debug level. Exceptions from
// the wrapped engine propagate unchanged.
//
// Usage:
//   auto engine = std::make_shared<InstrumentedEngine>(
//       std::make_shared<InMemoryEngine>());
//   EngineBinding binding(engine);
//   ...
//   auto stats = engine->stats(EngineOperation::Search);
//   engine->log_summary();  // at shutdown

#include "memcp/engine/memory_engine.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

namespace memcp {

enum class EngineOperation {
    Add,
    Search,
    Get,
    Update,
    Delete,
    DeleteAll,
    GetAll
};

inline constexpr std::size_t kEngineOperationCount = 7;

[[nodiscard]] constexpr std::string_view to_string(EngineOperation operation) noexcept {
    switch (operation) {
        case EngineOperation::Add:       return "add";
        case EngineOperation::Search:    return "search";
        case EngineOperation::Get:       return "get";
        case EngineOperation::Update:    return "update";
        case EngineOperation::Delete:    return "delete";
        case EngineOperation::DeleteAll: return "delete_all";
        case EngineOperation::GetAll:    return "get_all";
    }
    return "unknown";
}

struct EngineOperationStats {
    std::size_t calls{0};
    std::size_t failures{0};
    std::chrono::microseconds total_latency{0};
};

class InstrumentedEngine final : public MemoryEngine {
public:
    /// Throws std::invalid_argument when inner is null.
    explicit InstrumentedEngine(std::shared_ptr<MemoryEngine> inner);

    InstrumentedEngine(const InstrumentedEngine&) = delete;
    InstrumentedEngine& operator=(const InstrumentedEngine&) = delete;

    Value add(const AddRequest& request) override;
    Value search(const SearchRequest& request) override;
    Value get(const GetRequest& request) override;
    Value update(const UpdateRequest& request) override;
    Value remove(const DeleteRequest& request) override;
    Value remove_all(const DeleteAllRequest& request) override;
    Value get_all(const ListRequest& request) override;

    [[nodiscard]] EngineOperationStats stats(EngineOperation operation) const;

    [[nodiscard]] std::size_t total_calls() const;

    /// Logs one info line per operation that was called, then the total.
    void log_summary() const;

private:
    struct Counters {
        std::atomic<std::size_t> calls{0};
        std::atomic<std::size_t> failures{0};
        std::atomic<std::int64_t> latency_us{0};
    };

    template <typename Call>
    Value instrument(EngineOperation operation, Call&& call);

    std::shared_ptr<MemoryEngine> inner_;
    std::array<Counters, kEngineOperationCount> counters_;
};

}  // namespace memcp
