#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// In-Memory Engine
// ═══════════════════════════════════════════════════════════════════════════
// Process-local MemoryEngine used by memcp-server and the tests. Nothing is
// persisted. Ids are sequential from 1 and never reused.
//
// Search ranks by case-insensitive token overlap: the score of a memory is
// the fraction of distinct query tokens that occur in its content. Memories
// with a score of zero never match.
//
// Results are returned as MemoryRecord objects, whose structured dump keeps
// created_at/updated_at as Timestamp values.

#include "memcp/engine/memory_engine.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace memcp {

struct StoredMemory {
    std::int64_t id{0};
    std::string content;
    std::string user_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
    Json metadata = Json::object();
    std::optional<std::string> scope;
    std::optional<std::string> memory_type;
    Timestamp created_at{};
    Timestamp updated_at{};
};

class MemoryRecord final : public Object {
public:
    explicit MemoryRecord(StoredMemory memory);

    [[nodiscard]] const StoredMemory& memory() const noexcept { return memory_; }

    [[nodiscard]] std::string type_name() const override;
    [[nodiscard]] std::optional<Value> dump(DumpMode mode) const override;
    [[nodiscard]] std::string to_string() const override;

private:
    StoredMemory memory_;
};

struct InMemoryEngineConfig {
    /// Maximum number of stored memories, 0 for no limit
    std::size_t capacity{0};

    /// Time source for created_at/updated_at
    std::function<Timestamp()> clock;
};

class InMemoryEngine final : public MemoryEngine {
public:
    InMemoryEngine();
    explicit InMemoryEngine(InMemoryEngineConfig config);

    InMemoryEngine(const InMemoryEngine&) = delete;
    InMemoryEngine& operator=(const InMemoryEngine&) = delete;

    Value add(const AddRequest& request) override;
    Value search(const SearchRequest& request) override;
    Value get(const GetRequest& request) override;
    Value update(const UpdateRequest& request) override;
    Value remove(const DeleteRequest& request) override;
    Value remove_all(const DeleteAllRequest& request) override;
    Value get_all(const ListRequest& request) override;

    [[nodiscard]] std::size_t size() const;

private:
    [[nodiscard]] Timestamp now() const;

    InMemoryEngineConfig config_;
    mutable std::mutex mutex_;
    std::map<std::int64_t, StoredMemory> memories_;
    std::int64_t next_id_{1};
};

}  // namespace memcp
