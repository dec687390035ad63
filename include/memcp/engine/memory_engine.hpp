#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Memory Engine
// ═══════════════════════════════════════════════════════════════════════════
// The storage/retrieval collaborator behind the tools. Requests carry the
// already-normalized arguments of a tool call; results are engine-defined
// Value graphs which the dispatcher sanitizes before they leave the process.
//
// Optional fields that the client did not send stay disengaged; they are
// never passed as null.

#include "memcp/error.hpp"
#include "memcp/value/value.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace memcp {

struct AddRequest {
    Json messages;   // String, message object or list of message objects
    std::string user_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
    std::optional<Json> metadata;
    std::optional<Json> filters;
    std::optional<std::string> scope;
    std::optional<std::string> memory_type;
};

struct SearchRequest {
    std::string query;
    std::string user_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
    std::optional<Json> filters;
    std::int64_t limit{10};
    std::optional<double> threshold;
};

struct GetRequest {
    std::int64_t memory_id{0};
    std::string user_id;
    std::optional<std::string> agent_id;
};

struct UpdateRequest {
    std::int64_t memory_id{0};
    std::string content;
    std::string user_id;
    std::optional<std::string> agent_id;
    std::optional<Json> metadata;
};

struct DeleteRequest {
    std::int64_t memory_id{0};
    std::string user_id;
    std::optional<std::string> agent_id;
};

struct DeleteAllRequest {
    std::string user_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
};

struct ListRequest {
    std::string user_id;
    std::optional<std::string> agent_id;
    std::optional<std::string> run_id;
    std::int64_t limit{100};
    std::int64_t offset{0};
    std::optional<Json> filters;
};

/// Raised by engines for rejected operations. The kind is reported to the
/// client ("NotFound", "CapacityExceeded", ...).
class EngineError : public Error {
public:
    explicit EngineError(const std::string& message)
        : Error("EngineError", message)
    {}

    EngineError(std::string kind, const std::string& message)
        : Error(std::move(kind), message)
    {}
};

class MemoryEngine {
public:
    virtual ~MemoryEngine() = default;

    /// Result of the add, typically a map with an "id" entry.
    virtual Value add(const AddRequest& request) = 0;

    /// Map with "results" and, for graph-backed engines, "relations".
    virtual Value search(const SearchRequest& request) = 0;

    /// The memory, or null when it does not exist for this identity.
    virtual Value get(const GetRequest& request) = 0;

    virtual Value update(const UpdateRequest& request) = 0;

    virtual Value remove(const DeleteRequest& request) = 0;

    virtual Value remove_all(const DeleteAllRequest& request) = 0;

    /// Map with "results" (and optionally "total"), or a bare list.
    virtual Value get_all(const ListRequest& request) = 0;
};

}  // namespace memcp
