#include "memcp/engine/in_memory_engine.hpp"

#include "memcp/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <set>
#include <vector>

namespace memcp {
namespace {

Value optional_text(const std::optional<std::string>& text) {
    return text ? Value(*text) : Value(nullptr);
}

std::string message_text(const Json& message) {
    if (message.is_string()) {
        return message.get<std::string>();
    }
    if (message.is_object()) {
        const auto content = message.find("content");
        if ((content != message.end()) && content->is_string()) {
            return content->get<std::string>();
        }
    }
    throw EngineError("InvalidMessages",
                      "messages must be a string, a message object with 'content', or a list of them");
}

// Concatenates the content of every message, one per line.
std::string extract_content(const Json& messages) {
    std::string content;
    if (messages.is_array()) {
        for (const auto& message : messages) {
            const std::string text = message_text(message);
            if (text.empty()) {
                continue;
            }
            if (content.empty() == false) {
                content.push_back('\n');
            }
            content += text;
        }
    } else {
        content = message_text(messages);
    }

    if (content.empty()) {
        throw EngineError("InvalidMessages", "messages contain no content");
    }
    return content;
}

std::set<std::string> tokenize(std::string_view text) {
    std::set<std::string> tokens;
    std::string current;
    for (const char c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc) || (uc >= 0x80)) {
            current.push_back(static_cast<char>(std::tolower(uc)));
        } else if (current.empty() == false) {
            tokens.insert(std::move(current));
            current.clear();
        }
    }
    if (current.empty() == false) {
        tokens.insert(std::move(current));
    }
    return tokens;
}

bool matches_identity(const StoredMemory& memory,
                      const std::string& user_id,
                      const std::optional<std::string>& agent_id,
                      const std::optional<std::string>& run_id) {
    if (memory.user_id != user_id) {
        return false;
    }
    if (agent_id && (memory.agent_id != agent_id)) {
        return false;
    }
    if (run_id && (memory.run_id != run_id)) {
        return false;
    }
    return true;
}

// Every filter entry must equal the metadata entry of the same name.
bool matches_filters(const StoredMemory& memory, const std::optional<Json>& filters) {
    if (!filters || filters->is_null()) {
        return true;
    }
    if (filters->is_object() == false) {
        throw EngineError("InvalidFilters", "filters must be an object");
    }
    for (const auto& [key, expected] : filters->items()) {
        const auto actual = memory.metadata.find(key);
        if ((actual == memory.metadata.end()) || (*actual != expected)) {
            return false;
        }
    }
    return true;
}

Value make_record(const StoredMemory& memory) {
    return Value(std::make_shared<MemoryRecord>(memory));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// MemoryRecord
// ─────────────────────────────────────────────────────────────────────────────

MemoryRecord::MemoryRecord(StoredMemory memory)
    : memory_(std::move(memory))
{}

std::string MemoryRecord::type_name() const {
    return "MemoryRecord";
}

std::optional<Value> MemoryRecord::dump(DumpMode /*mode*/) const {
    // Timestamps stay temporal in both modes
    Value out = Value::map();
    out.set("id", memory_.id);
    out.set("memory", memory_.content);
    out.set("user_id", memory_.user_id);
    out.set("agent_id", optional_text(memory_.agent_id));
    out.set("run_id", optional_text(memory_.run_id));
    out.set("metadata", Value::from_json(memory_.metadata));
    out.set("scope", optional_text(memory_.scope));
    out.set("memory_type", optional_text(memory_.memory_type));
    out.set("created_at", memory_.created_at);
    out.set("updated_at", memory_.updated_at);
    return out;
}

std::string MemoryRecord::to_string() const {
    return std::format("<MemoryRecord id={}>", memory_.id);
}

// ─────────────────────────────────────────────────────────────────────────────
// InMemoryEngine
// ─────────────────────────────────────────────────────────────────────────────

InMemoryEngine::InMemoryEngine()
    : InMemoryEngine(InMemoryEngineConfig{})
{}

InMemoryEngine::InMemoryEngine(InMemoryEngineConfig config)
    : config_(std::move(config))
{}

Timestamp InMemoryEngine::now() const {
    if (config_.clock) {
        return config_.clock();
    }
    return std::chrono::system_clock::now();
}

std::size_t InMemoryEngine::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return memories_.size();
}

Value InMemoryEngine::add(const AddRequest& request) {
    StoredMemory memory;
    memory.content = extract_content(request.messages);
    memory.user_id = request.user_id;
    memory.agent_id = request.agent_id;
    memory.run_id = request.run_id;
    if (request.metadata && (request.metadata->is_null() == false)) {
        if (request.metadata->is_object() == false) {
            throw EngineError("InvalidMetadata", "metadata must be an object");
        }
        memory.metadata = *request.metadata;
    }
    memory.scope = request.scope;
    memory.memory_type = request.memory_type;

    std::lock_guard<std::mutex> lock(mutex_);
    const bool is_full = (config_.capacity > 0) && (memories_.size() >= config_.capacity);
    if (is_full) {
        throw EngineError("CapacityExceeded",
                          std::format("memory store is full ({} memories)", config_.capacity));
    }

    memory.id = next_id_++;
    memory.created_at = now();
    memory.updated_at = memory.created_at;
    const auto [it, inserted] = memories_.emplace(memory.id, std::move(memory));
    MEMCP_LOG_DEBUG(std::format("Stored memory {} for user '{}'", it->first, it->second.user_id));
    return make_record(it->second);
}

Value InMemoryEngine::search(const SearchRequest& request) {
    const auto query_tokens = tokenize(request.query);

    struct Hit {
        double score;
        const StoredMemory* memory;
    };

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Hit> hits;
    if (query_tokens.empty() == false) {
        for (const auto& [id, memory] : memories_) {
            if (!matches_identity(memory, request.user_id, request.agent_id, request.run_id)) {
                continue;
            }
            if (!matches_filters(memory, request.filters)) {
                continue;
            }
            const auto content_tokens = tokenize(memory.content);
            std::size_t shared = 0;
            for (const auto& token : query_tokens) {
                shared += content_tokens.count(token);
            }
            const double score = static_cast<double>(shared) / static_cast<double>(query_tokens.size());
            if (shared == 0) {
                continue;
            }
            if (request.threshold && (score < *request.threshold)) {
                continue;
            }
            hits.push_back(Hit{score, &memory});
        }
    }

    // Best score first, oldest first among equals
    std::stable_sort(hits.begin(), hits.end(), [](const Hit& a, const Hit& b) {
        return a.score > b.score;
    });

    const auto limit = static_cast<std::size_t>(std::max<std::int64_t>(request.limit, 0));
    Value results = Value::list();
    for (const auto& hit : hits) {
        if (results.size() >= limit) {
            break;
        }
        Value entry = Value::map();
        entry.set("id", hit.memory->id);
        entry.set("memory", hit.memory->content);
        entry.set("score", hit.score);
        entry.set("metadata", Value::from_json(hit.memory->metadata));
        entry.set("created_at", hit.memory->created_at);
        entry.set("updated_at", hit.memory->updated_at);
        results.push_back(std::move(entry));
    }

    Value out = Value::map();
    out.set("results", std::move(results));
    out.set("relations", Value::list());
    return out;
}

Value InMemoryEngine::get(const GetRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = memories_.find(request.memory_id);
    if ((it == memories_.end()) ||
        !matches_identity(it->second, request.user_id, request.agent_id, std::nullopt)) {
        return Value(nullptr);
    }
    return make_record(it->second);
}

Value InMemoryEngine::update(const UpdateRequest& request) {
    if (request.content.empty()) {
        throw EngineError("InvalidContent", "content must not be empty");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = memories_.find(request.memory_id);
    if ((it == memories_.end()) ||
        !matches_identity(it->second, request.user_id, request.agent_id, std::nullopt)) {
        throw EngineError("NotFound", std::format("Memory {} not found", request.memory_id));
    }

    StoredMemory& memory = it->second;
    memory.content = request.content;
    if (request.metadata && request.metadata->is_object()) {
        memory.metadata.update(*request.metadata);
    }
    memory.updated_at = now();
    return make_record(memory);
}

Value InMemoryEngine::remove(const DeleteRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = memories_.find(request.memory_id);
    if ((it == memories_.end()) ||
        !matches_identity(it->second, request.user_id, request.agent_id, std::nullopt)) {
        throw EngineError("NotFound", std::format("Memory {} not found", request.memory_id));
    }
    memories_.erase(it);
    return Value(true);
}

Value InMemoryEngine::remove_all(const DeleteAllRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::int64_t deleted = 0;
    for (auto it = memories_.begin(); it != memories_.end();) {
        if (matches_identity(it->second, request.user_id, request.agent_id, request.run_id)) {
            it = memories_.erase(it);
            ++deleted;
        } else {
            ++it;
        }
    }

    Value out = Value::map();
    out.set("deleted", deleted);
    return out;
}

Value InMemoryEngine::get_all(const ListRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const StoredMemory*> matching;
    for (const auto& [id, memory] : memories_) {
        if (matches_identity(memory, request.user_id, request.agent_id, request.run_id) &&
            matches_filters(memory, request.filters)) {
            matching.push_back(&memory);
        }
    }

    const auto offset = static_cast<std::size_t>(std::max<std::int64_t>(request.offset, 0));
    const auto limit = static_cast<std::size_t>(std::max<std::int64_t>(request.limit, 0));

    Value results = Value::list();
    for (std::size_t i = offset; (i < matching.size()) && (results.size() < limit); ++i) {
        results.push_back(make_record(*matching[i]));
    }

    Value out = Value::map();
    out.set("results", std::move(results));
    out.set("total", static_cast<std::int64_t>(matching.size()));
    return out;
}

}  // namespace memcp
