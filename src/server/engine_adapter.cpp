#include "memcp/server/engine_adapter.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <format>
#include <limits>

namespace memcp {
namespace {

std::string describe(const Json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return value.dump(-1, ' ', false, Json::error_handler_t::replace);
}

ValidationError invalid_integer(const Json& value, std::string_view name) {
    return ValidationError(std::format("{} must be a valid integer, got: {}", name, describe(value)));
}

std::optional<std::int64_t> parse_decimal(std::string_view text) {
    while ((text.empty() == false) && std::isspace(static_cast<unsigned char>(text.front()))) {
        text.remove_prefix(1);
    }
    while ((text.empty() == false) && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.remove_suffix(1);
    }
    if ((text.empty() == false) && (text.front() == '+')) {
        text.remove_prefix(1);
        if ((text.empty() == false) && (text.front() == '-')) {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }

    std::int64_t parsed = 0;
    const char* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, parsed);
    if ((ec != std::errc{}) || (ptr != end)) {
        return std::nullopt;
    }
    return parsed;
}

const Json* find_argument(const Json& arguments, std::string_view name) {
    const auto it = arguments.find(std::string(name));
    if ((it == arguments.end()) || it->is_null()) {
        return nullptr;
    }
    return &*it;
}

std::optional<std::string> optional_string(const Json& arguments, std::string_view name) {
    const Json* value = find_argument(arguments, name);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_number_integer()) {
        return value->dump();
    }
    if (value->is_string() == false) {
        throw ValidationError(std::format("{} must be a string", name));
    }
    std::string text = value->get<std::string>();
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

std::optional<Json> optional_object(const Json& arguments, std::string_view name) {
    const Json* value = find_argument(arguments, name);
    if (value == nullptr) {
        return std::nullopt;
    }
    if (value->is_object() == false) {
        throw ValidationError(std::format("{} must be an object", name));
    }
    return *value;
}

std::string required_string(const Json& arguments, std::string_view name) {
    const Json* value = find_argument(arguments, name);
    if ((value == nullptr) || (value->is_string() == false)) {
        throw ValidationError(std::format("{} must be a string", name));
    }
    return value->get<std::string>();
}

std::int64_t count_argument(const Json& arguments, std::string_view name, std::int64_t default_value) {
    const Json* value = find_argument(arguments, name);
    if (value == nullptr) {
        return default_value;
    }
    const std::int64_t count = coerce_integer(*value, name);
    if (count < 0) {
        throw ValidationError(std::format("{} must not be negative, got: {}", name, count));
    }
    return count;
}

std::int64_t memory_id_argument(const Json& arguments) {
    const Json* value = find_argument(arguments, "memory_id");
    if (value == nullptr) {
        throw ValidationError("memory_id parameter is required");
    }
    return coerce_integer(*value, "memory_id");
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Argument Coercion
// ─────────────────────────────────────────────────────────────────────────────

std::int64_t coerce_integer(const Json& value, std::string_view name) {
    if (value.is_number_unsigned()) {
        const auto unsigned_value = value.get<std::uint64_t>();
        if (unsigned_value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
            return static_cast<std::int64_t>(unsigned_value);
        }
        throw invalid_integer(value, name);
    }

    if (value.is_number_integer()) {
        return value.get<std::int64_t>();
    }

    if (value.is_number_float()) {
        const double d = std::trunc(value.get<double>());
        // 2^63 is exactly representable; anything at or above it overflows
        constexpr double kLimit = 9223372036854775808.0;
        if (std::isfinite(d) && (d >= -kLimit) && (d < kLimit)) {
            return static_cast<std::int64_t>(d);
        }
        throw invalid_integer(value, name);
    }

    if (value.is_string()) {
        if (const auto parsed = parse_decimal(value.get_ref<const std::string&>())) {
            return *parsed;
        }
    }

    throw invalid_integer(value, name);
}

bool is_missing(const Json& arguments, std::string_view name) {
    const Json* value = find_argument(arguments, name);
    if (value == nullptr) {
        return true;
    }
    return value->is_string() && value->get_ref<const std::string&>().empty();
}

void validate_required(const ToolDescriptor& tool, const Json& arguments) {
    for (const auto& name : tool.required()) {
        if (is_missing(arguments, name)) {
            throw ValidationError(std::format("{} parameter is required", name));
        }
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Request Projection
// ─────────────────────────────────────────────────────────────────────────────

AddRequest make_add_request(const Json& arguments, const Identity& identity) {
    AddRequest request;
    const Json* messages = find_argument(arguments, "messages");
    const bool valid_messages = (messages != nullptr)
        && (messages->is_string() || messages->is_object() || messages->is_array());
    if (valid_messages == false) {
        throw ValidationError("messages must be a string, an object or an array");
    }
    request.messages = *messages;
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    request.run_id = optional_string(arguments, "run_id");
    request.metadata = optional_object(arguments, "metadata");
    request.filters = optional_object(arguments, "filters");
    request.scope = optional_string(arguments, "scope");
    request.memory_type = optional_string(arguments, "memory_type");
    return request;
}

SearchRequest make_search_request(const Json& arguments, const Identity& identity) {
    SearchRequest request;
    request.query = required_string(arguments, "query");
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    request.run_id = optional_string(arguments, "run_id");
    request.filters = optional_object(arguments, "filters");
    request.limit = count_argument(arguments, "limit", 10);

    if (const Json* threshold = find_argument(arguments, "threshold")) {
        if (threshold->is_number() == false) {
            throw ValidationError(std::format("threshold must be a number, got: {}", describe(*threshold)));
        }
        request.threshold = threshold->get<double>();
    }
    return request;
}

GetRequest make_get_request(const Json& arguments, const Identity& identity) {
    GetRequest request;
    request.memory_id = memory_id_argument(arguments);
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    return request;
}

UpdateRequest make_update_request(const Json& arguments, const Identity& identity) {
    UpdateRequest request;
    request.memory_id = memory_id_argument(arguments);
    request.content = required_string(arguments, "content");
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    request.metadata = optional_object(arguments, "metadata");
    return request;
}

DeleteRequest make_delete_request(const Json& arguments, const Identity& identity) {
    DeleteRequest request;
    request.memory_id = memory_id_argument(arguments);
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    return request;
}

DeleteAllRequest make_delete_all_request(const Json& arguments, const Identity& identity) {
    DeleteAllRequest request;
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    request.run_id = optional_string(arguments, "run_id");
    return request;
}

ListRequest make_list_request(const Json& arguments, const Identity& identity) {
    ListRequest request;
    request.user_id = identity.user_id;
    request.agent_id = identity.agent_id;
    request.run_id = optional_string(arguments, "run_id");
    request.limit = count_argument(arguments, "limit", 100);
    request.offset = count_argument(arguments, "offset", 0);
    request.filters = optional_object(arguments, "filters");
    return request;
}

// ─────────────────────────────────────────────────────────────────────────────
// EngineAdapter
// ─────────────────────────────────────────────────────────────────────────────

EngineAdapter::EngineAdapter(EngineBinding& binding, IdentityResolver& identity)
    : binding_(binding)
    , identity_(identity)
{}

MemoryEngine& EngineAdapter::engine() {
    return binding_.get();
}

bool EngineAdapter::is_bound() const {
    return binding_.is_bound();
}

Identity EngineAdapter::prepare(ToolKind kind, const Json& arguments) {
    if (arguments.is_object() == false) {
        throw ValidationError("arguments must be an object");
    }
    validate_required(tool_descriptor(kind), arguments);

    // Type-check the identity arguments before the resolver reads them
    (void)optional_string(arguments, "user_id");
    (void)optional_string(arguments, "agent_id");
    return identity_.resolve(arguments);
}

Value EngineAdapter::add_memory(const Json& arguments) {
    const auto identity = prepare(ToolKind::AddMemory, arguments);
    return engine().add(make_add_request(arguments, identity));
}

Value EngineAdapter::search_memories(const Json& arguments) {
    const auto identity = prepare(ToolKind::SearchMemories, arguments);
    return engine().search(make_search_request(arguments, identity));
}

Value EngineAdapter::get_memory(const Json& arguments) {
    const auto identity = prepare(ToolKind::GetMemory, arguments);
    return engine().get(make_get_request(arguments, identity));
}

Value EngineAdapter::update_memory(const Json& arguments) {
    const auto identity = prepare(ToolKind::UpdateMemory, arguments);
    return engine().update(make_update_request(arguments, identity));
}

std::int64_t EngineAdapter::delete_memory(const Json& arguments) {
    const auto identity = prepare(ToolKind::DeleteMemory, arguments);
    const auto request = make_delete_request(arguments, identity);
    (void)engine().remove(request);
    return request.memory_id;
}

void EngineAdapter::delete_all_memories(const Json& arguments) {
    const auto identity = prepare(ToolKind::DeleteAllMemories, arguments);
    (void)engine().remove_all(make_delete_all_request(arguments, identity));
}

Value EngineAdapter::list_memories(const Json& arguments) {
    const auto identity = prepare(ToolKind::ListMemories, arguments);
    return engine().get_all(make_list_request(arguments, identity));
}

}  // namespace memcp
