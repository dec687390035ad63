#include "memcp/value/sanitizer.hpp"

#include "memcp/log/logger.hpp"
#include "memcp/value/json_encoding.hpp"

#include <algorithm>
#include <format>
#include <unordered_set>

namespace memcp {
namespace {

// Deeper graphs are cut off; an object whose dump keeps producing fresh
// objects would otherwise recurse without bound.

bool is_private_name(std::string_view name) noexcept {
    return (name.empty() == false) && (name.front() == '_');
}

// ─────────────────────────────────────────────────────────────────────────────
// SanitizePass - state for a single top-level sanitize() call
// ─────────────────────────────────────────────────────────────────────────────

class SanitizePass {
public:
    Value visit(const Value& value);

private:
    // Marks a node as being converted for exactly the lifetime of the frame.
    class ActiveFrame {
    public:
        ActiveFrame(std::unordered_set<const void*>& active, const void* identity, std::size_t& depth)
            : active_(active)
            , identity_(identity)
            , depth_(depth)
        {
            active_.insert(identity_);
            ++depth_;
        }

        ~ActiveFrame() {
            active_.erase(identity_);
            --depth_;
        }

        ActiveFrame(const ActiveFrame&) = delete;
        ActiveFrame& operator=(const ActiveFrame&) = delete;

    private:
        std::unordered_set<const void*>& active_;
        const void* identity_;
        std::size_t& depth_;
    };

    Value visit_compound(const Value& value);
    Value visit_object(const Object& object);
    Value visit_sequence(const Value& sequence);
    Value visit_map(const Value& map);
    Value public_mapping(const Value& mapping);
    std::optional<Value> dump_object(const Object& object);
    Value coerce_key(const Value& key);

    std::unordered_set<const void*> active_;
    std::size_t depth_{0};
};

Value SanitizePass::visit(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Timestamp:
            return Value{to_iso8601(value.as_timestamp())};
        case ValueKind::Date:
            return Value{to_iso8601(value.as_date())};
        case ValueKind::List:
        case ValueKind::Tuple:
        case ValueKind::Map:
        case ValueKind::Object:
            return visit_compound(value);
        default:
            return value;
    }
}

Value SanitizePass::visit_compound(const Value& value) {
    const void* identity = value.identity();
    if (active_.contains(identity)) {
        return Value{std::string(kCircularReference)};
    }
    if (depth_ >= kMaxSanitizeDepth) {
        MEMCP_LOG_WARN(std::format("Sanitizer depth limit ({}) reached, value dropped", kMaxSanitizeDepth));
        return Value{};
    }

    ActiveFrame frame(active_, identity, depth_);
    switch (value.kind()) {
        case ValueKind::Object:
            return visit_object(*value.as_object());
        case ValueKind::Map:
            return visit_map(value);
        default:
            return visit_sequence(value);
    }
}

Value SanitizePass::visit_sequence(const Value& sequence) {
    ValueList items;
    items.reserve(sequence.items().size());
    for (const auto& item : sequence.items()) {
        items.push_back(visit(item));
    }
    return sequence.is_tuple() ? Value::tuple(std::move(items)) : Value::list(std::move(items));
}

Value SanitizePass::visit_map(const Value& map) {
    ValueMap entries;
    entries.reserve(map.entries().size());
    for (const auto& [key, element] : map.entries()) {
        entries.emplace_back(coerce_key(key), visit(element));
    }
    return Value::map(std::move(entries));
}

Value SanitizePass::visit_object(const Object& object) {
    if (auto dumped = dump_object(object)) {
        // The dump may still hold temporal values or further objects
        return visit(*dumped);
    }

    try {
        if (auto attributes = object.attributes()) {
            ValueMap entries;
            for (const auto& [name, element] : *attributes) {
                if (is_private_name(name)) {
                    continue;
                }
                entries.emplace_back(Value{name}, visit(element));
            }
            return Value::map(std::move(entries));
        }
        if (auto mapping = object.to_mapping()) {
            return public_mapping(visit(*mapping));
        }
    } catch (const std::exception& e) {
        MEMCP_LOG_DEBUG(std::format("{} attribute conversion failed: {}", object.type_name(), e.what()));
    }

    try {
        return Value{object.to_string()};
    } catch (const std::exception& e) {
        MEMCP_LOG_DEBUG(std::format("{} string conversion failed: {}", object.type_name(), e.what()));
    }
    return Value{};
}

Value SanitizePass::public_mapping(const Value& mapping) {
    if (!mapping.is_map()) {
        return mapping;
    }
    ValueMap entries;
    for (const auto& entry : mapping.entries()) {
        if (is_private_name(entry.first.as_string())) {
            continue;
        }
        entries.push_back(entry);
    }
    return Value::map(std::move(entries));
}

std::optional<Value> SanitizePass::dump_object(const Object& object) {
    try {
        return object.dump(DumpMode::Json);
    } catch (const std::exception& e) {
        MEMCP_LOG_DEBUG(std::format("{} JSON dump failed, trying native dump: {}", object.type_name(), e.what()));
    }
    try {
        return object.dump(DumpMode::Native);
    } catch (const std::exception& e) {
        MEMCP_LOG_DEBUG(std::format("{} native dump failed: {}", object.type_name(), e.what()));
    }
    return std::nullopt;
}

Value SanitizePass::coerce_key(const Value& key) {
    switch (key.kind()) {
        case ValueKind::String:
            return key;
        case ValueKind::Null:
            return Value{"null"};
        case ValueKind::Bool:
            return Value{key.as_bool() ? "true" : "false"};
        case ValueKind::Integer:
            return Value{std::to_string(key.as_int())};
        case ValueKind::Unsigned:
            return Value{std::to_string(key.as_unsigned())};
        case ValueKind::Float:
            return Value{Json(key.as_double()).dump()};
        default:
            break;
    }

    Value converted = visit(key);
    if (converted.is_string()) {
        return converted;
    }
    return Value{to_json_lenient(converted).dump(-1, ' ', false, Json::error_handler_t::replace)};
}

bool all_json_safe(const ValueList& items) {
    return std::all_of(items.begin(), items.end(), [](const Value& item) {
        return is_json_safe(item);
    });
}

}  // namespace

Value sanitize(const Value& value) {
    SanitizePass pass;
    return pass.visit(value);
}

SanitizeOutcome sanitize_to_fixed_point(const Value& value, std::size_t max_passes) {
    const std::size_t limit = std::max<std::size_t>(max_passes, 1);

    SanitizeOutcome outcome{sanitize(value), 1, false};
    while (outcome.passes < limit) {
        Value next = sanitize(outcome.value);
        ++outcome.passes;
        if (next == outcome.value) {
            outcome.converged = true;
            break;
        }
        outcome.value = std::move(next);
    }

    if (outcome.converged == false) {
        MEMCP_LOG_DEBUG(std::format("Sanitizer stopped after {} passes without a fixed point", outcome.passes));
    }
    return outcome;
}

bool is_json_safe(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Timestamp:
        case ValueKind::Date:
        case ValueKind::Object:
            return false;
        case ValueKind::List:
        case ValueKind::Tuple:
            return all_json_safe(value.items());
        case ValueKind::Map:
            return std::all_of(value.entries().begin(), value.entries().end(), [](const MapEntry& entry) {
                return entry.first.is_string() && is_json_safe(entry.second);
            });
        default:
            return true;
    }
}

}  // namespace memcp
