#include "memcp/value/json_encoding.hpp"

#include "memcp/log/logger.hpp"

#include <format>
#include <unordered_set>

namespace memcp {
namespace {

Json encode_scalar(const Value& value) {
    switch (value.kind()) {
        case ValueKind::Null:     return Json(nullptr);
        case ValueKind::Bool:     return Json(value.as_bool());
        case ValueKind::Integer:  return Json(value.as_int());
        case ValueKind::Unsigned: return Json(value.as_unsigned());
        case ValueKind::Float:    return Json(value.as_double());
        case ValueKind::String:   return Json(value.as_string());
        default:
            throw EncodeError(std::format("{} is not a JSON scalar", to_string(value.kind())));
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Strict encoder
// ─────────────────────────────────────────────────────────────────────────────

class StrictEncoder {
public:
    Json encode(const Value& value) {
        switch (value.kind()) {
            case ValueKind::Timestamp:
            case ValueKind::Date:
            case ValueKind::Object:
                throw EncodeError(std::format("{} is not JSON serializable", to_string(value.kind())));
            case ValueKind::List:
            case ValueKind::Tuple:
            case ValueKind::Map:
                return encode_compound(value);
            default:
                return encode_scalar(value);
        }
    }

private:
    Json encode_compound(const Value& value) {
        const void* identity = value.identity();
        if (active_.insert(identity).second == false) {
            throw EncodeError("Circular reference detected");
        }

        Json result;
        if (value.is_map()) {
            result = Json::object();
            for (const auto& [key, element] : value.entries()) {
                if (!key.is_string()) {
                    throw EncodeError(std::format("map key of kind {} is not a string", to_string(key.kind())));
                }
                result[key.as_string()] = encode(element);
            }
        } else {
            result = Json::array();
            for (const auto& element : value.items()) {
                result.push_back(encode(element));
            }
        }

        active_.erase(identity);
        return result;
    }

    std::unordered_set<const void*> active_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Lenient encoder (default serializer)
// ─────────────────────────────────────────────────────────────────────────────

class LenientEncoder {
public:
    Json encode(const Value& value) {
        switch (value.kind()) {
            case ValueKind::Timestamp:
                return Json(to_iso8601(value.as_timestamp()));
            case ValueKind::Date:
                return Json(to_iso8601(value.as_date()));
            case ValueKind::List:
            case ValueKind::Tuple:
            case ValueKind::Map:
            case ValueKind::Object:
                return encode_compound(value);
            default:
                return encode_scalar(value);
        }
    }

private:
    Json encode_compound(const Value& value) {
        const void* identity = value.identity();
        if (active_.insert(identity).second == false) {
            return Json(nullptr);
        }

        Json result;
        if (value.is_object()) {
            result = encode_object(*value.as_object());
        } else if (value.is_map()) {
            result = Json::object();
            for (const auto& [key, element] : value.entries()) {
                result[key_text(key)] = encode(element);
            }
        } else {
            result = Json::array();
            for (const auto& element : value.items()) {
                result.push_back(encode(element));
            }
        }

        active_.erase(identity);
        return result;
    }

    Json encode_object(const Object& object) {
        try {
            if (auto attributes = object.attributes()) {
                Json result = Json::object();
                for (const auto& [name, element] : *attributes) {
                    if ((name.empty() == false) && (name.front() == '_')) {
                        continue;
                    }
                    result[name] = encode(element);
                }
                return result;
            }
            return Json(object.to_string());
        } catch (const std::exception& e) {
            MEMCP_LOG_DEBUG(std::format("Default serializer could not convert {}: {}", object.type_name(), e.what()));
        }
        return Json(nullptr);
    }

    std::string key_text(const Value& key) {
        if (key.is_string()) {
            return key.as_string();
        }
        const Json encoded = encode(key);
        if (encoded.is_string()) {
            return encoded.get<std::string>();
        }
        return dump_text(encoded);
    }

    std::unordered_set<const void*> active_;
};

}  // namespace

Json to_json(const Value& value) {
    StrictEncoder encoder;
    return encoder.encode(value);
}

Json to_json_lenient(const Value& value) {
    LenientEncoder encoder;
    return encoder.encode(value);
}

Json encode_result(const Value& value, std::size_t max_passes) {
    const auto outcome = sanitize_to_fixed_point(value, max_passes);
    try {
        return to_json(outcome.value);
    } catch (const EncodeError& e) {
        MEMCP_LOG_WARN(std::format("JSON encoding failed after {} sanitize passes, using default serializer: {}",
                                   outcome.passes, e.what()));
    }
    return to_json_lenient(outcome.value);
}

std::string dump_text(const Json& json, int indent) {
    return json.dump(indent, ' ', false, Json::error_handler_t::replace);
}

}  // namespace memcp
