#include "memcp/json/fast_json.hpp"

#include <cctype>

namespace memcp {
namespace {

tl::unexpected<JsonParseError> fail(simdjson::error_code code) {
    return tl::unexpected(JsonParseError(std::string(simdjson::error_message(code))));
}

// Valid JSON numbers that simdjson cannot hold: integers wider than 64 bits
// and magnitudes beyond a double. nlohmann re-reads the token, widening big
// integers to double; a number that overflows even that is kept as its text.
template <typename Node>
JsonResult convert_wide_number(Node& node) {
    simdjson::simdjson_result<std::string_view> token = node.raw_json_token();
    if (token.error() != simdjson::SUCCESS) {
        return fail(token.error());
    }

    std::string text(token.value());
    while (text.empty() == false && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }

    try {
        return Json::parse(text);
    } catch (const Json::out_of_range&) {
        return Json(text);
    } catch (const Json::parse_error&) {
        return tl::unexpected(JsonParseError("Invalid number: " + text));
    }
}

// Shared by values and root-level (scalar) documents, which simdjson exposes
// through different types with the same getters.
template <typename Node>
JsonResult convert_scalar(Node& node, simdjson::ondemand::json_type type) {
    switch (type) {
        case simdjson::ondemand::json_type::string: {
            auto str = node.get_string();
            if (str.error() != simdjson::SUCCESS) {
                return fail(str.error());
            }
            return Json(std::string(str.value()));
        }

        case simdjson::ondemand::json_type::number: {
            auto number = node.get_number();
            const auto error = number.error();
            if ((error == simdjson::BIGINT_ERROR) || (error == simdjson::NUMBER_ERROR)
                || (error == simdjson::NUMBER_OUT_OF_RANGE)) {
                return convert_wide_number(node);
            }
            if (error != simdjson::SUCCESS) {
                return fail(number.error());
            }
            simdjson::ondemand::number n = number.value();
            switch (n.get_number_type()) {
                case simdjson::ondemand::number_type::signed_integer:
                    return Json(n.get_int64());
                case simdjson::ondemand::number_type::unsigned_integer:
                    return Json(n.get_uint64());
                default:
                    return Json(n.get_double());
            }
        }

        case simdjson::ondemand::json_type::boolean: {
            auto flag = node.get_bool();
            if (flag.error() != simdjson::SUCCESS) {
                return fail(flag.error());
            }
            return Json(flag.value());
        }

        case simdjson::ondemand::json_type::null: {
            auto is_null = node.is_null();
            if (is_null.error() != simdjson::SUCCESS) {
                return fail(is_null.error());
            }
            if (is_null.value() == false) {
                return tl::unexpected(JsonParseError("Invalid null literal"));
            }
            return Json(nullptr);
        }

        default:
            break;
    }
    return tl::unexpected(JsonParseError("Unknown JSON type"));
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// FastJsonParser Implementation
// ─────────────────────────────────────────────────────────────────────────────

JsonResult FastJsonParser::parse(std::string_view json_str) {
    // simdjson reads past the end of its input and requires padding
    simdjson::padded_string padded(json_str);

    auto doc_result = parser_.iterate(padded);
    if (doc_result.error() != simdjson::SUCCESS) {
        return fail(doc_result.error());
    }

    try {
        auto doc = std::move(doc_result).value();
        return convert_document(doc);
    } catch (const simdjson::simdjson_error& e) {
        return tl::unexpected(JsonParseError(e.what()));
    }
}

JsonResult FastJsonParser::convert_document(simdjson::ondemand::document& doc) {
    auto type_result = doc.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return fail(type_result.error());
    }

    const auto type = type_result.value();
    const bool is_container = (type == simdjson::ondemand::json_type::object)
                           || (type == simdjson::ondemand::json_type::array);
    if (is_container == false) {
        // Root scalar getters reject trailing content themselves
        return convert_scalar(doc, type);
    }

    auto value = doc.get_value();
    if (value.error() != simdjson::SUCCESS) {
        return fail(value.error());
    }

    auto converted = convert(value.value(), 0);
    if (!converted) {
        return converted;
    }

    if (doc.at_end() == false) {
        return tl::unexpected(JsonParseError("Trailing content after JSON document"));
    }
    return converted;
}

JsonResult FastJsonParser::convert(simdjson::ondemand::value value, std::size_t depth) {
    if (depth > config_.max_depth) {
        return tl::unexpected(JsonParseError(
            "Maximum nesting depth exceeded (" + std::to_string(config_.max_depth) + ")"
        ));
    }

    auto type_result = value.type();
    if (type_result.error() != simdjson::SUCCESS) {
        return fail(type_result.error());
    }

    switch (type_result.value()) {
        case simdjson::ondemand::json_type::object: {
            auto obj = value.get_object();
            if (obj.error() != simdjson::SUCCESS) {
                return fail(obj.error());
            }
            return convert_object(obj.value(), depth + 1);
        }

        case simdjson::ondemand::json_type::array: {
            auto arr = value.get_array();
            if (arr.error() != simdjson::SUCCESS) {
                return fail(arr.error());
            }
            return convert_array(arr.value(), depth + 1);
        }

        default:
            return convert_scalar(value, type_result.value());
    }
}

JsonResult FastJsonParser::convert_object(simdjson::ondemand::object obj, std::size_t depth) {
    Json result = Json::object();

    for (auto field : obj) {
        auto key_result = field.unescaped_key();
        const bool key_ok = (key_result.error() == simdjson::SUCCESS);
        if (key_ok == false) {
            return fail(key_result.error());
        }

        auto val_result = field.value();
        const bool val_ok = (val_result.error() == simdjson::SUCCESS);
        if (val_ok == false) {
            return fail(val_result.error());
        }

        std::string key(key_result.value());
        auto converted = convert(val_result.value(), depth);
        if (!converted) {
            return converted;
        }
        // Duplicate keys: last one wins
        result[key] = std::move(*converted);
    }

    return result;
}

JsonResult FastJsonParser::convert_array(simdjson::ondemand::array arr, std::size_t depth) {
    Json result = Json::array();

    for (auto element : arr) {
        if (element.error() != simdjson::SUCCESS) {
            return fail(element.error());
        }

        auto converted = convert(element.value(), depth);
        if (!converted) {
            return converted;
        }
        result.push_back(std::move(*converted));
    }

    return result;
}

// ─────────────────────────────────────────────────────────────────────────────
// Convenience Functions
// ─────────────────────────────────────────────────────────────────────────────

JsonResult fast_parse(std::string_view json_str) {
    thread_local FastJsonParser parser;
    return parser.parse(json_str);
}

std::string fast_json_implementation() {
    const simdjson::implementation* impl = simdjson::get_active_implementation();
    return std::string(impl->name());
}

}  // namespace memcp
