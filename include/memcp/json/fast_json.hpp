#pragma once

// ─────────────────────────────────────────────────────────────────────────────
// Fast JSON Parser using simdjson
// ─────────────────────────────────────────────────────────────────────────────
//
// Incoming lines are decoded with simdjson and materialized as
// nlohmann::ordered_json, which the rest of the server manipulates and
// serializes. Object member order is preserved.
//
// USAGE:
//   auto result = memcp::fast_parse(line);
//   if (result.has_value()) {
//       const memcp::Json& message = *result;
//   }
//
// ─────────────────────────────────────────────────────────────────────────────

#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <tl/expected.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace memcp {

using Json = nlohmann::ordered_json;

struct JsonParseError {
    std::string message;

    JsonParseError() = default;
    explicit JsonParseError(std::string msg)
        : message(std::move(msg))
    {}
};

using JsonResult = tl::expected<Json, JsonParseError>;

struct FastJsonConfig {
    // Nesting limit for objects and arrays
    std::size_t max_depth{128};
};

class FastJsonParser {
public:
    FastJsonParser() = default;
    explicit FastJsonParser(FastJsonConfig config) : config_(config) {}

    /// Parses exactly one JSON document. Trailing non-whitespace content is
    /// an error. Scalar documents ("42", "null") are accepted.
    [[nodiscard]] JsonResult parse(std::string_view json_str);

    [[nodiscard]] const FastJsonConfig& config() const noexcept { return config_; }
    void set_config(FastJsonConfig config) noexcept { config_ = config; }

private:
    simdjson::ondemand::parser parser_;
    FastJsonConfig config_;

    [[nodiscard]] JsonResult convert_document(simdjson::ondemand::document& doc);
    [[nodiscard]] JsonResult convert(simdjson::ondemand::value value, std::size_t depth);
    [[nodiscard]] JsonResult convert_object(simdjson::ondemand::object obj, std::size_t depth);
    [[nodiscard]] JsonResult convert_array(simdjson::ondemand::array arr, std::size_t depth);
};

/// Thread-local parser shortcut.
[[nodiscard]] JsonResult fast_parse(std::string_view json_str);

/// Active simdjson kernel ("haswell", "arm64", "fallback", ...).
[[nodiscard]] std::string fast_json_implementation();

}  // namespace memcp
