#pragma once

#include "memcp/value/value.hpp"
#include "memcp/value/sanitizer.hpp"

#include <stdexcept>
#include <string>

namespace memcp {

/// Thrown by to_json() when a value has no direct JSON representation.
class EncodeError final : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Strict encoding of a sanitized value. Throws EncodeError on temporal
/// values, objects, non-string map keys and cycles.
[[nodiscard]] Json to_json(const Value& value);

/// Default serializer: encodes anything. Temporal values become ISO-8601
/// strings, objects their public attributes or text, map keys are
/// stringified, cycles and unconvertible values become null.
[[nodiscard]] Json to_json_lenient(const Value& value);

/// Sanitizes to a fixed point and encodes, falling back to the default
/// serializer if strict encoding still fails. Never throws for Value input.
[[nodiscard]] Json encode_result(const Value& value, std::size_t max_passes = kDefaultMaxSanitizePasses);

/// Text form of a JSON document; invalid UTF-8 is replaced, never thrown.
[[nodiscard]] std::string dump_text(const Json& json, int indent = -1);

}  // namespace memcp
