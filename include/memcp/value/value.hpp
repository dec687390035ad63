#ifndef MEMCP_VALUE_VALUE_HPP
#define MEMCP_VALUE_VALUE_HPP

// ═══════════════════════════════════════════════════════════════════════════
// Value - dynamic result graph
// ═══════════════════════════════════════════════════════════════════════════
// The memory engine answers with Value graphs rather than JSON. Compound
// nodes (list, tuple, map, object) are shared by reference, so the same node
// may appear in several places and a node may (directly or indirectly)
// contain itself. Copying a Value copies the reference, not the node.
//
// Scalars: null, bool, signed/unsigned 64-bit integer, double, string,
// Timestamp, Date.
// Compounds: List, Tuple (fixed-length sequence), Map (insertion-ordered,
// keys are arbitrary Values until sanitized), Object (opaque engine type).

#include <nlohmann/json.hpp>

#include <chrono>
#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace memcp {

using Json = nlohmann::ordered_json;
using Timestamp = std::chrono::system_clock::time_point;
using Date = std::chrono::year_month_day;

class Value;
class Object;

using ValueList = std::vector<Value>;
using MapEntry = std::pair<Value, Value>;
using ValueMap = std::vector<MapEntry>;

namespace detail {
struct ListNode;
struct TupleNode;
struct MapNode;
}  // namespace detail

// Order matches the storage variant alternatives.
enum class ValueKind : std::uint8_t {
    Null,
    Bool,
    Integer,
    Unsigned,
    Float,
    String,
    Timestamp,
    Date,
    List,
    Tuple,
    Map,
    Object
};

[[nodiscard]] constexpr std::string_view to_string(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null:      return "null";
        case ValueKind::Bool:      return "bool";
        case ValueKind::Integer:   return "integer";
        case ValueKind::Unsigned:  return "unsigned";
        case ValueKind::Float:     return "float";
        case ValueKind::String:    return "string";
        case ValueKind::Timestamp: return "timestamp";
        case ValueKind::Date:      return "date";
        case ValueKind::List:      return "list";
        case ValueKind::Tuple:     return "tuple";
        case ValueKind::Map:       return "map";
        case ValueKind::Object:    return "object";
    }
    return "unknown";
}

class Value {
public:
    Value() noexcept = default;
    Value(std::nullptr_t) noexcept {}
    Value(bool value) : storage_(value) {}

    template <std::signed_integral T>
        requires (!std::same_as<T, bool>)
    Value(T value) : storage_(static_cast<std::int64_t>(value)) {}

    template <std::unsigned_integral T>
        requires (!std::same_as<T, bool>)
    Value(T value) : storage_(static_cast<std::uint64_t>(value)) {}

    Value(double value) : storage_(value) {}
    Value(const char* value) : storage_(std::string(value)) {}
    Value(std::string value) : storage_(std::move(value)) {}
    Value(Timestamp value) : storage_(value) {}
    Value(Date value) : storage_(value) {}

    template <std::derived_from<Object> T>
    Value(std::shared_ptr<T> object) : storage_(std::shared_ptr<Object>(std::move(object))) {}

    // ─────────────────────────────────────────────────────────────────────────
    // Compound factories (each call creates a fresh node)
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] static Value list(ValueList items = {});
    [[nodiscard]] static Value tuple(ValueList items = {});
    [[nodiscard]] static Value map(ValueMap entries = {});

    /// Structural conversion; objects keep their key order.
    [[nodiscard]] static Value from_json(const Json& json);

    // ─────────────────────────────────────────────────────────────────────────
    // Observers
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] ValueKind kind() const noexcept {
        return static_cast<ValueKind>(storage_.index());
    }

    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
    [[nodiscard]] bool is_list() const noexcept { return kind() == ValueKind::List; }
    [[nodiscard]] bool is_tuple() const noexcept { return kind() == ValueKind::Tuple; }
    [[nodiscard]] bool is_map() const noexcept { return kind() == ValueKind::Map; }
    [[nodiscard]] bool is_object() const noexcept { return kind() == ValueKind::Object; }

    [[nodiscard]] bool is_number() const noexcept {
        const auto k = kind();
        return k == ValueKind::Integer || k == ValueKind::Unsigned || k == ValueKind::Float;
    }

    [[nodiscard]] bool is_temporal() const noexcept {
        const auto k = kind();
        return k == ValueKind::Timestamp || k == ValueKind::Date;
    }

    [[nodiscard]] bool is_sequence() const noexcept { return is_list() || is_tuple(); }

    [[nodiscard]] bool is_compound() const noexcept {
        return is_sequence() || is_map() || is_object();
    }

    /// Address of the shared node; nullptr for scalars.
    [[nodiscard]] const void* identity() const noexcept;

    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] std::int64_t as_int() const;
    [[nodiscard]] std::uint64_t as_unsigned() const;
    [[nodiscard]] double as_double() const;  // any numeric kind
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] Timestamp as_timestamp() const;
    [[nodiscard]] Date as_date() const;
    [[nodiscard]] const std::shared_ptr<Object>& as_object() const;

    /// Elements of a list or tuple.
    [[nodiscard]] ValueList& items();
    [[nodiscard]] const ValueList& items() const;

    /// Entries of a map.
    [[nodiscard]] ValueMap& entries();
    [[nodiscard]] const ValueMap& entries() const;

    [[nodiscard]] std::size_t size() const;

    /// Map lookup by string key; nullptr when absent or not a map.
    [[nodiscard]] const Value* find(std::string_view key) const;

    /// Replaces the entry with an equal key or appends a new one.
    void set(Value key, Value value);

    void push_back(Value value);

    /// Deep structural comparison. Objects compare by identity. Not meant
    /// for graphs that contain cycles.
    friend bool operator==(const Value& lhs, const Value& rhs);

private:
    using Storage = std::variant<
        std::monostate,
        bool,
        std::int64_t,
        std::uint64_t,
        double,
        std::string,
        Timestamp,
        Date,
        std::shared_ptr<detail::ListNode>,
        std::shared_ptr<detail::TupleNode>,
        std::shared_ptr<detail::MapNode>,
        std::shared_ptr<Object>>;

    Storage storage_;
};

namespace detail {
struct ListNode {
    ValueList items;
};

struct TupleNode {
    ValueList items;
};

struct MapNode {
    ValueMap entries;
};
}  // namespace detail

// ═══════════════════════════════════════════════════════════════════════════
// Object - opaque engine type
// ═══════════════════════════════════════════════════════════════════════════
// Engine types expose whichever conversion capabilities they support. The
// sanitizer tries them in order: structured dump, attribute dictionary,
// generic mapping, textual form.

enum class DumpMode : std::uint8_t {
    Json,    // Prefer JSON-friendly leaves
    Native   // Leaves in their natural types
};

class Object {
public:
    virtual ~Object() = default;

    [[nodiscard]] virtual std::string type_name() const = 0;

    /// Structured dump (schema-object pattern). nullopt when the type has no
    /// dump capability; throws when the requested mode fails.
    [[nodiscard]] virtual std::optional<Value> dump(DumpMode mode) const;

    /// Attribute dictionary, private (underscore-prefixed) names included.
    [[nodiscard]] virtual std::optional<std::vector<std::pair<std::string, Value>>> attributes() const;

    /// Generic conversion to a mapping.
    [[nodiscard]] virtual std::optional<Value> to_mapping() const;

    /// Textual form. May throw.
    [[nodiscard]] virtual std::string to_string() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// ISO-8601 formatting
// ─────────────────────────────────────────────────────────────────────────────

/// "2024-05-01T12:30:45+00:00", with ".ffffff" when sub-second is non-zero.
[[nodiscard]] std::string to_iso8601(Timestamp timestamp);

/// "2024-05-01"
[[nodiscard]] std::string to_iso8601(Date date);

}  // namespace memcp

#endif  // MEMCP_VALUE_VALUE_HPP
