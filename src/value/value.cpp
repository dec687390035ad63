#include "memcp/value/value.hpp"

#include <cmath>
#include <format>
#include <stdexcept>

namespace memcp {
namespace {

[[noreturn]] void throw_kind_mismatch(std::string_view expected, ValueKind actual) {
    throw std::logic_error(
        std::format("Value is {}, expected {}", to_string(actual), expected));
}

bool same_double(double lhs, double rhs) noexcept {
    // NaN compares equal to itself so that repeated sanitizing is stable
    const bool both_nan = std::isnan(lhs) && std::isnan(rhs);
    return both_nan || (lhs == rhs);
}

bool equal_sequences(const ValueList& lhs, const ValueList& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        if (!(lhs[i] == rhs[i])) {
            return false;
        }
    }
    return true;
}

bool equal_maps(const ValueMap& lhs, const ValueMap& rhs) {
    if (lhs.size() != rhs.size()) {
        return false;
    }
    for (std::size_t i = 0; i < lhs.size(); ++i) {
        const bool same_entry = (lhs[i].first == rhs[i].first) && (lhs[i].second == rhs[i].second);
        if (same_entry == false) {
            return false;
        }
    }
    return true;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Factories
// ─────────────────────────────────────────────────────────────────────────────

Value Value::list(ValueList items) {
    Value value;
    value.storage_ = std::make_shared<detail::ListNode>(detail::ListNode{std::move(items)});
    return value;
}

Value Value::tuple(ValueList items) {
    Value value;
    value.storage_ = std::make_shared<detail::TupleNode>(detail::TupleNode{std::move(items)});
    return value;
}

Value Value::map(ValueMap entries) {
    Value value;
    value.storage_ = std::make_shared<detail::MapNode>(detail::MapNode{std::move(entries)});
    return value;
}

Value Value::from_json(const Json& json) {
    switch (json.type()) {
        case Json::value_t::null:
        case Json::value_t::discarded:
            return Value{};
        case Json::value_t::boolean:
            return Value{json.get<bool>()};
        case Json::value_t::number_integer:
            return Value{json.get<std::int64_t>()};
        case Json::value_t::number_unsigned:
            return Value{json.get<std::uint64_t>()};
        case Json::value_t::number_float:
            return Value{json.get<double>()};
        case Json::value_t::string:
            return Value{json.get<std::string>()};
        case Json::value_t::binary: {
            ValueList bytes;
            for (const auto byte : json.get_binary()) {
                bytes.emplace_back(static_cast<std::uint64_t>(byte));
            }
            return Value::list(std::move(bytes));
        }
        case Json::value_t::array: {
            ValueList items;
            items.reserve(json.size());
            for (const auto& element : json) {
                items.push_back(from_json(element));
            }
            return Value::list(std::move(items));
        }
        case Json::value_t::object: {
            ValueMap entries;
            entries.reserve(json.size());
            for (const auto& [key, element] : json.items()) {
                entries.emplace_back(Value{key}, from_json(element));
            }
            return Value::map(std::move(entries));
        }
    }
    return Value{};
}

// ─────────────────────────────────────────────────────────────────────────────
// Observers
// ─────────────────────────────────────────────────────────────────────────────

const void* Value::identity() const noexcept {
    switch (kind()) {
        case ValueKind::List:
            return std::get<std::shared_ptr<detail::ListNode>>(storage_).get();
        case ValueKind::Tuple:
            return std::get<std::shared_ptr<detail::TupleNode>>(storage_).get();
        case ValueKind::Map:
            return std::get<std::shared_ptr<detail::MapNode>>(storage_).get();
        case ValueKind::Object:
            return std::get<std::shared_ptr<Object>>(storage_).get();
        default:
            return nullptr;
    }
}

bool Value::as_bool() const {
    if (!is_bool()) {
        throw_kind_mismatch("bool", kind());
    }
    return std::get<bool>(storage_);
}

std::int64_t Value::as_int() const {
    if (kind() != ValueKind::Integer) {
        throw_kind_mismatch("integer", kind());
    }
    return std::get<std::int64_t>(storage_);
}

std::uint64_t Value::as_unsigned() const {
    if (kind() != ValueKind::Unsigned) {
        throw_kind_mismatch("unsigned", kind());
    }
    return std::get<std::uint64_t>(storage_);
}

double Value::as_double() const {
    switch (kind()) {
        case ValueKind::Integer:  return static_cast<double>(std::get<std::int64_t>(storage_));
        case ValueKind::Unsigned: return static_cast<double>(std::get<std::uint64_t>(storage_));
        case ValueKind::Float:    return std::get<double>(storage_);
        default:
            throw_kind_mismatch("number", kind());
    }
}

const std::string& Value::as_string() const {
    if (!is_string()) {
        throw_kind_mismatch("string", kind());
    }
    return std::get<std::string>(storage_);
}

Timestamp Value::as_timestamp() const {
    if (kind() != ValueKind::Timestamp) {
        throw_kind_mismatch("timestamp", kind());
    }
    return std::get<Timestamp>(storage_);
}

Date Value::as_date() const {
    if (kind() != ValueKind::Date) {
        throw_kind_mismatch("date", kind());
    }
    return std::get<Date>(storage_);
}

const std::shared_ptr<Object>& Value::as_object() const {
    if (!is_object()) {
        throw_kind_mismatch("object", kind());
    }
    return std::get<std::shared_ptr<Object>>(storage_);
}

ValueList& Value::items() {
    if (is_list()) {
        return std::get<std::shared_ptr<detail::ListNode>>(storage_)->items;
    }
    if (is_tuple()) {
        return std::get<std::shared_ptr<detail::TupleNode>>(storage_)->items;
    }
    throw_kind_mismatch("list or tuple", kind());
}

const ValueList& Value::items() const {
    return const_cast<Value*>(this)->items();
}

ValueMap& Value::entries() {
    if (!is_map()) {
        throw_kind_mismatch("map", kind());
    }
    return std::get<std::shared_ptr<detail::MapNode>>(storage_)->entries;
}

const ValueMap& Value::entries() const {
    return const_cast<Value*>(this)->entries();
}

std::size_t Value::size() const {
    if (is_sequence()) {
        return items().size();
    }
    if (is_map()) {
        return entries().size();
    }
    return 0;
}

const Value* Value::find(std::string_view key) const {
    if (!is_map()) {
        return nullptr;
    }
    for (const auto& [entry_key, entry_value] : entries()) {
        if (entry_key.is_string() && entry_key.as_string() == key) {
            return &entry_value;
        }
    }
    return nullptr;
}

void Value::set(Value key, Value value) {
    auto& map_entries = entries();
    for (auto& entry : map_entries) {
        if (entry.first == key) {
            entry.second = std::move(value);
            return;
        }
    }
    map_entries.emplace_back(std::move(key), std::move(value));
}

void Value::push_back(Value value) {
    items().push_back(std::move(value));
}

bool operator==(const Value& lhs, const Value& rhs) {
    if (lhs.kind() != rhs.kind()) {
        return false;
    }
    switch (lhs.kind()) {
        case ValueKind::Float:
            return same_double(std::get<double>(lhs.storage_), std::get<double>(rhs.storage_));
        case ValueKind::List:
        case ValueKind::Tuple:
            return (lhs.identity() == rhs.identity()) || equal_sequences(lhs.items(), rhs.items());
        case ValueKind::Map:
            return (lhs.identity() == rhs.identity()) || equal_maps(lhs.entries(), rhs.entries());
        case ValueKind::Object:
            return lhs.identity() == rhs.identity();
        default:
            return lhs.storage_ == rhs.storage_;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Object defaults
// ─────────────────────────────────────────────────────────────────────────────

std::optional<Value> Object::dump(DumpMode /*mode*/) const {
    return std::nullopt;
}

std::optional<std::vector<std::pair<std::string, Value>>> Object::attributes() const {
    return std::nullopt;
}

std::optional<Value> Object::to_mapping() const {
    return std::nullopt;
}

std::string Object::to_string() const {
    return "<" + type_name() + ">";
}

// ─────────────────────────────────────────────────────────────────────────────
// ISO-8601
// ─────────────────────────────────────────────────────────────────────────────

std::string to_iso8601(Timestamp timestamp) {
    using namespace std::chrono;

    const auto day_start = floor<days>(timestamp);
    const year_month_day ymd{day_start};
    const hh_mm_ss time_of_day{floor<microseconds>(timestamp - day_start)};

    std::string text = std::format(
        "{:04}-{:02}-{:02}T{:02}:{:02}:{:02}",
        static_cast<int>(ymd.year()),
        static_cast<unsigned>(ymd.month()),
        static_cast<unsigned>(ymd.day()),
        time_of_day.hours().count(),
        time_of_day.minutes().count(),
        time_of_day.seconds().count());

    const auto micros = time_of_day.subseconds().count();
    if (micros != 0) {
        text += std::format(".{:06}", micros);
    }
    text += "+00:00";
    return text;
}

std::string to_iso8601(Date date) {
    return std::format(
        "{:04}-{:02}-{:02}",
        static_cast<int>(date.year()),
        static_cast<unsigned>(date.month()),
        static_cast<unsigned>(date.day()));
}

}  // namespace memcp
