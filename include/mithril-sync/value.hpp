/// @file value.hpp
/// @brief Value model: Value, Object, Array, Map, Set, kind tags and equality.

#pragma once

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mithril_sync {

/// An absent value (an array hole, an unset slot).
struct Undefined {
    auto operator==(const Undefined&) const -> bool = default;
};

/// Represents a JSON null value.
struct Null {
    auto operator==(const Null&) const -> bool = default;
};

/// Runtime category of a Value.
enum class Kind : std::uint8_t {
    undefined,
    null,
    boolean,
    number,
    string,
    object,  ///< Insertion-ordered field-keyed structure.
    array,   ///< Ordered sequence.
    map,     ///< Insertion-ordered unique-key mapping.
    set,     ///< Insertion-ordered unique-value collection.
};

/// Convert a Kind to its string representation.
constexpr auto to_string_view(Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case Kind::undefined: return "undefined";
        case Kind::null:      return "null";
        case Kind::boolean:   return "boolean";
        case Kind::number:    return "number";
        case Kind::string:    return "string";
        case Kind::object:    return "object";
        case Kind::array:     return "array";
        case Kind::map:       return "map";
        case Kind::set:       return "set";
    }
    return "unknown";
}

/// Parse a kind name produced by to_string_view(Kind).
auto kind_from_string(std::string_view name) -> std::optional<Kind>;

/// True for object, array, map and set.
constexpr auto is_container(Kind kind) noexcept -> bool {
    return kind == Kind::object || kind == Kind::array ||
           kind == Kind::map || kind == Kind::set;
}

class Value;

struct ObjectTag {};
struct MapTag {};

/// Insertion-ordered container of unique string keys.
///
/// Backs both Object and Map; the tag keeps the two kinds distinct.
/// Equality ignores key order.
template <typename Tag>
class KeyedContainer {
public:
    using value_type = std::pair<std::string, Value>;
    using iterator = typename std::vector<value_type>::iterator;
    using const_iterator = typename std::vector<value_type>::const_iterator;

    KeyedContainer() = default;

    /// Later duplicates of a key overwrite the earlier value in place.
    KeyedContainer(std::initializer_list<value_type> init);

    auto find(std::string_view key) -> Value*;
    auto find(std::string_view key) const -> const Value*;
    auto contains(std::string_view key) const -> bool { return find(key) != nullptr; }

    /// Access a field, appending an Undefined one if missing.
    auto operator[](std::string_view key) -> Value&;

    auto insert_or_assign(std::string key, Value value) -> Value&;

    /// @return true if the key existed.
    auto erase(std::string_view key) -> bool;

    auto size() const noexcept -> std::size_t { return fields_.size(); }
    auto empty() const noexcept -> bool { return fields_.empty(); }

    auto begin() noexcept -> iterator { return fields_.begin(); }
    auto end() noexcept -> iterator { return fields_.end(); }
    auto begin() const noexcept -> const_iterator { return fields_.begin(); }
    auto end() const noexcept -> const_iterator { return fields_.end(); }

    auto operator==(const KeyedContainer& other) const -> bool;

private:
    std::vector<value_type> fields_;
};

/// Field-keyed structure.
using Object = KeyedContainer<ObjectTag>;

/// Unique-key mapping.
using Map = KeyedContainer<MapTag>;

/// Ordered sequence.
using Array = std::vector<Value>;

/// Insertion-ordered collection of unique values.
///
/// Elements are addressed by their 0-based enumeration ordinal.
/// Equality ignores element order.
class Set {
public:
    using iterator = std::vector<Value>::iterator;
    using const_iterator = std::vector<Value>::const_iterator;

    Set() = default;
    Set(std::initializer_list<Value> init);

    /// @return false if an equal element is already present.
    auto insert(Value value) -> bool;
    auto contains(const Value& value) const -> bool;
    auto erase(const Value& value) -> bool;
    auto erase_at(std::size_t ordinal) -> bool;

    /// Element at an ordinal for in-place path writes.
    /// Appends an Undefined element when ordinal >= size().
    auto slot(std::size_t ordinal) -> Value&;

    /// Replace the element at an ordinal, or append when ordinal >= size().
    /// If an equal element already lives at another ordinal, the element at
    /// this ordinal is dropped instead so that elements stay unique.
    void assign_at(std::size_t ordinal, Value value);

    auto size() const noexcept -> std::size_t;
    auto empty() const noexcept -> bool;

    auto begin() noexcept -> iterator;
    auto end() noexcept -> iterator;
    auto begin() const noexcept -> const_iterator;
    auto end() const noexcept -> const_iterator;

    auto operator==(const Set& other) const -> bool;

private:
    std::vector<Value> items_;
};

/// A node of a nested structure: a scalar or a container.
///
/// @code
/// auto v = Value{Object{
///     {"user", Object{{"name", "John"}, {"age", 30}}},
///     {"tags", Array{"a", "b"}},
/// }};
/// @endcode
class Value {
public:
    using Storage = std::variant<
        Undefined,
        Null,
        bool,
        std::int64_t,
        double,
        std::string,
        Object,
        Array,
        Map,
        Set
    >;

    Value() = default;
    Value(Undefined) : data_{Undefined{}} {}
    Value(Null) : data_{Null{}} {}
    Value(std::nullptr_t) : data_{Null{}} {}
    Value(bool b) : data_{b} {}

    template <typename T>
        requires std::integral<T> && (!std::same_as<T, bool>)
    Value(T number) : data_{static_cast<std::int64_t>(number)} {}

    template <typename T>
        requires std::floating_point<T>
    Value(T number) : data_{static_cast<double>(number)} {}

    Value(const char* s) : data_{std::string{s}} {}
    Value(std::string s) : data_{std::move(s)} {}
    Value(std::string_view s) : data_{std::string{s}} {}
    Value(Object o) : data_{std::move(o)} {}
    Value(Array a) : data_{std::move(a)} {}
    Value(Map m) : data_{std::move(m)} {}
    Value(Set s) : data_{std::move(s)} {}

    auto kind() const noexcept -> Kind;
    auto is_container() const noexcept -> bool { return mithril_sync::is_container(kind()); }

    auto is_undefined() const noexcept -> bool { return holds<Undefined>(); }
    auto is_null() const noexcept -> bool { return holds<Null>(); }
    auto is_nullish() const noexcept -> bool { return is_null() || is_undefined(); }
    auto is_object() const noexcept -> bool { return holds<Object>(); }
    auto is_array() const noexcept -> bool { return holds<Array>(); }
    auto is_map() const noexcept -> bool { return holds<Map>(); }
    auto is_set() const noexcept -> bool { return holds<Set>(); }
    auto is_string() const noexcept -> bool { return holds<std::string>(); }
    auto is_number() const noexcept -> bool {
        return holds<std::int64_t>() || holds<double>();
    }

    template <typename T>
    auto holds() const noexcept -> bool { return std::holds_alternative<T>(data_); }

    template <typename T>
    auto get_if() noexcept -> T* { return std::get_if<T>(&data_); }

    template <typename T>
    auto get_if() const noexcept -> const T* { return std::get_if<T>(&data_); }

    /// Typed access. Throws std::bad_variant_access on mismatch.
    template <typename T>
    auto as() -> T& { return std::get<T>(data_); }

    template <typename T>
    auto as() const -> const T& { return std::get<T>(data_); }

    auto storage() noexcept -> Storage& { return data_; }
    auto storage() const noexcept -> const Storage& { return data_; }

    /// Exact structural equality (int 1 and double 1.0 differ).
    auto operator==(const Value& other) const -> bool;

    /// An empty container of the given kind; Undefined for scalar kinds.
    static auto empty_of(Kind kind) -> Value;

private:
    Storage data_;
};

// -- Equality -----------------------------------------------------------------

/// Identity-preserving equality: same kind, numbers compared numerically.
auto strict_equals(const Value& a, const Value& b) -> bool;

/// Coercing equality.
///
/// null and undefined equal each other and nothing else; booleans, numbers
/// and strings of different kinds are compared as numbers; containers
/// compare structurally against the same kind only.
auto loose_equals(const Value& a, const Value& b) -> bool;

/// The string form used for matching: numbers in shortest round-trip form,
/// "true"/"false", "null", "undefined", strings verbatim, containers as
/// compact JSON.
auto to_display_string(const Value& value) -> std::string;

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

// -- KeyedContainer -----------------------------------------------------------

template <typename Tag>
KeyedContainer<Tag>::KeyedContainer(std::initializer_list<value_type> init) {
    fields_.reserve(init.size());
    for (const auto& [key, value] : init) {
        insert_or_assign(key, value);
    }
}

template <typename Tag>
auto KeyedContainer<Tag>::find(std::string_view key) -> Value* {
    for (auto& [k, v] : fields_) {
        if (k == key) return &v;
    }
    return nullptr;
}

template <typename Tag>
auto KeyedContainer<Tag>::find(std::string_view key) const -> const Value* {
    for (const auto& [k, v] : fields_) {
        if (k == key) return &v;
    }
    return nullptr;
}

template <typename Tag>
auto KeyedContainer<Tag>::operator[](std::string_view key) -> Value& {
    if (auto* existing = find(key)) return *existing;
    return fields_.emplace_back(std::string{key}, Value{}).second;
}

template <typename Tag>
auto KeyedContainer<Tag>::insert_or_assign(std::string key, Value value) -> Value& {
    if (auto* existing = find(key)) {
        *existing = std::move(value);
        return *existing;
    }
    return fields_.emplace_back(std::move(key), std::move(value)).second;
}

template <typename Tag>
auto KeyedContainer<Tag>::erase(std::string_view key) -> bool {
    for (auto it = fields_.begin(); it != fields_.end(); ++it) {
        if (it->first == key) {
            fields_.erase(it);
            return true;
        }
    }
    return false;
}

template <typename Tag>
auto KeyedContainer<Tag>::operator==(const KeyedContainer& other) const -> bool {
    if (fields_.size() != other.fields_.size()) return false;
    for (const auto& [key, value] : fields_) {
        const auto* theirs = other.find(key);
        if (!theirs || !(*theirs == value)) return false;
    }
    return true;
}

// -- Set (inline accessors) ---------------------------------------------------

inline auto Set::size() const noexcept -> std::size_t { return items_.size(); }
inline auto Set::empty() const noexcept -> bool { return items_.empty(); }
inline auto Set::begin() noexcept -> iterator { return items_.begin(); }
inline auto Set::end() noexcept -> iterator { return items_.end(); }
inline auto Set::begin() const noexcept -> const_iterator { return items_.begin(); }
inline auto Set::end() const noexcept -> const_iterator { return items_.end(); }

}  // namespace mithril_sync
