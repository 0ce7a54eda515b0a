#include <mithril-sync/value.hpp>
#include <mithril-sync/json.hpp>

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <string>

namespace mithril_sync {

namespace {

constexpr auto all_kinds = std::array{
    Kind::undefined, Kind::null, Kind::boolean, Kind::number, Kind::string,
    Kind::object, Kind::array, Kind::map, Kind::set,
};

auto number_of(const Value& v) -> double {
    if (const auto* i = v.get_if<std::int64_t>()) return static_cast<double>(*i);
    return v.as<double>();
}

auto is_space(char c) -> bool {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

// Numeric coercion of a boolean, number or string. Blank strings are 0,
// unparseable strings NaN.
auto coerce_to_number(const Value& v) -> double {
    if (const auto* b = v.get_if<bool>()) return *b ? 1.0 : 0.0;
    if (v.is_number()) return number_of(v);

    const auto& s = v.as<std::string>();
    auto first = s.find_first_not_of(" \t\n\r\f\v");
    if (first == std::string::npos) return 0.0;
    auto last = s.size();
    while (last > first && is_space(s[last - 1])) --last;

    auto text = std::string_view{s}.substr(first, last - first);
    if (text == "Infinity" || text == "+Infinity") return std::numeric_limits<double>::infinity();
    if (text == "-Infinity") return -std::numeric_limits<double>::infinity();
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);

    auto result = 0.0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), result);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::numeric_limits<double>::quiet_NaN();
    }
    return result;
}

auto format_double(double d) -> std::string {
    if (std::isnan(d)) return "NaN";
    if (std::isinf(d)) return d > 0 ? "Infinity" : "-Infinity";
    auto buf = std::array<char, 64>{};
    auto [ptr, ec] = std::to_chars(buf.data(), buf.data() + buf.size(), d);
    if (ec != std::errc{}) return std::to_string(d);
    return std::string{buf.data(), ptr};
}

}  // anonymous namespace

auto kind_from_string(std::string_view name) -> std::optional<Kind> {
    for (auto kind : all_kinds) {
        if (to_string_view(kind) == name) return kind;
    }
    return std::nullopt;
}

// -- Set ----------------------------------------------------------------------

Set::Set(std::initializer_list<Value> init) {
    items_.reserve(init.size());
    for (const auto& v : init) insert(v);
}

auto Set::insert(Value value) -> bool {
    if (contains(value)) return false;
    items_.push_back(std::move(value));
    return true;
}

auto Set::contains(const Value& value) const -> bool {
    return std::ranges::find(items_, value) != items_.end();
}

auto Set::erase(const Value& value) -> bool {
    auto it = std::ranges::find(items_, value);
    if (it == items_.end()) return false;
    items_.erase(it);
    return true;
}

auto Set::erase_at(std::size_t ordinal) -> bool {
    if (ordinal >= items_.size()) return false;
    items_.erase(items_.begin() + static_cast<std::ptrdiff_t>(ordinal));
    return true;
}

auto Set::slot(std::size_t ordinal) -> Value& {
    if (ordinal < items_.size()) return items_[ordinal];
    return items_.emplace_back();
}

void Set::assign_at(std::size_t ordinal, Value value) {
    auto existing = std::ranges::find(items_, value);
    if (existing != items_.end()) {
        auto at = static_cast<std::size_t>(existing - items_.begin());
        if (at != ordinal) erase_at(ordinal);
        return;
    }
    if (ordinal < items_.size()) {
        items_[ordinal] = std::move(value);
    } else {
        items_.push_back(std::move(value));
    }
}

auto Set::operator==(const Set& other) const -> bool {
    if (items_.size() != other.items_.size()) return false;
    return std::ranges::all_of(items_, [&](const Value& v) { return other.contains(v); });
}

// -- Value --------------------------------------------------------------------

auto Value::kind() const noexcept -> Kind {
    return std::visit(overload{
        [](Undefined) { return Kind::undefined; },
        [](Null) { return Kind::null; },
        [](bool) { return Kind::boolean; },
        [](std::int64_t) { return Kind::number; },
        [](double) { return Kind::number; },
        [](const std::string&) { return Kind::string; },
        [](const Object&) { return Kind::object; },
        [](const Array&) { return Kind::array; },
        [](const Map&) { return Kind::map; },
        [](const Set&) { return Kind::set; },
    }, data_);
}

auto Value::operator==(const Value& other) const -> bool {
    return data_ == other.data_;
}

auto Value::empty_of(Kind kind) -> Value {
    switch (kind) {
        case Kind::object: return Object{};
        case Kind::array:  return Array{};
        case Kind::map:    return Map{};
        case Kind::set:    return Set{};
        default:           return Value{};
    }
}

// -- Equality -----------------------------------------------------------------

auto strict_equals(const Value& a, const Value& b) -> bool {
    if (a.is_number() && b.is_number()) {
        if (a.holds<std::int64_t>() && b.holds<std::int64_t>()) {
            return a.as<std::int64_t>() == b.as<std::int64_t>();
        }
        return number_of(a) == number_of(b);
    }
    return a == b;
}

auto loose_equals(const Value& a, const Value& b) -> bool {
    if (a.is_nullish() || b.is_nullish()) {
        return a.is_nullish() && b.is_nullish();
    }
    if (a.kind() == b.kind()) return strict_equals(a, b);
    if (a.is_container() || b.is_container()) return false;
    return coerce_to_number(a) == coerce_to_number(b);
}

auto to_display_string(const Value& value) -> std::string {
    return std::visit(overload{
        [](Undefined) -> std::string { return "undefined"; },
        [](Null) -> std::string { return "null"; },
        [](bool b) -> std::string { return b ? "true" : "false"; },
        [](std::int64_t i) -> std::string { return std::to_string(i); },
        [](double d) -> std::string { return format_double(d); },
        [](const std::string& s) -> std::string { return s; },
        [&](const auto&) -> std::string { return json::dump(value); },
    }, value.storage());
}

}  // namespace mithril_sync
