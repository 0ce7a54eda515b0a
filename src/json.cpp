#include <mithril-sync/json.hpp>
#include <mithril-sync/error.hpp>

#include <algorithm>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace mithril_sync {

// =============================================================================
// Shared helpers
// =============================================================================

namespace {

constexpr auto type_tag = "__type";

auto invalid_json(const std::string& what) -> SyncError {
    return SyncError{ErrorKind::invalid_json, what};
}

// Serialize a Value into either json flavour. With `sorted`, Map pairs and
// Set elements are emitted in a stable order (object keys of
// nlohmann::json are sorted already).
template <typename J>
auto value_to(const Value& value, bool sorted) -> J {
    return std::visit(overload{
        [](Undefined) -> J { return J{{type_tag, "undefined"}, {"value", nullptr}}; },
        [](Null) -> J { return nullptr; },
        [](bool b) -> J { return b; },
        [](std::int64_t i) -> J { return i; },
        [](double d) -> J { return d; },
        [](const std::string& s) -> J { return s; },
        [&](const Object& o) -> J {
            auto j = J::object();
            for (const auto& [key, child] : o) {
                j[key] = value_to<J>(child, sorted);
            }
            return j;
        },
        [&](const Array& a) -> J {
            auto j = J::array();
            for (const auto& child : a) {
                j.push_back(value_to<J>(child, sorted));
            }
            return j;
        },
        [&](const Map& m) -> J {
            auto pairs = std::vector<std::pair<std::string, J>>{};
            for (const auto& [key, child] : m) {
                pairs.emplace_back(key, value_to<J>(child, sorted));
            }
            if (sorted) {
                std::ranges::sort(pairs, {}, &std::pair<std::string, J>::first);
            }
            auto j = J::array();
            for (auto& [key, child] : pairs) {
                j.push_back(J::array({J(key), std::move(child)}));
            }
            return J{{type_tag, "map"}, {"value", std::move(j)}};
        },
        [&](const Set& s) -> J {
            auto items = std::vector<J>{};
            for (const auto& child : s) {
                items.push_back(value_to<J>(child, sorted));
            }
            if (sorted) {
                std::ranges::sort(items, {}, [](const J& item) { return item.dump(); });
            }
            return J{{type_tag, "set"}, {"value", J(std::move(items))}};
        },
    }, value.storage());
}

template <typename J>
auto value_from(const J& j) -> Value {
    switch (j.type()) {
        case J::value_t::null:
            return Null{};
        case J::value_t::boolean:
            return j.template get<bool>();
        case J::value_t::number_integer:
            return j.template get<std::int64_t>();
        case J::value_t::number_unsigned: {
            auto u = j.template get<std::uint64_t>();
            if (u <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
                return static_cast<std::int64_t>(u);
            }
            return static_cast<double>(u);
        }
        case J::value_t::number_float:
            return j.template get<double>();
        case J::value_t::string:
            return j.template get<std::string>();
        case J::value_t::array: {
            auto a = Array{};
            a.reserve(j.size());
            for (const auto& item : j) a.push_back(value_from(item));
            return a;
        }
        case J::value_t::object:
            break;
        default:
            throw invalid_json("unsupported JSON value type: " + std::string{j.type_name()});
    }

    // Check for tagged types first
    if (auto tag = j.find(type_tag); tag != j.end() && tag->is_string()) {
        const auto& type = tag->template get_ref<const std::string&>();
        if (type == "undefined") return Undefined{};
        if (type == "map" || type == "set") {
            auto payload = j.find("value");
            if (payload == j.end() || !payload->is_array()) {
                throw invalid_json("tagged " + type + " needs an array value");
            }
            if (type == "set") {
                auto s = Set{};
                for (const auto& item : *payload) s.insert(value_from(item));
                return s;
            }
            auto m = Map{};
            for (const auto& pair : *payload) {
                if (!pair.is_array() || pair.size() != 2 || !pair[0].is_string()) {
                    throw invalid_json("map entries must be [key, value] pairs");
                }
                m.insert_or_assign(pair[0].template get<std::string>(), value_from(pair[1]));
            }
            return m;
        }
    }

    auto o = Object{};
    for (const auto& [key, item] : j.items()) {
        o.insert_or_assign(key, value_from(item));
    }
    return o;
}

// Read the first of the given keys present in j into out.
template <typename T>
void read_key(const nlohmann::json& j, std::initializer_list<const char*> keys, T& out) {
    for (const auto* key : keys) {
        if (auto it = j.find(key); it != j.end()) {
            out = it->get<T>();
            return;
        }
    }
}

auto flatten_mode_from_string(std::string_view name) -> FlattenMode {
    if (name == "leaves") return FlattenMode::leaves;
    if (name == "with_containers" || name == "withContainers") {
        return FlattenMode::with_containers;
    }
    throw invalid_json("unknown flatten mode: " + std::string{name});
}

// Run a conversion, reporting nlohmann's own exceptions as invalid_json.
template <typename F>
void converting(std::string_view what, F&& body) {
    try {
        body();
    } catch (const nlohmann::json::exception& e) {
        throw invalid_json(std::string{what} + ": " + e.what());
    }
}

void require_object(const nlohmann::json& j, std::string_view what) {
    if (!j.is_object()) {
        throw invalid_json(std::string{what} + " must be a JSON object");
    }
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value --------------------------------------------------------------------

void to_json(nlohmann::json& j, const Value& v) {
    j = value_to<nlohmann::json>(v, false);
}

void from_json(const nlohmann::json& j, Value& v) {
    v = value_from(j);
}

void to_json(nlohmann::ordered_json& j, const Value& v) {
    j = value_to<nlohmann::ordered_json>(v, false);
}

void from_json(const nlohmann::ordered_json& j, Value& v) {
    v = value_from(j);
}

// -- Paths --------------------------------------------------------------------

auto step_to_json(const Step& step) -> nlohmann::json {
    return std::visit(overload{
        [](const std::string& key) -> nlohmann::json { return key; },
        [](std::size_t index) -> nlohmann::json { return index; },
    }, step);
}

auto step_from_json(const nlohmann::json& j) -> Step {
    if (j.is_string()) return key_step(j.get<std::string>());
    if (j.is_number_unsigned()) return index_step(j.get<std::size_t>());
    if (j.is_number_integer() && j.get<std::int64_t>() >= 0) {
        return index_step(static_cast<std::size_t>(j.get<std::int64_t>()));
    }
    throw invalid_json("path step must be a string or a non-negative integer");
}

auto path_to_json(const Path& path) -> nlohmann::json {
    auto j = nlohmann::json::array();
    for (const auto& step : path) j.push_back(step_to_json(step));
    return j;
}

auto path_from_json(const nlohmann::json& j) -> Path {
    if (!j.is_array()) throw invalid_json("path must be a JSON array");
    auto path = Path{};
    path.reserve(j.size());
    for (const auto& step : j) path.push_back(step_from_json(step));
    return path;
}

// -- Records ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Entry& e) {
    j = nlohmann::json{
        {"path", path_to_json(e.path)},
        {"dotPath", e.dot_path},
        {"key", step_to_json(e.key)},
        {"value", e.value},
        {"kind", std::string{to_string_view(e.kind)}},
    };
}

void from_json(const nlohmann::json& j, Entry& e) {
    require_object(j, "entry");
    converting("entry", [&] {
        auto path = Path{};
        if (auto it = j.find("path"); it != j.end()) {
            path = path_from_json(*it);
        } else if (auto dp = j.find("dotPath"); dp != j.end()) {
            path = decode_path(dp->get<std::string>());
        } else {
            throw invalid_json("entry needs a path or a dotPath");
        }
        auto value = j.contains("value") ? j.at("value").get<Value>() : Value{};
        e = make_entry(std::move(path), std::move(value));
    });
}

void to_json(nlohmann::json& j, const Change& c) {
    j = nlohmann::json{
        {"type", std::string{to_string_view(c.type)}},
        {"path", c.path},
    };
    if (c.value) j["value"] = *c.value;
    if (c.old_value) j["oldValue"] = *c.old_value;
    if (c.new_value) j["newValue"] = *c.new_value;
}

void from_json(const nlohmann::json& j, Change& c) {
    require_object(j, "change");
    converting("change", [&] {
        auto change = Change{};
        change.type = change_type_from_string(j.at("type").get<std::string>());
        change.path = j.at("path").get<std::string>();

        auto optional_value = [&](const char* camel, const char* snake) -> std::optional<Value> {
            for (const auto* key : {camel, snake}) {
                if (auto it = j.find(key); it != j.end()) return it->get<Value>();
            }
            return std::nullopt;
        };
        change.value = optional_value("value", "value");
        change.old_value = optional_value("oldValue", "old_value");
        change.new_value = optional_value("newValue", "new_value");
        c = std::move(change);
    });
}

void to_json(nlohmann::json& j, const Match& m) {
    j = nlohmann::json{
        {"key", step_to_json(m.key)},
        {"value", m.value},
        {"path", path_to_json(m.path)},
        {"dotPath", m.dot_path},
    };
}

void to_json(nlohmann::json& j, const FindResult& r) {
    auto results = nlohmann::json::array();
    for (const auto& item : r.results) {
        std::visit([&](const auto& alt) { results.push_back(alt); }, item);
    }
    j = nlohmann::json{
        {"matched", r.matched},
        {"results", std::move(results)},
    };
}

// -- Configuration ------------------------------------------------------------

void from_json(const nlohmann::json& j, DiffOptions& o) {
    require_object(j, "diff options");
    converting("diff options", [&] {
        read_key(j, {"deepCompare", "deep_compare"}, o.deep_compare);
        read_key(j, {"strictTypes", "strict_types"}, o.strict_types);
    });
}

void from_json(const nlohmann::json& j, FindOptions& o) {
    require_object(j, "find options");
    converting("find options", [&] {
        read_key(j, {"target"}, o.target);
        read_key(j, {"fallbacks"}, o.fallbacks);
        read_key(j, {"matchKeys", "match_keys"}, o.match_keys);
        read_key(j, {"matchValues", "match_values"}, o.match_values);
        read_key(j, {"caseInsensitive", "case_insensitive"}, o.case_insensitive);
        read_key(j, {"useRegex", "use_regex"}, o.use_regex);
        read_key(j, {"findAll", "find_all"}, o.find_all);
        read_key(j, {"onlyTypes", "only_types"}, o.only_types);
        read_key(j, {"includeNull", "include_null"}, o.include_null);
        read_key(j, {"includeUndefined", "include_undefined"}, o.include_undefined);
        read_key(j, {"includeEmptyString", "include_empty_string"}, o.include_empty_string);

        auto format = std::string{};
        read_key(j, {"returnFormat", "return_format"}, format);
        if (!format.empty()) {
            auto parsed = return_format_from_string(format);
            if (!parsed) throw invalid_json("unknown return format: " + format);
            o.return_format = *parsed;
        }
    });
}

void from_json(const nlohmann::json& j, SyncOptions& o) {
    require_object(j, "sync options");
    converting("sync options", [&] {
        auto mode = std::string{};
        read_key(j, {"flattenMode", "flatten_mode"}, mode);
        if (!mode.empty()) o.flatten_mode = flatten_mode_from_string(mode);
    });
}

// =============================================================================
// Text helpers
// =============================================================================

namespace json {

auto parse(std::string_view text) -> Value {
    try {
        return value_from(nlohmann::ordered_json::parse(text));
    } catch (const nlohmann::json::exception& e) {
        throw invalid_json(e.what());
    }
}

auto dump(const Value& value, int indent) -> std::string {
    return value_to<nlohmann::ordered_json>(value, false)
        .dump(indent, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

auto canonical(const Value& value) -> std::string {
    return value_to<nlohmann::json>(value, true)
        .dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace json

}  // namespace mithril_sync
