/// @file json.hpp
/// @brief nlohmann/json interoperability for mithril-sync.
///
/// Provides ADL serialization (to_json/from_json) for values, entries,
/// changes and search results, loading of the option structs from JSON
/// configuration, and text parse/dump helpers.

#pragma once

#include <mithril-sync/diff.hpp>
#include <mithril-sync/flatten.hpp>
#include <mithril-sync/path.hpp>
#include <mithril-sync/search.hpp>
#include <mithril-sync/sync_tool.hpp>
#include <mithril-sync/value.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace mithril_sync {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Value --------------------------------------------------------------------
//
// Objects become JSON objects, Arrays arrays, scalars map naturally.
// Map, Set and Undefined use the tagged form {"__type": ..., "value": ...};
// a Map's value is an array of [key, value] pairs.
// Pass containers wrapped in a Value (nlohmann::json(Value{object})).

void to_json(nlohmann::json& j, const Value& v);
void from_json(const nlohmann::json& j, Value& v);

void to_json(nlohmann::ordered_json& j, const Value& v);
void from_json(const nlohmann::ordered_json& j, Value& v);

// -- Paths --------------------------------------------------------------------
//
// Step and Path are std types, out of reach of ADL: use these helpers.
// Field steps serialize as strings, index steps as unsigned numbers.

auto step_to_json(const Step& step) -> nlohmann::json;
auto step_from_json(const nlohmann::json& j) -> Step;

auto path_to_json(const Path& path) -> nlohmann::json;
auto path_from_json(const nlohmann::json& j) -> Path;

// -- Records ------------------------------------------------------------------

/// {"path", "dotPath", "key", "value", "kind"}. from_json needs "path" or
/// "dotPath" plus "value"; the derived fields are recomputed.
void to_json(nlohmann::json& j, const Entry& e);
void from_json(const nlohmann::json& j, Entry& e);

/// {"type", "path", "value"?, "oldValue"?, "newValue"?}.
/// from_json throws SyncError (invalid_argument) for an unknown type.
void to_json(nlohmann::json& j, const Change& c);
void from_json(const nlohmann::json& j, Change& c);

void to_json(nlohmann::json& j, const Match& m);
void to_json(nlohmann::json& j, const FindResult& r);

// -- Configuration ------------------------------------------------------------
//
// Keys may be camelCase or snake_case; missing keys keep their defaults.

void from_json(const nlohmann::json& j, DiffOptions& o);
void from_json(const nlohmann::json& j, FindOptions& o);
void from_json(const nlohmann::json& j, SyncOptions& o);

// =============================================================================
// Text helpers
// =============================================================================

namespace json {

/// Parse JSON text into a Value, keeping field order.
/// @throws SyncError (invalid_json) on malformed input.
auto parse(std::string_view text) -> Value;

/// Serialize a Value, keeping field order. indent < 0 gives compact output.
auto dump(const Value& value, int indent = -1) -> std::string;

/// Compact serialization with sorted object keys, Map pairs sorted by key
/// and Set elements sorted by their own serialization.
auto canonical(const Value& value) -> std::string;

}  // namespace json

}  // namespace mithril_sync
