/// @file access.hpp
/// @brief Path-addressed reads and writes on a nested Value.

#pragma once

#include <mithril-sync/path.hpp>
#include <mithril-sync/value.hpp>

#include <optional>
#include <string_view>

namespace mithril_sync {

/// Get a copy of the value at a path.
/// @return The value, or nullopt if any step is missing. The empty path
///   returns the whole structure.
auto get(const Value& root, const Path& path) -> std::optional<Value>;

/// Get a copy of the value at a dotPath.
/// @code
/// auto name = get(doc, "user.name");
/// auto first = get(doc, "tags.0");
/// @endcode
auto get(const Value& root, std::string_view dot_path) -> std::optional<Value>;

/// Set the value at a path, creating missing intermediates as needed: an
/// Array when the following step is an index, an Object otherwise.
/// @throws SyncError (invalid_argument) for an empty path, a scalar root,
///   an existing scalar where an intermediate container is needed, or an
///   index more than max_index_growth past the end of an Array.
void set(Value& root, const Path& path, Value value);

/// Set the value at a dotPath.
/// @code
/// set(doc, "config.db.port", 5432);
/// @endcode
void set(Value& root, std::string_view dot_path, Value value);

}  // namespace mithril_sync
