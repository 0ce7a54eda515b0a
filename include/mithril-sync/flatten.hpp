/// @file flatten.hpp
/// @brief Entry records, flatten() and rebuild().

#pragma once

#include <mithril-sync/path.hpp>
#include <mithril-sync/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace mithril_sync {

/// Which nodes flatten() turns into entries.
enum class FlattenMode : std::uint8_t {
    leaves,           ///< Terminal values only (empty containers count as terminal).
    with_containers,  ///< Terminal values plus every non-root container node.
};

constexpr auto to_string_view(FlattenMode mode) noexcept -> std::string_view {
    switch (mode) {
        case FlattenMode::leaves:          return "leaves";
        case FlattenMode::with_containers: return "with_containers";
    }
    return "unknown";
}

/// One flattened node: where it lives and what it held.
struct Entry {
    Path path;             ///< Structural path from the root (authoritative).
    std::string dot_path;  ///< encode_path(path).
    Step key;              ///< Last step of path.
    Value value;           ///< The node value.
    Kind kind{Kind::undefined};  ///< value.kind() at capture time.

    auto operator==(const Entry&) const -> bool = default;
};

/// Build an Entry for a non-empty path, filling dot_path, key and kind.
/// @throws SyncError (invalid_argument) if path is empty.
auto make_entry(Path path, Value value) -> Entry;

/// Flatten a nested structure into entries, depth-first in definition order.
///
/// Set elements are addressed by enumeration ordinal.
/// In with_containers mode a container's entry precedes its children.
/// @throws SyncError (invalid_argument) if root is not a container.
auto flatten(const Value& root, FlattenMode mode = FlattenMode::leaves)
    -> std::vector<Entry>;

/// Rebuild a nested structure from entries, applied in order.
///
/// The root is an Object. Missing intermediates become Arrays when the next
/// step is an index and Objects otherwise. In with_containers mode a
/// container-valued entry only ensures a container of its kind exists at
/// its path; the contents come from the descendant entries.
auto rebuild(const std::vector<Entry>& entries, FlattenMode mode = FlattenMode::leaves)
    -> Value;

}  // namespace mithril_sync
