/// @file diff.hpp
/// @brief Change records: diffing flattened snapshots, applying and inverting.

#pragma once

#include <mithril-sync/flatten.hpp>
#include <mithril-sync/value.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mithril_sync {

/// The three kinds of structural delta.
enum class ChangeType : std::uint8_t {
    added,     ///< Path present only in the new snapshot.
    removed,   ///< Path present only in the old snapshot.
    modified,  ///< Path present in both with different values.
};

/// Convert a ChangeType to its string representation.
constexpr auto to_string_view(ChangeType type) noexcept -> std::string_view {
    switch (type) {
        case ChangeType::added:    return "added";
        case ChangeType::removed:  return "removed";
        case ChangeType::modified: return "modified";
    }
    return "unknown";
}

/// Parse "added", "removed" or "modified".
/// @throws SyncError (invalid_argument) for any other name.
auto change_type_from_string(std::string_view name) -> ChangeType;

/// One structural delta between two flattened snapshots.
struct Change {
    ChangeType type{ChangeType::modified};
    std::string path;                  ///< dotPath of the affected node.
    std::optional<Value> value;        ///< Set for added.
    std::optional<Value> old_value;    ///< Set for removed and modified.
    std::optional<Value> new_value;    ///< Set for modified.

    auto operator==(const Change&) const -> bool = default;
};

/// Value comparison rules used by diff().
struct DiffOptions {
    /// Compare canonical JSON serializations (takes precedence).
    bool deep_compare{false};
    /// Strict equality instead of coercing equality ("1" vs 1 differ).
    bool strict_types{false};
};

/// Compare two flattened snapshots by dotPath.
///
/// Changes are ordered by the first occurrence of their dotPath in
/// old_entries, followed by dotPaths that only occur in new_entries.
/// When a list holds several entries for one dotPath, the last one wins.
auto diff(const std::vector<Entry>& old_entries,
          const std::vector<Entry>& new_entries,
          const DiffOptions& options = {}) -> std::vector<Change>;

/// Apply changes to target in place and return it.
///
/// Missing intermediates are created along each dotPath as in set().
/// removed deletes the final key and drops parents it leaves empty (never
/// the root); every other change writes `value`, falling back to
/// `new_value`.
/// @throws SyncError (invalid_argument) for an empty path, a non-container
///   target, or a path that runs through a scalar.
auto apply_changes(Value& target, const std::vector<Change>& changes) -> Value&;

/// apply_changes() on a copy of base.
auto from_diff(const Value& base, const std::vector<Change>& changes) -> Value;

/// The changes that undo the given ones, in reverse order.
///
/// added becomes removed, removed becomes added with the old value, and
/// modified swaps its old and new values.
auto invert_changes(const std::vector<Change>& changes) -> std::vector<Change>;

}  // namespace mithril_sync
