/// @file search.hpp
/// @brief Key/value search over flattened entries.

#pragma once

#include <mithril-sync/flatten.hpp>
#include <mithril-sync/path.hpp>
#include <mithril-sync/value.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mithril_sync {

/// Shape of each reported match.
enum class ReturnFormat : std::uint8_t {
    full,          ///< A Match record.
    dot_paths,     ///< The dotPath string only.
    entries_only,  ///< The matched Entry.
};

/// Convert a ReturnFormat to its string representation.
constexpr auto to_string_view(ReturnFormat format) noexcept -> std::string_view {
    switch (format) {
        case ReturnFormat::full:         return "full";
        case ReturnFormat::dot_paths:    return "dotPaths";
        case ReturnFormat::entries_only: return "entriesOnly";
    }
    return "unknown";
}

/// Parse "full", "dotPaths" or "entriesOnly" (snake_case is accepted too).
auto return_format_from_string(std::string_view name) -> std::optional<ReturnFormat>;

/// Search parameters. Every field is optional.
struct FindOptions {
    std::string target;                  ///< Tried first.
    std::vector<std::string> fallbacks;  ///< Tried in order while nothing matched.
    bool match_keys{true};
    bool match_values{true};
    bool case_insensitive{false};
    bool use_regex{false};               ///< ECMAScript regex search instead of equality.
    bool find_all{false};                ///< Collect every match of the winning target.

    /// Invoked on each matched entry before it is recorded.
    std::function<void(Entry&)> mutate;

    /// Kind names ("string", "number", ...) to accept; empty accepts all.
    std::vector<std::string> only_types;
    ReturnFormat return_format{ReturnFormat::full};
    bool include_null{true};
    bool include_undefined{true};
    bool include_empty_string{true};
};

/// A match in ReturnFormat::full.
struct Match {
    Step key;
    Value value;
    Path path;
    std::string dot_path;

    auto operator==(const Match&) const -> bool = default;
};

/// One reported result; the alternative follows FindOptions::return_format.
using FindItem = std::variant<Match, std::string, Entry>;

struct FindResult {
    bool matched{false};
    std::vector<FindItem> results;
};

/// Search entries for keys and/or values equal to (or matching) a target.
///
/// The target list is `target` followed by `fallbacks`, skipping blank
/// strings. The first target that matches anything wins; later ones are
/// not tried. The null/undefined/empty-string and type filters look at the
/// value only. Each dotPath is reported at most once.
///
/// @code
/// auto result = find(entries, {.target = "nickname", .fallbacks = {"name"}});
/// @endcode
/// @throws SyncError (invalid_pattern) if use_regex is set and a target is
///   not a valid ECMAScript regular expression.
auto find(std::vector<Entry>& entries, const FindOptions& options) -> FindResult;

}  // namespace mithril_sync
