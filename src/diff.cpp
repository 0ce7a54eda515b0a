#include <mithril-sync/diff.hpp>
#include <mithril-sync/access.hpp>
#include <mithril-sync/error.hpp>
#include <mithril-sync/json.hpp>

#include "tree_ops.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace mithril_sync {

namespace {

/// dotPath -> value, remembering first-occurrence order.
struct Projection {
    std::vector<std::string_view> order;
    std::unordered_map<std::string_view, const Value*> values;
};

auto project(const std::vector<Entry>& entries) -> Projection {
    auto projection = Projection{};
    projection.order.reserve(entries.size());
    projection.values.reserve(entries.size());
    for (const auto& entry : entries) {
        auto [it, inserted] = projection.values.insert_or_assign(entry.dot_path, &entry.value);
        if (inserted) projection.order.push_back(it->first);
    }
    return projection;
}

auto values_differ(const Value& a, const Value& b, const DiffOptions& options) -> bool {
    if (options.deep_compare) return json::canonical(a) != json::canonical(b);
    if (options.strict_types) return !strict_equals(a, b);
    return !loose_equals(a, b);
}

void remove_at(Value& root, const Path& path) {
    // nodes[i] is the container addressed by path[0..i)
    auto nodes = std::vector<Value*>{&root};
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        auto* child = detail::find_child(*nodes.back(), path[i]);
        if (!child || !child->is_container()) return;
        nodes.push_back(child);
    }
    if (!detail::remove_child(*nodes.back(), path.back())) return;

    for (auto i = nodes.size() - 1; i > 0; --i) {
        if (detail::child_count(*nodes[i]) > 0) break;
        detail::remove_child(*nodes[i - 1], path[i - 1]);
    }
}

}  // anonymous namespace

auto change_type_from_string(std::string_view name) -> ChangeType {
    if (name == "added") return ChangeType::added;
    if (name == "removed") return ChangeType::removed;
    if (name == "modified") return ChangeType::modified;
    throw SyncError{ErrorKind::invalid_argument, "unknown change type: " + std::string{name}};
}

auto diff(const std::vector<Entry>& old_entries,
          const std::vector<Entry>& new_entries,
          const DiffOptions& options) -> std::vector<Change> {
    const auto before = project(old_entries);
    const auto after = project(new_entries);
    auto changes = std::vector<Change>{};

    for (auto path : before.order) {
        const auto* old_value = before.values.at(path);
        auto it = after.values.find(path);
        if (it == after.values.end()) {
            changes.push_back(Change{ChangeType::removed, std::string{path},
                                     std::nullopt, *old_value, std::nullopt});
        } else if (values_differ(*old_value, *it->second, options)) {
            changes.push_back(Change{ChangeType::modified, std::string{path},
                                     std::nullopt, *old_value, *it->second});
        }
    }
    for (auto path : after.order) {
        if (before.values.contains(path)) continue;
        changes.push_back(Change{ChangeType::added, std::string{path},
                                 *after.values.at(path), std::nullopt, std::nullopt});
    }
    return changes;
}

auto apply_changes(Value& target, const std::vector<Change>& changes) -> Value& {
    if (!target.is_container()) {
        throw SyncError{ErrorKind::invalid_argument,
                        "cannot apply changes to a " +
                        std::string{to_string_view(target.kind())} + " value"};
    }
    for (const auto& change : changes) {
        if (change.path.empty()) {
            throw SyncError{ErrorKind::invalid_argument, "change path must not be empty"};
        }
        auto path = decode_path(change.path);
        switch (change.type) {
            case ChangeType::removed:
                remove_at(target, path);
                break;
            case ChangeType::added:
            case ChangeType::modified:
                set(target, path, change.value ? *change.value
                                               : change.new_value.value_or(Value{}));
                break;
            default:
                throw SyncError{ErrorKind::invalid_argument,
                                "unknown change type at '" + change.path + "'"};
        }
    }
    return target;
}

auto from_diff(const Value& base, const std::vector<Change>& changes) -> Value {
    auto copy = base;
    apply_changes(copy, changes);
    return copy;
}

auto invert_changes(const std::vector<Change>& changes) -> std::vector<Change> {
    auto inverted = std::vector<Change>{};
    inverted.reserve(changes.size());
    for (auto it = changes.rbegin(); it != changes.rend(); ++it) {
        switch (it->type) {
            case ChangeType::added:
                inverted.push_back(Change{ChangeType::removed, it->path,
                                          std::nullopt, it->value, std::nullopt});
                break;
            case ChangeType::removed:
                inverted.push_back(Change{ChangeType::added, it->path,
                                          it->old_value, std::nullopt, std::nullopt});
                break;
            case ChangeType::modified:
                inverted.push_back(Change{ChangeType::modified, it->path,
                                          std::nullopt, it->new_value, it->old_value});
                break;
        }
    }
    return inverted;
}

}  // namespace mithril_sync
