#include <mithril-sync/flatten.hpp>
#include <mithril-sync/error.hpp>

#include "tree_ops.hpp"

#include <utility>

namespace mithril_sync {

namespace {

void flatten_children(const Value& node, Path& path, FlattenMode mode,
                      std::vector<Entry>& out);

void flatten_node(const Value& node, Path& path, FlattenMode mode,
                  std::vector<Entry>& out) {
    if (!node.is_container()) {
        out.push_back(make_entry(path, node));
        return;
    }
    auto has_children = detail::child_count(node) > 0;
    // An empty container is terminal: without its own entry it would vanish
    if (mode == FlattenMode::with_containers || !has_children) {
        out.push_back(make_entry(path, node));
    }
    if (has_children) {
        flatten_children(node, path, mode, out);
    }
}

void flatten_children(const Value& node, Path& path, FlattenMode mode,
                      std::vector<Entry>& out) {
    auto visit_keyed = [&](const auto& fields) {
        for (const auto& [key, child] : fields) {
            path.emplace_back(key);
            flatten_node(child, path, mode, out);
            path.pop_back();
        }
    };
    auto visit_ordinal = [&](const auto& items) {
        auto ordinal = std::size_t{0};
        for (const auto& child : items) {
            path.emplace_back(ordinal++);
            flatten_node(child, path, mode, out);
            path.pop_back();
        }
    };

    std::visit(overload{
        [&](const Object& o) { visit_keyed(o); },
        [&](const Map& m) { visit_keyed(m); },
        [&](const Array& a) { visit_ordinal(a); },
        [&](const Set& s) { visit_ordinal(s); },
        [](const auto&) {},
    }, node.storage());
}

}  // anonymous namespace

auto make_entry(Path path, Value value) -> Entry {
    if (path.empty()) {
        throw SyncError{ErrorKind::invalid_argument, "entry path must not be empty"};
    }
    auto entry = Entry{};
    entry.dot_path = encode_path(path);
    entry.key = path.back();
    entry.kind = value.kind();
    entry.path = std::move(path);
    entry.value = std::move(value);
    return entry;
}

auto flatten(const Value& root, FlattenMode mode) -> std::vector<Entry> {
    if (!root.is_container()) {
        throw SyncError{ErrorKind::invalid_argument,
                        "cannot flatten a " + std::string{to_string_view(root.kind())} +
                        " value: root must be a container"};
    }
    auto entries = std::vector<Entry>{};
    auto path = Path{};
    flatten_children(root, path, mode, entries);
    return entries;
}

auto rebuild(const std::vector<Entry>& entries, FlattenMode mode) -> Value {
    auto result = Value{Object{}};
    for (const auto& entry : entries) {
        const auto& path = entry.path;
        if (path.empty()) continue;

        auto* node = &result;
        for (std::size_t i = 0; i + 1 < path.size(); ++i) {
            auto& child = detail::child_slot(*node, path[i]);
            if (!child.is_container()) {
                // The structural path decides the container kind, not the dotPath
                child = Value::empty_of(is_index(path[i + 1]) ? Kind::array : Kind::object);
            }
            node = &child;
        }

        if (mode == FlattenMode::with_containers && entry.value.is_container()) {
            auto& slot = detail::child_slot(*node, path.back());
            if (slot.kind() != entry.value.kind()) {
                slot = Value::empty_of(entry.value.kind());
            }
        } else {
            detail::assign_child(*node, path.back(), entry.value);
        }
    }
    return result;
}

}  // namespace mithril_sync
