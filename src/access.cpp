#include <mithril-sync/access.hpp>
#include <mithril-sync/error.hpp>

#include "tree_ops.hpp"

namespace mithril_sync {

auto get(const Value& root, const Path& path) -> std::optional<Value> {
    const auto* node = &root;
    for (const auto& step : path) {
        node = detail::find_child(*node, step);
        if (!node) return std::nullopt;
    }
    return *node;
}

auto get(const Value& root, std::string_view dot_path) -> std::optional<Value> {
    return get(root, decode_path(dot_path));
}

void set(Value& root, const Path& path, Value value) {
    if (path.empty()) {
        throw SyncError{ErrorKind::invalid_argument, "cannot set at the root path"};
    }
    auto& parent = detail::ensure_parent(root, path);
    detail::assign_child(parent, path.back(), std::move(value));
}

void set(Value& root, std::string_view dot_path, Value value) {
    set(root, decode_path(dot_path), std::move(value));
}

}  // namespace mithril_sync
