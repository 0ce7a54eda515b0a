#include "tree_ops.hpp"

#include <mithril-sync/error.hpp>

#include <optional>
#include <string>

namespace mithril_sync::detail {

namespace {

auto step_index(const Step& step) -> std::optional<std::size_t> {
    if (const auto* idx = std::get_if<std::size_t>(&step)) return *idx;
    return parse_index(std::get<std::string>(step));
}

auto require_index(const Step& step, Kind kind) -> std::size_t {
    auto idx = step_index(step);
    if (!idx) {
        throw SyncError{ErrorKind::invalid_argument,
                        "cannot address " + std::string{to_string_view(kind)} +
                        " element with key '" + to_string(step) + "'"};
    }
    return *idx;
}

[[noreturn]] void throw_not_container(const Value& node, const Step& step) {
    throw SyncError{ErrorKind::invalid_argument,
                    "cannot address '" + to_string(step) + "' inside a " +
                    std::string{to_string_view(node.kind())} + " value"};
}

}  // anonymous namespace

auto child_count(const Value& node) -> std::size_t {
    return std::visit(overload{
        [](const Object& o) -> std::size_t { return o.size(); },
        [](const Map& m) -> std::size_t { return m.size(); },
        [](const Array& a) -> std::size_t { return a.size(); },
        [](const Set& s) -> std::size_t { return s.size(); },
        [](const auto&) -> std::size_t { return 0; },
    }, node.storage());
}

auto find_child(const Value& node, const Step& step) -> const Value* {
    return std::visit(overload{
        [&](const Object& o) -> const Value* { return o.find(to_string(step)); },
        [&](const Map& m) -> const Value* { return m.find(to_string(step)); },
        [&](const Array& a) -> const Value* {
            auto idx = step_index(step);
            if (!idx || *idx >= a.size()) return nullptr;
            return &a[*idx];
        },
        [&](const Set& s) -> const Value* {
            auto idx = step_index(step);
            if (!idx || *idx >= s.size()) return nullptr;
            return &*(s.begin() + static_cast<std::ptrdiff_t>(*idx));
        },
        [](const auto&) -> const Value* { return nullptr; },
    }, node.storage());
}

auto find_child(Value& node, const Step& step) -> Value* {
    return const_cast<Value*>(find_child(static_cast<const Value&>(node), step));
}

auto child_slot(Value& node, const Step& step) -> Value& {
    if (auto* o = node.get_if<Object>()) return (*o)[to_string(step)];
    if (auto* m = node.get_if<Map>()) return (*m)[to_string(step)];
    if (auto* a = node.get_if<Array>()) {
        auto idx = require_index(step, Kind::array);
        if (idx >= a->size()) {
            if (idx - a->size() >= max_index_growth) {
                throw SyncError{ErrorKind::invalid_argument,
                                "array index " + std::to_string(idx) + " is too far past the end (size " +
                                std::to_string(a->size()) + ")"};
            }
            a->resize(idx + 1);
        }
        return (*a)[idx];
    }
    if (auto* s = node.get_if<Set>()) {
        return s->slot(require_index(step, Kind::set));
    }
    throw_not_container(node, step);
}

void assign_child(Value& node, const Step& step, Value value) {
    if (auto* s = node.get_if<Set>()) {
        s->assign_at(require_index(step, Kind::set), std::move(value));
        return;
    }
    child_slot(node, step) = std::move(value);
}

auto remove_child(Value& node, const Step& step) -> bool {
    if (auto* o = node.get_if<Object>()) return o->erase(to_string(step));
    if (auto* m = node.get_if<Map>()) return m->erase(to_string(step));
    if (auto* a = node.get_if<Array>()) {
        auto idx = step_index(step);
        if (!idx || *idx >= a->size()) return false;
        if (*idx + 1 == a->size()) {
            a->pop_back();
        } else {
            (*a)[*idx] = Undefined{};
        }
        return true;
    }
    if (auto* s = node.get_if<Set>()) {
        auto idx = step_index(step);
        return idx && s->erase_at(*idx);
    }
    return false;
}

auto ensure_parent(Value& root, const Path& path) -> Value& {
    if (!root.is_container()) throw_not_container(root, path.front());
    auto* node = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        auto* child = find_child(*node, path[i]);
        if (!child || child->is_undefined()) {
            child = &child_slot(*node, path[i]);
            *child = Value::empty_of(is_index(path[i + 1]) ? Kind::array : Kind::object);
        } else if (!child->is_container()) {
            throw SyncError{ErrorKind::invalid_argument,
                            "path segment '" + to_string(path[i]) + "' holds a " +
                            std::string{to_string_view(child->kind())} + " value"};
        }
        node = child;
    }
    return *node;
}

}  // namespace mithril_sync::detail
