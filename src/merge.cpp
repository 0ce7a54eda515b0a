#include <mithril-sync/merge.hpp>
#include <mithril-sync/error.hpp>

#include <string>

namespace mithril_sync {

namespace {

template <typename Tag>
void merge_fields(KeyedContainer<Tag>& target, const KeyedContainer<Tag>& source) {
    for (const auto& [key, value] : source) {
        auto* existing = target.find(key);
        if (existing && existing->kind() == value.kind() &&
            (value.is_object() || value.is_map())) {
            merge(*existing, value);
        } else {
            target.insert_or_assign(key, value);
        }
    }
}

}  // anonymous namespace

auto merge(Value& target, const Value& source) -> Value& {
    if (auto* t = target.get_if<Object>()) {
        if (const auto* s = source.get_if<Object>()) {
            merge_fields(*t, *s);
            return target;
        }
    } else if (auto* t = target.get_if<Map>()) {
        if (const auto* s = source.get_if<Map>()) {
            merge_fields(*t, *s);
            return target;
        }
    }
    throw SyncError{ErrorKind::invalid_argument,
                    "cannot merge a " + std::string{to_string_view(source.kind())} +
                    " into a " + std::string{to_string_view(target.kind())}};
}

}  // namespace mithril_sync
