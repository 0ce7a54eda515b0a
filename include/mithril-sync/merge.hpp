/// @file merge.hpp
/// @brief Deep merge of keyed structures.

#pragma once

#include <mithril-sync/value.hpp>

namespace mithril_sync {

/// Deep-merge source into target in place and return target.
///
/// For each key of source: when both sides hold Objects (or both hold
/// Maps) they are merged recursively; otherwise the source value replaces
/// the target value wholesale. Arrays and Sets are never element-merged.
///
/// @code
/// auto t = Value{Object{{"a", Object{{"b", 1}}}}};
/// merge(t, Object{{"a", Object{{"c", 2}}}});   // {a: {b: 1, c: 2}}
/// @endcode
/// @throws SyncError (invalid_argument) unless target and source are both
///   Objects or both Maps.
auto merge(Value& target, const Value& source) -> Value&;

}  // namespace mithril_sync
