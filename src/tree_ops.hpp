#pragma once

// Internal header: not installed.
// Single-step navigation and mutation of container Values, shared by
// flatten/rebuild, path access and change application.

#include <mithril-sync/path.hpp>
#include <mithril-sync/value.hpp>

#include <cstddef>

namespace mithril_sync::detail {

/// Number of children of a container; 0 for scalars.
auto child_count(const Value& node) -> std::size_t;

/// The child at a step, or nullptr if the node has no such child.
/// Field steps address Objects and Maps; Arrays and Sets accept index steps
/// and field steps that parse as canonical indices.
auto find_child(const Value& node, const Step& step) -> const Value*;
auto find_child(Value& node, const Step& step) -> Value*;

/// The child at a step, created as Undefined when missing. Arrays grow
/// with Undefined holes, by at most max_index_growth elements; Sets append.
/// @throws SyncError (invalid_argument) if node is not a container, an
///   Array/Set is addressed by a non-index field name, or the index lies
///   beyond the growth limit.
auto child_slot(Value& node, const Step& step) -> Value&;

/// Write the child at a step. Same addressing rules as child_slot().
void assign_child(Value& node, const Step& step, Value value);

/// Remove the child at a step. An Array element is popped when it is the
/// last one and left as an Undefined hole otherwise.
/// @return true if a child was removed.
auto remove_child(Value& node, const Step& step) -> bool;

/// Walk to the parent of path.back(), creating missing or Undefined
/// intermediates: an Array when the following step is an index, an Object
/// otherwise.
/// @pre path is not empty.
/// @throws SyncError (invalid_argument) if root or an existing
///   intermediate is a scalar.
auto ensure_parent(Value& root, const Path& path) -> Value&;

}  // namespace mithril_sync::detail
