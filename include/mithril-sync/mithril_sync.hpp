/// @file mithril_sync.hpp
/// @brief Umbrella header for the mithril-sync library.
///
/// Include this single header for access to all public types:
/// Value, Path, Entry, Change, SyncTool, LiveWatcher, the free
/// flatten/rebuild/merge/diff/find functions, JSON interop and SyncError.

#pragma once

#include <mithril-sync/access.hpp>
#include <mithril-sync/diff.hpp>
#include <mithril-sync/error.hpp>
#include <mithril-sync/flatten.hpp>
#include <mithril-sync/json.hpp>
#include <mithril-sync/live_watcher.hpp>
#include <mithril-sync/merge.hpp>
#include <mithril-sync/path.hpp>
#include <mithril-sync/search.hpp>
#include <mithril-sync/sync_tool.hpp>
#include <mithril-sync/value.hpp>
