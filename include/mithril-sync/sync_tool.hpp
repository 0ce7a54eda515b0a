/// @file sync_tool.hpp
/// @brief The SyncTool facade: baseline snapshot plus an editable working set.

#pragma once

#include <mithril-sync/diff.hpp>
#include <mithril-sync/flatten.hpp>
#include <mithril-sync/live_watcher.hpp>
#include <mithril-sync/path.hpp>
#include <mithril-sync/search.hpp>
#include <mithril-sync/value.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string_view>
#include <vector>

namespace mithril_sync {

/// Construction-time settings of a SyncTool.
struct SyncOptions {
    /// Flattening used for the working set, get_changes() and watch_live().
    FlattenMode flatten_mode{FlattenMode::leaves};
};

/// Selects entries for to_tree().
using EntryPredicate = std::function<bool(const Entry&)>;

/// Tracks edits to a nested structure against an immutable baseline.
///
/// The baseline (`original`) is copied at construction and never changes;
/// there is no commit, construct a new SyncTool for a new baseline. The
/// working set is the flattened entry list, edited in place by
/// update_entry(), remove_entry(), merge_with() and revert_changes().
///
/// All methods may be called from any thread. Watch callbacks run on the
/// watcher thread without any SyncTool lock held, so they may call back
/// into the tool, stop_watch() included.
///
/// @code
/// auto tool = SyncTool{Object{{"user", Object{{"name", "John"}, {"age", 30}}}}};
/// tool.update_entry("user.name", "Jane");
/// auto changes = tool.get_changes();   // modified user.name: John -> Jane
/// tool.revert_changes(changes);
/// @endcode
class SyncTool {
public:
    /// Copy `initial` into the baseline and flatten it into the working set.
    /// @throws SyncError (invalid_argument) if initial is not a container.
    explicit SyncTool(Value initial = Object{}, SyncOptions options = {});

    /// Stops any active watch.
    ~SyncTool();

    SyncTool(const SyncTool&) = delete;
    auto operator=(const SyncTool&) -> SyncTool& = delete;
    SyncTool(SyncTool&&) = delete;
    auto operator=(SyncTool&&) -> SyncTool& = delete;

    auto options() const -> const SyncOptions& { return options_; }

    // -- Reading --------------------------------------------------------------

    /// A copy of the baseline.
    auto get_original() const -> Value;

    /// A copy of the working set.
    auto get_flat() const -> std::vector<Entry>;

    /// The working set rebuilt into a nested structure.
    auto rebuild() const -> Value;

    /// Rebuild only the entries accepted by the predicate (all if empty).
    auto to_tree(const EntryPredicate& predicate = {}) const -> Value;

    // -- Editing --------------------------------------------------------------

    /// Set the value of the entry at a dotPath, appending a new entry (with
    /// the decoded path) when there is none. With FlattenMode::with_containers
    /// a container written here, or replaced here, also replaces the entries
    /// below it.
    /// @throws SyncError (invalid_argument) if dot_path is empty.
    void update_entry(std::string_view dot_path, Value value);

    /// Set the value of the entry at a structural path, appending a new
    /// entry when there is none.
    void update_entry(const Path& path, Value value);

    /// Drop the entries whose dotPath equals dot_path.
    /// @throws SyncError (invalid_argument) if dot_path is empty.
    void remove_entry(std::string_view dot_path);

    /// Replace the working set wholesale.
    void sync_entries(std::vector<Entry> entries);

    /// Merge source into a copy of the baseline and make the result the
    /// working set. Edits made since construction are discarded.
    void merge_with(const Value& source);

    // -- Changes --------------------------------------------------------------

    /// Changes from the baseline to the rebuilt working set.
    auto get_changes(const DiffOptions& options = {}) const -> std::vector<Change>;

    /// Undo the given changes on the working set.
    void revert_changes(const std::vector<Change>& changes);

    // -- Live watch -----------------------------------------------------------

    /// Poll the rebuilt working set every interval and report what changed
    /// since the previous report. Cancels any watch already running.
    void watch_live(WatchCallback callback,
                    std::chrono::milliseconds interval = std::chrono::milliseconds{500},
                    DiffOptions options = {});

    /// Cancel the active watch, if any.
    void stop_watch();

    auto watching() const -> bool;

    // -- Search ---------------------------------------------------------------

    /// Search the working set. FindOptions::mutate runs with the working set
    /// locked and must not call back into this SyncTool. Mutated container
    /// entries are re-expanded as in update_entry().
    auto find(const FindOptions& options) -> FindResult;

private:
    void write_entry(std::vector<Entry>::iterator it, const Path& path, Value value);

    const Value original_;
    const SyncOptions options_;

    mutable std::shared_mutex mutex_;
    std::vector<Entry> entries_;

    mutable std::mutex watch_mutex_;
    std::unique_ptr<LiveWatcher> watcher_;
};

}  // namespace mithril_sync
