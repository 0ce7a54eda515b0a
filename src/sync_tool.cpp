#include <mithril-sync/sync_tool.hpp>
#include <mithril-sync/error.hpp>
#include <mithril-sync/merge.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <utility>
#include <vector>

namespace mithril_sync {

namespace {

auto is_below(const Path& path, const Path& ancestor) -> bool {
    return path.size() > ancestor.size() &&
           std::equal(ancestor.begin(), ancestor.end(), path.begin());
}

// Enriched working sets describe a container by its own entry and by the
// entries below it; both are replaced so rebuild() sees the new value.
void write_subtree(std::vector<Entry>& entries, const Path& path, Value value) {
    std::erase_if(entries, [&](const Entry& e) { return is_below(e.path, path); });

    auto children = std::vector<Entry>{};
    if (value.is_container()) {
        for (auto& child : flatten(value, FlattenMode::with_containers)) {
            auto child_path = path;
            child_path.insert(child_path.end(), child.path.begin(), child.path.end());
            children.push_back(make_entry(std::move(child_path), std::move(child.value)));
        }
    }

    auto it = std::ranges::find(entries, path, &Entry::path);
    if (it == entries.end()) {
        entries.push_back(make_entry(path, std::move(value)));
        it = std::prev(entries.end());
    } else {
        it->kind = value.kind();
        it->value = std::move(value);
    }
    entries.insert(std::next(it), std::make_move_iterator(children.begin()),
                   std::make_move_iterator(children.end()));
}

}  // anonymous namespace

SyncTool::SyncTool(Value initial, SyncOptions options)
    : original_{std::move(initial)},
      options_{options},
      entries_{flatten(original_, options_.flatten_mode)} {}

SyncTool::~SyncTool() {
    stop_watch();
}

auto SyncTool::get_original() const -> Value {
    return original_;
}

auto SyncTool::get_flat() const -> std::vector<Entry> {
    auto lock = std::shared_lock{mutex_};
    return entries_;
}

auto SyncTool::rebuild() const -> Value {
    auto lock = std::shared_lock{mutex_};
    return mithril_sync::rebuild(entries_, options_.flatten_mode);
}

auto SyncTool::to_tree(const EntryPredicate& predicate) const -> Value {
    auto lock = std::shared_lock{mutex_};
    if (!predicate) return mithril_sync::rebuild(entries_, options_.flatten_mode);

    auto selected = std::vector<Entry>{};
    std::ranges::copy_if(entries_, std::back_inserter(selected), predicate);
    return mithril_sync::rebuild(selected, options_.flatten_mode);
}

void SyncTool::update_entry(std::string_view dot_path, Value value) {
    if (dot_path.empty()) {
        throw SyncError{ErrorKind::invalid_argument, "update_entry: empty dotPath"};
    }
    auto lock = std::unique_lock{mutex_};
    auto it = std::ranges::find_if(entries_, [&](const Entry& e) { return e.dot_path == dot_path; });
    auto path = it != entries_.end() ? it->path : decode_path(dot_path);
    write_entry(it, path, std::move(value));
}

void SyncTool::update_entry(const Path& path, Value value) {
    if (path.empty()) {
        throw SyncError{ErrorKind::invalid_argument, "update_entry: empty path"};
    }
    auto lock = std::unique_lock{mutex_};
    write_entry(std::ranges::find(entries_, path, &Entry::path), path, std::move(value));
}

void SyncTool::write_entry(std::vector<Entry>::iterator it, const Path& path, Value value) {
    auto was_container = it != entries_.end() && it->value.is_container();
    if (options_.flatten_mode == FlattenMode::with_containers &&
        (was_container || value.is_container())) {
        write_subtree(entries_, path, std::move(value));
        return;
    }
    if (it != entries_.end()) {
        it->kind = value.kind();
        it->value = std::move(value);
        return;
    }
    entries_.push_back(make_entry(path, std::move(value)));
}

void SyncTool::remove_entry(std::string_view dot_path) {
    if (dot_path.empty()) {
        throw SyncError{ErrorKind::invalid_argument, "remove_entry: empty dotPath"};
    }
    auto lock = std::unique_lock{mutex_};
    std::erase_if(entries_, [&](const Entry& e) { return e.dot_path == dot_path; });
}

void SyncTool::sync_entries(std::vector<Entry> entries) {
    auto lock = std::unique_lock{mutex_};
    entries_ = std::move(entries);
}

void SyncTool::merge_with(const Value& source) {
    auto merged = original_;
    merge(merged, source);
    auto entries = flatten(merged, options_.flatten_mode);

    auto lock = std::unique_lock{mutex_};
    entries_ = std::move(entries);
    SPDLOG_DEBUG("merge_with: working set now holds {} entries", entries_.size());
}

auto SyncTool::get_changes(const DiffOptions& options) const -> std::vector<Change> {
    auto current = flatten(rebuild(), options_.flatten_mode);
    return diff(flatten(original_, options_.flatten_mode), current, options);
}

void SyncTool::revert_changes(const std::vector<Change>& changes) {
    auto inverse = invert_changes(changes);

    auto lock = std::unique_lock{mutex_};
    auto current = mithril_sync::rebuild(entries_, options_.flatten_mode);
    apply_changes(current, inverse);
    entries_ = flatten(current, options_.flatten_mode);
    SPDLOG_DEBUG("revert_changes: reverted {} changes", inverse.size());
}

void SyncTool::watch_live(WatchCallback callback, std::chrono::milliseconds interval,
                          DiffOptions options) {
    stop_watch();

    auto watcher = std::make_unique<LiveWatcher>(
        [this] { return flatten(rebuild(), options_.flatten_mode); },
        std::move(callback), interval, options);
    watcher->start();

    auto previous = std::unique_ptr<LiveWatcher>{};
    {
        auto lock = std::scoped_lock{watch_mutex_};
        previous = std::exchange(watcher_, std::move(watcher));
    }
    // A concurrent watch_live() may have slipped in; it is released here,
    // outside the lock, like in stop_watch()
}

void SyncTool::stop_watch() {
    auto watcher = std::unique_ptr<LiveWatcher>{};
    {
        auto lock = std::scoped_lock{watch_mutex_};
        watcher = std::move(watcher_);
    }
    // Joined outside the lock: the callback may itself call stop_watch()
    if (watcher) watcher->stop();
}

auto SyncTool::watching() const -> bool {
    auto lock = std::scoped_lock{watch_mutex_};
    return watcher_ && watcher_->running();
}

auto SyncTool::find(const FindOptions& options) -> FindResult {
    auto lock = std::unique_lock{mutex_};
    if (!options.mutate || options_.flatten_mode != FlattenMode::with_containers) {
        return mithril_sync::find(entries_, options);
    }

    // A mutated container entry must carry its new contents to the entries below it
    const auto before = entries_;
    auto result = mithril_sync::find(entries_, options);

    auto rewritten = std::vector<std::pair<Path, Value>>{};
    for (std::size_t i = 0; i < entries_.size(); ++i) {
        const auto& old_value = before[i].value;
        const auto& entry = entries_[i];
        if (entry.value == old_value) continue;
        if (old_value.is_container() || entry.value.is_container()) {
            rewritten.emplace_back(entry.path, entry.value);
        }
    }
    for (auto& [path, value] : rewritten) {
        write_subtree(entries_, path, std::move(value));
    }
    return result;
}

}  // namespace mithril_sync
