/// @file live_watcher.hpp
/// @brief Polling change notifier over a flattened snapshot.

#pragma once

#include <mithril-sync/diff.hpp>
#include <mithril-sync/flatten.hpp>

#include <chrono>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace mithril_sync {

/// Receives the changes found by one tick. Never called with an empty list.
using WatchCallback = std::function<void(const std::vector<Change>&)>;

/// Produces the current flattening of the watched structure.
using SnapshotSource = std::function<std::vector<Entry>()>;

/// A polling loop that reports what changed since the previous report.
///
/// The baseline snapshot is captured at construction. Each tick
/// re-flattens through the source, diffs against the retained snapshot
/// and, only when something changed, retains the new snapshot and invokes
/// the callback. Ticks never overlap.
///
/// @code
/// auto watcher = LiveWatcher{source, [](const auto& changes) { ... },
///                            std::chrono::milliseconds{100}};
/// watcher.start();
/// ...
/// watcher.stop();
/// @endcode
class LiveWatcher {
public:
    LiveWatcher(SnapshotSource source, WatchCallback callback,
                std::chrono::milliseconds interval, DiffOptions options = {});

    /// Stops the loop.
    ~LiveWatcher();

    LiveWatcher(const LiveWatcher&) = delete;
    auto operator=(const LiveWatcher&) -> LiveWatcher& = delete;
    LiveWatcher(LiveWatcher&&) = delete;
    auto operator=(LiveWatcher&&) -> LiveWatcher& = delete;

    /// Start ticking on a background thread. No-op if already running.
    void start();

    /// Cancel the loop. No tick starts afterwards; a tick in progress
    /// completes. Called from inside the callback it only requests the stop.
    void stop();

    auto running() const -> bool;

    /// Run one tick on the calling thread.
    /// @return The changes delivered to the callback (empty if none).
    auto poll() -> std::vector<Change>;

    auto interval() const -> std::chrono::milliseconds;

private:
    struct State;

    std::shared_ptr<State> state_;
    std::jthread thread_;
};

}  // namespace mithril_sync
