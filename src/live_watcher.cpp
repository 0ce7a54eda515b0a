#include <mithril-sync/live_watcher.hpp>
#include <mithril-sync/error.hpp>

#include <spdlog/spdlog.h>

#include <condition_variable>
#include <exception>
#include <mutex>
#include <stop_token>

namespace mithril_sync {

struct LiveWatcher::State {
    SnapshotSource source;
    WatchCallback callback;
    std::chrono::milliseconds interval;
    DiffOptions options;

    // Held for a whole tick, callback included
    std::mutex tick_mutex;
    std::vector<Entry> snapshot;

    std::mutex wait_mutex;
    std::condition_variable_any wakeup;

    auto tick() -> std::vector<Change> {
        auto lock = std::scoped_lock{tick_mutex};
        auto current = source();
        auto changes = diff(snapshot, current, options);
        if (changes.empty()) return changes;
        snapshot = std::move(current);
        callback(changes);
        return changes;
    }
};

LiveWatcher::LiveWatcher(SnapshotSource source, WatchCallback callback,
                         std::chrono::milliseconds interval, DiffOptions options)
    : state_{std::make_shared<State>()} {
    if (!source || !callback) {
        throw SyncError{ErrorKind::invalid_argument,
                        "live watcher needs a snapshot source and a callback"};
    }
    if (interval.count() <= 0) {
        throw SyncError{ErrorKind::invalid_argument, "watch interval must be positive"};
    }
    state_->source = std::move(source);
    state_->callback = std::move(callback);
    state_->interval = interval;
    state_->options = options;
    state_->snapshot = state_->source();
}

LiveWatcher::~LiveWatcher() {
    stop();
}

void LiveWatcher::start() {
    if (thread_.joinable()) return;
    SPDLOG_DEBUG("live watch starting, interval {}ms", state_->interval.count());

    // The thread co-owns the state: once detached by a stop() issued from
    // the callback it outlives this object.
    thread_ = std::jthread{[state = state_](std::stop_token st) {
        while (true) {
            {
                auto lock = std::unique_lock{state->wait_mutex};
                state->wakeup.wait_for(lock, st, state->interval, [] { return false; });
            }
            if (st.stop_requested()) break;
            try {
                state->tick();
            } catch (const std::exception& e) {
                SPDLOG_ERROR("live watch tick failed: {}", e.what());
            }
        }
    }};
}

void LiveWatcher::stop() {
    if (!thread_.joinable()) return;
    thread_.request_stop();
    if (thread_.get_id() == std::this_thread::get_id()) {
        // Stopping from the callback: the loop exits once the callback returns
        thread_.detach();
    } else {
        thread_.join();
    }
    SPDLOG_DEBUG("live watch stopped");
}

auto LiveWatcher::running() const -> bool {
    return thread_.joinable();
}

auto LiveWatcher::poll() -> std::vector<Change> {
    return state_->tick();
}

auto LiveWatcher::interval() const -> std::chrono::milliseconds {
    return state_->interval;
}

}  // namespace mithril_sync
