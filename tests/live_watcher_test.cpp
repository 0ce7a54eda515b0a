#include <mithril-sync/live_watcher.hpp>
#include <mithril-sync/error.hpp>

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace mithril_sync;
using namespace std::chrono_literals;

namespace {

/// A structure the tests edit while a watcher observes it.
class Observed {
public:
    auto source() -> SnapshotSource {
        return [this] {
            auto lock = std::scoped_lock{mutex_};
            return flatten(root_);
        };
    }

    void set(std::string key, Value value) {
        auto lock = std::scoped_lock{mutex_};
        root_.as<Object>().insert_or_assign(std::move(key), std::move(value));
    }

private:
    std::mutex mutex_;
    Value root_{Object{{"status", "idle"}}};
};

template <typename Pred>
auto wait_until(Pred pred, std::chrono::milliseconds timeout = 2000ms) -> bool {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() > deadline) return false;
        std::this_thread::sleep_for(5ms);
    }
    return true;
}

}  // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

TEST(LiveWatcher, rejects_missing_source_or_callback) {
    auto observed = Observed{};
    EXPECT_THROW(LiveWatcher(SnapshotSource{}, [](const auto&) {}, 10ms), SyncError);
    EXPECT_THROW(LiveWatcher(observed.source(), WatchCallback{}, 10ms), SyncError);
}

TEST(LiveWatcher, rejects_non_positive_interval) {
    auto observed = Observed{};
    EXPECT_THROW(LiveWatcher(observed.source(), [](const auto&) {}, 0ms), SyncError);
}

// =============================================================================
// Synchronous ticks
// =============================================================================

TEST(LiveWatcher, poll_without_changes_stays_silent) {
    auto observed = Observed{};
    auto calls = 0;
    auto watcher = LiveWatcher{observed.source(), [&](const auto&) { ++calls; }, 10ms};

    EXPECT_TRUE(watcher.poll().empty());
    EXPECT_EQ(calls, 0);
}

TEST(LiveWatcher, poll_reports_changes_since_previous_report) {
    auto observed = Observed{};
    auto delivered = std::vector<Change>{};
    auto watcher = LiveWatcher{observed.source(),
                               [&](const std::vector<Change>& c) { delivered = c; }, 10ms};

    observed.set("status", "busy");
    const auto changes = watcher.poll();
    ASSERT_EQ(changes.size(), 1u);
    EXPECT_EQ(changes[0].type, ChangeType::modified);
    EXPECT_EQ(changes[0].path, "status");
    EXPECT_EQ(changes[0].new_value, Value{"busy"});
    EXPECT_EQ(delivered, changes);

    // The snapshot advanced with the report
    EXPECT_TRUE(watcher.poll().empty());
}

TEST(LiveWatcher, diff_options_apply_to_ticks) {
    auto observed = Observed{};
    observed.set("count", 1);
    auto watcher = LiveWatcher{observed.source(), [](const auto&) {}, 10ms,
                               DiffOptions{.strict_types = true}};

    observed.set("count", "1");
    EXPECT_EQ(watcher.poll().size(), 1u);
}

TEST(LiveWatcher, poll_propagates_callback_errors) {
    auto observed = Observed{};
    auto watcher = LiveWatcher{observed.source(),
                               [](const auto&) { throw std::runtime_error{"callback failed"}; },
                               10ms};
    observed.set("status", "busy");
    EXPECT_THROW(watcher.poll(), std::runtime_error);
}

// =============================================================================
// Background loop
// =============================================================================

TEST(LiveWatcher, start_and_stop) {
    auto observed = Observed{};
    auto watcher = LiveWatcher{observed.source(), [](const auto&) {}, 10ms};
    EXPECT_FALSE(watcher.running());

    watcher.start();
    EXPECT_TRUE(watcher.running());

    watcher.stop();
    EXPECT_FALSE(watcher.running());
    watcher.stop();
}

TEST(LiveWatcher, background_ticks_deliver_changes) {
    auto observed = Observed{};
    auto calls = std::atomic<int>{0};
    auto watcher = LiveWatcher{observed.source(), [&](const auto&) { ++calls; }, 10ms};
    watcher.start();

    observed.set("status", "busy");
    EXPECT_TRUE(wait_until([&] { return calls.load() >= 1; }));
    watcher.stop();
    EXPECT_EQ(calls.load(), 1);
}

TEST(LiveWatcher, no_ticks_after_stop) {
    auto observed = Observed{};
    auto calls = std::atomic<int>{0};
    auto watcher = LiveWatcher{observed.source(), [&](const auto&) { ++calls; }, 10ms};
    watcher.start();
    watcher.stop();

    observed.set("status", "busy");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls.load(), 0);
}

TEST(LiveWatcher, loop_survives_callback_errors) {
    auto ticks = std::atomic<int>{0};
    auto source = [&ticks] {
        // A fresh value on every call, so every tick has a change
        return flatten(Value{Object{{"tick", ticks.load()}}});
    };
    auto calls = std::atomic<int>{0};
    auto watcher = LiveWatcher{source, [&](const auto&) {
        ++calls;
        ++ticks;
        throw std::runtime_error{"callback failed"};
    }, 5ms};

    ++ticks;
    watcher.start();
    EXPECT_TRUE(wait_until([&] { return calls.load() >= 2; }));
}

TEST(LiveWatcher, callback_may_stop_its_own_watcher) {
    auto observed = Observed{};
    auto calls = std::atomic<int>{0};
    auto watcher = std::unique_ptr<LiveWatcher>{};
    watcher = std::make_unique<LiveWatcher>(observed.source(), [&](const auto&) {
        watcher->stop();
        ++calls;
    }, 5ms);
    watcher->start();

    observed.set("status", "busy");
    ASSERT_TRUE(wait_until([&] { return calls.load() >= 1; }));

    observed.set("status", "done");
    std::this_thread::sleep_for(50ms);
    EXPECT_EQ(calls.load(), 1);
    watcher.reset();
}
