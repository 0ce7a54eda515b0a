// live_watch_demo: background change notifications
//
// Starts a live watch on a SyncTool, edits the working set from the main
// thread, and prints each batch of changes as the watcher reports it.
//
// Build: cmake -DMITHRIL_SYNC_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/live_watch_demo

#include <mithril-sync/mithril_sync.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <cstdio>
#include <thread>

namespace ms = mithril_sync;
using namespace std::chrono_literals;

int main() {
    spdlog::set_level(spdlog::level::debug);

    auto tool = ms::SyncTool{ms::Object{
        {"server", ms::Object{{"host", "localhost"}, {"port", 8080}}},
        {"workers", 4},
    }};

    tool.watch_live([](const std::vector<ms::Change>& changes) {
        spdlog::info("{} change(s)", changes.size());
        for (const auto& c : changes) {
            spdlog::info("  {} {}", ms::to_string_view(c.type), c.path);
        }
    }, 50ms);

    tool.update_entry("server.port", 9090);
    std::this_thread::sleep_for(200ms);

    tool.update_entry("workers", 8);
    tool.update_entry("server.tls", true);
    std::this_thread::sleep_for(200ms);

    // Reverting is itself a change the watcher reports
    tool.revert_changes(tool.get_changes());
    std::this_thread::sleep_for(200ms);

    tool.stop_watch();
    std::printf("watching after stop: %s\n", tool.watching() ? "yes" : "no");
    return 0;
}
