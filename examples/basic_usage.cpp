// basic_usage: demonstrates the core mithril-sync API
//
// Shows flattening a nested profile, editing entries by dotPath, listing
// the changes against the baseline, searching, and reverting.
//
// Build: cmake -DMITHRIL_SYNC_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/basic_usage

#include <mithril-sync/mithril_sync.hpp>

#include <cstdio>
#include <string>
#include <variant>
#include <vector>

namespace ms = mithril_sync;

static void print_changes(const std::vector<ms::Change>& changes) {
    for (const auto& c : changes) {
        auto line = std::string{ms::to_string_view(c.type)} + " " + c.path;
        if (c.old_value) line += " from " + ms::to_display_string(*c.old_value);
        if (c.new_value) line += " to " + ms::to_display_string(*c.new_value);
        if (c.value) line += " = " + ms::to_display_string(*c.value);
        std::printf("  %s\n", line.c_str());
    }
}

int main() {
    auto tool = ms::SyncTool{ms::Object{
        {"user", ms::Object{{"name", "John"}, {"age", 30}}},
        {"tags", ms::Array{"admin", "ops"}},
    }};

    // -- The flattened working set ---------------------------------------------
    std::printf("Entries:\n");
    for (const auto& e : tool.get_flat()) {
        std::printf("  %-10s %-7s %s\n", e.dot_path.c_str(),
                    std::string{ms::to_string_view(e.kind)}.c_str(),
                    ms::to_display_string(e.value).c_str());
    }

    // -- Edit by dotPath -------------------------------------------------------
    tool.update_entry("user.name", "Jane");
    tool.update_entry("user.email", "jane@example.com");
    tool.remove_entry("tags.1");

    std::printf("\nRebuilt: %s\n", ms::json::dump(tool.rebuild()).c_str());
    std::printf("Changes:\n");
    const auto changes = tool.get_changes();
    print_changes(changes);

    // -- Search with a fallback ------------------------------------------------
    auto options = ms::FindOptions{};
    options.target = "nickname";
    options.fallbacks = {"name"};
    options.return_format = ms::ReturnFormat::dot_paths;
    const auto found = tool.find(options);
    if (found.matched) {
        std::printf("\nFound at %s\n", std::get<std::string>(found.results.front()).c_str());
    }

    // -- Undo everything -------------------------------------------------------
    tool.revert_changes(changes);
    std::printf("\nAfter revert: %s\n", ms::json::dump(tool.rebuild()).c_str());
    std::printf("Pending changes: %zu\n", tool.get_changes().size());

    return 0;
}
