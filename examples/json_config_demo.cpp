// json_config_demo: JSON in, JSON out
//
// Loads a document and search options from JSON text, merges an overlay,
// and prints the resulting change list as JSON.
//
// Build: cmake -DMITHRIL_SYNC_BUILD_EXAMPLES=ON && cmake --build build
// Run:   ./build/json_config_demo

#include <mithril-sync/mithril_sync.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <string>

namespace ms = mithril_sync;
using json = nlohmann::json;

int main() {
    try {
        const auto base = ms::json::parse(R"({
            "database": {"host": "db.local", "port": 5432, "pool": {"size": 10}},
            "features": ["search", "export"],
            "debug": false
        })");
        const auto overlay = ms::json::parse(R"({
            "database": {"pool": {"size": 32, "timeout": 30}},
            "debug": true
        })");

        auto tool = ms::SyncTool{base};
        tool.merge_with(overlay);

        std::printf("Merged:\n%s\n\n", ms::json::dump(tool.rebuild(), 2).c_str());
        std::printf("Changes:\n%s\n\n", json(tool.get_changes()).dump(2).c_str());

        const auto options = json::parse(R"({
            "target": "^(size|timeout)$",
            "useRegex": true,
            "findAll": true,
            "matchValues": false,
            "onlyTypes": ["number"]
        })").get<ms::FindOptions>();
        std::printf("Pool settings:\n%s\n", json(tool.find(options)).dump(2).c_str());
    } catch (const ms::SyncError& e) {
        std::fprintf(stderr, "error (%s): %s\n",
                     std::string{ms::to_string_view(e.kind())}.c_str(), e.what());
        return 1;
    }
    return 0;
}
