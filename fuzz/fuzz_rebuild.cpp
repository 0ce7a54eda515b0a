// Fuzz target for rebuild and change application: every input line is a
// dotPath; entries are rebuilt and the resulting changes applied and
// inverted.

#include <mithril-sync/diff.hpp>
#include <mithril-sync/error.hpp>
#include <mithril-sync/flatten.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ms = mithril_sync;
    auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    auto entries = std::vector<ms::Entry>{};
    auto ordinal = std::int64_t{0};
    while (!text.empty() && entries.size() < 64) {
        auto end = text.find('\n');
        auto line = text.substr(0, end);
        text = end == std::string_view::npos ? std::string_view{} : text.substr(end + 1);

        auto path = ms::decode_path(line);
        if (!path.empty()) entries.push_back(ms::make_entry(std::move(path), ordinal++));
    }

    try {
        const auto tree = ms::rebuild(entries);
        const auto changes = ms::diff({}, ms::flatten(tree));
        auto copy = ms::from_diff(ms::Value{ms::Object{}}, changes);
        ms::apply_changes(copy, ms::invert_changes(changes));
    } catch (const ms::SyncError&) {
        // Mixed field/index addressing and far out-of-range indices are rejected
    }

    return 0;
}
