// Fuzz target for JSON text import: exercises the tagged map/set/undefined
// decoding and the flatten/rebuild round trip on whatever parses.

#include <mithril-sync/error.hpp>
#include <mithril-sync/flatten.hpp>
#include <mithril-sync/json.hpp>

#include <cstddef>
#include <cstdint>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    try {
        const auto value = mithril_sync::json::parse(text);
        auto dumped = mithril_sync::json::dump(value);
        (void)dumped;

        if (value.is_container()) {
            const auto mode = mithril_sync::FlattenMode::with_containers;
            auto rebuilt = mithril_sync::rebuild(mithril_sync::flatten(value, mode), mode);
            (void)rebuilt;
        }
    } catch (const mithril_sync::SyncError&) {
        // Malformed input and unaddressable paths are expected
    }

    return 0;
}
