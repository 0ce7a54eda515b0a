// Fuzz target for the dotPath codec: decoding arbitrary text must not
// crash, and re-encoding a decoded path must reproduce the input.

#include <mithril-sync/path.hpp>

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto text = std::string_view(reinterpret_cast<const char*>(data), size);

    const auto path = mithril_sync::decode_path(text);
    if (mithril_sync::encode_path(path) != text) std::abort();

    return 0;
}
