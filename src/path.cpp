#include <mithril-sync/path.hpp>

#include <charconv>

namespace mithril_sync {

auto to_string(const Step& step) -> std::string {
    if (const auto* idx = std::get_if<std::size_t>(&step)) {
        return std::to_string(*idx);
    }
    return std::get<std::string>(step);
}

auto parse_index(std::string_view segment) -> std::optional<std::size_t> {
    if (segment.empty()) return std::nullopt;
    // Leading zeros would not survive re-encoding
    if (segment.size() > 1 && segment[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(segment.data(), segment.data() + segment.size(), result);
    if (ec == std::errc{} && ptr == segment.data() + segment.size()) return result;
    return std::nullopt;
}

auto encode_path(const Path& path) -> std::string {
    auto result = std::string{};
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (i > 0) result += '.';
        result += to_string(path[i]);
    }
    return result;
}

auto decode_path(std::string_view dot_path) -> Path {
    auto path = Path{};
    if (dot_path.empty()) return path;

    auto pos = std::size_t{0};
    while (true) {
        auto next = dot_path.find('.', pos);
        auto segment = dot_path.substr(pos, next == std::string_view::npos ? next : next - pos);
        if (auto idx = parse_index(segment)) {
            path.emplace_back(*idx);
        } else {
            path.emplace_back(std::string{segment});
        }
        if (next == std::string_view::npos) break;
        pos = next + 1;
    }
    return path;
}

}  // namespace mithril_sync
