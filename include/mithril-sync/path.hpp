/// @file path.hpp
/// @brief Structural paths and their dotPath string encoding.

#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace mithril_sync {

/// A path element: either a field name or a sequence/collection index.
using Step = std::variant<std::string, std::size_t>;

/// A path from the root of a structure (e.g. "user" / "tags" / 0).
/// The root path is empty.
using Path = std::vector<Step>;

/// Create a field-name Step.
inline auto key_step(std::string key) -> Step { return Step{std::move(key)}; }

/// Create an index Step.
inline auto index_step(std::size_t idx) -> Step { return Step{idx}; }

inline auto is_index(const Step& step) -> bool {
    return std::holds_alternative<std::size_t>(step);
}

/// How far past its current end an Array may be extended by writing at an
/// index; the gap is filled with Undefined holes.
inline constexpr std::size_t max_index_growth = 65536;

/// The string form of a step: the field name, or the decimal index.
auto to_string(const Step& step) -> std::string;

/// Parse a canonical decimal index ("0", "42"; no sign, no leading zeros).
auto parse_index(std::string_view segment) -> std::optional<std::size_t>;

/// Join the string forms of the steps with '.'.
///
/// The encoding is lossy: a field name containing '.' splits into several
/// segments on decoding, and a field name that is a canonical decimal
/// decodes as an index. Keep the structural Path when fidelity matters.
auto encode_path(const Path& path) -> std::string;

/// Split a dotPath on '.'. Canonical decimal segments become index Steps,
/// every other segment a field Step. "" decodes to the root path.
auto decode_path(std::string_view dot_path) -> Path;

}  // namespace mithril_sync
