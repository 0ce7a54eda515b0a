/// @file error.hpp
/// @brief Error types for the mithril-sync library.

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace mithril_sync {

/// Categories of errors that can occur in the library.
enum class ErrorKind : std::uint8_t {
    invalid_argument,  ///< Malformed input: scalar root, empty path, bad step,
                       ///< unknown change type.
    invalid_pattern,   ///< A search pattern failed to compile as a regex.
    invalid_json,      ///< JSON text or a JSON document could not be converted.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_argument: return "invalid_argument";
        case ErrorKind::invalid_pattern:  return "invalid_pattern";
        case ErrorKind::invalid_json:     return "invalid_json";
    }
    return "unknown";
}

/// A structured error with a category and a human-readable message.
struct Error {
    ErrorKind kind;      ///< The category of this error.
    std::string message; ///< A human-readable description.

    /// Construct an Error with the given kind and message.
    Error(ErrorKind k, std::string msg)
        : kind{k}, message{std::move(msg)} {}

    auto operator==(const Error& other) const -> bool = default;
};

/// Exception thrown by every fallible library operation.
///
/// what() returns the message; kind() tells the category apart without
/// string matching.
class SyncError : public std::runtime_error {
public:
    SyncError(ErrorKind kind, const std::string& message)
        : std::runtime_error{message}, kind_{kind} {}

    auto kind() const noexcept -> ErrorKind { return kind_; }

    /// The error as a plain value.
    auto error() const -> Error { return Error{kind_, what()}; }

private:
    ErrorKind kind_;
};

}  // namespace mithril_sync
