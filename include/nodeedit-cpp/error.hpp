/// @file error.hpp
/// @brief Error types for the nodeedit-cpp library.

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace nodeedit_cpp {

/// Categories of errors that can occur while editing a node.
enum class ErrorKind : std::uint8_t {
    invalid_document,   ///< The stored full document is not valid JSON.
    invalid_draft,      ///< The draft text is not valid JSON.
    invalid_operation,  ///< An operation is invalid in the current session state.
    save_failed,        ///< Loading, merging or committing the document failed.
};

/// Convert an ErrorKind to its string representation.
constexpr auto to_string_view(ErrorKind kind) noexcept -> std::string_view {
    switch (kind) {
        case ErrorKind::invalid_document:  return "invalid_document";
        case ErrorKind::invalid_draft:     return "invalid_draft";
        case ErrorKind::invalid_operation: return "invalid_operation";
        case ErrorKind::save_failed:       return "save_failed";
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

}  // namespace nodeedit_cpp
