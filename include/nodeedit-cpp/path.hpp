/// @file path.hpp
/// @brief Reading, writing and formatting values at a Path inside a JSON tree.

#pragma once

#include <nodeedit-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>

namespace nodeedit_cpp {

/// How far past the end of an array set_at_path may write. The gap is
/// filled with nulls.
inline constexpr std::size_t max_array_growth = 65536;

// =============================================================================
// Resolution
// =============================================================================

/// Find the value at a path, by live reference.
///
/// Walks one segment at a time. A string segment looks up an object member
/// (or an array element when the key is a canonical index such as "3"); a
/// number segment looks up an array element (or the member named by its
/// decimal form on an object). Reaching null, a scalar, or an absent entry
/// before the last segment yields nullptr. Never throws.
///
/// @return The value, or nullptr if the path does not resolve.
auto find_at_path(JsonValue& root, std::span<const PathSegment> path) -> JsonValue*;

/// Const overload of find_at_path.
auto find_at_path(const JsonValue& root, std::span<const PathSegment> path) -> const JsonValue*;

/// Get a copy of the value at a path.
///
/// A JSON null stored at the path is returned as a value; only a path that
/// does not resolve yields nullopt.
///
/// @code
/// auto name = get_at_path(doc, make_path("customer", 0, "name"));
/// @endcode
auto get_at_path(const JsonValue& root, std::span<const PathSegment> path) -> std::optional<JsonValue>;

/// Write a value at a path, growing the tree as needed, and return root.
///
/// With an empty path the whole root is replaced. Otherwise the root and
/// every intermediate are made able to hold the next segment: an absent,
/// null or scalar entry becomes an empty array when the next segment is a
/// number and an empty object otherwise; an array addressed by a
/// non-index key is promoted to an object keyed by its indices. Writing
/// past the end of an array pads it with nulls.
///
/// Throws std::out_of_range when an index lies max_array_growth or more
/// past the end of its array. Intermediates grown before that segment are
/// left in place.
auto set_at_path(JsonValue& root, std::span<const PathSegment> path, JsonValue value) -> JsonValue&;

// =============================================================================
// Formatting
// =============================================================================

/// Render a path as `$["key"][0]...`; the root renders as `$`.
///
/// Keys are wrapped in double quotes as is: a key containing `"` produces
/// ambiguous output.
auto format_path(std::span<const PathSegment> path) -> std::string;

/// Render a path as `$["key"][0]...`.
auto format_path(const Path& path) -> std::string;

/// Render an optional path; an absent path renders as `$`.
auto format_path(const std::optional<Path>& path) -> std::string;

/// Render a path as an RFC 6901 JSON Pointer (`/key/0`), root = "".
auto to_json_pointer(std::span<const PathSegment> path) -> std::string;

}  // namespace nodeedit_cpp
