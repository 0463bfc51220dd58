/// @file json.hpp
/// @brief nlohmann/json serialization of the library's types.
///
/// Provides ADL serialization (to_json/from_json) for rows, nodes and
/// errors, and explicit conversions for Path, whose segments are a
/// std::variant and so cannot be reached through ADL.

#pragma once

#include <nodeedit-cpp/error.hpp>
#include <nodeedit-cpp/types.hpp>

#include <nlohmann/json.hpp>

namespace nodeedit_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Rows ---------------------------------------------------------------------

void to_json(JsonValue& j, RowType type);
void from_json(const JsonValue& j, RowType& type);

/// `{"key": ..., "value": ..., "type": "..."}`; "key" is omitted for a
/// keyless row.
void to_json(JsonValue& j, const NodeRow& row);
void from_json(const JsonValue& j, NodeRow& row);

/// `{"text": [rows...], "path": [segments...]}`
void to_json(JsonValue& j, const NodeData& node);
void from_json(const JsonValue& j, NodeData& node);

// -- Errors -------------------------------------------------------------------

void to_json(JsonValue& j, ErrorKind kind);
void to_json(JsonValue& j, const Error& error);

// =============================================================================
// namespace nodeedit_cpp::json — non-ADL conversions
// =============================================================================

namespace json {

/// Convert a path to a JSON array: keys as strings, indices as numbers.
auto path_to_json(const Path& path) -> JsonValue;

/// Convert a JSON array of strings and non-negative integers to a path.
/// Throws std::runtime_error for any other shape.
auto path_from_json(const JsonValue& j) -> Path;

}  // namespace json

}  // namespace nodeedit_cpp
