/// @file rows.hpp
/// @brief Conversions between JSON values, flattened node rows and editable text.

#pragma once

#include <nodeedit-cpp/types.hpp>

#include <optional>
#include <span>
#include <string>

namespace nodeedit_cpp {

/// Default indentation of editable and committed JSON text.
inline constexpr int default_indent = 2;

/// The RowType tag describing a JSON value.
auto row_type_of(const JsonValue& value) -> RowType;

/// Render a node's rows as editable text.
///
/// - no rows: `{}`
/// - one keyless row: the value as raw text; a string is emitted without
///   quotes, so a plain string node does not round-trip through a JSON
///   parse
/// - otherwise: a pretty-printed object of the keyed scalar rows; container
///   rows and keyless rows are dropped
///
/// @code
/// auto text = normalize_rows(node.text);
/// @endcode
auto normalize_rows(std::span<const NodeRow> rows, int indent = default_indent) -> std::string;

/// Build the node a graph view shows for the value at a path.
///
/// An object yields one row per member; nested containers become rows
/// tagged array/object whose value is their child count. An array or a
/// scalar yields a single keyless row holding the whole value.
///
/// @return The node, or nullopt if the path does not resolve.
auto node_at(const JsonValue& root, const Path& path) -> std::optional<NodeData>;

}  // namespace nodeedit_cpp
