/// @file types.hpp
/// @brief Core value types: JsonValue, PathSegment, Path, RowType, NodeRow, NodeData.

#pragma once

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nodeedit_cpp {

/// A JSON value tree: null, boolean, number, string, array or object.
///
/// Objects keep their keys in insertion order, so a document written back
/// after an edit preserves the layout the user saw.
using JsonValue = nlohmann::ordered_json;

/// One step of a Path: an object key (string) or an array index (size_t).
using PathSegment = std::variant<std::string, std::size_t>;

/// An ordered sequence of segments locating a value inside a JSON tree.
/// The empty path is the root.
using Path = std::vector<PathSegment>;

/// Create an object key segment from a string.
inline auto object_key(std::string key) -> PathSegment { return PathSegment{std::move(key)}; }

/// Create an array index segment from an index.
inline auto array_index(std::size_t idx) -> PathSegment { return PathSegment{idx}; }

// -- Variant visitor helper ---------------------------------------------------

/// Helper for constructing ad-hoc visitors from lambdas.
///
/// @code
/// std::visit(overload{
///     [](const std::string& key) { printf("%s\n", key.c_str()); },
///     [](std::size_t index) { printf("%zu\n", index); },
/// }, segment);
/// @endcode
template <typename... Ts>
struct overload : Ts... { using Ts::operator()...; };

template <typename... Ts>
overload(Ts...) -> overload<Ts...>;

/// Build a Path from a mixed list of keys and indices. A negative int index
/// throws std::invalid_argument.
///
/// @code
/// auto path = make_path("customer", 0, "name");
/// @endcode
template <typename... Segments>
auto make_path(Segments&&... segments) -> Path {
    auto path = Path{};
    path.reserve(sizeof...(Segments));
    auto to_segment = overload{
        [](std::string_view s) -> PathSegment { return std::string{s}; },
        [](const char* s) -> PathSegment { return std::string{s}; },
        [](const std::string& s) -> PathSegment { return s; },
        [](std::size_t i) -> PathSegment { return i; },
        [](int i) -> PathSegment {
            if (i < 0) throw std::invalid_argument{"negative path index: " + std::to_string(i)};
            return static_cast<std::size_t>(i);
        },
    };
    (path.push_back(to_segment(std::forward<Segments>(segments))), ...);
    return path;
}

// -- Node rows ----------------------------------------------------------------

/// The kind of value a NodeRow holds.
enum class RowType : std::uint8_t {
    null_value,  ///< JSON null.
    boolean,     ///< true / false.
    number,      ///< Integer or floating point number.
    string,      ///< A string.
    array,       ///< A nested array, edited by navigating to it.
    object,      ///< A nested object, edited by navigating to it.
};

/// Convert a RowType to its string representation.
constexpr auto to_string_view(RowType type) noexcept -> std::string_view {
    switch (type) {
        case RowType::null_value: return "null";
        case RowType::boolean:    return "boolean";
        case RowType::number:     return "number";
        case RowType::string:     return "string";
        case RowType::array:      return "array";
        case RowType::object:     return "object";
    }
    return "unknown";
}

/// Check if a row of this type stands for a nested container.
constexpr auto is_container(RowType type) noexcept -> bool {
    return type == RowType::array || type == RowType::object;
}

/// One flattened field of a node's content.
///
/// A keyed row is one member of an object node; a single keyless row is
/// the whole content of a scalar node. Rows tagged array/object stand for
/// nested containers and carry a summary value only.
struct NodeRow {
    std::optional<std::string> key;  ///< Member name, absent for a bare value.
    JsonValue value;                 ///< The member's value.
    RowType type{RowType::null_value};

    /// True when the row has a non-empty key.
    auto has_key() const -> bool { return key.has_value() && !key->empty(); }

    auto operator==(const NodeRow&) const -> bool = default;
};

/// The currently selected node: its display rows and its location.
struct NodeData {
    std::vector<NodeRow> text;  ///< Display content, one row per field.
    Path path;                  ///< Location inside the full document.

    auto operator==(const NodeData&) const -> bool = default;
};

}  // namespace nodeedit_cpp
