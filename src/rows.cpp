#include <nodeedit-cpp/rows.hpp>

#include <nodeedit-cpp/path.hpp>

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace nodeedit_cpp {

namespace {

/// Text of a bare value: strings unquoted, everything else as compact JSON.
auto raw_text(const JsonValue& value) -> std::string {
    if (value.is_string()) return value.get<std::string>();
    return value.dump(-1, ' ', false, JsonValue::error_handler_t::replace);
}

auto summary_row(std::string key, const JsonValue& child) -> NodeRow {
    auto type = row_type_of(child);
    if (is_container(type)) {
        return NodeRow{std::move(key), JsonValue(child.size()), type};
    }
    return NodeRow{std::move(key), child, type};
}

}  // anonymous namespace

auto row_type_of(const JsonValue& value) -> RowType {
    switch (value.type()) {
        case JsonValue::value_t::object:
            return RowType::object;
        case JsonValue::value_t::array:
            return RowType::array;
        case JsonValue::value_t::string:
            return RowType::string;
        case JsonValue::value_t::boolean:
            return RowType::boolean;
        case JsonValue::value_t::number_integer:
        case JsonValue::value_t::number_unsigned:
        case JsonValue::value_t::number_float:
            return RowType::number;
        default:
            return RowType::null_value;
    }
}

auto normalize_rows(std::span<const NodeRow> rows, int indent) -> std::string {
    if (rows.empty()) return "{}";
    if (rows.size() == 1 && !rows.front().has_key()) return raw_text(rows.front().value);

    auto obj = JsonValue::object();
    for (const auto& row : rows) {
        if (is_container(row.type) || !row.has_key()) continue;
        obj[*row.key] = row.value;
    }
    return obj.dump(indent, ' ', false, JsonValue::error_handler_t::replace);
}

auto node_at(const JsonValue& root, const Path& path) -> std::optional<NodeData> {
    const auto* value = find_at_path(root, path);
    if (value == nullptr) return std::nullopt;

    auto node = NodeData{{}, path};
    if (value->is_object()) {
        node.text.reserve(value->size());
        for (const auto& [key, child] : value->items()) {
            node.text.push_back(summary_row(key, child));
        }
    } else {
        node.text.push_back(NodeRow{std::nullopt, *value, row_type_of(*value)});
    }
    return node;
}

}  // namespace nodeedit_cpp
