#include <nodeedit-cpp/json.hpp>

#include <nodeedit-cpp/rows.hpp>

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace nodeedit_cpp {

namespace {

auto row_type_from_string(std::string_view name) -> RowType {
    for (auto type : {RowType::null_value, RowType::boolean, RowType::number,
                      RowType::string, RowType::array, RowType::object}) {
        if (to_string_view(type) == name) return type;
    }
    throw std::runtime_error{"unknown row type: " + std::string{name}};
}

}  // anonymous namespace

// =============================================================================
// ADL serialization: to_json / from_json  (in namespace nodeedit_cpp)
// =============================================================================

void to_json(JsonValue& j, RowType type) {
    j = std::string{to_string_view(type)};
}

void from_json(const JsonValue& j, RowType& type) {
    type = row_type_from_string(j.get<std::string>());
}

void to_json(JsonValue& j, const NodeRow& row) {
    j = JsonValue::object();
    if (row.key) {
        j["key"] = *row.key;
    }
    j["value"] = row.value;
    j["type"] = row.type;
}

void from_json(const JsonValue& j, NodeRow& row) {
    row.key.reset();
    if (j.contains("key") && !j["key"].is_null()) {
        row.key = j["key"].get<std::string>();
    }
    row.value = j.value("value", JsonValue{});
    // Rows written by hand may leave out the tag; infer it from the value.
    row.type = j.contains("type") ? j["type"].get<RowType>() : row_type_of(row.value);
}

void to_json(JsonValue& j, const NodeData& node) {
    j = JsonValue{
        {"text", node.text},
        {"path", json::path_to_json(node.path)},
    };
}

void from_json(const JsonValue& j, NodeData& node) {
    node.text = j.value("text", JsonValue::array()).get<std::vector<NodeRow>>();
    node.path = json::path_from_json(j.value("path", JsonValue::array()));
}

void to_json(JsonValue& j, ErrorKind kind) {
    j = std::string{to_string_view(kind)};
}

void to_json(JsonValue& j, const Error& error) {
    j = JsonValue{
        {"kind", error.kind},
        {"message", error.message},
    };
}

// =============================================================================
// namespace nodeedit_cpp::json
// =============================================================================

namespace json {

auto path_to_json(const Path& path) -> JsonValue {
    auto result = JsonValue::array();
    for (const auto& segment : path) {
        std::visit(overload{
            [&](const std::string& key) { result.push_back(key); },
            [&](std::size_t index) { result.push_back(index); },
        }, segment);
    }
    return result;
}

auto path_from_json(const JsonValue& j) -> Path {
    if (!j.is_array()) {
        throw std::runtime_error{"path must be a JSON array"};
    }
    auto path = Path{};
    path.reserve(j.size());
    for (const auto& segment : j) {
        if (segment.is_string()) {
            path.emplace_back(segment.get<std::string>());
        } else if (segment.is_number_unsigned()) {
            path.emplace_back(segment.get<std::size_t>());
        } else if (segment.is_number_integer() && segment.get<std::int64_t>() >= 0) {
            path.emplace_back(static_cast<std::size_t>(segment.get<std::int64_t>()));
        } else {
            throw std::runtime_error{"path segment must be a string or a non-negative integer: "
                                     + segment.dump()};
        }
    }
    return path;
}

}  // namespace json

}  // namespace nodeedit_cpp
