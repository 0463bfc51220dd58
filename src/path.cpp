#include <nodeedit-cpp/path.hpp>

#include <charconv>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>

namespace nodeedit_cpp {

namespace {

/// Try to parse a key as an array index. Leading zeros and signs are not
/// allowed, except "0" itself.
auto try_parse_index(std::string_view key) -> std::optional<std::size_t> {
    if (key.empty()) return std::nullopt;
    if (key.size() > 1 && key[0] == '0') return std::nullopt;
    auto result = std::size_t{0};
    auto [ptr, ec] = std::from_chars(key.data(), key.data() + key.size(), result);
    if (ec == std::errc{} && ptr == key.data() + key.size()) return result;
    return std::nullopt;
}

auto index_key(std::size_t index) -> std::string {
    return std::to_string(index);
}

// -- Reading ------------------------------------------------------------------

template <typename Json>
auto child_of(Json& node, const PathSegment& segment) -> Json* {
    return std::visit(overload{
        [&](const std::string& key) -> Json* {
            switch (node.type()) {
                case JsonValue::value_t::object: {
                    auto it = node.find(key);
                    return it == node.end() ? nullptr : &*it;
                }
                case JsonValue::value_t::array: {
                    auto idx = try_parse_index(key);
                    if (!idx || *idx >= node.size()) return nullptr;
                    return &node[*idx];
                }
                default:
                    return nullptr;
            }
        },
        [&](std::size_t index) -> Json* {
            switch (node.type()) {
                case JsonValue::value_t::array:
                    return index < node.size() ? &node[index] : nullptr;
                case JsonValue::value_t::object: {
                    auto it = node.find(index_key(index));
                    return it == node.end() ? nullptr : &*it;
                }
                default:
                    return nullptr;
            }
        },
    }, segment);
}

template <typename Json>
auto find_impl(Json& root, std::span<const PathSegment> path) -> Json* {
    auto* ref = &root;
    for (const auto& segment : path) {
        if (ref == nullptr || ref->is_null()) return nullptr;
        ref = child_of(*ref, segment);
    }
    return ref;
}

// -- Writing ------------------------------------------------------------------

/// Check whether a node can hold an entry addressed by this segment without
/// being reshaped.
auto accepts(const JsonValue& node, const PathSegment& segment) -> bool {
    return std::visit(overload{
        [&](const std::string& key) {
            return node.is_object() || (node.is_array() && try_parse_index(key).has_value());
        },
        [&](std::size_t) {
            return node.is_object() || node.is_array();
        },
    }, segment);
}

/// An array addressed by name becomes an object keyed by its indices.
void promote_to_object(JsonValue& node) {
    auto promoted = JsonValue::object();
    for (std::size_t i = 0; i < node.size(); ++i) {
        promoted[index_key(i)] = std::move(node[i]);
    }
    node = std::move(promoted);
}

/// Make node able to hold the entry addressed by segment.
void prepare_container(JsonValue& node, const PathSegment& segment) {
    if (accepts(node, segment)) return;
    if (node.is_array()) {
        promote_to_object(node);
        return;
    }
    if (std::holds_alternative<std::size_t>(segment)) {
        node = JsonValue::array();
    } else {
        node = JsonValue::object();
    }
}

/// Return the slot for segment inside an accepting container, creating it
/// (as null) when absent.
auto slot_of(JsonValue& node, const PathSegment& segment) -> JsonValue& {
    auto element = [&](std::size_t index) -> JsonValue& {
        if (index >= node.size()) {
            if (index - node.size() >= max_array_growth) {
                throw std::out_of_range{"array index " + std::to_string(index)
                                        + " is too far past the end of an array of size "
                                        + std::to_string(node.size())};
            }
            node.get_ref<JsonValue::array_t&>().resize(index + 1);
        }
        return node[index];
    };
    return std::visit(overload{
        [&](const std::string& key) -> JsonValue& {
            if (node.is_array()) return element(*try_parse_index(key));
            return node[key];
        },
        [&](std::size_t index) -> JsonValue& {
            if (node.is_array()) return element(index);
            return node[index_key(index)];
        },
    }, segment);
}

// -- Formatting ---------------------------------------------------------------

/// Escape a segment for RFC 6901: ~ -> ~0, / -> ~1
auto escape_pointer_segment(std::string_view segment) -> std::string {
    auto result = std::string{};
    result.reserve(segment.size());
    for (char c : segment) {
        if (c == '~') { result += "~0"; }
        else if (c == '/') { result += "~1"; }
        else { result += c; }
    }
    return result;
}

}  // anonymous namespace

auto find_at_path(JsonValue& root, std::span<const PathSegment> path) -> JsonValue* {
    return find_impl(root, path);
}

auto find_at_path(const JsonValue& root, std::span<const PathSegment> path) -> const JsonValue* {
    return find_impl(root, path);
}

auto get_at_path(const JsonValue& root, std::span<const PathSegment> path)
    -> std::optional<JsonValue> {
    if (const auto* found = find_at_path(root, path)) return *found;
    return std::nullopt;
}

auto set_at_path(JsonValue& root, std::span<const PathSegment> path, JsonValue value)
    -> JsonValue& {
    if (path.empty()) {
        root = std::move(value);
        return root;
    }

    auto* ref = &root;
    for (std::size_t i = 0; i + 1 < path.size(); ++i) {
        prepare_container(*ref, path[i]);
        ref = &slot_of(*ref, path[i]);
    }
    prepare_container(*ref, path.back());
    slot_of(*ref, path.back()) = std::move(value);
    return root;
}

auto format_path(std::span<const PathSegment> path) -> std::string {
    if (path.empty()) return "$";
    auto result = std::string{"$"};
    for (const auto& segment : path) {
        result += '[';
        std::visit(overload{
            [&](const std::string& key) {
                result += '"';
                result += key;
                result += '"';
            },
            [&](std::size_t index) { result += index_key(index); },
        }, segment);
        result += ']';
    }
    return result;
}

auto format_path(const Path& path) -> std::string {
    return format_path(std::span<const PathSegment>{path});
}

auto format_path(const std::optional<Path>& path) -> std::string {
    if (!path) return "$";
    return format_path(*path);
}

auto to_json_pointer(std::span<const PathSegment> path) -> std::string {
    auto result = std::string{};
    for (const auto& segment : path) {
        result += '/';
        std::visit(overload{
            [&](const std::string& key) { result += escape_pointer_segment(key); },
            [&](std::size_t index) { result += index_key(index); },
        }, segment);
    }
    return result;
}

}  // namespace nodeedit_cpp
