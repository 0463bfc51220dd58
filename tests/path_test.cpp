// path_test.cpp — Tests for path resolution, writes and formatting

#include <nodeedit-cpp/path.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ne = nodeedit_cpp;
using ne::JsonValue;

namespace {

auto sample_document() -> JsonValue {
    return JsonValue::parse(R"({
        "customer": {"name": "Ada", "tags": ["vip", "early"], "note": null},
        "orders": [{"id": 1, "total": 9.5}, {"id": 2, "total": 20}],
        "count": 2
    })");
}

}  // namespace

// =============================================================================
// make_path
// =============================================================================

TEST(MakePath, mixes_keys_and_indices) {
    auto path = ne::make_path("customer", 0, std::string{"name"}, std::size_t{3});
    ASSERT_EQ(path.size(), 4u);
    EXPECT_EQ(std::get<std::string>(path[0]), "customer");
    EXPECT_EQ(std::get<std::size_t>(path[1]), 0u);
    EXPECT_EQ(std::get<std::string>(path[2]), "name");
    EXPECT_EQ(std::get<std::size_t>(path[3]), 3u);
}

TEST(MakePath, negative_index_throws) {
    EXPECT_THROW(ne::make_path("a", -1), std::invalid_argument);
    EXPECT_THROW(ne::make_path(-5), std::invalid_argument);
}

TEST(MakePath, segment_helpers) {
    EXPECT_EQ(ne::object_key("k"), ne::PathSegment{std::string{"k"}});
    EXPECT_EQ(ne::array_index(4), ne::PathSegment{std::size_t{4}});
}

// =============================================================================
// get_at_path / find_at_path
// =============================================================================

TEST(GetAtPath, empty_path_returns_root) {
    auto doc = sample_document();
    auto result = ne::get_at_path(doc, ne::Path{});
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, doc);
}

TEST(GetAtPath, nested_key_and_index) {
    auto doc = sample_document();
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("customer", "name")), "Ada");
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("orders", 1, "id")), 2);
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("customer", "tags", 0)), "vip");
}

TEST(GetAtPath, missing_key_returns_nullopt) {
    auto doc = sample_document();
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("nope")).has_value());
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("customer", "nope", "deeper")).has_value());
}

TEST(GetAtPath, index_out_of_range_returns_nullopt) {
    auto doc = sample_document();
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("orders", 2)).has_value());
}

TEST(GetAtPath, null_final_value_is_present) {
    auto doc = sample_document();
    auto result = ne::get_at_path(doc, ne::make_path("customer", "note"));
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->is_null());
}

TEST(GetAtPath, null_intermediate_short_circuits) {
    auto doc = sample_document();
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("customer", "note", "x")).has_value());
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("customer", "note", 0)).has_value());
}

TEST(GetAtPath, scalar_intermediate_returns_nullopt) {
    auto doc = sample_document();
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("count", "x")).has_value());
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("customer", "name", 0)).has_value());
}

TEST(GetAtPath, index_key_on_array) {
    auto doc = sample_document();
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("orders", "1", "id")), 2);
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("orders", "01")).has_value());
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("orders", "-1")).has_value());
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("orders", "first")).has_value());
}

TEST(GetAtPath, index_on_object_uses_decimal_key) {
    auto doc = JsonValue::parse(R"({"m": {"0": "zero", "12": "twelve"}})");
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("m", 0)), "zero");
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("m", 12)), "twelve");
    EXPECT_FALSE(ne::get_at_path(doc, ne::make_path("m", 1)).has_value());
}

TEST(GetAtPath, never_throws_on_dangling_paths) {
    auto doc = sample_document();
    const auto paths = std::vector<ne::Path>{
        ne::make_path("count", "a", "b"),
        ne::make_path("orders", 99, "id"),
        ne::make_path("customer", "tags", "x", 0),
        ne::make_path(0, 1, 2),
    };
    for (const auto& path : paths) {
        EXPECT_NO_THROW({ EXPECT_FALSE(ne::get_at_path(doc, path).has_value()); });
    }
}

TEST(FindAtPath, returns_live_reference) {
    auto doc = sample_document();
    auto* name = ne::find_at_path(doc, ne::make_path("customer", "name"));
    ASSERT_NE(name, nullptr);
    *name = "Grace";
    EXPECT_EQ(doc["customer"]["name"], "Grace");
}

TEST(FindAtPath, const_overload) {
    const auto doc = sample_document();
    const auto* total = ne::find_at_path(doc, ne::make_path("orders", 0, "total"));
    ASSERT_NE(total, nullptr);
    EXPECT_DOUBLE_EQ(total->get<double>(), 9.5);
    EXPECT_EQ(ne::find_at_path(doc, ne::make_path("missing")), nullptr);
}

// =============================================================================
// set_at_path
// =============================================================================

TEST(SetAtPath, empty_path_replaces_root) {
    auto doc = sample_document();
    ne::set_at_path(doc, ne::Path{}, JsonValue(42));
    EXPECT_EQ(doc, 42);
}

TEST(SetAtPath, returns_root_reference) {
    auto doc = sample_document();
    auto& result = ne::set_at_path(doc, ne::make_path("count"), JsonValue(3));
    EXPECT_EQ(&result, &doc);
    EXPECT_EQ(doc["count"], 3);
}

TEST(SetAtPath, overwrites_existing_value) {
    auto doc = sample_document();
    ne::set_at_path(doc, ne::make_path("orders", 0, "total"), JsonValue(12));
    EXPECT_EQ(doc["orders"][0]["total"], 12);
    EXPECT_EQ(doc["orders"][0]["id"], 1);
}

TEST(SetAtPath, creates_missing_objects) {
    auto doc = JsonValue::object();
    ne::set_at_path(doc, ne::make_path("a", "b", "c"), JsonValue("x"));
    EXPECT_EQ(doc, JsonValue::parse(R"({"a": {"b": {"c": "x"}}})"));
}

TEST(SetAtPath, creates_array_when_next_segment_is_index) {
    auto doc = JsonValue::object();
    ne::set_at_path(doc, ne::make_path("items", 0, "name"), JsonValue("first"));
    ASSERT_TRUE(doc["items"].is_array());
    EXPECT_EQ(doc["items"][0]["name"], "first");
}

TEST(SetAtPath, pads_array_with_nulls) {
    auto doc = JsonValue::object();
    ne::set_at_path(doc, ne::make_path("items", 2), JsonValue(true));
    EXPECT_EQ(doc["items"], JsonValue::parse("[null, null, true]"));
}

TEST(SetAtPath, grows_up_to_the_limit) {
    auto doc = JsonValue::object();
    ne::set_at_path(doc, ne::make_path("items", ne::max_array_growth - 1), JsonValue(1));
    ASSERT_EQ(doc["items"].size(), ne::max_array_growth);
    EXPECT_TRUE(doc["items"][0].is_null());
    EXPECT_EQ(doc["items"].back(), 1);
}

TEST(SetAtPath, index_far_past_the_end_throws) {
    auto doc = JsonValue::parse(R"({"items": [1, 2]})");
    EXPECT_THROW(ne::set_at_path(doc, ne::make_path("items", std::size_t{2} + ne::max_array_growth),
                                 JsonValue(3)),
                 std::out_of_range);
    EXPECT_THROW(ne::set_at_path(doc, ne::make_path("items", std::size_t{4000000000}), JsonValue(3)),
                 std::out_of_range);
    EXPECT_THROW(ne::set_at_path(doc, ne::make_path("items", "4000000000"), JsonValue(3)),
                 std::out_of_range);
    EXPECT_EQ(doc["items"], JsonValue::parse("[1, 2]"));
}

TEST(SetAtPath, replaces_scalar_intermediate) {
    auto doc = JsonValue::parse(R"({"a": 5, "keep": 1})");
    ne::set_at_path(doc, ne::make_path("a", "b"), JsonValue(1));
    EXPECT_EQ(doc, JsonValue::parse(R"({"a": {"b": 1}, "keep": 1})"));
}

TEST(SetAtPath, replaces_null_intermediate) {
    auto doc = JsonValue::parse(R"({"a": null})");
    ne::set_at_path(doc, ne::make_path("a", 0), JsonValue("v"));
    EXPECT_EQ(doc["a"], JsonValue::parse(R"(["v"])"));
}

TEST(SetAtPath, scalar_root_becomes_container) {
    auto doc = JsonValue(7);
    ne::set_at_path(doc, ne::make_path("x"), JsonValue(1));
    EXPECT_EQ(doc, JsonValue::parse(R"({"x": 1})"));

    auto list = JsonValue(nullptr);
    ne::set_at_path(list, ne::make_path(1), JsonValue(1));
    EXPECT_EQ(list, JsonValue::parse("[null, 1]"));
}

TEST(SetAtPath, index_on_object_writes_decimal_key) {
    auto doc = JsonValue::parse(R"({"m": {"0": "zero"}})");
    ne::set_at_path(doc, ne::make_path("m", 1), JsonValue("one"));
    EXPECT_EQ(doc["m"], JsonValue::parse(R"({"0": "zero", "1": "one"})"));
}

TEST(SetAtPath, index_key_on_array_writes_element) {
    auto doc = JsonValue::parse(R"({"arr": [1, 2]})");
    ne::set_at_path(doc, ne::make_path("arr", "1"), JsonValue(20));
    EXPECT_EQ(doc["arr"], JsonValue::parse("[1, 20]"));
}

TEST(SetAtPath, named_key_promotes_array_to_object) {
    auto doc = JsonValue::parse(R"({"arr": [1, 2]})");
    ne::set_at_path(doc, ne::make_path("arr", "k"), JsonValue("v"));
    EXPECT_EQ(doc["arr"], JsonValue::parse(R"({"0": 1, "1": 2, "k": "v"})"));
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("arr", 0)), 1);
}

TEST(SetAtPath, preserves_key_order) {
    auto doc = JsonValue::parse(R"({"z": 1, "a": 2})");
    ne::set_at_path(doc, ne::make_path("z"), JsonValue(10));
    ne::set_at_path(doc, ne::make_path("m"), JsonValue(3));
    EXPECT_EQ(doc.dump(), R"({"z":10,"a":2,"m":3})");
}

// =============================================================================
// Properties
// =============================================================================

TEST(SetAtPath, get_after_set_returns_value) {
    const auto trees = std::vector<JsonValue>{
        JsonValue{},
        JsonValue(3),
        JsonValue::array(),
        JsonValue::parse(R"({"a": [1, {"b": null}], "c": "s"})"),
        JsonValue::parse(R"([[1, 2], {"0": true}])"),
    };
    const auto paths = std::vector<ne::Path>{
        ne::Path{},
        ne::make_path("a"),
        ne::make_path("a", 1, "b"),
        ne::make_path("a", "x"),
        ne::make_path(0, 5),
        ne::make_path(1, 0, "deep"),
        ne::make_path("c", "d", 2),
    };
    const auto value = JsonValue::parse(R"({"v": [1, 2, 3]})");

    for (const auto& tree : trees) {
        for (const auto& path : paths) {
            auto doc = tree;
            ne::set_at_path(doc, path, value);
            auto result = ne::get_at_path(doc, path);
            ASSERT_TRUE(result.has_value()) << tree.dump() << " at " << ne::format_path(path);
            EXPECT_EQ(*result, value) << tree.dump() << " at " << ne::format_path(path);
        }
    }
}

TEST(SetAtPath, leaves_sibling_paths_untouched) {
    auto doc = sample_document();
    const auto before = doc;
    ne::set_at_path(doc, ne::make_path("customer", "tags", 1), JsonValue("late"));

    const auto siblings = std::vector<ne::Path>{
        ne::make_path("customer", "name"),
        ne::make_path("customer", "tags", 0),
        ne::make_path("customer", "note"),
        ne::make_path("orders"),
        ne::make_path("count"),
    };
    for (const auto& path : siblings) {
        EXPECT_EQ(ne::get_at_path(doc, path), ne::get_at_path(before, path))
            << ne::format_path(path);
    }
}

TEST(SetAtPath, promotion_keeps_existing_elements_reachable) {
    auto doc = JsonValue::parse(R"({"arr": ["a", "b"]})");
    ne::set_at_path(doc, ne::make_path("arr", "name"), JsonValue("n"));
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("arr", 0)), "a");
    EXPECT_EQ(*ne::get_at_path(doc, ne::make_path("arr", 1)), "b");
}

// =============================================================================
// format_path / to_json_pointer
// =============================================================================

TEST(FormatPath, root_is_dollar) {
    EXPECT_EQ(ne::format_path(ne::Path{}), "$");
    EXPECT_EQ(ne::format_path(std::nullopt), "$");
}

TEST(FormatPath, keys_quoted_indices_bare) {
    EXPECT_EQ(ne::format_path(ne::make_path("customer", 0, "name")), R"($["customer"][0]["name"])");
    EXPECT_EQ(ne::format_path(ne::make_path(3)), "$[3]");
}

TEST(FormatPath, optional_path) {
    auto path = std::optional<ne::Path>{ne::make_path("a")};
    EXPECT_EQ(ne::format_path(path), R"($["a"])");
}

TEST(FormatPath, embedded_quote_is_not_escaped) {
    EXPECT_EQ(ne::format_path(ne::make_path("say \"hi\"")), R"($["say "hi""])");
}

TEST(ToJsonPointer, escapes_segments) {
    EXPECT_EQ(ne::to_json_pointer(ne::Path{}), "");
    EXPECT_EQ(ne::to_json_pointer(ne::make_path("a/b", "m~n", 0)), "/a~1b/m~0n/0");
}

TEST(ToJsonPointer, agrees_with_nlohmann_pointer) {
    auto doc = sample_document();
    auto path = ne::make_path("orders", 1, "total");
    auto pointer = nlohmann::ordered_json::json_pointer{ne::to_json_pointer(path)};
    EXPECT_EQ(doc.at(pointer), *ne::get_at_path(doc, path));
}
