// draft_test.cpp — Tests for draft validation

#include <nodeedit-cpp/draft.hpp>

#include <gtest/gtest.h>

#include <string>

namespace ne = nodeedit_cpp;

// =============================================================================
// validate_draft
// =============================================================================

TEST(ValidateDraft, accepts_any_json_value) {
    for (const auto* text : {"{}", "[]", "[1, 2]", "42", "-0.5", "\"text\"", "true", "null",
                             " \n {\"a\": {\"b\": [null]}} \t"}) {
        auto status = ne::validate_draft(text);
        EXPECT_TRUE(status.valid) << text;
        EXPECT_FALSE(status.error.has_value()) << text;
    }
}

TEST(ValidateDraft, rejects_malformed_text_with_parser_message) {
    for (const auto* text : {"hello", "", "{", "{\"a\": 1,}", "[1 2]", "{'a': 1}", "{} {}"}) {
        auto status = ne::validate_draft(text);
        EXPECT_FALSE(status.valid) << text;
        ASSERT_TRUE(status.error.has_value()) << text;
        EXPECT_NE(status.error->find("parse error"), std::string::npos) << *status.error;
    }
}

TEST(ValidateDraft, comments_rejected_by_default) {
    const auto text = std::string{"// note\n{\"a\": 1 /* inline */}"};
    EXPECT_FALSE(ne::validate_draft(text).valid);
    EXPECT_TRUE(ne::validate_draft(text, ne::ValidationOptions{true}).valid);
}

TEST(ParseDraft, returns_value) {
    auto value = ne::parse_draft(R"({"z": 1, "a": [true]})");
    EXPECT_EQ(value.dump(), R"({"z":1,"a":[true]})");
}

TEST(ParseDraft, throws_parse_error) {
    EXPECT_THROW(ne::parse_draft("nope"), ne::JsonValue::parse_error);
}

// =============================================================================
// DraftValidator
// =============================================================================

TEST(DraftValidator, valid_before_first_check) {
    auto validator = ne::DraftValidator{};
    EXPECT_TRUE(validator.status().valid);
    EXPECT_FALSE(validator.status().error.has_value());
}

TEST(DraftValidator, tracks_latest_text) {
    auto validator = ne::DraftValidator{};

    EXPECT_FALSE(validator.check("{").valid);
    EXPECT_TRUE(validator.status().error.has_value());

    EXPECT_TRUE(validator.check("{}").valid);
    EXPECT_FALSE(validator.status().error.has_value());

    EXPECT_FALSE(validator.check("{").valid);
}

TEST(DraftValidator, unchanged_text_returns_cached_status) {
    auto validator = ne::DraftValidator{};
    const auto& first = validator.check("[1,");
    const auto message = *first.error;

    const auto& second = validator.check("[1,");
    EXPECT_EQ(&first, &second);
    EXPECT_FALSE(second.valid);
    EXPECT_EQ(*second.error, message);
}

TEST(DraftValidator, invalidate_forces_recheck_with_same_result) {
    auto validator = ne::DraftValidator{};
    auto before = validator.check("{\"a\": 1}");
    validator.invalidate();
    EXPECT_EQ(validator.check("{\"a\": 1}"), before);
}

TEST(DraftValidator, uses_its_options) {
    auto validator = ne::DraftValidator{ne::ValidationOptions{true}};
    EXPECT_TRUE(validator.options().ignore_comments);
    EXPECT_TRUE(validator.check("/* c */ 1").valid);
}

TEST(ValidateDraft, overflowing_number_is_invalid) {
    auto status = ne::validate_draft("1e999");
    EXPECT_FALSE(status.valid);
    EXPECT_TRUE(status.error.has_value());
}
