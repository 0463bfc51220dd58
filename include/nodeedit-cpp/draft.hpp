/// @file draft.hpp
/// @brief Validation of user-edited draft text.

#pragma once

#include <nodeedit-cpp/types.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace nodeedit_cpp {

/// Parser settings shared by draft validation and save.
struct ValidationOptions {
    bool ignore_comments{false};  ///< Accept `//` and `/* */` comments.
};

/// Outcome of validating a draft.
struct DraftStatus {
    bool valid{true};                  ///< The text parses as JSON.
    std::optional<std::string> error;  ///< Parser message when invalid.

    auto operator==(const DraftStatus&) const -> bool = default;
};

/// Parse text as JSON and report whether it is valid.
auto validate_draft(std::string_view text, const ValidationOptions& options = {}) -> DraftStatus;

/// Parse draft text into a JSON value. Throws JsonValue::parse_error on
/// malformed input and JsonValue::out_of_range for numbers that overflow.
auto parse_draft(std::string_view text, const ValidationOptions& options = {}) -> JsonValue;

/// Memoizing validator for a draft buffer.
///
/// The text is parsed once per distinct value; checking the same text again
/// returns the cached status.
class DraftValidator {
public:
    explicit DraftValidator(ValidationOptions options = {})
        : options_{options} {}

    /// Validate text, reusing the previous result if the text is unchanged.
    auto check(std::string_view text) -> const DraftStatus&;

    /// The status of the most recent check (valid before any check).
    auto status() const -> const DraftStatus& { return status_; }

    /// Forget the cached text so the next check parses again.
    void invalidate() { checked_.reset(); }

    auto options() const -> const ValidationOptions& { return options_; }

private:
    ValidationOptions options_;
    std::optional<std::string> checked_;
    DraftStatus status_;
};

}  // namespace nodeedit_cpp
