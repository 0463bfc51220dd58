#include <nodeedit-cpp/draft.hpp>

#include <string>
#include <utility>

namespace nodeedit_cpp {

namespace {

constexpr auto fallback_message = "Invalid JSON";

}  // anonymous namespace

auto parse_draft(std::string_view text, const ValidationOptions& options) -> JsonValue {
    return JsonValue::parse(text, nullptr, true, options.ignore_comments);
}

auto validate_draft(std::string_view text, const ValidationOptions& options) -> DraftStatus {
    try {
        (void)parse_draft(text, options);
        return DraftStatus{true, std::nullopt};
    } catch (const JsonValue::exception& e) {
        auto message = std::string{e.what()};
        if (message.empty()) message = fallback_message;
        return DraftStatus{false, std::move(message)};
    }
}

auto DraftValidator::check(std::string_view text) -> const DraftStatus& {
    if (checked_ && *checked_ == text) return status_;
    status_ = validate_draft(text, options_);
    checked_ = std::string{text};
    return status_;
}

}  // namespace nodeedit_cpp
