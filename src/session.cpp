#include <nodeedit-cpp/session.hpp>

#include <nodeedit-cpp/path.hpp>

#include <exception>
#include <string>
#include <utility>

namespace nodeedit_cpp {

auto apply_edit(JsonValue& root, std::span<const PathSegment> path, JsonValue edited)
    -> JsonValue& {
    auto* current = find_at_path(root, path);
    if (edited.is_object() && current != nullptr && current->is_object()) {
        for (auto it = edited.begin(); it != edited.end(); ++it) {
            (*current)[it.key()] = std::move(it.value());
        }
        return root;
    }
    return set_at_path(root, path, std::move(edited));
}

EditSession::EditSession(DocumentStore& store, const SelectionSource& selection,
                         SessionOptions options, Logger& log)
    : store_{store},
      selection_{selection},
      options_{options},
      log_{log},
      validator_{options.validation()} {}

// -- Lifecycle ----------------------------------------------------------------

void EditSession::open() {
    open_ = true;
    reset();
}

void EditSession::close() {
    open_ = false;
    editing_ = false;
}

void EditSession::selection_changed() {
    if (open_) reset();
}

// -- Editing ------------------------------------------------------------------

auto EditSession::begin_edit() -> bool {
    if (!open_) return false;
    editing_ = true;
    return true;
}

void EditSession::update_draft(std::string text) {
    draft_ = std::move(text);
    revalidate();
}

auto EditSession::save() -> std::optional<Error> {
    revalidate();
    if (!can_save()) {
        auto reason = editing_ ? "draft is not valid JSON" : "session is not editing";
        log_.log(LogLevel::debug, "save", std::string{"save rejected: "} + reason);
        return Error{ErrorKind::invalid_operation, reason};
    }

    const auto node = current_node();
    if (auto err = write_back(node)) {
        log_.log(LogLevel::error, "save",
                 "save of " + format_path(node.path) + " abandoned ("
                     + std::string{to_string_view(err->kind)} + "): " + err->message);
        last_error_ = err;
        return err;
    }

    log_.log(LogLevel::info, "save", "committed node at " + format_path(node.path));
    last_error_.reset();
    editing_ = false;
    return std::nullopt;
}

void EditSession::cancel() {
    draft_ = normalize_rows(current_node().text, options_.indent);
    validator_.invalidate();
    revalidate();
    editing_ = false;
}

// -- Queries ------------------------------------------------------------------

auto EditSession::content_preview() const -> std::string {
    return normalize_rows(current_node().text, options_.indent);
}

auto EditSession::path_text() const -> std::string {
    if (auto node = selection_.current_selection()) return format_path(node->path);
    return format_path(std::nullopt);
}

// -- Internals ----------------------------------------------------------------

auto EditSession::current_node() const -> NodeData {
    if (auto node = selection_.current_selection()) return std::move(*node);
    return NodeData{};
}

void EditSession::reset() {
    const auto node = current_node();
    editing_ = false;
    last_error_.reset();
    draft_ = normalize_rows(node.text, options_.indent);
    validator_.invalidate();
    revalidate();
    log_.log(LogLevel::debug, "session", "session reset for " + format_path(node.path));
}

void EditSession::revalidate() {
    validator_.check(draft_);
}

auto EditSession::write_back(const NodeData& node) -> std::optional<Error> {
    try {
        auto root = JsonValue{};
        try {
            root = JsonValue::parse(store_.load_document_text());
        } catch (const JsonValue::exception& e) {
            return Error{ErrorKind::invalid_document, e.what()};
        }

        auto edited = JsonValue{};
        try {
            edited = parse_draft(draft_, options_.validation());
        } catch (const JsonValue::exception& e) {
            return Error{ErrorKind::invalid_draft, e.what()};
        }

        apply_edit(root, node.path, std::move(edited));
        store_.commit_document_text(root.dump(options_.indent), true);
    } catch (const std::exception& e) {
        return Error{ErrorKind::save_failed, e.what()};
    }
    return std::nullopt;
}

}  // namespace nodeedit_cpp
