/// @file session.hpp
/// @brief The EditSession class -- edit one node and commit it into the full document.

#pragma once

#include <nodeedit-cpp/draft.hpp>
#include <nodeedit-cpp/error.hpp>
#include <nodeedit-cpp/log.hpp>
#include <nodeedit-cpp/rows.hpp>
#include <nodeedit-cpp/store.hpp>
#include <nodeedit-cpp/types.hpp>

#include <optional>
#include <span>
#include <string>

namespace nodeedit_cpp {

/// Settings for an editing session.
struct SessionOptions {
    int indent{default_indent};   ///< Indentation of the draft and the committed document.
    bool ignore_comments{false};  ///< Accept comments in draft text.

    /// The parser settings derived from these options.
    auto validation() const -> ValidationOptions { return ValidationOptions{ignore_comments}; }
};

/// Reconcile an edited fragment into a document at a path.
///
/// If both the edit and the current value at the path are objects, the
/// edit's members are copied onto the current object one by one and the
/// other members are kept. Otherwise the value at the path is replaced by
/// the edit, creating intermediates as set_at_path does.
///
/// @return root, modified in place.
auto apply_edit(JsonValue& root, std::span<const PathSegment> path, JsonValue edited) -> JsonValue&;

/// One editing session over the selected node of a document.
///
/// The session owns a draft buffer seeded from the selected node's rows.
/// Edits to the draft are validated as they arrive; a valid draft can be
/// saved, which reloads the full document from the store, merges or
/// replaces the node's value and commits the whole document back.
///
/// The store and the selection are borrowed and must outlive the session.
/// The session is not thread-safe.
///
/// @code
/// auto store = MemoryDocumentStore{R"({"user":{"name":"Ada","age":36}})"};
/// auto selection = DocumentSelection{store, make_path("user")};
/// auto session = EditSession{store, selection};
/// session.open();
/// session.begin_edit();
/// session.update_draft(R"({"age":37})");
/// if (auto err = session.save()) {
///     // err->kind, err->message
/// }
/// @endcode
class EditSession {
public:
    EditSession(DocumentStore& store, const SelectionSource& selection,
                SessionOptions options = {}, Logger& log = logger());

    // -- Lifecycle ------------------------------------------------------------

    /// Open the editor and reset the session from the current selection.
    void open();

    /// Close the editor. Leaves editing state; the draft is kept until the
    /// next open.
    void close();

    /// Notify that another node was selected. Resets an open session.
    void selection_changed();

    // -- Editing --------------------------------------------------------------

    /// Enter editing state.
    /// @return false if the editor is not open.
    auto begin_edit() -> bool;

    /// Replace the draft text and revalidate it.
    void update_draft(std::string text);

    /// Commit the draft into the full document.
    ///
    /// Requires editing state and a valid draft. On failure the store is
    /// left untouched and the session stays as it was, apart from
    /// last_error().
    ///
    /// @return nullopt on success, else the reason the save was abandoned.
    auto save() -> std::optional<Error>;

    /// Discard the draft: regenerate it from the node's latest rows and
    /// leave editing state.
    void cancel();

    // -- Queries --------------------------------------------------------------

    /// The node's rows rendered as read-only text.
    auto content_preview() const -> std::string;

    /// The node's path rendered as `$[...]`.
    auto path_text() const -> std::string;

    auto draft() const -> const std::string& { return draft_; }
    auto draft_error() const -> const std::optional<std::string>& { return validator_.status().error; }
    auto is_draft_valid() const -> bool { return validator_.status().valid; }

    auto is_open() const -> bool { return open_; }
    auto is_editing() const -> bool { return editing_; }

    auto can_edit() const -> bool { return open_; }
    auto can_save() const -> bool { return editing_ && is_draft_valid(); }
    auto can_cancel() const -> bool { return editing_; }

    /// The error of the most recent failed save, cleared by a successful
    /// save or a reset.
    auto last_error() const -> const std::optional<Error>& { return last_error_; }

    auto options() const -> const SessionOptions& { return options_; }

private:
    /// The selected node, or an empty root node when nothing is selected.
    auto current_node() const -> NodeData;

    void reset();
    void revalidate();

    /// Load, reconcile and commit. Does not touch session state.
    auto write_back(const NodeData& node) -> std::optional<Error>;

    DocumentStore& store_;
    const SelectionSource& selection_;
    SessionOptions options_;
    Logger& log_;

    DraftValidator validator_;
    std::string draft_;
    std::optional<Error> last_error_;
    bool open_{false};
    bool editing_{false};
};

}  // namespace nodeedit_cpp
