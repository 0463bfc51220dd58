/// @file store.hpp
/// @brief Collaborator interfaces: the full-document store and the node selection.

#pragma once

#include <nodeedit-cpp/log.hpp>
#include <nodeedit-cpp/types.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <utility>

namespace nodeedit_cpp {

/// Owner of the full document's serialized text.
///
/// Reads and writes are whole-document and last-writer-wins; an
/// implementation may throw from either call to signal a failure.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    /// The full document's current serialized JSON.
    virtual auto load_document_text() const -> std::string = 0;

    /// Replace the committed text and set the pending-changes flag.
    virtual void commit_document_text(std::string text, bool dirty) = 0;
};

/// Supplier of the currently selected node.
class SelectionSource {
public:
    virtual ~SelectionSource() = default;

    /// The selected node, or nullopt when nothing is selected.
    virtual auto current_selection() const -> std::optional<NodeData> = 0;
};

// =============================================================================
// In-memory collaborators
// =============================================================================

/// A DocumentStore holding its text in memory.
class MemoryDocumentStore : public DocumentStore {
public:
    MemoryDocumentStore() = default;
    explicit MemoryDocumentStore(std::string text)
        : text_{std::move(text)} {}

    auto load_document_text() const -> std::string override { return text_; }
    void commit_document_text(std::string text, bool dirty) override;

    auto text() const -> const std::string& { return text_; }
    auto has_changes() const -> bool { return dirty_; }

    /// Number of commits received since construction.
    auto commit_count() const -> std::size_t { return commits_; }

    /// Replace the text without counting a commit (an external edit).
    void set_text(std::string text) { text_ = std::move(text); }

    /// Clear the pending-changes flag.
    void mark_clean() { dirty_ = false; }

private:
    std::string text_{"{}"};
    bool dirty_{false};
    std::size_t commits_{0};
};

/// A SelectionSource whose node is set directly by the caller.
class MemorySelectionSource : public SelectionSource {
public:
    MemorySelectionSource() = default;
    explicit MemorySelectionSource(NodeData node)
        : node_{std::move(node)} {}

    auto current_selection() const -> std::optional<NodeData> override { return node_; }

    void select(NodeData node) { node_ = std::move(node); }
    void clear() { node_.reset(); }

private:
    std::optional<NodeData> node_;
};

/// A SelectionSource that reads a fixed path out of a DocumentStore.
///
/// Every call reloads and reparses the store, so the node always reflects
/// the latest committed document. A path that does not resolve is still the
/// selection: it comes back with no rows, and a save writes the draft there.
/// Only a store holding malformed JSON is logged and reported as no
/// selection.
class DocumentSelection : public SelectionSource {
public:
    DocumentSelection(const DocumentStore& store, Path path, Logger& log = logger())
        : store_{store}, path_{std::move(path)}, log_{log} {}

    auto current_selection() const -> std::optional<NodeData> override;

    auto path() const -> const Path& { return path_; }
    void select(Path path) { path_ = std::move(path); }

private:
    const DocumentStore& store_;
    Path path_;
    Logger& log_;
};

}  // namespace nodeedit_cpp
