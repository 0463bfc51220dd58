#include <nodeedit-cpp/store.hpp>

#include <nodeedit-cpp/path.hpp>
#include <nodeedit-cpp/rows.hpp>

#include <exception>
#include <string>
#include <utility>

namespace nodeedit_cpp {

void MemoryDocumentStore::commit_document_text(std::string text, bool dirty) {
    text_ = std::move(text);
    dirty_ = dirty;
    ++commits_;
}

auto DocumentSelection::current_selection() const -> std::optional<NodeData> {
    try {
        auto root = JsonValue::parse(store_.load_document_text());
        if (auto node = node_at(root, path_)) return node;
        // The selected location no longer exists; saving recreates it.
        return NodeData{{}, path_};
    } catch (const std::exception& e) {
        log_.log(LogLevel::warning, "selection",
                 "cannot read node at " + format_path(path_) + ": " + e.what());
        return std::nullopt;
    }
}

}  // namespace nodeedit_cpp
