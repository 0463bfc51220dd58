// basic_usage — demonstrates the core nodeedit-cpp API
//
// Shows path reads and writes, building a node's rows, rendering the draft,
// and an editing session that merges a partial edit back into the document.
//
// Build: cmake --build build -DNODEEDIT_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/basic_usage

#include <nodeedit-cpp/nodeedit.hpp>

#include <cstdio>
#include <string>

namespace ne = nodeedit_cpp;

int main() {
    auto doc = ne::JsonValue::parse(R"({
        "customer": {"name": "Ada", "age": 36, "orders": [{"id": 1}, {"id": 2}]},
        "version": 3
    })");

    // -- Path reads -----------------------------------------------------------
    if (auto name = ne::get_at_path(doc, ne::make_path("customer", "name"))) {
        std::printf("Customer name: %s\n", name->get<std::string>().c_str());
    }
    const auto second = ne::make_path("customer", "orders", 1, "id");
    if (auto id = ne::get_at_path(doc, second)) {
        std::printf("%s = %s (pointer %s)\n", ne::format_path(second).c_str(),
                    id->dump().c_str(), ne::to_json_pointer(second).c_str());
    }
    if (!ne::get_at_path(doc, ne::make_path("customer", "email"))) {
        std::printf("No email on file\n");
    }

    // -- Path writes create what is missing -----------------------------------
    ne::set_at_path(doc, ne::make_path("audit", 0, "by"), ne::JsonValue("setup"));
    std::printf("Audit: %s\n", doc["audit"].dump().c_str());

    // -- Rows and draft text --------------------------------------------------
    if (auto node = ne::node_at(doc, ne::make_path("customer"))) {
        std::printf("Rows at %s:\n", ne::format_path(node->path).c_str());
        for (const auto& row : node->text) {
            std::printf("  %-8s %-7s %s\n", row.key.value_or("").c_str(),
                        std::string{ne::to_string_view(row.type)}.c_str(),
                        row.value.dump().c_str());
        }
        std::printf("Draft:\n%s\n", ne::normalize_rows(node->text).c_str());
    }

    // -- Edit session ---------------------------------------------------------
    auto store = ne::MemoryDocumentStore{doc.dump()};
    auto selection = ne::DocumentSelection{store, ne::make_path("customer")};
    auto session = ne::EditSession{store, selection};

    session.open();
    session.begin_edit();
    session.update_draft(R"({"age": 37, "email": "ada@example.com"})");
    if (auto err = session.save()) {
        std::printf("Save failed: %s\n", err->message.c_str());
        return 1;
    }
    std::printf("Saved %s (%zu commit)\n", session.path_text().c_str(), store.commit_count());
    std::printf("Document:\n%s\n", store.text().c_str());

    // -- Invalid drafts are caught before save --------------------------------
    session.begin_edit();
    session.update_draft("{\"age\": ");
    std::printf("Draft valid: %s\n", session.is_draft_valid() ? "yes" : "no");
    if (session.draft_error()) {
        std::printf("Draft error: %s\n", session.draft_error()->c_str());
    }
    session.cancel();
    std::printf("After cancel:\n%s\n", session.draft().c_str());

    std::printf("Done.\n");
    return 0;
}
