// Fuzz target for draft validation and save — exercises the parser and the
// write-back path with arbitrary draft text.
// A draft that validates must save into a fresh document without throwing.

#include <nodeedit-cpp/nodeedit.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ne = nodeedit_cpp;
    const auto text = std::string(reinterpret_cast<const char*>(data), size);

    auto status = ne::validate_draft(text);

    ne::Logger log;
    log.set_enabled(false);
    auto store = ne::MemoryDocumentStore{R"({"node": {"a": 1}, "list": [1, 2]})"};
    auto selection = ne::DocumentSelection{store, ne::make_path("node"), log};
    auto session = ne::EditSession{store, selection, {}, log};
    session.open();
    session.begin_edit();
    session.update_draft(text);

    auto err = session.save();
    if (status.valid && err) __builtin_trap();
    if (!status.valid && !err) __builtin_trap();
    return 0;
}
