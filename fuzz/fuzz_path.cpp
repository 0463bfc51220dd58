// Fuzz target for path writes — decodes the input into a path, writes a
// marker value there and reads it back. set_at_path must never throw and the
// written value must be readable at the same path.

#include <nodeedit-cpp/nodeedit.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    namespace ne = nodeedit_cpp;

    // Each segment is a tag byte followed by a length byte and up to two
    // key bytes (even tag) or a single index byte (odd tag).
    auto path = ne::Path{};
    std::size_t pos = 0;
    while (pos + 1 < size && path.size() < 16) {
        const auto tag = data[pos++];
        if (tag % 2 == 1) {
            path.emplace_back(static_cast<std::size_t>(data[pos++] % 32));
            continue;
        }
        const auto len = std::min<std::size_t>(data[pos++] % 3, size - pos);
        path.emplace_back(std::string(reinterpret_cast<const char*>(data + pos), len));
        pos += len;
    }

    auto root = ne::JsonValue::parse(R"({"a": [1, {"b": null}], "0": "zero"})");
    ne::set_at_path(root, path, ne::JsonValue("marker"));
    auto read = ne::get_at_path(root, path);
    if (!read || *read != "marker") __builtin_trap();
    (void)ne::to_json_pointer(path);
    (void)ne::format_path(path);
    return 0;
}
