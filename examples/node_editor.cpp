// node_editor — edit one node of a JSON file from the command line
//
// Loads the file, selects the node at the given path, saves the draft into
// it and writes the whole document back to the file.
//
//   node_editor <file.json> <path-as-json-array> <draft-json> [--indent N] [--comments] [--verbose]
//
// Example:
//   node_editor data.json '["users", 0]' '{"age": 37}'
//
// Build: cmake --build build -DNODEEDIT_CPP_BUILD_EXAMPLES=ON
// Run:   ./build/examples/node_editor data.json '[]' '{}'

#include <nodeedit-cpp/nodeedit.hpp>

#include <cstdio>
#include <exception>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace ne = nodeedit_cpp;

namespace {

/// A DocumentStore backed by a file on disk.
class FileDocumentStore : public ne::DocumentStore {
public:
    explicit FileDocumentStore(std::string file) : file_{std::move(file)} {}

    auto load_document_text() const -> std::string override {
        auto in = std::ifstream{file_};
        if (!in) throw std::runtime_error{"cannot open " + file_};
        auto buffer = std::stringstream{};
        buffer << in.rdbuf();
        return buffer.str();
    }

    void commit_document_text(std::string text, bool) override {
        auto out = std::ofstream{file_, std::ios::trunc};
        if (!out) throw std::runtime_error{"cannot write " + file_};
        out << text << '\n';
        if (!out) throw std::runtime_error{"write to " + file_ + " failed"};
    }

private:
    std::string file_;
};

void usage() {
    std::fprintf(stderr,
                 "usage: node_editor <file.json> <path-json> <draft-json>"
                 " [--indent N] [--comments] [--verbose]\n");
}

}  // anonymous namespace

int main(int argc, char** argv) {
    if (argc < 4) {
        usage();
        return 2;
    }

    auto options = ne::SessionOptions{};
    for (int i = 4; i < argc; ++i) {
        const auto arg = std::string_view{argv[i]};
        if (arg == "--indent" && i + 1 < argc) {
            try {
                options.indent = std::stoi(argv[++i]);
            } catch (const std::exception&) {
                std::fprintf(stderr, "bad indent: %s\n", argv[i]);
                return 2;
            }
        } else if (arg == "--comments") {
            options.ignore_comments = true;
        } else if (arg == "--verbose") {
            ne::logger().set_level(ne::LogLevel::debug);
        } else {
            usage();
            return 2;
        }
    }

    auto path = ne::Path{};
    try {
        path = ne::json::path_from_json(ne::JsonValue::parse(argv[2]));
    } catch (const std::exception& e) {
        std::fprintf(stderr, "bad path: %s\n", e.what());
        return 2;
    }

    auto store = FileDocumentStore{argv[1]};
    auto selection = ne::DocumentSelection{store, path};
    auto session = ne::EditSession{store, selection, options};

    session.open();
    std::printf("Node %s:\n%s\n", session.path_text().c_str(), session.content_preview().c_str());

    session.begin_edit();
    session.update_draft(argv[3]);
    if (!session.is_draft_valid()) {
        std::fprintf(stderr, "draft rejected: %s\n", session.draft_error().value_or("").c_str());
        return 1;
    }

    if (auto err = session.save()) {
        std::printf("%s\n", ne::JsonValue(*err).dump().c_str());
        return 1;
    }

    std::printf("Saved. Node is now:\n%s\n", session.content_preview().c_str());
    return 0;
}
