// nodeedit-cpp benchmarks — measures throughput of path access and save.

#include <nodeedit-cpp/nodeedit.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>

namespace ne = nodeedit_cpp;

static auto make_document(std::int64_t users) -> ne::JsonValue {
    auto doc = ne::JsonValue::object();
    auto& list = doc["users"] = ne::JsonValue::array();
    for (std::int64_t i = 0; i < users; ++i) {
        list.push_back({
            {"name", "user" + std::to_string(i)},
            {"age", i},
            {"tags", {"a", "b"}},
        });
    }
    return doc;
}

// =============================================================================
// Path access
// =============================================================================

static void bm_get_at_path(benchmark::State& state) {
    const auto doc = make_document(state.range(0));
    const auto path = ne::make_path("users", static_cast<std::size_t>(state.range(0) / 2), "name");
    for (auto _ : state) {
        auto val = ne::find_at_path(doc, path);
        benchmark::DoNotOptimize(val);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_get_at_path)->Range(8, 4096);

static void bm_set_at_path_creating(benchmark::State& state) {
    const auto path = ne::make_path("a", 0, "b", 1, "c");
    for (auto _ : state) {
        auto doc = ne::JsonValue::object();
        ne::set_at_path(doc, path, ne::JsonValue(1));
        benchmark::DoNotOptimize(doc);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_set_at_path_creating);

// =============================================================================
// Rows and drafts
// =============================================================================

static void bm_node_at_and_normalize(benchmark::State& state) {
    const auto doc = make_document(64);
    const auto path = ne::make_path("users", 10);
    for (auto _ : state) {
        auto node = ne::node_at(doc, path);
        auto text = ne::normalize_rows(node->text);
        benchmark::DoNotOptimize(text);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_node_at_and_normalize);

static void bm_validate_draft(benchmark::State& state) {
    const auto text = make_document(state.range(0)).dump(2);
    for (auto _ : state) {
        auto status = ne::validate_draft(text);
        benchmark::DoNotOptimize(status);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * text.size()));
}
BENCHMARK(bm_validate_draft)->Range(8, 1024);

// =============================================================================
// Save
// =============================================================================

static void bm_session_save(benchmark::State& state) {
    auto store = ne::MemoryDocumentStore{make_document(state.range(0)).dump()};
    auto selection = ne::DocumentSelection{store, ne::make_path("users", 0)};
    ne::Logger log;
    log.set_enabled(false);
    auto session = ne::EditSession{store, selection, {}, log};
    session.open();
    std::int64_t age = 0;
    for (auto _ : state) {
        session.begin_edit();
        session.update_draft(R"({"age": )" + std::to_string(age++) + "}");
        auto err = session.save();
        benchmark::DoNotOptimize(err);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_session_save)->Range(8, 1024);

BENCHMARK_MAIN();
