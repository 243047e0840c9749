// jsonmerge-cpp benchmarks — measures throughput of pointer resolution and patch application.

#include <jsonmerge-cpp/jsonmerge.hpp>

#include <benchmark/benchmark.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using namespace jsonmerge_cpp;

static auto make_wide_doc(std::int64_t n) -> Json {
    auto doc = Json::object();
    auto items = Json::array();
    for (std::int64_t i = 0; i < n; ++i) {
        doc["key" + std::to_string(i)] = i;
        items.push_back(Json{{"id", i}, {"tags", Json::array()}});
    }
    doc["items"] = std::move(items);
    return doc;
}

static auto make_deep_doc(std::int64_t depth) -> std::pair<Json, std::string> {
    auto doc = Json(0);
    auto pointer = std::string{};
    for (std::int64_t i = 0; i < depth; ++i) {
        doc = Json{{"n", std::move(doc)}};
        pointer += "/n";
    }
    return {std::move(doc), pointer};
}

// =============================================================================
// Pointer parsing and resolution
// =============================================================================

static void bm_pointer_parse(benchmark::State& state) {
    for (auto _ : state) {
        auto p = Pointer::parse("/config/servers/12/a~1b/m~0n/-");
        benchmark::DoNotOptimize(p);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_pointer_parse);

static void bm_resolve_deep(benchmark::State& state) {
    auto [doc, pointer] = make_deep_doc(state.range(0));
    auto parsed = Pointer::parse(pointer);
    for (auto _ : state) {
        auto target = resolve(doc, parsed);
        benchmark::DoNotOptimize(target);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_resolve_deep)->Range(4, 256);

// =============================================================================
// Operations
// =============================================================================

static void bm_add_object_member(benchmark::State& state) {
    auto doc = make_wide_doc(100);
    auto patch = Patch::decode(R"([{"op":"add","path":"/key50","value":{"x":1}}])");
    for (auto _ : state) {
        apply_patch(doc, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_add_object_member);

static void bm_array_append(benchmark::State& state) {
    auto doc = make_wide_doc(10);
    auto patch = Patch::decode(R"([{"op":"add","path":"/items/0/tags/-","value":"t"}])");
    for (auto _ : state) {
        apply_patch(doc, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_array_append);

static void bm_move_within_array(benchmark::State& state) {
    auto doc = make_wide_doc(state.range(0));
    auto patch = Patch::decode(R"([{"op":"move","from":"/items/0","path":"/items/-"}])");
    for (auto _ : state) {
        apply_patch(doc, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_move_within_array)->Range(10, 1000);

static void bm_test_structural(benchmark::State& state) {
    auto doc = make_wide_doc(state.range(0));
    auto op = Json{{"op", "test"}, {"path", ""}, {"value", doc}};
    auto patch = Patch{std::vector<Operation>{Operation{op}}};
    for (auto _ : state) {
        apply_patch(doc, patch);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_test_structural)->Range(10, 1000);

// =============================================================================
// Whole patches
// =============================================================================

static void bm_decode_apply_encode(benchmark::State& state) {
    const auto doc = make_wide_doc(100).dump();
    const auto patch_text = std::string{R"([
        {"op":"add","path":"/extra","value":[1,2,3]},
        {"op":"replace","path":"/key1","value":"one"},
        {"op":"copy","from":"/items/3","path":"/items/-"},
        {"op":"remove","path":"/key2"},
        {"op":"test","path":"/extra/1","value":2}
    ])"};
    for (auto _ : state) {
        auto out = Patch::decode(patch_text).apply(doc);
        benchmark::DoNotOptimize(out);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_decode_apply_encode);

static void bm_atomic_apply(benchmark::State& state) {
    auto doc = make_wide_doc(state.range(0));
    auto patch = Patch::decode(R"([{"op":"replace","path":"/key0","value":0}])");
    auto options = ApplyOptions{};
    options.atomic = true;
    for (auto _ : state) {
        apply_patch(doc, patch, options);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(bm_atomic_apply)->Range(10, 1000);

static void bm_batch_apply(benchmark::State& state) {
    const auto n = static_cast<std::size_t>(state.range(0));
    auto docs = std::vector<Json>(n, make_wide_doc(20));
    auto patch = Patch::decode(R"([{"op":"add","path":"/items/0/tags/0","value":"t"}])");
    for (auto _ : state) {
        auto results = apply_patch_batch(docs, patch);
        benchmark::DoNotOptimize(results);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * n));
}
BENCHMARK(bm_batch_apply)->Range(8, 512);
