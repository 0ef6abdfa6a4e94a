/// @file bench_truncator.cpp
/// @brief Performance benchmarks for bounded rendering and document inspection.

#include <patchguard/patchguard.hpp>

#include <benchmark/benchmark.h>

#include <string>

using namespace patchguard;

/// Records with long descriptions and a tag list each.
static JsonValue generate_records(int n) {
    Array records;
    for (int i = 0; i < n; ++i) {
        JsonValue r = JsonValue::object();
        r["id"] = i;
        r["description"] = std::string(80, static_cast<char>('a' + i % 26));
        r["tags"] = Array{"alpha", "beta", "gamma", "delta"};
        records.push_back(std::move(r));
    }
    JsonValue doc = JsonValue::object();
    doc["records"] = std::move(records);
    return doc;
}

static void BM_StringifyRecords(benchmark::State& state) {
    auto doc = generate_records(static_cast<int>(state.range(0)));
    Truncator t;
    for (auto _ : state) {
        auto s = t.stringify(doc);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_StringifyRecords)->Arg(10)->Arg(100);

static void BM_TruncateRecords(benchmark::State& state) {
    auto doc = generate_records(static_cast<int>(state.range(0)));
    Truncator t;
    for (auto _ : state) {
        auto s = t.truncate_with_limit(doc, 2000);
        benchmark::DoNotOptimize(s);
    }
}
BENCHMARK(BM_TruncateRecords)->Arg(10)->Arg(50);

static void BM_InspectKeys(benchmark::State& state) {
    auto doc = generate_records(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto r = inspect_keys(doc, "/records");
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_InspectKeys)->Arg(100)->Arg(1000);

static void BM_SearchFuzzy(benchmark::State& state) {
    auto doc = generate_records(static_cast<int>(state.range(0)));
    SearchOptions opts;
    opts.fuzzy = true;
    for (auto _ : state) {
        auto r = search_pointer(doc, "gama", opts);
        benchmark::DoNotOptimize(r);
    }
}
BENCHMARK(BM_SearchFuzzy)->Arg(100)->Arg(1000);

BENCHMARK_MAIN();
