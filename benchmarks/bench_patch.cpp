/// @file bench_patch.cpp
/// @brief Performance benchmarks for patch application and validation.
///
/// Measured operations:
///   - Parsing and applying a patch batch without a schema
///   - Schema-checked batches (candidate lookup + post-op validation)
///   - Guarded submission (pre-validation, duplicate filter, shrinkage)
///   - Validation of a recursive document

#include <patchguard/patchguard.hpp>

#include <benchmark/benchmark.h>

#include <string>
#include <vector>

using namespace patchguard;

// ═══════════════════════════════════════════════════════════════════════════════
// Test data generators
// ═══════════════════════════════════════════════════════════════════════════════

static const JsonValue& form_schema() {
    static const JsonValue schema = parse(R"({
        "type": "object",
        "required": ["title", "sections"],
        "properties": {
            "title": {"type": "string"},
            "sections": {"type": "array", "items": {"$ref": "#/definitions/section"}}
        },
        "additionalProperties": false,
        "definitions": {
            "section": {
                "type": "object",
                "required": ["name"],
                "properties": {
                    "name": {"type": "string", "pattern": "^[A-Z]"},
                    "email": {"type": "string", "format": "email"},
                    "order": {"type": "integer", "minimum": 0}
                }
            }
        }
    })");
    return schema;
}

/// Document with @p n sections.
static JsonValue generate_form(int n) {
    JsonValue doc = JsonValue::object();
    doc["title"] = "Form";
    Array sections;
    for (int i = 0; i < n; ++i) {
        JsonValue s = JsonValue::object();
        s["name"] = "Section " + std::to_string(i);
        s["email"] = "owner" + std::to_string(i) + "@example.com";
        s["order"] = i;
        sections.push_back(std::move(s));
    }
    doc["sections"] = std::move(sections);
    return doc;
}

/// @p n appends of fresh sections.
static std::vector<PatchOp> generate_appends(int n, int offset) {
    std::vector<PatchOp> ops;
    for (int i = 0; i < n; ++i) {
        JsonValue s = JsonValue::object();
        s["name"] = "Added " + std::to_string(offset + i);
        s["order"] = offset + i;
        ops.push_back(PatchOp::add("/sections/-", std::move(s)));
    }
    return ops;
}

static std::string generate_patch_text(int n) {
    std::string s = "[";
    for (int i = 0; i < n; ++i) {
        if (i > 0) s += ",";
        s += R"({"op":"add","path":"/items/-","value":{"id":)" + std::to_string(i) + "}}";
    }
    s += "]";
    return s;
}

// ═══════════════════════════════════════════════════════════════════════════════
// Patch application
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ParseAndApply(benchmark::State& state) {
    auto text = generate_patch_text(static_cast<int>(state.range(0)));
    JsonValue doc = parse(R"({"items":[]})");
    for (auto _ : state) {
        auto r = apply_patches(doc, parse(text));
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_ParseAndApply)->Arg(10)->Arg(100);

static void BM_ApplyWithSchema(benchmark::State& state) {
    auto doc = generate_form(static_cast<int>(state.range(0)));
    auto ops = generate_appends(10, static_cast<int>(state.range(0)));
    for (auto _ : state) {
        auto r = apply_patches(doc, ops, &form_schema());
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(ops.size()));
}
BENCHMARK(BM_ApplyWithSchema)->Arg(10)->Arg(100)->Arg(500);

static void BM_SubmitGuarded(benchmark::State& state) {
    auto doc = generate_form(static_cast<int>(state.range(0)));
    auto ops = generate_appends(10, 0);
    for (auto _ : state) {
        auto r = submit_patches(doc, ops, &form_schema());
        benchmark::DoNotOptimize(r);
    }
    state.SetItemsProcessed(state.iterations() * static_cast<int64_t>(ops.size()));
}
BENCHMARK(BM_SubmitGuarded)->Arg(10)->Arg(100);

// ═══════════════════════════════════════════════════════════════════════════════
// Validation
// ═══════════════════════════════════════════════════════════════════════════════

static void BM_ValidateForm(benchmark::State& state) {
    auto doc = generate_form(static_cast<int>(state.range(0)));
    Validator validator(form_schema());
    for (auto _ : state) {
        auto errors = validator.validate(doc);
        benchmark::DoNotOptimize(errors);
    }
}
BENCHMARK(BM_ValidateForm)->Arg(10)->Arg(100)->Arg(1000);

static void BM_ValidateRecursive(benchmark::State& state) {
    auto schema = parse(R"({
        "$ref": "#/definitions/node",
        "definitions": {"node": {"type": "object", "properties": {
            "value": {"type": "integer"},
            "children": {"type": "array", "items": {"$ref": "#/definitions/node"}}}}}
    })");
    JsonValue doc(Object{{"value", 0}});
    for (int64_t depth = 0; depth < state.range(0); ++depth)
        doc = JsonValue(Object{{"value", depth}, {"children", Array{doc, doc}}});
    Validator validator(schema);
    for (auto _ : state) {
        auto errors = validator.validate(doc);
        benchmark::DoNotOptimize(errors);
    }
}
BENCHMARK(BM_ValidateRecursive)->Arg(4)->Arg(8);

BENCHMARK_MAIN();
