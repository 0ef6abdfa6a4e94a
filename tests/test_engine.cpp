/// @file test_engine.cpp
/// @brief Batch engine tests: apply_patches() with and without a schema,
/// the wire entry point, and guarded submit_patches().

#include <patchguard/patchguard.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace patchguard;

namespace {

const JsonValue& form_schema() {
    static const JsonValue schema = parse(R"({
        "type": "object",
        "required": ["title", "sections"],
        "properties": {
            "title": {"type": "string"},
            "sections": {"type": "array", "items": {"$ref": "#/definitions/section"}},
            "tags": {"type": "array", "items": {"type": "string"}},
            "meta": {"type": "object"},
            "settings": {"type": "object", "properties": {"mode": {"enum": ["a", "b"]}}}
        },
        "additionalProperties": false,
        "definitions": {
            "section": {
                "type": "object",
                "required": ["name"],
                "properties": {"name": {"type": "string"}, "order": {"type": "integer", "minimum": 0}}
            }
        }
    })");
    return schema;
}

bool starts_with(const std::string& s, const char* prefix) {
    return s.rfind(prefix, 0) == 0;
}

JsonValue titled() { return parse(R"({"title":"Form"})"); }

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Without a schema
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Engine, AddToEmptyDocument) {
    auto r = apply_patches(JsonValue::object(), {PatchOp::add("/name", "Alice")});
    EXPECT_TRUE(r.ok);
    EXPECT_TRUE(r.errors.empty());
    EXPECT_EQ(r.final_doc, parse(R"({"name":"Alice"})"));
}

TEST(Engine, EmptyBatchReturnsInput) {
    auto doc = parse(R"([1,2])");
    auto r = apply_patches(doc, std::vector<PatchOp>{});
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.final_doc, doc);
}

TEST(Engine, NullDocumentAndMissingParents) {
    auto r = apply_patches(JsonValue(), {PatchOp::add("/a/b/-", 1)});
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.final_doc, parse(R"({"a":{"b":[1]}})"));
}

TEST(Engine, FailuresDoNotStopTheBatch) {
    auto r = apply_patches(JsonValue::object(), {
        PatchOp::add("/a", 1),
        PatchOp::remove("/missing"),
        PatchOp("frob", "/x"),
        PatchOp::add("/b", 2),
    });
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_EQ(r.errors[0].op_index, 1);
    EXPECT_EQ(r.errors[0].code, errc::pointer_not_found);
    EXPECT_TRUE(starts_with(r.errors[0].message, "failed to apply patch: "));
    EXPECT_EQ(r.errors[1].op_index, 2);
    EXPECT_EQ(r.errors[1].code, errc::unsupported_operation);
    EXPECT_EQ(r.errors[1].message, "failed to apply patch: Operation not supported: frob");
    EXPECT_EQ(r.final_doc, parse(R"({"a":1,"b":2})"));
}

TEST(Engine, MissingValueIsReported) {
    auto r = apply_patches(JsonValue::object(), {PatchOp("replace", "/a")});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message, "operation \"replace\" requires field \"value\"");
}

TEST(Engine, InvalidPointerWithoutSchema) {
    auto r = apply_patches(JsonValue::object(), {PatchOp::add("name", 1)});
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, errc::invalid_pointer);
    EXPECT_EQ(r.errors[0].message,
              "failed to apply patch: Invalid JSON Pointer (must start with \"/\"): name");
}

TEST(Engine, JsonNullSchemaMeansNoSchema) {
    JsonValue schema;
    auto r = apply_patches(JsonValue::object(), {PatchOp::add("/x/y", 1)}, &schema);
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.final_doc, parse(R"({"x":{"y":1}})"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// With a schema
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EngineSchema, SeedsFromBaseDocument) {
    auto r = apply_patches(JsonValue(), {PatchOp::add("/title", "T")}, &form_schema());
    EXPECT_TRUE(r.ok);
    EXPECT_EQ(r.final_doc, parse(R"({"title":"T","sections":[]})"));
}

TEST(EngineSchema, AppendValidatedAgainstItemSchema) {
    auto r = apply_patches(titled(), {
        PatchOp::add("/sections/-", parse(R"({"name":"A","order":1})")),
        PatchOp::add("/sections/-", parse(R"({"order":-1})")),
    }, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].op_index, 1);
    EXPECT_EQ(r.errors[0].code, errc::schema_violation);
    EXPECT_EQ(r.errors[0].message,
              "value incompatible with schema at path: /sections/-: required field missing: name | "
              "/sections/-/order: number < minimum (0)");
    EXPECT_EQ(r.final_doc["sections"].size(), 1u);
}

TEST(EngineSchema, TypeMismatchWithHint) {
    auto r = apply_patches(titled(), {PatchOp::add("/tags", parse(R"({"x":1})"))}, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message,
              "value incompatible with schema at path: /tags: invalid type: expected array, received object"
              " HINT: The schema expects an array at \"/tags\", but you provided a single object. "
              "To append this object to the array, use path \"/tags/-\" instead.");
}

TEST(EngineSchema, PropertyNotAllowed) {
    auto r = apply_patches(titled(), {PatchOp::add("/extra", 1)}, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_TRUE(starts_with(r.errors[0].message,
                            "add invalid: property \"extra\" is not allowed by the parent schema."));
    EXPECT_FALSE(r.final_doc.contains("extra"));
}

TEST(EngineSchema, ParentMustExist) {
    auto r = apply_patches(titled(), {PatchOp::add("/meta/a/b", 1)}, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, errc::pointer_not_found);
    EXPECT_TRUE(starts_with(r.errors[0].message, "add failed: parent path does not exist."));
}

TEST(EngineSchema, ArrayIndexChecked) {
    auto r = apply_patches(titled(), {PatchOp::add("/sections/5", parse(R"({"name":"A"})"))},
                           &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message,
              "add in array: invalid index '5'. Array has 0 items (valid indices: 0..0, "
              "or '-' to append). Use \"/sections/-\" to append to the end.");
}

TEST(EngineSchema, AddOverExistingArrayBlocked) {
    auto doc = parse(R"({"title":"Form","sections":[{"name":"A"}]})");
    auto r = apply_patches(doc, {PatchOp::add("/sections", parse(R"({"name":"B"})"))}, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, errc::guard_rejected);
    EXPECT_TRUE(starts_with(r.errors[0].message,
                            "DESTRUCTIVE OVERWRITE BLOCKED: path \"/sections\" currently holds an array with 1 items."));
    EXPECT_EQ(r.final_doc, doc);
}

TEST(EngineSchema, RequiredPropertyCannotBeRemoved) {
    auto r = apply_patches(titled(), {PatchOp::remove("/title")}, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message, "remove invalid: \"title\" is required by parent schema");
}

TEST(EngineSchema, TargetMustExist) {
    auto r = apply_patches(titled(), {PatchOp::replace("/meta", JsonValue::object()),
                                      PatchOp::test("/missing", 1)}, &form_schema());
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_EQ(r.errors[0].message, "replace failed: path does not exist in current document");
    EXPECT_EQ(r.errors[1].message, "test failed: path does not exist in current document");
}

TEST(EngineSchema, EnumViolation) {
    auto r = apply_patches(titled(), {PatchOp::add("/settings", parse(R"({"mode":"c"})"))},
                           &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message,
              R"(value incompatible with schema at path: /settings/mode: value is not in enum: "c")");
}

TEST(EngineSchema, InvalidPointer) {
    auto r = apply_patches(titled(), {PatchOp::add("title", "x")}, &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, errc::invalid_pointer);
    EXPECT_EQ(r.errors[0].message, "Invalid JSON Pointer (must start with \"/\"): title");
}

TEST(EngineSchema, PostOperationValidation) {
    auto r = apply_patches(JsonValue::object(), {PatchOp::add("/meta", JsonValue::object())},
                           &form_schema());
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message,
              "post-operation document became invalid: /title: invalid type: expected string, received null");
}

TEST(EngineSchema, VeryLongStringValues) {
    const std::string body(200000, 'a');
    const auto email = parse(R"({"properties":{"contact":{"type":"string","format":"email"}}})");
    auto ok = apply_patches(JsonValue::object(), {PatchOp::add("/contact", body + "@example.com")}, &email);
    EXPECT_TRUE(ok.ok);
    EXPECT_EQ(ok.final_doc["contact"].as_string().size(), body.size() + 12);

    const auto pattern = parse(R"({"properties":{"contact":{"type":"string","pattern":"^[a-z ]+$"}}})");
    auto r = apply_patches(JsonValue::object(), {PatchOp::add("/contact", body)}, &pattern);
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].code, errc::schema_violation);
    EXPECT_NE(r.errors[0].message.find("too long to check against pattern"), std::string::npos);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Wire entry point
// ═══════════════════════════════════════════════════════════════════════════════

TEST(EngineWire, NonArrayPatches) {
    auto r = apply_patches(JsonValue::object(), parse(R"({"op":"add"})"));
    EXPECT_FALSE(r.ok);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].op_index, -1);
    EXPECT_EQ(r.errors[0].message, "patches must be a JSON array");
}

TEST(EngineWire, IndicesReferToOriginalPositions) {
    auto r = apply_patches(JsonValue::object(), parse(R"([
        {"op":"add","path":"/a","value":1},
        "junk",
        {"op":"remove","path":"/zz"},
        {"path":"/b"}
    ])"));
    ASSERT_EQ(r.errors.size(), 3u);
    EXPECT_EQ(r.errors[0].op_index, 1);
    EXPECT_EQ(r.errors[0].message, "invalid operation (not an object)");
    EXPECT_FALSE(r.errors[0].op.has_value());
    EXPECT_EQ(r.errors[1].op_index, 2);
    EXPECT_EQ(r.errors[2].op_index, 3);
    EXPECT_EQ(r.errors[2].message, "invalid operation (missing op/path)");
    EXPECT_EQ(r.final_doc, parse(R"({"a":1})"));

    auto j = r.to_json();
    EXPECT_FALSE(j["ok"].as_bool());
    EXPECT_TRUE(j["errors"][0]["op"].is_null());
    EXPECT_EQ(j["finalDoc"], parse(R"({"a":1})"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// submit_patches
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Submit, EmptyBatch) {
    auto out = submit_patches(JsonValue::object(), {});
    EXPECT_FALSE(out.result.ok);
    ASSERT_EQ(out.result.errors.size(), 1u);
    EXPECT_EQ(out.result.errors[0].message, "No patches provided");
}

TEST(Submit, DestructiveArrayOverwriteRejected) {
    auto doc = parse(R"({"items":["a","b"]})");
    auto out = submit_patches(doc, {PatchOp::add("/items", parse(R"(["c"])"))});
    EXPECT_FALSE(out.result.ok);
    ASSERT_EQ(out.result.errors.size(), 1u);
    EXPECT_TRUE(starts_with(out.result.errors[0].message, "DESTRUCTIVE OVERWRITE"));
    EXPECT_EQ(out.result.final_doc, doc);
}

TEST(Submit, DestructiveOverwriteOfPercentEncodedKey) {
    auto doc = parse(R"({"rate%20table":["a","b","c"]})");
    auto out = submit_patches(doc, {PatchOp::add("/rate%20table", parse(R"(["z"])"))});
    EXPECT_FALSE(out.result.ok);
    ASSERT_EQ(out.result.errors.size(), 1u);
    EXPECT_TRUE(starts_with(out.result.errors[0].message, "DESTRUCTIVE OVERWRITE"));
    EXPECT_EQ(out.result.final_doc, doc);
}

TEST(Submit, AppendsWithDuplicates) {
    auto doc = parse(R"({"items":["a","b"]})");
    auto out = submit_patches(doc, {PatchOp::add("/items/-", "a"), PatchOp::add("/items/-", "c")});
    EXPECT_TRUE(out.result.ok);
    EXPECT_EQ(out.result.final_doc, parse(R"({"items":["a","b","c"]})"));
    ASSERT_EQ(out.duplicates_skipped.size(), 1u);

    auto j = out.to_json();
    ASSERT_TRUE(j["duplicatesSkipped"].is_array());
    EXPECT_EQ(j["duplicatesSkipped"].size(), 1u);
}

TEST(Submit, OnlyDuplicates) {
    auto doc = parse(R"({"items":["a"]})");
    auto out = submit_patches(doc, {PatchOp::add("/items/-", "a")});
    EXPECT_TRUE(out.result.ok);
    EXPECT_EQ(out.result.final_doc, doc);
    EXPECT_EQ(out.duplicates_skipped.size(), 1u);
}

TEST(Submit, AllOrNothing) {
    auto doc = parse(R"({"a":1})");
    auto out = submit_patches(doc, {PatchOp::add("/b", 2), PatchOp::remove("/missing")});
    EXPECT_FALSE(out.result.ok);
    EXPECT_EQ(out.result.errors.size(), 1u);
    EXPECT_EQ(out.result.final_doc, doc);
}

TEST(Submit, SchemaViolationRejectsBatch) {
    auto doc = titled();
    auto out = submit_patches(doc, {PatchOp::add("/sections/-", parse(R"({"name":"A"})")),
                                    PatchOp::replace("/title", 5)}, &form_schema());
    EXPECT_FALSE(out.result.ok);
    EXPECT_EQ(out.result.errors[0].code, errc::schema_violation);
    EXPECT_EQ(out.result.final_doc, doc);
}

TEST(Submit, ShrinkageGuard) {
    auto doc = parse(R"({"n":[0,1,2,3,4,5,6,7,8,9,10]})");
    std::vector<PatchOp> ops;
    for (int i = 10; i >= 6; --i) ops.push_back(PatchOp::remove("/n/" + std::to_string(i)));

    auto kept = submit_patches(doc, ops);
    EXPECT_TRUE(kept.result.ok);
    EXPECT_EQ(kept.result.final_doc["n"].size(), 6u);

    ops.push_back(PatchOp::remove("/n/5"));
    auto rejected = submit_patches(doc, ops);
    EXPECT_FALSE(rejected.result.ok);
    ASSERT_EQ(rejected.result.errors.size(), 1u);
    EXPECT_EQ(rejected.result.errors[0].code, errc::shrinkage_detected);
    EXPECT_EQ(rejected.result.errors[0].op_index, -1);
    EXPECT_EQ(rejected.result.final_doc, doc);
}

TEST(Submit, CustomGuardOptions) {
    GuardOptions opts;
    opts.shrinkage_min_items = 2;
    opts.shrinkage_ratio = 0.9;
    auto doc = parse(R"({"n":[1,2,3,4]})");
    auto out = submit_patches(doc, {PatchOp::remove("/n/0")}, nullptr, opts);
    EXPECT_FALSE(out.result.ok);
    EXPECT_EQ(out.result.errors[0].code, errc::shrinkage_detected);
}
