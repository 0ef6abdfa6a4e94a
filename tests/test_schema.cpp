/// @file test_schema.cpp
/// @brief Schema resolution tests: $ref, inlining, candidates, base documents.

#include <patchguard/patchguard.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace patchguard;

namespace {

const JsonValue& form_schema() {
    static const JsonValue schema = parse(R"({
        "type": "object",
        "required": ["title", "sections", "meta"],
        "properties": {
            "title": {"type": "string"},
            "sections": {"type": "array", "items": {"$ref": "#/definitions/section"}},
            "meta": {"$ref": "#/definitions/meta"},
            "node": {"$ref": "#/definitions/node"}
        },
        "additionalProperties": false,
        "definitions": {
            "section": {
                "type": "object",
                "properties": {"name": {"type": "string"}, "fields": {"type": "array"}}
            },
            "meta": {"type": "object"},
            "node": {
                "type": "object",
                "properties": {"children": {"type": "array", "items": {"$ref": "#/definitions/node"}}}
            }
        }
    })");
    return schema;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Permissive schemas and $ref
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Schema, PermissiveForms) {
    EXPECT_TRUE(is_permissive(JsonValue()));
    EXPECT_TRUE(is_permissive(JsonValue(true)));
    EXPECT_TRUE(is_permissive(permissive_schema()));
    EXPECT_FALSE(is_permissive(JsonValue(false)));
    EXPECT_FALSE(is_permissive(JsonValue::object()));
}

TEST(Schema, TypeList) {
    EXPECT_EQ(schema_types(parse(R"({"type":"string"})")), (std::vector<std::string>{"string"}));
    EXPECT_EQ(schema_types(parse(R"({"type":["string","null"]})")),
              (std::vector<std::string>{"string", "null"}));
    EXPECT_TRUE(schema_types(JsonValue::object()).empty());
}

TEST(Schema, ResolveRefFollowsLocalChain) {
    auto root = parse(R"({"definitions":{"a":{"$ref":"#/definitions/b"},"b":{"type":"integer"}}})");
    auto node = parse(R"({"$ref":"#/definitions/a"})");
    const auto& resolved = resolve_ref(node, root);
    EXPECT_EQ(resolved, parse(R"({"type":"integer"})"));
}

TEST(Schema, ResolveRefStopsOnExternalOrMissing) {
    auto root = JsonValue::object();
    auto external = parse(R"({"$ref":"http://example.com/s.json"})");
    auto missing = parse(R"({"$ref":"#/definitions/none"})");
    EXPECT_EQ(&resolve_ref(external, root), &external);
    EXPECT_EQ(&resolve_ref(missing, root), &missing);
    EXPECT_TRUE(has_unresolved_ref(resolve_ref(missing, root)));
}

TEST(Schema, ResolveRefStopsOnCycle) {
    auto root = parse(R"({"definitions":{"a":{"$ref":"#/definitions/b"},"b":{"$ref":"#/definitions/a"}}})");
    const auto& out = resolve_ref(root["definitions"]["a"], root);
    EXPECT_TRUE(has_unresolved_ref(out));
}

TEST(Schema, InlineRefsBreaksRecursion) {
    auto inlined = inline_refs(form_schema());
    EXPECT_EQ(inlined["properties"]["meta"], parse(R"({"type":"object"})"));
    EXPECT_EQ(inlined["properties"]["sections"]["items"]["type"].as_string(), "object");
    const auto& children = inlined["properties"]["node"]["properties"]["children"];
    EXPECT_TRUE(is_permissive(children["items"]));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Candidates at pointer
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Schema, CandidatesFollowItemsAndProperties) {
    auto c = candidates_at_pointer(form_schema(), JsonPointer("/sections/0/name"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(*c[0], parse(R"({"type":"string"})"));
}

TEST(Schema, AppendTokenUsesItemSchema) {
    auto c = candidates_at_pointer(form_schema(), JsonPointer("/sections/-"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(&*c[0], &form_schema()["definitions"]["section"]);
}

TEST(Schema, ClosedObjectGivesPermissiveFallback) {
    auto c = candidates_at_pointer(form_schema(), JsonPointer("/unknown"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_TRUE(is_permissive(*c[0]));
}

TEST(Schema, AnyOfBranchesAreExpanded) {
    auto schema = parse(R"({"anyOf":[
        {"type":"object","properties":{"v":{"type":"string"}}},
        {"type":"object","properties":{"v":{"type":"integer"}}}
    ]})");
    auto c = candidates_at_pointer(schema, JsonPointer("/v"));
    ASSERT_EQ(c.size(), 2u);
    EXPECT_EQ((*c[0])["type"].as_string(), "string");
    EXPECT_EQ((*c[1])["type"].as_string(), "integer");
}

TEST(Schema, AnyOfFanOutIsBounded) {
    auto schema = parse(R"({
        "$ref": "#/definitions/n",
        "definitions": {"n": {"anyOf": [
            {"type": "object", "properties": {"c": {"$ref": "#/definitions/n"}}},
            {"type": "object", "properties": {"c": {"$ref": "#/definitions/n"}}}
        ]}}
    })");
    std::string path;
    size_t expected = 1;
    while (expected * 2 <= PATCHGUARD_MAX_CANDIDATES) {
        path += "/c";
        expected *= 2;
    }
    EXPECT_EQ(candidates_at_pointer(schema, JsonPointer(path)).size(), expected);

    auto c = candidates_at_pointer(schema, JsonPointer(path + "/c"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_TRUE(is_permissive(*c[0]));
}

TEST(Schema, RecursiveRefCandidates) {
    auto c = candidates_at_pointer(form_schema(), JsonPointer("/node/children/0/children/1"));
    ASSERT_EQ(c.size(), 1u);
    EXPECT_EQ(&*c[0], &form_schema()["definitions"]["node"]);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Property rules and base documents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Schema, PropAllowedAndRequired) {
    const auto& s = form_schema();
    EXPECT_TRUE(is_prop_allowed(s, "title"));
    EXPECT_FALSE(is_prop_allowed(s, "extra"));
    EXPECT_TRUE(is_prop_allowed(JsonValue::object(), "extra"));
    EXPECT_TRUE(is_required(s, "sections"));
    EXPECT_FALSE(is_required(s, "node"));
}

TEST(Schema, BuildBaseDoc) {
    EXPECT_EQ(build_base_doc(form_schema()),
              parse(R"({"title":null,"sections":[],"meta":{}})"));
    EXPECT_EQ(build_base_doc(parse(R"({"type":"array"})")), JsonValue::object());
}
