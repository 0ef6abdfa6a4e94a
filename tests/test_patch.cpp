/// @file test_patch.cpp
/// @brief RFC 6902 application tests: each operation, failure codes, wire form.

#include <patchguard/patchguard.hpp>

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using namespace patchguard;

namespace {

errc code_of(const JsonValue& doc, const PatchOp& op) {
    try {
        (void)apply(doc, op);
    } catch (const std::system_error& e) {
        return static_cast<errc>(e.code().value());
    }
    return errc::ok;
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// add
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Patch, AddObjectMember) {
    auto doc = apply(JsonValue::object(), PatchOp::add("/name", "Alice"));
    EXPECT_EQ(doc, parse(R"({"name":"Alice"})"));
}

TEST(Patch, AddOverwritesExistingMember) {
    auto doc = apply(parse(R"({"a":1})"), PatchOp::add("/a", 2));
    EXPECT_EQ(doc["a"].as_integer(), 2);
}

TEST(Patch, AddArrayAppendAndInsert) {
    auto doc = parse(R"({"xs":[1,3]})");
    doc = apply(doc, PatchOp::add("/xs/1", 2));
    doc = apply(doc, PatchOp::add("/xs/-", 4));
    doc = apply(doc, PatchOp::add("/xs/4", 5));
    EXPECT_EQ(doc["xs"], parse("[1,2,3,4,5]"));
}

TEST(Patch, AddAtRootReplacesDocument) {
    EXPECT_EQ(apply(parse(R"({"a":1})"), PatchOp::add("", parse("[1]"))), parse("[1]"));
}

TEST(Patch, AddBadIndexFails) {
    auto doc = parse(R"({"xs":[1]})");
    EXPECT_EQ(code_of(doc, PatchOp::add("/xs/5", 0)), errc::invalid_array_index);
    EXPECT_EQ(code_of(doc, PatchOp::add("/xs/x", 0)), errc::invalid_array_index);
}

TEST(Patch, AddMissingParentFails) {
    EXPECT_EQ(code_of(JsonValue::object(), PatchOp::add("/a/b", 1)), errc::pointer_not_found);
}

TEST(Patch, CreateParentsBuildsChain) {
    ApplyOptions opts;
    opts.create_parents = true;
    auto doc = apply(JsonValue::object(), PatchOp::add("/a/list/-", "x"), opts);
    EXPECT_EQ(doc, parse(R"({"a":{"list":["x"]}})"));

    doc = apply(parse(R"({"a":5})"), PatchOp::add("/a/b", 1), opts);
    EXPECT_EQ(doc, parse(R"({"a":{"b":1}})"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// replace / remove
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Patch, ReplaceExisting) {
    auto doc = apply(parse(R"({"a":[1,2]})"), PatchOp::replace("/a/0", "one"));
    EXPECT_EQ(doc["a"][0].as_string(), "one");
}

TEST(Patch, ReplaceMissingFails) {
    EXPECT_EQ(code_of(JsonValue::object(), PatchOp::replace("/a", 1)), errc::pointer_not_found);
}

TEST(Patch, RemoveMemberAndElement) {
    auto doc = parse(R"({"a":1,"b":[1,2,3]})");
    doc = apply(doc, PatchOp::remove("/a"));
    doc = apply(doc, PatchOp::remove("/b/1"));
    EXPECT_EQ(doc, parse(R"({"b":[1,3]})"));
}

TEST(Patch, RemoveMissingOrRootFails) {
    auto doc = parse(R"({"b":[1]})");
    EXPECT_EQ(code_of(doc, PatchOp::remove("/a")), errc::pointer_not_found);
    EXPECT_EQ(code_of(doc, PatchOp::remove("/b/3")), errc::pointer_not_found);
    EXPECT_EQ(code_of(doc, PatchOp::remove("")), errc::invalid_operation);
}

// ═══════════════════════════════════════════════════════════════════════════════
// move / copy / test
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Patch, AddThenRemoveRestoresDocument) {
    const auto doc = parse(R"({"a":{"b":[1,2,3]},"c":"x"})");
    const std::vector<std::pair<std::string, JsonValue>> cases{
        {"/d", parse(R"({"k":[true]})")},
        {"/a/e", JsonValue()},
        {"/a/b/0", 0},
        {"/a/b/1", "mid"},
        {"/a/b/3", parse("[9]")},
        {"/a~1b", 5},
    };
    for (const auto& [path, value] : cases) {
        auto added = apply_batch(doc, {PatchOp::add(path, value)});
        EXPECT_NE(added, doc) << path;
        EXPECT_EQ(apply_batch(added, {PatchOp::remove(path)}), doc) << path;
    }
}

TEST(Patch, MoveMember) {
    auto doc = apply(parse(R"({"a":{"x":1},"b":{}})"), PatchOp::move("/a/x", "/b/y"));
    EXPECT_EQ(doc, parse(R"({"a":{},"b":{"y":1}})"));
}

TEST(Patch, MoveIntoOwnChildFails) {
    auto doc = parse(R"({"a":{"b":{}}})");
    EXPECT_EQ(code_of(doc, PatchOp::move("/a", "/a/b/c")), errc::invalid_operation);
}

TEST(Patch, FailedMoveLeavesInputUntouched) {
    const auto doc = parse(R"({"a":1,"xs":[]})");
    EXPECT_THROW((void)apply(doc, PatchOp::move("/a", "/xs/9")), PatchOpError);
    EXPECT_EQ(doc, parse(R"({"a":1,"xs":[]})"));
}

TEST(Patch, CopyIsDeep) {
    auto doc = apply(parse(R"({"a":{"v":[1]}})"), PatchOp::copy("/a", "/b"));
    doc = apply(doc, PatchOp::add("/b/v/-", 2));
    EXPECT_EQ(doc["a"]["v"].size(), 1u);
    EXPECT_EQ(doc["b"]["v"].size(), 2u);
}

TEST(Patch, TestOperation) {
    auto doc = parse(R"({"n":1,"o":{"a":1,"b":2}})");
    EXPECT_NO_THROW((void)apply(doc, PatchOp::test("/n", 1.0)));
    EXPECT_NO_THROW((void)apply(doc, PatchOp::test("/o", parse(R"({"b":2,"a":1})"))));
    EXPECT_EQ(code_of(doc, PatchOp::test("/n", 2)), errc::test_failed);
    EXPECT_EQ(code_of(doc, PatchOp::test("/zz", 2)), errc::test_failed);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Validation of the operation itself
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Patch, UnknownOperation) {
    PatchOp op("frobnicate", "/a");
    try {
        (void)apply(JsonValue::object(), op);
        FAIL() << "expected PatchOpError";
    } catch (const PatchOpError& e) {
        EXPECT_EQ(e.code(), errc::unsupported_operation);
        EXPECT_STREQ(e.what(), "Operation not supported: frobnicate");
    }
}

TEST(Patch, MissingValueOrFrom) {
    EXPECT_EQ(code_of(JsonValue::object(), PatchOp("add", "/a")), errc::invalid_operation);
    EXPECT_EQ(code_of(JsonValue::object(), PatchOp("copy", "/a")), errc::invalid_operation);
}

TEST(Patch, BatchStopsAtFirstFailure) {
    std::vector<PatchOp> ops{PatchOp::add("/a", 1), PatchOp::remove("/zz"), PatchOp::add("/b", 2)};
    EXPECT_THROW((void)apply_batch(JsonValue::object(), ops), PatchOpError);

    ops.erase(ops.begin() + 1);
    EXPECT_EQ(apply_batch(JsonValue::object(), ops), parse(R"({"a":1,"b":2})"));
}

// ═══════════════════════════════════════════════════════════════════════════════
// Wire form
// ═══════════════════════════════════════════════════════════════════════════════

TEST(PatchWire, DecodeOperations) {
    auto ops = parse_patch_ops(parse(R"([
        {"op":"add","path":"/a","value":1},
        {"op":"move","from":"/a","path":"/b"},
        {"path":"/c"}
    ])"));
    ASSERT_EQ(ops.size(), 3u);
    EXPECT_EQ(ops[0].type, OpType::Add);
    EXPECT_EQ(ops[0].value->as_integer(), 1);
    EXPECT_EQ(*ops[1].from, "/a");
    EXPECT_FALSE(ops[2].has_op_and_path);
}

TEST(PatchWire, DecodeRejectsNonArrayAndNonObject) {
    EXPECT_THROW((void)parse_patch_ops(parse("{}")), PatchOpError);
    EXPECT_THROW((void)parse_patch_ops(parse("[1]")), PatchOpError);
}

TEST(PatchWire, ResultShape) {
    PatchResult r;
    r.ok = false;
    r.errors.push_back({0, PatchOp::remove("/a"), "/a", "boom", errc::pointer_not_found});
    r.final_doc = JsonValue::object();
    auto j = r.to_json();
    EXPECT_FALSE(j["ok"].as_bool());
    EXPECT_EQ(j["errors"][0]["opIndex"].as_integer(), 0);
    EXPECT_EQ(j["errors"][0]["op"]["op"].as_string(), "remove");
    EXPECT_EQ(j["errors"][0]["message"].as_string(), "boom");
    EXPECT_FALSE(j["errors"][0].contains("code"));
    EXPECT_TRUE(j["finalDoc"].is_object());
    EXPECT_EQ(r.errors[0].error_code(), errc::pointer_not_found);
}
