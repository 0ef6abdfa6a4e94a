/// @file test_json_pointer.cpp
/// @brief JSON Pointer tests: parsing, escaping, resolution, index tokens.

#include <patchguard/patchguard.hpp>

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace patchguard;

namespace {

JsonValue sample() {
    return parse(R"({
        "foo": ["bar", "baz"],
        "": 0,
        "a/b": 1,
        "m~n": 8,
        "nested": {"list": [{"id": 7}]}
    })");
}

} // namespace

// ═══════════════════════════════════════════════════════════════════════════════
// Parsing
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonPointer, EmptyAndSlashAreRoot) {
    EXPECT_TRUE(JsonPointer("").empty());
    EXPECT_TRUE(JsonPointer("/").empty());
    auto doc = sample();
    EXPECT_EQ(JsonPointer("/").try_resolve(doc), &doc);
}

TEST(JsonPointer, MissingLeadingSlashThrows) {
    try {
        JsonPointer p("foo/0");
        FAIL() << "expected PointerError";
    } catch (const PointerError& e) {
        EXPECT_EQ(e.code(), errc::invalid_pointer);
        EXPECT_STREQ(e.what(), "Invalid JSON Pointer (must start with \"/\"): foo/0");
    }
}

TEST(JsonPointer, TokensAreUnescaped) {
    JsonPointer p("/a~1b/m~0n/~01");
    EXPECT_EQ(p.tokens(), (std::vector<std::string>{"a/b", "m~n", "~1"}));
    EXPECT_EQ(p.to_string(), "/a~1b/m~0n/~01");
}

TEST(JsonPointer, EscapeRoundTrip) {
    for (const std::string key : {"a/~b~1/", "~", "/", "~1", "~0/~", "plain"}) {
        EXPECT_EQ(JsonPointer::unescape(JsonPointer::escape(key)), key) << key;

        JsonValue doc = JsonValue::object();
        doc[key] = 42;
        const std::string path = JsonPointer().append(key).to_string();
        const JsonValue* found = JsonPointer(path).try_resolve(doc);
        ASSERT_NE(found, nullptr) << path;
        EXPECT_EQ(found->as_integer(), 42);
    }
    EXPECT_EQ(JsonPointer::escape("a/~b~1/"), "a~1~0b~01~1");
}

TEST(JsonPointer, LenientParse) {
    auto p = JsonPointer::parse_lenient("nested/list/0");
    EXPECT_EQ(p.to_string(), "/nested/list/0");
    EXPECT_EQ(JsonPointer::parse_lenient("/a%20b").back(), "a b");
    EXPECT_EQ(JsonPointer::parse_lenient("/a%20b", false).back(), "a%20b");
    EXPECT_EQ(JsonPointer::parse_lenient("/bad%zz").back(), "bad%zz");
}

// ═══════════════════════════════════════════════════════════════════════════════
// Resolution
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonPointer, ResolvesRfcExamples) {
    auto doc = sample();
    EXPECT_EQ(JsonPointer("/foo/0").resolve(doc).as_string(), "bar");
    EXPECT_EQ(JsonPointer("/a~1b").resolve(doc).as_integer(), 1);
    EXPECT_EQ(JsonPointer("/m~0n").resolve(doc).as_integer(), 8);
    EXPECT_EQ(JsonPointer("/nested/list/0/id").resolve(doc).as_integer(), 7);
}

TEST(JsonPointer, AbsentLocationsYieldNull) {
    auto doc = sample();
    EXPECT_EQ(JsonPointer("/missing").try_resolve(doc), nullptr);
    EXPECT_EQ(JsonPointer("/foo/2").try_resolve(doc), nullptr);
    EXPECT_EQ(JsonPointer("/foo/-").try_resolve(doc), nullptr);
    EXPECT_EQ(JsonPointer("/foo/x").try_resolve(doc), nullptr);
    EXPECT_EQ(JsonPointer("/foo/0/deeper").try_resolve(doc), nullptr);
}

TEST(JsonPointer, ResolveThrowsNotFound) {
    auto doc = sample();
    try {
        (void)JsonPointer("/nope").resolve(doc);
        FAIL() << "expected PointerError";
    } catch (const PointerError& e) {
        EXPECT_EQ(e.code(), errc::pointer_not_found);
    }
}

TEST(JsonPointer, ParentAndKey) {
    auto doc = sample();
    auto ref = JsonPointer("/nested/list").resolve_parent_and_key(doc);
    ASSERT_NE(ref.parent, nullptr);
    EXPECT_TRUE(ref.parent->is_object());
    EXPECT_EQ(ref.key, "list");
    EXPECT_EQ(JsonPointer("").resolve_parent_and_key(doc).parent, nullptr);
}

TEST(JsonPointer, Composition) {
    JsonPointer p("/a");
    EXPECT_EQ(p.append("b/c").append(size_t(3)).to_string(), "/a/b~1c/3");
    EXPECT_EQ(JsonPointer("/x/y").parent().to_string(), "/x");
    EXPECT_EQ(JsonPointer("/x/y").depth(), 2u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Index tokens
// ═══════════════════════════════════════════════════════════════════════════════

TEST(JsonPointer, IndexTokens) {
    EXPECT_EQ(JsonPointer::parse_index("0"), 0u);
    EXPECT_EQ(JsonPointer::parse_index("012"), 12u);
    EXPECT_FALSE(JsonPointer::parse_index("-").has_value());
    EXPECT_FALSE(JsonPointer::parse_index("1a").has_value());
    EXPECT_FALSE(JsonPointer::parse_index("").has_value());

    EXPECT_EQ(JsonPointer::parse_canonical_index("0"), 0u);
    EXPECT_FALSE(JsonPointer::parse_canonical_index("012").has_value());

    EXPECT_TRUE(JsonPointer::is_array_token("-"));
    EXPECT_TRUE(JsonPointer::is_array_token("5"));
    EXPECT_FALSE(JsonPointer::is_array_token("name"));
}

TEST(JsonPointer, FreeTryResolve) {
    auto doc = sample();
    ASSERT_NE(try_resolve(doc, "/foo/1"), nullptr);
    EXPECT_EQ(try_resolve(doc, "/foo/1")->as_string(), "baz");
    EXPECT_THROW((void)try_resolve(doc, "foo"), PointerError);
}
