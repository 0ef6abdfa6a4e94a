/// @file test_parser.cpp
/// @brief Parser tests: RFC 8259 input, lenient extensions, error reporting.

#include <patchguard/patchguard.hpp>

#include <gtest/gtest.h>

#include <string>

using namespace patchguard;

// ═══════════════════════════════════════════════════════════════════════════════
// Valid documents
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, Literals) {
    EXPECT_TRUE(parse("null").is_null());
    EXPECT_TRUE(parse("true").as_bool());
    EXPECT_FALSE(parse("false").as_bool());
}

TEST(Parser, Numbers) {
    EXPECT_EQ(parse("0").as_integer(), 0);
    EXPECT_EQ(parse("-17").as_integer(), -17);
    EXPECT_DOUBLE_EQ(parse("2.5").as_float(), 2.5);
    EXPECT_DOUBLE_EQ(parse("1e3").as_float(), 1000.0);
    EXPECT_TRUE(parse("1e3").is_float());
    EXPECT_TRUE(parse("9223372036854775807").is_integer());
    EXPECT_TRUE(parse("92233720368547758070").is_float());
}

TEST(Parser, StringEscapes) {
    EXPECT_EQ(parse(R"("a\"b\\c\/d\n")").as_string(), "a\"b\\c/d\n");
    EXPECT_EQ(parse(R"("é")").as_string(), "\xC3\xA9");
    EXPECT_EQ(parse(R"("😀")").as_string(), "\xF0\x9F\x98\x80");
}

TEST(Parser, NestedDocument) {
    auto v = parse(R"({"sections":[{"name":"A","fields":[1,2]}],"meta":{}})");
    EXPECT_EQ(v["sections"][0]["name"].as_string(), "A");
    EXPECT_EQ(v["sections"][0]["fields"].size(), 2u);
    EXPECT_TRUE(v["meta"].is_object());
}

TEST(Parser, DuplicateKeysKeepLast) {
    auto v = parse(R"({"a":1,"a":2})");
    EXPECT_EQ(v.size(), 1u);
    EXPECT_EQ(v["a"].as_integer(), 2);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Errors
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, RejectsTrailingContent) {
    EXPECT_THROW((void)parse("1 2"), ParseError);
}

TEST(Parser, RejectsUnterminatedString) {
    EXPECT_THROW((void)parse(R"("abc)"), ParseError);
}

TEST(Parser, ReportsLineAndColumn) {
    try {
        (void)parse("{\n  \"a\": ?\n}");
        FAIL() << "expected ParseError";
    } catch (const ParseError& e) {
        EXPECT_EQ(e.location().line, 2u);
        EXPECT_GT(e.location().column, 1u);
    }
}

TEST(Parser, DepthLimit) {
    std::string deep(600, '[');
    deep += std::string(600, ']');
    EXPECT_THROW((void)parse(deep), ParseError);

    ParseOptions opts;
    opts.max_depth = 4;
    EXPECT_NO_THROW((void)parse("[[[[]]]]", opts));
    EXPECT_THROW((void)parse("[[[[[]]]]]", opts), ParseError);
}

TEST(Parser, TryParseReturnsErrorCode) {
    auto [value, ec] = try_parse("{");
    EXPECT_TRUE(ec);
    EXPECT_EQ(ec.category(), patchguard_category());

    auto ok = try_parse("[1]");
    EXPECT_TRUE(ok);
    EXPECT_EQ(ok.value.size(), 1u);
}

// ═══════════════════════════════════════════════════════════════════════════════
// Lenient mode
// ═══════════════════════════════════════════════════════════════════════════════

TEST(Parser, LenientAcceptsCommentsAndTrailingCommas) {
    const char* text = R"([
        // first
        {"op": "add", "path": "/a", "value": 1,},  /* second */
    ])";
    EXPECT_THROW((void)parse(text), ParseError);
    auto v = parse(text, ParseOptions::lenient());
    ASSERT_EQ(v.size(), 1u);
    EXPECT_EQ(v[0]["path"].as_string(), "/a");
}
