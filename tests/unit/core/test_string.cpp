#include <gtest/gtest.h>
#include "scrape/core/string.hpp"

#include <unordered_set>

using namespace scrape;

// ============================================================================
// Unicode Tests
// ============================================================================

TEST(UnicodeTest, AsciiCaseConversion) {
    EXPECT_EQ(unicode::to_ascii_lower('A'), 'a');
    EXPECT_EQ(unicode::to_ascii_lower('z'), 'z');
    EXPECT_EQ(unicode::to_ascii_lower('1'), '1');
    EXPECT_EQ(unicode::to_ascii_upper(U'a'), U'A');
}

TEST(UnicodeTest, Utf8DecodeTwoBytes) {
    const char* text = "\xC3\xA9";  // é (U+00E9)
    auto result = unicode::utf8_decode(text, 2);

    EXPECT_EQ(result.code_point, 0x00E9u);
    EXPECT_EQ(result.bytes_consumed, 2u);
}

TEST(UnicodeTest, Utf8DecodeFourBytes) {
    const char* text = "\xF0\x9F\x98\x80";  // U+1F600
    auto result = unicode::utf8_decode(text, 4);

    EXPECT_EQ(result.code_point, 0x1F600u);
    EXPECT_EQ(result.bytes_consumed, 4u);
}

TEST(UnicodeTest, Utf8DecodeRejectsOverlong) {
    const char* text = "\xC0\xAF";
    auto result = unicode::utf8_decode(text, 2);

    EXPECT_EQ(result.code_point, unicode::REPLACEMENT_CHARACTER);
}

TEST(UnicodeTest, Utf8Encode) {
    char buffer[4];
    EXPECT_EQ(unicode::utf8_encode(0x4E2D, buffer), 3u);
    EXPECT_EQ(std::string_view(buffer, 3), "\xE4\xB8\xAD");
}

TEST(UnicodeTest, FindInvalidUtf8) {
    EXPECT_TRUE(unicode::is_valid_utf8("plain ascii"));
    EXPECT_TRUE(unicode::is_valid_utf8("caf\xC3\xA9"));
    EXPECT_TRUE(unicode::is_valid_utf8("\xEF\xBF\xBD"));

    auto bad = unicode::find_invalid_utf8("ab\xFF" "cd");
    ASSERT_TRUE(bad.has_value());
    EXPECT_EQ(*bad, 2u);
}

TEST(UnicodeTest, SanitizeReplacesInvalidBytes) {
    auto clean = unicode::sanitize_utf8("a\xFF" "b");
    EXPECT_EQ(clean, "a\xEF\xBF\xBD" "b");
    EXPECT_TRUE(unicode::is_valid_utf8(clean));
}

// ============================================================================
// String Tests
// ============================================================================

TEST(StringTest, Construction) {
    String empty;
    EXPECT_TRUE(empty.empty());

    String hello("hello");
    EXPECT_EQ(hello.size(), 5u);
    EXPECT_EQ(hello, "hello");

    auto literal = "world"_s;
    EXPECT_EQ(literal.view(), "world");
}

TEST(StringTest, CodePointCount) {
    String text("caf\xC3\xA9");
    EXPECT_EQ(text.size(), 5u);
    EXPECT_EQ(text.code_point_count(), 4u);
}

TEST(StringTest, FindReturnsOptional) {
    String text("a=b=c");

    EXPECT_EQ(text.find('='), std::optional<usize>(1));
    EXPECT_EQ(text.find('=', 2), std::optional<usize>(3));
    EXPECT_FALSE(text.find("x").has_value());
}

TEST(StringTest, CaseMappingIsAsciiOnly) {
    String text("Hello \xC3\x89T\xC3\x89");

    EXPECT_EQ(text.to_lowercase(), "hello \xC3\x89t\xC3\x89");
    EXPECT_EQ(String("div").to_uppercase(), "DIV");
    EXPECT_TRUE(String("DiV").equals_ignore_case("div"));
    EXPECT_FALSE(String("div").equals_ignore_case("span"));
}

TEST(StringTest, Trim) {
    String text("  \t padded \n");

    EXPECT_EQ(text.trim(), "padded");
    EXPECT_EQ(text.trim_start(), "padded \n");
    EXPECT_EQ(text.trim_end(), "  \t padded");
    EXPECT_TRUE(String(" \r\n").is_whitespace());
}

TEST(StringTest, Split) {
    auto parts = String("a,b,,c").split(',');

    ASSERT_EQ(parts.size(), 4u);
    EXPECT_EQ(parts[0], "a");
    EXPECT_EQ(parts[2], "");
    EXPECT_EQ(parts[3], "c");
}

TEST(StringTest, SplitWhitespace) {
    auto parts = String("  one\ttwo \n three ").split_whitespace();

    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "one");
    EXPECT_EQ(parts[1], "two");
    EXPECT_EQ(parts[2], "three");
}

TEST(StringTest, ReplaceAll) {
    EXPECT_EQ(String("a--b--c").replace_all("--", "- -"), "a- -b- -c");
    EXPECT_EQ(String("abc").replace_all("", "x"), "abc");
}

TEST(StringTest, Concatenation) {
    String text("foo");
    text += "bar";
    text += '!';
    text += U'é';

    EXPECT_EQ(text, "foobar!\xC3\xA9");
    EXPECT_EQ(String("a") + String("b"), "ab");
}

TEST(StringTest, Hashable) {
    std::unordered_set<String> set;
    set.insert("one");
    set.insert("one");
    set.insert("two");

    EXPECT_EQ(set.size(), 2u);
    EXPECT_TRUE(set.contains(String("two")));
}

// ============================================================================
// StringBuilder Tests
// ============================================================================

TEST(StringBuilderTest, AppendsMixedPieces) {
    StringBuilder builder;
    builder.append("count=")
        .append(static_cast<i64>(-3))
        .append(',')
        .append(static_cast<u64>(7))
        .append(String(" done"));

    EXPECT_EQ(builder.view(), "count=-3,7 done");
    EXPECT_EQ(builder.build(), "count=-3,7 done");
}

TEST(StringBuilderTest, TakeMovesBuffer) {
    StringBuilder builder;
    builder.append("abc");

    auto taken = builder.take();
    EXPECT_EQ(taken, "abc");
}
