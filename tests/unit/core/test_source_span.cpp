#include <gtest/gtest.h>
#include "scrape/core/source_span.hpp"

using namespace scrape;

TEST(SourceSpanTest, StartOfInput) {
    auto position = position_at("abc", 0);

    EXPECT_EQ(position.line, 1u);
    EXPECT_EQ(position.column, 1u);
    EXPECT_EQ(position.offset, 0u);
}

TEST(SourceSpanTest, CountsLines) {
    std::string_view source = "one\ntwo\nthree";
    auto position = position_at(source, 9);

    EXPECT_EQ(position.line, 3u);
    EXPECT_EQ(position.column, 2u);
}

TEST(SourceSpanTest, ColumnsCountCodePoints) {
    // "é" takes two bytes but one column
    std::string_view source = "\xC3\xA9x";
    auto position = position_at(source, 2);

    EXPECT_EQ(position.line, 1u);
    EXPECT_EQ(position.column, 2u);
    EXPECT_EQ(position.offset, 2u);
}

TEST(SourceSpanTest, OffsetClampsToEnd) {
    auto position = position_at("ab", 99);

    EXPECT_EQ(position.offset, 2u);
    EXPECT_EQ(position.column, 3u);
}

TEST(SourceSpanTest, FromOffsets) {
    std::string_view source = "div > > span";
    auto span = SourceSpan::from_offsets(source, 6, 7);

    EXPECT_EQ(span.start.column, 7u);
    EXPECT_EQ(span.end.column, 8u);
    EXPECT_EQ(span.length(), 1u);
}

TEST(SourceSpanTest, At) {
    auto span = SourceSpan::at("x\ny", 2);

    EXPECT_EQ(span.start, span.end);
    EXPECT_EQ(span.start.line, 2u);
    EXPECT_EQ(span.length(), 0u);
}
