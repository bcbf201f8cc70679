#include <gtest/gtest.h>
#include "output.hpp"
#include <sstream>

using namespace scrape;
using namespace scrape::cli;

namespace {

Extraction text_only(std::string_view text) {
    return Extraction{String(text), std::nullopt, std::nullopt};
}

} // namespace

class OutputTest : public ::testing::Test {
protected:
    std::string single(OutputFormat format, const std::vector<Extraction>& results,
                       const String* filename = nullptr, OutputOptions options = {}) {
        std::ostringstream out;
        make_formatter(format, options)->write_single(out, results, filename);
        return out.str();
    }

    std::string named(OutputFormat format, const NamedExtractions& results,
                      const String* filename = nullptr, OutputOptions options = {}) {
        std::ostringstream out;
        make_formatter(format, options)->write_named(out, results, filename);
        return out.str();
    }

    std::vector<Extraction> hello_world = {text_only("Hello"), text_only("World")};
    NamedExtractions people = {
        {"name", {text_only("Alice"), text_only("Bob")}},
        {"age", {text_only("30")}},
    };
    String filename{"page.html"};
};

// ============================================================================
// Text
// ============================================================================

TEST_F(OutputTest, TextLines) {
    EXPECT_EQ(single(OutputFormat::Text, hello_world), "Hello\nWorld\n");
    EXPECT_EQ(single(OutputFormat::Text, hello_world, &filename), "page.html: Hello\npage.html: World\n");
}

TEST_F(OutputTest, TextNullDelimiter) {
    auto out = single(OutputFormat::Text, hello_world, nullptr, OutputOptions{.delimiter = '\0'});
    EXPECT_EQ(out, std::string("Hello\0World\0", 12));
}

TEST_F(OutputTest, TextNamedSortedByName) {
    EXPECT_EQ(named(OutputFormat::Text, people), "age: 30\nname: Alice\nname: Bob\n");
}

TEST_F(OutputTest, TextColor) {
    auto out = single(OutputFormat::Text, {text_only("x")}, &filename, OutputOptions{.color = true});
    EXPECT_EQ(out, "\x1b[35mpage.html\x1b[0m: x\n");

    auto named_out = named(OutputFormat::Text, {{"t", {text_only("x")}}}, nullptr, OutputOptions{.color = true});
    EXPECT_EQ(named_out, "\x1b[36mt\x1b[0m: x\n");
}

// ============================================================================
// JSON
// ============================================================================

TEST_F(OutputTest, JsonStrings) {
    EXPECT_EQ(single(OutputFormat::Json, hello_world), "[\"Hello\",\"World\"]\n");
    EXPECT_EQ(single(OutputFormat::Json, {}), "[]\n");
}

TEST_F(OutputTest, JsonObjectsWithAttrsAndHtml) {
    Extraction link{"Link", dom::Attributes{{"href", "/page"}}, String("<a href=\"/page\">Link</a>")};
    EXPECT_EQ(single(OutputFormat::Json, {link}),
              "[{\"text\":\"Link\",\"attrs\":{\"href\":\"/page\"},\"html\":\"<a href=\\\"/page\\\">Link</a>\"}]\n");
}

TEST_F(OutputTest, JsonPretty) {
    EXPECT_EQ(single(OutputFormat::Json, {text_only("Hello")}, nullptr, OutputOptions{.pretty = true}),
              "[\n  \"Hello\"\n]\n");
    EXPECT_EQ(named(OutputFormat::Json, {{"t", {text_only("a")}}, {"u", {}}}, nullptr, OutputOptions{.pretty = true}),
              "{\n  \"t\": [\n    \"a\"\n  ],\n  \"u\": []\n}\n");
}

TEST_F(OutputTest, JsonNamed) {
    EXPECT_EQ(named(OutputFormat::Json, people), "{\"age\":[\"30\"],\"name\":[\"Alice\",\"Bob\"]}\n");
}

TEST_F(OutputTest, JsonEscaping) {
    EXPECT_EQ(json_quote("a\"b\\c\nd\te"), "\"a\\\"b\\\\c\\nd\\te\"");
    EXPECT_EQ(json_quote(std::string_view("\x01", 1)), "\"\\u0001\"");
    EXPECT_EQ(json_quote("caf\xC3\xA9"), "\"caf\xC3\xA9\"");
}

// ============================================================================
// HTML
// ============================================================================

TEST_F(OutputTest, HtmlPrefersOuterHtml) {
    Extraction span{"Hello", std::nullopt, String("<span>Hello</span>")};
    EXPECT_EQ(single(OutputFormat::Html, {span}), "<span>Hello</span>\n");
    EXPECT_EQ(single(OutputFormat::Html, {text_only("Hello")}), "Hello\n");
}

TEST_F(OutputTest, HtmlFilenameComment) {
    String dashed{"a--b.html"};
    EXPECT_EQ(single(OutputFormat::Html, {text_only("x")}, &dashed), "<!-- a- -b.html -->\nx\n");
    EXPECT_EQ(comment_safe("---"), "- - -");
}

TEST_F(OutputTest, HtmlNamed) {
    EXPECT_EQ(named(OutputFormat::Html, people, &filename),
              "<!-- page.html -->\n<!-- age -->\n30\n<!-- name -->\nAlice\nBob\n");
}

// ============================================================================
// CSV
// ============================================================================

TEST_F(OutputTest, CsvSingle) {
    EXPECT_EQ(single(OutputFormat::Csv, hello_world), "value\nHello\nWorld\n");
    EXPECT_EQ(single(OutputFormat::Csv, {text_only("Hello")}, &filename), "file,value\npage.html,Hello\n");
}

TEST_F(OutputTest, CsvNamedPadsShortColumns) {
    EXPECT_EQ(named(OutputFormat::Csv, people), "age,name\n30,Alice\n,Bob\n");
}

TEST_F(OutputTest, CsvQuoting) {
    EXPECT_EQ(csv_field("plain"), "plain");
    EXPECT_EQ(csv_field("a,b"), "\"a,b\"");
    EXPECT_EQ(csv_field("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(csv_field("two\nlines"), "\"two\nlines\"");
}
