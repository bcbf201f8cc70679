#include <gtest/gtest.h>
#include "scrape/soup/soup.hpp"
#include <fstream>

using namespace scrape;

// ============================================================================
// Soup Tests
// ============================================================================

class SoupTest : public ::testing::Test {
protected:
    Soup soup = Soup::parse(
        "<html><head><title>Listing</title></head><body>"
        "<div class=\"container\">"
        "<span class=\"item\">One</span>"
        "<span class=\"item\">Two</span>"
        "<a href=\"/next\">Next</a><a>Bare</a>"
        "</div>"
        "</body></html>");
};

TEST_F(SoupTest, FindReturnsFirstMatch) {
    auto result = soup.find("span.item");
    ASSERT_TRUE(result.is_ok());
    ASSERT_TRUE(result.value().has_value());
    EXPECT_EQ(result.value()->text(), "One");
}

TEST_F(SoupTest, FindAllInDocumentOrder) {
    auto result = soup.find_all("div.container > span.item");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 2u);
    EXPECT_EQ(result.value()[0].text(), "One");
    EXPECT_EQ(result.value()[1].text(), "Two");

    auto selected = soup.select("span, a");
    ASSERT_TRUE(selected.is_ok());
    EXPECT_EQ(selected.value().size(), 4u);
}

TEST_F(SoupTest, NotFoundIsNotAnError) {
    auto result = soup.find("table");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().has_value());

    auto all = soup.find_all("table");
    ASSERT_TRUE(all.is_ok());
    EXPECT_TRUE(all.value().empty());
}

TEST_F(SoupTest, FindOrErrReportsNotFound) {
    auto missing = soup.find_or_err("table");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().kind, SoupError::Kind::NotFound);
    EXPECT_EQ(missing.error().to_string(), "element not found: table");

    auto invalid = soup.find_or_err("div[[[");
    ASSERT_TRUE(invalid.is_err());
    EXPECT_EQ(invalid.error().kind, SoupError::Kind::InvalidSelector);

    auto found = soup.find_or_err("a");
    ASSERT_TRUE(found.is_ok());
    EXPECT_EQ(found.value().text(), "Next");
}

TEST_F(SoupTest, InvalidSelectorIsAnError) {
    auto result = soup.find_all("div[[[");
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, css::QueryError::Kind::InvalidSelector);
    EXPECT_TRUE(soup.find("").is_err());
}

TEST_F(SoupTest, SelectTextAndAttr) {
    auto texts = soup.select_text("span.item");
    ASSERT_TRUE(texts.is_ok());
    EXPECT_EQ(texts.value(), (std::vector<String>{"One", "Two"}));

    auto hrefs = soup.select_attr("a", "href");
    ASSERT_TRUE(hrefs.is_ok());
    ASSERT_EQ(hrefs.value().size(), 2u);
    EXPECT_EQ(hrefs.value()[0], String("/next"));
    EXPECT_FALSE(hrefs.value()[1].has_value());
}

TEST_F(SoupTest, CompiledSelectorsAreReusable) {
    auto compiled = css::CompiledSelector::compile(".item");
    ASSERT_TRUE(compiled.is_ok());

    EXPECT_EQ(soup.select_compiled(compiled.value()).size(), 2u);
    ASSERT_TRUE(soup.find_compiled(compiled.value()).has_value());
    EXPECT_EQ(soup.find_compiled(compiled.value())->text(), "One");

    auto other = Soup::parse("<p class=item>x</p>");
    EXPECT_EQ(other.select_compiled(compiled.value()).size(), 1u);
}

TEST_F(SoupTest, DocumentAccessors) {
    ASSERT_TRUE(soup.root().has_value());
    EXPECT_EQ(soup.root()->name(), "html");
    EXPECT_EQ(soup.title(), String("Listing"));
    EXPECT_EQ(soup.text(), "ListingOneTwoNextBare");
    EXPECT_FALSE(soup.empty());
    EXPECT_EQ(soup.length(), soup.document().size());
}

TEST_F(SoupTest, ToHtml) {
    auto small = Soup::parse("<p>a<b>b</b></p>");
    EXPECT_EQ(small.to_html(), "<html><head></head><body><p>a<b>b</b></p></body></html>");
    EXPECT_FALSE(Soup::parse("<p>x</p>").title().has_value());
}

TEST_F(SoupTest, ExplainCountsMatches) {
    auto result = soup.explain("span.item");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().estimated_matches, 2u);
    EXPECT_TRUE(soup.explain("div > > span").is_err());
}

// ============================================================================
// Parsing entry points
// ============================================================================

TEST(SoupParseTest, LenientParseDegradesToEmptyDocument) {
    auto soup = Soup::parse("   ");
    EXPECT_TRUE(soup.empty());
    EXPECT_FALSE(soup.root().has_value());
    EXPECT_EQ(soup.to_html(), "");
    EXPECT_EQ(soup.text(), "");

    auto result = soup.find("*");
    ASSERT_TRUE(result.is_ok());
    EXPECT_FALSE(result.value().has_value());
}

TEST(SoupParseTest, ParseWithConfigSurfacesErrors) {
    auto result = Soup::parse_with_config("<div><div><div>x", SoupConfig{.max_depth = 4});
    ASSERT_TRUE(result.is_err());
    EXPECT_EQ(result.error().kind, html::ParseError::Kind::MaxDepthExceeded);

    auto empty = Soup::parse_with_config("", SoupConfig{});
    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().kind, html::ParseError::Kind::EmptyInput);
}

TEST(SoupParseTest, ConfigOptionsReachTheParser) {
    auto result = Soup::parse_with_config("<p>a<!-- note -->b</p>", SoupConfig{.include_comments = true});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value().find("p").value()->inner_html(), "a<!-- note -->b");
}

TEST(SoupParseTest, WarningsAreKept) {
    auto soup = Soup::parse("<div><span></div>");
    ASSERT_EQ(soup.warnings().size(), 2u);
    EXPECT_EQ(soup.warnings()[1].severity, html::WarningSeverity::RecoveredError);
}

TEST(SoupParseTest, Fragments) {
    auto soup = Soup::parse_fragment("<li>a</li><li>b</li>", "ul");
    EXPECT_EQ(soup.to_html(), "<html><li>a</li><li>b</li></html>");
    EXPECT_EQ(soup.find_all("li").value().size(), 2u);
    EXPECT_FALSE(soup.find("body").value().has_value());

    auto failed = Soup::try_parse_fragment("");
    ASSERT_TRUE(failed.is_err());
    EXPECT_EQ(failed.error().kind, html::ParseError::Kind::EmptyInput);
    EXPECT_TRUE(Soup::parse_fragment("").empty());
}

TEST(SoupParseTest, FromFile) {
    auto path = std::filesystem::temp_directory_path() / "scrape_soup_from_file_test.html";
    {
        std::ofstream out(path, std::ios::binary);
        out << "<title>From disk</title><p class=x>body</p>";
    }

    auto result = Soup::from_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(result.is_ok()) << result.error().to_string();
    EXPECT_EQ(result.value().title(), String("From disk"));
    EXPECT_EQ(result.value().select_text(".x").value(), (std::vector<String>{"body"}));
}

TEST(SoupParseTest, FromFileErrors) {
    auto missing = Soup::from_file("/nonexistent/scrape/input.html");
    ASSERT_TRUE(missing.is_err());
    EXPECT_EQ(missing.error().kind, SoupError::Kind::Io);
    EXPECT_TRUE(missing.error().to_string().starts_with("I/O error: cannot open"));

    auto path = std::filesystem::temp_directory_path() / "scrape_soup_empty_file_test.html";
    {
        std::ofstream out(path, std::ios::binary);
    }
    auto empty = Soup::from_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(empty.is_err());
    EXPECT_EQ(empty.error().kind, SoupError::Kind::Parse);
    EXPECT_EQ(empty.error().to_string(), "empty or whitespace-only input");
}

// ============================================================================
// SoupError
// ============================================================================

TEST(SoupErrorTest, Formatting) {
    EXPECT_EQ(SoupError::not_found("div.missing").to_string(), "element not found: div.missing");
    EXPECT_EQ(SoupError::attribute_not_found("href").to_string(), "attribute 'href' not found on element");
    EXPECT_EQ(SoupError::io("disk on fire").to_string(), "I/O error: disk on fire");

    auto parse = html::ParseError::max_depth_exceeded(8);
    EXPECT_EQ(SoupError::from_parse(parse).to_string(), parse.to_string());

    auto query = css::QueryError::invalid_selector("unexpected token");
    EXPECT_EQ(SoupError::from_query(query).to_string(), query.to_string());
    EXPECT_EQ(SoupError::from_query(query).kind, SoupError::Kind::InvalidSelector);
}
