#include <gtest/gtest.h>
#include "extract.hpp"
#include <filesystem>
#include <format>
#include <fstream>

using namespace scrape;
using namespace scrape::cli;

class ExtractTest : public ::testing::Test {
protected:
    std::vector<Extraction> run(std::string_view selector, const ExtractOptions& options = {}) {
        auto result = extract(soup, selector, options);
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? result.value() : std::vector<Extraction>{};
    }

    Soup soup = Soup::parse(
        "<h1>Title</h1>"
        "<p>First</p><p>Second</p><p>Third</p>"
        "<a href=\"/page\" class=\"nav\">Link</a><a>Bare</a>");
};

TEST_F(ExtractTest, Text) {
    auto results = run("h1");
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].text, "Title");
    EXPECT_FALSE(results[0].attrs.has_value());
    EXPECT_FALSE(results[0].html.has_value());
}

TEST_F(ExtractTest, AttributeValueDefaultsToEmpty) {
    auto results = run("a", ExtractOptions{.attribute = String("href")});
    ASSERT_EQ(results.size(), 2u);
    EXPECT_EQ(results[0].text, "/page");
    EXPECT_EQ(results[1].text, "");
}

TEST_F(ExtractTest, FirstOnly) {
    auto results = run("p", ExtractOptions{.first_only = true});
    ASSERT_EQ(results.size(), 1u);
    EXPECT_EQ(results[0].text, "First");
    EXPECT_TRUE(run("table", ExtractOptions{.first_only = true}).empty());
}

TEST_F(ExtractTest, AttributesAndHtml) {
    auto results = run("a.nav", ExtractOptions{.include_attrs = true, .include_html = true});
    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].attrs.has_value());
    ASSERT_EQ(results[0].attrs->size(), 2u);
    EXPECT_EQ((*results[0].attrs)[0].name, "href");
    EXPECT_EQ(results[0].html, String("<a href=\"/page\" class=\"nav\">Link</a>"));
}

TEST_F(ExtractTest, NoMatches) {
    EXPECT_TRUE(run("span").empty());
}

TEST_F(ExtractTest, InvalidSelector) {
    auto result = extract(soup, "[[[", {});
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().starts_with("invalid CSS selector: "));
}

TEST_F(ExtractTest, NamedSelectors) {
    std::vector<NamedSelector> selectors = {{"title", "h1"}, {"links", "a"}, {"missing", "table"}};
    auto result = extract_named(soup, selectors, {});
    ASSERT_TRUE(result.is_ok());

    const auto& named = result.value();
    ASSERT_EQ(named.size(), 3u);
    EXPECT_EQ(named.begin()->first, "links");
    EXPECT_EQ(named.at("title")[0].text, "Title");
    EXPECT_EQ(named.at("links").size(), 2u);
    EXPECT_TRUE(named.at("missing").empty());
    EXPECT_TRUE(has_matches(named));
}

TEST_F(ExtractTest, NamedSelectorErrorsNameTheSelector) {
    auto result = extract_named(soup, {{"bad", "div[[["}}, {});
    ASSERT_TRUE(result.is_err());
    EXPECT_TRUE(result.error().starts_with("invalid CSS selector for 'bad': "));
}

TEST(ProcessFilesTest, ResultsFollowInputOrder) {
    auto dir = std::filesystem::temp_directory_path();
    std::vector<String> files;
    for (int i = 0; i < 6; ++i) {
        auto path = dir / std::format("scrape_cli_process_{}.html", i);
        std::ofstream(path) << std::format("<p>file {}</p>", i);
        files.emplace_back(path.string());
    }
    files.emplace_back((dir / "scrape_cli_process_missing.html").string());

    auto results = process_files(files, "p", {}, 3);
    for (usize i = 0; i + 1 < files.size(); ++i) {
        std::filesystem::remove(std::filesystem::path(files[i].view()));
    }

    ASSERT_EQ(results.size(), 7u);
    for (usize i = 0; i < 6; ++i) {
        EXPECT_EQ(results[i].filename, files[i]);
        ASSERT_TRUE(results[i].result.is_ok());
        EXPECT_EQ(results[i].result.value()[0].text, String(std::format("file {}", i)));
    }
    ASSERT_TRUE(results[6].result.is_err());
    EXPECT_TRUE(results[6].result.error().starts_with("I/O error: cannot open"));
}

TEST(ProcessFilesTest, NamedAcrossFiles) {
    auto path = std::filesystem::temp_directory_path() / "scrape_cli_named.html";
    std::ofstream(path) << "<h1>T</h1><a>x</a><a>y</a>";

    auto results = process_files_named({String(path.string())}, {{"title", "h1"}, {"links", "a"}}, {}, 0);
    std::filesystem::remove(path);

    ASSERT_EQ(results.size(), 1u);
    ASSERT_TRUE(results[0].result.is_ok());
    EXPECT_EQ(results[0].result.value().at("links").size(), 2u);
}
