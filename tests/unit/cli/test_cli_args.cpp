#include <gtest/gtest.h>
#include "cli_args.hpp"

using namespace scrape;
using namespace scrape::cli;

class CliArgsTest : public ::testing::Test {
protected:
    CliArgs parse(std::vector<std::string_view> arguments) {
        auto result = parse_args(arguments);
        EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error().c_str() : "");
        return result.is_ok() ? result.value() : CliArgs{};
    }

    String parse_error(std::vector<std::string_view> arguments) {
        auto result = parse_args(arguments);
        EXPECT_TRUE(result.is_err());
        return result.is_err() ? result.error() : String();
    }
};

TEST_F(CliArgsTest, SelectorAndFiles) {
    auto args = parse({"h1", "a.html", "b.html"});
    ASSERT_TRUE(args.selector.has_value());
    EXPECT_EQ(*args.selector, "h1");
    EXPECT_EQ(args.files, (std::vector<String>{"a.html", "b.html"}));
    EXPECT_EQ(args.output, OutputFormat::Text);
    EXPECT_EQ(args.timeout_secs, 30u);
    EXPECT_FALSE(args.named());
}

TEST_F(CliArgsTest, NamedSelectorsMakeEveryPositionalAFile) {
    auto args = parse({"-s", "title=h1", "--select", "links=a[href]", "page.html"});
    EXPECT_FALSE(args.selector.has_value());
    ASSERT_EQ(args.selects.size(), 2u);
    EXPECT_EQ(args.selects[0], (NamedSelector{"title", "h1"}));
    EXPECT_EQ(args.selects[1], (NamedSelector{"links", "a[href]"}));
    EXPECT_EQ(args.files, (std::vector<String>{"page.html"}));
}

TEST_F(CliArgsTest, SelectorValueMaySplitAtFirstEquals) {
    auto args = parse({"-s", "x=a[href='/q=1']"});
    ASSERT_EQ(args.selects.size(), 1u);
    EXPECT_EQ(args.selects[0].selector, "a[href='/q=1']");
}

TEST_F(CliArgsTest, FlagsAndValues) {
    auto args = parse({"-o", "json", "-a", "href", "-1", "-p", "-0", "-q", "-j", "4", "-H",
                       "--color=never", "-v", "a", "x.html"});
    EXPECT_EQ(args.output, OutputFormat::Json);
    EXPECT_EQ(args.attribute, String("href"));
    EXPECT_TRUE(args.first);
    EXPECT_TRUE(args.pretty);
    EXPECT_TRUE(args.null_delimiter);
    EXPECT_TRUE(args.quiet);
    EXPECT_EQ(args.parallel, 4u);
    EXPECT_TRUE(args.with_filename);
    EXPECT_FALSE(args.no_filename);
    EXPECT_EQ(args.color, ColorMode::Never);
    EXPECT_TRUE(args.verbose);
}

TEST_F(CliArgsTest, BundledShortOptions) {
    auto args = parse({"-1pj8", "li"});
    EXPECT_TRUE(args.first);
    EXPECT_TRUE(args.pretty);
    EXPECT_EQ(args.parallel, 8u);
    EXPECT_EQ(*args.selector, "li");
}

TEST_F(CliArgsTest, DoubleDashEndsOptions) {
    auto args = parse({"--", "-weird-selector", "file.html"});
    EXPECT_EQ(*args.selector, "-weird-selector");
    EXPECT_EQ(args.files.size(), 1u);
}

TEST_F(CliArgsTest, UrlAndTimeout) {
    auto args = parse({"-u", "https://example.com/", "--timeout", "5", "title"});
    EXPECT_EQ(args.url, String("https://example.com/"));
    EXPECT_EQ(args.timeout_secs, 5u);
}

TEST_F(CliArgsTest, HelpSkipsValidation) {
    auto args = parse({"--help"});
    EXPECT_TRUE(args.help);
    EXPECT_TRUE(usage_text().starts_with("Usage: scrape"));
}

TEST_F(CliArgsTest, ExplainNeedsOnlyASelector) {
    auto args = parse({"--explain", "div > p"});
    EXPECT_TRUE(args.explain);
    EXPECT_EQ(*args.selector, "div > p");

    EXPECT_EQ(parse_error({"--explain"}), "--explain requires a SELECTOR");
}

TEST_F(CliArgsTest, SelectorRequired) {
    EXPECT_EQ(parse_error({}), "either SELECTOR or --select must be provided");
    EXPECT_EQ(parse_error({"-o", "json"}), "either SELECTOR or --select must be provided");
}

TEST_F(CliArgsTest, InvalidNamedSelectors) {
    EXPECT_EQ(parse_error({"-s", "title"}), "invalid --select format: 'title'. Use NAME=SELECTOR");
    EXPECT_EQ(parse_error({"-s", "=h1"}), "invalid --select format: '=h1'. Use NAME=SELECTOR");
    EXPECT_EQ(parse_error({"-s", "title="}), "invalid --select format: 'title='. Use NAME=SELECTOR");
}

TEST_F(CliArgsTest, CsvRequiresNamedSelectors) {
    EXPECT_EQ(parse_error({"-o", "csv", "h1"}), "CSV output requires --select for column names");
    EXPECT_TRUE(parse_args({"-o", "csv", "-s", "t=h1"}).is_ok());
}

TEST_F(CliArgsTest, UrlConflictsWithFiles) {
    EXPECT_EQ(parse_error({"-u", "http://x/", "h1", "page.html"}), "--url cannot be combined with input files");
}

TEST_F(CliArgsTest, NumericOptionsMustBePositive) {
    EXPECT_EQ(parse_error({"-j", "0", "h1"}), "invalid value '0' for --parallel: expected a positive integer");
    EXPECT_EQ(parse_error({"-j", "four", "h1"}), "invalid value 'four' for --parallel: expected a positive integer");
    EXPECT_EQ(parse_error({"--timeout", "-3", "h1"}), "invalid value '-3' for --timeout: expected a positive integer");
    EXPECT_EQ(parse_error({"--timeout", "10s", "h1"}), "invalid value '10s' for --timeout: expected a positive integer");
}

TEST_F(CliArgsTest, UnknownOrIncompleteOptions) {
    EXPECT_EQ(parse_error({"--frobnicate", "h1"}), "unknown option '--frobnicate'");
    EXPECT_EQ(parse_error({"-x", "h1"}), "unknown option '-x'");
    EXPECT_EQ(parse_error({"h1", "-o"}), "option '-o' requires a value");
    EXPECT_EQ(parse_error({"--output=yaml", "h1"}), "invalid output format 'yaml' (expected text, json, html or csv)");
    EXPECT_EQ(parse_error({"--first=yes", "h1"}), "option '--first' does not take a value");
}

TEST_F(CliArgsTest, ShowFilename) {
    EXPECT_FALSE(parse({"h1", "a.html"}).show_filename());
    EXPECT_TRUE(parse({"h1", "a.html", "b.html"}).show_filename());
    EXPECT_FALSE(parse({"--no-filename", "h1", "a.html", "b.html"}).show_filename());
}

TEST_F(CliArgsTest, WithFilenameForcesPrefixAndWins) {
    EXPECT_TRUE(parse({"-H", "h1", "a.html"}).show_filename());
    EXPECT_TRUE(parse({"--with-filename", "h1"}).show_filename());
    EXPECT_TRUE(parse({"-H", "--no-filename", "h1", "a.html", "b.html"}).show_filename());
    EXPECT_EQ(parse_error({"-Hx", "h1"}), "unknown option '-x'");
}

TEST_F(CliArgsTest, NoFilenameIsLongOnly) {
    auto args = parse({"--no-filename", "h1", "a.html"});
    EXPECT_TRUE(args.no_filename);
    EXPECT_FALSE(args.with_filename);
}

TEST_F(CliArgsTest, InteractiveNeedsNoSelector) {
    auto args = parse({"-i"});
    EXPECT_TRUE(args.interactive);
    EXPECT_FALSE(args.selector.has_value());
    EXPECT_TRUE(parse({"--interactive", "-o", "csv"}).interactive);
}
