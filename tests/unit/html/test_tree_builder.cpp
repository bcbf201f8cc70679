#include <gtest/gtest.h>
#include "scrape/html/parser.hpp"
#include "scrape/dom/serializer.hpp"

using namespace scrape;
using namespace scrape::html;

// ============================================================================
// Tree construction
// ============================================================================

class TreeBuilderTest : public ::testing::Test {
protected:
    RefPtr<dom::Document> parse(std::string_view html, const ParseConfig& config = {}) {
        Parser parser;
        auto result = parser.parse(html, config);
        EXPECT_TRUE(result.is_ok()) << (result.is_err() ? result.error().to_string().c_str() : "");
        return result.is_ok() ? result.value() : make_ref<dom::Document>();
    }

    String document_html(std::string_view html, const ParseConfig& config = {}) {
        auto doc = parse(html, config);
        if (!doc->root()) {
            return {};
        }
        return dom::outer_html(*doc, *doc->root());
    }

    String body_html(std::string_view html, const ParseConfig& config = {}) {
        auto doc = parse(html, config);
        const auto& bodies = doc->elements_with_tag("body");
        if (bodies.empty()) {
            return {};
        }
        return dom::inner_html(*doc, bodies.front());
    }
};

TEST_F(TreeBuilderTest, ImplicitHtmlHeadBody) {
    EXPECT_EQ(document_html("<p>Hello</p>"), "<html><head></head><body><p>Hello</p></body></html>");
    EXPECT_EQ(document_html("Just text"), "<html><head></head><body>Just text</body></html>");
}

TEST_F(TreeBuilderTest, ExplicitStructureIsKept) {
    EXPECT_EQ(document_html("<!DOCTYPE html><html lang=en><head></head><body class=main></body></html>"),
              "<html lang=\"en\"><head></head><body class=\"main\"></body></html>");
}

TEST_F(TreeBuilderTest, HeadContentIsRoutedToHead) {
    EXPECT_EQ(document_html("<title>T &amp; U</title><meta charset=utf-8><link rel=icon><p>x"),
              "<html><head><title>T &amp; U</title><meta charset=\"utf-8\"><link rel=\"icon\"></head>"
              "<body><p>x</p></body></html>");
}

TEST_F(TreeBuilderTest, HeadContentAfterHeadStillGoesToHead) {
    EXPECT_EQ(document_html("<head></head><style>p{}</style><p>x"),
              "<html><head><style>p{}</style></head><body><p>x</p></body></html>");
}

TEST_F(TreeBuilderTest, UnclosedParagraph) {
    auto doc = parse("<p>Unclosed paragraph");
    EXPECT_EQ(doc->elements_with_tag("p").size(), 1u);

    EXPECT_EQ(body_html("<p>one<p>two"), "<p>one</p><p>two</p>");
    EXPECT_EQ(body_html("<p>one<div>two</div>"), "<p>one</p><div>two</div>");
}

TEST_F(TreeBuilderTest, StrayParagraphEndTagInsertsEmptyParagraph) {
    EXPECT_EQ(body_html("<div></p></div>"), "<div><p></p></div>");
}

TEST_F(TreeBuilderTest, BrEndTagBecomesBr) {
    EXPECT_EQ(body_html("a</br>b"), "a<br>b");
}

TEST_F(TreeBuilderTest, ListItemsCloseEachOther) {
    EXPECT_EQ(body_html("<ul><li>a<li>b</ul>"), "<ul><li>a</li><li>b</li></ul>");
    EXPECT_EQ(body_html("<dl><dt>t<dd>d<dt>u</dl>"), "<dl><dt>t</dt><dd>d</dd><dt>u</dt></dl>");

    auto doc = parse("<ul><div><li>");
    EXPECT_EQ(doc->elements_with_tag("li").size(), 1u);
}

TEST_F(TreeBuilderTest, NestedListDoesNotCloseOuterItem) {
    EXPECT_EQ(body_html("<ul><li>a<ul><li>b</ul><li>c</ul>"),
              "<ul><li>a<ul><li>b</li></ul></li><li>c</li></ul>");
}

TEST_F(TreeBuilderTest, OptionsCloseEachOther) {
    EXPECT_EQ(body_html("<select><option>a<option>b<optgroup><option>c</select>"),
              "<select><option>a</option><option>b</option><optgroup><option>c</option></optgroup></select>");
}

TEST_F(TreeBuilderTest, HeadingsCloseHeadings) {
    EXPECT_EQ(body_html("<h1>a<h2>b</h2>"), "<h1>a</h1><h2>b</h2>");
    EXPECT_EQ(body_html("<h1>a</h2>b"), "<h1>a</h1>b");
}

TEST_F(TreeBuilderTest, TablesGetImplicitSections) {
    EXPECT_EQ(body_html("<table><tr><td>1<td>2<tr><td>3</table>"),
              "<table><tbody><tr><td>1</td><td>2</td></tr><tr><td>3</td></tr></tbody></table>");
    EXPECT_EQ(body_html("<table><thead><th>h</thead><tbody><td>x</table>"),
              "<table><thead><tr><th>h</th></tr></thead><tbody><tr><td>x</td></tr></tbody></table>");
}

TEST_F(TreeBuilderTest, NestedTables) {
    EXPECT_EQ(body_html("<table><tr><td><table><tr><td>in</table>out</td></tr></table>"),
              "<table><tbody><tr><td><table><tbody><tr><td>in</td></tr></tbody></table>out</td></tr></tbody></table>");
}

TEST_F(TreeBuilderTest, TableCellsOutsideTablesAreIgnored) {
    EXPECT_EQ(body_html("<td>x</td>"), "x");
}

TEST_F(TreeBuilderTest, VoidElementsHaveNoChildren) {
    EXPECT_EQ(body_html("<img src=a.png><span>x</span><br><input>"),
              "<img src=\"a.png\"><span>x</span><br><input>");
    EXPECT_EQ(body_html("<image src=b.png>"), "<img src=\"b.png\">");
}

TEST_F(TreeBuilderTest, SelfClosingNonVoidIsOpened) {
    EXPECT_EQ(body_html("<div/>x"), "<div>x</div>");
    EXPECT_EQ(body_html("<svg><circle r=\"1\"/><rect/></svg>"), "<svg><circle r=\"1\"></circle><rect></rect></svg>");
}

TEST_F(TreeBuilderTest, AnyOtherEndTagStopsAtSpecialElements) {
    EXPECT_EQ(body_html("<div><span>a</div>b"), "<div><span>a</span></div>b");
    EXPECT_EQ(body_html("<b><div></b>x</div>"), "<b><div>x</div></b>");
    EXPECT_EQ(body_html("<em>a</i>b</em>"), "<em>ab</em>");
}

TEST_F(TreeBuilderTest, NestedAnchorsAreClosed) {
    EXPECT_EQ(body_html("<a href=1>x<a href=2>y</a>"), "<a href=\"1\">x</a><a href=\"2\">y</a>");
}

TEST_F(TreeBuilderTest, RawTextElements) {
    EXPECT_EQ(body_html("<script>if (a<b) x = '<p>';</script>"), "<script>if (a<b) x = '<p>';</script>");
    EXPECT_EQ(body_html("<textarea><b>x</b></textarea>"), "<textarea>&lt;b&gt;x&lt;/b&gt;</textarea>");
    EXPECT_EQ(body_html("<plaintext><p>x</p>"), "<plaintext><p>x</p></plaintext>");
}

TEST_F(TreeBuilderTest, LeadingNewlineOfPreIsDropped) {
    EXPECT_EQ(body_html("<pre>\nline\n</pre>"), "<pre>line\n</pre>");
}

TEST_F(TreeBuilderTest, WhitespaceOnlyTextIsDropped) {
    EXPECT_EQ(body_html("<div>\n  <p>a</p>\n</div>"), "<div><p>a</p></div>");
    EXPECT_EQ(body_html("<p>a <b>b</b> c</p>"), "<p>a <b>b</b> c</p>");
    EXPECT_EQ(body_html("<pre> </pre>"), "<pre> </pre>");
}

TEST_F(TreeBuilderTest, PreserveWhitespaceKeepsIt) {
    EXPECT_EQ(body_html("<div>\n  <p>a</p>\n</div>", ParseConfig{.preserve_whitespace = true}),
              "<div>\n  <p>a</p>\n</div>");
}

TEST_F(TreeBuilderTest, CommentsAreOptIn) {
    EXPECT_EQ(body_html("<p>a<!-- note -->b</p>"), "<p>ab</p>");
    EXPECT_EQ(body_html("<p>a<!-- note -->b</p>", ParseConfig{.include_comments = true}),
              "<p>a<!-- note -->b</p>");
}

TEST_F(TreeBuilderTest, AdjacentTextIsCoalesced) {
    auto doc = parse("<p>a &amp; b<!-- x --> c</p>");
    auto p = doc->elements_with_tag("p").front();

    ASSERT_EQ(doc->node(p).children.size(), 1u);
    EXPECT_EQ(doc->node(doc->node(p).children[0]).as_text()->content, "a & b c");
}

TEST_F(TreeBuilderTest, CreationOrderMatchesDocumentOrder) {
    auto doc = parse("<div><p>a</p>b<span>c</span></div>d<!-- x --><i>e</i>", ParseConfig{.include_comments = true});
    EXPECT_TRUE(doc->creation_order_is_document_order());
}

TEST_F(TreeBuilderTest, UnicodeContent) {
    EXPECT_EQ(body_html("<p title=\"\xE6\x97\xA5\xE6\x9C\xAC\">caf\xC3\xA9 \xF0\x9F\x98\x80</p>"),
              "<p title=\"\xE6\x97\xA5\xE6\x9C\xAC\">caf\xC3\xA9 \xF0\x9F\x98\x80</p>");
}

TEST_F(TreeBuilderTest, DeepNestingWithinLimit) {
    std::string html;
    for (int i = 0; i < 100; ++i) {
        html += "<div>";
    }
    html += "deep";

    auto doc = parse(html);
    EXPECT_EQ(doc->elements_with_tag("div").size(), 100u);
}
