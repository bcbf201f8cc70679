#include <gtest/gtest.h>
#include "scrape/dom/serializer.hpp"

using namespace scrape;
using namespace scrape::dom;

class SerializerTest : public ::testing::Test {
protected:
    NodeId add(NodeId parent, const char* name, Attributes attributes = {}) {
        auto id = doc.create_element(name, std::move(attributes));
        doc.append_child(parent, id);
        return id;
    }

    void add_text(NodeId parent, const char* content) {
        doc.append_child(parent, doc.create_text(content));
    }

    Document doc;
    NodeId root = doc.create_element("div");
};

TEST_F(SerializerTest, OuterHtmlOfElementWithChildren) {
    auto span = add(root, "span", {{"class", "a"}});
    add_text(span, "Hello");
    add_text(root, " world");

    EXPECT_EQ(outer_html(doc, root), "<div><span class=\"a\">Hello</span> world</div>");
    EXPECT_EQ(outer_html(doc, span), "<span class=\"a\">Hello</span>");
}

TEST_F(SerializerTest, InnerHtmlExcludesSelf) {
    auto span = add(root, "span");
    add_text(span, "Hello");

    EXPECT_EQ(inner_html(doc, root), "<span>Hello</span>");
    EXPECT_EQ(inner_html(doc, span), "Hello");
}

TEST_F(SerializerTest, AttributesKeepOrderAndEscape) {
    auto a = add(root, "a", {{"href", "/q?a=1&b=2"}, {"title", "say \"hi\" <now>"}});

    EXPECT_EQ(outer_html(doc, a),
              "<a href=\"/q?a=1&amp;b=2\" title=\"say &quot;hi&quot; &lt;now&gt;\"></a>");
}

TEST_F(SerializerTest, TextIsEscaped) {
    add_text(root, "1 < 2 && 3 > 2 \"quoted\"");

    EXPECT_EQ(inner_html(doc, root), "1 &lt; 2 &amp;&amp; 3 &gt; 2 \"quoted\"");
    EXPECT_EQ(text(doc, root), "1 < 2 && 3 > 2 \"quoted\"");
}

TEST_F(SerializerTest, VoidElementsHaveNoClosingTag) {
    add(root, "br");
    add(root, "img", {{"src", "x.png"}});
    add(root, "input");

    EXPECT_EQ(inner_html(doc, root), "<br><img src=\"x.png\"><input>");
}

TEST_F(SerializerTest, RawTextIsVerbatim) {
    auto script = add(root, "script");
    add_text(script, "if (a < b && c) {}");

    EXPECT_EQ(outer_html(doc, script), "<script>if (a < b && c) {}</script>");
}

TEST_F(SerializerTest, CommentsSerializeButAreNotText) {
    doc.append_child(root, doc.create_comment(" note "));
    add_text(root, "visible");

    EXPECT_EQ(inner_html(doc, root), "<!-- note -->visible");
    EXPECT_EQ(text(doc, root), "visible");
}

TEST_F(SerializerTest, TextConcatenatesDepthFirst) {
    add_text(root, "Hello ");
    auto b = add(root, "b");
    add_text(b, "World");
    add_text(root, "!");

    EXPECT_EQ(text(doc, root), "Hello World!");
}

TEST_F(SerializerTest, IntoVariantsAppend) {
    add_text(root, "x");
    String buffer("prefix:");

    text_into(doc, root, buffer);
    outer_html_into(doc, root, buffer);

    EXPECT_EQ(buffer, "prefix:x<div>x</div>");
}

TEST(ElementCategoryTest, VoidAndRawText) {
    EXPECT_TRUE(is_void_element("br"));
    EXPECT_TRUE(is_void_element("WBR"));
    EXPECT_FALSE(is_void_element("div"));
    EXPECT_TRUE(is_raw_text_element("style"));
    EXPECT_FALSE(is_raw_text_element("textarea"));
}

TEST(EscapeTest, Helpers) {
    EXPECT_EQ(escape_text("<a & b>"), "&lt;a &amp; b&gt;");
    EXPECT_EQ(escape_attribute("\"x\""), "&quot;x&quot;");
}
