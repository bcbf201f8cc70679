#include <gtest/gtest.h>
#include "scrape/css/matcher.hpp"
#include <chrono>

using namespace scrape;
using namespace scrape::css;
using scrape::dom::Attributes;
using scrape::dom::Document;
using scrape::dom::NodeId;

// <div id=root>
//   <p class="intro lead">Hello</p>
//   <!-- note -->
//   <p lang="en-US">Second</p>
//   <span data-x="Alpha Beta"></span>
//   <section><h2>Title</h2><p>Inner</p></section>
// </div>
class MatcherTest : public ::testing::Test {
protected:
    NodeId add(NodeId parent, const char* name, Attributes attributes = {}) {
        auto id = doc.create_element(name, std::move(attributes));
        doc.append_child(parent, id);
        return id;
    }

    NodeId with_text(NodeId element, const char* content) {
        doc.append_child(element, doc.create_text(content));
        return element;
    }

    bool matches(std::string_view selector, NodeId element) {
        auto compiled = CompiledSelector::compile(selector);
        EXPECT_TRUE(compiled.is_ok()) << selector;
        if (compiled.is_err()) {
            return false;
        }
        return SelectorMatcher(doc).matches(compiled.value().selectors(), element);
    }

    Document doc;
    NodeId root = make_root();
    NodeId intro = with_text(add(root, "p", {{"class", "intro lead"}}), "Hello");
    NodeId comment = add_comment();
    NodeId second = with_text(add(root, "p", {{"lang", "en-US"}}), "Second");
    NodeId span = add(root, "span", {{"data-x", "Alpha Beta"}});
    NodeId section = add(root, "section");
    NodeId h2 = with_text(add(section, "h2"), "Title");
    NodeId inner = with_text(add(section, "p"), "Inner");

private:
    NodeId make_root() {
        auto id = doc.create_element("div", {{"id", "root"}});
        doc.set_root(id);
        return id;
    }

    NodeId add_comment() {
        auto id = doc.create_comment(" note ");
        doc.append_child(root, id);
        return id;
    }
};

TEST_F(MatcherTest, TypeIsCaseInsensitive) {
    EXPECT_TRUE(matches("P", intro));
    EXPECT_TRUE(matches("p", intro));
    EXPECT_FALSE(matches("span", intro));
}

TEST_F(MatcherTest, ClassAndId) {
    EXPECT_TRUE(matches(".intro.lead", intro));
    EXPECT_FALSE(matches(".Intro", intro));
    EXPECT_TRUE(matches("#root", root));
    EXPECT_TRUE(matches("div#root", root));
    EXPECT_FALSE(matches("#ROOT", root));
}

TEST_F(MatcherTest, NonElementsNeverMatch) {
    EXPECT_FALSE(matches("*", comment));
}

TEST_F(MatcherTest, AttributeOperators) {
    EXPECT_TRUE(matches("[lang]", second));
    EXPECT_TRUE(matches("[LANG|=en]", second));
    EXPECT_TRUE(matches("[lang=en-US]", second));
    EXPECT_FALSE(matches("[lang=en-us]", second));
    EXPECT_TRUE(matches("[lang=en-us i]", second));
    EXPECT_TRUE(matches("[data-x~=Beta]", span));
    EXPECT_FALSE(matches("[data-x~=Bet]", span));
    EXPECT_TRUE(matches("[data-x^=Alp]", span));
    EXPECT_TRUE(matches("[data-x$=eta]", span));
    EXPECT_TRUE(matches("[data-x*='ha B']", span));
    EXPECT_FALSE(matches("[data-x^='']", span));
    EXPECT_FALSE(matches("[title]", span));
}

TEST_F(MatcherTest, DescendantBacktracks) {
    // section is not a div, but the outer div is
    EXPECT_TRUE(matches("div p", inner));
    EXPECT_TRUE(matches("div > section > p", inner));
    EXPECT_FALSE(matches("div > p > p", inner));
    EXPECT_TRUE(matches("#root section p", inner));
}

TEST_F(MatcherTest, SiblingCombinatorsSkipNonElements) {
    EXPECT_TRUE(matches("p + p", second));
    EXPECT_TRUE(matches(".intro ~ span", span));
    EXPECT_FALSE(matches("span + p", second));
    EXPECT_TRUE(matches("h2 + p", inner));
}

TEST_F(MatcherTest, ChildFailureRetriesHigherAncestors) {
    // root > p > section > p > span: the inner p is not a child of a div,
    // the outer one is
    auto outer = add(root, "p");
    auto middle = add(outer, "section");
    auto nested = add(middle, "p");
    auto leaf = add(nested, "span");

    EXPECT_TRUE(matches("div > p span", leaf));
    EXPECT_TRUE(matches("div > p section > p > span", leaf));
    EXPECT_TRUE(matches("section > p > span", leaf));
    EXPECT_FALSE(matches("div > section span", leaf));
    EXPECT_FALSE(matches("section > section span", leaf));
}

TEST_F(MatcherTest, SiblingFailureRetriesEarlierSiblings) {
    EXPECT_TRUE(matches(".intro ~ p ~ section", section));
    EXPECT_TRUE(matches("div > p + p ~ section", section));
    EXPECT_TRUE(matches("p ~ span + section", section));
    EXPECT_FALSE(matches("span ~ p ~ section", section));
    EXPECT_FALSE(matches("h2 ~ span ~ section", section));
    // Sibling chain inside a descendant chain
    EXPECT_TRUE(matches("p ~ section > h2 + p", inner));
    EXPECT_FALSE(matches("span + p ~ section p", inner));
}

TEST_F(MatcherTest, DeepNestingWithManyDescendantPartsIsFast) {
    NodeId parent = root;
    for (int i = 0; i < 200; ++i) {
        parent = add(parent, "div");
    }
    auto leaf = add(parent, "span");

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(matches("section div div div div div div div div span", leaf));
    EXPECT_FALSE(matches("div div div div div div div div p ~ span", leaf));
    EXPECT_TRUE(matches("div div div div div div div div span", leaf));
    EXPECT_TRUE(matches("#root div div div div div div div div span", leaf));
    auto elapsed = std::chrono::steady_clock::now() - start;

    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 1000);
}

TEST_F(MatcherTest, StructuralPseudoClasses) {
    EXPECT_TRUE(matches("p:first-child", intro));
    EXPECT_FALSE(matches("p:first-child", second));
    EXPECT_TRUE(matches("section:last-child", section));
    EXPECT_TRUE(matches("p:last-of-type", second));
    EXPECT_TRUE(matches("span:only-of-type", span));
    EXPECT_FALSE(matches("span:only-child", span));
    EXPECT_TRUE(matches(":root", root));
    EXPECT_FALSE(matches(":root", intro));
    EXPECT_TRUE(matches("span:empty", span));
    EXPECT_FALSE(matches("p:empty", intro));
}

TEST_F(MatcherTest, NthPseudoClasses) {
    EXPECT_TRUE(matches(":nth-child(2)", second));
    EXPECT_TRUE(matches(":nth-child(odd)", span));
    EXPECT_TRUE(matches(":nth-last-child(1)", section));
    EXPECT_TRUE(matches("p:nth-of-type(2)", second));
    EXPECT_TRUE(matches("p:nth-last-of-type(2)", intro));
    EXPECT_TRUE(matches(":nth-child(-n+2)", intro));
    EXPECT_FALSE(matches(":nth-child(-n+2)", span));
}

TEST_F(MatcherTest, LogicalPseudoClasses) {
    EXPECT_TRUE(matches("p:not(.intro)", second));
    EXPECT_FALSE(matches("p:not(.intro, [lang])", second));
    EXPECT_TRUE(matches(":is(span, h2)", h2));
    EXPECT_TRUE(matches(":where(.lead)", intro));
}

TEST_F(MatcherTest, HasPseudoClass) {
    EXPECT_TRUE(matches("section:has(h2)", section));
    EXPECT_TRUE(matches("div:has(> section > p)", root));
    EXPECT_FALSE(matches("div:has(> h2)", root));
    EXPECT_TRUE(matches("h2:has(+ p)", h2));
    EXPECT_TRUE(matches("p:has(~ section h2)", intro));
    EXPECT_FALSE(matches("p:has(+ span)", intro));
}

TEST_F(MatcherTest, PseudoElementsNeverMatch) {
    EXPECT_FALSE(matches("p::before", intro));
}

TEST_F(MatcherTest, SelectorListMatchesAnyMember) {
    EXPECT_TRUE(matches("h1, span", span));
    EXPECT_FALSE(matches("h1, h3", span));
}
