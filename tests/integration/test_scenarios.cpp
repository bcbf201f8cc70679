/**
 * End-to-end scenarios: parse, query and navigate through the Soup API
 */

#include <gtest/gtest.h>
#include "scrape/soup/soup.hpp"
#include <algorithm>
#include <chrono>
#include <format>

using namespace scrape;

namespace {

std::vector<String> ids_of(const std::vector<Tag>& tags) {
    std::vector<String> ids;
    for (const auto& tag : tags) {
        const auto* id = tag.get("id");
        ids.push_back(id ? *id : String());
    }
    return ids;
}

String collapse_whitespace(const String& text) {
    String collapsed;
    for (const auto& word : text.split_whitespace()) {
        if (!collapsed.empty()) {
            collapsed += ' ';
        }
        collapsed += word;
    }
    return collapsed;
}

} // namespace

class ScenarioTest : public ::testing::Test {
protected:
    static Soup parse(std::string_view html) { return Soup::parse(html); }

    static Tag first(const Soup& soup, std::string_view selector) {
        auto result = soup.find(selector);
        EXPECT_TRUE(result.is_ok() && result.value().has_value()) << selector;
        return *result.value();
    }
};

// ============================================================================
// Navigation
// ============================================================================

TEST_F(ScenarioTest, ThousandSiblings) {
    String html("<ul>");
    for (int i = 0; i < 1000; ++i) {
        html += String(std::format("<li id='i{}'>item {}</li>", i, i));
    }
    html += "</ul>";

    auto soup = parse(html.view());
    auto item = first(soup, "#i500");
    EXPECT_EQ(item.prev_siblings().count(), 500u);
    EXPECT_EQ(item.next_siblings().count(), 499u);
    EXPECT_EQ(item.siblings().count(), 999u);
    EXPECT_EQ(*item.prev_sibling()->get("id"), "i499");
    EXPECT_EQ(*item.next_sibling()->get("id"), "i501");
}

TEST_F(ScenarioTest, SiblingsArePrevReversedThenNext) {
    auto soup = parse("<div><a id=1></a>t<b id=2></b><i id=3></i><!-- c --><u id=4></u></div>");
    for (const auto& tag : soup.find_all("div > *").value()) {
        auto expected = ids_of(tag.prev_siblings().to_vector());
        std::reverse(expected.begin(), expected.end());
        auto next = ids_of(tag.next_siblings().to_vector());
        expected.insert(expected.end(), next.begin(), next.end());

        EXPECT_EQ(ids_of(tag.siblings().to_vector()), expected) << *tag.get("id");
    }
}

TEST_F(ScenarioTest, ClosestMatchesFirstAncestor) {
    auto soup = parse(
        "<div data-type='wrapper' id='w'><section id='s'><div id='inner'>"
        "<p id='p'><span id='leaf'>x</span></p></div></section></div>");

    for (std::string_view selector : {"div", "section, p", "[data-type='wrapper']", "body"}) {
        auto matching = soup.find_all(selector).value();
        for (const auto& tag : soup.select("*").value()) {
            std::optional<Tag> expected;
            for (const auto& ancestor : tag.ancestors()) {
                if (std::find(matching.begin(), matching.end(), ancestor) != matching.end()) {
                    expected = ancestor;
                    break;
                }
            }

            auto closest = tag.closest(selector);
            ASSERT_TRUE(closest.is_ok());
            EXPECT_EQ(closest.value(), expected) << selector;
            if (closest.value()) {
                EXPECT_FALSE(*closest.value() == tag);
            }
        }
    }

    auto wrapper = first(soup, "#leaf").closest("div[data-type='wrapper']");
    ASSERT_TRUE(wrapper.is_ok());
    EXPECT_EQ(*wrapper.value()->get("id"), "w");
}

// ============================================================================
// Selectors
// ============================================================================

TEST_F(ScenarioTest, DeeplyNestedSelector) {
    auto soup = parse(
        "<div class='wrapper'><main><section id='content'><article class='post'>"
        "<header><h1 class='title'>Deep Title</h1></header>"
        "</article></section></main></div>"
        "<div class='wrapper'><main><section><article class='post'>"
        "<header><h1 class='title'>Other</h1></header>"
        "</article></section></main></div>");

    auto result = soup.find_all("div.wrapper > main > section#content > article.post > header > h1.title");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].text(), "Deep Title");
}

TEST_F(ScenarioTest, AdjacentSibling) {
    auto soup = parse("<div><p>First</p><p>Second</p><span>Adjacent</span><p>Third</p></div>");
    auto result = soup.find_all("p + span");
    ASSERT_TRUE(result.is_ok());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].text(), "Adjacent");
}

TEST_F(ScenarioTest, GeneralSibling) {
    auto soup = parse("<div><h2>h</h2><p>1</p><span>s</span><p>2</p><p>3</p></div><p>outside</p>");
    EXPECT_EQ(soup.find_all("h2 ~ p").value().size(), 3u);
    EXPECT_EQ(soup.find_all("p ~ p").value().size(), 2u);
    EXPECT_EQ(soup.find_all("span ~ p").value().size(), 2u);
}

TEST_F(ScenarioTest, MultipleAttributeSelectors) {
    auto soup = parse(
        "<a href='https://a.example' target='_blank' rel='noopener'>yes</a>"
        "<a href='https://b.example' target='_blank'>no rel</a>"
        "<a href='http://c.example' target='_blank' rel='noopener'>plain http</a>");
    auto result = soup.select_text("a[href^=\"https\"][target=\"_blank\"][rel=\"noopener\"]");
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value(), (std::vector<String>{"yes"}));
}

TEST_F(ScenarioTest, FirstAndLastChild) {
    auto soup = parse("<ul><li>a</li><li>b</li><li>c</li></ul><ol><li>only</li></ol>");
    EXPECT_EQ(soup.select_text("li:first-child").value(), (std::vector<String>{"a", "only"}));
    EXPECT_EQ(soup.select_text("li:last-child").value(), (std::vector<String>{"c", "only"}));
}

TEST_F(ScenarioTest, InvalidSelectorsAreErrors) {
    auto soup = parse("<div><span>x</span></div>");
    for (std::string_view selector : {"div[[[", "", "div:not-a-real-pseudo", "div > > span"}) {
        auto result = soup.find_all(selector);
        ASSERT_TRUE(result.is_err()) << selector;
        EXPECT_EQ(result.error().kind, css::QueryError::Kind::InvalidSelector);
        EXPECT_TRUE(css::CompiledSelector::compile(selector).is_err()) << selector;
    }
    EXPECT_TRUE(css::explain("").is_err());
    EXPECT_TRUE(css::explain("div:not-a-real-pseudo").is_err());
    EXPECT_TRUE(css::explain("div > > span").is_err());
}

TEST_F(ScenarioTest, ArbitraryInputNeverCrashesTheCompiler) {
    const std::string_view alphabet = "abc*#.[]=\"'()>+~:, -_|^$\\\x01\xC3\xA9";
    u32 state = 12345;
    for (int round = 0; round < 2000; ++round) {
        std::string selector;
        usize length = state % 12;
        for (usize i = 0; i < length; ++i) {
            state = state * 1103515245u + 12345u;
            selector += alphabet[(state >> 16) % alphabet.size()];
        }
        state = state * 1103515245u + 12345u;

        auto compiled = css::CompiledSelector::compile(selector);
        if (compiled.is_err()) {
            EXPECT_EQ(compiled.error().kind, css::QueryError::Kind::InvalidSelector);
        }
    }
}

TEST_F(ScenarioTest, QueriesNeverCrashOnAnyDocument) {
    std::vector<std::string_view> documents = {
        "<p>unclosed", "<table><tr><td>1<td>2</table>", "</div></span>", "<a><b><c><d>",
        "<!DOCTYPE html><html><body><template><p>x</template>", "<svg><g/></svg><math><mi>x</mi></math>",
    };
    std::vector<std::string_view> selectors = {"*", "p", "td + td", "a b c d", ":root", "body > *",
                                               "[x]", "g", "li:first-child", "#nope"};
    for (auto html : documents) {
        auto soup = parse(html);
        for (auto selector : selectors) {
            EXPECT_TRUE(soup.find_all(selector).is_ok()) << html << " / " << selector;
            EXPECT_TRUE(soup.find(selector).is_ok());
            EXPECT_TRUE(soup.select(selector).is_ok());
        }
    }
}

TEST_F(ScenarioTest, UnmatchableDescendantChainOnDeepDocument) {
    String html;
    for (int i = 0; i < 60; ++i) {
        html += "<div>";
    }
    html += "<span>leaf</span>";

    auto soup = parse(html.view());
    auto start = std::chrono::steady_clock::now();
    auto none = soup.find_all("section div div div div div div span");
    auto some = soup.find_all("body div div div div div div span");
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(none.is_ok());
    EXPECT_TRUE(none.value().empty());
    ASSERT_TRUE(some.is_ok());
    EXPECT_EQ(some.value().size(), 1u);
    EXPECT_LT(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count(), 2000);
}

// ============================================================================
// Explain and specificity
// ============================================================================

TEST_F(ScenarioTest, ExplainHints) {
    auto universal = css::explain("*");
    ASSERT_TRUE(universal.is_ok());
    EXPECT_TRUE(universal.value().has_hint(css::OptimizationHint::Kind::AvoidUniversalSelector));

    auto id = css::explain("#id");
    ASSERT_TRUE(id.is_ok());
    EXPECT_TRUE(id.value().has_hint(css::OptimizationHint::Kind::Optimal));
}

TEST_F(ScenarioTest, SpecificityOrdering) {
    EXPECT_GT(css::Specificity(1, 0, 0), css::Specificity(0, 100, 0));
    EXPECT_GT(css::Specificity(0, 100, 0), css::Specificity(0, 0, 100));
}

// ============================================================================
// Tree building
// ============================================================================

TEST_F(ScenarioTest, ImplicitDocumentStructure) {
    auto soup = parse("<p>hello</p>");
    ASSERT_TRUE(soup.root().has_value());
    EXPECT_EQ(soup.root()->name(), "html");
    EXPECT_EQ(soup.find_all("html > head").value().size(), 1u);
    EXPECT_EQ(soup.find_all("html > body > p").value().size(), 1u);
}

TEST_F(ScenarioTest, UnclosedParagraph) {
    auto soup = parse("<div><p>one</div>");
    auto paragraphs = soup.find_all("p").value();
    ASSERT_EQ(paragraphs.size(), 1u);
    EXPECT_EQ(paragraphs[0].text(), "one");
}

TEST_F(ScenarioTest, MisplacedListItem) {
    auto soup = parse("<ul><div><li>item</li></div></ul>");
    auto items = soup.find_all("li").value();
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(items[0].text(), "item");
}

TEST_F(ScenarioTest, UnicodeContent) {
    auto soup = parse("<p title=\"日本語\" data-emoji=\"\xF0\x9F\x98\x80\">Ünïcödé テキスト</p>");
    auto p = first(soup, "p[title=\"日本語\"]");
    EXPECT_EQ(p.text(), "Ünïcödé テキスト");
    EXPECT_EQ(*p.get("data-emoji"), "\xF0\x9F\x98\x80");
}

TEST_F(ScenarioTest, HundredDeepNesting) {
    String html;
    for (int i = 0; i < 100; ++i) {
        html += "<div>";
    }
    html += "<span>bottom</span>";
    for (int i = 0; i < 100; ++i) {
        html += "</div>";
    }

    auto soup = parse(html.view());
    EXPECT_EQ(soup.find_all("div").value().size(), 100u);
    auto span = first(soup, "span");
    EXPECT_EQ(span.text(), "bottom");
    // 100 divs, body, html
    EXPECT_EQ(span.ancestors().count(), 102u);
}

TEST_F(ScenarioTest, OuterHtmlRoundTrip) {
    auto soup = parse(
        "<div id='card' class='a b' data-x='1 &amp; 2'>"
        "  <h2>Title &lt;here&gt;</h2>\n<p>Body <em>text</em></p><br><img src='x.png' alt=''>"
        "</div>");
    auto card = first(soup, "#card");

    auto reparsed = Soup::parse_fragment(card.outer_html().view());
    auto again = first(reparsed, "#card");

    EXPECT_EQ(again.name(), card.name());
    EXPECT_EQ(again.attrs(), card.attrs());
    EXPECT_EQ(collapse_whitespace(again.text()), collapse_whitespace(card.text()));
    EXPECT_EQ(again.descendants().count(), card.descendants().count());
    EXPECT_EQ(again.outer_html(), card.outer_html());
}
