#pragma once

#include "scrape/css/selector.hpp"
#include "scrape/dom/document.hpp"

namespace scrape::css {

// ============================================================================
// SelectorMatcher - right-to-left matching against a Document
// ============================================================================

// Holds a reference to the document; cheap to construct per query.
class SelectorMatcher {
public:
    explicit SelectorMatcher(const dom::Document& document);

    // True if the element matches any selector in the list
    [[nodiscard]] bool matches(const SelectorList& selectors, dom::NodeId element) const;
    [[nodiscard]] bool matches(const ComplexSelector& selector, dom::NodeId element) const;
    [[nodiscard]] bool matches(const CompoundSelector& selector, dom::NodeId element) const;
    [[nodiscard]] bool matches(const SimpleSelector& selector, dom::NodeId element) const;

    [[nodiscard]] const dom::Document& document() const { return m_document; }

private:
    // Outcome of matching a selector suffix at an element e
    enum class MatchResult : u8 {
        Matches,
        FailsLocally,      // fails for e only
        FailsAllSiblings,  // fails for e and every sibling of e
        FailsCompletely,   // fails for e, its siblings and its ancestors
    };

    // Matches parts [0, part_index] with `element` as the subject of
    // parts[part_index]. With an anchor, part 0 must also stand in the
    // leading-combinator relation to it (relative selectors in :has()).
    MatchResult matches_from(const ComplexSelector& selector, usize part_index,
                      dom::NodeId element, std::optional<dom::NodeId> anchor) const;
    bool matches_anchor(const ComplexSelector& selector, dom::NodeId element,
                        dom::NodeId anchor) const;
    bool matches_relative(const ComplexSelector& selector, dom::NodeId anchor) const;

    bool matches_attribute(const AttributeSelector& selector, const dom::Node& node) const;
    bool matches_pseudo_class(const PseudoClassSelector& selector, dom::NodeId element) const;

    // 1-based position among element siblings, optionally of the same type
    i64 position_from_start(dom::NodeId element, bool of_type) const;
    i64 position_from_end(dom::NodeId element, bool of_type) const;

    const dom::Document& m_document;
};

} // namespace scrape::css
