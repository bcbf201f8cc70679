#include "scrape/css/matcher.hpp"
#include "scrape/dom/navigation.hpp"

namespace scrape::css {

using dom::NodeId;

namespace {

bool same_type(const dom::Node& a, const dom::Node& b) {
    return a.name().equals_ignore_case(b.name());
}

bool is_nth(PseudoClass kind) {
    return kind == PseudoClass::NthChild || kind == PseudoClass::NthLastChild ||
           kind == PseudoClass::NthOfType || kind == PseudoClass::NthLastOfType;
}

} // anonymous namespace

SelectorMatcher::SelectorMatcher(const dom::Document& document)
    : m_document(document) {}

// ============================================================================
// Selector lists and complex selectors
// ============================================================================

bool SelectorMatcher::matches(const SelectorList& selectors, NodeId element) const {
    for (const auto& selector : selectors.selectors) {
        if (matches(selector, element)) {
            return true;
        }
    }
    return false;
}

bool SelectorMatcher::matches(const ComplexSelector& selector, NodeId element) const {
    if (selector.parts.empty()) {
        return false;
    }
    const auto* node = m_document.get(element);
    if (!node || !node->is_element()) {
        return false;
    }
    return matches_from(selector, selector.parts.size() - 1, element, std::nullopt) == MatchResult::Matches;
}

// Every candidate for a combinator is tried at most once per outer
// candidate, and a failure that no further candidate can repair is passed
// outward instead of retried. This keeps matching linear in the depth of
// the tree for chains of descendant and sibling combinators.
SelectorMatcher::MatchResult SelectorMatcher::matches_from(const ComplexSelector& selector, usize part_index,
                                                           NodeId element, std::optional<NodeId> anchor) const {
    if (!matches(selector.parts[part_index].compound, element)) {
        return MatchResult::FailsLocally;
    }

    if (part_index == 0) {
        if (!anchor || matches_anchor(selector, element, *anchor)) {
            return MatchResult::Matches;
        }
        return MatchResult::FailsLocally;
    }

    auto combinator = selector.parts[part_index - 1].combinator.value_or(Combinator::Descendant);
    bool sibling = combinator == Combinator::NextSibling || combinator == Combinator::SubsequentSibling;
    // Running out of candidates: a sibling chain can still be retried from
    // a different descendant, an ancestor chain cannot
    auto exhausted = sibling ? MatchResult::FailsAllSiblings : MatchResult::FailsCompletely;

    auto next_candidate = [&](NodeId current) -> std::optional<NodeId> {
        switch (combinator) {
            case Combinator::Descendant:
            case Combinator::Child:
                return dom::parent_element(m_document, current);
            case Combinator::NextSibling:
            case Combinator::SubsequentSibling:
                return dom::prev_element_sibling(m_document, current);
        }
        return std::nullopt;
    };

    for (auto candidate = next_candidate(element); candidate; candidate = next_candidate(*candidate)) {
        auto result = matches_from(selector, part_index - 1, *candidate, anchor);

        if (result == MatchResult::Matches || result == MatchResult::FailsCompletely ||
            combinator == Combinator::NextSibling) {
            return result;
        }
        if (combinator == Combinator::Child) {
            return MatchResult::FailsAllSiblings;
        }
        if (result == MatchResult::FailsAllSiblings &&
            combinator == Combinator::SubsequentSibling) {
            return result;
        }
        // Descendant: try the next ancestor. Subsequent sibling: try the
        // next preceding sibling.
    }

    return exhausted;
}

bool SelectorMatcher::matches_anchor(const ComplexSelector& selector, NodeId element,
                                     NodeId anchor) const {
    switch (selector.leading_combinator.value_or(Combinator::Descendant)) {
        case Combinator::Descendant:
            return element != anchor && m_document.is_inclusive_ancestor(anchor, element);

        case Combinator::Child:
            return dom::parent_element(m_document, element) == anchor;

        case Combinator::NextSibling:
            return dom::prev_element_sibling(m_document, element) == anchor;

        case Combinator::SubsequentSibling:
            for (auto sibling : dom::prev_siblings(m_document, element)) {
                if (sibling == anchor) {
                    return true;
                }
            }
            return false;
    }
    return false;
}

bool SelectorMatcher::matches_relative(const ComplexSelector& selector, NodeId anchor) const {
    if (selector.parts.empty()) {
        return false;
    }
    usize last = selector.parts.size() - 1;
    auto leading = selector.leading_combinator.value_or(Combinator::Descendant);

    if (leading == Combinator::Descendant || leading == Combinator::Child) {
        for (auto candidate : dom::descendants(m_document, anchor)) {
            if (matches_from(selector, last, candidate, anchor) == MatchResult::Matches) {
                return true;
            }
        }
        return false;
    }

    // Sibling-relative: the subject is a following sibling or inside one
    for (auto sibling : dom::next_siblings(m_document, anchor)) {
        if (matches_from(selector, last, sibling, anchor) == MatchResult::Matches) {
            return true;
        }
        for (auto candidate : dom::descendants(m_document, sibling)) {
            if (matches_from(selector, last, candidate, anchor) == MatchResult::Matches) {
                return true;
            }
        }
        if (leading == Combinator::NextSibling && last == 0) {
            // Only the adjacent sibling can be the subject
            break;
        }
    }
    return false;
}

// ============================================================================
// Compound and simple selectors
// ============================================================================

bool SelectorMatcher::matches(const CompoundSelector& selector, NodeId element) const {
    for (const auto& simple : selector.selectors) {
        if (!matches(simple, element)) {
            return false;
        }
    }
    return true;
}

bool SelectorMatcher::matches(const SimpleSelector& selector, NodeId element) const {
    const auto* node = m_document.get(element);
    if (!node || !node->is_element()) {
        return false;
    }

    return std::visit([&](const auto& sel) -> bool {
        using T = std::decay_t<decltype(sel)>;

        if constexpr (std::is_same_v<T, TypeSelector>) {
            return node->name().equals_ignore_case(sel.tag_name);
        } else if constexpr (std::is_same_v<T, UniversalSelector>) {
            return true;
        } else if constexpr (std::is_same_v<T, IdSelector>) {
            const auto* id = node->attribute("id");
            return id && *id == sel.id;
        } else if constexpr (std::is_same_v<T, ClassSelector>) {
            return node->has_class(sel.class_name);
        } else if constexpr (std::is_same_v<T, AttributeSelector>) {
            return matches_attribute(sel, *node);
        } else if constexpr (std::is_same_v<T, PseudoClassSelector>) {
            return matches_pseudo_class(sel, element);
        } else {
            // Pseudo-elements never match an element
            return false;
        }
    }, selector);
}

bool SelectorMatcher::matches_attribute(const AttributeSelector& selector,
                                        const dom::Node& node) const {
    const auto* element = node.as_element();
    const String* attr_value = nullptr;
    for (const auto& attr : element->attributes) {
        if (attr.name.equals_ignore_case(selector.attribute)) {
            attr_value = &attr.value;
            break;
        }
    }

    if (!attr_value) {
        return false;
    }

    if (selector.matcher == AttributeSelector::Matcher::Exists) {
        return true;
    }

    String actual = selector.case_insensitive ? attr_value->to_lowercase() : *attr_value;
    String expected = selector.case_insensitive ? selector.value.to_lowercase() : selector.value;

    switch (selector.matcher) {
        case AttributeSelector::Matcher::Exists:
            return true;

        case AttributeSelector::Matcher::Equals:
            return actual == expected;

        case AttributeSelector::Matcher::Includes: {
            if (expected.empty() || expected.contains(' ')) {
                return false;
            }
            for (const auto& token : actual.split_whitespace()) {
                if (token == expected) {
                    return true;
                }
            }
            return false;
        }

        case AttributeSelector::Matcher::DashMatch:
            return actual == expected ||
                   (actual.starts_with(expected) && actual.size() > expected.size() &&
                    actual[expected.size()] == '-');

        case AttributeSelector::Matcher::Prefix:
            return !expected.empty() && actual.starts_with(expected);

        case AttributeSelector::Matcher::Suffix:
            return !expected.empty() && actual.ends_with(expected);

        case AttributeSelector::Matcher::Substring:
            return !expected.empty() && actual.contains(expected);
    }

    return false;
}

// ============================================================================
// Pseudo-classes
// ============================================================================

bool SelectorMatcher::matches_pseudo_class(const PseudoClassSelector& selector,
                                           NodeId element) const {
    const auto& node = m_document.node(element);

    if (is_nth(selector.kind)) {
        bool of_type = selector.kind == PseudoClass::NthOfType ||
                       selector.kind == PseudoClass::NthLastOfType;
        bool from_end = selector.kind == PseudoClass::NthLastChild ||
                        selector.kind == PseudoClass::NthLastOfType;
        i64 position = from_end ? position_from_end(element, of_type)
                                : position_from_start(element, of_type);
        return selector.nth.matches(position);
    }

    switch (selector.kind) {
        case PseudoClass::FirstChild:
            return !dom::prev_element_sibling(m_document, element);

        case PseudoClass::LastChild:
            return !dom::next_element_sibling(m_document, element);

        case PseudoClass::OnlyChild:
            return !dom::prev_element_sibling(m_document, element) &&
                   !dom::next_element_sibling(m_document, element);

        case PseudoClass::FirstOfType:
            return position_from_start(element, true) == 1;

        case PseudoClass::LastOfType:
            return position_from_end(element, true) == 1;

        case PseudoClass::OnlyOfType:
            return position_from_start(element, true) == 1 &&
                   position_from_end(element, true) == 1;

        case PseudoClass::Empty:
            // Comments do not count as content
            for (auto child : node.children) {
                const auto& child_node = m_document.node(child);
                if (child_node.is_element()) {
                    return false;
                }
                if (const auto* text = child_node.as_text(); text && !text->content.empty()) {
                    return false;
                }
            }
            return true;

        case PseudoClass::Root:
            return !node.parent.has_value();

        case PseudoClass::Not:
            return selector.arguments && !matches(*selector.arguments, element);

        case PseudoClass::Is:
        case PseudoClass::Where:
            return selector.arguments && matches(*selector.arguments, element);

        case PseudoClass::Has:
            if (!selector.arguments) {
                return false;
            }
            for (const auto& relative : selector.arguments->selectors) {
                if (matches_relative(relative, element)) {
                    return true;
                }
            }
            return false;

        default:
            return false;
    }
}

i64 SelectorMatcher::position_from_start(NodeId element, bool of_type) const {
    const auto& node = m_document.node(element);
    i64 position = 1;
    for (auto sibling : dom::prev_siblings(m_document, element)) {
        if (!of_type || same_type(m_document.node(sibling), node)) {
            ++position;
        }
    }
    return position;
}

i64 SelectorMatcher::position_from_end(NodeId element, bool of_type) const {
    const auto& node = m_document.node(element);
    i64 position = 1;
    for (auto sibling : dom::next_siblings(m_document, element)) {
        if (!of_type || same_type(m_document.node(sibling), node)) {
            ++position;
        }
    }
    return position;
}

} // namespace scrape::css
