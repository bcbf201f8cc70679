#include "scrape/css/explain.hpp"
#include "scrape/css/query.hpp"
#include <algorithm>
#include <format>

namespace scrape::css {

namespace {

struct SelectorShape {
    usize longest_chain{0};
    bool universal{false};
    bool descendant{false};
    bool child{false};
    bool next_sibling{false};
    bool subsequent_sibling{false};
    // "a b" for the first descendant pair seen
    String first_descendant_pair;
};

SelectorShape analyze_shape(const SelectorList& list) {
    SelectorShape shape;
    for (const auto& complex : list.selectors) {
        shape.longest_chain = std::max(shape.longest_chain, complex.parts.size());

        for (usize i = 0; i < complex.parts.size(); ++i) {
            const auto& part = complex.parts[i];
            for (const auto& simple : part.compound.selectors) {
                if (std::holds_alternative<UniversalSelector>(simple)) {
                    shape.universal = true;
                }
            }

            if (!part.combinator) {
                continue;
            }
            switch (*part.combinator) {
                case Combinator::Descendant:
                    if (!shape.descendant && i + 1 < complex.parts.size()) {
                        shape.first_descendant_pair = to_string(part.compound);
                        shape.first_descendant_pair += ' ';
                        shape.first_descendant_pair += to_string(complex.parts[i + 1].compound);
                    }
                    shape.descendant = true;
                    break;
                case Combinator::Child: shape.child = true; break;
                case Combinator::NextSibling: shape.next_sibling = true; break;
                case Combinator::SubsequentSibling: shape.subsequent_sibling = true; break;
            }
        }
    }
    return shape;
}

// The compound of a one-element, one-part selector list
const CompoundSelector* single_compound(const SelectorList& list) {
    if (list.selectors.size() != 1 || list.selectors.front().parts.size() != 1) {
        return nullptr;
    }
    return &list.selectors.front().parts.front().compound;
}

String describe(const CompiledSelector& selector, const SelectorShape& shape) {
    if (const auto* compound = single_compound(selector.selectors())) {
        if (compound->selectors.size() == 1) {
            if (const auto* id = std::get_if<IdSelector>(&compound->selectors.front())) {
                return String(std::format("Element with ID '{}'", id->id.view()));
            }
        }

        bool class_only = !compound->selectors.empty();
        String classes;
        for (const auto& simple : compound->selectors) {
            const auto* cls = std::get_if<ClassSelector>(&simple);
            if (!cls) {
                class_only = false;
                break;
            }
            if (!classes.empty()) {
                classes += '.';
            }
            classes += cls->class_name;
        }
        if (class_only) {
            return String(std::format("Elements with class '{}'", classes.view()));
        }
    }

    if (shape.child) {
        return "Elements matching a child selector";
    }
    if (shape.next_sibling) {
        return "Elements matching an adjacent sibling selector";
    }
    if (shape.subsequent_sibling) {
        return "Elements matching a general sibling selector";
    }
    if (shape.descendant) {
        return "Elements matching a descendant selector";
    }
    return String(std::format("Elements matching '{}'", selector.source().view()));
}

// `[id="x"]` in a lone compound can be written `#x`
std::optional<OptimizationHint> id_attribute_hint(const CompoundSelector& compound) {
    for (usize i = 0; i < compound.selectors.size(); ++i) {
        const auto* attr = std::get_if<AttributeSelector>(&compound.selectors[i]);
        if (!attr || attr->attribute != "id" ||
            attr->matcher != AttributeSelector::Matcher::Equals || attr->case_insensitive) {
            continue;
        }
        CompoundSelector rewritten = compound;
        rewritten.selectors[i] = IdSelector{attr->value};
        return OptimizationHint::use_id_selector(to_string(compound), to_string(rewritten));
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// OptimizationHint
// ============================================================================

OptimizationHint OptimizationHint::use_id_selector(String current, String suggested) {
    return {.kind = Kind::UseIdSelector, .current = std::move(current), .suggested = std::move(suggested)};
}

OptimizationHint OptimizationHint::too_broad(String reason) {
    return {.kind = Kind::TooBroad, .reason = std::move(reason)};
}

OptimizationHint OptimizationHint::prefer_child_combinator(String at) {
    return {.kind = Kind::PreferChildCombinator, .at = std::move(at)};
}

String OptimizationHint::to_string() const {
    switch (kind) {
        case Kind::Optimal:
            return "Selector is already optimal";
        case Kind::UseIdSelector:
            return String(std::format("Consider ID selector: '{}' -> '{}'",
                                      current.view(), suggested.view()));
        case Kind::TooBroad:
            return String(std::format("Too broad: {}", reason.view()));
        case Kind::PreferChildCombinator:
            return String(std::format("Consider child combinator (>) at: {}", at.view()));
        case Kind::AvoidUniversalSelector:
            return "Avoid universal selector (*) for better performance";
        case Kind::CacheSelector:
            return "Consider caching this compiled selector for reuse";
    }
    return {};
}

// ============================================================================
// SelectorExplanation
// ============================================================================

bool SelectorExplanation::has_hint(OptimizationHint::Kind kind) const {
    return std::any_of(hints.begin(), hints.end(),
                       [kind](const OptimizationHint& hint) { return hint.kind == kind; });
}

String SelectorExplanation::format() const {
    StringBuilder out;
    out.append("Selector: ").append(source).append('\n');
    out.append("Specificity: ").append(specificity.to_string()).append('\n');
    out.append("Description: ").append(description).append('\n');

    if (estimated_matches) {
        out.append("Estimated matches: ").append(static_cast<u64>(*estimated_matches)).append('\n');
    }

    if (!performance_notes.empty()) {
        out.append("\nPerformance:\n");
        for (const auto& note : performance_notes) {
            out.append("  - ").append(note).append('\n');
        }
    }

    if (!hints.empty()) {
        out.append("\nOptimization hints:\n");
        for (const auto& hint : hints) {
            out.append("  - ").append(hint.to_string()).append('\n');
        }
    }

    return out.take();
}

// ============================================================================
// explain
// ============================================================================

SelectorExplanation explain(const CompiledSelector& selector, const ExplainConfig& config) {
    const auto& list = selector.selectors();
    auto shape = analyze_shape(list);

    SelectorExplanation result;
    result.source = selector.source();
    result.specificity = selector.specificity();
    result.description = describe(selector, shape);

    if (shape.universal) {
        result.performance_notes.emplace_back("Contains universal selector - may be slow on large documents");
        result.hints.push_back(OptimizationHint::avoid_universal_selector());
    }

    if (shape.longest_chain > config.deep_chain_threshold) {
        result.performance_notes.emplace_back(std::format(
            "Deep descendant chain ({} levels) - consider simplifying", shape.longest_chain));
        result.hints.push_back(OptimizationHint::too_broad("Deep nesting requires traversing many ancestors"));
    }

    if (const auto* compound = single_compound(list)) {
        bool has_id = std::any_of(compound->selectors.begin(), compound->selectors.end(),
                                  [](const SimpleSelector& simple) {
                                      return std::holds_alternative<IdSelector>(simple);
                                  });
        // Only a lone #id is answered from the id index
        if (has_id && compound->selectors.size() == 1) {
            result.performance_notes.emplace_back("ID selector - uses fast indexed lookup");
            result.hints.push_back(OptimizationHint::optimal());
        } else if (!has_id) {
            if (auto hint = id_attribute_hint(*compound)) {
                result.hints.push_back(std::move(*hint));
            }
        }
    }

    if (selector.source().size() > config.cache_length_threshold ||
        shape.longest_chain > config.cache_component_threshold) {
        result.hints.push_back(OptimizationHint::cache_selector());
    }

    if (shape.descendant && !shape.child) {
        result.performance_notes.emplace_back(
            "Uses descendant combinator - child combinator (>) may be faster for direct children");
        result.hints.push_back(OptimizationHint::prefer_child_combinator(shape.first_descendant_pair));
    }

    return result;
}

SelectorExplanation explain(const CompiledSelector& selector, const dom::Document& document,
                            const ExplainConfig& config) {
    auto result = explain(selector, config);
    result.estimated_matches = find_all_compiled(document, selector).size();
    return result;
}

Result<SelectorExplanation, QueryError> explain(std::string_view selector) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return explain(compiled.value());
}

Result<SelectorExplanation, QueryError> explain_with_document(std::string_view selector,
                                                              const dom::Document& document) {
    auto compiled = CompiledSelector::compile(selector);
    if (compiled.is_err()) {
        return make_error(std::move(compiled).error());
    }
    return explain(compiled.value(), document);
}

} // namespace scrape::css
