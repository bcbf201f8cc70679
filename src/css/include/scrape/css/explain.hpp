#pragma once

#include "scrape/css/selector.hpp"
#include "scrape/dom/document.hpp"

namespace scrape::css {

// ============================================================================
// Selector diagnostics
// ============================================================================

struct OptimizationHint {
    enum class Kind : u8 {
        Optimal,
        UseIdSelector,
        TooBroad,
        PreferChildCombinator,
        AvoidUniversalSelector,
        CacheSelector,
    };

    Kind kind{Kind::Optimal};
    String current;     // UseIdSelector
    String suggested;   // UseIdSelector
    String reason;      // TooBroad
    String at;          // PreferChildCombinator

    [[nodiscard]] static OptimizationHint optimal() { return {.kind = Kind::Optimal}; }
    [[nodiscard]] static OptimizationHint use_id_selector(String current, String suggested);
    [[nodiscard]] static OptimizationHint too_broad(String reason);
    [[nodiscard]] static OptimizationHint prefer_child_combinator(String at);
    [[nodiscard]] static OptimizationHint avoid_universal_selector() {
        return {.kind = Kind::AvoidUniversalSelector};
    }
    [[nodiscard]] static OptimizationHint cache_selector() { return {.kind = Kind::CacheSelector}; }

    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const OptimizationHint& other) const = default;
};

struct ExplainConfig {
    // Longest compound chain before a deep-chain warning
    usize deep_chain_threshold{3};
    // Caching is suggested above either threshold
    usize cache_length_threshold{30};
    usize cache_component_threshold{2};
};

struct SelectorExplanation {
    String source;
    Specificity specificity;
    String description;
    std::optional<usize> estimated_matches;
    std::vector<String> performance_notes;
    std::vector<OptimizationHint> hints;

    [[nodiscard]] bool has_hint(OptimizationHint::Kind kind) const;

    // Multi-line human-readable report
    [[nodiscard]] String format() const;
};

[[nodiscard]] SelectorExplanation explain(const CompiledSelector& selector,
                                          const ExplainConfig& config = {});
[[nodiscard]] SelectorExplanation explain(const CompiledSelector& selector,
                                          const dom::Document& document,
                                          const ExplainConfig& config = {});

[[nodiscard]] Result<SelectorExplanation, QueryError> explain(std::string_view selector);
[[nodiscard]] Result<SelectorExplanation, QueryError>
explain_with_document(std::string_view selector, const dom::Document& document);

} // namespace scrape::css
