#pragma once

#include "scrape/core/types.hpp"
#include "scrape/core/string.hpp"
#include "scrape/core/source_span.hpp"
#include <compare>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace scrape::css {

struct SelectorList;

// ============================================================================
// Selector Components
// ============================================================================

// Simple selectors. Type names are stored lower-case.
struct TypeSelector { String tag_name; };
struct UniversalSelector {};
struct IdSelector { String id; };
struct ClassSelector { String class_name; };

struct AttributeSelector {
    String attribute;
    enum class Matcher {
        Exists,      // [attr]
        Equals,      // [attr=value]
        Includes,    // [attr~=value]
        DashMatch,   // [attr|=value]
        Prefix,      // [attr^=value]
        Suffix,      // [attr$=value]
        Substring,   // [attr*=value]
    };
    Matcher matcher{Matcher::Exists};
    String value;
    bool case_insensitive{false};
};

// An+B from :nth-*() arguments
struct NthPattern {
    i32 a{0};
    i32 b{0};

    // `position` is 1-based
    [[nodiscard]] bool matches(i64 position) const;
};

enum class PseudoClass : u8 {
    FirstChild,
    LastChild,
    OnlyChild,
    FirstOfType,
    LastOfType,
    OnlyOfType,
    NthChild,
    NthLastChild,
    NthOfType,
    NthLastOfType,
    Empty,
    Root,
    Not,
    Is,
    Where,
    Has,
};

struct PseudoClassSelector {
    PseudoClass kind{PseudoClass::FirstChild};
    String name;
    NthPattern nth;                                  // :nth-*()
    std::shared_ptr<const SelectorList> arguments;   // :not() :is() :where() :has()
};

// ::before, ::after, ::first-line, ::first-letter. Never matches an element.
struct PseudoElementSelector {
    String name;
};

using SimpleSelector = std::variant<
    TypeSelector,
    UniversalSelector,
    IdSelector,
    ClassSelector,
    AttributeSelector,
    PseudoClassSelector,
    PseudoElementSelector
>;

// ============================================================================
// Compound / Complex Selectors
// ============================================================================

struct CompoundSelector {
    std::vector<SimpleSelector> selectors;
};

enum class Combinator {
    Descendant,       // space
    Child,            // >
    NextSibling,      // +
    SubsequentSibling // ~
};

struct ComplexSelectorPart {
    CompoundSelector compound;
    std::optional<Combinator> combinator;  // Combinator to next part
};

struct ComplexSelector {
    std::vector<ComplexSelectorPart> parts;
    // Relative selectors inside :has() may start with a combinator
    std::optional<Combinator> leading_combinator;
};

struct SelectorList {
    std::vector<ComplexSelector> selectors;
};

// ============================================================================
// Specificity
// ============================================================================

struct Specificity {
    u32 ids{0};       // ID selectors
    u32 classes{0};   // Class, attribute and pseudo-class selectors
    u32 elements{0};  // Type selectors, pseudo-elements

    Specificity() = default;
    Specificity(u32 ids_, u32 classes_, u32 elements_)
        : ids(ids_), classes(classes_), elements(elements_) {}

    [[nodiscard]] u64 value() const {
        return (static_cast<u64>(ids) << 32) | (static_cast<u64>(classes) << 16) | elements;
    }

    // "(a, b, c)"
    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const Specificity& other) const = default;
    [[nodiscard]] auto operator<=>(const Specificity& other) const = default;

    Specificity& operator+=(const Specificity& other);
    [[nodiscard]] Specificity operator+(const Specificity& other) const;
};

[[nodiscard]] Specificity calculate_specificity(const CompoundSelector& selector);
[[nodiscard]] Specificity calculate_specificity(const ComplexSelector& selector);
// Sum over every selector in the list
[[nodiscard]] Specificity calculate_specificity(const SelectorList& selectors);

// ============================================================================
// Errors
// ============================================================================

struct QueryError {
    enum class Kind : u8 {
        InvalidSelector,
    };

    Kind kind{Kind::InvalidSelector};
    String message;
    std::optional<SourceSpan> span;

    [[nodiscard]] static QueryError invalid_selector(String message,
                                                     std::optional<SourceSpan> span = std::nullopt);

    [[nodiscard]] std::optional<usize> line() const;
    [[nodiscard]] std::optional<usize> column() const;

    // "invalid selector[ at line L, column C]: message"
    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const QueryError& other) const = default;
};

// ============================================================================
// Selector Parsing
// ============================================================================

class SelectorParser {
public:
    // Bounds :not()/:is()/:where()/:has() nesting
    static constexpr usize MAX_NESTING = 32;

    [[nodiscard]] Result<SelectorList, QueryError> parse(std::string_view input);

private:
    Result<SelectorList, QueryError> parse_selector_list(bool nested, bool relative);
    Result<ComplexSelector, QueryError> parse_complex_selector(bool relative);
    Result<CompoundSelector, QueryError> parse_compound_selector();
    Result<SimpleSelector, QueryError> parse_simple_selector(bool first_in_compound);
    Result<AttributeSelector, QueryError> parse_attribute_selector();
    Result<SimpleSelector, QueryError> parse_pseudo();
    Result<NthPattern, QueryError> parse_nth_argument(usize start);
    Result<String, QueryError> consume_string();

    [[nodiscard]] QueryError error_at(usize begin, usize end, String message) const;
    [[nodiscard]] QueryError error_here(String message) const;

    bool skip_whitespace();
    [[nodiscard]] bool at_end() const { return m_position >= m_input.size(); }
    [[nodiscard]] char peek(usize offset = 0) const;
    char consume();
    [[nodiscard]] bool starts_ident() const;
    String consume_ident();
    void consume_escape(String& out);

    std::string_view m_input;
    usize m_position{0};
    usize m_depth{0};
};

// Parses an An+B expression ("odd", "even", "3", "-n+2", "2n + 1").
[[nodiscard]] std::optional<NthPattern> parse_nth(std::string_view text);

// Serializes back to selector syntax
[[nodiscard]] String to_string(const CompoundSelector& selector);
[[nodiscard]] String to_string(const ComplexSelector& selector);
[[nodiscard]] String to_string(const SelectorList& selectors);

// ============================================================================
// CompiledSelector
// ============================================================================

// Immutable and cheap to copy. Independent of any document.
class CompiledSelector {
public:
    [[nodiscard]] static Result<CompiledSelector, QueryError> compile(std::string_view source);

    [[nodiscard]] const String& source() const { return m_source; }
    [[nodiscard]] const SelectorList& selectors() const { return *m_selectors; }
    [[nodiscard]] Specificity specificity() const { return m_specificity; }

private:
    CompiledSelector(String source, std::shared_ptr<const SelectorList> selectors);

    String m_source;
    std::shared_ptr<const SelectorList> m_selectors;
    Specificity m_specificity;
};

} // namespace scrape::css
