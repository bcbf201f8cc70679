#pragma once

#include "tokenizer.hpp"
#include "tree_builder.hpp"
#include "scrape/core/source_span.hpp"
#include "scrape/dom/document.hpp"

namespace scrape::html {

// ============================================================================
// Configuration
// ============================================================================

struct ParseConfig {
    // Maximum element nesting, counting the html element itself
    usize max_depth{512};
    // The first parse error fails the parse
    bool strict_mode{false};
    // Keep whitespace-only text nodes
    bool preserve_whitespace{false};
    // Keep comment nodes
    bool include_comments{false};
};

// ============================================================================
// Errors and warnings
// ============================================================================

struct ParseError {
    enum class Kind : u8 {
        MaxDepthExceeded,
        EmptyInput,
        EncodingError,
        MalformedHtml,
        InternalError,
    };

    Kind kind{Kind::InternalError};
    String message;
    usize max_depth{0};
    std::optional<SourceSpan> span;

    [[nodiscard]] static ParseError max_depth_exceeded(usize max_depth, std::optional<SourceSpan> span = std::nullopt);
    [[nodiscard]] static ParseError empty_input();
    [[nodiscard]] static ParseError encoding_error(String message);
    [[nodiscard]] static ParseError malformed_html(String message, std::optional<SourceSpan> span = std::nullopt);
    [[nodiscard]] static ParseError internal_error(String message);

    [[nodiscard]] std::optional<usize> line() const;
    [[nodiscard]] std::optional<usize> column() const;

    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const ParseError& other) const = default;
};

enum class WarningSeverity : u8 {
    Info,
    Warning,
    RecoveredError,
};

[[nodiscard]] std::string_view severity_name(WarningSeverity severity);

struct ParseWarning {
    WarningSeverity severity{WarningSeverity::Warning};
    String message;
    std::optional<SourceSpan> span;

    // "warning: message at line L, column C"
    [[nodiscard]] String to_string() const;
};

using ParseResult = Result<RefPtr<dom::Document>, ParseError>;

// ============================================================================
// Parser - tokenizer plus tree builder over one input
// ============================================================================

class Parser {
public:
    Parser() = default;

    [[nodiscard]] ParseResult parse(std::string_view html, const ParseConfig& config = {});

    // The root is a synthetic html element holding the fragment's nodes.
    // The context element name picks the initial tokenizer state.
    [[nodiscard]] ParseResult parse_fragment(std::string_view html,
                                             std::string_view context = "body",
                                             const ParseConfig& config = {});

    // Non-fatal problems from the last parse
    [[nodiscard]] const std::vector<ParseWarning>& warnings() const { return m_warnings; }

private:
    ParseResult run(std::string_view html, const ParseConfig& config, std::optional<std::string_view> context);

    std::vector<ParseWarning> m_warnings;
};

} // namespace scrape::html
