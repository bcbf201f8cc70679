#pragma once

#include "tag.hpp"
#include "scrape/css/explain.hpp"
#include <filesystem>

namespace scrape {

using SoupConfig = html::ParseConfig;

// ============================================================================
// Soup - a parsed document and its queries
// ============================================================================

class Soup {
public:
    // An empty document: no root, every query finds nothing
    Soup();

    // Lenient: a failed parse logs a warning and yields an empty document
    [[nodiscard]] static Soup parse(std::string_view html);
    [[nodiscard]] static Result<Soup, html::ParseError> parse_with_config(std::string_view html,
                                                                         const SoupConfig& config);

    // Fragment parsing; the root is a synthetic html element
    [[nodiscard]] static Soup parse_fragment(std::string_view html, std::string_view context = "body");
    [[nodiscard]] static Result<Soup, html::ParseError>
    try_parse_fragment(std::string_view html, std::string_view context = "body", const SoupConfig& config = {});

    [[nodiscard]] static Result<Soup, SoupError> from_file(const std::filesystem::path& path,
                                                           const SoupConfig& config = {});

    // ========================================================================
    // Document access
    // ========================================================================

    [[nodiscard]] const dom::Document& document() const { return *m_document; }
    [[nodiscard]] const RefPtr<const dom::Document>& document_ptr() const { return m_document; }

    [[nodiscard]] std::optional<Tag> root() const;
    // Text of the first <title>
    [[nodiscard]] std::optional<String> title() const;
    [[nodiscard]] String text() const;
    [[nodiscard]] String to_html() const;

    // Node count, text and comments included
    [[nodiscard]] usize length() const { return m_document->size(); }
    [[nodiscard]] bool empty() const { return m_document->empty(); }

    // Non-fatal problems reported while parsing
    [[nodiscard]] const std::vector<html::ParseWarning>& warnings() const { return m_warnings; }

    // ========================================================================
    // Queries (whole document, root included)
    // ========================================================================

    [[nodiscard]] Result<std::optional<Tag>, css::QueryError> find(std::string_view selector) const;
    // NotFound instead of an empty optional
    [[nodiscard]] Result<Tag, SoupError> find_or_err(std::string_view selector) const;
    [[nodiscard]] Result<std::vector<Tag>, css::QueryError> find_all(std::string_view selector) const;
    [[nodiscard]] Result<std::vector<Tag>, css::QueryError> select(std::string_view selector) const;

    [[nodiscard]] std::optional<Tag> find_compiled(const css::CompiledSelector& selector) const;
    [[nodiscard]] std::vector<Tag> select_compiled(const css::CompiledSelector& selector) const;

    [[nodiscard]] Result<std::vector<String>, css::QueryError> select_text(std::string_view selector) const;
    [[nodiscard]] Result<std::vector<std::optional<String>>, css::QueryError>
    select_attr(std::string_view selector, std::string_view attribute) const;

    // Explanation with match counts against this document
    [[nodiscard]] Result<css::SelectorExplanation, css::QueryError> explain(std::string_view selector) const;

private:
    explicit Soup(RefPtr<const dom::Document> document, std::vector<html::ParseWarning> warnings = {});

    RefPtr<const dom::Document> m_document;
    std::vector<html::ParseWarning> m_warnings;
};

} // namespace scrape
