#include "scrape/soup/soup.hpp"
#include "scrape/core/logger.hpp"
#include "scrape/dom/serializer.hpp"
#include <format>
#include <fstream>
#include <sstream>

namespace scrape {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("soup");
    return instance;
}

} // namespace

Soup::Soup()
    : m_document(make_ref<dom::Document>()) {}

Soup::Soup(RefPtr<const dom::Document> document, std::vector<html::ParseWarning> warnings)
    : m_document(std::move(document))
    , m_warnings(std::move(warnings)) {}

// ============================================================================
// Parsing
// ============================================================================

Soup Soup::parse(std::string_view html) {
    auto result = parse_with_config(html, SoupConfig{});
    if (result.is_err()) {
        logger().warn_fmt("parse failed, using an empty document: {}", result.error().to_string().view());
        return Soup();
    }
    return std::move(result).value();
}

Result<Soup, html::ParseError> Soup::parse_with_config(std::string_view html, const SoupConfig& config) {
    html::Parser parser;
    auto result = parser.parse(html, config);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    return Soup(std::move(result).value(), parser.warnings());
}

Soup Soup::parse_fragment(std::string_view html, std::string_view context) {
    auto result = try_parse_fragment(html, context);
    if (result.is_err()) {
        logger().warn_fmt("fragment parse failed, using an empty document: {}",
                          result.error().to_string().view());
        return Soup();
    }
    return std::move(result).value();
}

Result<Soup, html::ParseError> Soup::try_parse_fragment(std::string_view html, std::string_view context,
                                                        const SoupConfig& config) {
    html::Parser parser;
    auto result = parser.parse_fragment(html, context, config);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    return Soup(std::move(result).value(), parser.warnings());
}

Result<Soup, SoupError> Soup::from_file(const std::filesystem::path& path, const SoupConfig& config) {
    std::ifstream file(path, std::ios::in | std::ios::binary);
    if (!file) {
        return make_error(SoupError::io(String(std::format("cannot open '{}'", path.string()))));
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        return make_error(SoupError::io(String(std::format("cannot read '{}'", path.string()))));
    }

    auto result = parse_with_config(buffer.view(), config);
    if (result.is_err()) {
        return make_error(SoupError::from_parse(std::move(result).error()));
    }
    logger().debug_fmt("loaded '{}'", path.string());
    return std::move(result).value();
}

// ============================================================================
// Document access
// ============================================================================

std::optional<Tag> Soup::root() const {
    auto id = m_document->root();
    if (!id) {
        return std::nullopt;
    }
    return Tag(m_document, *id);
}

std::optional<String> Soup::title() const {
    for (auto id : m_document->elements_with_tag("title")) {
        if (m_document->root() && m_document->is_inclusive_ancestor(*m_document->root(), id)) {
            return dom::text(*m_document, id);
        }
    }
    return std::nullopt;
}

String Soup::text() const {
    auto id = m_document->root();
    return id ? dom::text(*m_document, *id) : String();
}

String Soup::to_html() const {
    auto id = m_document->root();
    return id ? dom::outer_html(*m_document, *id) : String();
}

// ============================================================================
// Queries
// ============================================================================

Result<std::optional<Tag>, css::QueryError> Soup::find(std::string_view selector) const {
    auto result = css::find(*m_document, selector);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    if (!result.value()) {
        return std::optional<Tag>();
    }
    return std::optional<Tag>(Tag(m_document, *result.value()));
}

Result<Tag, SoupError> Soup::find_or_err(std::string_view selector) const {
    auto result = find(selector);
    if (result.is_err()) {
        return make_error(SoupError::from_query(std::move(result).error()));
    }
    if (!result.value()) {
        return make_error(SoupError::not_found(String(selector)));
    }
    return *result.value();
}

Result<std::vector<Tag>, css::QueryError> Soup::find_all(std::string_view selector) const {
    auto result = css::find_all(*m_document, selector);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    return to_tags(m_document, result.value());
}

Result<std::vector<Tag>, css::QueryError> Soup::select(std::string_view selector) const {
    return find_all(selector);
}

std::optional<Tag> Soup::find_compiled(const css::CompiledSelector& selector) const {
    auto id = css::find_compiled(*m_document, selector);
    if (!id) {
        return std::nullopt;
    }
    return Tag(m_document, *id);
}

std::vector<Tag> Soup::select_compiled(const css::CompiledSelector& selector) const {
    return to_tags(m_document, css::select_compiled(*m_document, selector));
}

Result<std::vector<String>, css::QueryError> Soup::select_text(std::string_view selector) const {
    return css::select_text(*m_document, selector);
}

Result<std::vector<std::optional<String>>, css::QueryError>
Soup::select_attr(std::string_view selector, std::string_view attribute) const {
    return css::select_attr(*m_document, selector, attribute);
}

Result<css::SelectorExplanation, css::QueryError> Soup::explain(std::string_view selector) const {
    return css::explain_with_document(selector, *m_document);
}

} // namespace scrape
