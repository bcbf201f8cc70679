#include "scrape/soup/tag.hpp"
#include "scrape/dom/serializer.hpp"

namespace scrape {

namespace {

const dom::Attributes& no_attributes() {
    static const dom::Attributes empty;
    return empty;
}

} // namespace

std::vector<Tag> to_tags(const RefPtr<const dom::Document>& document, const std::vector<dom::NodeId>& ids) {
    std::vector<Tag> tags;
    tags.reserve(ids.size());
    for (auto id : ids) {
        tags.emplace_back(document, id);
    }
    return tags;
}

Tag::Tag(RefPtr<const dom::Document> document, dom::NodeId id)
    : m_document(std::move(document))
    , m_id(id) {}

std::optional<Tag> Tag::wrap(std::optional<dom::NodeId> id) const {
    if (!id) {
        return std::nullopt;
    }
    return Tag(m_document, *id);
}

const String& Tag::name() const {
    return m_document->node(m_id).name();
}

// ============================================================================
// Attributes
// ============================================================================

const String* Tag::get(std::string_view attribute) const {
    return m_document->node(m_id).attribute(attribute);
}

Result<String, SoupError> Tag::get_or_err(std::string_view attribute) const {
    if (const auto* value = get(attribute)) {
        return *value;
    }
    return make_error(SoupError::attribute_not_found(String(attribute)));
}

bool Tag::has_attr(std::string_view attribute) const {
    return get(attribute) != nullptr;
}

const dom::Attributes& Tag::attrs() const {
    if (const auto* element = m_document->node(m_id).as_element()) {
        return element->attributes;
    }
    return no_attributes();
}

bool Tag::has_class(std::string_view class_name) const {
    return m_document->node(m_id).has_class(class_name);
}

std::vector<String> Tag::classes() const {
    const auto* value = get("class");
    if (!value) {
        return {};
    }
    return value->split_whitespace();
}

// ============================================================================
// Content
// ============================================================================

String Tag::text() const {
    return dom::text(*m_document, m_id);
}

void Tag::text_into(String& out) const {
    dom::text_into(*m_document, m_id, out);
}

String Tag::inner_html() const {
    return dom::inner_html(*m_document, m_id);
}

void Tag::inner_html_into(String& out) const {
    dom::inner_html_into(*m_document, m_id, out);
}

String Tag::outer_html() const {
    return dom::outer_html(*m_document, m_id);
}

void Tag::outer_html_into(String& out) const {
    dom::outer_html_into(*m_document, m_id, out);
}

// ============================================================================
// Navigation
// ============================================================================

std::optional<Tag> Tag::parent() const {
    return wrap(dom::parent_element(*m_document, m_id));
}

TagRange<dom::ChildWalk> Tag::children() const {
    return {m_document, m_id};
}

const std::vector<dom::NodeId>& Tag::raw_children() const {
    return m_document->node(m_id).children;
}

usize Tag::child_count() const {
    return dom::element_child_count(*m_document, m_id);
}

std::optional<Tag> Tag::next_sibling() const {
    return wrap(dom::next_element_sibling(*m_document, m_id));
}

std::optional<Tag> Tag::prev_sibling() const {
    return wrap(dom::prev_element_sibling(*m_document, m_id));
}

TagRange<dom::NextSiblingWalk> Tag::next_siblings() const {
    return {m_document, m_id};
}

TagRange<dom::PrevSiblingWalk> Tag::prev_siblings() const {
    return {m_document, m_id};
}

TagRange<dom::SiblingWalk> Tag::siblings() const {
    return {m_document, m_id};
}

TagRange<dom::AncestorWalk> Tag::ancestors() const {
    return {m_document, m_id};
}

TagRange<dom::AncestorWalk> Tag::parents() const {
    return ancestors();
}

TagRange<dom::DescendantWalk> Tag::descendants() const {
    return {m_document, m_id};
}

Result<std::optional<Tag>, css::QueryError> Tag::closest(std::string_view selector) const {
    auto result = css::closest(*m_document, m_id, selector);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    return wrap(result.value());
}

std::optional<Tag> Tag::closest_compiled(const css::CompiledSelector& selector) const {
    return wrap(css::closest_compiled(*m_document, m_id, selector));
}

// ============================================================================
// Scoped queries
// ============================================================================

Result<std::optional<Tag>, css::QueryError> Tag::find(std::string_view selector) const {
    auto result = css::find_within(*m_document, m_id, selector);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    return wrap(result.value());
}

Result<std::vector<Tag>, css::QueryError> Tag::find_all(std::string_view selector) const {
    auto result = css::find_all_within(*m_document, m_id, selector);
    if (result.is_err()) {
        return make_error(std::move(result).error());
    }
    return to_tags(m_document, result.value());
}

Result<std::vector<Tag>, css::QueryError> Tag::select(std::string_view selector) const {
    return find_all(selector);
}

std::optional<Tag> Tag::find_compiled(const css::CompiledSelector& selector) const {
    return wrap(css::find_compiled_within(*m_document, m_id, selector));
}

std::vector<Tag> Tag::select_compiled(const css::CompiledSelector& selector) const {
    return to_tags(m_document, css::select_compiled_within(*m_document, m_id, selector));
}

Result<std::vector<String>, css::QueryError> Tag::select_text(std::string_view selector) const {
    return css::select_text_within(*m_document, m_id, selector);
}

Result<std::vector<std::optional<String>>, css::QueryError>
Tag::select_attr(std::string_view selector, std::string_view attribute) const {
    return css::select_attr_within(*m_document, m_id, selector, attribute);
}

} // namespace scrape
