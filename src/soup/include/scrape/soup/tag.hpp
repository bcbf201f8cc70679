#pragma once

#include "error.hpp"
#include "scrape/css/query.hpp"
#include "scrape/dom/navigation.hpp"

namespace scrape {

template<typename Walk>
class TagRange;

// ============================================================================
// Tag - element handle into a shared document
// ============================================================================
//
// A Tag keeps its document alive. Copies are cheap and may be passed to
// other threads; the document is never mutated after parsing.

class Tag {
public:
    Tag(RefPtr<const dom::Document> document, dom::NodeId id);

    [[nodiscard]] dom::NodeId node_id() const { return m_id; }
    [[nodiscard]] const dom::Document& document() const { return *m_document; }
    [[nodiscard]] const RefPtr<const dom::Document>& document_ptr() const { return m_document; }

    [[nodiscard]] const String& name() const;

    // ========================================================================
    // Attributes
    // ========================================================================

    // nullptr when the attribute is missing
    [[nodiscard]] const String* get(std::string_view attribute) const;
    [[nodiscard]] Result<String, SoupError> get_or_err(std::string_view attribute) const;
    [[nodiscard]] bool has_attr(std::string_view attribute) const;
    [[nodiscard]] const dom::Attributes& attrs() const;

    [[nodiscard]] bool has_class(std::string_view class_name) const;
    [[nodiscard]] std::vector<String> classes() const;

    // ========================================================================
    // Content
    // ========================================================================

    [[nodiscard]] String text() const;
    void text_into(String& out) const;
    [[nodiscard]] String inner_html() const;
    void inner_html_into(String& out) const;
    [[nodiscard]] String outer_html() const;
    void outer_html_into(String& out) const;

    // ========================================================================
    // Navigation (elements only)
    // ========================================================================

    [[nodiscard]] std::optional<Tag> parent() const;
    [[nodiscard]] TagRange<dom::ChildWalk> children() const;
    // Every child node, text and comments included
    [[nodiscard]] const std::vector<dom::NodeId>& raw_children() const;
    [[nodiscard]] usize child_count() const;

    [[nodiscard]] std::optional<Tag> next_sibling() const;
    [[nodiscard]] std::optional<Tag> prev_sibling() const;
    [[nodiscard]] TagRange<dom::NextSiblingWalk> next_siblings() const;
    // Nearest first
    [[nodiscard]] TagRange<dom::PrevSiblingWalk> prev_siblings() const;
    [[nodiscard]] TagRange<dom::SiblingWalk> siblings() const;

    [[nodiscard]] TagRange<dom::AncestorWalk> ancestors() const;
    [[nodiscard]] TagRange<dom::AncestorWalk> parents() const;
    [[nodiscard]] TagRange<dom::DescendantWalk> descendants() const;

    // Nearest matching ancestor, never this element
    [[nodiscard]] Result<std::optional<Tag>, css::QueryError> closest(std::string_view selector) const;
    [[nodiscard]] std::optional<Tag> closest_compiled(const css::CompiledSelector& selector) const;

    // ========================================================================
    // Scoped queries (descendants only)
    // ========================================================================

    [[nodiscard]] Result<std::optional<Tag>, css::QueryError> find(std::string_view selector) const;
    [[nodiscard]] Result<std::vector<Tag>, css::QueryError> find_all(std::string_view selector) const;
    [[nodiscard]] Result<std::vector<Tag>, css::QueryError> select(std::string_view selector) const;

    [[nodiscard]] std::optional<Tag> find_compiled(const css::CompiledSelector& selector) const;
    [[nodiscard]] std::vector<Tag> select_compiled(const css::CompiledSelector& selector) const;

    [[nodiscard]] Result<std::vector<String>, css::QueryError> select_text(std::string_view selector) const;
    [[nodiscard]] Result<std::vector<std::optional<String>>, css::QueryError>
    select_attr(std::string_view selector, std::string_view attribute) const;

    [[nodiscard]] bool operator==(const Tag& other) const {
        return m_document == other.m_document && m_id == other.m_id;
    }

private:
    [[nodiscard]] std::optional<Tag> wrap(std::optional<dom::NodeId> id) const;

    RefPtr<const dom::Document> m_document;
    dom::NodeId m_id;
};

// Wraps node ids from `document` as Tags
[[nodiscard]] std::vector<Tag> to_tags(const RefPtr<const dom::Document>& document,
                                       const std::vector<dom::NodeId>& ids);

// ============================================================================
// TagRange - a dom navigation range yielding Tags
// ============================================================================

template<typename Walk>
class TagRange {
public:
    class iterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = Tag;
        using difference_type = std::ptrdiff_t;
        using pointer = const Tag*;
        using reference = Tag;

        iterator() = default;
        iterator(const dom::Document* document, dom::NodeIterator<Walk> inner)
            : m_document(document), m_inner(inner) {}

        // The reference count is intrusive, so a raw pointer can be re-shared
        [[nodiscard]] Tag operator*() const { return Tag(RefPtr<const dom::Document>(m_document), *m_inner); }

        iterator& operator++() {
            ++m_inner;
            return *this;
        }

        iterator operator++(int) {
            auto copy = *this;
            ++m_inner;
            return copy;
        }

        [[nodiscard]] bool operator==(const iterator& other) const { return m_inner == other.m_inner; }

    private:
        const dom::Document* m_document{nullptr};
        dom::NodeIterator<Walk> m_inner;
    };

    TagRange(RefPtr<const dom::Document> document, dom::NodeId origin)
        : m_document(std::move(document))
        , m_range(*m_document, origin) {}

    [[nodiscard]] iterator begin() const { return iterator(m_document.get(), m_range.begin()); }
    [[nodiscard]] iterator end() const { return iterator(m_document.get(), m_range.end()); }

    [[nodiscard]] bool empty() const { return m_range.empty(); }
    [[nodiscard]] usize count() const { return m_range.count(); }

    [[nodiscard]] std::vector<Tag> to_vector() const { return to_tags(m_document, m_range.to_vector()); }

    [[nodiscard]] std::vector<dom::NodeId> ids() const { return m_range.to_vector(); }

private:
    RefPtr<const dom::Document> m_document;
    dom::NodeRange<Walk> m_range;
};

} // namespace scrape
