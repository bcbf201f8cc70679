#pragma once

#include "document.hpp"
#include <iterator>

namespace scrape::dom {

// ============================================================================
// Single-step element navigation
// ============================================================================
//
// Text and comment nodes are skipped by every function here.

[[nodiscard]] std::optional<NodeId> parent_element(const Document& doc, NodeId id);
[[nodiscard]] std::optional<NodeId> first_element_child(const Document& doc, NodeId id);
[[nodiscard]] std::optional<NodeId> last_element_child(const Document& doc, NodeId id);
[[nodiscard]] std::optional<NodeId> next_element_sibling(const Document& doc, NodeId id);
[[nodiscard]] std::optional<NodeId> prev_element_sibling(const Document& doc, NodeId id);
[[nodiscard]] usize element_child_count(const Document& doc, NodeId id);

// ============================================================================
// Walk policies
// ============================================================================
//
// A walk yields the first node relative to an origin and steps from the
// current node. Iterator state is the document, the current node and the
// origin, so no walk allocates or recurses.

struct ChildWalk {
    static std::optional<NodeId> first(const Document& doc, NodeId origin);
    static std::optional<NodeId> next(const Document& doc, NodeId current, NodeId origin);
};

struct NextSiblingWalk {
    static std::optional<NodeId> first(const Document& doc, NodeId origin);
    static std::optional<NodeId> next(const Document& doc, NodeId current, NodeId origin);
};

// Nearest-first
struct PrevSiblingWalk {
    static std::optional<NodeId> first(const Document& doc, NodeId origin);
    static std::optional<NodeId> next(const Document& doc, NodeId current, NodeId origin);
};

// Every element sibling except the origin, in document order
struct SiblingWalk {
    static std::optional<NodeId> first(const Document& doc, NodeId origin);
    static std::optional<NodeId> next(const Document& doc, NodeId current, NodeId origin);
};

// Immediate parent upward to the root
struct AncestorWalk {
    static std::optional<NodeId> first(const Document& doc, NodeId origin);
    static std::optional<NodeId> next(const Document& doc, NodeId current, NodeId origin);
};

// Pre-order, depth-first, origin excluded
struct DescendantWalk {
    static std::optional<NodeId> first(const Document& doc, NodeId origin);
    static std::optional<NodeId> next(const Document& doc, NodeId current, NodeId origin);
};

// ============================================================================
// NodeIterator / NodeRange
// ============================================================================

template<typename Walk>
class NodeIterator {
public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = NodeId;
    using difference_type = std::ptrdiff_t;
    using pointer = const NodeId*;
    using reference = NodeId;

    NodeIterator() = default;
    NodeIterator(const Document* doc, std::optional<NodeId> current, std::optional<NodeId> origin)
        : m_document(doc), m_current(current), m_origin(origin) {}

    [[nodiscard]] NodeId operator*() const { return *m_current; }

    NodeIterator& operator++() {
        m_current = Walk::next(*m_document, *m_current, *m_origin);
        return *this;
    }

    NodeIterator operator++(int) {
        auto copy = *this;
        ++*this;
        return copy;
    }

    [[nodiscard]] bool operator==(const NodeIterator& other) const { return m_current == other.m_current; }

private:
    const Document* m_document{nullptr};
    std::optional<NodeId> m_current;
    std::optional<NodeId> m_origin;
};

// Restartable: every begin() starts a fresh walk from the origin.
template<typename Walk>
class NodeRange {
public:
    using iterator = NodeIterator<Walk>;

    NodeRange(const Document& doc, NodeId origin) : m_document(&doc), m_origin(origin) {}

    [[nodiscard]] iterator begin() const {
        if (!m_document->contains(m_origin)) {
            return end();
        }
        return iterator(m_document, Walk::first(*m_document, m_origin), m_origin);
    }
    [[nodiscard]] iterator end() const { return iterator(m_document, std::nullopt, m_origin); }

    [[nodiscard]] bool empty() const { return begin() == end(); }

    [[nodiscard]] usize count() const {
        usize n = 0;
        for (auto it = begin(); it != end(); ++it) {
            ++n;
        }
        return n;
    }

    [[nodiscard]] std::vector<NodeId> to_vector() const {
        std::vector<NodeId> result;
        for (auto id : *this) {
            result.push_back(id);
        }
        return result;
    }

    [[nodiscard]] const Document& document() const { return *m_document; }
    [[nodiscard]] NodeId origin() const { return m_origin; }

private:
    const Document* m_document;
    NodeId m_origin;
};

using ChildRange = NodeRange<ChildWalk>;
using NextSiblingRange = NodeRange<NextSiblingWalk>;
using PrevSiblingRange = NodeRange<PrevSiblingWalk>;
using SiblingRange = NodeRange<SiblingWalk>;
using AncestorRange = NodeRange<AncestorWalk>;
using DescendantRange = NodeRange<DescendantWalk>;

[[nodiscard]] inline ChildRange children(const Document& doc, NodeId id) { return {doc, id}; }
[[nodiscard]] inline NextSiblingRange next_siblings(const Document& doc, NodeId id) { return {doc, id}; }
[[nodiscard]] inline PrevSiblingRange prev_siblings(const Document& doc, NodeId id) { return {doc, id}; }
[[nodiscard]] inline SiblingRange siblings(const Document& doc, NodeId id) { return {doc, id}; }
[[nodiscard]] inline AncestorRange ancestors(const Document& doc, NodeId id) { return {doc, id}; }
[[nodiscard]] inline DescendantRange descendants(const Document& doc, NodeId id) { return {doc, id}; }

} // namespace scrape::dom
