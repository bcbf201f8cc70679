#include "scrape/dom/navigation.hpp"

namespace scrape::dom {

namespace {

std::optional<NodeId> element_forward(const Document& doc, std::optional<NodeId> id) {
    while (id) {
        const auto& node = doc.node(*id);
        if (node.is_element()) {
            return id;
        }
        id = node.next_sibling;
    }
    return std::nullopt;
}

std::optional<NodeId> element_backward(const Document& doc, std::optional<NodeId> id) {
    while (id) {
        const auto& node = doc.node(*id);
        if (node.is_element()) {
            return id;
        }
        id = node.prev_sibling;
    }
    return std::nullopt;
}

} // anonymous namespace

// ============================================================================
// Single steps
// ============================================================================

std::optional<NodeId> parent_element(const Document& doc, NodeId id) {
    const auto* node = doc.get(id);
    if (!node || !node->parent) {
        return std::nullopt;
    }
    // Only elements hold children, so any parent is an element
    return node->parent;
}

std::optional<NodeId> first_element_child(const Document& doc, NodeId id) {
    const auto* node = doc.get(id);
    if (!node || node->children.empty()) {
        return std::nullopt;
    }
    return element_forward(doc, node->children.front());
}

std::optional<NodeId> last_element_child(const Document& doc, NodeId id) {
    const auto* node = doc.get(id);
    if (!node || node->children.empty()) {
        return std::nullopt;
    }
    return element_backward(doc, node->children.back());
}

std::optional<NodeId> next_element_sibling(const Document& doc, NodeId id) {
    const auto* node = doc.get(id);
    if (!node) {
        return std::nullopt;
    }
    return element_forward(doc, node->next_sibling);
}

std::optional<NodeId> prev_element_sibling(const Document& doc, NodeId id) {
    const auto* node = doc.get(id);
    if (!node) {
        return std::nullopt;
    }
    return element_backward(doc, node->prev_sibling);
}

usize element_child_count(const Document& doc, NodeId id) {
    const auto* node = doc.get(id);
    if (!node) {
        return 0;
    }
    usize count = 0;
    for (auto child : node->children) {
        if (doc.node(child).is_element()) {
            ++count;
        }
    }
    return count;
}

// ============================================================================
// Walks
// ============================================================================

std::optional<NodeId> ChildWalk::first(const Document& doc, NodeId origin) {
    return first_element_child(doc, origin);
}

std::optional<NodeId> ChildWalk::next(const Document& doc, NodeId current, NodeId) {
    return next_element_sibling(doc, current);
}

std::optional<NodeId> NextSiblingWalk::first(const Document& doc, NodeId origin) {
    return next_element_sibling(doc, origin);
}

std::optional<NodeId> NextSiblingWalk::next(const Document& doc, NodeId current, NodeId) {
    return next_element_sibling(doc, current);
}

std::optional<NodeId> PrevSiblingWalk::first(const Document& doc, NodeId origin) {
    return prev_element_sibling(doc, origin);
}

std::optional<NodeId> PrevSiblingWalk::next(const Document& doc, NodeId current, NodeId) {
    return prev_element_sibling(doc, current);
}

std::optional<NodeId> SiblingWalk::first(const Document& doc, NodeId origin) {
    auto parent = parent_element(doc, origin);
    if (!parent) {
        return std::nullopt;
    }
    auto first = first_element_child(doc, *parent);
    if (first && *first == origin) {
        return next_element_sibling(doc, origin);
    }
    return first;
}

std::optional<NodeId> SiblingWalk::next(const Document& doc, NodeId current, NodeId origin) {
    auto next = next_element_sibling(doc, current);
    if (next && *next == origin) {
        return next_element_sibling(doc, origin);
    }
    return next;
}

std::optional<NodeId> AncestorWalk::first(const Document& doc, NodeId origin) {
    return parent_element(doc, origin);
}

std::optional<NodeId> AncestorWalk::next(const Document& doc, NodeId current, NodeId) {
    return parent_element(doc, current);
}

std::optional<NodeId> DescendantWalk::first(const Document& doc, NodeId origin) {
    return first_element_child(doc, origin);
}

std::optional<NodeId> DescendantWalk::next(const Document& doc, NodeId current, NodeId origin) {
    if (auto child = first_element_child(doc, current)) {
        return child;
    }
    // Climb until a following sibling exists, stopping at the origin
    std::optional<NodeId> node = current;
    while (node && *node != origin) {
        if (auto sibling = next_element_sibling(doc, *node)) {
            return sibling;
        }
        node = parent_element(doc, *node);
    }
    return std::nullopt;
}

} // namespace scrape::dom
