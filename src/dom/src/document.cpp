#include "scrape/dom/document.hpp"
#include "scrape/core/logger.hpp"

namespace scrape::dom {

namespace {

const std::vector<NodeId>& empty_ids() {
    static const std::vector<NodeId> empty;
    return empty;
}

const String& empty_string() {
    static const String empty;
    return empty;
}

} // anonymous namespace

// ============================================================================
// Node
// ============================================================================

const String& Node::name() const {
    if (const auto* element = as_element()) {
        return element->name;
    }
    return empty_string();
}

const String* Node::attribute(std::string_view attr_name) const {
    const auto* element = as_element();
    if (!element) {
        return nullptr;
    }
    for (const auto& attr : element->attributes) {
        if (attr.name == attr_name) {
            return &attr.value;
        }
    }
    return nullptr;
}

bool Node::has_class(std::string_view class_name) const {
    const auto* value = attribute("class");
    if (!value || class_name.empty()) {
        return false;
    }
    for (const auto& token : value->split_whitespace()) {
        if (token == class_name) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Document
// ============================================================================

Document::Document() : Document(DEFAULT_CAPACITY) {}

Document::Document(usize capacity) {
    m_nodes.reserve(capacity);
}

NodeId Document::push_node(NodeData data) {
    NodeId id(static_cast<u32>(m_nodes.size()));
    m_nodes.push_back(Node{.data = std::move(data)});
    return id;
}

NodeId Document::create_element(String name, Attributes attributes) {
    // Later duplicates of an attribute name are dropped
    Attributes unique;
    unique.reserve(attributes.size());
    for (auto& attr : attributes) {
        bool seen = false;
        for (const auto& kept : unique) {
            if (kept.name == attr.name) {
                seen = true;
                break;
            }
        }
        if (!seen) {
            unique.push_back(std::move(attr));
        }
    }

    auto id = push_node(ElementData{.name = std::move(name), .attributes = std::move(unique)});
    index_element(id, std::get<ElementData>(m_nodes.back().data));
    return id;
}

NodeId Document::create_text(String content) {
    return push_node(TextData{.content = std::move(content)});
}

NodeId Document::create_comment(String content) {
    return push_node(CommentData{.content = std::move(content)});
}

void Document::index_element(NodeId id, const ElementData& element) {
    m_tag_index[element.name.to_lowercase().std_string()].push_back(id);

    for (const auto& attr : element.attributes) {
        if (attr.name == "id") {
            if (!attr.value.empty()) {
                m_id_index[attr.value.std_string()].push_back(id);
            }
        } else if (attr.name == "class") {
            auto classes = attr.value.split_whitespace();
            for (usize i = 0; i < classes.size(); ++i) {
                bool duplicate = false;
                for (usize j = 0; j < i; ++j) {
                    if (classes[j] == classes[i]) {
                        duplicate = true;
                        break;
                    }
                }
                if (!duplicate) {
                    m_class_index[classes[i].std_string()].push_back(id);
                }
            }
        }
    }
}

void Document::append_child(NodeId parent, NodeId child) {
    SCRAPE_DEBUG_ASSERT(contains(parent) && contains(child), "node id out of range");
    SCRAPE_DEBUG_ASSERT(parent != child, "node cannot be its own child");
    SCRAPE_DEBUG_ASSERT(m_nodes[parent.index()].is_element(), "parent must be an element");
    SCRAPE_DEBUG_ASSERT(!m_nodes[child.index()].parent.has_value(), "node already has a parent");

    track_document_order(parent, child);

    auto& parent_node = m_nodes[parent.index()];
    auto& child_node = m_nodes[child.index()];

    if (!parent_node.children.empty()) {
        auto last = parent_node.children.back();
        m_nodes[last.index()].next_sibling = child;
        child_node.prev_sibling = last;
    }
    child_node.parent = parent;
    parent_node.children.push_back(child);
}

void Document::track_document_order(NodeId parent, NodeId child) {
    if (!m_creation_order_is_document_order) {
        return;
    }

    if (!m_nodes[child.index()].children.empty()) {
        m_creation_order_is_document_order = false;
        return;
    }

    if (!m_last_attached) {
        // First link of a tree built before set_root
        if (child < parent || m_nodes[parent.index()].parent.has_value()) {
            m_creation_order_is_document_order = false;
        }
        m_order_top = parent;
        m_last_attached = child;
        return;
    }

    // Pre-order holds when every new node lands after the last attached one
    // on the path from the top of the tree down to it.
    if (child < *m_last_attached || !is_inclusive_ancestor(parent, *m_last_attached)) {
        m_creation_order_is_document_order = false;
    }
    m_last_attached = child;
}

void Document::set_root(NodeId id) {
    SCRAPE_DEBUG_ASSERT(contains(id), "node id out of range");
    SCRAPE_DEBUG_ASSERT(!m_nodes[id.index()].parent.has_value(), "root cannot have a parent");

    if (m_order_top && *m_order_top != id) {
        m_creation_order_is_document_order = false;
    }
    if (!m_last_attached) {
        m_order_top = id;
        m_last_attached = id;
    }
    m_root = id;
}

const Node* Document::get(NodeId id) const {
    if (!contains(id)) {
        return nullptr;
    }
    return &m_nodes[id.index()];
}

const Node& Document::node(NodeId id) const {
    SCRAPE_ASSERT(contains(id), "node id out of range");
    return m_nodes[id.index()];
}

NodeId Document::id_at(usize index) const {
    SCRAPE_ASSERT(index < m_nodes.size(), "node index out of range");
    return NodeId(static_cast<u32>(index));
}

std::optional<NodeId> Document::element_by_id(std::string_view id) const {
    const auto& ids = elements_with_id(id);
    if (ids.empty()) {
        return std::nullopt;
    }
    return ids.front();
}

const std::vector<NodeId>& Document::elements_with_id(std::string_view id) const {
    auto it = m_id_index.find(id);
    return it != m_id_index.end() ? it->second : empty_ids();
}

const std::vector<NodeId>& Document::elements_with_class(std::string_view class_name) const {
    auto it = m_class_index.find(class_name);
    return it != m_class_index.end() ? it->second : empty_ids();
}

const std::vector<NodeId>& Document::elements_with_tag(std::string_view tag_name) const {
    auto lowered = String(tag_name).to_lowercase();
    auto it = m_tag_index.find(lowered.view());
    return it != m_tag_index.end() ? it->second : empty_ids();
}

bool Document::is_inclusive_ancestor(NodeId ancestor, NodeId node) const {
    std::optional<NodeId> current = node;
    while (current) {
        if (*current == ancestor) {
            return true;
        }
        const auto* entry = get(*current);
        if (!entry) {
            return false;
        }
        current = entry->parent;
    }
    return false;
}

} // namespace scrape::dom
