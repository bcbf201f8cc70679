#pragma once

#include "node.hpp"
#include <string>
#include <unordered_map>

namespace scrape::dom {

// ============================================================================
// Document - append-only node arena with id/class/tag indices
// ============================================================================

class Document : public RefCounted {
public:
    static constexpr usize DEFAULT_CAPACITY = 256;

    Document();
    explicit Document(usize capacity);

    // Node creation. Returned ids are stable for the lifetime of the document.
    NodeId create_element(String name, Attributes attributes = {});
    NodeId create_text(String content);
    NodeId create_comment(String content);

    // Links `child` as the last child of `parent`. The child must not have a
    // parent yet and the parent must be an element.
    void append_child(NodeId parent, NodeId child);

    void set_root(NodeId id);
    [[nodiscard]] std::optional<NodeId> root() const { return m_root; }

    // nullptr for ids that do not belong to this document
    [[nodiscard]] const Node* get(NodeId id) const;
    [[nodiscard]] const Node& node(NodeId id) const;
    [[nodiscard]] bool contains(NodeId id) const { return id.index() < m_nodes.size(); }

    [[nodiscard]] usize size() const { return m_nodes.size(); }
    [[nodiscard]] bool empty() const { return m_nodes.empty(); }
    [[nodiscard]] const std::vector<Node>& nodes() const { return m_nodes; }

    // Id of the node created `index`-th
    [[nodiscard]] NodeId id_at(usize index) const;

    // ========================================================================
    // Indices
    // ========================================================================

    // First element created with this id attribute
    [[nodiscard]] std::optional<NodeId> element_by_id(std::string_view id) const;

    // Candidate lists in creation order. Unattached elements are included.
    [[nodiscard]] const std::vector<NodeId>& elements_with_id(std::string_view id) const;
    [[nodiscard]] const std::vector<NodeId>& elements_with_class(std::string_view class_name) const;
    [[nodiscard]] const std::vector<NodeId>& elements_with_tag(std::string_view tag_name) const;

    // True while creation order of attached nodes equals pre-order. Index
    // candidate lists are only in document order while this holds.
    [[nodiscard]] bool creation_order_is_document_order() const {
        return m_creation_order_is_document_order;
    }

    [[nodiscard]] bool is_inclusive_ancestor(NodeId ancestor, NodeId node) const;

private:
    NodeId push_node(NodeData data);
    void index_element(NodeId id, const ElementData& element);
    void track_document_order(NodeId parent, NodeId child);

    std::vector<Node> m_nodes;
    std::optional<NodeId> m_root;

    struct KeyHash {
        using is_transparent = void;
        std::size_t operator()(std::string_view key) const noexcept {
            return std::hash<std::string_view>{}(key);
        }
    };
    using Index = std::unordered_map<std::string, std::vector<NodeId>, KeyHash, std::equal_to<>>;

    Index m_id_index;
    Index m_class_index;
    Index m_tag_index;

    bool m_creation_order_is_document_order{true};
    std::optional<NodeId> m_order_top;
    std::optional<NodeId> m_last_attached;
};

} // namespace scrape::dom
