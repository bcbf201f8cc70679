#pragma once

#include "scrape/core/types.hpp"
#include "scrape/core/string.hpp"
#include <compare>
#include <functional>
#include <optional>
#include <variant>
#include <vector>

namespace scrape::dom {

class Document;

// ============================================================================
// NodeId - opaque index into a Document's node arena
// ============================================================================

class NodeId {
public:
    [[nodiscard]] u32 index() const noexcept { return m_index; }

    [[nodiscard]] bool operator==(const NodeId& other) const = default;
    [[nodiscard]] auto operator<=>(const NodeId& other) const = default;

private:
    explicit NodeId(u32 index) : m_index(index) {}

    u32 m_index;

    friend class Document;
};

// ============================================================================
// Node payloads
// ============================================================================

enum class NodeKind : u8 {
    Element,
    Text,
    Comment,
};

struct Attribute {
    String name;
    String value;

    [[nodiscard]] bool operator==(const Attribute& other) const = default;
};

// Source order, unique names
using Attributes = std::vector<Attribute>;

struct ElementData {
    String name;
    Attributes attributes;
};

struct TextData {
    String content;
};

struct CommentData {
    String content;
};

using NodeData = std::variant<ElementData, TextData, CommentData>;

// ============================================================================
// Node - one arena slot
// ============================================================================

struct Node {
    NodeData data;
    std::optional<NodeId> parent;
    std::optional<NodeId> prev_sibling;
    std::optional<NodeId> next_sibling;
    std::vector<NodeId> children;

    [[nodiscard]] NodeKind kind() const { return static_cast<NodeKind>(data.index()); }
    [[nodiscard]] bool is_element() const { return kind() == NodeKind::Element; }
    [[nodiscard]] bool is_text() const { return kind() == NodeKind::Text; }
    [[nodiscard]] bool is_comment() const { return kind() == NodeKind::Comment; }

    [[nodiscard]] const ElementData* as_element() const { return std::get_if<ElementData>(&data); }
    [[nodiscard]] const TextData* as_text() const { return std::get_if<TextData>(&data); }
    [[nodiscard]] const CommentData* as_comment() const { return std::get_if<CommentData>(&data); }

    // Element name, or an empty string for text and comment nodes
    [[nodiscard]] const String& name() const;

    // Case-sensitive lookup; nullptr when missing or not an element
    [[nodiscard]] const String* attribute(std::string_view attr_name) const;
    [[nodiscard]] bool has_attribute(std::string_view attr_name) const {
        return attribute(attr_name) != nullptr;
    }

    [[nodiscard]] bool has_class(std::string_view class_name) const;
};

} // namespace scrape::dom

template<>
struct std::hash<scrape::dom::NodeId> {
    std::size_t operator()(const scrape::dom::NodeId& id) const noexcept {
        return std::hash<scrape::u32>{}(id.index());
    }
};
