#include "scrape/dom/serializer.hpp"
#include <array>

namespace scrape::dom {

namespace {

constexpr std::array<std::string_view, 14> VOID_ELEMENTS = {
    "area", "base", "br", "col", "embed", "hr", "img",
    "input", "link", "meta", "param", "source", "track", "wbr",
};

constexpr std::array<std::string_view, 8> RAW_TEXT_ELEMENTS = {
    "script", "style", "xmp", "iframe", "noembed", "noframes", "noscript", "plaintext",
};

bool equals_ignore_case(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    for (usize i = 0; i < a.size(); ++i) {
        if (unicode::to_ascii_lower(a[i]) != unicode::to_ascii_lower(b[i])) {
            return false;
        }
    }
    return true;
}

template<usize N>
bool contains_ignore_case(const std::array<std::string_view, N>& names, std::string_view name) {
    for (auto candidate : names) {
        if (equals_ignore_case(name, candidate)) {
            return true;
        }
    }
    return false;
}

bool text_is_raw(const Document& doc, const Node& text_node) {
    if (!text_node.parent) {
        return false;
    }
    return is_raw_text_element(doc.node(*text_node.parent).name());
}

void write_start_tag(const ElementData& element, String& out) {
    out += '<';
    out += element.name;
    for (const auto& attr : element.attributes) {
        out += ' ';
        out += attr.name;
        out += "=\"";
        escape_attribute_into(attr.value, out);
        out += '"';
    }
    out += '>';
}

} // anonymous namespace

bool is_void_element(std::string_view name) {
    return contains_ignore_case(VOID_ELEMENTS, name);
}

bool is_raw_text_element(std::string_view name) {
    return contains_ignore_case(RAW_TEXT_ELEMENTS, name);
}

// ============================================================================
// Escaping
// ============================================================================

void escape_text_into(std::string_view text, String& out) {
    for (char c : text) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
}

void escape_attribute_into(std::string_view value, String& out) {
    for (char c : value) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '"': out += "&quot;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            default: out += c; break;
        }
    }
}

String escape_text(std::string_view text) {
    String out;
    out.reserve(text.size());
    escape_text_into(text, out);
    return out;
}

String escape_attribute(std::string_view value) {
    String out;
    out.reserve(value.size());
    escape_attribute_into(value, out);
    return out;
}

// ============================================================================
// Serialization
// ============================================================================

void outer_html_into(const Document& doc, NodeId id, String& out) {
    if (!doc.contains(id)) {
        return;
    }

    struct Frame {
        NodeId id;
        bool closing;
    };
    std::vector<Frame> stack;
    stack.push_back({id, false});

    while (!stack.empty()) {
        auto frame = stack.back();
        stack.pop_back();
        const auto& node = doc.node(frame.id);

        if (frame.closing) {
            out += "</";
            out += node.name();
            out += '>';
            continue;
        }

        switch (node.kind()) {
            case NodeKind::Text: {
                const auto& content = node.as_text()->content;
                if (text_is_raw(doc, node)) {
                    out += content;
                } else {
                    escape_text_into(content, out);
                }
                break;
            }
            case NodeKind::Comment:
                out += "<!--";
                out += node.as_comment()->content;
                out += "-->";
                break;
            case NodeKind::Element: {
                const auto& element = *node.as_element();
                write_start_tag(element, out);
                if (is_void_element(element.name)) {
                    break;
                }
                stack.push_back({frame.id, true});
                for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
                    stack.push_back({*it, false});
                }
                break;
            }
        }
    }
}

void inner_html_into(const Document& doc, NodeId id, String& out) {
    const auto* node = doc.get(id);
    if (!node) {
        return;
    }
    for (auto child : node->children) {
        outer_html_into(doc, child, out);
    }
}

void text_into(const Document& doc, NodeId id, String& out) {
    if (!doc.contains(id)) {
        return;
    }

    std::vector<NodeId> stack;
    stack.push_back(id);
    while (!stack.empty()) {
        auto current = stack.back();
        stack.pop_back();
        const auto& node = doc.node(current);

        if (const auto* text = node.as_text()) {
            out += text->content;
            continue;
        }
        for (auto it = node.children.rbegin(); it != node.children.rend(); ++it) {
            stack.push_back(*it);
        }
    }
}

String outer_html(const Document& doc, NodeId id) {
    String out;
    outer_html_into(doc, id, out);
    return out;
}

String inner_html(const Document& doc, NodeId id) {
    String out;
    inner_html_into(doc, id, out);
    return out;
}

String text(const Document& doc, NodeId id) {
    String out;
    text_into(doc, id, out);
    return out;
}

} // namespace scrape::dom
