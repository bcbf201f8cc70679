#pragma once

#include "document.hpp"

namespace scrape::dom {

// ============================================================================
// Element categories used by serialization
// ============================================================================

// Elements serialized without a closing tag
[[nodiscard]] bool is_void_element(std::string_view name);

// Elements whose text content is written verbatim
[[nodiscard]] bool is_raw_text_element(std::string_view name);

// ============================================================================
// Escaping
// ============================================================================

// &, <, > in text content
void escape_text_into(std::string_view text, String& out);
// &, ", <, > in attribute values
void escape_attribute_into(std::string_view value, String& out);

[[nodiscard]] String escape_text(std::string_view text);
[[nodiscard]] String escape_attribute(std::string_view value);

// ============================================================================
// Serialization
// ============================================================================
//
// All traversals are iterative. Unknown ids serialize as empty strings.

void outer_html_into(const Document& doc, NodeId id, String& out);
void inner_html_into(const Document& doc, NodeId id, String& out);
// Concatenated text node contents of the subtree; comments are excluded
void text_into(const Document& doc, NodeId id, String& out);

[[nodiscard]] String outer_html(const Document& doc, NodeId id);
[[nodiscard]] String inner_html(const Document& doc, NodeId id);
[[nodiscard]] String text(const Document& doc, NodeId id);

} // namespace scrape::dom
