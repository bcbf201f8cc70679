#pragma once

#include "scrape/css/selector.hpp"
#include "scrape/dom/document.hpp"

namespace scrape::css {

// ============================================================================
// Queries
// ============================================================================
//
// Results are in document order. Document-scoped queries include the root
// element; `_within` queries only look at descendants of `scope`. Combinators
// may still look at ancestors outside the scope.
//
// The string forms compile on every call. Hold a CompiledSelector to reuse one.

[[nodiscard]] Result<std::optional<dom::NodeId>, QueryError>
find(const dom::Document& doc, std::string_view selector);
[[nodiscard]] Result<std::optional<dom::NodeId>, QueryError>
find_within(const dom::Document& doc, dom::NodeId scope, std::string_view selector);

[[nodiscard]] Result<std::vector<dom::NodeId>, QueryError>
find_all(const dom::Document& doc, std::string_view selector);
[[nodiscard]] Result<std::vector<dom::NodeId>, QueryError>
find_all_within(const dom::Document& doc, dom::NodeId scope, std::string_view selector);

// Alias of find_all
[[nodiscard]] Result<std::vector<dom::NodeId>, QueryError>
select(const dom::Document& doc, std::string_view selector);
[[nodiscard]] Result<std::vector<dom::NodeId>, QueryError>
select_within(const dom::Document& doc, dom::NodeId scope, std::string_view selector);

[[nodiscard]] std::optional<dom::NodeId>
find_compiled(const dom::Document& doc, const CompiledSelector& selector);
[[nodiscard]] std::optional<dom::NodeId>
find_compiled_within(const dom::Document& doc, dom::NodeId scope, const CompiledSelector& selector);

[[nodiscard]] std::vector<dom::NodeId>
find_all_compiled(const dom::Document& doc, const CompiledSelector& selector);
[[nodiscard]] std::vector<dom::NodeId>
find_all_compiled_within(const dom::Document& doc, dom::NodeId scope, const CompiledSelector& selector);

[[nodiscard]] std::vector<dom::NodeId>
select_compiled(const dom::Document& doc, const CompiledSelector& selector);
[[nodiscard]] std::vector<dom::NodeId>
select_compiled_within(const dom::Document& doc, dom::NodeId scope, const CompiledSelector& selector);

// ============================================================================
// Extraction
// ============================================================================

// text() of every match
[[nodiscard]] Result<std::vector<String>, QueryError>
select_text(const dom::Document& doc, std::string_view selector);
[[nodiscard]] Result<std::vector<String>, QueryError>
select_text_within(const dom::Document& doc, dom::NodeId scope, std::string_view selector);

// One entry per match; nullopt where the attribute is missing
[[nodiscard]] Result<std::vector<std::optional<String>>, QueryError>
select_attr(const dom::Document& doc, std::string_view selector, std::string_view attribute);
[[nodiscard]] Result<std::vector<std::optional<String>>, QueryError>
select_attr_within(const dom::Document& doc, dom::NodeId scope,
                   std::string_view selector, std::string_view attribute);

// ============================================================================
// closest
// ============================================================================

// Nearest ancestor of `element` (never `element` itself) matching the selector
[[nodiscard]] Result<std::optional<dom::NodeId>, QueryError>
closest(const dom::Document& doc, dom::NodeId element, std::string_view selector);
[[nodiscard]] std::optional<dom::NodeId>
closest_compiled(const dom::Document& doc, dom::NodeId element, const CompiledSelector& selector);

} // namespace scrape::css
