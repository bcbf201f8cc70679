#pragma once

#include "scrape/core/types.hpp"
#include <algorithm>
#include <array>
#include <string_view>

namespace scrape::html::detail {

inline constexpr std::array<std::string_view, 82> SPECIAL_ELEMENTS = {
    "address", "applet", "area", "article", "aside", "base", "basefont",
    "bgsound", "blockquote", "body", "br", "button", "caption", "center",
    "col", "colgroup", "dd", "details", "dir", "div", "dl", "dt", "embed",
    "fieldset", "figcaption", "figure", "footer", "form", "frame", "frameset",
    "h1", "h2", "h3", "h4", "h5", "h6", "head", "header", "hgroup", "hr",
    "html", "iframe", "img", "input", "keygen", "li", "link", "listing",
    "main", "marquee", "menu", "meta", "nav", "noembed", "noframes",
    "noscript", "object", "ol", "p", "param", "plaintext", "pre", "script",
    "section", "select", "source", "style", "summary", "table", "tbody",
    "td", "template", "textarea", "tfoot", "th", "thead", "title", "tr",
    "track", "ul", "wbr", "xmp"
};

inline constexpr std::array<std::string_view, 10> IMPLIED_END_TAG_ELEMENTS = {
    "dd", "dt", "li", "optgroup", "option", "p", "rb", "rp", "rt", "rtc"
};

inline constexpr std::array<std::string_view, 18> VOID_ELEMENTS = {
    "area", "base", "basefont", "bgsound", "br", "col", "embed", "frame",
    "hr", "img", "input", "keygen", "link", "meta", "param", "source",
    "track", "wbr"
};

// Start tags that close an open <p>
inline constexpr std::array<std::string_view, 27> CLOSES_P_ELEMENTS = {
    "address", "article", "aside", "blockquote", "center", "details",
    "dialog", "dir", "div", "dl", "fieldset", "figcaption", "figure",
    "footer", "header", "hgroup", "main", "menu", "nav", "ol", "p",
    "search", "section", "summary", "ul", "form", "table"
};

// End tags handled by the block rule in body
inline constexpr std::array<std::string_view, 29> BLOCK_END_TAG_ELEMENTS = {
    "address", "article", "aside", "blockquote", "button", "center",
    "details", "dialog", "dir", "div", "dl", "fieldset", "figcaption",
    "figure", "footer", "header", "hgroup", "listing", "main", "menu",
    "nav", "ol", "pre", "search", "section", "summary", "ul", "form",
    "select"
};

inline constexpr std::array<std::string_view, 11> HEAD_CONTENT_ELEMENTS = {
    "base", "basefont", "bgsound", "link", "meta", "noframes", "noscript",
    "script", "style", "template", "title"
};

inline constexpr std::array<std::string_view, 6> HEADING_ELEMENTS = {
    "h1", "h2", "h3", "h4", "h5", "h6"
};

inline constexpr std::array<std::string_view, 9> TABLE_ELEMENTS = {
    "caption", "col", "colgroup", "tbody", "td", "tfoot", "th", "thead", "tr"
};

// Elements that may legitimately be open at end of file
inline constexpr std::array<std::string_view, 14> OPTIONAL_END_TAG_ELEMENTS = {
    "p", "li", "dd", "dt", "option", "optgroup", "tbody", "thead", "tfoot",
    "tr", "td", "th", "body", "html"
};

// Whitespace-only text inside these is content
inline constexpr std::array<std::string_view, 7> WHITESPACE_SENSITIVE_ELEMENTS = {
    "pre", "listing", "textarea", "script", "style", "title", "plaintext"
};

template<usize N>
[[nodiscard]] constexpr bool is_one_of(const std::array<std::string_view, N>& list, std::string_view name) {
    return std::find(list.begin(), list.end(), name) != list.end();
}

[[nodiscard]] inline bool is_special_element(std::string_view name) {
    return is_one_of(SPECIAL_ELEMENTS, name);
}

[[nodiscard]] inline bool is_void_element(std::string_view name) {
    return is_one_of(VOID_ELEMENTS, name);
}

[[nodiscard]] inline bool is_heading(std::string_view name) {
    return is_one_of(HEADING_ELEMENTS, name);
}

} // namespace scrape::html::detail
