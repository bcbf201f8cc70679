#pragma once

#include "scrape/css/selector.hpp"
#include "scrape/html/parser.hpp"

namespace scrape {

// ============================================================================
// SoupError - one error type over parsing, querying and I/O
// ============================================================================

struct SoupError {
    enum class Kind : u8 {
        Parse,
        InvalidSelector,
        NotFound,
        AttributeNotFound,
        Io,
    };

    Kind kind{Kind::Io};
    // Selector for NotFound, attribute name for AttributeNotFound, reason for Io
    String message;
    std::optional<html::ParseError> parse_error;
    std::optional<css::QueryError> query_error;

    [[nodiscard]] static SoupError from_parse(html::ParseError error);
    [[nodiscard]] static SoupError from_query(css::QueryError error);
    [[nodiscard]] static SoupError not_found(String selector);
    [[nodiscard]] static SoupError attribute_not_found(String name);
    [[nodiscard]] static SoupError io(String message);

    [[nodiscard]] String to_string() const;

    [[nodiscard]] bool operator==(const SoupError& other) const = default;
};

} // namespace scrape
