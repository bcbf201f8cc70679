#include "scrape/soup/error.hpp"
#include <format>

namespace scrape {

SoupError SoupError::from_parse(html::ParseError error) {
    SoupError result;
    result.kind = Kind::Parse;
    result.message = error.message;
    result.parse_error = std::move(error);
    return result;
}

SoupError SoupError::from_query(css::QueryError error) {
    SoupError result;
    result.kind = Kind::InvalidSelector;
    result.message = error.message;
    result.query_error = std::move(error);
    return result;
}

SoupError SoupError::not_found(String selector) {
    SoupError result;
    result.kind = Kind::NotFound;
    result.message = std::move(selector);
    return result;
}

SoupError SoupError::attribute_not_found(String name) {
    SoupError result;
    result.kind = Kind::AttributeNotFound;
    result.message = std::move(name);
    return result;
}

SoupError SoupError::io(String message) {
    SoupError result;
    result.kind = Kind::Io;
    result.message = std::move(message);
    return result;
}

String SoupError::to_string() const {
    switch (kind) {
        case Kind::Parse:
            return parse_error ? parse_error->to_string() : String(std::format("malformed HTML: {}", message.view()));
        case Kind::InvalidSelector:
            return query_error ? query_error->to_string() : String(std::format("invalid selector: {}", message.view()));
        case Kind::NotFound:
            return String(std::format("element not found: {}", message.view()));
        case Kind::AttributeNotFound:
            return String(std::format("attribute '{}' not found on element", message.view()));
        case Kind::Io:
            return String(std::format("I/O error: {}", message.view()));
    }
    return String(std::format("I/O error: {}", message.view()));
}

} // namespace scrape
