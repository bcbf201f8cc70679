/**
 * HTML Tree Builder - document start, head, text and after-body modes
 */

#include "scrape/html/tree_builder.hpp"
#include "constants.hpp"
#include <format>

namespace scrape::html {

namespace {

usize leading_whitespace(std::string_view text) {
    usize count = 0;
    while (count < text.size() && unicode::is_ascii_whitespace(static_cast<u8>(text[count]))) {
        ++count;
    }
    return count;
}

// Splits off leading whitespace. Returns the remainder as a token, or
// nullopt if the run was all whitespace.
std::optional<CharacterToken> without_leading_whitespace(const CharacterToken& characters) {
    usize skip = leading_whitespace(characters.data.view());
    if (skip == characters.data.size()) {
        return std::nullopt;
    }
    return CharacterToken{characters.data.substring(skip), characters.offset + skip};
}

} // namespace

void TreeBuilder::process_initial(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        auto rest = without_leading_whitespace(*characters);
        if (!rest) {
            return;
        }
        m_insertion_mode = InsertionMode::BeforeHtml;
        process_token(*rest);
        return;
    }

    if (std::holds_alternative<CommentToken>(token)) {
        return;
    }

    if (auto* doctype = std::get_if<DoctypeToken>(&token)) {
        if (doctype->name != "html") {
            parse_error(String(std::format("unexpected DOCTYPE '{}'", doctype->name.view())), doctype->offset);
        }
        m_insertion_mode = InsertionMode::BeforeHtml;
        return;
    }

    m_insertion_mode = InsertionMode::BeforeHtml;
    process_token(token);
}

void TreeBuilder::process_before_html(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        auto rest = without_leading_whitespace(*characters);
        if (!rest) {
            return;
        }
        auto root = m_document.create_element("html");
        m_document.set_root(root);
        m_html_element = root;
        push(root, "html");
        m_insertion_mode = InsertionMode::BeforeHead;
        process_token(*rest);
        return;
    }

    if (std::holds_alternative<CommentToken>(token)) {
        return;
    }

    if (auto* doctype = std::get_if<DoctypeToken>(&token)) {
        parse_error("unexpected DOCTYPE", doctype->offset);
        return;
    }

    if (auto* tag = std::get_if<TagToken>(&token)) {
        if (!tag->is_end_tag && tag->name == "html") {
            auto root = m_document.create_element("html", tag->attributes);
            m_document.set_root(root);
            m_html_element = root;
            push(root, "html");
            m_insertion_mode = InsertionMode::BeforeHead;
            return;
        }
        if (tag->is_end_tag && tag->name != "head" && tag->name != "body"
            && tag->name != "html" && tag->name != "br") {
            parse_error(String(std::format("unexpected end tag </{}>", tag->name.view())), tag->offset);
            return;
        }
    }

    auto root = m_document.create_element("html");
    m_document.set_root(root);
    m_html_element = root;
    push(root, "html");
    m_insertion_mode = InsertionMode::BeforeHead;
    process_token(token);
}

void TreeBuilder::process_before_head(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        auto rest = without_leading_whitespace(*characters);
        if (!rest) {
            return;
        }
        if (auto head = insert_element("head", rest->offset)) {
            m_head_element = *head;
            m_insertion_mode = InsertionMode::InHead;
            process_token(*rest);
        }
        return;
    }

    if (auto* comment = std::get_if<CommentToken>(&token)) {
        insert_comment(*comment);
        return;
    }

    if (auto* doctype = std::get_if<DoctypeToken>(&token)) {
        parse_error("unexpected DOCTYPE", doctype->offset);
        return;
    }

    usize offset = token_offset(token);
    if (auto* tag = std::get_if<TagToken>(&token)) {
        if (!tag->is_end_tag && tag->name == "html") {
            parse_error("unexpected <html>", tag->offset);
            return;
        }
        if (!tag->is_end_tag && tag->name == "head") {
            if (auto head = insert_element(*tag)) {
                m_head_element = *head;
                m_insertion_mode = InsertionMode::InHead;
            }
            return;
        }
        if (tag->is_end_tag && tag->name != "head" && tag->name != "body"
            && tag->name != "html" && tag->name != "br") {
            parse_error(String(std::format("unexpected end tag </{}>", tag->name.view())), tag->offset);
            return;
        }
    }

    if (auto head = insert_element("head", offset)) {
        m_head_element = *head;
        m_insertion_mode = InsertionMode::InHead;
        process_token(token);
    }
}

void TreeBuilder::process_in_head(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        usize whitespace = leading_whitespace(characters->data.view());
        if (whitespace > 0) {
            insert_text(characters->data.view().substr(0, whitespace));
        }
        if (whitespace == characters->data.size()) {
            return;
        }
        pop();
        m_insertion_mode = InsertionMode::AfterHead;
        process_token(CharacterToken{characters->data.substring(whitespace), characters->offset + whitespace});
        return;
    }

    if (auto* comment = std::get_if<CommentToken>(&token)) {
        insert_comment(*comment);
        return;
    }

    if (auto* doctype = std::get_if<DoctypeToken>(&token)) {
        parse_error("unexpected DOCTYPE", doctype->offset);
        return;
    }

    if (auto* tag = std::get_if<TagToken>(&token)) {
        const auto& name = tag->name;
        if (!tag->is_end_tag) {
            if (name == "html") {
                parse_error("unexpected <html>", tag->offset);
                return;
            }
            if (name == "base" || name == "basefont" || name == "bgsound" || name == "link" || name == "meta") {
                insert_void_element(*tag);
                return;
            }
            if (name == "title") {
                start_raw_text(*tag, TokenizerState::RCDATA);
                return;
            }
            if (name == "style" || name == "noframes" || name == "noscript") {
                start_raw_text(*tag, TokenizerState::RAWTEXT);
                return;
            }
            if (name == "script") {
                start_raw_text(*tag, TokenizerState::ScriptData);
                return;
            }
            if (name == "template") {
                // Template contents are parsed as body content under the template
                if (insert_element(*tag)) {
                    m_insertion_mode = InsertionMode::InBody;
                }
                return;
            }
            if (name == "head") {
                parse_error("unexpected <head>", tag->offset);
                return;
            }
        } else {
            if (name == "head") {
                pop();
                m_insertion_mode = InsertionMode::AfterHead;
                return;
            }
            if (name != "body" && name != "html" && name != "br") {
                parse_error(String(std::format("unexpected end tag </{}>", name.view())), tag->offset);
                return;
            }
        }
    }

    if (current_node_is("head")) {
        pop();
    }
    m_insertion_mode = InsertionMode::AfterHead;
    process_token(token);
}

void TreeBuilder::process_after_head(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        usize whitespace = leading_whitespace(characters->data.view());
        if (whitespace > 0) {
            insert_text(characters->data.view().substr(0, whitespace));
        }
        if (whitespace == characters->data.size()) {
            return;
        }
        if (auto body = insert_element("body", characters->offset + whitespace)) {
            m_body_element = *body;
            m_insertion_mode = InsertionMode::InBody;
            process_token(CharacterToken{characters->data.substring(whitespace), characters->offset + whitespace});
        }
        return;
    }

    if (auto* comment = std::get_if<CommentToken>(&token)) {
        insert_comment(*comment);
        return;
    }

    if (auto* doctype = std::get_if<DoctypeToken>(&token)) {
        parse_error("unexpected DOCTYPE", doctype->offset);
        return;
    }

    usize offset = token_offset(token);
    if (auto* tag = std::get_if<TagToken>(&token)) {
        const auto& name = tag->name;
        if (!tag->is_end_tag) {
            if (name == "html") {
                parse_error("unexpected <html>", tag->offset);
                return;
            }
            if (name == "body") {
                if (auto body = insert_element(*tag)) {
                    m_body_element = *body;
                    m_insertion_mode = InsertionMode::InBody;
                }
                return;
            }
            if (detail::is_one_of(detail::HEAD_CONTENT_ELEMENTS, name.view()) && name != "template"
                && m_head_element) {
                // Late head content still goes into <head>
                parse_error(String(std::format("<{}> after </head>", name.view())), tag->offset);
                push(*m_head_element, "head");
                process_in_head(token);
                if (m_insertion_mode == InsertionMode::Text) {
                    // Popped when the raw text element closes
                    m_original_insertion_mode = InsertionMode::AfterHead;
                    m_open_elements.erase(m_open_elements.end() - 2);
                } else if (current_node_is("head")) {
                    pop();
                }
                return;
            }
            if (name == "head") {
                parse_error("unexpected <head>", tag->offset);
                return;
            }
        } else if (name != "body" && name != "html" && name != "br") {
            parse_error(String(std::format("unexpected end tag </{}>", name.view())), tag->offset);
            return;
        }
    }

    if (auto body = insert_element("body", offset)) {
        m_body_element = *body;
        m_insertion_mode = InsertionMode::InBody;
        process_token(token);
    }
}

void TreeBuilder::process_text(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        insert_text(characters->data.view());
        return;
    }

    if (auto* eof = std::get_if<EndOfFileToken>(&token)) {
        parse_error(String(std::format("end of file inside <{}>", current_node().name.view())), eof->offset);
        flush_text();
        pop();
        m_insertion_mode = m_original_insertion_mode;
        process_token(token);
        return;
    }

    if (is_end_tag(token)) {
        flush_text();
        pop();
        m_insertion_mode = m_original_insertion_mode;
    }
}

void TreeBuilder::process_after_body(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        if (leading_whitespace(characters->data.view()) == characters->data.size()) {
            process_in_body(token);
            return;
        }
    }

    if (auto* comment = std::get_if<CommentToken>(&token)) {
        if (m_html_element) {
            insert_comment_into(*m_html_element, *comment);
        }
        return;
    }

    if (std::holds_alternative<DoctypeToken>(token)) {
        parse_error("unexpected DOCTYPE", token_offset(token));
        return;
    }

    if (is_start_tag_named(token, "html")) {
        process_in_body(token);
        return;
    }

    if (is_end_tag_named(token, "html") || is_end_tag_named(token, "body")) {
        return;
    }

    if (is_eof(token)) {
        flush_text();
        return;
    }

    parse_error("content after </body>", token_offset(token));
    m_insertion_mode = InsertionMode::InBody;
    process_token(token);
}

} // namespace scrape::html
