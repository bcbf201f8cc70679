/**
 * HTML Tokenizer - tag and attribute states
 */

#include "scrape/html/tokenizer.hpp"

namespace scrape::html {

namespace {

constexpr std::string_view REPLACEMENT{"\xEF\xBF\xBD"};

bool is_whitespace(char c) {
    return unicode::is_ascii_whitespace(static_cast<u8>(c));
}

bool is_alpha(char c) {
    return unicode::is_ascii_alpha(static_cast<u8>(c));
}

} // namespace

void Tokenizer::handle_tag_open_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-before-tag-name");
        emit_characters("<", m_token_start);
        m_state = TokenizerState::Data;
        return;
    }

    if (*c == '!') {
        consume();
        m_state = TokenizerState::MarkupDeclarationOpen;
    } else if (*c == '/') {
        consume();
        m_state = TokenizerState::EndTagOpen;
    } else if (is_alpha(*c)) {
        m_current_tag = TagToken{};
        m_current_tag.offset = m_token_start;
        m_state = TokenizerState::TagName;
    } else if (*c == '?') {
        parse_error("unexpected-question-mark-instead-of-tag-name");
        m_current_comment = CommentToken{{}, m_token_start};
        m_state = TokenizerState::BogusComment;
    } else {
        parse_error("invalid-first-character-of-tag-name");
        emit_characters("<", m_token_start);
        m_state = TokenizerState::Data;
    }
}

void Tokenizer::handle_end_tag_open_state() {
    auto c = peek();
    if (!c) {
        parse_error("eof-before-tag-name");
        emit_characters("</", m_token_start);
        m_state = TokenizerState::Data;
        return;
    }

    if (is_alpha(*c)) {
        m_current_tag = TagToken{};
        m_current_tag.is_end_tag = true;
        m_current_tag.offset = m_token_start;
        m_state = TokenizerState::TagName;
    } else if (*c == '>') {
        consume();
        parse_error("missing-end-tag-name");
        m_state = TokenizerState::Data;
    } else {
        parse_error("invalid-first-character-of-tag-name");
        m_current_comment = CommentToken{{}, m_token_start};
        m_state = TokenizerState::BogusComment;
    }
}

void Tokenizer::handle_tag_name_state() {
    if (at_end()) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_tag.name.append(REPLACEMENT);
    } else {
        m_current_tag.name.append(unicode::to_ascii_lower(c));
    }
}

void Tokenizer::handle_before_attribute_name_state() {
    if (at_end()) {
        m_state = TokenizerState::AfterAttributeName;
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        return;
    }
    if (c == '/' || c == '>') {
        reconsume();
        m_state = TokenizerState::AfterAttributeName;
    } else if (c == '=') {
        parse_error("unexpected-equals-sign-before-attribute-name");
        start_new_attribute();
        m_current_attribute_name.append(c);
        m_state = TokenizerState::AttributeName;
    } else {
        start_new_attribute();
        reconsume();
        m_state = TokenizerState::AttributeName;
    }
}

void Tokenizer::handle_attribute_name_state() {
    if (at_end()) {
        m_state = TokenizerState::AfterAttributeName;
        return;
    }

    char c = consume();
    if (is_whitespace(c) || c == '/' || c == '>') {
        reconsume();
        m_state = TokenizerState::AfterAttributeName;
    } else if (c == '=') {
        m_state = TokenizerState::BeforeAttributeValue;
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_attribute_name.append(REPLACEMENT);
    } else {
        if (c == '"' || c == '\'' || c == '<') {
            parse_error("unexpected-character-in-attribute-name");
        }
        m_current_attribute_name.append(unicode::to_ascii_lower(c));
    }
}

void Tokenizer::handle_after_attribute_name_state() {
    if (at_end()) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        return;
    }
    if (c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (c == '=') {
        m_state = TokenizerState::BeforeAttributeValue;
    } else if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        start_new_attribute();
        reconsume();
        m_state = TokenizerState::AttributeName;
    }
}

void Tokenizer::handle_before_attribute_value_state() {
    auto c = peek();
    if (c && is_whitespace(*c)) {
        consume();
        return;
    }

    if (c == '"') {
        consume();
        m_state = TokenizerState::AttributeValueDoubleQuoted;
    } else if (c == '\'') {
        consume();
        m_state = TokenizerState::AttributeValueSingleQuoted;
    } else if (c == '>') {
        consume();
        parse_error("missing-attribute-value");
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        m_state = TokenizerState::AttributeValueUnquoted;
    }
}

void Tokenizer::handle_attribute_value_quoted_state(char quote) {
    if (at_end()) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    char c = consume();
    if (c == quote) {
        m_state = TokenizerState::AfterAttributeValueQuoted;
    } else if (c == '&') {
        consume_character_reference(m_current_attribute_value, true);
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_attribute_value.append(REPLACEMENT);
    } else {
        m_current_attribute_value.append(c);
    }
}

void Tokenizer::handle_attribute_value_unquoted_state() {
    if (at_end()) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (c == '&') {
        consume_character_reference(m_current_attribute_value, true);
    } else if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_attribute_value.append(REPLACEMENT);
    } else {
        if (c == '"' || c == '\'' || c == '<' || c == '=' || c == '`') {
            parse_error("unexpected-character-in-unquoted-attribute-value");
        }
        m_current_attribute_value.append(c);
    }
}

void Tokenizer::handle_after_attribute_value_quoted_state() {
    if (at_end()) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        m_state = TokenizerState::BeforeAttributeName;
    } else if (c == '/') {
        m_state = TokenizerState::SelfClosingStartTag;
    } else if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        parse_error("missing-whitespace-between-attributes");
        reconsume();
        m_state = TokenizerState::BeforeAttributeName;
    }
}

void Tokenizer::handle_self_closing_start_tag_state() {
    if (at_end()) {
        parse_error("eof-in-tag");
        emit_eof();
        return;
    }

    if (consume() == '>') {
        m_current_tag.self_closing = true;
        m_state = TokenizerState::Data;
        emit_current_tag();
    } else {
        parse_error("unexpected-solidus-in-tag");
        reconsume();
        m_state = TokenizerState::BeforeAttributeName;
    }
}

} // namespace scrape::html
