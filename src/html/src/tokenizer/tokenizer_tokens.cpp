/**
 * HTML Tokenizer - token helpers and emission
 */

#include "scrape/html/tokenizer.hpp"

namespace scrape::html {

const String* TagToken::attribute(std::string_view name) const {
    for (const auto& attr : attributes) {
        if (attr.name == name) {
            return &attr.value;
        }
    }
    return nullptr;
}

bool is_doctype(const Token& token) {
    return std::holds_alternative<DoctypeToken>(token);
}

bool is_start_tag(const Token& token) {
    if (auto* tag = std::get_if<TagToken>(&token)) {
        return !tag->is_end_tag;
    }
    return false;
}

bool is_end_tag(const Token& token) {
    if (auto* tag = std::get_if<TagToken>(&token)) {
        return tag->is_end_tag;
    }
    return false;
}

bool is_character(const Token& token) {
    return std::holds_alternative<CharacterToken>(token);
}

bool is_comment(const Token& token) {
    return std::holds_alternative<CommentToken>(token);
}

bool is_eof(const Token& token) {
    return std::holds_alternative<EndOfFileToken>(token);
}

// Tag names are lowercased by the tokenizer
bool is_start_tag_named(const Token& token, std::string_view name) {
    if (auto* tag = std::get_if<TagToken>(&token)) {
        return !tag->is_end_tag && tag->name == name;
    }
    return false;
}

bool is_end_tag_named(const Token& token, std::string_view name) {
    if (auto* tag = std::get_if<TagToken>(&token)) {
        return tag->is_end_tag && tag->name == name;
    }
    return false;
}

usize token_offset(const Token& token) {
    return std::visit([](const auto& t) { return t.offset; }, token);
}

// ============================================================================
// Emission
// ============================================================================

void Tokenizer::emit(Token token) {
    if (!is_character(token)) {
        flush_characters();
    }

    if (m_token_callback) {
        m_token_callback(std::move(token));
    } else {
        m_token_queue.push_back(std::move(token));
    }
}

void Tokenizer::emit_character(char c) {
    if (m_pending_text.empty()) {
        m_pending_text_offset = m_position > 0 ? m_position - 1 : 0;
    }
    m_pending_text.append(c);
}

void Tokenizer::emit_characters(std::string_view text, usize offset) {
    if (text.empty()) {
        return;
    }
    if (m_pending_text.empty()) {
        m_pending_text_offset = offset;
    }
    m_pending_text.append(text);
}

void Tokenizer::flush_characters() {
    if (m_pending_text.empty()) {
        return;
    }
    CharacterToken token{std::move(m_pending_text), m_pending_text_offset};
    m_pending_text.clear();
    emit(std::move(token));
}

void Tokenizer::emit_current_tag() {
    finish_attribute();

    if (m_current_tag.is_end_tag) {
        if (!m_current_tag.attributes.empty()) {
            parse_error("end-tag-with-attributes");
        }
        if (m_current_tag.self_closing) {
            parse_error("end-tag-with-trailing-solidus");
        }
    } else {
        m_last_start_tag_name = m_current_tag.name;
    }

    TagToken tag = std::move(m_current_tag);
    m_current_tag = TagToken{};
    emit(std::move(tag));
}

void Tokenizer::emit_current_comment() {
    CommentToken comment = std::move(m_current_comment);
    m_current_comment = CommentToken{};
    emit(std::move(comment));
}

void Tokenizer::emit_current_doctype() {
    DoctypeToken doctype = std::move(m_current_doctype);
    m_current_doctype = DoctypeToken{};
    emit(std::move(doctype));
}

void Tokenizer::emit_eof() {
    if (m_eof_emitted) {
        return;
    }
    flush_characters();
    m_eof_emitted = true;
    emit(EndOfFileToken{m_input.size()});
}

} // namespace scrape::html
