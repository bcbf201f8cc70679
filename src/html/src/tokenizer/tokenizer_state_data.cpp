/**
 * HTML Tokenizer - data, RCDATA, RAWTEXT, script data and PLAINTEXT states
 */

#include "scrape/html/tokenizer.hpp"

namespace scrape::html {

namespace {

// Length of the plain text run starting at `from` that contains none of `stops`
usize text_run_length(std::string_view input, usize from, std::string_view stops) {
    auto end = input.find_first_of(stops, from);
    return (end == std::string_view::npos ? input.size() : end) - from;
}

constexpr std::string_view DATA_STOPS{"<&\0", 3};
constexpr std::string_view RAW_STOPS{"<\0", 2};

} // namespace

void Tokenizer::handle_data_state() {
    if (at_end()) {
        emit_eof();
        return;
    }

    usize run = text_run_length(m_input, m_position, DATA_STOPS);
    if (run > 0) {
        emit_characters(m_input.substr(m_position, run), m_position);
        m_position += run;
        return;
    }

    usize start = m_position;
    char c = consume();
    switch (c) {
        case '&': {
            String decoded;
            consume_character_reference(decoded, false);
            emit_characters(decoded.view(), start);
            break;
        }
        case '<':
            m_token_start = start;
            m_state = TokenizerState::TagOpen;
            break;
        default:
            parse_error("unexpected-null-character");
            emit_characters("\xEF\xBF\xBD", start);
            break;
    }
}

void Tokenizer::handle_rcdata_state() {
    if (at_end()) {
        emit_eof();
        return;
    }

    usize run = text_run_length(m_input, m_position, DATA_STOPS);
    if (run > 0) {
        emit_characters(m_input.substr(m_position, run), m_position);
        m_position += run;
        return;
    }

    usize start = m_position;
    char c = consume();
    switch (c) {
        case '&': {
            String decoded;
            consume_character_reference(decoded, false);
            emit_characters(decoded.view(), start);
            break;
        }
        case '<':
            m_token_start = start;
            m_state = TokenizerState::RCDATALessThanSign;
            break;
        default:
            parse_error("unexpected-null-character");
            emit_characters("\xEF\xBF\xBD", start);
            break;
    }
}

void Tokenizer::handle_rawtext_state() {
    if (at_end()) {
        emit_eof();
        return;
    }

    usize run = text_run_length(m_input, m_position, RAW_STOPS);
    if (run > 0) {
        emit_characters(m_input.substr(m_position, run), m_position);
        m_position += run;
        return;
    }

    usize start = m_position;
    if (consume() == '<') {
        m_token_start = start;
        m_state = TokenizerState::RAWTEXTLessThanSign;
    } else {
        parse_error("unexpected-null-character");
        emit_characters("\xEF\xBF\xBD", start);
    }
}

// Script data is treated as raw text. Escaped script states ("<!--" inside
// a script) are not tracked; the first matching end tag closes the script.
void Tokenizer::handle_script_data_state() {
    if (at_end()) {
        emit_eof();
        return;
    }

    usize run = text_run_length(m_input, m_position, RAW_STOPS);
    if (run > 0) {
        emit_characters(m_input.substr(m_position, run), m_position);
        m_position += run;
        return;
    }

    usize start = m_position;
    if (consume() == '<') {
        m_token_start = start;
        m_state = TokenizerState::ScriptDataLessThanSign;
    } else {
        parse_error("unexpected-null-character");
        emit_characters("\xEF\xBF\xBD", start);
    }
}

void Tokenizer::handle_plaintext_state() {
    if (at_end()) {
        emit_eof();
        return;
    }

    usize run = text_run_length(m_input, m_position, std::string_view{"\0", 1});
    if (run > 0) {
        emit_characters(m_input.substr(m_position, run), m_position);
        m_position += run;
        return;
    }

    usize start = m_position;
    consume();
    parse_error("unexpected-null-character");
    emit_characters("\xEF\xBF\xBD", start);
}

// ============================================================================
// End tags inside raw text
// ============================================================================

void Tokenizer::handle_raw_less_than_sign_state(TokenizerState text_state, TokenizerState end_tag_open_state) {
    if (peek() == '/') {
        consume();
        m_temp_buffer.clear();
        m_state = end_tag_open_state;
        return;
    }

    emit_characters("<", m_token_start);
    m_state = text_state;
}

void Tokenizer::handle_raw_end_tag_open_state(TokenizerState text_state, TokenizerState end_tag_name_state) {
    auto c = peek();
    if (c && unicode::is_ascii_alpha(static_cast<u8>(*c))) {
        m_current_tag = TagToken{};
        m_current_tag.is_end_tag = true;
        m_current_tag.offset = m_token_start;
        m_state = end_tag_name_state;
        return;
    }

    emit_characters("</", m_token_start);
    m_state = text_state;
}

void Tokenizer::handle_raw_end_tag_name_state(TokenizerState text_state) {
    auto c = peek();
    if (c) {
        char ch = *c;
        if (unicode::is_ascii_whitespace(static_cast<u8>(ch)) && is_appropriate_end_tag_token()) {
            consume();
            m_state = TokenizerState::BeforeAttributeName;
            return;
        }
        if (ch == '/' && is_appropriate_end_tag_token()) {
            consume();
            m_state = TokenizerState::SelfClosingStartTag;
            return;
        }
        if (ch == '>' && is_appropriate_end_tag_token()) {
            consume();
            m_state = TokenizerState::Data;
            emit_current_tag();
            return;
        }
        if (unicode::is_ascii_alpha(static_cast<u8>(ch))) {
            consume();
            m_current_tag.name.append(unicode::to_ascii_lower(ch));
            m_temp_buffer.append(ch);
            return;
        }
    }

    // Not the closing tag: everything consumed so far is text
    String text("</");
    text.append(m_temp_buffer);
    emit_characters(text.view(), m_token_start);
    m_current_tag = TagToken{};
    m_state = text_state;
}

} // namespace scrape::html
