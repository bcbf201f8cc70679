/**
 * HTML Tokenizer - markup declarations, comments and DOCTYPE
 */

#include "scrape/html/tokenizer.hpp"

namespace scrape::html {

namespace {

constexpr std::string_view REPLACEMENT{"\xEF\xBF\xBD"};

bool is_whitespace(char c) {
    return unicode::is_ascii_whitespace(static_cast<u8>(c));
}

} // namespace

void Tokenizer::handle_markup_declaration_open_state() {
    if (consume_if_match("--")) {
        m_current_comment = CommentToken{{}, m_token_start};
        m_state = TokenizerState::CommentStart;
        return;
    }

    if (consume_if_match("DOCTYPE", true)) {
        m_current_doctype = DoctypeToken{};
        m_current_doctype.offset = m_token_start;
        m_state = TokenizerState::DOCTYPE;
        return;
    }

    // CDATA sections only exist in foreign content; in HTML they are comments
    if (consume_if_match("[CDATA[")) {
        parse_error("cdata-in-html-content");
        m_current_comment = CommentToken{String("[CDATA["), m_token_start};
        m_state = TokenizerState::BogusComment;
        return;
    }

    parse_error("incorrectly-opened-comment");
    m_current_comment = CommentToken{{}, m_token_start};
    m_state = TokenizerState::BogusComment;
}

void Tokenizer::handle_bogus_comment_state() {
    if (at_end()) {
        emit_current_comment();
        emit_eof();
        return;
    }

    char c = consume();
    if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_comment();
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_comment.data.append(REPLACEMENT);
    } else {
        m_current_comment.data.append(c);
    }
}

// ============================================================================
// Comments
// ============================================================================

void Tokenizer::handle_comment_start_state() {
    auto c = peek();
    if (c == '-') {
        consume();
        m_state = TokenizerState::CommentStartDash;
    } else if (c == '>') {
        consume();
        parse_error("abrupt-closing-of-empty-comment");
        m_state = TokenizerState::Data;
        emit_current_comment();
    } else {
        m_state = TokenizerState::Comment;
    }
}

void Tokenizer::handle_comment_start_dash_state() {
    if (at_end()) {
        parse_error("eof-in-comment");
        emit_current_comment();
        emit_eof();
        return;
    }

    char c = consume();
    if (c == '-') {
        m_state = TokenizerState::CommentEnd;
    } else if (c == '>') {
        parse_error("abrupt-closing-of-empty-comment");
        m_state = TokenizerState::Data;
        emit_current_comment();
    } else {
        m_current_comment.data.append('-');
        reconsume();
        m_state = TokenizerState::Comment;
    }
}

void Tokenizer::handle_comment_state() {
    if (at_end()) {
        parse_error("eof-in-comment");
        emit_current_comment();
        emit_eof();
        return;
    }

    // Bulk-copy up to the next dash or NUL
    auto end = m_input.find_first_of(std::string_view{"-\0", 2}, m_position);
    if (end == std::string_view::npos) {
        end = m_input.size();
    }
    if (end > m_position) {
        m_current_comment.data.append(m_input.substr(m_position, end - m_position));
        m_position = end;
        return;
    }

    char c = consume();
    if (c == '-') {
        m_state = TokenizerState::CommentEndDash;
    } else {
        parse_error("unexpected-null-character");
        m_current_comment.data.append(REPLACEMENT);
    }
}

void Tokenizer::handle_comment_end_dash_state() {
    if (at_end()) {
        parse_error("eof-in-comment");
        emit_current_comment();
        emit_eof();
        return;
    }

    if (consume() == '-') {
        m_state = TokenizerState::CommentEnd;
    } else {
        m_current_comment.data.append('-');
        reconsume();
        m_state = TokenizerState::Comment;
    }
}

void Tokenizer::handle_comment_end_state() {
    if (at_end()) {
        parse_error("eof-in-comment");
        emit_current_comment();
        emit_eof();
        return;
    }

    char c = consume();
    if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_comment();
    } else if (c == '!') {
        m_state = TokenizerState::CommentEndBang;
    } else if (c == '-') {
        m_current_comment.data.append('-');
    } else {
        m_current_comment.data.append("--");
        reconsume();
        m_state = TokenizerState::Comment;
    }
}

void Tokenizer::handle_comment_end_bang_state() {
    if (at_end()) {
        parse_error("eof-in-comment");
        emit_current_comment();
        emit_eof();
        return;
    }

    char c = consume();
    if (c == '-') {
        m_current_comment.data.append("--!");
        m_state = TokenizerState::CommentEndDash;
    } else if (c == '>') {
        parse_error("incorrectly-closed-comment");
        m_state = TokenizerState::Data;
        emit_current_comment();
    } else {
        m_current_comment.data.append("--!");
        reconsume();
        m_state = TokenizerState::Comment;
    }
}

// ============================================================================
// DOCTYPE (name only; public and system identifiers are skipped)
// ============================================================================

void Tokenizer::handle_doctype_state() {
    if (at_end()) {
        parse_error("eof-in-doctype");
        m_current_doctype.force_quirks = true;
        emit_current_doctype();
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        m_state = TokenizerState::BeforeDOCTYPEName;
    } else if (c == '>') {
        reconsume();
        m_state = TokenizerState::BeforeDOCTYPEName;
    } else {
        parse_error("missing-whitespace-before-doctype-name");
        reconsume();
        m_state = TokenizerState::BeforeDOCTYPEName;
    }
}

void Tokenizer::handle_before_doctype_name_state() {
    if (at_end()) {
        parse_error("eof-in-doctype");
        m_current_doctype.force_quirks = true;
        emit_current_doctype();
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        return;
    }
    if (c == '>') {
        parse_error("missing-doctype-name");
        m_current_doctype.force_quirks = true;
        m_state = TokenizerState::Data;
        emit_current_doctype();
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_doctype.name.append(REPLACEMENT);
        m_state = TokenizerState::DOCTYPEName;
    } else {
        m_current_doctype.name.append(unicode::to_ascii_lower(c));
        m_state = TokenizerState::DOCTYPEName;
    }
}

void Tokenizer::handle_doctype_name_state() {
    if (at_end()) {
        parse_error("eof-in-doctype");
        m_current_doctype.force_quirks = true;
        emit_current_doctype();
        emit_eof();
        return;
    }

    char c = consume();
    if (is_whitespace(c)) {
        m_state = TokenizerState::AfterDOCTYPEName;
    } else if (c == '>') {
        m_state = TokenizerState::Data;
        emit_current_doctype();
    } else if (c == '\0') {
        parse_error("unexpected-null-character");
        m_current_doctype.name.append(REPLACEMENT);
    } else {
        m_current_doctype.name.append(unicode::to_ascii_lower(c));
    }
}

void Tokenizer::handle_after_doctype_name_state() {
    if (at_end()) {
        parse_error("eof-in-doctype");
        m_current_doctype.force_quirks = true;
        emit_current_doctype();
        emit_eof();
        return;
    }

    auto c = *peek();
    if (is_whitespace(c)) {
        consume();
        return;
    }
    if (c == '>') {
        consume();
        m_state = TokenizerState::Data;
        emit_current_doctype();
        return;
    }

    if (consume_if_match("PUBLIC", true) || consume_if_match("SYSTEM", true)) {
        m_state = TokenizerState::BogusDOCTYPE;
        return;
    }

    parse_error("invalid-character-sequence-after-doctype-name");
    m_current_doctype.force_quirks = true;
    m_state = TokenizerState::BogusDOCTYPE;
}

void Tokenizer::handle_bogus_doctype_state() {
    if (at_end()) {
        emit_current_doctype();
        emit_eof();
        return;
    }

    if (consume() == '>') {
        m_state = TokenizerState::Data;
        emit_current_doctype();
    }
}

} // namespace scrape::html
