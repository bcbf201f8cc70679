/**
 * HTML Tokenizer - core driver and shared helpers
 */

#include "scrape/html/tokenizer.hpp"
#include "scrape/core/logger.hpp"

namespace scrape::html {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("html");
    return instance;
}

} // namespace

Tokenizer::Tokenizer() = default;

void Tokenizer::set_input(std::string_view input) {
    m_input = input;
    m_position = 0;
    m_state = TokenizerState::Data;
    m_pending_text.clear();
    m_token_queue.clear();
    m_eof_emitted = false;
    m_stopped = false;
}

void Tokenizer::run() {
    while (!m_eof_emitted && !m_stopped) {
        process_state();
    }
}

std::optional<Token> Tokenizer::next_token() {
    while (m_token_queue.empty() && !m_eof_emitted && !m_stopped) {
        process_state();
    }

    if (m_token_queue.empty()) {
        return std::nullopt;
    }
    Token token = std::move(m_token_queue.front());
    m_token_queue.pop_front();
    return token;
}

std::optional<char> Tokenizer::peek(usize offset) const {
    if (m_position + offset >= m_input.size()) {
        return std::nullopt;
    }
    return m_input[m_position + offset];
}

char Tokenizer::consume() {
    if (at_end()) {
        return '\0';
    }
    return m_input[m_position++];
}

void Tokenizer::reconsume() {
    if (m_position > 0) {
        --m_position;
    }
}

bool Tokenizer::consume_if_match(std::string_view str, bool case_insensitive) {
    if (m_position + str.size() > m_input.size()) {
        return false;
    }

    auto candidate = m_input.substr(m_position, str.size());
    for (usize i = 0; i < str.size(); ++i) {
        char a = candidate[i];
        char b = str[i];
        if (case_insensitive) {
            a = unicode::to_ascii_lower(a);
            b = unicode::to_ascii_lower(b);
        }
        if (a != b) {
            return false;
        }
    }

    m_position += str.size();
    return true;
}

void Tokenizer::parse_error(std::string_view error) {
    logger().trace_fmt("parse error '{}' at offset {}", error, m_position);
    if (m_error_callback) {
        m_error_callback(error, m_position);
    }
}

bool Tokenizer::is_appropriate_end_tag_token() const {
    return !m_last_start_tag_name.empty() && m_current_tag.name == m_last_start_tag_name;
}

void Tokenizer::start_new_attribute() {
    finish_attribute();
    m_current_attribute_name.clear();
    m_current_attribute_value.clear();
    m_has_current_attribute = true;
}

void Tokenizer::finish_attribute() {
    if (!m_has_current_attribute) {
        return;
    }
    m_has_current_attribute = false;

    for (const auto& existing : m_current_tag.attributes) {
        if (existing.name == m_current_attribute_name) {
            parse_error("duplicate-attribute");
            return;
        }
    }
    m_current_tag.attributes.push_back(dom::Attribute{
        std::move(m_current_attribute_name),
        std::move(m_current_attribute_value),
    });
    m_current_attribute_name.clear();
    m_current_attribute_value.clear();
}

void Tokenizer::process_state() {
    switch (m_state) {
        case TokenizerState::Data: handle_data_state(); break;
        case TokenizerState::RCDATA: handle_rcdata_state(); break;
        case TokenizerState::RAWTEXT: handle_rawtext_state(); break;
        case TokenizerState::ScriptData: handle_script_data_state(); break;
        case TokenizerState::PLAINTEXT: handle_plaintext_state(); break;
        case TokenizerState::TagOpen: handle_tag_open_state(); break;
        case TokenizerState::EndTagOpen: handle_end_tag_open_state(); break;
        case TokenizerState::TagName: handle_tag_name_state(); break;

        case TokenizerState::RCDATALessThanSign:
            handle_raw_less_than_sign_state(TokenizerState::RCDATA, TokenizerState::RCDATAEndTagOpen);
            break;
        case TokenizerState::RCDATAEndTagOpen:
            handle_raw_end_tag_open_state(TokenizerState::RCDATA, TokenizerState::RCDATAEndTagName);
            break;
        case TokenizerState::RCDATAEndTagName:
            handle_raw_end_tag_name_state(TokenizerState::RCDATA);
            break;
        case TokenizerState::RAWTEXTLessThanSign:
            handle_raw_less_than_sign_state(TokenizerState::RAWTEXT, TokenizerState::RAWTEXTEndTagOpen);
            break;
        case TokenizerState::RAWTEXTEndTagOpen:
            handle_raw_end_tag_open_state(TokenizerState::RAWTEXT, TokenizerState::RAWTEXTEndTagName);
            break;
        case TokenizerState::RAWTEXTEndTagName:
            handle_raw_end_tag_name_state(TokenizerState::RAWTEXT);
            break;
        case TokenizerState::ScriptDataLessThanSign:
            handle_raw_less_than_sign_state(TokenizerState::ScriptData, TokenizerState::ScriptDataEndTagOpen);
            break;
        case TokenizerState::ScriptDataEndTagOpen:
            handle_raw_end_tag_open_state(TokenizerState::ScriptData, TokenizerState::ScriptDataEndTagName);
            break;
        case TokenizerState::ScriptDataEndTagName:
            handle_raw_end_tag_name_state(TokenizerState::ScriptData);
            break;

        case TokenizerState::BeforeAttributeName: handle_before_attribute_name_state(); break;
        case TokenizerState::AttributeName: handle_attribute_name_state(); break;
        case TokenizerState::AfterAttributeName: handle_after_attribute_name_state(); break;
        case TokenizerState::BeforeAttributeValue: handle_before_attribute_value_state(); break;
        case TokenizerState::AttributeValueDoubleQuoted: handle_attribute_value_quoted_state('"'); break;
        case TokenizerState::AttributeValueSingleQuoted: handle_attribute_value_quoted_state('\''); break;
        case TokenizerState::AttributeValueUnquoted: handle_attribute_value_unquoted_state(); break;
        case TokenizerState::AfterAttributeValueQuoted: handle_after_attribute_value_quoted_state(); break;
        case TokenizerState::SelfClosingStartTag: handle_self_closing_start_tag_state(); break;

        case TokenizerState::BogusComment: handle_bogus_comment_state(); break;
        case TokenizerState::MarkupDeclarationOpen: handle_markup_declaration_open_state(); break;
        case TokenizerState::CommentStart: handle_comment_start_state(); break;
        case TokenizerState::CommentStartDash: handle_comment_start_dash_state(); break;
        case TokenizerState::Comment: handle_comment_state(); break;
        case TokenizerState::CommentEndDash: handle_comment_end_dash_state(); break;
        case TokenizerState::CommentEnd: handle_comment_end_state(); break;
        case TokenizerState::CommentEndBang: handle_comment_end_bang_state(); break;
        case TokenizerState::DOCTYPE: handle_doctype_state(); break;
        case TokenizerState::BeforeDOCTYPEName: handle_before_doctype_name_state(); break;
        case TokenizerState::DOCTYPEName: handle_doctype_name_state(); break;
        case TokenizerState::AfterDOCTYPEName: handle_after_doctype_name_state(); break;
        case TokenizerState::BogusDOCTYPE: handle_bogus_doctype_state(); break;
    }
}

} // namespace scrape::html
