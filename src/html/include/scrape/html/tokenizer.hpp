#pragma once

#include "scrape/core/types.hpp"
#include "scrape/core/string.hpp"
#include "scrape/dom/node.hpp"
#include <functional>
#include <optional>
#include <deque>
#include <variant>

namespace scrape::html {

// ============================================================================
// HTML Token Types
// ============================================================================
//
// Every token carries the byte offset in the input where it starts.

struct DoctypeToken {
    String name;
    bool force_quirks{false};
    usize offset{0};
};

struct TagToken {
    String name;
    dom::Attributes attributes;
    bool self_closing{false};
    bool is_end_tag{false};
    usize offset{0};

    [[nodiscard]] const String* attribute(std::string_view name) const;
};

struct CommentToken {
    String data;
    usize offset{0};
};

// A run of text
struct CharacterToken {
    String data;
    usize offset{0};
};

struct EndOfFileToken {
    usize offset{0};
};

using Token = std::variant<
    DoctypeToken,
    TagToken,
    CommentToken,
    CharacterToken,
    EndOfFileToken
>;

// Token type checking helpers
[[nodiscard]] bool is_doctype(const Token& token);
[[nodiscard]] bool is_start_tag(const Token& token);
[[nodiscard]] bool is_end_tag(const Token& token);
[[nodiscard]] bool is_character(const Token& token);
[[nodiscard]] bool is_comment(const Token& token);
[[nodiscard]] bool is_eof(const Token& token);

[[nodiscard]] bool is_start_tag_named(const Token& token, std::string_view name);
[[nodiscard]] bool is_end_tag_named(const Token& token, std::string_view name);

[[nodiscard]] usize token_offset(const Token& token);

// ============================================================================
// Tokenizer States
// ============================================================================

enum class TokenizerState {
    Data,
    RCDATA,
    RAWTEXT,
    ScriptData,
    PLAINTEXT,
    TagOpen,
    EndTagOpen,
    TagName,
    RCDATALessThanSign,
    RCDATAEndTagOpen,
    RCDATAEndTagName,
    RAWTEXTLessThanSign,
    RAWTEXTEndTagOpen,
    RAWTEXTEndTagName,
    ScriptDataLessThanSign,
    ScriptDataEndTagOpen,
    ScriptDataEndTagName,
    BeforeAttributeName,
    AttributeName,
    AfterAttributeName,
    BeforeAttributeValue,
    AttributeValueDoubleQuoted,
    AttributeValueSingleQuoted,
    AttributeValueUnquoted,
    AfterAttributeValueQuoted,
    SelfClosingStartTag,
    BogusComment,
    MarkupDeclarationOpen,
    CommentStart,
    CommentStartDash,
    Comment,
    CommentEndDash,
    CommentEnd,
    CommentEndBang,
    DOCTYPE,
    BeforeDOCTYPEName,
    DOCTYPEName,
    AfterDOCTYPEName,
    BogusDOCTYPE,
};

// ============================================================================
// Tokenizer - HTML state machine over UTF-8 bytes
// ============================================================================

class Tokenizer {
public:
    using TokenCallback = std::function<void(Token)>;
    // Error name (e.g. "eof-in-tag") and byte offset
    using ErrorCallback = std::function<void(std::string_view error, usize offset)>;

    Tokenizer();

    // The input is not copied and must outlive the tokenizer run
    void set_input(std::string_view input);

    void set_token_callback(TokenCallback callback) { m_token_callback = std::move(callback); }
    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    // Runs until end of input or stop()
    void run();

    // Pull interface when no token callback is set
    [[nodiscard]] std::optional<Token> next_token();

    // Makes run() return after the current token
    void stop() { m_stopped = true; }
    [[nodiscard]] bool finished() const { return m_eof_emitted || m_stopped; }

    // State manipulation (for tree builder integration)
    void set_state(TokenizerState state) { m_state = state; }
    [[nodiscard]] TokenizerState state() const { return m_state; }

    // Set last start tag (for end tag matching in raw text states)
    void set_last_start_tag(const String& name) { m_last_start_tag_name = name; }

    [[nodiscard]] usize position() const { return m_position; }

private:
    // Character consumption
    [[nodiscard]] std::optional<char> peek(usize offset = 0) const;
    char consume();
    void reconsume();
    [[nodiscard]] bool at_end() const { return m_position >= m_input.size(); }
    bool consume_if_match(std::string_view str, bool case_insensitive = false);

    // Token emission
    void emit(Token token);
    void emit_character(char c);
    void emit_characters(std::string_view text, usize offset);
    void flush_characters();
    void emit_current_tag();
    void emit_current_comment();
    void emit_current_doctype();
    void emit_eof();

    // Error reporting
    void parse_error(std::string_view error);

    // State machine
    void process_state();

    // Data states
    void handle_data_state();
    void handle_rcdata_state();
    void handle_rawtext_state();
    void handle_script_data_state();
    void handle_plaintext_state();

    // Raw text end tags
    void handle_raw_less_than_sign_state(TokenizerState text_state, TokenizerState end_tag_open_state);
    void handle_raw_end_tag_open_state(TokenizerState text_state, TokenizerState end_tag_name_state);
    void handle_raw_end_tag_name_state(TokenizerState text_state);

    // Tags
    void handle_tag_open_state();
    void handle_end_tag_open_state();
    void handle_tag_name_state();
    void handle_before_attribute_name_state();
    void handle_attribute_name_state();
    void handle_after_attribute_name_state();
    void handle_before_attribute_value_state();
    void handle_attribute_value_quoted_state(char quote);
    void handle_attribute_value_unquoted_state();
    void handle_after_attribute_value_quoted_state();
    void handle_self_closing_start_tag_state();

    // Comments and DOCTYPE
    void handle_bogus_comment_state();
    void handle_markup_declaration_open_state();
    void handle_comment_start_state();
    void handle_comment_start_dash_state();
    void handle_comment_state();
    void handle_comment_end_dash_state();
    void handle_comment_end_state();
    void handle_comment_end_bang_state();
    void handle_doctype_state();
    void handle_before_doctype_name_state();
    void handle_doctype_name_state();
    void handle_after_doctype_name_state();
    void handle_bogus_doctype_state();

    // Character references. Called after '&' was consumed; appends the
    // decoded text (or the literal '&') to `out`.
    void consume_character_reference(String& out, bool in_attribute);
    bool consume_numeric_character_reference(String& out);
    bool consume_named_character_reference(String& out, bool in_attribute);

    // Helper methods
    [[nodiscard]] bool is_appropriate_end_tag_token() const;
    void start_new_attribute();
    void finish_attribute();

    // Input
    std::string_view m_input;
    usize m_position{0};

    // Current state
    TokenizerState m_state{TokenizerState::Data};

    // Tokens being built
    TagToken m_current_tag;
    CommentToken m_current_comment;
    DoctypeToken m_current_doctype;
    usize m_token_start{0};

    // Buffers
    String m_pending_text;
    usize m_pending_text_offset{0};
    String m_temp_buffer;
    String m_current_attribute_name;
    String m_current_attribute_value;
    bool m_has_current_attribute{false};
    String m_last_start_tag_name;

    // Callbacks
    TokenCallback m_token_callback;
    ErrorCallback m_error_callback;

    // Token queue for next_token() interface
    std::deque<Token> m_token_queue;

    bool m_eof_emitted{false};
    bool m_stopped{false};
};

} // namespace scrape::html
