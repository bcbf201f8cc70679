#pragma once

#include "tokenizer.hpp"
#include "scrape/dom/document.hpp"
#include <vector>

namespace scrape::html {

// ============================================================================
// Insertion Mode
// ============================================================================
//
// Tables, selects and templates are handled inside InBody; the element
// stack carries enough context for implicit tbody/tr insertion.

enum class InsertionMode {
    Initial,
    BeforeHtml,
    BeforeHead,
    InHead,
    AfterHead,
    InBody,
    Text,
    AfterBody,
};

struct TreeBuilderOptions {
    usize max_depth{512};
    bool preserve_whitespace{false};
    bool include_comments{false};
};

// ============================================================================
// TreeBuilder - builds the document arena from tokens
// ============================================================================

class TreeBuilder {
public:
    // Tree-construction error and the offset of the token that caused it
    using ErrorCallback = std::function<void(const String& message, usize offset)>;

    explicit TreeBuilder(dom::Document& document, TreeBuilderOptions options = {});

    void set_tokenizer(Tokenizer* tokenizer) { m_tokenizer = tokenizer; }
    void set_error_callback(ErrorCallback callback) { m_error_callback = std::move(callback); }

    // Fragment parsing: a synthetic html root receives the nodes directly.
    // Must be called before the first token.
    void prepare_for_fragment(std::string_view context_name);

    void process_token(const Token& token);

    [[nodiscard]] InsertionMode insertion_mode() const { return m_insertion_mode; }

    // Set once an element would nest deeper than max_depth; the builder
    // stops the tokenizer and ignores further tokens.
    [[nodiscard]] std::optional<usize> depth_exceeded_at() const { return m_depth_exceeded_at; }

private:
    struct OpenElement {
        dom::NodeId id;
        String name;
    };

    // Insertion mode handlers
    void process_initial(const Token& token);
    void process_before_html(const Token& token);
    void process_before_head(const Token& token);
    void process_in_head(const Token& token);
    void process_after_head(const Token& token);
    void process_in_body(const Token& token);
    void process_text(const Token& token);
    void process_after_body(const Token& token);

    void process_using_rules_for(InsertionMode mode, const Token& token);

    // InBody pieces
    void process_start_tag_in_body(const TagToken& tag);
    void process_end_tag_in_body(const TagToken& tag);
    void process_any_other_end_tag(const TagToken& tag);
    void process_end_of_body(usize offset);

    // Tables
    void process_table_start_tag(const TagToken& tag);
    void process_table_end_tag(const TagToken& tag);
    [[nodiscard]] bool in_table_context() const;
    [[nodiscard]] bool table_available() const;
    [[nodiscard]] bool current_node_is_fragment_root() const;
    void clear_stack_to_table_context();
    void clear_stack_to_table_body_context();
    void clear_stack_to_table_row_context();

    // Node insertion
    // nullopt once max_depth is exceeded
    std::optional<dom::NodeId> insert_element(const TagToken& tag);
    std::optional<dom::NodeId> insert_element(String name, usize offset);
    void insert_void_element(const TagToken& tag);
    [[nodiscard]] bool check_depth(usize offset);
    void insert_text(std::string_view text);
    void insert_comment(const CommentToken& comment);
    void insert_comment_into(dom::NodeId parent, const CommentToken& comment);
    void flush_text();
    void start_raw_text(const TagToken& tag, TokenizerState state);

    // Stack of open elements
    [[nodiscard]] const OpenElement& current_node() const { return m_open_elements.back(); }
    [[nodiscard]] bool current_node_is(std::string_view name) const;
    [[nodiscard]] bool current_node_is_one_of(std::initializer_list<std::string_view> names) const;
    void push(dom::NodeId id, String name);
    void pop();
    void pop_until(std::string_view name);
    void pop_until_one_of(std::initializer_list<std::string_view> names);
    [[nodiscard]] bool stack_contains(std::string_view name) const;

    // Scope checking
    [[nodiscard]] bool has_element_in_scope(std::string_view name) const;
    [[nodiscard]] bool has_element_in_button_scope(std::string_view name) const;
    [[nodiscard]] bool has_element_in_list_item_scope(std::string_view name) const;
    [[nodiscard]] bool has_element_in_table_scope(std::string_view name) const;
    [[nodiscard]] bool has_heading_in_scope() const;
    [[nodiscard]] bool in_foreign_content() const;

    void generate_implied_end_tags(std::string_view except = {});
    void close_p_element(usize offset);
    void report_unclosed_elements(usize offset);

    void parse_error(const String& message, usize offset);
    void stop();

    dom::Document& m_document;
    TreeBuilderOptions m_options;
    Tokenizer* m_tokenizer{nullptr};
    ErrorCallback m_error_callback;

    InsertionMode m_insertion_mode{InsertionMode::Initial};
    InsertionMode m_original_insertion_mode{InsertionMode::Initial};

    std::vector<OpenElement> m_open_elements;
    std::optional<dom::NodeId> m_html_element;
    std::optional<dom::NodeId> m_head_element;
    std::optional<dom::NodeId> m_body_element;

    // Pending text run and the node it belongs to
    String m_pending_text;
    std::optional<dom::NodeId> m_pending_text_parent;
    bool m_pending_text_keep_whitespace{false};

    bool m_skip_next_newline{false};
    bool m_fragment{false};
    String m_fragment_context;
    bool m_stopped{false};
    std::optional<usize> m_depth_exceeded_at;
};

} // namespace scrape::html
