/**
 * HTML Tree Builder - core functionality
 */

#include "scrape/html/tree_builder.hpp"
#include "scrape/core/logger.hpp"
#include "constants.hpp"
#include <format>

namespace scrape::html {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("html");
    return instance;
}

constexpr std::array<std::string_view, 9> DEFAULT_SCOPE_BOUNDARIES = {
    "applet", "caption", "html", "table", "td", "th", "marquee", "object", "template"
};

} // namespace

TreeBuilder::TreeBuilder(dom::Document& document, TreeBuilderOptions options)
    : m_document(document)
    , m_options(options) {}

void TreeBuilder::prepare_for_fragment(std::string_view context_name) {
    m_fragment = true;
    m_fragment_context = String(context_name).to_lowercase();

    auto root = m_document.create_element("html");
    m_document.set_root(root);
    m_html_element = root;
    m_body_element = root;
    push(root, "html");
    m_insertion_mode = InsertionMode::InBody;
}

void TreeBuilder::process_token(const Token& token) {
    if (m_stopped) {
        return;
    }

    // A newline directly after <pre>, <listing> or <textarea> is dropped
    if (m_skip_next_newline) {
        m_skip_next_newline = false;
        if (auto* characters = std::get_if<CharacterToken>(&token);
            characters && characters->data.starts_with("\n")) {
            if (characters->data.size() == 1) {
                return;
            }
            process_using_rules_for(m_insertion_mode,
                CharacterToken{characters->data.substring(1), characters->offset + 1});
            return;
        }
    }

    process_using_rules_for(m_insertion_mode, token);
}

void TreeBuilder::process_using_rules_for(InsertionMode mode, const Token& token) {
    switch (mode) {
        case InsertionMode::Initial: process_initial(token); break;
        case InsertionMode::BeforeHtml: process_before_html(token); break;
        case InsertionMode::BeforeHead: process_before_head(token); break;
        case InsertionMode::InHead: process_in_head(token); break;
        case InsertionMode::AfterHead: process_after_head(token); break;
        case InsertionMode::InBody: process_in_body(token); break;
        case InsertionMode::Text: process_text(token); break;
        case InsertionMode::AfterBody: process_after_body(token); break;
    }
}

// ============================================================================
// Node insertion
// ============================================================================

bool TreeBuilder::check_depth(usize offset) {
    if (m_open_elements.size() + 1 <= m_options.max_depth) {
        return true;
    }
    logger().debug_fmt("nesting depth {} exceeded at offset {}", m_options.max_depth, offset);
    m_depth_exceeded_at = offset;
    stop();
    return false;
}

std::optional<dom::NodeId> TreeBuilder::insert_element(const TagToken& tag) {
    flush_text();
    if (!check_depth(tag.offset)) {
        return std::nullopt;
    }

    auto id = m_document.create_element(tag.name, tag.attributes);
    m_document.append_child(current_node().id, id);
    push(id, tag.name);
    return id;
}

std::optional<dom::NodeId> TreeBuilder::insert_element(String name, usize offset) {
    TagToken tag;
    tag.name = std::move(name);
    tag.offset = offset;
    return insert_element(tag);
}

void TreeBuilder::insert_void_element(const TagToken& tag) {
    flush_text();
    if (!check_depth(tag.offset)) {
        return;
    }

    auto id = m_document.create_element(tag.name, tag.attributes);
    m_document.append_child(current_node().id, id);
}

void TreeBuilder::insert_text(std::string_view text) {
    auto parent = current_node().id;
    if (m_pending_text_parent != parent) {
        flush_text();
        m_pending_text_parent = parent;
        m_pending_text_keep_whitespace = m_options.preserve_whitespace
            || detail::is_one_of(detail::WHITESPACE_SENSITIVE_ELEMENTS, current_node().name.view());
    }
    m_pending_text.append(text);
}

void TreeBuilder::flush_text() {
    if (m_pending_text.empty() || !m_pending_text_parent) {
        m_pending_text.clear();
        return;
    }

    if (m_pending_text_keep_whitespace || !m_pending_text.is_whitespace()) {
        auto id = m_document.create_text(std::move(m_pending_text));
        m_document.append_child(*m_pending_text_parent, id);
    }
    m_pending_text.clear();
    m_pending_text_parent.reset();
}

void TreeBuilder::insert_comment(const CommentToken& comment) {
    if (m_open_elements.empty()) {
        // Nowhere to attach a comment before the root exists
        return;
    }
    insert_comment_into(current_node().id, comment);
}

void TreeBuilder::insert_comment_into(dom::NodeId parent, const CommentToken& comment) {
    if (!m_options.include_comments) {
        return;
    }
    flush_text();
    auto id = m_document.create_comment(comment.data);
    m_document.append_child(parent, id);
}

void TreeBuilder::start_raw_text(const TagToken& tag, TokenizerState state) {
    if (!insert_element(tag)) {
        return;
    }
    if (m_tokenizer) {
        m_tokenizer->set_state(state);
        m_tokenizer->set_last_start_tag(tag.name);
    }
    m_original_insertion_mode = m_insertion_mode;
    m_insertion_mode = InsertionMode::Text;
}

// ============================================================================
// Stack of open elements
// ============================================================================

bool TreeBuilder::current_node_is(std::string_view name) const {
    return !m_open_elements.empty() && current_node().name == name;
}

bool TreeBuilder::current_node_is_one_of(std::initializer_list<std::string_view> names) const {
    if (m_open_elements.empty()) {
        return false;
    }
    for (auto name : names) {
        if (current_node().name == name) {
            return true;
        }
    }
    return false;
}

void TreeBuilder::push(dom::NodeId id, String name) {
    m_open_elements.push_back(OpenElement{id, std::move(name)});
}

// The root element is never popped
void TreeBuilder::pop() {
    if (m_open_elements.size() > 1) {
        m_open_elements.pop_back();
    }
}

void TreeBuilder::pop_until(std::string_view name) {
    while (m_open_elements.size() > 1) {
        bool found = current_node().name == name;
        m_open_elements.pop_back();
        if (found) {
            return;
        }
    }
}

void TreeBuilder::pop_until_one_of(std::initializer_list<std::string_view> names) {
    while (m_open_elements.size() > 1) {
        bool found = current_node_is_one_of(names);
        m_open_elements.pop_back();
        if (found) {
            return;
        }
    }
}

bool TreeBuilder::stack_contains(std::string_view name) const {
    for (const auto& entry : m_open_elements) {
        if (entry.name == name) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// Scope checking
// ============================================================================

namespace {

template<typename Stack>
bool has_in_scope(const Stack& stack, std::string_view name,
                  std::initializer_list<std::string_view> extra_boundaries,
                  bool default_boundaries = true) {
    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        std::string_view current = it->name.view();
        if (current == name) {
            return true;
        }
        if (default_boundaries && detail::is_one_of(DEFAULT_SCOPE_BOUNDARIES, current)) {
            return false;
        }
        for (auto boundary : extra_boundaries) {
            if (current == boundary) {
                return false;
            }
        }
    }
    return false;
}

} // namespace

bool TreeBuilder::has_element_in_scope(std::string_view name) const {
    return has_in_scope(m_open_elements, name, {});
}

bool TreeBuilder::has_element_in_button_scope(std::string_view name) const {
    return has_in_scope(m_open_elements, name, {"button"});
}

bool TreeBuilder::has_element_in_list_item_scope(std::string_view name) const {
    return has_in_scope(m_open_elements, name, {"ol", "ul"});
}

bool TreeBuilder::has_element_in_table_scope(std::string_view name) const {
    return has_in_scope(m_open_elements, name, {"html", "table", "template"}, false);
}

bool TreeBuilder::has_heading_in_scope() const {
    for (auto it = m_open_elements.rbegin(); it != m_open_elements.rend(); ++it) {
        if (detail::is_heading(it->name.view())) {
            return true;
        }
        if (detail::is_one_of(DEFAULT_SCOPE_BOUNDARIES, it->name.view())) {
            return false;
        }
    }
    return false;
}

bool TreeBuilder::in_foreign_content() const {
    return stack_contains("svg") || stack_contains("math");
}

void TreeBuilder::generate_implied_end_tags(std::string_view except) {
    while (!m_open_elements.empty()
           && current_node().name != except
           && detail::is_one_of(detail::IMPLIED_END_TAG_ELEMENTS, current_node().name.view())
           && m_open_elements.size() > 1) {
        pop();
    }
}

void TreeBuilder::close_p_element(usize offset) {
    generate_implied_end_tags("p");
    if (!current_node_is("p")) {
        parse_error(String(std::format("unexpected <{}> while closing <p>", current_node().name.view())), offset);
    }
    pop_until("p");
}

void TreeBuilder::report_unclosed_elements(usize offset) {
    for (const auto& entry : m_open_elements) {
        if (!detail::is_one_of(detail::OPTIONAL_END_TAG_ELEMENTS, entry.name.view())) {
            parse_error(String(std::format("unclosed element <{}>", entry.name.view())), offset);
        }
    }
}

void TreeBuilder::parse_error(const String& message, usize offset) {
    logger().trace_fmt("tree construction error: {} (offset {})", message.view(), offset);
    if (m_error_callback) {
        m_error_callback(message, offset);
    }
}

void TreeBuilder::stop() {
    m_stopped = true;
    if (m_tokenizer) {
        m_tokenizer->stop();
    }
}

} // namespace scrape::html
