/**
 * HTML Tree Builder - "in body" insertion mode
 */

#include "scrape/html/tree_builder.hpp"
#include "constants.hpp"
#include <format>

namespace scrape::html {

void TreeBuilder::process_in_body(const Token& token) {
    if (auto* characters = std::get_if<CharacterToken>(&token)) {
        insert_text(characters->data.view());
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
        if (tag->is_end_tag) {
            process_end_tag_in_body(*tag);
        } else {
            process_start_tag_in_body(*tag);
        }
        return;
    }

    // End of file
    flush_text();
    report_unclosed_elements(token_offset(token));
}

void TreeBuilder::process_start_tag_in_body(const TagToken& tag) {
    const auto name = tag.name.view();

    if (name == "html") {
        parse_error("unexpected <html>", tag.offset);
        return;
    }

    if (detail::is_one_of(detail::HEAD_CONTENT_ELEMENTS, name)) {
        process_in_head(Token{tag});
        return;
    }

    if (name == "body" || name == "head" || name == "frameset" || name == "frame") {
        parse_error(String(std::format("unexpected <{}>", name)), tag.offset);
        return;
    }

    if (name == "table" || detail::is_one_of(detail::TABLE_ELEMENTS, name)) {
        process_table_start_tag(tag);
        return;
    }

    if (detail::is_one_of(detail::CLOSES_P_ELEMENTS, name)) {
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        insert_element(tag);
        return;
    }

    if (detail::is_heading(name)) {
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        if (!m_open_elements.empty() && detail::is_heading(current_node().name.view())) {
            parse_error(String(std::format("<{}> inside <{}>", name, current_node().name.view())), tag.offset);
            pop();
        }
        insert_element(tag);
        return;
    }

    if (name == "pre" || name == "listing") {
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        if (insert_element(tag)) {
            m_skip_next_newline = true;
        }
        return;
    }

    if (name == "li" || name == "dd" || name == "dt") {
        // An open item of the same family closes, unless a special element
        // other than address, div or p is in the way
        for (auto it = m_open_elements.rbegin(); it != m_open_elements.rend(); ++it) {
            auto open = it->name.view();
            bool same_family = name == "li" ? open == "li" : (open == "dd" || open == "dt");
            if (same_family) {
                String closing(open);
                generate_implied_end_tags(closing.view());
                if (!current_node_is(closing.view())) {
                    parse_error(String(std::format("unclosed elements inside <{}>", closing.view())), tag.offset);
                }
                pop_until(closing.view());
                break;
            }
            if (detail::is_special_element(open) && open != "address" && open != "div" && open != "p") {
                break;
            }
        }
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        insert_element(tag);
        return;
    }

    if (name == "plaintext") {
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        if (insert_element(tag) && m_tokenizer) {
            m_tokenizer->set_state(TokenizerState::PLAINTEXT);
        }
        return;
    }

    if (name == "button") {
        if (has_element_in_scope("button")) {
            parse_error("nested <button>", tag.offset);
            generate_implied_end_tags();
            pop_until("button");
        }
        insert_element(tag);
        return;
    }

    if (name == "a" || name == "nobr") {
        if (has_element_in_scope(name)) {
            parse_error(String(std::format("nested <{}>", name)), tag.offset);
            generate_implied_end_tags();
            pop_until(name);
        }
        insert_element(tag);
        return;
    }

    if (name == "option") {
        if (current_node_is("option")) {
            pop();
        }
        insert_element(tag);
        return;
    }

    if (name == "optgroup") {
        if (current_node_is("option")) {
            pop();
        }
        if (current_node_is("optgroup")) {
            pop();
        }
        insert_element(tag);
        return;
    }

    if (name == "select") {
        if (stack_contains("select")) {
            parse_error("nested <select>", tag.offset);
            pop_until("select");
            return;
        }
        insert_element(tag);
        return;
    }

    if (name == "textarea") {
        start_raw_text(tag, TokenizerState::RCDATA);
        m_skip_next_newline = true;
        return;
    }

    if (name == "xmp") {
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        start_raw_text(tag, TokenizerState::RAWTEXT);
        return;
    }

    if (name == "iframe" || name == "noembed") {
        start_raw_text(tag, TokenizerState::RAWTEXT);
        return;
    }

    if (name == "image") {
        parse_error("<image> treated as <img>", tag.offset);
        TagToken img = tag;
        img.name = "img";
        insert_void_element(img);
        return;
    }

    if (detail::is_void_element(name)) {
        if (name == "hr" && has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        insert_void_element(tag);
        return;
    }

    // Self-closing syntax only means something in svg and math
    if (tag.self_closing) {
        if (name == "svg" || name == "math" || in_foreign_content()) {
            if (insert_element(tag)) {
                pop();
            }
            return;
        }
        parse_error(String(std::format("self-closing syntax on non-void element <{}>", name)), tag.offset);
    }

    insert_element(tag);
}

void TreeBuilder::process_end_tag_in_body(const TagToken& tag) {
    const auto name = tag.name.view();

    if (name == "body" || name == "html") {
        if (!has_element_in_scope("body")) {
            parse_error(String(std::format("unexpected end tag </{}>", name)), tag.offset);
            return;
        }
        process_end_of_body(tag.offset);
        return;
    }

    if (name == "table" || detail::is_one_of(detail::TABLE_ELEMENTS, name)) {
        process_table_end_tag(tag);
        return;
    }

    if (detail::is_one_of(detail::BLOCK_END_TAG_ELEMENTS, name)) {
        bool in_scope = name == "select" ? stack_contains(name) : has_element_in_scope(name);
        if (!in_scope) {
            parse_error(String(std::format("unexpected end tag </{}>", name)), tag.offset);
            return;
        }
        generate_implied_end_tags();
        if (!current_node_is(name)) {
            parse_error(String(std::format("end tag </{}> closes open <{}>", name, current_node().name.view())),
                        tag.offset);
        }
        pop_until(name);
        return;
    }

    if (name == "p") {
        if (!has_element_in_button_scope("p")) {
            parse_error("end tag </p> without open <p>", tag.offset);
            if (!insert_element("p", tag.offset)) {
                return;
            }
        }
        close_p_element(tag.offset);
        return;
    }

    if (name == "li") {
        if (!has_element_in_list_item_scope("li")) {
            parse_error("unexpected end tag </li>", tag.offset);
            return;
        }
        generate_implied_end_tags("li");
        pop_until("li");
        return;
    }

    if (name == "dd" || name == "dt") {
        if (!has_element_in_scope(name)) {
            parse_error(String(std::format("unexpected end tag </{}>", name)), tag.offset);
            return;
        }
        generate_implied_end_tags(name);
        pop_until(name);
        return;
    }

    if (detail::is_heading(name)) {
        if (!has_heading_in_scope()) {
            parse_error(String(std::format("unexpected end tag </{}>", name)), tag.offset);
            return;
        }
        generate_implied_end_tags();
        if (!current_node_is(name)) {
            parse_error(String(std::format("end tag </{}> closes open <{}>", name, current_node().name.view())),
                        tag.offset);
        }
        pop_until_one_of({"h1", "h2", "h3", "h4", "h5", "h6"});
        return;
    }

    if (name == "br") {
        parse_error("end tag </br> treated as <br>", tag.offset);
        TagToken br;
        br.name = "br";
        br.offset = tag.offset;
        insert_void_element(br);
        return;
    }

    if (name == "template") {
        if (!stack_contains("template")) {
            parse_error("unexpected end tag </template>", tag.offset);
            return;
        }
        generate_implied_end_tags();
        pop_until("template");
        if (current_node_is("head")) {
            m_insertion_mode = InsertionMode::InHead;
        }
        return;
    }

    process_any_other_end_tag(tag);
}

void TreeBuilder::process_any_other_end_tag(const TagToken& tag) {
    const auto name = tag.name.view();

    for (usize index = m_open_elements.size(); index-- > 0;) {
        auto open = m_open_elements[index].name.view();
        if (open == name) {
            generate_implied_end_tags(name);
            if (!current_node_is(name)) {
                parse_error(String(std::format("end tag </{}> closes open <{}>", name, current_node().name.view())),
                            tag.offset);
            }
            if (index > 0) {
                m_open_elements.erase(m_open_elements.begin() + static_cast<isize>(index), m_open_elements.end());
            }
            return;
        }
        if (detail::is_special_element(open)) {
            parse_error(String(std::format("unexpected end tag </{}>", name)), tag.offset);
            return;
        }
    }
}

void TreeBuilder::process_end_of_body(usize offset) {
    report_unclosed_elements(offset);
    m_insertion_mode = InsertionMode::AfterBody;
}

} // namespace scrape::html
