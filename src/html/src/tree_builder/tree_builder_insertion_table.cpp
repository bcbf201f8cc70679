/**
 * HTML Tree Builder - tables
 *
 * Table content is built in place: misplaced content stays where it
 * appears instead of being moved in front of the table.
 */

#include "scrape/html/tree_builder.hpp"
#include "constants.hpp"
#include <format>

namespace scrape::html {

namespace {

constexpr std::array<std::string_view, 5> TABLE_FRAGMENT_CONTEXTS = {
    "table", "tbody", "thead", "tfoot", "tr"
};

} // namespace

bool TreeBuilder::current_node_is_fragment_root() const {
    return m_fragment && m_open_elements.size() == 1;
}

// Directly inside table structure, outside any cell
bool TreeBuilder::in_table_context() const {
    if (current_node_is_fragment_root()) {
        return detail::is_one_of(TABLE_FRAGMENT_CONTEXTS, m_fragment_context.view());
    }
    return current_node_is_one_of({"table", "tbody", "thead", "tfoot", "tr"});
}

bool TreeBuilder::table_available() const {
    if (m_fragment && detail::is_one_of(TABLE_FRAGMENT_CONTEXTS, m_fragment_context.view())) {
        return true;
    }
    return has_element_in_table_scope("table");
}

void TreeBuilder::clear_stack_to_table_context() {
    while (m_open_elements.size() > 1 && !current_node_is_one_of({"table", "template", "html"})) {
        pop();
    }
}

void TreeBuilder::clear_stack_to_table_body_context() {
    while (m_open_elements.size() > 1
           && !current_node_is_one_of({"tbody", "thead", "tfoot", "table", "template", "html"})) {
        pop();
    }
}

void TreeBuilder::clear_stack_to_table_row_context() {
    while (m_open_elements.size() > 1
           && !current_node_is_one_of({"tr", "tbody", "thead", "tfoot", "table", "template", "html"})) {
        pop();
    }
}

void TreeBuilder::process_table_start_tag(const TagToken& tag) {
    const auto name = tag.name.view();

    if (name == "table") {
        if (in_table_context() && has_element_in_table_scope("table")) {
            parse_error("<table> directly inside a table", tag.offset);
            pop_until("table");
        }
        if (has_element_in_button_scope("p")) {
            close_p_element(tag.offset);
        }
        insert_element(tag);
        return;
    }

    if (!table_available()) {
        parse_error(String(std::format("<{}> outside of a table", name)), tag.offset);
        return;
    }

    if (name == "caption" || name == "colgroup" || name == "tbody" || name == "thead" || name == "tfoot") {
        clear_stack_to_table_context();
        insert_element(tag);
        return;
    }

    if (name == "col") {
        if (!current_node_is("colgroup")) {
            clear_stack_to_table_context();
            if (!current_node_is_fragment_root() && !insert_element("colgroup", tag.offset)) {
                return;
            }
        }
        insert_void_element(tag);
        return;
    }

    if (name == "tr") {
        clear_stack_to_table_body_context();
        if (current_node_is("table") && !insert_element("tbody", tag.offset)) {
            return;
        }
        insert_element(tag);
        return;
    }

    // td, th
    clear_stack_to_table_row_context();
    if (current_node_is("table") && !insert_element("tbody", tag.offset)) {
        return;
    }
    if (current_node_is_one_of({"tbody", "thead", "tfoot"}) && !insert_element("tr", tag.offset)) {
        return;
    }
    insert_element(tag);
}

void TreeBuilder::process_table_end_tag(const TagToken& tag) {
    const auto name = tag.name.view();

    if (name == "colgroup") {
        if (current_node_is("colgroup")) {
            pop();
        } else {
            parse_error("unexpected end tag </colgroup>", tag.offset);
        }
        return;
    }

    if (name == "col") {
        parse_error("unexpected end tag </col>", tag.offset);
        return;
    }

    if (!has_element_in_table_scope(name)) {
        parse_error(String(std::format("unexpected end tag </{}>", name)), tag.offset);
        return;
    }

    generate_implied_end_tags();
    if (!current_node_is(name) && (name == "td" || name == "th" || name == "caption")) {
        parse_error(String(std::format("end tag </{}> closes open <{}>", name, current_node().name.view())),
                    tag.offset);
    }
    pop_until(name);
}

} // namespace scrape::html
