/**
 * Interactive mode for the scrape tool
 */

#include "repl.hpp"
#include "scrape/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <format>
#include <istream>
#include <ostream>

namespace scrape::cli {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("cli");
    return instance;
}

// `name#id.class1.class2`
String describe_tag(const Tag& tag) {
    String label = tag.name();
    if (const auto* id = tag.get("id"); id && !id->empty()) {
        label += '#';
        label += *id;
    }
    for (const auto& cls : tag.classes()) {
        label += '.';
        label += cls;
    }
    return label;
}

} // namespace

String truncate_text(std::string_view text, usize max_length) {
    if (text.size() <= max_length) {
        return String(text);
    }
    usize cut = max_length >= 3 ? max_length - 3 : 0;
    while (cut > 0 && (static_cast<u8>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    String result(text.substr(0, cut));
    result += "...";
    return result;
}

Repl::Repl(std::istream& in, std::ostream& out)
    : m_in(in), m_out(out) {}

void Repl::load(std::string_view html) {
    load(Soup::parse(html), html.size());
}

void Repl::load(Soup soup, usize bytes) {
    m_soup = std::move(soup);
    m_out << "Loaded " << bytes << " bytes of HTML\n";
    logger().debug_fmt("repl loaded a document of {} nodes", m_soup->length());
}

Result<void, String> Repl::run() {
    m_out << "scrape interactive mode\n"
          << "Commands: :load <file>, :url <url>, :explain <selector>, :history, :help, :quit\n\n";

    std::string line;
    while (true) {
        m_out << "> " << std::flush;
        if (!std::getline(m_in, line)) {
            break;
        }
        String trimmed = String(line).trim();
        if (trimmed.empty()) {
            continue;
        }
        if (!execute(trimmed.view())) {
            break;
        }
    }

    if (m_in.bad()) {
        return make_error(String("cannot read standard input"));
    }
    return {};
}

bool Repl::execute(std::string_view line) {
    m_history.emplace_back(line);
    if (line.starts_with(':')) {
        return handle_command(line);
    }
    run_selector(line);
    return true;
}

bool Repl::handle_command(std::string_view line) {
    std::string_view command = line;
    String argument;
    if (auto space = line.find(' '); space != std::string_view::npos) {
        command = line.substr(0, space);
        argument = String(line.substr(space + 1)).trim();
    }

    if (command == ":quit" || command == ":q") {
        return false;
    }
    if (command == ":help" || command == ":h") {
        print_help();
    } else if (command == ":history") {
        print_history();
    } else if (command == ":load") {
        cmd_load(argument.view());
    } else if (command == ":url") {
        cmd_url(argument.view());
    } else if (command == ":explain") {
        cmd_explain(argument.view());
    } else if (command == ":count") {
        cmd_count(argument.view());
    } else if (command == ":tree") {
        cmd_tree();
    } else {
        m_out << "Unknown command: " << command << ". Type :help for available commands.\n";
    }
    return true;
}

void Repl::print_help() {
    m_out << "Commands:\n"
          << "  :load <file>      Load HTML from file\n"
          << "  :url <url>        Fetch and load HTML from URL\n"
          << "  :explain <sel>    Explain a CSS selector\n"
          << "  :count <sel>      Count matches for selector\n"
          << "  :tree             Show the element tree\n"
          << "  :history          Show command history\n"
          << "  :help, :h         Show this help\n"
          << "  :quit, :q         Exit\n"
          << "\n"
          << "Or enter a CSS selector directly to find matching elements.\n";
}

void Repl::print_history() {
    for (usize i = 0; i < m_history.size(); ++i) {
        m_out << std::format("{:4}: {}\n", i + 1, m_history[i].view());
    }
}

void Repl::cmd_load(std::string_view path) {
    if (path.empty()) {
        m_out << "Usage: :load <file>\n";
        return;
    }
    std::error_code ec;
    auto bytes = std::filesystem::file_size(std::filesystem::path(path), ec);
    auto soup = Soup::from_file(std::filesystem::path(path));
    if (soup.is_err()) {
        m_out << "Error loading file: " << soup.error().to_string() << "\n";
        return;
    }
    load(std::move(soup).value(), ec ? 0 : static_cast<usize>(bytes));
}

void Repl::cmd_url(std::string_view url) {
    if (url.empty()) {
        m_out << "Usage: :url <url>\n";
        return;
    }
    if (!m_url_loader) {
        m_out << "URL support is not available in this build\n";
        return;
    }
    auto html = m_url_loader(url);
    if (html.is_err()) {
        m_out << "Error fetching URL: " << html.error() << "\n";
        return;
    }
    load(html.value());
}

void Repl::cmd_explain(std::string_view selector) {
    if (selector.empty()) {
        m_out << "Usage: :explain <selector>\n";
        return;
    }
    auto explanation = css::explain(selector);
    if (explanation.is_err()) {
        m_out << "Error: " << explanation.error().to_string() << "\n";
        return;
    }
    m_out << explanation.value().format() << "\n";
}

void Repl::cmd_count(std::string_view selector) {
    if (!require_document()) {
        return;
    }
    if (selector.empty()) {
        m_out << "Usage: :count <selector>\n";
        return;
    }
    auto tags = m_soup->find_all(selector);
    if (tags.is_err()) {
        m_out << "Error: " << tags.error().to_string() << "\n";
        return;
    }
    m_out << tags.value().size() << " matches\n";
}

void Repl::cmd_tree() {
    if (!require_document()) {
        return;
    }
    auto root = m_soup->root();
    if (!root) {
        m_out << "(empty document)\n";
        return;
    }

    // Depth-first, iterative so deep documents cannot exhaust the stack
    std::vector<std::pair<Tag, usize>> pending{{*root, 0}};
    usize printed = 0;
    usize skipped = 0;
    while (!pending.empty()) {
        auto [tag, depth] = std::move(pending.back());
        pending.pop_back();

        if (printed == MAX_TREE_LINES) {
            ++skipped;
        } else {
            m_out << std::string(depth * 2, ' ') << describe_tag(tag) << "\n";
            ++printed;
        }

        auto children = tag.children().to_vector();
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            pending.emplace_back(*it, depth + 1);
        }
    }
    if (skipped > 0) {
        m_out << "... and " << skipped << " more elements\n";
    }
}

void Repl::run_selector(std::string_view selector) {
    if (!require_document()) {
        return;
    }
    auto tags = m_soup->find_all(selector);
    if (tags.is_err()) {
        m_out << "Error: " << tags.error().to_string() << "\n";
        return;
    }

    const auto& found = tags.value();
    if (found.empty()) {
        m_out << "No matches found.\n";
        return;
    }
    usize listed = std::min(found.size(), MAX_LISTED_MATCHES);
    for (usize i = 0; i < listed; ++i) {
        m_out << std::format("[{}] <{}> {}\n", i + 1, found[i].name().view(),
                             truncate_text(found[i].text().view(), MAX_TEXT_LENGTH).view());
    }
    if (found.size() > MAX_LISTED_MATCHES) {
        m_out << "... and " << found.size() - MAX_LISTED_MATCHES << " more\n";
    }
}

bool Repl::require_document() {
    if (!m_soup) {
        m_out << "No HTML loaded. Use :load or :url first.\n";
        return false;
    }
    return true;
}

} // namespace scrape::cli
