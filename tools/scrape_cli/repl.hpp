#pragma once

#include "scrape/soup/soup.hpp"
#include <functional>
#include <iosfwd>
#include <string>

namespace scrape::cli {

// Fetches the HTML behind a URL
using UrlLoader = std::function<Result<std::string, String>(std::string_view url)>;

// ============================================================================
// Repl - interactive selector session
// ============================================================================
//
// Lines starting with ':' are commands (:load, :url, :explain, :count,
// :tree, :history, :help, :quit). Anything else is run as a selector
// against the loaded document.

class Repl {
public:
    static constexpr usize MAX_LISTED_MATCHES = 10;
    static constexpr usize MAX_TEXT_LENGTH = 60;
    static constexpr usize MAX_TREE_LINES = 200;

    Repl(std::istream& in, std::ostream& out);

    // Without a loader :url reports that fetching is unavailable
    void set_url_loader(UrlLoader loader) { m_url_loader = std::move(loader); }

    void load(std::string_view html);
    void load(Soup soup, usize bytes);

    [[nodiscard]] bool loaded() const { return m_soup.has_value(); }
    [[nodiscard]] const std::vector<String>& history() const { return m_history; }

    // Reads lines until :quit or end of input
    Result<void, String> run();

    // Runs one trimmed, non-empty line. Returns false on :quit.
    bool execute(std::string_view line);

private:
    bool handle_command(std::string_view line);

    void print_help();
    void print_history();
    void cmd_load(std::string_view path);
    void cmd_url(std::string_view url);
    void cmd_explain(std::string_view selector);
    void cmd_count(std::string_view selector);
    void cmd_tree();
    void run_selector(std::string_view selector);

    // Prints the no-document notice when nothing is loaded
    bool require_document();

    std::istream& m_in;
    std::ostream& m_out;
    std::optional<Soup> m_soup;
    std::vector<String> m_history;
    UrlLoader m_url_loader;
};

// Cuts text to at most max_length bytes with a trailing "...", never
// splitting a UTF-8 sequence
[[nodiscard]] String truncate_text(std::string_view text, usize max_length);

} // namespace scrape::cli
