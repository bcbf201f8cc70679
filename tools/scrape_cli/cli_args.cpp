/**
 * Command line parsing for the scrape tool
 */

#include "cli_args.hpp"
#include <charconv>
#include <format>

namespace scrape::cli {

namespace {

enum class OptionId : u8 {
    Select,
    Output,
    Attribute,
    First,
    Pretty,
    Null,
    Quiet,
    Parallel,
    WithFilename,
    NoFilename,
    Url,
    Timeout,
    Explain,
    Interactive,
    Color,
    Verbose,
    Help,
};

struct OptionSpec {
    char short_name;  // '\0' for long-only options
    std::string_view long_name;
    OptionId id;
    bool takes_value;
};

constexpr OptionSpec OPTIONS[] = {
    {'s', "select", OptionId::Select, true},
    {'o', "output", OptionId::Output, true},
    {'a', "attribute", OptionId::Attribute, true},
    {'1', "first", OptionId::First, false},
    {'p', "pretty", OptionId::Pretty, false},
    {'0', "null", OptionId::Null, false},
    {'q', "quiet", OptionId::Quiet, false},
    {'j', "parallel", OptionId::Parallel, true},
    {'H', "with-filename", OptionId::WithFilename, false},
    {'\0', "no-filename", OptionId::NoFilename, false},
    {'u', "url", OptionId::Url, true},
    {'\0', "timeout", OptionId::Timeout, true},
    {'\0', "explain", OptionId::Explain, false},
    {'i', "interactive", OptionId::Interactive, false},
    {'c', "color", OptionId::Color, true},
    {'v', "verbose", OptionId::Verbose, false},
    {'h', "help", OptionId::Help, false},
};

const OptionSpec* find_short(char name) {
    for (const auto& option : OPTIONS) {
        if (option.short_name != '\0' && option.short_name == name) {
            return &option;
        }
    }
    return nullptr;
}

const OptionSpec* find_long(std::string_view name) {
    for (const auto& option : OPTIONS) {
        if (option.long_name == name) {
            return &option;
        }
    }
    return nullptr;
}

Result<u64, String> parse_positive(std::string_view text, std::string_view option) {
    u64 value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || end != text.data() + text.size() || value == 0) {
        return make_error(String(std::format(
            "invalid value '{}' for --{}: expected a positive integer", text, option)));
    }
    return value;
}

Result<void, String> apply_option(CliArgs& args, const OptionSpec& option, std::string_view value) {
    switch (option.id) {
        case OptionId::Select: {
            auto named = parse_named_selector(value);
            if (named.is_err()) {
                return make_error(std::move(named).error());
            }
            args.selects.push_back(std::move(named).value());
            break;
        }
        case OptionId::Output:
            if (value == "text") {
                args.output = OutputFormat::Text;
            } else if (value == "json") {
                args.output = OutputFormat::Json;
            } else if (value == "html") {
                args.output = OutputFormat::Html;
            } else if (value == "csv") {
                args.output = OutputFormat::Csv;
            } else {
                return make_error(String(std::format(
                    "invalid output format '{}' (expected text, json, html or csv)", value)));
            }
            break;
        case OptionId::Attribute:
            args.attribute = String(value);
            break;
        case OptionId::First:
            args.first = true;
            break;
        case OptionId::Pretty:
            args.pretty = true;
            break;
        case OptionId::Null:
            args.null_delimiter = true;
            break;
        case OptionId::Quiet:
            args.quiet = true;
            break;
        case OptionId::Parallel: {
            auto threads = parse_positive(value, option.long_name);
            if (threads.is_err()) {
                return make_error(std::move(threads).error());
            }
            args.parallel = static_cast<usize>(threads.value());
            break;
        }
        case OptionId::WithFilename:
            args.with_filename = true;
            break;
        case OptionId::NoFilename:
            args.no_filename = true;
            break;
        case OptionId::Url:
            args.url = String(value);
            break;
        case OptionId::Timeout: {
            auto seconds = parse_positive(value, option.long_name);
            if (seconds.is_err()) {
                return make_error(std::move(seconds).error());
            }
            if (seconds.value() > 86400) {
                return make_error(String(std::format("--timeout {} is too large", value)));
            }
            args.timeout_secs = static_cast<u32>(seconds.value());
            break;
        }
        case OptionId::Explain:
            args.explain = true;
            break;
        case OptionId::Interactive:
            args.interactive = true;
            break;
        case OptionId::Color:
            if (value == "auto") {
                args.color = ColorMode::Auto;
            } else if (value == "always") {
                args.color = ColorMode::Always;
            } else if (value == "never") {
                args.color = ColorMode::Never;
            } else {
                return make_error(String(std::format(
                    "invalid color mode '{}' (expected auto, always or never)", value)));
            }
            break;
        case OptionId::Verbose:
            args.verbose = true;
            break;
        case OptionId::Help:
            args.help = true;
            break;
    }
    return {};
}

Result<void, String> validate(CliArgs& args, std::vector<String> positionals) {
    // With --select every positional is an input file
    if (!args.selects.empty()) {
        args.files = std::move(positionals);
    } else if (!positionals.empty()) {
        args.selector = std::move(positionals.front());
        args.files.assign(std::make_move_iterator(positionals.begin() + 1),
                          std::make_move_iterator(positionals.end()));
    }

    // The REPL reads its selectors interactively
    if (args.interactive) {
        return {};
    }

    if (args.explain) {
        if (!args.selector) {
            return make_error(String("--explain requires a SELECTOR"));
        }
        return {};
    }

    if (!args.selector && args.selects.empty()) {
        return make_error(String("either SELECTOR or --select must be provided"));
    }
    if (args.output == OutputFormat::Csv && args.selects.empty()) {
        return make_error(String("CSV output requires --select for column names"));
    }
    if (args.url && !args.files.empty()) {
        return make_error(String("--url cannot be combined with input files"));
    }
    return {};
}

} // namespace

Result<NamedSelector, String> parse_named_selector(std::string_view text) {
    auto equals = text.find('=');
    if (equals == std::string_view::npos || equals == 0 || equals + 1 == text.size()) {
        return make_error(String(std::format("invalid --select format: '{}'. Use NAME=SELECTOR", text)));
    }
    return NamedSelector{String(text.substr(0, equals)), String(text.substr(equals + 1))};
}

Result<CliArgs, String> parse_args(const std::vector<std::string_view>& arguments) {
    CliArgs args;
    std::vector<String> positionals;
    bool options_done = false;

    for (usize i = 0; i < arguments.size(); ++i) {
        std::string_view arg = arguments[i];

        if (options_done || arg == "-" || !arg.starts_with('-')) {
            positionals.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            options_done = true;
            continue;
        }

        if (arg.starts_with("--")) {
            std::string_view name = arg.substr(2);
            std::optional<std::string_view> inline_value;
            if (auto equals = name.find('='); equals != std::string_view::npos) {
                inline_value = name.substr(equals + 1);
                name = name.substr(0, equals);
            }

            const auto* option = find_long(name);
            if (!option) {
                return make_error(String(std::format("unknown option '--{}'", name)));
            }

            std::string_view value;
            if (option->takes_value) {
                if (inline_value) {
                    value = *inline_value;
                } else if (i + 1 < arguments.size()) {
                    value = arguments[++i];
                } else {
                    return make_error(String(std::format("option '--{}' requires a value", name)));
                }
            } else if (inline_value) {
                return make_error(String(std::format("option '--{}' does not take a value", name)));
            }

            auto applied = apply_option(args, *option, value);
            if (applied.is_err()) {
                return make_error(applied.error());
            }
            continue;
        }

        // Bundled short flags: -1p, -j4, -s name=sel
        for (usize pos = 1; pos < arg.size(); ++pos) {
            const auto* option = find_short(arg[pos]);
            if (!option) {
                return make_error(String(std::format("unknown option '-{}'", arg[pos])));
            }

            std::string_view value;
            if (option->takes_value) {
                if (pos + 1 < arg.size()) {
                    value = arg.substr(pos + 1);
                } else if (i + 1 < arguments.size()) {
                    value = arguments[++i];
                } else {
                    return make_error(String(std::format("option '-{}' requires a value", arg[pos])));
                }
                pos = arg.size();
            }

            auto applied = apply_option(args, *option, value);
            if (applied.is_err()) {
                return make_error(applied.error());
            }
        }
    }

    if (args.help) {
        return args;
    }

    auto valid = validate(args, std::move(positionals));
    if (valid.is_err()) {
        return make_error(valid.error());
    }
    return args;
}

Result<CliArgs, String> parse_args(int argc, char* argv[]) {
    std::vector<std::string_view> arguments;
    for (int i = 1; i < argc; ++i) {
        arguments.emplace_back(argv[i]);
    }
    return parse_args(arguments);
}

String usage_text() {
    return String(
        "Usage: scrape [OPTIONS] [SELECTOR] [FILES...]\n"
        "\n"
        "Extract data from HTML using CSS selectors. Reads stdin when no files are given.\n"
        "\n"
        "Options:\n"
        "  -s, --select NAME=SELECTOR  Named selector (repeatable)\n"
        "  -o, --output FORMAT         Output format: text, json, html, csv [default: text]\n"
        "  -a, --attribute ATTR        Extract an attribute value instead of text\n"
        "  -1, --first                 Return only the first match\n"
        "  -p, --pretty                Pretty-print JSON output\n"
        "  -0, --null                  Use NUL as the record delimiter\n"
        "  -q, --quiet                 Suppress error messages\n"
        "  -j, --parallel N            Worker threads for multiple files\n"
        "  -H, --with-filename         Always prefix results with the filename\n"
        "      --no-filename           Never prefix results with the filename\n"
        "  -u, --url URL               Fetch HTML from a URL\n"
        "      --timeout SECS          Fetch timeout in seconds [default: 30]\n"
        "      --explain               Explain the selector\n"
        "  -i, --interactive           Start an interactive session\n"
        "  -c, --color MODE            Color: auto, always, never [default: auto]\n"
        "  -v, --verbose               Debug logging on stderr\n"
        "  -h, --help                  Print this help\n"
        "\n"
        "Examples:\n"
        "  scrape 'h1' page.html\n"
        "  scrape -o json 'a[href]' page.html\n"
        "  scrape -a href 'a' page.html\n"
        "  scrape -s title='h1' -s links='a' page.html\n"
        "\n"
        "Exit status: 0 matched, 1 no match, 2 runtime error, 4 usage error.\n");
}

} // namespace scrape::cli
