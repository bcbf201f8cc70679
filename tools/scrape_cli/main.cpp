/**
 * scrape - extract data from HTML with CSS selectors
 * Usage: scrape [OPTIONS] [SELECTOR] [FILES...]
 */

#include "cli_args.hpp"
#include "extract.hpp"
#include "output.hpp"
#include "repl.hpp"
#include "scrape/css/explain.hpp"
#include "scrape/network/http_client.hpp"
#include "scrape/core/logger.hpp"
#include <format>
#include <iostream>
#include <sstream>
#include <unistd.h>

using namespace scrape;
using namespace scrape::cli;

namespace {

Logger& logger() {
    static Logger& instance = logging::get("cli");
    return instance;
}

void report(const CliArgs& args, std::string_view message) {
    if (!args.quiet) {
        std::cerr << "Error: " << message << "\n";
    }
}

bool use_color(ColorMode mode) {
    switch (mode) {
        case ColorMode::Always: return true;
        case ColorMode::Never: return false;
        case ColorMode::Auto: return isatty(STDOUT_FILENO) != 0;
    }
    return false;
}

Result<network::HttpResponse, String> fetch(const String& url, u32 timeout_secs) {
    network::HttpClient client;
    client.set_timeout(timeout_secs * 1000);

    auto response = client.get(url.view());
    if (response.is_err()) {
        return make_error(String(std::format("fetching {} failed: {}", url.view(), response.error().view())));
    }
    if (!response.value().is_success()) {
        return make_error(String(std::format("HTTP {} fetching {}", response.value().status_code, url.view())));
    }
    logger().debug_fmt("fetched {} bytes from {}", response.value().body.size(), url.view());
    return std::move(response).value();
}

// Input from --url or standard input, parsed leniently
Result<Soup, String> read_input(const CliArgs& args) {
    if (args.url) {
        auto response = fetch(*args.url, args.timeout_secs);
        if (response.is_err()) {
            return make_error(std::move(response).error());
        }
        return Soup::parse(response.value().body_as_string().view());
    }
    std::stringstream buffer;
    buffer << std::cin.rdbuf();
    if (std::cin.bad()) {
        return make_error(String("cannot read standard input"));
    }
    return Soup::parse(buffer.view());
}

// Rejects bad selectors once instead of once per file
Result<void, String> check_selectors(const CliArgs& args) {
    if (args.selector) {
        auto compiled = css::CompiledSelector::compile(args.selector->view());
        if (compiled.is_err()) {
            return make_error(String(std::format("invalid CSS selector: {}", compiled.error().to_string().view())));
        }
    }
    for (const auto& named : args.selects) {
        auto compiled = css::CompiledSelector::compile(named.selector.view());
        if (compiled.is_err()) {
            return make_error(String(std::format("invalid CSS selector for '{}': {}", named.name.view(),
                                                 compiled.error().to_string().view())));
        }
    }
    return {};
}

Result<void, String> run_interactive(const CliArgs& args) {
    Repl repl(std::cin, std::cout);
    repl.set_url_loader([&args](std::string_view url) -> Result<std::string, String> {
        auto response = fetch(String(url), args.timeout_secs);
        if (response.is_err()) {
            return make_error(std::move(response).error());
        }
        const auto& body = response.value().body;
        return std::string(body.begin(), body.end());
    });
    return repl.run();
}

Result<bool, String> run(const CliArgs& args) {
    if (args.interactive) {
        auto session = run_interactive(args);
        if (session.is_err()) {
            return make_error(session.error());
        }
        return true;
    }

    if (args.explain) {
        auto explanation = css::explain(args.selector->view());
        if (explanation.is_err()) {
            return make_error(String(std::format("invalid selector: {}", explanation.error().to_string().view())));
        }
        std::cout << explanation.value().format() << "\n";
        return true;
    }

    auto checked = check_selectors(args);
    if (checked.is_err()) {
        return make_error(checked.error());
    }

    OutputOptions output_options;
    output_options.delimiter = args.null_delimiter ? '\0' : '\n';
    output_options.color = use_color(args.color);
    output_options.pretty = args.pretty;
    auto formatter = make_formatter(args.output, output_options);

    ExtractOptions options;
    options.attribute = args.attribute;
    options.first_only = args.first;
    options.include_attrs = args.output == OutputFormat::Json && !args.named();
    options.include_html = args.output == OutputFormat::Html
                           || (args.output == OutputFormat::Json && !args.named());

    bool found_any = false;

    if (args.files.empty()) {
        auto input = read_input(args);
        if (input.is_err()) {
            return make_error(std::move(input).error());
        }
        const Soup& soup = input.value();

        if (args.named()) {
            auto results = extract_named(soup, args.selects, options);
            if (results.is_err()) {
                return make_error(std::move(results).error());
            }
            found_any = has_matches(results.value());
            formatter->write_named(std::cout, results.value(), nullptr);
        } else {
            auto results = extract(soup, args.selector->view(), options);
            if (results.is_err()) {
                return make_error(std::move(results).error());
            }
            found_any = !results.value().empty();
            formatter->write_single(std::cout, results.value(), nullptr);
        }
    } else if (args.named()) {
        for (const auto& file : process_files_named(args.files, args.selects, options, args.parallel)) {
            if (file.result.is_err()) {
                if (!args.quiet) {
                    std::cerr << file.filename << ": " << file.result.error() << "\n";
                }
                continue;
            }
            found_any = found_any || has_matches(file.result.value());
            formatter->write_named(std::cout, file.result.value(), args.show_filename() ? &file.filename : nullptr);
        }
    } else {
        for (const auto& file : process_files(args.files, args.selector->view(), options, args.parallel)) {
            if (file.result.is_err()) {
                if (!args.quiet) {
                    std::cerr << file.filename << ": " << file.result.error() << "\n";
                }
                continue;
            }
            if (file.result.value().empty()) {
                continue;
            }
            found_any = true;
            formatter->write_single(std::cout, file.result.value(), args.show_filename() ? &file.filename : nullptr);
        }
    }

    std::cout.flush();
    if (!std::cout) {
        return make_error(String("cannot write to standard output"));
    }
    return found_any;
}

} // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (parsed.is_err()) {
        std::cerr << "Error: " << parsed.error() << "\n\nRun 'scrape --help' for usage.\n";
        return EXIT_USAGE_ERROR;
    }
    const CliArgs& args = parsed.value();

    if (args.help) {
        std::cout << usage_text();
        return EXIT_MATCHED;
    }

    logging::init();
    logging::set_level(LogLevel::Warn);
    logging::init_from_env();
    if (args.verbose) {
        logging::set_level(LogLevel::Debug);
    }

    auto result = run(args);
    logging::shutdown();

    if (result.is_err()) {
        report(args, result.error().view());
        return EXIT_RUNTIME_ERROR;
    }
    return result.value() ? EXIT_MATCHED : EXIT_NO_MATCH;
}
