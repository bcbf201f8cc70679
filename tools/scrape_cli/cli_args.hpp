#pragma once

#include "scrape/core/types.hpp"
#include "scrape/core/string.hpp"
#include <optional>
#include <vector>

namespace scrape::cli {

// Process exit codes
constexpr int EXIT_MATCHED = 0;
constexpr int EXIT_NO_MATCH = 1;
constexpr int EXIT_RUNTIME_ERROR = 2;
constexpr int EXIT_USAGE_ERROR = 4;

enum class OutputFormat : u8 {
    Text,
    Json,
    Html,
    Csv,
};

enum class ColorMode : u8 {
    Auto,
    Always,
    Never,
};

struct NamedSelector {
    String name;
    String selector;

    [[nodiscard]] bool operator==(const NamedSelector& other) const = default;
};

struct CliArgs {
    std::optional<String> selector;
    std::vector<String> files;
    std::vector<NamedSelector> selects;

    OutputFormat output{OutputFormat::Text};
    std::optional<String> attribute;
    ColorMode color{ColorMode::Auto};

    bool first{false};
    bool pretty{false};
    bool null_delimiter{false};
    bool quiet{false};
    bool with_filename{false};
    bool no_filename{false};
    bool explain{false};
    bool interactive{false};
    bool verbose{false};
    bool help{false};

    // Worker threads (0 = one per hardware thread)
    usize parallel{0};

    std::optional<String> url;
    u32 timeout_secs{30};

    [[nodiscard]] bool named() const { return !selects.empty(); }

    // Prefix results with filenames: forced by -H, otherwise only for
    // several files and not with --no-filename
    [[nodiscard]] bool show_filename() const {
        if (with_filename) {
            return true;
        }
        return !no_filename && files.size() > 1;
    }
};

// Parses arguments without the program name. Errors are usage errors.
[[nodiscard]] Result<CliArgs, String> parse_args(const std::vector<std::string_view>& arguments);
[[nodiscard]] Result<CliArgs, String> parse_args(int argc, char* argv[]);

// Splits NAME=SELECTOR at the first '='
[[nodiscard]] Result<NamedSelector, String> parse_named_selector(std::string_view text);

[[nodiscard]] String usage_text();

} // namespace scrape::cli
