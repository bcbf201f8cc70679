#pragma once

#include "cli_args.hpp"
#include "scrape/soup/soup.hpp"
#include <map>

namespace scrape::cli {

// One matched element
struct Extraction {
    // Text content, or the attribute value when one was requested
    String text;
    std::optional<dom::Attributes> attrs;
    std::optional<String> html;
};

// Keyed by selector name; iteration is in sorted name order
using NamedExtractions = std::map<String, std::vector<Extraction>>;

struct ExtractOptions {
    std::optional<String> attribute;
    bool first_only{false};
    bool include_attrs{false};
    bool include_html{false};
};

[[nodiscard]] Result<std::vector<Extraction>, String>
extract(const Soup& soup, std::string_view selector, const ExtractOptions& options);

[[nodiscard]] Result<NamedExtractions, String>
extract_named(const Soup& soup, const std::vector<NamedSelector>& selectors,
              const ExtractOptions& options);

[[nodiscard]] bool has_matches(const NamedExtractions& results);

// ============================================================================
// Multiple input files
// ============================================================================

template<typename T>
struct FileResult {
    String filename;
    Result<T, String> result;
};

// Results come back in input order regardless of scheduling
[[nodiscard]] std::vector<FileResult<std::vector<Extraction>>>
process_files(const std::vector<String>& files, std::string_view selector,
              const ExtractOptions& options, usize threads);

[[nodiscard]] std::vector<FileResult<NamedExtractions>>
process_files_named(const std::vector<String>& files, const std::vector<NamedSelector>& selectors,
                    const ExtractOptions& options, usize threads);

} // namespace scrape::cli
