/**
 * Selector extraction for the scrape tool
 */

#include "extract.hpp"
#include "scrape/soup/batch.hpp"
#include "scrape/core/logger.hpp"
#include <algorithm>
#include <filesystem>
#include <format>

namespace scrape::cli {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("cli");
    return instance;
}

Result<std::vector<Tag>, css::QueryError> match(const Soup& soup, std::string_view selector, bool first_only) {
    if (!first_only) {
        return soup.find_all(selector);
    }
    auto first = soup.find(selector);
    if (first.is_err()) {
        return make_error(std::move(first).error());
    }
    std::vector<Tag> tags;
    if (first.value()) {
        tags.push_back(std::move(*first.value()));
    }
    return tags;
}

Extraction to_extraction(const Tag& tag, const ExtractOptions& options) {
    Extraction extraction;
    if (options.attribute) {
        const auto* value = tag.get(options.attribute->view());
        extraction.text = value ? *value : String();
    } else {
        extraction.text = tag.text();
    }
    if (options.include_attrs) {
        extraction.attrs = tag.attrs();
    }
    if (options.include_html) {
        extraction.html = tag.outer_html();
    }
    return extraction;
}

template<typename T, typename Fn>
std::vector<FileResult<T>> process_each(const std::vector<String>& files, usize threads, Fn&& work) {
    std::vector<std::optional<Result<T, String>>> slots(files.size());

    parallel_for(files.size(), threads, [&](usize index) {
        auto soup = Soup::from_file(std::filesystem::path(files[index].view()));
        if (soup.is_err()) {
            slots[index].emplace(make_error(soup.error().to_string()));
            return;
        }
        slots[index].emplace(work(soup.value()));
    });

    std::vector<FileResult<T>> results;
    results.reserve(files.size());
    for (usize i = 0; i < files.size(); ++i) {
        results.push_back(FileResult<T>{files[i], std::move(*slots[i])});
    }
    logger().debug_fmt("processed {} files", files.size());
    return results;
}

} // namespace

Result<std::vector<Extraction>, String>
extract(const Soup& soup, std::string_view selector, const ExtractOptions& options) {
    auto tags = match(soup, selector, options.first_only);
    if (tags.is_err()) {
        return make_error(String(std::format("invalid CSS selector: {}", tags.error().to_string().view())));
    }

    std::vector<Extraction> results;
    results.reserve(tags.value().size());
    for (const auto& tag : tags.value()) {
        results.push_back(to_extraction(tag, options));
    }
    return results;
}

Result<NamedExtractions, String>
extract_named(const Soup& soup, const std::vector<NamedSelector>& selectors, const ExtractOptions& options) {
    NamedExtractions results;
    for (const auto& named : selectors) {
        auto tags = match(soup, named.selector.view(), options.first_only);
        if (tags.is_err()) {
            return make_error(String(std::format("invalid CSS selector for '{}': {}", named.name.view(),
                                                 tags.error().to_string().view())));
        }

        auto& extractions = results[named.name];
        extractions.clear();
        for (const auto& tag : tags.value()) {
            // Attributes are only reported for single-selector JSON
            ExtractOptions named_options = options;
            named_options.include_attrs = false;
            extractions.push_back(to_extraction(tag, named_options));
        }
    }
    return results;
}

bool has_matches(const NamedExtractions& results) {
    return std::ranges::any_of(results, [](const auto& entry) { return !entry.second.empty(); });
}

std::vector<FileResult<std::vector<Extraction>>>
process_files(const std::vector<String>& files, std::string_view selector,
              const ExtractOptions& options, usize threads) {
    return process_each<std::vector<Extraction>>(files, threads, [&](const Soup& soup) {
        return extract(soup, selector, options);
    });
}

std::vector<FileResult<NamedExtractions>>
process_files_named(const std::vector<String>& files, const std::vector<NamedSelector>& selectors,
                    const ExtractOptions& options, usize threads) {
    return process_each<NamedExtractions>(files, threads, [&](const Soup& soup) {
        return extract_named(soup, selectors, options);
    });
}

} // namespace scrape::cli
