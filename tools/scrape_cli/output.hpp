#pragma once

#include "extract.hpp"
#include <memory>
#include <ostream>

namespace scrape::cli {

struct OutputOptions {
    char delimiter{'\n'};
    bool color{false};
    bool pretty{false};
};

/**
 * Writes extraction results in one output format. `filename` is null when
 * filenames are not shown.
 */
class OutputFormatter {
public:
    virtual ~OutputFormatter() = default;

    virtual void write_single(std::ostream& out, const std::vector<Extraction>& results,
                              const String* filename) = 0;
    virtual void write_named(std::ostream& out, const NamedExtractions& results,
                             const String* filename) = 0;
};

[[nodiscard]] std::unique_ptr<OutputFormatter> make_formatter(OutputFormat format,
                                                              const OutputOptions& options);

// ============================================================================
// Formatters
// ============================================================================

class TextOutput : public OutputFormatter {
public:
    explicit TextOutput(const OutputOptions& options) : m_options(options) {}

    void write_single(std::ostream& out, const std::vector<Extraction>& results,
                      const String* filename) override;
    void write_named(std::ostream& out, const NamedExtractions& results,
                     const String* filename) override;

private:
    void write_filename(std::ostream& out, const String& filename) const;

    OutputOptions m_options;
};

class JsonOutput : public OutputFormatter {
public:
    explicit JsonOutput(const OutputOptions& options) : m_options(options) {}

    void write_single(std::ostream& out, const std::vector<Extraction>& results,
                      const String* filename) override;
    void write_named(std::ostream& out, const NamedExtractions& results,
                     const String* filename) override;

private:
    OutputOptions m_options;
};

class HtmlOutput : public OutputFormatter {
public:
    explicit HtmlOutput(const OutputOptions& options) : m_options(options) {}

    void write_single(std::ostream& out, const std::vector<Extraction>& results,
                      const String* filename) override;
    void write_named(std::ostream& out, const NamedExtractions& results,
                     const String* filename) override;

private:
    OutputOptions m_options;
};

// RFC 4180
class CsvOutput : public OutputFormatter {
public:
    void write_single(std::ostream& out, const std::vector<Extraction>& results,
                      const String* filename) override;
    void write_named(std::ostream& out, const NamedExtractions& results,
                     const String* filename) override;
};

// ============================================================================
// Escaping helpers
// ============================================================================

// Quoted JSON string literal
[[nodiscard]] String json_quote(std::string_view text);

// CSV field, quoted only when it needs to be
[[nodiscard]] String csv_field(std::string_view text);

// Makes text safe inside an HTML comment
[[nodiscard]] String comment_safe(std::string_view text);

} // namespace scrape::cli
