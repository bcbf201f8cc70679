/**
 * Output formatting for the scrape tool
 */

#include "output.hpp"
#include <algorithm>
#include <format>

namespace scrape::cli {

namespace {

constexpr std::string_view COLOR_FILENAME = "\x1b[35m";
constexpr std::string_view COLOR_NAME = "\x1b[36m";
constexpr std::string_view COLOR_RESET = "\x1b[0m";

// ============================================================================
// JsonWriter - streaming JSON with optional two-space indentation
// ============================================================================

class JsonWriter {
public:
    JsonWriter(std::ostream& out, bool pretty) : m_out(out), m_pretty(pretty) {}

    void begin_array() { open('['); }
    void end_array() { close(']'); }
    void begin_object() { open('{'); }
    void end_object() { close('}'); }

    void key(std::string_view name) {
        before_value();
        m_out << json_quote(name).view() << (m_pretty ? ": " : ":");
        m_after_key = true;
    }

    void value(std::string_view text) {
        before_value();
        m_out << json_quote(text).view();
    }

private:
    void open(char bracket) {
        before_value();
        m_out << bracket;
        m_first.push_back(true);
    }

    void close(char bracket) {
        bool empty = m_first.back();
        m_first.pop_back();
        if (!empty) {
            newline();
        }
        m_out << bracket;
    }

    void before_value() {
        if (m_after_key) {
            m_after_key = false;
            return;
        }
        if (m_first.empty()) {
            return;
        }
        if (!m_first.back()) {
            m_out << ',';
        }
        m_first.back() = false;
        newline();
    }

    void newline() {
        if (m_pretty) {
            m_out << '\n' << std::string(m_first.size() * 2, ' ');
        }
    }

    std::ostream& m_out;
    bool m_pretty;
    bool m_after_key{false};
    std::vector<bool> m_first;
};

void write_csv_record(std::ostream& out, const std::vector<std::string_view>& fields) {
    for (usize i = 0; i < fields.size(); ++i) {
        if (i > 0) {
            out << ',';
        }
        out << csv_field(fields[i]).view();
    }
    out << '\n';
}

const String& html_or_text(const Extraction& extraction) {
    return extraction.html ? *extraction.html : extraction.text;
}

} // namespace

// ============================================================================
// Escaping helpers
// ============================================================================

String json_quote(std::string_view text) {
    std::string quoted;
    quoted.reserve(text.size() + 2);
    quoted += '"';
    for (char c : text) {
        switch (c) {
            case '"': quoted += "\\\""; break;
            case '\\': quoted += "\\\\"; break;
            case '\b': quoted += "\\b"; break;
            case '\f': quoted += "\\f"; break;
            case '\n': quoted += "\\n"; break;
            case '\r': quoted += "\\r"; break;
            case '\t': quoted += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    quoted += std::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    quoted += c;
                }
        }
    }
    quoted += '"';
    return String(std::move(quoted));
}

String csv_field(std::string_view text) {
    if (text.find_first_of(",\"\r\n") == std::string_view::npos) {
        return String(text);
    }
    std::string quoted = "\"";
    for (char c : text) {
        if (c == '"') {
            quoted += '"';
        }
        quoted += c;
    }
    quoted += '"';
    return String(std::move(quoted));
}

String comment_safe(std::string_view text) {
    std::string safe;
    safe.reserve(text.size());
    for (char c : text) {
        if (c == '-' && !safe.empty() && safe.back() == '-') {
            safe += ' ';
        }
        safe += c;
    }
    return String(std::move(safe));
}

// ============================================================================
// TextOutput
// ============================================================================

void TextOutput::write_filename(std::ostream& out, const String& filename) const {
    if (m_options.color) {
        out << COLOR_FILENAME << filename << COLOR_RESET << ": ";
    } else {
        out << filename << ": ";
    }
}

void TextOutput::write_single(std::ostream& out, const std::vector<Extraction>& results,
                              const String* filename) {
    for (const auto& result : results) {
        if (filename) {
            write_filename(out, *filename);
        }
        out << result.text << m_options.delimiter;
    }
}

void TextOutput::write_named(std::ostream& out, const NamedExtractions& results,
                             const String* filename) {
    for (const auto& [name, extractions] : results) {
        for (const auto& extraction : extractions) {
            if (filename) {
                write_filename(out, *filename);
            }
            if (m_options.color) {
                out << COLOR_NAME << name << COLOR_RESET;
            } else {
                out << name;
            }
            out << ": " << extraction.text << m_options.delimiter;
        }
    }
}

// ============================================================================
// JsonOutput
// ============================================================================

void JsonOutput::write_single(std::ostream& out, const std::vector<Extraction>& results,
                              const String*) {
    JsonWriter json(out, m_options.pretty);
    json.begin_array();
    for (const auto& result : results) {
        if (!result.attrs && !result.html) {
            json.value(result.text.view());
            continue;
        }

        json.begin_object();
        json.key("text");
        json.value(result.text.view());
        if (result.attrs) {
            json.key("attrs");
            json.begin_object();
            for (const auto& attr : *result.attrs) {
                json.key(attr.name.view());
                json.value(attr.value.view());
            }
            json.end_object();
        }
        if (result.html) {
            json.key("html");
            json.value(result.html->view());
        }
        json.end_object();
    }
    json.end_array();
    out << '\n';
}

void JsonOutput::write_named(std::ostream& out, const NamedExtractions& results, const String*) {
    JsonWriter json(out, m_options.pretty);
    json.begin_object();
    for (const auto& [name, extractions] : results) {
        json.key(name.view());
        json.begin_array();
        for (const auto& extraction : extractions) {
            json.value(extraction.text.view());
        }
        json.end_array();
    }
    json.end_object();
    out << '\n';
}

// ============================================================================
// HtmlOutput
// ============================================================================

void HtmlOutput::write_single(std::ostream& out, const std::vector<Extraction>& results,
                              const String* filename) {
    for (const auto& result : results) {
        if (filename) {
            out << "<!-- " << comment_safe(filename->view()) << " -->" << m_options.delimiter;
        }
        out << html_or_text(result) << m_options.delimiter;
    }
}

void HtmlOutput::write_named(std::ostream& out, const NamedExtractions& results,
                             const String* filename) {
    if (filename) {
        out << "<!-- " << comment_safe(filename->view()) << " -->" << m_options.delimiter;
    }
    for (const auto& [name, extractions] : results) {
        out << "<!-- " << comment_safe(name.view()) << " -->" << m_options.delimiter;
        for (const auto& extraction : extractions) {
            out << html_or_text(extraction) << m_options.delimiter;
        }
    }
}

// ============================================================================
// CsvOutput
// ============================================================================

void CsvOutput::write_single(std::ostream& out, const std::vector<Extraction>& results,
                             const String* filename) {
    if (filename) {
        write_csv_record(out, {"file", "value"});
    } else {
        write_csv_record(out, {"value"});
    }
    for (const auto& result : results) {
        if (filename) {
            write_csv_record(out, {filename->view(), result.text.view()});
        } else {
            write_csv_record(out, {result.text.view()});
        }
    }
}

void CsvOutput::write_named(std::ostream& out, const NamedExtractions& results, const String*) {
    std::vector<std::string_view> header;
    usize rows = 0;
    for (const auto& [name, extractions] : results) {
        header.push_back(name.view());
        rows = std::max(rows, extractions.size());
    }
    write_csv_record(out, header);

    // Shorter columns are padded with empty cells
    for (usize row = 0; row < rows; ++row) {
        std::vector<std::string_view> record;
        record.reserve(header.size());
        for (const auto& [name, extractions] : results) {
            record.push_back(row < extractions.size() ? extractions[row].text.view() : std::string_view());
        }
        write_csv_record(out, record);
    }
}

// ============================================================================
// Factory
// ============================================================================

std::unique_ptr<OutputFormatter> make_formatter(OutputFormat format, const OutputOptions& options) {
    switch (format) {
        case OutputFormat::Text: return std::make_unique<TextOutput>(options);
        case OutputFormat::Json: return std::make_unique<JsonOutput>(options);
        case OutputFormat::Html: return std::make_unique<HtmlOutput>(options);
        case OutputFormat::Csv: return std::make_unique<CsvOutput>();
    }
    return std::make_unique<TextOutput>(options);
}

} // namespace scrape::cli
