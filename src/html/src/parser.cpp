/**
 * HTML Parser implementation
 */

#include "scrape/html/parser.hpp"
#include "scrape/core/logger.hpp"
#include "windows_1252.hpp"
#include <algorithm>
#include <format>

namespace scrape::html {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("html");
    return instance;
}

std::string_view strip_utf8_bom(std::string_view input) {
    if (input.size() >= 3 && static_cast<u8>(input[0]) == 0xEF &&
        static_cast<u8>(input[1]) == 0xBB &&
        static_cast<u8>(input[2]) == 0xBF) {
        return input.substr(3);
    }
    return input;
}

bool is_blank(std::string_view input) {
    return std::all_of(input.begin(), input.end(), [](char c) {
        return unicode::is_ascii_whitespace(static_cast<u8>(c));
    });
}

// Best-effort sniff of <meta charset> within the first 1024 bytes
std::optional<String> sniff_meta_charset(std::string_view input) {
    auto lower = String(input.substr(0, std::min<usize>(input.size(), 1024))).to_lowercase();

    auto pos = lower.find("charset=");
    if (!pos) {
        return std::nullopt;
    }

    usize start = *pos + 8;
    char quote = 0;
    if (start < lower.size() && (lower.view()[start] == '"' || lower.view()[start] == '\'')) {
        quote = lower.view()[start];
        ++start;
    }
    usize end = start;
    while (end < lower.size()) {
        char c = lower.view()[end];
        if ((quote && c == quote) || (!quote && (c == '"' || c == '\'')) ||
            unicode::is_ascii_whitespace(static_cast<u8>(c)) || c == ';' || c == '>' || c == '/') {
            break;
        }
        ++end;
    }
    if (end <= start) {
        return std::nullopt;
    }
    return lower.substring(start, end - start);
}

bool is_legacy_single_byte_charset(std::string_view charset) {
    return charset == "windows-1252" || charset == "iso-8859-1" || charset == "latin1"
        || charset == "cp1252" || charset == "us-ascii";
}

std::string decode_windows_1252(std::string_view input) {
    std::string output;
    output.reserve(input.size() + input.size() / 4);
    char buffer[4];
    for (char c : input) {
        auto byte = static_cast<u8>(c);
        if (byte < 0x80) {
            output.push_back(c);
            continue;
        }
        usize length = unicode::utf8_encode(detail::windows_1252_code_point(byte), buffer);
        output.append(buffer, length);
    }
    return output;
}

// CRLF and lone CR become LF
std::string normalize_newlines(std::string_view input) {
    std::string output;
    output.reserve(input.size());
    for (usize i = 0; i < input.size(); ++i) {
        if (input[i] == '\r') {
            output.push_back('\n');
            if (i + 1 < input.size() && input[i + 1] == '\n') {
                ++i;
            }
        } else {
            output.push_back(input[i]);
        }
    }
    return output;
}

// Maps byte offsets to line/column without rescanning from the start
class LineIndex {
public:
    explicit LineIndex(std::string_view source)
        : m_source(source) {
        m_line_starts.push_back(0);
        for (usize i = 0; i < source.size(); ++i) {
            if (source[i] == '\n') {
                m_line_starts.push_back(i + 1);
            }
        }
    }

    [[nodiscard]] SourceSpan span_at(usize offset) const {
        offset = std::min(offset, m_source.size());
        auto it = std::upper_bound(m_line_starts.begin(), m_line_starts.end(), offset);
        usize line = static_cast<usize>(it - m_line_starts.begin());
        usize line_start = *(it - 1);
        auto position = position_at(m_source.substr(line_start), offset - line_start);
        SourcePosition start{line, position.column, offset};
        return SourceSpan{start, start};
    }

private:
    std::string_view m_source;
    std::vector<usize> m_line_starts;
};

std::optional<TokenizerState> initial_state_for_context(std::string_view context) {
    if (context == "title" || context == "textarea") {
        return TokenizerState::RCDATA;
    }
    if (context == "style" || context == "xmp" || context == "iframe" || context == "noembed"
        || context == "noframes" || context == "noscript") {
        return TokenizerState::RAWTEXT;
    }
    if (context == "script") {
        return TokenizerState::ScriptData;
    }
    if (context == "plaintext") {
        return TokenizerState::PLAINTEXT;
    }
    return std::nullopt;
}

String with_position(String text, const std::optional<SourceSpan>& span) {
    if (span) {
        text.append(String(std::format(" at line {}, column {}", span->start.line, span->start.column)));
    }
    return text;
}

} // namespace

// ============================================================================
// ParseError
// ============================================================================

ParseError ParseError::max_depth_exceeded(usize max_depth, std::optional<SourceSpan> span) {
    ParseError error;
    error.kind = Kind::MaxDepthExceeded;
    error.max_depth = max_depth;
    error.span = span;
    return error;
}

ParseError ParseError::empty_input() {
    ParseError error;
    error.kind = Kind::EmptyInput;
    return error;
}

ParseError ParseError::encoding_error(String message) {
    ParseError error;
    error.kind = Kind::EncodingError;
    error.message = std::move(message);
    return error;
}

ParseError ParseError::malformed_html(String message, std::optional<SourceSpan> span) {
    ParseError error;
    error.kind = Kind::MalformedHtml;
    error.message = std::move(message);
    error.span = span;
    return error;
}

ParseError ParseError::internal_error(String message) {
    ParseError error;
    error.kind = Kind::InternalError;
    error.message = std::move(message);
    return error;
}

std::optional<usize> ParseError::line() const {
    if (!span) {
        return std::nullopt;
    }
    return span->start.line;
}

std::optional<usize> ParseError::column() const {
    if (!span) {
        return std::nullopt;
    }
    return span->start.column;
}

String ParseError::to_string() const {
    switch (kind) {
        case Kind::MaxDepthExceeded:
            return with_position(String(std::format("maximum nesting depth of {} exceeded", max_depth)), span);
        case Kind::EmptyInput:
            return "empty or whitespace-only input";
        case Kind::EncodingError:
            return String(std::format("encoding error: {}", message.view()));
        case Kind::MalformedHtml:
            return with_position(String(std::format("malformed HTML: {}", message.view())), span);
        case Kind::InternalError:
            return String(std::format("internal parser error: {}", message.view()));
    }
    return String(std::format("internal parser error: {}", message.view()));
}

std::string_view severity_name(WarningSeverity severity) {
    switch (severity) {
        case WarningSeverity::Info: return "info";
        case WarningSeverity::Warning: return "warning";
        case WarningSeverity::RecoveredError: return "recovered error";
    }
    return "warning";
}

String ParseWarning::to_string() const {
    return with_position(String(std::format("{}: {}", severity_name(severity), message.view())), span);
}

// ============================================================================
// Parser
// ============================================================================

ParseResult Parser::parse(std::string_view html, const ParseConfig& config) {
    return run(html, config, std::nullopt);
}

ParseResult Parser::parse_fragment(std::string_view html, std::string_view context, const ParseConfig& config) {
    return run(html, config, context);
}

ParseResult Parser::run(std::string_view html, const ParseConfig& config, std::optional<std::string_view> context) {
    m_warnings.clear();

    auto input = strip_utf8_bom(html);
    if (is_blank(input)) {
        return make_error(ParseError::empty_input());
    }

    // Encoding: UTF-8, a declared single-byte legacy charset, or UTF-8 with
    // invalid sequences replaced
    std::string decoded;
    std::optional<std::pair<WarningSeverity, String>> encoding_note;
    std::optional<usize> invalid_at;
    if (auto invalid = unicode::find_invalid_utf8(input)) {
        if (config.strict_mode) {
            return make_error(ParseError::encoding_error(
                String(std::format("invalid UTF-8 sequence at byte {}", *invalid))));
        }
        auto charset = sniff_meta_charset(input);
        if (charset && is_legacy_single_byte_charset(charset->view())) {
            decoded = decode_windows_1252(input);
            encoding_note.emplace(WarningSeverity::Info,
                String(std::format("input decoded as windows-1252 (declared charset '{}')", charset->view())));
        } else {
            decoded = unicode::sanitize_utf8(input);
            encoding_note.emplace(WarningSeverity::Warning, "invalid UTF-8 replaced with U+FFFD");
            invalid_at = *invalid;
        }
    } else {
        decoded = std::string(input);
    }

    std::string source = normalize_newlines(decoded);
    LineIndex lines(source);

    if (encoding_note) {
        std::optional<SourceSpan> span;
        if (invalid_at) {
            span = lines.span_at(std::min(*invalid_at, source.size()));
        }
        logger().warn_fmt("{}", encoding_note->second.view());
        m_warnings.push_back(ParseWarning{encoding_note->first, std::move(encoding_note->second), span});
    }

    auto document = make_ref<dom::Document>();
    TreeBuilder builder(*document, TreeBuilderOptions{
        .max_depth = config.max_depth,
        .preserve_whitespace = config.preserve_whitespace,
        .include_comments = config.include_comments,
    });
    Tokenizer tokenizer;
    builder.set_tokenizer(&tokenizer);

    std::optional<ParseError> failure;
    auto report = [&](WarningSeverity severity, String message, usize offset) {
        if (config.strict_mode) {
            if (!failure) {
                failure = ParseError::malformed_html(std::move(message), lines.span_at(offset));
            }
            tokenizer.stop();
            return;
        }
        m_warnings.push_back(ParseWarning{severity, std::move(message), lines.span_at(offset)});
    };

    tokenizer.set_error_callback([&](std::string_view error, usize offset) {
        report(WarningSeverity::Warning, String(error), offset);
    });
    builder.set_error_callback([&](const String& message, usize offset) {
        report(WarningSeverity::RecoveredError, message, offset);
    });

    bool doctype_checked = context.has_value();
    tokenizer.set_token_callback([&](Token token) {
        if (!doctype_checked) {
            auto* characters = std::get_if<CharacterToken>(&token);
            if (!characters || !characters->data.is_whitespace()) {
                doctype_checked = true;
                if (!is_doctype(token)) {
                    m_warnings.push_back(ParseWarning{WarningSeverity::Info,
                        "no DOCTYPE; document is parsed in quirks mode", lines.span_at(token_offset(token))});
                }
            }
        }
        builder.process_token(token);
    });

    tokenizer.set_input(source);
    if (context) {
        auto context_name = String(*context).to_lowercase();
        builder.prepare_for_fragment(context_name.view());
        if (auto state = initial_state_for_context(context_name.view())) {
            tokenizer.set_state(*state);
            tokenizer.set_last_start_tag(context_name);
        }
    }
    tokenizer.run();

    if (auto offset = builder.depth_exceeded_at()) {
        logger().debug_fmt("nesting depth {} exceeded", config.max_depth);
        return make_error(ParseError::max_depth_exceeded(config.max_depth, lines.span_at(*offset)));
    }
    if (failure) {
        logger().debug_fmt("strict parse failed: {}", failure->message.view());
        return make_error(std::move(*failure));
    }
    if (!document->root()) {
        return make_error(ParseError::internal_error("no root element was created"));
    }

    logger().debug_fmt("parsed {} bytes into {} nodes ({} warnings)",
                       source.size(), document->size(), m_warnings.size());
    return document;
}

} // namespace scrape::html
