#include "scrape/css/selector.hpp"
#include "scrape/core/logger.hpp"
#include <algorithm>
#include <charconv>
#include <format>

namespace scrape::css {

namespace {

Logger& logger() {
    static Logger& instance = logging::get("css");
    return instance;
}

bool is_name_start(char c) {
    auto byte = static_cast<u8>(c);
    return unicode::is_ascii_alpha(byte) || c == '_' || byte >= 0x80;
}

bool is_name_char(char c) {
    return is_name_start(c) || unicode::is_ascii_digit(static_cast<u8>(c)) || c == '-';
}

bool is_combinator(char c) {
    return c == '>' || c == '+' || c == '~';
}

Combinator combinator_for(char c) {
    switch (c) {
        case '>': return Combinator::Child;
        case '+': return Combinator::NextSibling;
        case '~': return Combinator::SubsequentSibling;
        default: return Combinator::Descendant;
    }
}

std::string_view combinator_text(Combinator combinator) {
    switch (combinator) {
        case Combinator::Descendant: return " ";
        case Combinator::Child: return " > ";
        case Combinator::NextSibling: return " + ";
        case Combinator::SubsequentSibling: return " ~ ";
    }
    return " ";
}

struct PseudoClassName {
    std::string_view name;
    PseudoClass kind;
};

constexpr PseudoClassName STRUCTURAL_PSEUDO_CLASSES[] = {
    {"first-child", PseudoClass::FirstChild},
    {"last-child", PseudoClass::LastChild},
    {"only-child", PseudoClass::OnlyChild},
    {"first-of-type", PseudoClass::FirstOfType},
    {"last-of-type", PseudoClass::LastOfType},
    {"only-of-type", PseudoClass::OnlyOfType},
    {"empty", PseudoClass::Empty},
    {"root", PseudoClass::Root},
};

constexpr PseudoClassName NTH_PSEUDO_CLASSES[] = {
    {"nth-child", PseudoClass::NthChild},
    {"nth-last-child", PseudoClass::NthLastChild},
    {"nth-of-type", PseudoClass::NthOfType},
    {"nth-last-of-type", PseudoClass::NthLastOfType},
};

constexpr PseudoClassName LOGICAL_PSEUDO_CLASSES[] = {
    {"not", PseudoClass::Not},
    {"is", PseudoClass::Is},
    {"where", PseudoClass::Where},
    {"has", PseudoClass::Has},
};

constexpr std::string_view PSEUDO_ELEMENTS[] = {
    "before", "after", "first-line", "first-letter",
};

template<typename Table>
std::optional<PseudoClass> lookup(const Table& table, std::string_view name) {
    for (const auto& entry : table) {
        if (entry.name == name) {
            return entry.kind;
        }
    }
    return std::nullopt;
}

bool is_pseudo_element_name(std::string_view name) {
    return std::find(std::begin(PSEUDO_ELEMENTS), std::end(PSEUDO_ELEMENTS), name) !=
           std::end(PSEUDO_ELEMENTS);
}

std::optional<i32> parse_integer(std::string_view text) {
    if (text.empty()) {
        return std::nullopt;
    }
    bool negative = false;
    if (text.front() == '+' || text.front() == '-') {
        negative = text.front() == '-';
        text.remove_prefix(1);
    }
    if (text.empty() || !unicode::is_ascii_digit(static_cast<u8>(text.front()))) {
        return std::nullopt;
    }
    i32 value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return negative ? -value : value;
}

String nth_to_string(const NthPattern& nth) {
    if (nth.a == 0) {
        return String(std::format("{}", nth.b));
    }
    String out;
    if (nth.a == 1) {
        out += "n";
    } else if (nth.a == -1) {
        out += "-n";
    } else {
        out += String(std::format("{}n", nth.a));
    }
    if (nth.b != 0) {
        out += String(std::format("{:+}", nth.b));
    }
    return out;
}

std::string_view attribute_operator(AttributeSelector::Matcher matcher) {
    using Matcher = AttributeSelector::Matcher;
    switch (matcher) {
        case Matcher::Exists: return "";
        case Matcher::Equals: return "=";
        case Matcher::Includes: return "~=";
        case Matcher::DashMatch: return "|=";
        case Matcher::Prefix: return "^=";
        case Matcher::Suffix: return "$=";
        case Matcher::Substring: return "*=";
    }
    return "";
}

} // anonymous namespace

// ============================================================================
// NthPattern
// ============================================================================

bool NthPattern::matches(i64 position) const {
    if (a == 0) {
        return position == b;
    }
    i64 diff = position - b;
    if (diff % a != 0) {
        return false;
    }
    return diff / a >= 0;
}

std::optional<NthPattern> parse_nth(std::string_view text) {
    std::string compact;
    for (char c : text) {
        if (!unicode::is_ascii_whitespace(static_cast<u8>(c))) {
            compact += unicode::to_ascii_lower(c);
        }
    }

    if (compact == "odd") {
        return NthPattern{.a = 2, .b = 1};
    }
    if (compact == "even") {
        return NthPattern{.a = 2, .b = 0};
    }

    std::string_view view = compact;
    auto n = view.find('n');
    if (n == std::string_view::npos) {
        auto b = parse_integer(view);
        if (!b) {
            return std::nullopt;
        }
        return NthPattern{.a = 0, .b = *b};
    }

    NthPattern pattern;
    auto a_text = view.substr(0, n);
    if (a_text.empty() || a_text == "+") {
        pattern.a = 1;
    } else if (a_text == "-") {
        pattern.a = -1;
    } else {
        auto a = parse_integer(a_text);
        if (!a) {
            return std::nullopt;
        }
        pattern.a = *a;
    }

    auto b_text = view.substr(n + 1);
    if (!b_text.empty()) {
        if (b_text.front() != '+' && b_text.front() != '-') {
            return std::nullopt;
        }
        auto b = parse_integer(b_text);
        if (!b) {
            return std::nullopt;
        }
        pattern.b = *b;
    }
    return pattern;
}

// ============================================================================
// Specificity
// ============================================================================

String Specificity::to_string() const {
    return String(std::format("({}, {}, {})", ids, classes, elements));
}

Specificity& Specificity::operator+=(const Specificity& other) {
    ids += other.ids;
    classes += other.classes;
    elements += other.elements;
    return *this;
}

Specificity Specificity::operator+(const Specificity& other) const {
    Specificity result = *this;
    result += other;
    return result;
}

Specificity calculate_specificity(const CompoundSelector& selector) {
    Specificity spec;
    for (const auto& simple : selector.selectors) {
        std::visit([&spec](const auto& sel) {
            using T = std::decay_t<decltype(sel)>;
            if constexpr (std::is_same_v<T, IdSelector>) {
                spec.ids++;
            } else if constexpr (std::is_same_v<T, ClassSelector> ||
                                 std::is_same_v<T, AttributeSelector> ||
                                 std::is_same_v<T, PseudoClassSelector>) {
                spec.classes++;
            } else if constexpr (std::is_same_v<T, TypeSelector> ||
                                 std::is_same_v<T, PseudoElementSelector>) {
                spec.elements++;
            }
            // UniversalSelector doesn't add specificity
        }, simple);
    }
    return spec;
}

Specificity calculate_specificity(const ComplexSelector& selector) {
    Specificity spec;
    for (const auto& part : selector.parts) {
        spec += calculate_specificity(part.compound);
    }
    return spec;
}

Specificity calculate_specificity(const SelectorList& selectors) {
    Specificity spec;
    for (const auto& sel : selectors.selectors) {
        spec += calculate_specificity(sel);
    }
    return spec;
}

// ============================================================================
// QueryError
// ============================================================================

QueryError QueryError::invalid_selector(String message, std::optional<SourceSpan> span) {
    return QueryError{.kind = Kind::InvalidSelector, .message = std::move(message), .span = span};
}

std::optional<usize> QueryError::line() const {
    if (!span) {
        return std::nullopt;
    }
    return span->start.line;
}

std::optional<usize> QueryError::column() const {
    if (!span) {
        return std::nullopt;
    }
    return span->start.column;
}

String QueryError::to_string() const {
    if (span) {
        return String(std::format("invalid selector at line {}, column {}: {}",
                                  span->start.line, span->start.column, message.view()));
    }
    return String(std::format("invalid selector: {}", message.view()));
}

// ============================================================================
// SelectorParser implementation
// ============================================================================

Result<SelectorList, QueryError> SelectorParser::parse(std::string_view input) {
    m_input = input;
    m_position = 0;
    m_depth = 0;
    return parse_selector_list(false, false);
}

Result<SelectorList, QueryError> SelectorParser::parse_selector_list(bool nested, bool relative) {
    SelectorList list;

    skip_whitespace();

    while (true) {
        if (at_end() || peek() == ',' || (nested && peek() == ')')) {
            if (!at_end() && peek() == ',') {
                return make_error(error_here("unexpected ','"));
            }
            if (list.selectors.empty()) {
                return make_error(error_here(nested ? "empty selector list" : "empty selector"));
            }
            return make_error(error_here("expected selector after ','"));
        }

        auto selector = parse_complex_selector(relative);
        if (selector.is_err()) {
            return make_error(std::move(selector).error());
        }
        list.selectors.push_back(std::move(selector).value());

        skip_whitespace();
        if (!at_end() && peek() == ',') {
            consume(); // comma
            skip_whitespace();
            continue;
        }
        break;
    }

    if (nested) {
        if (at_end() || peek() != ')') {
            return make_error(error_here("expected ')'"));
        }
        consume();
    } else if (!at_end()) {
        return make_error(error_here(std::format("unexpected character '{}'", peek())));
    }

    return list;
}

Result<ComplexSelector, QueryError> SelectorParser::parse_complex_selector(bool relative) {
    ComplexSelector selector;

    if (is_combinator(peek())) {
        if (!relative) {
            return make_error(error_here(
                std::format("selector cannot start with combinator '{}'", peek())));
        }
        selector.leading_combinator = combinator_for(consume());
        skip_whitespace();
    }

    auto compound = parse_compound_selector();
    if (compound.is_err()) {
        return make_error(std::move(compound).error());
    }
    selector.parts.push_back(ComplexSelectorPart{.compound = std::move(compound).value()});

    while (true) {
        bool had_whitespace = skip_whitespace();
        if (at_end() || peek() == ',' || peek() == ')') {
            break;
        }

        Combinator combinator = Combinator::Descendant;
        char c = peek();
        if (is_combinator(c)) {
            usize combinator_pos = m_position;
            consume();
            combinator = combinator_for(c);
            skip_whitespace();

            if (at_end() || peek() == ',' || peek() == ')') {
                return make_error(error_at(combinator_pos, combinator_pos + 1,
                                           std::format("dangling combinator '{}'", c)));
            }
            if (is_combinator(peek())) {
                return make_error(error_here(
                    std::format("unexpected combinator '{}' after '{}'", peek(), c)));
            }
        } else if (!had_whitespace) {
            return make_error(error_here(std::format("unexpected character '{}'", c)));
        }

        selector.parts.back().combinator = combinator;

        compound = parse_compound_selector();
        if (compound.is_err()) {
            return make_error(std::move(compound).error());
        }
        selector.parts.push_back(ComplexSelectorPart{.compound = std::move(compound).value()});
    }

    return selector;
}

Result<CompoundSelector, QueryError> SelectorParser::parse_compound_selector() {
    CompoundSelector selector;

    while (!at_end()) {
        char c = peek();
        if (c != '*' && c != '#' && c != '.' && c != '[' && c != ':' && !starts_ident()) {
            break;
        }
        auto simple = parse_simple_selector(selector.selectors.empty());
        if (simple.is_err()) {
            return make_error(std::move(simple).error());
        }
        selector.selectors.push_back(std::move(simple).value());
    }

    if (selector.selectors.empty()) {
        if (at_end()) {
            return make_error(error_here("expected selector"));
        }
        return make_error(error_here(std::format("unexpected character '{}'", peek())));
    }

    return selector;
}

Result<SimpleSelector, QueryError> SelectorParser::parse_simple_selector(bool first_in_compound) {
    char c = peek();

    // Universal selector
    if (c == '*') {
        if (!first_in_compound) {
            return make_error(error_here("universal selector must come first in a compound selector"));
        }
        consume();
        return UniversalSelector{};
    }

    // ID selector
    if (c == '#') {
        consume();
        if (!starts_ident()) {
            return make_error(error_here("expected identifier after '#'"));
        }
        return IdSelector{consume_ident()};
    }

    // Class selector
    if (c == '.') {
        consume();
        if (!starts_ident()) {
            return make_error(error_here("expected identifier after '.'"));
        }
        return ClassSelector{consume_ident()};
    }

    // Attribute selector
    if (c == '[') {
        auto attribute = parse_attribute_selector();
        if (attribute.is_err()) {
            return make_error(std::move(attribute).error());
        }
        return std::move(attribute).value();
    }

    // Pseudo-class or pseudo-element
    if (c == ':') {
        return parse_pseudo();
    }

    // Type selector
    if (!first_in_compound) {
        return make_error(error_here("type selector must come first in a compound selector"));
    }
    return TypeSelector{consume_ident().to_lowercase()};
}

Result<AttributeSelector, QueryError> SelectorParser::parse_attribute_selector() {
    usize start = m_position;
    consume(); // [

    skip_whitespace();

    if (!starts_ident()) {
        return make_error(error_here("expected attribute name"));
    }

    AttributeSelector sel;
    sel.attribute = consume_ident().to_lowercase();

    skip_whitespace();

    if (at_end()) {
        return make_error(error_at(start, m_position, "unterminated attribute selector"));
    }

    if (peek() == ']') {
        consume();
        sel.matcher = AttributeSelector::Matcher::Exists;
        return sel;
    }

    // Matcher
    char first = peek();
    if (first == '=') {
        consume();
        sel.matcher = AttributeSelector::Matcher::Equals;
    } else if (peek(1) == '=' && (first == '~' || first == '|' || first == '^' ||
                                  first == '$' || first == '*')) {
        consume();
        consume();
        switch (first) {
            case '~': sel.matcher = AttributeSelector::Matcher::Includes; break;
            case '|': sel.matcher = AttributeSelector::Matcher::DashMatch; break;
            case '^': sel.matcher = AttributeSelector::Matcher::Prefix; break;
            case '$': sel.matcher = AttributeSelector::Matcher::Suffix; break;
            default: sel.matcher = AttributeSelector::Matcher::Substring; break;
        }
    } else {
        return make_error(error_here("invalid attribute matcher"));
    }

    skip_whitespace();

    // Value
    if (peek() == '"' || peek() == '\'') {
        auto value = consume_string();
        if (value.is_err()) {
            return make_error(std::move(value).error());
        }
        sel.value = std::move(value).value();
    } else {
        // Unquoted values accept any run of name characters, digits first included
        String value;
        while (!at_end()) {
            if (is_name_char(peek())) {
                value += consume();
            } else if (peek() == '\\' && peek(1) != '\0' && peek(1) != '\n') {
                consume();
                consume_escape(value);
            } else {
                break;
            }
        }
        if (value.empty()) {
            return make_error(error_here("expected attribute value"));
        }
        sel.value = std::move(value);
    }

    skip_whitespace();

    // Case sensitivity flag
    if (starts_ident()) {
        usize flag_start = m_position;
        auto flag = consume_ident().to_lowercase();
        if (flag == "i") {
            sel.case_insensitive = true;
        } else if (flag != "s") {
            return make_error(error_at(flag_start, m_position,
                                       std::format("invalid attribute flag '{}'", flag.view())));
        }
        skip_whitespace();
    }

    if (at_end() || peek() != ']') {
        return make_error(error_here("expected ']' in attribute selector"));
    }
    consume();

    return sel;
}

Result<SimpleSelector, QueryError> SelectorParser::parse_pseudo() {
    usize start = m_position;
    consume(); // :

    if (peek() == ':') {
        consume();
        if (!starts_ident()) {
            return make_error(error_here("expected pseudo-element name"));
        }
        auto name = consume_ident().to_lowercase();
        if (!is_pseudo_element_name(name)) {
            return make_error(error_at(start, m_position,
                                       std::format("unknown pseudo-element '::{}'", name.view())));
        }
        return PseudoElementSelector{std::move(name)};
    }

    if (!starts_ident()) {
        return make_error(error_here("expected pseudo-class name"));
    }
    auto name = consume_ident().to_lowercase();

    // Functional pseudo-class
    if (peek() == '(') {
        consume();

        if (auto kind = lookup(LOGICAL_PSEUDO_CLASSES, name)) {
            if (++m_depth > MAX_NESTING) {
                return make_error(error_at(start, m_position, "selector nesting is too deep"));
            }
            auto arguments = parse_selector_list(true, *kind == PseudoClass::Has);
            --m_depth;
            if (arguments.is_err()) {
                return make_error(std::move(arguments).error());
            }
            return PseudoClassSelector{
                .kind = *kind,
                .name = std::move(name),
                .arguments = std::make_shared<const SelectorList>(std::move(arguments).value()),
            };
        }

        if (auto kind = lookup(NTH_PSEUDO_CLASSES, name)) {
            auto nth = parse_nth_argument(start);
            if (nth.is_err()) {
                return make_error(std::move(nth).error());
            }
            return PseudoClassSelector{.kind = *kind, .name = std::move(name), .nth = nth.value()};
        }

        return make_error(error_at(start, m_position - 1,
                                   std::format("unknown pseudo-class ':{}()'", name.view())));
    }

    // CSS2 single-colon pseudo-elements
    if (is_pseudo_element_name(name)) {
        return PseudoElementSelector{std::move(name)};
    }

    if (auto kind = lookup(STRUCTURAL_PSEUDO_CLASSES, name)) {
        return PseudoClassSelector{.kind = *kind, .name = std::move(name)};
    }

    if (lookup(LOGICAL_PSEUDO_CLASSES, name) || lookup(NTH_PSEUDO_CLASSES, name)) {
        return make_error(error_at(start, m_position,
                                   std::format("pseudo-class ':{}' requires arguments", name.view())));
    }

    return make_error(error_at(start, m_position,
                               std::format("unknown pseudo-class ':{}'", name.view())));
}

Result<NthPattern, QueryError> SelectorParser::parse_nth_argument(usize start) {
    usize argument_start = m_position;
    while (!at_end() && peek() != ')') {
        consume();
    }
    if (at_end()) {
        return make_error(error_at(start, m_position, "expected ')'"));
    }

    auto argument = m_input.substr(argument_start, m_position - argument_start);
    usize argument_end = m_position;
    consume(); // )

    auto nth = parse_nth(argument);
    if (!nth) {
        return make_error(error_at(argument_start, argument_end,
                                   std::format("invalid An+B expression '{}'",
                                               String(argument).trim().view())));
    }
    return *nth;
}

Result<String, QueryError> SelectorParser::consume_string() {
    usize start = m_position;
    char quote = consume();
    String value;

    while (!at_end()) {
        char c = consume();
        if (c == quote) {
            return value;
        }
        if (c == '\n') {
            break;
        }
        if (c == '\\') {
            if (at_end()) {
                break;
            }
            if (peek() == '\n') {
                consume(); // line continuation
                continue;
            }
            consume_escape(value);
            continue;
        }
        value += c;
    }

    return make_error(error_at(start, m_position, "unterminated string"));
}

QueryError SelectorParser::error_at(usize begin, usize end, String message) const {
    logger().debug_fmt("selector error at offset {}: {}", begin, message.view());
    return QueryError::invalid_selector(std::move(message),
                                        SourceSpan::from_offsets(m_input, begin, end));
}

QueryError SelectorParser::error_here(String message) const {
    usize end = std::min(m_position + 1, m_input.size());
    return error_at(m_position, end, std::move(message));
}

bool SelectorParser::skip_whitespace() {
    bool skipped = false;
    while (!at_end() && unicode::is_ascii_whitespace(static_cast<u8>(peek()))) {
        consume();
        skipped = true;
    }
    return skipped;
}

char SelectorParser::peek(usize offset) const {
    if (m_position + offset >= m_input.size()) return '\0';
    return m_input[m_position + offset];
}

char SelectorParser::consume() {
    if (m_position >= m_input.size()) return '\0';
    return m_input[m_position++];
}

bool SelectorParser::starts_ident() const {
    char c = peek();
    if (c == '-') {
        char next = peek(1);
        return next == '-' || is_name_start(next) || (next == '\\' && peek(2) != '\n' && peek(2) != '\0');
    }
    if (c == '\\') {
        return peek(1) != '\n' && peek(1) != '\0';
    }
    return is_name_start(c);
}

String SelectorParser::consume_ident() {
    String result;

    while (!at_end()) {
        char c = peek();
        if (is_name_char(c)) {
            result += consume();
        } else if (c == '\\' && peek(1) != '\n' && peek(1) != '\0') {
            consume();
            consume_escape(result);
        } else {
            break;
        }
    }

    return result;
}

void SelectorParser::consume_escape(String& out) {
    // Backslash already consumed
    if (unicode::is_ascii_hex_digit(static_cast<u8>(peek()))) {
        unicode::CodePoint cp = 0;
        for (int i = 0; i < 6 && unicode::is_ascii_hex_digit(static_cast<u8>(peek())); ++i) {
            char digit = consume();
            cp = cp * 16 + static_cast<unicode::CodePoint>(
                unicode::is_ascii_digit(static_cast<u8>(digit))
                    ? digit - '0'
                    : unicode::to_ascii_lower(digit) - 'a' + 10);
        }
        if (unicode::is_ascii_whitespace(static_cast<u8>(peek()))) {
            consume();
        }
        if (cp == 0 || !unicode::is_valid(cp)) {
            cp = unicode::REPLACEMENT_CHARACTER;
        }
        out.append(cp);
        return;
    }
    if (!at_end()) {
        out += consume();
    }
}

// ============================================================================
// Serialization
// ============================================================================

String to_string(const CompoundSelector& selector) {
    String out;
    for (const auto& simple : selector.selectors) {
        std::visit([&out](const auto& sel) {
            using T = std::decay_t<decltype(sel)>;
            if constexpr (std::is_same_v<T, TypeSelector>) {
                out += sel.tag_name;
            } else if constexpr (std::is_same_v<T, UniversalSelector>) {
                out += '*';
            } else if constexpr (std::is_same_v<T, IdSelector>) {
                out += '#';
                out += sel.id;
            } else if constexpr (std::is_same_v<T, ClassSelector>) {
                out += '.';
                out += sel.class_name;
            } else if constexpr (std::is_same_v<T, AttributeSelector>) {
                out += '[';
                out += sel.attribute;
                if (sel.matcher != AttributeSelector::Matcher::Exists) {
                    out += attribute_operator(sel.matcher);
                    out += '"';
                    out += sel.value.replace_all("\"", "\\\"");
                    out += '"';
                    if (sel.case_insensitive) {
                        out += " i";
                    }
                }
                out += ']';
            } else if constexpr (std::is_same_v<T, PseudoClassSelector>) {
                out += ':';
                out += sel.name;
                if (sel.arguments) {
                    out += '(';
                    out += to_string(*sel.arguments);
                    out += ')';
                } else if (sel.kind == PseudoClass::NthChild || sel.kind == PseudoClass::NthLastChild ||
                           sel.kind == PseudoClass::NthOfType || sel.kind == PseudoClass::NthLastOfType) {
                    out += '(';
                    out += nth_to_string(sel.nth);
                    out += ')';
                }
            } else if constexpr (std::is_same_v<T, PseudoElementSelector>) {
                out += "::";
                out += sel.name;
            }
        }, simple);
    }
    return out;
}

String to_string(const ComplexSelector& selector) {
    String out;
    if (selector.leading_combinator) {
        out += combinator_text(*selector.leading_combinator).substr(1);
    }
    for (const auto& part : selector.parts) {
        out += to_string(part.compound);
        if (part.combinator) {
            out += combinator_text(*part.combinator);
        }
    }
    return out;
}

String to_string(const SelectorList& selectors) {
    String out;
    for (usize i = 0; i < selectors.selectors.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += to_string(selectors.selectors[i]);
    }
    return out;
}

// ============================================================================
// CompiledSelector
// ============================================================================

CompiledSelector::CompiledSelector(String source, std::shared_ptr<const SelectorList> selectors)
    : m_source(std::move(source))
    , m_selectors(std::move(selectors))
    , m_specificity(calculate_specificity(*m_selectors)) {}

Result<CompiledSelector, QueryError> CompiledSelector::compile(std::string_view source) {
    SelectorParser parser;
    auto parsed = parser.parse(source);
    if (parsed.is_err()) {
        return make_error(std::move(parsed).error());
    }

    logger().trace_fmt("compiled selector '{}'", source);
    return CompiledSelector(String(source),
                            std::make_shared<const SelectorList>(std::move(parsed).value()));
}

} // namespace scrape::css
