/**
 * HTML Tokenizer - character reference handling
 */

#include "scrape/html/tokenizer.hpp"
#include "../windows_1252.hpp"
#include <unordered_map>

namespace scrape::html {

namespace {

struct NamedEntity {
    unicode::CodePoint code_point;
    // Recognized without the trailing semicolon
    bool legacy;
};

// Common named references. Legacy entries are the Latin-1 set that browsers
// also accept without a semicolon.
const std::unordered_map<std::string_view, NamedEntity>& named_entities() {
    static const std::unordered_map<std::string_view, NamedEntity> table = {
        {"amp", {0x26, true}}, {"AMP", {0x26, true}},
        {"lt", {0x3C, true}}, {"LT", {0x3C, true}},
        {"gt", {0x3E, true}}, {"GT", {0x3E, true}},
        {"quot", {0x22, true}}, {"QUOT", {0x22, true}},
        {"apos", {0x27, false}},
        {"nbsp", {0xA0, true}}, {"iexcl", {0xA1, true}}, {"cent", {0xA2, true}},
        {"pound", {0xA3, true}}, {"curren", {0xA4, true}}, {"yen", {0xA5, true}},
        {"brvbar", {0xA6, true}}, {"sect", {0xA7, true}}, {"uml", {0xA8, true}},
        {"copy", {0xA9, true}}, {"COPY", {0xA9, true}}, {"ordf", {0xAA, true}},
        {"laquo", {0xAB, true}}, {"not", {0xAC, true}}, {"shy", {0xAD, true}},
        {"reg", {0xAE, true}}, {"REG", {0xAE, true}}, {"macr", {0xAF, true}},
        {"deg", {0xB0, true}}, {"plusmn", {0xB1, true}}, {"sup2", {0xB2, true}},
        {"sup3", {0xB3, true}}, {"acute", {0xB4, true}}, {"micro", {0xB5, true}},
        {"para", {0xB6, true}}, {"middot", {0xB7, true}}, {"cedil", {0xB8, true}},
        {"sup1", {0xB9, true}}, {"ordm", {0xBA, true}}, {"raquo", {0xBB, true}},
        {"frac14", {0xBC, true}}, {"frac12", {0xBD, true}}, {"frac34", {0xBE, true}},
        {"iquest", {0xBF, true}},
        {"Agrave", {0xC0, true}}, {"Aacute", {0xC1, true}}, {"Acirc", {0xC2, true}},
        {"Atilde", {0xC3, true}}, {"Auml", {0xC4, true}}, {"Aring", {0xC5, true}},
        {"AElig", {0xC6, true}}, {"Ccedil", {0xC7, true}}, {"Egrave", {0xC8, true}},
        {"Eacute", {0xC9, true}}, {"Ecirc", {0xCA, true}}, {"Euml", {0xCB, true}},
        {"Igrave", {0xCC, true}}, {"Iacute", {0xCD, true}}, {"Icirc", {0xCE, true}},
        {"Iuml", {0xCF, true}}, {"ETH", {0xD0, true}}, {"Ntilde", {0xD1, true}},
        {"Ograve", {0xD2, true}}, {"Oacute", {0xD3, true}}, {"Ocirc", {0xD4, true}},
        {"Otilde", {0xD5, true}}, {"Ouml", {0xD6, true}}, {"times", {0xD7, true}},
        {"Oslash", {0xD8, true}}, {"Ugrave", {0xD9, true}}, {"Uacute", {0xDA, true}},
        {"Ucirc", {0xDB, true}}, {"Uuml", {0xDC, true}}, {"Yacute", {0xDD, true}},
        {"THORN", {0xDE, true}}, {"szlig", {0xDF, true}},
        {"agrave", {0xE0, true}}, {"aacute", {0xE1, true}}, {"acirc", {0xE2, true}},
        {"atilde", {0xE3, true}}, {"auml", {0xE4, true}}, {"aring", {0xE5, true}},
        {"aelig", {0xE6, true}}, {"ccedil", {0xE7, true}}, {"egrave", {0xE8, true}},
        {"eacute", {0xE9, true}}, {"ecirc", {0xEA, true}}, {"euml", {0xEB, true}},
        {"igrave", {0xEC, true}}, {"iacute", {0xED, true}}, {"icirc", {0xEE, true}},
        {"iuml", {0xEF, true}}, {"eth", {0xF0, true}}, {"ntilde", {0xF1, true}},
        {"ograve", {0xF2, true}}, {"oacute", {0xF3, true}}, {"ocirc", {0xF4, true}},
        {"otilde", {0xF5, true}}, {"ouml", {0xF6, true}}, {"divide", {0xF7, true}},
        {"oslash", {0xF8, true}}, {"ugrave", {0xF9, true}}, {"uacute", {0xFA, true}},
        {"ucirc", {0xFB, true}}, {"uuml", {0xFC, true}}, {"yacute", {0xFD, true}},
        {"thorn", {0xFE, true}}, {"yuml", {0xFF, true}},
        {"OElig", {0x152, false}}, {"oelig", {0x153, false}},
        {"Scaron", {0x160, false}}, {"scaron", {0x161, false}}, {"Yuml", {0x178, false}},
        {"fnof", {0x192, false}}, {"circ", {0x2C6, false}}, {"tilde", {0x2DC, false}},
        {"Alpha", {0x391, false}}, {"Beta", {0x392, false}}, {"Gamma", {0x393, false}},
        {"Delta", {0x394, false}}, {"Omega", {0x3A9, false}},
        {"alpha", {0x3B1, false}}, {"beta", {0x3B2, false}}, {"gamma", {0x3B3, false}},
        {"delta", {0x3B4, false}}, {"epsilon", {0x3B5, false}}, {"lambda", {0x3BB, false}},
        {"mu", {0x3BC, false}}, {"pi", {0x3C0, false}}, {"sigma", {0x3C3, false}},
        {"omega", {0x3C9, false}},
        {"ensp", {0x2002, false}}, {"emsp", {0x2003, false}}, {"thinsp", {0x2009, false}},
        {"zwnj", {0x200C, false}}, {"zwj", {0x200D, false}}, {"lrm", {0x200E, false}},
        {"rlm", {0x200F, false}}, {"ndash", {0x2013, false}}, {"mdash", {0x2014, false}},
        {"lsquo", {0x2018, false}}, {"rsquo", {0x2019, false}}, {"sbquo", {0x201A, false}},
        {"ldquo", {0x201C, false}}, {"rdquo", {0x201D, false}}, {"bdquo", {0x201E, false}},
        {"dagger", {0x2020, false}}, {"Dagger", {0x2021, false}}, {"bull", {0x2022, false}},
        {"hellip", {0x2026, false}}, {"permil", {0x2030, false}}, {"prime", {0x2032, false}},
        {"Prime", {0x2033, false}}, {"lsaquo", {0x2039, false}}, {"rsaquo", {0x203A, false}},
        {"oline", {0x203E, false}}, {"euro", {0x20AC, false}}, {"trade", {0x2122, false}},
        {"larr", {0x2190, false}}, {"uarr", {0x2191, false}}, {"rarr", {0x2192, false}},
        {"darr", {0x2193, false}}, {"harr", {0x2194, false}},
        {"minus", {0x2212, false}}, {"infin", {0x221E, false}}, {"ne", {0x2260, false}},
        {"le", {0x2264, false}}, {"ge", {0x2265, false}},
        {"spades", {0x2660, false}}, {"clubs", {0x2663, false}}, {"hearts", {0x2665, false}},
        {"diams", {0x2666, false}},
    };
    return table;
}

constexpr usize MAX_ENTITY_NAME_LENGTH = 32;

bool is_alnum(char c) {
    return unicode::is_ascii_alphanumeric(static_cast<u8>(c));
}

} // namespace

void Tokenizer::consume_character_reference(String& out, bool in_attribute) {

    auto c = peek();
    if (c == '#') {
        consume();
        if (consume_numeric_character_reference(out)) {
            return;
        }
    } else if (c && is_alnum(*c)) {
        if (consume_named_character_reference(out, in_attribute)) {
            return;
        }
    }

    out.append('&');
}

bool Tokenizer::consume_numeric_character_reference(String& out) {
    usize hash_position = m_position - 1;
    bool hex = false;
    if (peek() == 'x' || peek() == 'X') {
        consume();
        hex = true;
    }

    u32 code = 0;
    bool overflow = false;
    usize digits = 0;
    while (auto c = peek()) {
        auto cp = static_cast<u8>(*c);
        u32 digit;
        if (unicode::is_ascii_digit(cp)) {
            digit = static_cast<u32>(*c - '0');
        } else if (hex && unicode::is_ascii_hex_digit(cp)) {
            digit = static_cast<u32>(unicode::to_ascii_lower(*c) - 'a' + 10);
        } else {
            break;
        }
        consume();
        ++digits;
        if (!overflow) {
            code = code * (hex ? 16 : 10) + digit;
            overflow = code > 0x10FFFF;
        }
    }

    if (digits == 0) {
        parse_error("absence-of-digits-in-numeric-character-reference");
        m_position = hash_position;
        return false;
    }

    if (peek() == ';') {
        consume();
    } else {
        parse_error("missing-semicolon-after-character-reference");
    }

    unicode::CodePoint result;
    if (code == 0) {
        parse_error("null-character-reference");
        result = unicode::REPLACEMENT_CHARACTER;
    } else if (overflow) {
        parse_error("character-reference-outside-unicode-range");
        result = unicode::REPLACEMENT_CHARACTER;
    } else if (code >= 0xD800 && code <= 0xDFFF) {
        parse_error("surrogate-character-reference");
        result = unicode::REPLACEMENT_CHARACTER;
    } else if (code >= 0x80 && code <= 0x9F) {
        parse_error("control-character-reference");
        result = detail::windows_1252_code_point(code);
    } else {
        result = static_cast<unicode::CodePoint>(code);
    }

    out.append(result);
    return true;
}

bool Tokenizer::consume_named_character_reference(String& out, bool in_attribute) {
    const auto& table = named_entities();

    usize run = 0;
    while (run < MAX_ENTITY_NAME_LENGTH) {
        auto c = peek(run);
        if (!c || !is_alnum(*c)) {
            break;
        }
        ++run;
    }
    auto name = m_input.substr(m_position, run);

    if (peek(run) == ';') {
        if (auto it = table.find(name); it != table.end()) {
            m_position += run + 1;
            out.append(it->second.code_point);
            return true;
        }
    }

    // Longest legacy prefix, e.g. "&notit;" decodes "&not"
    for (usize length = run; length > 0; --length) {
        auto it = table.find(name.substr(0, length));
        if (it == table.end() || !it->second.legacy) {
            continue;
        }

        auto next = peek(length);
        if (in_attribute && next && (*next == '=' || is_alnum(*next))) {
            return false;
        }

        parse_error("missing-semicolon-after-character-reference");
        m_position += length;
        out.append(it->second.code_point);
        return true;
    }

    if (peek(run) == ';') {
        parse_error("unknown-named-character-reference");
    }
    return false;
}

} // namespace scrape::html
