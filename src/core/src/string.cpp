#include "scrape/core/string.hpp"
#include <charconv>
#include <ostream>

namespace scrape {

// ============================================================================
// UTF-8
// ============================================================================

namespace unicode {

Utf8DecodeResult utf8_decode(const char* data, usize length) {
    if (length == 0 || data == nullptr) {
        return {INVALID_CODE_POINT, 0};
    }

    auto byte = static_cast<u8>(data[0]);
    if ((byte & 0x80) == 0) {
        return {static_cast<CodePoint>(byte), 1};
    }

    usize seq_len;
    CodePoint cp;
    if ((byte & 0xE0) == 0xC0) {
        seq_len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        seq_len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        seq_len = 4;
        cp = byte & 0x07;
    } else {
        return {REPLACEMENT_CHARACTER, 1};
    }

    for (usize i = 1; i < seq_len; ++i) {
        if (i >= length) {
            return {REPLACEMENT_CHARACTER, i};
        }
        byte = static_cast<u8>(data[i]);
        if ((byte & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i};
        }
        cp = (cp << 6) | (byte & 0x3F);
    }

    static constexpr CodePoint min_for_length[] = {0, 0, 0x80, 0x800, 0x10000};
    if (!is_valid(cp) || cp < min_for_length[seq_len]) {
        return {REPLACEMENT_CHARACTER, seq_len};
    }

    return {cp, seq_len};
}

usize utf8_encode(CodePoint cp, char* buffer) {
    if (cp < 0x80) {
        buffer[0] = static_cast<char>(cp);
        return 1;
    }
    if (cp < 0x800) {
        buffer[0] = static_cast<char>(0xC0 | (cp >> 6));
        buffer[1] = static_cast<char>(0x80 | (cp & 0x3F));
        return 2;
    }
    if (cp < 0x10000) {
        buffer[0] = static_cast<char>(0xE0 | (cp >> 12));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | (cp & 0x3F));
        return 3;
    }
    if (cp <= 0x10FFFF) {
        buffer[0] = static_cast<char>(0xF0 | (cp >> 18));
        buffer[1] = static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        buffer[2] = static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        buffer[3] = static_cast<char>(0x80 | (cp & 0x3F));
        return 4;
    }
    return 0;
}

usize utf8_code_point_length(char first_byte) {
    auto byte = static_cast<u8>(first_byte);
    if ((byte & 0x80) == 0) return 1;
    if ((byte & 0xE0) == 0xC0) return 2;
    if ((byte & 0xF0) == 0xE0) return 3;
    if ((byte & 0xF8) == 0xF0) return 4;
    return 1;
}

std::optional<usize> find_invalid_utf8(std::string_view text) {
    usize pos = 0;
    while (pos < text.size()) {
        if (static_cast<u8>(text[pos]) < 0x80) {
            ++pos;
            continue;
        }
        auto decoded = utf8_decode(text.data() + pos, text.size() - pos);
        if (decoded.code_point == REPLACEMENT_CHARACTER) {
            // A literal U+FFFD in the input is valid
            if (text.substr(pos, 3) != "\xEF\xBF\xBD") {
                return pos;
            }
        }
        pos += decoded.bytes_consumed;
    }
    return std::nullopt;
}

bool is_valid_utf8(std::string_view text) {
    return !find_invalid_utf8(text).has_value();
}

std::string sanitize_utf8(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    usize pos = 0;
    while (pos < text.size()) {
        auto decoded = utf8_decode(text.data() + pos, text.size() - pos);
        char buffer[4];
        usize len = utf8_encode(decoded.code_point, buffer);
        out.append(buffer, len);
        pos += decoded.bytes_consumed;
    }
    return out;
}

} // namespace unicode

// ============================================================================
// String
// ============================================================================

String::String(const char* str) : m_data(str ? str : "") {}

String::String(const char* str, usize length) : m_data(str, length) {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

String::String(usize count, char c) : m_data(count, c) {}

String String::from_code_point(unicode::CodePoint cp) {
    String result;
    result.append(cp);
    return result;
}

usize String::code_point_count() const {
    usize count = 0;
    for (char c : m_data) {
        // Count every byte that is not a continuation byte
        if ((static_cast<u8>(c) & 0xC0) != 0x80) {
            ++count;
        }
    }
    return count;
}

void String::append(unicode::CodePoint cp) {
    char buffer[4];
    usize len = unicode::utf8_encode(cp, buffer);
    m_data.append(buffer, len);
}

String String::substring(usize start, usize length) const {
    if (start >= m_data.size()) {
        return {};
    }
    return String(m_data.substr(start, length));
}

std::optional<usize> String::find(std::string_view needle, usize start) const {
    auto pos = m_data.find(needle, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

std::optional<usize> String::find(char c, usize start) const {
    auto pos = m_data.find(c, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

bool String::contains(std::string_view needle) const {
    return m_data.find(needle) != std::string::npos;
}

bool String::contains(char c) const {
    return m_data.find(c) != std::string::npos;
}

String String::to_lowercase() const {
    std::string result(m_data);
    for (char& c : result) {
        c = unicode::to_ascii_lower(c);
    }
    return String(std::move(result));
}

String String::to_uppercase() const {
    std::string result(m_data);
    for (char& c : result) {
        if (c >= 'a' && c <= 'z') {
            c = static_cast<char>(c - ('a' - 'A'));
        }
    }
    return String(std::move(result));
}

bool String::equals_ignore_case(std::string_view other) const {
    if (m_data.size() != other.size()) {
        return false;
    }
    for (usize i = 0; i < other.size(); ++i) {
        if (unicode::to_ascii_lower(m_data[i]) != unicode::to_ascii_lower(other[i])) {
            return false;
        }
    }
    return true;
}

String String::trim() const {
    return trim_start().trim_end();
}

String String::trim_start() const {
    usize start = 0;
    while (start < m_data.size() && unicode::is_ascii_whitespace(static_cast<u8>(m_data[start]))) {
        ++start;
    }
    return String(m_data.substr(start));
}

String String::trim_end() const {
    usize end = m_data.size();
    while (end > 0 && unicode::is_ascii_whitespace(static_cast<u8>(m_data[end - 1]))) {
        --end;
    }
    return String(m_data.substr(0, end));
}

bool String::is_whitespace() const {
    for (char c : m_data) {
        if (!unicode::is_ascii_whitespace(static_cast<u8>(c))) {
            return false;
        }
    }
    return true;
}

std::vector<String> String::split(char delimiter) const {
    std::vector<String> result;
    usize start = 0;
    usize end = m_data.find(delimiter);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + 1;
        end = m_data.find(delimiter, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
}

std::vector<String> String::split_whitespace() const {
    std::vector<String> result;
    usize pos = 0;
    while (pos < m_data.size()) {
        while (pos < m_data.size() && unicode::is_ascii_whitespace(static_cast<u8>(m_data[pos]))) {
            ++pos;
        }
        usize start = pos;
        while (pos < m_data.size() && !unicode::is_ascii_whitespace(static_cast<u8>(m_data[pos]))) {
            ++pos;
        }
        if (pos > start) {
            result.emplace_back(m_data.substr(start, pos - start));
        }
    }
    return result;
}

String String::replace_all(std::string_view from, std::string_view to) const {
    if (from.empty()) {
        return *this;
    }
    std::string result;
    result.reserve(m_data.size());
    usize pos = 0;
    while (true) {
        auto hit = m_data.find(from, pos);
        if (hit == std::string::npos) {
            result.append(m_data, pos, std::string::npos);
            break;
        }
        result.append(m_data, pos, hit - pos);
        result.append(to);
        pos = hit + from.size();
    }
    return String(std::move(result));
}

String String::operator+(const String& other) const {
    return String(m_data + other.m_data);
}

String& String::operator+=(const String& other) {
    m_data += other.m_data;
    return *this;
}

String& String::operator+=(std::string_view sv) {
    m_data += sv;
    return *this;
}

String& String::operator+=(const char* str) {
    m_data += str;
    return *this;
}

String& String::operator+=(char c) {
    m_data += c;
    return *this;
}

String& String::operator+=(unicode::CodePoint cp) {
    append(cp);
    return *this;
}

std::ostream& operator<<(std::ostream& out, const String& str) {
    return out << str.view();
}

// ============================================================================
// StringBuilder
// ============================================================================

StringBuilder::StringBuilder(usize initial_capacity) {
    m_buffer.reserve(initial_capacity);
}

StringBuilder& StringBuilder::append(const String& str) {
    m_buffer.append(str.view());
    return *this;
}

StringBuilder& StringBuilder::append(std::string_view sv) {
    m_buffer.append(sv);
    return *this;
}

StringBuilder& StringBuilder::append(const char* str) {
    if (str) {
        m_buffer.append(str);
    }
    return *this;
}

StringBuilder& StringBuilder::append(char c) {
    m_buffer.push_back(c);
    return *this;
}

StringBuilder& StringBuilder::append(unicode::CodePoint cp) {
    char buffer[4];
    usize len = unicode::utf8_encode(cp, buffer);
    m_buffer.append(buffer, len);
    return *this;
}

StringBuilder& StringBuilder::append(i64 value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

StringBuilder& StringBuilder::append(u64 value) {
    char buffer[32];
    auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
    m_buffer.append(buffer, static_cast<usize>(result.ptr - buffer));
    return *this;
}

} // namespace scrape
