#pragma once

#include "types.hpp"
#include <functional>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scrape {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;
constexpr CodePoint INVALID_CODE_POINT = 0xFFFFFFFF;

[[nodiscard]] constexpr bool is_valid(CodePoint cp) {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

[[nodiscard]] constexpr bool is_ascii(CodePoint cp) {
    return cp <= 0x7F;
}

[[nodiscard]] constexpr bool is_ascii_alpha(CodePoint cp) {
    return (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z');
}

[[nodiscard]] constexpr bool is_ascii_digit(CodePoint cp) {
    return cp >= '0' && cp <= '9';
}

[[nodiscard]] constexpr bool is_ascii_alphanumeric(CodePoint cp) {
    return is_ascii_alpha(cp) || is_ascii_digit(cp);
}

// HTML whitespace: space, tab, LF, CR, FF
[[nodiscard]] constexpr bool is_ascii_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f';
}

[[nodiscard]] constexpr bool is_ascii_hex_digit(CodePoint cp) {
    return is_ascii_digit(cp) || (cp >= 'A' && cp <= 'F') || (cp >= 'a' && cp <= 'f');
}

[[nodiscard]] constexpr bool is_ascii_upper(CodePoint cp) {
    return cp >= 'A' && cp <= 'Z';
}

[[nodiscard]] constexpr bool is_ascii_lower(CodePoint cp) {
    return cp >= 'a' && cp <= 'z';
}

[[nodiscard]] constexpr CodePoint to_ascii_lower(CodePoint cp) {
    return is_ascii_upper(cp) ? cp + ('a' - 'A') : cp;
}

[[nodiscard]] constexpr CodePoint to_ascii_upper(CodePoint cp) {
    return is_ascii_lower(cp) ? cp - ('a' - 'A') : cp;
}

[[nodiscard]] constexpr char to_ascii_lower(char c) {
    return (c >= 'A' && c <= 'Z') ? static_cast<char>(c + ('a' - 'A')) : c;
}

struct Utf8DecodeResult {
    CodePoint code_point;
    usize bytes_consumed;
};

// Invalid or truncated sequences decode to REPLACEMENT_CHARACTER and consume
// at least one byte.
[[nodiscard]] Utf8DecodeResult utf8_decode(const char* data, usize length);
[[nodiscard]] usize utf8_encode(CodePoint cp, char* buffer);
[[nodiscard]] usize utf8_code_point_length(char first_byte);

// Returns the byte offset of the first invalid sequence, if any.
[[nodiscard]] std::optional<usize> find_invalid_utf8(std::string_view text);
[[nodiscard]] bool is_valid_utf8(std::string_view text);
[[nodiscard]] std::string sanitize_utf8(std::string_view text);

} // namespace unicode

// ============================================================================
// String - UTF-8 encoded string
// ============================================================================

class String {
public:
    using const_iterator = std::string::const_iterator;

    String() = default;
    String(const char* str);
    String(const char* str, usize length);
    String(std::string str);
    String(std::string_view sv);
    String(usize count, char c);

    [[nodiscard]] static String from_code_point(unicode::CodePoint cp);

    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] usize length() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }
    [[nodiscard]] usize code_point_count() const;

    [[nodiscard]] std::string_view view() const noexcept { return m_data; }
    [[nodiscard]] const std::string& std_string() const noexcept { return m_data; }
    operator std::string_view() const noexcept { return m_data; }

    const_iterator begin() const { return m_data.begin(); }
    const_iterator end() const { return m_data.end(); }

    void append(const String& other) { m_data.append(other.m_data); }
    void append(std::string_view sv) { m_data.append(sv); }
    void append(const char* str) { m_data.append(str); }
    void append(char c) { m_data.push_back(c); }
    void append(unicode::CodePoint cp);
    void clear() { m_data.clear(); }
    void reserve(usize capacity) { m_data.reserve(capacity); }

    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;

    [[nodiscard]] std::optional<usize> find(std::string_view needle, usize start = 0) const;
    [[nodiscard]] std::optional<usize> find(char c, usize start = 0) const;
    [[nodiscard]] bool contains(std::string_view needle) const;
    [[nodiscard]] bool contains(char c) const;
    [[nodiscard]] bool starts_with(std::string_view prefix) const { return view().starts_with(prefix); }
    [[nodiscard]] bool ends_with(std::string_view suffix) const { return view().ends_with(suffix); }

    // ASCII-only case mapping; non-ASCII bytes pass through unchanged
    [[nodiscard]] String to_lowercase() const;
    [[nodiscard]] String to_uppercase() const;
    [[nodiscard]] bool equals_ignore_case(std::string_view other) const;

    [[nodiscard]] String trim() const;
    [[nodiscard]] String trim_start() const;
    [[nodiscard]] String trim_end() const;
    [[nodiscard]] bool is_whitespace() const;

    [[nodiscard]] std::vector<String> split(char delimiter) const;
    // Splits on runs of ASCII whitespace, dropping empty pieces
    [[nodiscard]] std::vector<String> split_whitespace() const;

    [[nodiscard]] String replace_all(std::string_view from, std::string_view to) const;

    [[nodiscard]] bool operator==(const String& other) const { return m_data == other.m_data; }
    [[nodiscard]] bool operator==(const char* other) const { return m_data == other; }
    [[nodiscard]] bool operator==(std::string_view other) const { return m_data == other; }
    [[nodiscard]] bool operator<(const String& other) const { return m_data < other.m_data; }

    String operator+(const String& other) const;
    String& operator+=(const String& other);
    String& operator+=(std::string_view sv);
    String& operator+=(const char* str);
    String& operator+=(char c);
    String& operator+=(unicode::CodePoint cp);

    const char& operator[](usize index) const { return m_data[index]; }

private:
    std::string m_data;
};

inline String operator""_s(const char* str, std::size_t len) {
    return String(str, len);
}

std::ostream& operator<<(std::ostream& out, const String& str);

// ============================================================================
// StringBuilder
// ============================================================================

class StringBuilder {
public:
    StringBuilder() = default;
    explicit StringBuilder(usize initial_capacity);

    StringBuilder& append(const String& str);
    StringBuilder& append(std::string_view sv);
    StringBuilder& append(const char* str);
    StringBuilder& append(char c);
    StringBuilder& append(unicode::CodePoint cp);
    StringBuilder& append(i64 value);
    StringBuilder& append(u64 value);

    void clear() { m_buffer.clear(); }
    void reserve(usize capacity) { m_buffer.reserve(capacity); }

    [[nodiscard]] String build() const { return String(m_buffer); }
    [[nodiscard]] String take() { return String(std::move(m_buffer)); }
    [[nodiscard]] std::string_view view() const { return m_buffer; }
    [[nodiscard]] usize size() const { return m_buffer.size(); }
    [[nodiscard]] bool empty() const { return m_buffer.empty(); }

private:
    std::string m_buffer;
};

} // namespace scrape

template<>
struct std::hash<scrape::String> {
    std::size_t operator()(const scrape::String& str) const noexcept {
        return std::hash<std::string_view>{}(str.view());
    }
};
