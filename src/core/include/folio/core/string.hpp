#pragma once

#include "types.hpp"
#include <charconv>
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <ostream>

namespace folio {

// ============================================================================
// Unicode utilities
// ============================================================================

namespace unicode {

using CodePoint = char32_t;

constexpr CodePoint REPLACEMENT_CHARACTER = 0xFFFD;

[[nodiscard]] constexpr bool is_ascii_whitespace(CodePoint cp) {
    return cp == ' ' || cp == '\t' || cp == '\n' || cp == '\r' || cp == '\f';
}

// Lead byte to sequence length; stray continuation bytes count as 1
[[nodiscard]] usize utf8_code_point_length(char first_byte);

struct DecodedCodePoint {
    CodePoint code_point{REPLACEMENT_CHARACTER};
    usize length{0};
};

// First code point of bytes; malformed input yields REPLACEMENT_CHARACTER
// with a length of at least 1 so callers always advance
[[nodiscard]] DecodedCodePoint utf8_decode(std::string_view bytes);

} // namespace unicode

// ============================================================================
// String - UTF-8 encoded string; sizes and offsets are in bytes
// ============================================================================

class String {
public:
    String() = default;
    String(const char* str);
    String(std::string str);
    String(std::string_view sv);

    [[nodiscard]] const char* c_str() const noexcept { return m_data.c_str(); }
    [[nodiscard]] const char* data() const noexcept { return m_data.data(); }
    [[nodiscard]] usize size() const noexcept { return m_data.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept { return m_data; }
    [[nodiscard]] const std::string& std_string() const noexcept { return m_data; }

    // Modification
    void append(const String& other);
    void append(std::string_view sv);
    void insert(usize offset, const String& text);
    void erase(usize offset, usize count);
    void clear() { m_data.clear(); }

    [[nodiscard]] String substring(usize start, usize length = std::string::npos) const;

    [[nodiscard]] std::optional<usize> find(const String& needle, usize start = 0) const;
    [[nodiscard]] bool starts_with(const String& prefix) const;

    [[nodiscard]] String trim_end() const;

    // Number of trailing bytes that are ASCII whitespace
    [[nodiscard]] usize trailing_whitespace() const;

    [[nodiscard]] std::vector<String> split(const String& delimiter) const;

    [[nodiscard]] bool operator==(const String& other) const { return m_data == other.m_data; }
    [[nodiscard]] bool operator!=(const String& other) const { return m_data != other.m_data; }

    String operator+(const String& other) const;
    String& operator+=(const String& other);
    String& operator+=(std::string_view sv);

    const char& operator[](usize index) const { return m_data[index]; }

private:
    std::string m_data;
};

inline std::ostream& operator<<(std::ostream& os, const String& str) {
    return os << str.view();
}

// ============================================================================
// StringBuilder - chained message and id assembly
// ============================================================================

class StringBuilder {
public:
    StringBuilder& append(const String& str);
    StringBuilder& append(std::string_view sv);
    StringBuilder& append(const char* str);
    StringBuilder& append(char c);

    StringBuilder& append(i64 value) { return append_number(value); }
    StringBuilder& append(u64 value) { return append_number(value); }
    StringBuilder& append(f64 value) { return append_number(value); }
    StringBuilder& append(i32 value) { return append_number(static_cast<i64>(value)); }
    StringBuilder& append(u32 value) { return append_number(static_cast<u64>(value)); }
    StringBuilder& append(f32 value) { return append_number(static_cast<f64>(value)); }

    void clear() { m_buffer.clear(); }

    [[nodiscard]] String build() const { return String(m_buffer); }
    [[nodiscard]] std::string_view view() const { return m_buffer; }
    [[nodiscard]] usize size() const { return m_buffer.size(); }
    [[nodiscard]] bool empty() const { return m_buffer.empty(); }

private:
    template<typename Number>
    StringBuilder& append_number(Number value) {
        char digits[64];
        auto converted = std::to_chars(digits, digits + sizeof(digits), value);
        m_buffer.append(digits, converted.ptr);
        return *this;
    }

    std::string m_buffer;
};

} // namespace folio

template<>
struct std::hash<folio::String> {
    std::size_t operator()(const folio::String& str) const noexcept {
        return std::hash<std::string>{}(str.std_string());
    }
};
