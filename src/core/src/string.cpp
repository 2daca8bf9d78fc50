#include "folio/core/string.hpp"

namespace folio {

// ============================================================================
// UTF-8 implementation
// ============================================================================

namespace unicode {

usize utf8_code_point_length(char first_byte) {
    auto byte = static_cast<u8>(first_byte);
    if (byte < 0x80) return 1;
    if (byte >= 0xF0 && byte < 0xF8) return 4;
    if (byte >= 0xE0) return byte < 0xF0 ? 3 : 1;
    if (byte >= 0xC0) return 2;
    return 1;
}

DecodedCodePoint utf8_decode(std::string_view bytes) {
    if (bytes.empty()) {
        return {};
    }
    usize length = utf8_code_point_length(bytes[0]);
    auto lead = static_cast<u8>(bytes[0]);
    if (length == 1) {
        return {lead < 0x80 ? static_cast<CodePoint>(lead) : REPLACEMENT_CHARACTER, 1};
    }

    static constexpr u8 lead_mask[] = {0, 0, 0x1F, 0x0F, 0x07};
    CodePoint cp = lead & lead_mask[length];
    for (usize i = 1; i < length; ++i) {
        if (i >= bytes.size() || (static_cast<u8>(bytes[i]) & 0xC0) != 0x80) {
            return {REPLACEMENT_CHARACTER, i};
        }
        cp = (cp << 6) | (static_cast<u8>(bytes[i]) & 0x3F);
    }
    if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) {
        return {REPLACEMENT_CHARACTER, length};
    }
    return {cp, length};
}

} // namespace unicode

// ============================================================================
// String implementation
// ============================================================================

String::String(const char* str) : m_data(str ? str : "") {}

String::String(std::string str) : m_data(std::move(str)) {}

String::String(std::string_view sv) : m_data(sv) {}

void String::append(const String& other) {
    m_data.append(other.m_data);
}

void String::append(std::string_view sv) {
    m_data.append(sv);
}

void String::insert(usize offset, const String& text) {
    m_data.insert(std::min(offset, m_data.size()), text.m_data);
}

void String::erase(usize offset, usize count) {
    if (offset >= m_data.size()) return;
    m_data.erase(offset, count);
}

String String::substring(usize start, usize length) const {
    if (start >= m_data.size()) {
        return String();
    }
    return String(m_data.substr(start, length));
}

std::optional<usize> String::find(const String& needle, usize start) const {
    auto pos = m_data.find(needle.m_data, start);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    return pos;
}

bool String::starts_with(const String& prefix) const {
    return m_data.starts_with(prefix.m_data);
}

String String::trim_end() const {
    return String(m_data.substr(0, m_data.size() - trailing_whitespace()));
}

usize String::trailing_whitespace() const {
    usize count = 0;
    for (auto it = m_data.rbegin(); it != m_data.rend(); ++it) {
        if (!unicode::is_ascii_whitespace(static_cast<u8>(*it))) break;
        ++count;
    }
    return count;
}

std::vector<String> String::split(const String& delimiter) const {
    std::vector<String> result;
    if (delimiter.empty()) {
        result.emplace_back(m_data);
        return result;
    }

    usize start = 0;
    usize end = m_data.find(delimiter.m_data);

    while (end != std::string::npos) {
        result.emplace_back(m_data.substr(start, end - start));
        start = end + delimiter.size();
        end = m_data.find(delimiter.m_data, start);
    }

    result.emplace_back(m_data.substr(start));
    return result;
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

// ============================================================================
// StringBuilder implementation
// ============================================================================

StringBuilder& StringBuilder::append(const String& str) {
    m_buffer.append(str.std_string());
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

} // namespace folio
