#include "TextUtils.hpp"
#include <utf8proc.h>

#include <algorithm>
#include <cctype>

namespace verification
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Skip one byte so a stray continuation byte still counts as one edit
            result.push_back(REPLACEMENT_CHAR);
            pos += 1;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isWhitespace(char32_t cp)
{
    if (cp < 0x80)
    {
        // ASCII isspace plus the information separators U+001C..U+001F
        return std::isspace(static_cast<unsigned char>(cp)) || (cp >= 0x1C && cp <= 0x1F);
    }
    if (cp == 0x85)
        return true;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_ZS:
    case UTF8PROC_CATEGORY_ZL:
    case UTF8PROC_CATEGORY_ZP:
        return true;
    default:
        return false;
    }
}

std::string trim(const std::string& s)
{
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(s.data());
    const utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(s.size());

    // Byte range from the first to just past the last non-whitespace codepoint
    size_t start = s.size();
    size_t end = 0;
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        bool space = false;
        if (bytes <= 0)
        {
            // Invalid bytes are content
            bytes = 1;
        }
        else
        {
            space = isWhitespace(static_cast<char32_t>(codepoint));
        }

        if (!space)
        {
            start = std::min(start, static_cast<size_t>(pos));
            end = static_cast<size_t>(pos + bytes);
        }
        pos += bytes;
    }

    if (start >= end)
        return {};
    return s.substr(start, end - start);
}

std::u32string toLowerCase(const std::u32string& s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t cp : s)
    {
        out.push_back(static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp))));
    }
    return out;
}

std::u32string comparisonForm(const std::string& value)
{
    return toLowerCase(utf8ToUtf32(trim(value)));
}

bool endsWith(const std::string& value, const std::string& suffix)
{
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace verification
