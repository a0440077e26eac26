#pragma once

#include <string>

namespace verification
{

/// UTF-8 to UTF-32 conversion. Invalid sequences decode to U+FFFD.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// ASCII whitespace, U+001C..U+001F, U+0085 and the Unicode separators (Zs, Zl, Zp)
bool isWhitespace(char32_t cp);

/// Strips leading and trailing whitespace codepoints, NBSP and U+3000 included
std::string trim(const std::string& s);

/// Lower-cases every codepoint (simple case mapping, no length change)
std::u32string toLowerCase(const std::u32string& s);

/// Trim + decode + lower-case, the form values are compared in
std::u32string comparisonForm(const std::string& value);

bool endsWith(const std::string& value, const std::string& suffix);

constexpr char32_t REPLACEMENT_CHAR = U'\uFFFD';

} // namespace verification
