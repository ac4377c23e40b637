#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

/// UTF-8 to UTF-32 conversion
std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// Number of code points in a UTF-8 string
std::size_t codepointCount(std::string_view utf8_str);

/// Last code point of a UTF-8 string, nullopt when empty
std::optional<char32_t> lastCodepoint(std::string_view utf8_str);

/// Whitespace as a Unicode-aware isspace sees it (includes U+3000 ideographic space)
bool isUnicodeSpace(char32_t cp);

/// True when the text is empty or consists of whitespace only
bool isBlank(std::string_view utf8_str);

std::string trimUnicode(std::string_view utf8_str);

// Splits on \n, \r\n, \r and the Unicode line separators.
// A trailing line break does not produce a final empty line.
std::vector<std::string> splitLines(std::string_view text);

// Splits on every occurrence of delim, keeping empty fields ("a//b" -> a, "", b).
std::vector<std::string> splitAll(std::string_view text, std::string_view delim);

// Integer with optional sign; ASCII or full-width digits, single '_' between digits,
// surrounding whitespace ignored.
std::optional<int> parseInteger(std::string_view text);

/// Full-width digit U+FF10..U+FF19 or ASCII digit, as its value
std::optional<int> digitValue(char32_t cp);

} // namespace processing
