#include "TextUtils.hpp"
#include <utf8proc.h>

#include <limits>

namespace processing
{

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // invalid byte: keep going with a replacement character
            result.push_back(static_cast<char32_t>(0xFFFDu));
            ++pos;
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
    result.reserve(utf32_str.size());
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

std::size_t codepointCount(std::string_view utf8_str)
{
    return utf8ToUtf32(utf8_str).size();
}

std::optional<char32_t> lastCodepoint(std::string_view utf8_str)
{
    if (utf8_str.empty())
        return std::nullopt;

    // Step back over continuation bytes (10xxxxxx), at most 3 of them
    std::size_t start = utf8_str.size() - 1;
    std::size_t steps = 0;
    while (start > 0 && steps < 3 && (static_cast<unsigned char>(utf8_str[start]) & 0xC0u) == 0x80u)
    {
        --start;
        ++steps;
    }

    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data() + start);
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size() - start);
    utf8proc_int32_t codepoint;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, len, &codepoint);
    if (bytes != len)
        return static_cast<char32_t>(static_cast<unsigned char>(utf8_str.back()));
    return static_cast<char32_t>(codepoint);
}

bool isUnicodeSpace(char32_t cp)
{
    if (cp >= 0x09u && cp <= 0x0Du)
        return true;
    if (cp >= 0x1Cu && cp <= 0x20u)
        return true;
    if (cp >= 0x2000u && cp <= 0x200Au)
        return true;

    switch (cp)
    {
    case 0x0085u:
    case 0x00A0u:
    case 0x1680u:
    case 0x2028u:
    case 0x2029u:
    case 0x202Fu:
    case 0x205Fu:
    case 0x3000u: // ideographic space
        return true;
    default:
        return false;
    }
}

bool isBlank(std::string_view utf8_str)
{
    for (char32_t cp : utf8ToUtf32(utf8_str))
    {
        if (!isUnicodeSpace(cp))
            return false;
    }
    return true;
}

std::string trimUnicode(std::string_view utf8_str)
{
    std::u32string cps = utf8ToUtf32(utf8_str);
    std::size_t a = 0, b = cps.size();
    while (a < b && isUnicodeSpace(cps[a]))
        a++;
    while (b > a && isUnicodeSpace(cps[b - 1]))
        b--;
    return utf32ToUtf8(cps.substr(a, b - a));
}

std::vector<std::string> splitLines(std::string_view text)
{
    std::vector<std::string> lines;
    std::size_t line_start = 0;
    std::size_t i = 0;

    auto push_line = [&](std::size_t end, std::size_t next)
    {
        lines.emplace_back(text.substr(line_start, end - line_start));
        line_start = next;
        i = next;
    };

    while (i < text.size())
    {
        const unsigned char c = static_cast<unsigned char>(text[i]);
        if (c == '\r')
        {
            std::size_t next = (i + 1 < text.size() && text[i + 1] == '\n') ? i + 2 : i + 1;
            push_line(i, next);
        }
        else if (c == '\n' || c == 0x0B || c == 0x0C || (c >= 0x1C && c <= 0x1E))
        {
            push_line(i, i + 1);
        }
        else if (c == 0xC2 && i + 1 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x85)
        {
            // U+0085 NEXT LINE
            push_line(i, i + 2);
        }
        else if (c == 0xE2 && i + 2 < text.size() && static_cast<unsigned char>(text[i + 1]) == 0x80 &&
                 (static_cast<unsigned char>(text[i + 2]) == 0xA8 || static_cast<unsigned char>(text[i + 2]) == 0xA9))
        {
            // U+2028 LINE SEPARATOR, U+2029 PARAGRAPH SEPARATOR
            push_line(i, i + 3);
        }
        else
        {
            ++i;
        }
    }

    if (line_start < text.size())
        lines.emplace_back(text.substr(line_start));

    return lines;
}

std::vector<std::string> splitAll(std::string_view text, std::string_view delim)
{
    std::vector<std::string> parts;
    if (delim.empty())
    {
        parts.emplace_back(text);
        return parts;
    }

    std::size_t start = 0;
    while (true)
    {
        std::size_t pos = text.find(delim, start);
        if (pos == std::string_view::npos)
        {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + delim.size();
    }
    return parts;
}

std::optional<int> digitValue(char32_t cp)
{
    if (cp >= U'0' && cp <= U'9')
        return static_cast<int>(cp - U'0');
    if (cp >= 0xFF10u && cp <= 0xFF19u)
        return static_cast<int>(cp - 0xFF10u);
    return std::nullopt;
}

std::optional<int> parseInteger(std::string_view text)
{
    std::u32string cps = utf8ToUtf32(trimUnicode(text));
    if (cps.empty())
        return std::nullopt;

    std::size_t pos = 0;
    bool negative = false;
    if (cps[0] == U'+' || cps[0] == U'-')
    {
        negative = cps[0] == U'-';
        pos = 1;
    }
    if (pos >= cps.size())
        return std::nullopt;

    long long value = 0;
    bool prev_digit = false;
    for (; pos < cps.size(); ++pos)
    {
        char32_t cp = cps[pos];
        if (cp == U'_')
        {
            // only a single underscore between two digits
            if (!prev_digit || pos + 1 >= cps.size() || !digitValue(cps[pos + 1]))
                return std::nullopt;
            prev_digit = false;
            continue;
        }

        auto digit = digitValue(cp);
        if (!digit)
            return std::nullopt;

        value = value * 10 + *digit;
        if (value > std::numeric_limits<int>::max())
            return std::nullopt;
        prev_digit = true;
    }

    return static_cast<int>(negative ? -value : value);
}

} // namespace processing
