#pragma once

#include <string>
#include <string_view>
#include <variant>

namespace processing
{

// Always a valid Gregorian date with year in 1..9999.
struct CalendarDate
{
    int year = 1;
    int month = 1;
    int day = 1;

    bool operator==(const CalendarDate&) const = default;
};

// Either a parsed calendar date or the original text that could not be parsed.
using DateValue = std::variant<CalendarDate, std::string>;

[[nodiscard]] bool isValidCalendarDate(int year, int month, int day) noexcept;

[[nodiscard]] inline bool isCalendarDate(const DateValue& value) noexcept
{
    return std::holds_alternative<CalendarDate>(value);
}

// "YYYY-MM-DD" for a calendar date, the raw text otherwise
[[nodiscard]] std::string toString(const DateValue& value);
[[nodiscard]] std::string toIsoString(const CalendarDate& date);

/**
 * @brief Heuristic publication-date parser.
 *
 * Formats are tried in order and the first applicable one decides:
 *   1. "YYYY年MM月DD日" when all three ideographs are present
 *   2. three fields separated by '/' (preferred) or '-':
 *      YYYY/MM/DD when the first field has 4 characters,
 *      MM/DD/YYYY when the second field is above 12,
 *      DD/MM/YYYY otherwise
 * Anything unparseable or not a real calendar date comes back as the
 * original string. Never throws.
 */
class DateNormalizer
{
public:
    [[nodiscard]] static DateValue normalize(std::string_view input);
    [[nodiscard]] static DateValue normalize(const std::string& input) { return normalize(std::string_view(input)); }
    [[nodiscard]] static DateValue normalize(const char* input) { return normalize(std::string_view(input)); }

    // Calendar dates pass through untouched; raw strings are parsed.
    [[nodiscard]] static DateValue normalize(const DateValue& value);

private:
    static DateValue parseCjk(std::string_view input);
    static DateValue parseDelimited(std::string_view input, std::string_view delimiter);
};

} // namespace processing
