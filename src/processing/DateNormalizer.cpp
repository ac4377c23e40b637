#include "DateNormalizer.hpp"
#include "TextUtils.hpp"

#include <chrono>
#include <iomanip>
#include <optional>
#include <sstream>

namespace processing
{

namespace
{

constexpr std::string_view kYearMarker = "年";
constexpr std::string_view kMonthMarker = "月";
constexpr std::string_view kDayMarker = "日";

// Field `index` of text split on delim, empty when there are fewer fields
std::string fieldAt(std::string_view text, std::string_view delim, std::size_t index)
{
    auto parts = splitAll(text, delim);
    return index < parts.size() ? parts[index] : std::string();
}

std::optional<CalendarDate> makeDate(std::optional<int> year, std::optional<int> month, std::optional<int> day)
{
    if (!year || !month || !day)
        return std::nullopt;
    if (!isValidCalendarDate(*year, *month, *day))
        return std::nullopt;
    return CalendarDate{ *year, *month, *day };
}

} // anonymous namespace

bool isValidCalendarDate(int year, int month, int day) noexcept
{
    if (year < 1 || year > 9999)
        return false;
    if (month < 1 || month > 12 || day < 1 || day > 31)
        return false;

    const std::chrono::year_month_day ymd{ std::chrono::year{ year },
                                           std::chrono::month{ static_cast<unsigned>(month) },
                                           std::chrono::day{ static_cast<unsigned>(day) } };
    return ymd.ok();
}

std::string toIsoString(const CalendarDate& date)
{
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << date.year << '-' << std::setw(2) << date.month << '-'
        << std::setw(2) << date.day;
    return oss.str();
}

std::string toString(const DateValue& value)
{
    if (const auto* date = std::get_if<CalendarDate>(&value))
        return toIsoString(*date);
    return std::get<std::string>(value);
}

DateValue DateNormalizer::normalize(std::string_view input)
{
    if (input.find(kYearMarker) != std::string_view::npos && input.find(kMonthMarker) != std::string_view::npos &&
        input.find(kDayMarker) != std::string_view::npos)
    {
        // The CJK form owns the string once its markers are present
        return parseCjk(input);
    }

    if (input.find('/') != std::string_view::npos)
        return parseDelimited(input, "/");
    if (input.find('-') != std::string_view::npos)
        return parseDelimited(input, "-");

    return std::string(input);
}

DateValue DateNormalizer::normalize(const DateValue& value)
{
    if (const auto* raw = std::get_if<std::string>(&value))
        return normalize(std::string_view(*raw));
    return value;
}

DateValue DateNormalizer::parseCjk(std::string_view input)
{
    std::string year_text = fieldAt(input, kYearMarker, 0);
    std::string month_text = fieldAt(fieldAt(input, kYearMarker, 1), kMonthMarker, 0);
    std::string day_text = fieldAt(fieldAt(input, kMonthMarker, 1), kDayMarker, 0);

    if (auto date = makeDate(parseInteger(year_text), parseInteger(month_text), parseInteger(day_text)))
        return *date;
    return std::string(input);
}

DateValue DateNormalizer::parseDelimited(std::string_view input, std::string_view delimiter)
{
    auto parts = splitAll(input, delimiter);
    if (parts.size() != 3)
        return std::string(input);

    std::optional<CalendarDate> date;
    if (codepointCount(parts[0]) == 4)
    {
        date = makeDate(parseInteger(parts[0]), parseInteger(parts[1]), parseInteger(parts[2]));
    }
    else
    {
        auto second = parseInteger(parts[1]);
        if (!second)
            return std::string(input);

        if (*second > 12)
            date = makeDate(parseInteger(parts[2]), parseInteger(parts[0]), second);
        else
            date = makeDate(parseInteger(parts[2]), second, parseInteger(parts[0]));
    }

    if (date)
        return *date;
    return std::string(input);
}

} // namespace processing
