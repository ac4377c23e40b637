#include <catch2/catch_test_macros.hpp>
#include "processing/DateNormalizer.hpp"

using namespace processing;

namespace
{

bool isDate(const DateValue& value, int year, int month, int day)
{
    const auto* date = std::get_if<CalendarDate>(&value);
    return date && *date == CalendarDate{ year, month, day };
}

bool isRaw(const DateValue& value, const std::string& text)
{
    const auto* raw = std::get_if<std::string>(&value);
    return raw && *raw == text;
}

} // namespace

TEST_CASE("DateNormalizer - CJK dates", "[date]")
{
    REQUIRE(isDate(DateNormalizer::normalize("2023年05月10日"), 2023, 5, 10));
    REQUIRE(isDate(DateNormalizer::normalize("2023年5月1日"), 2023, 5, 1));

    SECTION("Full-width digits")
    {
        REQUIRE(isDate(DateNormalizer::normalize("２０２３年５月１０日"), 2023, 5, 10));
    }

    SECTION("Era years are not numbers")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("元年5月10日"), "元年5月10日"));
    }

    SECTION("Markers present but fields malformed stay raw")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("2023年05/10月日"), "2023年05/10月日"));
    }

    SECTION("Impossible calendar dates stay raw")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("2023年02月30日"), "2023年02月30日"));
        REQUIRE(isRaw(DateNormalizer::normalize("2023年13月01日"), "2023年13月01日"));
    }
}

TEST_CASE("DateNormalizer - Delimited dates", "[date]")
{
    SECTION("Year first when the first field has four characters")
    {
        REQUIRE(isDate(DateNormalizer::normalize("2023/05/10"), 2023, 5, 10));
        REQUIRE(isDate(DateNormalizer::normalize("2023-05-10"), 2023, 5, 10));
    }

    SECTION("Month first when the middle field exceeds 12")
    {
        REQUIRE(isDate(DateNormalizer::normalize("12/25/2023"), 2023, 12, 25));
    }

    SECTION("Day first otherwise")
    {
        REQUIRE(isDate(DateNormalizer::normalize("05/10/2023"), 2023, 10, 5));
        REQUIRE(isDate(DateNormalizer::normalize("10-05-2023"), 2023, 5, 10));
        REQUIRE(isDate(DateNormalizer::normalize("25/12/2023"), 2023, 12, 25));
    }

    SECTION("Slash takes precedence over dash")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("2023/05-10"), "2023/05-10"));
    }

    SECTION("Invalid year-first date stays raw")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("2023/13/40"), "2023/13/40"));
    }

    SECTION("Invalid day-first date stays raw")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("31/02/2023"), "31/02/2023"));
    }

    SECTION("Leap days")
    {
        REQUIRE(isDate(DateNormalizer::normalize("2024/02/29"), 2024, 2, 29));
        REQUIRE(isRaw(DateNormalizer::normalize("2023/02/29"), "2023/02/29"));
    }

    SECTION("Wrong number of fields stays raw")
    {
        REQUIRE(isRaw(DateNormalizer::normalize("2023/05"), "2023/05"));
        REQUIRE(isRaw(DateNormalizer::normalize("2023/05/10/01"), "2023/05/10/01"));
    }

    SECTION("Non-numeric fields stay raw")
    {
        // only ASCII and full-width digits count; Arabic-Indic digits do not
        REQUIRE(isRaw(DateNormalizer::normalize("٢٠٢٣/٠٥/١٠"), "٢٠٢٣/٠٥/١٠"));
        REQUIRE(isRaw(DateNormalizer::normalize("abcd/05/10"), "abcd/05/10"));
        REQUIRE(isRaw(DateNormalizer::normalize("05/May/2023"), "05/May/2023"));
    }
}

TEST_CASE("DateNormalizer - Unrecognized input", "[date]")
{
    REQUIRE(isRaw(DateNormalizer::normalize(""), ""));
    REQUIRE(isRaw(DateNormalizer::normalize("yesterday"), "yesterday"));
    REQUIRE(isRaw(DateNormalizer::normalize("20230510"), "20230510"));
}

TEST_CASE("DateNormalizer - Value overload", "[date]")
{
    SECTION("Calendar dates pass through")
    {
        DateValue value = CalendarDate{ 1999, 12, 31 };
        REQUIRE(isDate(DateNormalizer::normalize(value), 1999, 12, 31));
    }

    SECTION("Raw strings are parsed")
    {
        DateValue value = std::string("1999/12/31");
        REQUIRE(isDate(DateNormalizer::normalize(value), 1999, 12, 31));
    }

    SECTION("Normalizing twice changes nothing")
    {
        for (const char* input : { "2023年05月10日", "05/10/2023", "not a date", "2023/02/29" })
        {
            DateValue once = DateNormalizer::normalize(input);
            REQUIRE(DateNormalizer::normalize(once) == once);
        }
    }
}

TEST_CASE("DateNormalizer - Rendering", "[date]")
{
    REQUIRE(toIsoString(CalendarDate{ 2023, 5, 1 }) == "2023-05-01");
    REQUIRE(toIsoString(CalendarDate{ 987, 12, 9 }) == "0987-12-09");
    REQUIRE(toString(DateValue{ std::string("raw text") }) == "raw text");
    REQUIRE(isValidCalendarDate(2000, 2, 29));
    REQUIRE_FALSE(isValidCalendarDate(1900, 2, 29));
    REQUIRE_FALSE(isValidCalendarDate(0, 1, 1));
    REQUIRE_FALSE(isValidCalendarDate(10000, 1, 1));
}
