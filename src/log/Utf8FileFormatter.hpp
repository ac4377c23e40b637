#pragma once

#include <plog/Formatters/TxtFormatter.h>
#include <plog/Util.h>

// File formatter for the page logs. Extracted newspaper text is mostly CJK,
// so records are written as UTF-8 without a byte order mark header.
// The UTC variant is selected by [logging] utc = true.
template<bool UseUtcTime>
struct Utf8FileFormatterImpl
{
    static plog::util::nstring header()
    {
        return plog::util::nstring();
    }

    static plog::util::nstring format(const plog::Record& record)
    {
        return plog::TxtFormatterImpl<UseUtcTime>::format(record);
    }
};

using Utf8FileFormatter = Utf8FileFormatterImpl<false>;
using Utf8UtcFileFormatter = Utf8FileFormatterImpl<true>;
