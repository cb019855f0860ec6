// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef TIME_H_3392017465120398475
#define TIME_H_3392017465120398475

#include <algorithm>
#include <cassert>
#include <ctime>
#include <iterator>
#include <string>
#include <utility>
#include "string_tools.h"


namespace rvfs
{
struct TimeComp //replaces std::tm
{
    int year   = 0; // -
    int month  = 0; //1-12
    int day    = 0; //1-31
    int hour   = 0; //0-23
    int minute = 0; //0-59
    int second = 0; //0-60 (including leap second)

    bool operator==(const TimeComp&) const = default;
};

TimeComp getUtcTime(time_t utc); //convert time_t (UTC) to UTC time components, returns TimeComp() on error
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc); //convert UTC time components to time_t (UTC)

/* format date and time; example:
            formatTime("%Y|%m|%d", tc); -> "2011|10|29"  */
std::string formatTime(const char* format, const TimeComp& tc); //format as specified by "std::strftime", returns empty string on error

const char* const formatFtpTimeTag = "%Y%m%d%H%M%S";      //e.g. 20010823145502 (MLSD "modify" fact, MFMT argument)

//example: parseTime("%Y-%m-%d %H:%M:%S", "2001-08-23 14:55:02");
template <class String, class String2>
TimeComp parseTime(const String& format, const String2& str); //similar to ::strptime(): supports %Y %m %d %H %M %S











//############################ implementation ##############################
namespace impl
{
inline
std::tm toClibTimeComponents(const TimeComp& tc)
{
    return
    {
        .tm_sec   = tc.second,
        .tm_min   = tc.minute,
        .tm_hour  = tc.hour,
        .tm_mday  = tc.day,
        .tm_mon   = tc.month - 1,   //0-11
        .tm_year  = tc.year - 1900, //years since 1900
        .tm_isdst = -1,
    };
}

inline
TimeComp toTimeComponents(const std::tm& ctc)
{
    return
    {
        .year   = ctc.tm_year + 1900,
        .month  = ctc.tm_mon + 1,
        .day    = ctc.tm_mday,
        .hour   = ctc.tm_hour,
        .minute = ctc.tm_min,
        .second = ctc.tm_sec,
    };
}
}


inline
TimeComp getUtcTime(time_t utc)
{
    std::tm ctc = {};
    if (::gmtime_r(&utc, &ctc) == nullptr)
        return TimeComp();

    return impl::toTimeComponents(ctc);
}


inline
std::pair<time_t, bool /*success*/> utcToTimeT(const TimeComp& tc)
{
    if (tc == TimeComp())
        return {};

    if (!(1 <= tc.month  && tc.month  <= 12 &&
          1 <= tc.day    && tc.day    <= 31 &&
          0 <= tc.hour   && tc.hour   <= 23 &&
          0 <= tc.minute && tc.minute <= 59 &&
          0 <= tc.second && tc.second <= 61))
        return {};

    std::tm ctc = impl::toClibTimeComponents(tc);
    ctc.tm_isdst = 0;

    const time_t utc = ::timegm(&ctc);
    if (utc == -1 && tc != getUtcTime(-1)) //disambiguate error code from 1969-12-31 23:59:59
        return {};

    return {utc, true};
}


inline
std::string formatTime(const char* format, const TimeComp& tc)
{
    if (tc == TimeComp()) //failure code from getUtcTime()
        return std::string();

    std::tm ctc = impl::toClibTimeComponents(tc);
    ::timegm(&ctc); //std::strftime() needs all elements of "struct tm" filled, e.g. tm_wday, tm_yday

    std::string buf(256, '\0');
    const size_t charsWritten = std::strftime(buf.data(), buf.size(), format, &ctc);
    buf.resize(charsWritten);
    return buf;
}


template <class String, class String2>
TimeComp parseTime(const String& format, const String2& str)
{
    const auto fmtView = impl::viewOf(format);
    const auto strView = impl::viewOf(str);
    using CharType = typename decltype(strView)::value_type;

    auto itStr = strView.begin();
    const auto strLast = strView.end();

    auto extractNumber = [&](int& result, size_t digitCount)
    {
        if (static_cast<size_t>(strLast - itStr) < digitCount)
            return false;

        if (!std::all_of(itStr, itStr + digitCount, isDigit<CharType>))
            return false;

        result = stringTo<int>(makeStringView(itStr, itStr + digitCount));
        itStr += digitCount;
        return true;
    };

    TimeComp output;

    for (auto itFmt = fmtView.begin(); itFmt != fmtView.end(); ++itFmt)
    {
        const auto fmt = *itFmt;

        if (fmt == '%')
        {
            ++itFmt;
            if (itFmt == fmtView.end())
                return TimeComp();

            switch (*itFmt)
            {
                case 'Y':
                    if (!extractNumber(output.year, 4))
                        return TimeComp();
                    break;
                case 'm':
                    if (!extractNumber(output.month, 2))
                        return TimeComp();
                    break;
                case 'd':
                    if (!extractNumber(output.day, 2))
                        return TimeComp();
                    break;
                case 'H':
                    if (!extractNumber(output.hour, 2))
                        return TimeComp();
                    break;
                case 'M':
                    if (!extractNumber(output.minute, 2))
                        return TimeComp();
                    break;
                case 'S':
                    if (!extractNumber(output.second, 2))
                        return TimeComp();
                    break;
                default:
                    return TimeComp();
            }
        }
        else if (isWhiteSpace(fmt)) //single whitespace in format => skip 0..n whitespace chars
        {
            while (itStr != strLast && isWhiteSpace(*itStr))
                ++itStr;
        }
        else
        {
            if (itStr == strLast || *itStr != static_cast<CharType>(fmt))
                return TimeComp();
            ++itStr;
        }
    }

    if (itStr != strLast)
        return TimeComp();

    return output;
}
}

#endif //TIME_H_3392017465120398475
