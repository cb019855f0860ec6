// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef UTF_H_0193847561029384756
#define UTF_H_0193847561029384756

#include <string>
#include <string_view>
#include "string_tools.h"


namespace rvfs
{
//convert between UTF-8 (std::string) and UTF-32 (std::wstring on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);








//----------------------- implementation ----------------------------------
namespace impl
{
static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");

using CodePoint = uint32_t;
const CodePoint REPLACEMENT_CHAR = 0xfffd;
const CodePoint CODE_POINT_MAX   = 0x10ffff;


inline
void codePointToUtf8(CodePoint cp, std::string& output)
{
    if (cp > CODE_POINT_MAX || (0xd800 <= cp && cp <= 0xdfff))
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        output += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        output += static_cast<char>(0xc0 | (cp >> 6));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        output += static_cast<char>(0xe0 | (cp >> 12));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        output += static_cast<char>(0xf0 | (cp >> 18));
        output += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        output += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        output += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


//decode one code point; invalid sequences decode as REPLACEMENT_CHAR, consuming a single byte
template <class Function> inline
void utf8ToCodePoint(std::string_view str, Function onCodePoint)
{
    for (auto it = str.begin(); it != str.end();)
    {
        const auto lead = static_cast<unsigned char>(*it);

        size_t trailCount = 0;
        CodePoint cp = 0;
        if (lead < 0x80)                { cp = lead; }
        else if ((lead & 0xe0) == 0xc0) { cp = lead & 0x1f; trailCount = 1; }
        else if ((lead & 0xf0) == 0xe0) { cp = lead & 0x0f; trailCount = 2; }
        else if ((lead & 0xf8) == 0xf0) { cp = lead & 0x07; trailCount = 3; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR, false);
            ++it;
            continue;
        }

        if (static_cast<size_t>(str.end() - it) <= trailCount ||
            !std::all_of(it + 1, it + 1 + trailCount, [](char c) { return (static_cast<unsigned char>(c) & 0xc0) == 0x80; }))
        {
            onCodePoint(REPLACEMENT_CHAR, false);
            ++it;
            continue;
        }

        for (size_t i = 1; i <= trailCount; ++i)
            cp = (cp << 6) | (static_cast<unsigned char>(it[i]) & 0x3f);

        const bool overlong = (trailCount == 1 && cp < 0x80) ||
                              (trailCount == 2 && cp < 0x800) ||
                              (trailCount == 3 && cp < 0x10000);
        const bool valid = !overlong && cp <= CODE_POINT_MAX && !(0xd800 <= cp && cp <= 0xdfff);

        onCodePoint(valid ? cp : REPLACEMENT_CHAR, valid);
        it += 1 + trailCount;
    }
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto view = impl::viewOf(str);
    using SourceChar = typename decltype(view)::value_type;
    using TargetChar = typename TargetString::value_type;

    if constexpr (sizeof(SourceChar) == sizeof(TargetChar))
        return TargetString(view.begin(), view.end());
    else if constexpr (sizeof(SourceChar) == 1) //UTF-8 -> UTF-32
    {
        TargetString output;
        impl::utf8ToCodePoint(std::string_view(view.data(), view.size()), [&](impl::CodePoint cp, bool /*valid*/) { output += static_cast<TargetChar>(cp); });
        return output;
    }
    else //UTF-32 -> UTF-8
    {
        std::string output;
        for (const SourceChar c : view)
            impl::codePointToUtf8(static_cast<impl::CodePoint>(c), output);
        return TargetString(output.begin(), output.end());
    }
}
}

#endif //UTF_H_0193847561029384756
