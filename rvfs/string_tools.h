// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef STRING_TOOLS_H_3450918237401928374
#define STRING_TOOLS_H_3450918237401928374

#include <algorithm>
#include <charconv>
#include <compare>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//string helpers working on std::string, std::wstring and their views
namespace rvfs
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //not exactly the same as "std::isdigit" -> we consider '0'-'9' only!
template <class Char> Char asciiToLower(Char c);

template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);
template <class S, class T> bool contains  (const S& str, const T& term);

template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

//call "onBlock" for each block between separators; empty blocks included
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onBlock);
template <class S, class Function1, class Function2> void split2(const S& str, Function1 isDelimiter, Function2 onBlock);

template <class S, class T, class U> S replaceCpy(S str, const T& oldTerm, const U& newTerm);
template <class S> S trimCpy(const S& str);

template <class Num, class S> Num stringTo(const S& str); //invalid input => 0
template <class S, class Num> S numberTo(const Num& number);

template <class Iterator> auto makeStringView(Iterator first, Iterator last);







//---------------------- implementation ----------------------
namespace impl
{
template <class T> inline
auto viewOf(const T& str)
{
    if constexpr (std::is_pointer_v<T> || std::is_array_v<T>)
        return std::basic_string_view<std::remove_cv_t<std::remove_pointer_t<std::decay_t<T>>>>(str);
    else if constexpr (std::is_integral_v<T>)
        return std::basic_string_view<T>(&str, 1);
    else
        return std::basic_string_view<typename T::value_type>(str.data(), str.size());
}
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    return c == static_cast<Char>(' ')  || c == static_cast<Char>('\t') ||
           c == static_cast<Char>('\n') || c == static_cast<Char>('\r') ||
           c == static_cast<Char>('\v') || c == static_cast<Char>('\f');
}


template <class Char> inline
bool isLineBreak(Char c) { return c == static_cast<Char>('\r') || c == static_cast<Char>('\n'); }


template <class Char> inline
bool isDigit(Char c) { return static_cast<Char>('0') <= c && c <= static_cast<Char>('9'); }


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto s = impl::viewOf(str);
    const auto p = impl::viewOf(prefix);
    return s.size() >= p.size() && std::equal(p.begin(), p.end(), s.begin());
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto s = impl::viewOf(str);
    const auto p = impl::viewOf(postfix);
    return s.size() >= p.size() && std::equal(p.begin(), p.end(), s.end() - p.size());
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    return impl::viewOf(str).find(impl::viewOf(term)) != std::string_view::npos;
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto l = impl::viewOf(lhs);
    const auto r = impl::viewOf(rhs);
    return l.size() == r.size() &&
           std::equal(l.begin(), l.end(), r.begin(), [](auto cl, auto cr) { return asciiToLower(cl) == asciiToLower(cr); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto s = impl::viewOf(str);
    const auto p = impl::viewOf(prefix);
    return s.size() >= p.size() && equalAsciiNoCase(s.substr(0, p.size()), p);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::viewOf(str);
    const auto t = impl::viewOf(term);
    const size_t pos = s.rfind(t);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(pos + t.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::viewOf(str);
    const size_t pos = s.rfind(impl::viewOf(term));
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::viewOf(str);
    const auto t = impl::viewOf(term);
    const size_t pos = s.find(t);
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(pos + t.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::viewOf(str);
    const size_t pos = s.find(impl::viewOf(term));
    if (pos == std::string_view::npos)
        return infr == IfNotFoundReturn::all ? str : S();
    return S(s.substr(0, pos));
}


template <class S, class Function1, class Function2> inline
void split2(const S& str, Function1 isDelimiter, Function2 onBlock)
{
    const auto s = impl::viewOf(str);
    auto blockFirst = s.begin();
    for (;;)
    {
        const auto blockLast = std::find_if(blockFirst, s.end(), isDelimiter);
        onBlock(makeStringView(blockFirst, blockLast));
        if (blockLast == s.end())
            return;
        blockFirst = blockLast + 1;
    }
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onBlock)
{
    split2(str, [delimiter](Char c) { return c == delimiter; }, onBlock);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::viewOf(oldTerm);
    const auto newView = impl::viewOf(newTerm);
    if (oldView.empty())
        throw std::logic_error(std::string(__FILE__) + '[' + std::to_string(__LINE__) + "] Contract violation!");

    for (size_t pos = str.find(oldView); pos != S::npos; pos = str.find(oldView, pos + newView.size()))
        str.replace(pos, oldView.size(), newView);
    return str;
}


template <class S> inline
S trimCpy(const S& str)
{
    const auto s = impl::viewOf(str);
    const auto itFirst = std::find_if_not(s.begin(), s.end(), [](auto c) { return isWhiteSpace(c); });
    const auto itLast  = std::find_if_not(s.rbegin(), std::make_reverse_iterator(itFirst), [](auto c) { return isWhiteSpace(c); }).base();
    return S(makeStringView(itFirst, itLast));
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    const auto s = impl::viewOf(str);
    std::string buf;
    for (auto c : s)
        buf += static_cast<char>(c);

    const std::string_view trimmed = trimCpy(std::string_view(buf));
    Num number = 0;
    if constexpr (std::is_unsigned_v<Num>)
        if (startsWith(trimmed, '-'))
            return 0;
    std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), number);
    return number;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    const std::string tmp = std::to_string(number);
    return S(tmp.begin(), tmp.end());
}


template <class Iterator> inline
auto makeStringView(Iterator first, Iterator last)
{
    using CharType = std::remove_cv_t<std::remove_reference_t<decltype(*first)>>;
    return std::basic_string_view<CharType>(first == last ? nullptr : &*first, last - first);
}
}

#endif //STRING_TOOLS_H_3450918237401928374
