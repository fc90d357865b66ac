// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef STRING_TOOLS_H_7720398145760931
#define STRING_TOOLS_H_7720398145760931

#include <algorithm>
#include <cassert>
#include <charconv>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>


//useful non-member functions for std::string, std::wstring and their views
namespace ferry
{
template <class Char> bool isWhiteSpace(Char c);
template <class Char> bool isLineBreak (Char c);
template <class Char> bool isDigit     (Char c); //'0'-'9' only!
template <class Char> bool isAsciiChar (Char c);
template <class S   > bool isAsciiString(const S& str);
template <class Char> Char asciiToLower(Char c);

//T can be a string, a string view, a char array or a single char
template <class S, class T> bool contains  (const S& str, const T& term);
template <class S, class T> bool startsWith(const S& str, const T& prefix);
template <class S, class T> bool endsWith  (const S& str, const T& postfix);
template <class S, class T> bool startsWithAsciiNoCase(const S& str, const T& prefix);
template <class S, class T> bool equalAsciiNoCase     (const S& lhs, const T& rhs);

enum class IfNotFoundReturn
{
    all,
    none
};
template <class S, class T> S afterLast  (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeLast (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S afterFirst (const S& str, const T& term, IfNotFoundReturn infr);
template <class S, class T> S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr);

enum class SplitOnEmpty
{
    allow,
    skip
};
template <class S, class Char, class Function> void split(const S& str, Char delimiter, Function onStringPart);
template <class S, class Char> [[nodiscard]] std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe);

enum class TrimSide
{
    both,
    left,
    right,
};
template <class S> [[nodiscard]] S trimCpy(const S& str, TrimSide side = TrimSide::both);
template <class S>                     void trim(S& str, TrimSide side = TrimSide::both);

template <class S, class T, class U> [[nodiscard]] S replaceCpy(S  str, const T& oldTerm, const U& newTerm);
template <class S, class T, class U>            void replace   (S& str, const T& oldTerm, const U& newTerm);

template <class S,   class Num> S   numberTo(const Num& number);
template <class Num, class S>   Num stringTo(const S&   str); //returns 0 on parse error

std::pair<char, char> hexify  (unsigned char c, bool upperCase = true);
char                  unhexify(char high, char low);










//---------------------- implementation ----------------------
namespace impl
{
inline std::string_view  asView(const std::string&  s) { return s; }
inline std::string_view  asView(std::string_view    s) { return s; }
inline std::string_view  asView(const char*         s) { return s; }
inline std::string_view  asView(const char&         c) { return {&c, 1}; }
inline std::wstring_view asView(const std::wstring& s) { return s; }
inline std::wstring_view asView(std::wstring_view   s) { return s; }
inline std::wstring_view asView(const wchar_t*      s) { return s; }
inline std::wstring_view asView(const wchar_t&      c) { return {&c, 1}; }
}


template <class Char> inline
bool isWhiteSpace(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    assert(c != 0); //std C++ does not consider 0 as white space
    return c == static_cast<Char>(' ') || (static_cast<Char>('\t') <= c && c <= static_cast<Char>('\r'));
}


template <class Char> inline
bool isLineBreak(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return c == static_cast<Char>('\r') || c == static_cast<Char>('\n');
}


template <class Char> inline
bool isDigit(Char c)
{
    static_assert(std::is_same_v<Char, char> || std::is_same_v<Char, wchar_t>);
    return static_cast<Char>('0') <= c && c <= static_cast<Char>('9');
}


template <class Char> inline
bool isAsciiChar(Char c)
{
    return static_cast<std::make_unsigned_t<Char>>(c) < 128;
}


template <class S> inline
bool isAsciiString(const S& str)
{
    const auto view = impl::asView(str);
    return std::all_of(view.begin(), view.end(), [](auto c) { return static_cast<std::make_unsigned_t<decltype(c)>>(c) < 128; });
}


template <class Char> inline
Char asciiToLower(Char c)
{
    if (static_cast<Char>('A') <= c && c <= static_cast<Char>('Z'))
        return static_cast<Char>(c - static_cast<Char>('A') + static_cast<Char>('a'));
    return c;
}


template <class S, class T> inline
bool contains(const S& str, const T& term)
{
    const auto s = impl::asView(str);
    return s.find(impl::asView(term)) != s.npos;
}


template <class S, class T> inline
bool startsWith(const S& str, const T& prefix)
{
    const auto s = impl::asView(str);
    const auto p = impl::asView(prefix);
    return s.size() >= p.size() && s.compare(0, p.size(), p) == 0;
}


template <class S, class T> inline
bool endsWith(const S& str, const T& postfix)
{
    const auto s = impl::asView(str);
    const auto p = impl::asView(postfix);
    return s.size() >= p.size() && s.compare(s.size() - p.size(), p.size(), p) == 0;
}


template <class S, class T> inline
bool equalAsciiNoCase(const S& lhs, const T& rhs)
{
    const auto l = impl::asView(lhs);
    const auto r = impl::asView(rhs);
    return l.size() == r.size() &&
           std::equal(l.begin(), l.end(), r.begin(), [](auto a, auto b) { return asciiToLower(a) == asciiToLower(b); });
}


template <class S, class T> inline
bool startsWithAsciiNoCase(const S& str, const T& prefix)
{
    const auto s = impl::asView(str);
    const auto p = impl::asView(prefix);
    return s.size() >= p.size() && equalAsciiNoCase(s.substr(0, p.size()), p);
}


template <class S, class T> inline
S afterLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const auto t = impl::asView(term);
    assert(!t.empty());

    const size_t pos = s.rfind(t);
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(s.substr(pos + t.size()));
}


template <class S, class T> inline
S beforeLast(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const auto t = impl::asView(term);
    assert(!t.empty());

    const size_t pos = s.rfind(t);
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(s.substr(0, pos));
}


template <class S, class T> inline
S afterFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const auto t = impl::asView(term);
    assert(!t.empty());

    const size_t pos = s.find(t);
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(s.substr(pos + t.size()));
}


template <class S, class T> inline
S beforeFirst(const S& str, const T& term, IfNotFoundReturn infr)
{
    const auto s = impl::asView(str);
    const auto t = impl::asView(term);
    assert(!t.empty());

    const size_t pos = s.find(t);
    if (pos == s.npos)
        return infr == IfNotFoundReturn::all ? str : S();

    return S(s.substr(0, pos));
}


template <class S, class Char, class Function> inline
void split(const S& str, Char delimiter, Function onStringPart)
{
    const auto s = impl::asView(str);
    for (auto it = s.begin();;)
    {
        const auto itFound = std::find(it, s.end(), delimiter);
        onStringPart(s.substr(it - s.begin(), itFound - it));
        if (itFound == s.end())
            return;
        it = itFound + 1;
    }
}


template <class S, class Char> inline
std::vector<S> splitCpy(const S& str, Char delimiter, SplitOnEmpty soe)
{
    std::vector<S> output;
    split(str, delimiter, [&](auto block)
    {
        if (!block.empty() || soe == SplitOnEmpty::allow)
            output.emplace_back(block);
    });
    return output;
}


template <class S> inline
S trimCpy(const S& str, TrimSide side)
{
    const auto s = impl::asView(str);
    auto itBegin = s.begin();
    auto itEnd   = s.end();

    if (side != TrimSide::left)
        while (itBegin != itEnd && isWhiteSpace(itEnd[-1]))
            --itEnd;

    if (side != TrimSide::right)
        while (itBegin != itEnd && isWhiteSpace(*itBegin))
            ++itBegin;

    return S(s.substr(itBegin - s.begin(), itEnd - itBegin));
}


template <class S> inline
void trim(S& str, TrimSide side)
{
    str = trimCpy(str, side);
}


template <class S, class T, class U> inline
void replace(S& str, const T& oldTerm, const U& newTerm)
{
    const auto oldView = impl::asView(oldTerm);
    const auto newView = impl::asView(newTerm);
    assert(!oldView.empty());
    if (oldView.empty())
        return;

    S output;
    const auto s = impl::asView(str);
    for (size_t pos = 0;;)
    {
        const size_t posFound = s.find(oldView, pos);
        if (posFound == s.npos)
        {
            output.append(s.substr(pos));
            break;
        }
        output.append(s.substr(pos, posFound - pos));
        output.append(newView);
        pos = posFound + oldView.size();
    }
    str = std::move(output);
}


template <class S, class T, class U> inline
S replaceCpy(S str, const T& oldTerm, const U& newTerm)
{
    replace(str, oldTerm, newTerm);
    return str;
}


template <class S, class Num> inline
S numberTo(const Num& number)
{
    static_assert(std::is_integral_v<Num> || std::is_enum_v<Num>);
    const std::string buf = std::to_string(number);
    return S(buf.begin(), buf.end());
}


template <class Num, class S> inline
Num stringTo(const S& str)
{
    static_assert(std::is_integral_v<Num>);
    const auto s = impl::asView(str);

    std::string ascii;
    for (auto c : s)
        ascii += static_cast<char>(c);
    trim(ascii);

    Num number = 0;
    const char* first = ascii.data();
    if (!ascii.empty() && ascii[0] == '+')
        ++first;
    if (const auto [ptr, ec] = std::from_chars(first, ascii.data() + ascii.size(), number);
        ec != std::errc() || ptr != ascii.data() + ascii.size())
        return 0;
    return number;
}


inline
std::pair<char, char> hexify(unsigned char c, bool upperCase)
{
    auto hexifyDigit = [upperCase](int num) -> char //input [0, 15], output 0-9, A-F
    {
        assert(0 <= num && num <= 15);
        if (num <= 9)
            return static_cast<char>('0' + num);
        return static_cast<char>((upperCase ? 'A' : 'a') + (num - 10));
    };
    return {hexifyDigit(c / 16), hexifyDigit(c % 16)};
}


inline
char unhexify(char high, char low)
{
    auto unhexifyDigit = [](char hex) -> int //input 0-9, a-f, A-F; output range: [0, 15]
    {
        if ('0' <= hex && hex <= '9') //no locale-dependent "isdigit"
            return hex - '0';
        else if ('A' <= hex && hex <= 'F')
            return (hex - 'A') + 10;
        else if ('a' <= hex && hex <= 'f')
            return (hex - 'a') + 10;
        assert(false);
        return 0;
    };
    return static_cast<char>(16 * unhexifyDigit(high) + unhexifyDigit(low));
}
}

#endif //STRING_TOOLS_H_7720398145760931
