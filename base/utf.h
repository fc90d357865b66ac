// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef UTF_H_2046517290836412
#define UTF_H_2046517290836412

#include <cstdint>
#include "string_tools.h"


namespace ferry
{
//convert between UTF-8 (char) and UTF-32 (wchar_t on Linux)
template <class TargetString, class SourceString>
TargetString utfTo(const SourceString& str);

bool isValidUtf(std::string_view str);

const char32_t REPLACEMENT_CHAR = 0xfffd;








//----------------------- implementation ----------------------------------
namespace impl
{
static_assert(sizeof(wchar_t) == 4, "UTF-32 wchar_t expected");

template <class Function> inline
void decodeUtf8(std::string_view str, Function onCodePoint) //onCodePoint(char32_t cp, bool valid)
{
    auto byte = [&](size_t pos) { return static_cast<unsigned char>(str[pos]); };

    for (size_t i = 0; i < str.size();)
    {
        const unsigned char lead = byte(i);

        size_t trailCount = 0;
        char32_t cp = 0;
        if (lead < 0x80)
        {
            onCodePoint(lead, true);
            ++i;
            continue;
        }
        else if ((lead & 0xe0) == 0xc0) { trailCount = 1; cp = lead & 0x1f; }
        else if ((lead & 0xf0) == 0xe0) { trailCount = 2; cp = lead & 0x0f; }
        else if ((lead & 0xf8) == 0xf0) { trailCount = 3; cp = lead & 0x07; }
        else
        {
            onCodePoint(REPLACEMENT_CHAR, false);
            ++i;
            continue;
        }

        if (i + trailCount >= str.size()) //truncated sequence
        {
            onCodePoint(REPLACEMENT_CHAR, false);
            ++i;
            continue;
        }

        bool valid = true;
        size_t consumed = 1;
        for (; consumed <= trailCount; ++consumed)
        {
            const unsigned char trail = byte(i + consumed);
            if ((trail & 0xc0) != 0x80)
            {
                valid = false;
                break;
            }
            cp = (cp << 6) | (trail & 0x3f);
        }

        if (valid)
        {
            const char32_t minValue = trailCount == 1 ? 0x80 : trailCount == 2 ? 0x800 : 0x10000;
            if (cp < minValue || cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff)) //overlong, out of range, surrogate
                valid = false;
        }

        onCodePoint(valid ? cp : REPLACEMENT_CHAR, valid);
        i += consumed;
    }
}


inline
void encodeUtf8(char32_t cp, std::string& out)
{
    if (cp > 0x10ffff || (0xd800 <= cp && cp <= 0xdfff))
        cp = REPLACEMENT_CHAR;

    if (cp < 0x80)
        out += static_cast<char>(cp);
    else if (cp < 0x800)
    {
        out += static_cast<char>(0xc0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else if (cp < 0x10000)
    {
        out += static_cast<char>(0xe0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
    else
    {
        out += static_cast<char>(0xf0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3f));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3f));
        out += static_cast<char>(0x80 | (cp & 0x3f));
    }
}


inline std::string  toUtf8 (std::string_view  str) { return std::string(str); }
inline std::wstring toUtf32(std::wstring_view str) { return std::wstring(str); }

inline
std::wstring toUtf32(std::string_view str)
{
    std::wstring output;
    output.reserve(str.size());
    decodeUtf8(str, [&](char32_t cp, bool /*valid*/) { output += static_cast<wchar_t>(cp); });
    return output;
}


inline
std::string toUtf8(std::wstring_view str)
{
    std::string output;
    output.reserve(str.size());
    for (const wchar_t c : str)
        encodeUtf8(static_cast<char32_t>(c), output);
    return output;
}
}


template <class TargetString, class SourceString> inline
TargetString utfTo(const SourceString& str)
{
    const auto view = impl::asView(str);

    if constexpr (std::is_same_v<typename TargetString::value_type, char>)
        return impl::toUtf8(view);
    else
    {
        static_assert(std::is_same_v<typename TargetString::value_type, wchar_t>);
        return impl::toUtf32(view);
    }
}


inline
bool isValidUtf(std::string_view str)
{
    bool valid = true;
    impl::decodeUtf8(str, [&](char32_t /*cp*/, bool cpValid) { if (!cpValid) valid = false; });
    return valid;
}
}

#endif //UTF_H_2046517290836412
