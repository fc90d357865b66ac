// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef BASE64_H_3307516942874106
#define BASE64_H_3307516942874106

#include <algorithm>
#include <string>
#include <string_view>


namespace ferry
{
/*  https://en.wikipedia.org/wiki/Base64

    Usage:
        const std::string output = ferry::stringEncodeBase64("Sample text");
        //output contains "U2FtcGxlIHRleHQ="                                       */

std::string stringEncodeBase64(std::string_view str);
std::string stringDecodeBase64(std::string_view str); //skips characters outside the alphabet; stops at padding









//------------------------- implementation -------------------------------
namespace impl
{
//64 chars for base64 encoding + padding char
constexpr char ENCODING_MIME[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/=";
const int INDEX_PAD = 64; //index of "="

inline
int decodeMimeChar(char c) //return -1 if not part of the alphabet
{
    if ('A' <= c && c <= 'Z') return c - 'A';
    if ('a' <= c && c <= 'z') return c - 'a' + 26;
    if ('0' <= c && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    if (c == '=') return INDEX_PAD;
    return -1;
}
}


inline
std::string stringEncodeBase64(std::string_view str)
{
    using namespace impl;
    std::string out;
    out.reserve((str.size() + 2) / 3 * 4);

    for (size_t i = 0; i < str.size(); i += 3)
    {
        const size_t blockLen = std::min<size_t>(3, str.size() - i);

        unsigned int block = 0;
        for (size_t j = 0; j < 3; ++j)
            block = (block << 8) | (j < blockLen ? static_cast<unsigned char>(str[i + j]) : 0);

        out += ENCODING_MIME[(block >> 18) & 0x3f];
        out += ENCODING_MIME[(block >> 12) & 0x3f];
        out += blockLen > 1 ? ENCODING_MIME[(block >> 6) & 0x3f] : ENCODING_MIME[INDEX_PAD];
        out += blockLen > 2 ? ENCODING_MIME[block & 0x3f]        : ENCODING_MIME[INDEX_PAD];
    }
    return out;
}


inline
std::string stringDecodeBase64(std::string_view str)
{
    using namespace impl;
    std::string out;

    unsigned int block = 0;
    int bitCount = 0;
    for (const char c : str)
    {
        const int index = decodeMimeChar(c);
        if (index < 0) //skip all unknown characters (including carriage return, line-break, tab)
            continue;
        if (index == INDEX_PAD)
            break;

        block = (block << 6) | static_cast<unsigned int>(index);
        bitCount += 6;
        if (bitCount >= 8)
        {
            bitCount -= 8;
            out += static_cast<char>((block >> bitCount) & 0xff);
        }
    }
    return out;
}
}

#endif //BASE64_H_3307516942874106
