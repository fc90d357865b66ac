// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FTP_COMMON_H_5527093184602471
#define FTP_COMMON_H_5527093184602471

#include <base/base64.h>
#include <base/string_tools.h>


namespace ferry
{
inline
std::string encodePasswordBase64(std::string_view pass)
{
    return stringEncodeBase64(pass); //nothrow
}


inline
std::string decodePasswordBase64(std::string_view pass)
{
    return stringDecodeBase64(pass); //nothrow
}


//according to the (S)FTP path syntax, the username must not contain raw @ : / and the option separator |
//-> we don't need a full urlencode!
inline
std::string encodeFtpUsername(std::string name)
{
    replace(name, '%', "%25"); //first!
    replace(name, '@', "%40");
    replace(name, ':', "%3A");
    replace(name, '/', "%2F");
    replace(name, '|', "%7C");
    return name;
}


//working path inside a connection phrase: '/' stays the folder separator
inline
std::string encodeFtpPath(std::string path)
{
    replace(path, '%', "%25"); //first!
    replace(path, '|', "%7C");
    return path;
}


//RFC 3986: only unreserved characters stay literal
inline
std::string encodeUriComponent(std::string_view str)
{
    std::string output;
    for (const char c : str)
        if (('A' <= c && c <= 'Z') ||
            ('a' <= c && c <= 'z') ||
            ('0' <= c && c <= '9') ||
            c == '-' || c == '.' || c == '_' || c == '~')
            output += c;
        else
        {
            const auto [high, low] = hexify(static_cast<unsigned char>(c));
            output += '%';
            output += high;
            output += low;
        }
    return output;
}


inline
std::string decodeUriComponent(std::string_view str)
{
    auto isHex = [](char c) { return isDigit(c) || ('A' <= c && c <= 'F') || ('a' <= c && c <= 'f'); };

    std::string output;
    for (size_t i = 0; i < str.size(); ++i)
        if (str[i] == '%' && i + 2 < str.size() && isHex(str[i + 1]) && isHex(str[i + 2]))
        {
            output += unhexify(str[i + 1], str[i + 2]);
            i += 2;
        }
        else
            output += str[i]; //keep malformed escapes as-is
    return output;
}
}

#endif //FTP_COMMON_H_5527093184602471
