// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ZSTRING_H_0391786524381769
#define ZSTRING_H_0391786524381769

#include <stdexcept> //not used by this header, but the "rest of the world" needs it!
#include <string>
#include <string_view>


//native string type for file paths and other OS API parameters: UTF-8 on Linux
using Zchar = char;
#define Zstr(x) x

using Zstring     = std::basic_string<Zchar>;
using ZstringView = std::basic_string_view<Zchar>;

#endif //ZSTRING_H_0391786524381769
