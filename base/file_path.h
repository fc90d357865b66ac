// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_PATH_H_5038271946613074
#define FILE_PATH_H_5038271946613074

#include <optional>
#include "string_tools.h"
#include "zstring.h"


namespace ferry
{
const Zchar FILE_NAME_SEPARATOR = '/';

Zstring getItemName(const Zstring& itemPath); //trailing separators are ignored: "/tmp/folder/" => "folder"

Zstring appendPath(const Zstring& basePath, const Zstring& relPath);

std::optional<Zstring> getParentFolderPath(const Zstring& itemPath); //no value for root or a bare name






//------------------------------- implementation -------------------------------
namespace impl
{
inline
Zstring trimTrailingSeparators(const Zstring& itemPath)
{
    Zstring path = itemPath;
    while (path.size() > 1 && endsWith(path, FILE_NAME_SEPARATOR))
        path.pop_back();
    return path;
}
}


inline
Zstring getItemName(const Zstring& itemPath)
{
    return afterLast(impl::trimTrailingSeparators(itemPath), FILE_NAME_SEPARATOR, IfNotFoundReturn::all);
}


inline
Zstring appendPath(const Zstring& basePath, const Zstring& relPath)
{
    if (relPath.empty())
        return basePath;

    if (basePath.empty()) //basePath might be a relative path, too!
        return relPath;

    if (endsWith(basePath, FILE_NAME_SEPARATOR))
        return basePath + relPath;

    return basePath + FILE_NAME_SEPARATOR + relPath;
}


inline
std::optional<Zstring> getParentFolderPath(const Zstring& itemPath)
{
    const Zstring path = impl::trimTrailingSeparators(itemPath);

    const size_t pos = path.rfind(FILE_NAME_SEPARATOR);
    if (pos == Zstring::npos || path == Zstr("/"))
        return std::nullopt;

    if (pos == 0)
        return Zstring(Zstr("/"));

    return path.substr(0, pos);
}
}

#endif //FILE_PATH_H_5038271946613074
