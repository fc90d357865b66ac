// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_ACCESS_H_1947035826174490
#define FILE_ACCESS_H_1947035826174490

#include "file_error.h"
#include "file_path.h"


namespace ferry
{
enum class ItemType
{
    file,
    folder,
    symlink,
};
//(hard) symlink handling: not followed!
ItemType getItemType(const Zstring& itemPath); //throw ErrorLocalIo

//- no value on "not existing", but distinguish from access errors
std::optional<ItemType> getItemTypeIfExists(const Zstring& itemPath); //throw ErrorLocalIo

inline bool itemExists(const Zstring& itemPath) { return static_cast<bool>(getItemTypeIfExists(itemPath)); } //throw ErrorLocalIo

//like getItemType(), but symlinks are followed
ItemType getItemTypeFollowLink(const Zstring& itemPath); //throw ErrorLocalIo

void removeFilePlain(const Zstring& filePath); //throw ErrorLocalIo; ERROR if not existing

//rename() overwrites an existing target atomically
void moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo); //throw ErrorLocalIo
}

#endif //FILE_ACCESS_H_1947035826174490
