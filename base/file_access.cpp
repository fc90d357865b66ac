// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_access.h"

#include <sys/stat.h>
#include <unistd.h> //unlink
#include <cstdio>   //rename

using namespace ferry;


namespace
{
struct SysErrorCode : public ferry::SysError
{
    SysErrorCode(const std::string& functionName, ErrorCode ec) : SysError(formatSystemError(functionName, ec)), errorCode(ec) {}

    const ErrorCode errorCode;
};


ItemType getItemTypeImpl(const Zstring& itemPath, bool followLink) //throw SysErrorCode
{
    struct stat itemInfo = {};
    if (followLink)
    {
        if (::stat(itemPath.c_str(), &itemInfo) != 0)
            throw SysErrorCode("stat", errno);
    }
    else if (::lstat(itemPath.c_str(), &itemInfo) != 0)
        throw SysErrorCode("lstat", errno);

    if (S_ISLNK(itemInfo.st_mode))
        return ItemType::symlink;
    if (S_ISDIR(itemInfo.st_mode))
        return ItemType::folder;
    return ItemType::file; //S_ISREG || S_ISCHR || S_ISBLK || S_ISFIFO || S_ISSOCK
}


std::wstring getAttributesErrorMsg(const Zstring& itemPath)
{
    return replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(itemPath));
}
}


ItemType ferry::getItemType(const Zstring& itemPath) //throw ErrorLocalIo
{
    try
    {
        return getItemTypeImpl(itemPath, false /*followLink*/); //throw SysErrorCode
    }
    catch (const SysError& e) { throw ErrorLocalIo(getAttributesErrorMsg(itemPath), e.toString()); }
}


ItemType ferry::getItemTypeFollowLink(const Zstring& itemPath) //throw ErrorLocalIo
{
    try
    {
        return getItemTypeImpl(itemPath, true /*followLink*/); //throw SysErrorCode
    }
    catch (const SysError& e) { throw ErrorLocalIo(getAttributesErrorMsg(itemPath), e.toString()); }
}


std::optional<ItemType> ferry::getItemTypeIfExists(const Zstring& itemPath) //throw ErrorLocalIo
{
    try
    {
        return getItemTypeImpl(itemPath, false /*followLink*/); //throw SysErrorCode
    }
    catch (const SysErrorCode& e)
    {
        //ENOTDIR: some parent component is a file => item cannot exist either
        if (e.errorCode == ENOENT || e.errorCode == ENOTDIR)
            return std::nullopt;

        throw ErrorLocalIo(getAttributesErrorMsg(itemPath), e.toString());
    }
}


void ferry::removeFilePlain(const Zstring& filePath) //throw ErrorLocalIo
{
    try
    {
        if (::unlink(filePath.c_str()) != 0)
            THROW_LAST_SYS_ERROR("unlink");
    }
    catch (const SysError& e) { throw ErrorLocalIo(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


void ferry::moveAndRenameItem(const Zstring& pathFrom, const Zstring& pathTo) //throw ErrorLocalIo
{
    //rename() will never fail with EEXIST, but always (atomically) overwrite!
    if (::rename(pathFrom.c_str(), pathTo.c_str()) != 0)
    {
        const ErrorCode ec = getLastError(); //copy before making other system calls!
        throw ErrorLocalIo(replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                                 L"%x", L'\n' + fmtPath(pathFrom)),
                                      L"%y", L'\n' + fmtPath(pathTo)),
                           formatSystemError("rename", ec));
    }
}
