// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "file_io.h"
#include <atomic>
#include <cstddef>
#include <sys/stat.h>
#include <fcntl.h>  //open
#include <unistd.h> //close, read, write, getpid

using namespace ferry;


FileBase::~FileBase()
{
    if (hFile_ != invalidFileHandle)
        try
        {
            close(); //throw ErrorLocalIo
        }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void FileBase::close() //throw ErrorLocalIo
{
    try
    {
        if (hFile_ == invalidFileHandle)
            throw SysError(L"Contract error: close() called more than once.");
        if (::close(hFile_) != 0)
            THROW_LAST_SYS_ERROR("close");
        hFile_ = invalidFileHandle; //do NOT set on error! => ~FileOutputPlain() still wants to (try to) delete the file!
    }
    catch (const SysError& e) { throw ErrorLocalIo(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

namespace
{
FileBase::FileHandle openHandleForRead(const Zstring& filePath) //throw ErrorLocalIo
{
    try
    {
        //caveat: check for file types that block during open(): character device, block device, named pipe
        struct stat fileInfo = {};
        if (::stat(filePath.c_str(), &fileInfo) != 0) //follows symlinks
            THROW_LAST_SYS_ERROR("stat");

        if (!S_ISREG(fileInfo.st_mode))
            throw SysError(_("Unsupported item type.") + (S_ISDIR(fileInfo.st_mode) ? L" [directory]" : L""));

        const int fdFile = ::open(filePath.c_str(), O_RDONLY | O_CLOEXEC);
        if (fdFile == -1) //don't check "< 0" -> docu seems to allow "-2" to be a valid file handle
            THROW_LAST_SYS_ERROR("open");
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw ErrorLocalIo(replaceCpy(_("Cannot open file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}


FileBase::FileHandle openHandleForWrite(const Zstring& filePath) //throw ErrorLocalIo
{
    try
    {
        const mode_t fileMode = S_IRUSR | S_IWUSR | S_IRGRP | S_IWGRP | S_IROTH | S_IWOTH; //0666 => umask will be applied implicitly!

        const int fdFile = ::open(filePath.c_str(), O_CREAT | O_EXCL | O_WRONLY | O_CLOEXEC, fileMode);
        if (fdFile == -1)
            THROW_LAST_SYS_ERROR("open");
        return fdFile; //pass ownership
    }
    catch (const SysError& e) { throw ErrorLocalIo(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(filePath)), e.toString()); }
}
}


FileInputPlain::FileInputPlain(const Zstring& filePath) :
    FileBase(openHandleForRead(filePath), filePath) {} //throw ErrorLocalIo


//may return short, only 0 means EOF! =>  CONTRACT: bytesToRead > 0!
size_t FileInputPlain::tryRead(void* buffer, size_t bytesToRead) //throw ErrorLocalIo
{
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesRead = 0;
        do
        {
            bytesRead = ::read(getHandle(), buffer, bytesToRead);
        }
        while (bytesRead < 0 && errno == EINTR);

        if (bytesRead < 0)
            THROW_LAST_SYS_ERROR("read");

        ASSERT_SYSERROR(static_cast<size_t>(bytesRead) <= bytesToRead); //better safe than sorry
        return bytesRead; //"zero indicates end of file"
    }
    catch (const SysError& e) { throw ErrorLocalIo(replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}

//----------------------------------------------------------------------------------------------------

FileOutputPlain::FileOutputPlain(const Zstring& filePath) :
    FileBase(openHandleForWrite(filePath), filePath) {} //throw ErrorLocalIo


FileOutputPlain::~FileOutputPlain()
{
    if (getHandle() != invalidFileHandle) //not finalized => clean up garbage
        try
        {
            if (::unlink(getFilePath().c_str()) != 0)
                THROW_LAST_SYS_ERROR("unlink");
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getFilePath())) + L"\n\n" + e.toString());
        }
}


//may return short! CONTRACT: bytesToWrite > 0
size_t FileOutputPlain::tryWrite(const void* buffer, size_t bytesToWrite) //throw ErrorLocalIo
{
    if (bytesToWrite == 0)
        throw std::logic_error(std::string(__FILE__) + '[' + numberTo<std::string>(__LINE__) + "] Contract violation!");
    try
    {
        ssize_t bytesWritten = 0;
        do
        {
            bytesWritten = ::write(getHandle(), buffer, bytesToWrite);
        }
        while (bytesWritten < 0 && errno == EINTR);

        if (bytesWritten <= 0)
        {
            if (bytesWritten == 0) //treat as error: buggy drivers
                errno = ENOSPC;

            THROW_LAST_SYS_ERROR("write");
        }

        ASSERT_SYSERROR(static_cast<size_t>(bytesWritten) <= bytesToWrite); //better safe than sorry
        return bytesWritten;
    }
    catch (const SysError& e) { throw ErrorLocalIo(replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getFilePath())), e.toString()); }
}


void FileOutputPlain::writeAll(const void* buffer, size_t bytesToWrite) //throw ErrorLocalIo
{
    const auto* it = static_cast<const std::byte*>(buffer);
    for (size_t bytesLeft = bytesToWrite; bytesLeft > 0;)
    {
        const size_t bytesWritten = tryWrite(it, bytesLeft); //throw ErrorLocalIo
        it        += bytesWritten;
        bytesLeft -= bytesWritten;
    }
}

//----------------------------------------------------------------------------------------------------

Zstring ferry::getPathWithTempName(const Zstring& filePath) //generate (hopefully) unique file name
{
    static std::atomic<unsigned int> tempCount{0};
    const unsigned int id = (static_cast<unsigned int>(::getpid()) << 8) ^ ++tempCount;

    std::string shortId;
    for (int i = 3; i >= 0; --i)
    {
        const auto [high, low] = hexify(static_cast<unsigned char>(id >> (8 * i)), false /*upperCase*/);
        shortId += high;
        shortId += low;
    }
    return filePath + Zstr('.') + shortId + Zstr(".tmp");
}


std::string ferry::getFileContent(const Zstring& filePath) //throw ErrorLocalIo
{
    FileInputPlain fileIn(filePath); //throw ErrorLocalIo

    std::string content;
    for (;;)
    {
        const size_t oldSize = content.size();
        content.resize(oldSize + FileBase::blockSize);

        const size_t bytesRead = fileIn.tryRead(content.data() + oldSize, FileBase::blockSize); //throw ErrorLocalIo
        content.resize(oldSize + bytesRead);
        if (bytesRead == 0) //end of file
            return content;
    }
}


void ferry::saveFileTransactional(const Zstring& filePath, const std::function<void(const WriteBlockFun& writeBlock)>& writeContent) //throw ErrorLocalIo, X
{
    const Zstring tmpFilePath = getPathWithTempName(filePath);
    {
        FileOutputPlain tmpFile(tmpFilePath); //throw ErrorLocalIo

        writeContent([&](const void* buffer, size_t bytesToWrite)
        {
            if (bytesToWrite > 0)
                tmpFile.writeAll(buffer, bytesToWrite); //throw ErrorLocalIo
        }); //throw X => ~FileOutputPlain() deletes the temp file

        tmpFile.close(); //throw ErrorLocalIo
    }
    //take over ownership:
    FERRY_ON_SCOPE_FAIL( try { removeFilePlain(tmpFilePath); }
    catch (const FileError& e) { logExtraError(e.toString()); });

    //operation finished: move temp file transactionally
    moveAndRenameItem(tmpFilePath, filePath); //throw ErrorLocalIo
}


void ferry::setFileContent(const Zstring& filePath, std::string_view bytes) //throw ErrorLocalIo
{
    saveFileTransactional(filePath, [&](const WriteBlockFun& writeBlock)
    {
        writeBlock(bytes.data(), bytes.size()); //throw ErrorLocalIo
    });
}
