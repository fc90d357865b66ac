// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_IO_H_7316629048152287
#define FILE_IO_H_7316629048152287

#include <functional>
#include "file_access.h"


namespace ferry
{
/*  OS-buffered file I/O:
    - sequential read/write accesses
    - better error reporting
    - follows symlinks                     */
class FileBase
{
public:
    using FileHandle = int;
    static const int invalidFileHandle = -1;

    FileHandle getHandle() { return hFile_; }

    const Zstring& getFilePath() const { return filePath_; }

    static constexpr size_t blockSize = 256 * 1024;

    void close(); //throw ErrorLocalIo -> good place to catch errors when closing stream, otherwise called in ~FileBase()!

protected:
    FileBase(FileHandle handle, const Zstring& filePath) : hFile_(handle), filePath_(filePath) {}
    ~FileBase();

private:
    FileBase           (const FileBase&) = delete;
    FileBase& operator=(const FileBase&) = delete;

    FileHandle hFile_ = invalidFileHandle;
    const Zstring filePath_;
};

//-----------------------------------------------------------------------------------------------

class FileInputPlain : public FileBase
{
public:
    explicit FileInputPlain(const Zstring& filePath); //throw ErrorLocalIo

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    size_t tryRead(void* buffer, size_t bytesToRead); //throw ErrorLocalIo
};


class FileOutputPlain : public FileBase
{
public:
    explicit FileOutputPlain(const Zstring& filePath); //throw ErrorLocalIo; fails if target is existing
    ~FileOutputPlain();

    //may return short! CONTRACT: bytesToWrite > 0
    size_t tryWrite(const void* buffer, size_t bytesToWrite); //throw ErrorLocalIo

    void writeAll(const void* buffer, size_t bytesToWrite); //throw ErrorLocalIo

    //close() when done, or else file is considered incomplete and will be deleted!
};

//-----------------------------------------------------------------------------------------------

//stream I/O convenience functions:

Zstring getPathWithTempName(const Zstring& filePath); //generate (hopefully) unique file name

[[nodiscard]] std::string getFileContent(const Zstring& filePath); //throw ErrorLocalIo

using WriteBlockFun = std::function<void(const void* buffer, size_t bytesToWrite)>; //throw ErrorLocalIo

//overwrites if existing + transactional: content goes to a temp file first, which is renamed onto filePath on success
void saveFileTransactional(const Zstring& filePath, const std::function<void(const WriteBlockFun& writeBlock)>& writeContent); //throw ErrorLocalIo, X

void setFileContent(const Zstring& filePath, std::string_view bytes); //throw ErrorLocalIo
}

#endif //FILE_IO_H_7316629048152287
