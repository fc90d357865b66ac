// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef FILE_ERROR_H_2791054368120945
#define FILE_ERROR_H_2791054368120945

#include "sys_error.h" //we'll need this later anyway!


namespace ferry
{
class FileError //high-level exception class giving detailed context information for end users
{
public:
    explicit FileError(const std::wstring& msg) : msg_(msg) {}
    FileError(const std::wstring& msg, const std::wstring& details) : msg_(msg + L"\n\n" + details) {}
    virtual ~FileError() {}

    const std::wstring& toString() const { return msg_; }

private:
    std::wstring msg_;
};

#define DEFINE_NEW_FILE_ERROR(X) struct X : public ferry::FileError { explicit X(const std::wstring& msg) : FileError(msg) {} X(const std::wstring& msg, const std::wstring& descr) : FileError(msg, descr) {} };

DEFINE_NEW_FILE_ERROR(ErrorInvalidArgument) //missing or empty argument: raised before any I/O
DEFINE_NEW_FILE_ERROR(ErrorUnsupported)     //directory transfer
DEFINE_NEW_FILE_ERROR(ErrorLocalIo)

//remote call failed: protocolStatus is the FTP reply code or the SFTP status, 0 if not available
class ErrorRemoteOperation : public FileError
{
public:
    ErrorRemoteOperation(const std::wstring& msg, const std::wstring& details, long protocolStatus) :
        FileError(msg, details), protocolStatus_(protocolStatus) {}

    long getProtocolStatus() const { return protocolStatus_; }

private:
    long protocolStatus_ = 0;
};


//errno is easily overwritten => evaluate *before* making any (indirect) system calls:
#define THROW_LAST_FILE_ERROR(msg, functionName)                           \
    do { const ErrorCode ecInternal = getLastError(); throw ferry::ErrorLocalIo(msg, formatSystemError(functionName, ecInternal)); } while (false)

//----------- facilitate usage of std::wstring for error messages --------------------

inline std::wstring fmtPath(const std::wstring& displayPath) { return L'"' + displayPath + L'"'; }
inline std::wstring fmtPath(const Zstring& displayPath) { return fmtPath(utfTo<std::wstring>(displayPath)); }
inline std::wstring fmtPath(const wchar_t* displayPath) { return fmtPath(std::wstring(displayPath)); } //resolve overload ambiguity
}

#endif //FILE_ERROR_H_2791054368120945
