// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sftp.h"
#include <base/file_io.h>

using namespace ferry;


template <class Function>
auto SftpDriver::runSftpCommand(const ConnectionDescriptor& conn, const std::wstring& errorMsg, Function sftpCommand) //throw ErrorRemoteOperation, X
{
    try
    {
        const std::unique_ptr<SftpSession> session = sessionFactory_(conn); //throw SysError, SysErrorPassword
        if (!session)
            throw SysError(formatSystemError("SftpSessionFactory", L"", L"No session."));

        session->changeDirectory(conn.getWorkingPath()); //throw SysError, SysErrorSftpProtocol

        return sftpCommand(*session); //throw SysError, SysErrorSftpProtocol, X
    }
    catch (const SysErrorSftpProtocol& e) { throw ErrorRemoteOperation(errorMsg, e.toString(), e.sftpErrorCode); }
    catch (const SysError&             e) { throw ErrorRemoteOperation(errorMsg, e.toString(), 0); }
}


std::vector<std::string> SftpDriver::listDirectory(const ConnectionDescriptor& conn) //throw ErrorRemoteOperation
{
    return runSftpCommand(conn, replaceCpy(_("Cannot read directory %x."), L"%x", fmtPath(getDisplayPath(conn))),
                          [](SftpSession& session) { return session.readDirectory(); }); //throw SysError, SysErrorSftpProtocol
}


PathType SftpDriver::getPathType(const ConnectionDescriptor& conn, const std::string& itemName) //throw ErrorRemoteOperation
{
    return runSftpCommand(conn, replaceCpy(_("Cannot read file attributes of %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))),
                          [&](SftpSession& session)
    {
        return session.isDirectory(itemName) ? PathType::folder : PathType::file; //throw SysError, SysErrorSftpProtocol
    });
}


void SftpDriver::uploadFile(const ConnectionDescriptor& conn, const Zstring& localFilePath, const std::string& itemName) //throw ErrorRemoteOperation, ErrorLocalIo
{
    FileInputPlain fileIn(localFilePath); //throw ErrorLocalIo

    runSftpCommand(conn, replaceCpy(_("Cannot write file %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))),
                   [&](SftpSession& session)
    {
        session.uploadFile(itemName, [&](std::span<char> buf)
        {
            return fileIn.tryRead(buf.data(), buf.size()); //throw ErrorLocalIo
        }); //throw SysError, SysErrorSftpProtocol, ErrorLocalIo
    });
}


void SftpDriver::downloadFile(const ConnectionDescriptor& conn, const std::string& itemName, const Zstring& localFilePath) //throw ErrorRemoteOperation, ErrorLocalIo
{
    saveFileTransactional(localFilePath, [&](const WriteBlockFun& writeBlock) //throw ErrorLocalIo, ErrorRemoteOperation
    {
        runSftpCommand(conn, replaceCpy(_("Cannot read file %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))),
                       [&](SftpSession& session)
        {
            session.downloadFile(itemName, [&](std::span<const char> buf)
            {
                writeBlock(buf.data(), buf.size()); //throw ErrorLocalIo
            }); //throw SysError, SysErrorSftpProtocol, ErrorLocalIo
        });
    });
}


void SftpDriver::deleteFile(const ConnectionDescriptor& conn, const std::string& itemName) //throw ErrorRemoteOperation
{
    runSftpCommand(conn, replaceCpy(_("Cannot delete file %x."), L"%x", fmtPath(getDisplayPath(conn, itemName))),
                   [&](SftpSession& session) { session.deleteFile(itemName); }); //throw SysError, SysErrorSftpProtocol
}


void SftpDriver::renameFile(const ConnectionDescriptor& conn, const std::string& itemName, const std::string& newName) //throw ErrorRemoteOperation
{
    runSftpCommand(conn, replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                               L"%x", L'\n' + fmtPath(getDisplayPath(conn, itemName))),
                                    L"%y", L'\n' + fmtPath(getDisplayPath(conn, newName))),
                   [&](SftpSession& session) { session.renameFile(itemName, newName); }); //throw SysError, SysErrorSftpProtocol
}


void SftpDriver::makeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) //throw ErrorRemoteOperation
{
    runSftpCommand(conn, replaceCpy(_("Cannot create directory %x."), L"%x", fmtPath(getDisplayPath(conn, folderName))),
                   [&](SftpSession& session) { session.createDirectory(folderName); }); //throw SysError, SysErrorSftpProtocol
}


void SftpDriver::removeDirectory(const ConnectionDescriptor& conn, const std::string& folderName) //throw ErrorRemoteOperation
{
    runSftpCommand(conn, replaceCpy(_("Cannot delete directory %x."), L"%x", fmtPath(getDisplayPath(conn, folderName))),
                   [&](SftpSession& session) { session.deleteDirectory(folderName); }); //throw SysError, SysErrorSftpProtocol
}
