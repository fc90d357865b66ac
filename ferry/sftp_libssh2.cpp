// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#include "sftp_libssh2.h"
#include <cstring>
#include <optional>
#include <base/socket.h>
#include <libssh2/libssh2_wrap.h> //DON'T include <libssh2_sftp.h> directly!
#include "init_curl_libssh2.h"

using namespace ferry;


namespace
{
//permissions for new files: rw- rw- rw- [0666] => server may apply umask!
const long SFTP_DEFAULT_PERMISSION_FILE = LIBSSH2_SFTP_S_IRUSR | LIBSSH2_SFTP_S_IWUSR |
                                          LIBSSH2_SFTP_S_IRGRP | LIBSSH2_SFTP_S_IWGRP |
                                          LIBSSH2_SFTP_S_IROTH | LIBSSH2_SFTP_S_IWOTH;

//permissions for new folders: rwx rwx rwx [0777] => server may apply umask!
const long SFTP_DEFAULT_PERMISSION_FOLDER = LIBSSH2_SFTP_S_IRWXU |
                                            LIBSSH2_SFTP_S_IRWXG |
                                            LIBSSH2_SFTP_S_IRWXO;

//libssh2 sends at most 30000 bytes per SFTP packet
const size_t SFTP_BLOCK_SIZE_READ  = 16 * 30000;
const size_t SFTP_BLOCK_SIZE_WRITE = 16 * 30000;


class Libssh2SftpSession : public SftpSession
{
public:
    explicit Libssh2SftpSession(const ConnectionDescriptor& conn) //throw SysError, SysErrorPassword
    {
        FERRY_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        const int timeoutSec = conn.options.timeoutSec;

        socket_.emplace(conn.getHost(), numberTo<Zstring>(getEffectivePort(conn)), timeoutSec); //throw SysError

        sshSession_ = ::libssh2_session_init();
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init", formatSshStatusCode(LIBSSH2_ERROR_ALLOC), L""));

        if (conn.options.allowZlib)
            if (const int rc = ::libssh2_session_flag(sshSession_, LIBSSH2_FLAG_COMPRESS, 1);
                rc != 0) //does not set SSH last error
                throw SysError(formatSystemError("libssh2_session_flag", formatSshStatusCode(rc), L""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake"));

        authenticate(conn.getUsername(), conn.getSecret().secureHandle()); //throw SysError, SysErrorPassword

        sftpChannel_ = ::libssh2_sftp_init(sshSession_);
        if (!sftpChannel_)
            throw SysError(formatLastSshError("libssh2_sftp_init"));
    }

    ~Libssh2SftpSession() { cleanup(); }

    void changeDirectory(const std::string& folderPath) override //throw SysError, SysErrorSftpProtocol
    {
        if (folderPath.empty())
        {
            workingDir_.clear();
            return;
        }
        const std::string serverPath = getServerPath(folderPath);

        if (!statFollowLink(serverPath)) //throw SysError, SysErrorSftpProtocol
            throw SysErrorSftpProtocol(formatSystemError("libssh2_sftp_stat", formatSftpStatusCode(LIBSSH2_FX_NOT_A_DIRECTORY),
                                                         utfTo<std::wstring>(serverPath)), LIBSSH2_FX_NOT_A_DIRECTORY);
        workingDir_ = serverPath;
    }

    std::vector<std::string> readDirectory() override //throw SysError, SysErrorSftpProtocol
    {
        LIBSSH2_SFTP_HANDLE* dirHandle = ::libssh2_sftp_opendir(sftpChannel_, workingDir_.empty() ? std::string(".") : workingDir_);
        if (!dirHandle)
            throwLastSftpError("libssh2_sftp_opendir", ::libssh2_session_last_errno(sshSession_)); //throw SysError, SysErrorSftpProtocol
        auto guardHandle = makeGuard<ScopeGuardRunMode::onFail>([&] { ::libssh2_sftp_closedir(dirHandle); });

        std::vector<std::string> output;
        std::vector<char> buf(4096); //libssh2 truncates names that don't fit

        for (;;)
        {
            LIBSSH2_SFTP_ATTRIBUTES attribs = {};
            const int rc = ::libssh2_sftp_readdir(dirHandle, buf.data(), buf.size(), &attribs);
            if (rc == 0) //no more items
                break;
            if (rc < 0)
                throwLastSftpError("libssh2_sftp_readdir", rc); //throw SysError, SysErrorSftpProtocol

            output.emplace_back(buf.data(), rc);
        }

        guardHandle.dismiss();
        if (const int rc = ::libssh2_sftp_closedir(dirHandle);
            rc < 0)
            throwLastSftpError("libssh2_sftp_closedir", rc); //throw SysError, SysErrorSftpProtocol
        return output;
    }

    bool isDirectory(const std::string& itemName) override //throw SysError, SysErrorSftpProtocol
    {
        return statFollowLink(getServerPath(itemName)); //throw SysError, SysErrorSftpProtocol
    }

    void uploadFile(const std::string& itemName, const std::function<size_t(std::span<char> buf)>& readBlock) override //throw SysError, SysErrorSftpProtocol, X
    {
        LIBSSH2_SFTP_HANDLE* fileHandle = ::libssh2_sftp_open(sftpChannel_, getServerPath(itemName),
                                                              LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC,
                                                              SFTP_DEFAULT_PERMISSION_FILE);
        if (!fileHandle)
            throwLastSftpError("libssh2_sftp_open", ::libssh2_session_last_errno(sshSession_)); //throw SysError, SysErrorSftpProtocol
        auto guardHandle = makeGuard<ScopeGuardRunMode::onFail>([&] { ::libssh2_sftp_close(fileHandle); });

        std::vector<char> buf(SFTP_BLOCK_SIZE_WRITE);
        for (;;)
        {
            const size_t bytesRead = readBlock(buf); //throw X
            if (bytesRead == 0) //end of stream
                break;

            for (size_t bytesWritten = 0; bytesWritten < bytesRead;)
            {
                const ssize_t rc = ::libssh2_sftp_write(fileHandle, buf.data() + bytesWritten, bytesRead - bytesWritten);
                if (rc < 0)
                    throwLastSftpError("libssh2_sftp_write", static_cast<int>(rc)); //throw SysError, SysErrorSftpProtocol
                bytesWritten += static_cast<size_t>(rc);
            }
        }

        guardHandle.dismiss();
        if (const int rc = ::libssh2_sftp_close(fileHandle); //flushes pending writes
            rc < 0)
            throwLastSftpError("libssh2_sftp_close", rc); //throw SysError, SysErrorSftpProtocol
    }

    void downloadFile(const std::string& itemName, const std::function<void(std::span<const char> buf)>& writeBlock) override //throw SysError, SysErrorSftpProtocol, X
    {
        LIBSSH2_SFTP_HANDLE* fileHandle = ::libssh2_sftp_open(sftpChannel_, getServerPath(itemName), LIBSSH2_FXF_READ, 0);
        if (!fileHandle)
            throwLastSftpError("libssh2_sftp_open", ::libssh2_session_last_errno(sshSession_)); //throw SysError, SysErrorSftpProtocol
        FERRY_ON_SCOPE_EXIT(::libssh2_sftp_close(fileHandle)); //read-only: nothing to flush

        std::vector<char> buf(SFTP_BLOCK_SIZE_READ);
        for (;;)
        {
            //libssh2_sftp_read has same semantics as Posix read:
            const ssize_t rc = ::libssh2_sftp_read(fileHandle, buf.data(), buf.size());
            if (rc == 0) //EOF
                break;
            if (rc < 0)
                throwLastSftpError("libssh2_sftp_read", static_cast<int>(rc)); //throw SysError, SysErrorSftpProtocol

            writeBlock({buf.data(), static_cast<size_t>(rc)}); //throw X
        }
    }

    void deleteFile(const std::string& itemName) override //throw SysError, SysErrorSftpProtocol
    {
        if (const int rc = ::libssh2_sftp_unlink(sftpChannel_, getServerPath(itemName));
            rc != 0)
            throwLastSftpError("libssh2_sftp_unlink", rc); //throw SysError, SysErrorSftpProtocol
    }

    void renameFile(const std::string& itemName, const std::string& newName) override //throw SysError, SysErrorSftpProtocol
    {
        if (const int rc = ::libssh2_sftp_rename(sftpChannel_, getServerPath(itemName), getServerPath(newName),
                                                 LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE);
            rc != 0)
            throwLastSftpError("libssh2_sftp_rename", rc); //throw SysError, SysErrorSftpProtocol
    }

    void createDirectory(const std::string& folderName) override //throw SysError, SysErrorSftpProtocol
    {
        if (const int rc = ::libssh2_sftp_mkdir(sftpChannel_, getServerPath(folderName), SFTP_DEFAULT_PERMISSION_FOLDER);
            rc != 0)
            throwLastSftpError("libssh2_sftp_mkdir", rc); //throw SysError, SysErrorSftpProtocol
    }

    void deleteDirectory(const std::string& folderName) override //throw SysError, SysErrorSftpProtocol
    {
        if (const int rc = ::libssh2_sftp_rmdir(sftpChannel_, getServerPath(folderName));
            rc != 0)
            throwLastSftpError("libssh2_sftp_rmdir", rc); //throw SysError, SysErrorSftpProtocol
    }

private:
    Libssh2SftpSession           (const Libssh2SftpSession&) = delete;
    Libssh2SftpSession& operator=(const Libssh2SftpSession&) = delete;

    void authenticate(const std::string& username, const SecureSecret& password) //throw SysError, SysErrorPassword
    {
        const char* authList = ::libssh2_userauth_list(sshSession_, username);
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list"));
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthInteractive = false;
        split(std::string_view(authList), ',', [&](std::string_view authMethod)
        {
            const std::string method = trimCpy(std::string(authMethod));
            if (method == "password")
                supportAuthPassword = true;
            else if (method == "keyboard-interactive")
                supportAuthInteractive = true;
        });

        if (supportAuthPassword)
        {
            if (::libssh2_userauth_password(sshSession_, username, password.c_str(), password.size()) != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_password"));
        }
        else if (supportAuthInteractive) //some servers support "keyboard-interactive", but not "password"
        {
            std::wstring unexpectedPrompts;

            auto authCallback = [&](int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)
            {
                //single prompt with "!echo": assume password request, prompt may be localized!
                if (num_prompts == 1 && prompts[0].echo == 0)
                {
                    responses[0].text = //pass ownership; will be ::free()d
                        ::strdup(password.c_str());
                    responses[0].length = static_cast<unsigned int>(password.size());
                }
                else
                    for (int i = 0; i < num_prompts; ++i)
                        unexpectedPrompts += (unexpectedPrompts.empty() ? L"" : L"|") +
                                             utfTo<std::wstring>(std::string_view(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length));
            };
            using AuthCbType = decltype(authCallback);

            auto authCallbackWrapper = [](const char* /*name*/, int /*name_len*/, const char* /*instruction*/, int /*instruction_len*/,
                                          int num_prompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses, void** abstract)
            {
                AuthCbType* callback = *reinterpret_cast<AuthCbType**>(abstract); //free this poor little C-API from its shackles and redirect to a proper lambda
                (*callback)(num_prompts, prompts, responses); //noexcept
            };

            if (*::libssh2_session_abstract(sshSession_))
                throw SysError(L"libssh2_session_abstract: non-null value");

            *reinterpret_cast<AuthCbType**>(::libssh2_session_abstract(sshSession_)) = &authCallback;
            FERRY_ON_SCOPE_EXIT(*::libssh2_session_abstract(sshSession_) = nullptr);

            if (::libssh2_userauth_keyboard_interactive(sshSession_, username, authCallbackWrapper) != 0)
                throw SysErrorPassword(formatLastSshError("libssh2_userauth_keyboard_interactive") +
                                       (unexpectedPrompts.empty() ? L"" : L"\nUnexpected prompts: " + unexpectedPrompts));
        }
        else
            throw SysError(replaceCpy(_("The server does not support authentication via %x."), L"%x", L"\"username/password\"") +
                           L'\n' + _("Required:") + L' ' + utfTo<std::wstring>(std::string_view(authList)));
    }

    //true if folder
    bool statFollowLink(const std::string& serverPath) //throw SysError, SysErrorSftpProtocol
    {
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};
        if (const int rc = ::libssh2_sftp_stat(sftpChannel_, serverPath, &attribs);
            rc != 0)
            throwLastSftpError("libssh2_sftp_stat", rc); //throw SysError, SysErrorSftpProtocol

        if (!(attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS))
            throw SysError(formatSystemError("libssh2_sftp_stat", L"", L"File attributes not available."));

        return LIBSSH2_SFTP_S_ISDIR(attribs.permissions);
    }

    std::string getServerPath(const std::string& itemName) const
    {
        if (workingDir_.empty() || startsWith(itemName, '/'))
            return itemName;
        if (endsWith(workingDir_, '/'))
            return workingDir_ + itemName;
        return workingDir_ + '/' + itemName;
    }

    [[noreturn]] void throwLastSftpError(const char* functionName, int rc) //throw SysError, SysErrorSftpProtocol
    {
        if (::libssh2_session_last_errno(sshSession_) != rc) //when libssh2 fails to properly set last error
            ::libssh2_session_set_last_error(sshSession_, rc, nullptr);

        //LIBSSH2_ERROR_SFTP_PROTOCOL *without* LIBSSH2_SFTP::last_errno indicates a corrupted connection!
        if (rc == LIBSSH2_ERROR_SFTP_PROTOCOL)
            if (const unsigned long sftpStatus = ::libssh2_sftp_last_error(sftpChannel_);
                sftpStatus != LIBSSH2_FX_OK)
                throw SysErrorSftpProtocol(formatLastSshError(functionName), sftpStatus);

        throw SysError(formatLastSshError(functionName));
    }

    std::wstring formatLastSshError(const char* functionName) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::wstring errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(utfTo<std::wstring>(std::string_view(lastErrorMsg)));

        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel_ && ::libssh2_sftp_last_error(sftpChannel_) != LIBSSH2_FX_OK)
        {
            if (errorMsg == L"SFTP Protocol Error") //that's trite!
                errorMsg.clear();
            return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel_)), errorMsg);
        }
        return formatSystemError(functionName, formatSshStatusCode(sshStatusCode), errorMsg);
    }

    void cleanup() //nothrow; attention: may block heavily after error!
    {
        if (sftpChannel_)
            if (const int rc = ::libssh2_sftp_shutdown(sftpChannel_);
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(_("Failed to close SFTP channel.") + L"\n\n" + formatSystemError("libssh2_sftp_shutdown", formatSshStatusCode(rc), L""));

        if (sshSession_)
        {
            if (const int rc = ::libssh2_session_disconnect(sshSession_, "Ferry says \"bye\"!"); //= server notification only! no local cleanup apparently
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(_("Failed to disconnect SSH session.") + L"\n\n" + formatSystemError("libssh2_session_disconnect", formatSshStatusCode(rc), L""));

            if (const int rc = ::libssh2_session_free(sshSession_);
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(_("Failed to disconnect SSH session.") + L"\n\n" + formatSystemError("libssh2_session_free", formatSshStatusCode(rc), L""));
        }
    }

    const std::shared_ptr<NetworkInitCookie> initCookie_ = acquireNetworkInit(); //first member: outlives the libssh2 handles
    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    LIBSSH2_SFTP* sftpChannel_ = nullptr;
    std::string workingDir_; //empty: login directory
};
}


std::unique_ptr<SftpSession> ferry::openLibssh2Session(const ConnectionDescriptor& conn) //throw SysError, SysErrorPassword
{
    return std::make_unique<Libssh2SftpSession>(conn); //throw SysError, SysErrorPassword
}
