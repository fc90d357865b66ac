// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef LIBSSH2_WRAP_H_6205918473302651
#define LIBSSH2_WRAP_H_6205918473302651

#include <base/scope_guard.h>
#include <base/string_tools.h>


//-------------------------------------------------
#include <libssh2_sftp.h>
//-------------------------------------------------

#ifndef LIBSSH2_SFTP_H
    #error libssh2_sftp.h header guard changed
#endif

//std::string overloads for the libssh2 macros: the *_ex() functions take "unsigned int" lengths
namespace ferry::impl
{
inline unsigned int getSshLength(const std::string& str) { return static_cast<unsigned int>(str.size()); }
}

#undef libssh2_userauth_password
inline int libssh2_userauth_password(LIBSSH2_SESSION* session, const std::string& username, const char* password, size_t passwordLen)
{
    return libssh2_userauth_password_ex(session, username.c_str(), ferry::impl::getSshLength(username),
                                        password, static_cast<unsigned int>(passwordLen), nullptr /*passwd_change_cb*/);
}

#undef libssh2_userauth_keyboard_interactive
inline int libssh2_userauth_keyboard_interactive(LIBSSH2_SESSION* session, const std::string& username, LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC((*response_callback)))
{
    return libssh2_userauth_keyboard_interactive_ex(session, username.c_str(), ferry::impl::getSshLength(username), response_callback);
}

inline char* libssh2_userauth_list(LIBSSH2_SESSION* session, const std::string& username)
{
    return libssh2_userauth_list(session, username.c_str(), ferry::impl::getSshLength(username));
}

//all SFTP paths are relative to the login folder or absolute; never empty
#undef libssh2_sftp_opendir
inline LIBSSH2_SFTP_HANDLE* libssh2_sftp_opendir(LIBSSH2_SFTP* sftp, const std::string& path)
{
    return libssh2_sftp_open_ex(sftp, path.c_str(), ferry::impl::getSshLength(path), 0 /*flags*/, 0 /*mode*/, LIBSSH2_SFTP_OPENDIR);
}

#undef libssh2_sftp_open
inline LIBSSH2_SFTP_HANDLE* libssh2_sftp_open(LIBSSH2_SFTP* sftp, const std::string& path, unsigned long flags, long mode)
{
    return libssh2_sftp_open_ex(sftp, path.c_str(), ferry::impl::getSshLength(path), flags, mode, LIBSSH2_SFTP_OPENFILE);
}

#undef libssh2_sftp_stat
inline int libssh2_sftp_stat(LIBSSH2_SFTP* sftp, const std::string& path, LIBSSH2_SFTP_ATTRIBUTES* attrs) //follows symlinks
{
    return libssh2_sftp_stat_ex(sftp, path.c_str(), ferry::impl::getSshLength(path), LIBSSH2_SFTP_STAT, attrs);
}

#undef libssh2_sftp_unlink
inline int libssh2_sftp_unlink(LIBSSH2_SFTP* sftp, const std::string& path)
{
    return libssh2_sftp_unlink_ex(sftp, path.c_str(), ferry::impl::getSshLength(path));
}

#undef libssh2_sftp_rename
inline int libssh2_sftp_rename(LIBSSH2_SFTP* sftp, const std::string& pathFrom, const std::string& pathTo, long flags)
{
    return libssh2_sftp_rename_ex(sftp, pathFrom.c_str(), ferry::impl::getSshLength(pathFrom),
                                  /**/  pathTo  .c_str(), ferry::impl::getSshLength(pathTo), flags);
}

#undef libssh2_sftp_mkdir
inline int libssh2_sftp_mkdir(LIBSSH2_SFTP* sftp, const std::string& path, long mode)
{
    return libssh2_sftp_mkdir_ex(sftp, path.c_str(), ferry::impl::getSshLength(path), mode);
}

#undef libssh2_sftp_rmdir
inline int libssh2_sftp_rmdir(LIBSSH2_SFTP* sftp, const std::string& path)
{
    return libssh2_sftp_rmdir_ex(sftp, path.c_str(), ferry::impl::getSshLength(path));
}


namespace ferry
{
inline
std::wstring formatSshStatusCode(int sc)
{
    switch (sc)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_NONE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_SOCKET_NONE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_BANNER_RECV);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_BANNER_SEND);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_INVALID_MAC);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_KEX_FAILURE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_ALLOC);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_SOCKET_SEND);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_TIMEOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_HOSTKEY_INIT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_HOSTKEY_SIGN);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_DECRYPT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_SOCKET_DISCONNECT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_PROTO);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_PASSWORD_EXPIRED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_METHOD_NONE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_AUTHENTICATION_FAILED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_CHANNEL_FAILURE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_CHANNEL_CLOSED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_CHANNEL_EOF_SENT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_ZLIB);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_SOCKET_TIMEOUT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_SFTP_PROTOCOL);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_REQUEST_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_METHOD_NOT_SUPPORTED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_INVAL);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_EAGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_BUFFER_TOO_SMALL);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_BAD_USE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_COMPRESS);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_SOCKET_RECV);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_ENCRYPT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_ERROR_BAD_SOCKET);

        default:
            return replaceCpy<std::wstring>(L"SSH status %x", L"%x", numberTo<std::wstring>(sc));
    }
}


//status of the last SFTP request: libssh2_sftp_last_error()
inline
std::wstring formatSftpStatusCode(unsigned long sc)
{
    switch (sc)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_OK);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_EOF);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_NO_SUCH_FILE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_PERMISSION_DENIED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_FAILURE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_BAD_MESSAGE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_NO_CONNECTION);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_CONNECTION_LOST);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_OP_UNSUPPORTED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_INVALID_HANDLE);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_NO_SUCH_PATH);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_FILE_ALREADY_EXISTS);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_WRITE_PROTECT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_NO_MEDIA);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_NO_SPACE_ON_FILESYSTEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_QUOTA_EXCEEDED);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_UNKNOWN_PRINCIPAL);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_LOCK_CONFLICT);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_DIR_NOT_EMPTY);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_NOT_A_DIRECTORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_INVALID_FILENAME);
            FERRY_CHECK_CASE_FOR_CONSTANT(LIBSSH2_FX_LINK_LOOP);
        default:
            return replaceCpy<std::wstring>(L"SFTP status %x", L"%x", numberTo<std::wstring>(sc));
    }
}
}

#else
#error Why is this header already defined? Do not include in other headers: encapsulate the gory details!
#endif //LIBSSH2_WRAP_H_6205918473302651
