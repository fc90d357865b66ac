// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SFTP_LIBSSH2_H_4470918236650238
#define SFTP_LIBSSH2_H_4470918236650238

#include "sftp.h"


namespace ferry
{
//blocking libssh2 session: password authentication, else keyboard-interactive
std::unique_ptr<SftpSession> openLibssh2Session(const ConnectionDescriptor& conn); //throw SysError, SysErrorPassword

inline SftpSessionFactory getLibssh2SessionFactory() { return &openLibssh2Session; }
}

#endif //SFTP_LIBSSH2_H_4470918236650238
