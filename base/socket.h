// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef SOCKET_H_8820461357924116
#define SOCKET_H_8820461357924116

#include <optional>
#include "sys_error.h"
#include <unistd.h> //close
#include <fcntl.h>
#include <poll.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <netinet/tcp.h> //TCP_NODELAY
#include <netdb.h>       //getaddrinfo


namespace ferry
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw ferry::SysError(formatSystemError("getaddrinfo", formatGaiErrorCode(rcGai), utfTo<std::wstring>(::gai_strerror(rcGai)))); \
    } while (false)

inline
std::wstring formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            FERRY_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), L"%x", numberTo<std::wstring>(ec));
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError


//blocking TCP connection; the connect attempt is limited by timeoutSec
class Socket //throw SysError
{
public:
    Socket(const Zstring& server, const Zstring& serviceName, int timeoutSec) //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError(_("Server name must not be empty."));

        addrinfo hints = {};
        hints.ai_flags    = AI_ADDRCONFIG;
        hints.ai_socktype = SOCK_STREAM;

        addrinfo* servinfo = nullptr;
        FERRY_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", L"", L"Empty server info."));

        const auto getConnectedSocket = [timeoutSec](const addrinfo& ai)
        {
            SocketType testSocket = ::socket(ai.ai_family, SOCK_CLOEXEC | SOCK_NONBLOCK | ai.ai_socktype, ai.ai_protocol);
            if (testSocket == invalidSocket)
                THROW_LAST_SYS_ERROR("socket");
            FERRY_ON_SCOPE_FAIL(closeSocket(testSocket));

            if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                    THROW_LAST_SYS_ERROR("connect");

                pollfd fds[] = {{testSocket, POLLOUT, 0}};

                int rv = 0;
                do
                {
                    rv = ::poll(fds, 1, timeoutSec * 1000);
                }
                while (rv < 0 && errno == EINTR);

                if (rv < 0)
                    THROW_LAST_SYS_ERROR("poll");

                if (rv == 0) //time-out!
                    throw SysError(formatSystemError("poll, " + utfTo<std::string>(_P("1 sec", "%x sec", timeoutSec)), ETIMEDOUT));

                int error = 0;
                socklen_t optLen = sizeof(error);
                if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                    THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

                if (error != 0)
                    throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
            }

            setNonBlocking(testSocket, false); //throw SysError

            int noDelay = 1; //disable Nagle algorithm
            if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

            return testSocket;
        };

        //try all addresses (IPv6 + IPv4), report the first error if none works
        std::optional<SysError> firstError;
        for (const addrinfo* si = servinfo; si; si = si->ai_next)
            try
            {
                socket_ = getConnectedSocket(*si); //throw SysError; pass ownership
                return;
            }
            catch (const SysError& e) { if (!firstError) firstError = e; }

        throw* firstError; //list was not empty, so there must have been an error!
    }

    ~Socket() { closeSocket(socket_); }

    SocketType get() const { return socket_; }

private:
    Socket           (const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    SocketType socket_ = invalidSocket;
};


inline
void setNonBlocking(SocketType socket, bool nonBlocking) //throw SysError
{
    int flags = ::fcntl(socket, F_GETFL);
    if (flags == -1)
        THROW_LAST_SYS_ERROR("fcntl(F_GETFL)");

    if (nonBlocking)
        flags |= O_NONBLOCK;
    else
        flags &= ~O_NONBLOCK;

    if (::fcntl(socket, F_SETFL, flags) != 0)
        THROW_LAST_SYS_ERROR(nonBlocking ? "fcntl(F_SETFL, O_NONBLOCK)" : "fcntl(F_SETFL, ~O_NONBLOCK)");
}
}

#endif //SOCKET_H_8820461357924116
