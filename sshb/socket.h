// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SOCKET_H_8847150322965418
#define SOCKET_H_8847150322965418

#include <chrono>
#include <optional>
#include "sys_error.h"
    #include <unistd.h> //close
    #include <fcntl.h>
    #include <poll.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <netinet/tcp.h> //TCP_NODELAY
    #include <netdb.h> //getaddrinfo


namespace sshb
{
#define THROW_LAST_SYS_ERROR_GAI(rcGai)                        \
    do {                                                       \
        if (rcGai == EAI_SYSTEM) /*"check errno for details"*/ \
            THROW_LAST_SYS_ERROR("getaddrinfo");               \
        \
        throw sshb::SysError(sshb::formatSystemError("getaddrinfo", sshb::formatGaiErrorCode(rcGai), ::gai_strerror(rcGai))); \
    } while (false)

inline
std::string formatGaiErrorCode(int ec)
{
    switch (ec)
    {
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_ADDRFAMILY);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_AGAIN);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_BADFLAGS);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_FAIL);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_FAMILY);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_MEMORY);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_NODATA);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_NONAME);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_SERVICE);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_SOCKTYPE);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_SYSTEM);
            SSHB_CHECK_CASE_FOR_CONSTANT(EAI_OVERFLOW);
        default:
            return replaceCpy(_("Error code %x"), "%x", numberTo<std::string>(ec));
    }
}

using SocketType = int;
const SocketType invalidSocket = -1;
inline void closeSocket(SocketType s) { ::close(s); }

void setNonBlocking(SocketType socket, bool value); //throw SysError


class Socket //throw SysError
{
public:
    Socket(const std::string& server, const std::string& serviceName, int timeoutSec) //throw SysError
    {
        if (trimCpy(server).empty())
            throw SysError(_("Server name must not be empty."));

        const addrinfo hints
        {
            .ai_flags = AI_ADDRCONFIG, //save a AAAA lookup on machines that can't use the returned data anyhow
            .ai_socktype = SOCK_STREAM,
        };

        addrinfo* servinfo = nullptr;
        SSHB_ON_SCOPE_EXIT(if (servinfo) ::freeaddrinfo(servinfo));

        const int rcGai = ::getaddrinfo(server.c_str(), serviceName.c_str(), &hints, &servinfo);
        if (rcGai != 0)
            THROW_LAST_SYS_ERROR_GAI(rcGai);
        if (!servinfo)
            throw SysError(formatSystemError("getaddrinfo", "", "Empty server info."));

        const auto getConnectedSocket = [timeoutSec](const addrinfo& ai)
        {
            SocketType testSocket = ::socket(ai.ai_family,    //int socket_family
                                             SOCK_CLOEXEC | SOCK_NONBLOCK |
                                             ai.ai_socktype,  //int socket_type
                                             ai.ai_protocol); //int protocol
            if (testSocket == invalidSocket)
                THROW_LAST_SYS_ERROR("socket");
            SSHB_ON_SCOPE_FAIL(closeSocket(testSocket));

            if (::connect(testSocket, ai.ai_addr, ai.ai_addrlen) != 0)
            {
                if (errno != EINPROGRESS)
                    THROW_LAST_SYS_ERROR("connect");

                pollfd pfd{.fd = testSocket, .events = POLLOUT};

                const int rv = ::poll(&pfd, 1, timeoutSec * 1000);
                if (rv < 0)
                    THROW_LAST_SYS_ERROR("poll");

                if (rv == 0) //time-out!
                    throw SysError(formatSystemError("poll, " + _P("1 sec", "%x sec", timeoutSec), ETIMEDOUT));

                int error = 0;
                socklen_t optLen = sizeof(error);
                if (::getsockopt(testSocket, SOL_SOCKET, SO_ERROR, &error, &optLen) != 0)
                    THROW_LAST_SYS_ERROR("getsockopt(SO_ERROR)");

                if (error != 0)
                    throw SysError(formatSystemError("connect, SO_ERROR", static_cast<ErrorCode>(error)));
            }

            setNonBlocking(testSocket, false); //throw SysError

            int noDelay = 1; //disable Nagle algorithm: SSH packets are latency-bound
            if (::setsockopt(testSocket, IPPROTO_TCP, TCP_NODELAY, &noDelay, sizeof(noDelay)) != 0)
                THROW_LAST_SYS_ERROR("setsockopt(TCP_NODELAY)");

            return testSocket;
        };

        //getaddrinfo() may return more than one address: use the first one that connects
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


//wait until socket is ready for reading and/or writing: returns false on time-out
bool waitForSocket(SocketType socket, bool readable, bool writable, std::chrono::steady_clock::time_point stopTime); //throw SysError






//######################## implementation ########################
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


inline
bool waitForSocket(SocketType socket, bool readable, bool writable, std::chrono::steady_clock::time_point stopTime) //throw SysError
{
    //reference: libssh2 session.c: _libssh2_wait_socket()
    pollfd pfd{.fd = socket};
    if (readable)
        pfd.events |= POLLIN;
    if (writable)
        pfd.events |= POLLOUT;

    if (pfd.events == 0)
        throw SysError(formatSystemError("poll", "", "No traffic direction specified."));

    for (;;)
    {
        const auto now = std::chrono::steady_clock::now();
        if (now >= stopTime)
            return false;
        const auto waitTimeMs = std::chrono::duration_cast<std::chrono::milliseconds>(stopTime - now).count();

        const int rv = ::poll(&pfd,       //struct pollfd* fds
                              1,          //nfds_t nfds
                              static_cast<int>(std::max<decltype(waitTimeMs)>(waitTimeMs, 1))); //int timeout [ms]
        if (rv < 0)
        {
            if (errno == EINTR)
                continue;
            THROW_LAST_SYS_ERROR("poll");
        }
        return rv != 0; //rv == 0: time-out! => let next attempt fail with detailed error!
    }
}
}

#endif //SOCKET_H_8847150322965418
