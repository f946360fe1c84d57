// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef RETRYING_INVOKER_H_0817465523902281
#define RETRYING_INVOKER_H_0817465523902281

#include "ssh_transport.h"


namespace sshb
{
/*  drive a non-blocking primitive to completion:
        rc >= 0                           => done
        SSH_RC_WOULD_BLOCK                => wait for socket traffic in the blocked direction(s), then repeat the same call
        SSH_RC_SFTP_PROTOCOL + SFTP error => SysErrorSftpProtocol: the session itself is fine
        anything else                     => SysError: session is considered corrupted

    stop time covers the whole command, not a single attempt                  */
class RetryingInvoker
{
public:
    RetryingInvoker(SessionTraffic& traffic, const SftpChannel* channel /*optional*/, std::chrono::steady_clock::duration timeout) :
        traffic_(traffic), channel_(channel), timeout_(timeout) {}

    template <class Function> //int/ssize_t Function()
    auto invoke(const char* functionName, Function attempt) //throw SysError, SysErrorTimeout, SysErrorSftpProtocol
    {
        const auto startTime = std::chrono::steady_clock::now();
        return invoke(functionName, attempt, startTime + timeout_);
    }

    template <class Function>
    auto invoke(const char* functionName, Function attempt, std::chrono::steady_clock::time_point stopTime) //throw SysError, SysErrorTimeout, SysErrorSftpProtocol
    {
        const auto startTime = std::chrono::steady_clock::now();
        for (;;)
        {
            const auto rc = attempt(); //noexcept!
            if (rc >= 0)
                return rc;

            waitOrThrow(functionName, static_cast<int>(rc), startTime, stopTime); //throw SysError, SysErrorTimeout, SysErrorSftpProtocol
        }
    }

    std::chrono::steady_clock::duration getTimeout() const { return timeout_; }

private:
    void waitOrThrow(const char* functionName, int rc, std::chrono::steady_clock::time_point startTime, std::chrono::steady_clock::time_point stopTime);

    SessionTraffic& traffic_;
    const SftpChannel* const channel_;
    const std::chrono::steady_clock::duration timeout_;
};
}

#endif //RETRYING_INVOKER_H_0817465523902281
