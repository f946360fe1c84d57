// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SSH_TRANSPORT_H_9021347758160342
#define SSH_TRANSPORT_H_9021347758160342

#include <chrono>
#include <functional>
#include "ssh_status.h"
#include "sftp_channel.h"


namespace sshb
{
//socket readiness of an established connection
class SessionTraffic
{
public:
    virtual ~SessionTraffic() {}

    //direction(s) the last SSH_RC_WOULD_BLOCK attempt is waiting for; may be "none" if unknown
    virtual BlockDirection getBlockDirections() const = 0;

    //wait until socket is ready for one of "dirs": return false on time-out
    virtual bool waitForTraffic(BlockDirection dirs, std::chrono::steady_clock::time_point stopTime) = 0; //throw SysError

    //session-level failure or abandoned pending command: don't trust this connection anymore
    virtual void markAsCorrupted() = 0;
    virtual bool isHealthy() const = 0;

    virtual std::string formatLastError(const char* functionName) const = 0;
};


//session handle: an authenticated SSH connection
class SshTransport : public SessionTraffic
{
public:
    virtual int tryOpenSftp(std::unique_ptr<SftpChannel>& channel) = 0;     //single attempt, see ssh_status.h
    virtual int trySendKeepAlive(int& secondsToNextKeepAlive) = 0;          //

    virtual std::string getHostKey() const = 0; //raw server host key blob
    virtual std::string getServerBanner() const = 0;
};


struct SessionConfig;
class SessionDelegate;

//establish connection, including handshake and authentication: may block until SessionConfig::timeoutSec
using TransportFactory = std::function<std::unique_ptr<SshTransport>(const SessionConfig& cfg, SessionDelegate& delegate)>; //throw SysError
}

#endif //SSH_TRANSPORT_H_9021347758160342
