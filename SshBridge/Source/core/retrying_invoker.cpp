// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "retrying_invoker.h"

using namespace sshb;


void RetryingInvoker::waitOrThrow(const char* functionName, int rc,
                                  std::chrono::steady_clock::time_point startTime,
                                  std::chrono::steady_clock::time_point stopTime) //throw SysError, SysErrorTimeout, SysErrorSftpProtocol
{
    if (rc == SSH_RC_WOULD_BLOCK)
    {
        BlockDirection dirs = traffic_.getBlockDirections();
        if (dirs == BlockDirection::none) //transport doesn't know: better wait for either than spin
            dirs = BlockDirection::both;

        if (std::chrono::steady_clock::now() < stopTime &&
            traffic_.waitForTraffic(dirs, stopTime)) //throw SysError
            return; //=> next attempt

        //pending command is abandoned: don't trust this session anymore
        traffic_.markAsCorrupted();

        const auto timeoutSec = std::max<int64_t>(std::chrono::ceil<std::chrono::seconds>(stopTime - startTime).count(), 0);
        throw SysErrorTimeout(formatSystemError(functionName, formatSshReturnCode(SSH_RC_TIMEOUT),
                                                _P("Operation timed out after 1 second.", "Operation timed out after %x seconds.", timeoutSec)));
    }

    //SSH_RC_SFTP_PROTOCOL *without* an SFTP status indicates a corrupted connection
    if (rc == SSH_RC_SFTP_PROTOCOL && channel_)
        if (const unsigned long sftpError = channel_->getLastSftpStatus();
            sftpError != SSH_FX_OK)
            throw SysErrorSftpProtocol(channel_->formatLastError(functionName), sftpError); //the SSH session is just fine!

    traffic_.markAsCorrupted(); //SSH session errors only (hopefully!) e.g. socket recv failure
    throw SysError(channel_ ? channel_->formatLastError(functionName) : traffic_.formatLastError(functionName));
}
