// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SSH_SESSION_H_4409821176350927
#define SSH_SESSION_H_4409821176350927

#include "../core/ssh_transport.h"
#include "../core/session_config.h"
#include "../core/session_delegate.h"


namespace sshb
{
/*  libssh2-based SSH transport:
        - TCP connect, handshake and authentication run in blocking mode, bounded by SessionConfig::timeoutSec
        - afterwards the session is switched to non-blocking mode: all further calls are single attempts
        - "delegate" must outlive the returned transport                                                */
std::unique_ptr<SshTransport> createLibssh2Transport(const SessionConfig& cfg, SessionDelegate& delegate); //throw SysError
}

#endif //SSH_SESSION_H_4409821176350927
