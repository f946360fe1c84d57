// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SESSION_DELEGATE_H_2260917835540119
#define SESSION_DELEGATE_H_2260917835540119

#include <cstddef>
#include <string>


namespace sshb
{
/*  session notifications: override what you need

    THREAD-SAFETY: all callbacks run synchronously on the session's worker thread,
    i.e. inside the serialized context => must not wait for other session operations! */
class SessionDelegate
{
public:
    virtual ~SessionDelegate() {}

    virtual void onConnect(const std::string& serverBanner) {}
    virtual void onDisconnect(const std::string& reason) {} //server-initiated or local teardown

    virtual void onDataSent    (size_t bytes) {} //raw socket traffic
    virtual void onDataReceived(size_t bytes) {} //

    virtual void onDebug(const std::string& msg) {} //SSH_MSG_DEBUG sent by server
    virtual void onTrace(const std::string& msg) {} //transport diagnostics

    //keyboard-interactive authentication: one call per prompt
    virtual std::string onKeyboardInteractive(const std::string& prompt, bool echo) { return {}; }
};
}

#endif //SESSION_DELEGATE_H_2260917835540119
