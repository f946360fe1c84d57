// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sys_error.h"
#include <utility>
#include <glib.h>

using namespace sshb;


namespace
{
#define SSHB_ERRNO_NAME(X) { X, #X }

//socket setup, name resolution and local file access
constexpr std::pair<ErrorCode, const char*> errnoNames[] =
{
    SSHB_ERRNO_NAME(EPERM),
    SSHB_ERRNO_NAME(ENOENT),
    SSHB_ERRNO_NAME(EINTR),
    SSHB_ERRNO_NAME(EIO),
    SSHB_ERRNO_NAME(EBADF),
    SSHB_ERRNO_NAME(EAGAIN),
    SSHB_ERRNO_NAME(ENOMEM),
    SSHB_ERRNO_NAME(EACCES),
    SSHB_ERRNO_NAME(EEXIST),
    SSHB_ERRNO_NAME(ENOTDIR),
    SSHB_ERRNO_NAME(EISDIR),
    SSHB_ERRNO_NAME(EINVAL),
    SSHB_ERRNO_NAME(EMFILE),
    SSHB_ERRNO_NAME(ENOSPC),
    SSHB_ERRNO_NAME(EROFS),
    SSHB_ERRNO_NAME(EPIPE),
    SSHB_ERRNO_NAME(ENAMETOOLONG),
    SSHB_ERRNO_NAME(EAFNOSUPPORT),
    SSHB_ERRNO_NAME(EADDRNOTAVAIL),
    SSHB_ERRNO_NAME(ENETDOWN),
    SSHB_ERRNO_NAME(ENETUNREACH),
    SSHB_ERRNO_NAME(ECONNABORTED),
    SSHB_ERRNO_NAME(ECONNRESET),
    SSHB_ERRNO_NAME(ENOTCONN),
    SSHB_ERRNO_NAME(ETIMEDOUT),
    SSHB_ERRNO_NAME(ECONNREFUSED),
    SSHB_ERRNO_NAME(EHOSTDOWN),
    SSHB_ERRNO_NAME(EHOSTUNREACH),
    SSHB_ERRNO_NAME(EINPROGRESS),
    SSHB_ERRNO_NAME(EDQUOT),
};

#undef SSHB_ERRNO_NAME


std::string formatErrorCode(ErrorCode ec)
{
    for (const auto& [code, name] : errnoNames)
        if (code == ec)
            return name;
    return replaceCpy(_("Error code %x"), "%x", numberTo<std::string>(ec));
}
}


std::string sshb::getSystemErrorDescription(ErrorCode ec)
{
    const ErrorCode ecCurrent = getLastError(); //g_strerror() may clobber errno
    SSHB_ON_SCOPE_EXIT(errno = ecCurrent);

    return trimCpy(::g_strerror(ec)); //UTF-8 and thread-safe, unlike strerror()
}


std::string sshb::formatSystemError(const std::string& functionName, ErrorCode ec)
{
    return formatSystemError(functionName, formatErrorCode(ec), getSystemErrorDescription(ec));
}


//"ECONNREFUSED: Connection refused [connect]"
std::string sshb::formatSystemError(const std::string& functionName, const std::string& errorCode, const std::string& errorMsg)
{
    std::string output = trimCpy(errorCode);

    if (const std::string msg = trimCpy(errorMsg);
        !msg.empty())
        output += (output.empty() ? "" : ": ") + msg;

    if (!functionName.empty())
        output += (output.empty() ? "[" : " [") + functionName + ']';

    return output;
}
