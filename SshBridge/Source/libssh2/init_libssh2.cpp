// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "init_libssh2.h"
#include <utility>
#include <sshb/globals.h>
#include <sshb/open_ssl.h>
#include <sshb/string_tools.h>
#include <libssh2.h>

using namespace sshb;


namespace
{
constinit Global<Libssh2Initializer> globalLibssh2Init;

#define SSHB_LIBSSH2_STATUS(X) { X, #X }

//codes a client session can run into; the rest are numbered
constexpr std::pair<int, const char*> libssh2StatusNames[] =
{
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_NONE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_SOCKET_NONE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_BANNER_RECV),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_BANNER_SEND),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_INVALID_MAC),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_KEX_FAILURE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_ALLOC),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_SOCKET_SEND),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_KEY_EXCHANGE_FAILURE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_TIMEOUT),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_HOSTKEY_INIT),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_HOSTKEY_SIGN),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_DECRYPT),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_SOCKET_DISCONNECT),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_PROTO),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_PASSWORD_EXPIRED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_FILE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_METHOD_NONE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_AUTHENTICATION_FAILED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_PUBLICKEY_UNVERIFIED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_CHANNEL_FAILURE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_CHANNEL_CLOSED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_ZLIB),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_SOCKET_TIMEOUT),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_SFTP_PROTOCOL),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_REQUEST_DENIED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_METHOD_NOT_SUPPORTED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_INVAL),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_EAGAIN),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_BUFFER_TOO_SMALL),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_BAD_USE),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_COMPRESS),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_AGENT_PROTOCOL),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_SOCKET_RECV),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_ENCRYPT),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_BAD_SOCKET),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_KEYFILE_AUTH_FAILED),
    SSHB_LIBSSH2_STATUS(LIBSSH2_ERROR_ALGO_UNSUPPORTED),
};

#undef SSHB_LIBSSH2_STATUS
}


std::string sshb::formatLibssh2Status(int rc)
{
    for (const auto& [status, name] : libssh2StatusNames)
        if (status == rc)
            return name;
    return replaceCpy("SSH status %x", "%x", numberTo<std::string>(rc));
}


Libssh2Initializer::Libssh2Initializer() //throw SysError
{
    openSslInit(); //libssh2 uses OpenSSL as crypto backend

    if (const int rc = ::libssh2_init(0);
        rc != 0)
        throw SysError(formatSystemError("libssh2_init", formatLibssh2Status(rc), ""));
}


Libssh2Initializer::~Libssh2Initializer()
{
    ::libssh2_exit();
}


std::shared_ptr<Libssh2Initializer> sshb::getLibssh2Initializer() //throw SysError
{
    globalLibssh2Init.setOnce([] { return std::make_unique<Libssh2Initializer>(); }); //throw SysError

    if (std::shared_ptr<Libssh2Initializer> init = globalLibssh2Init.get())
        return init;

    throw SysError(formatSystemError("getLibssh2Initializer", "", "Function call not allowed during init/shutdown."));
}
