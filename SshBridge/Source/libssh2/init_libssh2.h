// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef INIT_LIBSSH2_H_6610498237715520
#define INIT_LIBSSH2_H_6610498237715520

#include <memory>
#include <string>
#include <sshb/sys_error.h>


namespace sshb
{
/*  libssh2_init()/libssh2_exit() dance:
        - every SSH session shares ownership of the initializer
        - libssh2_exit() runs after both process shutdown has begun and the last session is gone */
class Libssh2Initializer
{
public:
    Libssh2Initializer(); //throw SysError
    ~Libssh2Initializer();

private:
    Libssh2Initializer           (const Libssh2Initializer&) = delete;
    Libssh2Initializer& operator=(const Libssh2Initializer&) = delete;
};

std::shared_ptr<Libssh2Initializer> getLibssh2Initializer(); //throw SysError

//"LIBSSH2_ERROR_KEX_FAILURE": core/ssh_status.h only names the codes the session logic acts on
std::string formatLibssh2Status(int rc);
}

#endif //INIT_LIBSSH2_H_6610498237715520
