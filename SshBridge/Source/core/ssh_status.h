// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SSH_STATUS_H_7713049815562034
#define SSH_STATUS_H_7713049815562034

#include <optional>
#include <sshb/file_error.h>


namespace sshb
{
/*  single-attempt status codes follow the libssh2 convention:
        rc >= 0:  success (may carry a byte count)
        rc <  0:  failure; SSH_RC_WOULD_BLOCK is transient         */
const int SSH_RC_OK             = 0;
const int SSH_RC_SOCKET_NONE    = -1;  //LIBSSH2_ERROR_SOCKET_NONE
const int SSH_RC_TIMEOUT        = -9;  //LIBSSH2_ERROR_TIMEOUT
const int SSH_RC_SFTP_PROTOCOL  = -31; //LIBSSH2_ERROR_SFTP_PROTOCOL: consult the channel's last SFTP status
const int SSH_RC_WOULD_BLOCK    = -37; //LIBSSH2_ERROR_EAGAIN
const int SSH_RC_BUFFER_TOO_SMALL = -38; //LIBSSH2_ERROR_BUFFER_TOO_SMALL

//SFTP status codes: https://tools.ietf.org/html/draft-ietf-secsh-filexfer-13#section-9.1
const unsigned long SSH_FX_OK                = 0;
const unsigned long SSH_FX_EOF               = 1;
const unsigned long SSH_FX_NO_SUCH_FILE      = 2;
const unsigned long SSH_FX_PERMISSION_DENIED = 3;
const unsigned long SSH_FX_FAILURE           = 4;
const unsigned long SSH_FX_OP_UNSUPPORTED    = 8;
const unsigned long SSH_FX_INVALID_HANDLE    = 9;
const unsigned long SSH_FX_NO_SUCH_PATH      = 10;
const unsigned long SSH_FX_FILE_ALREADY_EXISTS = 11;
const unsigned long SSH_FX_DIR_NOT_EMPTY     = 18;
const unsigned long SSH_FX_NOT_A_DIRECTORY   = 19;
const unsigned long SSH_FX_FILE_IS_A_DIRECTORY = 24;

std::string formatSftpStatusCode(unsigned long sc);
std::string formatSshReturnCode(int rc);


//socket direction(s) a pending command is blocked on
enum class BlockDirection
{
    none     = 0,
    inbound  = 0x1, //wait until readable
    outbound = 0x2, //wait until writable
    both     = inbound | outbound,
};

inline BlockDirection operator|(BlockDirection lhs, BlockDirection rhs) { return static_cast<BlockDirection>(static_cast<int>(lhs) | static_cast<int>(rhs)); }
inline BlockDirection operator&(BlockDirection lhs, BlockDirection rhs) { return static_cast<BlockDirection>(static_cast<int>(lhs) & static_cast<int>(rhs)); }
inline bool contains(BlockDirection dirs, BlockDirection dir) { return (dirs & dir) == dir && dir != BlockDirection::none; }

//-----------------------------------------------------------------------------------------------

//low-level errors raised inside the serialized session context
DEFINE_NEW_SYS_ERROR(SysErrorTimeout) //deadline exceeded while waiting for socket readiness

class SysErrorSftpProtocol : public SysError
{
public:
    SysErrorSftpProtocol(const std::string& msg, unsigned long sftpError) : SysError(msg), sftpErrorCode(sftpError) {}
    const unsigned long sftpErrorCode;
};

//high-level errors seen by callers
DEFINE_NEW_FILE_ERROR(ErrorSessionClosed) //operation attempted after teardown
DEFINE_NEW_FILE_ERROR(ErrorTimeout)       //
DEFINE_NEW_FILE_ERROR(ErrorShortTransfer) //fewer bytes moved than expected

//definitive failure reported by the protocol layer
class ErrorProtocol : public FileError
{
public:
    ErrorProtocol(const std::string& msg, const std::string& details, std::optional<unsigned long> sftpError = {}) :
        FileError(msg, details), sftpErrorCode(sftpError) {}

    const std::optional<unsigned long> sftpErrorCode;
};

//file or directory handle could not be created
class ErrorOpenFailed : public FileError
{
public:
    ErrorOpenFailed(const std::string& msg, const std::string& details, std::optional<unsigned long> sftpError = {}) :
        FileError(msg, details), sftpErrorCode(sftpError) {}

    const std::optional<unsigned long> sftpErrorCode;
};

inline bool isNotFoundStatus(std::optional<unsigned long> sftpError)
{
    return sftpError && (*sftpError == SSH_FX_NO_SUCH_FILE ||
                         *sftpError == SSH_FX_NO_SUCH_PATH);
}
inline bool isNotFoundError(const ErrorProtocol&   e) { return isNotFoundStatus(e.sftpErrorCode); }
inline bool isNotFoundError(const ErrorOpenFailed& e) { return isNotFoundStatus(e.sftpErrorCode); }


//translate low-level error into high-level error: one place for all call sites
template <class Function> inline
auto runWithErrorContext(const std::string& errorMsg, Function fun) //throw ErrorTimeout, ErrorProtocol
{
    try
    {
        return fun(); //throw SysError
    }
    catch (const SysErrorTimeout&      e) { throw ErrorTimeout (errorMsg, e.toString()); }
    catch (const SysErrorSftpProtocol& e) { throw ErrorProtocol(errorMsg, e.toString(), e.sftpErrorCode); }
    catch (const SysError&             e) { throw ErrorProtocol(errorMsg, e.toString()); }
}


//same for handle creation
template <class Function> inline
auto runOpenWithErrorContext(const std::string& errorMsg, Function fun) //throw ErrorTimeout, ErrorOpenFailed
{
    try
    {
        return fun(); //throw SysError
    }
    catch (const SysErrorTimeout&      e) { throw ErrorTimeout   (errorMsg, e.toString()); }
    catch (const SysErrorSftpProtocol& e) { throw ErrorOpenFailed(errorMsg, e.toString(), e.sftpErrorCode); }
    catch (const SysError&             e) { throw ErrorOpenFailed(errorMsg, e.toString()); }
}
}

#endif //SSH_STATUS_H_7713049815562034
