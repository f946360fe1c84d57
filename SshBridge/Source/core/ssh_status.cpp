// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ssh_status.h"

using namespace sshb;


std::string sshb::formatSftpStatusCode(unsigned long sc)
{
    //libssh2 only defines LIBSSH2_FX_OK(0) to LIBSSH2_FX_LINK_LOOP(21)
    switch (sc)
    {
        //*INDENT-OFF*
        case  0: return "SSH_FX_OK";
        case  1: return "SSH_FX_EOF";
        case  2: return "SSH_FX_NO_SUCH_FILE";
        case  3: return "SSH_FX_PERMISSION_DENIED";
        case  4: return "SSH_FX_FAILURE";
        case  5: return "SSH_FX_BAD_MESSAGE";
        case  6: return "SSH_FX_NO_CONNECTION";
        case  7: return "SSH_FX_CONNECTION_LOST";
        case  8: return "SSH_FX_OP_UNSUPPORTED";
        case  9: return "SSH_FX_INVALID_HANDLE";
        case 10: return "SSH_FX_NO_SUCH_PATH";
        case 11: return "SSH_FX_FILE_ALREADY_EXISTS";
        case 12: return "SSH_FX_WRITE_PROTECT";
        case 13: return "SSH_FX_NO_MEDIA";
        case 14: return "SSH_FX_NO_SPACE_ON_FILESYSTEM";
        case 15: return "SSH_FX_QUOTA_EXCEEDED";
        case 16: return "SSH_FX_UNKNOWN_PRINCIPAL";
        case 17: return "SSH_FX_LOCK_CONFLICT";
        case 18: return "SSH_FX_DIR_NOT_EMPTY";
        case 19: return "SSH_FX_NOT_A_DIRECTORY";
        case 20: return "SSH_FX_INVALID_FILENAME";
        case 21: return "SSH_FX_LINK_LOOP";
        case 22: return "SSH_FX_CANNOT_DELETE";
        case 23: return "SSH_FX_INVALID_PARAMETER";
        case 24: return "SSH_FX_FILE_IS_A_DIRECTORY";
        case 25: return "SSH_FX_BYTE_RANGE_LOCK_CONFLICT";
        case 26: return "SSH_FX_BYTE_RANGE_LOCK_REFUSED";
        case 27: return "SSH_FX_DELETE_PENDING";
        case 28: return "SSH_FX_FILE_CORRUPT";
        case 29: return "SSH_FX_OWNER_INVALID";
        case 30: return "SSH_FX_GROUP_INVALID";
        case 31: return "SSH_FX_NO_MATCHING_BYTE_RANGE_LOCK";

        default: return replaceCpy("SFTP status %x", "%x", numberTo<std::string>(sc));
        //*INDENT-ON*
    }
}


std::string sshb::formatSshReturnCode(int rc)
{
    switch (rc)
    {
            SSHB_CHECK_CASE_FOR_CONSTANT(SSH_RC_OK);
            SSHB_CHECK_CASE_FOR_CONSTANT(SSH_RC_SOCKET_NONE);
            SSHB_CHECK_CASE_FOR_CONSTANT(SSH_RC_TIMEOUT);
            SSHB_CHECK_CASE_FOR_CONSTANT(SSH_RC_SFTP_PROTOCOL);
            SSHB_CHECK_CASE_FOR_CONSTANT(SSH_RC_WOULD_BLOCK);
            SSHB_CHECK_CASE_FOR_CONSTANT(SSH_RC_BUFFER_TOO_SMALL);
        default:
            return replaceCpy("SSH rc %x", "%x", numberTo<std::string>(rc));
    }
}
