// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SFTP_CHANNEL_H_5532790418861023
#define SFTP_CHANNEL_H_5532790418861023

#include <memory>
#include <sys/types.h> //ssize_t
#include "file_attributes.h"


namespace sshb
{
/*  SFTP primitives as single non-blocking attempts:
        - return codes follow the libssh2 convention (see ssh_status.h)
        - SSH_RC_WOULD_BLOCK: repeat the very same call once the socket is ready => RetryingInvoker
        - none of these functions throws
        - not thread-safe: only called from the session's serialized context        */

//open remote file or directory
class SftpHandle
{
public:
    virtual ~SftpHandle() {}

    virtual ssize_t tryRead (char* buffer, size_t bufferSize) = 0;         //> 0: bytes read, 0: end of file
    virtual ssize_t tryWrite(const char* buffer, size_t bytesToWrite) = 0; //> 0: bytes written (may be short)

    virtual int tryReadDir(std::string& itemName, std::string& longEntry, FileAttributes& attr) = 0; //> 0: entry found, 0: end of listing

    virtual int tryClose() = 0; //handle is unusable afterwards, unless SSH_RC_WOULD_BLOCK
};


enum class SftpOpenMode
{
    read,
    write, //create or truncate
};

enum class SftpStatMode
{
    followLink,
    noFollow,
};

enum class SftpLinkQuery
{
    readLink,
    realPath,
};


//subsystem handle: derived from an SSH session
class SftpChannel
{
public:
    virtual ~SftpChannel() {}

    virtual int tryOpenFile(const std::string& filePath, SftpOpenMode mode, long permissions, std::unique_ptr<SftpHandle>& handle) = 0;
    virtual int tryOpenDir (const std::string& folderPath, std::unique_ptr<SftpHandle>& handle) = 0;

    virtual int tryStat   (const std::string& itemPath, SftpStatMode mode, FileAttributes& attr) = 0;
    virtual int trySetStat(const std::string& itemPath, const FileAttributes& attr) = 0; //only members with value are changed
    virtual int tryStatVfs(const std::string& itemPath, FsStats& stats) = 0;

    virtual int tryQueryLink(const std::string& itemPath, SftpLinkQuery query, std::string& targetPath) = 0; //> 0: length of target path
    virtual int trySymlink  (const std::string& targetPath, const std::string& linkPath) = 0;

    virtual int tryMkdir (const std::string& folderPath, long permissions) = 0;
    virtual int tryRmdir (const std::string& folderPath) = 0;
    virtual int tryUnlink(const std::string& filePath) = 0;
    virtual int tryRename(const std::string& pathFrom, const std::string& pathTo) = 0; //requests overwrite + atomic + native semantics

    virtual int tryShutdown() = 0; //channel is unusable afterwards, unless SSH_RC_WOULD_BLOCK

    //diagnostics for the most recent failed attempt:
    virtual unsigned long getLastSftpStatus() const = 0; //SSH_FX_*
    virtual std::string formatLastError(const char* functionName) const = 0;
};
}

#endif //SFTP_CHANNEL_H_5532790418861023
