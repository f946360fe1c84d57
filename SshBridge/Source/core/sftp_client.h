// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SFTP_CLIENT_H_4410285396672057
#define SFTP_CLIENT_H_4410285396672057

#include "remote_stream.h"
#include "session_config.h"
#include "session_delegate.h"


namespace sshb
{
//handle tree of one session: owned by SessionExecutor, only accessed inside the serialized context
struct SessionContext
{
    std::unique_ptr<SshTransport> transport;
    std::unique_ptr<SftpChannel>  sftp; //derived from "transport": declared last => destroyed first
};


//synchronous SFTP operations: one instance per task, runs inside the serialized context
class SftpClient
{
public:
    SftpClient(SessionContext& ctx, const SessionConfig& cfg) : ctx_(ctx), cfg_(cfg) {}

    void connect(const TransportFactory& transportFactory, SessionDelegate& delegate); //throw FileError; drops any existing connection
    void disconnect(); //nothrow; errors during teardown are logged only
    bool isConnected() const { return static_cast<bool>(ctx_.transport); }
    bool isHealthy() const { return ctx_.transport && ctx_.transport->isHealthy(); }

    void openSftp(); //throw FileError; closes any prior channel
    void closeSftp(); //throw FileError
    bool isSftpOpen() const { return static_cast<bool>(ctx_.sftp); }

    std::vector<DirEntry> listDirectory(const std::string& folderPath); //throw FileError

    FileAttributes getAttributes    (const std::string& itemPath); //throw FileError, follows symlinks
    FileAttributes getLinkAttributes(const std::string& itemPath); //throw FileError
    FsStats getFsStats(const std::string& itemPath); //throw FileError; "statvfs@openssh.com" is not supported by all servers

    std::string readLink   (const std::string& linkPath); //throw FileError
    std::string getRealPath(const std::string& itemPath); //throw FileError
    void createSymlink(const std::string& targetPath, const std::string& linkPath); //throw FileError

    void createFolder   (const std::string& folderPath, long permissions = SFTP_DEFAULT_PERMISSION_FOLDER); //throw FileError
    void createEmptyFile(const std::string& filePath,   long permissions = SFTP_DEFAULT_PERMISSION_FILE);   //throw FileError; truncates existing
    void rename(const std::string& pathFrom, const std::string& pathTo); //throw FileError; replaces existing target
    void removeFolder(const std::string& folderPath); //throw FileError; must be empty
    void removeFile  (const std::string& filePath);   //throw FileError

    void changeOwner      (const std::string& itemPath, uint32_t uid, uint32_t gid); //throw FileError
    void changePermissions(const std::string& itemPath, uint32_t permissions);     //throw FileError

    TransferResult readFile(const std::string& filePath, SinkStream& sink, const ProgressCallback& onProgress); //throw FileError
    TransferResult writeFile(SourceStream& source, const std::string& filePath, long permissions, const ProgressCallback& onProgress); //throw FileError

    void sendKeepAlive(); //throw FileError
    std::string getHostKey(); //throw FileError

private:
    SshTransport& getTransport(); //throw ErrorSessionClosed
    SftpAccess getSftpAccess(); //throw ErrorSessionClosed

    SessionContext& ctx_;
    const SessionConfig& cfg_;
};
}

#endif //SFTP_CLIENT_H_4410285396672057
