// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef SSH_BRIDGE_H_6013958824471736
#define SSH_BRIDGE_H_6013958824471736

#include <future>
#include <sshb/error_log.h>
#include <sshb/open_ssl.h>
#include "session_executor.h"
#include "sftp_client.h"


namespace sshb
{
/*  asynchronous front end of one SSH session:
        - every operation is queued on the session's executor and returns immediately
        - queries collapse failures to false/nullopt: details are recorded in the session's error log
        - after close(): futures fail with ErrorSessionClosed

    Usage:
        SshBridge session(cfg, createLibssh2Transport);
        if (session.connect().get() && session.openSftp().get())
            if (std::optional<FileAttributes> attr = session.stat("/home/user/file.txt").get())
                ...
        ErrorLog log = session.fetchErrorLog();                                          */
class SshBridge
{
public:
    SshBridge(const SessionConfig& cfg, const TransportFactory& transportFactory, const std::shared_ptr<SessionDelegate>& delegate = nullptr);
    ~SshBridge();

    std::future<bool> connect();    //drops any existing connection
    std::future<void> disconnect(); //nothrow
    std::future<bool> openSftp();   //closes any prior channel
    std::future<bool> closeSftp();

    //teardown: stop keep-alive, fail queued operations, disconnect
    void close();

    std::future<std::optional<std::vector<DirEntry>>> openDir(const std::string& folderPath);
    std::future<std::optional<FileAttributes>> stat (const std::string& itemPath); //follows symlinks
    std::future<std::optional<FileAttributes>> lstat(const std::string& itemPath);
    std::future<std::optional<FsStats>> statVfs(const std::string& itemPath);
    std::future<std::optional<std::string>> readLink(const std::string& linkPath);
    std::future<std::optional<std::string>> realPath(const std::string& itemPath);

    std::future<bool> symlink(const std::string& targetPath, const std::string& linkPath);
    std::future<bool> mkdir (const std::string& folderPath, long permissions = SFTP_DEFAULT_PERMISSION_FOLDER);
    std::future<bool> mkfile(const std::string& filePath,   long permissions = SFTP_DEFAULT_PERMISSION_FILE);
    std::future<bool> rename(const std::string& pathFrom, const std::string& pathTo);
    std::future<bool> rmdir (const std::string& folderPath);
    std::future<bool> unlink(const std::string& filePath);
    std::future<bool> chown (const std::string& itemPath, uint32_t uid, uint32_t gid);
    std::future<bool> chmod (const std::string& itemPath, uint32_t permissions);

    //transfers: "false" if failed or cancelled via onProgress
    std::future<std::optional<std::string>> readBytes(const std::string& remotePath, const ProgressCallback& onProgress = nullptr);
    std::future<bool> readFile  (const std::string& remotePath, const std::string& localPath, const ProgressCallback& onProgress = nullptr);
    std::future<bool> readStream(const std::string& remotePath, const std::shared_ptr<SinkStream>& sink, const ProgressCallback& onProgress = nullptr);

    std::future<bool> writeBytes (std::string bytes,                             const std::string& remotePath, long permissions = SFTP_DEFAULT_PERMISSION_FILE, const ProgressCallback& onProgress = nullptr);
    std::future<bool> writeFile  (const std::string& localPath,                  const std::string& remotePath, long permissions = SFTP_DEFAULT_PERMISSION_FILE, const ProgressCallback& onProgress = nullptr);
    std::future<bool> writeStream(const std::shared_ptr<SourceStream>& source, const std::string& remotePath, long permissions = SFTP_DEFAULT_PERMISSION_FILE, const ProgressCallback& onProgress = nullptr);

    std::future<std::optional<std::string>> hostKeyFingerprint(DigestAlgorithm algo); //e.g. "SHA256:..."

    std::future<bool> sendKeepAlive();

    //typed-error access: R fun(SftpClient&); exceptions are delivered through the future
    template <class Function>
    auto runSerialized(Function&& fun);

    ErrorLog fetchErrorLog() { return errorLog_.access([](ErrorLog& log) { return std::exchange(log, ErrorLog()); }); }

private:
    SshBridge           (const SshBridge&) = delete;
    SshBridge& operator=(const SshBridge&) = delete;

    template <class T, class Function>
    std::future<std::optional<T>> runQuery(Function fun); //T fun(SftpClient&) throw FileError

    template <class Function>
    std::future<bool> runCommand(Function fun); //void fun(SftpClient&) throw FileError

    template <class Function>
    std::future<bool> runTransfer(const std::string& itemPath, Function fun); //TransferResult fun(SftpClient&) throw FileError

    void logError(const FileError& e) { errorLog_.access([&](ErrorLog& log) { logMsg(log, e.toString(), MSG_TYPE_ERROR, getDisplayName(cfg_)); }); }
    void logInfo(const std::string& msg) { errorLog_.access([&](ErrorLog& log) { logMsg(log, msg, MSG_TYPE_INFO, getDisplayName(cfg_)); }); }
    void logCancelled(const std::string& itemPath, const TransferResult& result);

    const SessionConfig cfg_;
    const TransportFactory transportFactory_;
    const std::shared_ptr<SessionDelegate> delegate_; //must outlive executor_

    Protected<ErrorLog> errorLog_;

    SessionExecutor<SessionContext> executor_;

    InterruptibleThread keepAliveThread_; //declared last: stop before executor_
};








//######################## implementation ########################
template <class Function> inline
auto SshBridge::runSerialized(Function&& fun)
{
    return executor_.submit([this, fun = std::forward<Function>(fun)](SessionContext& ctx) mutable
    {
        SftpClient client(ctx, cfg_);
        return fun(client); //throw X
    });
}
}

#endif //SSH_BRIDGE_H_6013958824471736
