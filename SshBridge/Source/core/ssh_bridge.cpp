// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ssh_bridge.h"
#include "local_stream.h"

using namespace sshb;


SshBridge::SshBridge(const SessionConfig& cfg, const TransportFactory& transportFactory, const std::shared_ptr<SessionDelegate>& delegate) :
    cfg_(cfg),
    transportFactory_(transportFactory),
    delegate_(delegate ? delegate : std::make_shared<SessionDelegate>()),
    executor_(std::make_unique<SessionContext>(), getDisplayName(cfg))
{
    if (!transportFactory_ || cfg_.timeoutSec <= 0 || cfg_.readBlockSize == 0 || cfg_.writeBlockSize == 0)
        throw SSHB_CONTRACT_VIOLATION();

    if (cfg_.keepAliveIntervalSec > 0)
        keepAliveThread_ = InterruptibleThread([this]
        {
            setCurrentThreadName("SSH keep-alive");
            std::future<void> pendingKeepAlive;
            for (;;)
            {
                interruptibleSleep(std::chrono::seconds(cfg_.keepAliveIntervalSec)); //throw ThreadStopRequest

                //previous request still queued behind a long-running operation: don't pile up a backlog
                if (pendingKeepAlive.valid() && pendingKeepAlive.wait_for(std::chrono::seconds(0)) != std::future_status::ready)
                    continue;

                //never touch the session directly: queue like everybody else; no need to wait for the result
                pendingKeepAlive = executor_.submit([this](SessionContext& ctx)
                {
                    SftpClient client(ctx, cfg_);
                    if (client.isConnected())
                        try
                        {
                            client.sendKeepAlive(); //throw FileError
                        }
                        catch (const FileError& e) { logError(e); }
                });
            }
        });
}


SshBridge::~SshBridge() { close(); }


void SshBridge::close()
{
    if (keepAliveThread_.joinable())
    {
        keepAliveThread_.requestStop();
        keepAliveThread_.join();
    }
    executor_.shutdown(); //session handle tree is torn down on the worker thread
}


void SshBridge::logCancelled(const std::string& itemPath, const TransferResult& result)
{
    logInfo(replaceCpy(replaceCpy(_("Transfer of %x was cancelled after %y."),
                                  "%x", fmtPath(itemPath)),
                       "%y", _P("1 byte", "%x bytes", result.bytesTransferred)));
}


template <class T, class Function> inline
std::future<std::optional<T>> SshBridge::runQuery(Function fun)
{
    return executor_.submit([this, fun](SessionContext& ctx) -> std::optional<T>
    {
        try
        {
            SftpClient client(ctx, cfg_);
            return fun(client); //throw FileError
        }
        catch (const FileError& e)
        {
            logError(e);
            return std::nullopt;
        }
    });
}


template <class Function> inline
std::future<bool> SshBridge::runCommand(Function fun)
{
    return executor_.submit([this, fun](SessionContext& ctx)
    {
        try
        {
            SftpClient client(ctx, cfg_);
            fun(client); //throw FileError
            return true;
        }
        catch (const FileError& e)
        {
            logError(e);
            return false;
        }
    });
}


template <class Function> inline
std::future<bool> SshBridge::runTransfer(const std::string& itemPath, Function fun)
{
    return executor_.submit([this, itemPath, fun](SessionContext& ctx) mutable
    {
        try
        {
            SftpClient client(ctx, cfg_);
            const TransferResult result = fun(client); //throw FileError

            if (result.status == TransferStatus::cancelled)
            {
                logCancelled(itemPath, result);
                return false;
            }
            return true;
        }
        catch (const FileError& e)
        {
            logError(e);
            return false;
        }
    });
}

//------------------------------------------------------------------------------------------

std::future<bool> SshBridge::connect()
{
    return runCommand([this](SftpClient& client)
    {
        client.connect(transportFactory_, *delegate_); //throw FileError
        logInfo(replaceCpy(_("Connected to %x."), "%x", fmtPath(getDisplayName(cfg_))));
    });
}


std::future<void> SshBridge::disconnect()
{
    return executor_.submit([this](SessionContext& ctx) { SftpClient(ctx, cfg_).disconnect(); });
}


std::future<bool> SshBridge::openSftp()
{
    return runCommand([](SftpClient& client) { client.openSftp(); }); //throw FileError
}


std::future<bool> SshBridge::closeSftp()
{
    return runCommand([](SftpClient& client) { client.closeSftp(); }); //throw FileError
}


std::future<std::optional<std::vector<DirEntry>>> SshBridge::openDir(const std::string& folderPath)
{
    return runQuery<std::vector<DirEntry>>([folderPath](SftpClient& client) { return client.listDirectory(folderPath); }); //throw FileError
}


std::future<std::optional<FileAttributes>> SshBridge::stat(const std::string& itemPath)
{
    return runQuery<FileAttributes>([itemPath](SftpClient& client) { return client.getAttributes(itemPath); }); //throw FileError
}


std::future<std::optional<FileAttributes>> SshBridge::lstat(const std::string& itemPath)
{
    return runQuery<FileAttributes>([itemPath](SftpClient& client) { return client.getLinkAttributes(itemPath); }); //throw FileError
}


std::future<std::optional<FsStats>> SshBridge::statVfs(const std::string& itemPath)
{
    return runQuery<FsStats>([itemPath](SftpClient& client) { return client.getFsStats(itemPath); }); //throw FileError
}


std::future<std::optional<std::string>> SshBridge::readLink(const std::string& linkPath)
{
    return runQuery<std::string>([linkPath](SftpClient& client) { return client.readLink(linkPath); }); //throw FileError
}


std::future<std::optional<std::string>> SshBridge::realPath(const std::string& itemPath)
{
    return runQuery<std::string>([itemPath](SftpClient& client) { return client.getRealPath(itemPath); }); //throw FileError
}


std::future<bool> SshBridge::symlink(const std::string& targetPath, const std::string& linkPath)
{
    return runCommand([targetPath, linkPath](SftpClient& client) { client.createSymlink(targetPath, linkPath); }); //throw FileError
}


std::future<bool> SshBridge::mkdir(const std::string& folderPath, long permissions)
{
    return runCommand([folderPath, permissions](SftpClient& client) { client.createFolder(folderPath, permissions); }); //throw FileError
}


std::future<bool> SshBridge::mkfile(const std::string& filePath, long permissions)
{
    return runCommand([filePath, permissions](SftpClient& client) { client.createEmptyFile(filePath, permissions); }); //throw FileError
}


std::future<bool> SshBridge::rename(const std::string& pathFrom, const std::string& pathTo)
{
    return runCommand([pathFrom, pathTo](SftpClient& client) { client.rename(pathFrom, pathTo); }); //throw FileError
}


std::future<bool> SshBridge::rmdir(const std::string& folderPath)
{
    return runCommand([folderPath](SftpClient& client) { client.removeFolder(folderPath); }); //throw FileError
}


std::future<bool> SshBridge::unlink(const std::string& filePath)
{
    return runCommand([filePath](SftpClient& client) { client.removeFile(filePath); }); //throw FileError
}


std::future<bool> SshBridge::chown(const std::string& itemPath, uint32_t uid, uint32_t gid)
{
    return runCommand([itemPath, uid, gid](SftpClient& client) { client.changeOwner(itemPath, uid, gid); }); //throw FileError
}


std::future<bool> SshBridge::chmod(const std::string& itemPath, uint32_t permissions)
{
    return runCommand([itemPath, permissions](SftpClient& client) { client.changePermissions(itemPath, permissions); }); //throw FileError
}

//------------------------------------------------------------------------------------------

std::future<std::optional<std::string>> SshBridge::readBytes(const std::string& remotePath, const ProgressCallback& onProgress)
{
    auto sink = std::make_shared<MemorySink>();

    return executor_.submit([this, remotePath, onProgress, sink](SessionContext& ctx) -> std::optional<std::string>
    {
        try
        {
            SftpClient client(ctx, cfg_);
            const TransferResult result = client.readFile(remotePath, *sink, onProgress); //throw FileError
            if (result.status == TransferStatus::cancelled)
            {
                logCancelled(remotePath, result);
                return std::nullopt;
            }
            return sink->release();
        }
        catch (const FileError& e)
        {
            logError(e);
            return std::nullopt;
        }
    });
}


std::future<bool> SshBridge::readFile(const std::string& remotePath, const std::string& localPath, const ProgressCallback& onProgress)
{
    return runTransfer(remotePath, [remotePath, localPath, onProgress](SftpClient& client)
    {
        LocalFileSink fileOut(localPath); //throw FileError

        const TransferResult result = client.readFile(remotePath, fileOut, onProgress); //throw FileError
        if (result.status == TransferStatus::completed)
            fileOut.finalize(); //throw FileError
        //else: ~LocalFileSink() removes the incomplete file
        return result;
    });
}


std::future<bool> SshBridge::readStream(const std::string& remotePath, const std::shared_ptr<SinkStream>& sink, const ProgressCallback& onProgress)
{
    if (!sink)
        throw SSHB_CONTRACT_VIOLATION();

    return runTransfer(remotePath, [remotePath, sink, onProgress](SftpClient& client)
    {
        return client.readFile(remotePath, *sink, onProgress); //throw FileError
    });
}


std::future<bool> SshBridge::writeBytes(std::string bytes, const std::string& remotePath, long permissions, const ProgressCallback& onProgress)
{
    auto bytesShared = std::make_shared<const std::string>(std::move(bytes));

    return runTransfer(remotePath, [bytesShared, remotePath, permissions, onProgress](SftpClient& client)
    {
        MemorySource source(*bytesShared);
        return client.writeFile(source, remotePath, permissions, onProgress); //throw FileError
    });
}


std::future<bool> SshBridge::writeFile(const std::string& localPath, const std::string& remotePath, long permissions, const ProgressCallback& onProgress)
{
    return runTransfer(remotePath, [localPath, remotePath, permissions, onProgress](SftpClient& client)
    {
        LocalFileSource fileIn(localPath); //throw FileError
        return client.writeFile(fileIn, remotePath, permissions, onProgress); //throw FileError
    });
}


std::future<bool> SshBridge::writeStream(const std::shared_ptr<SourceStream>& source, const std::string& remotePath, long permissions, const ProgressCallback& onProgress)
{
    if (!source)
        throw SSHB_CONTRACT_VIOLATION();

    return runTransfer(remotePath, [source, remotePath, permissions, onProgress](SftpClient& client)
    {
        return client.writeFile(*source, remotePath, permissions, onProgress); //throw FileError
    });
}

//------------------------------------------------------------------------------------------

std::future<std::optional<std::string>> SshBridge::hostKeyFingerprint(DigestAlgorithm algo)
{
    return runQuery<std::string>([algo](SftpClient& client)
    {
        const std::string hostKey = client.getHostKey(); //throw FileError
        try
        {
            return formatDigest(calculateDigest(hostKey, algo), algo); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate %x checksum."), "%x", getDigestName(algo)), e.toString()); }
    });
}


std::future<bool> SshBridge::sendKeepAlive()
{
    return runCommand([](SftpClient& client) { client.sendKeepAlive(); }); //throw FileError
}
