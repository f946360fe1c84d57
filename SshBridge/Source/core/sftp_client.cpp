// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "sftp_client.h"

using namespace sshb;


namespace
{
template <class Function> inline
int runSftpCommand(const SftpAccess& access, const std::string& errorMsg, const char* functionName, Function sftpCommand /*noexcept!*/) //throw ErrorProtocol, ErrorTimeout
{
    return runWithErrorContext(errorMsg, [&] { return access.makeInvoker().invoke(functionName, sftpCommand); }); //throw SysError, SysErrorSftpProtocol, SysErrorTimeout
}


std::string generateMoveErrorMsg(const std::string& pathFrom, const std::string& pathTo)
{
    return replaceCpy(replaceCpy(_("Cannot move file %x to %y."),
                                 "%x", '\n' + fmtPath(pathFrom)),
                      "%y", '\n' + fmtPath(pathTo));
}
}


SshTransport& SftpClient::getTransport() //throw ErrorSessionClosed
{
    if (!ctx_.transport)
        throw ErrorSessionClosed(replaceCpy(_("Not connected to %x."), "%x", fmtPath(getDisplayName(cfg_))));
    return *ctx_.transport;
}


SftpAccess SftpClient::getSftpAccess() //throw ErrorSessionClosed
{
    SshTransport& transport = getTransport(); //throw ErrorSessionClosed
    if (!ctx_.sftp)
        throw ErrorSessionClosed(replaceCpy(_("The SFTP channel for %x is not open."), "%x", fmtPath(getDisplayName(cfg_))));

    return {transport, *ctx_.sftp, cfg_.getTimeout()};
}


void SftpClient::connect(const TransportFactory& transportFactory, SessionDelegate& delegate) //throw FileError
{
    disconnect();

    runWithErrorContext(replaceCpy(_("Unable to connect to %x."), "%x", fmtPath(getDisplayName(cfg_))), [&]
    {
        ctx_.transport = transportFactory(cfg_, delegate); //throw SysError
        ASSERT_SYSERROR(ctx_.transport.get());
    });
}


void SftpClient::disconnect()
{
    if (ctx_.sftp)
        try
        {
            closeSftp(); //throw FileError
        }
        catch (const FileError& e) { logExtraError(e.toString()); }

    ctx_.transport.reset(); //graceful SSH disconnect: errors are logged by the transport
}


void SftpClient::openSftp() //throw FileError
{
    SshTransport& transport = getTransport(); //throw ErrorSessionClosed

    if (ctx_.sftp) //at most one channel per session
        closeSftp(); //throw FileError

    runWithErrorContext(replaceCpy(_("Failed to open SFTP channel for %x."), "%x", fmtPath(getDisplayName(cfg_))), [&]
    {
        RetryingInvoker(transport, nullptr, cfg_.getTimeout()).invoke("libssh2_sftp_init", [&] { return transport.tryOpenSftp(ctx_.sftp); }); //throw SysError
        ASSERT_SYSERROR(ctx_.sftp.get());
    });
}


void SftpClient::closeSftp() //throw FileError
{
    if (!ctx_.sftp)
        return;

    SshTransport& transport = getTransport(); //throw ErrorSessionClosed

    SSHB_ON_SCOPE_EXIT(ctx_.sftp.reset()); //no point in calling shutdown a second time

    runWithErrorContext(replaceCpy(_("Failed to close SFTP channel for %x."), "%x", fmtPath(getDisplayName(cfg_))), [&]
    {
        RetryingInvoker(transport, nullptr, cfg_.getTimeout()).invoke("libssh2_sftp_shutdown", [&] { return ctx_.sftp->tryShutdown(); }); //throw SysError
    });
}


std::vector<DirEntry> SftpClient::listDirectory(const std::string& folderPath) //throw FileError
{
    RemoteDirectoryStream dirStream(getSftpAccess(), folderPath, cfg_.ignoredNames); //throw FileError

    std::vector<DirEntry> output;
    while (std::optional<DirEntry> entry = dirStream.next()) //throw FileError
        output.push_back(std::move(*entry));
    return output;
}


FileAttributes SftpClient::getAttributes(const std::string& itemPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    FileAttributes attr;
    runSftpCommand(access, replaceCpy(_("Cannot read file attributes of %x."), "%x", fmtPath(itemPath)), "libssh2_sftp_stat", //throw FileError
    [&] { return access.sftp.tryStat(itemPath, SftpStatMode::followLink, attr); });
    return attr;
}


FileAttributes SftpClient::getLinkAttributes(const std::string& itemPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    FileAttributes attr;
    runSftpCommand(access, replaceCpy(_("Cannot read file attributes of %x."), "%x", fmtPath(itemPath)), "libssh2_sftp_lstat", //throw FileError
    [&] { return access.sftp.tryStat(itemPath, SftpStatMode::noFollow, attr); });
    return attr;
}


FsStats SftpClient::getFsStats(const std::string& itemPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    //"It is unspecified whether all members of the returned struct have meaningful values on all file systems."
    FsStats stats;
    runSftpCommand(access, replaceCpy(_("Cannot determine free disk space for %x."), "%x", fmtPath(itemPath)), "libssh2_sftp_statvfs", //throw FileError
    [&] { return access.sftp.tryStatVfs(itemPath, stats); });
    return stats;
}


std::string SftpClient::readLink(const std::string& linkPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    std::string targetPath;
    runSftpCommand(access, replaceCpy(_("Cannot resolve symbolic link %x."), "%x", fmtPath(linkPath)), "libssh2_sftp_readlink", //throw FileError
    [&] { return access.sftp.tryQueryLink(linkPath, SftpLinkQuery::readLink, targetPath); });
    return targetPath;
}


std::string SftpClient::getRealPath(const std::string& itemPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    std::string realPath;
    runSftpCommand(access, replaceCpy(_("Cannot determine final path for %x."), "%x", fmtPath(itemPath)), "libssh2_sftp_realpath", //throw FileError
    [&] { return access.sftp.tryQueryLink(itemPath, SftpLinkQuery::realPath, realPath); });
    return realPath;
}


void SftpClient::createSymlink(const std::string& targetPath, const std::string& linkPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    runSftpCommand(access, replaceCpy(_("Cannot create symbolic link %x."), "%x", fmtPath(linkPath)), "libssh2_sftp_symlink", //throw FileError
    [&] { return access.sftp.trySymlink(targetPath, linkPath); });
}


void SftpClient::createFolder(const std::string& folderPath, long permissions) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    //libssh2_sftp_mkdir fails with generic LIBSSH2_FX_FAILURE if existing
    runSftpCommand(access, replaceCpy(_("Cannot create directory %x."), "%x", fmtPath(folderPath)), "libssh2_sftp_mkdir", //throw FileError
    [&] { return access.sftp.tryMkdir(folderPath, permissions); });
}


void SftpClient::createEmptyFile(const std::string& filePath, long permissions) //throw FileError
{
    RemoteFileOutput fileOut(getSftpAccess(), filePath, permissions); //throw FileError
    fileOut.finalize(); //throw FileError
}


void SftpClient::rename(const std::string& pathFrom, const std::string& pathTo) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    runSftpCommand(access, generateMoveErrorMsg(pathFrom, pathTo), "libssh2_sftp_rename", //throw FileError
    [&] { return access.sftp.tryRename(pathFrom, pathTo); });
}


void SftpClient::removeFolder(const std::string& folderPath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    runSftpCommand(access, replaceCpy(_("Cannot delete directory %x."), "%x", fmtPath(folderPath)), "libssh2_sftp_rmdir", //throw FileError
    [&] { return access.sftp.tryRmdir(folderPath); });
}


void SftpClient::removeFile(const std::string& filePath) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed
    runSftpCommand(access, replaceCpy(_("Cannot delete file %x."), "%x", fmtPath(filePath)), "libssh2_sftp_unlink", //throw FileError
    [&] { return access.sftp.tryUnlink(filePath); });
}


void SftpClient::changeOwner(const std::string& itemPath, uint32_t uid, uint32_t gid) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed

    FileAttributes attrNew;
    attrNew.uid = uid;
    attrNew.gid = gid;

    runSftpCommand(access, replaceCpy(_("Cannot write owner of %x."), "%x", fmtPath(itemPath)), "libssh2_sftp_setstat", //throw FileError
    [&] { return access.sftp.trySetStat(itemPath, attrNew); });
}


void SftpClient::changePermissions(const std::string& itemPath, uint32_t permissions) //throw FileError
{
    const SftpAccess access = getSftpAccess(); //throw ErrorSessionClosed

    FileAttributes attrNew;
    attrNew.permissions = permissions & SFTP_MODE_PERM_MASK;

    runSftpCommand(access, replaceCpy(_("Cannot write permissions of %x."), "%x", fmtPath(itemPath)), "libssh2_sftp_setstat", //throw FileError
    [&] { return access.sftp.trySetStat(itemPath, attrNew); });
}


TransferResult SftpClient::readFile(const std::string& filePath, SinkStream& sink, const ProgressCallback& onProgress) //throw FileError
{
    RemoteFileInput fileIn(getSftpAccess(), filePath); //throw FileError

    const TransferResult result = copyStream(fileIn, sink, cfg_.readBlockSize, onProgress); //throw FileError

    if (result.status == TransferStatus::completed)
        fileIn.close(); //throw FileError; report errors, unlike ~RemoteFileInput()
    return result;
}


TransferResult SftpClient::writeFile(SourceStream& source, const std::string& filePath, long permissions, const ProgressCallback& onProgress) //throw FileError
{
    RemoteFileOutput fileOut(getSftpAccess(), filePath, permissions); //throw FileError

    const TransferResult result = copyStream(source, fileOut, cfg_.writeBlockSize, onProgress); //throw FileError

    if (result.status == TransferStatus::completed)
        fileOut.finalize(); //throw FileError
    //else: ~RemoteFileOutput() removes the incomplete file
    return result;
}


void SftpClient::sendKeepAlive() //throw FileError
{
    SshTransport& transport = getTransport(); //throw ErrorSessionClosed

    int secondsToNextKeepAlive = 0;
    runWithErrorContext(replaceCpy(_("Failed to send keep-alive message to %x."), "%x", fmtPath(getDisplayName(cfg_))), [&]
    {
        RetryingInvoker(transport, nullptr, cfg_.getTimeout()).invoke("libssh2_keepalive_send", [&] { return transport.trySendKeepAlive(secondsToNextKeepAlive); }); //throw SysError
    });
}


std::string SftpClient::getHostKey() //throw FileError
{
    std::string hostKey = getTransport().getHostKey(); //throw ErrorSessionClosed
    if (hostKey.empty())
        throw FileError(replaceCpy(_("Cannot read host key of %x."), "%x", fmtPath(getDisplayName(cfg_))));
    return hostKey;
}
