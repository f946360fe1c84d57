// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "remote_stream.h"
#include <algorithm>

using namespace sshb;


namespace
{
void closeHandle(const SftpAccess& access, std::unique_ptr<SftpHandle>& handle, const char* functionName) //throw SysError
{
    access.makeInvoker().invoke(functionName, [&] { return handle->tryClose(); }); //throw SysError, SysErrorSftpProtocol
    handle.reset();
}


std::string formatUnexpectedSize(uint64_t actual, uint64_t expected)
{
    return _("Unexpected size of data stream:") + ' ' + numberTo<std::string>(actual) + '\n' +
           _("Expected:") + ' ' + numberTo<std::string>(expected);
}
}


RemoteFileInput::RemoteFileInput(const SftpAccess& access, const std::string& filePath) : //throw ErrorOpenFailed, ErrorTimeout
    access_(access),
    filePath_(filePath)
{
    const std::string errorMsg = replaceCpy(_("Cannot open file %x."), "%x", fmtPath(filePath_));

    FileAttributes attr;
    runOpenWithErrorContext(errorMsg, [&]
    {
        access_.makeInvoker().invoke("libssh2_sftp_stat", [&] { return access_.sftp.tryStat(filePath_, SftpStatMode::followLink, attr); });
    });

    if (attr.isDirectory())
        throw ErrorOpenFailed(errorMsg, formatSystemError("libssh2_sftp_stat", formatSftpStatusCode(SSH_FX_FILE_IS_A_DIRECTORY), _("Item is a folder.")),
                              SSH_FX_FILE_IS_A_DIRECTORY);
    fileSize_ = attr.fileSize; //not all servers report the size

    runOpenWithErrorContext(errorMsg, [&]
    {
        access_.makeInvoker().invoke("libssh2_sftp_open", [&] { return access_.sftp.tryOpenFile(filePath_, SftpOpenMode::read, 0, fileHandle_); });
    });
}


RemoteFileInput::~RemoteFileInput()
{
    if (fileHandle_)
        try { close(); /*throw ErrorProtocol, ErrorTimeout*/ }
        catch (const FileError& e) { logExtraError(e.toString()); }
}


void RemoteFileInput::close() //throw ErrorProtocol, ErrorTimeout
{
    if (!fileHandle_)
        throw SSHB_CONTRACT_VIOLATION();

    runWithErrorContext(replaceCpy(_("Cannot read file %x."), "%x", fmtPath(filePath_)), [&]
    {
        SSHB_ON_SCOPE_FAIL(fileHandle_.reset()); //no point in calling close a second time
        closeHandle(access_, fileHandle_, "libssh2_sftp_close"); //throw SysError
    });
}


size_t RemoteFileInput::read(void* buffer, size_t bytesToRead) //throw ErrorProtocol, ErrorTimeout, ErrorShortTransfer
{
    //libssh2_sftp_read has same semantics as Posix read:
    if (bytesToRead == 0) //"read() with a count of 0 returns zero" => indistinguishable from end of file! => check!
        throw SSHB_CONTRACT_VIOLATION();
    if (!fileHandle_)
        throw SSHB_CONTRACT_VIOLATION();

    const std::string errorMsg = replaceCpy(_("Cannot read file %x."), "%x", fmtPath(filePath_));

    const ssize_t bytesRead = runWithErrorContext(errorMsg, [&]
    {
        const ssize_t rc = access_.makeInvoker().invoke("libssh2_sftp_read", [&] { return fileHandle_->tryRead(static_cast<char*>(buffer), bytesToRead); });
        ASSERT_SYSERROR(static_cast<size_t>(rc) <= bytesToRead); //better safe than sorry (user should never see this)
        return rc;
    });

    bytesRead_ += bytesRead;

    if (fileSize_)
    {
        if (bytesRead == 0 && bytesRead_ < *fileSize_) //EOF
            throw ErrorShortTransfer(errorMsg, formatUnexpectedSize(bytesRead_, *fileSize_));
        if (bytesRead_ > *fileSize_) //file grew while reading
            throw ErrorProtocol(errorMsg, formatUnexpectedSize(bytesRead_, *fileSize_));
    }
    return bytesRead; //"zero indicates end of file"
}

//------------------------------------------------------------------------------------------

RemoteFileOutput::RemoteFileOutput(const SftpAccess& access, const std::string& filePath, long permissions) : //throw ErrorOpenFailed, ErrorTimeout
    access_(access),
    filePath_(filePath)
{
    runOpenWithErrorContext(replaceCpy(_("Cannot write file %x."), "%x", fmtPath(filePath_)), [&]
    {
        //note: server may also apply umask! (e.g. 0022)
        access_.makeInvoker().invoke("libssh2_sftp_open", [&] { return access_.sftp.tryOpenFile(filePath_, SftpOpenMode::write, permissions, fileHandle_); });
    });
}


RemoteFileOutput::~RemoteFileOutput()
{
    if (fileHandle_) //=> cleanup non-finalized output file
    {
        if (!closeFailed_) //otherwise there's no much point in calling close a second time
            try { close(); /*throw ErrorProtocol, ErrorTimeout*/ }
            catch (const FileError& e) { logExtraError(e.toString()); }

        try
        {
            access_.makeInvoker().invoke("libssh2_sftp_unlink", [&] { return access_.sftp.tryUnlink(filePath_); }); //throw SysError, SysErrorSftpProtocol
        }
        catch (const SysError& e)
        {
            logExtraError(replaceCpy(_("Cannot delete file %x."), "%x", fmtPath(filePath_)) + "\n\n" + e.toString());
        }
    }
}


size_t RemoteFileOutput::write(const void* buffer, size_t bytesToWrite) //throw ErrorProtocol, ErrorTimeout
{
    if (bytesToWrite == 0)
        throw SSHB_CONTRACT_VIOLATION();
    if (!fileHandle_)
        throw SSHB_CONTRACT_VIOLATION();

    size_t bytesWritten = 0;

    runWithErrorContext(replaceCpy(_("Cannot write file %x."), "%x", fmtPath(filePath_)), [&]
    {
        while (bytesWritten < bytesToWrite)
        {
            const ssize_t rc = access_.makeInvoker().invoke("libssh2_sftp_write", [&]
            {
                return fileHandle_->tryWrite(static_cast<const char*>(buffer) + bytesWritten, bytesToWrite - bytesWritten);
            });
            ASSERT_SYSERROR(static_cast<size_t>(rc) <= bytesToWrite - bytesWritten); //better safe than sorry

            if (rc == 0) //no progress: let caller fail with short transfer
                break;
            bytesWritten += rc;
        }
    });

    bytesWritten_ += bytesWritten;
    return bytesWritten;
}


void RemoteFileOutput::close() //throw ErrorProtocol, ErrorTimeout
{
    if (!fileHandle_)
        throw SSHB_CONTRACT_VIOLATION();

    runWithErrorContext(replaceCpy(_("Cannot write file %x."), "%x", fmtPath(filePath_)), [&]
    {
        SSHB_ON_SCOPE_FAIL(closeFailed_ = true);
        closeHandle(access_, fileHandle_, "libssh2_sftp_close"); //throw SysError
    });
}


void RemoteFileOutput::finalize() //throw ErrorProtocol, ErrorTimeout
{
    close(); //throw ErrorProtocol, ErrorTimeout
    //output finalized => no more exceptions from here on!
}

//------------------------------------------------------------------------------------------

RemoteDirectoryStream::RemoteDirectoryStream(const SftpAccess& access, const std::string& folderPath, //throw ErrorOpenFailed, ErrorTimeout
                                             const std::vector<std::string>& ignoredNames) :
    access_(access),
    folderPath_(folderPath),
    ignoredNames_(ignoredNames)
{
    runOpenWithErrorContext(replaceCpy(_("Cannot open directory %x."), "%x", fmtPath(folderPath_)), [&]
    {
        access_.makeInvoker().invoke("libssh2_sftp_opendir", [&] { return access_.sftp.tryOpenDir(folderPath_, dirHandle_); });
    });
}


RemoteDirectoryStream::~RemoteDirectoryStream()
{
    try
    {
        closeHandle(access_, dirHandle_, "libssh2_sftp_closedir"); //throw SysError
    }
    catch (const SysError& e) { logExtraError(replaceCpy(_("Cannot read directory %x."), "%x", fmtPath(folderPath_)) + "\n\n" + e.toString()); }
}


std::optional<DirEntry> RemoteDirectoryStream::next() //throw ErrorProtocol, ErrorTimeout
{
    for (;;)
    {
        DirEntry entry;
        const int rc = runWithErrorContext(replaceCpy(_("Cannot read directory %x."), "%x", fmtPath(folderPath_)), [&]
        {
            return access_.makeInvoker().invoke("libssh2_sftp_readdir", [&]
            {
                entry = DirEntry(); //don't carry over partial results of a blocked attempt
                return dirHandle_->tryReadDir(entry.name, entry.longEntry, entry.attributes);
            });
        });

        if (rc == 0) //no more items
            return std::nullopt;

        if (std::find(ignoredNames_.begin(), ignoredNames_.end(), entry.name) != ignoredNames_.end()) //"." and ".." are reported by SFTP, too!
            continue;

        return entry;
    }
}
