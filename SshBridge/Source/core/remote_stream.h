// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef REMOTE_STREAM_H_1904726638815520
#define REMOTE_STREAM_H_1904726638815520

#include <vector>
#include "retrying_invoker.h"
#include "stream_copier.h"


namespace sshb
{
//everything needed to run SFTP primitives: only valid inside the session's serialized context!
struct SftpAccess
{
    SessionTraffic& traffic;
    SftpChannel& sftp;
    std::chrono::steady_clock::duration timeout;

    RetryingInvoker makeInvoker() const { return RetryingInvoker(traffic, &sftp, timeout); }
};


//read remote file: size is determined up front, reading fewer bytes is a failure
class RemoteFileInput : public SourceStream
{
public:
    RemoteFileInput(const SftpAccess& access, const std::string& filePath); //throw ErrorOpenFailed, ErrorTimeout
    ~RemoteFileInput();

    size_t read(void* buffer, size_t bytesToRead) override; //throw ErrorProtocol, ErrorTimeout, ErrorShortTransfer

    std::optional<uint64_t> getDeclaredSize() override { return fileSize_; }

    void close(); //throw ErrorProtocol, ErrorTimeout: optional, otherwise called by destructor

private:
    RemoteFileInput           (const RemoteFileInput&) = delete;
    RemoteFileInput& operator=(const RemoteFileInput&) = delete;

    const SftpAccess access_;
    const std::string filePath_;
    std::optional<uint64_t> fileSize_;
    uint64_t bytesRead_ = 0;
    std::unique_ptr<SftpHandle> fileHandle_;
};


/*  create or overwrite remote file: call finalize() when done, or else the incomplete file is removed!
    the output is complete when the source is exhausted: a source's declared size only feeds progress reporting  */
class RemoteFileOutput : public SinkStream
{
public:
    RemoteFileOutput(const SftpAccess& access, const std::string& filePath, long permissions); //throw ErrorOpenFailed, ErrorTimeout
    ~RemoteFileOutput();

    //short remote writes are repeated until the chunk is sent or the server stops accepting data
    size_t write(const void* buffer, size_t bytesToWrite) override; //throw ErrorProtocol, ErrorTimeout

    void finalize(); //throw ErrorProtocol, ErrorTimeout

    uint64_t getBytesWritten() const { return bytesWritten_; }

private:
    RemoteFileOutput           (const RemoteFileOutput&) = delete;
    RemoteFileOutput& operator=(const RemoteFileOutput&) = delete;

    void close(); //throw ErrorProtocol, ErrorTimeout

    const SftpAccess access_;
    const std::string filePath_;
    uint64_t bytesWritten_ = 0;
    std::unique_ptr<SftpHandle> fileHandle_;
    bool closeFailed_ = false;
};


//lazy directory listing: one server round-trip per next()
class RemoteDirectoryStream
{
public:
    RemoteDirectoryStream(const SftpAccess& access, const std::string& folderPath, //throw ErrorOpenFailed, ErrorTimeout
                          const std::vector<std::string>& ignoredNames /*e.g. "." and ".."*/);
    ~RemoteDirectoryStream();

    std::optional<DirEntry> next(); //throw ErrorProtocol, ErrorTimeout; nullopt: no more items

private:
    RemoteDirectoryStream           (const RemoteDirectoryStream&) = delete;
    RemoteDirectoryStream& operator=(const RemoteDirectoryStream&) = delete;

    const SftpAccess access_;
    const std::string folderPath_;
    const std::vector<std::string> ignoredNames_;
    std::unique_ptr<SftpHandle> dirHandle_;
};
}

#endif //REMOTE_STREAM_H_1904726638815520
