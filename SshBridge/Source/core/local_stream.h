// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef LOCAL_STREAM_H_7785120943306118
#define LOCAL_STREAM_H_7785120943306118

#include <sshb/file_io.h>
#include <sshb/open_ssl.h>
#include "stream_copier.h"


namespace sshb
{
class MemorySource : public SourceStream
{
public:
    explicit MemorySource(std::string_view bytes) : bytes_(bytes) {} //bytes must outlive MemorySource!

    size_t read(void* buffer, size_t bytesToRead) override;
    std::optional<uint64_t> getDeclaredSize() override { return bytes_.size(); }

private:
    const std::string_view bytes_;
    size_t pos_ = 0;
};


class MemorySink : public SinkStream
{
public:
    size_t write(const void* buffer, size_t bytesToWrite) override;

    const std::string& ref() const { return bytes_; }
    std::string release() { return std::exchange(bytes_, std::string()); }

private:
    std::string bytes_;
};


class LocalFileSource : public SourceStream
{
public:
    explicit LocalFileSource(const std::string& filePath) : fileIn_(filePath) {} //throw FileError

    size_t read(void* buffer, size_t bytesToRead) override { return fileIn_.tryRead(buffer, bytesToRead); } //throw FileError
    std::optional<uint64_t> getDeclaredSize() override { return fileIn_.getFileSize(); } //throw FileError

private:
    FileInputPlain fileIn_;
};


//call finalize() when done, or else the incomplete file is removed!
class LocalFileSink : public SinkStream
{
public:
    explicit LocalFileSink(const std::string& filePath) : fileOut_(filePath) {} //throw FileError

    size_t write(const void* buffer, size_t bytesToWrite) override; //throw FileError

    void finalize() { fileOut_.close(); } //throw FileError

private:
    FileOutputPlain fileOut_;
};


//hash the stream instead of storing it
class DigestSink : public SinkStream
{
public:
    explicit DigestSink(DigestAlgorithm algo) : algo_(algo), calc_(algo) {} //throw SysError

    size_t write(const void* buffer, size_t bytesToWrite) override; //throw FileError

    std::string finalize(); //throw FileError; returns formatDigest() output

private:
    const DigestAlgorithm algo_;
    DigestCalculator calc_;
};
}

#endif //LOCAL_STREAM_H_7785120943306118
