// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef STREAM_COPIER_H_6620938157744102
#define STREAM_COPIER_H_6620938157744102

#include <cstdint>
#include <functional>
#include <optional>
#include <sshb/file_error.h>


namespace sshb
{
//return "false" to cancel: no further read or write will happen
using ProgressCallback = std::function<bool(uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal /*nullopt if unknown*/)>;


class SourceStream
{
public:
    virtual ~SourceStream() {}

    //may return short, only 0 means EOF! CONTRACT: bytesToRead > 0!
    virtual size_t read(void* buffer, size_t bytesToRead) = 0; //throw FileError

    virtual std::optional<uint64_t> getDeclaredSize() = 0; //throw FileError
};


class SinkStream
{
public:
    virtual ~SinkStream() {}

    //returns bytes accepted: anything less than "bytesToWrite" is a failed transfer
    virtual size_t write(const void* buffer, size_t bytesToWrite) = 0; //throw FileError
};


enum class TransferStatus
{
    completed,
    cancelled,
};

struct TransferResult
{
    TransferStatus status = TransferStatus::completed;
    uint64_t bytesTransferred = 0;
};

//chunk-wise copy: every chunk is read, written in full, then reported
TransferResult copyStream(SourceStream& source, SinkStream& sink, size_t chunkSize, const ProgressCallback& onProgress /*optional*/); //throw FileError, ErrorShortTransfer
}

#endif //STREAM_COPIER_H_6620938157744102
