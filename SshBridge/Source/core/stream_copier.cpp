// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "stream_copier.h"
#include <vector>
#include "ssh_status.h"

using namespace sshb;


TransferResult sshb::copyStream(SourceStream& source, SinkStream& sink, size_t chunkSize, const ProgressCallback& onProgress) //throw FileError, ErrorShortTransfer
{
    if (chunkSize == 0)
        throw SSHB_CONTRACT_VIOLATION();

    const std::optional<uint64_t> bytesTotal = source.getDeclaredSize(); //throw FileError

    std::vector<char> buffer(chunkSize);
    uint64_t bytesSoFar = 0;

    for (;;)
    {
        const size_t bytesRead = source.read(buffer.data(), buffer.size()); //throw FileError
        if (bytesRead == 0) //EOF
            return {TransferStatus::completed, bytesSoFar};

        if (bytesRead > buffer.size()) //sanity check
            throw SSHB_CONTRACT_VIOLATION();

        const size_t bytesWritten = sink.write(buffer.data(), bytesRead); //throw FileError
        if (bytesWritten != bytesRead)
            throw ErrorShortTransfer(_("Data transfer is incomplete."),
                                     replaceCpy(replaceCpy(_("Wrote %x of %y bytes."),
                                                           "%x", numberTo<std::string>(bytesWritten)),
                                                "%y", numberTo<std::string>(bytesRead)));
        bytesSoFar += bytesWritten;

        if (onProgress && !onProgress(bytesSoFar, bytesTotal))
            return {TransferStatus::cancelled, bytesSoFar};
    }
}
