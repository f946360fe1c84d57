// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "local_stream.h"
#include <cstring>

using namespace sshb;


size_t MemorySource::read(void* buffer, size_t bytesToRead)
{
    if (bytesToRead == 0)
        throw SSHB_CONTRACT_VIOLATION();

    const size_t junkSize = std::min(bytesToRead, bytes_.size() - pos_);
    std::memcpy(buffer, bytes_.data() + pos_, junkSize);
    pos_ += junkSize;
    return junkSize;
}


size_t MemorySink::write(const void* buffer, size_t bytesToWrite)
{
    bytes_.append(static_cast<const char*>(buffer), bytesToWrite);
    return bytesToWrite;
}


size_t LocalFileSink::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    size_t bytesWritten = 0;
    while (bytesWritten < bytesToWrite)
        bytesWritten += fileOut_.tryWrite(static_cast<const char*>(buffer) + bytesWritten, bytesToWrite - bytesWritten); //throw FileError; never returns 0
    return bytesWritten;
}


size_t DigestSink::write(const void* buffer, size_t bytesToWrite) //throw FileError
{
    try
    {
        calc_.update(std::string_view(static_cast<const char*>(buffer), bytesToWrite)); //throw SysError
        return bytesToWrite;
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate %x checksum."), "%x", getDigestName(algo_)), e.toString()); }
}


std::string DigestSink::finalize() //throw FileError
{
    try
    {
        return formatDigest(calc_.finalize(), algo_); //throw SysError
    }
    catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate %x checksum."), "%x", getDigestName(algo_)), e.toString()); }
}
