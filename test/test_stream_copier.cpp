// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <limits>
#include <SshBridge/Source/core/local_stream.h>
#include <SshBridge/Source/core/ssh_status.h>
#include <catch2/catch.hpp>

using namespace sshb;


namespace
{
std::string makeTestData(size_t size)
{
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>('a' + i % 26);
    return data;
}


class CountingSource : public SourceStream
{
public:
    CountingSource(std::string_view bytes, bool declareSize) : source_(bytes), declareSize_(declareSize) {}

    size_t read(void* buffer, size_t bytesToRead) override { ++reads; return source_.read(buffer, bytesToRead); }
    std::optional<uint64_t> getDeclaredSize() override { return declareSize_ ? source_.getDeclaredSize() : std::nullopt; }

    int reads = 0;

private:
    MemorySource source_;
    const bool declareSize_;
};


class CountingSink : public SinkStream
{
public:
    size_t write(const void* buffer, size_t bytesToWrite) override
    {
        ++writes;
        const size_t bytesAccepted = std::min(bytesToWrite, acceptLimit);
        bytes.append(static_cast<const char*>(buffer), bytesAccepted);
        return bytesAccepted;
    }

    std::string bytes;
    int writes = 0;
    size_t acceptLimit = std::numeric_limits<size_t>::max();
};
}


TEST_CASE("copy_stream_in_chunks", "[unit][copier]")
{
    const size_t chunkSize = 1000;
    const size_t streamSize = GENERATE(0, 1, 999, 1000, 2500, 10001);
    const std::string data = makeTestData(streamSize);

    CountingSource source(data, true);
    CountingSink sink;

    std::vector<uint64_t> progress;
    const TransferResult result = copyStream(source, sink, chunkSize, [&](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal)
    {
        CHECK(bytesTotal == streamSize);
        progress.push_back(bytesSoFar);
        return true;
    });

    CHECK(result.status == TransferStatus::completed);
    CHECK(result.bytesTransferred == streamSize);
    CHECK(sink.bytes == data);

    CHECK(progress.size() == (streamSize + chunkSize - 1) / chunkSize);
    if (!progress.empty())
        CHECK(progress.back() == streamSize);
    CHECK(std::is_sorted(progress.begin(), progress.end()));
}


TEST_CASE("copy_stream_of_unknown_size", "[unit][copier]")
{
    const std::string data = makeTestData(2500);
    CountingSource source(data, false);
    MemorySink sink;

    int calls = 0;
    const TransferResult result = copyStream(source, sink, 1000, [&](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal)
    {
        CHECK(!bytesTotal);
        ++calls;
        return true;
    });

    CHECK(result.bytesTransferred == 2500);
    CHECK(calls == 3);
    CHECK(sink.ref() == data);
}


TEST_CASE("copy_stream_cancelled_after_first_chunk", "[unit][copier]")
{
    const std::string data = makeTestData(5000);
    CountingSource source(data, true);
    CountingSink sink;

    const TransferResult result = copyStream(source, sink, 1000, [](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal) { return false; });

    CHECK(result.status == TransferStatus::cancelled);
    CHECK(result.bytesTransferred == 1000);
    CHECK(source.reads == 1); //nothing after the cancelling callback
    CHECK(sink.writes == 1);
    CHECK(sink.bytes == data.substr(0, 1000));
}


TEST_CASE("copy_stream_fails_on_short_write", "[unit][copier]")
{
    const std::string data = makeTestData(3000);
    CountingSource source(data, true);
    CountingSink sink;
    sink.acceptLimit = 600;

    CHECK_THROWS_AS(copyStream(source, sink, 1000, nullptr), ErrorShortTransfer);
    CHECK(source.reads == 1);
}


TEST_CASE("copy_stream_rejects_empty_chunk", "[unit][copier]")
{
    MemorySource source("abc");
    MemorySink sink;
    CHECK_THROWS_AS(copyStream(source, sink, 0, nullptr), std::logic_error);
}


TEST_CASE("digest_sink_hashes_stream", "[unit][copier]")
{
    MemorySource source("abc");
    DigestSink sink(DigestAlgorithm::sha256);

    copyStream(source, sink, 1, nullptr);
    CHECK(sink.finalize() == "SHA256:ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}
