// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <SshBridge/Source/core/remote_stream.h>
#include <SshBridge/Source/core/local_stream.h>
#include "fake_sftp.h"
#include <catch2/catch.hpp>

using namespace sshb;
using namespace sshb::test;
using namespace std::chrono_literals;


namespace
{
struct FakeSftpSession
{
    FakeSftpSession() : server(std::make_shared<FakeServer>()), transport(server)
    {
        if (transport.tryOpenSftp(channel) != SSH_RC_OK)
            throw SSHB_CONTRACT_VIOLATION();
    }

    SftpAccess getAccess() { return {transport, *channel, 2s}; }

    std::shared_ptr<FakeServer> server;
    FakeTransport transport;
    std::unique_ptr<SftpChannel> channel;
};


std::string makeTestData(size_t size)
{
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>(i * 7);
    return data;
}


bool hasCall(const FakeServer& server, const std::string& call)
{
    return std::find(server.callLog.begin(), server.callLog.end(), call) != server.callLog.end();
}
}


TEST_CASE("remote_input_reads_whole_file", "[unit][remote]")
{
    FakeSftpSession session;
    const std::string data = makeTestData(2500);
    session.server->addFile("/data.bin", data);
    session.server->maxBytesPerRead = 300; //server returns less than requested

    MemorySink sink;
    {
        RemoteFileInput fileIn(session.getAccess(), "/data.bin");
        CHECK(fileIn.getDeclaredSize() == data.size());

        const TransferResult result = copyStream(fileIn, sink, 1000, nullptr);
        CHECK(result.bytesTransferred == data.size());
        fileIn.close();
    }
    CHECK(sink.ref() == data);
    CHECK(hasCall(*session.server, "close /data.bin"));
}


TEST_CASE("remote_input_survives_would_block", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFile("/data.bin", makeTestData(1500));
    session.server->blockDirections = BlockDirection::inbound;

    RemoteFileInput fileIn(session.getAccess(), "/data.bin");

    session.server->wouldBlockAttempts = 4;
    MemorySink sink;
    copyStream(fileIn, sink, 1000, nullptr);

    CHECK(sink.ref().size() == 1500);
    CHECK(session.server->trafficWaits.size() == 4);
}


TEST_CASE("remote_input_fails_on_truncated_file", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFile("/short.bin", makeTestData(2000));
    session.server->readEofAfter = 500;

    RemoteFileInput fileIn(session.getAccess(), "/short.bin");
    MemorySink sink;
    CHECK_THROWS_AS(copyStream(fileIn, sink, 1000, nullptr), ErrorShortTransfer);
}


TEST_CASE("remote_input_fails_when_file_grows", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFile("/log.txt", makeTestData(1000));

    RemoteFileInput fileIn(session.getAccess(), "/log.txt");
    session.server->items["/log.txt"].content += "appended while reading";

    MemorySink sink;
    CHECK_THROWS_AS(copyStream(fileIn, sink, 4000, nullptr), ErrorProtocol);
}


TEST_CASE("remote_input_without_reported_size", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFile("/proc.txt", "dynamic content");
    session.server->reportFileSize = false;

    RemoteFileInput fileIn(session.getAccess(), "/proc.txt");
    CHECK(!fileIn.getDeclaredSize());

    MemorySink sink;
    copyStream(fileIn, sink, 4, nullptr);
    CHECK(sink.ref() == "dynamic content");
}


TEST_CASE("remote_input_open_failures", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFolder("/folder");

    SECTION("missing file")
    {
        try
        {
            RemoteFileInput fileIn(session.getAccess(), "/missing.txt");
            FAIL("opened missing file");
        }
        catch (const ErrorOpenFailed& e)
        {
            CHECK(isNotFoundError(e));
            CHECK(contains(e.toString(), "/missing.txt"));
        }
    }

    SECTION("folder")
    {
        try
        {
            RemoteFileInput fileIn(session.getAccess(), "/folder");
            FAIL("opened folder as file");
        }
        catch (const ErrorOpenFailed& e)
        {
            CHECK(e.sftpErrorCode == SSH_FX_FILE_IS_A_DIRECTORY);
            CHECK(!isNotFoundError(e));
        }
    }

    SECTION("timeout")
    {
        session.server->wouldBlockAttempts = 1000;
        session.server->trafficArrives = false;
        CHECK_THROWS_AS(RemoteFileInput(session.getAccess(), "/folder/file.txt"), ErrorTimeout);
    }
}


TEST_CASE("remote_output_writes_file", "[unit][remote]")
{
    FakeSftpSession session;
    const std::string data = makeTestData(2345);

    MemorySource source(data);
    {
        RemoteFileOutput fileOut(session.getAccess(), "/upload.bin", 0640);
        const TransferResult result = copyStream(source, fileOut, 1000, nullptr);
        CHECK(result.bytesTransferred == data.size());
        fileOut.finalize();
    }

    REQUIRE(session.server->items.contains("/upload.bin"));
    CHECK(session.server->items["/upload.bin"].content == data);
    CHECK((session.server->items["/upload.bin"].mode & SFTP_MODE_PERM_MASK) == 0640);
    CHECK(!hasCall(*session.server, "unlink /upload.bin"));
}


TEST_CASE("remote_output_removes_unfinished_file", "[unit][remote]")
{
    FakeSftpSession session;
    const std::string data = makeTestData(5000);
    {
        RemoteFileOutput fileOut(session.getAccess(), "/partial.bin", SFTP_DEFAULT_PERMISSION_FILE);
        MemorySource source(data);
        copyStream(source, fileOut, 1000, [](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal) { return bytesSoFar < 2000; });
    } //no finalize()

    CHECK(!session.server->items.contains("/partial.bin"));
    CHECK(hasCall(*session.server, "unlink /partial.bin"));
}


TEST_CASE("remote_output_short_write_fails_hard", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->writeLimit = 1500;

    const std::string data = makeTestData(4000);
    MemorySource source(data);
    {
        RemoteFileOutput fileOut(session.getAccess(), "/full.bin", SFTP_DEFAULT_PERMISSION_FILE);
        CHECK_THROWS_AS(copyStream(source, fileOut, 1000, nullptr), ErrorShortTransfer);
        CHECK(fileOut.getBytesWritten() == 1500);
    } //no finalize() after a failed copy
    CHECK(!session.server->items.contains("/full.bin"));
}


TEST_CASE("remote_output_open_failure", "[unit][remote]")
{
    FakeSftpSession session;
    try
    {
        RemoteFileOutput fileOut(session.getAccess(), "/no/such/folder/file.txt", SFTP_DEFAULT_PERMISSION_FILE);
        FAIL("created file in missing folder");
    }
    catch (const ErrorOpenFailed& e)
    {
        CHECK(isNotFoundError(e));
    }
}


TEST_CASE("remote_directory_skips_dot_entries", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFolder("/home");
    session.server->addFile("/home/a.txt", "aaa");
    session.server->addFolder("/home/sub");
    session.server->addFile("/home/sub/deep.txt", "not listed");

    std::vector<DirEntry> entries;
    {
        RemoteDirectoryStream dirStream(session.getAccess(), "/home", {".", ".."});
        while (std::optional<DirEntry> entry = dirStream.next())
            entries.push_back(std::move(*entry));
    }

    REQUIRE(entries.size() == 2);
    CHECK(entries[0].name == "a.txt");
    CHECK(entries[0].attributes.isRegularFile());
    CHECK(entries[0].attributes.fileSize == 3u);
    CHECK(entries[1].name == "sub");
    CHECK(entries[1].attributes.isDirectory());
    CHECK(contains(entries[1].longEntry, "drwxr-xr-x"));

    CHECK(hasCall(*session.server, "close /home"));
}


TEST_CASE("remote_directory_open_failures", "[unit][remote]")
{
    FakeSftpSession session;
    session.server->addFile("/file.txt", "x");

    SECTION("missing")
    {
        try
        {
            RemoteDirectoryStream dirStream(session.getAccess(), "/missing", {});
            FAIL("opened missing folder");
        }
        catch (const ErrorOpenFailed& e) { CHECK(isNotFoundError(e)); }
    }

    SECTION("not a folder")
    {
        try
        {
            RemoteDirectoryStream dirStream(session.getAccess(), "/file.txt", {});
            FAIL("opened file as folder");
        }
        catch (const ErrorOpenFailed& e) { CHECK(e.sftpErrorCode == SSH_FX_NOT_A_DIRECTORY); }
    }
}
