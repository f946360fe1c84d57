// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <algorithm>
#include <atomic>
#include <thread>
#include <SshBridge/Source/core/local_stream.h>
#include <SshBridge/Source/core/ssh_bridge.h>
#include "fake_sftp.h"
#include <catch2/catch.hpp>

using namespace sshb;
using namespace sshb::test;
using namespace std::chrono_literals;


namespace
{
class RecordingDelegate : public SessionDelegate
{
public:
    void onConnect(const std::string& serverBanner) override { banner = serverBanner; }

    std::string banner;
};


struct ConnectedBridge
{
    explicit ConnectedBridge(const SessionConfig& cfg = makeFakeConfig()) :
        server(std::make_shared<FakeServer>()),
        delegate(std::make_shared<RecordingDelegate>()),
        session(cfg, makeFakeTransportFactory(server), delegate)
    {
        if (!session.connect().get() || !session.openSftp().get())
            throw SSHB_CONTRACT_VIOLATION();
    }

    //fake server state is owned by the worker thread: access it in serialized context only
    template <class Function>
    auto inspect(Function fun) { return session.runSerialized([this, fun](SftpClient& client) { return fun(*server); }).get(); }

    std::shared_ptr<FakeServer> server;
    std::shared_ptr<RecordingDelegate> delegate;
    SshBridge session;
};


std::string makeTestData(size_t size)
{
    std::string data(size, '\0');
    for (size_t i = 0; i < size; ++i)
        data[i] = static_cast<char>('A' + i % 23);
    return data;
}


bool logContains(const ErrorLog& log, MessageType type, const std::string& term)
{
    return std::any_of(log.begin(), log.end(), [&](const LogEntry& entry) { return entry.type == type && contains(entry.message, term); });
}
}


TEST_CASE("bridge_connect_reports_banner", "[unit][bridge]")
{
    ConnectedBridge bridge;
    CHECK(bridge.delegate->banner == "SSH-2.0-FakeServer_1.0");

    const ErrorLog log = bridge.session.fetchErrorLog();
    CHECK(logContains(log, MSG_TYPE_INFO, "tester@sftp.example.com:22"));
    CHECK(getStats(log).error == 0);
}


TEST_CASE("bridge_connect_failure", "[unit][bridge]")
{
    auto server = std::make_shared<FakeServer>();
    server->refuseConnect = "Connection refused by fake server.";

    SshBridge session(makeFakeConfig(), makeFakeTransportFactory(server));
    CHECK(!session.connect().get());
    CHECK(!session.stat("/").get());

    const ErrorLog log = session.fetchErrorLog();
    CHECK(logContains(log, MSG_TYPE_ERROR, "Connection refused by fake server."));
    CHECK(getStats(log).error == 2);

    //typed access keeps the error category
    CHECK_THROWS_AS(session.runSerialized([](SftpClient& client) { return client.getAttributes("/"); }).get(), ErrorSessionClosed);
}


TEST_CASE("bridge_write_then_stat", "[unit][bridge]")
{
    ConnectedBridge bridge;
    const std::string data = makeTestData(2500);

    REQUIRE(bridge.session.writeBytes(data, "/upload.bin", 0640).get());

    const std::optional<FileAttributes> attr = bridge.session.stat("/upload.bin").get();
    REQUIRE(attr);
    CHECK(attr->isRegularFile());
    CHECK(attr->fileSize == data.size());
    CHECK((*attr->permissions & SFTP_MODE_PERM_MASK) == 0640);

    CHECK(bridge.session.readBytes("/upload.bin").get() == data);
}


TEST_CASE("bridge_rename_replaces_target", "[unit][bridge]")
{
    ConnectedBridge bridge;
    REQUIRE(bridge.session.writeBytes("new content", "/a.txt").get());
    REQUIRE(bridge.session.writeBytes("old", "/b.txt").get());

    CHECK(bridge.session.rename("/a.txt", "/b.txt").get());

    CHECK(bridge.session.readBytes("/b.txt").get() == "new content");
    CHECK(!bridge.session.stat("/a.txt").get());

    try
    {
        bridge.session.runSerialized([](SftpClient& client) { return client.getAttributes("/a.txt"); }).get();
        FAIL("renamed item still exists");
    }
    catch (const ErrorProtocol& e) { CHECK(isNotFoundError(e)); }
}


TEST_CASE("bridge_lists_directory", "[unit][bridge]")
{
    ConnectedBridge bridge;
    REQUIRE(bridge.session.mkdir("/home").get());
    REQUIRE(bridge.session.writeBytes("1", "/home/one.txt").get());
    REQUIRE(bridge.session.mkdir("/home/two").get());

    const std::optional<std::vector<DirEntry>> entries = bridge.session.openDir("/home").get();
    REQUIRE(entries);
    REQUIRE(entries->size() == 2);
    CHECK((*entries)[0].name == "one.txt");
    CHECK((*entries)[1].name == "two");
    CHECK((*entries)[1].attributes.isDirectory());

    CHECK(!bridge.session.openDir("/missing").get());
}


TEST_CASE("bridge_item_operations", "[unit][bridge]")
{
    ConnectedBridge bridge;

    REQUIRE(bridge.session.mkdir("/dir").get());
    CHECK(!bridge.session.mkdir("/dir").get()); //existing

    REQUIRE(bridge.session.mkfile("/dir/empty.txt").get());
    CHECK(bridge.session.stat("/dir/empty.txt").get()->fileSize == 0u);

    CHECK(!bridge.session.rmdir("/dir").get()); //not empty

    REQUIRE(bridge.session.symlink("/dir/empty.txt", "/link").get());
    CHECK(bridge.session.readLink("/link").get() == "/dir/empty.txt");
    CHECK(bridge.session.lstat("/link").get()->isSymlink());
    CHECK(bridge.session.stat("/link").get()->isRegularFile());
    CHECK(bridge.session.realPath("/dir").get() == "/dir");

    REQUIRE(bridge.session.chmod("/dir/empty.txt", 0600).get());
    CHECK((*bridge.session.stat("/dir/empty.txt").get()->permissions & SFTP_MODE_PERM_MASK) == 0600);

    REQUIRE(bridge.session.chown("/dir/empty.txt", 1234, 5678).get());
    const std::optional<FileAttributes> attr = bridge.session.stat("/dir/empty.txt").get();
    CHECK(attr->uid == 1234u);
    CHECK(attr->gid == 5678u);

    const std::optional<FsStats> stats = bridge.session.statVfs("/").get();
    REQUIRE(stats);
    CHECK(stats->getTotalBytes() == 4096u * 1000);
    CHECK(stats->getAvailableBytes() == 4096u * 500);

    CHECK(bridge.session.unlink("/dir/empty.txt").get());
    CHECK(bridge.session.unlink("/link").get());
    CHECK(bridge.session.rmdir("/dir").get());
    CHECK(!bridge.session.stat("/dir").get());
    CHECK(!bridge.session.unlink("/dir/empty.txt").get());

    const ErrorLog log = bridge.session.fetchErrorLog();
    CHECK(getStats(log).error == 4);
}


TEST_CASE("bridge_transfer_progress", "[unit][bridge]")
{
    ConnectedBridge bridge;
    const std::string data = makeTestData(2500);

    //callbacks run on the worker thread: evaluate after the transfer
    std::vector<uint64_t> uploadProgress;
    std::vector<std::optional<uint64_t>> uploadTotals;
    REQUIRE(bridge.session.writeBytes(data, "/p.bin", SFTP_DEFAULT_PERMISSION_FILE, [&](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal)
    {
        uploadProgress.push_back(bytesSoFar);
        uploadTotals.push_back(bytesTotal);
        return true;
    }).get());
    const std::vector<uint64_t> expectedProgress{1000, 2000, 2500};
    CHECK(uploadProgress == expectedProgress);
    CHECK(std::all_of(uploadTotals.begin(), uploadTotals.end(), [&](std::optional<uint64_t> total) { return total == data.size(); }));

    std::vector<uint64_t> downloadProgress;
    CHECK(bridge.session.readBytes("/p.bin", [&](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal)
    {
        downloadProgress.push_back(bytesSoFar);
        return true;
    }).get() == data);
    CHECK(downloadProgress == expectedProgress);
}


TEST_CASE("bridge_upload_completes_on_source_exhaustion", "[unit][bridge]")
{
    ConnectedBridge bridge;

    //declared size is a progress hint only: e.g. a local file shrinking during upload
    class MisreportingSource : public SourceStream
    {
    public:
        size_t read(void* buffer, size_t bytesToRead) override { return source_.read(buffer, bytesToRead); }
        std::optional<uint64_t> getDeclaredSize() override { return 10; }
    private:
        MemorySource source_{"hello"};
    };

    std::vector<std::optional<uint64_t>> totals;
    CHECK(bridge.session.writeStream(std::make_shared<MisreportingSource>(), "/x.bin", SFTP_DEFAULT_PERMISSION_FILE,
                                     [&](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal) { totals.push_back(bytesTotal); return true; }).get());

    const std::optional<FileAttributes> attr = bridge.session.stat("/x.bin").get();
    REQUIRE(attr);
    CHECK(attr->fileSize == 5u);
    CHECK(bridge.session.readBytes("/x.bin").get() == "hello");

    REQUIRE(totals.size() == 1);
    CHECK(totals[0] == 10u);
    CHECK(getStats(bridge.session.fetchErrorLog()).error == 0);
}


TEST_CASE("bridge_cancelled_upload_leaves_no_file", "[unit][bridge]")
{
    ConnectedBridge bridge;
    const std::string data = makeTestData(5000);

    int callbacks = 0;
    CHECK(!bridge.session.writeBytes(data, "/cancel.bin", SFTP_DEFAULT_PERMISSION_FILE, [&](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal)
    {
        ++callbacks;
        return false;
    }).get());

    CHECK(callbacks == 1);
    CHECK(!bridge.session.stat("/cancel.bin").get());

    const std::vector<std::string> callLog = bridge.inspect([](FakeServer& server) { return server.callLog; });
    CHECK(std::count(callLog.begin(), callLog.end(), "write /cancel.bin") == 1);

    CHECK(logContains(bridge.session.fetchErrorLog(), MSG_TYPE_INFO, "cancelled"));
}


TEST_CASE("bridge_cancelled_download", "[unit][bridge]")
{
    ConnectedBridge bridge;
    REQUIRE(bridge.session.writeBytes(makeTestData(3000), "/down.bin").get());

    CHECK(!bridge.session.readBytes("/down.bin", [](uint64_t bytesSoFar, std::optional<uint64_t> bytesTotal) { return false; }).get());

    const std::vector<std::string> callLog = bridge.inspect([](FakeServer& server) { return server.callLog; });
    CHECK(std::count(callLog.begin(), callLog.end(), "read /down.bin") == 1);
    CHECK(std::count(callLog.begin(), callLog.end(), "close /down.bin") == 2); //upload + download handle
}


TEST_CASE("bridge_short_download_fails", "[unit][bridge]")
{
    ConnectedBridge bridge;
    REQUIRE(bridge.session.writeBytes(makeTestData(3000), "/trunc.bin").get());
    bridge.inspect([](FakeServer& server) { server.readEofAfter = 1200; return 0; });

    CHECK(!bridge.session.readBytes("/trunc.bin").get());
    CHECK_THROWS_AS(bridge.session.runSerialized([](SftpClient& client)
    {
        MemorySink sink;
        return client.readFile("/trunc.bin", sink, nullptr);
    }).get(), ErrorShortTransfer);
}


TEST_CASE("bridge_timeout_marks_session_unhealthy", "[unit][bridge]")
{
    ConnectedBridge bridge;
    bridge.inspect([](FakeServer& server) { server.wouldBlockAttempts = 1000000; server.trafficArrives = false; return 0; });

    CHECK_THROWS_AS(bridge.session.runSerialized([](SftpClient& client) { return client.getAttributes("/"); }).get(), ErrorTimeout);
    CHECK(!bridge.session.runSerialized([](SftpClient& client) { return client.isHealthy(); }).get());
}


TEST_CASE("bridge_serializes_concurrent_callers", "[unit][bridge]")
{
    ConnectedBridge bridge;

    std::vector<std::thread> callers;
    std::atomic<int> failures{0};

    for (int t = 0; t < 4; ++t)
        callers.emplace_back([&, t]
        {
            const std::string filePath = "/caller" + numberTo<std::string>(t) + ".bin";
            for (int i = 0; i < 10; ++i)
            {
                std::future<bool> written = bridge.session.writeBytes(makeTestData(3000 + i), filePath);
                std::future<std::optional<FileAttributes>> attrFut = bridge.session.stat(filePath);

                const bool writeOk = written.get();
                const std::optional<FileAttributes> attr = attrFut.get();
                if (!writeOk || !attr || attr->fileSize != 3000u + i)
                    ++failures;
            }
        });

    for (std::thread& t : callers)
        t.join();

    CHECK(failures == 0);
    CHECK(bridge.inspect([](FakeServer& server) { return server.maxConcurrentCalls; }) == 1);
}


TEST_CASE("bridge_host_key_fingerprint", "[unit][bridge]")
{
    ConnectedBridge bridge;

    const std::optional<std::string> fingerprint = bridge.session.hostKeyFingerprint(DigestAlgorithm::sha256).get();
    REQUIRE(fingerprint);
    CHECK(*fingerprint == formatDigest(calculateDigest("ssh-ed25519 fake host key blob", DigestAlgorithm::sha256), DigestAlgorithm::sha256));
    CHECK(startsWith(*fingerprint, "SHA256:"));
}


TEST_CASE("bridge_keep_alive", "[unit][bridge]")
{
    ConnectedBridge bridge;
    CHECK(bridge.session.sendKeepAlive().get());
    CHECK(bridge.inspect([](FakeServer& server) { return server.keepAlivesSent; }) == 1);
}


TEST_CASE("bridge_background_keep_alive", "[unit][bridge][slow]")
{
    SessionConfig cfg = makeFakeConfig();
    cfg.keepAliveIntervalSec = 1;
    ConnectedBridge bridge(cfg);

    const auto stopTime = std::chrono::steady_clock::now() + 5s;
    int keepAlivesSent = 0;
    while (keepAlivesSent == 0 && std::chrono::steady_clock::now() < stopTime)
    {
        std::this_thread::sleep_for(100ms);
        keepAlivesSent = bridge.inspect([](FakeServer& server) { return server.keepAlivesSent; });
    }
    CHECK(keepAlivesSent > 0);
}


TEST_CASE("bridge_keep_alive_does_not_queue_up", "[unit][bridge][slow]")
{
    SessionConfig cfg = makeFakeConfig();
    cfg.keepAliveIntervalSec = 1;
    ConnectedBridge bridge(cfg);

    //long-running operation blocks the session for several keep-alive intervals
    bridge.session.runSerialized([](SftpClient& client) { std::this_thread::sleep_for(4500ms); }).get();

    //one keep-alive waited behind the operation, at most one more became due since
    const int keepAlivesSent = bridge.inspect([](FakeServer& server) { return server.keepAlivesSent; });
    CHECK(keepAlivesSent >= 1);
    CHECK(keepAlivesSent <= 2);
}


TEST_CASE("bridge_closed_session", "[unit][bridge]")
{
    ConnectedBridge bridge;
    REQUIRE(bridge.session.writeBytes("x", "/x.txt").get());

    bridge.session.close();

    CHECK_THROWS_AS(bridge.session.stat("/x.txt").get(), ErrorSessionClosed);
    CHECK_THROWS_AS(bridge.session.writeBytes("y", "/y.txt").get(), ErrorSessionClosed);

    bridge.session.close(); //idempotent
}


TEST_CASE("bridge_reopen_sftp_channel", "[unit][bridge]")
{
    ConnectedBridge bridge;
    CHECK(bridge.session.openSftp().get()); //closes prior channel first
    CHECK(bridge.session.closeSftp().get());

    CHECK(!bridge.session.stat("/").get()); //no channel
    CHECK(bridge.session.openSftp().get());
    CHECK(bridge.session.stat("/").get());

    const std::vector<std::string> callLog = bridge.inspect([](FakeServer& server) { return server.callLog; });
    CHECK(std::count(callLog.begin(), callLog.end(), "sftp_shutdown") == 2);
    CHECK(std::count(callLog.begin(), callLog.end(), "sftp_init") == 3);
}
