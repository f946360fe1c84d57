// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <SshBridge/Source/core/retrying_invoker.h>
#include "fake_sftp.h"
#include <catch2/catch.hpp>

using namespace sshb;
using namespace sshb::test;
using namespace std::chrono_literals;


TEST_CASE("invoker_retries_until_success", "[unit][invoker]")
{
    auto server = std::make_shared<FakeServer>();
    FakeTransport transport(server);

    const int wouldBlockCount = GENERATE(0, 1, 5);

    int attempts = 0;
    const int rc = RetryingInvoker(transport, nullptr, 2s).invoke("test_call", [&]
    {
        return ++attempts <= wouldBlockCount ? SSH_RC_WOULD_BLOCK : 17;
    });

    CHECK(rc == 17);
    CHECK(attempts == wouldBlockCount + 1);
    CHECK(server->trafficWaits.size() == static_cast<size_t>(wouldBlockCount));
    CHECK(transport.isHealthy());
}


TEST_CASE("invoker_waits_on_blocked_direction", "[unit][invoker]")
{
    auto server = std::make_shared<FakeServer>();
    FakeTransport transport(server);

    SECTION("outbound")
    {
        server->blockDirections = BlockDirection::outbound;
        int attempts = 0;
        RetryingInvoker(transport, nullptr, 2s).invoke("test_write", [&] { return ++attempts < 3 ? SSH_RC_WOULD_BLOCK : SSH_RC_OK; });

        REQUIRE(server->trafficWaits.size() == 2);
        for (BlockDirection dir : server->trafficWaits)
            CHECK(dir == BlockDirection::outbound);
    }

    SECTION("inbound")
    {
        server->blockDirections = BlockDirection::inbound;
        int attempts = 0;
        RetryingInvoker(transport, nullptr, 2s).invoke("test_read", [&] { return ++attempts < 2 ? SSH_RC_WOULD_BLOCK : SSH_RC_OK; });

        REQUIRE(server->trafficWaits.size() == 1);
        CHECK(server->trafficWaits[0] == BlockDirection::inbound);
    }

    SECTION("unknown direction waits for both")
    {
        server->blockDirections = BlockDirection::none;
        int attempts = 0;
        RetryingInvoker(transport, nullptr, 2s).invoke("test_any", [&] { return ++attempts < 2 ? SSH_RC_WOULD_BLOCK : SSH_RC_OK; });

        REQUIRE(server->trafficWaits.size() == 1);
        CHECK(server->trafficWaits[0] == BlockDirection::both);
    }
}


TEST_CASE("invoker_times_out_without_traffic", "[unit][invoker]")
{
    auto server = std::make_shared<FakeServer>();
    server->trafficArrives = false;
    FakeTransport transport(server);

    int attempts = 0;
    CHECK_THROWS_AS(RetryingInvoker(transport, nullptr, 1s).invoke("test_call", [&] { ++attempts; return SSH_RC_WOULD_BLOCK; }),
                    SysErrorTimeout);

    CHECK(attempts == 1);
    CHECK(!transport.isHealthy()); //abandoned command: session can't be trusted anymore
}


TEST_CASE("invoker_deadline_covers_whole_command", "[unit][invoker]")
{
    auto server = std::make_shared<FakeServer>();
    FakeTransport transport(server);

    int attempts = 0;
    const auto stopTime = std::chrono::steady_clock::now() - 1ms; //already expired

    CHECK_THROWS_AS(RetryingInvoker(transport, nullptr, 1s).invoke("test_call", [&] { ++attempts; return SSH_RC_WOULD_BLOCK; }, stopTime),
                    SysErrorTimeout);
    CHECK(attempts == 1);
    CHECK(server->trafficWaits.empty());
}


TEST_CASE("invoker_reports_sftp_status", "[unit][invoker]")
{
    auto server = std::make_shared<FakeServer>();
    FakeTransport transport(server);

    std::unique_ptr<SftpChannel> channel;
    REQUIRE(transport.tryOpenSftp(channel) == SSH_RC_OK);

    FileAttributes attr;
    try
    {
        RetryingInvoker(transport, channel.get(), 1s).invoke("libssh2_sftp_stat", [&] { return channel->tryStat("/missing", SftpStatMode::followLink, attr); });
        FAIL("stat of missing item succeeded");
    }
    catch (const SysErrorSftpProtocol& e)
    {
        CHECK(e.sftpErrorCode == SSH_FX_NO_SUCH_FILE);
        CHECK(contains(e.toString(), "libssh2_sftp_stat"));
    }
    CHECK(transport.isHealthy()); //SFTP error: SSH session is fine
}


TEST_CASE("invoker_marks_session_corrupted_on_fatal_error", "[unit][invoker]")
{
    auto server = std::make_shared<FakeServer>();
    FakeTransport transport(server);

    bool timeout = false;
    try
    {
        RetryingInvoker(transport, nullptr, 1s).invoke("libssh2_session_handshake", [] { return SSH_RC_SOCKET_NONE; });
        FAIL("fatal error was ignored");
    }
    catch (const SysErrorTimeout&) { timeout = true; }
    catch (const SysError& e) { CHECK(contains(e.toString(), "libssh2_session_handshake")); }

    CHECK(!timeout);
    CHECK(!transport.isHealthy());
}
