// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <sshb/error_log.h>
#include <sshb/extra_log.h>
#include <sshb/open_ssl.h>
#include <sshb/ring_buffer.h>
#include <sshb/string_tools.h>
#include <sshb/sys_error.h>
#include <SshBridge/Source/core/file_attributes.h>
#include <SshBridge/Source/core/ssh_status.h>
#include <catch2/catch.hpp>

using namespace sshb;


TEST_CASE("encode_base64", "[unit][util]")
{
    CHECK(stringEncodeBase64("") == "");
    CHECK(stringEncodeBase64("f") == "Zg==");
    CHECK(stringEncodeBase64("fo") == "Zm8=");
    CHECK(stringEncodeBase64("foo") == "Zm9v");
    CHECK(stringEncodeBase64("foob") == "Zm9vYg==");
    CHECK(stringEncodeBase64("fooba") == "Zm9vYmE=");
    CHECK(stringEncodeBase64("foobar") == "Zm9vYmFy");
}


TEST_CASE("decode_base64", "[unit][util]")
{
    CHECK(stringDecodeBase64("") == "");
    CHECK(stringDecodeBase64("Zg==") == "f");
    CHECK(stringDecodeBase64("Zm8=") == "fo");
    CHECK(stringDecodeBase64("Zm9v") == "foo");
    CHECK(stringDecodeBase64("Zm9vYg==") == "foob");
    CHECK(stringDecodeBase64("Zm9vYmE=") == "fooba");
    CHECK(stringDecodeBase64(" Zm9vYmFy\n") == "foobar");

    const std::string binary("\0\xff\x10 abc", 7);
    CHECK(stringDecodeBase64(stringEncodeBase64(binary)) == binary);

    CHECK_THROWS_AS(stringDecodeBase64("Zg"), SysError);
    CHECK_THROWS_AS(stringDecodeBase64("Zm9vY"), SysError);
    CHECK_THROWS_AS(stringDecodeBase64("Zm9v!@#$"), SysError);
}


TEST_CASE("digest_test_vectors", "[unit][util]")
{
    auto hexDigest = [](std::string_view msg, DigestAlgorithm algo) { return formatAsHexString(calculateDigest(msg, algo)); };

    //FIPS 180-2 examples
    CHECK(hexDigest("abc", DigestAlgorithm::sha1)   == "a9993e364706816aba3e25717850c26c9cd0d89d");
    CHECK(hexDigest("abc", DigestAlgorithm::sha224) == "23097d223405d8228642a477bda255b32aadbce4bda0b3f7e36c9da7");
    CHECK(hexDigest("abc", DigestAlgorithm::sha256) == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    CHECK(hexDigest("abc", DigestAlgorithm::sha384) == "cb00753f45a35e8bb5a03d699ac65007272c32ab0eded1631a8b605a43ff5bed"
          "8086072ba1e7cc2358baeca134c825a7");
    CHECK(hexDigest("abc", DigestAlgorithm::sha512) == "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
          "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");

    CHECK(hexDigest("", DigestAlgorithm::sha256) == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    CHECK(formatDigest(calculateDigest("abc", DigestAlgorithm::sha1), DigestAlgorithm::sha1) == "SHA1:a9993e364706816aba3e25717850c26c9cd0d89d");
}


TEST_CASE("digest_calculator_block_wise", "[unit][util]")
{
    const std::string message = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";

    DigestCalculator calc(DigestAlgorithm::sha256);
    for (size_t pos = 0; pos < message.size(); pos += 5)
        calc.update(std::string_view(message).substr(pos, 5));

    const std::string digest = calc.finalize();
    CHECK(formatAsHexString(digest) == "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
    CHECK(digest == calculateDigest(message, DigestAlgorithm::sha256));
}


TEST_CASE("string_tools", "[unit][util]")
{
    CHECK(trimCpy("  a b \t\n") == "a b");
    CHECK(replaceCpy("Cannot open %x.", "%x", "\"f\"") == "Cannot open \"f\".");

    CHECK(beforeFirst("user:pw@host", "@", IfNotFoundReturn::none) == "user:pw");
    CHECK(afterFirst ("user:pw@host", "@", IfNotFoundReturn::none) == "host");
    CHECK(beforeFirst("host", "@", IfNotFoundReturn::none) == "");
    CHECK(afterFirst ("host", "@", IfNotFoundReturn::all) == "host");
    CHECK(afterLast ("/a/b/c", "/", IfNotFoundReturn::all) == "c");
    CHECK(beforeLast("/a/b/c", "/", IfNotFoundReturn::all) == "/a/b");

    const std::vector<std::string> parts = splitCpy("a||b|", '|', SplitOnEmpty::skip);
    REQUIRE(parts.size() == 2);
    CHECK(parts[0] == "a");
    CHECK(parts[1] == "b");

    CHECK(equalAsciiNoCase("SFTP", "sftp"));
    CHECK(stringTo<int>("  42") == 42);
    CHECK(numberTo<std::string>(-17) == "-17");
    CHECK(formatAsHexString(std::string("\x01\xab", 2)) == "01ab");
}


TEST_CASE("format_system_error", "[unit][util]")
{
    const std::string msg = formatSystemError("connect", ECONNREFUSED);
    CHECK(startsWith(msg, "ECONNREFUSED: "));
    CHECK(endsWith(msg, " [connect]"));

    CHECK(formatSystemError("libssh2_init", "SSH status -6", "") == "SSH status -6 [libssh2_init]");
    CHECK(formatSystemError("", " code ", " details\n") == "code: details");
    CHECK(formatSystemError("getLibssh2Initializer", "", "") == "[getLibssh2Initializer]");

    errno = EINTR;
    CHECK(!getSystemErrorDescription(ENOENT).empty());
    CHECK(errno == EINTR); //preserved for the caller
}


TEST_CASE("ring_buffer_fifo", "[unit][util]")
{
    RingBuffer<std::string> buf;
    for (int i = 0; i < 100; ++i)
    {
        buf.push_back(numberTo<std::string>(i));
        if (i % 3 == 0)
            buf.pop_front();
    }

    CHECK(buf.size() == 66);
    CHECK(buf.front() == "34");

    RingBuffer<std::string> other;
    other.swap(buf);
    CHECK(buf.empty());
    CHECK(other.size() == 66);
}


TEST_CASE("error_log", "[unit][util]")
{
    ErrorLog log;
    logMsg(log, "connected", MSG_TYPE_INFO);
    logMsg(log, "Cannot read file \"/x\".\n\nSSH_FX_NO_SUCH_FILE", MSG_TYPE_ERROR, "me@host:22");
    logMsg(log, "slow server", MSG_TYPE_WARNING);

    const ErrorLogStats stats = getStats(log);
    CHECK(stats.info == 1);
    CHECK(stats.warning == 1);
    CHECK(stats.error == 1);

    const std::string formatted = formatMessage(log[1]);
    CHECK(contains(formatted, "Error [me@host:22]:  Cannot read file \"/x\"."));
    CHECK(!contains(formatted, "\n\n")); //blank lines are collapsed

    const std::string secondLine = afterFirst(formatted, "\n", IfNotFoundReturn::none);
    CHECK(trimCpy(secondLine) == "SSH_FX_NO_SUCH_FILE");
    CHECK(secondLine.find('S') == formatted.find("Cannot")); //continuation lines are aligned

    CHECK(contains(formatMessage(log[0]), "Info:  connected")); //no origin
    CHECK(formatErrorLog(log) == formatMessage(log[0]) + "\n\n" + formatMessage(log[1]) + "\n\n" + formatMessage(log[2]) + "\n\n");
}


TEST_CASE("extra_log_keeps_newest_entries", "[unit][util]")
{
    fetchExtraLog(); //start clean

    for (int i = 0; i < 1005; ++i)
        logExtraError("cleanup failure " + numberTo<std::string>(i));

    const ErrorLog log = fetchExtraLog();
    REQUIRE(log.size() == 1001);
    CHECK(log[0].type == MSG_TYPE_WARNING);
    CHECK(contains(log[0].message, "5"));
    CHECK(log[1].message == "cleanup failure 5");
    CHECK(log.back().message == "cleanup failure 1004");

    CHECK(fetchExtraLog().empty());
}


TEST_CASE("format_status_codes", "[unit][util]")
{
    CHECK(formatSftpStatusCode(SSH_FX_NO_SUCH_FILE) == "SSH_FX_NO_SUCH_FILE");
    CHECK(formatSftpStatusCode(SSH_FX_FILE_IS_A_DIRECTORY) == "SSH_FX_FILE_IS_A_DIRECTORY");
    CHECK(formatSftpStatusCode(1000) == "SFTP status 1000");

    CHECK(isNotFoundStatus(SSH_FX_NO_SUCH_PATH));
    CHECK(!isNotFoundStatus(SSH_FX_PERMISSION_DENIED));
    CHECK(!isNotFoundStatus(std::nullopt));
}


TEST_CASE("format_permissions", "[unit][util]")
{
    CHECK(formatPermissions(SFTP_MODE_DIRECTORY | 0755) == "drwxr-xr-x");
    CHECK(formatPermissions(SFTP_MODE_REGULAR | 0640) == "-rw-r-----");
    CHECK(formatPermissions(SFTP_MODE_SYMLINK | 0777) == "lrwxrwxrwx");
    CHECK(formatPermissions(SFTP_MODE_REGULAR | 04755) == "-rwsr-xr-x");
    CHECK(formatPermissions(SFTP_MODE_DIRECTORY | 01777) == "drwxrwxrwt");

    FileAttributes attr;
    attr.permissions = SFTP_MODE_REGULAR | 0600;
    attr.fileSize = 1234;
    CHECK(attr.isRegularFile());
    CHECK(!attr.isDirectory());
    CHECK(contains(formatFileAttributes(attr), "-rw-------"));
    CHECK(contains(formatFileAttributes(attr), "0600"));
}
