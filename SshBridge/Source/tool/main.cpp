// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include <atomic>
#include <iostream>
#include <termios.h>
#include <unistd.h>
#include <sshb/file_io.h>
#include "../core/local_stream.h"
#include "../core/ssh_bridge.h"
#include "../libssh2/ssh_session.h"

using namespace sshb;


namespace
{
enum class SshbExitCode //as returned on process exit
{
    success = 0,
    error,
    usage,
};


void notifyAppError(const std::string& msg)
{
    std::cerr << _("Error") + ": " + msg + '\n';
}


const char* getSyntaxHelp()
{
    return
        "Usage: sshb [-v] [--log=<file>] <session phrase> <command> [arguments]\n"
        "\n"
        "Session phrase:\n"
        "    sftp://[<user>[:<password>]@]<server>[:port][/<path>][|option...]\n"
        "    options: timeout=<sec> keepalive=<sec> keyfile=<path> agent kbd zlib pass64=<base64>\n"
        "\n"
        "Commands: (relative paths are resolved against the phrase's path)\n"
        "    ls [<folder>]                 list folder\n"
        "    stat [<path>]                 show attributes, following symlinks\n"
        "    lstat [<path>]                show attributes of the link itself\n"
        "    df [<path>]                   show file system usage\n"
        "    readlink <link>               show symlink target\n"
        "    realpath [<path>]             canonicalize path\n"
        "    ln <target> <link>            create symlink\n"
        "    mkdir <folder>                create folder\n"
        "    touch <file>                  create empty file\n"
        "    mv <from> <to>                rename, replacing an existing target\n"
        "    rmdir <folder>                remove empty folder\n"
        "    rm <file>                     remove file\n"
        "    chown <uid>:<gid> <path>      change owner\n"
        "    chmod <octal mode> <path>     change permissions\n"
        "    get <remote> [<local>]        download file\n"
        "    put <local> [<remote>]        upload file\n"
        "    cat <remote>                  print file content\n"
        "    sum <remote> [<algorithm>]    digest of file content: sha1, sha224, sha256 (default), sha384, sha512\n"
        "    fingerprint [<algorithm>]     digest of the server's host key\n"
        "\n"
        "Options:\n"
        "    -v            print session notifications to stderr\n"
        "    --log=<file>  write the session log to a file\n";
}


//session notifications arrive on the worker thread
class ConsoleDelegate : public SessionDelegate
{
public:
    explicit ConsoleDelegate(bool verbose) : verbose_(verbose) {}

    void onConnect(const std::string& serverBanner) override
    {
        if (verbose_)
            std::cerr << "Server: " + serverBanner + '\n';
    }

    void onDisconnect(const std::string& reason) override
    {
        if (verbose_)
            std::cerr << "Disconnected: " + reason + '\n' +
                      "Traffic: " + numberTo<std::string>(bytesSent_.load()) + " bytes sent, " +
                      numberTo<std::string>(bytesReceived_.load()) + " bytes received\n";
    }

    void onDataSent    (size_t bytes) override { bytesSent_     += bytes; }
    void onDataReceived(size_t bytes) override { bytesReceived_ += bytes; }

    void onDebug(const std::string& msg) override
    {
        if (verbose_)
            std::cerr << "Server debug: " + msg + '\n';
    }

    void onTrace(const std::string& msg) override
    {
        if (verbose_)
            std::cerr << "Trace: " + msg + '\n';
    }

    std::string onKeyboardInteractive(const std::string& prompt, bool echo) override
    {
        std::cerr << prompt << std::flush;

        termios ttyOld = {};
        const bool hideInput = !echo && ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &ttyOld) == 0;
        if (hideInput)
        {
            termios ttyNew = ttyOld;
            ttyNew.c_lflag &= ~ECHO;
            ::tcsetattr(STDIN_FILENO, TCSANOW, &ttyNew);
        }
        SSHB_ON_SCOPE_EXIT(if (hideInput) { ::tcsetattr(STDIN_FILENO, TCSANOW, &ttyOld); std::cerr << '\n'; });

        std::string answer;
        std::getline(std::cin, answer);
        return answer;
    }

private:
    const bool verbose_;
    std::atomic<uint64_t> bytesSent_{0};
    std::atomic<uint64_t> bytesReceived_{0};
};


std::string resolveRemotePath(const std::string& basePath, const std::string& arg)
{
    if (arg.empty())
        return basePath;
    if (startsWith(arg, "/"))
        return arg;
    return endsWith(basePath, "/") ? basePath + arg : basePath + '/' + arg;
}


DigestAlgorithm parseDigestAlgorithm(const std::string& name) //throw FileError
{
    for (const DigestAlgorithm algo : {DigestAlgorithm::sha1, DigestAlgorithm::sha224, DigestAlgorithm::sha256, DigestAlgorithm::sha384, DigestAlgorithm::sha512})
        if (equalAsciiNoCase(name, getDigestName(algo)))
            return algo;

    throw FileError(replaceCpy(_("Unknown digest algorithm %x."), "%x", fmtPath(name)));
}


ProgressCallback makeProgressReporter(bool verbose, const std::string& itemPath)
{
    if (!verbose)
        return nullptr;

    return [itemPath](uint64_t bytesSoFar, std::optional<uint64_t> total)
    {
        std::string msg = itemPath + ": " + numberTo<std::string>(bytesSoFar);
        if (total)
            msg += " / " + numberTo<std::string>(*total);
        std::cerr << msg + " bytes\r" << std::flush;
        return true; //continue
    };
}


struct CommandLine
{
    bool verbose = false;
    std::string logFilePath;
    std::string sessionPhrase;
    std::string command;
    std::vector<std::string> args;
};

CommandLine parseCommandLine(int argc, char* argv[]) //throw FileError
{
    CommandLine cmdLine;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i)
    {
        const std::string arg = argv[i];
        if (arg == "-v")
            cmdLine.verbose = true;
        else if (startsWith(arg, "--log="))
            cmdLine.logFilePath = afterFirst(arg, "=", IfNotFoundReturn::none);
        else
            positional.push_back(arg);
    }

    if (positional.size() < 2)
        throw FileError(_("A session phrase and a command are expected."));

    cmdLine.sessionPhrase = positional[0];
    cmdLine.command       = positional[1];
    cmdLine.args.assign(positional.begin() + 2, positional.end());
    return cmdLine;
}


//returns false if the command failed: details are in the session's error log
bool runCommand(SshBridge& session, const CommandLine& cmdLine, const std::string& basePath) //throw FileError
{
    const std::string& cmd = cmdLine.command;
    const std::vector<std::string>& args = cmdLine.args;

    auto getArg = [&](size_t pos) -> std::string
    {
        if (pos >= args.size())
            throw FileError(replaceCpy(_("Missing argument for command %x."), "%x", fmtPath(cmd)));
        return args[pos];
    };
    auto getOptArg = [&](size_t pos) { return pos < args.size() ? args[pos] : std::string(); };
    auto remote = [&](const std::string& arg) { return resolveRemotePath(basePath, arg); };

    if (cmd == "ls")
    {
        const std::optional<std::vector<DirEntry>> entries = session.openDir(remote(getOptArg(0))).get();
        if (!entries)
            return false;
        for (const DirEntry& entry : *entries)
            std::cout << (entry.longEntry.empty() ? entry.name : entry.longEntry) << '\n';
        return true;
    }
    if (cmd == "stat" || cmd == "lstat")
    {
        const std::string itemPath = remote(getOptArg(0));
        const std::optional<FileAttributes> attr = cmd == "stat" ? session.stat(itemPath).get() : session.lstat(itemPath).get();
        if (!attr)
            return false;
        std::cout << itemPath << '\n' << formatFileAttributes(*attr);
        return true;
    }
    if (cmd == "df")
    {
        const std::optional<FsStats> st = session.statVfs(remote(getOptArg(0))).get();
        if (!st)
            return false;
        std::cout << "Total:     " << st->getTotalBytes()     << " bytes\n"
                  << "Free:      " << st->getFreeBytes()      << " bytes\n"
                  << "Available: " << st->getAvailableBytes() << " bytes\n"
                  << "Inodes:    " << st->inodes << " (" << st->inodesFree << " free)\n"
                  << "Read-only: " << (st->isReadOnly() ? "yes" : "no") << '\n';
        return true;
    }
    if (cmd == "readlink" || cmd == "realpath")
    {
        const std::optional<std::string> target = cmd == "readlink" ?
                                                  session.readLink(remote(getArg(0))).get() :
                                                  session.realPath(remote(getOptArg(0))).get();
        if (!target)
            return false;
        std::cout << *target << '\n';
        return true;
    }
    if (cmd == "ln")
        return session.symlink(getArg(0) /*stored verbatim*/, remote(getArg(1))).get();
    if (cmd == "mkdir")
        return session.mkdir(remote(getArg(0))).get();
    if (cmd == "touch")
        return session.mkfile(remote(getArg(0))).get();
    if (cmd == "mv")
        return session.rename(remote(getArg(0)), remote(getArg(1))).get();
    if (cmd == "rmdir")
        return session.rmdir(remote(getArg(0))).get();
    if (cmd == "rm")
        return session.unlink(remote(getArg(0))).get();
    if (cmd == "chown")
    {
        const std::string owner = getArg(0);
        if (!contains(owner, ":"))
            throw FileError(replaceCpy(_("Invalid owner %x."), "%x", fmtPath(owner)), "Expected: <uid>:<gid>");
        return session.chown(remote(getArg(1)),
                             stringTo<uint32_t>(beforeFirst(owner, ":", IfNotFoundReturn::none)),
                             stringTo<uint32_t>(afterFirst (owner, ":", IfNotFoundReturn::none))).get();
    }
    if (cmd == "chmod")
    {
        const std::string mode = getArg(0);
        uint32_t permissions = 0;
        for (const char c : mode)
        {
            if (c < '0' || c > '7')
                throw FileError(replaceCpy(_("Invalid permissions %x."), "%x", fmtPath(mode)), "Expected: octal number");
            permissions = permissions * 8 + static_cast<uint32_t>(c - '0');
        }
        return session.chmod(remote(getArg(1)), permissions).get();
    }
    if (cmd == "get")
    {
        const std::string remotePath = remote(getArg(0));
        std::string localPath = getOptArg(1);
        if (localPath.empty())
            localPath = afterLast(remotePath, "/", IfNotFoundReturn::all);

        const bool ok = session.readFile(remotePath, localPath, makeProgressReporter(cmdLine.verbose, remotePath)).get();
        if (cmdLine.verbose)
            std::cerr << '\n';
        return ok;
    }
    if (cmd == "put")
    {
        const std::string localPath = getArg(0);
        const std::string remotePath = remote(args.size() > 1 ? args[1] : afterLast(localPath, "/", IfNotFoundReturn::all));

        const bool ok = session.writeFile(localPath, remotePath, SFTP_DEFAULT_PERMISSION_FILE, makeProgressReporter(cmdLine.verbose, remotePath)).get();
        if (cmdLine.verbose)
            std::cerr << '\n';
        return ok;
    }
    if (cmd == "cat")
    {
        const std::optional<std::string> content = session.readBytes(remote(getArg(0))).get();
        if (!content)
            return false;
        std::cout << *content << std::flush;
        return true;
    }
    if (cmd == "sum")
    {
        const std::string remotePath = remote(getArg(0));
        const DigestAlgorithm algo = args.size() > 1 ? parseDigestAlgorithm(args[1]) : DigestAlgorithm::sha256; //throw FileError

        std::shared_ptr<DigestSink> digestSink;
        try
        {
            digestSink = std::make_shared<DigestSink>(algo); //throw SysError
        }
        catch (const SysError& e) { throw FileError(replaceCpy(_("Cannot calculate %x checksum."), "%x", getDigestName(algo)), e.toString()); }

        if (!session.readStream(remotePath, digestSink).get())
            return false;
        std::cout << digestSink->finalize() /*throw FileError*/ << "  " << remotePath << '\n';
        return true;
    }
    if (cmd == "fingerprint")
    {
        const DigestAlgorithm algo = args.empty() ? DigestAlgorithm::sha256 : parseDigestAlgorithm(args[0]); //throw FileError

        const std::optional<std::string> fingerprint = session.hostKeyFingerprint(algo).get();
        if (!fingerprint)
            return false;
        std::cout << *fingerprint << '\n';
        return true;
    }

    throw FileError(replaceCpy(_("Unknown command %x."), "%x", fmtPath(cmd)), getSyntaxHelp());
}


void reportLog(const ErrorLog& log, const std::string& logFilePath) //throw FileError
{
    const std::string logStream = formatErrorLog(log);

    std::cerr << logStream;

    if (!logFilePath.empty())
        setFileContent(logFilePath, logStream); //throw FileError
}
}


int main(int argc, char* argv[])
{
    //errors that cannot be propagated, e.g. failed clean-up in destructors
    initExtraLog([](const ErrorLog& log) { std::cerr << formatErrorLog(log); });

    if (argc < 2 || std::string_view(argv[1]) == "-h" || std::string_view(argv[1]) == "--help")
    {
        std::cout << getSyntaxHelp();
        return static_cast<int>(argc < 2 ? SshbExitCode::usage : SshbExitCode::success);
    }

    SshbExitCode exitCode = SshbExitCode::success;
    try
    {
        const CommandLine cmdLine = parseCommandLine(argc, argv); //throw FileError
        const SessionPhrase phrase = parseSessionPhrase(cmdLine.sessionPhrase); //throw FileError

        ErrorLog log;
        {
            SshBridge session(phrase.cfg, createLibssh2Transport, std::make_shared<ConsoleDelegate>(cmdLine.verbose));

            if (!session.connect().get() ||
                !session.openSftp().get() ||
                !runCommand(session, cmdLine, phrase.path)) //throw FileError
                exitCode = SshbExitCode::error;

            session.disconnect().get();
            session.close();

            log = session.fetchErrorLog();
        }

        const ErrorLog& extraLog = fetchExtraLog();
        log.insert(log.end(), extraLog.begin(), extraLog.end());

        if (exitCode == SshbExitCode::success && getStats(log).error > 0)
            exitCode = SshbExitCode::error;

        reportLog(log, cmdLine.logFilePath); //throw FileError
    }
    catch (const FileError& e)
    {
        notifyAppError(e.toString());
        exitCode = SshbExitCode::error;
    }
    return static_cast<int>(exitCode);
}
