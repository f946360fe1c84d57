// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "ssh_session.h"
#include <array>
#include <cstring> //strdup, strnlen
#include <exception>
#include <functional>
#include <sshb/extra_log.h>
#include <sshb/file_io.h>
#include <sshb/scope_guard.h>
#include <sshb/socket.h>
#include "init_libssh2.h"
#include <libssh2.h>
#include <libssh2_sftp.h>

using namespace sshb;


//the session logic is libssh2-agnostic: its status codes must match
static_assert(SSH_RC_OK               == LIBSSH2_ERROR_NONE);
static_assert(SSH_RC_SOCKET_NONE      == LIBSSH2_ERROR_SOCKET_NONE);
static_assert(SSH_RC_TIMEOUT          == LIBSSH2_ERROR_TIMEOUT);
static_assert(SSH_RC_SFTP_PROTOCOL    == LIBSSH2_ERROR_SFTP_PROTOCOL);
static_assert(SSH_RC_WOULD_BLOCK      == LIBSSH2_ERROR_EAGAIN);
static_assert(SSH_RC_BUFFER_TOO_SMALL == LIBSSH2_ERROR_BUFFER_TOO_SMALL);

static_assert(SSH_FX_OK                  == LIBSSH2_FX_OK);
static_assert(SSH_FX_EOF                 == LIBSSH2_FX_EOF);
static_assert(SSH_FX_NO_SUCH_FILE        == LIBSSH2_FX_NO_SUCH_FILE);
static_assert(SSH_FX_PERMISSION_DENIED   == LIBSSH2_FX_PERMISSION_DENIED);
static_assert(SSH_FX_FAILURE             == LIBSSH2_FX_FAILURE);
static_assert(SSH_FX_OP_UNSUPPORTED      == LIBSSH2_FX_OP_UNSUPPORTED);
static_assert(SSH_FX_INVALID_HANDLE      == LIBSSH2_FX_INVALID_HANDLE);
static_assert(SSH_FX_NO_SUCH_PATH        == LIBSSH2_FX_NO_SUCH_PATH);
static_assert(SSH_FX_FILE_ALREADY_EXISTS == LIBSSH2_FX_FILE_ALREADY_EXISTS);
static_assert(SSH_FX_DIR_NOT_EMPTY       == LIBSSH2_FX_DIR_NOT_EMPTY);
static_assert(SSH_FX_NOT_A_DIRECTORY     == LIBSSH2_FX_NOT_A_DIRECTORY);

static_assert(SFTP_MODE_TYPE_MASK == LIBSSH2_SFTP_S_IFMT);
static_assert(SFTP_MODE_DIRECTORY == LIBSSH2_SFTP_S_IFDIR);
static_assert(SFTP_MODE_REGULAR   == LIBSSH2_SFTP_S_IFREG);
static_assert(SFTP_MODE_SYMLINK   == LIBSSH2_SFTP_S_IFLNK);


namespace
{
//libssh2's string macros measure with strlen() and truncate size_t: call the *_ex functions instead
unsigned int strLen(const std::string& str) { return static_cast<unsigned int>(str.size()); }


FileAttributes convertAttributes(const LIBSSH2_SFTP_ATTRIBUTES& attribs)
{
    FileAttributes attr;
    if (attribs.flags & LIBSSH2_SFTP_ATTR_SIZE)
        attr.fileSize = attribs.filesize;

    if (attribs.flags & LIBSSH2_SFTP_ATTR_UIDGID)
    {
        attr.uid = static_cast<uint32_t>(attribs.uid);
        attr.gid = static_cast<uint32_t>(attribs.gid);
    }
    if (attribs.flags & LIBSSH2_SFTP_ATTR_PERMISSIONS)
        attr.permissions = static_cast<uint32_t>(attribs.permissions);

    if (attribs.flags & LIBSSH2_SFTP_ATTR_ACMODTIME)
    {
        attr.accessTime = static_cast<time_t>(attribs.atime);
        attr.modTime    = static_cast<time_t>(attribs.mtime);
    }
    return attr;
}


//SFTP transmits owner and times as pairs: return "false" if only one half is set
bool convertAttributes(const FileAttributes& attr, LIBSSH2_SFTP_ATTRIBUTES& attribs)
{
    attribs = {};
    if (attr.fileSize)
    {
        attribs.flags |= LIBSSH2_SFTP_ATTR_SIZE;
        attribs.filesize = *attr.fileSize;
    }

    if (attr.uid.has_value() != attr.gid.has_value())
        return false;
    if (attr.uid)
    {
        attribs.flags |= LIBSSH2_SFTP_ATTR_UIDGID;
        attribs.uid = *attr.uid;
        attribs.gid = *attr.gid;
    }

    if (attr.permissions)
    {
        attribs.flags |= LIBSSH2_SFTP_ATTR_PERMISSIONS;
        attribs.permissions = *attr.permissions;
    }

    if (attr.accessTime.has_value() != attr.modTime.has_value())
        return false;
    if (attr.modTime)
    {
        attribs.flags |= LIBSSH2_SFTP_ATTR_ACMODTIME;
        attribs.atime = static_cast<unsigned long>(*attr.accessTime);
        attribs.mtime = static_cast<unsigned long>(*attr.modTime);
    }
    return true;
}


class Libssh2SftpChannel;

class SshSession : public SshTransport
{
public:
    SshSession(const SessionConfig& cfg, SessionDelegate& delegate) : //throw SysError
        cfg_(cfg),
        delegate_(delegate),
        libssh2Init_(getLibssh2Initializer()) //throw SysError
    {
        SSHB_ON_SCOPE_FAIL(cleanup()); //destructor call would lead to member double clean-up!!!

        socket_.emplace(cfg_.server, numberTo<std::string>(cfg_.getPort()), cfg_.timeoutSec); //throw SysError

        //callbacks find their session via the "abstract" pointer
        sshSession_ = ::libssh2_session_init_ex(nullptr, nullptr, nullptr, this);
        if (!sshSession_) //does not set ssh last error; source: only memory allocation may fail
            throw SysError(formatSystemError("libssh2_session_init_ex", formatLibssh2Status(LIBSSH2_ERROR_ALLOC), ""));

        ::libssh2_session_callback_set(sshSession_, LIBSSH2_CALLBACK_SEND,       reinterpret_cast<void*>(&onSend));
        ::libssh2_session_callback_set(sshSession_, LIBSSH2_CALLBACK_RECV,       reinterpret_cast<void*>(&onRecv));
        ::libssh2_session_callback_set(sshSession_, LIBSSH2_CALLBACK_DEBUG,      reinterpret_cast<void*>(&onDebug));
        ::libssh2_session_callback_set(sshSession_, LIBSSH2_CALLBACK_DISCONNECT, reinterpret_cast<void*>(&onDisconnect));

        //no-op unless libssh2 was built with debug tracing
        if (::libssh2_trace_sethandler(sshSession_, this, &onTrace) == 0)
            ::libssh2_trace(sshSession_, LIBSSH2_TRACE_CONN | LIBSSH2_TRACE_AUTH | LIBSSH2_TRACE_SFTP | LIBSSH2_TRACE_ERROR);

        //zlib costs CPU time, especially for local networks => user setting
        if (cfg_.allowZlib)
            if (const int rc = ::libssh2_session_flag(sshSession_, LIBSSH2_FLAG_COMPRESS, 1);
                rc != 0) //does not set SSH last error
                throw SysError(formatSystemError("libssh2_session_flag", formatLibssh2Status(rc), ""));

        ::libssh2_session_set_blocking(sshSession_, 1);
        ::libssh2_session_set_timeout(sshSession_, cfg_.timeoutSec * 1000 /*ms*/);

        if (::libssh2_session_handshake(sshSession_, socket_->get()) != 0)
            throw SysError(formatLastSshError("libssh2_session_handshake", nullptr));

        if (const char* banner = ::libssh2_session_banner_get(sshSession_))
            serverBanner_ = trimCpy(banner);

        authenticate(); //throw SysError

        //libssh2_keepalive_send() is a no-op for interval 0: the bridge schedules keep-alives itself
        ::libssh2_keepalive_config(sshSession_, 1 /*want_reply*/, static_cast<unsigned int>(std::max(cfg_.keepAliveIntervalSec, 1)));

        //from here on: single attempts only => RetryingInvoker
        ::libssh2_session_set_blocking(sshSession_, 0);

        connected_ = true;
        delegate_.onConnect(serverBanner_);
    }

    ~SshSession() override { cleanup(); }

    BlockDirection getBlockDirections() const override
    {
        const int dir = ::libssh2_session_block_directions(sshSession_);

        BlockDirection dirs = BlockDirection::none;
        if (dir & LIBSSH2_SESSION_BLOCK_INBOUND)
            dirs = dirs | BlockDirection::inbound;
        if (dir & LIBSSH2_SESSION_BLOCK_OUTBOUND)
            dirs = dirs | BlockDirection::outbound;
        return dirs;
    }

    bool waitForTraffic(BlockDirection dirs, std::chrono::steady_clock::time_point stopTime) override //throw SysError
    {
        return waitForSocket(socket_->get(),
                             contains(dirs, BlockDirection::inbound),
                             contains(dirs, BlockDirection::outbound), stopTime); //throw SysError
    }

    void markAsCorrupted() override { possiblyCorrupted_ = true; }
    bool isHealthy() const override { return !possiblyCorrupted_; }

    std::string formatLastError(const char* functionName) const override { return formatLastSshError(functionName, nullptr); }

    int tryOpenSftp(std::unique_ptr<SftpChannel>& channel) override; //see below

    int trySendKeepAlive(int& secondsToNextKeepAlive) override
    {
        return checkRc(::libssh2_keepalive_send(sshSession_, &secondsToNextKeepAlive));
    }

    std::string getHostKey() const override
    {
        size_t keyLen = 0;
        int keyType = 0;
        if (const char* key = ::libssh2_session_hostkey(sshSession_, &keyLen, &keyType))
            return std::string(key, keyLen);
        return {};
    }

    std::string getServerBanner() const override { return serverBanner_; }

    //-------------------------------------------------------------------------
    LIBSSH2_SESSION* get() const { return sshSession_; }

    //when libssh2 fails to properly set last error; e.g. https://github.com/libssh2/libssh2/pull/123
    template <class Num>
    Num checkRc(Num rc) //noexcept
    {
        if (rc < 0 && ::libssh2_session_last_errno(sshSession_) != rc)
            ::libssh2_session_set_last_error(sshSession_, static_cast<int>(rc), nullptr);
        return rc;
    }

    //clean-up outside of a RetryingInvoker: may block until the session time-out
    void runBlocking(const char* functionName, LIBSSH2_SFTP* sftpChannel /*optional*/, const std::function<int()>& cmd) //throw SysError
    {
        ::libssh2_session_set_blocking(sshSession_, 1);
        SSHB_ON_SCOPE_EXIT(::libssh2_session_set_blocking(sshSession_, 0));

        if (checkRc(cmd()) < 0)
            throw SysError(formatLastSshError(functionName, sftpChannel));
    }

    std::string formatLastSshError(const char* functionName, LIBSSH2_SFTP* sftpChannel /*optional*/) const
    {
        char* lastErrorMsg = nullptr; //owned by "sshSession"
        const int sshStatusCode = ::libssh2_session_last_error(sshSession_, &lastErrorMsg, nullptr, false /*want_buf*/);

        std::string errorMsg;
        if (lastErrorMsg)
            errorMsg = trimCpy(lastErrorMsg);

        //LIBSSH2_ERROR_SFTP_PROTOCOL does *not* mean libssh2_sftp_last_error() is also available!
        //But if it's not, we have a broken connection, and lastErrorMsg contains meaningful details!
        if (sshStatusCode == LIBSSH2_ERROR_SFTP_PROTOCOL && sftpChannel && ::libssh2_sftp_last_error(sftpChannel) != LIBSSH2_FX_OK)
        {
            if (errorMsg == "SFTP Protocol Error") //that's trite!
                errorMsg.clear();
            return formatSystemError(functionName, formatSftpStatusCode(::libssh2_sftp_last_error(sftpChannel)), errorMsg);
        }

        return formatSystemError(functionName, formatLibssh2Status(sshStatusCode), errorMsg);
    }

private:
    SshSession           (const SshSession&) = delete;
    SshSession& operator=(const SshSession&) = delete;

    void authenticate() //throw SysError
    {
        const char* authList = ::libssh2_userauth_list(sshSession_, cfg_.username.c_str(), strLen(cfg_.username));
        if (!authList)
        {
            if (::libssh2_userauth_authenticated(sshSession_) != 1)
                throw SysError(formatLastSshError("libssh2_userauth_list", nullptr));
            return; //SSH_USERAUTH_NONE has authenticated successfully => we're already done
        }

        bool supportAuthPassword    = false;
        bool supportAuthKeyfile     = false;
        bool supportAuthInteractive = false;
        split(authList, ',', [&](std::string_view authMethod)
        {
            const std::string method = trimCpy(authMethod);
            if (method == "password")
                supportAuthPassword = true;
            else if (method == "publickey")
                supportAuthKeyfile = true;
            else if (method == "keyboard-interactive")
                supportAuthInteractive = true;
        });

        const auto authNotSupported = [&](const char* authName)
        {
            return SysError(replaceCpy(_("The server does not support authentication via %x."), "%x", authName) +
                            '\n' + _("Required:") + ' ' + authList);
        };

        switch (cfg_.authType)
        {
            case SshAuthType::password:
                if (supportAuthPassword)
                {
                    if (::libssh2_userauth_password_ex(sshSession_, cfg_.username.c_str(), strLen(cfg_.username),
                                                      cfg_.password.c_str(), strLen(cfg_.password), nullptr /*passwd_change_cb*/) != 0)
                        throw SysError(formatLastSshError("libssh2_userauth_password", nullptr));
                }
                else if (supportAuthInteractive) //some servers, e.g. web.sourceforge.net, support "keyboard-interactive", but not "password"
                    authenticateInteractive(true /*passwordOnly*/); //throw SysError
                else
                    throw authNotSupported("\"username/password\"");
                break;

            case SshAuthType::keyboardInteractive:
                if (!supportAuthInteractive)
                    throw authNotSupported("\"keyboard-interactive\"");
                authenticateInteractive(false /*passwordOnly*/); //throw SysError
                break;

            case SshAuthType::keyFile:
                if (!supportAuthKeyfile)
                    throw authNotSupported("\"key file\"");
                authenticateKeyFile(); //throw SysError
                break;

            case SshAuthType::agent:
                authenticateAgent(); //throw SysError
                break;
        }
    }

    void authenticateInteractive(bool passwordOnly) //throw SysError
    {
        std::string unexpectedPrompts;

        kbdResponder_ = [&](int numPrompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)
        {
            for (int i = 0; i < numPrompts; ++i)
            {
                const std::string prompt(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
                const bool echo = prompts[i].echo != 0;

                //FileZilla assumes a password request for a single prompt without echo: the prompt text may be localized!
                //test case: sourceforge.net sends a single "Password: " prompt with "!echo"
                std::string answer;
                if (numPrompts == 1 && !echo && (passwordOnly || !cfg_.password.empty()))
                    answer = cfg_.password;
                else if (passwordOnly)
                {
                    unexpectedPrompts += (unexpectedPrompts.empty() ? "" : "|") + prompt;
                    continue;
                }
                else
                    answer = delegate_.onKeyboardInteractive(prompt, echo); //throw X

                responses[i].text = ::strdup(answer.c_str()); //pass ownership; will be ::free()d
                responses[i].length = static_cast<unsigned int>(answer.size());
            }
        };
        SSHB_ON_SCOPE_EXIT(kbdResponder_ = nullptr; kbdError_ = nullptr);

        const int rc = ::libssh2_userauth_keyboard_interactive_ex(sshSession_, cfg_.username.c_str(), strLen(cfg_.username), &onKeyboardInteractive);

        if (kbdError_)
            std::rethrow_exception(kbdError_);

        if (rc != 0)
            throw SysError(formatLastSshError("libssh2_userauth_keyboard_interactive", nullptr) +
                           (unexpectedPrompts.empty() ? "" : "\nUnexpected prompts: " + unexpectedPrompts));
    }

    void authenticateKeyFile() //throw SysError
    {
        std::string pkStream;
        try
        {
            pkStream = trimCpy(getFileContent(cfg_.privateKeyFilePath)); //throw FileError
        }
        catch (const FileError& e) { throw SysError(replaceCpy(e.toString(), "\n\n", "\n")); } //errors should be further enriched by context info => SysError

        if (::libssh2_userauth_publickey_frommemory(sshSession_, cfg_.username.c_str(), cfg_.username.size(),
                                                  nullptr, 0 /*derive public key*/,
                                                  pkStream.c_str(), pkStream.size(), cfg_.password.c_str() /*passphrase*/) != 0)
        {
            //"Unable to extract public key from private key" isn't exactly *helpful* => detect invalid key files
            const char* invalidKeyFormat = [&]() -> const char*
            {
                //"-----BEGIN PUBLIC KEY-----"      OpenSSH SSH-2 public key (X.509 SubjectPublicKeyInfo) = PKIX
                //"-----BEGIN RSA PUBLIC KEY-----"  OpenSSH SSH-2 public key (PKCS#1 RSAPublicKey)
                //"---- BEGIN SSH2 PUBLIC KEY ----" SSH-2 public key (RFC 4716 format)
                const std::string_view firstLine(pkStream.data(), std::min(pkStream.find('\n'), pkStream.size()));
                if (contains(firstLine, "PUBLIC KEY"))
                    return "OpenSSH public key";

                if (startsWith(pkStream, "rsa-") || //rsa-sha2-256, rsa-sha2-512
                    startsWith(pkStream, "ssh-") || //ssh-rsa, ssh-dss, ssh-ed25519, ssh-ed448
                    startsWith(pkStream, "ecdsa-")) //ecdsa-sha2-nistp256, ecdsa-sha2-nistp384, ecdsa-sha2-nistp521
                    return "OpenSSH public key";

                if (startsWith(pkStream, "PuTTY-User-Key-File-"))
                    return "PuTTY private key";

                return nullptr; //other: maybe invalid, maybe not
            }();
            if (invalidKeyFormat)
                throw SysError(_("Authentication failed.") + ' ' +
                               replaceCpy("%x is not an OpenSSH private key file.", "%x",
                                          fmtPath(cfg_.privateKeyFilePath) + " [" + invalidKeyFormat + ']'));

            throw SysError(formatLastSshError("libssh2_userauth_publickey_frommemory", nullptr));
        }
    }

    void authenticateAgent() //throw SysError
    {
        LIBSSH2_AGENT* sshAgent = ::libssh2_agent_init(sshSession_);
        if (!sshAgent)
            throw SysError(formatLastSshError("libssh2_agent_init", nullptr));
        SSHB_ON_SCOPE_EXIT(::libssh2_agent_free(sshAgent));

        if (::libssh2_agent_connect(sshAgent) != 0)
            throw SysError(formatLastSshError("libssh2_agent_connect", nullptr));
        SSHB_ON_SCOPE_EXIT(::libssh2_agent_disconnect(sshAgent));

        if (::libssh2_agent_list_identities(sshAgent) != 0)
            throw SysError(formatLastSshError("libssh2_agent_list_identities", nullptr));

        for (libssh2_agent_publickey* prev = nullptr;;)
        {
            libssh2_agent_publickey* identity = nullptr;
            const int rc = ::libssh2_agent_get_identity(sshAgent, &identity, prev);
            if (rc == 0) //public key returned
                ;
            else if (rc == 1) //no more public keys
                throw SysError("SSH agent contains no matching public key.");
            else
                throw SysError(formatLastSshError("libssh2_agent_get_identity", nullptr));

            if (::libssh2_agent_userauth(sshAgent, cfg_.username.c_str(), identity) == 0)
                return; //authentication successful

            //else: failed => try next public key
            prev = identity;
        }
    }

    void cleanup() //attention: may block heavily after error!
    {
        if (sshSession_)
        {
            ::libssh2_session_set_blocking(sshSession_, 1);

            if (!possiblyCorrupted_)
            {
                if (::libssh2_session_disconnect(sshSession_, "SshBridge says \"bye\"!") != LIBSSH2_ERROR_NONE) //= server notification only! no local cleanup apparently
                    logExtraError(formatLastSshError("libssh2_session_disconnect", nullptr));
            }
            //else: avoid further stress on the broken SSH session and take French leave

            if (const int rc = ::libssh2_session_free(sshSession_);
                rc != LIBSSH2_ERROR_NONE)
                logExtraError(formatSystemError("libssh2_session_free", formatLibssh2Status(rc), ""));
            sshSession_ = nullptr;
        }

        if (connected_ && !disconnectNotified_)
        {
            disconnectNotified_ = true;
            delegate_.onDisconnect(possiblyCorrupted_ ? "Connection abandoned." : "Disconnected by client.");
        }
    }

    //------------------------ libssh2 callbacks: must not throw ------------------------
    static SshSession& getSelf(void** abstract) { return *static_cast<SshSession*>(*abstract); }

    static LIBSSH2_SEND_FUNC(onSend)
    {
        const ssize_t rv = ::send(socket, buffer, length, flags | MSG_NOSIGNAL);
        if (rv < 0)
            return -errno; //libssh2 convention: -EAGAIN => would block
        getSelf(abstract).delegate_.onDataSent(static_cast<size_t>(rv));
        return rv;
    }

    static LIBSSH2_RECV_FUNC(onRecv)
    {
        const ssize_t rv = ::recv(socket, buffer, length, flags);
        if (rv < 0)
            return -errno;
        getSelf(abstract).delegate_.onDataReceived(static_cast<size_t>(rv));
        return rv;
    }

    static LIBSSH2_DEBUG_FUNC(onDebug)
    {
        getSelf(abstract).delegate_.onDebug(trimCpy(std::string_view(message, message_len)));
    }

    static LIBSSH2_DISCONNECT_FUNC(onDisconnect)
    {
        SshSession& self = getSelf(abstract);
        self.possiblyCorrupted_ = true;
        self.disconnectNotified_ = true;
        self.delegate_.onDisconnect(trimCpy(std::string_view(message, message_len)) + " [reason " + numberTo<std::string>(reason) + ']');
    }

    static void onTrace(LIBSSH2_SESSION* session, void* context, const char* data, size_t length)
    {
        static_cast<SshSession*>(context)->delegate_.onTrace(trimCpy(std::string_view(data, length)));
    }

    static LIBSSH2_USERAUTH_KBDINT_RESPONSE_FUNC(onKeyboardInteractive)
    {
        SshSession& self = getSelf(abstract);
        try
        {
            if (self.kbdResponder_)
                self.kbdResponder_(num_prompts, prompts, responses); //name, instruction are nullptr for sourceforge.net
        }
        catch (...) { self.kbdError_ = std::current_exception(); } //rethrown after libssh2 returns: don't unwind through C code
    }

    const SessionConfig cfg_;
    SessionDelegate& delegate_;
    const std::shared_ptr<Libssh2Initializer> libssh2Init_; //keep libssh2 alive while the session exists

    std::optional<Socket> socket_; //*bound* after constructor has run
    LIBSSH2_SESSION* sshSession_ = nullptr;
    std::string serverBanner_;

    bool connected_ = false;
    bool possiblyCorrupted_ = false;
    bool disconnectNotified_ = false;

    std::function<void(int numPrompts, const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts, LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses)> kbdResponder_;
    std::exception_ptr kbdError_;
};

//===========================================================================================================================

class Libssh2SftpHandle : public SftpHandle
{
public:
    Libssh2SftpHandle(SshSession& session, LIBSSH2_SFTP* sftpChannel, LIBSSH2_SFTP_HANDLE* handle) :
        session_(session), sftpChannel_(sftpChannel), handle_(handle) {}

    ~Libssh2SftpHandle() override
    {
        if (!closed_)
            try
            {
                session_.runBlocking("libssh2_sftp_close_handle", sftpChannel_, [&] { return ::libssh2_sftp_close_handle(handle_); }); //throw SysError
            }
            catch (const SysError& e) { logExtraError(e.toString()); }
    }

    ssize_t tryRead(char* buffer, size_t bufferSize) override
    {
        //libssh2_sftp_read has same semantics as Posix read: may return short, only 0 means EOF
        return session_.checkRc(::libssh2_sftp_read(handle_, buffer, bufferSize));
    }

    ssize_t tryWrite(const char* buffer, size_t bytesToWrite) override
    {
        /*  libssh2_sftp_write() waits for at least one "ack" unless given so much data that
            _libssh2_channel_write() can't send it all => keep SessionConfig::writeBlockSize large */
        return session_.checkRc(::libssh2_sftp_write(handle_, buffer, bytesToWrite));
    }

    int tryReadDir(std::string& itemName, std::string& longEntry, FileAttributes& attr) override
    {
        std::array<char, 1024> buf{}; //libssh2 sample code uses 512; in practice NAME_MAX(255)+1 should suffice
        std::array<char, 2048> longBuf{};
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};

        const int rc = session_.checkRc(::libssh2_sftp_readdir_ex(handle_, buf.data(), buf.size(), longBuf.data(), longBuf.size(), &attribs));
        if (rc > 0)
        {
            itemName.assign(buf.data(), std::min(static_cast<size_t>(rc), buf.size()));
            longEntry.assign(longBuf.data(), ::strnlen(longBuf.data(), longBuf.size()));
            attr = convertAttributes(attribs);
        }
        return rc;
    }

    int tryClose() override
    {
        const int rc = session_.checkRc(::libssh2_sftp_close_handle(handle_));
        if (rc != LIBSSH2_ERROR_EAGAIN)
            closed_ = true; //libssh2 releases the handle even on error
        return rc;
    }

private:
    Libssh2SftpHandle           (const Libssh2SftpHandle&) = delete;
    Libssh2SftpHandle& operator=(const Libssh2SftpHandle&) = delete;

    SshSession& session_;
    LIBSSH2_SFTP* const sftpChannel_;
    LIBSSH2_SFTP_HANDLE* const handle_;
    bool closed_ = false;
};


class Libssh2SftpChannel : public SftpChannel
{
public:
    Libssh2SftpChannel(SshSession& session, LIBSSH2_SFTP* sftpChannel) : session_(session), sftpChannel_(sftpChannel) {}

    ~Libssh2SftpChannel() override
    {
        if (!shutDown_)
            try
            {
                session_.runBlocking("libssh2_sftp_shutdown", nullptr, [&] { return ::libssh2_sftp_shutdown(sftpChannel_); }); //throw SysError
            }
            catch (const SysError& e) { logExtraError(e.toString()); }
    }

    int tryOpenFile(const std::string& filePath, SftpOpenMode mode, long permissions, std::unique_ptr<SftpHandle>& handle) override
    {
        const unsigned long flags = mode == SftpOpenMode::read ?
                                    LIBSSH2_FXF_READ :
                                    LIBSSH2_FXF_WRITE | LIBSSH2_FXF_CREAT | LIBSSH2_FXF_TRUNC;

        LIBSSH2_SFTP_HANDLE* fileHandle = ::libssh2_sftp_open_ex(sftpChannel_, filePath.c_str(), strLen(filePath), flags, permissions, LIBSSH2_SFTP_OPENFILE);
        if (!fileHandle)
            return openFailed();

        handle = std::make_unique<Libssh2SftpHandle>(session_, sftpChannel_, fileHandle);
        return LIBSSH2_ERROR_NONE;
    }

    int tryOpenDir(const std::string& folderPath, std::unique_ptr<SftpHandle>& handle) override
    {
        LIBSSH2_SFTP_HANDLE* dirHandle = ::libssh2_sftp_open_ex(sftpChannel_, folderPath.c_str(), strLen(folderPath), 0, 0, LIBSSH2_SFTP_OPENDIR);
        if (!dirHandle)
            return openFailed();

        handle = std::make_unique<Libssh2SftpHandle>(session_, sftpChannel_, dirHandle);
        return LIBSSH2_ERROR_NONE;
    }

    int tryStat(const std::string& itemPath, SftpStatMode mode, FileAttributes& attr) override
    {
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};
        const int rc = session_.checkRc(::libssh2_sftp_stat_ex(sftpChannel_, itemPath.c_str(), strLen(itemPath),
                                                               mode == SftpStatMode::followLink ? LIBSSH2_SFTP_STAT : LIBSSH2_SFTP_LSTAT, &attribs));
        if (rc == LIBSSH2_ERROR_NONE)
            attr = convertAttributes(attribs);
        return rc;
    }

    int trySetStat(const std::string& itemPath, const FileAttributes& attr) override
    {
        LIBSSH2_SFTP_ATTRIBUTES attribs = {};
        if (!convertAttributes(attr, attribs))
        {
            ::libssh2_session_set_last_error(session_.get(), LIBSSH2_ERROR_INVAL, "Owner and group (or access and modification time) must be set together.");
            return LIBSSH2_ERROR_INVAL;
        }
        return session_.checkRc(::libssh2_sftp_stat_ex(sftpChannel_, itemPath.c_str(), strLen(itemPath), LIBSSH2_SFTP_SETSTAT, &attribs));
    }

    int tryStatVfs(const std::string& itemPath, FsStats& stats) override
    {
        LIBSSH2_SFTP_STATVFS st = {};
        const int rc = session_.checkRc(::libssh2_sftp_statvfs(sftpChannel_, itemPath.c_str(), itemPath.size(), &st));
        if (rc == LIBSSH2_ERROR_NONE)
            stats =
            {
                .blockSize       = st.f_bsize,
                .fragmentSize    = st.f_frsize,
                .blocks          = st.f_blocks,
                .blocksFree      = st.f_bfree,
                .blocksAvailable = st.f_bavail,
                .inodes          = st.f_files,
                .inodesFree      = st.f_ffree,
                .inodesAvailable = st.f_favail,
                .fileSystemId    = st.f_fsid,
                .mountFlags      = st.f_flag,
                .maxNameLength   = st.f_namemax,
            };
        return rc;
    }

    int tryQueryLink(const std::string& itemPath, SftpLinkQuery query, std::string& targetPath) override
    {
        std::string buf(10000, '\0');
        const int rc = session_.checkRc(::libssh2_sftp_symlink_ex(sftpChannel_, itemPath.c_str(), strLen(itemPath), buf.data(), strLen(buf),
                                                                  query == SftpLinkQuery::readLink ? LIBSSH2_SFTP_READLINK : LIBSSH2_SFTP_REALPATH));
        if (rc >= 0)
            targetPath.assign(buf.data(), std::min(static_cast<size_t>(rc), buf.size()));
        return rc;
    }

    int trySymlink(const std::string& targetPath, const std::string& linkPath) override
    {
        //libssh2 passes "path" as the link target and "target" as the new link: no const in the signature
        return session_.checkRc(::libssh2_sftp_symlink_ex(sftpChannel_, targetPath.c_str(), strLen(targetPath),
                                                          const_cast<char*>(linkPath.c_str()), strLen(linkPath), LIBSSH2_SFTP_SYMLINK));
    }

    int tryMkdir(const std::string& folderPath, long permissions) override
    {
        return session_.checkRc(::libssh2_sftp_mkdir_ex(sftpChannel_, folderPath.c_str(), strLen(folderPath), permissions));
    }

    int tryRmdir (const std::string& folderPath) override { return session_.checkRc(::libssh2_sftp_rmdir_ex (sftpChannel_, folderPath.c_str(), strLen(folderPath))); }
    int tryUnlink(const std::string& filePath)   override { return session_.checkRc(::libssh2_sftp_unlink_ex(sftpChannel_, filePath.c_str(), strLen(filePath))); }

    int tryRename(const std::string& pathFrom, const std::string& pathTo) override
    {
        //no fallback if the server rejects one of the flags
        return session_.checkRc(::libssh2_sftp_rename_ex(sftpChannel_, pathFrom.c_str(), strLen(pathFrom), pathTo.c_str(), strLen(pathTo),
                                                         LIBSSH2_SFTP_RENAME_OVERWRITE | LIBSSH2_SFTP_RENAME_ATOMIC | LIBSSH2_SFTP_RENAME_NATIVE));
    }

    int tryShutdown() override
    {
        if (shutDown_)
            return LIBSSH2_ERROR_NONE;

        const int rc = session_.checkRc(::libssh2_sftp_shutdown(sftpChannel_));
        if (rc != LIBSSH2_ERROR_EAGAIN)
            shutDown_ = true; //channel memory is released even on error
        return rc;
    }

    unsigned long getLastSftpStatus() const override
    {
        return shutDown_ ? LIBSSH2_FX_OK : ::libssh2_sftp_last_error(sftpChannel_);
    }

    std::string formatLastError(const char* functionName) const override
    {
        return session_.formatLastSshError(functionName, shutDown_ ? nullptr : sftpChannel_);
    }

private:
    Libssh2SftpChannel           (const Libssh2SftpChannel&) = delete;
    Libssh2SftpChannel& operator=(const Libssh2SftpChannel&) = delete;

    int openFailed()
    {
        //just in case libssh2 failed to properly set last error; e.g. https://github.com/libssh2/libssh2/pull/123
        return session_.checkRc(std::min(::libssh2_session_last_errno(session_.get()), LIBSSH2_ERROR_SOCKET_NONE));
    }

    SshSession& session_;
    LIBSSH2_SFTP* const sftpChannel_;
    bool shutDown_ = false;
};


int SshSession::tryOpenSftp(std::unique_ptr<SftpChannel>& channel)
{
    LIBSSH2_SFTP* sftpChannelNew = ::libssh2_sftp_init(sshSession_);
    if (!sftpChannelNew)
        return checkRc(std::min(::libssh2_session_last_errno(sshSession_), LIBSSH2_ERROR_SOCKET_NONE));

    channel = std::make_unique<Libssh2SftpChannel>(*this, sftpChannelNew);
    return LIBSSH2_ERROR_NONE;
}
}


std::unique_ptr<SshTransport> sshb::createLibssh2Transport(const SessionConfig& cfg, SessionDelegate& delegate) //throw SysError
{
    return std::make_unique<SshSession>(cfg, delegate); //throw SysError
}
