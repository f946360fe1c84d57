// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "session_config.h"
#include <algorithm>
#include <cstdlib>
#include <sshb/open_ssl.h>

using namespace sshb;


namespace
{
const std::string_view sftpPrefix = "sftp:";


//according to the SFTP path syntax, the username must not contain raw @ and :
//-> we don't need a full urlencode!
std::string encodeUsername(std::string name)
{
    replace(name, "%", "%25"); //first!
    replace(name, "@", "%40");
    replace(name, ":", "%3A");
    return name;
}


std::string decodeUsername(std::string name)
{
    replace(name, "%40", "@");
    replace(name, "%3A", ":");
    replace(name, "%3a", ":");
    replace(name, "%25", "%"); //last!
    return name;
}


bool isIpv6Address(std::string_view server) { return std::count(server.begin(), server.end(), ':') > 1; }


int parsePositiveNumber(std::string_view str, const std::string& errorMsg) //throw FileError
{
    const std::string number = trimCpy(str);

    if (number.empty() || number.size() > 9 || !std::all_of(number.begin(), number.end(), isDigit))
        throw FileError(errorMsg, replaceCpy(_("Invalid number: %x"), "%x", fmtPath(number)));

    const int n = stringTo<int>(number);
    if (n <= 0)
        throw FileError(errorMsg, replaceCpy(_("Invalid number: %x"), "%x", fmtPath(number)));
    return n;
}


std::string resolveFilePath(const std::string& path)
{
    if (startsWith(path, "~/"))
        if (const char* homeDir = ::getenv("HOME"))
            return homeDir + path.substr(1);
    return path;
}
}


std::string sshb::getDisplayName(const SessionConfig& cfg)
{
    std::string server = cfg.server;
    if (isIpv6Address(server))
        server = '[' + server + ']';

    std::string output = server + ':' + numberTo<std::string>(cfg.getPort());
    if (!cfg.username.empty())
        output = cfg.username + '@' + output;
    return output;
}


SessionPhrase sshb::parseSessionPhrase(std::string_view phraseIn) //throw FileError
{
    const std::string errorMsg = _("Invalid SFTP session phrase.");

    const std::string phraseTrm = trimCpy(phraseIn);
    std::string_view phrase = phraseTrm;

    if (!startsWithAsciiNoCase(phrase, sftpPrefix))
        throw FileError(errorMsg, replaceCpy(_("Expected prefix %x."), "%x", fmtPath(std::string(sftpPrefix) + "//")));
    phrase.remove_prefix(sftpPrefix.size());

    while (!phrase.empty() && (phrase.front() == '/' || phrase.front() == '\\'))
        phrase.remove_prefix(1);

    SessionPhrase output;
    SessionConfig& cfg = output.cfg;

    const std::string credentials = beforeFirst(phrase, "@", IfNotFoundReturn::none);
    const std::string fullPathOpt =  afterFirst(phrase, "@", IfNotFoundReturn::all);

    cfg.username = decodeUsername(beforeFirst(credentials, ":", IfNotFoundReturn::all));
    cfg.password =                 afterFirst(credentials, ":", IfNotFoundReturn::none);

    const std::string fullPath = beforeFirst(fullPathOpt, "|", IfNotFoundReturn::all);
    const std::string options  =  afterFirst(fullPathOpt, "|", IfNotFoundReturn::none);

    const size_t pathPos = std::min(fullPath.find('/'), fullPath.size());
    const std::string_view serverPort = std::string_view(fullPath).substr(0, pathPos);

    output.path = fullPath.substr(pathPos);
    if (output.path.empty())
        output.path = "/";

    std::string port;
    if (startsWith(serverPort, "[")) //e.g. [::1]:80
    {
        const size_t posEnd = serverPort.find(']');
        if (posEnd == std::string_view::npos)
            throw FileError(errorMsg, replaceCpy(_("Invalid IPv6 address %x."), "%x", fmtPath(std::string(serverPort))));

        cfg.server = serverPort.substr(1, posEnd - 1);

        const std::string_view trail = serverPort.substr(posEnd + 1);
        if (!trail.empty())
        {
            if (!startsWith(trail, ":"))
                throw FileError(errorMsg, replaceCpy(_("Invalid IPv6 address %x."), "%x", fmtPath(std::string(serverPort))));
            port = trail.substr(1);
        }
    }
    else if (isIpv6Address(serverPort)) //e.g. 2001:db8::ff00:42:8329 without port
        cfg.server = serverPort;
    else
    {
        cfg.server = beforeLast(serverPort, ":", IfNotFoundReturn::all);
        port       =  afterLast(serverPort, ":", IfNotFoundReturn::none);
        if (contains(serverPort, ":") && port.empty())
            throw FileError(errorMsg, _("Port number is missing."));
    }

    if (trimCpy(cfg.server).empty())
        throw FileError(errorMsg, _("Server name must not be empty."));

    if (!port.empty())
        cfg.portCfg = parsePositiveNumber(port, errorMsg); //throw FileError

    for (const std::string& optPhraseRaw : splitCpy(options, '|', SplitOnEmpty::skip))
    {
        const std::string optPhrase = trimCpy(optPhraseRaw);
        const std::string optValue = afterFirst(optPhrase, "=", IfNotFoundReturn::none);

        if (optPhrase.empty())
            continue;
        else if (startsWith(optPhrase, "timeout="))
            cfg.timeoutSec = parsePositiveNumber(optValue, errorMsg); //throw FileError
        else if (startsWith(optPhrase, "keepalive="))
            cfg.keepAliveIntervalSec = parsePositiveNumber(optValue, errorMsg); //throw FileError
        else if (startsWith(optPhrase, "keyfile="))
        {
            cfg.authType = SshAuthType::keyFile;
            cfg.privateKeyFilePath = resolveFilePath(optValue);
        }
        else if (optPhrase == "agent")
            cfg.authType = SshAuthType::agent;
        else if (optPhrase == "kbd")
            cfg.authType = SshAuthType::keyboardInteractive;
        else if (optPhrase == "zlib")
            cfg.allowZlib = true;
        else if (startsWith(optPhrase, "pass64="))
            try
            {
                cfg.password = stringDecodeBase64(optValue); //throw SysError
            }
            catch (const SysError& e) { throw FileError(errorMsg, e.toString()); }
        else
            throw FileError(errorMsg, replaceCpy(_("Unknown option %x."), "%x", fmtPath(optPhrase)));
    }
    return output;
}


std::string sshb::formatSessionPhrase(const SessionConfig& cfg, const std::string& path)
{
    std::string username;
    if (!cfg.username.empty())
        username = encodeUsername(cfg.username) + '@';

    std::string server = cfg.server;
    if (isIpv6Address(server) && cfg.portCfg > 0)
        server = '[' + server + ']'; //e.g. [::1]:80

    std::string port;
    if (cfg.portCfg > 0)
        port = ':' + numberTo<std::string>(cfg.portCfg);

    std::string relPath = path;
    if (relPath == "/")
        relPath.clear();
    else if (!relPath.empty() && !startsWith(relPath, "/"))
        relPath = '/' + relPath;

    const SessionConfig cfgDefault;

    std::string options;
    if (cfg.timeoutSec != cfgDefault.timeoutSec)
        options += "|timeout=" + numberTo<std::string>(cfg.timeoutSec);

    if (cfg.keepAliveIntervalSec != cfgDefault.keepAliveIntervalSec)
        options += "|keepalive=" + numberTo<std::string>(cfg.keepAliveIntervalSec);

    if (cfg.allowZlib)
        options += "|zlib";

    switch (cfg.authType)
    {
        case SshAuthType::password:
            break;
        case SshAuthType::keyboardInteractive:
            options += "|kbd";
            break;
        case SshAuthType::keyFile:
            options += "|keyfile=" + cfg.privateKeyFilePath;
            break;
        case SshAuthType::agent:
            options += "|agent";
            break;
    }

    if (cfg.authType != SshAuthType::agent && !cfg.password.empty()) //password always last => visually truncated by input field
        options += "|pass64=" + stringEncodeBase64(cfg.password);

    return std::string(sftpPrefix) + "//" + username + server + port + relPath + options;
}
