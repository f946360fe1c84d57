// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_1958203476610294
#define ERROR_LOG_H_1958203476610294

#include <cassert>
#include <ctime>
#include <vector>
#include "i18n.h"


namespace sshb
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MSG_TYPE_ERROR;
    std::string origin; //"user@server:port"; empty for process-wide messages
    std::string message;
};

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::string& msg, MessageType type, const std::string& origin = {});

/*  [12:34:56]  Error [user@server:22]:  Cannot read file "/x".
                                         SSH_FX_NO_SUCH_FILE        */
std::string formatMessage(const LogEntry& entry);
std::string formatErrorLog(const ErrorLog& log); //one formatted message per entry, separated by blank lines

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::string& msg, MessageType type, const std::string& origin)
{
    log.push_back({std::time(nullptr), type, origin, msg});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_INFO:    ++count.info;    break;
            case MSG_TYPE_WARNING: ++count.warning; break;
            case MSG_TYPE_ERROR:   ++count.error;   break;
        }
    return count;
}


namespace impl
{
inline
const char* getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:    return "Info";
        case MSG_TYPE_WARNING: return "Warning";
        case MSG_TYPE_ERROR:   return "Error";
    }
    assert(false);
    return "";
}
}


inline
std::string formatMessage(const LogEntry& entry)
{
    std::tm localTime = {};
    ::localtime_r(&entry.time, &localTime);

    char timeTag[16] = {};
    std::strftime(timeTag, sizeof(timeTag), "%H:%M:%S", &localTime);

    std::string header = std::string("[") + timeTag + "]  " + _(impl::getMessageTypeLabel(entry.type));
    if (!entry.origin.empty())
        header += " [" + entry.origin + ']';
    header += ":  ";

    //continuation lines line up with the first one; labels and origin are ASCII
    const std::string indent(header.size(), ' ');

    std::string output = header;
    bool lineStart = false;
    for (const char c : trimCpy(entry.message))
        if (c == '\n')
        {
            if (!lineStart) //collapse empty lines
                output += '\n';
            lineStart = true;
        }
        else
        {
            if (lineStart)
                output += indent;
            lineStart = false;
            output += c;
        }
    return output;
}


inline
std::string formatErrorLog(const ErrorLog& log)
{
    std::string output;
    for (const LogEntry& entry : log)
        output += formatMessage(entry) + "\n\n";
    return output;
}
}

#endif //ERROR_LOG_H_1958203476610294
