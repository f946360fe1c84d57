// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_7302218649170553
#define EXTRA_LOG_H_7302218649170553

#include <functional>
#include "error_log.h"
#include "ring_buffer.h"
#include "thread.h"

/*  process-wide log for errors that have nowhere else to go:
    - clean-up failures in destructors (closing SFTP handles, unlinking partial uploads)
    - failures while an exception is already in flight

    A bridge may run for days with a broken server: only the newest entries are kept.  */

namespace sshb
{
namespace impl
{
constexpr size_t EXTRA_LOG_CAPACITY = 1000;


class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (reportOutstandingLog_)
            if (const ErrorLog log = fetchLog();
                !log.empty())
                reportOutstandingLog_(log);
    }

    void setReporter(const std::function<void(const ErrorLog& log)>& reportOutstandingLog) { reportOutstandingLog_ = reportOutstandingLog; }

    void add(LogEntry&& entry) //nothrow!
    {
        if (entries_.size() >= EXTRA_LOG_CAPACITY)
        {
            entries_.pop_front();
            ++dropped_;
        }
        entries_.push_back(std::move(entry));
    }

    ErrorLog fetchLog()
    {
        ErrorLog log;
        if (dropped_ > 0)
            logMsg(log, replaceCpy(_("%x older errors were discarded."), "%x", numberTo<std::string>(dropped_)), MSG_TYPE_WARNING);

        for (; !entries_.empty(); entries_.pop_front())
            log.push_back(std::move(entries_.front()));

        dropped_ = 0;
        return log;
    }

private:
    RingBuffer<LogEntry> entries_;
    size_t dropped_ = 0;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};

inline constinit Global<Protected<ExtraLog>> globalExtraLog;

template <class Function>
void accessExtraLog(Function fun)
{
    globalExtraLog.setOnce([] { return std::make_unique<Protected<ExtraLog>>(); });

    if (auto protExtraLog = globalExtraLog.get())
        protExtraLog->access([&](ExtraLog& log) { fun(log); });
    //else: access during global shutdown: nothing left to report to
}
}

//reporter runs during global shutdown if entries were never fetched: must not throw
inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.setReporter(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraError(const std::string& msg) //nothrow!
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.add({std::time(nullptr), MSG_TYPE_ERROR, "", msg}); });
}
}

#endif //EXTRA_LOG_H_7302218649170553
