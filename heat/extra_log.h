// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef EXTRA_LOG_H_8813402967512093846
#define EXTRA_LOG_H_8813402967512093846

#include <functional>
#include <mutex>
#include "error_log.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - nothrow GUI functions: paint and size handlers
    - cleanup errors                                */

namespace heat
{
namespace impl
{
class ExtraLog
{
public:
    ~ExtraLog()
    {
        if (!log_.empty() && reportOutstandingLog_)
            reportOutstandingLog_(log_);
    }

    void init(const std::function<void(const ErrorLog& log)>& reportOutstandingLog)
    {
        std::lock_guard dummy(lockLog_);
        assert(!reportOutstandingLog_);
        reportOutstandingLog_ = reportOutstandingLog;
    }

    ErrorLog fetchLog()
    {
        std::lock_guard dummy(lockLog_);
        return std::exchange(log_, ErrorLog());
    }

    void logError(const std::wstring& msg) //nothrow!
    {
        std::lock_guard dummy(lockLog_);
        logMsg(log_, msg, MessageType::MSG_TYPE_ERROR);
    }

private:
    std::mutex lockLog_;
    ErrorLog log_;
    std::function<void(const ErrorLog& log)> reportOutstandingLog_;
};

inline constinit Global<ExtraLog> globalExtraLog;

template <class Function>
void accessExtraLog(Function fun)
{
    globalExtraLog.setOnce([] { return std::make_unique<ExtraLog>(); });

    if (std::shared_ptr<ExtraLog> extraLog = globalExtraLog.get())
        fun(*extraLog);
    else
        assert(false); //access after global shutdown!?
}
}

inline
void initExtraLog(const std::function<void(const ErrorLog& log)>& reportOutstandingLog /*nothrow! runs during global shutdown!*/)
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.init(reportOutstandingLog); });
}


inline
ErrorLog fetchExtraLog()
{
    ErrorLog output;
    impl::accessExtraLog([&](impl::ExtraLog& el) { output = el.fetchLog(); });
    return output;
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::accessExtraLog([&](impl::ExtraLog& el) { el.logError(msg); });
}
}

#endif //EXTRA_LOG_H_8813402967512093846
