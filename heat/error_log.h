// *****************************************************************************
// * This file is part of the HeatGrid project. It is distributed under        *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#ifndef ERROR_LOG_H_4409182736450912837
#define ERROR_LOG_H_4409182736450912837

#include <cassert>
#include <ctime>
#include <cwchar>
#include <string>
#include <vector>
#include "i18n.h"


namespace heat
{
enum MessageType
{
    MSG_TYPE_INFO    = 0x1,
    MSG_TYPE_WARNING = 0x2,
    MSG_TYPE_ERROR   = 0x4,
};

struct LogEntry
{
    time_t       time = 0;
    MessageType  type = MSG_TYPE_ERROR;
    std::wstring message;
};

std::wstring formatMessage(const LogEntry& entry);

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, msg});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            case MSG_TYPE_INFO:
                ++count.info;
                break;
            case MSG_TYPE_WARNING:
                ++count.warning;
                break;
            case MSG_TYPE_ERROR:
                ++count.error;
                break;
        }
    assert(std::ssize(log) == count.info + count.warning + count.error);
    return count;
}


inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        case MSG_TYPE_INFO:
            return _("Info");
        case MSG_TYPE_WARNING:
            return _("Warning");
        case MSG_TYPE_ERROR:
            return _("Error");
    }
    assert(false);
    return std::wstring();
}


inline
std::wstring formatTimeTag(time_t time) //HH:MM:SS in local time
{
    std::tm tmLocal = {};
    if (!::localtime_r(&time, &tmLocal))
        return L"??:??:??";

    wchar_t buf[32] = {};
    if (std::wcsftime(buf, std::size(buf), L"%H:%M:%S", &tmLocal) == 0)
        return L"??:??:??";
    return buf;
}


inline
std::wstring formatMessage(const LogEntry& entry)
{
    std::wstring msgFmt = L'[' + formatTimeTag(entry.time) + L"]  " + getMessageTypeLabel(entry.type) + L":  ";
    const size_t prefixLen = msgFmt.size();

    const std::wstring& msg = entry.message;
    size_t first = msg.find_first_not_of(L" \t\n");
    size_t last  = msg.find_last_not_of (L" \t\n");
    if (first == std::wstring::npos)
        first = last = 0;
    else
        ++last;

    for (auto it = msg.begin() + first; it != msg.begin() + last; )
        if (*it == L'\n')
        {
            msgFmt += *it++;
            msgFmt.append(prefixLen, L' ');
            //skip duplicate newlines
            for (; it != msg.end() && *it == L'\n'; ++it)
                ;
        }
        else
            msgFmt += *it++;

    msgFmt += L'\n';
    return msgFmt;
}
}

#endif //ERROR_LOG_H_4409182736450912837
