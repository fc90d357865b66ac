// *****************************************************************************
// * This file is part of the Ferry project. It is distributed under           *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// *****************************************************************************

#ifndef ERROR_LOG_H_4471920365187203
#define ERROR_LOG_H_4471920365187203

#include <ctime>
#include <vector>
#include "i18n.h"
#include "utf.h"
#include "zstring.h"


namespace ferry
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
    std::string message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));

struct ErrorLogStats
{
    int info    = 0;
    int warning = 0;
    int error   = 0;
};
ErrorLogStats getStats(const ErrorLog& log);

//typeFilter: combination of MessageType flags
ErrorLog filterLog(const ErrorLog& log, int typeFilter);

//"[HH:MM:SS]  Error:  first line"; continuation lines are aligned below the first; empty lines are skipped
std::string formatMessage(const LogEntry& entry);
std::string formatLog(const ErrorLog& log);






//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}


inline
ErrorLogStats getStats(const ErrorLog& log)
{
    ErrorLogStats count;
    for (const LogEntry& entry : log)
        switch (entry.type)
        {
            //*INDENT-OFF*
            case MSG_TYPE_INFO:    ++count.info;    break;
            case MSG_TYPE_WARNING: ++count.warning; break;
            case MSG_TYPE_ERROR:   ++count.error;   break;
            //*INDENT-ON*
        }
    return count;
}


inline
ErrorLog filterLog(const ErrorLog& log, int typeFilter)
{
    ErrorLog output;
    for (const LogEntry& entry : log)
        if (entry.type & typeFilter)
            output.push_back(entry);
    return output;
}


namespace impl
{
inline
std::wstring getMessageTypeLabel(MessageType type)
{
    switch (type)
    {
        //*INDENT-OFF*
        case MSG_TYPE_INFO:    return _("Info");
        case MSG_TYPE_WARNING: return _("Warning");
        case MSG_TYPE_ERROR:   return _("Error");
        //*INDENT-ON*
    }
    return L"??";
}


inline
std::string formatTimeTag(time_t time)
{
    struct tm localTime = {};
    char buffer[32] = {};
    if (!::localtime_r(&time, &localTime) ||
        std::strftime(buffer, sizeof(buffer), "%H:%M:%S", &localTime) == 0)
        return "??:??:??";
    return buffer;
}
}


inline
std::string formatMessage(const LogEntry& entry)
{
    const std::string prefix = '[' + impl::formatTimeTag(entry.time) + "]  " + utfTo<std::string>(impl::getMessageTypeLabel(entry.type)) + ":  ";
    const std::string indent(utfTo<std::wstring>(prefix).size(), ' '); //count code points, not bytes

    std::string output = prefix;
    bool firstLine = true;
    split(trimCpy(entry.message), '\n', [&](std::string_view line)
    {
        if (line.empty())
            return;
        if (!firstLine)
            output += '\n' + indent;
        output += line;
        firstLine = false;
    });
    return output + '\n';
}


inline
std::string formatLog(const ErrorLog& log)
{
    std::string output;
    for (const LogEntry& entry : log)
        output += formatMessage(entry);
    return output;
}
}

#endif //ERROR_LOG_H_4471920365187203
