// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef ERROR_LOG_H_1029384756102938475
#define ERROR_LOG_H_1029384756102938475

#include <ctime>
#include <string>
#include <vector>
#include "utf.h"


namespace rvfs
{
enum class MessageType
{
    info,
    warning,
    error,
};

struct LogEntry
{
    time_t      time = 0;
    MessageType type = MessageType::error;
    std::string message; //UTF-8
};

using ErrorLog = std::vector<LogEntry>;

void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time = std::time(nullptr));







//######################## implementation ##########################
inline
void logMsg(ErrorLog& log, const std::wstring& msg, MessageType type, time_t time)
{
    log.push_back({time, type, utfTo<std::string>(msg)});
}
}

#endif //ERROR_LOG_H_1029384756102938475
