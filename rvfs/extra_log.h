// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#ifndef EXTRA_LOG_H_5610293847561029384
#define EXTRA_LOG_H_5610293847561029384

#include <utility>
#include "error_log.h"
#include "thread.h"

/*  log errors in "exceptional situations" when no other means are available, e.g.
    - cleanup errors in destructors
    - while an exception is in flight                        */

namespace rvfs
{
namespace impl
{
class ExtraLog
{
public:
    ErrorLog fetchLog() { return std::exchange(log_, ErrorLog()); }

    void logError(const std::wstring& msg) { logMsg(log_, msg, MessageType::error); }

private:
    ErrorLog log_;
};


inline Protected<ExtraLog>& getGlobalExtraLog()
{
    static Protected<ExtraLog> globalExtraLog; //thread-safe init, destroyed during global shutdown
    return globalExtraLog;
}
}

inline
ErrorLog fetchExtraLog()
{
    return impl::getGlobalExtraLog().access([](impl::ExtraLog& el) { return el.fetchLog(); });
}


inline
void logExtraError(const std::wstring& msg) //nothrow!
{
    impl::getGlobalExtraLog().access([&](impl::ExtraLog& el) { el.logError(msg); });
}
}

#endif //EXTRA_LOG_H_5610293847561029384
