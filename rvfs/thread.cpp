// *****************************************************************************
// * This file is part of the rvfs project. It is distributed under            *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) The rvfs authors - All Rights Reserved                      *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace rvfs;


void rvfs::setCurrentThreadName(const std::string& threadName)
{
    //Linux truncates to 15 chars + null terminator
    ::prctl(PR_SET_NAME, threadName.substr(0, 15).c_str(), 0, 0, 0);
}

