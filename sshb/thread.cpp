// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#include "thread.h"
#include <sys/prctl.h>

using namespace sshb;


void sshb::setCurrentThreadName(const std::string& threadName)
{
    //Linux truncates names longer than 15 characters
    ::prctl(PR_SET_NAME, threadName.substr(0, 15).c_str(), 0, 0, 0);
}
