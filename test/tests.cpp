// *****************************************************************************
// * This file is part of the SshBridge project. It is distributed under       *
// * GNU General Public License: https://www.gnu.org/licenses/gpl-3.0          *
// * Copyright (C) Zenju (zenju AT freefilesync DOT org) - All Rights Reserved *
// *****************************************************************************

#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <iostream>
#include <sshb/extra_log.h>
#include <sshb/open_ssl.h>

using namespace sshb;


int main(int argc, char* argv[])
{
    using namespace Catch::clara;

    Catch::Session session;
    bool showExtraLog = false;

    auto cli = session.cli()
               | Opt(showExtraLog)
               ["--show-extra-log"]
               ("Print errors logged during cleanup");

    session.cli(cli);

    if (const int rc = session.applyCommandLine(argc, argv);
        rc != 0)
        return rc;

    openSslInit();

    const int rc = session.run();

    if (showExtraLog)
        std::cerr << formatErrorLog(fetchExtraLog());
    return rc;
}
