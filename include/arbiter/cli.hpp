#pragma once

namespace arbiter::cli
{

    /**
     * Command-line entry point: serve, config-print, ledger-verify,
     * ledger-export, status. Returns the process exit code.
     */
    int run(int argc, char *argv[]);

} // namespace arbiter::cli
