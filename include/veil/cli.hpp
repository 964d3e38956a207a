#pragma once

namespace veil::cli
{
    /**
     * Entry point for the veil command-line tool. Returns 0 on success and
     * 1 on a usage, configuration or input error.
     */
    int run(int argc, char *argv[]);

} // namespace veil::cli
