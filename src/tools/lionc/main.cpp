//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Main entry point for the lionc command-line tool (LionCode compiler).
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `lionc` CLI tool.
/// @details Parses the command line, then delegates to runLionc() which
///          compiles one `.lion` file to JavaScript.

#include "tools/lionc/cli.hpp"

#include <iostream>

#ifndef LIONCODE_VERSION_STR
#define LIONCODE_VERSION_STR "0.1.0"
#endif

int main(int argc, char **argv)
{
    using namespace lion::tools::lionc;

    auto config = parseArgs(argc - 1, argv + 1);
    if (!config)
    {
        lion::support::printDiag(config.error(), std::cerr);
        printUsage(std::cerr);
        return 1;
    }

    if (config.value().showHelp)
    {
        printUsage(std::cout);
        return 0;
    }
    if (config.value().showVersion)
    {
        std::cout << "lionc v" << LIONCODE_VERSION_STR << "\n";
        return 0;
    }

    return runLionc(config.value(), std::cout, std::cerr);
}
