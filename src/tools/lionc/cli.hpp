//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tools/lionc/cli.hpp
// Purpose: Command-line parsing and the compile action of `lionc`.
// Key invariants: Exactly one source path per invocation; unknown flags are
//                 reported, never ignored.
// Ownership/Lifetime: LioncConfig is a value type owned by the caller.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lioncode/Options.hpp"
#include "support/diag_expected.hpp"

#include <ostream>
#include <string>

namespace lion::tools::lionc
{

/// @brief Everything `lionc` needs to run one compilation.
struct LioncConfig
{
    std::string sourcePath;
    std::string outputPath; ///< Empty writes the output to stdout.
    lion::frontends::lioncode::CompilerOptions compiler{};
    bool showHelp{false};
    bool showVersion{false};
};

/// @brief Parse @p argv (without the program name).
/// @details Recognised flags: `-o FILE`, `--target NAME` (also
///          `--target=NAME`), `-O0`, `-O1`, `--dump-ast`, `-h`/`--help`,
///          `--version`.
lion::support::Expected<LioncConfig> parseArgs(int argc, char **argv);

/// @brief Print the usage synopsis.
void printUsage(std::ostream &os);

/// @brief Compile according to @p config, writing the output or diagnostics.
/// @return Process exit status: 0 on success, 1 on any failure.
int runLionc(const LioncConfig &config, std::ostream &out, std::ostream &err);

} // namespace lion::tools::lionc
