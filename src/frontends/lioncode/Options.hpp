//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Options.hpp
/// @brief Options controlling the LionCode compilation pipeline.
///
/// @details Populated from command-line flags by `lionc` (`-O0`,
/// `--target NAME`, `--dump-ast`) and passed by const reference into
/// compile().
///
/// @invariant Default-constructed CompilerOptions optimize and target
///            JavaScript.
///
//===----------------------------------------------------------------------===//

#pragma once

#include <string>

namespace lion::frontends::lioncode
{

/// @brief Options controlling LionCode compilation behavior.
struct CompilerOptions
{
    /// @brief Run the AST optimizer between analysis and generation.
    bool optimize{true};

    /// @brief Output target handed to the generator.
    std::string target{"js"};

    /// @brief Dump the AST to stderr after analysis and after optimization.
    bool dumpAst{false};
};

} // namespace lion::frontends::lioncode
