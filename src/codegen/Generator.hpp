//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/Generator.hpp
// Purpose: Target selection for LionCode code generation.
// Key invariants: Only the "js" target exists; any other target name is
//                 reported with code L3000 and produces no output.
// Ownership/Lifetime: Stateless; the program is borrowed for the call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lioncode/AST.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>

namespace lion::codegen
{

/// @brief Name of the default output target.
inline constexpr std::string_view kDefaultTarget = "js";

/// @brief Translate @p program into source text for @p target.
/// @return The generated text, or an L3000 diagnostic when @p target is empty
///         ("Output type required") or unknown ("Unknown output type: T").
lion::support::Expected<std::string> generate(const lion::frontends::lioncode::Program &program,
                                              std::string_view target = kDefaultTarget);

} // namespace lion::codegen
