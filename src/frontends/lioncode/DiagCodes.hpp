//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lioncode/DiagCodes.hpp
// Purpose: Diagnostic codes distinguishing the three failure kinds of the
//          LionCode pipeline.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace lion::frontends::lioncode::diag_codes
{

/// Lexer and parser errors.
inline constexpr const char *kSyntax = "L1000";

/// Analyzer errors, including operator type errors raised by the builders.
inline constexpr const char *kSemantic = "L2000";

/// Generator asked for an output target it does not support.
inline constexpr const char *kUnsupportedTarget = "L3000";

} // namespace lion::frontends::lioncode::diag_codes
