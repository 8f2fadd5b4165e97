//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.hpp
/// @brief Human-readable dump of a typed LionCode program.
///
/// @details Produces an indentation-based tree dump, two spaces per level.
/// Each node prints its kind, identifying attributes (names, operators,
/// literal values), the resolved type of expressions and its location.
///
/// Example output for `x = 5 + 8` followed by `roar x`:
/// @code
///   Program
///     AssignmentStatement let (1:1)
///       Identifier "x" : number (1:1)
///       BinaryExpression (+) : number (1:5)
///         NumberLiteral 5 : number (1:5)
///         NumberLiteral 8 : number (1:9)
///     PrintStatement (2:1)
///       Identifier "x" : number (2:6)
/// @endcode
///
/// @invariant Printing never mutates the AST.
/// @invariant Output is deterministic for reproducible test results.
///
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lioncode/AST.hpp"

#include <string>

namespace lion::frontends::lioncode
{

/// @brief Produces a human-readable dump of a LionCode program.
class AstPrinter
{
  public:
    /// @brief Dump the whole program.
    std::string dump(const Program &program);

    /// @brief Dump one expression subtree.
    std::string dump(const Expr &expr);
};

} // namespace lion::frontends::lioncode
