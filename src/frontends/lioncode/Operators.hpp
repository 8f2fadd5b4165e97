//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lioncode/Operators.hpp
// Purpose: Operator enumerations shared by the parse tree and the AST.
// Key invariants: Shl/Shr never come from source text; only the optimizer's
//                 strength reduction introduces them.
// Ownership/Lifetime: Plain enumerations.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace lion::frontends::lioncode
{

/// @brief Binary arithmetic and logical operators.
enum class BinaryOp
{
    Add, ///< `+` (numeric addition or string concatenation)
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Mod, ///< `%`
    And, ///< `and`
    Or,  ///< `or`
    Shl, ///< `<<` produced by strength reduction
    Shr, ///< `>>` produced by strength reduction
};

/// @brief Comparison operators, including the English phrase forms.
enum class CompareOp
{
    Eq,            ///< `==`
    Ne,            ///< `!=`
    Lt,            ///< `<`
    Le,            ///< `<=`
    Gt,            ///< `>`
    Ge,            ///< `>=`
    IsEqualTo,     ///< `is equal to`
    IsLessThan,    ///< `is less than`
    IsGreaterThan, ///< `is greater than`
};

/// @brief Prefix operators.
enum class UnaryOp
{
    Neg, ///< `-x`
    Not, ///< `!x`
};

/// @brief LionCode spelling of @p op (`+`, `and`, `<<`, ...).
const char *toString(BinaryOp op);

/// @brief LionCode spelling of @p op (`==`, `is less than`, ...).
const char *toString(CompareOp op);

/// @brief LionCode spelling of @p op (`-` or `!`).
const char *toString(UnaryOp op);

/// @brief Map the phrase forms onto their symbolic equivalents.
/// @details IsEqualTo -> Eq, IsLessThan -> Lt, IsGreaterThan -> Gt; other
///          operators are returned unchanged.
CompareOp canonical(CompareOp op);

/// @brief True for `==`, `!=` and `is equal to`.
bool isEquality(CompareOp op);

} // namespace lion::frontends::lioncode
