//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: src/transform/Optimizer.hpp
// Purpose: Declares the LionCode AST optimizer: constant folding, algebraic
//          simplification and dead code elimination over the typed AST.
// Key invariants: Rewrites preserve the observable output of the generated
//                 program; division or modulus by a literal zero is never
//                 folded. One bottom-up pass, no fixpoint iteration.
// Ownership/Lifetime: Never mutates its input. Returned trees share every
//                     untouched subtree with the input, and an input with
//                     nothing to rewrite is returned as the same pointer.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lioncode/AST.hpp"

namespace lion::transform
{

using lion::frontends::lioncode::ExprPtr;
using lion::frontends::lioncode::ProgramPtr;
using lion::frontends::lioncode::StmtList;
using lion::frontends::lioncode::StmtPtr;

/// \brief Optimize every top-level statement of @p program.
ProgramPtr optimize(const ProgramPtr &program);

/// \brief Optimize one statement.
/// \return Zero statements when @p stmt is eliminated, several when a branch
///         is spliced into the enclosing statement list, else one.
StmtList optimizeStmt(const StmtPtr &stmt);

/// \brief Optimize one expression; children are optimized first.
ExprPtr optimizeExpr(const ExprPtr &expr);

} // namespace lion::transform
