//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Builder.hpp
/// @brief Node factories for the LionCode AST.
///
/// @details One factory per node kind. The plain factories trust their caller
/// for the result type; the optimizer uses them to rebuild nodes. The
/// `check*` factories compute the result type from the operand types and
/// reject ill-typed operator applications:
///
/// | operator | rule |
/// |---|---|
/// | `+` | a string operand gives string; a boolean operand is an error |
/// | `- * /` | number operands only; literal `0` divisor is an error |
/// | `%` | number operands only |
/// | `and or` | boolean operands only, result boolean |
/// | `< <= > >=` and phrases | both number or both string |
/// | `== !=`, `is equal to` | any operands |
/// | unary `-` / `!` | number / boolean operand |
///
/// An Unknown operand never raises; it makes the result Unknown unless the
/// other operand decides it. Builders never look at scopes.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/lioncode/AST.hpp"
#include "support/diag_expected.hpp"

namespace lion::frontends::lioncode::build
{

using lion::support::Expected;

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

ExprPtr number(SourceLoc loc, double value);
ExprPtr string(SourceLoc loc, std::string value);

/// @brief Interpolated string; collapses to a plain literal when no segment
///        holds an expression.
ExprPtr interpolated(SourceLoc loc, std::vector<StringSegment> segments);

ExprPtr boolean(SourceLoc loc, bool value);
IdentifierPtr identifier(SourceLoc loc, std::string name, Type type, bool isFunction = false);
ExprPtr binary(SourceLoc loc, BinaryOp op, ExprPtr left, ExprPtr right, Type type);
ExprPtr comparison(SourceLoc loc, CompareOp op, ExprPtr left, ExprPtr right);
ExprPtr unary(SourceLoc loc, UnaryOp op, ExprPtr operand, Type type);
ExprPtr call(SourceLoc loc, std::string callee, std::vector<ExprPtr> args, Type type, bool isBuiltin);
RangePtr range(SourceLoc loc, ExprPtr bound);

/// @brief Type-checked binary expression.
Expected<ExprPtr> checkBinary(SourceLoc loc, BinaryOp op, ExprPtr left, ExprPtr right);

/// @brief Type-checked comparison.
Expected<ExprPtr> checkComparison(SourceLoc loc, CompareOp op, ExprPtr left, ExprPtr right);

/// @brief Type-checked unary expression.
Expected<ExprPtr> checkUnary(SourceLoc loc, UnaryOp op, ExprPtr operand);

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

BlockPtr block(SourceLoc loc, StmtList statements);
StmtPtr assignment(SourceLoc loc, IdentifierPtr target, ExprPtr value, bool isDeclaration);
StmtPtr print(SourceLoc loc, ExprPtr value);
StmtPtr function(SourceLoc loc,
                 std::string name,
                 std::vector<std::string> params,
                 BlockPtr body,
                 Type returnType);
StmtPtr returnStmt(SourceLoc loc, ExprPtr value);
StmtPtr ifStmt(SourceLoc loc, ExprPtr condition, BlockPtr consequent, StmtPtr alternate);
StmtPtr whileStmt(SourceLoc loc, IdentifierPtr variable, RangePtr range, BlockPtr body);
StmtPtr breakStmt(SourceLoc loc);
StmtPtr comment(SourceLoc loc, std::string text);
StmtPtr expression(SourceLoc loc, ExprPtr expr);
ProgramPtr program(StmtList statements);

} // namespace lion::frontends::lioncode::build
