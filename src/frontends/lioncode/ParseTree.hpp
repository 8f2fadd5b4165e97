//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file ParseTree.hpp
/// @brief Concrete syntax tree produced by the LionCode parser.
///
/// @details The parse tree records what the source says, not what it means.
/// Names are unresolved, nothing is typed, and a few positions are
/// deliberately more permissive than the language so the analyzer can report
/// a precise semantic error instead of a generic syntax error:
/// - an assignment target is any expression (`5 + 3 = 8` parses);
/// - a loop variable is any primary (`Prowl 123 in range(5)` parses).
///
/// Nodes are uniquely owned; the analyzer reads the tree and never keeps
/// pointers into it.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/lioncode/Operators.hpp"
#include "support/source_location.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lion::frontends::lioncode
{

using SourceLoc = lion::support::SourceLoc;

struct SynExpr;
struct SynStmt;

using SynExprPtr = std::unique_ptr<SynExpr>;
using SynStmtPtr = std::unique_ptr<SynStmt>;

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

enum class SynExprKind
{
    Number,
    String,
    Bool,
    Identifier,
    Binary,
    Comparison,
    Unary,
    Call,
};

struct SynExpr
{
    SynExprKind kind;
    SourceLoc loc;

    SynExpr(SynExprKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~SynExpr() = default;
};

struct SynNumber : SynExpr
{
    double value;
    std::string text; ///< Literal as written

    SynNumber(SourceLoc l, double v, std::string t)
        : SynExpr(SynExprKind::Number, l), value(v), text(std::move(t))
    {
    }
};

/// @brief One piece of a string literal: literal text or an embedded expression.
struct SynStringSegment
{
    std::string text; ///< Unescaped text (when expr is null)
    SynExprPtr expr;  ///< Interpolated expression, or null for text
};

struct SynString : SynExpr
{
    /// Segments in source order. A plain literal has exactly one text segment.
    std::vector<SynStringSegment> segments;

    /// True when the literal used `$name` or `$( ... )`, even if empty.
    bool interpolated = false;

    explicit SynString(SourceLoc l) : SynExpr(SynExprKind::String, l) {}
};

struct SynBool : SynExpr
{
    bool value;

    SynBool(SourceLoc l, bool v) : SynExpr(SynExprKind::Bool, l), value(v) {}
};

struct SynIdentifier : SynExpr
{
    std::string name;

    SynIdentifier(SourceLoc l, std::string n) : SynExpr(SynExprKind::Identifier, l), name(std::move(n))
    {
    }
};

struct SynBinary : SynExpr
{
    BinaryOp op;
    SynExprPtr left;
    SynExprPtr right;

    SynBinary(SourceLoc l, BinaryOp o, SynExprPtr lhs, SynExprPtr rhs)
        : SynExpr(SynExprKind::Binary, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

struct SynComparison : SynExpr
{
    CompareOp op;
    SynExprPtr left;
    SynExprPtr right;

    SynComparison(SourceLoc l, CompareOp o, SynExprPtr lhs, SynExprPtr rhs)
        : SynExpr(SynExprKind::Comparison, l), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

struct SynUnary : SynExpr
{
    UnaryOp op;
    SynExprPtr operand;

    SynUnary(SourceLoc l, UnaryOp o, SynExprPtr e)
        : SynExpr(SynExprKind::Unary, l), op(o), operand(std::move(e))
    {
    }
};

struct SynCall : SynExpr
{
    std::string callee;
    std::vector<SynExprPtr> args;

    SynCall(SourceLoc l, std::string c, std::vector<SynExprPtr> a)
        : SynExpr(SynExprKind::Call, l), callee(std::move(c)), args(std::move(a))
    {
    }
};

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

enum class SynStmtKind
{
    Print,
    Assign,
    Function,
    Return,
    If,
    Loop,
    Break,
    Comment,
    Expression,
};

struct SynStmt
{
    SynStmtKind kind;
    SourceLoc loc;

    SynStmt(SynStmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~SynStmt() = default;
};

/// @brief `| statement* |`
struct SynBlock
{
    SourceLoc loc;
    std::vector<SynStmtPtr> statements;
};

/// @brief `roar value`
struct SynPrint : SynStmt
{
    SynExprPtr value;

    SynPrint(SourceLoc l, SynExprPtr v) : SynStmt(SynStmtKind::Print, l), value(std::move(v)) {}
};

/// @brief `target = value`
struct SynAssign : SynStmt
{
    SynExprPtr target;
    SynExprPtr value;

    SynAssign(SourceLoc l, SynExprPtr t, SynExprPtr v)
        : SynStmt(SynStmtKind::Assign, l), target(std::move(t)), value(std::move(v))
    {
    }
};

struct SynParam
{
    std::string name;
    SourceLoc loc;
};

/// @brief `ignite name(params) | body |`
struct SynFunction : SynStmt
{
    std::string name;
    std::vector<SynParam> params;
    SynBlock body;

    SynFunction(SourceLoc l, std::string n) : SynStmt(SynStmtKind::Function, l), name(std::move(n)) {}
};

/// @brief `serve value`
struct SynReturn : SynStmt
{
    SynExprPtr value;

    SynReturn(SourceLoc l, SynExprPtr v) : SynStmt(SynStmtKind::Return, l), value(std::move(v)) {}
};

/// @brief One conditioned arm of an if chain.
struct SynBranch
{
    SourceLoc loc;
    SynExprPtr condition;
    SynBlock block;
};

/// @brief `if (c) | .. | else (c2) | .. | otherwise | .. |`
/// @details branches[0] is the `if` arm; the rest are `else (..)` arms.
struct SynIf : SynStmt
{
    std::vector<SynBranch> branches;
    std::optional<SynBlock> otherwise;

    explicit SynIf(SourceLoc l) : SynStmt(SynStmtKind::If, l) {}
};

/// @brief `Prowl variable in range(bound) | body |`
struct SynLoop : SynStmt
{
    SynExprPtr variable;
    SynExprPtr bound;
    SourceLoc rangeLoc;
    SynBlock body;

    SynLoop(SourceLoc l, SynExprPtr v, SynExprPtr b)
        : SynStmt(SynStmtKind::Loop, l), variable(std::move(v)), bound(std::move(b))
    {
    }
};

struct SynBreak : SynStmt
{
    explicit SynBreak(SourceLoc l) : SynStmt(SynStmtKind::Break, l) {}
};

/// @brief `~ text ~` in statement position.
struct SynComment : SynStmt
{
    std::string text;

    SynComment(SourceLoc l, std::string t) : SynStmt(SynStmtKind::Comment, l), text(std::move(t)) {}
};

/// @brief An expression evaluated for its effect, e.g. `greet()`.
struct SynExprStmt : SynStmt
{
    SynExprPtr expr;

    SynExprStmt(SourceLoc l, SynExprPtr e) : SynStmt(SynStmtKind::Expression, l), expr(std::move(e))
    {
    }
};

/// @brief Root of a successful parse.
struct ParseTree
{
    uint32_t fileId = 0;
    std::vector<SynStmtPtr> statements;
};

} // namespace lion::frontends::lioncode
