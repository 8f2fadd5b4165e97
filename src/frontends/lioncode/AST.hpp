//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AST.hpp
/// @brief Typed abstract syntax tree shared by the analyzer, the optimizer and
///        the code generator.
///
/// @details The AST is produced by the Analyzer (through the factories in
/// Builder.hpp), rewritten by the Optimizer and rendered by the Generator.
///
/// ## Design Overview
///
/// Every node is a struct carrying a `kind` tag and a source location; each
/// pass dispatches with a `switch` over the tag and a `static_cast` to the
/// concrete node. Every expression additionally carries its resolved Type.
///
/// ## Ownership
///
/// Nodes are immutable once built and are held through `shared_ptr<const T>`.
/// A pass that changes a node builds a replacement and reuses every untouched
/// child pointer, so an optimized tree may share subtrees with its input.
///
/// ## Conditional chains
///
/// `if (a) |..| else (b) |..| otherwise |..|` is an IfStmt whose alternate is
/// another IfStmt (for `else (b)`), whose alternate is a BlockStmt (for
/// `otherwise`). A null alternate ends the chain.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/lioncode/Operators.hpp"
#include "frontends/lioncode/Types.hpp"
#include "support/source_location.hpp"

#include <memory>
#include <string>
#include <vector>

namespace lion::frontends::lioncode
{

using SourceLoc = lion::support::SourceLoc;

struct Expr;
struct Stmt;
struct BlockStmt;
struct IdentifierExpr;
struct RangeExpr;
struct Program;

using ExprPtr = std::shared_ptr<const Expr>;
using StmtPtr = std::shared_ptr<const Stmt>;
using BlockPtr = std::shared_ptr<const BlockStmt>;
using IdentifierPtr = std::shared_ptr<const IdentifierExpr>;
using RangePtr = std::shared_ptr<const RangeExpr>;
using ProgramPtr = std::shared_ptr<const Program>;
using StmtList = std::vector<StmtPtr>;

//===----------------------------------------------------------------------===//
/// @name Expressions
/// @{
//===----------------------------------------------------------------------===//

enum class ExprKind
{
    NumberLiteral,
    StringLiteral,
    BooleanLiteral,
    Identifier,
    Binary,
    Comparison,
    Unary,
    Call,
    Range,
};

/// @brief Base class for all expressions.
struct Expr
{
    ExprKind kind;
    SourceLoc loc;

    /// @brief Type resolved by the analyzer.
    Type type;

    Expr(ExprKind k, SourceLoc l, Type t) : kind(k), loc(l), type(t) {}

    virtual ~Expr() = default;
};

/// @brief Numeric literal; every LionCode number is an IEEE double.
struct NumberLiteralExpr : Expr
{
    double value;

    NumberLiteralExpr(SourceLoc l, double v) : Expr(ExprKind::NumberLiteral, l, Type::Number), value(v)
    {
    }
};

/// @brief Piece of an interpolated string: literal text or an expression.
struct StringSegment
{
    std::string text; ///< Literal text when expr is null
    ExprPtr expr;     ///< Embedded expression, or null
};

/// @brief String literal, plain or interpolated.
/// @invariant When segments is non-empty at least one segment holds an
///            expression and `value` is unused; otherwise `value` is the text.
struct StringLiteralExpr : Expr
{
    std::string value;
    std::vector<StringSegment> segments;

    StringLiteralExpr(SourceLoc l, std::string v)
        : Expr(ExprKind::StringLiteral, l, Type::String), value(std::move(v))
    {
    }

    StringLiteralExpr(SourceLoc l, std::vector<StringSegment> s)
        : Expr(ExprKind::StringLiteral, l, Type::String), segments(std::move(s))
    {
    }

    bool isInterpolated() const
    {
        return !segments.empty();
    }
};

struct BooleanLiteralExpr : Expr
{
    bool value;

    BooleanLiteralExpr(SourceLoc l, bool v) : Expr(ExprKind::BooleanLiteral, l, Type::Boolean), value(v)
    {
    }
};

/// @brief Reference to a variable, parameter, loop variable or function.
struct IdentifierExpr : Expr
{
    std::string name;

    /// @brief True when the name resolved to a function (type is then Unknown).
    bool isFunction;

    IdentifierExpr(SourceLoc l, std::string n, Type t, bool fn = false)
        : Expr(ExprKind::Identifier, l, t), name(std::move(n)), isFunction(fn)
    {
    }
};

struct BinaryExpr : Expr
{
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;

    BinaryExpr(SourceLoc l, BinaryOp o, ExprPtr lhs, ExprPtr rhs, Type t)
        : Expr(ExprKind::Binary, l, t), op(o), left(std::move(lhs)), right(std::move(rhs))
    {
    }
};

/// @brief Comparison; always boolean.
struct ComparisonExpr : Expr
{
    CompareOp op;
    ExprPtr left;
    ExprPtr right;

    ComparisonExpr(SourceLoc l, CompareOp o, ExprPtr lhs, ExprPtr rhs)
        : Expr(ExprKind::Comparison, l, Type::Boolean), op(o), left(std::move(lhs)),
          right(std::move(rhs))
    {
    }
};

struct UnaryExpr : Expr
{
    UnaryOp op;
    ExprPtr operand;

    UnaryExpr(SourceLoc l, UnaryOp o, ExprPtr e, Type t)
        : Expr(ExprKind::Unary, l, t), op(o), operand(std::move(e))
    {
    }
};

/// @brief Call of a user function or of a built-in math function.
struct CallExpr : Expr
{
    std::string callee;
    std::vector<ExprPtr> args;

    /// @brief True for sqrt/abs/floor/ceil resolved to the prelude.
    bool isBuiltin;

    CallExpr(SourceLoc l, std::string c, std::vector<ExprPtr> a, Type t, bool builtin)
        : Expr(ExprKind::Call, l, t), callee(std::move(c)), args(std::move(a)), isBuiltin(builtin)
    {
    }
};

/// @brief `range(bound)` of a loop; counts 0 .. bound-1.
struct RangeExpr : Expr
{
    ExprPtr bound;

    RangeExpr(SourceLoc l, ExprPtr b) : Expr(ExprKind::Range, l, Type::Number), bound(std::move(b)) {}
};

/// @}

//===----------------------------------------------------------------------===//
/// @name Statements
/// @{
//===----------------------------------------------------------------------===//

enum class StmtKind
{
    Block,
    Assignment,
    Print,
    FunctionDecl,
    Return,
    If,
    While,
    Break,
    Comment,
    Expression,
};

struct Stmt
{
    StmtKind kind;
    SourceLoc loc;

    Stmt(StmtKind k, SourceLoc l) : kind(k), loc(l) {}

    virtual ~Stmt() = default;
};

struct BlockStmt : Stmt
{
    StmtList statements;

    BlockStmt(SourceLoc l, StmtList s) : Stmt(StmtKind::Block, l), statements(std::move(s)) {}
};

/// @brief `target = value`; the first assignment to a name declares it.
struct AssignmentStmt : Stmt
{
    IdentifierPtr target;
    ExprPtr value;
    bool isDeclaration;

    AssignmentStmt(SourceLoc l, IdentifierPtr t, ExprPtr v, bool decl)
        : Stmt(StmtKind::Assignment, l), target(std::move(t)), value(std::move(v)),
          isDeclaration(decl)
    {
    }
};

struct PrintStmt : Stmt
{
    ExprPtr value;

    PrintStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Print, l), value(std::move(v)) {}
};

struct FunctionDeclStmt : Stmt
{
    std::string name;
    std::vector<std::string> params;
    BlockPtr body;

    /// @brief Type of the first `serve` with a known type, Unknown if none.
    Type returnType;

    FunctionDeclStmt(SourceLoc l, std::string n, std::vector<std::string> p, BlockPtr b, Type r)
        : Stmt(StmtKind::FunctionDecl, l), name(std::move(n)), params(std::move(p)), body(std::move(b)),
          returnType(r)
    {
    }
};

struct ReturnStmt : Stmt
{
    ExprPtr value;

    ReturnStmt(SourceLoc l, ExprPtr v) : Stmt(StmtKind::Return, l), value(std::move(v)) {}
};

/// @brief One link of a conditional chain.
/// @details alternate is null, a BlockStmt (`otherwise`) or an IfStmt (`else (c)`).
struct IfStmt : Stmt
{
    ExprPtr condition;
    BlockPtr consequent;
    StmtPtr alternate;

    IfStmt(SourceLoc l, ExprPtr c, BlockPtr t, StmtPtr e)
        : Stmt(StmtKind::If, l), condition(std::move(c)), consequent(std::move(t)), alternate(std::move(e))
    {
    }
};

/// @brief `Prowl variable in range(n) | body |`.
struct WhileStmt : Stmt
{
    IdentifierPtr variable;
    RangePtr range;
    BlockPtr body;

    WhileStmt(SourceLoc l, IdentifierPtr v, RangePtr r, BlockPtr b)
        : Stmt(StmtKind::While, l), variable(std::move(v)), range(std::move(r)), body(std::move(b))
    {
    }
};

struct BreakStmt : Stmt
{
    explicit BreakStmt(SourceLoc l) : Stmt(StmtKind::Break, l) {}
};

struct CommentStmt : Stmt
{
    std::string text;

    CommentStmt(SourceLoc l, std::string t) : Stmt(StmtKind::Comment, l), text(std::move(t)) {}
};

struct ExpressionStmt : Stmt
{
    ExprPtr expr;

    ExpressionStmt(SourceLoc l, ExprPtr e) : Stmt(StmtKind::Expression, l), expr(std::move(e)) {}
};

/// @}

/// @brief Root of an analyzed program.
struct Program
{
    StmtList statements;
};

/// @brief Deep structural equality of two expressions.
/// @details Compares kinds, operators, literal values, names and children;
///          locations and resolved types are ignored.
bool structurallyEqual(const Expr &a, const Expr &b);

const char *toString(ExprKind kind);

const char *toString(StmtKind kind);

} // namespace lion::frontends::lioncode
