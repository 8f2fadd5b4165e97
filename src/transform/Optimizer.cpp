//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
// File: src/transform/Optimizer.cpp
// Purpose: Statement rewrites and the program entry point of the LionCode
//          optimizer.
// Key invariants: A statement is replaced by a list so that eliminated code
//                 disappears and a statically selected branch is spliced into
//                 the enclosing block.
// Ownership/Lifetime: Operates on shared immutable nodes; see Optimizer.hpp.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Dead code elimination and statement-level simplification.
/// @details Expression rewrites live in Optimizer_Expr.cpp. The statement
///          rules run after the children have been optimized, so an `if`
///          whose condition folds to a literal is resolved in the same pass.

#include "transform/Optimizer.hpp"

#include "frontends/lioncode/Builder.hpp"

using namespace lion::frontends::lioncode;

namespace lion::transform
{

namespace
{

/// @brief Optimize every statement of @p in, flattening the results.
/// @return True when the resulting list differs from @p in.
static bool optimizeList(const StmtList &in, StmtList &out)
{
    bool changed = false;
    for (const auto &stmt : in)
    {
        StmtList replaced = optimizeStmt(stmt);
        if (replaced.size() != 1 || replaced.front() != stmt)
            changed = true;
        out.insert(out.end(), replaced.begin(), replaced.end());
    }
    return changed;
}

static BlockPtr optimizeBlock(const BlockPtr &block)
{
    StmtList statements;
    if (!optimizeList(block->statements, statements))
        return block;
    return build::block(block->loc, std::move(statements));
}

/// @brief Optimize the alternate of an if: null, a block or another if.
/// @details An else-if that optimizes into spliced statements becomes an
///          `otherwise` block holding them.
static StmtPtr optimizeAlternate(const StmtPtr &alternate)
{
    if (!alternate)
        return alternate;
    if (alternate->kind == StmtKind::Block)
        return optimizeBlock(std::static_pointer_cast<const BlockStmt>(alternate));

    StmtList replaced = optimizeStmt(alternate);
    if (replaced.empty())
        return nullptr;
    if (replaced.size() == 1 && replaced.front()->kind == StmtKind::If)
        return replaced.front();
    return build::block(alternate->loc, std::move(replaced));
}

/// @brief The statements an alternate contributes when it is selected.
static StmtList spliceAlternate(const StmtPtr &alternate)
{
    if (!alternate)
        return {};
    if (alternate->kind == StmtKind::Block)
        return static_cast<const BlockStmt &>(*alternate).statements;
    return {alternate};
}

static StmtList optimizeAssignment(const StmtPtr &stmt)
{
    const auto &s = static_cast<const AssignmentStmt &>(*stmt);
    ExprPtr value = optimizeExpr(s.value);

    // x = x
    if (value->kind == ExprKind::Identifier &&
        static_cast<const IdentifierExpr &>(*value).name == s.target->name)
        return {};

    if (value == s.value)
        return {stmt};
    return {build::assignment(s.loc, s.target, std::move(value), s.isDeclaration)};
}

static StmtList optimizeIf(const StmtPtr &stmt)
{
    const auto &s = static_cast<const IfStmt &>(*stmt);
    ExprPtr condition = optimizeExpr(s.condition);
    BlockPtr consequent = optimizeBlock(s.consequent);
    StmtPtr alternate = optimizeAlternate(s.alternate);

    if (condition->kind == ExprKind::BooleanLiteral)
    {
        if (static_cast<const BooleanLiteralExpr &>(*condition).value)
            return consequent->statements;
        return spliceAlternate(alternate);
    }

    if (consequent->statements.empty() && !alternate)
        return {};

    // if (a != b) A otherwise B -> if (a == b) B otherwise A
    if (condition->kind == ExprKind::Comparison && alternate && alternate->kind == StmtKind::Block)
    {
        const auto &cmp = static_cast<const ComparisonExpr &>(*condition);
        if (cmp.op == CompareOp::Ne)
        {
            return {build::ifStmt(s.loc,
                                  build::comparison(cmp.loc, CompareOp::Eq, cmp.left, cmp.right),
                                  std::static_pointer_cast<const BlockStmt>(alternate),
                                  consequent)};
        }
    }

    if (condition == s.condition && consequent == s.consequent && alternate == s.alternate)
        return {stmt};
    return {build::ifStmt(s.loc, std::move(condition), std::move(consequent), std::move(alternate))};
}

static StmtList optimizeWhile(const StmtPtr &stmt)
{
    const auto &s = static_cast<const WhileStmt &>(*stmt);
    ExprPtr bound = optimizeExpr(s.range->bound);
    BlockPtr body = optimizeBlock(s.body);

    if (bound->kind == ExprKind::NumberLiteral && static_cast<const NumberLiteralExpr &>(*bound).value <= 0)
        return {};
    if (body->statements.empty())
        return {};

    if (bound == s.range->bound && body == s.body)
        return {stmt};
    RangePtr range = bound == s.range->bound ? s.range : build::range(s.range->loc, std::move(bound));
    return {build::whileStmt(s.loc, s.variable, std::move(range), std::move(body))};
}

/// @brief Rebuild a statement holding a single expression when it changed.
template <typename Factory>
static StmtList rewriteValue(const StmtPtr &stmt, const ExprPtr &current, Factory factory)
{
    ExprPtr value = optimizeExpr(current);
    if (value == current)
        return {stmt};
    return {factory(stmt->loc, std::move(value))};
}

} // namespace

StmtList optimizeStmt(const StmtPtr &stmt)
{
    if (!stmt)
        return {};

    switch (stmt->kind)
    {
        case StmtKind::Block:
        {
            BlockPtr block = std::static_pointer_cast<const BlockStmt>(stmt);
            return {optimizeBlock(block)};
        }
        case StmtKind::Assignment:
            return optimizeAssignment(stmt);
        case StmtKind::Print:
            return rewriteValue(
                stmt, static_cast<const PrintStmt &>(*stmt).value, build::print);
        case StmtKind::Return:
            return rewriteValue(
                stmt, static_cast<const ReturnStmt &>(*stmt).value, build::returnStmt);
        case StmtKind::Expression:
            return rewriteValue(
                stmt, static_cast<const ExpressionStmt &>(*stmt).expr, build::expression);
        case StmtKind::FunctionDecl:
        {
            const auto &f = static_cast<const FunctionDeclStmt &>(*stmt);
            BlockPtr body = optimizeBlock(f.body);
            if (body == f.body)
                return {stmt};
            return {build::function(f.loc, f.name, f.params, std::move(body), f.returnType)};
        }
        case StmtKind::If:
            return optimizeIf(stmt);
        case StmtKind::While:
            return optimizeWhile(stmt);
        case StmtKind::Break:
        case StmtKind::Comment:
            return {stmt};
    }
    return {stmt};
}

ProgramPtr optimize(const ProgramPtr &program)
{
    if (!program)
        return program;

    StmtList statements;
    if (!optimizeList(program->statements, statements))
        return program;
    return build::program(std::move(statements));
}

} // namespace lion::transform
