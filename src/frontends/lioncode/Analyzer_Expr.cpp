//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Analyzer_Expr.cpp
/// @brief Expression rules of the LionCode semantic analyzer.
///
/// @details Children are analyzed left to right before the parent, so the
/// first reported error is always the leftmost innermost one. Operator typing
/// is delegated to the check* factories of Builder.hpp.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Analyzer.hpp"

#include "frontends/lioncode/Builder.hpp"

namespace lion::frontends::lioncode
{

ExprPtr Analyzer::analyzeExpr(const SynExpr &expr)
{
    switch (expr.kind)
    {
        case SynExprKind::Number:
            return build::number(expr.loc, static_cast<const SynNumber &>(expr).value);
        case SynExprKind::String:
            return analyzeString(static_cast<const SynString &>(expr));
        case SynExprKind::Bool:
            return build::boolean(expr.loc, static_cast<const SynBool &>(expr).value);
        case SynExprKind::Identifier:
            return analyzeIdentifier(static_cast<const SynIdentifier &>(expr));
        case SynExprKind::Binary:
            return analyzeBinary(static_cast<const SynBinary &>(expr));
        case SynExprKind::Comparison:
            return analyzeComparison(static_cast<const SynComparison &>(expr));
        case SynExprKind::Unary:
            return analyzeUnary(static_cast<const SynUnary &>(expr));
        case SynExprKind::Call:
            return analyzeCall(static_cast<const SynCall &>(expr));
    }
    return nullptr;
}

ExprPtr Analyzer::analyzeString(const SynString &expr)
{
    if (!expr.interpolated)
    {
        std::string text;
        for (const auto &segment : expr.segments)
            text += segment.text;
        return build::string(expr.loc, std::move(text));
    }

    std::vector<StringSegment> segments;
    for (const auto &segment : expr.segments)
    {
        if (!segment.expr)
        {
            segments.push_back(StringSegment{segment.text, nullptr});
            continue;
        }
        ExprPtr value = analyzeExpr(*segment.expr);
        if (!value)
            return nullptr;
        segments.push_back(StringSegment{{}, std::move(value)});
    }
    return build::interpolated(expr.loc, std::move(segments));
}

ExprPtr Analyzer::analyzeIdentifier(const SynIdentifier &expr)
{
    Symbol *sym = currentScope_->lookup(expr.name);
    if (!sym)
    {
        error(expr.loc, "Variable '" + expr.name + "' not declared");
        return nullptr;
    }

    if (sym->kind == Symbol::Kind::Function || sym->kind == Symbol::Kind::Builtin)
        return build::identifier(expr.loc, expr.name, Type::Unknown, true);
    return build::identifier(expr.loc, expr.name, sym->type);
}

ExprPtr Analyzer::analyzeBinary(const SynBinary &expr)
{
    ExprPtr left = analyzeExpr(*expr.left);
    if (!left)
        return nullptr;
    ExprPtr right = analyzeExpr(*expr.right);
    if (!right)
        return nullptr;
    return take(build::checkBinary(expr.loc, expr.op, std::move(left), std::move(right)));
}

namespace
{
bool isFunctionRef(const Expr &e)
{
    return e.kind == ExprKind::Identifier && static_cast<const IdentifierExpr &>(e).isFunction;
}
} // namespace

ExprPtr Analyzer::analyzeComparison(const SynComparison &expr)
{
    ExprPtr left = analyzeExpr(*expr.left);
    if (!left)
        return nullptr;
    ExprPtr right = analyzeExpr(*expr.right);
    if (!right)
        return nullptr;

    const bool leftFn = isFunctionRef(*left);
    const bool rightFn = isFunctionRef(*right);
    if (leftFn != rightFn)
    {
        const Expr &other = leftFn ? *right : *left;
        error(expr.loc, std::string("Cannot compare function and ") + toString(other.type));
        return nullptr;
    }

    return take(build::checkComparison(expr.loc, expr.op, std::move(left), std::move(right)));
}

ExprPtr Analyzer::analyzeUnary(const SynUnary &expr)
{
    ExprPtr operand = analyzeExpr(*expr.operand);
    if (!operand)
        return nullptr;
    return take(build::checkUnary(expr.loc, expr.op, std::move(operand)));
}

ExprPtr Analyzer::analyzeCall(const SynCall &expr)
{
    Symbol *sym = currentScope_->lookup(expr.callee);
    if (!sym)
    {
        error(expr.loc, "Variable '" + expr.callee + "' not declared");
        return nullptr;
    }
    if (sym->kind != Symbol::Kind::Function && sym->kind != Symbol::Kind::Builtin)
    {
        error(expr.loc, "Not a function");
        return nullptr;
    }

    if (expr.args.size() != sym->paramCount)
    {
        error(expr.loc,
              "Expected " + std::to_string(sym->paramCount) + " argument(s) but " +
                  std::to_string(expr.args.size()) + " passed");
        return nullptr;
    }

    const bool isBuiltin = sym->kind == Symbol::Kind::Builtin;
    std::vector<ExprPtr> args;
    for (const auto &arg : expr.args)
    {
        ExprPtr value = analyzeExpr(*arg);
        if (!value)
            return nullptr;
        // Parameters are bound as numbers.
        if (isKnown(value->type) && value->type != Type::Number)
        {
            if (sym == currentFunction_)
                error(value->loc, "Recursive call with invalid type");
            else
                error(value->loc, std::string("Expected number argument but found ") + toString(value->type));
            return nullptr;
        }
        args.push_back(std::move(value));
    }

    // Recursive calls made before the first typed `serve` default to number.
    Type result = isKnown(sym->returnType) ? sym->returnType : Type::Number;
    return build::call(expr.loc, expr.callee, std::move(args), result, isBuiltin);
}

} // namespace lion::frontends::lioncode
