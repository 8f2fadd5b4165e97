//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
// File: src/transform/Optimizer_Expr.cpp
// Purpose: Expression rewrites of the LionCode optimizer.
// Key invariants: Folding must never change the value the generated
//                 JavaScript would compute; operations with a literal zero
//                 divisor and math calls outside their domain stay untouched.
// Ownership/Lifetime: Builds replacement nodes through the AST factories and
//                     reuses the input pointer whenever nothing changed.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Constant folding and algebraic simplification of expressions.
/// @details Children are optimized first, then the parent is matched against
///          the rewrite families in order: literal folding, boolean
///          short-circuit, identities, term combination and finally strength
///          reduction to shifts.

#include "transform/Optimizer.hpp"

#include "frontends/lioncode/Builder.hpp"
#include "support/number_format.hpp"

#include <cmath>
#include <optional>

using namespace lion::frontends::lioncode;

namespace lion::transform
{

namespace
{

/// @brief Extract the payload of a number literal.
static bool getConstNumber(const Expr &e, double &out)
{
    if (e.kind != ExprKind::NumberLiteral)
        return false;
    out = static_cast<const NumberLiteralExpr &>(e).value;
    return true;
}

static bool getConstBool(const Expr &e, bool &out)
{
    if (e.kind != ExprKind::BooleanLiteral)
        return false;
    out = static_cast<const BooleanLiteralExpr &>(e).value;
    return true;
}

/// @brief Extract the text of a plain (non-interpolated) string literal.
static bool getConstString(const Expr &e, std::string &out)
{
    if (e.kind != ExprKind::StringLiteral)
        return false;
    const auto &s = static_cast<const StringLiteralExpr &>(e);
    if (s.isInterpolated())
        return false;
    out = s.value;
    return true;
}

/// @brief Render a literal the way JavaScript string conversion would.
/// @return std::nullopt when @p e is not a literal.
static std::optional<std::string> literalText(const Expr &e)
{
    double n;
    bool b;
    std::string s;
    if (getConstNumber(e, n))
        return lion::support::formatNumber(n);
    if (getConstBool(e, b))
        return std::string(b ? "true" : "false");
    if (getConstString(e, s))
        return s;
    return std::nullopt;
}

static bool isConstNumber(const Expr &e, double value)
{
    double v;
    return getConstNumber(e, v) && v == value;
}

/// Largest shift count for which int32 shifts match the multiplication.
constexpr int kMaxShift = 30;

/// @brief Recognise a literal power of two 2^k with 1 <= k <= kMaxShift.
/// @param shift Receives k.
static bool isPowerOfTwo(const Expr &e, int &shift)
{
    double v;
    if (!getConstNumber(e, v) || !std::isfinite(v) || v < 2.0)
        return false;
    int exp = 0;
    double mantissa = std::frexp(v, &exp);
    if (mantissa != 0.5 || exp - 1 > kMaxShift)
        return false;
    shift = exp - 1;
    return true;
}

/// @brief Fold arithmetic on two number literals.
/// @details Division and modulus by zero are left for the runtime.
static bool foldArithmetic(BinaryOp op, double l, double r, double &out)
{
    switch (op)
    {
        case BinaryOp::Add:
            out = l + r;
            return true;
        case BinaryOp::Sub:
            out = l - r;
            return true;
        case BinaryOp::Mul:
            out = l * r;
            return true;
        case BinaryOp::Div:
            if (r == 0.0)
                return false;
            out = l / r;
            return true;
        case BinaryOp::Mod:
            if (r == 0.0)
                return false;
            out = std::fmod(l, r);
            return true;
        default:
            return false;
    }
}

/// @brief Evaluate an ordering or equality comparison of two literals.
template <typename T> static bool compareValues(CompareOp op, const T &l, const T &r)
{
    switch (canonical(op))
    {
        case CompareOp::Eq:
            return l == r;
        case CompareOp::Ne:
            return l != r;
        case CompareOp::Lt:
            return l < r;
        case CompareOp::Le:
            return l <= r;
        case CompareOp::Gt:
            return l > r;
        case CompareOp::Ge:
            return l >= r;
        default:
            return false;
    }
}

static bool isLiteral(const Expr &e)
{
    return literalText(e).has_value();
}

/// @brief Fold a comparison between two literals.
static std::optional<bool> foldComparison(CompareOp op, const Expr &left, const Expr &right)
{
    if (!isLiteral(left) || !isLiteral(right))
        return std::nullopt;

    double ln, rn;
    std::string ls, rs;
    bool lb, rb;
    if (getConstNumber(left, ln) && getConstNumber(right, rn))
        return compareValues(op, ln, rn);
    if (getConstString(left, ls) && getConstString(right, rs))
        return compareValues(op, ls, rs);
    if (getConstBool(left, lb) && getConstBool(right, rb) && isEquality(op))
        return compareValues(op, lb, rb);

    // Strict equality between literals of different types.
    if (left.kind != right.kind && isEquality(op))
        return canonical(op) == CompareOp::Ne;
    return std::nullopt;
}

/// @brief Fold recognised built-in math calls whose optimized argument
///        @p args is a literal.
/// @details Mirrors the runtime: sqrt is only folded for non-negative input
///          so that NaN-producing calls stay visible in the output.
static bool foldCall(const CallExpr &call, const std::vector<ExprPtr> &args, double &out)
{
    double a;
    if (!call.isBuiltin || args.size() != 1 || !getConstNumber(*args[0], a))
        return false;
    if (call.callee == "abs")
    {
        out = std::fabs(a);
        return true;
    }
    if (call.callee == "floor")
    {
        out = std::floor(a);
        return true;
    }
    if (call.callee == "ceil")
    {
        out = std::ceil(a);
        return true;
    }
    if (call.callee == "sqrt" && a >= 0.0)
    {
        out = std::sqrt(a);
        return true;
    }
    return false;
}

static ExprPtr simplifyBinary(const ExprPtr &original, const BinaryExpr &e, ExprPtr left, ExprPtr right)
{
    const SourceLoc loc = e.loc;

    double l, r;
    if (getConstNumber(*left, l) && getConstNumber(*right, r))
    {
        double value;
        if (foldArithmetic(e.op, l, r, value))
            return build::number(loc, value);
    }

    if (e.op == BinaryOp::Add && e.type == Type::String)
    {
        auto lt = literalText(*left);
        auto rt = literalText(*right);
        if (lt && rt)
            return build::string(loc, *lt + *rt);
    }

    bool lb, rb;
    if (e.op == BinaryOp::And || e.op == BinaryOp::Or)
    {
        const bool isAnd = e.op == BinaryOp::And;
        if (getConstBool(*left, lb))
        {
            // true and x -> x, false and x -> false, true or x -> true, false or x -> x
            if (lb == isAnd)
                return right;
            return build::boolean(loc, lb);
        }
        if (getConstBool(*right, rb))
        {
            if (rb == isAnd)
                return left;
            return build::boolean(loc, rb);
        }
    }

    if (e.op == BinaryOp::Add)
    {
        if (isConstNumber(*right, 0.0) && left->type == Type::Number)
            return left;
        if (isConstNumber(*left, 0.0) && right->type == Type::Number)
            return right;

        // (x + c1) + c2 -> x + (c1 + c2)
        if (getConstNumber(*right, r) && left->kind == ExprKind::Binary && e.type == Type::Number)
        {
            const auto &inner = static_cast<const BinaryExpr &>(*left);
            double c1;
            if (inner.op == BinaryOp::Add && inner.left->type == Type::Number &&
                getConstNumber(*inner.right, c1))
            {
                return build::binary(
                    loc, BinaryOp::Add, inner.left, build::number(inner.right->loc, c1 + r), Type::Number);
            }
        }
    }

    int shift = 0;
    if (e.op == BinaryOp::Mul)
    {
        if (isConstNumber(*right, 1.0))
            return left;
        if (isConstNumber(*left, 1.0))
            return right;
        if (isConstNumber(*right, 0.0) || isConstNumber(*left, 0.0))
            return build::number(loc, 0.0);
        if (isPowerOfTwo(*right, shift))
            return build::binary(loc, BinaryOp::Shl, left, build::number(right->loc, shift), Type::Number);
        if (isPowerOfTwo(*left, shift))
            return build::binary(loc, BinaryOp::Shl, right, build::number(left->loc, shift), Type::Number);
    }

    if (e.op == BinaryOp::Div && isPowerOfTwo(*right, shift))
        return build::binary(loc, BinaryOp::Shr, left, build::number(right->loc, shift), Type::Number);

    if (left == e.left && right == e.right)
        return original;
    return build::binary(loc, e.op, std::move(left), std::move(right), e.type);
}

static ExprPtr optimizeBinary(const ExprPtr &expr)
{
    const auto &e = static_cast<const BinaryExpr &>(*expr);
    return simplifyBinary(expr, e, optimizeExpr(e.left), optimizeExpr(e.right));
}

static ExprPtr optimizeComparison(const ExprPtr &expr)
{
    const auto &e = static_cast<const ComparisonExpr &>(*expr);
    ExprPtr left = optimizeExpr(e.left);
    ExprPtr right = optimizeExpr(e.right);

    if (auto folded = foldComparison(e.op, *left, *right))
        return build::boolean(e.loc, *folded);

    if (structurallyEqual(*left, *right))
    {
        switch (canonical(e.op))
        {
            case CompareOp::Eq:
            case CompareOp::Le:
            case CompareOp::Ge:
                return build::boolean(e.loc, true);
            default:
                return build::boolean(e.loc, false);
        }
    }

    if (left == e.left && right == e.right)
        return expr;
    return build::comparison(e.loc, e.op, std::move(left), std::move(right));
}

static ExprPtr optimizeUnary(const ExprPtr &expr)
{
    const auto &e = static_cast<const UnaryExpr &>(*expr);
    ExprPtr operand = optimizeExpr(e.operand);

    double n;
    bool b;
    if (e.op == UnaryOp::Neg && getConstNumber(*operand, n))
        return build::number(e.loc, -n);
    if (e.op == UnaryOp::Not && getConstBool(*operand, b))
        return build::boolean(e.loc, !b);

    // !!x -> x
    if (e.op == UnaryOp::Not && operand->kind == ExprKind::Unary)
    {
        const auto &inner = static_cast<const UnaryExpr &>(*operand);
        if (inner.op == UnaryOp::Not)
            return inner.operand;
    }

    if (operand == e.operand)
        return expr;
    return build::unary(e.loc, e.op, std::move(operand), e.type);
}

static ExprPtr optimizeCall(const ExprPtr &expr)
{
    const auto &e = static_cast<const CallExpr &>(*expr);

    bool changed = false;
    std::vector<ExprPtr> args;
    args.reserve(e.args.size());
    for (const auto &arg : e.args)
    {
        args.push_back(optimizeExpr(arg));
        changed = changed || args.back() != arg;
    }

    double value;
    if (foldCall(e, args, value))
        return build::number(e.loc, value);

    if (!changed)
        return expr;
    return build::call(e.loc, e.callee, std::move(args), e.type, e.isBuiltin);
}

static ExprPtr optimizeString(const ExprPtr &expr)
{
    const auto &e = static_cast<const StringLiteralExpr &>(*expr);
    if (!e.isInterpolated())
        return expr;

    bool changed = false;
    std::vector<StringSegment> segments;
    for (const auto &segment : e.segments)
    {
        if (!segment.expr)
        {
            segments.push_back(segment);
            continue;
        }
        ExprPtr value = optimizeExpr(segment.expr);
        if (auto text = literalText(*value))
        {
            segments.push_back(StringSegment{*text, nullptr});
            changed = true;
            continue;
        }
        changed = changed || value != segment.expr;
        segments.push_back(StringSegment{{}, std::move(value)});
    }

    if (!changed)
        return expr;
    return build::interpolated(e.loc, std::move(segments));
}

} // namespace

ExprPtr optimizeExpr(const ExprPtr &expr)
{
    if (!expr)
        return expr;

    switch (expr->kind)
    {
        case ExprKind::NumberLiteral:
        case ExprKind::BooleanLiteral:
        case ExprKind::Identifier:
            return expr;
        case ExprKind::StringLiteral:
            return optimizeString(expr);
        case ExprKind::Binary:
            return optimizeBinary(expr);
        case ExprKind::Comparison:
            return optimizeComparison(expr);
        case ExprKind::Unary:
            return optimizeUnary(expr);
        case ExprKind::Call:
            return optimizeCall(expr);
        case ExprKind::Range:
        {
            const auto &r = static_cast<const RangeExpr &>(*expr);
            ExprPtr bound = optimizeExpr(r.bound);
            if (bound == r.bound)
                return expr;
            return build::range(r.loc, std::move(bound));
        }
    }
    return expr;
}

} // namespace lion::transform
