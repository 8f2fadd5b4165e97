//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Kind names and structural comparison for the LionCode AST.
//
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/AST.hpp"

namespace lion::frontends::lioncode
{

const char *toString(ExprKind kind)
{
    switch (kind)
    {
        case ExprKind::NumberLiteral:
            return "NumberLiteral";
        case ExprKind::StringLiteral:
            return "StringLiteral";
        case ExprKind::BooleanLiteral:
            return "BooleanLiteral";
        case ExprKind::Identifier:
            return "Identifier";
        case ExprKind::Binary:
            return "BinaryExpression";
        case ExprKind::Comparison:
            return "ComparisonExpression";
        case ExprKind::Unary:
            return "UnaryExpression";
        case ExprKind::Call:
            return "FunctionCall";
        case ExprKind::Range:
            return "RangeExpression";
    }
    return "?";
}

const char *toString(StmtKind kind)
{
    switch (kind)
    {
        case StmtKind::Block:
            return "Block";
        case StmtKind::Assignment:
            return "AssignmentStatement";
        case StmtKind::Print:
            return "PrintStatement";
        case StmtKind::FunctionDecl:
            return "FunctionDeclaration";
        case StmtKind::Return:
            return "ReturnStatement";
        case StmtKind::If:
            return "IfStatement";
        case StmtKind::While:
            return "WhileStatement";
        case StmtKind::Break:
            return "BreakStatement";
        case StmtKind::Comment:
            return "Comment";
        case StmtKind::Expression:
            return "ExpressionStatement";
    }
    return "?";
}

namespace
{
bool sameChild(const ExprPtr &a, const ExprPtr &b)
{
    if (!a || !b)
        return a == b;
    return structurallyEqual(*a, *b);
}
} // namespace

bool structurallyEqual(const Expr &a, const Expr &b)
{
    if (&a == &b)
        return true;
    if (a.kind != b.kind)
        return false;

    switch (a.kind)
    {
        case ExprKind::NumberLiteral:
            return static_cast<const NumberLiteralExpr &>(a).value ==
                   static_cast<const NumberLiteralExpr &>(b).value;

        case ExprKind::StringLiteral:
        {
            const auto &sa = static_cast<const StringLiteralExpr &>(a);
            const auto &sb = static_cast<const StringLiteralExpr &>(b);
            if (sa.value != sb.value || sa.segments.size() != sb.segments.size())
                return false;
            for (size_t i = 0; i < sa.segments.size(); ++i)
            {
                if (sa.segments[i].text != sb.segments[i].text ||
                    !sameChild(sa.segments[i].expr, sb.segments[i].expr))
                    return false;
            }
            return true;
        }

        case ExprKind::BooleanLiteral:
            return static_cast<const BooleanLiteralExpr &>(a).value ==
                   static_cast<const BooleanLiteralExpr &>(b).value;

        case ExprKind::Identifier:
            return static_cast<const IdentifierExpr &>(a).name ==
                   static_cast<const IdentifierExpr &>(b).name;

        case ExprKind::Binary:
        {
            const auto &ba = static_cast<const BinaryExpr &>(a);
            const auto &bb = static_cast<const BinaryExpr &>(b);
            return ba.op == bb.op && sameChild(ba.left, bb.left) && sameChild(ba.right, bb.right);
        }

        case ExprKind::Comparison:
        {
            const auto &ca = static_cast<const ComparisonExpr &>(a);
            const auto &cb = static_cast<const ComparisonExpr &>(b);
            return ca.op == cb.op && sameChild(ca.left, cb.left) && sameChild(ca.right, cb.right);
        }

        case ExprKind::Unary:
        {
            const auto &ua = static_cast<const UnaryExpr &>(a);
            const auto &ub = static_cast<const UnaryExpr &>(b);
            return ua.op == ub.op && sameChild(ua.operand, ub.operand);
        }

        case ExprKind::Call:
        {
            const auto &ca = static_cast<const CallExpr &>(a);
            const auto &cb = static_cast<const CallExpr &>(b);
            if (ca.callee != cb.callee || ca.args.size() != cb.args.size())
                return false;
            for (size_t i = 0; i < ca.args.size(); ++i)
            {
                if (!sameChild(ca.args[i], cb.args[i]))
                    return false;
            }
            return true;
        }

        case ExprKind::Range:
            return sameChild(static_cast<const RangeExpr &>(a).bound,
                             static_cast<const RangeExpr &>(b).bound);
    }
    return false;
}

} // namespace lion::frontends::lioncode
