//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Node factories and the operator typing rules of LionCode.
//
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Builder.hpp"

#include "frontends/lioncode/DiagCodes.hpp"

namespace lion::frontends::lioncode::build
{

namespace
{

lion::support::Diag typeError(SourceLoc loc, std::string message)
{
    return lion::support::makeError(loc, std::move(message), diag_codes::kSemantic);
}

std::string cannotApply(const char *op, Type left, Type right)
{
    return std::string("Cannot apply ") + op + " to " + toString(left) + " and " + toString(right);
}

bool isZeroLiteral(const Expr &e)
{
    return e.kind == ExprKind::NumberLiteral && static_cast<const NumberLiteralExpr &>(e).value == 0.0;
}

/// @brief Result type of @p op applied to operands typed @p l and @p r.
Expected<Type> binaryType(SourceLoc loc, BinaryOp op, const Expr &left, const Expr &right)
{
    const Type l = left.type;
    const Type r = right.type;

    switch (op)
    {
        case BinaryOp::Add:
            if (l == Type::String || r == Type::String)
                return Type::String;
            if (l == Type::Boolean || r == Type::Boolean)
                return typeError(loc, cannotApply("+", l, r));
            if (!isKnown(l) || !isKnown(r))
                return Type::Unknown;
            return Type::Number;

        case BinaryOp::Sub:
        case BinaryOp::Mul:
        case BinaryOp::Div:
            if ((isKnown(l) && l != Type::Number) || (isKnown(r) && r != Type::Number))
                return typeError(loc, cannotApply(toString(op), l, r));
            if (op == BinaryOp::Div && isZeroLiteral(right))
                return typeError(loc, "Cannot divide by zero");
            if (!isKnown(l) || !isKnown(r))
                return Type::Unknown;
            return Type::Number;

        case BinaryOp::Mod:
            if ((isKnown(l) && l != Type::Number) || (isKnown(r) && r != Type::Number))
                return typeError(loc, "Modulus requires number operands");
            if (!isKnown(l) || !isKnown(r))
                return Type::Unknown;
            return Type::Number;

        case BinaryOp::And:
        case BinaryOp::Or:
            if ((isKnown(l) && l != Type::Boolean) || (isKnown(r) && r != Type::Boolean))
                return typeError(loc, cannotApply(toString(op), l, r));
            return Type::Boolean;

        case BinaryOp::Shl:
        case BinaryOp::Shr:
            return Type::Number;
    }
    return Type::Unknown;
}

} // namespace

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

ExprPtr number(SourceLoc loc, double value)
{
    return std::make_shared<NumberLiteralExpr>(loc, value);
}

ExprPtr string(SourceLoc loc, std::string value)
{
    return std::make_shared<StringLiteralExpr>(loc, std::move(value));
}

ExprPtr interpolated(SourceLoc loc, std::vector<StringSegment> segments)
{
    std::vector<StringSegment> merged;
    bool hasExpr = false;
    for (auto &segment : segments)
    {
        if (segment.expr)
        {
            hasExpr = true;
            merged.push_back(std::move(segment));
            continue;
        }
        if (segment.text.empty())
            continue;
        if (!merged.empty() && !merged.back().expr)
            merged.back().text += segment.text;
        else
            merged.push_back(std::move(segment));
    }

    if (!hasExpr)
        return string(loc, merged.empty() ? std::string() : std::move(merged.front().text));
    return std::make_shared<StringLiteralExpr>(loc, std::move(merged));
}

ExprPtr boolean(SourceLoc loc, bool value)
{
    return std::make_shared<BooleanLiteralExpr>(loc, value);
}

IdentifierPtr identifier(SourceLoc loc, std::string name, Type type, bool isFunction)
{
    return std::make_shared<IdentifierExpr>(loc, std::move(name), type, isFunction);
}

ExprPtr binary(SourceLoc loc, BinaryOp op, ExprPtr left, ExprPtr right, Type type)
{
    return std::make_shared<BinaryExpr>(loc, op, std::move(left), std::move(right), type);
}

ExprPtr comparison(SourceLoc loc, CompareOp op, ExprPtr left, ExprPtr right)
{
    return std::make_shared<ComparisonExpr>(loc, op, std::move(left), std::move(right));
}

ExprPtr unary(SourceLoc loc, UnaryOp op, ExprPtr operand, Type type)
{
    return std::make_shared<UnaryExpr>(loc, op, std::move(operand), type);
}

ExprPtr call(SourceLoc loc, std::string callee, std::vector<ExprPtr> args, Type type, bool isBuiltin)
{
    return std::make_shared<CallExpr>(loc, std::move(callee), std::move(args), type, isBuiltin);
}

RangePtr range(SourceLoc loc, ExprPtr bound)
{
    return std::make_shared<RangeExpr>(loc, std::move(bound));
}

Expected<ExprPtr> checkBinary(SourceLoc loc, BinaryOp op, ExprPtr left, ExprPtr right)
{
    auto type = binaryType(loc, op, *left, *right);
    if (!type)
        return type.error();
    return binary(loc, op, std::move(left), std::move(right), type.value());
}

Expected<ExprPtr> checkComparison(SourceLoc loc, CompareOp op, ExprPtr left, ExprPtr right)
{
    if (!isEquality(op))
    {
        const Type l = left->type;
        const Type r = right->type;
        const bool ordered = (l == Type::Number || l == Type::String) && (l == r);
        if (isKnown(l) && isKnown(r) && !ordered)
            return typeError(loc, "Expected number or string");
        if ((isKnown(l) && l == Type::Boolean) || (isKnown(r) && r == Type::Boolean))
            return typeError(loc, "Expected number or string");
    }
    return comparison(loc, op, std::move(left), std::move(right));
}

Expected<ExprPtr> checkUnary(SourceLoc loc, UnaryOp op, ExprPtr operand)
{
    const Type t = operand->type;
    const Type wanted = op == UnaryOp::Neg ? Type::Number : Type::Boolean;
    if (isKnown(t) && t != wanted)
        return typeError(loc, std::string("Cannot apply ") + toString(op) + " to " + toString(t));

    Type result = op == UnaryOp::Not ? Type::Boolean : t;
    return unary(loc, op, std::move(operand), result);
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

BlockPtr block(SourceLoc loc, StmtList statements)
{
    return std::make_shared<BlockStmt>(loc, std::move(statements));
}

StmtPtr assignment(SourceLoc loc, IdentifierPtr target, ExprPtr value, bool isDeclaration)
{
    return std::make_shared<AssignmentStmt>(loc, std::move(target), std::move(value), isDeclaration);
}

StmtPtr print(SourceLoc loc, ExprPtr value)
{
    return std::make_shared<PrintStmt>(loc, std::move(value));
}

StmtPtr function(SourceLoc loc,
                 std::string name,
                 std::vector<std::string> params,
                 BlockPtr body,
                 Type returnType)
{
    return std::make_shared<FunctionDeclStmt>(
        loc, std::move(name), std::move(params), std::move(body), returnType);
}

StmtPtr returnStmt(SourceLoc loc, ExprPtr value)
{
    return std::make_shared<ReturnStmt>(loc, std::move(value));
}

StmtPtr ifStmt(SourceLoc loc, ExprPtr condition, BlockPtr consequent, StmtPtr alternate)
{
    return std::make_shared<IfStmt>(loc, std::move(condition), std::move(consequent), std::move(alternate));
}

StmtPtr whileStmt(SourceLoc loc, IdentifierPtr variable, RangePtr range, BlockPtr body)
{
    return std::make_shared<WhileStmt>(loc, std::move(variable), std::move(range), std::move(body));
}

StmtPtr breakStmt(SourceLoc loc)
{
    return std::make_shared<BreakStmt>(loc);
}

StmtPtr comment(SourceLoc loc, std::string text)
{
    return std::make_shared<CommentStmt>(loc, std::move(text));
}

StmtPtr expression(SourceLoc loc, ExprPtr expr)
{
    return std::make_shared<ExpressionStmt>(loc, std::move(expr));
}

ProgramPtr program(StmtList statements)
{
    auto p = std::make_shared<Program>();
    p->statements = std::move(statements);
    return p;
}

} // namespace lion::frontends::lioncode::build
