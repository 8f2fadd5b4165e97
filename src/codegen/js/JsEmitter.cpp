//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: codegen/js/JsEmitter.cpp
// Purpose: JavaScript rendering of LionCode statements and expressions.
// Key invariants: Declarations are named through NameTable before any
//                 reference to them is rendered; the range bound of a loop is
//                 rendered in the scope enclosing the loop.
// Ownership/Lifetime: See JsEmitter.hpp.
//
//===----------------------------------------------------------------------===//

#include "codegen/js/JsEmitter.hpp"

#include "support/number_format.hpp"

#include <cstdio>

using namespace lion::frontends::lioncode;

namespace lion::codegen::js
{

namespace
{

/// @brief Escape one character for a JavaScript string or template literal.
/// @return True when @p c was escaped into @p out.
bool escapeCommon(char c, std::string &out)
{
    switch (c)
    {
        case '\\':
            out += "\\\\";
            return true;
        case '\n':
            out += "\\n";
            return true;
        case '\t':
            out += "\\t";
            return true;
        case '\r':
            out += "\\r";
            return true;
        default:
            break;
    }
    const auto u = static_cast<unsigned char>(c);
    if (u < 0x20 || u == 0x7f)
    {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\x%02x", u);
        out += buf;
        return true;
    }
    return false;
}

/// @brief Escape literal text placed between the backticks of a template.
std::string escapeTemplateText(const std::string &text)
{
    std::string out;
    for (size_t i = 0; i < text.size(); ++i)
    {
        const char c = text[i];
        if (escapeCommon(c, out))
            continue;
        if (c == '`')
            out += "\\`";
        else if (c == '$' && i + 1 < text.size() && text[i + 1] == '{')
            out += "\\$";
        else
            out += c;
    }
    return out;
}

const char *jsOperator(BinaryOp op)
{
    switch (op)
    {
        case BinaryOp::And:
            return "&&";
        case BinaryOp::Or:
            return "||";
        default:
            return toString(op);
    }
}

const char *jsOperator(CompareOp op)
{
    switch (canonical(op))
    {
        case CompareOp::Eq:
            return "===";
        case CompareOp::Ne:
            return "!==";
        default:
            return toString(canonical(op));
    }
}

bool isBuiltinName(const std::string &name)
{
    return name == "sqrt" || name == "abs" || name == "floor" || name == "ceil";
}

} // namespace

std::string JsEmitter::quote(const std::string &text)
{
    std::string out = "\"";
    for (char c : text)
    {
        if (escapeCommon(c, out))
            continue;
        if (c == '"')
            out += "\\\"";
        else
            out += c;
    }
    out += '"';
    return out;
}

std::string JsEmitter::emit(const Program &program)
{
    lines_.clear();
    indent_ = 0;
    names_.reset();

    emitStatements(program.statements);

    std::string out;
    for (size_t i = 0; i < lines_.size(); ++i)
    {
        if (i != 0)
            out += '\n';
        out += lines_[i];
    }
    return out;
}

void JsEmitter::line(const std::string &text)
{
    lines_.push_back(std::string(indent_ * 2, ' ') + text);
}

//===----------------------------------------------------------------------===//
// Statements
//===----------------------------------------------------------------------===//

void JsEmitter::emitStatements(const StmtList &statements)
{
    for (const auto &stmt : statements)
        emitStmt(*stmt);
}

void JsEmitter::emitScopedBlock(const BlockStmt &block)
{
    NameTable::ScopedScope scope(names_);
    ++indent_;
    emitStatements(block.statements);
    --indent_;
}

void JsEmitter::emitStmt(const Stmt &stmt)
{
    switch (stmt.kind)
    {
        case StmtKind::Block:
            line("{");
            emitScopedBlock(static_cast<const BlockStmt &>(stmt));
            line("}");
            return;
        case StmtKind::Assignment:
            emitAssignment(static_cast<const AssignmentStmt &>(stmt));
            return;
        case StmtKind::Print:
            line("console.log(" + emitExpr(*static_cast<const PrintStmt &>(stmt).value) + ");");
            return;
        case StmtKind::FunctionDecl:
            emitFunction(static_cast<const FunctionDeclStmt &>(stmt));
            return;
        case StmtKind::Return:
            line("return " + emitExpr(*static_cast<const ReturnStmt &>(stmt).value) + ";");
            return;
        case StmtKind::If:
            emitIf(static_cast<const IfStmt &>(stmt));
            return;
        case StmtKind::While:
            emitWhile(static_cast<const WhileStmt &>(stmt));
            return;
        case StmtKind::Break:
            line("break;");
            return;
        case StmtKind::Comment:
            line("// " + static_cast<const CommentStmt &>(stmt).text);
            return;
        case StmtKind::Expression:
            line(emitExpr(*static_cast<const ExpressionStmt &>(stmt).expr) + ";");
            return;
    }
}

void JsEmitter::emitAssignment(const AssignmentStmt &stmt)
{
    std::string value = emitExpr(*stmt.value);
    if (stmt.isDeclaration)
    {
        line("let " + names_.declare(stmt.target->name) + " = " + value + ";");
        return;
    }
    line(emitIdentifier(*stmt.target) + " = " + value + ";");
}

void JsEmitter::emitFunction(const FunctionDeclStmt &stmt)
{
    const std::string name = names_.declare(stmt.name);

    NameTable::ScopedScope scope(names_);
    std::string params;
    for (size_t i = 0; i < stmt.params.size(); ++i)
    {
        if (i != 0)
            params += ", ";
        params += names_.declare(stmt.params[i]);
    }

    line("function " + name + "(" + params + ") {");
    ++indent_;
    emitStatements(stmt.body->statements);
    --indent_;
    line("}");
}

void JsEmitter::emitIf(const IfStmt &stmt)
{
    line("if (" + emitExpr(*stmt.condition) + ") {");
    emitScopedBlock(*stmt.consequent);

    const Stmt *alternate = stmt.alternate.get();
    while (alternate)
    {
        if (alternate->kind == StmtKind::If)
        {
            const auto &elseIf = static_cast<const IfStmt &>(*alternate);
            line("} else if (" + emitExpr(*elseIf.condition) + ") {");
            emitScopedBlock(*elseIf.consequent);
            alternate = elseIf.alternate.get();
            continue;
        }
        line("} else {");
        emitScopedBlock(static_cast<const BlockStmt &>(*alternate));
        break;
    }
    line("}");
}

void JsEmitter::emitWhile(const WhileStmt &stmt)
{
    const Expr &bound = *stmt.range->bound;
    std::string limit = emitExpr(bound);

    NameTable::ScopedScope scope(names_);
    const std::string var = names_.declare(stmt.variable->name);

    if (bound.kind == ExprKind::NumberLiteral)
    {
        line("for (let " + var + " = 0; " + var + " < " + limit + "; " + var + "++) {");
    }
    else
    {
        const std::string limitName = names_.declare(var + "_limit");
        line("for (let " + var + " = 0, " + limitName + " = " + limit + "; " + var + " < " +
             limitName + "; " + var + "++) {");
    }

    ++indent_;
    emitStatements(stmt.body->statements);
    --indent_;
    line("}");
}

//===----------------------------------------------------------------------===//
// Expressions
//===----------------------------------------------------------------------===//

std::string JsEmitter::emitExpr(const Expr &expr)
{
    switch (expr.kind)
    {
        case ExprKind::NumberLiteral:
            return lion::support::formatNumber(static_cast<const NumberLiteralExpr &>(expr).value);
        case ExprKind::StringLiteral:
            return emitString(static_cast<const StringLiteralExpr &>(expr));
        case ExprKind::BooleanLiteral:
            return static_cast<const BooleanLiteralExpr &>(expr).value ? "true" : "false";
        case ExprKind::Identifier:
            return emitIdentifier(static_cast<const IdentifierExpr &>(expr));
        case ExprKind::Binary:
            return emitBinary(static_cast<const BinaryExpr &>(expr));
        case ExprKind::Comparison:
            return emitComparison(static_cast<const ComparisonExpr &>(expr));
        case ExprKind::Unary:
            return emitUnary(static_cast<const UnaryExpr &>(expr));
        case ExprKind::Call:
            return emitCall(static_cast<const CallExpr &>(expr));
        case ExprKind::Range:
            return emitExpr(*static_cast<const RangeExpr &>(expr).bound);
    }
    return {};
}

std::string JsEmitter::emitBinary(const BinaryExpr &expr)
{
    return "(" + emitExpr(*expr.left) + " " + jsOperator(expr.op) + " " + emitExpr(*expr.right) + ")";
}

std::string JsEmitter::emitComparison(const ComparisonExpr &expr)
{
    return "(" + emitExpr(*expr.left) + " " + jsOperator(expr.op) + " " + emitExpr(*expr.right) + ")";
}

std::string JsEmitter::emitUnary(const UnaryExpr &expr)
{
    std::string operand = emitExpr(*expr.operand);
    // `--5` would lex as a decrement.
    if (expr.op == UnaryOp::Neg && !operand.empty() && operand.front() == '-')
        return "(- " + operand + ")";
    return std::string("(") + toString(expr.op) + operand + ")";
}

std::string JsEmitter::emitCall(const CallExpr &expr)
{
    std::string out;
    if (expr.isBuiltin)
    {
        out = "Math." + expr.callee;
    }
    else
    {
        auto resolved = names_.resolve(expr.callee);
        out = resolved ? *resolved : expr.callee;
    }

    out += "(";
    for (size_t i = 0; i < expr.args.size(); ++i)
    {
        if (i != 0)
            out += ", ";
        out += emitExpr(*expr.args[i]);
    }
    out += ")";
    return out;
}

std::string JsEmitter::emitString(const StringLiteralExpr &expr)
{
    if (!expr.isInterpolated())
        return quote(expr.value);

    std::string out = "`";
    for (const auto &segment : expr.segments)
    {
        if (segment.expr)
            out += "${" + emitExpr(*segment.expr) + "}";
        else
            out += escapeTemplateText(segment.text);
    }
    out += "`";
    return out;
}

std::string JsEmitter::emitIdentifier(const IdentifierExpr &expr) const
{
    if (auto resolved = names_.resolve(expr.name))
        return *resolved;
    if (expr.isFunction && isBuiltinName(expr.name))
        return "Math." + expr.name;
    return expr.name;
}

} // namespace lion::codegen::js
