//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file AstPrinter.cpp
/// @brief Implements the LionCode AST tree-walking printer.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/AstPrinter.hpp"

#include "support/number_format.hpp"

#include <sstream>

namespace lion::frontends::lioncode
{

namespace
{

struct Printer
{
    std::ostream &os;
    int indent = 0;

    void line(const std::string &text)
    {
        for (int i = 0; i < indent; ++i)
            os << "  ";
        os << text << '\n';
    }

    void push()
    {
        ++indent;
    }

    void pop()
    {
        --indent;
    }
};

static void printStmt(const Stmt &stmt, Printer &p);
static void printExpr(const Expr &expr, Printer &p);

/// @brief Format a source location as "(line:col)".
static std::string locStr(const SourceLoc &loc)
{
    std::ostringstream s;
    s << "(" << loc.line << ":" << loc.column << ")";
    return s.str();
}

static std::string quoted(const std::string &text)
{
    return "\"" + text + "\"";
}

static void printBlock(const char *label, const BlockStmt &block, Printer &p)
{
    p.line(label);
    p.push();
    for (const auto &stmt : block.statements)
        printStmt(*stmt, p);
    p.pop();
}

static void printExpr(const Expr &expr, Printer &p)
{
    std::string head = toString(expr.kind);
    switch (expr.kind)
    {
        case ExprKind::NumberLiteral:
            head += " " + lion::support::formatNumber(static_cast<const NumberLiteralExpr &>(expr).value);
            break;
        case ExprKind::StringLiteral:
        {
            const auto &s = static_cast<const StringLiteralExpr &>(expr);
            head += s.isInterpolated() ? " interpolated" : " " + quoted(s.value);
            break;
        }
        case ExprKind::BooleanLiteral:
            head += static_cast<const BooleanLiteralExpr &>(expr).value ? " true" : " false";
            break;
        case ExprKind::Identifier:
        {
            const auto &id = static_cast<const IdentifierExpr &>(expr);
            head += " " + quoted(id.name);
            if (id.isFunction)
                head += " function";
            break;
        }
        case ExprKind::Binary:
            head += std::string(" (") + toString(static_cast<const BinaryExpr &>(expr).op) + ")";
            break;
        case ExprKind::Comparison:
            head += std::string(" (") + toString(static_cast<const ComparisonExpr &>(expr).op) + ")";
            break;
        case ExprKind::Unary:
            head += std::string(" (") + toString(static_cast<const UnaryExpr &>(expr).op) + ")";
            break;
        case ExprKind::Call:
        {
            const auto &c = static_cast<const CallExpr &>(expr);
            head += " " + quoted(c.callee);
            if (c.isBuiltin)
                head += " builtin";
            break;
        }
        case ExprKind::Range:
            break;
    }
    p.line(head + " : " + toString(expr.type) + " " + locStr(expr.loc));

    p.push();
    switch (expr.kind)
    {
        case ExprKind::StringLiteral:
            for (const auto &segment : static_cast<const StringLiteralExpr &>(expr).segments)
            {
                if (segment.expr)
                    printExpr(*segment.expr, p);
                else
                    p.line("Text " + quoted(segment.text));
            }
            break;
        case ExprKind::Binary:
        {
            const auto &b = static_cast<const BinaryExpr &>(expr);
            printExpr(*b.left, p);
            printExpr(*b.right, p);
            break;
        }
        case ExprKind::Comparison:
        {
            const auto &c = static_cast<const ComparisonExpr &>(expr);
            printExpr(*c.left, p);
            printExpr(*c.right, p);
            break;
        }
        case ExprKind::Unary:
            printExpr(*static_cast<const UnaryExpr &>(expr).operand, p);
            break;
        case ExprKind::Call:
            for (const auto &arg : static_cast<const CallExpr &>(expr).args)
                printExpr(*arg, p);
            break;
        case ExprKind::Range:
            printExpr(*static_cast<const RangeExpr &>(expr).bound, p);
            break;
        default:
            break;
    }
    p.pop();
}

static void printStmt(const Stmt &stmt, Printer &p)
{
    const std::string loc = locStr(stmt.loc);
    switch (stmt.kind)
    {
        case StmtKind::Block:
            printBlock(("Block " + loc).c_str(), static_cast<const BlockStmt &>(stmt), p);
            return;
        case StmtKind::Assignment:
        {
            const auto &a = static_cast<const AssignmentStmt &>(stmt);
            p.line(std::string("AssignmentStatement ") + (a.isDeclaration ? "let " : "") + loc);
            p.push();
            printExpr(*a.target, p);
            printExpr(*a.value, p);
            p.pop();
            return;
        }
        case StmtKind::Print:
            p.line("PrintStatement " + loc);
            p.push();
            printExpr(*static_cast<const PrintStmt &>(stmt).value, p);
            p.pop();
            return;
        case StmtKind::FunctionDecl:
        {
            const auto &f = static_cast<const FunctionDeclStmt &>(stmt);
            p.line("FunctionDeclaration " + quoted(f.name) + " : " + toString(f.returnType) + " " + loc);
            p.push();
            std::string params = "Params:";
            for (const auto &param : f.params)
                params += " " + param;
            p.line(params);
            printBlock("Body:", *f.body, p);
            p.pop();
            return;
        }
        case StmtKind::Return:
            p.line("ReturnStatement " + loc);
            p.push();
            printExpr(*static_cast<const ReturnStmt &>(stmt).value, p);
            p.pop();
            return;
        case StmtKind::If:
        {
            const auto &i = static_cast<const IfStmt &>(stmt);
            p.line("IfStatement " + loc);
            p.push();
            printExpr(*i.condition, p);
            printBlock("Then:", *i.consequent, p);
            if (i.alternate)
            {
                p.line("Else:");
                p.push();
                printStmt(*i.alternate, p);
                p.pop();
            }
            p.pop();
            return;
        }
        case StmtKind::While:
        {
            const auto &w = static_cast<const WhileStmt &>(stmt);
            p.line("WhileStatement " + loc);
            p.push();
            printExpr(*w.variable, p);
            printExpr(*w.range, p);
            printBlock("Body:", *w.body, p);
            p.pop();
            return;
        }
        case StmtKind::Break:
            p.line("BreakStatement " + loc);
            return;
        case StmtKind::Comment:
            p.line("Comment " + quoted(static_cast<const CommentStmt &>(stmt).text) + " " + loc);
            return;
        case StmtKind::Expression:
            p.line("ExpressionStatement " + loc);
            p.push();
            printExpr(*static_cast<const ExpressionStmt &>(stmt).expr, p);
            p.pop();
            return;
    }
}

} // namespace

std::string AstPrinter::dump(const Program &program)
{
    std::ostringstream os;
    Printer p{os};
    p.line("Program");
    p.push();
    for (const auto &stmt : program.statements)
        printStmt(*stmt, p);
    return os.str();
}

std::string AstPrinter::dump(const Expr &expr)
{
    std::ostringstream os;
    Printer p{os};
    printExpr(expr, p);
    return os.str();
}

} // namespace lion::frontends::lioncode
