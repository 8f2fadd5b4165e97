//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Analyzer_Stmt.cpp
/// @brief Statement rules of the LionCode semantic analyzer.
///
/// @details Scoping summary:
/// - each `if`/`else`/`otherwise` block is its own scope;
/// - a function body shares one scope with the parameters and resets the flags
///   to inFunction=true, inLoop=false;
/// - a loop body shares one scope with the loop variable and sets inLoop=true;
///   the range bound is analyzed in the enclosing scope.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Analyzer.hpp"

#include "frontends/lioncode/Builder.hpp"

#include <optional>

namespace lion::frontends::lioncode
{

bool Analyzer::analyzeStatements(const std::vector<SynStmtPtr> &stmts, StmtList &out)
{
    for (const auto &stmt : stmts)
    {
        StmtPtr analyzed = analyzeStmt(*stmt);
        if (!analyzed)
            return false;
        out.push_back(std::move(analyzed));
    }
    return true;
}

BlockPtr Analyzer::analyzeNestedBlock(const SynBlock &block)
{
    pushScope(currentScope_->inLoop(), currentScope_->inFunction());
    StmtList statements;
    bool ok = analyzeStatements(block.statements, statements);
    popScope();

    if (!ok)
        return nullptr;
    return build::block(block.loc, std::move(statements));
}

StmtPtr Analyzer::analyzeStmt(const SynStmt &stmt)
{
    switch (stmt.kind)
    {
        case SynStmtKind::Print:
            return analyzePrint(static_cast<const SynPrint &>(stmt));
        case SynStmtKind::Assign:
            return analyzeAssign(static_cast<const SynAssign &>(stmt));
        case SynStmtKind::Function:
            return analyzeFunction(static_cast<const SynFunction &>(stmt));
        case SynStmtKind::Return:
            return analyzeReturn(static_cast<const SynReturn &>(stmt));
        case SynStmtKind::If:
            return analyzeIf(static_cast<const SynIf &>(stmt));
        case SynStmtKind::Loop:
            return analyzeLoop(static_cast<const SynLoop &>(stmt));
        case SynStmtKind::Break:
            return analyzeBreak(static_cast<const SynBreak &>(stmt));
        case SynStmtKind::Comment:
        {
            const auto &c = static_cast<const SynComment &>(stmt);
            return build::comment(c.loc, c.text);
        }
        case SynStmtKind::Expression:
        {
            const auto &e = static_cast<const SynExprStmt &>(stmt);
            ExprPtr expr = analyzeExpr(*e.expr);
            if (!expr)
                return nullptr;
            return build::expression(e.loc, std::move(expr));
        }
    }
    return nullptr;
}

StmtPtr Analyzer::analyzePrint(const SynPrint &stmt)
{
    ExprPtr value = analyzeExpr(*stmt.value);
    if (!value)
        return nullptr;
    return build::print(stmt.loc, std::move(value));
}

StmtPtr Analyzer::analyzeAssign(const SynAssign &stmt)
{
    if (stmt.target->kind != SynExprKind::Identifier)
    {
        error(stmt.target->loc, "Cannot assign to expression");
        return nullptr;
    }
    const auto &target = static_cast<const SynIdentifier &>(*stmt.target);

    ExprPtr value = analyzeExpr(*stmt.value);
    if (!value)
        return nullptr;

    Symbol *sym = currentScope_->lookup(target.name);

    // Builtins live in the prelude and may be shadowed.
    if (!sym || sym->kind == Symbol::Kind::Builtin)
    {
        const Type declared = value->type;
        Symbol var;
        var.kind = Symbol::Kind::Variable;
        var.name = target.name;
        var.type = declared;
        currentScope_->define(target.name, std::move(var));
        IdentifierPtr id = build::identifier(target.loc, target.name, declared);
        return build::assignment(stmt.loc, std::move(id), std::move(value), true);
    }

    switch (sym->kind)
    {
        case Symbol::Kind::Function:
            error(stmt.loc, "Assignment to immutable variable");
            return nullptr;
        case Symbol::Kind::LoopVariable:
            error(stmt.loc, "Cannot reassign loop variable");
            return nullptr;
        default:
            break;
    }

    if (isKnown(sym->type) && isKnown(value->type) && sym->type != value->type)
    {
        error(stmt.loc, "Operands must have the same type");
        return nullptr;
    }
    if (!isKnown(sym->type))
        sym->type = value->type;

    return build::assignment(
        stmt.loc, build::identifier(target.loc, target.name, sym->type), std::move(value), false);
}

StmtPtr Analyzer::analyzeFunction(const SynFunction &stmt)
{
    if (currentScope_->lookupLocal(stmt.name))
    {
        error(stmt.loc, "Variable already declared: " + stmt.name);
        return nullptr;
    }

    // Registered before the body so recursive calls resolve.
    Symbol fn;
    fn.kind = Symbol::Kind::Function;
    fn.name = stmt.name;
    fn.paramCount = stmt.params.size();
    currentScope_->define(stmt.name, std::move(fn));
    Symbol *fnSym = currentScope_->lookupLocal(stmt.name);

    pushScope(false, true);

    std::vector<std::string> params;
    bool ok = true;
    for (const auto &param : stmt.params)
    {
        if (currentScope_->lookupLocal(param.name))
        {
            error(param.loc, "Variable already declared: " + param.name);
            ok = false;
            break;
        }
        Symbol p;
        p.kind = Symbol::Kind::Parameter;
        p.name = param.name;
        p.type = Type::Number;
        currentScope_->define(param.name, std::move(p));
        params.push_back(param.name);
    }

    StmtList body;
    if (ok)
    {
        Symbol *savedFunction = currentFunction_;
        currentFunction_ = fnSym;
        ok = analyzeStatements(stmt.body.statements, body);
        currentFunction_ = savedFunction;
    }

    popScope();

    if (!ok)
        return nullptr;
    return build::function(stmt.loc,
                           stmt.name,
                           std::move(params),
                           build::block(stmt.body.loc, std::move(body)),
                           fnSym->returnType);
}

StmtPtr Analyzer::analyzeReturn(const SynReturn &stmt)
{
    if (!currentScope_->inFunction())
    {
        error(stmt.loc, "Return statement outside function");
        return nullptr;
    }

    ExprPtr value = analyzeExpr(*stmt.value);
    if (!value)
        return nullptr;

    if (currentFunction_ && !isKnown(currentFunction_->returnType))
        currentFunction_->returnType = value->type;

    return build::returnStmt(stmt.loc, std::move(value));
}

StmtPtr Analyzer::analyzeBreak(const SynBreak &stmt)
{
    if (!currentScope_->inLoop())
    {
        error(stmt.loc, "Break can only appear in a loop");
        return nullptr;
    }
    return build::breakStmt(stmt.loc);
}

namespace
{
/// @brief What the last statement of a block produces, for branch agreement.
struct TerminalValue
{
    std::string key; ///< "=name" for an assignment, "serve" for a return
    Type type;
};

std::optional<TerminalValue> terminalValue(const BlockStmt &block)
{
    if (block.statements.empty())
        return std::nullopt;
    const Stmt &last = *block.statements.back();
    if (last.kind == StmtKind::Assignment)
    {
        const auto &a = static_cast<const AssignmentStmt &>(last);
        return TerminalValue{"=" + a.target->name, a.value->type};
    }
    if (last.kind == StmtKind::Return)
        return TerminalValue{"serve", static_cast<const ReturnStmt &>(last).value->type};
    return std::nullopt;
}
} // namespace

bool Analyzer::checkBranchTypes(SourceLoc loc, const BlockStmt &branch, const BlockStmt &otherwise)
{
    auto a = terminalValue(branch);
    auto b = terminalValue(otherwise);
    if (!a || !b || a->key != b->key)
        return true;
    if (isKnown(a->type) && isKnown(b->type) && a->type != b->type)
    {
        error(loc, "Mismatched types in if-else branches");
        return false;
    }
    return true;
}

StmtPtr Analyzer::analyzeIf(const SynIf &stmt)
{
    struct Arm
    {
        SourceLoc loc;
        ExprPtr condition;
        BlockPtr block;
    };

    std::vector<Arm> arms;
    for (const auto &branch : stmt.branches)
    {
        ExprPtr condition = analyzeExpr(*branch.condition);
        if (!condition)
            return nullptr;
        BlockPtr block = analyzeNestedBlock(branch.block);
        if (!block)
            return nullptr;
        arms.push_back(Arm{branch.loc, std::move(condition), std::move(block)});
    }

    BlockPtr otherwise;
    if (stmt.otherwise)
    {
        otherwise = analyzeNestedBlock(*stmt.otherwise);
        if (!otherwise)
            return nullptr;

        for (const auto &arm : arms)
        {
            if (!checkBranchTypes(stmt.loc, *arm.block, *otherwise))
                return nullptr;
        }
    }

    // Link the chain from the back: the last arm's alternate is `otherwise`.
    StmtPtr chain = otherwise;
    for (auto it = arms.rbegin(); it != arms.rend(); ++it)
        chain = build::ifStmt(it->loc, std::move(it->condition), std::move(it->block), std::move(chain));
    return chain;
}

namespace
{
/// @brief True for a literal negative number, written `-5` or folded.
bool isNegativeLiteral(const Expr &e)
{
    if (e.kind == ExprKind::NumberLiteral)
        return static_cast<const NumberLiteralExpr &>(e).value < 0;
    if (e.kind == ExprKind::Unary)
    {
        const auto &u = static_cast<const UnaryExpr &>(e);
        if (u.op == UnaryOp::Neg && u.operand->kind == ExprKind::NumberLiteral)
            return static_cast<const NumberLiteralExpr &>(*u.operand).value > 0;
    }
    return false;
}
} // namespace

StmtPtr Analyzer::analyzeLoop(const SynLoop &stmt)
{
    if (stmt.variable->kind != SynExprKind::Identifier)
    {
        error(stmt.variable->loc, "Invalid loop variable");
        return nullptr;
    }
    const auto &variable = static_cast<const SynIdentifier &>(*stmt.variable);

    ExprPtr bound = analyzeExpr(*stmt.bound);
    if (!bound)
        return nullptr;

    if (isKnown(bound->type) && bound->type != Type::Number)
    {
        error(stmt.bound->loc, "Range bound must be a number");
        return nullptr;
    }
    if (isNegativeLiteral(*bound))
    {
        error(stmt.bound->loc, "Range requires non-negative value");
        return nullptr;
    }

    pushScope(true, currentScope_->inFunction());

    Symbol var;
    var.kind = Symbol::Kind::LoopVariable;
    var.name = variable.name;
    var.type = Type::Number;
    currentScope_->define(variable.name, std::move(var));

    StmtList body;
    bool ok = analyzeStatements(stmt.body.statements, body);

    popScope();

    if (!ok)
        return nullptr;
    return build::whileStmt(stmt.loc,
                            build::identifier(variable.loc, variable.name, Type::Number),
                            build::range(stmt.rangeLoc, std::move(bound)),
                            build::block(stmt.body.loc, std::move(body)));
}

} // namespace lion::frontends::lioncode
