//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Analyzer.cpp
/// @brief Scope handling, builtins and the entry point of the LionCode
///        semantic analyzer.
///
/// @details The scope chain at the start of analysis is:
/// ```
/// prelude   sqrt abs floor ceil        (inLoop=false, inFunction=false)
///   program top-level names
///     ...   one frame per block, function body or loop body
/// ```
/// User code may shadow the builtins because assignment only refuses to
/// rebind names declared by `ignite`.
///
/// Statement rules are in Analyzer_Stmt.cpp, expression rules in
/// Analyzer_Expr.cpp.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Analyzer.hpp"

#include "frontends/lioncode/Builder.hpp"
#include "frontends/lioncode/DiagCodes.hpp"

namespace lion::frontends::lioncode
{

//=============================================================================
// Scope Implementation
//=============================================================================

void Scope::define(const std::string &name, Symbol symbol)
{
    symbols_[name] = std::move(symbol);
}

Symbol *Scope::lookup(const std::string &name)
{
    auto it = symbols_.find(name);
    if (it != symbols_.end())
        return &it->second;
    if (parent_)
        return parent_->lookup(name);
    return nullptr;
}

Symbol *Scope::lookupLocal(const std::string &name)
{
    auto it = symbols_.find(name);
    return it != symbols_.end() ? &it->second : nullptr;
}

//=============================================================================
// Analyzer Implementation
//=============================================================================

Analyzer::Analyzer(lion::support::DiagnosticEngine &diag) : diag_(diag)
{
    pushScope(false, false);
    registerBuiltins();
}

ProgramPtr Analyzer::analyzeProgram(const ParseTree &tree)
{
    pushScope(false, false);

    StmtList statements;
    bool ok = analyzeStatements(tree.statements, statements);

    popScope();

    if (!ok || hasError_)
        return nullptr;
    return build::program(std::move(statements));
}

void Analyzer::pushScope(bool inLoop, bool inFunction)
{
    scopes_.push_back(std::make_unique<Scope>(currentScope_, inLoop, inFunction));
    currentScope_ = scopes_.back().get();
}

void Analyzer::popScope()
{
    currentScope_ = currentScope_->parent();
    scopes_.pop_back();
}

void Analyzer::registerBuiltins()
{
    for (const char *name : {"sqrt", "abs", "floor", "ceil"})
    {
        Symbol sym;
        sym.kind = Symbol::Kind::Builtin;
        sym.name = name;
        sym.paramCount = 1;
        sym.returnType = Type::Number;
        currentScope_->define(name, std::move(sym));
    }
}

void Analyzer::error(SourceLoc loc, const std::string &message)
{
    if (hasError_)
        return;
    hasError_ = true;
    diag_.report({lion::support::Severity::Error, message, loc, diag_codes::kSemantic});
}

ExprPtr Analyzer::take(lion::support::Expected<ExprPtr> result)
{
    if (!result)
    {
        if (!hasError_)
        {
            hasError_ = true;
            diag_.report(result.error());
        }
        return nullptr;
    }
    return std::move(result.value());
}

//=============================================================================
// Entry point
//=============================================================================

lion::support::Expected<ProgramPtr> analyze(const ParseTree &tree)
{
    lion::support::DiagnosticEngine diag;
    Analyzer analyzer(diag);

    ProgramPtr program = analyzer.analyzeProgram(tree);
    if (program)
        return program;

    if (diag.diagnostics().empty())
        return lion::support::makeError({}, "semantic analysis failed", diag_codes::kSemantic);
    return diag.diagnostics().front();
}

} // namespace lion::frontends::lioncode
