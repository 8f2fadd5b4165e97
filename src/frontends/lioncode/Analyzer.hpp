//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lioncode/Analyzer.hpp
// Purpose: Semantic analyzer turning a LionCode parse tree into a typed AST.
// Key invariants: Single top-down pass; the first violated rule aborts the
//                 analysis and no partial AST is returned.
// Ownership/Lifetime: Analyzer borrows the parse tree; owns its scope chain
//                     for the duration of one analyze() call.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "frontends/lioncode/AST.hpp"
#include "frontends/lioncode/ParseTree.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace lion::frontends::lioncode
{

/// @brief Analyze @p tree and return the typed program or the first semantic
///        error (code L2000).
lion::support::Expected<ProgramPtr> analyze(const ParseTree &tree);

/// @brief Information about a bound name.
struct Symbol
{
    enum class Kind
    {
        Variable,
        Parameter,
        LoopVariable,
        Function,
        Builtin,
    };

    Kind kind;
    std::string name;
    Type type{Type::Unknown};

    /// Functions and builtins only.
    size_t paramCount{0};
    Type returnType{Type::Unknown};
};

/// @brief One lexical scope frame.
/// @details `inLoop` / `inFunction` are inherited from the parent unless the
///          frame was opened by a loop or a function, which set their own.
class Scope
{
  public:
    Scope(Scope *parent, bool inLoop, bool inFunction)
        : parent_(parent), inLoop_(inLoop), inFunction_(inFunction)
    {
    }

    void define(const std::string &name, Symbol symbol);
    Symbol *lookup(const std::string &name);
    Symbol *lookupLocal(const std::string &name);

    Scope *parent() const
    {
        return parent_;
    }

    bool inLoop() const
    {
        return inLoop_;
    }

    bool inFunction() const
    {
        return inFunction_;
    }

  private:
    Scope *parent_{nullptr};
    bool inLoop_{false};
    bool inFunction_{false};
    std::unordered_map<std::string, Symbol> symbols_;
};

/// @brief Semantic analyzer for LionCode.
/// @details Resolves names through the scope chain, infers expression types
///          with the factories of Builder.hpp and enforces the language rules.
class Analyzer
{
  public:
    explicit Analyzer(lion::support::DiagnosticEngine &diag);

    /// @brief Analyze a whole program.
    /// @return The typed program, or nullptr after the first error.
    ProgramPtr analyzeProgram(const ParseTree &tree);

    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    // Statement Analysis
    //=========================================================================

    /// @brief Analyze @p stmts in the current scope, appending to @p out.
    bool analyzeStatements(const std::vector<SynStmtPtr> &stmts, StmtList &out);

    /// @brief Analyze @p block in a fresh child scope that inherits the flags.
    BlockPtr analyzeNestedBlock(const SynBlock &block);

    StmtPtr analyzeStmt(const SynStmt &stmt);
    StmtPtr analyzePrint(const SynPrint &stmt);
    StmtPtr analyzeAssign(const SynAssign &stmt);
    StmtPtr analyzeFunction(const SynFunction &stmt);
    StmtPtr analyzeReturn(const SynReturn &stmt);
    StmtPtr analyzeIf(const SynIf &stmt);
    StmtPtr analyzeLoop(const SynLoop &stmt);
    StmtPtr analyzeBreak(const SynBreak &stmt);

    /// @brief Check that an if/otherwise pair agrees on the type of the value
    ///        its two terminal blocks produce.
    bool checkBranchTypes(SourceLoc loc, const BlockStmt &branch, const BlockStmt &otherwise);

    //=========================================================================
    // Expression Analysis
    //=========================================================================

    ExprPtr analyzeExpr(const SynExpr &expr);
    ExprPtr analyzeString(const SynString &expr);
    ExprPtr analyzeIdentifier(const SynIdentifier &expr);
    ExprPtr analyzeBinary(const SynBinary &expr);
    ExprPtr analyzeComparison(const SynComparison &expr);
    ExprPtr analyzeUnary(const SynUnary &expr);
    ExprPtr analyzeCall(const SynCall &expr);

    /// @brief Unwrap a builder result, reporting its diagnostic on failure.
    ExprPtr take(lion::support::Expected<ExprPtr> result);

    //=========================================================================
    // Scope Management
    //=========================================================================

    void pushScope(bool inLoop, bool inFunction);
    void popScope();

    /// @brief Register sqrt, abs, floor and ceil in the prelude scope.
    void registerBuiltins();

    //=========================================================================
    // Error Reporting
    //=========================================================================

    /// @brief Record a semantic error; only the first one is kept.
    void error(SourceLoc loc, const std::string &message);

    //=========================================================================
    // Member Variables
    //=========================================================================

    lion::support::DiagnosticEngine &diag_;
    bool hasError_{false};

    std::vector<std::unique_ptr<Scope>> scopes_;
    Scope *currentScope_{nullptr};

    /// Function whose body is being analyzed; receives inferred return types.
    Symbol *currentFunction_{nullptr};
};

} // namespace lion::frontends::lioncode
