//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lioncode/Parser.hpp
// Purpose: Recursive descent parser for LionCode.
// Key invariants: Precedence climbing for expressions; one-token lookahead;
//                 parsing stops at the first syntax error.
// Ownership/Lifetime: Parser borrows Lexer and DiagnosticEngine.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/lioncode/Lexer.hpp"
#include "frontends/lioncode/ParseTree.hpp"
#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"

#include <memory>
#include <string>

namespace lion::frontends::lioncode
{

/// @brief Parse LionCode @p source into a parse tree.
/// @param fileId SourceManager id stamped on every location (0 for none).
/// @return The tree, or the earliest syntax error (code L1000) with its
///         1-based line and column.
lion::support::Expected<ParseTree> parse(std::string source, uint32_t fileId = 0);

/// @brief Recursive descent parser for LionCode.
///
/// @details Grammar, from lowest to highest precedence:
/// ```
/// Expression = Or
/// Or         = And ("or" And)*
/// And        = Compare ("and" Compare)*
/// Compare    = Additive [CompOp Additive]
/// Additive   = Term (("+" | "-") Term)*
/// Term       = Unary (("*" | "/" | "%") Unary)*
/// Unary      = ("-" | "!") Unary | Primary
/// ```
/// Statement sequences end at the first token that cannot start a statement;
/// blocks then require the closing `|` and the program requires end of input.
class Parser
{
  public:
    Parser(Lexer &lexer, lion::support::DiagnosticEngine &diag);

    /// @brief Parse a whole program.
    /// @return The tree, or nullptr after a syntax error.
    std::unique_ptr<ParseTree> parseProgram();

    /// @brief Parse a single expression.
    SynExprPtr parseExpression();

    /// @brief Parse a single statement.
    SynStmtPtr parseStatement();

    bool hasError() const
    {
        return hasError_;
    }

  private:
    //=========================================================================
    // Token Handling
    //=========================================================================

    const Token &peek() const;
    Token advance();
    bool check(TokenKind kind) const;
    bool match(TokenKind kind);

    /// @brief Consume a token of @p kind or report "expected WHAT but found ...".
    bool expect(TokenKind kind, const char *what);

    /// @brief True when the current token is the contextual word @p word.
    bool checkWord(const char *word) const;

    //=========================================================================
    // Error Handling
    //=========================================================================

    /// @brief Report "expected WHAT but found <current token>".
    void unexpected(const std::string &what);

    void errorAt(SourceLoc loc, const std::string &message);

    /// @brief Human-readable description of @p tok for diagnostics.
    static std::string describe(const Token &tok);

    //=========================================================================
    // Expression Parsing
    //=========================================================================

    SynExprPtr parseLogicalOr();
    SynExprPtr parseLogicalAnd();
    SynExprPtr parseComparison();
    SynExprPtr parseAdditive();
    SynExprPtr parseMultiplicative();
    SynExprPtr parseUnary();
    SynExprPtr parsePrimary();
    SynExprPtr parseInterpolatedString();
    bool parseCallArgs(std::vector<SynExprPtr> &args);

    /// @brief If the current token starts a comparison operator, consume it.
    std::optional<CompareOp> matchComparisonOp();

    //=========================================================================
    // Statement Parsing
    //=========================================================================

    /// @brief Parse statements until none can start; comments become statements.
    bool parseStatementList(std::vector<SynStmtPtr> &out);
    bool parseBlock(SynBlock &block);
    SynStmtPtr parsePrint();
    SynStmtPtr parseFunction();
    SynStmtPtr parseReturn();
    SynStmtPtr parseLoop();
    SynStmtPtr parseIf();
    SynStmtPtr parseExpressionStatement();

    bool canStartStatement() const;
    bool canStartExpression() const;

    //=========================================================================
    // Member Variables
    //=========================================================================

    Lexer &lexer_;
    lion::support::DiagnosticEngine &diag_;
    Token current_;
    bool hasError_{false};
};

} // namespace lion::frontends::lioncode
