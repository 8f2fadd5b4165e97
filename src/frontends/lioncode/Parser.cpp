//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser.cpp
/// @brief Token handling, error reporting and the program entry point of the
///        LionCode parser.
///
/// @details Each grammar rule has a parseXxx() method that checks the current
/// token, consumes expected tokens with match() or expect(), recurses into
/// other rules and returns a parse tree node. There is no error recovery: the
/// first syntax error clears the result and every caller unwinds by returning
/// nullptr (or false).
///
/// Statement rules live in Parser_Stmt.cpp, expression rules in
/// Parser_Expr.cpp.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Parser.hpp"

#include "frontends/lioncode/DiagCodes.hpp"

namespace lion::frontends::lioncode
{

Parser::Parser(Lexer &lexer, lion::support::DiagnosticEngine &diag) : lexer_(lexer), diag_(diag)
{
    current_ = lexer_.next();
}

//===----------------------------------------------------------------------===//
// Token Handling
//===----------------------------------------------------------------------===//

const Token &Parser::peek() const
{
    return current_;
}

Token Parser::advance()
{
    Token prev = std::move(current_);
    current_ = lexer_.next();
    return prev;
}

bool Parser::check(TokenKind kind) const
{
    return current_.kind == kind;
}

bool Parser::match(TokenKind kind)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    return false;
}

bool Parser::expect(TokenKind kind, const char *what)
{
    if (check(kind))
    {
        advance();
        return true;
    }
    unexpected(what);
    return false;
}

bool Parser::checkWord(const char *word) const
{
    return current_.kind == TokenKind::Identifier && current_.text == word;
}

//===----------------------------------------------------------------------===//
// Error Handling
//===----------------------------------------------------------------------===//

std::string Parser::describe(const Token &tok)
{
    if (tok.kind == TokenKind::Eof)
        return "end of input";
    return "'" + tok.text + "'";
}

void Parser::unexpected(const std::string &what)
{
    // The lexer has already reported why this token is malformed.
    if (current_.kind == TokenKind::Error)
    {
        hasError_ = true;
        return;
    }
    errorAt(current_.loc, "expected " + what + " but found " + describe(current_));
}

void Parser::errorAt(SourceLoc loc, const std::string &message)
{
    if (hasError_)
        return;
    hasError_ = true;
    diag_.report(lion::support::Diagnostic{
        lion::support::Severity::Error,
        message,
        loc,
        diag_codes::kSyntax
    });
}

//===----------------------------------------------------------------------===//
// Program
//===----------------------------------------------------------------------===//

std::unique_ptr<ParseTree> Parser::parseProgram()
{
    auto tree = std::make_unique<ParseTree>();
    tree->fileId = current_.loc.file_id;

    if (!parseStatementList(tree->statements))
        return nullptr;

    if (!check(TokenKind::Eof))
    {
        unexpected("a statement or end of input");
        return nullptr;
    }

    if (hasError_)
        return nullptr;
    return tree;
}

//===----------------------------------------------------------------------===//
// Entry point
//===----------------------------------------------------------------------===//

lion::support::Expected<ParseTree> parse(std::string source, uint32_t fileId)
{
    lion::support::DiagnosticEngine diag;
    Lexer lexer(std::move(source), fileId, diag);
    Parser parser(lexer, diag);

    auto tree = parser.parseProgram();
    if (tree && diag.errorCount() == 0)
        return std::move(*tree);

    // The lexer runs one token ahead of the parser, so the diagnostics are not
    // necessarily in source order. Report the one closest to the start.
    const lion::support::Diagnostic *first = nullptr;
    for (const auto &d : diag.diagnostics())
    {
        if (d.severity != lion::support::Severity::Error)
            continue;
        if (!first || d.loc.line < first->loc.line ||
            (d.loc.line == first->loc.line && d.loc.column < first->loc.column))
        {
            first = &d;
        }
    }
    if (!first)
        return lion::support::makeError({fileId, 1, 1}, "syntax error", diag_codes::kSyntax);
    return *first;
}

} // namespace lion::frontends::lioncode
