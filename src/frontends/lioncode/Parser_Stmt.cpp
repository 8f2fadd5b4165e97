//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Stmt.cpp
/// @brief Statement and block parsing for LionCode.
///
/// @details Statement forms:
/// ```
/// roar Expression
/// ignite name(a, b) | ... |
/// serve Expression
/// Prowl i in range(Expression) | ... |
/// if (c) | ... | else (c2) | ... | otherwise | ... |
/// break
/// Expression [= Expression]
/// ```
/// `|` both opens and closes a block. A statement list ends at the first token
/// that cannot begin a statement, at which point the enclosing rule decides
/// whether that token is the closing `|` or end of input.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Parser.hpp"

namespace lion::frontends::lioncode
{

bool Parser::canStartExpression() const
{
    switch (current_.kind)
    {
        case TokenKind::NumberLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::StringStart:
        case TokenKind::Identifier:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
        case TokenKind::LParen:
        case TokenKind::Minus:
        case TokenKind::Bang:
            return true;
        default:
            return false;
    }
}

bool Parser::canStartStatement() const
{
    switch (current_.kind)
    {
        case TokenKind::KwRoar:
        case TokenKind::KwIgnite:
        case TokenKind::KwServe:
        case TokenKind::KwProwl:
        case TokenKind::KwIf:
        case TokenKind::KwBreak:
            return true;
        default:
            return canStartExpression();
    }
}

bool Parser::parseStatementList(std::vector<SynStmtPtr> &out)
{
    while (true)
    {
        // Comments in statement position are kept as statements.
        for (auto &comment : current_.leadingComments)
            out.push_back(std::make_unique<SynComment>(comment.loc, std::move(comment.text)));
        current_.leadingComments.clear();

        if (!canStartStatement())
            return !hasError_;

        SynStmtPtr stmt = parseStatement();
        if (!stmt)
            return false;
        out.push_back(std::move(stmt));
    }
}

bool Parser::parseBlock(SynBlock &block)
{
    block.loc = current_.loc;
    if (!expect(TokenKind::Pipe, "'|'"))
        return false;
    if (!parseStatementList(block.statements))
        return false;
    return expect(TokenKind::Pipe, "'|'");
}

SynStmtPtr Parser::parseStatement()
{
    switch (current_.kind)
    {
        case TokenKind::KwRoar:
            return parsePrint();
        case TokenKind::KwIgnite:
            return parseFunction();
        case TokenKind::KwServe:
            return parseReturn();
        case TokenKind::KwProwl:
            return parseLoop();
        case TokenKind::KwIf:
            return parseIf();
        case TokenKind::KwBreak:
        {
            SourceLoc loc = advance().loc;
            return std::make_unique<SynBreak>(loc);
        }
        default:
            break;
    }

    if (canStartExpression())
        return parseExpressionStatement();

    unexpected("a statement");
    return nullptr;
}

SynStmtPtr Parser::parsePrint()
{
    SourceLoc loc = advance().loc; // roar
    SynExprPtr value = parseExpression();
    if (!value)
        return nullptr;
    return std::make_unique<SynPrint>(loc, std::move(value));
}

SynStmtPtr Parser::parseReturn()
{
    SourceLoc loc = advance().loc; // serve
    SynExprPtr value = parseExpression();
    if (!value)
        return nullptr;
    return std::make_unique<SynReturn>(loc, std::move(value));
}

SynStmtPtr Parser::parseFunction()
{
    SourceLoc loc = advance().loc; // ignite

    if (!check(TokenKind::Identifier))
    {
        unexpected("a function name");
        return nullptr;
    }
    auto fn = std::make_unique<SynFunction>(loc, advance().text);

    if (!expect(TokenKind::LParen, "'('"))
        return nullptr;

    if (!check(TokenKind::RParen))
    {
        do
        {
            if (!check(TokenKind::Identifier))
            {
                unexpected("a parameter name");
                return nullptr;
            }
            Token param = advance();
            fn->params.push_back(SynParam{param.text, param.loc});
        } while (match(TokenKind::Comma));
    }

    if (!expect(TokenKind::RParen, "')'"))
        return nullptr;

    if (!parseBlock(fn->body))
        return nullptr;
    return fn;
}

SynStmtPtr Parser::parseLoop()
{
    SourceLoc loc = advance().loc; // Prowl

    // Any primary is accepted here; the analyzer rejects non-identifiers.
    SynExprPtr variable = parsePrimary();
    if (!variable)
        return nullptr;

    if (!expect(TokenKind::KwIn, "'in'"))
        return nullptr;

    SourceLoc rangeLoc = current_.loc;
    if (!expect(TokenKind::KwRange, "'range'"))
        return nullptr;
    if (!expect(TokenKind::LParen, "'('"))
        return nullptr;

    SynExprPtr bound = parseExpression();
    if (!bound)
        return nullptr;

    if (!expect(TokenKind::RParen, "')'"))
        return nullptr;

    auto loop = std::make_unique<SynLoop>(loc, std::move(variable), std::move(bound));
    loop->rangeLoc = rangeLoc;
    if (!parseBlock(loop->body))
        return nullptr;
    return loop;
}

SynStmtPtr Parser::parseIf()
{
    auto stmt = std::make_unique<SynIf>(current_.loc);

    // `if` arm followed by any number of `else (cond)` arms.
    bool first = true;
    while (first || check(TokenKind::KwElse))
    {
        SynBranch branch;
        branch.loc = advance().loc; // if / else
        first = false;

        if (!expect(TokenKind::LParen, "'('"))
            return nullptr;
        branch.condition = parseExpression();
        if (!branch.condition)
            return nullptr;
        if (!expect(TokenKind::RParen, "')'"))
            return nullptr;
        if (!parseBlock(branch.block))
            return nullptr;

        stmt->branches.push_back(std::move(branch));
    }

    if (match(TokenKind::KwOtherwise))
    {
        SynBlock block;
        if (!parseBlock(block))
            return nullptr;
        stmt->otherwise = std::move(block);
    }

    return stmt;
}

SynStmtPtr Parser::parseExpressionStatement()
{
    SourceLoc loc = current_.loc;
    SynExprPtr expr = parseExpression();
    if (!expr)
        return nullptr;

    if (match(TokenKind::Equal))
    {
        SynExprPtr value = parseExpression();
        if (!value)
            return nullptr;
        return std::make_unique<SynAssign>(loc, std::move(expr), std::move(value));
    }

    return std::make_unique<SynExprStmt>(loc, std::move(expr));
}

} // namespace lion::frontends::lioncode
