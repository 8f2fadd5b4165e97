//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: tests/lioncode/test_lexer.cpp
// Purpose: Tokenization of LionCode: keywords, dash strings, interpolation,
//          comments and lexical errors.
// Key invariants: Every lexical error carries code L1000 and yields an Error
//                 token.
//
//===----------------------------------------------------------------------===//

#include <gtest/gtest.h>

#include "frontends/lioncode/DiagCodes.hpp"
#include "frontends/lioncode/Lexer.hpp"

#include <string>
#include <vector>

using namespace lion::frontends::lioncode;
using lion::support::DiagnosticEngine;

namespace
{

std::vector<Token> lexAll(const std::string &source, DiagnosticEngine &diag)
{
    Lexer lexer(source, 1, diag);
    std::vector<Token> tokens;
    for (int guard = 0; guard < 1000; ++guard)
    {
        tokens.push_back(lexer.next());
        if (tokens.back().is(TokenKind::Eof))
            break;
    }
    return tokens;
}

std::vector<TokenKind> kindsOf(const std::string &source)
{
    DiagnosticEngine diag;
    std::vector<TokenKind> kinds;
    for (const auto &tok : lexAll(source, diag))
        kinds.push_back(tok.kind);
    EXPECT_EQ(diag.errorCount(), 0u) << "while lexing: " << source;
    return kinds;
}

/// @brief Lex @p source and return the first diagnostic message.
std::string firstError(const std::string &source)
{
    DiagnosticEngine diag;
    lexAll(source, diag);
    if (diag.diagnostics().empty())
        return {};
    EXPECT_EQ(diag.diagnostics().front().code, diag_codes::kSyntax);
    return diag.diagnostics().front().message;
}

TEST(LionLexer, KeywordsAndIdentifiers)
{
    std::vector<TokenKind> expected = {TokenKind::KwProwl,
                                       TokenKind::Identifier,
                                       TokenKind::KwIn,
                                       TokenKind::KwRange,
                                       TokenKind::LParen,
                                       TokenKind::NumberLiteral,
                                       TokenKind::RParen,
                                       TokenKind::Pipe,
                                       TokenKind::KwBreak,
                                       TokenKind::Pipe,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf("Prowl i in range(3) | break |"), expected);

    // Keywords are case sensitive.
    EXPECT_EQ(kindsOf("prowl"), (std::vector<TokenKind>{TokenKind::Identifier, TokenKind::Eof}));
}

TEST(LionLexer, PhraseWordsStayIdentifiers)
{
    std::vector<TokenKind> expected = {TokenKind::Identifier,
                                       TokenKind::KwIs,
                                       TokenKind::Identifier,
                                       TokenKind::Identifier,
                                       TokenKind::Identifier,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf("a is less than b"), expected);
}

TEST(LionLexer, Operators)
{
    std::vector<TokenKind> expected = {TokenKind::EqualEqual,
                                       TokenKind::NotEqual,
                                       TokenKind::LessEqual,
                                       TokenKind::GreaterEqual,
                                       TokenKind::Less,
                                       TokenKind::Greater,
                                       TokenKind::Bang,
                                       TokenKind::Comma,
                                       TokenKind::Equal,
                                       TokenKind::Star,
                                       TokenKind::Slash,
                                       TokenKind::Percent,
                                       TokenKind::Plus,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf("== != <= >= < > ! , = * / % +"), expected);
}

TEST(LionLexer, NumberLiterals)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("42 3.25", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].numberValue, 42.0);
    EXPECT_EQ(tokens[1].numberValue, 3.25);
    EXPECT_EQ(tokens[1].text, "3.25");
}

TEST(LionLexer, DashDelimitedString)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("roar -Hello LMU!-", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwRoar);
    EXPECT_EQ(tokens[1].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[1].stringValue, "Hello LMU!");
    EXPECT_EQ(tokens[1].text, "-Hello LMU!-");
}

TEST(LionLexer, DashAfterOperandIsMinus)
{
    std::vector<TokenKind> expected = {TokenKind::Identifier,
                                       TokenKind::Equal,
                                       TokenKind::NumberLiteral,
                                       TokenKind::Minus,
                                       TokenKind::NumberLiteral,
                                       TokenKind::Minus,
                                       TokenKind::Identifier,
                                       TokenKind::Eof};
    EXPECT_EQ(kindsOf("x = 5 - 3 - y"), expected);
}

TEST(LionLexer, DashWithoutClosingDashIsUnaryMinus)
{
    EXPECT_EQ(kindsOf("roar -5"),
              (std::vector<TokenKind>{
                  TokenKind::KwRoar, TokenKind::Minus, TokenKind::NumberLiteral, TokenKind::Eof}));

    // The closing dash must be on the same line.
    EXPECT_EQ(kindsOf("roar -x\nroar y - 1"),
              (std::vector<TokenKind>{TokenKind::KwRoar,
                                      TokenKind::Minus,
                                      TokenKind::Identifier,
                                      TokenKind::KwRoar,
                                      TokenKind::Identifier,
                                      TokenKind::Minus,
                                      TokenKind::NumberLiteral,
                                      TokenKind::Eof}));
}

TEST(LionLexer, DashFollowedByOperandIsMinus)
{
    EXPECT_EQ(kindsOf("x = -5 - 3"),
              (std::vector<TokenKind>{TokenKind::Identifier,
                                      TokenKind::Equal,
                                      TokenKind::Minus,
                                      TokenKind::NumberLiteral,
                                      TokenKind::Minus,
                                      TokenKind::NumberLiteral,
                                      TokenKind::Eof}));
    EXPECT_EQ(kindsOf("roar -a - b"),
              (std::vector<TokenKind>{TokenKind::KwRoar,
                                      TokenKind::Minus,
                                      TokenKind::Identifier,
                                      TokenKind::Minus,
                                      TokenKind::Identifier,
                                      TokenKind::Eof}));
    EXPECT_EQ(kindsOf("roar -n - (1)"),
              (std::vector<TokenKind>{TokenKind::KwRoar,
                                      TokenKind::Minus,
                                      TokenKind::Identifier,
                                      TokenKind::Minus,
                                      TokenKind::LParen,
                                      TokenKind::NumberLiteral,
                                      TokenKind::RParen,
                                      TokenKind::Eof}));
}

TEST(LionLexer, DashFollowedByOperatorClosesString)
{
    EXPECT_EQ(kindsOf("roar -a- is less than b"),
              (std::vector<TokenKind>{TokenKind::KwRoar,
                                      TokenKind::StringLiteral,
                                      TokenKind::KwIs,
                                      TokenKind::Identifier,
                                      TokenKind::Identifier,
                                      TokenKind::Identifier,
                                      TokenKind::Eof}));
    EXPECT_EQ(kindsOf("roar -a- != -b-"),
              (std::vector<TokenKind>{
                  TokenKind::KwRoar, TokenKind::StringLiteral, TokenKind::NotEqual, TokenKind::StringLiteral,
                  TokenKind::Eof}));
    EXPECT_EQ(kindsOf("roar -a- - 1"),
              (std::vector<TokenKind>{
                  TokenKind::KwRoar, TokenKind::StringLiteral, TokenKind::Minus, TokenKind::NumberLiteral,
                  TokenKind::Eof}));
}

TEST(LionLexer, EscapeSequences)
{
    DiagnosticEngine diag;
    auto tokens = lexAll(R"(-a\-b\nc\$d\\e\~f\tg-)", diag);
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(diag.errorCount(), 0u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringLiteral);
    EXPECT_EQ(tokens[0].stringValue, "a-b\nc$d\\e~f\tg");
}

TEST(LionLexer, IdentifierInterpolation)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("-Hi $name!-", diag);
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::StringStart);
    EXPECT_EQ(tokens[0].stringValue, "Hi ");
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[1].text, "name");
    EXPECT_EQ(tokens[2].kind, TokenKind::StringEnd);
    EXPECT_EQ(tokens[2].stringValue, "!");
    EXPECT_EQ(tokens[3].kind, TokenKind::Eof);
}

TEST(LionLexer, ExpressionInterpolation)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("-Sum $(a + (b)) and $c done-", diag);
    std::vector<TokenKind> kinds;
    for (const auto &tok : tokens)
        kinds.push_back(tok.kind);

    std::vector<TokenKind> expected = {TokenKind::StringStart,
                                       TokenKind::Identifier,
                                       TokenKind::Plus,
                                       TokenKind::LParen,
                                       TokenKind::Identifier,
                                       TokenKind::RParen,
                                       TokenKind::StringMid,
                                       TokenKind::Identifier,
                                       TokenKind::StringEnd,
                                       TokenKind::Eof};
    EXPECT_EQ(kinds, expected);
    EXPECT_EQ(diag.errorCount(), 0u);
    EXPECT_EQ(tokens[0].stringValue, "Sum ");
    EXPECT_EQ(tokens[6].stringValue, " and ");
    EXPECT_EQ(tokens[8].stringValue, " done");
}

TEST(LionLexer, CommentsAttachToNextToken)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("~  say hello  ~ roar 1 ~tail~", diag);
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwRoar);
    ASSERT_EQ(tokens[0].leadingComments.size(), 1u);
    EXPECT_EQ(tokens[0].leadingComments[0].text, "say hello");
    EXPECT_EQ(tokens[0].leadingComments[0].loc.column, 1u);

    EXPECT_EQ(tokens[2].kind, TokenKind::Eof);
    ASSERT_EQ(tokens[2].leadingComments.size(), 1u);
    EXPECT_EQ(tokens[2].leadingComments[0].text, "tail");
}

TEST(LionLexer, TracksLinesAndColumns)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("roar 1\n  roar 2", diag);
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[2].loc.line, 2u);
    EXPECT_EQ(tokens[2].loc.column, 3u);
    EXPECT_EQ(tokens[2].loc.file_id, 1u);
}

TEST(LionLexer, PeekDoesNotConsume)
{
    DiagnosticEngine diag;
    Lexer lexer("roar x", 0, diag);
    EXPECT_EQ(lexer.peek().kind, TokenKind::KwRoar);
    EXPECT_EQ(lexer.next().kind, TokenKind::KwRoar);
    EXPECT_EQ(lexer.next().kind, TokenKind::Identifier);
    EXPECT_EQ(lexer.next().kind, TokenKind::Eof);
    EXPECT_EQ(lexer.next().kind, TokenKind::Eof);
}

TEST(LionLexer, ReportsMalformedNumber)
{
    EXPECT_EQ(firstError("x = 3x"), "invalid number literal '3x'");
}

TEST(LionLexer, ReportsUnexpectedCharacter)
{
    EXPECT_EQ(firstError("roar @"), "unexpected character '@'");
}

TEST(LionLexer, ReportsInvalidEscape)
{
    EXPECT_EQ(firstError(R"(roar -bad\q-)"), "invalid escape sequence: \\q");
}

TEST(LionLexer, ReportsUnterminatedComment)
{
    DiagnosticEngine diag;
    auto tokens = lexAll("roar 1 ~ never closed", diag);
    ASSERT_GE(tokens.size(), 3u);
    EXPECT_EQ(tokens[2].kind, TokenKind::Error);
    ASSERT_EQ(diag.errorCount(), 1u);
    EXPECT_EQ(diag.diagnostics().front().message, "unterminated comment");
}

} // namespace
