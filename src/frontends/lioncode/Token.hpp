//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/lioncode/Token.hpp
// Purpose: Token kinds and token structure for the LionCode lexer.
// Key invariants: Each token has a kind, location, and optional text/value.
// Ownership/Lifetime: Tokens own their string data.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/source_location.hpp"

#include <string>
#include <vector>

namespace lion::frontends::lioncode
{

/// @brief Token kinds for LionCode.
enum class TokenKind
{
    // Special tokens
    Eof,
    Error,

    // Literals
    NumberLiteral, // 42, 3.5
    StringLiteral, // -hello-
    StringStart,   // -Hello $   or  -Hello $(
    StringMid,     // text between two interpolations
    StringEnd,     // text after the last interpolation, through the closing -
    Identifier,

    // Keywords - statements
    KwRoar,      // roar
    KwIgnite,    // ignite
    KwServe,     // serve
    KwProwl,     // Prowl
    KwIn,        // in
    KwRange,     // range
    KwIf,        // if
    KwElse,      // else
    KwOtherwise, // otherwise
    KwBreak,     // break

    // Keywords - literals and logic
    KwTrue,  // true
    KwFalse, // false
    KwAnd,   // and
    KwOr,    // or
    KwIs,    // is

    // Operators
    Plus,         // +
    Minus,        // -
    Star,         // *
    Slash,        // /
    Percent,      // %
    Bang,         // !
    Equal,        // =
    EqualEqual,   // ==
    NotEqual,     // !=
    Less,         // <
    LessEqual,    // <=
    Greater,      // >
    GreaterEqual, // >=
    Comma,        // ,
    Pipe,         // |  (opens and closes blocks)

    // Brackets
    LParen, // (
    RParen, // )
};

/// @brief Convert TokenKind to string for debugging.
const char *tokenKindToString(TokenKind kind);

/// @brief A `~comment~` seen before a token.
struct TokenComment
{
    lion::support::SourceLoc loc{};
    std::string text;
};

/// @brief Token structure holding kind, location, and value.
struct Token
{
    TokenKind kind = TokenKind::Eof;
    lion::support::SourceLoc loc{};
    std::string text; // Original source text

    double numberValue = 0.0;
    std::string stringValue; // Unescaped string content (string tokens only)

    /// Comments between the previous token and this one, in source order.
    std::vector<TokenComment> leadingComments;

    bool is(TokenKind k) const
    {
        return kind == k;
    }

    template <typename... Kinds> bool isOneOf(Kinds... kinds) const
    {
        return (is(kinds) || ...);
    }

    bool isKeyword() const;
};

} // namespace lion::frontends::lioncode
