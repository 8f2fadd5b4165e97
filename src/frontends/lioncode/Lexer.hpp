//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.hpp
/// @brief Lexical analyzer (tokenizer) for the LionCode language.
///
/// @details The lexer turns source text into tokens on demand for the parser.
///
/// ## Token Categories
///
/// **Identifiers and Keywords:**
/// - Identifiers: `total`, `_tmp`, `n2`
/// - 15 reserved keywords: `roar`, `ignite`, `serve`, `Prowl`, `in`, `range`,
///   `if`, `else`, `otherwise`, `break`, `true`, `false`, `and`, `or`, `is`
/// - The comparison phrase words `equal`, `to`, `less`, `than`, `greater`
///   stay identifiers; the parser recognises them after `is`.
///
/// **Literals:**
/// - Numbers: `42`, `3.25` (decimal only, stored as double)
/// - Strings: `-Hello LMU!-`, with escapes `\-`, `\$`, `\\`, `\n`, `\t`, `\~`
///
/// ## The dash
///
/// `-` is both the string delimiter and the minus operator. After a token
/// that ends an operand (identifier, number, string, `)`, `true`, `false`) it
/// is always the binary operator. Anywhere else it opens a string if a closing
/// `-` exists later on the same line, and is unary minus otherwise.
///
/// ## String Interpolation
///
/// `$name` embeds one identifier and `$( expr )` a full expression:
/// ```
/// -Total: $(a + b) for $who-
/// ```
/// is tokenized as `StringStart("Total: ")`, the expression tokens,
/// `StringMid(" for ")`, `Identifier(who)`, `StringEnd("")`.
///
/// ## Comments
///
/// `~ text ~` comments are not tokens. Their text is attached to the next
/// token's `leadingComments` so the parser can keep comments that appear in
/// statement position.
///
/// ## Error Handling
///
/// Lexical errors (unterminated strings or comments, malformed numbers such as
/// `3x`, invalid escapes, unexpected characters) are reported to the
/// DiagnosticEngine with code L1000 and produce an Error token.
///
/// @invariant pos_ <= source_.size()
/// @invariant interpolation_ holds one frame per open interpolation span.
///
//===----------------------------------------------------------------------===//
#pragma once

#include "frontends/lioncode/Token.hpp"
#include "support/diagnostics.hpp"

#include <optional>
#include <string>
#include <vector>

namespace lion::frontends::lioncode
{

class Lexer
{
  public:
    /// @brief Create a lexer over @p source.
    /// @param fileId File identifier embedded in every token location.
    /// @param diag Borrowed diagnostic engine; must outlive the lexer.
    Lexer(std::string source, uint32_t fileId, lion::support::DiagnosticEngine &diag);

    /// @brief Get the next token, consuming it. Returns Eof repeatedly at the end.
    Token next();

    /// @brief Peek at the next token without consuming it.
    const Token &peek();

  private:
    /// @brief State of one open interpolation span.
    struct Interpolation
    {
        bool identifierOnly = false; ///< `$name` form
        bool identifierLexed = false;
        int parenDepth = 0; ///< Nested `(` inside a `$( ... )` span
    };

    //=========================================================================
    // Character access
    //=========================================================================

    char peekChar() const;
    char peekChar(size_t offset) const;
    char getChar();
    bool eof() const;
    lion::support::SourceLoc currentLoc() const;

    void reportError(lion::support::SourceLoc loc, const std::string &message);

    //=========================================================================
    // Skipping
    //=========================================================================

    /// @brief Skip whitespace and collect `~comments~`.
    /// @return False when an unterminated comment was found.
    bool skipWhitespaceAndComments(std::vector<TokenComment> &comments);

    //=========================================================================
    // Token lexers
    //=========================================================================

    Token lexToken();
    Token lexIdentifierOrKeyword();
    Token lexNumber();
    Token lexString();
    Token lexStringBody(Token tok, TokenKind plainKind, TokenKind interpolatedKind);
    Token lexDashOrString();
    std::optional<char> processEscape(char c);

    /// @brief True when a `-` at the current position has a closing `-` on the same line.
    /// @details The first unescaped `-` is the candidate; when an operand follows
    ///          it, both dashes are minus signs instead.
    bool closingDashAhead() const;

    /// @brief True when the text from @p i on the line starts an operand.
    bool continuesExpression(size_t i) const;

    /// @brief True when the previous token ends an operand.
    bool previousEndsOperand() const;

    static std::optional<TokenKind> lookupKeyword(const std::string &name);

    //=========================================================================
    // State
    //=========================================================================

    std::string source_;
    uint32_t fileId_;
    lion::support::DiagnosticEngine &diag_;

    size_t pos_ = 0;
    uint32_t line_ = 1;
    uint32_t column_ = 1;

    std::optional<Token> peeked_;

    /// Kind of the most recently produced token; drives the dash rule.
    TokenKind lastKind_ = TokenKind::Eof;

    std::vector<Interpolation> interpolation_;
};

} // namespace lion::frontends::lioncode
