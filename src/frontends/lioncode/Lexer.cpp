//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Lexer.cpp
/// @brief Implementation of the LionCode lexical analyzer.
///
/// @details Key implementation details:
///
/// ## Keyword Lookup
///
/// Keywords are stored in a sorted array (kKeywordTable) for binary search.
/// The table is ordered by byte value, so `Prowl` sorts first.
///
/// ## String Interpolation
///
/// Interpolated strings are handled with a stack of Interpolation frames:
/// 1. `$name` pushes an identifier-only frame; the next token is the
///    identifier and string lexing resumes right after it.
/// 2. `$(` pushes a parenthesised frame; nested `(`/`)` adjust its depth and
///    the `)` at depth zero resumes string lexing.
///
/// @see Lexer.hpp for the class interface
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Lexer.hpp"

#include "frontends/common/CharUtils.hpp"
#include "frontends/lioncode/DiagCodes.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <string_view>

namespace lion::frontends::lioncode
{

//===----------------------------------------------------------------------===//
// TokenKind to string conversion
//===----------------------------------------------------------------------===//

const char *tokenKindToString(TokenKind kind)
{
    switch (kind)
    {
        case TokenKind::Eof:
            return "eof";
        case TokenKind::Error:
            return "error";
        case TokenKind::NumberLiteral:
            return "number";
        case TokenKind::StringLiteral:
            return "string";
        case TokenKind::StringStart:
            return "string-start";
        case TokenKind::StringMid:
            return "string-mid";
        case TokenKind::StringEnd:
            return "string-end";
        case TokenKind::Identifier:
            return "identifier";
        case TokenKind::KwRoar:
            return "roar";
        case TokenKind::KwIgnite:
            return "ignite";
        case TokenKind::KwServe:
            return "serve";
        case TokenKind::KwProwl:
            return "Prowl";
        case TokenKind::KwIn:
            return "in";
        case TokenKind::KwRange:
            return "range";
        case TokenKind::KwIf:
            return "if";
        case TokenKind::KwElse:
            return "else";
        case TokenKind::KwOtherwise:
            return "otherwise";
        case TokenKind::KwBreak:
            return "break";
        case TokenKind::KwTrue:
            return "true";
        case TokenKind::KwFalse:
            return "false";
        case TokenKind::KwAnd:
            return "and";
        case TokenKind::KwOr:
            return "or";
        case TokenKind::KwIs:
            return "is";
        case TokenKind::Plus:
            return "+";
        case TokenKind::Minus:
            return "-";
        case TokenKind::Star:
            return "*";
        case TokenKind::Slash:
            return "/";
        case TokenKind::Percent:
            return "%";
        case TokenKind::Bang:
            return "!";
        case TokenKind::Equal:
            return "=";
        case TokenKind::EqualEqual:
            return "==";
        case TokenKind::NotEqual:
            return "!=";
        case TokenKind::Less:
            return "<";
        case TokenKind::LessEqual:
            return "<=";
        case TokenKind::Greater:
            return ">";
        case TokenKind::GreaterEqual:
            return ">=";
        case TokenKind::Comma:
            return ",";
        case TokenKind::Pipe:
            return "|";
        case TokenKind::LParen:
            return "(";
        case TokenKind::RParen:
            return ")";
    }
    return "unknown";
}

bool Token::isKeyword() const
{
    return kind >= TokenKind::KwRoar && kind <= TokenKind::KwIs;
}

//===----------------------------------------------------------------------===//
// Keyword lookup table
//===----------------------------------------------------------------------===//

namespace
{

struct KeywordEntry
{
    std::string_view key;
    TokenKind kind;
};

// Sorted by byte value for binary search (15 keywords)
constexpr std::array<KeywordEntry, 15> kKeywordTable = {{
    {"Prowl", TokenKind::KwProwl},
    {"and", TokenKind::KwAnd},
    {"break", TokenKind::KwBreak},
    {"else", TokenKind::KwElse},
    {"false", TokenKind::KwFalse},
    {"if", TokenKind::KwIf},
    {"ignite", TokenKind::KwIgnite},
    {"in", TokenKind::KwIn},
    {"is", TokenKind::KwIs},
    {"or", TokenKind::KwOr},
    {"otherwise", TokenKind::KwOtherwise},
    {"range", TokenKind::KwRange},
    {"roar", TokenKind::KwRoar},
    {"serve", TokenKind::KwServe},
    {"true", TokenKind::KwTrue},
}};

using common::char_utils::isDigit;
using common::char_utils::isIdentifierContinue;
using common::char_utils::isIdentifierStart;
using common::char_utils::isNewline;
using common::char_utils::isWhitespace;

} // anonymous namespace

std::optional<TokenKind> Lexer::lookupKeyword(const std::string &name)
{
    auto it = std::lower_bound(kKeywordTable.begin(),
                               kKeywordTable.end(),
                               name,
                               [](const KeywordEntry &entry, const std::string &key)
                               { return entry.key < key; });
    if (it != kKeywordTable.end() && it->key == name)
        return it->kind;
    return std::nullopt;
}

//===----------------------------------------------------------------------===//
// Lexer implementation
//===----------------------------------------------------------------------===//

Lexer::Lexer(std::string source, uint32_t fileId, lion::support::DiagnosticEngine &diag)
    : source_(std::move(source)), fileId_(fileId), diag_(diag)
{
}

char Lexer::peekChar() const
{
    if (pos_ >= source_.size())
        return '\0';
    return source_[pos_];
}

char Lexer::peekChar(size_t offset) const
{
    if (pos_ + offset >= source_.size())
        return '\0';
    return source_[pos_ + offset];
}

char Lexer::getChar()
{
    if (pos_ >= source_.size())
        return '\0';
    char c = source_[pos_++];
    if (c == '\n')
    {
        ++line_;
        column_ = 1;
    }
    else
    {
        ++column_;
    }
    return c;
}

bool Lexer::eof() const
{
    return pos_ >= source_.size();
}

lion::support::SourceLoc Lexer::currentLoc() const
{
    return lion::support::SourceLoc{fileId_, line_, column_};
}

void Lexer::reportError(lion::support::SourceLoc loc, const std::string &message)
{
    diag_.report(lion::support::Diagnostic{
        lion::support::Severity::Error,
        message,
        loc,
        diag_codes::kSyntax
    });
}

bool Lexer::skipWhitespaceAndComments(std::vector<TokenComment> &comments)
{
    while (!eof())
    {
        char c = peekChar();

        if (isWhitespace(c))
        {
            getChar();
            continue;
        }

        if (c == '~')
        {
            TokenComment comment;
            comment.loc = currentLoc();
            getChar(); // consume opening ~
            std::string text;
            while (!eof() && peekChar() != '~')
                text.push_back(getChar());
            if (eof())
            {
                reportError(comment.loc, "unterminated comment");
                return false;
            }
            getChar(); // consume closing ~

            auto first = text.find_first_not_of(" \t\r\n");
            auto last = text.find_last_not_of(" \t\r\n");
            comment.text = first == std::string::npos ? "" : text.substr(first, last - first + 1);
            comments.push_back(std::move(comment));
            continue;
        }

        break;
    }
    return true;
}

Token Lexer::lexIdentifierOrKeyword()
{
    Token tok;
    tok.loc = currentLoc();

    while (!eof() && isIdentifierContinue(peekChar()))
    {
        tok.text.push_back(getChar());
    }

    if (auto kw = lookupKeyword(tok.text))
    {
        tok.kind = *kw;
        return tok;
    }

    tok.kind = TokenKind::Identifier;
    return tok;
}

Token Lexer::lexNumber()
{
    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::NumberLiteral;

    while (isDigit(peekChar()))
        tok.text.push_back(getChar());

    if (peekChar() == '.' && isDigit(peekChar(1)))
    {
        tok.text.push_back(getChar());
        while (isDigit(peekChar()))
            tok.text.push_back(getChar());
    }

    // 3x, 2.5abc: a number may not run into an identifier
    if (isIdentifierContinue(peekChar()))
    {
        while (isIdentifierContinue(peekChar()))
            tok.text.push_back(getChar());
        reportError(tok.loc, "invalid number literal '" + tok.text + "'");
        tok.kind = TokenKind::Error;
        return tok;
    }

    tok.numberValue = std::strtod(tok.text.c_str(), nullptr);
    return tok;
}

std::optional<char> Lexer::processEscape(char c)
{
    switch (c)
    {
        case '-':
            return '-';
        case '$':
            return '$';
        case '\\':
            return '\\';
        case '~':
            return '~';
        case 'n':
            return '\n';
        case 't':
            return '\t';
        default:
            return std::nullopt;
    }
}

Token Lexer::lexString()
{
    Token tok;
    tok.loc = currentLoc();
    tok.text.push_back(getChar()); // consume opening -
    return lexStringBody(std::move(tok), TokenKind::StringLiteral, TokenKind::StringStart);
}

/// @brief Lex string content up to the closing `-` or the next interpolation.
/// @param plainKind Kind used when the closing `-` is reached.
/// @param interpolatedKind Kind used when an interpolation span begins.
Token Lexer::lexStringBody(Token tok, TokenKind plainKind, TokenKind interpolatedKind)
{
    while (!eof())
    {
        char c = peekChar();

        if (c == '-')
        {
            tok.text.push_back(getChar());
            tok.kind = plainKind;
            return tok;
        }

        if (c == '$' && isIdentifierStart(peekChar(1)))
        {
            tok.text.push_back(getChar()); // consume '$'
            tok.kind = interpolatedKind;
            Interpolation frame;
            frame.identifierOnly = true;
            interpolation_.push_back(frame);
            return tok;
        }

        if (c == '$' && peekChar(1) == '(')
        {
            tok.text.push_back(getChar()); // consume '$'
            tok.text.push_back(getChar()); // consume '('
            tok.kind = interpolatedKind;
            interpolation_.push_back(Interpolation{});
            return tok;
        }

        if (isNewline(c))
            break;

        if (c == '\\')
        {
            tok.text.push_back(getChar());
            if (eof() || isNewline(peekChar()))
                break;
            char escaped = getChar();
            tok.text.push_back(escaped);
            if (auto esc = processEscape(escaped))
            {
                tok.stringValue.push_back(*esc);
            }
            else
            {
                reportError(tok.loc, std::string("invalid escape sequence: \\") + escaped);
                tok.kind = TokenKind::Error;
                return tok;
            }
            continue;
        }

        tok.text.push_back(getChar());
        tok.stringValue.push_back(c);
    }

    reportError(tok.loc, "unterminated string literal");
    tok.kind = TokenKind::Error;
    return tok;
}

bool Lexer::previousEndsOperand() const
{
    switch (lastKind_)
    {
        case TokenKind::Identifier:
        case TokenKind::NumberLiteral:
        case TokenKind::StringLiteral:
        case TokenKind::StringEnd:
        case TokenKind::RParen:
        case TokenKind::KwTrue:
        case TokenKind::KwFalse:
            return true;
        default:
            return false;
    }
}

bool Lexer::closingDashAhead() const
{
    size_t i = pos_ + 1;
    while (i < source_.size() && !isNewline(source_[i]))
    {
        char c = source_[i];
        if (c == '\\')
        {
            i += 2;
            continue;
        }
        if (c == '$' && i + 1 < source_.size() && source_[i + 1] == '(')
        {
            int depth = 1;
            i += 2;
            while (i < source_.size() && !isNewline(source_[i]) && depth > 0)
            {
                if (source_[i] == '(')
                    ++depth;
                else if (source_[i] == ')')
                    --depth;
                ++i;
            }
            continue;
        }
        if (c == '-')
            return !continuesExpression(i + 1);
        ++i;
    }
    return false;
}

bool Lexer::continuesExpression(size_t i) const
{
    while (i < source_.size() && (source_[i] == ' ' || source_[i] == '\t'))
        ++i;
    if (i >= source_.size())
        return false;

    const char c = source_[i];
    if (isDigit(c) || c == '(')
        return true;
    if (c == '!')
        return i + 1 >= source_.size() || source_[i + 1] != '=';
    if (!isIdentifierStart(c))
        return false;

    size_t end = i;
    while (end < source_.size() && isIdentifierContinue(source_[end]))
        ++end;
    auto kw = lookupKeyword(source_.substr(i, end - i));
    return !kw || *kw == TokenKind::KwTrue || *kw == TokenKind::KwFalse;
}

Token Lexer::lexDashOrString()
{
    if (!previousEndsOperand() && closingDashAhead())
        return lexString();

    Token tok;
    tok.loc = currentLoc();
    tok.kind = TokenKind::Minus;
    tok.text = "-";
    getChar();
    return tok;
}

Token Lexer::lexToken()
{
    // Inside `$name`: emit the identifier, then resume the string.
    if (!interpolation_.empty() && interpolation_.back().identifierOnly)
    {
        auto &frame = interpolation_.back();
        if (!frame.identifierLexed)
        {
            frame.identifierLexed = true;
            return lexIdentifierOrKeyword();
        }
        interpolation_.pop_back();
        Token tok;
        tok.loc = currentLoc();
        return lexStringBody(std::move(tok), TokenKind::StringEnd, TokenKind::StringMid);
    }

    std::vector<TokenComment> comments;
    if (!skipWhitespaceAndComments(comments))
    {
        Token tok;
        tok.kind = TokenKind::Error;
        tok.loc = currentLoc();
        return tok;
    }

    Token tok;
    tok.loc = currentLoc();

    if (eof())
    {
        tok.kind = TokenKind::Eof;
        tok.leadingComments = std::move(comments);
        return tok;
    }

    char c = peekChar();

    if (isIdentifierStart(c))
    {
        tok = lexIdentifierOrKeyword();
        tok.leadingComments = std::move(comments);
        return tok;
    }

    if (isDigit(c))
    {
        tok = lexNumber();
        tok.leadingComments = std::move(comments);
        return tok;
    }

    if (c == '-')
    {
        tok = lexDashOrString();
        tok.leadingComments = std::move(comments);
        return tok;
    }

    tok.leadingComments = std::move(comments);
    switch (c)
    {
        case '+':
            tok.kind = TokenKind::Plus;
            tok.text = "+";
            getChar();
            break;

        case '*':
            tok.kind = TokenKind::Star;
            tok.text = "*";
            getChar();
            break;

        case '/':
            tok.kind = TokenKind::Slash;
            tok.text = "/";
            getChar();
            break;

        case '%':
            tok.kind = TokenKind::Percent;
            tok.text = "%";
            getChar();
            break;

        case ',':
            tok.kind = TokenKind::Comma;
            tok.text = ",";
            getChar();
            break;

        case '|':
            tok.kind = TokenKind::Pipe;
            tok.text = "|";
            getChar();
            break;

        case '!':
            getChar();
            if (peekChar() == '=')
            {
                getChar();
                tok.kind = TokenKind::NotEqual;
                tok.text = "!=";
            }
            else
            {
                tok.kind = TokenKind::Bang;
                tok.text = "!";
            }
            break;

        case '=':
            getChar();
            if (peekChar() == '=')
            {
                getChar();
                tok.kind = TokenKind::EqualEqual;
                tok.text = "==";
            }
            else
            {
                tok.kind = TokenKind::Equal;
                tok.text = "=";
            }
            break;

        case '<':
            getChar();
            if (peekChar() == '=')
            {
                getChar();
                tok.kind = TokenKind::LessEqual;
                tok.text = "<=";
            }
            else
            {
                tok.kind = TokenKind::Less;
                tok.text = "<";
            }
            break;

        case '>':
            getChar();
            if (peekChar() == '=')
            {
                getChar();
                tok.kind = TokenKind::GreaterEqual;
                tok.text = ">=";
            }
            else
            {
                tok.kind = TokenKind::Greater;
                tok.text = ">";
            }
            break;

        case '(':
            tok.kind = TokenKind::LParen;
            tok.text = "(";
            getChar();
            if (!interpolation_.empty())
                interpolation_.back().parenDepth++;
            break;

        case ')':
            getChar();
            if (!interpolation_.empty())
            {
                if (interpolation_.back().parenDepth == 0)
                {
                    // Closes a `$( ... )` span - continue lexing the string
                    interpolation_.pop_back();
                    Token rest;
                    rest.loc = currentLoc();
                    return lexStringBody(std::move(rest), TokenKind::StringEnd, TokenKind::StringMid);
                }
                interpolation_.back().parenDepth--;
            }
            tok.kind = TokenKind::RParen;
            tok.text = ")";
            break;

        default:
            reportError(tok.loc, std::string("unexpected character '") + c + "'");
            tok.kind = TokenKind::Error;
            tok.text = std::string(1, c);
            getChar();
            break;
    }

    return tok;
}

Token Lexer::next()
{
    if (peeked_.has_value())
    {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }

    Token tok = lexToken();
    lastKind_ = tok.kind;
    return tok;
}

const Token &Lexer::peek()
{
    if (!peeked_.has_value())
    {
        peeked_ = lexToken();
        lastKind_ = peeked_->kind;
    }
    return *peeked_;
}

} // namespace lion::frontends::lioncode
