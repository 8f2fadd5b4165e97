//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
///
/// @file Parser_Expr.cpp
/// @brief Expression parsing for LionCode.
///
/// @details Binary expressions use precedence climbing: each level calls the
/// next higher level for its operands and loops over left-associative
/// operators of its own level. Comparisons do not chain; `a < b < c` stops
/// after `a < b` and the enclosing statement list reports the stray `<`.
///
/// ## Comparison phrases
///
/// `is` is always followed by one of `equal to`, `less than` or
/// `greater than`. The phrase words are ordinary identifiers everywhere else.
///
/// ## String Interpolation
///
/// A StringStart token is followed by the embedded expression (absent for
/// `$()`), then either StringMid (more text and another interpolation) or
/// StringEnd.
///
//===----------------------------------------------------------------------===//

#include "frontends/lioncode/Parser.hpp"

namespace lion::frontends::lioncode
{

SynExprPtr Parser::parseExpression()
{
    return parseLogicalOr();
}

SynExprPtr Parser::parseLogicalOr()
{
    SynExprPtr expr = parseLogicalAnd();
    if (!expr)
        return nullptr;

    while (check(TokenKind::KwOr))
    {
        SourceLoc loc = advance().loc;
        SynExprPtr right = parseLogicalAnd();
        if (!right)
            return nullptr;
        expr = std::make_unique<SynBinary>(loc, BinaryOp::Or, std::move(expr), std::move(right));
    }
    return expr;
}

SynExprPtr Parser::parseLogicalAnd()
{
    SynExprPtr expr = parseComparison();
    if (!expr)
        return nullptr;

    while (check(TokenKind::KwAnd))
    {
        SourceLoc loc = advance().loc;
        SynExprPtr right = parseComparison();
        if (!right)
            return nullptr;
        expr = std::make_unique<SynBinary>(loc, BinaryOp::And, std::move(expr), std::move(right));
    }
    return expr;
}

std::optional<CompareOp> Parser::matchComparisonOp()
{
    switch (current_.kind)
    {
        case TokenKind::EqualEqual:
            advance();
            return CompareOp::Eq;
        case TokenKind::NotEqual:
            advance();
            return CompareOp::Ne;
        case TokenKind::Less:
            advance();
            return CompareOp::Lt;
        case TokenKind::LessEqual:
            advance();
            return CompareOp::Le;
        case TokenKind::Greater:
            advance();
            return CompareOp::Gt;
        case TokenKind::GreaterEqual:
            advance();
            return CompareOp::Ge;
        case TokenKind::KwIs:
            break;
        default:
            return std::nullopt;
    }

    advance(); // is
    if (checkWord("equal"))
    {
        advance();
        if (!checkWord("to"))
        {
            unexpected("'to'");
            return std::nullopt;
        }
        advance();
        return CompareOp::IsEqualTo;
    }
    if (checkWord("less") || checkWord("greater"))
    {
        bool less = current_.text == "less";
        advance();
        if (!checkWord("than"))
        {
            unexpected("'than'");
            return std::nullopt;
        }
        advance();
        return less ? CompareOp::IsLessThan : CompareOp::IsGreaterThan;
    }
    unexpected("'equal', 'less' or 'greater'");
    return std::nullopt;
}

SynExprPtr Parser::parseComparison()
{
    SynExprPtr left = parseAdditive();
    if (!left)
        return nullptr;

    SourceLoc loc = current_.loc;
    std::optional<CompareOp> op = matchComparisonOp();
    if (hasError_)
        return nullptr;
    if (!op)
        return left;

    SynExprPtr right = parseAdditive();
    if (!right)
        return nullptr;
    return std::make_unique<SynComparison>(loc, *op, std::move(left), std::move(right));
}

SynExprPtr Parser::parseAdditive()
{
    SynExprPtr expr = parseMultiplicative();
    if (!expr)
        return nullptr;

    while (check(TokenKind::Plus) || check(TokenKind::Minus))
    {
        Token opTok = advance();
        BinaryOp op = opTok.kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
        SynExprPtr right = parseMultiplicative();
        if (!right)
            return nullptr;
        expr = std::make_unique<SynBinary>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

SynExprPtr Parser::parseMultiplicative()
{
    SynExprPtr expr = parseUnary();
    if (!expr)
        return nullptr;

    while (check(TokenKind::Star) || check(TokenKind::Slash) || check(TokenKind::Percent))
    {
        Token opTok = advance();
        BinaryOp op = BinaryOp::Mul;
        if (opTok.kind == TokenKind::Slash)
            op = BinaryOp::Div;
        else if (opTok.kind == TokenKind::Percent)
            op = BinaryOp::Mod;

        SynExprPtr right = parseUnary();
        if (!right)
            return nullptr;
        expr = std::make_unique<SynBinary>(opTok.loc, op, std::move(expr), std::move(right));
    }
    return expr;
}

SynExprPtr Parser::parseUnary()
{
    if (check(TokenKind::Minus) || check(TokenKind::Bang))
    {
        Token opTok = advance();
        SynExprPtr operand = parseUnary();
        if (!operand)
            return nullptr;
        UnaryOp op = opTok.kind == TokenKind::Minus ? UnaryOp::Neg : UnaryOp::Not;
        return std::make_unique<SynUnary>(opTok.loc, op, std::move(operand));
    }
    return parsePrimary();
}

bool Parser::parseCallArgs(std::vector<SynExprPtr> &args)
{
    if (!expect(TokenKind::LParen, "'('"))
        return false;

    if (!check(TokenKind::RParen))
    {
        do
        {
            SynExprPtr arg = parseExpression();
            if (!arg)
                return false;
            args.push_back(std::move(arg));
        } while (match(TokenKind::Comma));
    }

    return expect(TokenKind::RParen, "')'");
}

SynExprPtr Parser::parsePrimary()
{
    SourceLoc loc = current_.loc;

    switch (current_.kind)
    {
        case TokenKind::NumberLiteral:
        {
            Token tok = advance();
            return std::make_unique<SynNumber>(loc, tok.numberValue, tok.text);
        }

        case TokenKind::StringLiteral:
        {
            Token tok = advance();
            auto str = std::make_unique<SynString>(loc);
            str->segments.push_back(SynStringSegment{std::move(tok.stringValue), nullptr});
            return str;
        }

        case TokenKind::StringStart:
            return parseInterpolatedString();

        case TokenKind::KwTrue:
            advance();
            return std::make_unique<SynBool>(loc, true);

        case TokenKind::KwFalse:
            advance();
            return std::make_unique<SynBool>(loc, false);

        case TokenKind::Identifier:
        {
            std::string name = advance().text;
            if (check(TokenKind::LParen))
            {
                std::vector<SynExprPtr> args;
                if (!parseCallArgs(args))
                    return nullptr;
                return std::make_unique<SynCall>(loc, std::move(name), std::move(args));
            }
            return std::make_unique<SynIdentifier>(loc, std::move(name));
        }

        case TokenKind::LParen:
        {
            advance();
            SynExprPtr inner = parseExpression();
            if (!inner)
                return nullptr;
            if (!expect(TokenKind::RParen, "')'"))
                return nullptr;
            return inner;
        }

        default:
            unexpected("an expression");
            return nullptr;
    }
}

SynExprPtr Parser::parseInterpolatedString()
{
    Token start = advance();
    auto str = std::make_unique<SynString>(start.loc);
    str->interpolated = true;
    if (!start.stringValue.empty())
        str->segments.push_back(SynStringSegment{std::move(start.stringValue), nullptr});

    while (true)
    {
        // `$()` embeds nothing.
        if (!check(TokenKind::StringMid) && !check(TokenKind::StringEnd))
        {
            SynExprPtr expr = parseExpression();
            if (!expr)
                return nullptr;
            str->segments.push_back(SynStringSegment{{}, std::move(expr)});
        }

        if (check(TokenKind::StringMid) || check(TokenKind::StringEnd))
        {
            bool done = check(TokenKind::StringEnd);
            Token part = advance();
            if (!part.stringValue.empty())
                str->segments.push_back(SynStringSegment{std::move(part.stringValue), nullptr});
            if (done)
                return str;
            continue;
        }

        unexpected("')'");
        return nullptr;
    }
}

} // namespace lion::frontends::lioncode
