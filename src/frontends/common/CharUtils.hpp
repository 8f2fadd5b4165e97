//===----------------------------------------------------------------------===//
//
// Part of the LionCode project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: frontends/common/CharUtils.hpp
// Purpose: ASCII character classification used by the LionCode lexer and by
//          the code generator when escaping string literals.
//
//===----------------------------------------------------------------------===//
#pragma once

namespace lion::frontends::common::char_utils
{

[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character can start an identifier (letter or underscore).
[[nodiscard]] constexpr bool isIdentifierStart(char c) noexcept
{
    return isLetter(c) || c == '_';
}

/// @brief Check if character can continue an identifier (letter, digit, or underscore).
[[nodiscard]] constexpr bool isIdentifierContinue(char c) noexcept
{
    return isLetter(c) || isDigit(c) || c == '_';
}

[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

[[nodiscard]] constexpr bool isNewline(char c) noexcept
{
    return c == '\r' || c == '\n';
}

/// @brief Check for a printable ASCII character (space through tilde).
[[nodiscard]] constexpr bool isPrintable(char c) noexcept
{
    return c >= 0x20 && c < 0x7f;
}

} // namespace lion::frontends::common::char_utils
