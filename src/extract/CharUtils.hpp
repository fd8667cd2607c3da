//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/CharUtils.hpp
// Purpose: Character classification and small text helpers for the scanners.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace thymus::extract::char_utils
{

/// @brief Check if character is an ASCII letter (A-Z, a-z).
[[nodiscard]] constexpr bool isLetter(char c) noexcept
{
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

/// @brief Check if character is a decimal digit (0-9).
[[nodiscard]] constexpr bool isDigit(char c) noexcept
{
    return c >= '0' && c <= '9';
}

/// @brief Check if character is alphanumeric (letter or digit).
[[nodiscard]] constexpr bool isAlphanumeric(char c) noexcept
{
    return isLetter(c) || isDigit(c);
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

/// @brief Check if character is horizontal whitespace (space or tab).
[[nodiscard]] constexpr bool isHorizontalWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t';
}

/// @brief Check if character is ASCII whitespace.
[[nodiscard]] constexpr bool isWhitespace(char c) noexcept
{
    return c == ' ' || c == '\t' || c == '\r' || c == '\n' || c == '\f' || c == '\v';
}

/// @brief Convert ASCII character to lowercase.
[[nodiscard]] constexpr char toLower(char c) noexcept
{
    if (c >= 'A' && c <= 'Z')
        return static_cast<char>(c + ('a' - 'A'));
    return c;
}

/// @brief Convert string to lowercase (ASCII only).
[[nodiscard]] inline std::string toLowercase(std::string_view s)
{
    std::string result;
    result.reserve(s.size());
    for (char c : s)
        result.push_back(toLower(c));
    return result;
}

/// @brief Strip leading and trailing ASCII whitespace.
[[nodiscard]] inline std::string_view trim(std::string_view s)
{
    size_t begin = 0;
    while (begin < s.size() && isWhitespace(s[begin]))
        ++begin;
    size_t end = s.size();
    while (end > begin && isWhitespace(s[end - 1]))
        --end;
    return s.substr(begin, end - begin);
}

/// @brief Split @p text on '\n'; a trailing newline yields a final empty line.
[[nodiscard]] inline std::vector<std::string_view> splitLines(std::string_view text)
{
    std::vector<std::string_view> lines;
    size_t start = 0;
    for (;;)
    {
        size_t nl = text.find('\n', start);
        if (nl == std::string_view::npos)
        {
            lines.push_back(text.substr(start));
            return lines;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }
}

} // namespace thymus::extract::char_utils
