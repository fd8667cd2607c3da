//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/LanguageExtractors.hpp
// Purpose: Per-language comment strippers and import recognizers.
//
// Every language runs in two phases. The strip function blanks comments
// (keeping string text and line structure); the extract function recognizes
// import statements in the stripped text and returns specifiers in order of
// first appearance without duplicates.
//
// Key invariants:
//   - strip*() output has the same length and the same newline positions as
//     the input.
//   - extract*() never throws on malformed input; it returns what it can
//     recognize (Python returns nothing on a syntax error).
//
//===----------------------------------------------------------------------===//
#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::extract
{

using ImportVector = std::vector<std::string>;

std::string stripJsComments(std::string_view source);
ImportVector extractJsImports(std::string_view source);

/// @brief Python imports via a tokenizer-driven statement parser.
/// @details Collects `import a.b` names and the module of `from X import`,
///          at any nesting depth. Relative dots are dropped; `from . import x`
///          contributes nothing. Any lexical or import-statement syntax error
///          yields an empty result.
ImportVector extractPythonImports(std::string_view source);

std::string stripGoComments(std::string_view source);
ImportVector extractGoImports(std::string_view source);

std::string stripRustComments(std::string_view source);
ImportVector extractRustImports(std::string_view source);

std::string stripJavaComments(std::string_view source);
ImportVector extractJavaImports(std::string_view source);

std::string stripDartComments(std::string_view source);
ImportVector extractDartImports(std::string_view source);

std::string stripKotlinComments(std::string_view source);
ImportVector extractKotlinImports(std::string_view source);

std::string stripSwiftComments(std::string_view source);
ImportVector extractSwiftImports(std::string_view source);

std::string stripCSharpComments(std::string_view source);
ImportVector extractCSharpImports(std::string_view source);

std::string stripPhpComments(std::string_view source);
ImportVector extractPhpImports(std::string_view source);

std::string stripRubyComments(std::string_view source);
ImportVector extractRubyImports(std::string_view source);

namespace detail
{
using SvMatch = std::match_results<std::string_view::const_iterator>;

/// @brief Match @p re anchored at the start of @p text.
inline bool matchAtStart(std::string_view text, const std::regex &re, SvMatch &m)
{
    return std::regex_search(text.begin(), text.end(), m, re,
                             std::regex_constants::match_continuous);
}

/// @brief Collect group 1 of @p pattern from every trimmed line of @p cleaned
///        where it matches at the line start.
ImportVector collectLineStartImports(std::string_view cleaned, const std::regex &pattern);

/// @brief Split a brace group body ("a, b as c") into member names without aliases.
std::vector<std::string> splitGroupMembers(std::string_view body);

/// Longest run of physical lines folded into one logical statement.
inline constexpr std::size_t kMaxStatementLines = 64;

/// @brief Split @p cleaned into trimmed logical statements.
/// @details A trimmed line starting with the word @p head and lacking
///          @p terminator absorbs the following lines, joined by single
///          spaces, until one supplies the terminator. Every other line is
///          returned on its own.
std::vector<std::string> joinStatements(std::string_view cleaned, std::string_view head, char terminator);
} // namespace detail

} // namespace thymus::extract
