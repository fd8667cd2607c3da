//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/CStyleStripper.hpp
// Purpose: Comment stripper shared by languages with C-style comments.
//
// Go, Java, Kotlin, Dart and Swift differ only in which literal forms exist
// and whether block comments nest; CStyleSyntax captures those switches.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string>
#include <string_view>

namespace thymus::extract
{

/// @brief Literal and comment forms recognized by stripCStyleComments().
struct CStyleSyntax
{
    bool nestedBlockComments = false; ///< `/* /* */ */` keeps a depth counter.
    bool tripleDoubleQuotes = false;  ///< `"""..."""`, no escapes.
    bool tripleSingleQuotes = false;  ///< `'''...'''`, no escapes.
    bool singleQuoteLiterals = true;  ///< `'...'` with backslash escapes.
    bool backtickRawStrings = false;  ///< `` `...` ``, no escapes.
    bool rawStringPrefix = false;     ///< `r"..."` and `r'...'`, no escapes.
};

/// @brief Blank `//` and `/* */` comments in @p source, keeping literals intact.
std::string stripCStyleComments(std::string_view source, const CStyleSyntax &syntax);

} // namespace thymus::extract
