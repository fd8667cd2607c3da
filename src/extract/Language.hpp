//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/Language.hpp
// Purpose: Source languages understood by the import extractor.
// Key invariants: Language selection is a pure function of the file extension
//                 (case-insensitive); unknown extensions map to Unknown.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string_view>
#include <vector>

namespace thymus::extract
{

enum class Language
{
    Unknown,
    JavaScript, ///< .ts .tsx .js .jsx .mjs .cjs
    Python,
    Go,
    Rust,
    Java,
    Dart,
    Kotlin, ///< .kt .kts
    Swift,
    CSharp,
    Php,
    Ruby
};

/// @brief Language for extension @p ext (with leading dot, any case).
[[nodiscard]] Language languageForExtension(std::string_view ext);

/// @brief Language for the extension of @p path.
[[nodiscard]] Language languageForPath(std::string_view path);

/// @brief Lower-case display name ("javascript", "python", ...).
[[nodiscard]] const char *languageName(Language lang);

/// @brief Every extension the extractor understands, with leading dot.
[[nodiscard]] const std::vector<std::string_view> &sourceExtensions();

} // namespace thymus::extract
