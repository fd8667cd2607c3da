//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/Language.cpp
// Purpose: Extension to language mapping.
//
//===----------------------------------------------------------------------===//

#include "extract/Language.hpp"

#include "extract/CharUtils.hpp"
#include "support/path_utils.hpp"

#include <string>

namespace thymus::extract
{

namespace
{
struct ExtensionEntry
{
    std::string_view ext;
    Language lang;
};

constexpr ExtensionEntry kExtensions[] = {
    {".ts", Language::JavaScript},  {".tsx", Language::JavaScript}, {".js", Language::JavaScript},
    {".jsx", Language::JavaScript}, {".mjs", Language::JavaScript}, {".cjs", Language::JavaScript},
    {".py", Language::Python},      {".go", Language::Go},          {".rs", Language::Rust},
    {".java", Language::Java},      {".dart", Language::Dart},      {".kt", Language::Kotlin},
    {".kts", Language::Kotlin},     {".swift", Language::Swift},    {".cs", Language::CSharp},
    {".php", Language::Php},        {".rb", Language::Ruby},
};
} // namespace

Language languageForExtension(std::string_view ext)
{
    const std::string key = char_utils::toLowercase(ext);
    for (const auto &entry : kExtensions)
    {
        if (entry.ext == key)
            return entry.lang;
    }
    return Language::Unknown;
}

Language languageForPath(std::string_view path)
{
    return languageForExtension(support::extension(support::toForwardSlashes(path)));
}

const char *languageName(Language lang)
{
    switch (lang)
    {
        case Language::JavaScript:
            return "javascript";
        case Language::Python:
            return "python";
        case Language::Go:
            return "go";
        case Language::Rust:
            return "rust";
        case Language::Java:
            return "java";
        case Language::Dart:
            return "dart";
        case Language::Kotlin:
            return "kotlin";
        case Language::Swift:
            return "swift";
        case Language::CSharp:
            return "csharp";
        case Language::Php:
            return "php";
        case Language::Ruby:
            return "ruby";
        case Language::Unknown:
            break;
    }
    return "unknown";
}

const std::vector<std::string_view> &sourceExtensions()
{
    static const std::vector<std::string_view> exts = []
    {
        std::vector<std::string_view> out;
        for (const auto &entry : kExtensions)
            out.push_back(entry.ext);
        return out;
    }();
    return exts;
}

} // namespace thymus::extract
