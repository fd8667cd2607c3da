//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/ImportExtractor.cpp
// Purpose: Language dispatch and helpers shared by the per-language extractors.
//
//===----------------------------------------------------------------------===//

#include "extract/ImportExtractor.hpp"

#include "extract/CharUtils.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"
#include "support/source_loader.hpp"

namespace thymus::extract
{

namespace detail
{
ImportVector collectLineStartImports(std::string_view cleaned, const std::regex &pattern)
{
    ImportList imports;
    SvMatch m;
    for (std::string_view line : char_utils::splitLines(cleaned))
    {
        const std::string_view stripped = char_utils::trim(line);
        if (!stripped.empty() && matchAtStart(stripped, pattern, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

std::vector<std::string> splitGroupMembers(std::string_view body)
{
    std::vector<std::string> members;
    std::size_t start = 0;
    while (start <= body.size())
    {
        std::size_t comma = body.find(',', start);
        if (comma == std::string_view::npos)
            comma = body.size();
        std::string_view item = char_utils::trim(body.substr(start, comma - start));
        const std::size_t alias = item.find(" as ");
        if (alias != std::string_view::npos)
            item = char_utils::trim(item.substr(0, alias));
        if (!item.empty())
            members.emplace_back(item);
        start = comma + 1;
    }
    return members;
}

std::vector<std::string> joinStatements(std::string_view cleaned, std::string_view head, char terminator)
{
    const std::vector<std::string_view> lines = char_utils::splitLines(cleaned);
    std::vector<std::string> statements;
    statements.reserve(lines.size());

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::string statement(char_utils::trim(lines[i]));
        const bool opens = statement.compare(0, head.size(), head) == 0 &&
                           (statement.size() == head.size() ||
                            !char_utils::isIdentifierContinue(statement[head.size()]));
        if (opens)
        {
            std::size_t joined = 1;
            while (statement.find(terminator) == std::string::npos && i + 1 < lines.size() &&
                   joined < kMaxStatementLines)
            {
                const std::string_view next = char_utils::trim(lines[++i]);
                ++joined;
                if (next.empty())
                    continue;
                statement += ' ';
                statement += next;
            }
        }
        statements.push_back(std::move(statement));
    }
    return statements;
}
} // namespace detail

std::vector<std::string> extractImports(std::string_view content, Language lang)
{
    switch (lang)
    {
        case Language::JavaScript:
            return extractJsImports(content);
        case Language::Python:
            return extractPythonImports(content);
        case Language::Go:
            return extractGoImports(content);
        case Language::Rust:
            return extractRustImports(content);
        case Language::Java:
            return extractJavaImports(content);
        case Language::Dart:
            return extractDartImports(content);
        case Language::Kotlin:
            return extractKotlinImports(content);
        case Language::Swift:
            return extractSwiftImports(content);
        case Language::CSharp:
            return extractCSharpImports(content);
        case Language::Php:
            return extractPhpImports(content);
        case Language::Ruby:
            return extractRubyImports(content);
        case Language::Unknown:
            break;
    }
    return {};
}

std::vector<std::string> extractImportsFromFile(const std::string &path, std::uintmax_t maxBytes)
{
    const Language lang = languageForPath(path);
    if (lang == Language::Unknown)
        return {};

    auto content = support::loadSourceFile(path, maxBytes);
    if (!content)
        return {};
    return extractImports(content.value(), lang);
}

} // namespace thymus::extract
