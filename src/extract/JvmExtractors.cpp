//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/JvmExtractors.cpp
// Purpose: Java and Kotlin import extraction.
//
// Both languages only allow `import` in the file header, so a statement
// must begin with the keyword after comment stripping. Kotlin block comments nest
// and it has triple-quoted raw strings; Java has neither.
//
//===----------------------------------------------------------------------===//

#include "extract/CStyleStripper.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"

namespace thymus::extract
{

std::string stripJavaComments(std::string_view source)
{
    return stripCStyleComments(source, CStyleSyntax{});
}

ImportVector extractJavaImports(std::string_view source)
{
    static const std::regex kImport(R"(import\s+(?:static\s+)?([\w.*]+))");

    // Java imports end at a semicolon and may wrap after `import static`.
    ImportList imports;
    detail::SvMatch m;
    for (const std::string &statement : detail::joinStatements(stripJavaComments(source), "import", ';'))
    {
        if (detail::matchAtStart(statement, kImport, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

std::string stripKotlinComments(std::string_view source)
{
    CStyleSyntax syntax;
    syntax.nestedBlockComments = true;
    syntax.tripleDoubleQuotes = true;
    return stripCStyleComments(source, syntax);
}

ImportVector extractKotlinImports(std::string_view source)
{
    // `import a.b.C`, `import a.b.*`, `import a.b.C as D` (alias dropped).
    static const std::regex kImport(R"(import\s+(\w+(?:\.\w+)*(?:\.\*)?))");
    return detail::collectLineStartImports(stripKotlinComments(source), kImport);
}

} // namespace thymus::extract
