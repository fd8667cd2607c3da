//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/DartExtractor.cpp
// Purpose: Dart import/export/part directive extraction.
//
//===----------------------------------------------------------------------===//

#include "extract/CStyleStripper.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"

namespace thymus::extract
{

std::string stripDartComments(std::string_view source)
{
    CStyleSyntax syntax;
    syntax.tripleDoubleQuotes = true;
    syntax.tripleSingleQuotes = true;
    syntax.rawStringPrefix = true;
    return stripCStyleComments(source, syntax);
}

ImportVector extractDartImports(std::string_view source)
{
    static const std::regex kDirective(R"((?:import|export|part)\s+['"](.+?)['"])");
    ImportList imports;
    detail::SvMatch m;
    // An import may wrap before its URI; it always ends at the semicolon.
    for (const std::string &statement : detail::joinStatements(stripDartComments(source), "import", ';'))
    {
        if (!statement.empty() && detail::matchAtStart(statement, kDirective, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

} // namespace thymus::extract
