//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/GoExtractor.cpp
// Purpose: Go import extraction.
//
// Go imports live at file scope, so only lines beginning with `import` (or the
// body of an `import ( ... )` group) are considered after comment stripping.
//
//===----------------------------------------------------------------------===//

#include "extract/CStyleStripper.hpp"
#include "extract/CharUtils.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"

namespace thymus::extract
{

std::string stripGoComments(std::string_view source)
{
    CStyleSyntax syntax;
    syntax.backtickRawStrings = true;
    return stripCStyleComments(source, syntax);
}

ImportVector extractGoImports(std::string_view source)
{
    static const std::regex kGroupOpen(R"(import\s*\()");
    // Group member: `"path"`, `alias "path"`, `_ "path"` or `. "path"`.
    static const std::regex kGroupMember(R"re(\s*(?:[\w.]+\s+)?"([^"]+)")re");
    static const std::regex kSingle(R"re(import\s+(?:[\w.]+\s+)?"([^"]+)")re");

    const std::string cleaned = stripGoComments(source);
    ImportList imports;
    bool inGroup = false;
    detail::SvMatch m;

    for (std::string_view line : char_utils::splitLines(cleaned))
    {
        const std::string_view stripped = char_utils::trim(line);
        if (stripped.empty())
            continue;

        if (detail::matchAtStart(stripped, kGroupOpen, m))
        {
            inGroup = true;
            continue;
        }
        if (inGroup && stripped.front() == ')')
        {
            inGroup = false;
            continue;
        }

        if (inGroup)
        {
            if (detail::matchAtStart(line, kGroupMember, m))
                imports.add(m[1].str());
        }
        else if (stripped.substr(0, 7) == "import ")
        {
            if (detail::matchAtStart(stripped, kSingle, m))
                imports.add(m[1].str());
        }
    }
    return imports.release();
}

} // namespace thymus::extract
