//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/CSharpExtractor.cpp
// Purpose: C# using-directive extraction.
//
// Key invariants:
//   - Verbatim strings (`@"..."`, `$@"..."`) treat `""` as an escaped quote.
//   - Raw strings open with three or more quotes and close on a run at least
//     as long.
//   - Only directives before the first namespace/type declaration count, so
//     `using` statements inside method bodies are never reported.
//   - A directive may wrap across lines up to its semicolon.
//
//===----------------------------------------------------------------------===//

#include "extract/CharUtils.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"
#include "extract/StripCursor.hpp"

namespace thymus::extract
{

namespace
{
enum class CsState
{
    Code,
    LineComment,
    BlockComment,
    String,
    VerbatimString,
    CharLiteral,
    RawString
};

std::size_t quoteRun(const StripCursor &cur, std::size_t offset)
{
    std::size_t count = 0;
    while (cur.peek(offset + count) == '"')
        ++count;
    return count;
}
} // namespace

std::string stripCSharpComments(std::string_view source)
{
    StripCursor cur(source);
    CsState state = CsState::Code;
    std::size_t rawQuotes = 0;

    while (!cur.eof())
    {
        const char ch = cur.peek();
        switch (state)
        {
            case CsState::Code:
            {
                if (ch == '/' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = CsState::LineComment;
                    continue;
                }
                if (ch == '/' && cur.peek(1) == '*')
                {
                    cur.blank(2);
                    state = CsState::BlockComment;
                    continue;
                }
                // @"..." and $@"..."; a run of three or more quotes is raw instead.
                std::size_t prefix = 0;
                if (ch == '@')
                    prefix = 1;
                else if (ch == '$' && cur.peek(1) == '@')
                    prefix = 2;
                if (prefix != 0 && cur.peek(prefix) == '"')
                {
                    const std::size_t run = quoteRun(cur, prefix);
                    if (run >= 3)
                    {
                        rawQuotes = run;
                        state = CsState::RawString;
                        cur.keep(prefix + run);
                    }
                    else
                    {
                        state = CsState::VerbatimString;
                        cur.keep(prefix + 1);
                    }
                    continue;
                }
                if (cur.lookingAt("\"\"\""))
                {
                    rawQuotes = quoteRun(cur, 0);
                    state = CsState::RawString;
                    cur.keep(rawQuotes);
                    continue;
                }
                if (ch == '$' && cur.peek(1) == '"')
                {
                    state = CsState::String;
                    cur.keep(2);
                    continue;
                }
                if (ch == '"')
                    state = CsState::String;
                else if (ch == '\'')
                    state = CsState::CharLiteral;
                cur.keep();
                break;
            }

            case CsState::LineComment:
                if (ch == '\n')
                {
                    state = CsState::Code;
                    cur.keep();
                }
                else
                {
                    cur.blank();
                }
                break;

            case CsState::BlockComment:
                if (ch == '*' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = CsState::Code;
                    continue;
                }
                cur.blank();
                break;

            case CsState::String:
            case CsState::CharLiteral:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if ((state == CsState::String && ch == '"') ||
                    (state == CsState::CharLiteral && ch == '\''))
                    state = CsState::Code;
                cur.keep();
                break;

            case CsState::VerbatimString:
                if (ch == '"')
                {
                    if (cur.peek(1) == '"')
                    {
                        cur.keep(2);
                        continue;
                    }
                    state = CsState::Code;
                }
                cur.keep();
                break;

            case CsState::RawString:
                if (ch == '"')
                {
                    const std::size_t run = quoteRun(cur, 0);
                    if (run >= rawQuotes)
                        state = CsState::Code;
                    cur.keep(run);
                    continue;
                }
                cur.keep();
                break;
        }
    }
    return cur.take();
}

ImportVector extractCSharpImports(std::string_view source)
{
    static const std::regex kDeclaration(R"((?:namespace|class|struct|interface|enum|record)\s)");
    static const std::regex kUsing(
        R"((?:global\s+)?using\s+(?:static\s+)?(?:\w+\s*=\s*)?(?:global::)?([\w.]+))");

    const std::string cleaned = stripCSharpComments(source);
    ImportList imports;
    detail::SvMatch m;

    for (const std::string &statement : detail::joinStatements(cleaned, "using", ';'))
    {
        const std::string_view stripped = statement;
        if (stripped.empty())
            continue;
        if (detail::matchAtStart(stripped, kDeclaration, m))
            break;
        if (detail::matchAtStart(stripped, kUsing, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

} // namespace thymus::extract
