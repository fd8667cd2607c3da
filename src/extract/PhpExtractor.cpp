//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/PhpExtractor.cpp
// Purpose: PHP `use` / require / include extraction.
//
// Key invariants:
//   - `#` starts a comment unless it opens an attribute (`#[`).
//   - Single-quoted strings only escape `\\` and `\'`.
//   - A heredoc/nowdoc body (`<<<ID`, `<<<'ID'`, `<<<"ID"`) runs until a
//     line whose indented content starts with ID followed by a newline, `;`
//     or end of input.
//   - Grouped `use A\{B, C as D};` yields `A\B` and `A\C`; a `use`
//     statement runs to its semicolon across lines.
//
//===----------------------------------------------------------------------===//

#include "extract/CharUtils.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"
#include "extract/StripCursor.hpp"

namespace thymus::extract
{

using namespace char_utils;

namespace
{
enum class PhpState
{
    Code,
    LineComment,
    BlockComment,
    SingleString,
    DoubleString,
    Heredoc
};
} // namespace

std::string stripPhpComments(std::string_view source)
{
    StripCursor cur(source);
    PhpState state = PhpState::Code;
    std::string heredocId;

    while (!cur.eof())
    {
        const char ch = cur.peek();
        switch (state)
        {
            case PhpState::Code:
            {
                if (ch == '/' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = PhpState::LineComment;
                    continue;
                }
                if (ch == '/' && cur.peek(1) == '*')
                {
                    cur.blank(2);
                    state = PhpState::BlockComment;
                    continue;
                }
                if (ch == '#' && cur.peek(1) != '[')
                {
                    cur.blank();
                    state = PhpState::LineComment;
                    continue;
                }
                if (cur.lookingAt("<<<"))
                {
                    std::size_t j = 3;
                    while (isHorizontalWhitespace(cur.peek(j)))
                        ++j;
                    char quote = '\0';
                    if (cur.peek(j) == '\'' || cur.peek(j) == '"')
                        quote = cur.peek(j++);
                    const std::size_t idStart = j;
                    while (isIdentifierContinue(cur.peek(j)))
                        ++j;
                    if (j > idStart)
                    {
                        heredocId = std::string(cur.source().substr(cur.position() + idStart, j - idStart));
                        if (quote != '\0' && cur.peek(j) == quote)
                            ++j;
                        while (cur.has(j + 1) && cur.peek(j) != '\n')
                            ++j;
                        cur.keep(j);
                        state = PhpState::Heredoc;
                        continue;
                    }
                }
                if (ch == '\'')
                    state = PhpState::SingleString;
                else if (ch == '"')
                    state = PhpState::DoubleString;
                cur.keep();
                break;
            }

            case PhpState::LineComment:
                if (ch == '\n')
                {
                    state = PhpState::Code;
                    cur.keep();
                }
                else
                {
                    cur.blank();
                }
                break;

            case PhpState::BlockComment:
                if (ch == '*' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = PhpState::Code;
                    continue;
                }
                cur.blank();
                break;

            case PhpState::SingleString:
                if (ch == '\\' && (cur.peek(1) == '\\' || cur.peek(1) == '\''))
                {
                    cur.keep(2);
                    continue;
                }
                if (ch == '\'')
                    state = PhpState::Code;
                cur.keep();
                break;

            case PhpState::DoubleString:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if (ch == '"')
                    state = PhpState::Code;
                cur.keep();
                break;

            case PhpState::Heredoc:
                if (ch == '\n')
                {
                    std::size_t j = 1;
                    while (isHorizontalWhitespace(cur.peek(j)))
                        ++j;
                    if (cur.lookingAt(heredocId, j))
                    {
                        const std::size_t after = j + heredocId.size();
                        if (!cur.has(after + 1) || cur.peek(after) == '\n' || cur.peek(after) == ';')
                        {
                            cur.keep(after);
                            state = PhpState::Code;
                            continue;
                        }
                    }
                }
                cur.keep();
                break;
        }
    }
    return cur.take();
}

ImportVector extractPhpImports(std::string_view source)
{
    static const std::regex kUse(R"(use\s+(?:function\s+|const\s+)?([\w\\]+)\s*(?:as\s+\w+\s*)?;)");
    static const std::regex kGroupedUse(R"(use\s+(?:function\s+|const\s+)?([\w\\]+)\\\{([^}]+)\})");
    static const std::regex kInclude(R"((?:require_once|require|include_once|include)\s+['"](.+?)['"])");

    const std::string cleaned = stripPhpComments(source);
    ImportList imports;
    detail::SvMatch m;

    for (const std::string &statement : detail::joinStatements(cleaned, "use", ';'))
    {
        const std::string_view stripped = statement;
        if (stripped.empty())
            continue;

        if (detail::matchAtStart(stripped, kUse, m))
        {
            imports.add(m[1].str());
            continue;
        }

        if (detail::matchAtStart(stripped, kGroupedUse, m))
        {
            const std::string prefix = m[1].str();
            for (const auto &item : detail::splitGroupMembers(m[2].str()))
                imports.add(prefix + "\\" + item);
            continue;
        }

        if (detail::matchAtStart(stripped, kInclude, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

} // namespace thymus::extract
