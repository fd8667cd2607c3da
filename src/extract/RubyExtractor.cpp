//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/RubyExtractor.cpp
// Purpose: Ruby require/load/autoload extraction.
//
// Key invariants:
//   - `=begin` ... `=end` block comments are recognized only at line start.
//   - A heredoc opener (`<<~ID`, `<<-ID`, `<<ID`, optionally quoted) counts
//     only when followed by end of line, `,`, `.` or `)`; the body runs until
//     a line whose indented content starts with ID.
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
enum class RubyState
{
    Code,
    LineComment,
    BlockComment,
    SingleString,
    DoubleString,
    Heredoc
};

/// @brief True when @p word sits at the cursor and is followed by blank or EOF.
bool atDirective(const StripCursor &cur, std::string_view word)
{
    if (!cur.lookingAt(word))
        return false;
    const char after = cur.peek(word.size());
    return !cur.has(word.size() + 1) || after == ' ' || after == '\t' || after == '\n';
}

/// @brief Blank the remainder of the current line, stopping before the newline.
void blankRestOfLine(StripCursor &cur)
{
    while (!cur.eof() && cur.peek() != '\n')
        cur.blank();
}

/// @brief Identifier of a heredoc opened at the cursor, or empty when none.
std::string heredocOpener(const StripCursor &cur)
{
    if (!cur.lookingAt("<<"))
        return {};
    std::size_t j = 2;
    if (cur.peek(j) == '~' || cur.peek(j) == '-')
        ++j;
    char quote = '\0';
    if (cur.peek(j) == '\'' || cur.peek(j) == '"')
        quote = cur.peek(j++);
    const std::size_t idStart = j;
    while (isIdentifierContinue(cur.peek(j)))
        ++j;
    if (j == idStart)
        return {};
    std::string id(cur.source().substr(cur.position() + idStart, j - idStart));
    if (quote != '\0' && cur.peek(j) == quote)
        ++j;
    while (isHorizontalWhitespace(cur.peek(j)))
        ++j;
    const char next = cur.peek(j);
    if (next == '\n' || next == ',' || next == '.' || next == ')')
        return id;
    return {};
}
} // namespace

std::string stripRubyComments(std::string_view source)
{
    StripCursor cur(source);
    RubyState state = RubyState::Code;
    std::string heredocId;
    bool atLineStart = true;

    while (!cur.eof())
    {
        const char ch = cur.peek();
        switch (state)
        {
            case RubyState::Code:
            {
                if (atLineStart && atDirective(cur, "=begin"))
                {
                    blankRestOfLine(cur);
                    state = RubyState::BlockComment;
                    atLineStart = true;
                    continue;
                }
                if (ch == '#')
                {
                    cur.blank();
                    state = RubyState::LineComment;
                    continue;
                }
                std::string id = heredocOpener(cur);
                if (!id.empty())
                {
                    heredocId = std::move(id);
                    skipToEndOfLine(cur);
                    state = RubyState::Heredoc;
                    atLineStart = true;
                    continue;
                }
                if (ch == '\'')
                    state = RubyState::SingleString;
                else if (ch == '"')
                    state = RubyState::DoubleString;
                atLineStart = ch == '\n';
                cur.keep();
                break;
            }

            case RubyState::LineComment:
                if (ch == '\n')
                {
                    state = RubyState::Code;
                    atLineStart = true;
                    cur.keep();
                }
                else
                {
                    cur.blank();
                }
                break;

            case RubyState::BlockComment:
                if (atLineStart && atDirective(cur, "=end"))
                {
                    blankRestOfLine(cur);
                    state = RubyState::Code;
                    atLineStart = true;
                    continue;
                }
                atLineStart = ch == '\n';
                cur.blank();
                break;

            case RubyState::SingleString:
                if (ch == '\\' && (cur.peek(1) == '\\' || cur.peek(1) == '\''))
                {
                    cur.keep(2);
                    continue;
                }
                if (ch == '\'')
                    state = RubyState::Code;
                atLineStart = ch == '\n';
                cur.keep();
                break;

            case RubyState::DoubleString:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if (ch == '"')
                    state = RubyState::Code;
                atLineStart = ch == '\n';
                cur.keep();
                break;

            case RubyState::Heredoc:
                if (ch == '\n')
                {
                    std::size_t j = 1;
                    while (isHorizontalWhitespace(cur.peek(j)))
                        ++j;
                    if (cur.lookingAt(heredocId, j))
                    {
                        const std::size_t after = j + heredocId.size();
                        const char next = cur.peek(after);
                        if (!cur.has(after + 1) || next == '\n' || next == ' ' || next == '\t')
                        {
                            cur.keep(after);
                            state = RubyState::Code;
                            atLineStart = false;
                            continue;
                        }
                    }
                    atLineStart = true;
                }
                else
                {
                    atLineStart = false;
                }
                cur.keep();
                break;
        }
    }
    return cur.take();
}

ImportVector extractRubyImports(std::string_view source)
{
    static const std::regex kRequire(
        R"((?:require_relative|require_dependency|require|load)\s+['"](.+?)['"])");
    static const std::regex kAutoload(R"(autoload\s+:\w+,\s*['"](.+?)['"])");

    const std::string cleaned = stripRubyComments(source);
    ImportList imports;
    detail::SvMatch m;

    for (std::string_view line : splitLines(cleaned))
    {
        const std::string_view stripped = trim(line);
        if (stripped.empty())
            continue;
        if (detail::matchAtStart(stripped, kRequire, m) ||
            detail::matchAtStart(stripped, kAutoload, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

} // namespace thymus::extract
