//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/CStyleStripper.cpp
// Purpose: State machine behind stripCStyleComments().
//
//===----------------------------------------------------------------------===//

#include "extract/CStyleStripper.hpp"

#include "extract/CharUtils.hpp"
#include "extract/StripCursor.hpp"

namespace thymus::extract
{

namespace
{
enum class CState
{
    Code,
    LineComment,
    BlockComment,
    DoubleString,
    SingleLiteral,
    TripleDouble,
    TripleSingle,
    RawDouble,
    RawSingle,
    Backtick
};
} // namespace

std::string stripCStyleComments(std::string_view source, const CStyleSyntax &syntax)
{
    StripCursor cur(source);
    CState state = CState::Code;
    int depth = 0;

    while (!cur.eof())
    {
        const char ch = cur.peek();
        switch (state)
        {
            case CState::Code:
                if (syntax.rawStringPrefix && ch == 'r' && (cur.peek(1) == '"' || cur.peek(1) == '\'') &&
                    (cur.position() == 0 || !char_utils::isIdentifierContinue(cur.at(cur.position() - 1))))
                {
                    state = cur.peek(1) == '"' ? CState::RawDouble : CState::RawSingle;
                    cur.keep(2);
                    continue;
                }
                if (ch == '/' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = CState::LineComment;
                    continue;
                }
                if (ch == '/' && cur.peek(1) == '*')
                {
                    cur.blank(2);
                    state = CState::BlockComment;
                    depth = 1;
                    continue;
                }
                if (syntax.tripleDoubleQuotes && cur.lookingAt("\"\"\""))
                {
                    state = CState::TripleDouble;
                    cur.keep(3);
                    continue;
                }
                if (syntax.tripleSingleQuotes && cur.lookingAt("'''"))
                {
                    state = CState::TripleSingle;
                    cur.keep(3);
                    continue;
                }
                if (ch == '"')
                    state = CState::DoubleString;
                else if (ch == '\'' && syntax.singleQuoteLiterals)
                    state = CState::SingleLiteral;
                else if (ch == '`' && syntax.backtickRawStrings)
                    state = CState::Backtick;
                cur.keep();
                break;

            case CState::LineComment:
                if (ch == '\n')
                {
                    state = CState::Code;
                    cur.keep();
                }
                else
                {
                    cur.blank();
                }
                break;

            case CState::BlockComment:
                if (syntax.nestedBlockComments && ch == '/' && cur.peek(1) == '*')
                {
                    cur.blank(2);
                    ++depth;
                    continue;
                }
                if (ch == '*' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    if (!syntax.nestedBlockComments || --depth == 0)
                        state = CState::Code;
                    continue;
                }
                cur.blank();
                break;

            case CState::DoubleString:
            case CState::SingleLiteral:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if ((state == CState::DoubleString && ch == '"') ||
                    (state == CState::SingleLiteral && ch == '\''))
                    state = CState::Code;
                cur.keep();
                break;

            case CState::TripleDouble:
            case CState::TripleSingle:
                if (cur.lookingAt(state == CState::TripleDouble ? "\"\"\"" : "'''"))
                {
                    state = CState::Code;
                    cur.keep(3);
                    continue;
                }
                cur.keep();
                break;

            case CState::RawDouble:
            case CState::RawSingle:
            case CState::Backtick:
                if ((state == CState::RawDouble && ch == '"') ||
                    (state == CState::RawSingle && ch == '\'') ||
                    (state == CState::Backtick && ch == '`'))
                    state = CState::Code;
                cur.keep();
                break;
        }
    }
    return cur.take();
}

} // namespace thymus::extract
