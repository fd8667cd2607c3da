//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/RustExtractor.cpp
// Purpose: Rust `use` / `extern crate` extraction.
//
// Key invariants:
//   - Block comments nest.
//   - Raw strings close only on a quote followed by the same number of '#'
//     characters that opened them (`r#"..."#`, `br##"..."##`).
//   - A quote is a char literal only when followed by an escape or by one
//     character and a closing quote; otherwise it is a lifetime.
//   - `use a::{b, c as d};` yields `a::b` and `a::c`, also when the group
//     is spread over several lines.
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
enum class RustState
{
    Code,
    LineComment,
    BlockComment,
    String,
    RawString,
    CharLiteral
};

/// @brief Length of a raw string opener (`r#"`, `br"`, ...) at the cursor, or 0.
std::size_t rawStringOpener(const StripCursor &cur, std::size_t &hashes)
{
    std::size_t j = 0;
    if (cur.peek() == 'b' && cur.peek(1) == 'r')
        j = 2;
    else if (cur.peek() == 'r')
        j = 1;
    else
        return 0;

    hashes = 0;
    while (cur.peek(j) == '#')
    {
        ++hashes;
        ++j;
    }
    return cur.peek(j) == '"' ? j + 1 : 0;
}
} // namespace

std::string stripRustComments(std::string_view source)
{
    StripCursor cur(source);
    RustState state = RustState::Code;
    int depth = 0;
    std::size_t rawHashes = 0;

    while (!cur.eof())
    {
        const char ch = cur.peek();
        switch (state)
        {
            case RustState::Code:
            {
                if (ch == '/' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = RustState::LineComment;
                    continue;
                }
                if (ch == '/' && cur.peek(1) == '*')
                {
                    cur.blank(2);
                    state = RustState::BlockComment;
                    depth = 1;
                    continue;
                }
                std::size_t hashes = 0;
                if (const std::size_t len = rawStringOpener(cur, hashes))
                {
                    rawHashes = hashes;
                    state = RustState::RawString;
                    cur.keep(len);
                    continue;
                }
                if (ch == 'b' && cur.peek(1) == '"')
                {
                    state = RustState::String;
                    cur.keep(2);
                    continue;
                }
                if (ch == '"')
                {
                    state = RustState::String;
                    cur.keep();
                    continue;
                }
                if (ch == '\'' && cur.has(3) && (cur.peek(1) == '\\' || cur.peek(2) == '\''))
                {
                    state = RustState::CharLiteral;
                    cur.keep();
                    continue;
                }
                cur.keep();
                break;
            }

            case RustState::LineComment:
                if (ch == '\n')
                {
                    state = RustState::Code;
                    cur.keep();
                }
                else
                {
                    cur.blank();
                }
                break;

            case RustState::BlockComment:
                if (ch == '/' && cur.peek(1) == '*')
                {
                    cur.blank(2);
                    ++depth;
                    continue;
                }
                if (ch == '*' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    if (--depth == 0)
                        state = RustState::Code;
                    continue;
                }
                cur.blank();
                break;

            case RustState::String:
            case RustState::CharLiteral:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if ((state == RustState::String && ch == '"') ||
                    (state == RustState::CharLiteral && ch == '\''))
                    state = RustState::Code;
                cur.keep();
                break;

            case RustState::RawString:
                if (ch == '"')
                {
                    std::size_t hashes = 0;
                    while (hashes < rawHashes && cur.peek(1 + hashes) == '#')
                        ++hashes;
                    if (hashes == rawHashes)
                    {
                        state = RustState::Code;
                        cur.keep(1 + hashes);
                        continue;
                    }
                }
                cur.keep();
                break;
        }
    }
    return cur.take();
}

ImportVector extractRustImports(std::string_view source)
{
    static const std::regex kExternCrate(R"(extern\s+crate\s+(\w+))");
    static const std::regex kGroupedUse(R"(use\s+([\w:]+)::\{([^}]+)\})");
    static const std::regex kSimpleUse(R"(use\s+([\w:]+(?:::\*)?)\s*(?:as\s+\w+\s*)?;)");

    const std::string cleaned = stripRustComments(source);
    ImportList imports;
    detail::SvMatch m;

    // A `use` declaration may span lines up to its semicolon.
    for (const std::string &statement : detail::joinStatements(cleaned, "use", ';'))
    {
        const std::string_view stripped = statement;
        if (stripped.substr(0, 4) != "use " && stripped.substr(0, 7) != "extern ")
            continue;

        if (detail::matchAtStart(stripped, kExternCrate, m))
        {
            imports.add(m[1].str());
            continue;
        }

        if (detail::matchAtStart(stripped, kGroupedUse, m))
        {
            const std::string prefix = m[1].str();
            const std::string body = m[2].str();
            for (const auto &item : detail::splitGroupMembers(body))
                imports.add(prefix + "::" + item);
            continue;
        }

        if (detail::matchAtStart(stripped, kSimpleUse, m))
            imports.add(m[1].str());
    }
    return imports.release();
}

} // namespace thymus::extract
