//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/JsExtractor.cpp
// Purpose: JavaScript/TypeScript import extraction.
//
// Key invariants:
//   - Comments and template-literal text are blanked; quoted strings and
//     regex literals are kept verbatim.
//   - `${...}` inside a template returns to code state until the matching
//     close brace.
//   - A '/' opens a regex literal unless the previous non-blank character on
//     the line could end an expression (alphanumeric or one of `)]}._$`).
//   - An import/export declaration or a require()/import() call whose
//     brackets or `from` clause are left open is folded with the following
//     lines into one statement before matching.
//   - A statement contributes imports only when import/require/export occurs
//     in it as a whole word outside string literals.
//
//===----------------------------------------------------------------------===//

#include "extract/CharUtils.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"
#include "extract/StripCursor.hpp"

#include <array>
#include <vector>

namespace thymus::extract
{

using namespace char_utils;

namespace
{
enum class JsState
{
    Code,
    LineComment,
    BlockComment,
    SingleString,
    DoubleString,
    TemplateString,
    RegexLiteral
};

/// @brief True when the character before @p pos (skipping spaces and tabs)
///        can terminate an expression, making '/' a division operator.
bool prevTokenIsValue(const StripCursor &cur, std::size_t pos)
{
    std::size_t i = pos;
    while (i > 0 && isHorizontalWhitespace(cur.at(i - 1)))
        --i;
    if (i == 0)
        return false;
    const char c = cur.at(i - 1);
    return isAlphanumeric(c) || c == ')' || c == ']' || c == '}' || c == '.' || c == '_' ||
           c == '$';
}

/// @brief Find @p keyword in @p line as a whole word outside quoted or
///        template literals.
/// @return Offset of the first such occurrence, or npos.
std::size_t findKeywordOutsideStrings(std::string_view line, std::string_view keyword)
{
    enum
    {
        kCode,
        kSingle,
        kDouble,
        kTemplate
    } state = kCode;

    const std::size_t n = line.size();
    std::size_t i = 0;
    while (i < n)
    {
        const char ch = line[i];
        if (state == kCode)
        {
            if (line.substr(i, keyword.size()) == keyword)
            {
                const bool beforeOk = i == 0 || !isIdentifierContinue(line[i - 1]);
                const std::size_t after = i + keyword.size();
                const bool afterOk = after >= n || !isIdentifierContinue(line[after]);
                if (beforeOk && afterOk)
                    return i;
            }
            if (ch == '\'')
                state = kSingle;
            else if (ch == '"')
                state = kDouble;
            else if (ch == '`')
                state = kTemplate;
            ++i;
            continue;
        }

        if (ch == '\\' && i + 1 < n)
        {
            i += 2;
            continue;
        }
        if ((state == kSingle && ch == '\'') || (state == kDouble && ch == '"') ||
            (state == kTemplate && ch == '`'))
            state = kCode;
        ++i;
    }
    return std::string_view::npos;
}

/// @brief Opening minus closing brackets in @p text, ignoring quoted text.
int bracketBalance(std::string_view text)
{
    int balance = 0;
    char quote = 0;
    for (std::size_t i = 0; i < text.size(); ++i)
    {
        const char ch = text[i];
        if (quote)
        {
            if (ch == '\\')
                ++i;
            else if (ch == quote)
                quote = 0;
            continue;
        }
        if (ch == '\'' || ch == '"')
            quote = ch;
        else if (ch == '(' || ch == '{' || ch == '[')
            ++balance;
        else if (ch == ')' || ch == '}' || ch == ']')
            --balance;
    }
    return balance;
}

bool endsWithWord(std::string_view text, std::string_view word)
{
    if (text.size() < word.size() || text.substr(text.size() - word.size()) != word)
        return false;
    return text.size() == word.size() || !isIdentifierContinue(text[text.size() - word.size() - 1]);
}

/// @brief Offset where a possibly multi-line import statement begins on
///        @p line, or npos.
/// @details Declarations (`import ...`, `export {`, `export *`,
///          `export type {`) must lead the line; `require(` and `import(`
///          calls may appear anywhere outside strings.
std::size_t statementHead(std::string_view line)
{
    const std::string_view lead = trim(line);
    const std::size_t indent = static_cast<std::size_t>(lead.data() - line.data());
    if (findKeywordOutsideStrings(lead, "import") == 0)
        return indent;
    if (findKeywordOutsideStrings(lead, "export") == 0)
    {
        std::string_view rest = trim(lead.substr(6));
        if (rest.substr(0, 4) == "type" && (rest.size() == 4 || !isIdentifierContinue(rest[4])))
            rest = trim(rest.substr(4));
        if (rest.empty() || rest.front() == '{' || rest.front() == '*')
            return indent;
    }
    for (std::string_view call : {std::string_view("require"), std::string_view("import")})
    {
        const std::size_t at = findKeywordOutsideStrings(line, call);
        if (at != std::string_view::npos && trim(line.substr(at + call.size())).substr(0, 1) == "(")
            return at;
    }
    return std::string_view::npos;
}

/// @brief True while the statement starting at @p head in @p text is still
///        open, given the trimmed line @p next that would follow it.
bool statementContinues(std::string_view text, std::size_t head, std::string_view next)
{
    const std::string_view body = trim(text.substr(head));
    if (bracketBalance(body) > 0)
        return true;
    if (endsWithWord(body, "from") || body == "import" || body == "export")
        return true;
    return findKeywordOutsideStrings(next, "from") == 0 && body.back() != ';';
}

const std::array<std::string_view, 3> kKeywords = {"import", "require", "export"};

const std::vector<std::regex> &importPatterns()
{
    static const std::vector<std::regex> patterns = {
        std::regex(R"((?:import|export)\s+.*?\s+from\s+['"]([^'"]+)['"])"),
        std::regex(R"(import\s+['"]([^'"]+)['"])"),
        std::regex(R"(export\s+\*\s+from\s+['"]([^'"]+)['"])"),
        std::regex(R"(require\s*\(\s*['"]([^'"]+)['"]\s*\))"),
        std::regex(R"(import\s*\(\s*['"]([^'"]+)['"]\s*\))"),
    };
    return patterns;
}
} // namespace

std::string stripJsComments(std::string_view source)
{
    StripCursor cur(source);
    JsState state = JsState::Code;
    std::vector<JsState> stack; // states to resume after templates and ${...}
    int braceDepth = 0;

    while (!cur.eof())
    {
        const char ch = cur.peek();
        switch (state)
        {
            case JsState::Code:
                if (ch == '/' && cur.has(2))
                {
                    const char next = cur.peek(1);
                    if (next == '/')
                    {
                        cur.blank(2);
                        state = JsState::LineComment;
                        continue;
                    }
                    if (next == '*')
                    {
                        cur.blank(2);
                        state = JsState::BlockComment;
                        continue;
                    }
                    if (!prevTokenIsValue(cur, cur.position()))
                    {
                        cur.keep();
                        state = JsState::RegexLiteral;
                        continue;
                    }
                }
                if (ch == '\'')
                {
                    state = JsState::SingleString;
                }
                else if (ch == '"')
                {
                    state = JsState::DoubleString;
                }
                else if (ch == '`')
                {
                    cur.blank();
                    stack.push_back(JsState::Code);
                    state = JsState::TemplateString;
                    continue;
                }
                else if (ch == '}' && !stack.empty())
                {
                    if (--braceDepth <= 0)
                    {
                        braceDepth = 0;
                        state = stack.back();
                        stack.pop_back();
                    }
                }
                else if (ch == '{' && !stack.empty())
                {
                    ++braceDepth;
                }
                cur.keep();
                break;

            case JsState::LineComment:
                if (ch == '\n')
                {
                    state = JsState::Code;
                    cur.keep();
                }
                else
                {
                    cur.blank();
                }
                break;

            case JsState::BlockComment:
                if (ch == '*' && cur.peek(1) == '/')
                {
                    cur.blank(2);
                    state = JsState::Code;
                    continue;
                }
                cur.blank();
                break;

            case JsState::SingleString:
            case JsState::DoubleString:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if (ch == '\n' || (state == JsState::SingleString && ch == '\'') ||
                    (state == JsState::DoubleString && ch == '"'))
                    state = JsState::Code;
                cur.keep();
                break;

            case JsState::TemplateString:
                if (ch == '\\' && cur.has(2))
                {
                    cur.blank(2);
                    continue;
                }
                if (ch == '`')
                {
                    cur.blank();
                    if (stack.empty())
                    {
                        state = JsState::Code;
                    }
                    else
                    {
                        state = stack.back();
                        stack.pop_back();
                    }
                    continue;
                }
                if (ch == '$' && cur.peek(1) == '{')
                {
                    cur.blank(2);
                    stack.push_back(JsState::TemplateString);
                    state = JsState::Code;
                    braceDepth = 1;
                    continue;
                }
                cur.blank();
                break;

            case JsState::RegexLiteral:
                if (ch == '\\' && cur.has(2))
                {
                    cur.keep(2);
                    continue;
                }
                if (ch == '/')
                {
                    state = JsState::Code;
                    cur.keep();
                    while (!cur.eof() && isLetter(cur.peek()))
                        cur.keep();
                    continue;
                }
                if (ch == '\n')
                    state = JsState::Code;
                cur.keep();
                break;
        }
    }
    return cur.take();
}

ImportVector extractJsImports(std::string_view source)
{
    const std::string cleaned = stripJsComments(source);
    const std::vector<std::string_view> lines = splitLines(cleaned);
    ImportList imports;

    for (std::size_t i = 0; i < lines.size(); ++i)
    {
        std::string statement(lines[i]);

        // Fold a statement whose braces, parens or `from` clause continue on
        // the following lines into a single line.
        const std::size_t head = statementHead(statement);
        if (head != std::string_view::npos)
        {
            std::size_t joined = 1;
            while (i + 1 < lines.size() && joined < detail::kMaxStatementLines &&
                   statementContinues(statement, head, trim(lines[i + 1])))
            {
                statement += ' ';
                statement += trim(lines[++i]);
                ++joined;
            }
        }

        bool hasKeyword = false;
        for (std::string_view kw : kKeywords)
        {
            if (statement.find(kw) != std::string::npos &&
                findKeywordOutsideStrings(statement, kw) != std::string_view::npos)
            {
                hasKeyword = true;
                break;
            }
        }
        if (!hasKeyword)
            continue;

        for (const auto &pattern : importPatterns())
        {
            for (std::sregex_iterator it(statement.begin(), statement.end(), pattern), end; it != end; ++it)
                imports.add((*it)[1].str());
        }
    }
    return imports.release();
}

} // namespace thymus::extract
