//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: extract/PythonExtractor.cpp
// Purpose: Python import extraction through a tokenizer and statement parser.
//
// Key invariants:
//   - Tokens are grouped into logical lines: newlines inside brackets and
//     after a backslash continuation do not end a line.
//   - `import` and `from` only start a statement at the beginning of a logical
//     line, after `;`, or after a block colon at bracket depth zero.
//   - Results are ordered by block nesting level, then by source position,
//     so module-level imports come before imports inside functions.
//   - Unterminated strings, unbalanced brackets, a stray backslash, an
//     indentation error (indent without a block colon, a missing block, or a
//     dedent to no enclosing level), `= =`, or a malformed import statement
//     make the whole file yield no imports.
//
//===----------------------------------------------------------------------===//

#include "extract/CharUtils.hpp"
#include "extract/ImportList.hpp"
#include "extract/LanguageExtractors.hpp"
#include "extract/ScanCursor.hpp"

#include <algorithm>
#include <optional>
#include <vector>

namespace thymus::extract
{

using namespace char_utils;

namespace
{
enum class PyTok
{
    Name,
    Op,
    String,
    Number
};

struct Token
{
    PyTok kind;
    std::string text;
    int depth = 0; ///< Bracket depth before the token.
};

struct LogicalLine
{
    int indent = 0;
    std::vector<Token> tokens;
};

/// @brief Raised internally when the source is not valid Python.
struct PySyntaxError
{
};

bool isNameChar(char c)
{
    return isIdentifierContinue(c) || static_cast<unsigned char>(c) >= 0x80;
}

bool isNameStart(char c)
{
    return isIdentifierStart(c) || static_cast<unsigned char>(c) >= 0x80;
}

bool isStringPrefix(std::string_view text)
{
    static const char *const kPrefixes[] = {"r", "u", "b", "f", "t", "br", "rb", "fr", "rf", "tr", "rt"};
    const std::string lower = toLowercase(text);
    return std::any_of(std::begin(kPrefixes), std::end(kPrefixes),
                       [&](const char *p) { return lower == p; });
}

class PyTokenizer : public ScanCursor<PyTokenizer>
{
  public:
    explicit PyTokenizer(std::string_view src) : src_(src) {}

    [[nodiscard]] std::string_view source() const noexcept
    {
        return src_;
    }

    /// @brief Tokenize the whole source into logical lines.
    /// @throws PySyntaxError on lexical errors.
    std::vector<LogicalLine> run()
    {
        while (!eof())
        {
            const char c = peek();
            if (c == '#')
            {
                skipToEndOfLine(*this);
                continue;
            }
            if (c == '\\')
            {
                if (peek(1) == '\n')
                {
                    get();
                    get();
                    continue;
                }
                if (peek(1) == '\r' && peek(2) == '\n')
                {
                    get();
                    get();
                    get();
                    continue;
                }
                throw PySyntaxError{};
            }
            if (c == '\n')
            {
                get();
                lineStart_ = position();
                if (brackets_.empty())
                    endLine();
                continue;
            }
            if (c == ' ' || c == '\t' || c == '\r' || c == '\f')
            {
                get();
                continue;
            }
            if (isNameStart(c))
            {
                const std::size_t start = position();
                std::string name;
                while (!eof() && isNameChar(peek()))
                    name.push_back(get());
                if ((peek() == '\'' || peek() == '"') && isStringPrefix(name))
                {
                    readString(start, name);
                    continue;
                }
                emit(start, PyTok::Name, std::move(name));
                continue;
            }
            if (c == '\'' || c == '"')
            {
                readString(position(), {});
                continue;
            }
            if (isDigit(c) || (c == '.' && isDigit(peek(1))))
            {
                readNumber();
                continue;
            }
            readOperator();
        }

        if (!brackets_.empty())
            throw PySyntaxError{};
        endLine();
        return std::move(lines_);
    }

  private:
    void emit(std::size_t start, PyTok kind, std::string text)
    {
        if (current_.tokens.empty())
            current_.indent = indentWidth(start);
        current_.tokens.push_back(Token{kind, std::move(text), static_cast<int>(brackets_.size())});
    }

    void endLine()
    {
        if (!current_.tokens.empty())
            lines_.push_back(std::move(current_));
        current_ = LogicalLine{};
    }

    /// @brief Column of @p pos on its physical line, tabs expanding to 8.
    int indentWidth(std::size_t pos) const
    {
        int col = 0;
        for (std::size_t i = lineStart_; i < pos && i < src_.size(); ++i)
            col = src_[i] == '\t' ? (col / 8 + 1) * 8 : col + 1;
        return col;
    }

    void readString(std::size_t start, const std::string &prefix)
    {
        const bool formatted = toLowercase(prefix).find_first_of("ft") != std::string::npos;
        scanStringBody(formatted);
        emit(start, PyTok::String, {});
    }

    /// @brief Consume a string literal starting at its opening quote.
    void scanStringBody(bool formatted)
    {
        const char quote = peek();
        const std::string triple(3, quote);
        const bool isTriple = lookingAt(triple);
        for (std::size_t i = 0; i < (isTriple ? 3u : 1u); ++i)
            get();

        for (;;)
        {
            if (eof())
                throw PySyntaxError{};
            const char c = peek();
            if (c == '\\')
            {
                get();
                if (eof())
                    throw PySyntaxError{};
                get();
                continue;
            }
            if (isTriple && lookingAt(triple))
            {
                get();
                get();
                get();
                return;
            }
            if (!isTriple && c == quote)
            {
                get();
                return;
            }
            if (!isTriple && c == '\n')
                throw PySyntaxError{};
            if (formatted && c == '{')
            {
                if (peek(1) == '{')
                {
                    get();
                    get();
                    continue;
                }
                get();
                scanReplacementField();
                continue;
            }
            get();
        }
    }

    /// @brief Skip an f-string `{...}` expression, including nested strings.
    void scanReplacementField()
    {
        int depth = 1;
        while (depth > 0)
        {
            if (eof())
                throw PySyntaxError{};
            const char c = peek();
            if (c == '\'' || c == '"')
            {
                scanStringBody(false);
                continue;
            }
            if (c == '{' || c == '(' || c == '[')
                ++depth;
            else if (c == '}' || c == ')' || c == ']')
                --depth;
            get();
        }
    }

    void readNumber()
    {
        const std::size_t start = position();
        std::string text;
        while (!eof())
        {
            const char c = peek();
            if (isAlphanumeric(c) || c == '_' || c == '.')
            {
                text.push_back(get());
                continue;
            }
            if ((c == '+' || c == '-') && !text.empty() &&
                (text.back() == 'e' || text.back() == 'E') && text.find_first_of("xXoObB") == std::string::npos)
            {
                text.push_back(get());
                continue;
            }
            break;
        }
        emit(start, PyTok::Number, std::move(text));
    }

    void readOperator()
    {
        static const char *const kCompound[] = {"**=", "//=", ">>=", "<<=", "==", "!=", "<=", ">=",
                                                "->",  ":=",  "**",  "//",  "<<", ">>", "+=", "-=",
                                                "*=",  "/=",  "%=",  "&=",  "|=", "^=", "@="};
        const std::size_t start = position();
        for (const char *op : kCompound)
        {
            if (lookingAt(op))
            {
                const std::string text(op);
                for (std::size_t i = 0; i < text.size(); ++i)
                    get();
                emit(start, PyTok::Op, text);
                return;
            }
        }

        const char c = get();
        if (c == '(' || c == '[' || c == '{')
        {
            emit(start, PyTok::Op, std::string(1, c));
            brackets_.push_back(c);
            return;
        }
        if (c == ')' || c == ']' || c == '}')
        {
            const char open = c == ')' ? '(' : c == ']' ? '[' : '{';
            if (brackets_.empty() || brackets_.back() != open)
                throw PySyntaxError{};
            brackets_.pop_back();
        }
        emit(start, PyTok::Op, std::string(1, c));
    }

    std::string_view src_;
    std::size_t lineStart_ = 0;
    std::vector<char> brackets_;
    LogicalLine current_;
    std::vector<LogicalLine> lines_;
};

struct FoundImport
{
    int level;
    std::size_t order;
    std::string name;
};

class ImportStatementParser
{
  public:
    ImportStatementParser(const std::vector<Token> &tokens, int level, std::vector<FoundImport> &out)
        : tokens_(tokens), level_(level), out_(out)
    {
    }

    void run()
    {
        bool atStatementStart = true;
        int bonus = 0;
        while (i_ < tokens_.size())
        {
            const Token &tok = tokens_[i_];
            if (atStatementStart && isName(tok, "import"))
            {
                ++i_;
                parseImport(level_ + bonus);
                continue;
            }
            if (atStatementStart && isName(tok, "from"))
            {
                ++i_;
                parseFrom(level_ + bonus);
                continue;
            }
            atStatementStart = false;
            // `x = = 1`: an assignment with no value between the operators.
            if (isOp(tok, "=") && i_ + 1 < tokens_.size() && isOp(tokens_[i_ + 1], "="))
                throw PySyntaxError{};
            if (tok.kind == PyTok::Op && tok.depth == 0)
            {
                if (tok.text == ";")
                {
                    atStatementStart = true;
                }
                else if (tok.text == ":")
                {
                    atStatementStart = true;
                    bonus = 1;
                }
            }
            ++i_;
        }
    }

  private:
    static bool isName(const Token &tok, std::string_view text)
    {
        return tok.kind == PyTok::Name && tok.text == text;
    }

    static bool isOp(const Token &tok, std::string_view text)
    {
        return tok.kind == PyTok::Op && tok.text == text;
    }

    [[nodiscard]] bool atEnd() const
    {
        return i_ >= tokens_.size() || (isOp(tokens_[i_], ";") && tokens_[i_].depth == 0);
    }

    /// @brief Parse `NAME ('.' NAME)*`; empty when no name is present.
    std::string parseDottedName()
    {
        std::string name;
        if (i_ >= tokens_.size() || tokens_[i_].kind != PyTok::Name)
            return name;
        name = tokens_[i_++].text;
        while (i_ + 1 < tokens_.size() && isOp(tokens_[i_], ".") && tokens_[i_ + 1].kind == PyTok::Name)
        {
            name += "." + tokens_[i_ + 1].text;
            i_ += 2;
        }
        if (i_ < tokens_.size() && isOp(tokens_[i_], "."))
            throw PySyntaxError{};
        return name;
    }

    void record(int level, std::string name)
    {
        out_.push_back(FoundImport{level, out_.size(), std::move(name)});
    }

    void parseImport(int level)
    {
        for (;;)
        {
            std::string name = parseDottedName();
            if (name.empty())
                throw PySyntaxError{};
            record(level, std::move(name));
            if (i_ < tokens_.size() && isName(tokens_[i_], "as"))
            {
                ++i_;
                if (i_ >= tokens_.size() || tokens_[i_].kind != PyTok::Name)
                    throw PySyntaxError{};
                ++i_;
            }
            if (atEnd())
                return;
            if (!isOp(tokens_[i_], ","))
                throw PySyntaxError{};
            ++i_;
        }
    }

    void parseFrom(int level)
    {
        int dots = 0;
        while (i_ < tokens_.size() && isOp(tokens_[i_], "."))
        {
            ++dots;
            ++i_;
        }
        std::string module;
        if (i_ < tokens_.size() && !isName(tokens_[i_], "import"))
            module = parseDottedName();
        if (dots == 0 && module.empty())
            throw PySyntaxError{};
        if (i_ >= tokens_.size() || !isName(tokens_[i_], "import"))
            throw PySyntaxError{};
        ++i_;
        if (i_ >= tokens_.size())
            throw PySyntaxError{};
        const Token &first = tokens_[i_];
        if (!(isOp(first, "*") || isOp(first, "(") || first.kind == PyTok::Name))
            throw PySyntaxError{};
        while (!atEnd())
            ++i_;
        if (!module.empty())
            record(level, std::move(module));
    }

    const std::vector<Token> &tokens_;
    int level_;
    std::vector<FoundImport> &out_;
    std::size_t i_ = 0;
};

/// @brief True when @p line ends in a block colon (`if x:`, `def f():`).
bool opensBlock(const LogicalLine &line)
{
    const Token &last = line.tokens.back();
    return last.kind == PyTok::Op && last.text == ":" && last.depth == 0;
}
} // namespace

ImportVector extractPythonImports(std::string_view source)
{
    std::vector<FoundImport> found;
    try
    {
        PyTokenizer tokenizer(source);
        const std::vector<LogicalLine> lines = tokenizer.run();

        std::vector<int> indents{0};
        bool expectBlock = false;
        for (const auto &line : lines)
        {
            if (line.indent > indents.back())
            {
                if (!expectBlock)
                    throw PySyntaxError{}; // unexpected indent
                indents.push_back(line.indent);
            }
            else
            {
                if (expectBlock)
                    throw PySyntaxError{}; // expected an indented block
                while (line.indent < indents.back())
                    indents.pop_back();
                if (line.indent != indents.back())
                    throw PySyntaxError{}; // dedent matches no outer level
            }
            expectBlock = opensBlock(line);
            const int level = static_cast<int>(indents.size()) - 1;
            ImportStatementParser(line.tokens, level, found).run();
        }
        if (expectBlock)
            throw PySyntaxError{};
    }
    catch (const PySyntaxError &)
    {
        return {};
    }

    std::stable_sort(found.begin(), found.end(),
                     [](const FoundImport &a, const FoundImport &b) { return a.level < b.level; });

    ImportList imports;
    for (auto &f : found)
        imports.add(std::move(f.name));
    return imports.release();
}

} // namespace thymus::extract
