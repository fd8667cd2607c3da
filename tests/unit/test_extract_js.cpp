// File: tests/unit/test_extract_js.cpp
// Purpose: Cover JavaScript/TypeScript comment stripping and import forms.
// Key invariants: Comments are blanked with line structure intact; template
//                 text is blanked but ${...} code survives; a '/' after a
//                 value token is division rather than a regex literal.
// Ownership/Lifetime: Operates on in-memory snippets only.

#include <gtest/gtest.h>

#include "extract/LanguageExtractors.hpp"

#include <string>
#include <vector>

using namespace thymus::extract;
using Imports = std::vector<std::string>;

TEST(JsExtractor, RecognizesEveryStatementForm)
{
    const char *src = "import { a } from './a';\n"
                      "import b from \"../b\";\n"
                      "const c = require('c');\n"
                      "export * from './d';\n"
                      "import './side';\n"
                      "const e = await import(\"./lazy\");\n"
                      "export { f } from './f';\n";
    EXPECT_EQ(extractJsImports(src), (Imports{"./a", "../b", "c", "./d", "./side", "./lazy", "./f"}));
}

TEST(JsExtractor, DuplicatesCollapseInFirstSeenOrder)
{
    const char *src = "import x from './x';\n"
                      "import y from './y';\n"
                      "const again = require('./x');\n";
    EXPECT_EQ(extractJsImports(src), (Imports{"./x", "./y"}));
}

TEST(JsExtractor, IgnoresImportsInCommentsAndStrings)
{
    const char *src = "// import hidden from './line';\n"
                      "/* import hidden from './block';\n"
                      "   require('./block2'); */\n"
                      "const s = \"import fake from './str'\";\n"
                      "const t = `import fake from './tmpl'`;\n"
                      "import real from './real';\n";
    EXPECT_EQ(extractJsImports(src), (Imports{"./real"}));
}

TEST(JsExtractor, StripPreservesLineStructure)
{
    const std::string out = stripJsComments("a /* b\nc */ d // e\nf");
    EXPECT_EQ(out, "a     \n     d     \nf");
}

TEST(JsExtractor, TemplateInterpolationIsCode)
{
    const char *src = "const u = `prefix ${require('./inner')} suffix`;\n"
                      "const v = `${ { nested: 1 }.nested }`; import w from './w';\n";
    EXPECT_EQ(extractJsImports(src), (Imports{"./inner", "./w"}));
}

TEST(JsExtractor, RegexLiteralIsNotAComment)
{
    const char *src = "const re = /\\/\\//; import x from './x';\n"
                      "const ratio = a / b; // import y from './y'\n";
    EXPECT_EQ(extractJsImports(src), (Imports{"./x"}));
}

TEST(JsExtractor, EscapedQuoteDoesNotCloseString)
{
    const char *src = "const s = 'it\\'s // not a comment'; import z from './z';\n";
    EXPECT_EQ(extractJsImports(src), (Imports{"./z"}));
}

TEST(JsExtractor, KeywordMustStandAlone)
{
    const char *src = "const reimport = load('./nope');\n"
                      "myrequire('./nope2');\n";
    EXPECT_TRUE(extractJsImports(src).empty());
}
