// File: tests/unit/test_extract_python.cpp
// Purpose: Exercise the Python tokenizer and import statement parser.
// Key invariants: Module-level imports precede nested ones; relative
//                 `from . import x` contributes no module name; any syntax
//                 error empties the result.
// Ownership/Lifetime: Operates on in-memory snippets only.

#include <gtest/gtest.h>

#include "extract/LanguageExtractors.hpp"

#include <string>
#include <vector>

using namespace thymus::extract;
using Imports = std::vector<std::string>;

TEST(PythonExtractor, ModuleLevelThenNested)
{
    const char *src = "import os\n"
                      "import a.b as c, d\n"
                      "from . import sibling\n"
                      "from ..pkg.mod import (x,\n"
                      "    y)\n"
                      "\n"
                      "def f():\n"
                      "    import json\n"
                      "import os\n";
    EXPECT_EQ(extractPythonImports(src), (Imports{"os", "a.b", "d", "pkg.mod", "json"}));
}

TEST(PythonExtractor, StatementsAfterSemicolonAndColon)
{
    const char *src = "print('a'); import sys\n"
                      "if True: import cond\n"
                      "x = 1\n";
    EXPECT_EQ(extractPythonImports(src), (Imports{"sys", "cond"}));
}

TEST(PythonExtractor, LineContinuationJoinsStatement)
{
    const char *src = "from collections \\\n"
                      "    import OrderedDict\n";
    EXPECT_EQ(extractPythonImports(src), (Imports{"collections"}));
}

TEST(PythonExtractor, CommentsAndStringsAreNotImports)
{
    const char *src = "# import hidden\n"
                      "doc = \"\"\"\n"
                      "import fake\n"
                      "\"\"\"\n"
                      "s = 'from fake import x'\n"
                      "name = f\"{'import'}\"\n"
                      "import real\n";
    EXPECT_EQ(extractPythonImports(src), (Imports{"real"}));
}

TEST(PythonExtractor, ImportAsAttributeIsIgnored)
{
    const char *src = "obj.import_thing = 1\n"
                      "value = module.from_\n"
                      "import ok\n";
    EXPECT_EQ(extractPythonImports(src), (Imports{"ok"}));
}

TEST(PythonExtractor, SyntaxErrorsYieldNothing)
{
    EXPECT_TRUE(extractPythonImports("import os\nx = (\n").empty());
    EXPECT_TRUE(extractPythonImports("import os\ns = 'unterminated\n").empty());
    EXPECT_TRUE(extractPythonImports("import\n").empty());
    EXPECT_TRUE(extractPythonImports("import os\nfrom x\n").empty());
    EXPECT_TRUE(extractPythonImports("import os\n)\n").empty());
    EXPECT_TRUE(extractPythonImports("import os\nx = = 1\n").empty());
}

TEST(PythonExtractor, IndentationErrorsYieldNothing)
{
    EXPECT_TRUE(extractPythonImports("import os\n    import sys\n").empty());
    EXPECT_TRUE(extractPythonImports("if x:\n        import a\n    import b\n").empty());
    EXPECT_TRUE(extractPythonImports("import os\ndef f():\nimport sys\n").empty());
    EXPECT_TRUE(extractPythonImports("import os\nclass A:\n").empty());
}

TEST(PythonExtractor, OperatorsAndBlocksThatAreValid)
{
    const char *src = "import os\n"
                      "if x == 1 and (y := 2) >= 0:\n"
                      "    total //= 2\n"
                      "    def f(a=1) -> int:\n"
                      "        import json\n"
                      "    items = {k: v for k, v in pairs}\n"
                      "import sys\n";
    EXPECT_EQ(extractPythonImports(src), (Imports{"os", "sys", "json"}));
}
