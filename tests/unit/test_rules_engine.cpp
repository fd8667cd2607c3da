// File: tests/unit/test_rules_engine.cpp
// Purpose: Evaluate each rule kind against files in a temporary project.
// Key invariants: Out-of-scope and missing files yield nothing; pattern and
//                 dependency rules report at most one violation per file.
// Ownership/Lifetime: Each test owns a ProjectFixture directory.

#include <gtest/gtest.h>

#include "rules/CompiledInvariant.hpp"
#include "rules/RuleEngine.hpp"
#include "tests/common/ProjectFixture.hpp"

#include <regex>

using namespace thymus::rules;
using thymus::tests::ProjectFixture;

namespace
{
CompiledInvariant compile(const Invariant &inv)
{
    auto compiled = compileInvariant(inv);
    EXPECT_TRUE(compiled.hasValue());
    return compiled.value();
}

std::vector<Violation> run(const ProjectFixture &project, const std::string &rel, const Invariant &inv)
{
    FileSubject file(project.path(rel), rel);
    return evaluate(file, compile(inv), project.root());
}

Invariant routesMayNotTouchDb()
{
    Invariant inv;
    inv.id = "routes-no-db";
    inv.kind = RuleKind::Boundary;
    inv.severity = Severity::Error;
    inv.description = "Routes must not import the database layer";
    inv.sourceGlob = "src/routes/**";
    inv.forbiddenImports = {"src/db/**"};
    return inv;
}
} // namespace

TEST(RuleEngine, BoundaryReportsEachForbiddenImport)
{
    ProjectFixture project;
    project.write("src/routes/users.ts",
                  "import { db } from '../db/client';\n"
                  "import { pool } from '../db/pool';\n"
                  "import { log } from '../util/log';\n");

    const auto found = run(project, "src/routes/users.ts", routesMayNotTouchDb());
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].rule, "routes-no-db");
    EXPECT_EQ(found[0].severity, Severity::Error);
    EXPECT_EQ(found[0].file, "src/routes/users.ts");
    EXPECT_EQ(found[0].importSpec.value_or(""), "../db/client");
    EXPECT_EQ(found[0].message, "Routes must not import the database layer");
    EXPECT_EQ(found[1].importSpec.value_or(""), "../db/pool");
    EXPECT_FALSE(found[0].line.has_value());
}

TEST(RuleEngine, OutOfScopeAndMissingFilesAreSilent)
{
    ProjectFixture project;
    project.write("src/db/client.ts", "import { x } from '../db/other';\n");
    EXPECT_TRUE(run(project, "src/db/client.ts", routesMayNotTouchDb()).empty());
    EXPECT_TRUE(run(project, "src/routes/deleted.ts", routesMayNotTouchDb()).empty());
}

TEST(RuleEngine, PatternReportsFirstMatchingLineOnly)
{
    ProjectFixture project;
    project.write("src/app.ts", "const a = 1;\r\nconsole.log(a);\nconsole.log(a + 1);\n");

    Invariant inv;
    inv.id = "no-console";
    inv.kind = RuleKind::Pattern;
    inv.forbiddenPattern = "console[[:space:]]*\\.log";
    inv.description = "No console logging";

    const auto found = run(project, "src/app.ts", inv);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].line.value_or(0), 2u);
    EXPECT_EQ(found[0].severity, Severity::Warning);
    EXPECT_FALSE(found[0].importSpec.has_value());

    project.write("src/clean.ts", "const a = 1;\n");
    EXPECT_TRUE(run(project, "src/clean.ts", inv).empty());
}

TEST(RuleEngine, FirstMatchingLineIsOneBased)
{
    const std::regex re("TODO");
    EXPECT_EQ(firstMatchingLine("TODO first\nTODO second\n", re).value_or(0), 1u);
    EXPECT_EQ(firstMatchingLine("a\nb\nTODO\n", re).value_or(0), 3u);
    EXPECT_FALSE(firstMatchingLine("nothing here", re).has_value());
}

TEST(RuleEngine, DependencyIsSubstringAndFirstMatchOnly)
{
    ProjectFixture project;
    project.write("src/app.ts", "import a from 'axios';\nimport b from 'axios/retry';\n");
    project.write("src/infra/http.ts", "import a from 'axios';\n");
    project.write("src/other.ts", "import x from 'crypto/io';\n");

    Invariant inv;
    inv.id = "no-axios";
    inv.kind = RuleKind::Dependency;
    inv.package = "axios";
    inv.allowedIn = {"src/infra/**"};

    const auto found = run(project, "src/app.ts", inv);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].package.value_or(""), "axios");
    EXPECT_TRUE(run(project, "src/infra/http.ts", inv).empty());

    inv.package = "io";
    EXPECT_EQ(run(project, "src/other.ts", inv).size(), 1u);
}

TEST(RuleEngine, ConventionAppliesOnlyToTestingRules)
{
    ProjectFixture project;
    project.write("src/service.ts", "export const s = 1;\n");

    Invariant inv;
    inv.id = "tests-colocated";
    inv.kind = RuleKind::Convention;
    inv.rule = "Every module needs a colocated Test file";

    const auto found = run(project, "src/service.ts", inv);
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].message, "missing colocated test file");

    project.write("src/service.test.ts", "test('s', () => {});\n");
    EXPECT_TRUE(run(project, "src/service.ts", inv).empty());

    inv.rule = "Files use kebab-case names";
    project.write("src/other.ts", "export const o = 1;\n");
    EXPECT_TRUE(run(project, "src/other.ts", inv).empty());
}

TEST(RuleEngine, EvaluateAllKeepsInvariantOrder)
{
    ProjectFixture project;
    project.write("src/routes/users.ts", "import { db } from '../db/client';\nconsole.log(db);\n");

    Invariant pattern;
    pattern.id = "no-console";
    pattern.kind = RuleKind::Pattern;
    pattern.forbiddenPattern = "console\\.log";

    const std::vector<CompiledInvariant> rules = {compile(pattern), compile(routesMayNotTouchDb())};
    FileSubject file(project.path("src/routes/users.ts"), "src/routes/users.ts");
    const auto found = evaluateAll(file, rules, project.root());
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].rule, "no-console");
    EXPECT_EQ(found[1].rule, "routes-no-db");
}
