// File: tests/unit/test_rules_scope.cpp
// Purpose: Check file scoping and import-boundary decisions.
// Key invariants: No scope glob means every file is in scope; exclusions win
//                 over inclusion; allowed_imports overrides forbidden_imports.
// Ownership/Lifetime: Invariants are built per test.

#include <gtest/gtest.h>

#include "rules/CompiledInvariant.hpp"
#include "support/diagnostics.hpp"
#include "support/logger.hpp"

using namespace thymus::rules;

namespace
{
Invariant boundary(std::vector<std::string> forbidden, std::vector<std::string> allowed = {})
{
    Invariant inv;
    inv.id = "b";
    inv.kind = RuleKind::Boundary;
    inv.forbiddenImports = std::move(forbidden);
    inv.allowedImports = std::move(allowed);
    return inv;
}
} // namespace

TEST(RuleScope, NoGlobMeansEverything)
{
    Invariant inv;
    EXPECT_TRUE(fileInScope("any/path.ts", inv));
}

TEST(RuleScope, SourceGlobPreferredOverScopeGlob)
{
    Invariant inv;
    inv.sourceGlob = "src/routes/**";
    inv.scopeGlob = "lib/**";
    EXPECT_TRUE(fileInScope("src/routes/users.ts", inv));
    EXPECT_FALSE(fileInScope("lib/x.ts", inv));

    inv.sourceGlob.clear();
    EXPECT_TRUE(fileInScope("lib/x.ts", inv));
}

TEST(RuleScope, ExclusionsWin)
{
    Invariant inv;
    inv.scopeGlob = "src/**";
    inv.scopeGlobExclude = {"**/*.test.ts", "src/generated/**"};
    EXPECT_TRUE(fileInScope("src/a.ts", inv));
    EXPECT_FALSE(fileInScope("src/a.test.ts", inv));
    EXPECT_FALSE(fileInScope("src/generated/api.ts", inv));
}

TEST(RuleScope, AllowedImportOverridesForbidden)
{
    const Invariant inv = boundary({"src/db/**"}, {"src/db/client"});
    EXPECT_FALSE(importIsForbidden("src/db/client", inv));
    EXPECT_TRUE(importIsForbidden("src/db/internal", inv));
    EXPECT_FALSE(importIsForbidden("src/api/handler", inv));
}

TEST(RuleScope, LiteralAndDottedForms)
{
    const Invariant inv = boundary({"com/example/db/**", "lodash"});
    EXPECT_TRUE(importIsForbidden("lodash", inv));
    EXPECT_FALSE(importIsForbidden("lodash-es", inv));
    EXPECT_TRUE(importIsForbidden("com.example.db.Repo", inv));
    EXPECT_FALSE(importIsForbidden("com.example.api.Handler", inv));
    EXPECT_FALSE(importIsForbidden("anything", boundary({})));
}

TEST(RuleScope, RelativeImportsAlsoTestedResolved)
{
    const RuleScope scope(boundary({"src/db/**"}, {"src/db/public/**"}));
    EXPECT_FALSE(scope.importIsForbidden("../db/client"));
    EXPECT_TRUE(scope.importIsForbidden("../db/client", "src/db/client"));
    EXPECT_FALSE(scope.importIsForbidden("../db/public/api", "src/db/public/api"));
    EXPECT_FALSE(scope.importIsForbidden("./util", "src/routes/util"));
}

TEST(RuleScope, AllowedInLocations)
{
    Invariant inv;
    inv.kind = RuleKind::Dependency;
    inv.allowedIn = {"src/infra/**"};
    const RuleScope scope(inv);
    EXPECT_TRUE(scope.inAllowedLocation("src/infra/http.ts"));
    EXPECT_FALSE(scope.inAllowedLocation("src/app.ts"));
}

TEST(CompiledInvariant, PosixClassesAreTranslated)
{
    EXPECT_EQ(translatePosixClasses("console[[:space:]]*\\.log"), "console\\s*\\.log");
    EXPECT_EQ(translatePosixClasses("[[:digit:]][[:alpha:]]"), "\\d[a-zA-Z]");
}

TEST(CompiledInvariant, InvalidPatternIsSkippedWithDiagnostic)
{
    Invariant good;
    good.id = "no-console";
    good.kind = RuleKind::Pattern;
    good.forbiddenPattern = "console\\.log";

    Invariant bad = good;
    bad.id = "broken";
    bad.forbiddenPattern = "(unclosed";

    thymus::support::DiagnosticEngine diags;
    const auto compiled = compileInvariants({good, bad}, diags, thymus::support::Logger::null());
    ASSERT_EQ(compiled.size(), 1u);
    EXPECT_EQ(compiled[0].invariant.id, "no-console");
    EXPECT_TRUE(compiled[0].pattern.has_value());
    ASSERT_EQ(diags.errorCount(), 1u);
    EXPECT_NE(diags.diagnostics()[0].message.find("broken"), std::string::npos);
}
