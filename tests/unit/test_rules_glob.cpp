// File: tests/unit/test_rules_glob.cpp
// Purpose: Verify glob-to-regex translation used by every scope decision.
// Key invariants: Matches are anchored; '*' stays inside one segment; '**'
//                 crosses separators; regex metacharacters are literal.
// Ownership/Lifetime: Pure functions; no shared state.

#include <gtest/gtest.h>

#include "rules/Glob.hpp"

using namespace thymus::rules;

TEST(Glob, TranslationIsAnchored)
{
    EXPECT_EQ(globToRegex("src/*.ts"), "^src/[^/]*\\.ts$");
    EXPECT_EQ(globToRegex("src/**"), "^src/.*$");
    EXPECT_EQ(globToRegex("a?c"), "^a[^/]c$");
}

TEST(Glob, StarStaysWithinSegment)
{
    EXPECT_TRUE(pathMatches("src/a.ts", "src/*.ts"));
    EXPECT_FALSE(pathMatches("src/deep/a.ts", "src/*.ts"));
    EXPECT_TRUE(pathMatches("src/deep/a.ts", "src/**/*.ts"));
    EXPECT_TRUE(pathMatches("src/routes/users.ts", "src/routes/**"));
    EXPECT_FALSE(pathMatches("lib/src/routes/users.ts", "src/routes/**"));
}

TEST(Glob, DotAndMetacharactersAreLiteral)
{
    EXPECT_FALSE(pathMatches("srcXts", "src.ts"));
    EXPECT_TRUE(pathMatches("a+b(1).ts", "a+b(1).ts"));
    EXPECT_TRUE(pathMatches("lib/[id].tsx", "lib/[id].tsx"));
    EXPECT_FALSE(pathMatches("lib/i.tsx", "lib/[id].tsx"));
}

TEST(Glob, GlobSetMatchesAny)
{
    GlobSet set({"**/*.test.ts", "scripts/**"});
    EXPECT_FALSE(set.empty());
    EXPECT_TRUE(set.anyMatch("src/a.test.ts"));
    EXPECT_TRUE(set.anyMatch("scripts/build.js"));
    EXPECT_FALSE(set.anyMatch("src/a.ts"));
    EXPECT_TRUE(GlobSet().empty());
    EXPECT_FALSE(GlobSet().anyMatch("anything"));
}
