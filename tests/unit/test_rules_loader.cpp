// File: tests/unit/test_rules_loader.cpp
// Purpose: Validate YAML invariant loading, schema checks and the JSON cache.
// Key invariants: Bad records are skipped with a warning while the rest load;
//                 a missing file or YAML syntax error is a configuration
//                 error; a cache newer than the YAML file is preferred; a
//                 file with skipped records is never cached.
// Ownership/Lifetime: Each test owns a ProjectFixture directory.

#include <gtest/gtest.h>

#include "rules/InvariantLoader.hpp"
#include "support/diagnostics.hpp"
#include "support/logger.hpp"
#include "tests/common/ProjectFixture.hpp"

#include <chrono>
#include <filesystem>

using namespace thymus::rules;
using thymus::support::DiagnosticEngine;
using thymus::support::Logger;
using thymus::tests::ProjectFixture;

namespace
{
constexpr const char *kConfig = R"YAML(version: "1.0"
invariants:
  - id: routes-no-db
    type: boundary
    severity: error
    description: Routes must not import the database layer
    source_glob: "src/routes/**"
    forbidden_imports:
      - "src/db/**"
    allowed_imports: "src/db/client"
  - id: no-console
    type: pattern
    forbidden_pattern: "console\\.log"
    scope_glob: "src/**"
    scope_glob_exclude: ["**/*.test.ts"]
  - id: broken-type
    type: nonsense
  - type: boundary
  - id: no-axios
    type: dependency
    severity: fatal
  - id: tests-colocated
    type: convention
    severity: info
    rule: Every service has a test file
)YAML";

constexpr const char *kCleanConfig = R"YAML(invariants:
  - id: routes-no-db
    type: boundary
    source_glob: "src/routes/**"
    forbidden_imports: ["src/db/**"]
  - id: no-console
    type: pattern
    forbidden_pattern: "console\\.log"
  - id: tests-colocated
    type: convention
    rule: Every service has a test file
)YAML";
} // namespace

TEST(InvariantYaml, LoadsValidRecordsAndSkipsBadOnes)
{
    DiagnosticEngine diags;
    auto parsed = parseInvariantsYaml(kConfig, "invariants.yml", diags);
    ASSERT_TRUE(parsed);
    const auto &invs = parsed.value();
    ASSERT_EQ(invs.size(), 3u);

    EXPECT_EQ(invs[0].id, "routes-no-db");
    EXPECT_EQ(invs[0].kind, RuleKind::Boundary);
    EXPECT_EQ(invs[0].severity, Severity::Error);
    EXPECT_EQ(invs[0].sourceGlob, "src/routes/**");
    EXPECT_EQ(invs[0].forbiddenImports, (std::vector<std::string>{"src/db/**"}));
    EXPECT_EQ(invs[0].allowedImports, (std::vector<std::string>{"src/db/client"}));

    EXPECT_EQ(invs[1].id, "no-console");
    EXPECT_EQ(invs[1].severity, Severity::Warning);
    EXPECT_EQ(invs[1].forbiddenPattern, "console\\.log");
    EXPECT_EQ(invs[1].scopeGlobExclude, (std::vector<std::string>{"**/*.test.ts"}));

    EXPECT_EQ(invs[2].id, "tests-colocated");
    EXPECT_EQ(invs[2].severity, Severity::Info);
    EXPECT_EQ(invs[2].rule, "Every service has a test file");

    ASSERT_EQ(diags.warningCount(), 3u);
    EXPECT_EQ(diags.errorCount(), 0u);
    const auto &first = diags.diagnostics()[0];
    EXPECT_EQ(first.loc.path, "invariants.yml");
    EXPECT_EQ(first.loc.line, 16u);
    EXPECT_NE(first.message.find("unknown type 'nonsense'"), std::string::npos);
    EXPECT_NE(first.message.find("record skipped"), std::string::npos);
}

TEST(InvariantYaml, BareSequenceAndEmptyDocuments)
{
    DiagnosticEngine diags;
    auto bare = parseInvariantsYaml("- id: a\n  type: pattern\n", "x.yml", diags);
    ASSERT_TRUE(bare);
    EXPECT_EQ(bare.value().size(), 1u);

    auto empty = parseInvariantsYaml("", "x.yml", diags);
    ASSERT_TRUE(empty);
    EXPECT_TRUE(empty.value().empty());

    auto noList = parseInvariantsYaml("version: 1\ninvariants:\n", "x.yml", diags);
    ASSERT_TRUE(noList);
    EXPECT_TRUE(noList.value().empty());
}

TEST(InvariantYaml, SyntaxAndShapeErrorsAreConfigurationErrors)
{
    DiagnosticEngine diags;
    auto broken = parseInvariantsYaml("invariants:\n  - id: [unclosed\n", "bad.yml", diags);
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().loc.path, "bad.yml");
    EXPECT_NE(broken.error().message.find("invalid YAML"), std::string::npos);

    auto scalar = parseInvariantsYaml("invariants: 42\n", "bad.yml", diags);
    ASSERT_FALSE(scalar);
    EXPECT_NE(scalar.error().message.find("must be a list"), std::string::npos);
}

TEST(InvariantLoader, MissingFileIsAnError)
{
    ProjectFixture project;
    InvariantLoader loader(defaultInvariantsPath(project.root()), defaultCachePath(project.root()),
                           Logger::null());
    DiagnosticEngine diags;
    auto loaded = loader.load(diags);
    ASSERT_FALSE(loaded);
    EXPECT_NE(loaded.error().message.find("invariant file not found"), std::string::npos);
}

TEST(InvariantLoader, WritesAndPrefersFreshCache)
{
    namespace fs = std::filesystem;
    ProjectFixture project;
    project.write(".thymus/invariants.yml", kCleanConfig);
    const std::string yamlPath = defaultInvariantsPath(project.root());
    const std::string cachePath = defaultCachePath(project.root());
    EXPECT_EQ(cachePath, project.path(".thymus/cache/invariants.json"));

    InvariantLoader loader(yamlPath, cachePath, Logger::null());
    DiagnosticEngine diags;
    auto first = loader.load(diags);
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().size(), 3u);
    EXPECT_EQ(diags.warningCount(), 0u);
    ASSERT_TRUE(fs::exists(cachePath));

    project.write(".thymus/cache/invariants.json",
                  R"({"invariants": [{"id": "from-cache", "type": "pattern", "severity": "info"}]})");
    fs::last_write_time(cachePath, fs::last_write_time(yamlPath) + std::chrono::hours(1));

    auto cached = loader.load(diags);
    ASSERT_TRUE(cached);
    ASSERT_EQ(cached.value().size(), 1u);
    EXPECT_EQ(cached.value()[0].id, "from-cache");

    fs::last_write_time(yamlPath, fs::last_write_time(cachePath) + std::chrono::hours(1));
    auto reparsed = loader.load(diags);
    ASSERT_TRUE(reparsed);
    EXPECT_EQ(reparsed.value().size(), 3u);
}

TEST(InvariantLoader, CorruptCacheFallsBackToYaml)
{
    namespace fs = std::filesystem;
    ProjectFixture project;
    project.write(".thymus/invariants.yml", "invariants:\n  - id: only\n    type: pattern\n");
    project.write(".thymus/cache/invariants.json", "{not json");
    const std::string yamlPath = defaultInvariantsPath(project.root());
    const std::string cachePath = defaultCachePath(project.root());
    fs::last_write_time(cachePath, fs::last_write_time(yamlPath) + std::chrono::hours(1));

    InvariantLoader loader(yamlPath, cachePath, Logger::null());
    DiagnosticEngine diags;
    auto loaded = loader.load(diags);
    ASSERT_TRUE(loaded);
    ASSERT_EQ(loaded.value().size(), 1u);
    EXPECT_EQ(loaded.value()[0].id, "only");
}

TEST(InvariantLoader, SkippedRecordsWarnOnEveryLoad)
{
    namespace fs = std::filesystem;
    ProjectFixture project;
    project.write(".thymus/invariants.yml", kConfig);
    const std::string cachePath = defaultCachePath(project.root());
    InvariantLoader loader(defaultInvariantsPath(project.root()), cachePath, Logger::null());

    for (int run = 0; run < 2; ++run)
    {
        DiagnosticEngine diags;
        auto loaded = loader.load(diags);
        ASSERT_TRUE(loaded);
        EXPECT_EQ(loaded.value().size(), 3u);
        EXPECT_EQ(diags.warningCount(), 3u) << "run " << run;
    }
    EXPECT_FALSE(fs::exists(cachePath));
}
