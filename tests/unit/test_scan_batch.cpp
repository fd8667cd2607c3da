// File: tests/unit/test_scan_batch.cpp
// Purpose: Exercise the batch scanner end to end over small projects.
// Key invariants: Results are identical across repeated scans and worker
//                 counts; missing and oversized files contribute nothing.
// Ownership/Lifetime: Each test owns a ProjectFixture directory.

#include <gtest/gtest.h>

#include "rules/CompiledInvariant.hpp"
#include "scan/BatchScanner.hpp"
#include "scan/FileDiscovery.hpp"
#include "support/logger.hpp"
#include "tests/common/ProjectFixture.hpp"

#include <string>
#include <vector>

using namespace thymus::scan;
using thymus::rules::CompiledInvariant;
using thymus::rules::Invariant;
using thymus::rules::RuleKind;
using thymus::rules::Severity;
using thymus::rules::Violation;
using thymus::support::Logger;
using thymus::tests::ProjectFixture;

namespace
{
std::vector<CompiledInvariant> routesRules()
{
    Invariant inv;
    inv.id = "routes-no-db";
    inv.kind = RuleKind::Boundary;
    inv.severity = Severity::Error;
    inv.description = "Routes must not import the database layer";
    inv.sourceGlob = "src/routes/**";
    inv.forbiddenImports = {"src/db/**"};

    Invariant console;
    console.id = "no-console";
    console.kind = RuleKind::Pattern;
    console.forbiddenPattern = "console\\.log";
    console.description = "No console logging";

    auto first = thymus::rules::compileInvariant(inv);
    auto second = thymus::rules::compileInvariant(console);
    EXPECT_TRUE(first.hasValue());
    EXPECT_TRUE(second.hasValue());
    return {first.value(), second.value()};
}

ScanOptions optionsFor(const ProjectFixture &project, unsigned jobs)
{
    ScanOptions opts;
    opts.root = project.root();
    opts.jobs = jobs;
    return opts;
}

bool sameViolations(const std::vector<Violation> &a, const std::vector<Violation> &b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (a[i].rule != b[i].rule || a[i].file != b[i].file || a[i].importSpec != b[i].importSpec ||
            a[i].line != b[i].line || a[i].severity != b[i].severity)
            return false;
    }
    return true;
}
} // namespace

TEST(BatchScanner, RouteImportingDatabaseIsOneError)
{
    ProjectFixture project;
    project.write("src/routes/users.ts", "import { db } from '../db/client';\n");
    project.write("src/db/client.ts", "export const db = {};\n");

    const BatchScanner scanner(routesRules(), optionsFor(project, 2), Logger::null());
    const auto files = findSourceFiles(project.root(), "", Logger::null());
    const ScanResult result = scanner.scan(files);

    EXPECT_EQ(result.filesChecked, 2u);
    ASSERT_EQ(result.violations.size(), 1u);
    EXPECT_EQ(result.violations[0].rule, "routes-no-db");
    EXPECT_EQ(result.violations[0].file, "src/routes/users.ts");
    EXPECT_EQ(result.violations[0].importSpec.value_or(""), "../db/client");
    EXPECT_EQ(result.stats.total, 1u);
    EXPECT_EQ(result.stats.errors, 1u);
    EXPECT_EQ(result.stats.warnings, 0u);
}

TEST(BatchScanner, RepeatedScansAgreeAcrossWorkerCounts)
{
    ProjectFixture project;
    for (int i = 0; i < 12; ++i)
    {
        const std::string n = std::to_string(i);
        project.write("src/routes/r" + n + ".ts",
                      "import { a } from '../db/m" + n + "';\nconsole.log('" + n + "');\n");
        project.write("src/db/m" + n + ".ts", "export const a = " + n + ";\n");
    }
    const auto files = findSourceFiles(project.root(), "", Logger::null());

    const BatchScanner serial(routesRules(), optionsFor(project, 1), Logger::null());
    const BatchScanner parallel(routesRules(), optionsFor(project, 8), Logger::null());

    const ScanResult first = serial.scan(files);
    const ScanResult second = serial.scan(files);
    const ScanResult third = parallel.scan(files);

    EXPECT_EQ(first.violations.size(), 24u);
    EXPECT_TRUE(sameViolations(first.violations, second.violations));
    EXPECT_TRUE(sameViolations(first.violations, third.violations));
    EXPECT_EQ(first.stats.errors, 12u);
    EXPECT_EQ(first.stats.warnings, 12u);
}

TEST(BatchScanner, MissingAndEmptyPathsAreSkipped)
{
    ProjectFixture project;
    project.write("src/routes/ok.ts", "export {};\n");

    const BatchScanner scanner(routesRules(), optionsFor(project, 1), Logger::null());
    const ScanResult result = scanner.scan({"src/routes/ok.ts", "src/routes/gone.ts", ""});
    EXPECT_EQ(result.filesChecked, 3u);
    EXPECT_TRUE(result.violations.empty());
    EXPECT_TRUE(scanner.scanFile("src/routes/gone.ts").empty());
}

TEST(BatchScanner, OversizedFilesAreSkipped)
{
    ProjectFixture project;
    project.write("src/routes/big.ts", "import { db } from '../db/client';\n" + std::string(200, '/') + "\n");

    ScanOptions opts = optionsFor(project, 1);
    opts.maxFileSize = 64;
    const BatchScanner capped(routesRules(), opts, Logger::null());
    EXPECT_TRUE(capped.scanFile("src/routes/big.ts").empty());

    opts.maxFileSize = 0;
    const BatchScanner uncapped(routesRules(), opts, Logger::null());
    EXPECT_EQ(uncapped.scanFile("src/routes/big.ts").size(), 1u);

    EXPECT_TRUE(exceedsSizeCap(project.path("src/routes/big.ts"), 64));
    EXPECT_FALSE(exceedsSizeCap(project.path("src/routes/big.ts"), 0));
    EXPECT_FALSE(exceedsSizeCap(project.path("src/routes/none.ts"), 64));
}

TEST(BatchScanner, EvaluateFileUsesReportedPath)
{
    ProjectFixture project;
    project.write("tmp/buffer.ts", "import { db } from '../db/client';\n");

    const BatchScanner scanner(routesRules(), optionsFor(project, 1), Logger::null());
    const auto found = scanner.evaluateFile(project.path("tmp/buffer.ts"), "src/routes/users.ts");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].file, "src/routes/users.ts");
}

TEST(BatchScanner, ComputeStatsCountsBySeverity)
{
    std::vector<Violation> vs(4);
    vs[0].severity = Severity::Error;
    vs[1].severity = Severity::Warning;
    vs[2].severity = Severity::Info;
    vs[3].severity = Severity::Error;

    const ScanStats stats = computeStats(vs);
    EXPECT_EQ(stats.total, 4u);
    EXPECT_EQ(stats.errors, 2u);
    EXPECT_EQ(stats.warnings, 1u);
}

TEST(BatchScanner, CollectImportsForGraph)
{
    ProjectFixture project;
    project.write("src/a.ts", "import x from './b';\nimport y from 'lodash';\n");
    project.write("src/b.ts", "export default 1;\n");

    const BatchScanner scanner({}, optionsFor(project, 2), Logger::null());
    const auto entries = scanner.collectImports({"src/a.ts", "src/b.ts", "src/missing.ts"});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].file, "src/a.ts");
    const std::vector<std::string> expected = {"./b", "lodash"};
    EXPECT_EQ(entries[0].imports, expected);
    EXPECT_EQ(entries[1].file, "src/b.ts");
    EXPECT_TRUE(entries[1].imports.empty());
}
