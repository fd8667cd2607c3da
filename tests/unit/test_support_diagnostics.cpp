// File: tests/unit/test_support_diagnostics.cpp
// Purpose: Ensure diagnostics count severities and print in location order.
// Key invariants: Notes do not affect counters; printDiag prefixes path:line
//                 when a location is attached.
// Ownership/Lifetime: Engine instances are local to each test.

#include <gtest/gtest.h>

#include "support/diag_expected.hpp"
#include "support/diagnostics.hpp"
#include "support/source_loader.hpp"

#include <sstream>
#include <string>

using namespace thymus::support;

TEST(Diagnostics, CountsErrorsAndWarnings)
{
    DiagnosticEngine de;
    de.report(makeError({"a.yml", 3}, "bad record"));
    de.report(makeWarning({"a.yml", 5}, "unknown severity; record skipped"));
    de.report(Diagnostic{Severity::Note, "fyi", {}});

    EXPECT_EQ(de.errorCount(), 1u);
    EXPECT_EQ(de.warningCount(), 1u);
    ASSERT_EQ(de.diagnostics().size(), 3u);

    std::ostringstream os;
    de.printAll(os);
    EXPECT_EQ(os.str(),
              "a.yml:3: error: bad record\n"
              "a.yml:5: warning: unknown severity; record skipped\n"
              "note: fyi\n");
}

TEST(Diagnostics, PathWithoutLineOmitsLineNumber)
{
    std::ostringstream os;
    printDiag(makeWarning({"cache.json", 0}, "ignored"), os);
    printDiag(makeError({"inv.yml", 12}, "bad"), os);
    EXPECT_EQ(os.str(), "cache.json: warning: ignored\ninv.yml:12: error: bad\n");
}

TEST(Diagnostics, ExpectedCarriesValueOrError)
{
    Expected<int> ok(42);
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok.value(), 42);

    Expected<int> bad(makeError("boom"));
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "boom");
    EXPECT_FALSE(bad.error().loc.hasFile());

    Expected<void> done;
    EXPECT_TRUE(done.hasValue());
    Expected<void> failed(makeError({"x", 0}, "nope"));
    EXPECT_FALSE(failed);
    EXPECT_EQ(failed.error().loc.path, "x");
}

TEST(SourceLoader, MissingFileIsAnError)
{
    auto loaded = loadSourceFile("/nonexistent/thymus/file.ts");
    ASSERT_FALSE(loaded);
    EXPECT_NE(loaded.error().message.find("unable to open"), std::string::npos);
    EXPECT_TRUE(loadFilePrefix("/nonexistent/thymus/file.ts", 16).empty());
}
