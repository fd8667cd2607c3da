// File: tests/unit/test_io_yaml.cpp
// Purpose: Verify rendering of inferred rules and appending them to a config.
// Key invariants: Rendered records load back through the invariant loader;
//                 appending never creates a missing config file.
// Ownership/Lifetime: Each file-backed test owns a ProjectFixture directory.

#include <gtest/gtest.h>

#include "io/YamlWriter.hpp"
#include "rules/InvariantLoader.hpp"
#include "support/diagnostics.hpp"
#include "tests/common/ProjectFixture.hpp"

#include <string>
#include <vector>

using namespace thymus::io;
using thymus::rules::Invariant;
using thymus::rules::RuleKind;
using thymus::rules::Severity;
using thymus::support::DiagnosticEngine;
using thymus::tests::ProjectFixture;

namespace
{
Invariant gatewayRule()
{
    Invariant rule;
    rule.id = "inferred-lib-gateway";
    rule.kind = RuleKind::Boundary;
    rule.severity = Severity::Warning;
    rule.description = "90% of imports into lib go through index; enforce gateway pattern";
    rule.sourceGlob = "**";
    rule.forbiddenImports = {"lib/**"};
    rule.allowedImports = {"lib/index"};
    rule.inferred = true;
    rule.confidence = 90.0;
    return rule;
}
} // namespace

TEST(YamlWriter, FormatConfidence)
{
    EXPECT_EQ(formatConfidence(90.0), "90");
    EXPECT_EQ(formatConfidence(100.0), "100");
    EXPECT_EQ(formatConfidence(93.27), "93.3");
    EXPECT_EQ(formatConfidence(97.5), "97.5");
}

TEST(YamlWriter, EmptyResultCarriesReason)
{
    const std::string text = renderInferredRules({}, 90.0, "No multi-file modules found");
    EXPECT_EQ(text,
              "# Auto-inferred rules (thymus infer)\n"
              "# Min confidence: 90%\n"
              "# Review before applying\n"
              "# No multi-file modules found\n");
}

TEST(YamlWriter, RecordsAreIndentedListItems)
{
    const std::string text = renderRuleRecords({gatewayRule()});
    EXPECT_EQ(text.rfind("  - id: inferred-lib-gateway\n", 0), 0u);
    EXPECT_NE(text.find("\n    type: boundary\n"), std::string::npos);
    EXPECT_NE(text.find("\n    inferred: true\n"), std::string::npos);
    EXPECT_NE(text.find("\n    confidence: 90"), std::string::npos);
    EXPECT_EQ(text.back(), '\n');

    const std::string full = renderInferredRules({gatewayRule()}, 85.0, "unused");
    EXPECT_NE(full.find("# Review before applying\n\n  - id: "), std::string::npos);
    EXPECT_EQ(full.find("unused"), std::string::npos);
}

TEST(YamlWriter, RenderedRulesLoadBack)
{
    const std::string text = "invariants:\n" + renderRuleRecords({gatewayRule()});
    DiagnosticEngine diags;
    auto loaded = thymus::rules::parseInvariantsYaml(text, "inferred.yml", diags);
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_EQ(loaded.value().size(), 1u);

    const Invariant &rule = loaded.value()[0];
    EXPECT_EQ(rule.id, "inferred-lib-gateway");
    EXPECT_EQ(rule.sourceGlob, "**");
    EXPECT_EQ(rule.forbiddenImports, std::vector<std::string>{"lib/**"});
    EXPECT_EQ(rule.allowedImports, std::vector<std::string>{"lib/index"});
    EXPECT_TRUE(rule.inferred);
    EXPECT_DOUBLE_EQ(rule.confidence.value_or(0), 90.0);
    EXPECT_EQ(diags.errorCount(), 0u);
}

TEST(YamlWriter, AppendExtendsExistingConfig)
{
    ProjectFixture project;
    project.write(".thymus/invariants.yml",
                  "version: \"1.0\"\n"
                  "invariants:\n"
                  "  - id: routes-no-db\n"
                  "    type: boundary\n"
                  "    source_glob: \"src/routes/**\"\n"
                  "    forbidden_imports: [\"src/db/**\"]\n");

    const std::string path = project.path(".thymus/invariants.yml");
    auto appended = appendRulesToFile(path, {gatewayRule()});
    ASSERT_TRUE(appended.hasValue());

    DiagnosticEngine diags;
    auto loaded = thymus::rules::parseInvariantsYaml(thymus::tests::readFile(path), path, diags);
    ASSERT_TRUE(loaded.hasValue());
    ASSERT_EQ(loaded.value().size(), 2u);
    EXPECT_EQ(loaded.value()[0].id, "routes-no-db");
    EXPECT_EQ(loaded.value()[1].id, "inferred-lib-gateway");
}

TEST(YamlWriter, AppendRequiresExistingFile)
{
    ProjectFixture project;
    const std::string path = project.path(".thymus/invariants.yml");
    auto appended = appendRulesToFile(path, {gatewayRule()});
    ASSERT_FALSE(appended.hasValue());
    EXPECT_NE(appended.error().message.find("invariant file not found"), std::string::npos);
    EXPECT_TRUE(thymus::tests::readFile(path).empty());
}
