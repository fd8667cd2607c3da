// File: tests/unit/test_io_json.cpp
// Purpose: Verify the JSON shapes produced and accepted by the codec layer.
// Key invariants: Empty optional fields are omitted; whole confidences are
//                 integers; decoding reports malformed records as errors.
// Ownership/Lifetime: Pure value conversions.

#include <gtest/gtest.h>

#include "io/JsonCodec.hpp"

#include <string>
#include <vector>

using namespace thymus::io;
using thymus::rules::Invariant;
using thymus::rules::RuleKind;
using thymus::rules::Severity;
using thymus::rules::Violation;

TEST(JsonCodec, InvariantOmitsEmptyFields)
{
    Invariant inv;
    inv.id = "routes-no-db";
    inv.kind = RuleKind::Boundary;
    inv.severity = Severity::Error;
    inv.sourceGlob = "src/routes/**";
    inv.forbiddenImports = {"src/db/**"};

    const json j = invariantToJson(inv);
    EXPECT_EQ(j["id"], "routes-no-db");
    EXPECT_EQ(j["type"], "boundary");
    EXPECT_EQ(j["severity"], "error");
    EXPECT_EQ(j["source_glob"], "src/routes/**");
    EXPECT_EQ(j["forbidden_imports"], json::array({"src/db/**"}));
    EXPECT_FALSE(j.contains("description"));
    EXPECT_FALSE(j.contains("allowed_imports"));
    EXPECT_FALSE(j.contains("inferred"));
    EXPECT_FALSE(j.contains("confidence"));
}

TEST(JsonCodec, ConfidenceIsIntegerWhenWhole)
{
    Invariant inv;
    inv.id = "inferred-lib-gateway";
    inv.inferred = true;
    inv.confidence = 90.0;
    json j = invariantToJson(inv);
    EXPECT_EQ(j["inferred"], true);
    EXPECT_TRUE(j["confidence"].is_number_integer());
    EXPECT_EQ(j["confidence"], 90);

    inv.confidence = 93.5;
    j = invariantToJson(inv);
    EXPECT_TRUE(j["confidence"].is_number_float());
}

TEST(JsonCodec, InvariantsDecodeFromObjectOrList)
{
    const json doc = json::parse(R"({"invariants": [
        {"id": "a", "type": "pattern", "forbidden_pattern": "TODO"},
        {"id": "b", "type": "dependency", "package": "axios", "allowed_in": "src/infra/**",
         "severity": "info", "inferred": true, "confidence": 95}
    ]})");

    auto decoded = invariantsFromJson(doc);
    ASSERT_TRUE(decoded.hasValue());
    const auto &list = decoded.value();
    ASSERT_EQ(list.size(), 2u);
    EXPECT_EQ(list[0].kind, RuleKind::Pattern);
    EXPECT_EQ(list[0].severity, Severity::Warning);
    EXPECT_EQ(list[0].forbiddenPattern, "TODO");
    EXPECT_EQ(list[1].allowedIn, std::vector<std::string>{"src/infra/**"});
    EXPECT_EQ(list[1].severity, Severity::Info);
    EXPECT_TRUE(list[1].inferred);
    EXPECT_DOUBLE_EQ(list[1].confidence.value_or(0), 95.0);

    auto bare = invariantsFromJson(doc["invariants"]);
    ASSERT_TRUE(bare.hasValue());
    EXPECT_EQ(bare.value().size(), 2u);
}

TEST(JsonCodec, InvariantDecodeErrors)
{
    auto noType = invariantFromJson(json{{"id", "x"}});
    ASSERT_FALSE(noType.hasValue());
    EXPECT_NE(noType.error().message.find("missing required field 'type'"), std::string::npos);

    auto badType = invariantFromJson(json{{"id", "x"}, {"type", "nonsense"}});
    ASSERT_FALSE(badType.hasValue());
    EXPECT_NE(badType.error().message.find("unknown type 'nonsense'"), std::string::npos);

    EXPECT_FALSE(invariantFromJson(json{{"type", "boundary"}}).hasValue());
    EXPECT_FALSE(invariantFromJson(json{{"id", "x"}, {"type", "boundary"}, {"forbidden_imports", 3}}).hasValue());
    EXPECT_FALSE(invariantsFromJson(json{{"rules", json::array()}}).hasValue());
}

TEST(JsonCodec, ViolationShape)
{
    Violation v;
    v.rule = "no-console";
    v.severity = Severity::Warning;
    v.message = "No console logging";
    v.file = "src/app.ts";
    v.line = 7;

    const json j = violationToJson(v);
    EXPECT_EQ(j["rule"], "no-console");
    EXPECT_EQ(j["severity"], "warning");
    EXPECT_EQ(j["file"], "src/app.ts");
    EXPECT_TRUE(j["line"].is_number_integer());
    EXPECT_EQ(j["line"], 7);
    EXPECT_FALSE(j.contains("import"));
    EXPECT_FALSE(j.contains("package"));
}

TEST(JsonCodec, ViolationLineAcceptsNumericString)
{
    auto v = violationFromJson(json{{"rule", "r"}, {"file", "f.ts"}, {"line", "12"}, {"import", "../db"}});
    ASSERT_TRUE(v.hasValue());
    EXPECT_EQ(v.value().line.value_or(0), 12u);
    EXPECT_EQ(v.value().importSpec.value_or(""), "../db");

    auto junk = violationFromJson(json{{"rule", "r"}, {"file", "f.ts"}, {"line", "twelve"}});
    ASSERT_TRUE(junk.hasValue());
    EXPECT_FALSE(junk.value().line.has_value());
}

TEST(JsonCodec, ViolationsListSkipsMalformedRecords)
{
    const json doc = json::parse(R"({"violations": [
        {"rule": "a", "file": "x.ts", "severity": "error"},
        "not an object",
        {"rule": 5, "file": "y.ts"}
    ]})");
    auto list = violationsFromJson(doc);
    ASSERT_TRUE(list.hasValue());
    ASSERT_EQ(list.value().size(), 1u);
    EXPECT_EQ(list.value()[0].severity, Severity::Error);

    auto none = violationsFromJson(json::object());
    ASSERT_TRUE(none.hasValue());
    EXPECT_TRUE(none.value().empty());
}

TEST(JsonCodec, ScanResultAndErrorPayloads)
{
    thymus::scan::ScanResult result;
    result.scope = "src";
    result.filesChecked = 3;
    result.violations.resize(1);
    result.violations[0].rule = "r";
    result.violations[0].severity = Severity::Error;
    result.stats.total = 1;
    result.stats.errors = 1;

    const json j = scanResultToJson(result);
    EXPECT_EQ(j["scope"], "src");
    EXPECT_EQ(j["files_checked"], 3);
    ASSERT_EQ(j["violations"].size(), 1u);
    EXPECT_EQ(j["stats"]["total"], 1);
    EXPECT_EQ(j["stats"]["errors"], 1);
    EXPECT_EQ(j["stats"]["warnings"], 0);

    const json err = scanErrorToJson("invalid YAML");
    EXPECT_EQ(err["error"], "invalid YAML");
    EXPECT_TRUE(err["violations"].is_array());
    EXPECT_TRUE(err["violations"].empty());
    EXPECT_EQ(err["stats"]["total"], 0);
}

TEST(JsonCodec, ImportEntries)
{
    const std::vector<thymus::graph::ImportEntry> entries = {{"src/a.ts", {"./b", "lodash"}}, {"src/b.ts", {}}};
    const json j = importEntriesToJson(entries);
    ASSERT_TRUE(j.is_array());
    EXPECT_EQ(j[0]["file"], "src/a.ts");
    EXPECT_EQ(j[0]["imports"], json::array({"./b", "lodash"}));

    auto decoded = importEntriesFromJson(j);
    ASSERT_TRUE(decoded.hasValue());
    ASSERT_EQ(decoded.value().size(), 2u);
    EXPECT_EQ(decoded.value()[0].imports.size(), 2u);

    EXPECT_FALSE(importEntriesFromJson(json::object()).hasValue());
}

TEST(JsonCodec, AdjacencyGraphShape)
{
    thymus::graph::AdjacencyGraph g;
    g.modules.push_back({"src/db", {"src/db/client.ts"}, 1, 0});
    g.modules.push_back({"src/routes", {"src/routes/users.ts"}, 1, 1});
    thymus::graph::ModuleEdge e;
    e.from = "src/routes";
    e.to = "src/db";
    e.imports.push_back({"src/routes/users.ts", "../db/client"});
    e.violation = true;
    e.ruleIds = {"routes-no-db"};
    g.edges.push_back(e);

    const json j = adjacencyGraphToJson(g);
    ASSERT_EQ(j["modules"].size(), 2u);
    EXPECT_EQ(j["modules"][1]["file_count"], 1);
    EXPECT_EQ(j["modules"][1]["violations"], 1);
    ASSERT_EQ(j["edges"].size(), 1u);
    EXPECT_EQ(j["edges"][0]["imports"][0]["target"], "../db/client");
    EXPECT_EQ(j["edges"][0]["violation"], true);
    EXPECT_EQ(j["edges"][0]["rule_ids"], json::array({"routes-no-db"}));

    auto decoded = adjacencyGraphFromJson(j);
    ASSERT_TRUE(decoded.hasValue());
    const auto *edge = decoded.value().findEdge("src/routes", "src/db");
    ASSERT_NE(edge, nullptr);
    EXPECT_TRUE(edge->violation);
    EXPECT_NE(decoded.value().findModule("src/db"), nullptr);

    EXPECT_FALSE(adjacencyGraphFromJson(json::array()).hasValue());
    EXPECT_FALSE(adjacencyGraphFromJson(json{{"modules", json::array({json{{"files", 1}}})}}).hasValue());
}

TEST(JsonCodec, ParseJsonReportsSource)
{
    auto ok = parseJson(R"({"a": 1})", "input");
    ASSERT_TRUE(ok.hasValue());
    EXPECT_EQ(ok.value()["a"], 1);

    auto bad = parseJson("{not json", "imports.json");
    ASSERT_FALSE(bad.hasValue());
    EXPECT_EQ(bad.error().message.rfind("imports.json: invalid JSON", 0), 0u);
}

TEST(JsonCodec, ProjectProfileShapes)
{
    thymus::scan::StructureProfile structure;
    structure.rawStructure = {"src", "src/db"};
    structure.detectedLayers = {"db"};
    structure.testGaps = {"src/db/client.ts"};
    structure.fileCounts.push_back({"src", 2});

    const json s = structureProfileToJson(structure);
    EXPECT_EQ(s["raw_structure"], json::array({"src", "src/db"}));
    EXPECT_EQ(s["detected_layers"], json::array({"db"}));
    EXPECT_TRUE(s["naming_patterns"].is_array());
    EXPECT_TRUE(s["naming_patterns"].empty());
    EXPECT_EQ(s["test_gaps"], json::array({"src/db/client.ts"}));
    EXPECT_EQ(s["file_counts"][0]["dir"], "src");
    EXPECT_EQ(s["file_counts"][0]["count"], 2);

    thymus::scan::DependencyProfile deps;
    deps.language = "go";
    deps.externalDeps = {"github.com/lib/pq"};
    deps.importFrequency.push_back({"github.com/acme/shop/db", 3});
    deps.crossModuleImports.push_back({"handlers", "db"});

    const json d = dependencyProfileToJson(deps);
    EXPECT_EQ(d["language"], "go");
    EXPECT_EQ(d["framework"], "unknown");
    EXPECT_EQ(d["external_deps"], json::array({"github.com/lib/pq"}));
    EXPECT_EQ(d["import_frequency"][0]["path"], "github.com/acme/shop/db");
    EXPECT_EQ(d["import_frequency"][0]["count"], 3);
    EXPECT_EQ(d["cross_module_imports"][0]["from"], "handlers");
    EXPECT_EQ(d["cross_module_imports"][0]["to"], "db");
}
