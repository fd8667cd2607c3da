//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/JsonCodec.hpp
// Purpose: JSON payload shapes for invariants, violations, scan results,
//          import entries, the adjacency graph and the project profile.
//
// Key invariants:
//   - Optional fields are omitted from output when unset or empty.
//   - Decoders never throw; malformed payloads produce a diagnostic.
//   - Violation lines decode from either a number or a numeric string.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "graph/ModuleGraph.hpp"
#include "rules/Invariant.hpp"
#include "scan/BatchScanner.hpp"
#include "scan/ProjectProfile.hpp"
#include "support/diag_expected.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace thymus::io
{

using json = nlohmann::json;

json invariantToJson(const rules::Invariant &inv);
support::Expected<rules::Invariant> invariantFromJson(const json &j);

json invariantsToJson(const std::vector<rules::Invariant> &invariants);
support::Expected<std::vector<rules::Invariant>> invariantsFromJson(const json &j);

json violationToJson(const rules::Violation &v);
support::Expected<rules::Violation> violationFromJson(const json &j);

json scanResultToJson(const scan::ScanResult &result);

/// @brief Scan-result payload reporting a configuration error.
json scanErrorToJson(const std::string &message);

/// @brief Violations of a scan-result payload (`{"violations": [...]}`) or a bare array.
support::Expected<std::vector<rules::Violation>> violationsFromJson(const json &j);

json importEntriesToJson(const std::vector<graph::ImportEntry> &entries);
support::Expected<std::vector<graph::ImportEntry>> importEntriesFromJson(const json &j);

json adjacencyGraphToJson(const graph::AdjacencyGraph &g);
support::Expected<graph::AdjacencyGraph> adjacencyGraphFromJson(const json &j);

json structureProfileToJson(const scan::StructureProfile &profile);
json dependencyProfileToJson(const scan::DependencyProfile &profile);

/// @brief Parse @p text, converting parser exceptions into a diagnostic.
support::Expected<json> parseJson(const std::string &text, const std::string &sourceName);

} // namespace thymus::io
