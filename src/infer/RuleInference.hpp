//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: infer/RuleInference.hpp
// Purpose: Propose boundary rules from the module adjacency graph.
//
// Key invariants:
//   - Every proposed rule is a warning-severity boundary invariant with
//     `inferred` set and a confidence in [0, 100].
//   - Rules below the minimum confidence are never emitted.
//   - Output order is directionality, gateway, self-containment, selective
//     dependencies; duplicates on (scope glob, forbidden set) keep the first.
//   - Graphs without a module of two or more files infer nothing.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "graph/ModuleGraph.hpp"
#include "rules/Invariant.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace thymus::support
{
class Logger;
} // namespace thymus::support

namespace thymus::infer
{

inline constexpr double kDefaultMinConfidence = 90.0;

/// @brief Module id with path separators replaced by '-'.
[[nodiscard]] std::string moduleSlug(std::string_view moduleId);

/// @brief True when some module owns at least two files.
[[nodiscard]] bool hasMultiFileModule(const graph::AdjacencyGraph &g);

std::vector<rules::Invariant> detectDirectionality(const graph::AdjacencyGraph &g, double minConfidence);
std::vector<rules::Invariant> detectGateways(const graph::AdjacencyGraph &g, double minConfidence);
std::vector<rules::Invariant> detectSelfContained(const graph::AdjacencyGraph &g, double minConfidence);
std::vector<rules::Invariant> detectSelectiveDeps(const graph::AdjacencyGraph &g, double minConfidence);

/// @brief Drop rules repeating an earlier (source glob, forbidden set) pair.
std::vector<rules::Invariant> deduplicateRules(std::vector<rules::Invariant> rules);

/// @brief Run every detector, then deduplicate.
std::vector<rules::Invariant> inferRules(const graph::AdjacencyGraph &g,
                                         double minConfidence,
                                         const support::Logger &log);

} // namespace thymus::infer
