//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/Invariant.hpp
// Purpose: Invariant (declared rule) and Violation value types.
// Key invariants:
//   - An Invariant is immutable for the duration of a scan and identified by id.
//   - Which optional fields are meaningful depends on the rule kind.
// Ownership/Lifetime: Plain value types.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::rules
{

enum class RuleKind
{
    Boundary,
    Pattern,
    Convention,
    Dependency
};

enum class Severity
{
    Error,
    Warning,
    Info
};

[[nodiscard]] std::optional<RuleKind> parseRuleKind(std::string_view text);
[[nodiscard]] const char *ruleKindName(RuleKind kind);

[[nodiscard]] std::optional<Severity> parseSeverity(std::string_view text);
[[nodiscard]] const char *severityName(Severity severity);

/// @brief A user-declared architectural rule.
struct Invariant
{
    std::string id;
    RuleKind kind = RuleKind::Boundary;
    Severity severity = Severity::Warning;
    std::string description;

    std::string sourceGlob; ///< Preferred scope glob.
    std::string scopeGlob;  ///< Fallback scope glob when sourceGlob is empty.
    std::vector<std::string> scopeGlobExclude;

    std::vector<std::string> forbiddenImports; ///< boundary
    std::vector<std::string> allowedImports;   ///< boundary
    std::string forbiddenPattern;              ///< pattern
    std::string rule;                          ///< convention (free text)
    std::string package;                       ///< dependency
    std::vector<std::string> allowedIn;        ///< dependency

    bool inferred = false;             ///< Produced by rule inference.
    std::optional<double> confidence;  ///< Inference confidence, 0-100.

    /// @brief Glob restricting which files the rule applies to; empty for all.
    [[nodiscard]] const std::string &applicableGlob() const
    {
        return sourceGlob.empty() ? scopeGlob : sourceGlob;
    }
};

/// @brief A single detected breach of an invariant by one file.
struct Violation
{
    std::string rule;
    Severity severity = Severity::Warning;
    std::string message;
    std::string file;
    std::optional<std::string> importSpec;
    std::optional<uint32_t> line;
    std::optional<std::string> package;
};

} // namespace thymus::rules
