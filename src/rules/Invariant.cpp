//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/Invariant.cpp
// Purpose: Name tables for rule kinds and severities.
//
//===----------------------------------------------------------------------===//

#include "rules/Invariant.hpp"

namespace thymus::rules
{

std::optional<RuleKind> parseRuleKind(std::string_view text)
{
    if (text == "boundary")
        return RuleKind::Boundary;
    if (text == "pattern")
        return RuleKind::Pattern;
    if (text == "convention")
        return RuleKind::Convention;
    if (text == "dependency")
        return RuleKind::Dependency;
    return std::nullopt;
}

const char *ruleKindName(RuleKind kind)
{
    switch (kind)
    {
        case RuleKind::Boundary:
            return "boundary";
        case RuleKind::Pattern:
            return "pattern";
        case RuleKind::Convention:
            return "convention";
        case RuleKind::Dependency:
            return "dependency";
    }
    return "";
}

std::optional<Severity> parseSeverity(std::string_view text)
{
    if (text == "error")
        return Severity::Error;
    if (text == "warning")
        return Severity::Warning;
    if (text == "info")
        return Severity::Info;
    return std::nullopt;
}

const char *severityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Error:
            return "error";
        case Severity::Warning:
            return "warning";
        case Severity::Info:
            return "info";
    }
    return "";
}

} // namespace thymus::rules
