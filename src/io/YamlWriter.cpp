//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/YamlWriter.cpp
// Purpose: yaml-cpp emitter for inferred rule records.
//
//===----------------------------------------------------------------------===//

#include "io/YamlWriter.hpp"

#include <yaml-cpp/yaml.h>

#include <cmath>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace thymus::io
{

namespace
{
void emitList(YAML::Emitter &out, const char *key, const std::vector<std::string> &values)
{
    if (values.empty())
        return;
    out << YAML::Key << key << YAML::Value << YAML::BeginSeq;
    for (const auto &v : values)
        out << YAML::DoubleQuoted << v;
    out << YAML::EndSeq;
}

void emitString(YAML::Emitter &out, const char *key, const std::string &value)
{
    if (value.empty())
        return;
    out << YAML::Key << key << YAML::Value << YAML::DoubleQuoted << value;
}

/// @brief One rule as a block list item, every line indented by two spaces.
std::string renderRecord(const rules::Invariant &rule)
{
    YAML::Emitter out;
    out.SetIndent(2);
    out << YAML::BeginSeq << YAML::BeginMap;
    out << YAML::Key << "id" << YAML::Value << rule.id;
    out << YAML::Key << "type" << YAML::Value << rules::ruleKindName(rule.kind);
    out << YAML::Key << "severity" << YAML::Value << rules::severityName(rule.severity);
    emitString(out, "description", rule.description);
    emitString(out, "source_glob", rule.sourceGlob);
    emitString(out, "scope_glob", rule.scopeGlob);
    emitList(out, "scope_glob_exclude", rule.scopeGlobExclude);
    emitList(out, "forbidden_imports", rule.forbiddenImports);
    emitList(out, "allowed_imports", rule.allowedImports);
    emitString(out, "forbidden_pattern", rule.forbiddenPattern);
    emitString(out, "rule", rule.rule);
    emitString(out, "package", rule.package);
    emitList(out, "allowed_in", rule.allowedIn);
    out << YAML::Key << "inferred" << YAML::Value << rule.inferred;
    if (rule.confidence)
        out << YAML::Key << "confidence" << YAML::Value << formatConfidence(*rule.confidence);
    out << YAML::EndMap << YAML::EndSeq;

    std::istringstream lines(out.c_str());
    std::string result;
    std::string line;
    while (std::getline(lines, line))
        result += "  " + line + "\n";
    return result;
}
} // namespace

std::string formatConfidence(double confidence)
{
    if (std::floor(confidence) == confidence)
        return std::to_string(static_cast<long long>(confidence));
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f", confidence);
    return buf;
}

std::string renderRuleRecords(const std::vector<rules::Invariant> &rules)
{
    std::string out;
    for (const auto &rule : rules)
        out += renderRecord(rule);
    return out;
}

std::string renderInferredRules(const std::vector<rules::Invariant> &rules,
                                double minConfidence,
                                std::string_view emptyReason)
{
    std::string out = "# Auto-inferred rules (thymus infer)\n";
    out += "# Min confidence: " + formatConfidence(minConfidence) + "%\n";
    out += "# Review before applying\n";
    if (rules.empty())
    {
        out += "# ";
        out += emptyReason;
        out += "\n";
        return out;
    }
    out += "\n";
    out += renderRuleRecords(rules);
    return out;
}

support::Expected<void> appendRulesToFile(const std::string &path, const std::vector<rules::Invariant> &rules)
{
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        return support::makeError("cannot apply rules: invariant file not found: " + path);

    std::ofstream out(path, std::ios::binary | std::ios::app);
    if (!out)
        return support::makeError("cannot open " + path + " for appending");
    out << "\n" << renderRuleRecords(rules);
    if (!out)
        return support::makeError("failed writing " + path);
    return {};
}

} // namespace thymus::io
