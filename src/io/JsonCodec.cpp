//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/JsonCodec.cpp
// Purpose: nlohmann::json encoders and decoders for the payload shapes.
//
//===----------------------------------------------------------------------===//

#include "io/JsonCodec.hpp"

#include <algorithm>
#include <cmath>

namespace thymus::io
{

namespace
{
void putString(json &j, const char *key, const std::string &value)
{
    if (!value.empty())
        j[key] = value;
}

void putList(json &j, const char *key, const std::vector<std::string> &values)
{
    if (!values.empty())
        j[key] = values;
}

/// @brief Read an optional string or string-list field; a scalar becomes a one-element list.
bool getList(const json &j, const char *key, std::vector<std::string> &out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (it->is_string())
    {
        out.push_back(it->get<std::string>());
        return true;
    }
    if (!it->is_array())
        return false;
    for (const auto &item : *it)
    {
        if (!item.is_string())
            return false;
        out.push_back(item.get<std::string>());
    }
    return true;
}

bool getString(const json &j, const char *key, std::string &out)
{
    auto it = j.find(key);
    if (it == j.end() || it->is_null())
        return true;
    if (!it->is_string())
        return false;
    out = it->get<std::string>();
    return true;
}

/// @brief Confidence as an integer when whole, otherwise as a double.
json confidenceValue(double confidence)
{
    if (std::floor(confidence) == confidence && std::abs(confidence) < 1e15)
        return static_cast<long long>(confidence);
    return confidence;
}

template <class T> support::Expected<T> fail(const std::string &message)
{
    return support::Expected<T>(support::makeError(message));
}
} // namespace

json invariantToJson(const rules::Invariant &inv)
{
    json j;
    j["id"] = inv.id;
    j["type"] = rules::ruleKindName(inv.kind);
    j["severity"] = rules::severityName(inv.severity);
    putString(j, "description", inv.description);
    putString(j, "source_glob", inv.sourceGlob);
    putString(j, "scope_glob", inv.scopeGlob);
    putList(j, "scope_glob_exclude", inv.scopeGlobExclude);
    putList(j, "forbidden_imports", inv.forbiddenImports);
    putList(j, "allowed_imports", inv.allowedImports);
    putString(j, "forbidden_pattern", inv.forbiddenPattern);
    putString(j, "rule", inv.rule);
    putString(j, "package", inv.package);
    putList(j, "allowed_in", inv.allowedIn);
    if (inv.inferred)
        j["inferred"] = true;
    if (inv.confidence)
        j["confidence"] = confidenceValue(*inv.confidence);
    return j;
}

support::Expected<rules::Invariant> invariantFromJson(const json &j)
{
    if (!j.is_object())
        return fail<rules::Invariant>("invariant record is not an object");

    rules::Invariant inv;
    if (!getString(j, "id", inv.id) || inv.id.empty())
        return fail<rules::Invariant>("invariant record without an id");

    std::string type;
    if (!getString(j, "type", type))
        return fail<rules::Invariant>("invariant " + inv.id + ": type must be a string");
    if (type.empty())
        return fail<rules::Invariant>("invariant " + inv.id + ": missing required field 'type'");
    const auto kind = rules::parseRuleKind(type);
    if (!kind)
        return fail<rules::Invariant>("invariant " + inv.id + ": unknown type '" + type + "'");
    inv.kind = *kind;

    std::string severity;
    if (!getString(j, "severity", severity))
        return fail<rules::Invariant>("invariant " + inv.id + ": severity must be a string");
    if (!severity.empty())
    {
        const auto sev = rules::parseSeverity(severity);
        if (!sev)
            return fail<rules::Invariant>("invariant " + inv.id + ": unknown severity '" + severity + "'");
        inv.severity = *sev;
    }

    const bool ok = getString(j, "description", inv.description) && getString(j, "source_glob", inv.sourceGlob) &&
                    getString(j, "scope_glob", inv.scopeGlob) &&
                    getList(j, "scope_glob_exclude", inv.scopeGlobExclude) &&
                    getList(j, "forbidden_imports", inv.forbiddenImports) &&
                    getList(j, "allowed_imports", inv.allowedImports) &&
                    getString(j, "forbidden_pattern", inv.forbiddenPattern) && getString(j, "rule", inv.rule) &&
                    getString(j, "package", inv.package) && getList(j, "allowed_in", inv.allowedIn);
    if (!ok)
        return fail<rules::Invariant>("invariant " + inv.id + ": malformed field");

    if (auto it = j.find("inferred"); it != j.end() && it->is_boolean())
        inv.inferred = it->get<bool>();
    if (auto it = j.find("confidence"); it != j.end() && it->is_number())
        inv.confidence = it->get<double>();
    return inv;
}

json invariantsToJson(const std::vector<rules::Invariant> &invariants)
{
    json list = json::array();
    for (const auto &inv : invariants)
        list.push_back(invariantToJson(inv));
    return json{{"invariants", list}};
}

support::Expected<std::vector<rules::Invariant>> invariantsFromJson(const json &j)
{
    const json *list = &j;
    if (j.is_object())
    {
        auto it = j.find("invariants");
        if (it == j.end())
            return fail<std::vector<rules::Invariant>>("missing 'invariants' list");
        list = &*it;
    }
    if (!list->is_array())
        return fail<std::vector<rules::Invariant>>("'invariants' is not a list");

    std::vector<rules::Invariant> out;
    out.reserve(list->size());
    for (const auto &item : *list)
    {
        auto inv = invariantFromJson(item);
        if (!inv)
            return fail<std::vector<rules::Invariant>>(inv.error().message);
        out.push_back(std::move(inv.value()));
    }
    return out;
}

json violationToJson(const rules::Violation &v)
{
    json j;
    j["rule"] = v.rule;
    j["severity"] = rules::severityName(v.severity);
    j["message"] = v.message;
    j["file"] = v.file;
    if (v.importSpec)
        j["import"] = *v.importSpec;
    if (v.line)
        j["line"] = *v.line;
    if (v.package)
        j["package"] = *v.package;
    return j;
}

support::Expected<rules::Violation> violationFromJson(const json &j)
{
    if (!j.is_object())
        return fail<rules::Violation>("violation is not an object");

    rules::Violation v;
    std::string severity;
    if (!getString(j, "rule", v.rule) || !getString(j, "file", v.file) || !getString(j, "message", v.message) ||
        !getString(j, "severity", severity))
        return fail<rules::Violation>("malformed violation record");
    if (!severity.empty())
    {
        if (auto sev = rules::parseSeverity(severity))
            v.severity = *sev;
    }

    std::string text;
    if (getString(j, "import", text) && !text.empty())
        v.importSpec = text;
    text.clear();
    if (getString(j, "package", text) && !text.empty())
        v.package = text;

    if (auto it = j.find("line"); it != j.end())
    {
        if (it->is_number_unsigned())
        {
            v.line = it->get<uint32_t>();
        }
        else if (it->is_string())
        {
            const std::string s = it->get<std::string>();
            if (!s.empty() && s.find_first_not_of("0123456789") == std::string::npos && s.size() < 10)
                v.line = static_cast<uint32_t>(std::stoul(s));
        }
    }
    return v;
}

json scanResultToJson(const scan::ScanResult &result)
{
    json violations = json::array();
    for (const auto &v : result.violations)
        violations.push_back(violationToJson(v));

    json j;
    j["scope"] = result.scope;
    j["files_checked"] = result.filesChecked;
    j["violations"] = violations;
    j["stats"] = {
        {"total", result.stats.total},
        {"errors", result.stats.errors},
        {"warnings", result.stats.warnings},
    };
    return j;
}

json scanErrorToJson(const std::string &message)
{
    json j;
    j["error"] = message;
    j["violations"] = json::array();
    j["stats"] = {{"total", 0}, {"errors", 0}, {"warnings", 0}};
    return j;
}

support::Expected<std::vector<rules::Violation>> violationsFromJson(const json &j)
{
    const json *list = &j;
    if (j.is_object())
    {
        auto it = j.find("violations");
        if (it == j.end())
            return std::vector<rules::Violation>{};
        list = &*it;
    }
    if (!list->is_array())
        return fail<std::vector<rules::Violation>>("'violations' is not a list");

    std::vector<rules::Violation> out;
    for (const auto &item : *list)
    {
        auto v = violationFromJson(item);
        if (v)
            out.push_back(std::move(v.value()));
    }
    return out;
}

json importEntriesToJson(const std::vector<graph::ImportEntry> &entries)
{
    json list = json::array();
    for (const auto &e : entries)
        list.push_back({{"file", e.file}, {"imports", e.imports}});
    return list;
}

support::Expected<std::vector<graph::ImportEntry>> importEntriesFromJson(const json &j)
{
    if (!j.is_array())
        return fail<std::vector<graph::ImportEntry>>("import entries must be a JSON array");

    std::vector<graph::ImportEntry> out;
    out.reserve(j.size());
    for (const auto &item : j)
    {
        if (!item.is_object())
            continue;
        graph::ImportEntry entry;
        if (!getString(item, "file", entry.file) || !getList(item, "imports", entry.imports))
            return fail<std::vector<graph::ImportEntry>>("malformed import entry");
        out.push_back(std::move(entry));
    }
    return out;
}

json adjacencyGraphToJson(const graph::AdjacencyGraph &g)
{
    json modules = json::array();
    for (const auto &m : g.modules)
    {
        modules.push_back({
            {"id", m.id},
            {"files", m.files},
            {"file_count", m.fileCount},
            {"violations", m.violations},
        });
    }

    json edges = json::array();
    for (const auto &e : g.edges)
    {
        json imports = json::array();
        for (const auto &imp : e.imports)
            imports.push_back({{"source", imp.source}, {"target", imp.target}});
        edges.push_back({
            {"from", e.from},
            {"to", e.to},
            {"imports", imports},
            {"violation", e.violation},
            {"rule_ids", e.ruleIds},
        });
    }
    return json{{"modules", modules}, {"edges", edges}};
}

json structureProfileToJson(const scan::StructureProfile &profile)
{
    json counts = json::array();
    for (const auto &c : profile.fileCounts)
        counts.push_back({{"dir", c.dir}, {"count", c.count}});
    return json{
        {"raw_structure", profile.rawStructure},
        {"detected_layers", profile.detectedLayers},
        {"naming_patterns", profile.namingPatterns},
        {"test_gaps", profile.testGaps},
        {"file_counts", counts},
    };
}

json dependencyProfileToJson(const scan::DependencyProfile &profile)
{
    json frequency = json::array();
    for (const auto &f : profile.importFrequency)
        frequency.push_back({{"path", f.path}, {"count", f.count}});
    json links = json::array();
    for (const auto &link : profile.crossModuleImports)
        links.push_back({{"from", link.from}, {"to", link.to}});
    return json{
        {"language", profile.language},
        {"framework", profile.framework},
        {"external_deps", profile.externalDeps},
        {"import_frequency", frequency},
        {"cross_module_imports", links},
    };
}

support::Expected<graph::AdjacencyGraph> adjacencyGraphFromJson(const json &j)
{
    using Result = graph::AdjacencyGraph;
    if (!j.is_object())
        return fail<Result>("adjacency graph must be a JSON object");

    graph::AdjacencyGraph g;
    try
    {
        for (const auto &m : j.value("modules", json::array()))
        {
            graph::ModuleNode node;
            node.id = m.at("id").get<std::string>();
            node.files = m.value("files", std::vector<std::string>{});
            node.fileCount = m.value("file_count", node.files.size());
            node.violations = m.value("violations", std::size_t{0});
            g.modules.push_back(std::move(node));
        }
        for (const auto &e : j.value("edges", json::array()))
        {
            graph::ModuleEdge edge;
            edge.from = e.at("from").get<std::string>();
            edge.to = e.at("to").get<std::string>();
            for (const auto &imp : e.value("imports", json::array()))
                edge.imports.push_back({imp.value("source", ""), imp.value("target", "")});
            edge.ruleIds = e.value("rule_ids", std::vector<std::string>{});
            edge.violation = e.value("violation", !edge.ruleIds.empty());
            g.edges.push_back(std::move(edge));
        }
    }
    catch (const json::exception &e)
    {
        return fail<Result>(std::string("malformed adjacency graph: ") + e.what());
    }

    std::sort(g.modules.begin(), g.modules.end(),
              [](const graph::ModuleNode &a, const graph::ModuleNode &b) { return a.id < b.id; });
    return g;
}

support::Expected<json> parseJson(const std::string &text, const std::string &sourceName)
{
    try
    {
        return json::parse(text);
    }
    catch (const json::parse_error &e)
    {
        return fail<json>(sourceName + ": invalid JSON: " + e.what());
    }
}

} // namespace thymus::io
