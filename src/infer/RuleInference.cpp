//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: infer/RuleInference.cpp
// Purpose: Directionality, gateway, self-containment and selective-dependency
//          detectors.
//
//===----------------------------------------------------------------------===//

#include "infer/RuleInference.hpp"

#include "support/logger.hpp"
#include "support/path_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <map>
#include <set>

namespace thymus::infer
{

namespace
{
const std::set<std::string> &gatewayNames()
{
    static const std::set<std::string> kNames = {"index", "__init__", "mod", "lib", "main", "exports", "public"};
    return kNames;
}

rules::Invariant makeRule(std::string id, std::string description, std::string sourceGlob, double confidence)
{
    rules::Invariant rule;
    rule.id = std::move(id);
    rule.kind = rules::RuleKind::Boundary;
    rule.severity = rules::Severity::Warning;
    rule.description = std::move(description);
    rule.sourceGlob = std::move(sourceGlob);
    rule.inferred = true;
    rule.confidence = confidence;
    return rule;
}

std::size_t fileCountOf(const graph::AdjacencyGraph &g, const std::string &id)
{
    const graph::ModuleNode *node = g.findModule(id);
    return node ? node->fileCount : 0;
}

/// @brief Distinct outgoing targets per module.
std::map<std::string, std::set<std::string>> outgoingTargets(const graph::AdjacencyGraph &g)
{
    std::map<std::string, std::set<std::string>> out;
    for (const auto &e : g.edges)
        out[e.from].insert(e.to);
    return out;
}

/// @brief Last path component of a raw import specifier.
std::string importLeaf(const std::string &spec)
{
    const std::string slashed = support::toForwardSlashes(spec);
    const std::size_t pos = slashed.rfind('/');
    return pos == std::string::npos ? slashed : slashed.substr(pos + 1);
}

std::string formatPercent(double pct)
{
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%.0f", pct);
    return buf;
}
} // namespace

std::string moduleSlug(std::string_view moduleId)
{
    std::string slug(moduleId);
    std::replace(slug.begin(), slug.end(), '/', '-');
    std::replace(slug.begin(), slug.end(), '\\', '-');
    return slug;
}

bool hasMultiFileModule(const graph::AdjacencyGraph &g)
{
    return std::any_of(g.modules.begin(), g.modules.end(),
                       [](const graph::ModuleNode &m) { return m.fileCount >= 2; });
}

std::vector<rules::Invariant> detectDirectionality(const graph::AdjacencyGraph &g, double minConfidence)
{
    std::vector<rules::Invariant> out;
    const double confidence = 100.0;
    if (confidence < minConfidence)
        return out;

    for (const auto &e : g.edges)
    {
        if (e.imports.size() < 2)
            continue;
        const graph::ModuleNode *from = g.findModule(e.from);
        const graph::ModuleNode *to = g.findModule(e.to);
        if (!from || !to || from->fileCount == 0 || to->fileCount == 0)
            continue;
        if (g.findEdge(e.to, e.from))
            continue;

        rules::Invariant rule =
            makeRule("inferred-" + moduleSlug(e.to) + "-no-import-" + moduleSlug(e.from),
                     e.from + " imports from " + e.to + " but " + e.to + " never imports from " + e.from,
                     e.to + "/**", confidence);
        rule.forbiddenImports = {e.from + "/**"};
        out.push_back(std::move(rule));
    }
    return out;
}

std::vector<rules::Invariant> detectGateways(const graph::AdjacencyGraph &g, double minConfidence)
{
    // Incoming imports per target module, in first-seen order.
    std::vector<std::string> order;
    std::map<std::string, std::vector<const graph::EdgeImport *>> incoming;
    for (const auto &e : g.edges)
    {
        auto [it, inserted] = incoming.try_emplace(e.to);
        if (inserted)
            order.push_back(e.to);
        for (const auto &imp : e.imports)
            it->second.push_back(&imp);
    }

    std::vector<rules::Invariant> out;
    for (const auto &id : order)
    {
        const auto &imports = incoming[id];
        if (fileCountOf(g, id) < 2 || imports.size() < 2)
            continue;

        std::vector<std::pair<std::string, std::size_t>> leafCounts;
        for (const auto *imp : imports)
        {
            const std::string leaf = importLeaf(imp->target);
            auto it = std::find_if(leafCounts.begin(), leafCounts.end(),
                                   [&](const auto &entry) { return entry.first == leaf; });
            if (it == leafCounts.end())
                leafCounts.emplace_back(leaf, 1);
            else
                ++it->second;
        }

        // First leaf wins ties.
        auto top = leafCounts.begin();
        for (auto it = leafCounts.begin(); it != leafCounts.end(); ++it)
        {
            if (it->second > top->second)
                top = it;
        }

        const double pct = static_cast<double>(top->second) * 100.0 / static_cast<double>(imports.size());
        if (gatewayNames().count(support::stem(top->first)) == 0)
            continue;
        if (pct < 90.0)
            continue;
        const double confidence = std::round(pct * 10.0) / 10.0;
        if (confidence < minConfidence)
            continue;

        rules::Invariant rule = makeRule("inferred-" + moduleSlug(id) + "-gateway",
                                         formatPercent(pct) + "% of imports into " + id + " go through " +
                                             top->first + "; enforce gateway pattern",
                                         "**", confidence);
        rule.forbiddenImports = {id + "/**"};
        rule.allowedImports = {id + "/" + top->first};
        out.push_back(std::move(rule));
    }
    return out;
}

std::vector<rules::Invariant> detectSelfContained(const graph::AdjacencyGraph &g, double minConfidence)
{
    std::vector<rules::Invariant> out;
    const double confidence = 100.0;
    if (g.modules.size() < 3 || confidence < minConfidence)
        return out;

    const auto outgoing = outgoingTargets(g);
    for (const auto &m : g.modules)
    {
        if (m.fileCount <= 1)
            continue;
        auto it = outgoing.find(m.id);
        const std::size_t targets = it == outgoing.end() ? 0 : it->second.size();
        if (targets > 1)
            continue;

        const std::string id = "inferred-" + moduleSlug(m.id) + "-self-contained";
        if (targets == 0)
        {
            rules::Invariant rule = makeRule(id, m.id + " has no external imports; enforce self-containment",
                                             m.id + "/**", confidence);
            rule.forbiddenImports = {"**"};
            rule.allowedImports = {m.id + "/**"};
            out.push_back(std::move(rule));
            continue;
        }

        const std::string &target = *it->second.begin();
        rules::Invariant rule = makeRule(id, m.id + " only imports from " + target + "; enforce self-containment",
                                         m.id + "/**", confidence);
        rule.forbiddenImports = {"**"};
        rule.allowedImports = {m.id + "/**", target + "/**"};
        out.push_back(std::move(rule));
    }
    return out;
}

std::vector<rules::Invariant> detectSelectiveDeps(const graph::AdjacencyGraph &g, double minConfidence)
{
    std::vector<rules::Invariant> out;
    const double confidence = 100.0;
    if (g.modules.size() < 3 || confidence < minConfidence)
        return out;

    const auto outgoing = outgoingTargets(g);
    for (const auto &m : g.modules)
    {
        if (m.fileCount <= 1)
            continue;
        auto it = outgoing.find(m.id);
        if (it == outgoing.end() || it->second.size() != 2)
            continue;

        const std::vector<std::string> allowed(it->second.begin(), it->second.end());
        rules::Invariant rule =
            makeRule("inferred-" + moduleSlug(m.id) + "-selective-deps",
                     m.id + " only imports from " + allowed[0] + " and " + allowed[1] +
                         "; enforce selective dependencies",
                     m.id + "/**", confidence);
        rule.forbiddenImports = {"**"};
        rule.allowedImports = {m.id + "/**", allowed[0] + "/**", allowed[1] + "/**"};
        out.push_back(std::move(rule));
    }
    return out;
}

std::vector<rules::Invariant> deduplicateRules(std::vector<rules::Invariant> rules)
{
    std::set<std::pair<std::string, std::vector<std::string>>> seen;
    std::vector<rules::Invariant> unique;
    unique.reserve(rules.size());
    for (auto &rule : rules)
    {
        std::vector<std::string> forbidden = rule.forbiddenImports;
        std::sort(forbidden.begin(), forbidden.end());
        if (!seen.emplace(rule.sourceGlob, std::move(forbidden)).second)
            continue;
        unique.push_back(std::move(rule));
    }
    return unique;
}

std::vector<rules::Invariant> inferRules(const graph::AdjacencyGraph &g,
                                         double minConfidence,
                                         const support::Logger &log)
{
    if (!hasMultiFileModule(g))
    {
        log.info("infer", "no multi-file modules; nothing to infer");
        return {};
    }

    std::vector<rules::Invariant> all;
    auto append = [&](const char *name, std::vector<rules::Invariant> found) {
        log.debug("infer", std::string(name) + ": " + std::to_string(found.size()) + " rules");
        all.insert(all.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    };
    append("directionality", detectDirectionality(g, minConfidence));
    append("gateway", detectGateways(g, minConfidence));
    append("self-containment", detectSelfContained(g, minConfidence));
    append("selective-deps", detectSelectiveDeps(g, minConfidence));

    auto unique = deduplicateRules(std::move(all));
    log.info("infer", std::to_string(unique.size()) + " rules after deduplication");
    return unique;
}

} // namespace thymus::infer
