//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
/// @file
/// @brief Implements module grouping, import resolution and edge accumulation.
/// @details Modules and edges are gathered in ordered maps so the output is
///          sorted without a separate pass and never depends on input order
///          beyond the per-edge import list.
//
//===----------------------------------------------------------------------===//

#include "graph/ModuleGraph.hpp"

#include "support/path_utils.hpp"

#include <algorithm>
#include <set>

namespace thymus::graph
{

const ModuleNode *AdjacencyGraph::findModule(std::string_view id) const
{
    auto it = std::lower_bound(modules.begin(), modules.end(), id,
                               [](const ModuleNode &m, std::string_view key) { return m.id < key; });
    if (it == modules.end() || it->id != id)
        return nullptr;
    return &*it;
}

const ModuleEdge *AdjacencyGraph::findEdge(std::string_view from, std::string_view to) const
{
    for (const auto &e : edges)
    {
        if (e.from == from && e.to == to)
            return &e;
    }
    return nullptr;
}

void ViolationIndex::add(const std::string &file, const std::string &importSpec, const std::string &ruleId)
{
    auto &ids = entries_[Key{file, resolveImport(file, importSpec)}];
    if (std::find(ids.begin(), ids.end(), ruleId) == ids.end())
        ids.push_back(ruleId);
}

ViolationIndex ViolationIndex::fromViolations(const std::vector<rules::Violation> &violations)
{
    ViolationIndex index;
    for (const auto &v : violations)
    {
        if (!v.importSpec || v.importSpec->empty() || v.file.empty() || v.rule.empty())
            continue;
        index.add(v.file, *v.importSpec, v.rule);
    }
    return index;
}

const std::vector<std::string> *ViolationIndex::find(const std::string &file, const std::string &resolved) const
{
    auto it = entries_.find(Key{file, resolved});
    return it == entries_.end() ? nullptr : &it->second;
}

std::string moduleId(std::string_view path)
{
    const std::string p = support::toForwardSlashes(path);
    std::vector<std::string_view> parts;
    std::string_view rest(p);
    for (;;)
    {
        const std::size_t slash = rest.find('/');
        parts.push_back(rest.substr(0, slash));
        if (slash == std::string_view::npos)
            break;
        rest.remove_prefix(slash + 1);
    }

    if (parts.size() >= 3)
        return std::string(parts[0]) + "/" + std::string(parts[1]);
    if (parts.size() == 2)
        return std::string(parts[0]);
    return support::stem(parts[0]);
}

std::string resolveImport(std::string_view sourceFile, std::string_view importSpec)
{
    return support::resolveRelativeImport(sourceFile, importSpec);
}

AdjacencyGraph buildAdjacencyGraph(const std::vector<ImportEntry> &entries, const ViolationIndex &index)
{
    using EdgeKey = std::pair<std::string, std::string>;

    std::map<std::string, std::set<std::string>> moduleFiles;
    std::map<EdgeKey, ModuleEdge> edges;
    std::map<EdgeKey, std::set<std::string>> edgeRules;

    for (const auto &entry : entries)
    {
        if (entry.file.empty())
            continue;
        const std::string from = moduleId(entry.file);
        moduleFiles[from].insert(entry.file);

        for (const auto &imp : entry.imports)
        {
            if (imp.empty())
                continue;
            const std::string resolved = resolveImport(entry.file, imp);
            const std::string to = moduleId(resolved);
            if (to == from)
                continue;
            moduleFiles[to];

            const EdgeKey key{from, to};
            ModuleEdge &edge = edges[key];
            edge.imports.push_back(EdgeImport{entry.file, imp});

            if (const auto *ids = index.find(entry.file, resolved))
                edgeRules[key].insert(ids->begin(), ids->end());
        }
    }

    std::map<std::string, std::size_t> moduleViolations;
    for (const auto &[key, ids] : index.entries())
        moduleViolations[moduleId(key.first)] += ids.size();

    AdjacencyGraph g;
    g.modules.reserve(moduleFiles.size());
    for (auto &[id, files] : moduleFiles)
    {
        ModuleNode node;
        node.id = id;
        node.files.assign(files.begin(), files.end());
        node.fileCount = node.files.size();
        auto it = moduleViolations.find(id);
        node.violations = it == moduleViolations.end() ? 0 : it->second;
        g.modules.push_back(std::move(node));
    }

    g.edges.reserve(edges.size());
    for (auto &[key, edge] : edges)
    {
        edge.from = key.first;
        edge.to = key.second;
        auto rit = edgeRules.find(key);
        if (rit != edgeRules.end())
            edge.ruleIds.assign(rit->second.begin(), rit->second.end());
        edge.violation = !edge.ruleIds.empty();
        g.edges.push_back(std::move(edge));
    }
    return g;
}

} // namespace thymus::graph
