//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Module-level adjacency graph built from per-file import lists. Files are
// grouped into modules by path prefix; an edge records every cross-module
// import between two modules.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Module adjacency graph construction.
/// @details Imports that stay inside their own module never produce an edge.
///          Targets that own no scanned files are still registered as modules
///          with an empty file list so inference can recognise them.

#pragma once

#include "rules/Invariant.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace thymus::graph
{

/// @brief Imports of one project file.
struct ImportEntry
{
    std::string file;
    std::vector<std::string> imports;
};

struct ModuleNode
{
    std::string id;
    std::vector<std::string> files; ///< Sorted member files.
    std::size_t fileCount = 0;
    std::size_t violations = 0;
};

/// @brief One cross-module import: source file and the raw specifier.
struct EdgeImport
{
    std::string source;
    std::string target;
};

struct ModuleEdge
{
    std::string from;
    std::string to;
    std::vector<EdgeImport> imports; ///< In encounter order.
    bool violation = false;
    std::vector<std::string> ruleIds; ///< Sorted, distinct.
};

/// @brief Graph payload: modules sorted by id, edges sorted by (from, to).
struct AdjacencyGraph
{
    std::vector<ModuleNode> modules;
    std::vector<ModuleEdge> edges;

    /// @brief Module with @p id, or nullptr.
    [[nodiscard]] const ModuleNode *findModule(std::string_view id) const;

    /// @brief Edge from @p from to @p to, or nullptr.
    [[nodiscard]] const ModuleEdge *findEdge(std::string_view from, std::string_view to) const;
};

/// @brief Rule ids that fired on an import, keyed by (source file, resolved import).
class ViolationIndex
{
  public:
    /// @brief Record @p ruleId for @p importSpec of @p file; duplicates are ignored.
    void add(const std::string &file, const std::string &importSpec, const std::string &ruleId);

    /// @brief Index boundary violations; entries without file, import or rule are skipped.
    static ViolationIndex fromViolations(const std::vector<rules::Violation> &violations);

    /// @brief Rule ids for (@p file, @p resolved), or nullptr.
    [[nodiscard]] const std::vector<std::string> *find(const std::string &file,
                                                       const std::string &resolved) const;

    [[nodiscard]] bool empty() const noexcept
    {
        return entries_.empty();
    }

    using Key = std::pair<std::string, std::string>;

    [[nodiscard]] const std::map<Key, std::vector<std::string>> &entries() const noexcept
    {
        return entries_;
    }

  private:
    std::map<Key, std::vector<std::string>> entries_;
};

/// @brief Module id of @p path.
/// @details `a/b/c.ts` -> `a/b`, `a/c.ts` -> `a`, `c.ts` -> `c`.
[[nodiscard]] std::string moduleId(std::string_view path);

/// @brief Resolve @p importSpec against @p sourceFile when it starts with '.'.
[[nodiscard]] std::string resolveImport(std::string_view sourceFile, std::string_view importSpec);

/// @brief Build the adjacency graph for @p entries.
AdjacencyGraph buildAdjacencyGraph(const std::vector<ImportEntry> &entries,
                                   const ViolationIndex &index = {});

} // namespace thymus::graph
