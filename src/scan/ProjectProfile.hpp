//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: scan/ProjectProfile.hpp
// Purpose: Describe a project's layout and dependencies for rule authoring.
//
// The structure profile records directories, conventional layer names,
// compound file suffixes, untested source files and per-directory file
// counts. The dependency profile detects the language and framework from
// manifest files and summarizes external packages, the most imported
// internal paths and imports between top-level modules.
//
// Key invariants:
//   - Ignored directories are never descended into.
//   - Every list is deterministic: sorted, or ranked by count with ties in
//     ascending name order.
//   - Unreadable or malformed manifests contribute nothing; profiling never
//     fails.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::support
{
class Logger;
} // namespace thymus::support

namespace thymus::scan
{

struct DirectoryFileCount
{
    std::string dir;
    std::size_t count = 0;
};

struct StructureProfile
{
    /// Project-relative directories at most three levels deep, sorted.
    std::vector<std::string> rawStructure;

    /// Known layer names found as directory names, in catalogue order.
    std::vector<std::string> detectedLayers;

    /// Most frequent compound suffixes of source files (".service.ts"), at most 20.
    std::vector<std::string> namingPatterns;

    /// Source files without a colocated test, sorted.
    std::vector<std::string> testGaps;

    /// Files under each top-level directory, sorted by directory.
    std::vector<DirectoryFileCount> fileCounts;
};

struct ImportCount
{
    std::string path;
    std::size_t count = 0;
};

/// @brief One top-level module importing another.
struct ModuleLink
{
    std::string from;
    std::string to;

    bool operator<(const ModuleLink &other) const
    {
        return from != other.from ? from < other.from : to < other.to;
    }

    bool operator==(const ModuleLink &other) const
    {
        return from == other.from && to == other.to;
    }
};

struct DependencyProfile
{
    std::string language = "unknown";
    std::string framework = "unknown";
    std::vector<std::string> externalDeps;
    std::vector<ImportCount> importFrequency;
    std::vector<ModuleLink> crossModuleImports;
};

/// @brief Conventional layer directory names, in reporting order.
[[nodiscard]] const std::vector<std::string_view> &knownLayers();

/// @brief Walk @p root once and compute its structure profile.
StructureProfile profileStructure(const std::string &root, const support::Logger &log);

/// @brief Primary language from the manifest files at @p root ("unknown" when none).
[[nodiscard]] std::string detectLanguage(const std::string &root);

/// @brief Framework named by the manifests of a @p language project ("unknown" when none).
[[nodiscard]] std::string detectFramework(const std::string &root, std::string_view language);

/// @brief Package names declared in the manifest of a @p language project.
[[nodiscard]] std::vector<std::string> externalDependencies(const std::string &root, std::string_view language);

/// @brief The 20 most imported internal paths of a @p language project.
std::vector<ImportCount> importFrequency(const std::string &root, std::string_view language,
                                         const support::Logger &log);

/// @brief Pairs of top-level modules where the first imports the second.
std::vector<ModuleLink> crossModuleImports(const std::string &root, std::string_view language,
                                           const support::Logger &log);

/// @brief Run every dependency detector over @p root.
DependencyProfile profileDependencies(const std::string &root, const support::Logger &log);

} // namespace thymus::scan
