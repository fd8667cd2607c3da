//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: scan/BatchScanner.hpp
// Purpose: Evaluate every invariant against a set of project files.
//
// Key invariants:
//   - Violations are grouped by file in input order, then by invariant order,
//     regardless of how many worker threads ran.
//   - Missing files and files above the size cap yield nothing.
//   - `filesChecked` counts candidate paths, skipped ones included.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "graph/ModuleGraph.hpp"
#include "rules/CompiledInvariant.hpp"
#include "rules/Invariant.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace thymus::support
{
class Logger;
} // namespace thymus::support

namespace thymus::scan
{

inline constexpr std::uintmax_t kDefaultMaxFileSize = 512000;

struct ScanStats
{
    std::size_t total = 0;
    std::size_t errors = 0;
    std::size_t warnings = 0;
};

struct ScanResult
{
    std::string scope;
    std::size_t filesChecked = 0;
    std::vector<rules::Violation> violations;
    ScanStats stats;
};

struct ScanOptions
{
    std::string root;                                ///< Project root directory.
    std::string scope;                               ///< Reported scope label.
    unsigned jobs = 0;                               ///< 0 = hardware concurrency.
    std::uintmax_t maxFileSize = kDefaultMaxFileSize; ///< 0 disables the cap.
};

/// @brief Count violations by severity.
[[nodiscard]] ScanStats computeStats(const std::vector<rules::Violation> &violations);

/// @brief True when @p absPath exceeds @p maxFileSize (0 = no cap).
[[nodiscard]] bool exceedsSizeCap(const std::string &absPath, std::uintmax_t maxFileSize);

class BatchScanner
{
  public:
    BatchScanner(std::vector<rules::CompiledInvariant> rules, ScanOptions opts, const support::Logger &log);

    /// @brief Scan project-relative @p files.
    ScanResult scan(const std::vector<std::string> &files) const;

    /// @brief Violations for one project-relative file.
    std::vector<rules::Violation> scanFile(const std::string &relPath) const;

    /// @brief Violations for the file at @p absPath, reported as @p relPath.
    std::vector<rules::Violation> evaluateFile(const std::string &absPath, const std::string &relPath) const;

    /// @brief Import entries for the graph stage; missing files are skipped.
    std::vector<graph::ImportEntry> collectImports(const std::vector<std::string> &files) const;

  private:
    std::vector<rules::CompiledInvariant> rules_;
    ScanOptions opts_;
    const support::Logger &log_;
};

} // namespace thymus::scan
