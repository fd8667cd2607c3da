//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: scan/FileDiscovery.hpp
// Purpose: Enumerate the project files a scan or graph build visits.
//
// Key invariants:
//   - Returned paths are relative to the project root, use '/' and are sorted.
//   - Ignored directories are pruned, never descended into.
//   - Diff-mode lists come from git and may name deleted files.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace thymus::support
{
class Logger;
} // namespace thymus::support

namespace thymus::scan
{

/// @brief Directory names skipped during the walk.
[[nodiscard]] const std::vector<std::string_view> &ignoredDirectories();

[[nodiscard]] bool isIgnoredDirectory(std::string_view name);

/// @brief True when @p path ends in one of the extractor's source extensions.
[[nodiscard]] bool hasSourceExtension(std::string_view path);

/// @brief True for known binary extensions, or when the first 512 bytes hold a NUL.
[[nodiscard]] bool isLikelyBinary(const std::string &path);

/// @brief Scope argument made relative to @p root, without trailing '/'.
[[nodiscard]] std::string normalizeScope(std::string_view scope, std::string_view root);

/// @brief Walk @p root (or its @p scope sub-directory) for source files.
std::vector<std::string> findSourceFiles(const std::string &root,
                                         const std::string &scope,
                                         const support::Logger &log);

/// @brief Files changed against HEAD, filtered by @p scope prefix.
support::Expected<std::vector<std::string>> changedFiles(const std::string &root,
                                                         const std::string &scope,
                                                         const support::Logger &log);

} // namespace thymus::scan
