//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/InvariantLoader.hpp
// Purpose: Load the invariant file (YAML) with a JSON cache keyed by mtime.
//
// Key invariants:
//   - A missing file or a YAML syntax error is an error result.
//   - A record failing schema validation is skipped with a warning
//     diagnostic; the other records still load.
//   - The cache is read only while it is newer than the YAML file; a corrupt
//     cache falls back to parsing and cache write failures are only logged.
//   - A file with skipped records is not cached, so every load repeats its
//     warnings.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "rules/Invariant.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <vector>

namespace thymus::support
{
class DiagnosticEngine;
class Logger;
} // namespace thymus::support

namespace thymus::rules
{

/// @brief `<root>/.thymus/invariants.yml`.
[[nodiscard]] std::string defaultInvariantsPath(const std::string &root);

/// @brief `<root>/.thymus/cache/invariants.json`.
[[nodiscard]] std::string defaultCachePath(const std::string &root);

/// @brief Parse invariant records from YAML @p text.
/// @param sourceName Path used in diagnostics.
support::Expected<std::vector<Invariant>> parseInvariantsYaml(const std::string &text,
                                                              const std::string &sourceName,
                                                              support::DiagnosticEngine &diags);

class InvariantLoader
{
  public:
    InvariantLoader(std::string yamlPath, std::string cachePath, const support::Logger &log);

    /// @brief Load invariants, preferring a fresh cache.
    support::Expected<std::vector<Invariant>> load(support::DiagnosticEngine &diags) const;

    [[nodiscard]] const std::string &yamlPath() const noexcept
    {
        return yamlPath_;
    }

  private:
    bool cacheIsFresh() const;
    bool readCache(std::vector<Invariant> &out) const;
    void writeCache(const std::vector<Invariant> &invariants) const;

    std::string yamlPath_;
    std::string cachePath_;
    const support::Logger &log_;
};

} // namespace thymus::rules
