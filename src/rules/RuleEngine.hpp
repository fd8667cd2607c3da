//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/RuleEngine.hpp
// Purpose: Evaluate compiled invariants against one file.
//
// Key invariants:
//   - The scope check runs before any file I/O; out-of-scope pairs cost only
//     the glob match.
//   - A file missing on disk yields no violations.
//   - File contents and imports are loaded at most once per FileSubject and
//     only when a rule needs them.
//   - Pattern and dependency rules emit at most one violation per file.
//
// Ownership/Lifetime: FileSubject owns its lazily loaded buffers; it is not
// shared between threads.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "rules/CompiledInvariant.hpp"
#include "rules/Invariant.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::rules
{

/// @brief A file under evaluation, with contents and imports loaded on demand.
class FileSubject
{
  public:
    FileSubject(std::string absPath, std::string relPath);

    [[nodiscard]] const std::string &absPath() const noexcept
    {
        return absPath_;
    }

    [[nodiscard]] const std::string &relPath() const noexcept
    {
        return relPath_;
    }

    /// @brief True when the path names a regular file.
    bool exists();

    /// @brief File contents; empty when the file cannot be read.
    const std::string &content();

    /// @brief Extracted import specifiers; empty when unreadable.
    const std::vector<std::string> &imports();

  private:
    std::string absPath_;
    std::string relPath_;
    std::optional<bool> exists_;
    std::optional<std::string> content_;
    std::optional<std::vector<std::string>> imports_;
};

/// @brief Evaluate one invariant against @p file.
/// @param projectRoot Root used by the test colocation lookup.
std::vector<Violation> evaluate(FileSubject &file,
                                const CompiledInvariant &rule,
                                const std::string &projectRoot);

/// @brief Evaluate every invariant in order, concatenating the results.
std::vector<Violation> evaluateAll(FileSubject &file,
                                   const std::vector<CompiledInvariant> &rules,
                                   const std::string &projectRoot);

/// @brief One-based number of the first line of @p content matching @p re.
[[nodiscard]] std::optional<uint32_t> firstMatchingLine(std::string_view content, const std::regex &re);

} // namespace thymus::rules
