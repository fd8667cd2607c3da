//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/TestColocation.hpp
// Purpose: Decide whether a source file has a colocated test.
//
// Key invariants:
//   - Files outside the checked extension set, and files that are tests
//     themselves, always count as tested.
//   - Lookups touch only the file system; nothing is cached between calls.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <string>
#include <string_view>

namespace thymus::rules
{

/// @brief True when @p relPath names a test file by its naming convention.
[[nodiscard]] bool isTestFile(std::string_view relPath);

/// @brief True when @p relPath is a source file subject to the colocation check.
[[nodiscard]] bool needsColocatedTest(std::string_view relPath);

/// @brief Look for a test belonging to the source file at @p absPath.
/// @param absPath Absolute path of the source file.
/// @param relPath Project-relative path (used for naming checks).
/// @param projectRoot Root used for the Rust `tests/` directory lookup.
[[nodiscard]] bool hasColocatedTest(const std::string &absPath,
                                    std::string_view relPath,
                                    const std::string &projectRoot);

} // namespace thymus::rules
