//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/run_process.hpp
// Purpose: Declare the subprocess helper used for diff-mode file listing.
// Key invariants: RunResult captures the exit code and stdout text; stderr is
// kept separate so it never pollutes parsed output.
// Ownership/Lifetime: Callers own argument buffers; helper copies command text.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <optional>
#include <string>
#include <vector>

namespace thymus::support
{

/// @brief Result of launching a subprocess.
struct RunResult
{
    int exitCode = 0; ///< Process exit code, or -1 on launch failure.
    std::string out;  ///< Captured standard output text.
};

/// @brief Spawn a subprocess using the provided argument vector.
/// @param argv Command-line arguments including the executable at index zero.
/// @param cwd Optional working directory for the child.
/// @return Captured process result including exit code and stdout.
RunResult runProcess(const std::vector<std::string> &argv,
                     const std::optional<std::string> &cwd = std::nullopt);

/// @brief Quote @p arg for a POSIX shell command line.
[[nodiscard]] std::string quoteShellArgument(const std::string &arg);

} // namespace thymus::support
