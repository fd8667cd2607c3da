//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/source_location.hpp
// Purpose: Declares the lightweight location value attached to diagnostics.
// Key invariants: An empty path denotes an unknown location; line is 1-based when valid.
// Ownership/Lifetime: Value type owning a copy of the path string.
//
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace thymus::support
{

/// @brief Position inside a project file or configuration file.
/// @invariant path.empty() indicates an unknown location.
struct SourceLoc
{
    /// @brief Project-relative (or absolute) path; empty when unknown.
    std::string path;

    /// @brief One-based line number; 0 when unknown.
    uint32_t line = 0;

    /// @brief Determine whether a file path is attached.
    [[nodiscard]] bool hasFile() const
    {
        return !path.empty();
    }

    /// @brief Determine whether a 1-based line number is available.
    [[nodiscard]] bool hasLine() const
    {
        return line != 0;
    }
};

} // namespace thymus::support
