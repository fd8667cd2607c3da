//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: support/diagnostics.hpp
// Purpose: Declares diagnostic engine for configuration and rule errors.
// Key invariants: Counts reflect reported diagnostics.
// Ownership/Lifetime: Engine owns collected diagnostics.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "support/source_location.hpp"
#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace thymus::support
{

/// @brief Severity levels for diagnostics.
enum class Severity
{
    Note,
    Warning,
    Error
};

/// @brief Single diagnostic message with location.
struct Diagnostic
{
    Severity severity;   ///< Message severity
    std::string message; ///< Human-readable text
    SourceLoc loc;       ///< Optional source location
};

/// @brief Collects diagnostics and prints them in order.
class DiagnosticEngine
{
  public:
    /// @brief Record diagnostic @p d.
    void report(Diagnostic d);

    /// @brief Print all recorded diagnostics to stream @p os.
    void printAll(std::ostream &os) const;

    /// @brief Recorded diagnostics in report order.
    [[nodiscard]] const std::vector<Diagnostic> &diagnostics() const
    {
        return diags_;
    }

    /// @brief Number of errors reported.
    size_t errorCount() const;

    /// @brief Number of warnings reported.
    size_t warningCount() const;

  private:
    std::vector<Diagnostic> diags_;
    size_t errors_ = 0;
    size_t warnings_ = 0;
};

} // namespace thymus::support
