//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the diagnostic-oriented Expected helpers used across the support
// library: the Expected<void> members, severity-to-string mapping, and the
// printer shared by the driver and the diagnostic engine.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Supplies the `Expected<void>` helpers specialized for diagnostics.

#include "support/diag_expected.hpp"

namespace thymus::support
{
/// @brief Construct an Expected<void> that stores a diagnostic error state.
/// @param diag Diagnostic to transfer into the error payload.
Expected<void>::Expected(Diag diag) : error_(std::move(diag))
{
}

/// @brief Report whether the Expected<void> represents a successful outcome.
/// @return True if the instance holds no diagnostic (success), otherwise false.
bool Expected<void>::hasValue() const
{
    return !error_.has_value();
}

/// @brief Allow Expected<void> to participate directly in boolean tests.
Expected<void>::operator bool() const
{
    return hasValue();
}

/// @brief Access the diagnostic that describes the recorded failure.
/// @details Callers must ensure the `Expected` represents an error before
///          invoking this accessor.
const Diag &Expected<void>::error() const &
{
    return *error_;
}

namespace
{
/// @brief Map a diagnostic severity to a lowercase string used for printing.
const char *diagSeverityName(Severity severity)
{
    switch (severity)
    {
        case Severity::Note:
            return "note";
        case Severity::Warning:
            return "warning";
        case Severity::Error:
            return "error";
    }
    return "";
}
} // namespace

Diag makeError(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Error, std::move(msg), std::move(loc)};
}

Diag makeError(std::string msg)
{
    return Diag{Severity::Error, std::move(msg), {}};
}

Diag makeWarning(SourceLoc loc, std::string msg)
{
    return Diag{Severity::Warning, std::move(msg), std::move(loc)};
}

/// @brief Print a diagnostic to the provided output stream.
///
/// @details When a location is available the message is prefixed with
///          "<path>:<line>:" following the common compiler diagnostic style.
///          The function always emits a trailing newline so multiple
///          diagnostics appear as a contiguous block.
///
/// @param diag Diagnostic to render.
/// @param os Output stream receiving the textual representation.
void printDiag(const Diag &diag, std::ostream &os)
{
    if (diag.loc.hasFile())
    {
        os << diag.loc.path;
        if (diag.loc.hasLine())
            os << ':' << diag.loc.line;
        os << ": ";
    }
    os << diagSeverityName(diag.severity) << ": " << diag.message << '\n';
}
} // namespace thymus::support
