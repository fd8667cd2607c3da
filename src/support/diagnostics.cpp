/**
 * @file diagnostics.cpp
 * @brief Implements the diagnostic engine responsible for collecting messages.
 * @copyright
 *     GNU GPL v3. See the LICENSE file in the project root for full terms.
 * @details
 *     Configuration loading and rule compilation report per-record problems
 *     here instead of aborting.  Diagnostics are stored until the driver
 *     prints or inspects them.
 */

#include "support/diagnostics.hpp"
#include "support/diag_expected.hpp"

namespace thymus::support
{
/**
 * @brief Adds a diagnostic to the engine and updates severity counters.
 *
 * Notes leave both counters unchanged.
 *
 * @param d Diagnostic to record; moved into the engine's storage.
 */
void DiagnosticEngine::report(Diagnostic d)
{
    if (d.severity == Severity::Error)
        ++errors_;
    else if (d.severity == Severity::Warning)
        ++warnings_;
    diags_.push_back(std::move(d));
}

/**
 * @brief Writes all stored diagnostics to the provided output stream.
 *
 * Formatting is delegated to `printDiag` so engine output and one-off error
 * reports look identical.
 *
 * @param os Output stream that receives the formatted diagnostics.
 */
void DiagnosticEngine::printAll(std::ostream &os) const
{
    for (const auto &d : diags_)
    {
        printDiag(d, os);
    }
}

size_t DiagnosticEngine::errorCount() const
{
    return errors_;
}

size_t DiagnosticEngine::warningCount() const
{
    return warnings_;
}
} // namespace thymus::support
