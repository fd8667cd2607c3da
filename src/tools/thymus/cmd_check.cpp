//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `thymus check FILE`: evaluate every invariant against a single
// file, typically one that was just edited, and print one line per violation.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "rules/CompiledInvariant.hpp"
#include "scan/BatchScanner.hpp"
#include "scan/FileDiscovery.hpp"
#include "support/diagnostics.hpp"
#include "support/path_utils.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>

using namespace thymus;

namespace
{
/// @brief `[ERROR] rule-id: message (import: X)`.
std::string formatViolation(const rules::Violation &v)
{
    std::string sev = rules::severityName(v.severity);
    std::transform(sev.begin(), sev.end(), sev.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    std::string line = "[" + sev + "] " + v.rule + ": " + v.message;
    if (v.importSpec)
        line += " (import: " + *v.importSpec + ")";
    else if (v.line)
        line += " (line " + std::to_string(*v.line) + ")";
    else if (v.package)
        line += " (package: " + *v.package + ")";
    return line;
}
} // namespace

/// @brief Entry point for `thymus check FILE`.
/// @return 1 when an error-severity violation was found, 0 otherwise.
int cmdCheck(int argc, char **argv)
{
    tools::CliOptions opts;
    if (!tools::parseCliOptions(argc, argv, opts) || opts.positional.size() != 1)
    {
        tools::printUsage();
        return 1;
    }
    tools::finalizeOptions(opts);
    support::Logger log(std::cerr, opts.logLevel);

    namespace fs = std::filesystem;
    std::error_code ec;
    const fs::path target = fs::absolute(opts.positional.front(), ec);
    if (ec)
    {
        log.error("check", "cannot resolve " + opts.positional.front() + ": " + ec.message());
        return 0;
    }
    const std::string absPath = support::normalizePath(target.generic_string());

    if (fs::is_symlink(target, ec))
    {
        log.info("check", "skipping symlink " + absPath);
        return 0;
    }
    if (fs::is_regular_file(target, ec))
    {
        if (scan::isLikelyBinary(absPath))
        {
            log.info("check", "skipping binary file " + absPath);
            return 0;
        }
        if (scan::exceedsSizeCap(absPath, opts.maxFileSize))
        {
            log.info("check", "skipping large file " + absPath);
            return 0;
        }
    }

    std::string relPath = support::relativeTo(absPath, opts.root);
    if (relPath.empty() || relPath == ".")
        relPath = support::fileName(absPath);

    auto invariants = tools::loadInvariants(opts, log);
    if (!invariants)
    {
        support::printDiag(invariants.error(), std::cerr);
        return 0;
    }

    support::DiagnosticEngine diags;
    auto compiled = rules::compileInvariants(invariants.value(), diags, log);
    diags.printAll(std::cerr);

    scan::ScanOptions scanOpts;
    scanOpts.root = opts.root;
    scanOpts.jobs = 1;
    scanOpts.maxFileSize = opts.maxFileSize;
    const scan::BatchScanner scanner(std::move(compiled), scanOpts, log);
    const auto violations = scanner.evaluateFile(absPath, relPath);
    if (violations.empty())
        return 0;

    std::cout << "thymus: " << violations.size() << " violation(s) in " << relPath << "\n";
    bool hasError = false;
    for (const auto &v : violations)
    {
        std::cout << "  " << formatViolation(v) << "\n";
        hasError = hasError || v.severity == rules::Severity::Error;
    }
    return hasError ? 1 : 0;
}
