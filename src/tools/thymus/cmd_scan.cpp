//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `thymus scan`: evaluate every invariant against the project (or
// a scope directory, or the files changed against HEAD) and print the scan
// result as JSON.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "io/JsonCodec.hpp"
#include "rules/CompiledInvariant.hpp"
#include "scan/BatchScanner.hpp"
#include "scan/FileDiscovery.hpp"
#include "support/diagnostics.hpp"

#include <iostream>

using namespace thymus;

/// @brief Entry point for `thymus scan [SCOPE]`.
/// @details Configuration errors are reported inside the JSON payload and the
///          command still exits with status 0.
int cmdScan(int argc, char **argv)
{
    tools::CliOptions opts;
    if (!tools::parseCliOptions(argc, argv, opts) || opts.positional.size() > 1)
    {
        tools::printUsage();
        return 1;
    }
    tools::finalizeOptions(opts);
    support::Logger log(std::cerr, opts.logLevel);

    const std::string scope = opts.positional.empty() ? std::string()
                                                      : scan::normalizeScope(opts.positional.front(), opts.root);
    log.debug("scan", "scope=" + (scope.empty() ? std::string("full") : scope) + (opts.diff ? " diff" : ""));

    auto invariants = tools::loadInvariants(opts, log);
    if (!invariants)
    {
        std::cout << io::scanErrorToJson(invariants.error().message).dump() << "\n";
        return 0;
    }

    support::DiagnosticEngine diags;
    auto compiled = rules::compileInvariants(invariants.value(), diags, log);
    diags.printAll(std::cerr);

    std::vector<std::string> files;
    if (opts.diff)
    {
        auto changed = scan::changedFiles(opts.root, scope, log);
        if (changed)
            files = std::move(changed.value());
        else
            log.warn("scan", changed.error().message);
    }
    else
    {
        files = scan::findSourceFiles(opts.root, scope, log);
    }

    scan::ScanOptions scanOpts;
    scanOpts.root = opts.root;
    scanOpts.scope = scope;
    scanOpts.jobs = opts.jobs;
    scanOpts.maxFileSize = opts.maxFileSize;

    const scan::BatchScanner scanner(std::move(compiled), scanOpts, log);
    const scan::ScanResult result = scanner.scan(files);
    std::cout << io::scanResultToJson(result).dump() << "\n";
    return 0;
}
