//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `thymus extract FILE...`: print the import specifiers found in
// each file. A single file prints one import per line; several files (or
// `--format json`) print the `[{file, imports}]` array the graph stage reads.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "extract/ImportExtractor.hpp"
#include "io/JsonCodec.hpp"

#include <iostream>

using namespace thymus;

int cmdExtract(int argc, char **argv)
{
    tools::CliOptions opts;
    if (!tools::parseCliOptions(argc, argv, opts) || opts.positional.empty())
    {
        tools::printUsage();
        return 1;
    }
    support::Logger log(std::cerr, opts.logLevel);

    std::vector<graph::ImportEntry> entries;
    entries.reserve(opts.positional.size());
    for (const auto &file : opts.positional)
    {
        auto imports = extract::extractImportsFromFile(file, opts.maxFileSize);
        log.debug("extract", file + ": " + std::to_string(imports.size()) + " imports");
        entries.push_back(graph::ImportEntry{file, std::move(imports)});
    }

    if (opts.format == tools::OutputFormat::Json || entries.size() > 1)
    {
        std::cout << io::importEntriesToJson(entries).dump(2) << "\n";
        return 0;
    }
    for (const auto &imp : entries.front().imports)
        std::cout << imp << "\n";
    return 0;
}
