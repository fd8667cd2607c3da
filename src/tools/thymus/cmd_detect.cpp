//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `thymus detect`, which profiles the project's layout and
// dependencies and prints both as one JSON object for rule authoring.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "io/JsonCodec.hpp"
#include "scan/ProjectProfile.hpp"

#include <filesystem>
#include <iostream>

using namespace thymus;

int cmdDetect(int argc, char **argv)
{
    tools::CliOptions opts;
    if (!tools::parseCliOptions(argc, argv, opts) || !opts.positional.empty())
    {
        tools::printUsage();
        return 1;
    }
    tools::finalizeOptions(opts);
    support::Logger log(std::cerr, opts.logLevel);

    std::error_code ec;
    if (!std::filesystem::is_directory(opts.root, ec))
    {
        std::cerr << "thymus: project root is not a directory: " << opts.root << "\n";
        return 1;
    }

    io::json profile = io::structureProfileToJson(scan::profileStructure(opts.root, log));
    profile.update(io::dependencyProfileToJson(scan::profileDependencies(opts.root, log)));
    std::cout << profile.dump(2) << "\n";
    return 0;
}
