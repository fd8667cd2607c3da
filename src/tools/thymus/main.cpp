//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements the top-level `thymus` driver. The executable dispatches to
// subcommands that scan a project, check a single file, extract imports, or
// build the module graph and infer rules from it, or profile the project.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Entry point for the `thymus` CLI tool.

#include "cli.hpp"
#include "usage.hpp"

#include <string_view>

/// @brief Program entry for the `thymus` command-line tool.
/// @return Exit status of the selected subcommand, or `1` on usage errors.
int main(int argc, char **argv)
{
    if (argc < 2)
    {
        thymus::tools::printUsage();
        return 1;
    }
    const std::string_view cmd = argv[1];
    if (cmd == "--version")
    {
        thymus::tools::printVersion();
        return 0;
    }
    if (cmd == "-h" || cmd == "--help")
    {
        thymus::tools::printUsage();
        return 0;
    }
    if (cmd == "scan")
        return cmdScan(argc - 2, argv + 2);
    if (cmd == "check")
        return cmdCheck(argc - 2, argv + 2);
    if (cmd == "extract")
        return cmdExtract(argc - 2, argv + 2);
    if (cmd == "graph")
        return cmdGraph(argc - 2, argv + 2);
    if (cmd == "infer")
        return cmdInfer(argc - 2, argv + 2);
    if (cmd == "detect")
        return cmdDetect(argc - 2, argv + 2);
    thymus::tools::printUsage();
    return 1;
}
