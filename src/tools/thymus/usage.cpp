//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements help text and version information for the thymus tool.
//
//===----------------------------------------------------------------------===//

#include "usage.hpp"

#include "thymus/version.hpp"

#include <iostream>

namespace thymus::tools
{

void printVersion()
{
    std::cout << "thymus v" << THYMUS_VERSION_STR << "\n";
    std::cout << "Architectural invariant checker\n";
}

void printUsage()
{
    std::cerr << "thymus v" << THYMUS_VERSION_STR << " - architectural invariant checker\n"
              << "\n"
              << "Usage: thymus <command> [options] [args]\n"
              << "\n"
              << "Commands:\n"
              << "  scan [SCOPE]          Check every source file (or those under SCOPE)\n"
              << "  check FILE            Check one file and print its violations\n"
              << "  extract FILE...       Print the imports of each file\n"
              << "  graph                 Print the module adjacency graph as JSON\n"
              << "  infer                 Propose boundary rules from the import graph\n"
              << "  detect                Print the project structure and dependency profile as JSON\n"
              << "\n"
              << "Options:\n"
              << "  --root DIR                   Project root (default: current directory)\n"
              << "  --config FILE                Invariant file (default: .thymus/invariants.yml)\n"
              << "  --jobs N                     Worker threads (default: hardware concurrency)\n"
              << "  --max-file-size BYTES        Skip larger files; 0 disables (default: 512000)\n"
              << "  --log-level LEVEL            debug, info, warn, error or off (env: THYMUS_LOG)\n"
              << "  --diff                       scan: only files changed against HEAD\n"
              << "  --violations FILE            graph/infer: annotate edges from a scan result\n"
              << "  --min-confidence N           infer: confidence threshold 0-100 (default: 90)\n"
              << "  --apply                      infer: append rules to the invariant file\n"
              << "  --format json|yaml           Output format for extract and infer\n"
              << "  -h, --help                   Show this help message\n"
              << "  --version                    Show version information\n";
}

} // namespace thymus::tools
