//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements `thymus graph` and `thymus infer`. Both discover the project's
// source files, extract their imports in parallel and build the module
// adjacency graph; `infer` then proposes boundary rules from it.
//
//===----------------------------------------------------------------------===//

#include "cli.hpp"
#include "usage.hpp"

#include "graph/ModuleGraph.hpp"
#include "infer/RuleInference.hpp"
#include "io/JsonCodec.hpp"
#include "io/YamlWriter.hpp"
#include "scan/BatchScanner.hpp"
#include "scan/FileDiscovery.hpp"
#include "support/source_loader.hpp"

#include <filesystem>
#include <iostream>

using namespace thymus;

namespace
{
struct ProjectGraph
{
    std::size_t fileCount = 0;
    graph::AdjacencyGraph graph;
};

/// @brief Violation index from a scan-result file; empty when unreadable.
graph::ViolationIndex loadViolationIndex(const std::string &path, const support::Logger &log)
{
    if (path.empty())
        return {};
    auto text = support::loadSourceFile(path);
    if (!text)
    {
        log.warn("graph", text.error().message);
        return {};
    }
    auto parsed = io::parseJson(text.value(), path);
    if (!parsed)
    {
        log.warn("graph", parsed.error().message);
        return {};
    }
    auto violations = io::violationsFromJson(parsed.value());
    if (!violations)
    {
        log.warn("graph", path + ": " + violations.error().message);
        return {};
    }
    return graph::ViolationIndex::fromViolations(violations.value());
}

ProjectGraph buildProjectGraph(const tools::CliOptions &opts, const support::Logger &log)
{
    ProjectGraph result;
    const auto files = scan::findSourceFiles(opts.root, {}, log);
    result.fileCount = files.size();

    scan::ScanOptions scanOpts;
    scanOpts.root = opts.root;
    scanOpts.jobs = opts.jobs;
    scanOpts.maxFileSize = opts.maxFileSize;
    const scan::BatchScanner scanner({}, scanOpts, log);
    const auto entries = scanner.collectImports(files);

    result.graph = graph::buildAdjacencyGraph(entries, loadViolationIndex(opts.violationsPath, log));
    log.info("graph", std::to_string(result.graph.modules.size()) + " modules, " +
                          std::to_string(result.graph.edges.size()) + " edges");
    return result;
}

bool parseGraphOptions(int argc, char **argv, tools::CliOptions &opts)
{
    if (!tools::parseCliOptions(argc, argv, opts) || !opts.positional.empty())
    {
        tools::printUsage();
        return false;
    }
    tools::finalizeOptions(opts);
    return true;
}
} // namespace

int cmdGraph(int argc, char **argv)
{
    tools::CliOptions opts;
    if (!parseGraphOptions(argc, argv, opts))
        return 1;
    support::Logger log(std::cerr, opts.logLevel);

    const ProjectGraph project = buildProjectGraph(opts, log);
    std::cout << io::adjacencyGraphToJson(project.graph).dump(2) << "\n";
    return 0;
}

int cmdInfer(int argc, char **argv)
{
    tools::CliOptions opts;
    if (!parseGraphOptions(argc, argv, opts))
        return 1;
    support::Logger log(std::cerr, opts.logLevel);

    std::error_code ec;
    if (opts.apply && !std::filesystem::is_regular_file(opts.config, ec))
    {
        std::cerr << "thymus: --apply requires an existing invariant file: " << opts.config << "\n";
        return 1;
    }

    const ProjectGraph project = buildProjectGraph(opts, log);
    if (project.fileCount == 0)
    {
        std::cout << "# No source files found to analyze\n";
        return 0;
    }

    std::vector<rules::Invariant> inferred;
    std::string emptyReason = "No multi-file modules found; nothing to infer";
    if (infer::hasMultiFileModule(project.graph))
    {
        inferred = infer::inferRules(project.graph, opts.minConfidence, log);
        emptyReason = "No rules inferred at this confidence level";
    }

    if (opts.format == tools::OutputFormat::Json)
    {
        io::json list = io::json::array();
        for (const auto &rule : inferred)
            list.push_back(io::invariantToJson(rule));
        std::cout << list.dump(2) << "\n";
    }

    if (opts.apply)
    {
        if (inferred.empty())
        {
            std::cout << "# No rules inferred above confidence threshold; nothing to apply\n";
            return 0;
        }
        auto applied = io::appendRulesToFile(opts.config, inferred);
        if (!applied)
        {
            support::printDiag(applied.error(), std::cerr);
            return 1;
        }
        log.info("infer", "appended " + std::to_string(inferred.size()) + " rules to " + opts.config);
    }

    if (opts.format != tools::OutputFormat::Json)
        std::cout << io::renderInferredRules(inferred, opts.minConfidence, emptyReason);
    return 0;
}
