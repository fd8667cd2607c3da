//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: scan/BatchScanner.cpp
// Purpose: Parallel per-file rule evaluation and import collection.
//
//===----------------------------------------------------------------------===//

#include "scan/BatchScanner.hpp"

#include "extract/ImportExtractor.hpp"
#include "rules/RuleEngine.hpp"
#include "support/logger.hpp"
#include "support/path_utils.hpp"
#include "support/worker_pool.hpp"

#include <filesystem>
#include <optional>

namespace thymus::scan
{

ScanStats computeStats(const std::vector<rules::Violation> &violations)
{
    ScanStats stats;
    stats.total = violations.size();
    for (const auto &v : violations)
    {
        if (v.severity == rules::Severity::Error)
            ++stats.errors;
        else if (v.severity == rules::Severity::Warning)
            ++stats.warnings;
    }
    return stats;
}

bool exceedsSizeCap(const std::string &absPath, std::uintmax_t maxFileSize)
{
    if (maxFileSize == 0)
        return false;
    std::error_code ec;
    const std::uintmax_t size = std::filesystem::file_size(absPath, ec);
    return !ec && size > maxFileSize;
}

BatchScanner::BatchScanner(std::vector<rules::CompiledInvariant> rules, ScanOptions opts, const support::Logger &log)
    : rules_(std::move(rules)), opts_(std::move(opts)), log_(log)
{
}

std::vector<rules::Violation> BatchScanner::scanFile(const std::string &relPath) const
{
    if (relPath.empty())
        return {};
    return evaluateFile(support::joinPath(opts_.root, relPath), relPath);
}

std::vector<rules::Violation> BatchScanner::evaluateFile(const std::string &absPath, const std::string &relPath) const
{
    rules::FileSubject subject(absPath, relPath);
    if (!subject.exists())
    {
        log_.debug("scan", "skipping missing file " + relPath);
        return {};
    }
    if (exceedsSizeCap(subject.absPath(), opts_.maxFileSize))
    {
        log_.info("scan", "skipping " + relPath + ": larger than " + std::to_string(opts_.maxFileSize) + " bytes");
        return {};
    }
    return rules::evaluateAll(subject, rules_, opts_.root);
}

ScanResult BatchScanner::scan(const std::vector<std::string> &files) const
{
    ScanResult result;
    result.scope = opts_.scope;
    result.filesChecked = files.size();
    log_.info("scan", "checking " + std::to_string(files.size()) + " files against " +
                          std::to_string(rules_.size()) + " invariants");

    const support::WorkerPool pool(opts_.jobs);
    auto perFile = pool.map(files, [this](const std::string &rel) { return scanFile(rel); });
    for (auto &found : perFile)
    {
        result.violations.insert(result.violations.end(), std::make_move_iterator(found.begin()),
                                 std::make_move_iterator(found.end()));
    }
    result.stats = computeStats(result.violations);
    return result;
}

std::vector<graph::ImportEntry> BatchScanner::collectImports(const std::vector<std::string> &files) const
{
    const support::WorkerPool pool(opts_.jobs);
    auto perFile = pool.map(files, [this](const std::string &rel) -> std::optional<graph::ImportEntry> {
        if (rel.empty())
            return std::nullopt;
        rules::FileSubject subject(support::joinPath(opts_.root, rel), rel);
        if (!subject.exists())
            return std::nullopt;
        if (exceedsSizeCap(subject.absPath(), opts_.maxFileSize))
            return graph::ImportEntry{rel, {}};
        return graph::ImportEntry{rel, subject.imports()};
    });

    std::vector<graph::ImportEntry> entries;
    entries.reserve(perFile.size());
    for (auto &entry : perFile)
    {
        if (entry)
            entries.push_back(std::move(*entry));
    }
    return entries;
}

} // namespace thymus::scan
