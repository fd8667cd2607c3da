//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: scan/FileDiscovery.cpp
// Purpose: Directory walk and git diff listing.
//
//===----------------------------------------------------------------------===//

#include "scan/FileDiscovery.hpp"

#include "extract/CharUtils.hpp"
#include "extract/Language.hpp"
#include "support/logger.hpp"
#include "support/path_utils.hpp"
#include "support/run_process.hpp"
#include "support/source_loader.hpp"

#include <algorithm>
#include <filesystem>

namespace thymus::scan
{

namespace fs = std::filesystem;

const std::vector<std::string_view> &ignoredDirectories()
{
    static const std::vector<std::string_view> kDirs = {
        "node_modules", "dist", ".next", ".git", "coverage", "__pycache__",
        ".venv", "vendor", "target", "build", ".thymus",
    };
    return kDirs;
}

bool isIgnoredDirectory(std::string_view name)
{
    const auto &dirs = ignoredDirectories();
    return std::find(dirs.begin(), dirs.end(), name) != dirs.end();
}

bool hasSourceExtension(std::string_view path)
{
    const std::string ext = support::extension(path);
    const auto &exts = extract::sourceExtensions();
    return !ext.empty() && std::find(exts.begin(), exts.end(), ext) != exts.end();
}

bool isLikelyBinary(const std::string &path)
{
    static const std::vector<std::string_view> kBinaryExtensions = {
        ".png", ".jpg", ".jpeg", ".gif", ".bmp", ".ico", ".svg", ".webp", ".pdf", ".doc", ".docx",
        ".xls", ".xlsx", ".ppt", ".pptx", ".zip", ".tar", ".gz", ".bz2", ".xz", ".7z", ".rar",
        ".exe", ".dll", ".so", ".dylib", ".a", ".o", ".obj", ".wasm", ".class", ".pyc", ".pyo",
        ".mp3", ".mp4", ".wav", ".avi", ".mkv", ".mov", ".woff", ".woff2", ".ttf", ".otf", ".eot",
        ".lock",
    };
    const std::string name = extract::char_utils::toLowercase(support::fileName(path));
    if (name.size() > 7 && (name.compare(name.size() - 7, 7, ".min.js") == 0))
        return true;
    if (name.size() > 8 && (name.compare(name.size() - 8, 8, ".min.css") == 0))
        return true;
    const std::string ext = support::extension(name);
    if (std::find(kBinaryExtensions.begin(), kBinaryExtensions.end(), ext) != kBinaryExtensions.end())
        return true;
    if (hasSourceExtension(path))
        return false;
    const std::string prefix = support::loadFilePrefix(path, 512);
    return prefix.find('\0') != std::string::npos;
}

std::string normalizeScope(std::string_view scope, std::string_view root)
{
    std::string out = support::toForwardSlashes(scope);
    while (!out.empty() && out.back() == '/')
        out.pop_back();
    if (out.empty())
        return out;

    if (out.front() == '/')
    {
        const std::string rel = support::relativeTo(out, root);
        if (!rel.empty())
            out = rel == "." ? std::string() : rel;
    }
    return out;
}

std::vector<std::string> findSourceFiles(const std::string &root,
                                         const std::string &scope,
                                         const support::Logger &log)
{
    const fs::path base = scope.empty() ? fs::path(root) : fs::path(root) / scope;
    std::vector<std::string> files;

    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec)
    {
        log.warn("discovery", "cannot walk " + base.string() + ": " + ec.message());
        return files;
    }

    const fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec))
    {
        if (ec)
        {
            log.debug("discovery", "walk error: " + ec.message());
            ec.clear();
            continue;
        }
        const fs::directory_entry &entry = *it;
        const std::string name = entry.path().filename().string();
        std::error_code typeEc;
        if (entry.is_directory(typeEc))
        {
            if (isIgnoredDirectory(name))
                it.disable_recursion_pending();
            continue;
        }
        if (!entry.is_regular_file(typeEc) || !hasSourceExtension(name))
            continue;

        std::string rel = entry.path().lexically_relative(base).generic_string();
        if (!scope.empty())
            rel = scope + "/" + rel;
        files.push_back(std::move(rel));
    }

    std::sort(files.begin(), files.end());
    log.info("discovery", "found " + std::to_string(files.size()) + " source files");
    return files;
}

support::Expected<std::vector<std::string>> changedFiles(const std::string &root,
                                                         const std::string &scope,
                                                         const support::Logger &log)
{
    const support::RunResult rr = support::runProcess({"git", "diff", "--name-only", "HEAD"}, root);
    if (rr.exitCode != 0)
    {
        return support::Expected<std::vector<std::string>>(
            support::makeError("git diff failed in " + root + " (exit " + std::to_string(rr.exitCode) + ")"));
    }

    std::vector<std::string> files;
    for (std::string_view line : extract::char_utils::splitLines(rr.out))
    {
        const std::string_view path = extract::char_utils::trim(line);
        if (path.empty())
            continue;
        if (!scope.empty() && path.substr(0, scope.size()) != scope)
            continue;
        files.emplace_back(path);
    }
    log.info("discovery", std::to_string(files.size()) + " changed files");
    return files;
}

} // namespace thymus::scan
