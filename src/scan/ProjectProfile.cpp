//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: scan/ProjectProfile.cpp
// Purpose: Structure and dependency profiling over the project tree.
//
// Manifests are read with nlohmann::ordered_json so "first key" lookups
// (composer.json PSR-4 roots) follow document order. Maven and Gradle files
// are scanned textually; no XML parser is involved.
//
//===----------------------------------------------------------------------===//

#include "scan/ProjectProfile.hpp"

#include "extract/CharUtils.hpp"
#include "extract/ImportExtractor.hpp"
#include "rules/TestColocation.hpp"
#include "scan/FileDiscovery.hpp"
#include "support/logger.hpp"
#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <regex>
#include <set>
#include <utility>

namespace thymus::scan
{

namespace fs = std::filesystem;
using extract::char_utils::splitLines;
using extract::char_utils::trim;

namespace
{
using Manifest = nlohmann::ordered_json;
using LinkSet = std::set<ModuleLink>;

constexpr std::size_t kTopRanked = 20;

bool endsWith(std::string_view text, std::string_view suffix)
{
    return text.size() >= suffix.size() && text.substr(text.size() - suffix.size()) == suffix;
}

bool startsWith(std::string_view text, std::string_view prefix)
{
    return text.substr(0, prefix.size()) == prefix;
}

bool isFile(const fs::path &p)
{
    std::error_code ec;
    return fs::is_regular_file(p, ec);
}

bool isDir(const fs::path &p)
{
    std::error_code ec;
    return fs::is_directory(p, ec);
}

/// @brief Whole file as text; empty when unreadable.
std::string readText(const fs::path &p)
{
    auto text = support::loadSourceFile(p.string());
    return text ? text.value() : std::string();
}

std::optional<Manifest> readManifest(const fs::path &p)
{
    if (!isFile(p))
        return std::nullopt;
    Manifest doc = Manifest::parse(readText(p), nullptr, false);
    if (doc.is_discarded() || !doc.is_object())
        return std::nullopt;
    return doc;
}

/// @brief Visit files and directories below @p base.
/// @details @p fn receives the entry, its depth (0 = directly under @p base)
///          and whether it is a directory, and returns false to stop the walk.
///          Ignored directories are skipped; directories at @p maxDepth are
///          reported but not entered (a negative depth means unlimited).
template <class Fn> void walk(const fs::path &base, int maxDepth, Fn fn)
{
    if (!isDir(base))
        return;
    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::skip_permission_denied, ec);
    if (ec)
        return;

    const fs::recursive_directory_iterator end;
    for (; it != end; it.increment(ec))
    {
        if (ec)
        {
            ec.clear();
            continue;
        }
        const fs::directory_entry &entry = *it;
        const int depth = it.depth();
        std::error_code typeEc;
        if (entry.is_directory(typeEc))
        {
            if (isIgnoredDirectory(entry.path().filename().string()))
            {
                it.disable_recursion_pending();
                continue;
            }
            if (maxDepth >= 0 && depth >= maxDepth)
                it.disable_recursion_pending();
            if (!fn(entry, depth, true))
                return;
            continue;
        }
        if (entry.is_regular_file(typeEc) && !fn(entry, depth, false))
            return;
    }
}

/// @brief First entry below @p base whose name ends in @p suffix.
std::optional<fs::path> findEntry(const fs::path &base, std::string_view suffix, int maxDepth, bool dirsToo)
{
    std::optional<fs::path> found;
    walk(base, maxDepth,
         [&](const fs::directory_entry &entry, int, bool dir)
         {
             if ((dirsToo || !dir) && endsWith(entry.path().filename().string(), suffix))
             {
                 found = entry.path();
                 return false;
             }
             return true;
         });
    return found;
}

/// @brief Call @p fn(path) for each file below @p base ending in @p suffix.
template <class Fn> void forEachFile(const fs::path &base, std::string_view suffix, Fn fn)
{
    walk(base, -1,
         [&](const fs::directory_entry &entry, int, bool dir)
         {
             if (!dir && endsWith(entry.path().filename().string(), suffix))
                 fn(entry.path());
             return true;
         });
}

/// @brief Names of the sub-directories of @p dir that are not ignored, sorted.
std::vector<std::string> childDirectories(const fs::path &dir)
{
    std::vector<std::string> names;
    std::error_code ec;
    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec))
    {
        std::error_code typeEc;
        const std::string name = it->path().filename().string();
        if (it->is_directory(typeEc) && !isIgnoredDirectory(name))
            names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::string firstSegment(std::string_view text, char separator)
{
    return std::string(text.substr(0, text.find(separator)));
}

void addLink(LinkSet &links, const std::string &from, const std::string &to)
{
    if (!to.empty() && to != from)
        links.insert(ModuleLink{from, to});
}

/// @brief Entries of @p counts ranked by count, then name; at most kTopRanked.
std::vector<std::pair<std::string, std::size_t>> topRanked(const std::map<std::string, std::size_t> &counts)
{
    std::vector<std::pair<std::string, std::size_t>> ranked(counts.begin(), counts.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto &a, const auto &b) { return a.second > b.second; });
    if (ranked.size() > kTopRanked)
        ranked.resize(kTopRanked);
    return ranked;
}

bool manifestHasDependency(const Manifest &pkg, const std::string &name)
{
    for (const char *field : {"dependencies", "devDependencies"})
    {
        auto it = pkg.find(field);
        if (it != pkg.end() && it->is_object() && it->contains(name))
            return true;
    }
    return false;
}

/// @brief Text of the first `<tag>` element inside @p block, trimmed.
std::optional<std::string> xmlElementText(std::string_view block, const std::string &tag)
{
    const std::string open = "<" + tag + ">";
    const std::string close = "</" + tag + ">";
    const std::size_t start = block.find(open);
    if (start == std::string_view::npos)
        return std::nullopt;
    const std::size_t body = start + open.size();
    const std::size_t stop = block.find(close, body);
    if (stop == std::string_view::npos)
        return std::nullopt;
    return std::string(trim(block.substr(body, stop - body)));
}

/// @brief `group:artifact:version` for each `<dependency>` of a Maven POM.
std::vector<std::string> mavenDependencies(const std::string &pom)
{
    std::vector<std::string> deps;
    const std::string open = "<dependency>";
    const std::string close = "</dependency>";
    std::size_t pos = 0;
    while ((pos = pom.find(open, pos)) != std::string::npos)
    {
        const std::size_t body = pos + open.size();
        const std::size_t stop = pom.find(close, body);
        if (stop == std::string::npos)
            break;
        const std::string_view block(pom.data() + body, stop - body);
        const auto group = xmlElementText(block, "groupId");
        const auto artifact = xmlElementText(block, "artifactId");
        if (group && artifact)
            deps.push_back(*group + ":" + *artifact + ":" + xmlElementText(block, "version").value_or("managed"));
        pos = stop + close.size();
    }
    return deps;
}

std::vector<std::string> gradleDependencies(const std::string &script)
{
    static const std::regex kDependency(
        R"re(\b(?:implementation|compile|api|runtimeOnly|compileOnly|testImplementation)\s*\(?\s*['"]([^'"]+)['"])re");
    std::vector<std::string> deps;
    for (std::string_view line : splitLines(script))
    {
        using Iter = std::regex_iterator<std::string_view::const_iterator>;
        for (Iter it(line.begin(), line.end(), kDependency), end; it != end; ++it)
            deps.push_back((*it)[1].str());
    }
    return deps;
}

std::vector<std::string> goRequirements(const std::string &gomod)
{
    static const std::regex kSingle(R"(require\s+(\S+)\s+)");
    static const std::regex kBlockMember(R"(([a-z0-9._-]+/[a-z0-9./_-]+))");
    std::vector<std::string> deps;
    bool inBlock = false;
    std::smatch m;
    for (std::string_view raw : splitLines(gomod))
    {
        const std::string line(trim(raw));
        if (startsWith(line, "require"))
        {
            inBlock = true;
            if (std::regex_search(line, m, kSingle))
                deps.push_back(m[1].str());
            continue;
        }
        if (!inBlock)
            continue;
        if (line == ")")
        {
            inBlock = false;
            continue;
        }
        if (std::regex_search(line, m, kBlockMember, std::regex_constants::match_continuous))
            deps.push_back(m[1].str());
    }
    return deps;
}

std::vector<std::string> pythonRequirements(const std::string &text)
{
    std::vector<std::string> deps;
    for (std::string_view raw : splitLines(text))
    {
        const std::string_view line = trim(raw);
        if (line.empty() || line.front() == '#')
            continue;
        const std::string_view name = trim(line.substr(0, line.find_first_of("><=![")));
        if (!name.empty())
            deps.emplace_back(name);
    }
    return deps;
}

/// @brief How one language's internal imports are counted.
struct FrequencyPattern
{
    std::string_view language;
    std::regex re;
    bool anchored; ///< Match only at the start of a line.
    std::vector<std::string_view> extensions;
};

const std::vector<FrequencyPattern> &frequencyPatterns()
{
    static const std::vector<FrequencyPattern> patterns = {
        {"typescript", std::regex(R"re(from\s+['"]([./][^'"]*?)['"])re"), false, {".ts", ".js"}},
        {"javascript", std::regex(R"re(from\s+['"]([./][^'"]*?)['"])re"), false, {".ts", ".js"}},
        {"python", std::regex(R"((?:from\s+(\.\S+)|import\s+(\.\S+)))"), true, {".py"}},
        {"go", std::regex(R"re("([a-z0-9_-]+/.+?)")re"), false, {".go"}},
        {"java", std::regex(R"(import\s+(?:static\s+)?([a-z][\w.]*))"), true, {".java"}},
        {"kotlin", std::regex(R"(import\s+([a-z][\w.]*))"), true, {".kt", ".kts"}},
        {"dart", std::regex(R"re(import\s+['"]package:([^'"]+)['"])re"), true, {".dart"}},
        {"swift", std::regex(R"(import\s+(\w+))"), true, {".swift"}},
        {"csharp", std::regex(R"(using\s+([A-Z][\w.]*))"), true, {".cs"}},
        {"php", std::regex(R"(use\s+([A-Z][\w\\]*))"), true, {".php"}},
        {"ruby", std::regex(R"re(require\S*\s+['"](.+?)['"])re"), true, {".rb"}},
        {"rust", std::regex(R"(use\s+(.+?)\s*;)"), true, {".rs"}},
    };
    return patterns;
}

/// @brief First non-empty capture group of @p m.
template <class Match> std::string firstCapture(const Match &m)
{
    for (std::size_t g = 1; g < m.size(); ++g)
    {
        if (m[g].matched && m[g].length() > 0)
            return m[g].str();
    }
    return {};
}

LinkSet scriptModuleLinks(const fs::path &root, std::string_view language)
{
    static const std::regex kPython(R"(from\s+\.\.([a-z_]+))");
    static const std::regex kScript(R"re(from\s+['"`]\.\./([a-z_-]+))re");
    const std::regex &re = language == "python" ? kPython : kScript;
    const fs::path srcRoot = isDir(root / "src") ? root / "src" : root;

    LinkSet links;
    for (const std::string &from : childDirectories(srcRoot))
    {
        walk(srcRoot / from, -1,
             [&](const fs::directory_entry &entry, int, bool dir)
             {
                 if (dir || !hasSourceExtension(entry.path().filename().string()))
                     return true;
                 const std::string text = readText(entry.path());
                 for (std::string_view line : splitLines(text))
                 {
                     using Iter = std::regex_iterator<std::string_view::const_iterator>;
                     for (Iter it(line.begin(), line.end(), re), end; it != end; ++it)
                         addLink(links, from, (*it)[1].str());
                 }
                 return true;
             });
    }
    return links;
}

LinkSet jvmModuleLinks(const fs::path &root, std::string_view language)
{
    const bool kotlin = language == "kotlin";
    const std::string fileExt = kotlin ? ".kt" : ".java";
    const fs::path javaSrc = root / "src" / "main" / (kotlin && isDir(root / "src/main/kotlin") ? "kotlin" : "java");
    if (!isDir(javaSrc))
        return {};

    const auto firstFile = findEntry(javaSrc, fileExt, -1, false);
    if (!firstFile)
        return {};

    // The base package is the first directory above a source file that
    // branches into several packages, or the topmost one below javaSrc.
    fs::path packageRoot = firstFile->parent_path();
    fs::path parent = packageRoot.parent_path();
    while (parent != javaSrc && parent != parent.parent_path())
    {
        std::size_t subdirs = 0;
        std::error_code ec;
        for (fs::directory_iterator it(parent, ec), end; !ec && it != end; it.increment(ec))
        {
            std::error_code typeEc;
            if (it->is_directory(typeEc))
                ++subdirs;
        }
        packageRoot = parent;
        if (subdirs > 1)
            break;
        parent = parent.parent_path();
    }

    std::string basePackage = packageRoot.lexically_relative(javaSrc).generic_string();
    std::replace(basePackage.begin(), basePackage.end(), '/', '.');
    const std::string prefix = basePackage + ".";

    LinkSet links;
    for (const std::string &from : childDirectories(packageRoot))
    {
        forEachFile(packageRoot / from, fileExt,
                    [&](const fs::path &file)
                    {
                        for (const auto &imp : extract::extractImportsFromFile(file.string()))
                        {
                            if (startsWith(imp, prefix))
                                addLink(links, from, firstSegment(std::string_view(imp).substr(prefix.size()), '.'));
                        }
                    });
    }
    return links;
}

LinkSet goModuleLinks(const fs::path &root)
{
    const std::string gomod = readText(root / "go.mod");
    std::string modulePath;
    for (std::string_view line : splitLines(gomod))
    {
        if (startsWith(line, "module "))
        {
            modulePath = std::string(trim(line.substr(7)));
            modulePath = firstSegment(modulePath, ' ');
            break;
        }
    }
    if (modulePath.empty())
        return {};

    const std::string prefix = modulePath + "/";
    const fs::path srcRoot = isDir(root / "src") ? root / "src" : root;
    LinkSet links;
    forEachFile(srcRoot, ".go",
                [&](const fs::path &file)
                {
                    if (endsWith(file.filename().string(), "_test.go"))
                        return;
                    const std::string from = file.parent_path().filename().string();
                    for (const auto &imp : extract::extractImportsFromFile(file.string()))
                    {
                        if (!startsWith(imp, prefix))
                            continue;
                        std::string_view rel = std::string_view(imp).substr(prefix.size());
                        if (startsWith(rel, "src/"))
                            rel.remove_prefix(4);
                        addLink(links, from, firstSegment(rel, '/'));
                    }
                });
    return links;
}

LinkSet rustModuleLinks(const fs::path &root)
{
    const fs::path srcRoot = root / "src";
    LinkSet links;
    forEachFile(srcRoot, ".rs",
                [&](const fs::path &file)
                {
                    const std::string from = file.parent_path() == srcRoot ? file.stem().string()
                                                                          : file.parent_path().filename().string();
                    for (const auto &imp : extract::extractImportsFromFile(file.string()))
                    {
                        if (startsWith(imp, "crate::"))
                            addLink(links, from, firstSegment(std::string_view(imp).substr(7), ':'));
                    }
                });
    return links;
}

LinkSet dartModuleLinks(const fs::path &root)
{
    const std::string pubspec = readText(root / "pubspec.yaml");
    std::string packageName;
    for (std::string_view line : splitLines(pubspec))
    {
        if (startsWith(line, "name:"))
        {
            std::string_view value = trim(line.substr(5));
            while (!value.empty() && (value.front() == '\'' || value.front() == '"'))
                value.remove_prefix(1);
            while (!value.empty() && (value.back() == '\'' || value.back() == '"'))
                value.remove_suffix(1);
            packageName = std::string(value);
            break;
        }
    }
    const fs::path libRoot = root / "lib";
    if (packageName.empty() || !isDir(libRoot))
        return {};

    const std::string prefix = "package:" + packageName + "/";
    LinkSet links;
    forEachFile(libRoot, ".dart",
                [&](const fs::path &file)
                {
                    const std::string from =
                        file.parent_path() == libRoot ? std::string("lib") : file.parent_path().filename().string();
                    for (const auto &imp : extract::extractImportsFromFile(file.string()))
                    {
                        if (startsWith(imp, prefix))
                            addLink(links, from, firstSegment(std::string_view(imp).substr(prefix.size()), '/'));
                    }
                });
    return links;
}

/// @brief Call @p fn(file) for files under @p base whose imports start with
///        @p prefix, passing each import's leading segment after the prefix.
template <class Fn>
void forEachPrefixedImport(const fs::path &base, std::string_view suffix, const std::string &prefix, char sep, Fn fn)
{
    forEachFile(base, suffix,
                [&](const fs::path &file)
                {
                    for (const auto &imp : extract::extractImportsFromFile(file.string()))
                    {
                        if (startsWith(imp, prefix))
                            fn(file, firstSegment(std::string_view(imp).substr(prefix.size()), sep));
                    }
                });
}

LinkSet csharpModuleLinks(const fs::path &root)
{
    const auto project = findEntry(root, ".csproj", 2, false);
    if (!project)
        return {};
    static const std::regex kRootNamespace(R"(<RootNamespace>([^<]*)</RootNamespace>)");
    std::string rootNamespace = project->stem().string();
    const std::string csproj = readText(*project);
    for (std::string_view line : splitLines(csproj))
    {
        std::match_results<std::string_view::const_iterator> m;
        if (std::regex_search(line.begin(), line.end(), m, kRootNamespace))
        {
            rootNamespace = m[1].str();
            break;
        }
    }
    if (rootNamespace.empty())
        return {};

    LinkSet links;
    forEachPrefixedImport(root, ".cs", rootNamespace + ".", '.',
                          [&](const fs::path &file, const std::string &to)
                          { addLink(links, file.parent_path().filename().string(), to); });
    return links;
}

LinkSet phpModuleLinks(const fs::path &root)
{
    const auto composer = readManifest(root / "composer.json");
    if (!composer)
        return {};
    const auto autoload = composer->find("autoload");
    if (autoload == composer->end() || !autoload->is_object())
        return {};
    const auto psr4 = autoload->find("psr-4");
    if (psr4 == autoload->end() || !psr4->is_object() || psr4->empty())
        return {};

    std::string rootNamespace = psr4->begin().key();
    while (!rootNamespace.empty() && rootNamespace.back() == '\\')
        rootNamespace.pop_back();
    if (rootNamespace.empty())
        return {};

    LinkSet links;
    forEachPrefixedImport(root, ".php", rootNamespace + "\\", '\\',
                          [&](const fs::path &file, const std::string &to)
                          { addLink(links, file.parent_path().filename().string(), to); });
    return links;
}

LinkSet rubyModuleLinks(const fs::path &root)
{
    fs::path srcRoot = root / "app";
    if (!isDir(srcRoot))
        srcRoot = root / "lib";
    if (!isDir(srcRoot))
        return {};

    LinkSet links;
    forEachFile(srcRoot, ".rb",
                [&](const fs::path &file)
                {
                    const std::string from = file.parent_path().filename().string();
                    for (const auto &imp : extract::extractImportsFromFile(file.string()))
                    {
                        if (!startsWith(imp, "../") && imp.find('/') == std::string::npos)
                            continue;
                        std::string_view rel = imp;
                        while (!rel.empty() && (rel.front() == '.' || rel.front() == '/'))
                            rel.remove_prefix(1);
                        addLink(links, from, firstSegment(rel, '/'));
                    }
                });
    return links;
}

LinkSet swiftModuleLinks(const fs::path &root)
{
    const fs::path sourcesRoot = root / "Sources";
    if (!isDir(sourcesRoot))
        return {};
    const std::vector<std::string> targetList = childDirectories(sourcesRoot);
    const std::set<std::string> targets(targetList.begin(), targetList.end());

    LinkSet links;
    forEachFile(sourcesRoot, ".swift",
                [&](const fs::path &file)
                {
                    const std::string rel = file.parent_path().lexically_relative(sourcesRoot).generic_string();
                    const std::string from = firstSegment(rel, '/');
                    for (const auto &imp : extract::extractImportsFromFile(file.string()))
                    {
                        if (targets.count(imp))
                            addLink(links, from, imp);
                    }
                });
    return links;
}
} // namespace

const std::vector<std::string_view> &knownLayers()
{
    static const std::vector<std::string_view> kLayers = {
        "routes",      "controllers", "controller",   "services",  "service",        "repositories",
        "repository",  "models",      "model",        "middleware", "utils",         "util",
        "lib",         "helpers",     "types",        "handlers",  "resolvers",      "stores",
        "hooks",       "components",  "pages",        "app",       "api",            "db",
        "database",    "config",      "auth",         "tests",     "test",           "__tests__",
        "entity",      "entities",    "dto",          "converter", "mapper",         "filter",
        "interceptor", "domain",      "infrastructure", "adapter", "port",           "presenter",
        "exception",   "exceptions",
    };
    return kLayers;
}

StructureProfile profileStructure(const std::string &root, const support::Logger &log)
{
    static const std::regex kCompoundSuffix(R"(\.[a-zA-Z]+\.[a-z]+$)");

    StructureProfile profile;
    const fs::path base = fs::path(root).lexically_normal();
    std::set<std::string> layers;
    std::map<std::string, std::size_t> suffixCounts;
    std::map<std::string, std::size_t> topCounts;

    auto noteLayer = [&](const std::string &name)
    {
        const auto &known = knownLayers();
        if (std::find(known.begin(), known.end(), name) != known.end())
            layers.insert(name);
    };
    noteLayer((base.has_filename() ? base : base.parent_path()).filename().string());

    walk(base, -1,
         [&](const fs::directory_entry &entry, int depth, bool dir)
         {
             const std::string rel = entry.path().lexically_relative(base).generic_string();
             const std::string name = entry.path().filename().string();
             if (dir)
             {
                 if (depth < 3)
                     profile.rawStructure.push_back(rel);
                 noteLayer(name);
                 return true;
             }

             const std::size_t slash = rel.find('/');
             if (slash != std::string::npos)
                 ++topCounts[rel.substr(0, slash)];
             if (!hasSourceExtension(name))
                 return true;

             std::smatch m;
             if (std::regex_search(name, m, kCompoundSuffix))
                 ++suffixCounts[m.str()];
             if (!rules::isTestFile(rel) && !rules::hasColocatedTest(entry.path().string(), rel, root))
                 profile.testGaps.push_back(rel);
             return true;
         });

    std::sort(profile.rawStructure.begin(), profile.rawStructure.end());
    std::sort(profile.testGaps.begin(), profile.testGaps.end());
    for (std::string_view layer : knownLayers())
    {
        if (layers.count(std::string(layer)))
            profile.detectedLayers.emplace_back(layer);
    }
    for (auto &[suffix, count] : topRanked(suffixCounts))
        profile.namingPatterns.push_back(suffix);
    for (const auto &[dir, count] : topCounts)
        profile.fileCounts.push_back(DirectoryFileCount{dir, count});

    log.info("profile", std::to_string(profile.rawStructure.size()) + " directories, " +
                            std::to_string(profile.testGaps.size()) + " test gaps");
    return profile;
}

std::string detectLanguage(const std::string &root)
{
    const fs::path r(root);
    if (isFile(r / "package.json"))
    {
        const bool typed = isFile(r / "tsconfig.json") || findEntry(r / "src", ".ts", 2, false);
        return typed ? "typescript" : "javascript";
    }
    if (isFile(r / "pyproject.toml") || isFile(r / "setup.py") || isFile(r / "requirements.txt"))
        return "python";
    if (isFile(r / "go.mod"))
        return "go";
    if (isFile(r / "Cargo.toml"))
        return "rust";
    if (isFile(r / "pom.xml") || isFile(r / "build.gradle") || isFile(r / "build.gradle.kts"))
    {
        if (isFile(r / "build.gradle.kts") && readText(r / "build.gradle.kts").find("kotlin") != std::string::npos)
            return "kotlin";
        if (findEntry(r / "src", ".kt", 4, false))
            return "kotlin";
        return "java";
    }
    if (isFile(r / "pubspec.yaml"))
        return "dart";
    if (isFile(r / "Package.swift") || findEntry(r, ".xcodeproj", 0, true) || findEntry(r, ".xcworkspace", 0, true))
        return "swift";
    if (findEntry(r, ".csproj", 2, false) || findEntry(r, ".sln", 0, false))
        return "csharp";
    if (isFile(r / "composer.json"))
        return "php";
    if (isFile(r / "Gemfile") || isFile(r / "Rakefile"))
        return "ruby";
    return "unknown";
}

std::string detectFramework(const std::string &root, std::string_view language)
{
    const fs::path r(root);
    auto contains = [](const std::string &text, std::string_view needle)
    { return text.find(needle) != std::string::npos; };
    auto firstExisting = [&](std::initializer_list<const char *> names)
    {
        for (const char *name : names)
        {
            if (isFile(r / name))
                return readText(r / name);
        }
        return std::string();
    };

    if (language == "typescript" || language == "javascript")
    {
        const auto pkg = readManifest(r / "package.json");
        if (!pkg)
            return "unknown";
        for (const auto &[dep, framework] : {std::pair{"next", "nextjs"}, std::pair{"express", "express"},
                                             std::pair{"@nestjs/core", "nestjs"}, std::pair{"fastify", "fastify"}})
        {
            if (manifestHasDependency(*pkg, dep))
                return framework;
        }
        return "unknown";
    }
    if (language == "python")
    {
        for (const char *manifest : {"requirements.txt", "pyproject.toml"})
        {
            const std::string text = readText(r / manifest);
            if (contains(text, "django"))
                return "django";
            if (contains(text, "fastapi"))
                return "fastapi";
        }
        return "unknown";
    }
    if (language == "java")
    {
        static const std::regex kWeb(R"(spring-boot-starter-web|spring-webmvc)");
        static const std::regex kQuarkus(R"(quarkus-core|quarkus-bom)");
        static const std::regex kMicronaut(R"(micronaut-core|micronaut-bom)");
        const std::string build = firstExisting({"pom.xml", "build.gradle", "build.gradle.kts"});
        if (std::regex_search(build, kWeb))
            return contains(build, "spring-boot-starter") ? "spring-boot" : "spring-mvc";
        if (std::regex_search(build, kQuarkus))
            return "quarkus";
        if (std::regex_search(build, kMicronaut))
            return "micronaut";
        if (contains(build, "dropwizard"))
            return "dropwizard";
        return "unknown";
    }
    if (language == "go")
    {
        const std::string gomod = readText(r / "go.mod");
        for (const auto &[module, framework] :
             {std::pair{"github.com/gin-gonic/gin", "gin"}, std::pair{"github.com/labstack/echo", "echo"},
              std::pair{"github.com/gofiber/fiber", "fiber"}, std::pair{"github.com/gorilla/mux", "gorilla"},
              std::pair{"github.com/go-chi/chi", "chi"}})
        {
            if (contains(gomod, module))
                return framework;
        }
        return "unknown";
    }
    if (language == "rust")
    {
        const std::string cargo = readText(r / "Cargo.toml");
        for (const char *crate : {"actix-web", "axum", "rocket", "warp", "tide"})
        {
            if (contains(cargo, crate))
                return std::string(crate) == "actix-web" ? "actix" : crate;
        }
        return "unknown";
    }
    if (language == "kotlin")
    {
        const std::string build = firstExisting({"build.gradle.kts", "build.gradle", "pom.xml"});
        if (contains(build, "spring-boot"))
            return "spring-boot";
        if (contains(build, "io.ktor"))
            return "ktor";
        if (contains(build, "io.micronaut"))
            return "micronaut";
        return "unknown";
    }
    if (language == "dart")
    {
        static const std::regex kAngel(R"(angel_framework:|angel3_framework:)");
        const std::string pubspec = readText(r / "pubspec.yaml");
        if (contains(pubspec, "flutter:") || contains(pubspec, "flutter_test:"))
            return "flutter";
        if (contains(pubspec, "aqueduct:"))
            return "aqueduct";
        if (contains(pubspec, "shelf:"))
            return "shelf";
        if (std::regex_search(pubspec, kAngel))
            return "angel";
        return "unknown";
    }
    if (language == "swift")
    {
        if (isFile(r / "Package.swift"))
            return contains(readText(r / "Package.swift"), "vapor") ? "vapor" : "spm";
        if (findEntry(r, ".xcodeproj", 0, true) || findEntry(r, ".xcworkspace", 0, true))
            return "ios";
        return "unknown";
    }
    if (language == "csharp")
    {
        static const std::regex kAspNet(R"(Microsoft\.AspNetCore|Microsoft\.NET\.Sdk\.Web)");
        const auto project = findEntry(r, ".csproj", 2, false);
        const std::string csproj = project ? readText(*project) : std::string();
        if (std::regex_search(csproj, kAspNet))
            return "aspnet";
        if (contains(csproj, "Xamarin"))
            return "xamarin";
        if (contains(csproj, "Microsoft.Maui"))
            return "maui";
        return "unknown";
    }
    if (language == "php")
    {
        const auto composer = readManifest(r / "composer.json");
        if (!composer)
            return "unknown";
        const auto require = composer->find("require");
        if (require == composer->end() || !require->is_object())
            return "unknown";
        if (require->contains("laravel/framework") || require->contains("laravel/lumen-framework"))
            return "laravel";
        for (auto it = require->begin(); it != require->end(); ++it)
        {
            if (startsWith(it.key(), "symfony/"))
                return "symfony";
        }
        if (require->contains("slim/slim"))
            return "slim";
        if (require->contains("yiisoft/yii2"))
            return "yii";
        return "unknown";
    }
    if (language == "ruby")
    {
        static const std::regex kRails(R"re(['"]rails['"])re");
        static const std::regex kSinatra(R"re(['"]sinatra['"])re");
        static const std::regex kHanami(R"re(['"]hanami['"])re");
        const std::string gemfile = readText(r / "Gemfile");
        if (std::regex_search(gemfile, kRails))
            return "rails";
        if (std::regex_search(gemfile, kSinatra))
            return "sinatra";
        if (std::regex_search(gemfile, kHanami))
            return "hanami";
        return "unknown";
    }
    return "unknown";
}

std::vector<std::string> externalDependencies(const std::string &root, std::string_view language)
{
    const fs::path r(root);
    if (language == "typescript" || language == "javascript")
    {
        const auto pkg = readManifest(r / "package.json");
        if (!pkg)
            return {};
        std::set<std::string> names;
        for (const char *field : {"dependencies", "devDependencies"})
        {
            auto it = pkg->find(field);
            if (it == pkg->end() || !it->is_object())
                continue;
            for (auto dep = it->begin(); dep != it->end(); ++dep)
                names.insert(dep.key());
        }
        return {names.begin(), names.end()};
    }
    if (language == "python")
        return isFile(r / "requirements.txt") ? pythonRequirements(readText(r / "requirements.txt"))
                                              : std::vector<std::string>{};
    if (language == "go")
        return isFile(r / "go.mod") ? goRequirements(readText(r / "go.mod")) : std::vector<std::string>{};
    if (language == "java")
    {
        if (isFile(r / "pom.xml"))
            return mavenDependencies(readText(r / "pom.xml"));
        for (const char *script : {"build.gradle", "build.gradle.kts"})
        {
            if (isFile(r / script))
                return gradleDependencies(readText(r / script));
        }
    }
    return {};
}

std::vector<ImportCount> importFrequency(const std::string &root, std::string_view language,
                                         const support::Logger &log)
{
    const auto &patterns = frequencyPatterns();
    const auto rule = std::find_if(patterns.begin(), patterns.end(),
                                   [&](const FrequencyPattern &p) { return p.language == language; });
    if (rule == patterns.end())
        return {};

    std::map<std::string, std::size_t> counts;
    walk(fs::path(root), -1,
         [&](const fs::directory_entry &entry, int, bool dir)
         {
             const std::string ext = entry.path().extension().string();
             if (dir || std::find(rule->extensions.begin(), rule->extensions.end(), ext) == rule->extensions.end())
                 return true;
             const std::string text = readText(entry.path());
             for (std::string_view line : splitLines(text))
             {
                 if (rule->anchored)
                 {
                     std::match_results<std::string_view::const_iterator> m;
                     if (std::regex_search(line.begin(), line.end(), m, rule->re,
                                           std::regex_constants::match_continuous))
                     {
                         const std::string path = firstCapture(m);
                         if (!path.empty())
                             ++counts[path];
                     }
                     continue;
                 }
                 using Iter = std::regex_iterator<std::string_view::const_iterator>;
                 for (Iter it(line.begin(), line.end(), rule->re), end; it != end; ++it)
                 {
                     const std::string path = firstCapture(*it);
                     if (!path.empty())
                         ++counts[path];
                 }
             }
             return true;
         });

    std::vector<ImportCount> ranked;
    for (auto &[path, count] : topRanked(counts))
        ranked.push_back(ImportCount{path, count});
    log.debug("profile", std::to_string(counts.size()) + " distinct internal imports");
    return ranked;
}

std::vector<ModuleLink> crossModuleImports(const std::string &root, std::string_view language,
                                           const support::Logger &log)
{
    const fs::path r(root);
    LinkSet links;
    if (language == "java" || language == "kotlin")
        links = jvmModuleLinks(r, language);
    else if (language == "go")
        links = isFile(r / "go.mod") ? goModuleLinks(r) : LinkSet{};
    else if (language == "rust")
        links = rustModuleLinks(r);
    else if (language == "dart")
        links = dartModuleLinks(r);
    else if (language == "csharp")
        links = csharpModuleLinks(r);
    else if (language == "php")
        links = phpModuleLinks(r);
    else if (language == "ruby")
        links = rubyModuleLinks(r);
    else if (language == "swift")
        links = swiftModuleLinks(r);
    else
        links = scriptModuleLinks(r, language);

    log.debug("profile", std::to_string(links.size()) + " cross-module import pairs");
    return {links.begin(), links.end()};
}

DependencyProfile profileDependencies(const std::string &root, const support::Logger &log)
{
    DependencyProfile profile;
    profile.language = detectLanguage(root);
    profile.framework = detectFramework(root, profile.language);
    profile.externalDeps = externalDependencies(root, profile.language);
    profile.importFrequency = importFrequency(root, profile.language, log);
    profile.crossModuleImports = crossModuleImports(root, profile.language, log);
    log.info("profile", "language " + profile.language + ", framework " + profile.framework);
    return profile;
}

} // namespace thymus::scan
