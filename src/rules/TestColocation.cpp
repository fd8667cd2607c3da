//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/TestColocation.cpp
// Purpose: Per-language sibling, suffix and mirrored-directory test lookups.
//
//===----------------------------------------------------------------------===//

#include "rules/TestColocation.hpp"

#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

#include <filesystem>
#include <initializer_list>
#include <regex>

namespace thymus::rules
{

namespace fs = std::filesystem;

namespace
{
bool isFile(const std::string &path)
{
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

/// @brief True when `base + suffix` exists for any of @p suffixes.
bool anyExists(const std::string &base, std::initializer_list<const char *> suffixes)
{
    for (const char *suffix : suffixes)
    {
        if (isFile(base + suffix))
            return true;
    }
    return false;
}

std::string replaceAll(std::string text, std::string_view from, std::string_view to)
{
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
    return text;
}

/// @brief Path with its extension removed (a leading dot does not start one).
std::string withoutExtension(const std::string &path)
{
    const std::string ext = support::extension(path);
    return path.substr(0, path.size() - ext.size());
}

/// @brief Test-root mirror of @p absPath, extension stripped; empty if @p marker is absent.
std::string mirrorBase(const std::string &absPath,
                       std::string_view marker,
                       std::string_view from,
                       std::string_view to)
{
    if (absPath.find(marker) == std::string::npos)
        return {};
    return withoutExtension(replaceAll(absPath, from, to));
}

bool javaHasTest(const std::string &absPath, const std::string &sibling)
{
    if (anyExists(sibling, {"Test.java", "Tests.java", "IT.java"}))
        return true;
    const std::string mirror = mirrorBase(absPath, "/src/main/java/", "src/main/java", "src/test/java");
    return !mirror.empty() && anyExists(mirror, {"Test.java", "Tests.java", "IT.java"});
}

bool rustHasTest(const std::string &absPath, const std::string &stem, const std::string &projectRoot)
{
    auto content = support::loadSourceFile(absPath);
    if (content && content.value().find("#[cfg(test)]") != std::string::npos)
        return true;
    const std::string tests = support::joinPath(projectRoot, "tests");
    return isFile(support::joinPath(tests, stem + ".rs")) ||
           isFile(support::joinPath(tests, "test_" + stem + ".rs"));
}

bool kotlinHasTest(const std::string &absPath, const std::string &sibling)
{
    if (anyExists(sibling, {"Test.kt", "Tests.kt"}))
        return true;
    if (absPath.find("/src/main/") == std::string::npos)
        return false;
    std::string mirror = replaceAll(absPath, "src/main/kotlin", "src/test/kotlin");
    mirror = withoutExtension(replaceAll(mirror, "src/main/java", "src/test/java"));
    return anyExists(mirror, {"Test.kt", "Tests.kt"});
}

bool rubyHasTest(const std::string &absPath, const std::string &sibling)
{
    if (anyExists(sibling, {"_test.rb", "_spec.rb"}))
        return true;
    const std::string testMirror = mirrorBase(absPath, "/app/", "/app/", "/test/");
    if (testMirror.empty())
        return false;
    const std::string specMirror = mirrorBase(absPath, "/app/", "/app/", "/spec/");
    return isFile(testMirror + "_test.rb") || isFile(specMirror + "_spec.rb");
}
} // namespace

bool isTestFile(std::string_view relPath)
{
    static const std::regex kPatterns[] = {
        std::regex(R"(\.(test|spec)\.)"),
        std::regex(R"(\.d\.ts$)"),
        std::regex(R"((Test|Tests|IT|Spec)\.java$)"),
        std::regex(R"(_test\.(go|dart|rb)$)"),
        std::regex(R"(_spec\.rb$)"),
        std::regex(R"((Test|Tests)\.kt$)"),
        std::regex(R"(Tests\.swift$)"),
        std::regex(R"((Tests|Test)\.cs$)"),
        std::regex(R"(Test\.php$)"),
    };
    for (const auto &re : kPatterns)
    {
        if (std::regex_search(relPath.begin(), relPath.end(), re))
            return true;
    }
    return false;
}

bool needsColocatedTest(std::string_view relPath)
{
    static const std::regex kSourceExt(R"(\.(ts|js|py|java|go|rs|dart|kt|kts|swift|cs|php|rb)$)");
    return std::regex_search(relPath.begin(), relPath.end(), kSourceExt) && !isTestFile(relPath);
}

bool hasColocatedTest(const std::string &absPath, std::string_view relPath, const std::string &projectRoot)
{
    if (!needsColocatedTest(relPath))
        return true;

    const std::string ext = support::extension(absPath);
    const std::string base = withoutExtension(absPath);
    if (isFile(base + ".test" + ext) || isFile(base + ".spec" + ext))
        return true;

    const std::string stem = support::stem(absPath);
    const std::string sibling = support::joinPath(support::dirname(absPath), stem);

    if (ext == ".java")
        return javaHasTest(absPath, sibling);
    if (ext == ".go")
        return isFile(sibling + "_test.go");
    if (ext == ".rs")
        return rustHasTest(absPath, stem, projectRoot);
    if (ext == ".dart")
    {
        if (isFile(sibling + "_test.dart"))
            return true;
        const std::string mirror = mirrorBase(absPath, "/lib/", "/lib/", "/test/");
        return !mirror.empty() && isFile(mirror + "_test.dart");
    }
    if (ext == ".kt" || ext == ".kts")
        return kotlinHasTest(absPath, sibling);
    if (ext == ".swift")
    {
        if (isFile(sibling + "Tests.swift"))
            return true;
        const std::string mirror = mirrorBase(absPath, "/Sources/", "/Sources/", "/Tests/");
        return !mirror.empty() && isFile(mirror + "Tests.swift");
    }
    if (ext == ".cs")
        return anyExists(sibling, {"Tests.cs", "Test.cs"});
    if (ext == ".php")
    {
        if (isFile(sibling + "Test.php"))
            return true;
        const std::string mirror = mirrorBase(absPath, "/src/", "/src/", "/tests/");
        return !mirror.empty() && isFile(mirror + "Test.php");
    }
    if (ext == ".rb")
        return rubyHasTest(absPath, sibling);
    return false;
}

} // namespace thymus::rules
