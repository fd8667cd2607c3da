//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/RuleEngine.cpp
// Purpose: Boundary, pattern, convention and dependency rule evaluation.
//
//===----------------------------------------------------------------------===//

#include "rules/RuleEngine.hpp"

#include "extract/CharUtils.hpp"
#include "extract/ImportExtractor.hpp"
#include "rules/TestColocation.hpp"
#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

#include <filesystem>

namespace thymus::rules
{

namespace
{
Violation makeViolation(const Invariant &inv, std::string message, const std::string &file)
{
    Violation v;
    v.rule = inv.id;
    v.severity = inv.severity;
    v.message = std::move(message);
    v.file = file;
    return v;
}

bool mentionsTesting(const std::string &ruleText)
{
    return extract::char_utils::toLowercase(ruleText).find("test") != std::string::npos;
}
} // namespace

FileSubject::FileSubject(std::string absPath, std::string relPath)
    : absPath_(std::move(absPath)), relPath_(std::move(relPath))
{
}

bool FileSubject::exists()
{
    if (!exists_)
    {
        std::error_code ec;
        exists_ = std::filesystem::is_regular_file(absPath_, ec);
    }
    return *exists_;
}

const std::string &FileSubject::content()
{
    if (!content_)
    {
        auto loaded = support::loadSourceFile(absPath_);
        content_ = loaded ? std::move(loaded.value()) : std::string();
    }
    return *content_;
}

const std::vector<std::string> &FileSubject::imports()
{
    if (!imports_)
    {
        const extract::Language lang = extract::languageForPath(absPath_);
        imports_ = lang == extract::Language::Unknown ? std::vector<std::string>()
                                                      : extract::extractImports(content(), lang);
    }
    return *imports_;
}

std::optional<uint32_t> firstMatchingLine(std::string_view content, const std::regex &re)
{
    uint32_t lineNo = 0;
    for (std::string_view line : extract::char_utils::splitLines(content))
    {
        ++lineNo;
        if (!line.empty() && line.back() == '\r')
            line.remove_suffix(1);
        if (std::regex_search(line.begin(), line.end(), re))
            return lineNo;
    }
    return std::nullopt;
}

std::vector<Violation> evaluate(FileSubject &file, const CompiledInvariant &rule, const std::string &projectRoot)
{
    const Invariant &inv = rule.invariant;
    std::vector<Violation> out;

    if (!rule.scope.fileInScope(file.relPath()))
        return out;
    if (!file.exists())
        return out;

    switch (inv.kind)
    {
        case RuleKind::Boundary:
            for (const auto &imp : file.imports())
            {
                if (imp.empty() ||
                    !rule.scope.importIsForbidden(imp, support::resolveRelativeImport(file.relPath(), imp)))
                    continue;
                Violation v = makeViolation(inv, inv.description, file.relPath());
                v.importSpec = imp;
                out.push_back(std::move(v));
            }
            break;

        case RuleKind::Pattern:
        {
            if (!rule.pattern)
                break;
            if (auto line = firstMatchingLine(file.content(), *rule.pattern))
            {
                Violation v = makeViolation(inv, inv.description, file.relPath());
                v.line = *line;
                out.push_back(std::move(v));
            }
            break;
        }

        case RuleKind::Convention:
            if (mentionsTesting(inv.rule) && !hasColocatedTest(file.absPath(), file.relPath(), projectRoot))
                out.push_back(makeViolation(inv, "missing colocated test file", file.relPath()));
            break;

        case RuleKind::Dependency:
        {
            if (inv.package.empty() || rule.scope.inAllowedLocation(file.relPath()))
                break;
            for (const auto &imp : file.imports())
            {
                if (imp.find(inv.package) == std::string::npos)
                    continue;
                Violation v = makeViolation(inv, inv.description, file.relPath());
                v.package = inv.package;
                out.push_back(std::move(v));
                break;
            }
            break;
        }
    }
    return out;
}

std::vector<Violation> evaluateAll(FileSubject &file,
                                   const std::vector<CompiledInvariant> &rules,
                                   const std::string &projectRoot)
{
    std::vector<Violation> out;
    for (const auto &rule : rules)
    {
        auto found = evaluate(file, rule, projectRoot);
        out.insert(out.end(), std::make_move_iterator(found.begin()), std::make_move_iterator(found.end()));
    }
    return out;
}

} // namespace thymus::rules
