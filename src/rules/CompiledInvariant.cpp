//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/CompiledInvariant.cpp
// Purpose: Scope matching, forbidden-import tests and rule compilation.
//
//===----------------------------------------------------------------------===//

#include "rules/CompiledInvariant.hpp"

#include "support/diagnostics.hpp"
#include "support/logger.hpp"

#include <algorithm>

namespace thymus::rules
{

namespace
{
/// @brief Dotted module names without '/' are also tried in path form.
std::string importAsPath(std::string_view imp)
{
    std::string out(imp);
    if (out.find('.') != std::string::npos && out.find('/') == std::string::npos)
        std::replace(out.begin(), out.end(), '.', '/');
    return out;
}

bool importMatches(const GlobSet &globs, std::string_view imp, std::string_view asPath)
{
    for (const auto &m : globs.matchers())
    {
        if (m.matches(imp) || imp == m.glob() || m.matches(asPath))
            return true;
    }
    return false;
}

void replaceAll(std::string &text, std::string_view from, std::string_view to)
{
    std::size_t pos = 0;
    while ((pos = text.find(from, pos)) != std::string::npos)
    {
        text.replace(pos, from.size(), to);
        pos += to.size();
    }
}
} // namespace

RuleScope::RuleScope(const Invariant &inv)
    : exclude_(inv.scopeGlobExclude), forbidden_(inv.forbiddenImports), allowed_(inv.allowedImports),
      allowedIn_(inv.allowedIn)
{
    if (!inv.applicableGlob().empty())
        scope_.emplace(inv.applicableGlob());
}

bool RuleScope::fileInScope(std::string_view path) const
{
    if (!scope_)
        return true;
    if (!scope_->matches(path))
        return false;
    return !exclude_.anyMatch(path);
}

bool RuleScope::importIsForbidden(std::string_view imp) const
{
    if (forbidden_.empty())
        return false;
    const std::string asPath = importAsPath(imp);
    if (!importMatches(forbidden_, imp, asPath))
        return false;
    return !importMatches(allowed_, imp, asPath);
}

bool RuleScope::importIsForbidden(std::string_view imp, std::string_view resolved) const
{
    if (resolved == imp)
        return importIsForbidden(imp);
    if (forbidden_.empty())
        return false;
    const std::string asPath = importAsPath(imp);
    if (!importMatches(forbidden_, imp, asPath) && !importMatches(forbidden_, resolved, resolved))
        return false;
    return !importMatches(allowed_, imp, asPath) && !importMatches(allowed_, resolved, resolved);
}

bool RuleScope::inAllowedLocation(std::string_view path) const
{
    return allowedIn_.anyMatch(path);
}

bool fileInScope(std::string_view path, const Invariant &inv)
{
    return RuleScope(inv).fileInScope(path);
}

bool importIsForbidden(std::string_view imp, const Invariant &inv)
{
    return RuleScope(inv).importIsForbidden(imp);
}

std::string translatePosixClasses(std::string_view pattern)
{
    std::string out(pattern);
    replaceAll(out, "[[:space:]]", "\\s");
    replaceAll(out, "[[:alpha:]]", "[a-zA-Z]");
    replaceAll(out, "[[:digit:]]", "\\d");
    replaceAll(out, "[[:alnum:]]", "[a-zA-Z0-9]");
    replaceAll(out, "[[:upper:]]", "[A-Z]");
    replaceAll(out, "[[:lower:]]", "[a-z]");
    replaceAll(out, "[[:punct:]]", "[^\\w\\s]");
    replaceAll(out, "[[:blank:]]", "[ \\t]");
    return out;
}

support::Expected<CompiledInvariant> compileInvariant(const Invariant &inv)
{
    std::optional<std::regex> pattern;
    if (inv.kind == RuleKind::Pattern && !inv.forbiddenPattern.empty())
    {
        try
        {
            pattern.emplace(translatePosixClasses(inv.forbiddenPattern), std::regex::ECMAScript);
        }
        catch (const std::regex_error &e)
        {
            return support::Expected<CompiledInvariant>(support::makeError(
                "invalid regex in pattern rule " + inv.id + ": " + inv.forbiddenPattern + " (" +
                e.what() + ")"));
        }
    }
    return support::Expected<CompiledInvariant>(
        CompiledInvariant{inv, RuleScope(inv), std::move(pattern)});
}

std::vector<CompiledInvariant> compileInvariants(const std::vector<Invariant> &invariants,
                                                 support::DiagnosticEngine &diags,
                                                 const support::Logger &log)
{
    std::vector<CompiledInvariant> compiled;
    compiled.reserve(invariants.size());
    for (const auto &inv : invariants)
    {
        auto result = compileInvariant(inv);
        if (!result)
        {
            log.warn("rules", result.error().message);
            diags.report(result.error());
            continue;
        }
        compiled.push_back(std::move(result.value()));
    }
    return compiled;
}

} // namespace thymus::rules
