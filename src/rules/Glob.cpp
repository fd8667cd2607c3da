//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/Glob.cpp
// Purpose: Glob to regular-expression translation and matching.
//
//===----------------------------------------------------------------------===//

#include "rules/Glob.hpp"

#include <cstring>

namespace thymus::rules
{

std::string globToRegex(std::string_view glob)
{
    std::string out = "^";
    out.reserve(glob.size() * 2 + 2);
    for (std::size_t i = 0; i < glob.size(); ++i)
    {
        const char c = glob[i];
        if (c == '*')
        {
            if (i + 1 < glob.size() && glob[i + 1] == '*')
            {
                out += ".*";
                ++i;
            }
            else
            {
                out += "[^/]*";
            }
            continue;
        }
        if (c == '?')
        {
            out += "[^/]";
            continue;
        }
        if (c != '\0' && std::strchr(".^$|()[]{}+\\", c) != nullptr)
            out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('$');
    return out;
}

GlobMatcher::GlobMatcher(std::string glob) : glob_(std::move(glob)), re_(globToRegex(glob_)) {}

bool GlobMatcher::matches(std::string_view path) const
{
    return std::regex_match(path.begin(), path.end(), re_);
}

GlobSet::GlobSet(const std::vector<std::string> &globs)
{
    matchers_.reserve(globs.size());
    for (const auto &g : globs)
        matchers_.emplace_back(g);
}

bool GlobSet::anyMatch(std::string_view path) const
{
    for (const auto &m : matchers_)
    {
        if (m.matches(path))
            return true;
    }
    return false;
}

bool pathMatches(std::string_view path, std::string_view glob)
{
    return GlobMatcher(std::string(glob)).matches(path);
}

} // namespace thymus::rules
