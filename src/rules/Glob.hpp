//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/Glob.hpp
// Purpose: Glob patterns over slash-separated project paths.
//
// Syntax: `**` matches any run of characters including '/', `*` matches within
// one path segment, `?` matches one non-'/' character; every other character
// is literal. A glob must match the whole path.
//
//===----------------------------------------------------------------------===//
#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::rules
{

/// @brief Translate @p glob into an anchored ECMAScript regular expression.
[[nodiscard]] std::string globToRegex(std::string_view glob);

/// @brief Compiled glob pattern.
class GlobMatcher
{
  public:
    explicit GlobMatcher(std::string glob);

    [[nodiscard]] bool matches(std::string_view path) const;

    /// @brief Source text of the glob.
    [[nodiscard]] const std::string &glob() const noexcept
    {
        return glob_;
    }

  private:
    std::string glob_;
    std::regex re_;
};

/// @brief Ordered collection of globs matched as a disjunction.
class GlobSet
{
  public:
    GlobSet() = default;
    explicit GlobSet(const std::vector<std::string> &globs);

    [[nodiscard]] bool anyMatch(std::string_view path) const;

    [[nodiscard]] bool empty() const noexcept
    {
        return matchers_.empty();
    }

    [[nodiscard]] const std::vector<GlobMatcher> &matchers() const noexcept
    {
        return matchers_;
    }

  private:
    std::vector<GlobMatcher> matchers_;
};

/// @brief One-shot convenience: does @p path match @p glob?
[[nodiscard]] bool pathMatches(std::string_view path, std::string_view glob);

} // namespace thymus::rules
