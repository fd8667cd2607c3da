//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/CompiledInvariant.hpp
// Purpose: Invariants with their globs and patterns compiled once per scan.
//
// Key invariants:
//   - A file is in scope when the rule declares no scope glob, or when it
//     matches source_glob (else scope_glob) and none of scope_glob_exclude.
//   - An import is forbidden when it matches a forbidden_imports entry (as a
//     glob, as the literal text, or with dots turned into slashes for dotted
//     names without '/') and does not match an allowed_imports entry under
//     the same test.
//
// Ownership/Lifetime: CompiledInvariant owns a copy of its Invariant.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "rules/Glob.hpp"
#include "rules/Invariant.hpp"
#include "support/diag_expected.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace thymus::support
{
class DiagnosticEngine;
class Logger;
} // namespace thymus::support

namespace thymus::rules
{

/// @brief Compiled scope, import filters and allowed locations of one invariant.
class RuleScope
{
  public:
    explicit RuleScope(const Invariant &inv);

    [[nodiscard]] bool fileInScope(std::string_view path) const;
    [[nodiscard]] bool importIsForbidden(std::string_view imp) const;

    /// @brief Like importIsForbidden(imp), also testing @p resolved, the
    ///        project-relative form of a `./` or `../` specifier.
    [[nodiscard]] bool importIsForbidden(std::string_view imp, std::string_view resolved) const;

    /// @brief True when @p path matches an allowed_in glob (dependency rules).
    [[nodiscard]] bool inAllowedLocation(std::string_view path) const;

  private:
    std::optional<GlobMatcher> scope_;
    GlobSet exclude_;
    GlobSet forbidden_;
    GlobSet allowed_;
    GlobSet allowedIn_;
};

/// @brief Scope test without precompiled state.
[[nodiscard]] bool fileInScope(std::string_view path, const Invariant &inv);

/// @brief Forbidden-import test without precompiled state.
[[nodiscard]] bool importIsForbidden(std::string_view imp, const Invariant &inv);

/// @brief Rewrite POSIX bracket classes (`[[:space:]]`, `[[:alpha:]]`, ...)
///        into ECMAScript equivalents.
[[nodiscard]] std::string translatePosixClasses(std::string_view pattern);

struct CompiledInvariant
{
    Invariant invariant;
    RuleScope scope;
    std::optional<std::regex> pattern; ///< Set for pattern rules with a non-empty pattern.
};

/// @brief Compile @p inv; fails when a pattern rule carries an invalid regex.
support::Expected<CompiledInvariant> compileInvariant(const Invariant &inv);

/// @brief Compile every invariant, dropping (and reporting) those that fail.
std::vector<CompiledInvariant> compileInvariants(const std::vector<Invariant> &invariants,
                                                 support::DiagnosticEngine &diags,
                                                 const support::Logger &log);

} // namespace thymus::rules
