//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: io/YamlWriter.hpp
// Purpose: Render inferred rules back into the invariant-file shape.
//
// Key invariants:
//   - Records are list items indented two spaces, ready to sit under the
//     `invariants:` key of an existing invariant file.
//   - Whole-number confidences print without a fractional part.
//
//===----------------------------------------------------------------------===//
#pragma once

#include "rules/Invariant.hpp"
#include "support/diag_expected.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace thymus::io
{

/// @brief `90` for 90.0, `93.3` for 93.3.
[[nodiscard]] std::string formatConfidence(double confidence);

/// @brief Rule records only, without comments.
[[nodiscard]] std::string renderRuleRecords(const std::vector<rules::Invariant> &rules);

/// @brief Commented header followed by the records, or by `# <emptyReason>`
///        when @p rules is empty.
[[nodiscard]] std::string renderInferredRules(const std::vector<rules::Invariant> &rules,
                                              double minConfidence,
                                              std::string_view emptyReason);

/// @brief Append the records of @p rules to the existing invariant file at @p path.
support::Expected<void> appendRulesToFile(const std::string &path, const std::vector<rules::Invariant> &rules);

} // namespace thymus::io
