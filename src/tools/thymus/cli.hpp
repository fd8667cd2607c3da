//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Shared command-line options for the thymus driver and the subcommand entry
// points that consume them.
//
//===----------------------------------------------------------------------===//

#pragma once

#include "rules/Invariant.hpp"
#include "support/diag_expected.hpp"
#include "support/logger.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace thymus::tools
{

enum class OutputFormat
{
    Default, ///< Subcommand-specific (text, YAML or JSON).
    Json,
    Yaml
};

struct CliOptions
{
    /// @brief Project root; made absolute by finalizeOptions().
    std::string root = ".";

    /// @brief Invariant file; defaults to `<root>/.thymus/invariants.yml`.
    std::string config;

    /// @brief Worker threads (0 means hardware concurrency).
    unsigned jobs = 0;

    /// @brief Per-file byte cap; 0 disables it.
    std::uintmax_t maxFileSize = 512000;

    support::LogLevel logLevel = support::LogLevel::Warn;

    double minConfidence = 90.0;

    /// @brief Scan result used to annotate graph edges.
    std::string violationsPath;

    OutputFormat format = OutputFormat::Default;

    /// @brief Restrict the scan to files changed against HEAD.
    bool diff = false;

    /// @brief Append inferred rules to the invariant file.
    bool apply = false;

    /// @brief Non-option arguments in order.
    std::vector<std::string> positional;
};

enum class OptionParseResult
{
    NotMatched, ///< Argument is not a recognised option.
    Parsed,     ///< Argument consumed.
    Error       ///< Recognised option with a missing or malformed value.
};

/// @brief Parse the option at @p index, advancing it past consumed values.
OptionParseResult parseOption(int &index, int argc, char **argv, CliOptions &opts);

/// @brief Parse all of @p argv into @p opts; reports problems on stderr.
bool parseCliOptions(int argc, char **argv, CliOptions &opts);

/// @brief Resolve the root to an absolute path and fill in the config default.
void finalizeOptions(CliOptions &opts);

/// @brief Load the invariant file named by @p opts, printing diagnostics.
support::Expected<std::vector<rules::Invariant>> loadInvariants(const CliOptions &opts,
                                                                const support::Logger &log);

} // namespace thymus::tools

int cmdScan(int argc, char **argv);

int cmdCheck(int argc, char **argv);

int cmdExtract(int argc, char **argv);

int cmdGraph(int argc, char **argv);

int cmdInfer(int argc, char **argv);

int cmdDetect(int argc, char **argv);
