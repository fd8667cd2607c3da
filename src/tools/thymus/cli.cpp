//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// Implements option parsing shared by every thymus subcommand, plus the
// invariant loading step that scan and check both need.
//
//===----------------------------------------------------------------------===//

/// @file
/// @brief Parses thymus command-line options.
/// @details Options may appear anywhere after the subcommand name; anything
///          that is not an option is collected as a positional argument.

#include "cli.hpp"

#include "rules/InvariantLoader.hpp"
#include "support/diagnostics.hpp"
#include "support/path_utils.hpp"

#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string_view>
#include <system_error>

namespace thymus::tools
{

namespace
{
template <class T> bool parseNumber(std::string_view text, T &out)
{
    const char *const begin = text.data();
    const char *const end = begin + text.size();
    const auto fc = std::from_chars(begin, end, out);
    return fc.ec == std::errc() && fc.ptr == end && begin != end;
}

bool parseConfidence(std::string_view text, double &out)
{
    unsigned whole = 0;
    if (parseNumber(text, whole))
    {
        out = whole;
        return out <= 100.0;
    }
    const std::string copy(text);
    char *end = nullptr;
    out = std::strtod(copy.c_str(), &end);
    return !copy.empty() && end == copy.c_str() + copy.size() && out >= 0.0 && out <= 100.0;
}

/// @brief Value of `--name VALUE` or `--name=VALUE`; advances @p index for the former.
std::optional<std::string_view> optionValue(
    std::string_view arg, std::string_view name, int &index, int argc, char **argv, bool &malformed)
{
    if (arg == name)
    {
        if (index + 1 >= argc)
        {
            malformed = true;
            return std::nullopt;
        }
        return std::string_view(argv[++index]);
    }
    if (arg.size() > name.size() && arg.substr(0, name.size()) == name && arg[name.size()] == '=')
        return arg.substr(name.size() + 1);
    return std::nullopt;
}
} // namespace

OptionParseResult parseOption(int &index, int argc, char **argv, CliOptions &opts)
{
    const std::string_view arg(argv[index]);
    if (arg == "--diff")
    {
        opts.diff = true;
        return OptionParseResult::Parsed;
    }
    if (arg == "--apply")
    {
        opts.apply = true;
        return OptionParseResult::Parsed;
    }

    bool malformed = false;
    if (auto v = optionValue(arg, "--root", index, argc, argv, malformed))
    {
        opts.root = std::string(*v);
        return OptionParseResult::Parsed;
    }
    if (auto v = optionValue(arg, "--config", index, argc, argv, malformed))
    {
        opts.config = std::string(*v);
        return OptionParseResult::Parsed;
    }
    if (auto v = optionValue(arg, "--violations", index, argc, argv, malformed))
    {
        opts.violationsPath = std::string(*v);
        return OptionParseResult::Parsed;
    }
    if (auto v = optionValue(arg, "--jobs", index, argc, argv, malformed))
        return parseNumber(*v, opts.jobs) ? OptionParseResult::Parsed : OptionParseResult::Error;
    if (auto v = optionValue(arg, "--max-file-size", index, argc, argv, malformed))
        return parseNumber(*v, opts.maxFileSize) ? OptionParseResult::Parsed : OptionParseResult::Error;
    if (auto v = optionValue(arg, "--min-confidence", index, argc, argv, malformed))
        return parseConfidence(*v, opts.minConfidence) ? OptionParseResult::Parsed : OptionParseResult::Error;
    if (auto v = optionValue(arg, "--log-level", index, argc, argv, malformed))
    {
        if (auto level = support::parseLogLevel(*v))
        {
            opts.logLevel = *level;
            return OptionParseResult::Parsed;
        }
        return OptionParseResult::Error;
    }
    if (auto v = optionValue(arg, "--format", index, argc, argv, malformed))
    {
        if (*v == "json")
            opts.format = OutputFormat::Json;
        else if (*v == "yaml")
            opts.format = OutputFormat::Yaml;
        else
            return OptionParseResult::Error;
        return OptionParseResult::Parsed;
    }
    return malformed ? OptionParseResult::Error : OptionParseResult::NotMatched;
}

bool parseCliOptions(int argc, char **argv, CliOptions &opts)
{
    if (const char *env = std::getenv("THYMUS_LOG"))
    {
        if (auto level = support::parseLogLevel(env))
            opts.logLevel = *level;
    }

    for (int i = 0; i < argc; ++i)
    {
        const std::string_view arg(argv[i]);
        switch (parseOption(i, argc, argv, opts))
        {
            case OptionParseResult::Parsed:
                continue;
            case OptionParseResult::Error:
                std::cerr << "thymus: invalid or incomplete option '" << arg << "'\n";
                return false;
            case OptionParseResult::NotMatched:
                break;
        }
        if (arg.size() > 1 && arg.front() == '-')
        {
            std::cerr << "thymus: unknown option '" << arg << "'\n";
            return false;
        }
        opts.positional.emplace_back(arg);
    }
    return true;
}

void finalizeOptions(CliOptions &opts)
{
    std::error_code ec;
    const auto abs = std::filesystem::absolute(opts.root.empty() ? "." : opts.root, ec);
    if (!ec)
        opts.root = support::normalizePath(abs.generic_string());
    if (opts.config.empty())
        opts.config = rules::defaultInvariantsPath(opts.root);
}

support::Expected<std::vector<rules::Invariant>> loadInvariants(const CliOptions &opts,
                                                                const support::Logger &log)
{
    support::DiagnosticEngine diags;
    // The derived cache belongs to the default invariant file only.
    const bool defaultConfig = opts.config == rules::defaultInvariantsPath(opts.root);
    rules::InvariantLoader loader(opts.config, defaultConfig ? rules::defaultCachePath(opts.root) : std::string(),
                                  log);
    auto loaded = loader.load(diags);
    diags.printAll(std::cerr);
    return loaded;
}

} // namespace thymus::tools
