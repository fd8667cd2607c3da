//===----------------------------------------------------------------------===//
//
// Part of the Thymus project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: rules/InvariantLoader.cpp
// Purpose: yaml-cpp schema reader and nlohmann::json cache for invariants.
//
//===----------------------------------------------------------------------===//

#include "rules/InvariantLoader.hpp"

#include "io/JsonCodec.hpp"
#include "support/diagnostics.hpp"
#include "support/logger.hpp"
#include "support/path_utils.hpp"
#include "support/source_loader.hpp"

#include <yaml-cpp/yaml.h>

#include <filesystem>
#include <fstream>

namespace thymus::rules
{

namespace fs = std::filesystem;

namespace
{
/// @brief Raised while reading one record; carries the message for its diagnostic.
struct SchemaError
{
    std::string message;
};

std::string scalarField(const YAML::Node &record, const char *key)
{
    const YAML::Node node = record[key];
    if (!node || node.IsNull())
        return {};
    if (!node.IsScalar())
        throw SchemaError{std::string("field '") + key + "' must be a scalar"};
    return node.as<std::string>();
}

std::vector<std::string> listField(const YAML::Node &record, const char *key)
{
    const YAML::Node node = record[key];
    std::vector<std::string> out;
    if (!node || node.IsNull())
        return out;
    if (node.IsScalar())
    {
        out.push_back(node.as<std::string>());
        return out;
    }
    if (!node.IsSequence())
        throw SchemaError{std::string("field '") + key + "' must be a string or a list"};
    for (const auto &item : node)
    {
        if (!item.IsScalar())
            throw SchemaError{std::string("field '") + key + "' must contain only strings"};
        out.push_back(item.as<std::string>());
    }
    return out;
}

Invariant readRecord(const YAML::Node &record)
{
    if (!record.IsMap())
        throw SchemaError{"invariant record must be a mapping"};

    Invariant inv;
    inv.id = scalarField(record, "id");
    if (inv.id.empty())
        throw SchemaError{"missing required field 'id'"};

    const std::string type = scalarField(record, "type");
    if (type.empty())
        throw SchemaError{"invariant " + inv.id + ": missing required field 'type'"};
    const auto kind = parseRuleKind(type);
    if (!kind)
        throw SchemaError{"invariant " + inv.id + ": unknown type '" + type + "'"};
    inv.kind = *kind;

    const std::string severity = scalarField(record, "severity");
    if (!severity.empty())
    {
        const auto sev = parseSeverity(severity);
        if (!sev)
            throw SchemaError{"invariant " + inv.id + ": unknown severity '" + severity + "'"};
        inv.severity = *sev;
    }

    inv.description = scalarField(record, "description");
    inv.sourceGlob = scalarField(record, "source_glob");
    inv.scopeGlob = scalarField(record, "scope_glob");
    inv.scopeGlobExclude = listField(record, "scope_glob_exclude");
    inv.forbiddenImports = listField(record, "forbidden_imports");
    inv.allowedImports = listField(record, "allowed_imports");
    inv.forbiddenPattern = scalarField(record, "forbidden_pattern");
    inv.rule = scalarField(record, "rule");
    inv.package = scalarField(record, "package");
    inv.allowedIn = listField(record, "allowed_in");

    if (const YAML::Node inferred = record["inferred"]; inferred && inferred.IsScalar())
        inv.inferred = inferred.as<bool>(false);
    if (const YAML::Node confidence = record["confidence"]; confidence && confidence.IsScalar())
        inv.confidence = confidence.as<double>();
    return inv;
}

bool newerThan(const std::string &a, const std::string &b)
{
    std::error_code ec;
    const auto ta = fs::last_write_time(a, ec);
    if (ec)
        return false;
    const auto tb = fs::last_write_time(b, ec);
    if (ec)
        return false;
    return ta > tb;
}
} // namespace

std::string defaultInvariantsPath(const std::string &root)
{
    return support::joinPath(root, ".thymus/invariants.yml");
}

std::string defaultCachePath(const std::string &root)
{
    return support::joinPath(root, ".thymus/cache/invariants.json");
}

support::Expected<std::vector<Invariant>> parseInvariantsYaml(const std::string &text,
                                                              const std::string &sourceName,
                                                              support::DiagnosticEngine &diags)
{
    using Result = support::Expected<std::vector<Invariant>>;

    YAML::Node doc;
    try
    {
        doc = YAML::Load(text);
    }
    catch (const YAML::Exception &e)
    {
        return Result(support::makeError({sourceName, static_cast<uint32_t>(e.mark.line + 1)},
                                         "invalid YAML: " + e.msg));
    }

    std::vector<Invariant> invariants;
    if (!doc || doc.IsNull())
        return invariants;

    YAML::Node records = doc;
    if (doc.IsMap())
    {
        records = doc["invariants"];
        if (!records || records.IsNull())
            return invariants;
    }
    if (!records.IsSequence())
        return Result(support::makeError({sourceName, 0}, "'invariants' must be a list of records"));

    for (const auto &record : records)
    {
        const support::SourceLoc loc{sourceName, static_cast<uint32_t>(record.Mark().line + 1)};
        try
        {
            invariants.push_back(readRecord(record));
        }
        catch (const SchemaError &e)
        {
            diags.report(support::makeWarning(loc, e.message + "; record skipped"));
        }
        catch (const YAML::Exception &e)
        {
            diags.report(support::makeWarning(loc, "malformed record: " + e.msg + "; record skipped"));
        }
    }
    return invariants;
}

InvariantLoader::InvariantLoader(std::string yamlPath, std::string cachePath, const support::Logger &log)
    : yamlPath_(std::move(yamlPath)), cachePath_(std::move(cachePath)), log_(log)
{
}

bool InvariantLoader::cacheIsFresh() const
{
    return !cachePath_.empty() && newerThan(cachePath_, yamlPath_);
}

bool InvariantLoader::readCache(std::vector<Invariant> &out) const
{
    auto text = support::loadSourceFile(cachePath_);
    if (!text)
        return false;
    auto parsed = io::parseJson(text.value(), cachePath_);
    if (!parsed)
    {
        log_.warn("config", parsed.error().message);
        return false;
    }
    auto invariants = io::invariantsFromJson(parsed.value());
    if (!invariants)
    {
        log_.warn("config", "ignoring cache " + cachePath_ + ": " + invariants.error().message);
        return false;
    }
    out = std::move(invariants.value());
    return true;
}

void InvariantLoader::writeCache(const std::vector<Invariant> &invariants) const
{
    if (cachePath_.empty())
        return;
    std::error_code ec;
    fs::create_directories(fs::path(cachePath_).parent_path(), ec);
    std::ofstream out(cachePath_, std::ios::binary | std::ios::trunc);
    if (!out)
    {
        log_.warn("config", "cannot write invariant cache " + cachePath_);
        return;
    }
    out << io::invariantsToJson(invariants).dump() << '\n';
    if (!out)
        log_.warn("config", "failed writing invariant cache " + cachePath_);
}

support::Expected<std::vector<Invariant>> InvariantLoader::load(support::DiagnosticEngine &diags) const
{
    using Result = support::Expected<std::vector<Invariant>>;

    std::error_code ec;
    if (!fs::is_regular_file(yamlPath_, ec))
        return Result(support::makeError("invariant file not found: " + yamlPath_));

    if (cacheIsFresh())
    {
        std::vector<Invariant> cached;
        if (readCache(cached))
        {
            log_.debug("config", "loaded " + std::to_string(cached.size()) + " invariants from cache");
            return cached;
        }
    }

    auto text = support::loadSourceFile(yamlPath_);
    if (!text)
        return Result(text.error());

    const std::size_t warningsBefore = diags.warningCount();
    auto parsed = parseInvariantsYaml(text.value(), yamlPath_, diags);
    if (!parsed)
        return parsed;

    log_.info("config", "parsed " + std::to_string(parsed.value().size()) + " invariants from " + yamlPath_);
    // Skipped records must be reported on every load, so their file is never cached.
    if (diags.warningCount() == warningsBefore)
        writeCache(parsed.value());
    else
        log_.debug("config", "not caching " + yamlPath_ + ": records were skipped");
    return parsed;
}

} // namespace thymus::rules
