#include "ConfigManager.hpp"
#include "SettingsSerializer.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

using utils::ErrorCategory;
using utils::ErrorReporter;

ConfigManager::ConfigManager(AppSettings& settings, std::string config_path)
    : settings_(settings)
    , config_path_(std::move(config_path))
{
}

const std::vector<ConfigManager::TableSpec>& ConfigManager::tableSpecs()
{
    static const std::vector<TableSpec> specs = {
        { "cleaning",
          { "invisible_chars", "markdown_headers", "markdown_bold", "repeating_chars", "formatting_lines",
            "extra_whitespace", "word_exchanges" },
          [](const toml::table& t, AppSettings& s) { SettingsSerializer::deserializeCleaning(t, s.sanitizer.options); },
          [](const AppSettings& s) { return SettingsSerializer::serializeCleaning(s.sanitizer.options); } },
        { "variance",
          { "enabled", "synonym_variation", "case_variation", "plural_variation", "word_boundary", "synonyms_file" },
          [](const toml::table& t, AppSettings& s) { SettingsSerializer::deserializeVariance(t, s); },
          [](const AppSettings& s) { return SettingsSerializer::serializeVariance(s); } },
        { "word_exchange",
          { "rules" },
          [](const toml::table& t, AppSettings& s)
          { SettingsSerializer::deserializeWordExchanges(t, s.sanitizer.word_exchanges); },
          [](const AppSettings& s) { return SettingsSerializer::serializeWordExchanges(s.sanitizer.word_exchanges); } },
        { "logging",
          { "level", "append", "file", "console" },
          [](const toml::table& t, AppSettings& s) { SettingsSerializer::deserializeLogging(t, s.logging); },
          [](const AppSettings& s) { return SettingsSerializer::serializeLogging(s.logging); } },
        { "diagnostics",
          { "verbose", "max_preview" },
          [](const toml::table& t, AppSettings& s) { SettingsSerializer::deserializeDiagnostics(t, s.diagnostics); },
          [](const AppSettings& s) { return SettingsSerializer::serializeDiagnostics(s.diagnostics); } },
    };
    return specs;
}

bool ConfigManager::exists() const
{
    std::error_code ec;
    return fs::is_regular_file(config_path_, ec);
}

bool ConfigManager::load()
{
    document_ = toml::table{};
    loaded_from_file_ = false;

    if (!exists())
    {
        PLOG_DEBUG << "No config at " << config_path_ << ", using defaults";
        return true;
    }

    try
    {
        document_ = toml::parse_file(config_path_);
    }
    catch (const toml::parse_error& pe)
    {
        std::string details = config_path_;
        if (pe.source().begin.line > 0)
            details += ":" + std::to_string(pe.source().begin.line);
        details += ": " + std::string(pe.description());

        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Configuration file has errors, using defaults",
                                     details);
        return false;
    }

    loaded_from_file_ = true;
    applyDocument();
    PLOG_INFO << "Loaded config from " << config_path_;
    return true;
}

void ConfigManager::applyDocument()
{
    const auto& specs = tableSpecs();

    for (auto&& [key, node] : document_)
    {
        const bool known = std::any_of(specs.begin(), specs.end(),
                                       [&](const TableSpec& spec) { return spec.name == key.str(); });
        if (!known)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown table ignored",
                                         config_path_ + ": [" + std::string(key.str()) + "]");
        }
    }

    for (const auto& spec : specs)
    {
        const toml::node* node = document_.get(spec.name);
        if (!node)
            continue;

        const toml::table* table = node->as_table();
        if (!table)
        {
            ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Expected a table, using defaults",
                                         config_path_ + ": " + std::string(spec.name));
            continue;
        }

        for (auto&& [key, value] : *table)
        {
            if (std::find(spec.keys.begin(), spec.keys.end(), key.str()) == spec.keys.end())
            {
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown key ignored",
                                             config_path_ + ": " + std::string(spec.name) + "." +
                                                 std::string(key.str()));
            }
        }

        spec.read(*table, settings_);
    }
}

toml::table ConfigManager::mergedDocument() const
{
    toml::table output = document_;

    for (const auto& spec : tableSpecs())
    {
        toml::table written = spec.write(settings_);

        toml::table* target = output.get_as<toml::table>(spec.name);
        if (!target)
        {
            output.insert_or_assign(spec.name, toml::table{});
            target = output.get_as<toml::table>(spec.name);
        }

        for (const auto key : spec.keys)
        {
            if (written.contains(key))
                target->insert_or_assign(key, written[key]);
            else
                target->erase(key);
        }
    }

    return output;
}

bool ConfigManager::saveAs(const std::string& path)
{
    const toml::table output = mergedDocument();

    const std::string tmp = path + ".tmp";
    {
        std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
        if (!ofs)
        {
            ErrorReporter::ReportError(ErrorCategory::Io, "Failed to write configuration", "cannot create " + tmp);
            return false;
        }
        ofs << output << '\n';
        if (!ofs.flush())
        {
            ErrorReporter::ReportError(ErrorCategory::Io, "Failed to write configuration", "write failed for " + tmp);
            return false;
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Io, "Failed to write configuration",
                                   "cannot rename " + tmp + ": " + ec.message());
        fs::remove(tmp, ec);
        return false;
    }

    if (path == config_path_)
        document_ = output;

    PLOG_INFO << "Saved config to " << path;
    return true;
}
