#include "SettingsSerializer.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>
#include <cstdint>

using glyphscrub::CleaningOptions;
using glyphscrub::WordBoundaryMode;
using glyphscrub::WordExchange;

namespace
{

// Wrong-typed values leave the current (default) value in place
inline void read_bool(const toml::table& t, std::string_view key, bool& out)
{
    if (auto v = t[key].value<bool>())
        out = *v;
}

inline void read_string(const toml::table& t, std::string_view key, std::string& out)
{
    if (auto v = t[key].value<std::string>())
        out = *v;
}

} // namespace

toml::table SettingsSerializer::serializeCleaning(const CleaningOptions& options)
{
    toml::table t;
    t.insert("invisible_chars", options.invisible_chars);
    t.insert("markdown_headers", options.markdown_headers);
    t.insert("markdown_bold", options.markdown_bold);
    t.insert("repeating_chars", options.repeating_chars);
    t.insert("formatting_lines", options.formatting_lines);
    t.insert("extra_whitespace", options.extra_whitespace);
    t.insert("word_exchanges", options.word_exchanges);
    return t;
}

void SettingsSerializer::deserializeCleaning(const toml::table& t, CleaningOptions& options)
{
    read_bool(t, "invisible_chars", options.invisible_chars);
    read_bool(t, "markdown_headers", options.markdown_headers);
    read_bool(t, "markdown_bold", options.markdown_bold);
    read_bool(t, "repeating_chars", options.repeating_chars);
    read_bool(t, "formatting_lines", options.formatting_lines);
    read_bool(t, "extra_whitespace", options.extra_whitespace);
    read_bool(t, "word_exchanges", options.word_exchanges);
}

toml::table SettingsSerializer::serializeVariance(const AppSettings& settings)
{
    const auto& variance = settings.sanitizer.variance;

    toml::table t;
    t.insert("enabled", variance.enabled);
    t.insert("synonym_variation", variance.synonym_variation);
    t.insert("case_variation", variance.case_variation);
    t.insert("plural_variation", variance.plural_variation);
    t.insert("word_boundary", std::string(boundaryModeName(settings.sanitizer.boundary)));
    t.insert("synonyms_file", settings.synonyms_file);
    return t;
}

void SettingsSerializer::deserializeVariance(const toml::table& t, AppSettings& settings)
{
    auto& variance = settings.sanitizer.variance;
    read_bool(t, "enabled", variance.enabled);
    read_bool(t, "synonym_variation", variance.synonym_variation);
    read_bool(t, "case_variation", variance.case_variation);
    read_bool(t, "plural_variation", variance.plural_variation);
    read_string(t, "synonyms_file", settings.synonyms_file);

    if (auto name = t["word_boundary"].value<std::string>())
    {
        if (auto mode = parseBoundaryMode(*name))
        {
            settings.sanitizer.boundary = *mode;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown word_boundary value, using \"ascii\"",
                                                "variance.word_boundary = \"" + *name + "\"");
            settings.sanitizer.boundary = WordBoundaryMode::Ascii;
        }
    }
}

toml::table SettingsSerializer::serializeWordExchanges(const std::vector<WordExchange>& exchanges)
{
    toml::array rules;
    for (const auto& exchange : exchanges)
    {
        toml::table rule;
        rule.insert("id", exchange.id);
        rule.insert("bad_word", exchange.bad_word);
        rule.insert("good_word", exchange.good_word);
        rule.insert("enabled", exchange.enabled);
        rules.push_back(std::move(rule));
    }

    toml::table t;
    t.insert("rules", std::move(rules));
    return t;
}

void SettingsSerializer::deserializeWordExchanges(const toml::table& t, std::vector<WordExchange>& exchanges)
{
    auto* rules = t["rules"].as_array();
    if (!rules)
        return;

    exchanges.clear();
    std::size_t index = 0;
    for (const auto& node : *rules)
    {
        ++index;
        const auto* rule = node.as_table();
        if (!rule)
        {
            PLOG_WARNING << "word_exchange.rules[" << index - 1 << "] is not a table; skipping";
            continue;
        }

        WordExchange exchange;
        exchange.id = "rule-" + std::to_string(index);
        read_string(*rule, "id", exchange.id);
        read_string(*rule, "bad_word", exchange.bad_word);
        read_string(*rule, "good_word", exchange.good_word);
        read_bool(*rule, "enabled", exchange.enabled);
        exchanges.push_back(std::move(exchange));
    }
}

toml::table SettingsSerializer::serializeLogging(const utils::LogSettings& logging)
{
    toml::table t;
    t.insert("level", static_cast<int64_t>(logging.level));
    t.insert("append", logging.append);
    t.insert("file", logging.file);
    t.insert("console", logging.console);
    return t;
}

void SettingsSerializer::deserializeLogging(const toml::table& t, utils::LogSettings& logging)
{
    if (auto level = t["level"].value<int64_t>())
    {
        if (*level >= 0 && *level <= 6)
        {
            logging.level = static_cast<int>(*level);
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "logging.level must be between 0 and 6",
                                                "logging.level = " + std::to_string(*level));
        }
    }
    read_bool(t, "append", logging.append);
    read_string(t, "file", logging.file);
    read_bool(t, "console", logging.console);
}

toml::table SettingsSerializer::serializeDiagnostics(const DiagnosticsSettings& diagnostics)
{
    toml::table t;
    t.insert("verbose", diagnostics.verbose);
    t.insert("max_preview", static_cast<int64_t>(diagnostics.max_preview));
    return t;
}

void SettingsSerializer::deserializeDiagnostics(const toml::table& t, DiagnosticsSettings& diagnostics)
{
    read_bool(t, "verbose", diagnostics.verbose);
    if (auto preview = t["max_preview"].value<int64_t>(); preview && *preview > 0)
        diagnostics.max_preview = static_cast<std::size_t>(*preview);
}

std::string_view SettingsSerializer::boundaryModeName(WordBoundaryMode mode)
{
    switch (mode)
    {
    case WordBoundaryMode::Unicode:
        return "unicode";
    case WordBoundaryMode::Ascii:
    default:
        return "ascii";
    }
}

std::optional<WordBoundaryMode> SettingsSerializer::parseBoundaryMode(std::string_view name)
{
    if (name == "ascii")
        return WordBoundaryMode::Ascii;
    if (name == "unicode")
        return WordBoundaryMode::Unicode;
    return std::nullopt;
}
