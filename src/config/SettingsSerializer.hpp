#pragma once

#include "AppSettings.hpp"

#include <toml++/toml.h>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Centralized TOML serialization for every configuration table
class SettingsSerializer
{
public:
    static toml::table serializeCleaning(const glyphscrub::CleaningOptions& options);
    static void deserializeCleaning(const toml::table& tbl, glyphscrub::CleaningOptions& options);

    // [variance] also carries the word boundary mode and the synonym dictionary path
    static toml::table serializeVariance(const AppSettings& settings);
    static void deserializeVariance(const toml::table& tbl, AppSettings& settings);

    static toml::table serializeWordExchanges(const std::vector<glyphscrub::WordExchange>& exchanges);
    static void deserializeWordExchanges(const toml::table& tbl, std::vector<glyphscrub::WordExchange>& exchanges);

    static toml::table serializeLogging(const utils::LogSettings& logging);
    static void deserializeLogging(const toml::table& tbl, utils::LogSettings& logging);

    static toml::table serializeDiagnostics(const DiagnosticsSettings& diagnostics);
    static void deserializeDiagnostics(const toml::table& tbl, DiagnosticsSettings& diagnostics);

    static std::string_view boundaryModeName(glyphscrub::WordBoundaryMode mode);
    static std::optional<glyphscrub::WordBoundaryMode> parseBoundaryMode(std::string_view name);
};
