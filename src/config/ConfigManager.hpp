#pragma once

#include "AppSettings.hpp"

#include <string>
#include <string_view>
#include <vector>

#include <toml++/toml.h>

/**
 * @brief glyphscrub.toml: reads it into an AppSettings and writes the settings back.
 *
 * The file format defines [cleaning], [variance], [word_exchange], [logging] and [diagnostics].
 * Anything else (other tables, unknown keys inside those tables) is reported as a likely typo on
 * load and left untouched on save.
 */
class ConfigManager
{
public:
    explicit ConfigManager(AppSettings& settings, std::string config_path = "glyphscrub.toml");

    // A missing file leaves the defaults in place and succeeds. A parse error leaves them in place,
    // reports a warning and fails.
    bool load();

    // Temp file + rename. Known keys come from the settings, everything else from the loaded file.
    bool save() { return saveAs(config_path_); }
    bool saveAs(const std::string& path);

    const std::string& configPath() const { return config_path_; }
    bool exists() const;
    bool loadedFromFile() const { return loaded_from_file_; }

private:
    struct TableSpec
    {
        std::string_view name;
        std::vector<std::string_view> keys;
        void (*read)(const toml::table&, AppSettings&);
        toml::table (*write)(const AppSettings&);
    };

    static const std::vector<TableSpec>& tableSpecs();

    void applyDocument();
    toml::table mergedDocument() const;

    AppSettings& settings_;
    std::string config_path_;
    toml::table document_;
    bool loaded_from_file_ = false;
};
