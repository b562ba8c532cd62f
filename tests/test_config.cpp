#include <catch2/catch_test_macros.hpp>

#include "config/ConfigManager.hpp"
#include "config/SettingsSerializer.hpp"
#include "utils/ErrorReporter.hpp"

#include <plog/Severity.h>
#include <toml++/toml.h>
#include <filesystem>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

using glyphscrub::WordBoundaryMode;
namespace fs = std::filesystem;

namespace
{
class TempConfigDir
{
public:
    TempConfigDir()
    {
        dir_ = "test_temp_config";
        fs::create_directories(dir_);
    }

    ~TempConfigDir()
    {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) const
    {
        std::string path = dir_ + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        return path;
    }

    std::string path(const std::string& name) const { return dir_ + "/" + name; }

private:
    std::string dir_;
};

bool loadInto(const std::string& path, AppSettings& settings)
{
    ConfigManager config(settings, path);
    return config.load();
}
} // namespace

TEST_CASE("ConfigManager - Loading settings from TOML", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("full.toml", R"(
[cleaning]
invisible_chars = false
markdown_bold = true

[variance]
enabled = true
case_variation = false
word_boundary = "unicode"
synonyms_file = "synonyms.json"

[[word_exchange.rules]]
id = "r1"
bad_word = "bad"
good_word = "good"

[[word_exchange.rules]]
bad_word = "foo"
good_word = "bar"
enabled = false

[logging]
level = 5
console = true

[diagnostics]
verbose = true
max_preview = 40
)");

    AppSettings settings;
    REQUIRE(loadInto(path, settings));

    const auto& sanitizer = settings.sanitizer;
    REQUIRE_FALSE(sanitizer.options.invisible_chars);
    REQUIRE(sanitizer.options.markdown_bold);
    REQUIRE_FALSE(sanitizer.options.markdown_headers);

    REQUIRE(sanitizer.variance.enabled);
    REQUIRE_FALSE(sanitizer.variance.case_variation);
    REQUIRE(sanitizer.variance.plural_variation);
    REQUIRE(sanitizer.boundary == WordBoundaryMode::Unicode);
    REQUIRE(settings.synonyms_file == "synonyms.json");

    REQUIRE(sanitizer.word_exchanges.size() == 2);
    REQUIRE(sanitizer.word_exchanges[0] == glyphscrub::WordExchange{ "r1", "bad", "good", true });
    REQUIRE(sanitizer.word_exchanges[1] == glyphscrub::WordExchange{ "rule-2", "foo", "bar", false });

    REQUIRE(settings.logging.level == 5);
    REQUIRE(settings.logging.console);
    REQUIRE(settings.logging.file == "logs/glyphscrub.log");

    REQUIRE(settings.diagnostics.verbose);
    REQUIRE(settings.diagnostics.max_preview == 40);
}

TEST_CASE("ConfigManager - Missing file keeps defaults", "[config]")
{
    AppSettings settings;
    ConfigManager config(settings, "test_temp_config/absent.toml");

    REQUIRE_FALSE(config.exists());
    REQUIRE(config.load());
    REQUIRE_FALSE(config.loadedFromFile());
    REQUIRE(settings.sanitizer.options == glyphscrub::CleaningOptions{});
    REQUIRE(settings.sanitizer.word_exchanges.empty());
    REQUIRE(settings.logging == utils::LogSettings{});
}

TEST_CASE("ConfigManager - Parse errors are reported", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("broken.toml", "[cleaning\nmarkdown_bold = true\n");

    utils::ErrorReporter::ClearErrors();

    AppSettings settings;
    ConfigManager config(settings, path);
    REQUIRE_FALSE(config.load());
    REQUIRE_FALSE(config.loadedFromFile());
    REQUIRE_FALSE(settings.sanitizer.options.markdown_bold);

    auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 1);
    REQUIRE(reports[0].category == utils::ErrorCategory::Configuration);
    REQUIRE(reports[0].severity == utils::ErrorSeverity::Warning);
    // Path and line of the error
    REQUIRE(reports[0].details.find(path + ":") == 0);
}

TEST_CASE("ConfigManager - Invalid values fall back", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("invalid.toml", R"(
[cleaning]
markdown_bold = "yes"
repeating_chars = 1

[variance]
word_boundary = "klingon"

[word_exchange]
rules = [ "not a table", { bad_word = "x", good_word = "y" } ]

[logging]
level = 9

[diagnostics]
max_preview = 0
)");

    utils::ErrorReporter::ClearErrors();

    AppSettings settings;
    settings.sanitizer.boundary = WordBoundaryMode::Unicode;
    REQUIRE(loadInto(path, settings));

    REQUIRE_FALSE(settings.sanitizer.options.markdown_bold);
    REQUIRE_FALSE(settings.sanitizer.options.repeating_chars);
    REQUIRE(settings.sanitizer.boundary == WordBoundaryMode::Ascii);
    REQUIRE(settings.logging.level == plog::info);
    REQUIRE(settings.diagnostics.max_preview == 160);

    REQUIRE(settings.sanitizer.word_exchanges.size() == 1);
    REQUIRE(settings.sanitizer.word_exchanges[0].id == "rule-2");

    // word_boundary and logging.level each raise a warning
    REQUIRE(utils::ErrorReporter::GetPendingErrors().size() == 2);
}

TEST_CASE("ConfigManager - Save and reload", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("round.toml", R"(
[custom]
answer = 42

[cleaning]
markdown_headers = true
)");

    AppSettings saved;
    ConfigManager config(saved, path);
    REQUIRE(config.load());
    REQUIRE(saved.sanitizer.options.markdown_headers);

    saved.sanitizer.options.extra_whitespace = true;
    saved.sanitizer.variance.synonym_variation = true;
    saved.sanitizer.boundary = WordBoundaryMode::Unicode;
    saved.sanitizer.word_exchanges = { { "a", "teh", "the", true }, { "b", "recieve", "receive", false } };
    saved.synonyms_file = "words.json";
    saved.logging.level = plog::debug;
    saved.diagnostics.max_preview = 64;
    REQUIRE(config.save());
    REQUIRE_FALSE(fs::exists(path + ".tmp"));

    SECTION("Owned values round-trip")
    {
        AppSettings loaded;
        REQUIRE(loadInto(path, loaded));
        REQUIRE(loaded.sanitizer.options == saved.sanitizer.options);
        REQUIRE(loaded.sanitizer.variance == saved.sanitizer.variance);
        REQUIRE(loaded.sanitizer.boundary == WordBoundaryMode::Unicode);
        REQUIRE(loaded.sanitizer.word_exchanges == saved.sanitizer.word_exchanges);
        REQUIRE(loaded.synonyms_file == "words.json");
        REQUIRE(loaded.logging == saved.logging);
        REQUIRE(loaded.diagnostics == saved.diagnostics);
    }

    SECTION("Unknown tables survive")
    {
        toml::table root = toml::parse_file(path);
        REQUIRE(root["custom"]["answer"].value<int64_t>() == 42);
        REQUIRE(root["cleaning"]["extra_whitespace"].value<bool>() == true);
        REQUIRE(root["variance"]["word_boundary"].value<std::string>() == "unicode");
    }
}

TEST_CASE("ConfigManager - Unknown tables and keys are reported", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("typos.toml", R"(
[cleaning]
markdown_bol = true
extra_whitespace = true

[cleanup]
markdown_bold = true
)");

    utils::ErrorReporter::ClearErrors();

    AppSettings settings;
    ConfigManager config(settings, path);
    REQUIRE(config.load());
    REQUIRE_FALSE(settings.sanitizer.options.markdown_bold);
    REQUIRE(settings.sanitizer.options.extra_whitespace);

    auto reports = utils::ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].message == "Unknown table ignored");
    REQUIRE(reports[0].details.find("[cleanup]") != std::string::npos);
    REQUIRE(reports[1].message == "Unknown key ignored");
    REQUIRE(reports[1].details.find("cleaning.markdown_bol") != std::string::npos);

    SECTION("They are kept on save")
    {
        REQUIRE(config.save());
        toml::table root = toml::parse_file(path);
        REQUIRE(root["cleaning"]["markdown_bol"].value<bool>() == true);
        REQUIRE(root["cleanup"]["markdown_bold"].value<bool>() == true);
    }
}

TEST_CASE("ConfigManager - A known name that is not a table", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("scalar.toml", "cleaning = true\n");

    utils::ErrorReporter::ClearErrors();

    AppSettings settings;
    ConfigManager config(settings, path);
    REQUIRE(config.load());
    REQUIRE(settings.sanitizer.options == glyphscrub::CleaningOptions{});
    REQUIRE(utils::ErrorReporter::GetPendingErrors().size() == 1);

    REQUIRE(config.save());
    toml::table root = toml::parse_file(path);
    REQUIRE(root["cleaning"].is_table());
    REQUIRE(root["cleaning"]["invisible_chars"].value<bool>() == true);
}

TEST_CASE("ConfigManager - Writing the effective settings elsewhere", "[config]")
{
    TempConfigDir dir;
    const std::string source = dir.write("source.toml", "[cleaning]\nmarkdown_bold = true\n");
    const std::string target = dir.path("effective.toml");

    AppSettings settings;
    ConfigManager config(settings, source);
    REQUIRE(config.load());
    settings.sanitizer.options.repeating_chars = true;

    REQUIRE(config.saveAs(target));

    AppSettings reloaded;
    REQUIRE(loadInto(target, reloaded));
    REQUIRE(reloaded.sanitizer.options.markdown_bold);
    REQUIRE(reloaded.sanitizer.options.repeating_chars);

    // The source file is left as it was
    AppSettings original;
    REQUIRE(loadInto(source, original));
    REQUIRE_FALSE(original.sanitizer.options.repeating_chars);
}

TEST_CASE("ConfigManager - Every section is recognised", "[config]")
{
    TempConfigDir dir;
    const std::string path = dir.write("sections.toml", R"(
[cleaning]
[variance]
[word_exchange]
[logging]
[diagnostics]
)");

    utils::ErrorReporter::ClearErrors();

    AppSettings settings;
    REQUIRE(loadInto(path, settings));
    REQUIRE(utils::ErrorReporter::GetPendingErrors().empty());
}

TEST_CASE("SettingsSerializer - Word boundary names", "[config]")
{
    REQUIRE(SettingsSerializer::boundaryModeName(WordBoundaryMode::Ascii) == "ascii");
    REQUIRE(SettingsSerializer::boundaryModeName(WordBoundaryMode::Unicode) == "unicode");
    REQUIRE(SettingsSerializer::parseBoundaryMode("unicode") == WordBoundaryMode::Unicode);
    REQUIRE_FALSE(SettingsSerializer::parseBoundaryMode("Unicode").has_value());
}
