#pragma once

#include "CommandLine.hpp"
#include "../config/AppSettings.hpp"

#include <memory>
#include <string>

class ConfigManager;

namespace glyphscrub
{
class SynonymTable;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    bool parseCommandLineArgs();
    bool initializeConfig();
    bool initializeLogging();
    void applyCommandLineOverrides();
    void loadSynonyms();

    int writeConfig();
    int process();

    bool readInput(std::string& text);
    bool writeOutput(const std::string& text);

    // Drains ErrorReporter to stderr; returns true when an Error or Fatal report was seen
    bool flushErrors();

    CommandLine cmd_;
    AppSettings settings_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<glyphscrub::SynonymTable> synonyms_;
    std::string usage_error_;

    int argc_ = 0;
    char** argv_ = nullptr;
};
