#pragma once

#include <optional>
#include <string>

enum ExitCode
{
    kExitOk = 0,
    kExitFailure = 1, // I/O or configuration failure
    kExitUsage = 2
};

struct CommandLine
{
    std::string config_path = "glyphscrub.toml";
    bool config_given = false; // -c was passed; a missing file is then an error
    std::string input_path;  // Empty or "-": stdin
    std::string output_path; // Empty or "-": stdout
    std::string report_file;
    std::string write_config;
    bool report = false;
    bool strip_only = false;
    bool detect_only = false;
    bool all = false;
    bool verbose = false;
    bool help = false;
};

// getopt_long based parser. On failure returns nullopt and sets `error`.
std::optional<CommandLine> parseCommandLine(int argc, char** argv, std::string& error);

std::string usageText(const char* program);
