#pragma once

#include "../glyphscrub/Sanitizer.hpp"
#include "../utils/LogManager.hpp"

#include <cstddef>
#include <string>

// [diagnostics] table
struct DiagnosticsSettings
{
    bool verbose = false;
    std::size_t max_preview = 160;

    bool operator==(const DiagnosticsSettings&) const = default;
};

// Everything glyphscrub.toml can configure
struct AppSettings
{
    glyphscrub::SanitizerSettings sanitizer;
    std::string synonyms_file; // Empty: no synonym dictionary
    utils::LogSettings logging;
    DiagnosticsSettings diagnostics;
};
