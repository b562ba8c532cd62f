#pragma once

#include "../glyphscrub/SanitizerTypes.hpp"

#include <nlohmann/json.hpp>
#include <string>

// JSON rendering of a detection result
class ReportWriter
{
public:
    // { totalCount, categories{NAME: n}, positions, byteOffsets, additionalCleaning?, totalIssues }
    static nlohmann::ordered_json toJson(const glyphscrub::DetectionResult& result);

    static std::string render(const glyphscrub::DetectionResult& result, int indent = 2);

    // Writes render() plus a trailing newline; reports an Io error and returns false on failure
    static bool writeFile(const std::string& path, const glyphscrub::DetectionResult& result);
};
