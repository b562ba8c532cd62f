#include "ReportWriter.hpp"
#include "../glyphscrub/PatternRegistry.hpp"
#include "../glyphscrub/Sanitizer.hpp"
#include "../utils/ErrorReporter.hpp"

#include <fstream>
#include <plog/Log.h>

using glyphscrub::CleaningPattern;

nlohmann::ordered_json ReportWriter::toJson(const glyphscrub::DetectionResult& result)
{
    nlohmann::ordered_json report;
    report["totalCount"] = result.total_count;

    nlohmann::ordered_json categories = nlohmann::ordered_json::object();
    for (auto category : glyphscrub::kAllInvisibleCategories)
    {
        categories[std::string(glyphscrub::categoryName(category))] = result.count(category);
    }
    report["categories"] = std::move(categories);
    report["positions"] = result.positions;
    report["byteOffsets"] = result.byte_offsets;

    if (result.additional_cleaning)
    {
        const auto& patterns = glyphscrub::PatternRegistry::instance();
        const auto& extra = *result.additional_cleaning;

        auto key = [&patterns](CleaningPattern pattern) { return std::string(patterns.definition(pattern).name); };

        nlohmann::ordered_json additional;
        additional[key(CleaningPattern::MarkdownHeader)] = extra.markdown_headers;
        additional[key(CleaningPattern::MarkdownBold)] = extra.markdown_bold;
        additional[key(CleaningPattern::RepeatingChars)] = extra.repeating_chars;
        additional[key(CleaningPattern::FormattingLine)] = extra.formatting_lines;
        additional[key(CleaningPattern::ExtraWhitespace)] = extra.extra_whitespace;
        additional["wordExchanges"] = extra.word_exchanges;
        report["additionalCleaning"] = std::move(additional);
    }

    report["totalIssues"] = glyphscrub::totalIssues(result);
    return report;
}

std::string ReportWriter::render(const glyphscrub::DetectionResult& result, int indent)
{
    return toJson(result).dump(indent);
}

bool ReportWriter::writeFile(const std::string& path, const glyphscrub::DetectionResult& result)
{
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Could not write report file", path);
        return false;
    }

    ofs << render(result) << '\n';
    if (!ofs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed while writing report file", path);
        return false;
    }

    PLOG_INFO << "Wrote detection report to " << path;
    return true;
}
