#include "Sanitizer.hpp"
#include "Diagnostics.hpp"
#include "PatternRegistry.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>
#include <utility>

namespace glyphscrub
{

ProcessResult processText(std::string_view text, const SanitizerSettings& settings, const SynonymTable* synonyms)
{
    PROFILE_SCOPE_TEXT("processText", text.size());

    ProcessResult result;
    if (text.empty())
        return result;

    result.detection = detect(text, settings.options, settings.word_exchanges, settings.boundary);
    result.cleaned = Cleaner(synonyms, settings.boundary)
                         .clean(text, settings.options, settings.word_exchanges, settings.variance);

    PLOG_DEBUG << "Processed " << text.size() << " bytes: " << totalIssues(result.detection) << " issues, "
               << result.cleaned.size() << " bytes out";
    return result;
}

std::size_t totalIssues(const DetectionResult& result) noexcept
{
    std::size_t total = result.total_count;
    if (result.additional_cleaning)
        total += result.additional_cleaning->total();
    return total;
}

std::vector<IssueStat> summarize(const DetectionResult& result)
{
    std::vector<IssueStat> stats;

    for (InvisibleCategory category : kAllInvisibleCategories)
    {
        if (std::size_t n = result.count(category); n > 0)
            stats.push_back({ std::string(categoryName(category)), n, IssueKind::Invisible });
    }

    if (!result.additional_cleaning)
        return stats;

    const auto& patterns = PatternRegistry::instance();
    const AdditionalCleaning& extra = *result.additional_cleaning;
    const std::pair<std::string, std::size_t> additional[] = {
        { std::string(patterns.definition(CleaningPattern::MarkdownHeader).name), extra.markdown_headers },
        { std::string(patterns.definition(CleaningPattern::MarkdownBold).name), extra.markdown_bold },
        { std::string(patterns.definition(CleaningPattern::RepeatingChars).name), extra.repeating_chars },
        { std::string(patterns.definition(CleaningPattern::FormattingLine).name), extra.formatting_lines },
        { std::string(patterns.definition(CleaningPattern::ExtraWhitespace).name), extra.extra_whitespace },
        { "wordExchanges", extra.word_exchanges },
    };

    for (const auto& [name, count] : additional)
    {
        if (count > 0)
            stats.push_back({ name, count, IssueKind::Additional });
    }
    return stats;
}

} // namespace glyphscrub
