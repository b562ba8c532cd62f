#include "Detector.hpp"
#include "Diagnostics.hpp"
#include "InvisibleCharacterRegistry.hpp"
#include "PatternRegistry.hpp"
#include "WordExchangeEngine.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace glyphscrub
{

namespace
{

bool wantsAdditionalCleaning(const CleaningOptions& options) noexcept
{
    return options.markdown_headers || options.markdown_bold || options.repeating_chars ||
           options.formatting_lines || options.extra_whitespace || options.word_exchanges;
}

AdditionalCleaning countAdditional(std::string_view text, const CleaningOptions& options,
                                   const std::vector<WordExchange>* word_exchanges, WordBoundaryMode boundary)
{
    const auto& patterns = PatternRegistry::instance();
    const std::u32string wide = utf8ToUtf32(text);

    AdditionalCleaning counts;
    if (options.markdown_headers)
        counts.markdown_headers = patterns.countMatches(CleaningPattern::MarkdownHeader, wide);
    if (options.markdown_bold)
        counts.markdown_bold = patterns.countMatches(CleaningPattern::MarkdownBold, wide);
    if (options.repeating_chars)
        counts.repeating_chars = patterns.countMatches(CleaningPattern::RepeatingChars, wide);
    if (options.formatting_lines)
        counts.formatting_lines = patterns.countMatches(CleaningPattern::FormattingLine, wide);
    if (options.extra_whitespace)
        counts.extra_whitespace = patterns.countMatches(CleaningPattern::ExtraWhitespace, wide);
    if (options.word_exchanges && word_exchanges)
    {
        WordExchangeEngine engine(VarianceSettings{}, nullptr, boundary);
        counts.word_exchanges = engine.countLiteral(wide, *word_exchanges);
    }
    return counts;
}

DetectionResult detectImpl(std::string_view text, const CleaningOptions& options,
                           const std::vector<WordExchange>* word_exchanges, WordBoundaryMode boundary)
{
    PROFILE_SCOPE_TEXT("detect", text.size());

    DetectionResult result = options.invisible_chars ? detectInvisible(text) : DetectionResult{};
    if (wantsAdditionalCleaning(options))
        result.additional_cleaning = countAdditional(text, options, word_exchanges, boundary);

    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[Detector] invisible=" << result.total_count << " additional="
            << (result.additional_cleaning ? result.additional_cleaning->total() : 0);
        Diagnostics::TraceText("Detector", "input", text);
    }
    return result;
}

} // namespace

DetectionResult detectInvisible(std::string_view text)
{
    const auto& registry = InvisibleCharacterRegistry::instance();
    DetectionResult result;

    std::size_t byte_offset = 0;
    std::size_t utf16_offset = 0;
    while (byte_offset < text.size())
    {
        Utf8Unit unit = decodeUtf8At(text, byte_offset);

        // Malformed bytes stand alone: one code unit, never invisible
        if (unit.valid)
        {
            if (auto category = registry.categorize(unit.codepoint))
            {
                ++result.total_count;
                ++result.categories[categoryIndex(*category)];
                result.positions.push_back(utf16_offset);
                result.byte_offsets.push_back(byte_offset);
            }
            utf16_offset += utf16Length(unit.codepoint);
        }
        else
        {
            utf16_offset += 1;
        }
        byte_offset += unit.length;
    }

    return result;
}

DetectionResult detect(std::string_view text, const CleaningOptions& options)
{
    return detectImpl(text, options, nullptr, WordBoundaryMode::Ascii);
}

DetectionResult detect(std::string_view text, const CleaningOptions& options,
                       const std::vector<WordExchange>& word_exchanges, WordBoundaryMode boundary)
{
    return detectImpl(text, options, &word_exchanges, boundary);
}

} // namespace glyphscrub
