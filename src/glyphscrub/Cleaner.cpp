#include "Cleaner.hpp"
#include "Diagnostics.hpp"
#include "InvisibleCharacterRegistry.hpp"
#include "PatternRegistry.hpp"
#include "StageRunner.hpp"
#include "TextNormalizer.hpp"
#include "WordExchangeEngine.hpp"
#include "../utils/Profile.hpp"

namespace glyphscrub
{

namespace
{

std::string toUtf8(std::string_view text) { return std::string(text); }

std::string toUtf8(const std::u32string& text) { return utf32ToUtf8(text); }

// `before` is the text the stage received
template<typename T, typename Before>
void traceStage(const StageResult<T>& stage, const Before& before)
{
    if (!Diagnostics::IsVerbose())
        return;

    if (stage.succeeded)
        Diagnostics::TraceStage("Cleaner", stage.stage_name, toUtf8(before), toUtf8(stage.result), stage.duration);
    else
        Diagnostics::TraceFailure("Cleaner", stage.stage_name, stage.error.value_or("unknown"), stage.duration);
}

struct PatternStep
{
    bool enabled;
    CleaningPattern pattern;
};

} // anonymous namespace

std::string stripInvisible(std::string_view text)
{
    const auto& registry = InvisibleCharacterRegistry::instance();

    std::string out;
    out.reserve(text.size());

    std::size_t pos = 0;
    while (pos < text.size())
    {
        Utf8Unit unit = decodeUtf8At(text, pos);
        if (!unit.valid || !registry.isInvisible(unit.codepoint))
            out.append(text.substr(pos, unit.length));
        pos += unit.length;
    }
    return out;
}

Cleaner::Cleaner(const SynonymTable* synonyms, WordBoundaryMode boundary)
    : synonyms_(synonyms)
    , boundary_(boundary)
{
}

std::string Cleaner::clean(std::string_view text, const CleaningOptions& options,
                           const std::vector<WordExchange>& word_exchanges, const VarianceSettings& variance) const
{
    PROFILE_SCOPE_TEXT("Cleaner::clean", text.size());

    Diagnostics::TraceText("Cleaner", "input", text);

    std::string stripped(text);
    if (options.invisible_chars)
    {
        auto invisible_stage = run_stage<std::string>("invisibleChars",
                                                      [&]()
                                                      {
                                                          return stripInvisible(text);
                                                      });
        traceStage(invisible_stage, text);
        if (invisible_stage.succeeded)
            stripped = std::move(invisible_stage.result);
    }

    std::u32string current = utf8ToUtf32(stripped);
    const auto& patterns = PatternRegistry::instance();

    const PatternStep steps[] = {
        { options.markdown_headers, CleaningPattern::MarkdownHeader },
        { options.markdown_bold, CleaningPattern::MarkdownBold },
        { options.repeating_chars, CleaningPattern::RepeatingChars },
        { options.formatting_lines, CleaningPattern::FormattingLine },
        { options.extra_whitespace, CleaningPattern::ExtraWhitespace },
    };

    for (const auto& step : steps)
    {
        if (!step.enabled)
            continue;

        auto pattern_stage = run_stage<std::u32string>(std::string(patterns.definition(step.pattern).name),
                                                       [&]()
                                                       {
                                                           return patterns.replaceMatches(step.pattern, current);
                                                       });
        traceStage(pattern_stage, current);
        if (pattern_stage.succeeded)
            current = std::move(pattern_stage.result);
    }

    if (options.word_exchanges && !word_exchanges.empty())
    {
        WordExchangeEngine engine(variance, synonyms_, boundary_);
        auto exchange_stage = run_stage<std::u32string>("wordExchanges",
                                                        [&]()
                                                        {
                                                            return engine.apply(current, word_exchanges);
                                                        });
        traceStage(exchange_stage, current);
        if (exchange_stage.succeeded)
            current = std::move(exchange_stage.result);
    }

    auto final_stage = run_stage<std::u32string>("finalize",
                                                 [&]()
                                                 {
                                                     return finalize_text(current);
                                                 });
    traceStage(final_stage, current);
    if (final_stage.succeeded)
        current = std::move(final_stage.result);

    std::string output = utf32ToUtf8(current);
    Diagnostics::TraceText("Cleaner", "output", output);
    return output;
}

std::string clean(std::string_view text, const CleaningOptions& options)
{
    return Cleaner().clean(text, options);
}

std::string clean(std::string_view text, const CleaningOptions& options, const std::vector<WordExchange>& word_exchanges,
                  const VarianceSettings& variance)
{
    return Cleaner().clean(text, options, word_exchanges, variance);
}

} // namespace glyphscrub
