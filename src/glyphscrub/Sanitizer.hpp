#pragma once

#include "Cleaner.hpp"
#include "Detector.hpp"
#include "SanitizerTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace glyphscrub
{

class SynonymTable;

// Everything a caller configures for one detect + clean round
struct SanitizerSettings
{
    CleaningOptions options;
    VarianceSettings variance;
    std::vector<WordExchange> word_exchanges;
    WordBoundaryMode boundary = WordBoundaryMode::Ascii;
};

struct ProcessResult
{
    DetectionResult detection;
    std::string cleaned;
};

enum class IssueKind
{
    Invisible,
    Additional
};

struct IssueStat
{
    std::string name; // Category name ("ZERO_WIDTH") or pattern key ("markdownBold")
    std::size_t count = 0;
    IssueKind kind = IssueKind::Invisible;
};

/// Detection and cleaning of the same input. Empty input short-circuits to an empty result.
[[nodiscard]] ProcessResult processText(std::string_view text, const SanitizerSettings& settings,
                                        const SynonymTable* synonyms = nullptr);

/// Invisible hits plus every additional-cleaning count.
[[nodiscard]] std::size_t totalIssues(const DetectionResult& result) noexcept;

/// Non-zero counts only: categories in registry order, then additional-cleaning keys.
[[nodiscard]] std::vector<IssueStat> summarize(const DetectionResult& result);

} // namespace glyphscrub
