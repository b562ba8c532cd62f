#pragma once

#include "SanitizerTypes.hpp"
#include "TextUtils.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace glyphscrub
{

class SynonymTable;

/// Removes every registry code point. Multi-byte sequences are kept or dropped whole and
/// malformed bytes are copied through untouched.
[[nodiscard]] std::string stripInvisible(std::string_view text);

/**
 * @brief Applies the enabled transformations in their fixed order.
 *
 *   1. invisible characters      5. formatting-divider lines
 *   2. markdown headers          6. whitespace runs
 *   3. markdown bold             7. word exchanges
 *   4. repeated characters       8. newline collapse + trim (always)
 *
 * Each step works on the previous step's output. A step that throws is logged, reported and
 * skipped; the input is never modified.
 */
class Cleaner
{
public:
    explicit Cleaner(const SynonymTable* synonyms = nullptr, WordBoundaryMode boundary = WordBoundaryMode::Ascii);

    [[nodiscard]] std::string clean(std::string_view text, const CleaningOptions& options,
                                    const std::vector<WordExchange>& word_exchanges = {},
                                    const VarianceSettings& variance = {}) const;

private:
    const SynonymTable* synonyms_ = nullptr;
    WordBoundaryMode boundary_;
};

[[nodiscard]] std::string clean(std::string_view text, const CleaningOptions& options);

[[nodiscard]] std::string clean(std::string_view text, const CleaningOptions& options,
                                const std::vector<WordExchange>& word_exchanges,
                                const VarianceSettings& variance = {});

} // namespace glyphscrub
