#pragma once

#include "SanitizerTypes.hpp"
#include "TextUtils.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace glyphscrub
{

class SynonymTable;

/// Enabled, with a bad word and a good word that are non-empty once trimmed.
[[nodiscard]] bool isActive(const WordExchange& exchange);

[[nodiscard]] std::vector<WordExchange> activeExchanges(const std::vector<WordExchange>& exchanges);

/**
 * @brief Whole-word, case-insensitive word substitution.
 *
 * Words are matched as literal code-point sequences: nothing the user types is ever interpreted
 * as a pattern, and the replacement is inserted verbatim. A match needs a word boundary on both
 * sides, where a boundary is a change in word-ness between neighbouring code points (the start
 * and end of the text count as non-word). Case-insensitivity uses simple lowercase mapping.
 */
class WordExchangeEngine
{
public:
    explicit WordExchangeEngine(VarianceSettings variance = {}, const SynonymTable* synonyms = nullptr,
                                WordBoundaryMode boundary = WordBoundaryMode::Ascii);

    /// Surface forms matched for `word`; exactly { word } when variance is disabled.
    [[nodiscard]] std::vector<std::string> generateVariants(const std::string& word) const;

    [[nodiscard]] std::size_t countOccurrences(std::u32string_view text, std::u32string_view word) const;

    [[nodiscard]] std::u32string replaceOccurrences(std::u32string_view text, std::u32string_view word,
                                                    std::u32string_view replacement) const;

    /// Occurrences of each active exchange's literal bad word, summed. Variants are not
    /// expanded here, only in apply().
    [[nodiscard]] std::size_t countLiteral(std::u32string_view text, const std::vector<WordExchange>& exchanges) const;

    /// Rewrites `text` with every active exchange in list order; each exchange sees the output
    /// of the previous one.
    [[nodiscard]] std::u32string apply(std::u32string_view text, const std::vector<WordExchange>& exchanges) const;

    [[nodiscard]] const VarianceSettings& variance() const noexcept { return variance_; }
    [[nodiscard]] WordBoundaryMode boundaryMode() const noexcept { return boundary_; }

private:
    std::vector<std::u32string> expand(const std::u32string& word) const;
    bool boundaryAt(std::u32string_view text, std::size_t pos) const noexcept;
    static bool matchesAt(std::u32string_view text, std::size_t pos, std::u32string_view lowered_word) noexcept;

    VarianceSettings variance_;
    const SynonymTable* synonyms_ = nullptr;
    WordBoundaryMode boundary_;
};

} // namespace glyphscrub
