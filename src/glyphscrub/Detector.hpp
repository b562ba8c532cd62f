#pragma once

#include "SanitizerTypes.hpp"
#include "TextUtils.hpp"

#include <string_view>
#include <vector>

namespace glyphscrub
{

/// Invisible-character pass only: counts, categories and offsets of every registry hit.
[[nodiscard]] DetectionResult detectInvisible(std::string_view text);

/**
 * @brief Reports what clean() would touch, measured on the unmodified input.
 *
 * Invisible characters are counted only when `options.invisible_chars` is set. Each other enabled
 * option contributes its match count to `additional_cleaning`, which stays empty when none of
 * them is enabled. Word exchanges are counted by their literal bad word only.
 */
[[nodiscard]] DetectionResult detect(std::string_view text, const CleaningOptions& options);

[[nodiscard]] DetectionResult detect(std::string_view text, const CleaningOptions& options,
                                     const std::vector<WordExchange>& word_exchanges,
                                     WordBoundaryMode boundary = WordBoundaryMode::Ascii);

} // namespace glyphscrub
