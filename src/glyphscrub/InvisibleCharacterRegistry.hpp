#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace glyphscrub
{

// Invisible code point families, in reporting order
enum class InvisibleCategory
{
    ZeroWidth,
    BidiControls,
    MathOperators,
    Hyphenation,
    VariationSelectors,
    FormatControls,
    Shorthand,
    TagCharacters, // Range U+E0000..U+E007F
    IvsCharacters  // Range U+E0100..U+E01EF
};

constexpr std::size_t kInvisibleCategoryCount = 9;

constexpr std::array<InvisibleCategory, kInvisibleCategoryCount> kAllInvisibleCategories = {
    InvisibleCategory::ZeroWidth,          InvisibleCategory::BidiControls,   InvisibleCategory::MathOperators,
    InvisibleCategory::Hyphenation,        InvisibleCategory::VariationSelectors,
    InvisibleCategory::FormatControls,     InvisibleCategory::Shorthand,      InvisibleCategory::TagCharacters,
    InvisibleCategory::IvsCharacters,
};

constexpr char32_t kTagRangeStart = 0xE0000;
constexpr char32_t kTagRangeEnd = 0xE007F;
constexpr char32_t kIvsRangeStart = 0xE0100;
constexpr char32_t kIvsRangeEnd = 0xE01EF;

/// "ZERO_WIDTH", "BIDI_CONTROLS", ...
[[nodiscard]] std::string_view categoryName(InvisibleCategory category) noexcept;

[[nodiscard]] constexpr std::size_t categoryIndex(InvisibleCategory category) noexcept
{
    return static_cast<std::size_t>(category);
}

/**
 * @brief Process-wide table of code points treated as invisible.
 *
 * Built once on first use and never modified afterwards, so concurrent lookups need no locking.
 * The explicit per-category lists are disjoint; the TAG and IVS blocks are tested by range
 * comparison instead of being expanded into the table.
 */
class InvisibleCharacterRegistry
{
public:
    [[nodiscard]] static const InvisibleCharacterRegistry& instance();

    [[nodiscard]] bool isInvisible(char32_t cp) const noexcept;

    // Ranges first, then the explicit lists
    [[nodiscard]] std::optional<InvisibleCategory> categorize(char32_t cp) const noexcept;

    // Explicit members of a category; empty for the two range-backed categories
    [[nodiscard]] const std::vector<char32_t>& members(InvisibleCategory category) const noexcept;

    InvisibleCharacterRegistry(const InvisibleCharacterRegistry&) = delete;
    InvisibleCharacterRegistry& operator=(const InvisibleCharacterRegistry&) = delete;

private:
    InvisibleCharacterRegistry();

    void registerCategory(InvisibleCategory category, std::vector<char32_t> code_points);

    std::array<std::vector<char32_t>, kInvisibleCategoryCount> lists_;
    std::unordered_map<char32_t, InvisibleCategory> index_; // Fast lookup for explicit members
};

} // namespace glyphscrub
