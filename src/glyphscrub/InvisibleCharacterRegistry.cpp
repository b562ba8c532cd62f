#include "InvisibleCharacterRegistry.hpp"

#include <cstdint>

#include <plog/Log.h>

namespace glyphscrub
{

namespace
{

std::vector<char32_t> codePointRange(char32_t first, char32_t last)
{
    std::vector<char32_t> out;
    out.reserve(last - first + 1);
    for (char32_t cp = first; cp <= last; ++cp)
        out.push_back(cp);
    return out;
}

bool inRange(char32_t cp, char32_t first, char32_t last) noexcept { return cp >= first && cp <= last; }

} // namespace

std::string_view categoryName(InvisibleCategory category) noexcept
{
    switch (category)
    {
    case InvisibleCategory::ZeroWidth:
        return "ZERO_WIDTH";
    case InvisibleCategory::BidiControls:
        return "BIDI_CONTROLS";
    case InvisibleCategory::MathOperators:
        return "MATH_OPERATORS";
    case InvisibleCategory::Hyphenation:
        return "HYPHENATION";
    case InvisibleCategory::VariationSelectors:
        return "VARIATION_SELECTORS";
    case InvisibleCategory::FormatControls:
        return "FORMAT_CONTROLS";
    case InvisibleCategory::Shorthand:
        return "SHORTHAND";
    case InvisibleCategory::TagCharacters:
        return "TAG_CHARACTERS";
    case InvisibleCategory::IvsCharacters:
        return "IVS_CHARACTERS";
    }
    return "UNKNOWN";
}

const InvisibleCharacterRegistry& InvisibleCharacterRegistry::instance()
{
    static const InvisibleCharacterRegistry registry;
    return registry;
}

InvisibleCharacterRegistry::InvisibleCharacterRegistry()
{
    registerCategory(InvisibleCategory::ZeroWidth, {
        0x200B, // ZERO WIDTH SPACE
        0x200C, // ZERO WIDTH NON-JOINER
        0x200D, // ZERO WIDTH JOINER
        0x2060, // WORD JOINER
        0xFEFF, // ZERO WIDTH NO-BREAK SPACE (BOM)
    });

    std::vector<char32_t> bidi = { 0x200E, 0x200F, 0x061C };
    for (char32_t cp : codePointRange(0x202A, 0x202E)) // LRE, RLE, PDF, LRO, RLO
        bidi.push_back(cp);
    for (char32_t cp : codePointRange(0x2066, 0x2069)) // LRI, RLI, FSI, PDI
        bidi.push_back(cp);
    registerCategory(InvisibleCategory::BidiControls, std::move(bidi));

    // FUNCTION APPLICATION, INVISIBLE TIMES, INVISIBLE SEPARATOR, INVISIBLE PLUS
    registerCategory(InvisibleCategory::MathOperators, codePointRange(0x2061, 0x2064));

    registerCategory(InvisibleCategory::Hyphenation, { 0x00AD });

    // Mongolian free variation selectors + vowel separator, then VS1..VS16
    std::vector<char32_t> selectors = { 0x180B, 0x180C, 0x180D, 0x180E };
    for (char32_t cp : codePointRange(0xFE00, 0xFE0F))
        selectors.push_back(cp);
    registerCategory(InvisibleCategory::VariationSelectors, std::move(selectors));

    // COMBINING GRAPHEME JOINER and the interlinear annotation controls
    registerCategory(InvisibleCategory::FormatControls, { 0x034F, 0xFFF9, 0xFFFA, 0xFFFB });

    registerCategory(InvisibleCategory::Shorthand, codePointRange(0x1BCA0, 0x1BCA3));
}

void InvisibleCharacterRegistry::registerCategory(InvisibleCategory category, std::vector<char32_t> code_points)
{
    for (char32_t cp : code_points)
    {
        auto [it, inserted] = index_.emplace(cp, category);
        if (!inserted)
        {
            PLOG_ERROR << "Invisible code point U+" << std::hex << static_cast<std::uint32_t>(cp)
                       << " registered twice, keeping " << categoryName(it->second);
        }
    }
    lists_[categoryIndex(category)] = std::move(code_points);
}

bool InvisibleCharacterRegistry::isInvisible(char32_t cp) const noexcept
{
    if (inRange(cp, kTagRangeStart, kTagRangeEnd) || inRange(cp, kIvsRangeStart, kIvsRangeEnd))
        return true;
    return index_.find(cp) != index_.end();
}

std::optional<InvisibleCategory> InvisibleCharacterRegistry::categorize(char32_t cp) const noexcept
{
    if (inRange(cp, kTagRangeStart, kTagRangeEnd))
        return InvisibleCategory::TagCharacters;
    if (inRange(cp, kIvsRangeStart, kIvsRangeEnd))
        return InvisibleCategory::IvsCharacters;

    auto it = index_.find(cp);
    if (it == index_.end())
        return std::nullopt;
    return it->second;
}

const std::vector<char32_t>& InvisibleCharacterRegistry::members(InvisibleCategory category) const noexcept
{
    return lists_[categoryIndex(category)];
}

} // namespace glyphscrub
