#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace glyphscrub
{

// Formatting artifacts the cleaner knows how to find and rewrite
enum class CleaningPattern
{
    MarkdownHeader,  // ^#{1,6}\s+            (multiline)  -> ""
    MarkdownBold,    // \*\*(.*?)\*\*|__(.*?)__          -> inner text
    RepeatingChars,  // (.)\1{2,}                        -> the character
    FormattingLine,  // ^[-=_*]{3,}\s*$       (multiline)  -> ""
    ExtraWhitespace, // \s{2,}                           -> " "
    ExcessNewlines   // \n{3,}                           -> "\n\n"
};

constexpr std::size_t kCleaningPatternCount = 6;

// Scans `text` left to right for non-overlapping matches. When `out` is non-null the rewritten
// text is appended to it. Returns the number of matches.
using PatternScanner = std::size_t (*)(std::u32string_view text, std::u32string* out);

struct PatternDefinition
{
    CleaningPattern pattern;
    std::string_view name;       // Report key, e.g. "markdownHeaders"
    std::string_view expression; // Equivalent regular expression, for diagnostics
    PatternScanner scan;
};

/**
 * @brief Static table of the formatting matchers.
 *
 * Matchers work on code points: `.` never matches LF, CR, U+2028 or U+2029, and `\s` is the
 * ECMAScript whitespace class. `^` and `$` in multiline patterns anchor at those same line
 * terminators. No matcher can produce an empty match.
 */
class PatternRegistry
{
public:
    [[nodiscard]] static const PatternRegistry& instance();

    [[nodiscard]] const PatternDefinition& definition(CleaningPattern pattern) const noexcept;

    [[nodiscard]] std::size_t countMatches(CleaningPattern pattern, std::u32string_view text) const;
    [[nodiscard]] std::u32string replaceMatches(CleaningPattern pattern, std::u32string_view text) const;

    PatternRegistry(const PatternRegistry&) = delete;
    PatternRegistry& operator=(const PatternRegistry&) = delete;

private:
    PatternRegistry();

    std::array<PatternDefinition, kCleaningPatternCount> definitions_;
};

} // namespace glyphscrub
