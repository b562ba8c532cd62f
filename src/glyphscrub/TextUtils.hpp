#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace glyphscrub
{

/// One decoding step over a UTF-8 buffer.
struct Utf8Unit
{
    char32_t codepoint = 0;  // Decoded value, or the isolated-byte mapping when !valid
    std::size_t offset = 0;  // Byte offset of the first byte
    std::size_t length = 0;  // Bytes consumed (1 for malformed input)
    bool valid = false;      // False for bytes that do not start a well-formed sequence
};

/// Decodes the unit starting at `offset`. A malformed or truncated sequence yields a
/// single-byte invalid unit so iteration always makes progress.
[[nodiscard]] Utf8Unit decodeUtf8At(std::string_view text, std::size_t offset);

/// Malformed bytes are carried through UTF-32 as U+DC80..U+DCFF (an unpaired low surrogate
/// can never come out of a well-formed UTF-8 decode) and restored byte-for-byte on encode.
constexpr char32_t kIsolatedByteBase = 0xDC00;

[[nodiscard]] constexpr bool isIsolatedByte(char32_t cp) noexcept
{
    return cp >= kIsolatedByteBase + 0x80 && cp <= kIsolatedByteBase + 0xFF;
}

/// UTF-8 to UTF-32 conversion
[[nodiscard]] std::u32string utf8ToUtf32(std::string_view utf8_str);

/// UTF-32 to UTF-8 conversion
[[nodiscard]] std::string utf32ToUtf8(std::u32string_view utf32_str);

/// Number of UTF-16 code units the code point occupies.
[[nodiscard]] constexpr std::size_t utf16Length(char32_t cp) noexcept { return cp > 0xFFFF ? 2 : 1; }

/// LF, CR, LINE SEPARATOR and PARAGRAPH SEPARATOR: the characters `.` never matches.
[[nodiscard]] bool isLineTerminator(char32_t cp) noexcept;

/// The ECMAScript `\s` class, which is also the set `trim` removes.
[[nodiscard]] bool isEcmaWhitespace(char32_t cp) noexcept;

enum class WordBoundaryMode
{
    Ascii,   // [A-Za-z0-9_], same as ECMAScript \b
    Unicode  // Letters, marks, numbers and connector punctuation of any script
};

[[nodiscard]] bool isWordChar(char32_t cp, WordBoundaryMode mode) noexcept;

/// Simple (one-to-one) case mappings.
[[nodiscard]] char32_t toLowerChar(char32_t cp) noexcept;
[[nodiscard]] char32_t toUpperChar(char32_t cp) noexcept;

[[nodiscard]] std::u32string toLower(std::u32string_view s);
[[nodiscard]] std::u32string toUpper(std::u32string_view s);

/// First code point upper-cased, the remainder lower-cased.
[[nodiscard]] std::u32string capitalize(std::u32string_view s);

} // namespace glyphscrub
