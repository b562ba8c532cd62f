#include "TextUtils.hpp"
#include <utf8proc.h>

namespace glyphscrub
{

Utf8Unit decodeUtf8At(std::string_view text, std::size_t offset)
{
    Utf8Unit unit;
    unit.offset = offset;
    if (offset >= text.size())
        return unit;

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(text.data() + offset);
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(text.size() - offset);

    utf8proc_int32_t codepoint = 0;
    utf8proc_ssize_t bytes = utf8proc_iterate(str, len, &codepoint);
    if (bytes <= 0 || codepoint < 0)
    {
        unit.codepoint = kIsolatedByteBase + static_cast<unsigned char>(text[offset]);
        unit.length = 1;
        unit.valid = false;
        return unit;
    }

    unit.codepoint = static_cast<char32_t>(codepoint);
    unit.length = static_cast<std::size_t>(bytes);
    unit.valid = true;
    return unit;
}

std::u32string utf8ToUtf32(std::string_view utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;

    result.reserve(utf8_str.size());
    std::size_t pos = 0;
    while (pos < utf8_str.size())
    {
        Utf8Unit unit = decodeUtf8At(utf8_str, pos);
        result.push_back(unit.codepoint);
        pos += unit.length;
    }
    return result;
}

std::string utf32ToUtf8(std::u32string_view utf32_str)
{
    std::string result;
    result.reserve(utf32_str.size());
    for (char32_t cp : utf32_str)
    {
        if (isIsolatedByte(cp))
        {
            result.push_back(static_cast<char>(cp - kIsolatedByteBase));
            continue;
        }

        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isLineTerminator(char32_t cp) noexcept
{
    return cp == U'\n' || cp == U'\r' || cp == 0x2028 || cp == 0x2029;
}

bool isEcmaWhitespace(char32_t cp) noexcept
{
    if (cp >= 0x09 && cp <= 0x0D)
        return true;

    switch (cp)
    {
    case 0x0020:
    case 0x00A0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
    case 0xFEFF:
        return true;
    default:
        return cp >= 0x2000 && cp <= 0x200A;
    }
}

bool isWordChar(char32_t cp, WordBoundaryMode mode) noexcept
{
    if (cp < 0x80)
    {
        return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') || (cp >= U'0' && cp <= U'9') ||
               cp == U'_';
    }

    if (mode == WordBoundaryMode::Ascii || isIsolatedByte(cp) || cp > 0x10FFFF)
        return false;

    switch (utf8proc_category(static_cast<utf8proc_int32_t>(cp)))
    {
    case UTF8PROC_CATEGORY_LU:
    case UTF8PROC_CATEGORY_LL:
    case UTF8PROC_CATEGORY_LT:
    case UTF8PROC_CATEGORY_LM:
    case UTF8PROC_CATEGORY_LO:
    case UTF8PROC_CATEGORY_MN:
    case UTF8PROC_CATEGORY_MC:
    case UTF8PROC_CATEGORY_ME:
    case UTF8PROC_CATEGORY_ND:
    case UTF8PROC_CATEGORY_NL:
    case UTF8PROC_CATEGORY_NO:
    case UTF8PROC_CATEGORY_PC:
        return true;
    default:
        return false;
    }
}

char32_t toLowerChar(char32_t cp) noexcept
{
    if (isIsolatedByte(cp) || cp > 0x10FFFF)
        return cp;
    return static_cast<char32_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp)));
}

char32_t toUpperChar(char32_t cp) noexcept
{
    if (isIsolatedByte(cp) || cp > 0x10FFFF)
        return cp;
    return static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cp)));
}

std::u32string toLower(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t cp : s)
        out.push_back(toLowerChar(cp));
    return out;
}

std::u32string toUpper(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t cp : s)
        out.push_back(toUpperChar(cp));
    return out;
}

std::u32string capitalize(std::u32string_view s)
{
    if (s.empty())
        return {};

    std::u32string out;
    out.reserve(s.size());
    out.push_back(toUpperChar(s.front()));
    for (std::size_t i = 1; i < s.size(); ++i)
        out.push_back(toLowerChar(s[i]));
    return out;
}

} // namespace glyphscrub
