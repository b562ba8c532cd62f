#include "TextNormalizer.hpp"
#include "PatternRegistry.hpp"
#include "TextUtils.hpp"

namespace glyphscrub
{

std::u32string_view trim_whitespace(std::u32string_view text)
{
    std::size_t begin = 0;
    while (begin < text.size() && isEcmaWhitespace(text[begin]))
        ++begin;

    std::size_t end = text.size();
    while (end > begin && isEcmaWhitespace(text[end - 1]))
        --end;

    return text.substr(begin, end - begin);
}

std::string trim_whitespace(std::string_view text)
{
    if (text.empty())
        return std::string();

    std::u32string wide = utf8ToUtf32(text);
    return utf32ToUtf8(trim_whitespace(std::u32string_view(wide)));
}

std::u32string finalize_text(std::u32string_view text)
{
    if (text.empty())
        return std::u32string();

    std::u32string collapsed = PatternRegistry::instance().replaceMatches(CleaningPattern::ExcessNewlines, text);
    return std::u32string(trim_whitespace(std::u32string_view(collapsed)));
}

} // namespace glyphscrub
