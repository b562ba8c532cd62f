#include "PatternRegistry.hpp"
#include "TextUtils.hpp"

namespace glyphscrub
{

namespace
{

constexpr std::size_t npos = std::u32string_view::npos;

bool atLineStart(std::u32string_view s, std::size_t i) noexcept
{
    return i == 0 || isLineTerminator(s[i - 1]);
}

bool isDividerChar(char32_t cp) noexcept
{
    return cp == U'-' || cp == U'=' || cp == U'_' || cp == U'*';
}

void emit(std::u32string* out, char32_t cp)
{
    if (out)
        out->push_back(cp);
}

std::size_t scanMarkdownHeaders(std::u32string_view s, std::u32string* out)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        if (s[i] == U'#' && atLineStart(s, i))
        {
            std::size_t j = i;
            while (j < s.size() && s[j] == U'#')
                ++j;

            if (j - i <= 6 && j < s.size() && isEcmaWhitespace(s[j]))
            {
                // \s+ is greedy and may run across blank lines
                while (j < s.size() && isEcmaWhitespace(s[j]))
                    ++j;
                ++count;
                i = j;
                continue;
            }
        }
        emit(out, s[i]);
        ++i;
    }
    return count;
}

// First closing marker pair at or after `from` on the same line
std::size_t findClosingMarker(std::u32string_view s, std::size_t from, char32_t marker) noexcept
{
    for (std::size_t e = from; e + 1 < s.size(); ++e)
    {
        if (s[e] == marker && s[e + 1] == marker)
            return e;
        if (isLineTerminator(s[e]))
            return npos;
    }
    return npos;
}

std::size_t scanMarkdownBold(std::u32string_view s, std::u32string* out)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        const char32_t c = s[i];
        if ((c == U'*' || c == U'_') && i + 1 < s.size() && s[i + 1] == c)
        {
            std::size_t close = findClosingMarker(s, i + 2, c);
            if (close != npos)
            {
                if (out)
                    out->append(s.substr(i + 2, close - (i + 2)));
                ++count;
                i = close + 2;
                continue;
            }
        }
        emit(out, c);
        ++i;
    }
    return count;
}

std::size_t scanRepeatingChars(std::u32string_view s, std::u32string* out)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        const char32_t c = s[i];
        if (!isLineTerminator(c))
        {
            std::size_t run = 1;
            while (i + run < s.size() && s[i + run] == c)
                ++run;
            if (run >= 3)
            {
                emit(out, c);
                ++count;
                i += run;
                continue;
            }
        }
        emit(out, c);
        ++i;
    }
    return count;
}

std::size_t scanFormattingLines(std::u32string_view s, std::u32string* out)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        if (isDividerChar(s[i]) && atLineStart(s, i))
        {
            std::size_t j = i;
            while (j < s.size() && isDividerChar(s[j]))
                ++j;

            if (j - i >= 3)
            {
                std::size_t ws_end = j;
                while (ws_end < s.size() && isEcmaWhitespace(s[ws_end]))
                    ++ws_end;

                // \s* backs off to the last position where $ holds
                std::size_t end = npos;
                if (ws_end == s.size())
                {
                    end = ws_end;
                }
                else
                {
                    for (std::size_t e = ws_end; e > j; --e)
                    {
                        if (isLineTerminator(s[e - 1]))
                        {
                            end = e - 1;
                            break;
                        }
                    }
                }

                if (end != npos)
                {
                    ++count;
                    i = end;
                    continue;
                }
            }
        }
        emit(out, s[i]);
        ++i;
    }
    return count;
}

std::size_t scanExtraWhitespace(std::u32string_view s, std::u32string* out)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        if (isEcmaWhitespace(s[i]))
        {
            std::size_t run = 1;
            while (i + run < s.size() && isEcmaWhitespace(s[i + run]))
                ++run;
            if (run >= 2)
            {
                emit(out, U' ');
                ++count;
                i += run;
                continue;
            }
        }
        emit(out, s[i]);
        ++i;
    }
    return count;
}

std::size_t scanExcessNewlines(std::u32string_view s, std::u32string* out)
{
    std::size_t count = 0;
    std::size_t i = 0;
    while (i < s.size())
    {
        if (s[i] == U'\n')
        {
            std::size_t run = 1;
            while (i + run < s.size() && s[i + run] == U'\n')
                ++run;
            if (run >= 3)
            {
                emit(out, U'\n');
                emit(out, U'\n');
                ++count;
                i += run;
                continue;
            }
        }
        emit(out, s[i]);
        ++i;
    }
    return count;
}

} // namespace

const PatternRegistry& PatternRegistry::instance()
{
    static const PatternRegistry registry;
    return registry;
}

PatternRegistry::PatternRegistry()
    : definitions_{ {
          { CleaningPattern::MarkdownHeader, "markdownHeaders", R"(/^#{1,6}\s+/gm)", &scanMarkdownHeaders },
          { CleaningPattern::MarkdownBold, "markdownBold", R"(/\*\*(.*?)\*\*|__(.*?)__/g)", &scanMarkdownBold },
          { CleaningPattern::RepeatingChars, "repeatingChars", R"(/(.)\1{2,}/g)", &scanRepeatingChars },
          { CleaningPattern::FormattingLine, "formattingLines", R"(/^[-=_*]{3,}\s*$/gm)", &scanFormattingLines },
          { CleaningPattern::ExtraWhitespace, "extraWhitespace", R"(/\s{2,}/g)", &scanExtraWhitespace },
          { CleaningPattern::ExcessNewlines, "excessNewlines", R"(/\n{3,}/g)", &scanExcessNewlines },
      } }
{
}

const PatternDefinition& PatternRegistry::definition(CleaningPattern pattern) const noexcept
{
    return definitions_[static_cast<std::size_t>(pattern)];
}

std::size_t PatternRegistry::countMatches(CleaningPattern pattern, std::u32string_view text) const
{
    return definition(pattern).scan(text, nullptr);
}

std::u32string PatternRegistry::replaceMatches(CleaningPattern pattern, std::u32string_view text) const
{
    std::u32string out;
    out.reserve(text.size());
    definition(pattern).scan(text, &out);
    return out;
}

} // namespace glyphscrub
