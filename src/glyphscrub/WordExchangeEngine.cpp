#include "WordExchangeEngine.hpp"
#include "Diagnostics.hpp"
#include "SynonymTable.hpp"
#include "TextNormalizer.hpp"

#include <algorithm>
#include <iterator>
#include <plog/Log.h>

namespace glyphscrub
{

bool isActive(const WordExchange& exchange)
{
    return exchange.enabled && !trim_whitespace(exchange.bad_word).empty() &&
           !trim_whitespace(exchange.good_word).empty();
}

std::vector<WordExchange> activeExchanges(const std::vector<WordExchange>& exchanges)
{
    std::vector<WordExchange> active;
    std::copy_if(exchanges.begin(), exchanges.end(), std::back_inserter(active), isActive);
    return active;
}

WordExchangeEngine::WordExchangeEngine(VarianceSettings variance, const SynonymTable* synonyms,
                                       WordBoundaryMode boundary)
    : variance_(variance)
    , synonyms_(synonyms)
    , boundary_(boundary)
{
}

std::vector<std::string> WordExchangeEngine::generateVariants(const std::string& word) const
{
    std::vector<std::string> out;
    for (const auto& variant : expand(utf8ToUtf32(word)))
        out.push_back(utf32ToUtf8(variant));
    return out;
}

std::vector<std::u32string> WordExchangeEngine::expand(const std::u32string& word) const
{
    std::vector<std::u32string> variants{ word };
    if (!variance_.enabled)
        return variants;

    if (variance_.case_variation)
    {
        variants.push_back(toLower(word));
        variants.push_back(toUpper(word));
        variants.push_back(capitalize(word));
    }

    if (variance_.plural_variation)
    {
        const bool ends_in_s = !word.empty() && word.back() == U's';
        if (!ends_in_s)
            variants.push_back(word + U's');
        if (ends_in_s && word.size() > 1)
            variants.push_back(word.substr(0, word.size() - 1));
        if (!word.empty() && word.back() == U'y' && word.size() > 1)
            variants.push_back(word.substr(0, word.size() - 1) + U"ies");
    }

    if (variance_.synonym_variation && synonyms_)
    {
        for (const auto& synonym : synonyms_->lookup(utf32ToUtf8(word)))
            variants.push_back(utf8ToUtf32(synonym));
    }

    std::vector<std::u32string> unique;
    unique.reserve(variants.size());
    for (auto& variant : variants)
    {
        if (std::find(unique.begin(), unique.end(), variant) == unique.end())
            unique.push_back(std::move(variant));
    }
    return unique;
}

bool WordExchangeEngine::boundaryAt(std::u32string_view text, std::size_t pos) const noexcept
{
    const bool before = pos > 0 && isWordChar(text[pos - 1], boundary_);
    const bool after = pos < text.size() && isWordChar(text[pos], boundary_);
    return before != after;
}

bool WordExchangeEngine::matchesAt(std::u32string_view text, std::size_t pos, std::u32string_view lowered_word) noexcept
{
    for (std::size_t k = 0; k < lowered_word.size(); ++k)
    {
        if (toLowerChar(text[pos + k]) != lowered_word[k])
            return false;
    }
    return true;
}

std::size_t WordExchangeEngine::countOccurrences(std::u32string_view text, std::u32string_view word) const
{
    if (word.empty() || word.size() > text.size())
        return 0;

    const std::u32string lowered = toLower(word);
    std::size_t count = 0;
    std::size_t i = 0;
    while (i + lowered.size() <= text.size())
    {
        if (boundaryAt(text, i) && matchesAt(text, i, lowered) && boundaryAt(text, i + lowered.size()))
        {
            ++count;
            i += lowered.size();
        }
        else
        {
            ++i;
        }
    }
    return count;
}

std::u32string WordExchangeEngine::replaceOccurrences(std::u32string_view text, std::u32string_view word,
                                                      std::u32string_view replacement) const
{
    if (word.empty() || word.size() > text.size())
        return std::u32string(text);

    const std::u32string lowered = toLower(word);
    std::u32string out;
    out.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size())
    {
        if (i + lowered.size() <= text.size() && boundaryAt(text, i) && matchesAt(text, i, lowered) &&
            boundaryAt(text, i + lowered.size()))
        {
            out.append(replacement);
            i += lowered.size();
        }
        else
        {
            out.push_back(text[i]);
            ++i;
        }
    }
    return out;
}

std::size_t WordExchangeEngine::countLiteral(std::u32string_view text, const std::vector<WordExchange>& exchanges) const
{
    std::size_t total = 0;
    for (const auto& exchange : exchanges)
    {
        if (!isActive(exchange))
            continue;
        total += countOccurrences(text, utf8ToUtf32(exchange.bad_word));
    }
    return total;
}

std::u32string WordExchangeEngine::apply(std::u32string_view text, const std::vector<WordExchange>& exchanges) const
{
    std::u32string result(text);
    for (const auto& exchange : exchanges)
    {
        if (!isActive(exchange))
            continue;

        const std::u32string replacement = utf8ToUtf32(exchange.good_word);
        const auto variants = expand(utf8ToUtf32(exchange.bad_word));

        if (Diagnostics::IsVerbose())
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[WordExchange] id=" << exchange.id << " variants=" << variants.size()
                << " bad=" << Diagnostics::Preview(exchange.bad_word)
                << " good=" << Diagnostics::Preview(exchange.good_word);
        }

        for (const auto& variant : variants)
            result = replaceOccurrences(result, variant, replacement);
    }
    return result;
}

} // namespace glyphscrub
