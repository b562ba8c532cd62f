#include <catch2/catch_test_macros.hpp>

#include "glyphscrub/Cleaner.hpp"
#include "glyphscrub/Detector.hpp"

#include <string>
#include <vector>

using namespace glyphscrub;

namespace
{
CleaningOptions only(bool CleaningOptions::*flag)
{
    CleaningOptions options = CleaningOptions::none();
    options.*flag = true;
    return options;
}
} // namespace

TEST_CASE("Cleaner - stripInvisible", "[cleaner]")
{
    REQUIRE(stripInvisible("A\u200BB") == "AB");
    REQUIRE(stripInvisible("\u202Eevil\u202C") == "evil");
    REQUIRE(stripInvisible("plain text") == "plain text");
    REQUIRE(stripInvisible("").empty());

    SECTION("Supplementary plane characters are removed whole")
    {
        REQUIRE(stripInvisible("葛\U000E0100") == "葛");
        REQUIRE(stripInvisible("hi\U000E0068\U000E0069\U000E007F") == "hi");
        REQUIRE(stripInvisible("\U0001BCA1x") == "x");
    }

    SECTION("Idempotent")
    {
        const std::string once = stripInvisible("a\u200B\u00ADb\uFE0F\u2063c");
        REQUIRE(once == "abc");
        REQUIRE(stripInvisible(once) == once);
    }

    SECTION("Malformed bytes pass through")
    {
        const std::string input = std::string("a\xFF") + "\u200B" + "b\xC3";
        REQUIRE(stripInvisible(input) == std::string("a\xFF") + "b\xC3");
    }

    SECTION("Result has no registry hits")
    {
        const std::string input = "\u200B\u200E\u2061\u00AD\uFE0F\u034F\U0001BCA0\U000E0001\U000E0100text";
        REQUIRE(detectInvisible(stripInvisible(input)).total_count == 0);
    }
}

TEST_CASE("Cleaner - Individual options", "[cleaner]")
{
    REQUIRE(clean("### Title\n", only(&CleaningOptions::markdown_headers)) == "Title");
    REQUIRE(clean("**bold**", only(&CleaningOptions::markdown_bold)) == "bold");
    REQUIRE(clean("aaaa", only(&CleaningOptions::repeating_chars)) == "a");
    REQUIRE(clean("wow \U0001F600\U0001F600\U0001F600", only(&CleaningOptions::repeating_chars)) == "wow \U0001F600");
    REQUIRE(clean("Intro\n---\nBody", only(&CleaningOptions::formatting_lines)) == "Intro\n\nBody");
    REQUIRE(clean("a  b\t\tc", only(&CleaningOptions::extra_whitespace)) == "a b c");
    REQUIRE(clean("a\n\n\nb", only(&CleaningOptions::extra_whitespace)) == "a b");
}

TEST_CASE("Cleaner - Default options", "[cleaner]")
{
    const std::string input = "  hi\u200B there \n\n\n\n end  ";
    REQUIRE(clean(input, CleaningOptions{}) == "hi there \n\n end");
    REQUIRE(clean("", CleaningOptions{}).empty());
}

TEST_CASE("Cleaner - No-op options only collapse newlines and trim", "[cleaner]")
{
    const CleaningOptions none = CleaningOptions::none();

    REQUIRE(clean("  plain text  ", none) == "plain text");
    REQUIRE(clean("a\u200Bb", none) == "a\u200Bb");
    REQUIRE(clean("# kept **as** is", none) == "# kept **as** is");
    REQUIRE(clean("a\n\n\n\nb", none) == "a\n\nb");
    REQUIRE(clean("\uFEFFabc", none) == "abc");
}

TEST_CASE("Cleaner - Fixed step order", "[cleaner]")
{
    SECTION("Invisible characters go before repeated characters")
    {
        CleaningOptions options = only(&CleaningOptions::repeating_chars);
        options.invisible_chars = true;
        REQUIRE(clean("a\u200Baa", options) == "a");
    }

    SECTION("Bold goes before repeated characters")
    {
        CleaningOptions options = only(&CleaningOptions::markdown_bold);
        options.repeating_chars = true;
        REQUIRE(clean("****", options).empty());
        REQUIRE(clean("****", only(&CleaningOptions::repeating_chars)) == "*");
    }

    SECTION("Headers go before formatting lines")
    {
        CleaningOptions options = only(&CleaningOptions::markdown_headers);
        options.formatting_lines = true;
        REQUIRE(clean("# ---\ntext", options) == "text");
    }

    SECTION("Whitespace goes before word exchanges")
    {
        CleaningOptions options = only(&CleaningOptions::extra_whitespace);
        options.word_exchanges = true;
        std::vector<WordExchange> exchanges{ { "1", "x y", "z", true } };
        REQUIRE(clean("x    y", options, exchanges) == "z");
    }
}

TEST_CASE("Cleaner - Word exchanges need the option flag", "[cleaner][word_exchange]")
{
    std::vector<WordExchange> exchanges{ { "1", "bad", "good", true } };

    REQUIRE(clean("bad day", CleaningOptions{}, exchanges) == "bad day");
    REQUIRE(clean("bad day", only(&CleaningOptions::word_exchanges), exchanges) == "good day");
}

TEST_CASE("Cleaner - All options together", "[cleaner]")
{
    const std::string input = "## Summary\u200B\n\n***\n\nThis is **really** soooo   good!!!\n\n\n\n";
    // The divider collapses to one '*' before the formatting-line pass sees it
    REQUIRE(clean(input, CleaningOptions::all()) == "Summary * This is really so good!");
}
