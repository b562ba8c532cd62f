#include <catch2/catch_test_macros.hpp>

#include "glyphscrub/SynonymTable.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace glyphscrub;
namespace fs = std::filesystem;

namespace
{
class TempSynonymFile
{
public:
    TempSynonymFile(const std::string& name, const std::string& content)
    {
        test_dir_ = "test_temp_synonyms";
        fs::create_directories(test_dir_);
        file_path_ = test_dir_ + "/" + name + ".json";
        std::ofstream file(file_path_);
        file << content;
        file.close();
    }

    ~TempSynonymFile()
    {
        std::error_code ec;
        fs::remove(file_path_, ec);
        if (fs::exists(test_dir_, ec) && fs::is_empty(test_dir_, ec))
        {
            fs::remove(test_dir_, ec);
        }
    }

    const std::string& path() const { return file_path_; }

private:
    std::string file_path_;
    std::string test_dir_;
};
} // namespace

TEST_CASE("SynonymTable - Loading", "[synonyms]")
{
    TempSynonymFile file("basic", R"({
        "bad": ["awful", "poor", "awful"],
        "Big": "large",
        "empty": []
    })");

    SynonymTable table;
    REQUIRE(table.loadFile(file.path()));

    SECTION("Arrays and single strings are both accepted")
    {
        REQUIRE(table.lookup("bad") == std::vector<std::string>{ "awful", "poor" });
        REQUIRE(table.lookup("big") == std::vector<std::string>{ "large" });
    }

    SECTION("Lookup is case-insensitive")
    {
        REQUIRE(table.lookup("BAD") == table.lookup("bad"));
        REQUIRE(table.lookup("bIg").size() == 1);
    }

    SECTION("Unknown words have no synonyms")
    {
        REQUIRE(table.lookup("unknown").empty());
        REQUIRE(table.lookup("empty").empty());
    }

    REQUIRE(table.size() == 2);
}

TEST_CASE("SynonymTable - Non-string values are skipped", "[synonyms]")
{
    TempSynonymFile file("mixed", R"({ "a": 5, "b": ["x", 3, null], "c": { "d": "e" } })");

    SynonymTable table;
    REQUIRE(table.loadFile(file.path()));
    REQUIRE(table.size() == 1);
    REQUIRE(table.lookup("b") == std::vector<std::string>{ "x" });
}

TEST_CASE("SynonymTable - Rejected files leave the table unchanged", "[synonyms]")
{
    SynonymTable table;
    table.add("keep", "me");

    SECTION("Missing file")
    {
        REQUIRE_FALSE(table.loadFile("test_temp_synonyms/does_not_exist.json"));
    }

    SECTION("Malformed JSON")
    {
        TempSynonymFile file("broken", R"({ "bad": ["awful", )");
        REQUIRE_FALSE(table.loadFile(file.path()));
    }

    SECTION("Top-level array")
    {
        TempSynonymFile file("array", R"(["bad", "awful"])");
        REQUIRE_FALSE(table.loadFile(file.path()));
    }

    REQUIRE(table.size() == 1);
    REQUIRE(table.lookup("keep") == std::vector<std::string>{ "me" });
}

TEST_CASE("SynonymTable - Manual entries", "[synonyms]")
{
    SynonymTable table;
    REQUIRE(table.empty());

    table.add("  Quick ", " fast ");
    table.add("quick", "fast");
    table.add("quick", "");
    table.add("", "nothing");

    REQUIRE(table.size() == 1);
    REQUIRE(table.lookup("QUICK") == std::vector<std::string>{ "fast" });
}
