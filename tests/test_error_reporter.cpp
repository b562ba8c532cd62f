#include <catch2/catch_test_macros.hpp>

#include "utils/ErrorReporter.hpp"

#include <sstream>
#include <string>

using namespace utils;

TEST_CASE("ErrorReporter - Queue and drain", "[errors]")
{
    ErrorReporter::ClearErrors();
    REQUIRE(ErrorReporter::GetPendingErrors().empty());

    ErrorReporter::ReportWarning(ErrorCategory::Dictionary, "Could not load synonym dictionary", "words.json");
    ErrorReporter::ReportError(ErrorCategory::Io, "Could not open output file", "out.txt");

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 2);
    REQUIRE(reports[0].category == ErrorCategory::Dictionary);
    REQUIRE(reports[0].severity == ErrorSeverity::Warning);
    REQUIRE(reports[0].details == "words.json");
    REQUIRE(reports[1].severity == ErrorSeverity::Error);

    REQUIRE(ErrorReporter::GetPendingErrors().empty());
}

TEST_CASE("ErrorReporter - Repeated reports are merged", "[errors]")
{
    ErrorReporter::ClearErrors();

    for (int i = 0; i < 3; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Sanitizer, "Text cleaning step failed", "markdownBold");
    ErrorReporter::ReportWarning(ErrorCategory::Sanitizer, "Text cleaning step failed", "repeatingChars");
    ErrorReporter::ReportWarning(ErrorCategory::Sanitizer, "Text cleaning step failed", "markdownBold");

    auto reports = ErrorReporter::GetPendingErrors();
    REQUIRE(reports.size() == 3);
    REQUIRE(reports[0].repeats == 3);
    REQUIRE(reports[1].repeats == 1);
    REQUIRE(reports[2].repeats == 1);
}

TEST_CASE("ErrorReporter - Full queue keeps the earliest reports", "[errors]")
{
    ErrorReporter::ClearErrors();

    for (std::size_t i = 0; i < ErrorReporter::kMaxQueued + 5; ++i)
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown key ignored", "key" + std::to_string(i));

    std::ostringstream out;
    auto worst = ErrorReporter::Flush(out, "glyphscrub");
    REQUIRE(worst == ErrorSeverity::Warning);

    const std::string text = out.str();
    REQUIRE(text.find("(key0)") != std::string::npos);
    REQUIRE(text.find("(key99)") != std::string::npos);
    REQUIRE(text.find("(key100)") == std::string::npos);
    REQUIRE(text.find("glyphscrub: 5 more reports not shown") != std::string::npos);

    SECTION("The dropped count is reset by the flush")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown key ignored", "late");
        std::ostringstream again;
        ErrorReporter::Flush(again, "glyphscrub");
        REQUIRE(again.str() == "glyphscrub: warning [Configuration] Unknown key ignored (late)\n");
    }
}

TEST_CASE("ErrorReporter - Flush output and worst severity", "[errors]")
{
    ErrorReporter::ClearErrors();

    SECTION("Nothing pending")
    {
        std::ostringstream out;
        REQUIRE_FALSE(ErrorReporter::Flush(out, "glyphscrub").has_value());
        REQUIRE(out.str().empty());
    }

    SECTION("One line per report")
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Unknown table ignored", "glyphscrub.toml: [x]");
        ErrorReporter::ReportFatal(ErrorCategory::Io, "Could not open input file", "notes.md");
        ErrorReporter::ReportError(ErrorCategory::Io, "Could not write report file", "r.json");

        std::ostringstream out;
        REQUIRE(ErrorReporter::Flush(out, "glyphscrub") == ErrorSeverity::Fatal);
        REQUIRE(out.str() ==
                "glyphscrub: warning [Configuration] Unknown table ignored (glyphscrub.toml: [x])\n"
                "glyphscrub: fatal [I/O] Could not open input file (notes.md)\n"
                "glyphscrub: error [I/O] Could not write report file (r.json)\n");
        REQUIRE(ErrorReporter::GetPendingErrors().empty());
    }
}

TEST_CASE("ErrorReporter - Formatting", "[errors]")
{
    ErrorReport report;
    report.category = ErrorCategory::Dictionary;
    report.severity = ErrorSeverity::Warning;
    report.message = "Could not load synonym dictionary";

    REQUIRE(ErrorReporter::Format(report, "gs") == "gs: warning [Dictionary] Could not load synonym dictionary");

    report.details = "words.json";
    report.repeats = 4;
    REQUIRE(ErrorReporter::Format(report, "gs") ==
            "gs: warning [Dictionary] Could not load synonym dictionary (words.json) [x4]");

    REQUIRE(ErrorReporter::CategoryToString(ErrorCategory::Io) == "I/O");
    REQUIRE(ErrorReporter::SeverityToString(ErrorSeverity::Fatal) == "fatal");
}
