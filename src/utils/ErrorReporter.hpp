#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logging setup
    Configuration,  // glyphscrub.toml parsing and values
    Io,             // Input, output and report files
    Dictionary,     // Synonym dictionary loading
    Sanitizer       // A detection or cleaning stage
};

// Ordered: a run fails once anything at Error or above was reported
enum class ErrorSeverity
{
    Warning, // The run continues with a default or without the feature
    Error,   // The requested output is incomplete
    Fatal    // Nothing useful can be produced
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Sanitizer;
    ErrorSeverity severity = ErrorSeverity::Warning;
    std::string message; // One line, shown on stderr
    std::string details; // File name, offending value, library message
    std::size_t repeats = 1;
};

/**
 * @brief Problems met during one glyphscrub run.
 *
 * Every report is logged through plog when it arrives. The command line prints the queue to
 * stderr before exiting and derives its exit status from the worst severity seen.
 *
 * A report identical to the previous one only bumps its repeat count. Once kMaxQueued distinct
 * reports are held, later ones are logged and counted but not queued; the earliest reports are
 * usually the cause of the rest.
 */
class ErrorReporter
{
public:
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");

    // Drains the queue
    static std::vector<ErrorReport> GetPendingErrors();

    static void ClearErrors();

    /// Drains the queue into `out`, one line per report, followed by a note on dropped reports.
    /// Returns the worst severity drained, or nullopt when nothing was pending.
    static std::optional<ErrorSeverity> Flush(std::ostream& out, std::string_view program);

    // "glyphscrub: warning [Configuration] message (details) [x3]"
    static std::string Format(const ErrorReport& report, std::string_view program);

    static std::string_view CategoryToString(ErrorCategory category);
    static std::string_view SeverityToString(ErrorSeverity severity);

    static constexpr std::size_t kMaxQueued = 100;

private:
    static void Report(ErrorSeverity severity, ErrorCategory category, const std::string& message,
                       const std::string& details);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static std::size_t s_dropped;
};

} // namespace utils
