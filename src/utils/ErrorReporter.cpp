#include "ErrorReporter.hpp"

#include <plog/Log.h>
#include <algorithm>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;
std::size_t ErrorReporter::s_dropped = 0;

namespace
{

plog::Severity toPlogSeverity(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
    default:
        return plog::fatal;
    }
}

bool sameReport(const ErrorReport& report, ErrorSeverity severity, ErrorCategory category,
                const std::string& message, const std::string& details)
{
    return report.severity == severity && report.category == category && report.message == message &&
           report.details == details;
}

} // namespace

void ErrorReporter::Report(ErrorSeverity severity, ErrorCategory category, const std::string& message,
                           const std::string& details)
{
    PLOG(toPlogSeverity(severity)) << "[" << CategoryToString(category) << "] " << message
                                   << (details.empty() ? "" : " | ") << details;

    std::lock_guard<std::mutex> lock(s_mutex);
    if (!s_queue.empty() && sameReport(s_queue.back(), severity, category, message, details))
    {
        ++s_queue.back().repeats;
        return;
    }

    if (s_queue.size() >= kMaxQueued)
    {
        ++s_dropped;
        return;
    }

    s_queue.push_back({ category, severity, message, details, 1 });
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(ErrorSeverity::Warning, category, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(ErrorSeverity::Error, category, message, details);
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(ErrorSeverity::Fatal, category, message, details);
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports = std::move(s_queue);
    s_queue.clear();
    s_dropped = 0;
    return reports;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_dropped = 0;
}

std::optional<ErrorSeverity> ErrorReporter::Flush(std::ostream& out, std::string_view program)
{
    std::vector<ErrorReport> reports;
    std::size_t dropped = 0;
    {
        std::lock_guard<std::mutex> lock(s_mutex);
        reports = std::move(s_queue);
        s_queue.clear();
        dropped = s_dropped;
        s_dropped = 0;
    }

    std::optional<ErrorSeverity> worst;
    for (const auto& report : reports)
    {
        out << Format(report, program) << '\n';
        worst = worst ? std::max(*worst, report.severity) : report.severity;
    }

    if (dropped > 0)
        out << program << ": " << dropped << " more reports not shown, see the log file\n";

    return worst;
}

std::string ErrorReporter::Format(const ErrorReport& report, std::string_view program)
{
    std::string line;
    line.append(program).append(": ");
    line.append(SeverityToString(report.severity)).append(" [");
    line.append(CategoryToString(report.category)).append("] ");
    line.append(report.message);
    if (!report.details.empty())
        line.append(" (").append(report.details).append(")");
    if (report.repeats > 1)
        line.append(" [x").append(std::to_string(report.repeats)).append("]");
    return line;
}

std::string_view ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Io:
        return "I/O";
    case ErrorCategory::Dictionary:
        return "Dictionary";
    case ErrorCategory::Sanitizer:
        return "Sanitizer";
    }
    return "Unknown";
}

std::string_view ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Warning:
        return "warning";
    case ErrorSeverity::Error:
        return "error";
    case ErrorSeverity::Fatal:
        return "fatal";
    }
    return "unknown";
}

} // namespace utils
