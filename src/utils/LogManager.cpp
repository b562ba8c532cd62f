#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../glyphscrub/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_console = false;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_file = "logs/glyphscrub.log";
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    s_append_logs = settings.append;
    s_console = settings.console;
    if (!settings.file.empty())
        s_log_file = settings.file;

    if (settings.level >= plog::none && settings.level <= plog::verbose)
    {
        s_default_level = static_cast<plog::Severity>(settings.level);
    }
    else
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Invalid logging level, using info",
                                     "level=" + std::to_string(settings.level));
        s_default_level = plog::info;
    }

    PrepareLogDirectory();

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            // stdout carries cleaned text, so console logging goes to stderr
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<glyphscrub::Diagnostics::kLogInstance>(const LoggerConfig&);

#if GLYPHSCRUB_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

const std::string& LogManager::GetLogFile() { return s_log_file; }

bool LogManager::IsConsoleEnabled() { return s_console; }

std::string LogManager::GetLogDirectory()
{
    std::filesystem::path parent = std::filesystem::path(s_log_file).parent_path();
    return parent.empty() ? std::string(".") : parent.string();
}

void LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(GetLogDirectory(), ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

} // namespace utils
