#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace utils
{

// [logging] table of the configuration file
struct LogSettings
{
    int level = static_cast<int>(plog::info); // plog severity 0-6
    bool append = true;
    std::string file = "logs/glyphscrub.log";
    bool console = false;

    bool operator==(const LogSettings&) const = default;
};

class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const LogSettings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static const std::string& GetLogFile();
    static bool IsConsoleEnabled();

    // Directory that holds the main log file; other loggers write beside it
    static std::string GetLogDirectory();
    static void PrepareLogDirectory();

private:
    LogManager() = default;

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static plog::Severity s_default_level;
    static std::string s_log_file;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
