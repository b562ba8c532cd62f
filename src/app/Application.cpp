#include "Application.hpp"
#include "ReportWriter.hpp"
#include "config/ConfigManager.hpp"
#include "glyphscrub/Diagnostics.hpp"
#include "glyphscrub/Sanitizer.hpp"
#include "glyphscrub/SynonymTable.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace
{

bool isStdStream(const std::string& path) { return path.empty() || path == "-"; }

std::string logPathBeside(const std::string& file_name)
{
    return (std::filesystem::path(utils::LogManager::GetLogDirectory()) / file_name).string();
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application()
{
    utils::LogManager::Shutdown();
}

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        std::cerr << "glyphscrub: " << usage_error_ << "\n"
                  << "Try '" << (argc_ > 0 ? argv_[0] : "glyphscrub") << " --help' for more information.\n";
        return kExitUsage;
    }

    if (cmd_.help)
    {
        std::cout << usageText(argc_ > 0 ? argv_[0] : nullptr);
        return kExitOk;
    }

    if (!initializeConfig())
    {
        flushErrors();
        return kExitFailure;
    }

    applyCommandLineOverrides();

    if (!initializeLogging())
    {
        flushErrors();
        return kExitFailure;
    }

    if (!cmd_.write_config.empty())
    {
        int code = writeConfig();
        flushErrors();
        return code;
    }

    loadSynonyms();

    int code = process();
    if (flushErrors() && code == kExitOk)
        code = kExitFailure;
    return code;
}

bool Application::parseCommandLineArgs()
{
    auto parsed = parseCommandLine(argc_, argv_, usage_error_);
    if (!parsed)
        return false;
    cmd_ = std::move(*parsed);
    return true;
}

bool Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(settings_, cmd_.config_path);

    if (cmd_.config_given && !config_->exists())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Configuration file not found", cmd_.config_path);
        return false;
    }

    return config_->load();
}

void Application::applyCommandLineOverrides()
{
    if (cmd_.all)
        settings_.sanitizer.options = glyphscrub::CleaningOptions::all();
    if (cmd_.verbose)
        settings_.diagnostics.verbose = true;

    glyphscrub::Diagnostics::Configure(settings_.diagnostics.verbose, settings_.diagnostics.max_preview);
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(settings_.logging))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                          "");
        return false;
    }

    utils::LogManager::RegisterLogger<0>({ .name = "main",
                                           .filepath = utils::LogManager::GetLogFile(),
                                           .append_override = std::nullopt,
                                           .level_override = std::nullopt,
                                           .max_file_size = 10 * 1024 * 1024,
                                           .backup_count = 3,
                                           .add_console_appender = utils::LogManager::IsConsoleEnabled() });

    if (settings_.diagnostics.verbose)
    {
        utils::LogManager::RegisterLogger<glyphscrub::Diagnostics::kLogInstance>(
            { .name = "diagnostics",
              .filepath = logPathBeside("diagnostics.log"),
              .append_override = std::nullopt,
              .level_override = plog::debug,
              .max_file_size = 10 * 1024 * 1024,
              .backup_count = 3,
              .add_console_appender = false });
    }

#if GLYPHSCRUB_PROFILING_LEVEL >= 1
    utils::LogManager::RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                                          .filepath = logPathBeside("profiling.log"),
                                                                          .append_override = std::nullopt,
                                                                          .level_override = plog::debug,
                                                                          .max_file_size = 10 * 1024 * 1024,
                                                                          .backup_count = 3,
                                                                          .add_console_appender = false });
#endif

    PLOG_INFO << "glyphscrub starting (config: " << config_->configPath()
              << (config_->loadedFromFile() ? "" : ", defaults") << ")";
    return true;
}

void Application::loadSynonyms()
{
    const auto& variance = settings_.sanitizer.variance;
    if (!variance.enabled || !variance.synonym_variation)
        return;

    if (settings_.synonyms_file.empty())
    {
        PLOG_WARNING << "Synonym variation enabled without variance.synonyms_file; no synonyms will be used";
        return;
    }

    auto table = std::make_unique<glyphscrub::SynonymTable>();
    if (!table->loadFile(settings_.synonyms_file))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Dictionary,
                                            "Could not load synonym dictionary; continuing without synonyms",
                                            settings_.synonyms_file);
        return;
    }

    PLOG_INFO << "Loaded " << table->size() << " synonym entries from " << settings_.synonyms_file;
    synonyms_ = std::move(table);
}

int Application::writeConfig()
{
    return config_->saveAs(cmd_.write_config) ? kExitOk : kExitFailure;
}

int Application::process()
{
    PROFILE_SCOPE_FUNCTION();

    std::string text;
    if (!readInput(text))
        return kExitFailure;

    glyphscrub::ProcessResult result;
    if (cmd_.strip_only)
    {
        result.detection = glyphscrub::detectInvisible(text);
        result.cleaned = glyphscrub::stripInvisible(text);
    }
    else if (cmd_.detect_only)
    {
        const auto& sanitizer = settings_.sanitizer;
        result.detection = glyphscrub::detect(text, sanitizer.options, sanitizer.word_exchanges, sanitizer.boundary);
    }
    else
    {
        result = glyphscrub::processText(text, settings_.sanitizer, synonyms_.get());
    }

    for (const auto& stat : glyphscrub::summarize(result.detection))
        PLOG_INFO << "  " << stat.name << ": " << stat.count;
    PLOG_INFO << "Total issues: " << glyphscrub::totalIssues(result.detection);

    bool ok = true;
    if (cmd_.detect_only)
    {
        std::cout << ReportWriter::render(result.detection) << '\n';
        if (!cmd_.report_file.empty())
            ok = ReportWriter::writeFile(cmd_.report_file, result.detection);
        return ok ? kExitOk : kExitFailure;
    }

    ok = writeOutput(result.cleaned);

    if (cmd_.report)
    {
        if (!cmd_.report_file.empty())
            ok = ReportWriter::writeFile(cmd_.report_file, result.detection) && ok;
        else
            std::cerr << ReportWriter::render(result.detection) << '\n';
    }

    return ok ? kExitOk : kExitFailure;
}

bool Application::readInput(std::string& text)
{
    if (isStdStream(cmd_.input_path))
    {
        std::ostringstream buffer;
        buffer << std::cin.rdbuf();
        text = buffer.str();
        return true;
    }

    std::ifstream ifs(cmd_.input_path, std::ios::binary);
    if (!ifs)
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Io, "Could not open input file", cmd_.input_path);
        return false;
    }

    text.assign(std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>());
    if (ifs.bad())
    {
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Io, "Failed while reading input file", cmd_.input_path);
        return false;
    }

    PLOG_DEBUG << "Read " << text.size() << " bytes from " << cmd_.input_path;
    return true;
}

bool Application::writeOutput(const std::string& text)
{
    if (isStdStream(cmd_.output_path))
    {
        std::cout << text;
        std::cout.flush();
        if (!std::cout)
        {
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed while writing to stdout");
            return false;
        }
        return true;
    }

    std::ofstream ofs(cmd_.output_path, std::ios::binary | std::ios::trunc);
    if (!ofs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Could not open output file", cmd_.output_path);
        return false;
    }

    ofs << text;
    if (!ofs)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Io, "Failed while writing output file", cmd_.output_path);
        return false;
    }

    PLOG_INFO << "Wrote " << text.size() << " bytes to " << cmd_.output_path;
    return true;
}

bool Application::flushErrors()
{
    auto worst = utils::ErrorReporter::Flush(std::cerr, "glyphscrub");
    return worst && *worst >= utils::ErrorSeverity::Error;
}
