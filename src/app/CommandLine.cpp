#include "CommandLine.hpp"

#include <getopt.h>
#include <sstream>

namespace
{

enum LongOnlyOption
{
    kOptReportFile = 256,
    kOptStripOnly,
    kOptDetectOnly,
    kOptAll,
    kOptWriteConfig
};

const struct option kLongOptions[] = {
    { "config", required_argument, nullptr, 'c' },
    { "output", required_argument, nullptr, 'o' },
    { "report", no_argument, nullptr, 'r' },
    { "report-file", required_argument, nullptr, kOptReportFile },
    { "strip-only", no_argument, nullptr, kOptStripOnly },
    { "detect-only", no_argument, nullptr, kOptDetectOnly },
    { "all", no_argument, nullptr, kOptAll },
    { "verbose", no_argument, nullptr, 'v' },
    { "write-config", required_argument, nullptr, kOptWriteConfig },
    { "help", no_argument, nullptr, 'h' },
    { nullptr, 0, nullptr, 0 },
};

} // namespace

std::optional<CommandLine> parseCommandLine(int argc, char** argv, std::string& error)
{
    CommandLine cmd;
    error.clear();

    // 0 makes glibc reinitialise its scanner, so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    int opt = 0;
    int opt_idx = 0;
    while ((opt = getopt_long(argc, argv, ":c:o:rvh", kLongOptions, &opt_idx)) != -1)
    {
        switch (opt)
        {
        case 'c':
            cmd.config_path = optarg;
            cmd.config_given = true;
            break;
        case 'o':
            cmd.output_path = optarg;
            break;
        case 'r':
            cmd.report = true;
            break;
        case 'v':
            cmd.verbose = true;
            break;
        case 'h':
            cmd.help = true;
            break;
        case kOptReportFile:
            cmd.report = true;
            cmd.report_file = optarg;
            break;
        case kOptStripOnly:
            cmd.strip_only = true;
            break;
        case kOptDetectOnly:
            cmd.detect_only = true;
            break;
        case kOptAll:
            cmd.all = true;
            break;
        case kOptWriteConfig:
            cmd.write_config = optarg;
            break;
        case ':':
            error = "option '" + std::string(argv[optind - 1]) + "' requires an argument";
            return std::nullopt;
        default:
            if (optopt > 0 && optopt < 256)
                error = "unknown option '-" + std::string(1, static_cast<char>(optopt)) + "'";
            else
                error = "unknown option '" + std::string(argv[optind - 1]) + "'";
            return std::nullopt;
        }
    }

    if (optind < argc)
        cmd.input_path = argv[optind++];

    if (optind < argc)
    {
        error = "unexpected argument '" + std::string(argv[optind]) + "'";
        return std::nullopt;
    }

    if (cmd.strip_only && cmd.detect_only)
    {
        error = "--strip-only and --detect-only cannot be combined";
        return std::nullopt;
    }

    return cmd;
}

std::string usageText(const char* program)
{
    std::ostringstream oss;
    oss << "Usage: " << (program ? program : "glyphscrub") << " [options] [FILE]\n"
        << "\n"
        << "Detects and removes invisible Unicode characters and AI formatting artifacts.\n"
        << "Reads FILE (or stdin when omitted or \"-\") and writes the cleaned text to stdout.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config PATH        configuration file (default: glyphscrub.toml)\n"
        << "  -o, --output PATH        write cleaned text to PATH\n"
        << "  -r, --report             print the JSON detection report to stderr\n"
        << "      --report-file PATH   write the JSON detection report to PATH\n"
        << "      --strip-only         only strip invisible characters\n"
        << "      --detect-only        print the report to stdout, no cleaned text\n"
        << "      --all                enable every cleaning option\n"
        << "  -v, --verbose            trace every cleaning stage to the diagnostics log\n"
        << "      --write-config PATH  write the effective settings to PATH and exit\n"
        << "  -h, --help               show this help\n"
        << "\n"
        << "Exit status: 0 success, 1 I/O or configuration failure, 2 usage error.\n";
    return oss.str();
}
