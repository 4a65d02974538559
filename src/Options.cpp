#include "Options.hpp"
#include "ProxyError.hpp"
#include <getopt.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast/try_lexical_convert.hpp>

namespace {

int parsePort(const std::string & value) {
    int port = -1;
    if (value.empty() || !boost::algorithm::all(value, boost::algorithm::is_digit()) ||
        !boost::conversion::try_lexical_convert(value, port) || port > 65535) {
        throw UsageError("Invalid port number: " + value);
    }
    return port;
}

Logger::Level parseLevel(const std::string & value) {
    if (boost::algorithm::iequals(value, "debug")) return Logger::LEVEL_DEBUG;
    if (boost::algorithm::iequals(value, "info")) return Logger::LEVEL_INFO;
    if (boost::algorithm::iequals(value, "warning")) return Logger::LEVEL_WARNING;
    if (boost::algorithm::iequals(value, "error")) return Logger::LEVEL_ERROR;
    throw UsageError("Invalid log level: " + value);
}

}

CommandLine parseCommandLine(int argc, char * argv[]) {
    const option command_line_options[] = {
        { "port",           required_argument, nullptr, 'p' },
        { "origin",         required_argument, nullptr, 'o' },
        { "full-caching",         no_argument, nullptr, 'f' },
        { "clear-cache",          no_argument, nullptr, 'c' },
        { "cache-dir",      required_argument, nullptr, 'd' },
        { "log-dir",        required_argument, nullptr, 'l' },
        { "log-level",      required_argument, nullptr, 'v' },
        { "help",                 no_argument, nullptr, 'h' },
        { 0,                                0, nullptr, 0 }
    };

    CommandLine command_line;
    ProxyConfig & config = command_line.config;
    bool have_port = false;
    bool help = false;
    bool clear_cache = false;

    // reset getopt so the parser can run more than once per process
    optind = 0;
    opterr = 0;

    while (true) {
        const int opt = getopt_long(argc, argv, ":h", command_line_options, nullptr);
        if (opt == -1) { /* end of options */
            break;
        }

        switch (opt) {
        case 'p':
            config.port = parsePort(optarg);
            have_port = true;
            break;
        case 'o':
            config.origin = std::string(optarg);
            break;
        case 'f':
            config.fullProxyMode = true;
            break;
        case 'c':
            clear_cache = true;
            break;
        case 'd':
            config.cacheDir = optarg;
            break;
        case 'l':
            config.logDir = optarg;
            break;
        case 'v':
            config.logLevel = parseLevel(optarg);
            break;
        case 'h':
            help = true;
            break;
        case ':':
            throw UsageError(std::string("Missing argument for ") + argv[optind - 1]);
        case '?':
            throw UsageError(std::string("Invalid option: ") + argv[optind - 1]);
        default:
            throw UsageError("getopt_long: unexpected return value " + std::to_string(opt));
        }
    }

    if (optind < argc) {
        throw UsageError(std::string("Invalid option: ") + argv[optind]);
    }

    if (help) {
        command_line.action = CommandLine::HELP;
        return command_line;
    }
    if (clear_cache) {
        command_line.action = CommandLine::CLEAR_CACHE;
        return command_line;
    }
    if (!have_port) {
        throw UsageError("Port is required");
    }
    if (!config.fullProxyMode && !config.origin) {
        throw UsageError("Origin URL is required");
    }

    command_line.action = CommandLine::RUN;
    return command_line;
}

void usage(std::ostream & out, const std::string & program_name) {
    out << "Usage: " << program_name << " [OPTIONS]" << std::endl;
    out << "Options:" << std::endl;
    out << "  --port <number>      Port on which the proxy server will run" << std::endl;
    out << "  --origin <url>       URL of the server to which requests will be forwarded" << std::endl;
    out << "  --full-caching       Honor the Host of every request instead of --origin" << std::endl;
    out << "  --clear-cache        Clear the cache and exit" << std::endl;
    out << "  --cache-dir <path>   Cache directory (default ./cache)" << std::endl;
    out << "  --log-dir <path>     Write INFO/WARNING/DEBUG/ERROR.log files here" << std::endl;
    out << "  --log-level <level>  Console log level: debug, info, warning, error" << std::endl;
    out << "  --help, -h           Show this help message" << std::endl;
    out << std::endl << "Example:" << std::endl;
    out << "  " << program_name << " --port 3000 --origin http://dummyjson.com" << std::endl;
}
