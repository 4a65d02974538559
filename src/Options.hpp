#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <iostream>
#include <string>
#include "ProxyConfig.hpp"

struct CommandLine {
    enum Action {
        RUN,
        HELP,
        CLEAR_CACHE
    };

    Action action = RUN;
    ProxyConfig config;
};

// Parse the command line. Throws UsageError for an unknown option, a missing
// or malformed option argument, a missing --port, or a missing --origin
// without --full-caching. --help wins over --clear-cache, and both skip the
// --port/--origin checks.
CommandLine parseCommandLine(int argc, char * argv[]);

void usage(std::ostream & out, const std::string & program_name);

#endif
