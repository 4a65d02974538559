#include "CacheStore.hpp"
#include "Options.hpp"
#include "Proxy.hpp"
#include "ProxyError.hpp"
#include <csignal>
#include <cstdlib>

int main(int argc, char * argv[]) {
    // a client hanging up mid-write must not kill the process
    signal(SIGPIPE, SIG_IGN);

    CommandLine command_line;
    try {
        command_line = parseCommandLine(argc, argv);
    } catch (const UsageError& e) {
        std::cout << e.what() << std::endl;
        usage(std::cout, argv[0]);
        return EXIT_FAILURE;
    }

    if (command_line.action == CommandLine::HELP) {
        usage(std::cout, argv[0]);
        return EXIT_SUCCESS;
    }

    const ProxyConfig & config = command_line.config;
    Logger& logger = Logger::getInstance();
    if (!config.logDir.empty()) {
        logger.setLogPath(config.logDir);
    }
    logger.setLevel(config.logLevel);

    try {
        if (command_line.action == CommandLine::CLEAR_CACHE) {
            CacheStore store(config.cacheDir);
            size_t removed = store.clear();
            std::cout << "Cache cleared (" << removed << " entries)" << std::endl;
            return EXIT_SUCCESS;
        }

        logger.info("starting proxy...");
        Proxy proxy(config);
        proxy.run();

        return EXIT_SUCCESS;
    } catch (const std::exception& e) {
        logger.error(std::string("fatal: ") + e.what());
        return EXIT_FAILURE;
    }
}
