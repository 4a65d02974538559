#ifndef PROXYCONFIG_HPP
#define PROXYCONFIG_HPP

#include <optional>
#include <string>
#include "Logger.hpp"

struct ProxyConfig {
    // 0 lets the system pick a free port
    int port = 0;
    std::optional<std::string> origin;
    // honor the client's Host instead of redirecting everything to origin
    bool fullProxyMode = false;
    std::string cacheDir = "./cache";
    // empty: console logging only
    std::string logDir;
    Logger::Level logLevel = Logger::LEVEL_DEBUG;

    // value forced into every Host header, none in full-proxy mode
    std::optional<std::string> fixedOrigin() const {
        if (fullProxyMode) {
            return std::nullopt;
        }
        return origin;
    }
};

#endif
