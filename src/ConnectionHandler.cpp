#include "ConnectionHandler.hpp"
#include "Parser.hpp"
#include "ProxyError.hpp"
#include "Tunnel.hpp"
#include <cerrno>
#include <cstring>
#include <optional>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <boost/beast/core/string.hpp>

ConnectionHandler::ConnectionHandler(const ProxyConfig & config, CacheStore & store, OriginClient & origin)
    : config(config), store(store), origin(origin) {}

void ConnectionHandler::handle(int client_fd) {
    logger.debug("handle client fd " + to_string(client_fd));
    int id = -1;
    try {
        serve(client_fd, id);
    }
    catch (const ParseError & e) {
        logger.warning(id, std::string(e.what()) + ", closing without response");
    }
    catch (const MissingHostError & e) {
        logger.warning(id, std::string(e.what()) + ", closing without response");
    }
    catch (const TunnelError & e) {
        logger.error(id, e.what());
    }
    catch (const ProxyError & e) {
        logger.error(id, std::string(e.what()) + ", closing without response");
    }
    catch (const std::exception & e) {
        logger.error(id, "ERROR on client fd " + to_string(client_fd) + ": " + e.what());
    }

    if (shutdown(client_fd, SHUT_WR) < 0 && errno != ENOTCONN) {
        logger.debug(id, "shutdown client fd " + to_string(client_fd) + ": " + std::string(strerror(errno)));
    }
    close(client_fd);
    logger.debug(id, "closed client fd: " + to_string(client_fd));
}

void ConnectionHandler::serve(int client_fd, int & id) {
    SocketReader reader(client_fd);
    Parser parser(config.fixedOrigin());

    std::optional<Request> parsed = parser.parseRequest(reader);
    if (!parsed) {
        logger.debug("empty request on client fd " + to_string(client_fd));
        return;
    }
    const Request & request = *parsed;
    id = request.getId();
    logger.info(id, "\"" + request.getMethod() + " " + request.getUrl() + " " + request.getVersion() +
                "\" from " + peerAddress(client_fd) + " @ " + logger.getCurrentTime());

    if (request.isConnect()) {
        Tunnel tunnel;
        tunnel.run(client_fd, request.getUrl(), reader.takeBuffered(), id);
        return;
    }

    if (!request.hasHeader("Host")) {
        throw MissingHostError();
    }

    CacheEntry entry;
    bool hit = lookup(request, entry);

    send_all(client_fd, buildResponse(entry, hit));
    logger.info(id, "Responding \"" + entry.getResponseLine() + "\" X-CACHE: " + (hit ? "HIT" : "MISS"));
}

bool ConnectionHandler::lookup(const Request & request, CacheEntry & entry) {
    int id = request.getId();
    std::string key = CacheStore::computeKey(request.getMethod(), request.getHeader("Host"), request.getUrl());

    std::optional<CacheEntry> cached = store.get(key);
    if (cached) {
        logger.info(id, "in cache, key " + key);
        entry = std::move(*cached);
        return true;
    }

    logger.info(id, "not in cache, key " + key);
    entry = origin.fetch(request);
    store.put(key, entry);
    logger.debug(id, "cached response for " + request.getUrl());
    return false;
}

std::string ConnectionHandler::buildResponse(const CacheEntry & entry, bool hit) {
    std::string response = entry.getResponseLine() + "\r\n";
    for (const auto & field : entry.getResponseHeaders()) {
        // both are set by the proxy below
        if (beast::iequals(field.name_string(), "Connection") ||
            beast::iequals(field.name_string(), "X-CACHE")) {
            continue;
        }
        response += field.name_string().to_string() + ": " + field.value().to_string() + "\r\n";
    }
    response += std::string("X-CACHE: ") + (hit ? "HIT" : "MISS") + "\r\n";
    response += "Connection: close\r\n";
    response += "\r\n";
    response += entry.getResponseBody();
    return response;
}

std::string ConnectionHandler::peerAddress(int client_fd) {
    struct sockaddr_storage addr;
    socklen_t addr_len = sizeof(addr);
    if (getpeername(client_fd, reinterpret_cast<struct sockaddr *>(&addr), &addr_len) < 0) {
        return "unknown";
    }
    char ip[INET6_ADDRSTRLEN] = {0};
    if (addr.ss_family == AF_INET) {
        inet_ntop(AF_INET, &reinterpret_cast<struct sockaddr_in *>(&addr)->sin_addr, ip, sizeof(ip));
    } else if (addr.ss_family == AF_INET6) {
        inet_ntop(AF_INET6, &reinterpret_cast<struct sockaddr_in6 *>(&addr)->sin6_addr, ip, sizeof(ip));
    } else {
        return "local";
    }
    return ip;
}
