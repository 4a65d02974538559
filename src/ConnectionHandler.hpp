#ifndef CONNECTIONHANDLER_HPP
#define CONNECTIONHANDLER_HPP

#include <string>
#include "CacheEntry.hpp"
#include "CacheStore.hpp"
#include "Logger.hpp"
#include "OriginClient.hpp"
#include "ProxyConfig.hpp"
#include "Request.hpp"
#include "Socket.hpp"

// Serves one accepted client connection:
//   AwaitRequest -> (Tunnel | Lookup) -> Respond -> Close
// Every failure stays inside the connection: it is logged and the socket is
// closed without a response.
class ConnectionHandler {
    public:
        ConnectionHandler(const ProxyConfig & config, CacheStore & store, OriginClient & origin);

        // handles the connection and always closes client_fd
        void handle(int client_fd);

        // status line, stored headers, X-CACHE, Connection: close, blank line, body
        static std::string buildResponse(const CacheEntry & entry, bool hit);

    private:
        // the state machine, throws ProxyError subclasses on failure
        void serve(int client_fd, int & id);

        // cache hit or origin round trip, returns whether it was a hit
        bool lookup(const Request & request, CacheEntry & entry);

        std::string peerAddress(int client_fd);

        ProxyConfig config;
        CacheStore & store;
        OriginClient & origin;
        static inline Logger & logger = Logger::getInstance();
};

#endif
