#ifndef TUNNEL_HPP
#define TUNNEL_HPP

#include <atomic>
#include <cstddef>
#include <string>
#include <utility>
#include "Logger.hpp"

// CONNECT handling: a plain byte pump between the client and host:port.
// Nothing that passes through is inspected or cached.
class Tunnel {
    public:
        static const int kDefaultPort = 443;
        static const size_t kChunkSize = 8192;

        // "host[:port]" or "[v6addr][:port]", port defaults to 443;
        // throws TunnelError for a bad port or an empty host
        static std::pair<std::string, int> parseTarget(const std::string & target);

        // Connects to target, answers the client with 200 and relays until
        // both directions end. early_data is whatever the client sent after
        // the CONNECT head that was already read. Does not close client_fd.
        // Throws TunnelError when the target cannot be reached.
        void run(int client_fd, const std::string & target, const std::string & early_data, int id);

        size_t getBytesUp() const { return bytes_up; }
        size_t getBytesDown() const { return bytes_down; }

    private:
        // copy src to dst in chunks until src ends or an I/O error
        void relay(int src_fd, int dst_fd, std::atomic<size_t> & total, const char * direction, int id);

        std::atomic<size_t> bytes_up{0};
        std::atomic<size_t> bytes_down{0};
        static inline Logger & logger = Logger::getInstance();
};

#endif
