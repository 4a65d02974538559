#include "Tunnel.hpp"
#include "ProxyError.hpp"
#include "Socket.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <functional>
#include <system_error>
#include <thread>
#include <sys/socket.h>
#include <unistd.h>
#include <boost/lexical_cast.hpp>

namespace {

const char kEstablished[] = "HTTP/1.1 200 Connection Established\r\n"
                            "Proxy-Agent: caching-proxy\r\n"
                            "\r\n";

void shutdown_fd(int fd, int how, int id) {
    if (shutdown(fd, how) < 0 && errno != ENOTCONN) {
        Logger::getInstance().debug(id, "shutdown fd " + to_string(fd) + ": " + std::string(strerror(errno)));
    }
}

}

std::pair<std::string, int> Tunnel::parseTarget(const std::string & target) {
    std::string host = target;
    std::string port_str;
    if (!target.empty() && target.front() == '[') {
        size_t close = target.find(']');
        if (close == std::string::npos) {
            throw TunnelError("malformed IPv6 target \"" + target + "\"");
        }
        host = target.substr(1, close - 1);
        if (close + 1 < target.size()) {
            if (target[close + 1] != ':') {
                throw TunnelError("malformed target \"" + target + "\"");
            }
            port_str = target.substr(close + 2);
        }
    } else {
        size_t colon = target.find(':');
        if (colon != std::string::npos) {
            host = target.substr(0, colon);
            port_str = target.substr(colon + 1);
        }
    }
    if (host.empty()) {
        throw TunnelError("no host in target \"" + target + "\"");
    }

    int port = kDefaultPort;
    if (!port_str.empty()) {
        bool digits = std::all_of(port_str.begin(), port_str.end(),
                                  [](unsigned char c) { return std::isdigit(c); });
        if (!digits || !boost::conversion::try_lexical_convert(port_str, port) ||
            port <= 0 || port > 65535) {
            throw TunnelError("bad port in target \"" + target + "\"");
        }
    }
    return {host, port};
}

void Tunnel::run(int client_fd, const std::string & target, const std::string & early_data, int id) {
    auto [host, port] = parseTarget(target);
    logger.info(id, "Requesting \"CONNECT " + target + "\" to " + host + ":" + to_string(port));

    int server_fd = -1;
    try {
        server_fd = connect_to_server(host, port);
    }
    catch (const std::runtime_error & e) {
        throw TunnelError(e.what());
    }
    logger.info(id, "Successfully connected to destination server " + host + ":" + to_string(port) +
                " on fd " + to_string(server_fd));

    try {
        send_all(client_fd, kEstablished, sizeof(kEstablished) - 1);
        if (!early_data.empty()) {
            send_all(server_fd, early_data);
            bytes_up += early_data.size();
        }
    }
    catch (const std::runtime_error & e) {
        close(server_fd);
        throw TunnelError(e.what());
    }
    logger.info(id, "Responding \"HTTP/1.1 200 Connection Established\"");

    std::thread upstream(&Tunnel::relay, this, client_fd, server_fd, std::ref(bytes_up), "client->server", id);
    try {
        std::thread downstream(&Tunnel::relay, this, server_fd, client_fd, std::ref(bytes_down), "server->client", id);
        downstream.join();
    }
    catch (const std::system_error & e) {
        // no second relay thread: unblock the first one and give up
        shutdown_fd(client_fd, SHUT_RDWR, id);
        shutdown_fd(server_fd, SHUT_RDWR, id);
        upstream.join();
        close(server_fd);
        throw TunnelError(std::string("cannot start relay thread: ") + e.what());
    }
    upstream.join();

    close(server_fd);
    logger.info(id, "Tunnel closed. Total bytes: client->server=" + to_string(bytes_up.load()) +
                ", server->client=" + to_string(bytes_down.load()));
}

void Tunnel::relay(int src_fd, int dst_fd, std::atomic<size_t> & total, const char * direction, int id) {
    char buffer[kChunkSize];
    while (true) {
        ssize_t bytes_read = recv(src_fd, buffer, sizeof(buffer), 0);
        if (bytes_read < 0 && errno == EINTR) {
            continue;
        }
        if (bytes_read == 0) {
            // pass the half-close on, the other direction keeps running
            logger.debug(id, std::string(direction) + " reached end of stream");
            shutdown_fd(dst_fd, SHUT_WR, id);
            return;
        }
        if (bytes_read < 0) {
            logger.debug(id, std::string(direction) + " read failed: " + std::string(strerror(errno)));
            shutdown_fd(src_fd, SHUT_RDWR, id);
            shutdown_fd(dst_fd, SHUT_RDWR, id);
            return;
        }
        try {
            send_all(dst_fd, buffer, bytes_read);
        }
        catch (const std::runtime_error & e) {
            logger.debug(id, std::string(direction) + " write failed: " + e.what());
            shutdown_fd(src_fd, SHUT_RDWR, id);
            shutdown_fd(dst_fd, SHUT_RDWR, id);
            return;
        }
        total += bytes_read;
    }
}
