#include "Socket.hpp"
#include "Logger.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netdb.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace {

const size_t kReadChunk = 8192;
const size_t kMaxLineLength = 64 * 1024;

}

int connect_to_server(const std::string & host, int port) {
    Logger & logger = Logger::getInstance();
    logger.debug("Attempting to connect to " + host + ":" + std::to_string(port));

    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo * result = nullptr;
    int rc = getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &result);
    if (rc != 0) {
        throw std::runtime_error("Failed to resolve hostname " + host + ": " + gai_strerror(rc));
    }

    int server_fd = -1;
    int last_errno = 0;
    for (struct addrinfo * ai = result; ai != nullptr; ai = ai->ai_next) {
        server_fd = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (server_fd < 0) {
            last_errno = errno;
            continue;
        }
        if (connect(server_fd, ai->ai_addr, ai->ai_addrlen) == 0) {
            break;
        }
        last_errno = errno;
        close(server_fd);
        server_fd = -1;
    }
    freeaddrinfo(result);

    if (server_fd < 0) {
        throw std::runtime_error("Failed to connect to " + host + ":" + std::to_string(port) +
                                 ": " + std::string(strerror(last_errno)));
    }
    logger.debug("Successfully connected to " + host + ":" + std::to_string(port) +
                 " on fd " + std::to_string(server_fd));
    return server_fd;
}

void send_all(int fd, const char * data, size_t len) {
    size_t total_sent = 0;
    while (total_sent < len) {
        ssize_t sent = send(fd, data + total_sent, len - total_sent, MSG_NOSIGNAL);
        if (sent < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("Failed to send on fd " + std::to_string(fd) + ": " +
                                     std::string(strerror(errno)));
        }
        total_sent += sent;
    }
}

void send_all(int fd, const std::string & data) {
    send_all(fd, data.data(), data.size());
}

SocketReader::SocketReader(int fd) : socket_fd(fd), pos(0) {}

bool SocketReader::fill() {
    // drop what has been consumed before growing the buffer
    if (pos > 0) {
        buffer.erase(0, pos);
        pos = 0;
    }
    char chunk[kReadChunk];
    while (true) {
        ssize_t received = recv(socket_fd, chunk, sizeof(chunk), 0);
        if (received < 0) {
            if (errno == EINTR) continue;
            throw std::runtime_error("Failed to receive on fd " + std::to_string(socket_fd) + ": " +
                                     std::string(strerror(errno)));
        }
        if (received == 0) {
            return false;
        }
        buffer.append(chunk, received);
        return true;
    }
}

std::optional<std::string> SocketReader::readLine() {
    // offset past pos that is already known to hold no newline
    size_t scanned = 0;
    while (true) {
        size_t newline = buffer.find('\n', pos + scanned);
        if (newline != std::string::npos) {
            size_t end = newline;
            if (end > pos && buffer[end - 1] == '\r') {
                end--;
            }
            std::string line = buffer.substr(pos, end - pos);
            pos = newline + 1;
            return line;
        }
        scanned = buffer.size() - pos;
        if (scanned > kMaxLineLength) {
            throw std::runtime_error("line longer than " + std::to_string(kMaxLineLength) + " bytes");
        }
        if (!fill()) {
            // end of stream: hand back a trailing unterminated line once
            if (pos < buffer.size()) {
                std::string line = buffer.substr(pos);
                pos = buffer.size();
                return line;
            }
            return std::nullopt;
        }
    }
}

std::optional<std::string> SocketReader::readExact(size_t n) {
    while (buffer.size() - pos < n) {
        if (!fill()) {
            return std::nullopt;
        }
    }
    std::string data = buffer.substr(pos, n);
    pos += n;
    return data;
}

std::string SocketReader::takeBuffered() {
    std::string rest = buffer.substr(pos);
    buffer.clear();
    pos = 0;
    return rest;
}
