#ifndef SOCKET_HPP
#define SOCKET_HPP

#include <cstddef>
#include <optional>
#include <string>

// Connect a blocking TCP socket to host:port, trying every resolved address.
// Throws std::runtime_error when no address accepts the connection.
int connect_to_server(const std::string & host, int port);

// send every byte of data, throws std::runtime_error on failure
void send_all(int fd, const std::string & data);
void send_all(int fd, const char * data, size_t len);

// Buffered reader over a connected socket. The parser pulls lines and
// fixed-size bodies from it; whatever it has read past the request stays
// buffered and can be taken with takeBuffered().
class SocketReader {
    public:
        explicit SocketReader(int fd);

        // next line without its "\n" or "\r\n"; nullopt at end of stream
        std::optional<std::string> readLine();

        // exactly n bytes, nullopt if the stream ends first
        std::optional<std::string> readExact(size_t n);

        // bytes received but not consumed yet
        std::string takeBuffered();

        int fd() const { return socket_fd; }

    private:
        // append one recv() worth of data, false at end of stream
        bool fill();

        int socket_fd;
        std::string buffer;
        size_t pos;
};

#endif
