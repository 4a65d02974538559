#ifndef TESTSERVER_HPP
#define TESTSERVER_HPP

#include <sys/socket.h>
#include <sys/time.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <unistd.h>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

// Local server on 127.0.0.1 with a system assigned port, serving one
// connection at a time. In HTTP mode it reads a request head plus its
// Content-Length body, records it and answers with handler(raw request).
// In echo mode it sends back every byte until the peer half-closes.
class TestServer {
public:
    using Handler = std::function<std::string(const std::string &)>;

    explicit TestServer(Handler handler) : handler(std::move(handler)), echo(false) { start(); }

    // echo mode
    TestServer() : echo(true) { start(); }

    ~TestServer() {
        running = false;
        shutdown(listen_fd, SHUT_RDWR);
        if (thread.joinable()) thread.join();
        close(listen_fd);
    }

    int getPort() const { return port; }

    std::vector<std::string> getRequests() {
        std::lock_guard<std::mutex> lock(mtx);
        return requests;
    }

    int getConnections() const { return connections; }

    // plain 200 response with the given body
    static std::string ok(const std::string & body, const std::string & extra_headers = "") {
        return "HTTP/1.1 200 OK\r\n"
               "Content-Type: text/plain\r\n" + extra_headers +
               "Content-Length: " + std::to_string(body.size()) + "\r\n"
               "Connection: close\r\n\r\n" + body;
    }

private:
    void start() {
        listen_fd = socket(AF_INET, SOCK_STREAM, 0);
        if (listen_fd < 0) throw std::runtime_error("test server: socket failed");
        int opt = 1;
        setsockopt(listen_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

        struct sockaddr_in addr;
        memset(&addr, 0, sizeof(addr));
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        addr.sin_addr.s_addr = inet_addr("127.0.0.1");
        if (bind(listen_fd, (struct sockaddr *)&addr, sizeof(addr)) < 0 || listen(listen_fd, 16) < 0) {
            close(listen_fd);
            throw std::runtime_error("test server: bind/listen failed");
        }
        socklen_t len = sizeof(addr);
        getsockname(listen_fd, (struct sockaddr *)&addr, &len);
        port = ntohs(addr.sin_port);

        struct timeval tv;
        tv.tv_sec = 0;
        tv.tv_usec = 200 * 1000;
        setsockopt(listen_fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv));

        running = true;
        thread = std::thread(&TestServer::serve, this);
    }

    void serve() {
        while (running) {
            int fd = accept(listen_fd, nullptr, nullptr);
            if (fd < 0) continue;
            connections++;

            struct timeval tv;
            tv.tv_sec = 5;
            tv.tv_usec = 0;
            setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv));

            if (echo) {
                serve_echo(fd);
            } else {
                serve_http(fd);
            }
            close(fd);
        }
    }

    void serve_echo(int fd) {
        char buffer[4096];
        while (true) {
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) break;
            if (send(fd, buffer, n, MSG_NOSIGNAL) != n) break;
        }
    }

    void serve_http(int fd) {
        std::string raw;
        char buffer[4096];
        size_t head_end = std::string::npos;
        size_t body_len = 0;
        while (true) {
            if (head_end == std::string::npos) {
                head_end = raw.find("\r\n\r\n");
                if (head_end != std::string::npos) {
                    body_len = content_length(raw.substr(0, head_end));
                }
            }
            if (head_end != std::string::npos && raw.size() >= head_end + 4 + body_len) break;
            ssize_t n = recv(fd, buffer, sizeof(buffer), 0);
            if (n <= 0) return;
            raw.append(buffer, n);
        }
        {
            std::lock_guard<std::mutex> lock(mtx);
            requests.push_back(raw);
        }
        std::string response = handler(raw);
        send(fd, response.data(), response.size(), MSG_NOSIGNAL);
        shutdown(fd, SHUT_WR);
    }

    static size_t content_length(const std::string & head) {
        std::string lower = head;
        for (auto & c : lower) c = tolower(static_cast<unsigned char>(c));
        size_t pos = lower.find("\r\ncontent-length:");
        if (pos == std::string::npos) return 0;
        return std::strtoul(head.c_str() + pos + 17, nullptr, 10);
    }

    Handler handler;
    bool echo;
    int listen_fd = -1;
    int port = 0;
    std::atomic<bool> running{false};
    std::atomic<int> connections{0};
    std::thread thread;
    std::mutex mtx;
    std::vector<std::string> requests;
};

#endif
