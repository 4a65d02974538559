#include "Proxy.hpp"
#include <unistd.h>
#include <iostream>
#include <cstring>
#include <cerrno>
#include <arpa/inet.h>
#include <sys/time.h>
#include <filesystem>
#include <system_error>

Proxy::Proxy(const ProxyConfig & config) : Proxy(config, std::make_unique<OriginClient>()) {}

Proxy::Proxy(const ProxyConfig & config, std::unique_ptr<OriginClient> origin) :
    config(config),
    store(config.cacheDir),
    origin(std::move(origin)),
    handler(this->config, store, *this->origin),
    listen_fd(-1),
    port(config.port),
    logger(Logger::getInstance()),
    running(false) {}

Proxy::~Proxy() {
    stop();
    int fd = listen_fd.exchange(-1);
    if (fd >= 0) {
        close(fd);
        logger.debug("closed listen fd: " + to_string(fd));
    }
}

void Proxy::run() {
    if (listen_fd < 0) {
        bind_and_listen();
    }
    start_accepting();
}

// Setup server socket with proper configurations
void Proxy::bind_and_listen() {
    logger.info("setting up server...");
    int fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd < 0) {
        throw std::runtime_error("Failed to create socket");
    }

    int opt = 1;
    if (setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt))) {
        close(fd);
        throw std::runtime_error("Failed to set socket options");
    }

    struct sockaddr_in address;
    memset(&address, 0, sizeof(address));
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(port);  // if port=0, the system will assign a available port

    if (bind(fd, (struct sockaddr *)&address, sizeof(address)) < 0) {
        int err = errno;
        close(fd);
        throw std::runtime_error("Failed to bind to port " + std::to_string(port) + ": " + strerror(err));
    }

    // get the actual port
    socklen_t addrlen = sizeof(address);
    if (getsockname(fd, (struct sockaddr *)&address, &addrlen) == -1) {
        close(fd);
        throw std::runtime_error("Failed to get socket port");
    }
    port = ntohs(address.sin_port);

    if (listen(fd, SOMAXCONN) < 0) {
        close(fd);
        throw std::runtime_error("Failed to listen");
    }

    // accept wakes up every second to check the running flag
    struct timeval tv;
    tv.tv_sec = 1;
    tv.tv_usec = 0;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, (const char*)&tv, sizeof(tv)) < 0) {
        logger.warning("Failed to set accept timeout: " + std::string(strerror(errno)));
    }

    std::error_code ec;
    std::filesystem::create_directories(store.getBaseDir(), ec);
    if (ec) {
        // put() retries and reports per request
        logger.warning("cannot create cache dir " + store.getBaseDir().string() + ": " + ec.message());
    }

    listen_fd = fd;
    running = true;
    logger.info("successfully set up server on port " + std::to_string(port));
    if (config.fullProxyMode) {
        logger.info("full proxy mode, honoring client Host headers");
    } else if (config.origin) {
        logger.info("forwarding requests to " + *config.origin);
    }
}

void Proxy::start_accepting() {
    while(running) {
        struct sockaddr_in client_addr;
        socklen_t client_len = sizeof(client_addr);

        int client_fd = accept(listen_fd, (struct sockaddr *)&client_addr, &client_len);

        if (!running) {
            if (client_fd >= 0) close(client_fd);
            break;
        }

        if (client_fd < 0) {
            if (errno == EWOULDBLOCK || errno == EAGAIN || errno == EINTR) {
                reap_finished();
                continue;  // Timeout or interrupted, check running flag
            }
            logger.warning("Failed to accept connection: " + std::string(strerror(errno)));
            continue;
        }
        logger.debug("build a new client fd " + to_string(client_fd));

        reap_finished();
        {
            std::lock_guard<std::mutex> lock(thread_mutex);
            auto done = std::make_shared<std::atomic<bool>>(false);
            try {
                workers.push_back(Worker{std::thread(&Proxy::client_thread, this, client_fd, done), done});
            }
            catch (const std::system_error & e) {
                logger.error("Failed to start connection thread: " + std::string(e.what()));
                close(client_fd);
            }
        }
    }

    logger.info("Accepting loop terminated");
}

void Proxy::client_thread(Proxy* proxy, int client_fd, std::shared_ptr<std::atomic<bool>> done) {
    proxy->handler.handle(client_fd);
    *done = true;
}

void Proxy::reap_finished() {
    std::lock_guard<std::mutex> lock(thread_mutex);
    for (auto it = workers.begin(); it != workers.end();) {
        if (*it->done) {
            it->thread.join();
            it = workers.erase(it);
        } else {
            ++it;
        }
    }
}

void Proxy::stop() {
    if (running.exchange(false)) {
        logger.info("Initiating proxy shutdown...");

        // interrupt accept, the descriptor is closed by the destructor
        int fd = listen_fd;
        if (fd >= 0) {
            shutdown(fd, SHUT_RDWR);
        }
    }

    join_all();
}

void Proxy::join_all() {
    std::lock_guard<std::mutex> lock(thread_mutex);
    if (workers.empty()) return;
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
    workers.clear();
    logger.info("all client threads joined");
}
