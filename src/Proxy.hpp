#ifndef PROXY_HPP
#define PROXY_HPP

#include <sys/socket.h>
#include <netinet/in.h>
#include <atomic>
#include <list>
#include <memory>
#include <string>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <mutex>
#include "CacheStore.hpp"
#include "ConnectionHandler.hpp"
#include "Logger.hpp"
#include "OriginClient.hpp"
#include "ProxyConfig.hpp"

// The listener: accepts connections and runs each one on its own thread.
// There is no connection limit.
class Proxy {
public:
    explicit Proxy(const ProxyConfig & config);

    // use a different origin client, e.g. a recording one in tests
    Proxy(const ProxyConfig & config, std::unique_ptr<OriginClient> origin);

    // Destructor
    ~Proxy();

    // Bind and listen; throws std::runtime_error, which is fatal at startup.
    // Called by run() when it has not been called yet.
    void bind_and_listen();

    // Start the proxy server, returns after stop()
    void run();

    // Stop accepting and wait for in-flight connections
    void stop();

    // Get the current port
    int getPort() const { return port; }

    CacheStore & getCacheStore() { return store; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    // Accept client connections
    void start_accepting();

    // Static client thread function
    static void client_thread(Proxy* proxy, int client_fd, std::shared_ptr<std::atomic<bool>> done);

    // join the threads of connections that have finished
    void reap_finished();

    // Wait for all client threads
    void join_all();

    ProxyConfig config;
    CacheStore store;
    std::unique_ptr<OriginClient> origin;
    ConnectionHandler handler;

    std::atomic<int> listen_fd;
    std::atomic<int> port;
    Logger& logger;
    std::atomic<bool> running;
    std::list<Worker> workers;
    std::mutex thread_mutex;
};

#endif
