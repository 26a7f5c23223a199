#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "net/HttpMessage.hpp"

namespace net {

/**
 * One accepted socket as seen by a request handler.
 * All sends use MSG_NOSIGNAL, a closed peer shows up as a false return.
 */
class HttpConnection {
public:
    HttpConnection(int socket, const std::atomic<bool>& active)
        : socket_(socket), active_(active) {}

    /**
     * Sends all bytes. Returns false if the peer is gone.
     */
    bool send(const void* data, size_t size);
    bool send(const std::string& data) { return send(data.data(), data.size()); }
    bool sendResponse(const HttpResponse& response) { return send(formatResponse(response)); }

    /**
     * False once the server is stopping. Long-lived handlers poll this.
     */
    [[nodiscard]] bool isActive() const { return active_.load(std::memory_order_relaxed); }

    [[nodiscard]] int socket() const { return socket_; }

private:
    int socket_;
    const std::atomic<bool>& active_;
};

/**
 * Minimal threaded HTTP/1.1 server: one accept thread, one thread per
 * connection, one request per connection. The handler may keep the
 * connection open as long as it likes (MJPEG streaming).
 */
class HttpServer {
public:
    using Handler = std::function<void(const HttpRequest& request, HttpConnection& connection)>;

    /**
     * @param name used in log lines
     * @param port TCP port, 0 picks a free one (see port())
     */
    HttpServer(std::string name, int port, Handler handler);
    ~HttpServer();

    // Non-copyable
    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * Bind and start accepting. Throws std::runtime_error if the socket
     * cannot be created, bound or put into listening state.
     */
    void start();
    void stop();

    [[nodiscard]] bool isRunning() const { return _running; }

    /**
     * Bound port, valid after start().
     */
    [[nodiscard]] int port() const { return _port; }

    /**
     * Connections whose handler is still running.
     */
    size_t clientCount();

private:
    struct Client {
        int socket = -1;
        std::thread thread;
        std::atomic<bool> active{true};  // Cleared by stop()
        std::atomic<bool> done{false};   // Set by the client thread on exit
    };

    void serverLoop();
    void handleClient(std::shared_ptr<Client> client);
    bool readRequest(int socket, HttpRequest& request);
    void cleanClients();
    static void release(Client& client);

    std::string _name;
    int _port;
    Handler _handler;

    int _serverSocket = -1;
    std::atomic<bool> _running{false};
    std::thread _serverThread;

    std::vector<std::shared_ptr<Client>> _clients;
    std::mutex _clientsMutex;
};

} // namespace net
