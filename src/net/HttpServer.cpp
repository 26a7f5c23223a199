#include "net/HttpServer.hpp"
#include "core/Logger.hpp"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <stdexcept>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

namespace net {

namespace {

constexpr int LISTEN_BACKLOG = 16;
constexpr int RECV_TIMEOUT_S = 5;

} // namespace

bool HttpConnection::send(const void* data, size_t size) {
    const char* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = ::send(socket_, p, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

HttpServer::HttpServer(std::string name, int port, Handler handler)
    : _name(std::move(name)), _port(port), _handler(std::move(handler)) {
}

HttpServer::~HttpServer() {
    stop();
}

void HttpServer::start() {
    if (_running) return;

    _serverSocket = socket(AF_INET, SOCK_STREAM, 0);
    if (_serverSocket < 0) {
        throw std::runtime_error(_name + ": Failed to create socket: " + std::strerror(errno));
    }

    int opt = 1;
    setsockopt(_serverSocket, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = INADDR_ANY;
    address.sin_port = htons(static_cast<uint16_t>(_port));

    if (bind(_serverSocket, reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        std::string reason = std::strerror(errno);
        close(_serverSocket);
        _serverSocket = -1;
        throw std::runtime_error(_name + ": Failed to bind to port " + std::to_string(_port) + ": " + reason);
    }

    if (listen(_serverSocket, LISTEN_BACKLOG) < 0) {
        std::string reason = std::strerror(errno);
        close(_serverSocket);
        _serverSocket = -1;
        throw std::runtime_error(_name + ": Failed to listen: " + reason);
    }

    // Resolve the actual port when 0 was requested
    socklen_t len = sizeof(address);
    if (getsockname(_serverSocket, reinterpret_cast<sockaddr*>(&address), &len) == 0) {
        _port = ntohs(address.sin_port);
    }

    _running = true;
    _serverThread = std::thread(&HttpServer::serverLoop, this);
    core::Logger::info(_name, " started on port ", _port);
}

void HttpServer::stop() {
    if (!_running) return;
    _running = false;

    // shutdown() unblocks accept(), close() alone does not on Linux
    if (_serverSocket >= 0) {
        shutdown(_serverSocket, SHUT_RDWR);
        close(_serverSocket);
        _serverSocket = -1;
    }

    if (_serverThread.joinable()) {
        _serverThread.join();
    }

    std::vector<std::shared_ptr<Client>> clients;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        clients.swap(_clients);
    }

    // Wake up handlers blocked in send() or waiting for frames
    for (auto& client : clients) {
        client->active = false;
        shutdown(client->socket, SHUT_RDWR);
    }
    for (auto& client : clients) {
        release(*client);
    }

    core::Logger::info(_name, " stopped.");
}

size_t HttpServer::clientCount() {
    std::lock_guard<std::mutex> lock(_clientsMutex);
    size_t count = 0;
    for (const auto& client : _clients) {
        if (!client->done) ++count;
    }
    return count;
}

void HttpServer::serverLoop() {
    while (_running) {
        sockaddr_in clientAddr{};
        socklen_t clientLen = sizeof(clientAddr);
        int clientSocket = accept(_serverSocket, reinterpret_cast<sockaddr*>(&clientAddr), &clientLen);

        if (clientSocket < 0) {
            if (_running) {
                core::Logger::warn(_name, ": Accept failed: ", std::strerror(errno));
                // Avoid spinning when out of descriptors
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
            continue;
        }

        timeval timeout{};
        timeout.tv_sec = RECV_TIMEOUT_S;
        setsockopt(clientSocket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

        auto client = std::make_shared<Client>();
        client->socket = clientSocket;
        client->thread = std::thread(&HttpServer::handleClient, this, client);

        cleanClients();

        std::lock_guard<std::mutex> lock(_clientsMutex);
        _clients.push_back(std::move(client));
    }
}

void HttpServer::handleClient(std::shared_ptr<Client> client) {
    HttpConnection connection(client->socket, client->active);

    try {
        HttpRequest request;
        if (readRequest(client->socket, request)) {
            _handler(request, connection);
        }
    } catch (const HttpError& e) {
        core::Logger::debug(_name, ": rejected request: ", e.what());
        HttpResponse response;
        response.status = e.status();
        response.body = std::string(e.what()) + "\n";
        connection.sendResponse(response);
    } catch (const std::exception& e) {
        core::Logger::error(_name, ": connection error: ", e.what());
        HttpResponse response;
        response.status = 500;
        response.body = "Internal Server Error\n";
        connection.sendResponse(response);
    }

    // Socket is closed by whoever joins this thread
    shutdown(client->socket, SHUT_RDWR);
    client->done = true;
}

bool HttpServer::readRequest(int socket, HttpRequest& request) {
    std::string data;
    char buf[4096];

    size_t headEnd;
    while ((headEnd = data.find("\r\n\r\n")) == std::string::npos) {
        if (data.size() > MAX_REQUEST_HEAD) {
            throw HttpError(431, "Request head too large");
        }
        ssize_t n = recv(socket, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) return false; // Closed or timed out before a full head arrived
        data.append(buf, static_cast<size_t>(n));
    }

    request = parseRequestHead(data.substr(0, headEnd + 2));

    size_t length = request.contentLength();
    if (length > MAX_REQUEST_BODY) {
        throw HttpError(413, "Request body too large");
    }

    request.body = data.substr(headEnd + 4);
    while (request.body.size() < length) {
        ssize_t n = recv(socket, buf, sizeof(buf), 0);
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            throw HttpError(400, "Truncated request body");
        }
        request.body.append(buf, static_cast<size_t>(n));
    }
    request.body.resize(length);
    return true;
}

void HttpServer::cleanClients() {
    std::vector<std::shared_ptr<Client>> finished;
    {
        std::lock_guard<std::mutex> lock(_clientsMutex);
        auto it = _clients.begin();
        while (it != _clients.end()) {
            if ((*it)->done) {
                finished.push_back(std::move(*it));
                it = _clients.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& client : finished) {
        release(*client);
    }
}

void HttpServer::release(Client& client) {
    if (client.thread.joinable()) {
        client.thread.join();
    }
    if (client.socket >= 0) {
        close(client.socket);
        client.socket = -1;
    }
}

} // namespace net
