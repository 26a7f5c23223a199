#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace net {

/**
 * Malformed or unsupported request. status() is the HTTP status to answer with.
 */
class HttpError : public std::runtime_error {
public:
    HttpError(int status, const std::string& message)
        : std::runtime_error(message), status_(status) {}

    [[nodiscard]] int status() const { return status_; }

private:
    int status_;
};

struct HttpRequest {
    std::string method;
    std::string target;  // As sent, e.g. "/?action=stream"
    std::string path;    // "/"
    std::string query;   // "action=stream"
    std::string version;
    std::map<std::string, std::string> headers; // Lower-case names
    std::string body;

    [[nodiscard]] std::string header(const std::string& name) const;

    /**
     * Throws HttpError(400) for a malformed value.
     */
    [[nodiscard]] size_t contentLength() const;
};

struct HttpResponse {
    int status = 200;
    std::string contentType = "text/plain";
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;

    HttpResponse& header(std::string name, std::string value) {
        headers.emplace_back(std::move(name), std::move(value));
        return *this;
    }
};

constexpr size_t MAX_REQUEST_HEAD = 8 * 1024;
constexpr size_t MAX_REQUEST_BODY = 64 * 1024;

/**
 * Parse the request line and headers (everything before the blank line).
 * Throws HttpError(400) if malformed.
 */
HttpRequest parseRequestHead(const std::string& head);

[[nodiscard]] const char* statusText(int status);

/**
 * Status line plus header lines plus the terminating blank line.
 */
std::string formatHead(int status, const std::vector<std::pair<std::string, std::string>>& headers);

/**
 * Complete response with Content-Type, Content-Length and Connection: close.
 */
std::string formatResponse(const HttpResponse& response);

} // namespace net
