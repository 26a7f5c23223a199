#include "net/HttpMessage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace net {

namespace {

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t begin = s.find_first_not_of(" \t");
    if (begin == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(begin, end - begin + 1);
}

} // namespace

std::string HttpRequest::header(const std::string& name) const {
    auto it = headers.find(toLower(name));
    return it != headers.end() ? it->second : std::string();
}

size_t HttpRequest::contentLength() const {
    std::string value = header("content-length");
    if (value.empty()) return 0;
    if (!std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); }) ||
        value.size() > 12) {
        throw HttpError(400, "Invalid Content-Length");
    }
    return static_cast<size_t>(std::stoull(value));
}

HttpRequest parseRequestHead(const std::string& head) {
    HttpRequest request;

    std::istringstream stream(head);
    std::string line;
    if (!std::getline(stream, line)) {
        throw HttpError(400, "Empty request");
    }
    if (!line.empty() && line.back() == '\r') line.pop_back();

    std::istringstream requestLine(line);
    std::string extra;
    if (!(requestLine >> request.method >> request.target >> request.version) || (requestLine >> extra)) {
        throw HttpError(400, "Malformed request line");
    }
    if (request.version.rfind("HTTP/1.", 0) != 0) {
        throw HttpError(505, "Unsupported HTTP version");
    }
    if (request.target.empty() || request.target.front() != '/') {
        throw HttpError(400, "Malformed request target");
    }

    size_t q = request.target.find('?');
    request.path = request.target.substr(0, q);
    if (q != std::string::npos) {
        request.query = request.target.substr(q + 1);
    }

    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty()) break;

        size_t colon = line.find(':');
        if (colon == std::string::npos || colon == 0) {
            throw HttpError(400, "Malformed header line");
        }
        request.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }

    return request;
}

const char* statusText(int status) {
    switch (status) {
        case 200: return "OK";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 409: return "Conflict";
        case 413: return "Payload Too Large";
        case 422: return "Unprocessable Entity";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 503: return "Service Unavailable";
        case 505: return "HTTP Version Not Supported";
        default:  return "Unknown";
    }
}

std::string formatHead(int status, const std::vector<std::pair<std::string, std::string>>& headers) {
    std::ostringstream oss;
    oss << "HTTP/1.1 " << status << " " << statusText(status) << "\r\n";
    for (const auto& [name, value] : headers) {
        oss << name << ": " << value << "\r\n";
    }
    oss << "\r\n";
    return oss.str();
}

std::string formatResponse(const HttpResponse& response) {
    std::vector<std::pair<std::string, std::string>> headers;
    if (response.status != 204) {
        headers.emplace_back("Content-Type", response.contentType);
        headers.emplace_back("Content-Length", std::to_string(response.body.size()));
    }
    headers.insert(headers.end(), response.headers.begin(), response.headers.end());
    headers.emplace_back("Connection", "close");

    std::string out = formatHead(response.status, headers);
    if (response.status != 204) {
        out += response.body;
    }
    return out;
}

} // namespace net
