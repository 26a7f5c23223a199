#include "net/MjpegServer.hpp"
#include "core/Logger.hpp"
#include <cmath>
#include <cstdint>
#include <iomanip>
#include <optional>
#include <sstream>
#include <nlohmann/json.hpp>

namespace net {

MjpegServer::MjpegServer(std::shared_ptr<core::LatestFrameBuffer> buffer, Config config,
                         std::shared_ptr<core::CameraControl> camera)
    : _buffer(std::move(buffer)),
      _config(config),
      _camera(std::move(camera)),
      _server("MjpegServer", config.port,
              [this](const HttpRequest& request, HttpConnection& connection) {
                  handleRequest(request, connection);
              }) {
}

MjpegServer::~MjpegServer() {
    stop();
}

void MjpegServer::start() {
    _server.start();
    core::Logger::info("MJPEG stream available at http://<host>:", _server.port(), "/video");
}

void MjpegServer::stop() {
    _server.stop();
}

std::string MjpegServer::streamHead() {
    return formatHead(200, {
        {"Age", "0"},
        {"Cache-Control", "no-cache, private"},
        {"Pragma", "no-cache"},
        {"Content-Type", std::string("multipart/x-mixed-replace; boundary=") + core::MJPEG_BOUNDARY},
        {"Connection", "keep-alive"},
    });
}

std::string MjpegServer::partHeader(size_t payloadSize) {
    std::ostringstream oss;
    oss << "--" << core::MJPEG_BOUNDARY << "\r\n"
        << "Content-Type: image/jpeg\r\n"
        << "Content-Length: " << payloadSize << "\r\n"
        << "\r\n";
    return oss.str();
}

std::string MjpegServer::formatPart(const uint8_t* payload, size_t size) {
    std::string part = partHeader(size);
    if (size > 0) {
        part.append(reinterpret_cast<const char*>(payload), size);
    }
    part += "\r\n";
    return part;
}

namespace {

std::optional<bool> optionalBool(const nlohmann::json& body, const char* name) {
    auto it = body.find(name);
    if (it == body.end() || it->is_null()) return std::nullopt;
    if (!it->is_boolean()) {
        throw HttpError(422, std::string(name) + ": value is not a valid boolean");
    }
    return it->get<bool>();
}

HttpResponse jsonResponse(int status, const nlohmann::json& body) {
    HttpResponse response;
    response.status = status;
    response.contentType = "application/json";
    response.body = body.dump();
    response.header("Access-Control-Allow-Origin", "*");
    return response;
}

} // namespace

bool MjpegServer::isKnownPath(const HttpRequest& request) const {
    static const char* const pagePaths[] = {"/", "/index.html", "/video", "/stream", "/status"};
    for (const char* path : pagePaths) {
        if (request.path == path) return true;
    }
    return _camera && (request.path == "/camera_status" || request.path == "/set_rotation" ||
                       request.path == "/reconnect");
}

void MjpegServer::handleRequest(const HttpRequest& request, HttpConnection& connection) {
    const bool isStream = request.path == "/video" || request.path == "/stream" ||
                          (request.path == "/" && request.query == "action=stream");

    if (!isKnownPath(request)) {
        HttpResponse response;
        response.status = 404;
        response.body = "Not Found\n";
        connection.sendResponse(response);
        return;
    }

    if (_camera && request.method == "POST" &&
        (request.path == "/set_rotation" || request.path == "/reconnect")) {
        HttpResponse response;
        try {
            response = request.path == "/set_rotation" ? setRotation(request) : reconnect();
        } catch (const HttpError& e) {
            response = jsonResponse(e.status(), {{"detail", e.what()}});
        }
        connection.sendResponse(response);
        return;
    }

    const bool postOnly = request.path == "/set_rotation" || request.path == "/reconnect";
    if (request.method != "GET" || postOnly) {
        HttpResponse response;
        response.status = 405;
        response.body = "Method Not Allowed\n";
        response.header("Allow", postOnly ? "POST" : "GET");
        connection.sendResponse(response);
        return;
    }

    if (isStream) {
        streamFrames(connection);
        return;
    }

    HttpResponse response;
    if (request.path == "/status") {
        response.contentType = "application/json";
        response.body = renderStatus();
        response.header("Access-Control-Allow-Origin", "*");
    } else if (request.path == "/camera_status") {
        response = cameraStatus();
    } else {
        response.contentType = "text/html; charset=utf-8";
        response.body = renderIndex();
    }
    connection.sendResponse(response);
}

HttpResponse MjpegServer::cameraStatus() const {
    core::Orientation o = _camera->orientation();
    return jsonResponse(200, {
        {"connected", _camera->isConnected()},
        {"source", _camera->sourceName()},
        {"capture_enabled", _camera->captureEnabled()},
        {"rotation", o.rotation},
        {"flip_horizontal", o.flipHorizontal},
        {"flip_vertical", o.flipVertical},
    });
}

HttpResponse MjpegServer::setRotation(const HttpRequest& request) {
    nlohmann::json body;
    try {
        body = request.body.empty() ? nlohmann::json::object() : nlohmann::json::parse(request.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw HttpError(400, std::string("Malformed JSON: ") + e.what());
    }
    if (!body.is_object()) {
        throw HttpError(422, "body: expected a JSON object");
    }

    std::optional<int> rotation;
    auto it = body.find("rotation");
    if (it != body.end() && !it->is_null()) {
        int64_t value = it->is_number_integer() ? it->get<int64_t>() : -1;
        if (value < 0 || value > 270 || !core::CameraControl::isValidRotation(static_cast<int>(value))) {
            throw HttpError(422, "rotation: must be 0, 90, 180 or 270");
        }
        rotation = static_cast<int>(value);
    }

    core::Orientation o = _camera->updateOrientation(rotation, optionalBool(body, "flip_horizontal"),
                                                     optionalBool(body, "flip_vertical"));
    return jsonResponse(200, {
        {"status", "success"},
        {"rotation", o.rotation},
        {"flip_horizontal", o.flipHorizontal},
        {"flip_vertical", o.flipVertical},
    });
}

HttpResponse MjpegServer::reconnect() {
    if (!_camera->requestReconnect()) {
        return jsonResponse(409, {{"status", "failed"}, {"detail", "Capture is disabled"}});
    }
    return jsonResponse(202, {{"status", "reconnecting"}});
}

void MjpegServer::streamFrames(HttpConnection& connection) {
    if (!connection.send(streamHead())) return;

    core::Logger::debug("MjpegServer: stream client connected");

    uint64_t lastSeen = 0;
    while (connection.isActive()) {
        auto frame = _buffer->waitNext(lastSeen, _config.waitTimeout);
        if (!frame) {
            if (_buffer->isClosed()) break;
            continue; // Timeout, keep the connection without sending an empty part
        }
        lastSeen = frame->sequence;

        // Send Boundary
        if (!connection.send(partHeader(frame->size()))) break;

        // Send JPEG
        if (frame->size() > 0 && !connection.send(frame->data(), frame->size())) break;

        // Send Newline
        if (!connection.send("\r\n", 2)) break;
    }

    core::Logger::debug("MjpegServer: stream client disconnected");
}

std::string MjpegServer::renderIndex() const {
    std::ostringstream fps;
    fps << std::fixed << std::setprecision(1) << _buffer->snapshotFPS();

    std::ostringstream html;
    html << "<!DOCTYPE html>\n"
         << "<html>\n"
         << "<head><title>Gesture Camera</title></head>\n"
         << "<body style=\"background:#1a1a2e;color:#fff;font-family:Arial;text-align:center;padding:20px;\">\n"
         << "<h1>Gesture Recognition Camera</h1>\n"
         << "<p>FPS: " << fps.str() << " | Resolution: " << _config.width << "x" << _config.height << "</p>\n"
         << "<img src=\"/video\" style=\"border:3px solid #00d9ff;border-radius:10px;max-width:100%;\">\n"
         << "<p style=\"margin-top:20px;\"><b>Stream URL:</b> <code>http://HOST:" << _server.port()
         << "/video</code></p>\n"
         << "</body>\n"
         << "</html>\n";
    return html.str();
}

std::string MjpegServer::renderStatus() const {
    nlohmann::json status = {
        {"fps", std::round(_buffer->snapshotFPS() * 10.0) / 10.0},
        {"width", _config.width},
        {"height", _config.height},
    };
    return status.dump();
}

} // namespace net
