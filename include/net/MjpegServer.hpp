#pragma once

#include <chrono>
#include <memory>
#include <string>

#include "core/CameraControl.hpp"
#include "core/LatestFrameBuffer.hpp"
#include "core/Types.hpp"
#include "net/HttpServer.hpp"

namespace net {

/**
 * MJPEG-over-HTTP server.
 *
 *   /, /index.html                    HTML status page
 *   /video, /stream, /?action=stream  multipart/x-mixed-replace stream
 *   /status                           {"fps": .., "width": .., "height": ..}
 *
 * With a CameraControl attached:
 *   GET  /camera_status                connection state and orientation
 *   POST /set_rotation                 {"rotation", "flip_horizontal", "flip_vertical"}, all optional
 *   POST /reconnect                    reopen the capture source
 *
 * Every stream client runs its own loop against the shared
 * LatestFrameBuffer and only ever receives the newest frame.
 */
class MjpegServer {
public:
    struct Config {
        int port = 8080;
        int width = 640;    // Reported on / and /status
        int height = 480;
        std::chrono::milliseconds waitTimeout = core::STREAM_WAIT_TIMEOUT;
    };

    MjpegServer(std::shared_ptr<core::LatestFrameBuffer> buffer, Config config,
                std::shared_ptr<core::CameraControl> camera = nullptr);
    ~MjpegServer();

    /**
     * Throws std::runtime_error if the port cannot be bound.
     */
    void start();
    void stop();

    [[nodiscard]] int port() const { return _server.port(); }
    size_t clientCount() { return _server.clientCount(); }

    /**
     * Headers that open a stream response.
     */
    static std::string streamHead();

    /**
     * "--frame\r\nContent-Type: image/jpeg\r\nContent-Length: N\r\n\r\n"
     */
    static std::string partHeader(size_t payloadSize);

    /**
     * Full part: partHeader + payload + "\r\n".
     */
    static std::string formatPart(const uint8_t* payload, size_t size);

private:
    void handleRequest(const HttpRequest& request, HttpConnection& connection);
    void streamFrames(HttpConnection& connection);
    [[nodiscard]] bool isKnownPath(const HttpRequest& request) const;
    HttpResponse cameraStatus() const;
    HttpResponse setRotation(const HttpRequest& request);
    HttpResponse reconnect();
    [[nodiscard]] std::string renderIndex() const;
    [[nodiscard]] std::string renderStatus() const;

    std::shared_ptr<core::LatestFrameBuffer> _buffer;
    Config _config;
    std::shared_ptr<core::CameraControl> _camera;
    HttpServer _server;
};

} // namespace net
