#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/Logger.hpp"

namespace core {

enum class CaptureBackend {
    Auto,       // libcamera if it opens, OpenCV device otherwise
    Libcamera,  // libcamerasrc through GStreamer (Raspberry Pi camera)
    OpenCv,     // V4L2 device through cv::VideoCapture
    None        // No capture, API only
};

[[nodiscard]] const char* backendName(CaptureBackend backend);

/**
 * Everything the operator can tune. Read from the environment once at startup,
 * every effective value is logged by log().
 */
struct ServiceConfig {
    struct Stream {
        int port = 8080;
        int width = 640;
        int height = 480;
        int fps = 30;
        int jpegQuality = 70;
    } stream;

    struct Capture {
        CaptureBackend backend = CaptureBackend::Auto;
        int deviceIndex = 0;
        int rotation = 0;          // 0, 90, 180 or 270 degrees clockwise
        bool flipHorizontal = true;
        bool flipVertical = false;
    } capture;

    struct Stabilizer {
        size_t rawWindow = 20;
        size_t predWindow = 10;
        float lowConfidence = 0.40f;
        float actionableConfidence = 0.65f;
        std::vector<std::string> labels = {
            "Call", "Emergency", "Food", "Medicine", "No",
            "Sleep", "Stop", "Washroom", "Water", "Yes"
        };
    } stabilizer;

    struct Api {
        int port = 8000;           // 0 disables the gesture API
        std::string modelPath = "model/gesture_forest.yml";
    } api;

    struct Osc {
        std::string host;          // Empty disables OSC output
        std::string port = "9000";
    } osc;

    LogLevel logLevel = LogLevel::INFO;

    using Lookup = std::function<std::optional<std::string>(const std::string& name)>;

    /**
     * Build from std::getenv.
     * Throws std::invalid_argument on malformed or out-of-range values.
     */
    static ServiceConfig fromEnvironment();

    /**
     * Build from an arbitrary name -> value source (tests).
     */
    static ServiceConfig fromLookup(const Lookup& lookup);

    /**
     * Throws std::invalid_argument if any value is out of range.
     */
    void validate() const;

    void log() const;
};

} // namespace core
