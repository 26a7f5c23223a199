#include "core/Config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace core {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

long parseLong(const std::string& name, const std::string& value) {
    std::string v = trim(value);
    size_t pos = 0;
    long result = 0;
    try {
        result = std::stol(v, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": expected an integer, got '" + value + "'");
    }
    if (pos != v.size()) {
        throw std::invalid_argument(name + ": expected an integer, got '" + value + "'");
    }
    return result;
}

float parseFloat(const std::string& name, const std::string& value) {
    std::string v = trim(value);
    size_t pos = 0;
    float result = 0.0f;
    try {
        result = std::stof(v, &pos);
    } catch (const std::exception&) {
        throw std::invalid_argument(name + ": expected a number, got '" + value + "'");
    }
    if (pos != v.size()) {
        throw std::invalid_argument(name + ": expected a number, got '" + value + "'");
    }
    return result;
}

bool parseBool(const std::string& name, const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "1" || v == "true" || v == "yes" || v == "on") return true;
    if (v == "0" || v == "false" || v == "no" || v == "off") return false;
    throw std::invalid_argument(name + ": expected true/false, got '" + value + "'");
}

CaptureBackend parseBackend(const std::string& name, const std::string& value) {
    std::string v = lower(trim(value));
    if (v == "auto") return CaptureBackend::Auto;
    if (v == "libcamera" || v == "picamera") return CaptureBackend::Libcamera;
    if (v == "opencv" || v == "v4l2") return CaptureBackend::OpenCv;
    if (v == "none") return CaptureBackend::None;
    throw std::invalid_argument(name + ": expected auto, libcamera, opencv or none, got '" + value + "'");
}

std::vector<std::string> parseList(const std::string& value) {
    std::vector<std::string> items;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        items.push_back(trim(item));
    }
    return items;
}

void requireRange(const std::string& name, long value, long min, long max) {
    if (value < min || value > max) {
        throw std::invalid_argument(name + " must be within [" + std::to_string(min) + ", " +
                                    std::to_string(max) + "], got " + std::to_string(value));
    }
}

template<typename T>
std::string join(const std::vector<T>& items) {
    std::ostringstream ss;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i) ss << ",";
        ss << items[i];
    }
    return ss.str();
}

} // namespace

const char* backendName(CaptureBackend backend) {
    switch (backend) {
        case CaptureBackend::Auto:      return "auto";
        case CaptureBackend::Libcamera: return "libcamera";
        case CaptureBackend::OpenCv:    return "opencv";
        case CaptureBackend::None:      return "none";
    }
    return "auto";
}

ServiceConfig ServiceConfig::fromEnvironment() {
    return fromLookup([](const std::string& name) -> std::optional<std::string> {
        const char* value = std::getenv(name.c_str());
        if (!value) return std::nullopt;
        return std::string(value);
    });
}

ServiceConfig ServiceConfig::fromLookup(const Lookup& lookup) {
    ServiceConfig c;

    auto intVar = [&](const char* name, int& target) {
        if (auto v = lookup(name)) {
            long parsed = parseLong(name, *v);
            requireRange(name, parsed, std::numeric_limits<int>::min(), std::numeric_limits<int>::max());
            target = static_cast<int>(parsed);
        }
    };
    auto sizeVar = [&](const char* name, size_t& target) {
        if (auto v = lookup(name)) {
            long parsed = parseLong(name, *v);
            if (parsed <= 0) throw std::invalid_argument(std::string(name) + " must be > 0");
            target = static_cast<size_t>(parsed);
        }
    };
    auto floatVar = [&](const char* name, float& target) {
        if (auto v = lookup(name)) target = parseFloat(name, *v);
    };
    auto boolVar = [&](const char* name, bool& target) {
        if (auto v = lookup(name)) target = parseBool(name, *v);
    };
    auto stringVar = [&](const char* name, std::string& target) {
        if (auto v = lookup(name)) target = trim(*v);
    };

    intVar("STREAM_PORT", c.stream.port);
    intVar("STREAM_WIDTH", c.stream.width);
    intVar("STREAM_HEIGHT", c.stream.height);
    intVar("STREAM_FPS", c.stream.fps);
    intVar("JPEG_QUALITY", c.stream.jpegQuality);

    if (auto v = lookup("CAPTURE_BACKEND")) c.capture.backend = parseBackend("CAPTURE_BACKEND", *v);
    intVar("CAMERA_INDEX", c.capture.deviceIndex);
    intVar("CAMERA_ROTATION", c.capture.rotation);
    boolVar("CAMERA_FLIP_H", c.capture.flipHorizontal);
    boolVar("CAMERA_FLIP_V", c.capture.flipVertical);

    sizeVar("RAW_WINDOW", c.stabilizer.rawWindow);
    sizeVar("PRED_WINDOW", c.stabilizer.predWindow);
    floatVar("LOW_CONFIDENCE", c.stabilizer.lowConfidence);
    floatVar("ACTIONABLE_CONFIDENCE", c.stabilizer.actionableConfidence);
    if (auto v = lookup("GESTURE_LABELS")) c.stabilizer.labels = parseList(*v);

    intVar("API_PORT", c.api.port);
    stringVar("MODEL_PATH", c.api.modelPath);

    stringVar("OSC_HOST", c.osc.host);
    stringVar("OSC_PORT", c.osc.port);

    if (auto v = lookup("LOG_LEVEL")) c.logLevel = Logger::parseLevel(trim(*v));

    c.validate();
    return c;
}

void ServiceConfig::validate() const {
    requireRange("STREAM_PORT", stream.port, 1, 65535);
    requireRange("API_PORT", api.port, 0, 65535);
    requireRange("STREAM_WIDTH", stream.width, 16, 7680);
    requireRange("STREAM_HEIGHT", stream.height, 16, 4320);
    requireRange("STREAM_FPS", stream.fps, 1, 240);
    requireRange("JPEG_QUALITY", stream.jpegQuality, 1, 100);
    requireRange("CAMERA_INDEX", capture.deviceIndex, 0, 63);

    if (capture.rotation % 90 != 0 || capture.rotation < 0 || capture.rotation > 270) {
        throw std::invalid_argument("CAMERA_ROTATION must be 0, 90, 180 or 270");
    }
    if (stabilizer.rawWindow == 0 || stabilizer.predWindow == 0) {
        throw std::invalid_argument("RAW_WINDOW and PRED_WINDOW must be > 0");
    }
    auto inUnitRange = [](float v) { return v >= 0.0f && v <= 1.0f; };
    if (!inUnitRange(stabilizer.lowConfidence) || !inUnitRange(stabilizer.actionableConfidence)) {
        throw std::invalid_argument("LOW_CONFIDENCE and ACTIONABLE_CONFIDENCE must be within [0,1]");
    }
    if (stabilizer.labels.empty()) {
        throw std::invalid_argument("GESTURE_LABELS must not be empty");
    }
}

void ServiceConfig::log() const {
    Logger::info("Configuration:");
    Logger::info("  Stream:     port=", stream.port, " ", stream.width, "x", stream.height,
                 " @ ", stream.fps, "fps, JPEG quality ", stream.jpegQuality);
    Logger::info("  Capture:    backend=", backendName(capture.backend), " device=", capture.deviceIndex,
                 " rotation=", capture.rotation, " flipH=", capture.flipHorizontal, " flipV=", capture.flipVertical);
    Logger::info("  Stabilizer: Kraw=", stabilizer.rawWindow, " Kpred=", stabilizer.predWindow,
                 " low=", stabilizer.lowConfidence, " actionable=", stabilizer.actionableConfidence);
    Logger::info("  Labels:     ", join(stabilizer.labels));
    Logger::info("  API:        port=", api.port, (api.port == 0 ? " (disabled)" : ""), " model=", api.modelPath);
    Logger::info("  OSC:        ", osc.host.empty() ? std::string("disabled") : osc.host + ":" + osc.port);
    Logger::info("  Log level:  ", Logger::levelName(logLevel));
}

} // namespace core
