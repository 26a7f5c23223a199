#include "core/CaptureSource.hpp"
#include "core/Logger.hpp"

#include <sstream>
#include <stdexcept>

namespace core {

// ═══════════════════════════════════════════════════════════
// OpenCV (V4L2)
// ═══════════════════════════════════════════════════════════

OpenCvCaptureSource::OpenCvCaptureSource(Settings settings) : settings_(settings) {
}

OpenCvCaptureSource::~OpenCvCaptureSource() {
    close();
}

bool OpenCvCaptureSource::open() {
    if (!capture_.open(settings_.deviceIndex, cv::CAP_V4L2) && !capture_.open(settings_.deviceIndex)) {
        Logger::warn("OpenCvCaptureSource: Cannot open camera ", settings_.deviceIndex);
        return false;
    }

    capture_.set(cv::CAP_PROP_FOURCC, cv::VideoWriter::fourcc('M', 'J', 'P', 'G'));
    capture_.set(cv::CAP_PROP_FRAME_WIDTH, settings_.width);
    capture_.set(cv::CAP_PROP_FRAME_HEIGHT, settings_.height);
    capture_.set(cv::CAP_PROP_FPS, settings_.fps);
    capture_.set(cv::CAP_PROP_BUFFERSIZE, 1); // Minimal driver-side queue

    Logger::info("OpenCvCaptureSource: camera ", settings_.deviceIndex, " opened at ",
                 capture_.get(cv::CAP_PROP_FRAME_WIDTH), "x", capture_.get(cv::CAP_PROP_FRAME_HEIGHT),
                 " @ ", capture_.get(cv::CAP_PROP_FPS), "fps");
    return true;
}

bool OpenCvCaptureSource::read(cv::Mat& frame) {
    return capture_.read(frame) && !frame.empty();
}

void OpenCvCaptureSource::close() {
    if (capture_.isOpened()) {
        capture_.release();
    }
}

std::string OpenCvCaptureSource::name() const {
    return "opencv:" + std::to_string(settings_.deviceIndex);
}

// ═══════════════════════════════════════════════════════════
// libcamera (GStreamer)
// ═══════════════════════════════════════════════════════════

LibcameraCaptureSource::LibcameraCaptureSource(Settings settings) : settings_(settings) {
}

LibcameraCaptureSource::~LibcameraCaptureSource() {
    close();
}

std::string LibcameraCaptureSource::pipeline(const Settings& settings) {
    std::ostringstream ss;
    ss << "libcamerasrc ! video/x-raw,width=" << settings.width
       << ",height=" << settings.height
       << ",framerate=" << settings.fps << "/1"
       << " ! videoconvert ! video/x-raw,format=BGR"
       << " ! appsink drop=true max-buffers=1 sync=false";
    return ss.str();
}

bool LibcameraCaptureSource::open() {
    const std::string desc = pipeline(settings_);
    if (!capture_.open(desc, cv::CAP_GSTREAMER)) {
        Logger::warn("LibcameraCaptureSource: Cannot open pipeline: ", desc);
        return false;
    }
    Logger::info("LibcameraCaptureSource: started ", settings_.width, "x", settings_.height,
                 " @ ", settings_.fps, "fps");
    return true;
}

bool LibcameraCaptureSource::read(cv::Mat& frame) {
    return capture_.read(frame) && !frame.empty();
}

void LibcameraCaptureSource::close() {
    if (capture_.isOpened()) {
        capture_.release();
    }
}

// ═══════════════════════════════════════════════════════════
// Factory
// ═══════════════════════════════════════════════════════════

std::unique_ptr<CaptureSource> createCaptureSource(const ServiceConfig& config) {
    CaptureSource::Settings settings;
    settings.deviceIndex = config.capture.deviceIndex;
    settings.width = config.stream.width;
    settings.height = config.stream.height;
    settings.fps = config.stream.fps;

    const CaptureBackend backend = config.capture.backend;

    if (backend == CaptureBackend::None) {
        throw std::runtime_error("Capture backend 'none' has no camera");
    }

    if (backend == CaptureBackend::Libcamera || backend == CaptureBackend::Auto) {
        auto source = std::make_unique<LibcameraCaptureSource>(settings);
        if (source->open()) {
            return source;
        }
        if (backend == CaptureBackend::Libcamera) {
            throw std::runtime_error("libcamera capture unavailable");
        }
        Logger::info("libcamera unavailable, falling back to OpenCV device ", settings.deviceIndex);
    }

    auto source = std::make_unique<OpenCvCaptureSource>(settings);
    if (!source->open()) {
        throw std::runtime_error("Cannot open camera " + std::to_string(settings.deviceIndex));
    }
    return source;
}

} // namespace core
