#include "core/CaptureLoop.hpp"
#include "core/Logger.hpp"
#include <chrono>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

namespace core {

CaptureLoop::CaptureLoop(std::unique_ptr<CaptureSource> source,
                         std::shared_ptr<LatestFrameBuffer> buffer,
                         std::shared_ptr<const CameraControl> camera,
                         Settings settings)
    : source_(std::move(source)),
      buffer_(std::move(buffer)),
      camera_(std::move(camera)),
      settings_(settings) {
}

CaptureLoop::~CaptureLoop() {
    stop();
}

void CaptureLoop::start() {
    if (running_) return;
    hasError_ = false;
    running_ = true;
    thread_ = std::thread(&CaptureLoop::loop, this);
    Logger::info("CaptureLoop started (", source_->name(), ").");
}

void CaptureLoop::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
        Logger::info("CaptureLoop stopped.");
    }
}

void CaptureLoop::orient(cv::Mat& image, int rotation, bool flipHorizontal, bool flipVertical) {
    switch (rotation) {
        case 90:  cv::rotate(image, image, cv::ROTATE_90_CLOCKWISE); break;
        case 180: cv::rotate(image, image, cv::ROTATE_180); break;
        case 270: cv::rotate(image, image, cv::ROTATE_90_COUNTERCLOCKWISE); break;
        default: break;
    }

    if (flipHorizontal && flipVertical) {
        cv::flip(image, image, -1);
    } else if (flipHorizontal) {
        cv::flip(image, image, 1);
    } else if (flipVertical) {
        cv::flip(image, image, 0);
    }
}

bool CaptureLoop::encodeJpeg(const cv::Mat& image, int quality, std::vector<uint8_t>& out) {
    if (image.empty()) return false;

    std::vector<int> params = {cv::IMWRITE_JPEG_QUALITY, quality};
    try {
        return cv::imencode(".jpg", image, out, params);
    } catch (const cv::Exception& e) {
        Logger::error("CaptureLoop: JPEG encoding failed: ", e.what());
        return false;
    }
}

void CaptureLoop::loop() {
    cv::Mat image;
    int failures = 0;
    bool firstFrameLogged = false;

    while (running_) {
        try {
            std::vector<uint8_t> jpeg;
            if (source_->read(image)) {
                Orientation o = camera_->orientation();
                orient(image, o.rotation, o.flipHorizontal, o.flipVertical);
                if (encodeJpeg(image, settings_.jpegQuality, jpeg)) {
                    if (!firstFrameLogged) {
                        Logger::info("CaptureLoop: first frame ", image.cols, "x", image.rows,
                                     " (", jpeg.size(), " bytes JPEG)");
                        firstFrameLogged = true;
                    }
                    buffer_->publish(std::move(jpeg));
                    failures = 0;
                    continue;
                }
            }

            if (++failures >= settings_.failureLimit) {
                Logger::error("CaptureLoop: ", failures, " consecutive capture failures (camera lost?)");
                running_ = false;
                hasError_ = true;
                break;
            }
            Logger::debug("CaptureLoop: capture failed, retrying");
            std::this_thread::sleep_for(settings_.retryDelay);
        } catch (const std::exception& e) {
            // cv::Exception included
            Logger::error("CaptureLoop Critical Error: ", e.what());
            running_ = false;
            hasError_ = true;
        }
    }
}

} // namespace core
