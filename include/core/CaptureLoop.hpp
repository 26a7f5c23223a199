#pragma once

#include <thread>
#include <atomic>
#include <memory>
#include <vector>
#include <opencv2/core.hpp>

#include "core/CameraControl.hpp"
#include "core/CaptureSource.hpp"
#include "core/LatestFrameBuffer.hpp"
#include "core/Types.hpp"

namespace core {

/**
 * Dedicated producer thread.
 * Reads frames from the CaptureSource, orients and JPEG-encodes them, and
 * publishes into the LatestFrameBuffer. Never waits on stream clients.
 * Orientation is read from the CameraControl on every frame, so changes
 * made over HTTP apply without a restart.
 */
class CaptureLoop {
public:
    struct Settings {
        int jpegQuality = 70;
        int failureLimit = CAPTURE_FAILURE_LIMIT;
        std::chrono::milliseconds retryDelay = CAPTURE_RETRY_DELAY;
    };

    CaptureLoop(std::unique_ptr<CaptureSource> source,
                std::shared_ptr<LatestFrameBuffer> buffer,
                std::shared_ptr<const CameraControl> camera,
                Settings settings);

    ~CaptureLoop();

    void start();
    void stop();

    /**
     * True once the camera failed failureLimit times in a row or threw.
     * The loop has stopped by then, the owner decides whether to restart.
     */
    [[nodiscard]] bool hasError() const { return hasError_; }
    [[nodiscard]] bool isRunning() const { return running_; }

    /**
     * Rotate (clockwise) then mirror in place.
     */
    static void orient(cv::Mat& image, int rotation, bool flipHorizontal, bool flipVertical);

    /**
     * Returns false if the encoder rejects the image.
     */
    static bool encodeJpeg(const cv::Mat& image, int quality, std::vector<uint8_t>& out);

private:
    void loop();

    std::unique_ptr<CaptureSource> source_;
    std::shared_ptr<LatestFrameBuffer> buffer_;
    std::shared_ptr<const CameraControl> camera_;
    Settings settings_;

    std::thread thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> hasError_{false};
};

} // namespace core
