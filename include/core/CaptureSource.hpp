#pragma once

#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/videoio.hpp>

#include "core/Config.hpp"

namespace core {

/**
 * A camera that hands out BGR frames.
 * Chosen once at startup, see createCaptureSource().
 */
class CaptureSource {
public:
    struct Settings {
        int deviceIndex = 0;
        int width = 640;
        int height = 480;
        int fps = 30;
    };

    virtual ~CaptureSource() = default;

    /**
     * Returns false if the camera cannot be opened.
     */
    virtual bool open() = 0;

    /**
     * Grab the next frame. Returns false on a failed read.
     */
    virtual bool read(cv::Mat& frame) = 0;

    virtual void close() = 0;

    [[nodiscard]] virtual bool isOpen() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
};

/**
 * USB / V4L2 camera through cv::VideoCapture.
 */
class OpenCvCaptureSource : public CaptureSource {
public:
    explicit OpenCvCaptureSource(Settings settings);
    ~OpenCvCaptureSource() override;

    bool open() override;
    bool read(cv::Mat& frame) override;
    void close() override;

    [[nodiscard]] bool isOpen() const override { return capture_.isOpened(); }
    [[nodiscard]] std::string name() const override;

private:
    Settings settings_;
    cv::VideoCapture capture_;
};

/**
 * Raspberry Pi camera through libcamerasrc and a GStreamer appsink.
 * The appsink drops stale buffers so read() always returns the newest frame.
 */
class LibcameraCaptureSource : public CaptureSource {
public:
    explicit LibcameraCaptureSource(Settings settings);
    ~LibcameraCaptureSource() override;

    bool open() override;
    bool read(cv::Mat& frame) override;
    void close() override;

    [[nodiscard]] bool isOpen() const override { return capture_.isOpened(); }
    [[nodiscard]] std::string name() const override { return "libcamera"; }

    [[nodiscard]] static std::string pipeline(const Settings& settings);

private:
    Settings settings_;
    cv::VideoCapture capture_;
};

/**
 * Build and open the configured backend.
 * Auto tries libcamera first and falls back to the OpenCV device.
 * Throws std::runtime_error if no camera opens or the backend is None.
 */
std::unique_ptr<CaptureSource> createCaptureSource(const ServiceConfig& config);

} // namespace core
