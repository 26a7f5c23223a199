#include <gtest/gtest.h>

#include "core/Config.hpp"

#include <map>

using core::CaptureBackend;
using core::ServiceConfig;

namespace {

ServiceConfig load(const std::map<std::string, std::string>& env) {
    return ServiceConfig::fromLookup([&env](const std::string& name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end()) return std::nullopt;
        return it->second;
    });
}

} // namespace

TEST(ConfigTest, Defaults) {
    ServiceConfig config = load({});
    EXPECT_EQ(config.stream.port, 8080);
    EXPECT_EQ(config.stream.width, 640);
    EXPECT_EQ(config.stream.height, 480);
    EXPECT_EQ(config.stream.jpegQuality, 70);
    EXPECT_EQ(config.capture.backend, CaptureBackend::Auto);
    EXPECT_TRUE(config.capture.flipHorizontal);
    EXPECT_FALSE(config.capture.flipVertical);
    EXPECT_EQ(config.stabilizer.rawWindow, 20u);
    EXPECT_EQ(config.stabilizer.predWindow, 10u);
    EXPECT_FLOAT_EQ(config.stabilizer.lowConfidence, 0.40f);
    EXPECT_FLOAT_EQ(config.stabilizer.actionableConfidence, 0.65f);
    ASSERT_EQ(config.stabilizer.labels.size(), 10u);
    EXPECT_EQ(config.stabilizer.labels.front(), "Call");
    EXPECT_EQ(config.stabilizer.labels.back(), "Yes");
    EXPECT_EQ(config.api.port, 8000);
    EXPECT_TRUE(config.osc.host.empty());
    EXPECT_EQ(config.logLevel, core::LogLevel::INFO);
}

TEST(ConfigTest, Overrides) {
    ServiceConfig config = load({
        {"STREAM_PORT", "9090"},
        {"JPEG_QUALITY", " 85 "},
        {"CAPTURE_BACKEND", "OpenCV"},
        {"CAMERA_ROTATION", "180"},
        {"CAMERA_FLIP_H", "false"},
        {"CAMERA_FLIP_V", "yes"},
        {"RAW_WINDOW", "5"},
        {"LOW_CONFIDENCE", "0.5"},
        {"GESTURE_LABELS", "Open, Fist ,Point"},
        {"API_PORT", "0"},
        {"OSC_HOST", "192.168.1.20"},
        {"LOG_LEVEL", "debug"},
    });
    EXPECT_EQ(config.stream.port, 9090);
    EXPECT_EQ(config.stream.jpegQuality, 85);
    EXPECT_EQ(config.capture.backend, CaptureBackend::OpenCv);
    EXPECT_EQ(config.capture.rotation, 180);
    EXPECT_FALSE(config.capture.flipHorizontal);
    EXPECT_TRUE(config.capture.flipVertical);
    EXPECT_EQ(config.stabilizer.rawWindow, 5u);
    EXPECT_FLOAT_EQ(config.stabilizer.lowConfidence, 0.5f);
    EXPECT_EQ(config.stabilizer.labels, (std::vector<std::string>{"Open", "Fist", "Point"}));
    EXPECT_EQ(config.api.port, 0);
    EXPECT_EQ(config.osc.host, "192.168.1.20");
    EXPECT_EQ(config.logLevel, core::LogLevel::DEBUG);
}

TEST(ConfigTest, BackendAliases) {
    EXPECT_EQ(load({{"CAPTURE_BACKEND", "picamera"}}).capture.backend, CaptureBackend::Libcamera);
    EXPECT_EQ(load({{"CAPTURE_BACKEND", "v4l2"}}).capture.backend, CaptureBackend::OpenCv);
    EXPECT_EQ(load({{"CAPTURE_BACKEND", "none"}}).capture.backend, CaptureBackend::None);
    EXPECT_STREQ(core::backendName(CaptureBackend::Libcamera), "libcamera");
}

TEST(ConfigTest, RejectsInvalidValues) {
    EXPECT_THROW(load({{"STREAM_PORT", "http"}}), std::invalid_argument);
    EXPECT_THROW(load({{"STREAM_PORT", "80x"}}), std::invalid_argument);
    EXPECT_THROW(load({{"STREAM_PORT", "70000"}}), std::invalid_argument);
    EXPECT_THROW(load({{"JPEG_QUALITY", "0"}}), std::invalid_argument);
    EXPECT_THROW(load({{"CAMERA_ROTATION", "45"}}), std::invalid_argument);
    EXPECT_THROW(load({{"CAMERA_FLIP_H", "maybe"}}), std::invalid_argument);
    EXPECT_THROW(load({{"CAPTURE_BACKEND", "webcam"}}), std::invalid_argument);
    EXPECT_THROW(load({{"RAW_WINDOW", "0"}}), std::invalid_argument);
    EXPECT_THROW(load({{"PRED_WINDOW", "-3"}}), std::invalid_argument);
    EXPECT_THROW(load({{"LOW_CONFIDENCE", "1.5"}}), std::invalid_argument);
    EXPECT_THROW(load({{"ACTIONABLE_CONFIDENCE", "-0.1"}}), std::invalid_argument);
    EXPECT_THROW(load({{"GESTURE_LABELS", ""}}), std::invalid_argument);
    EXPECT_THROW(load({{"LOG_LEVEL", "verbose"}}), std::invalid_argument);
}

TEST(ConfigTest, RejectsIntegersThatOverflowInt) {
    // 4294975488 would wrap to 8192 if narrowed
    EXPECT_THROW(load({{"STREAM_PORT", "4294975488"}}), std::invalid_argument);
    EXPECT_THROW(load({{"CAMERA_INDEX", "-4294967296"}}), std::invalid_argument);
}
