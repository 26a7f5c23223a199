#include <gtest/gtest.h>

#include "core/CameraControl.hpp"

#include <stdexcept>

using core::CameraControl;
using core::Orientation;

TEST(CameraControlTest, StartsFromConfiguredOrientation) {
    Orientation initial;
    initial.rotation = 90;
    initial.flipHorizontal = false;
    CameraControl camera(initial);

    Orientation o = camera.orientation();
    EXPECT_EQ(o.rotation, 90);
    EXPECT_FALSE(o.flipHorizontal);
    EXPECT_FALSE(o.flipVertical);
    EXPECT_FALSE(camera.isConnected());
    EXPECT_TRUE(camera.captureEnabled());
}

TEST(CameraControlTest, RejectsInvalidInitialRotation) {
    Orientation initial;
    initial.rotation = 45;
    EXPECT_THROW(CameraControl camera(initial), std::invalid_argument);
}

TEST(CameraControlTest, PartialUpdateKeepsOtherFields) {
    CameraControl camera;
    Orientation o = camera.updateOrientation(std::nullopt, std::nullopt, true);
    EXPECT_EQ(o.rotation, 0);
    EXPECT_TRUE(o.flipHorizontal);
    EXPECT_TRUE(o.flipVertical);

    o = camera.updateOrientation(270, false, std::nullopt);
    EXPECT_EQ(o.rotation, 270);
    EXPECT_FALSE(o.flipHorizontal);
    EXPECT_TRUE(o.flipVertical);
}

TEST(CameraControlTest, InvalidRotationChangesNothing) {
    CameraControl camera;
    EXPECT_THROW(camera.updateOrientation(100, false, true), std::invalid_argument);

    Orientation o = camera.orientation();
    EXPECT_EQ(o.rotation, 0);
    EXPECT_TRUE(o.flipHorizontal);
    EXPECT_FALSE(o.flipVertical);
}

TEST(CameraControlTest, ConnectionState) {
    CameraControl camera;
    camera.setConnected(true, "libcamera");
    EXPECT_TRUE(camera.isConnected());
    EXPECT_EQ(camera.sourceName(), "libcamera");

    camera.setConnected(false);
    EXPECT_FALSE(camera.isConnected());
    EXPECT_EQ(camera.sourceName(), "");
}

TEST(CameraControlTest, ReconnectRequestIsTakenOnce) {
    CameraControl camera;
    EXPECT_FALSE(camera.takeReconnectRequest());

    EXPECT_TRUE(camera.requestReconnect());
    EXPECT_TRUE(camera.requestReconnect());
    EXPECT_TRUE(camera.takeReconnectRequest());
    EXPECT_FALSE(camera.takeReconnectRequest());
}

TEST(CameraControlTest, ReconnectRefusedWhenCaptureDisabled) {
    CameraControl camera(Orientation{}, false);
    EXPECT_FALSE(camera.captureEnabled());
    EXPECT_FALSE(camera.requestReconnect());
    EXPECT_FALSE(camera.takeReconnectRequest());
}
