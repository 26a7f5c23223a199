#pragma once

#include <atomic>
#include <mutex>
#include <optional>
#include <string>

namespace core {

struct Orientation {
    int rotation = 0;           // 0, 90, 180 or 270 degrees clockwise
    bool flipHorizontal = true;
    bool flipVertical = false;
};

/**
 * Camera settings that can change while the service runs.
 *
 * Written by the HTTP control routes, read by the capture thread once per
 * frame and by the capture owner in main(), which reopens the source when a
 * reconnect is pending.
 */
class CameraControl {
public:
    explicit CameraControl(Orientation initial = Orientation{}, bool captureEnabled = true);

    // Non-copyable
    CameraControl(const CameraControl&) = delete;
    CameraControl& operator=(const CameraControl&) = delete;

    [[nodiscard]] static bool isValidRotation(int rotation);

    [[nodiscard]] Orientation orientation() const;

    /**
     * Changes only the fields that are set and returns the result.
     * Throws std::invalid_argument for a rotation other than 0/90/180/270,
     * leaving every field untouched.
     */
    Orientation updateOrientation(std::optional<int> rotation,
                                  std::optional<bool> flipHorizontal,
                                  std::optional<bool> flipVertical);

    void setConnected(bool connected, const std::string& source = "");
    [[nodiscard]] bool isConnected() const { return connected_; }
    [[nodiscard]] std::string sourceName() const;

    // False with CAPTURE_BACKEND=none
    [[nodiscard]] bool captureEnabled() const { return captureEnabled_; }

    /**
     * Ask the capture owner to reopen the source.
     * @return false if capture is disabled
     */
    bool requestReconnect();

    /**
     * True once per requestReconnect().
     */
    bool takeReconnectRequest();

private:
    mutable std::mutex mutex_;
    Orientation orientation_;
    std::string source_;

    const bool captureEnabled_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> reconnectRequested_{false};
};

} // namespace core
