#include "core/CameraControl.hpp"
#include "core/Logger.hpp"

#include <stdexcept>

namespace core {

CameraControl::CameraControl(Orientation initial, bool captureEnabled)
    : orientation_(initial), captureEnabled_(captureEnabled) {
    if (!isValidRotation(initial.rotation)) {
        throw std::invalid_argument("rotation must be 0, 90, 180 or 270");
    }
}

bool CameraControl::isValidRotation(int rotation) {
    return rotation == 0 || rotation == 90 || rotation == 180 || rotation == 270;
}

Orientation CameraControl::orientation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return orientation_;
}

Orientation CameraControl::updateOrientation(std::optional<int> rotation,
                                             std::optional<bool> flipHorizontal,
                                             std::optional<bool> flipVertical) {
    if (rotation && !isValidRotation(*rotation)) {
        throw std::invalid_argument("rotation must be 0, 90, 180 or 270, got " + std::to_string(*rotation));
    }

    Orientation result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (rotation) orientation_.rotation = *rotation;
        if (flipHorizontal) orientation_.flipHorizontal = *flipHorizontal;
        if (flipVertical) orientation_.flipVertical = *flipVertical;
        result = orientation_;
    }
    Logger::info("CameraControl: rotation=", result.rotation, " flipH=", result.flipHorizontal,
                 " flipV=", result.flipVertical);
    return result;
}

void CameraControl::setConnected(bool connected, const std::string& source) {
    std::lock_guard<std::mutex> lock(mutex_);
    connected_ = connected;
    source_ = source;
}

std::string CameraControl::sourceName() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return source_;
}

bool CameraControl::requestReconnect() {
    if (!captureEnabled_) return false;
    reconnectRequested_ = true;
    Logger::info("CameraControl: reconnect requested");
    return true;
}

bool CameraControl::takeReconnectRequest() {
    return reconnectRequested_.exchange(false);
}

} // namespace core
