#pragma once

#include <memory>

#include "core/CameraControl.hpp"
#include "core/Config.hpp"
#include "core/GestureStabilizer.hpp"
#include "core/LatestFrameBuffer.hpp"
#include "inference/Classifier.hpp"

namespace core {

/**
 * Shared state of one service run, created once in main() and handed to
 * every module that needs it. No globals.
 */
struct ServiceContext {
    ServiceConfig config;
    std::shared_ptr<LatestFrameBuffer> frameBuffer;
    std::shared_ptr<CameraControl> camera;        // Runtime orientation, reconnect requests
    std::shared_ptr<const inference::Classifier> classifier; // Null if the model did not load
    std::shared_ptr<GestureStabilizer> stabilizer;

    /**
     * Build the buffer, load the model and wire up the stabilizer.
     * A missing model is logged, not fatal: /predict reports it per request.
     */
    static ServiceContext create(const ServiceConfig& config);

    /**
     * Same as create() but with a caller-supplied classifier (may be null).
     */
    static ServiceContext create(const ServiceConfig& config,
                                 std::shared_ptr<const inference::Classifier> classifier);
};

} // namespace core
