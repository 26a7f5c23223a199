#include "core/ServiceContext.hpp"
#include "core/Logger.hpp"
#include "inference/ForestClassifier.hpp"

namespace core {

ServiceContext ServiceContext::create(const ServiceConfig& config) {
    std::shared_ptr<const inference::Classifier> classifier;

    auto forest = std::make_shared<inference::ForestClassifier>();
    inference::ForestClassifier::Config forestConfig;
    forestConfig.modelPath = config.api.modelPath;
    if (forest->init(forestConfig)) {
        classifier = forest;
    } else {
        Logger::warn("No gesture model loaded, /predict will fail until one is provided.");
    }

    return create(config, std::move(classifier));
}

ServiceContext ServiceContext::create(const ServiceConfig& config,
                                      std::shared_ptr<const inference::Classifier> classifier) {
    ServiceContext context;
    context.config = config;
    context.frameBuffer = std::make_shared<LatestFrameBuffer>();

    Orientation orientation;
    orientation.rotation = config.capture.rotation;
    orientation.flipHorizontal = config.capture.flipHorizontal;
    orientation.flipVertical = config.capture.flipVertical;
    context.camera = std::make_shared<CameraControl>(orientation, config.capture.backend != CaptureBackend::None);
    context.classifier = std::move(classifier);

    GestureStabilizer::Config stabilizerConfig;
    stabilizerConfig.rawWindow = config.stabilizer.rawWindow;
    stabilizerConfig.predWindow = config.stabilizer.predWindow;
    stabilizerConfig.lowConfidence = config.stabilizer.lowConfidence;
    stabilizerConfig.actionableConfidence = config.stabilizer.actionableConfidence;
    stabilizerConfig.labels = config.stabilizer.labels;

    context.stabilizer = std::make_shared<GestureStabilizer>(stabilizerConfig, context.classifier);
    return context;
}

} // namespace core
