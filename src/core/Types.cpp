#include "core/Types.hpp"

namespace core {

const char* statusName(DecisionStatus status) {
    switch (status) {
        case DecisionStatus::Buffering:     return "buffering";
        case DecisionStatus::LowConfidence: return "low_confidence";
        case DecisionStatus::Confident:     return "confident";
    }
    return "buffering";
}

FeatureVector SensorSample::toFeatures() const {
    FeatureVector features;
    features.reserve(SENSOR_FEATURES);
    for (size_t ch = 0; ch < SENSOR_CHANNELS; ++ch) {
        features.push_back(static_cast<double>(raw[ch]));
        features.push_back(volt[ch]);
    }
    return features;
}

} // namespace core
