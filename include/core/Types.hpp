#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

namespace core {

// ============================================================
// Constants
// ============================================================

// Streaming
constexpr std::chrono::milliseconds STREAM_WAIT_TIMEOUT{2000}; // waitNext() bound per loop
constexpr const char* MJPEG_BOUNDARY = "frame";

// Capture
constexpr std::chrono::milliseconds CAPTURE_RETRY_DELAY{100};
constexpr int CAPTURE_FAILURE_LIMIT = 50;   // consecutive failures before the loop gives up

// Sensor ingest: 5 channels, each a raw ADC count and a voltage
constexpr size_t SENSOR_CHANNELS = 5;
constexpr size_t SENSOR_FEATURES = SENSOR_CHANNELS * 2;

// Decision labels
constexpr int NO_CLASS = -1;
constexpr const char* LABEL_INITIALIZING = "Initializing...";
constexpr const char* LABEL_UNKNOWN = "Unknown";

// ============================================================
// Data Structures
// ============================================================

using FeatureVector = std::vector<double>;

enum class DecisionStatus {
    Buffering,      // Raw window not yet full, classifier not invoked
    LowConfidence,  // Observation rejected by the admission gate
    Confident       // Majority vote over admitted observations
};

[[nodiscard]] const char* statusName(DecisionStatus status);

/**
 * One per-frame (or per-query) classifier output.
 */
struct Observation {
    int classId = NO_CLASS;
    float confidence = 0.0f;
};

/**
 * Output of the stabilization pipeline. Built fresh on every query.
 */
struct StableDecision {
    std::string label = LABEL_UNKNOWN;
    int classId = NO_CLASS;           // Voted class, NO_CLASS when nothing was admitted
    int predictedClass = NO_CLASS;    // Instantaneous class, only when above the actionable threshold
    float confidence = 0.0f;          // Instantaneous confidence in [0,1]
    DecisionStatus status = DecisionStatus::Buffering;
};

/**
 * One reading from the glove/sensor board as posted to /ingest.
 */
struct SensorSample {
    std::string timestamp;
    std::array<int, SENSOR_CHANNELS> raw{};
    std::array<double, SENSOR_CHANNELS> volt{};
    int target = 0; // Training label sent by the board, ignored here

    /**
     * Feature order used by the model: [raw0, volt0, raw1, volt1, ... raw4, volt4]
     */
    [[nodiscard]] FeatureVector toFeatures() const;
};

} // namespace core
