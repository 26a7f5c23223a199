#pragma once

#include "core/Types.hpp"
#include "inference/Classifier.hpp"
#include "math/SlidingWindow.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace core {

/**
 * GestureStabilizer: turns noisy classifier output into a stable gesture.
 *
 * Strategy A (sensor vectors, addSample() + predict()):
 *   raw window of Kraw vectors -> element-wise mean -> classify once
 *   -> Strategy B. Until the window is full predict() answers "buffering"
 *   without touching the classifier.
 *
 * Strategy B (observe(), also fed by Strategy A):
 *   confidence < lowConfidence -> rejected, "Unknown", vote window untouched.
 *   Otherwise the class id joins a window of Kpred and the mode of that
 *   window is the displayed gesture (ties: earliest first occurrence).
 *   predictedClass is the instantaneous class id only when confidence
 *   also clears actionableConfidence.
 *
 * Each window has its own mutex. The classifier runs with no lock held.
 */
class GestureStabilizer {
public:
    struct Config {
        size_t rawWindow = 20;              // Kraw
        size_t predWindow = 10;             // Kpred
        float lowConfidence = 0.40f;        // Admission gate
        float actionableConfidence = 0.65f; // Gate for side effects
        std::vector<std::string> labels;    // Class id -> label
    };

    using DecisionCallback = std::function<void(const StableDecision& decision)>;

    /**
     * @param classifier may be null, predict() then throws once the window is full
     * Throws std::invalid_argument for zero window sizes or thresholds outside [0,1].
     */
    GestureStabilizer(Config config, std::shared_ptr<const inference::Classifier> classifier);

    /**
     * Strategy A ingest: append one raw feature vector.
     */
    void addSample(FeatureVector sample);

    /**
     * Strategy A query. Throws inference::ClassifierError if the window holds
     * vectors of different sizes or the classifier fails.
     */
    StableDecision predict();

    /**
     * Strategy B on one per-frame classifier output.
     * Throws std::invalid_argument for a negative class id.
     */
    StableDecision observe(int classId, float confidence);
    StableDecision observe(const Observation& observation) {
        return observe(observation.classId, observation.confidence);
    }

    /**
     * Called after every non-buffering decision, outside the locks.
     * Set before the stabilizer is shared between threads.
     */
    void setDecisionCallback(DecisionCallback callback) { decisionCallback_ = std::move(callback); }

    void reset();

    [[nodiscard]] size_t rawCount() const;
    [[nodiscard]] std::vector<int> voteHistory() const;
    [[nodiscard]] const Config& config() const { return config_; }
    [[nodiscard]] std::string labelFor(int classId) const;
    [[nodiscard]] bool hasClassifier() const { return classifier_ != nullptr; }
    [[nodiscard]] std::string classifierName() const;

private:
    Config config_;
    std::shared_ptr<const inference::Classifier> classifier_;

    mutable std::mutex rawMutex_;
    math::SlidingWindow<FeatureVector> rawWindow_;

    mutable std::mutex voteMutex_;
    math::SlidingWindow<int> voteWindow_;

    DecisionCallback decisionCallback_;

    void emit(const StableDecision& decision) const;
};

} // namespace core
