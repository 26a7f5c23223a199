#include "core/GestureStabilizer.hpp"
#include "core/Logger.hpp"
#include "math/Filters.hpp"

#include <stdexcept>

namespace core {

namespace {

GestureStabilizer::Config validated(GestureStabilizer::Config config) {
    if (config.rawWindow == 0 || config.predWindow == 0) {
        throw std::invalid_argument("GestureStabilizer: window sizes must be > 0");
    }
    auto inUnitRange = [](float v) { return v >= 0.0f && v <= 1.0f; };
    if (!inUnitRange(config.lowConfidence) || !inUnitRange(config.actionableConfidence)) {
        throw std::invalid_argument("GestureStabilizer: thresholds must be within [0,1]");
    }
    return config;
}

} // namespace

GestureStabilizer::GestureStabilizer(Config config, std::shared_ptr<const inference::Classifier> classifier)
    : config_(validated(std::move(config))),
      classifier_(std::move(classifier)),
      rawWindow_(config_.rawWindow),
      voteWindow_(config_.predWindow) {
}

void GestureStabilizer::addSample(FeatureVector sample) {
    std::lock_guard<std::mutex> lock(rawMutex_);
    rawWindow_.push(std::move(sample));
}

StableDecision GestureStabilizer::predict() {
    std::vector<FeatureVector> samples;
    {
        std::lock_guard<std::mutex> lock(rawMutex_);
        if (!rawWindow_.full()) {
            StableDecision buffering;
            buffering.label = LABEL_INITIALIZING;
            buffering.status = DecisionStatus::Buffering;
            return buffering;
        }
        samples = rawWindow_.snapshot();
    }

    if (!classifier_) {
        throw inference::ClassifierError("No classifier loaded");
    }

    FeatureVector mean;
    try {
        mean = math::MovingAverage::mean(samples);
    } catch (const std::invalid_argument& e) {
        throw inference::ClassifierError(std::string("Malformed feature window: ") + e.what());
    }

    inference::Classification result = classifier_->classify(mean);
    if (result.classId < 0) {
        throw inference::ClassifierError("Classifier returned invalid class id " + std::to_string(result.classId));
    }
    return observe(result.classId, result.confidence);
}

StableDecision GestureStabilizer::observe(int classId, float confidence) {
    if (classId < 0) {
        throw std::invalid_argument("GestureStabilizer: class id must be >= 0, got " + std::to_string(classId));
    }

    StableDecision decision;
    decision.confidence = confidence;

    if (confidence < config_.lowConfidence) {
        decision.label = LABEL_UNKNOWN;
        decision.status = DecisionStatus::LowConfidence;
        emit(decision);
        return decision;
    }

    {
        std::lock_guard<std::mutex> lock(voteMutex_);
        voteWindow_.push(classId);
        auto vote = math::MajorityVote::mode(voteWindow_.items());
        decision.classId = vote ? vote->value : NO_CLASS;
    }

    decision.label = labelFor(decision.classId);
    decision.status = DecisionStatus::Confident;
    decision.predictedClass = confidence >= config_.actionableConfidence ? classId : NO_CLASS;

    emit(decision);
    return decision;
}

void GestureStabilizer::emit(const StableDecision& decision) const {
    if (decisionCallback_) {
        decisionCallback_(decision);
    }
}

void GestureStabilizer::reset() {
    {
        std::lock_guard<std::mutex> lock(rawMutex_);
        rawWindow_.clear();
    }
    {
        std::lock_guard<std::mutex> lock(voteMutex_);
        voteWindow_.clear();
    }
    Logger::debug("GestureStabilizer: windows cleared");
}

size_t GestureStabilizer::rawCount() const {
    std::lock_guard<std::mutex> lock(rawMutex_);
    return rawWindow_.size();
}

std::vector<int> GestureStabilizer::voteHistory() const {
    std::lock_guard<std::mutex> lock(voteMutex_);
    return voteWindow_.snapshot();
}

std::string GestureStabilizer::labelFor(int classId) const {
    if (classId < 0 || static_cast<size_t>(classId) >= config_.labels.size()) {
        return LABEL_UNKNOWN;
    }
    return config_.labels[static_cast<size_t>(classId)];
}

std::string GestureStabilizer::classifierName() const {
    return classifier_ ? classifier_->name() : "none";
}

} // namespace core
