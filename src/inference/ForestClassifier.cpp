#include "inference/ForestClassifier.hpp"
#include "core/Logger.hpp"

#include <algorithm>

namespace inference {

ForestClassifier::ForestClassifier() = default;

ForestClassifier::~ForestClassifier() = default;

bool ForestClassifier::init(const Config& config) {
    config_ = config;

    cv::Ptr<cv::ml::RTrees> forest;
    try {
        forest = cv::ml::RTrees::load(config.modelPath);
    } catch (const cv::Exception& e) {
        core::Logger::error("ForestClassifier: Failed to load ", config.modelPath, ": ", e.what());
        return false;
    }

    return init(forest, config.modelPath);
}

bool ForestClassifier::init(cv::Ptr<cv::ml::RTrees> forest, const std::string& label) {
    if (!forest || forest->empty() || !forest->isTrained() || !forest->isClassifier()) {
        core::Logger::error("ForestClassifier: ", label, " is not a trained RTrees classifier");
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    forest_ = forest;
    featureCount_ = forest_->getVarCount();
    config_.modelPath = label;
    initialized_ = true;

    core::Logger::info("ForestClassifier initialized");
    core::Logger::info("  Model: ", label);
    core::Logger::info("  Features: ", featureCount_, "  Trees: ", forest_->getRoots().size());
    return true;
}

Classification ForestClassifier::classify(const std::vector<double>& features) const {
    if (!initialized_) {
        throw ClassifierError("ForestClassifier not initialized");
    }
    if (static_cast<int>(features.size()) != featureCount_) {
        throw ClassifierError("Expected " + std::to_string(featureCount_) +
                              " features, got " + std::to_string(features.size()));
    }

    cv::Mat sample(1, featureCount_, CV_32F);
    for (int i = 0; i < featureCount_; ++i) {
        sample.at<float>(0, i) = static_cast<float>(features[i]);
    }

    cv::Mat votes;
    try {
        std::lock_guard<std::mutex> lock(mutex_);
        forest_->getVotes(sample, votes, 0);
    } catch (const cv::Exception& e) {
        throw ClassifierError(std::string("RTrees vote failed: ") + e.what());
    }

    // Row 0: class labels, row 1: vote counts for our single sample
    if (votes.rows < 2 || votes.cols < 1) {
        throw ClassifierError("RTrees returned no votes");
    }
    votes.convertTo(votes, CV_32S);

    int total = 0;
    int bestCol = 0;
    int maxLabel = 0;
    for (int c = 0; c < votes.cols; ++c) {
        int v = votes.at<int>(1, c);
        total += v;
        if (v > votes.at<int>(1, bestCol)) bestCol = c;
        maxLabel = std::max(maxLabel, votes.at<int>(0, c));
    }
    if (total <= 0) {
        throw ClassifierError("RTrees returned zero votes");
    }

    Classification result;
    result.probabilities.assign(static_cast<size_t>(maxLabel) + 1, 0.0f);
    for (int c = 0; c < votes.cols; ++c) {
        int label = votes.at<int>(0, c);
        if (label >= 0) {
            result.probabilities[label] = static_cast<float>(votes.at<int>(1, c)) / static_cast<float>(total);
        }
    }
    result.classId = votes.at<int>(0, bestCol);
    result.confidence = static_cast<float>(votes.at<int>(1, bestCol)) / static_cast<float>(total);
    return result;
}

std::string ForestClassifier::name() const {
    return "RTrees (" + config_.modelPath + ")";
}

} // namespace inference
