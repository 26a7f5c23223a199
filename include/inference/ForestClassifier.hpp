#pragma once

#include "inference/Classifier.hpp"
#include <mutex>
#include <string>
#include <opencv2/core.hpp>
#include <opencv2/ml.hpp>

namespace inference {

/**
 * Random forest gesture classifier backed by cv::ml::RTrees.
 *
 * Model: a trained RTrees saved with cv::ml::StatModel::save() (YAML/XML).
 * Class probabilities are the fraction of trees voting for each class.
 */
class ForestClassifier : public Classifier {
public:
    struct Config {
        std::string modelPath = "model/gesture_forest.yml";
    };

    ForestClassifier();
    ~ForestClassifier() override;

    /**
     * Load the model. Returns false (and logs) if the file is missing or untrained.
     */
    bool init(const Config& config);

    /**
     * Wrap an already trained model.
     */
    bool init(cv::Ptr<cv::ml::RTrees> forest, const std::string& label = "in-memory");

    Classification classify(const std::vector<double>& features) const override;

    [[nodiscard]] std::string name() const override;

    [[nodiscard]] bool isInitialized() const { return initialized_; }
    [[nodiscard]] int featureCount() const { return featureCount_; }

private:
    Config config_;
    bool initialized_ = false;
    int featureCount_ = 0;

    cv::Ptr<cv::ml::RTrees> forest_;
    mutable std::mutex mutex_; // RTrees prediction is not documented as thread-safe
};

} // namespace inference
