#pragma once

#include <stdexcept>
#include <string>
#include <vector>

namespace inference {

/**
 * Raised when a feature vector cannot be classified
 * (wrong dimension, model not loaded, backend failure).
 */
class ClassifierError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Classification {
    int classId = -1;
    float confidence = 0.0f;          // Probability of classId
    std::vector<float> probabilities; // Indexed by class id
};

/**
 * Gesture classifier boundary: features in, arg-max class and its probability out.
 * Implementations must be safe to call from several threads.
 */
class Classifier {
public:
    virtual ~Classifier() = default;

    /**
     * Throws ClassifierError on failure.
     */
    virtual Classification classify(const std::vector<double>& features) const = 0;

    [[nodiscard]] virtual std::string name() const = 0;
};

} // namespace inference
