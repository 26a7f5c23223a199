#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <vector>

namespace math {

/**
 * Low-pass filter over a window of feature vectors: the element-wise mean.
 * Suppresses single-sample sensor noise before classification.
 */
class MovingAverage {
public:
    /**
     * @param samples window contents, all of the same dimension
     * @return mean vector
     * Throws std::invalid_argument if samples is empty or dimensions differ.
     */
    [[nodiscard]] static std::vector<double> mean(const std::vector<std::vector<double>>& samples);
};

/**
 * Mode of a window of class ids.
 *
 * Tie-break: among classes sharing the highest count, the one whose first
 * occurrence is earliest (oldest to newest) wins. [0,0,1,1] -> 0, [1,0,0,1] -> 1.
 */
class MajorityVote {
public:
    struct Result {
        int value = -1;
        size_t count = 0;
    };

    /**
     * @return mode and its count, std::nullopt for an empty window
     */
    [[nodiscard]] static std::optional<Result> mode(const std::deque<int>& values);
};

} // namespace math
