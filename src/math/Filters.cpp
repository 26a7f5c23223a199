#include "math/Filters.hpp"
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace math {

std::vector<double> MovingAverage::mean(const std::vector<std::vector<double>>& samples) {
    if (samples.empty()) {
        throw std::invalid_argument("MovingAverage: empty window");
    }

    const size_t dim = samples.front().size();
    std::vector<double> sum(dim, 0.0);

    for (const auto& sample : samples) {
        if (sample.size() != dim) {
            throw std::invalid_argument("MovingAverage: dimension mismatch (" +
                                        std::to_string(sample.size()) + " != " + std::to_string(dim) + ")");
        }
        for (size_t i = 0; i < dim; ++i) {
            sum[i] += sample[i];
        }
    }

    const double n = static_cast<double>(samples.size());
    for (auto& v : sum) {
        v /= n;
    }
    return sum;
}

std::optional<MajorityVote::Result> MajorityVote::mode(const std::deque<int>& values) {
    if (values.empty()) return std::nullopt;

    std::unordered_map<int, size_t> counts;
    for (int v : values) {
        counts[v]++;
    }

    // Scan in insertion order, strict '>' keeps the earliest first occurrence on ties
    Result best;
    for (int v : values) {
        size_t c = counts[v];
        if (c > best.count) {
            best.value = v;
            best.count = c;
        }
    }
    return best;
}

} // namespace math
