#pragma once

#include <cstddef>
#include <deque>
#include <stdexcept>
#include <vector>

namespace math {

/**
 * Fixed-capacity history of the most recent samples.
 * Pushing past capacity evicts the oldest entry (FIFO).
 *
 * Thread-safety: none, callers hold their own lock.
 */
template<typename T>
class SlidingWindow {
public:
    explicit SlidingWindow(size_t capacity) : capacity_(capacity) {
        if (capacity_ == 0) {
            throw std::invalid_argument("SlidingWindow capacity must be > 0");
        }
    }

    void push(T value) {
        items_.push_back(std::move(value));
        if (items_.size() > capacity_) {
            items_.pop_front();
        }
    }

    void clear() { items_.clear(); }

    [[nodiscard]] size_t size() const { return items_.size(); }
    [[nodiscard]] size_t capacity() const { return capacity_; }
    [[nodiscard]] bool empty() const { return items_.empty(); }
    [[nodiscard]] bool full() const { return items_.size() == capacity_; }

    /**
     * Oldest first.
     */
    [[nodiscard]] const std::deque<T>& items() const { return items_; }

    [[nodiscard]] std::vector<T> snapshot() const {
        return std::vector<T>(items_.begin(), items_.end());
    }

private:
    size_t capacity_;
    std::deque<T> items_;
};

} // namespace math
