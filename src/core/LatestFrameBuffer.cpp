#include "core/LatestFrameBuffer.hpp"

#include <memory>

namespace core {

LatestFrameBuffer::LatestFrameBuffer()
    : startTime_(std::chrono::steady_clock::now()) {
}

uint64_t LatestFrameBuffer::publish(std::vector<uint8_t> payload) {
    // Allocate outside the lock
    auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(payload));
    auto now = std::chrono::steady_clock::now();

    uint64_t sequence;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sequence = ++sequence_;
        current_.payload = std::move(shared);
        current_.sequence = sequence;
        current_.producedAt = now;
    }
    frameCv_.notify_all();
    return sequence;
}

std::optional<Frame> LatestFrameBuffer::waitNext(uint64_t lastSeen, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    bool ready = frameCv_.wait_for(lock, timeout, [this, lastSeen] {
        return closed_ || sequence_ > lastSeen;
    });

    if (!ready || closed_) {
        return std::nullopt;
    }
    return current_;
}

std::optional<Frame> LatestFrameBuffer::latest() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sequence_ == 0) {
        return std::nullopt;
    }
    return current_;
}

double LatestFrameBuffer::snapshotFPS() const {
    uint64_t count = frameCount();
    double elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - startTime_).count();
    return elapsed > 0.0 ? static_cast<double>(count) / elapsed : 0.0;
}

uint64_t LatestFrameBuffer::frameCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sequence_;
}

void LatestFrameBuffer::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    frameCv_.notify_all();
}

bool LatestFrameBuffer::isClosed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace core
