#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <vector>

#include "core/Frame.hpp"

namespace core {

/**
 * Single-slot, always-freshest frame buffer.
 *
 * One producer publishes, any number of consumers wait. There is no queue:
 * publishing replaces the current frame, so a consumer that falls behind
 * skips straight to the newest frame instead of replaying stale ones.
 *
 * Each consumer tracks the sequence number it saw last and passes it to
 * waitNext(). The buffer keeps no per-consumer state.
 *
 * The mutex only covers the slot swap and the copy-out of the shared
 * payload pointer. It is never held while a consumer writes to a socket.
 */
class LatestFrameBuffer {
public:
    LatestFrameBuffer();

    // Non-copyable
    LatestFrameBuffer(const LatestFrameBuffer&) = delete;
    LatestFrameBuffer& operator=(const LatestFrameBuffer&) = delete;

    /**
     * Stores payload as the current frame and wakes every waiter.
     * Never blocks on consumers. Empty payloads are valid frames.
     * @return sequence number assigned to the frame
     */
    uint64_t publish(std::vector<uint8_t> payload);

    /**
     * Blocks until a frame newer than lastSeen exists, the timeout elapses
     * or the buffer is closed.
     * @param lastSeen sequence of the last frame this consumer received (0 = none)
     * @return the latest frame, or std::nullopt on timeout/close
     */
    std::optional<Frame> waitNext(uint64_t lastSeen, std::chrono::milliseconds timeout);

    /**
     * Non-blocking read of the current frame.
     */
    [[nodiscard]] std::optional<Frame> latest() const;

    /**
     * Total publishes divided by seconds since construction.
     */
    [[nodiscard]] double snapshotFPS() const;

    [[nodiscard]] uint64_t frameCount() const;

    /**
     * Wakes all waiters for good. waitNext() returns std::nullopt from now on.
     */
    void close();

    [[nodiscard]] bool isClosed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable frameCv_;

    Frame current_;
    uint64_t sequence_ = 0; // Doubles as the publish counter
    bool closed_ = false;

    const std::chrono::steady_clock::time_point startTime_;
};

} // namespace core
