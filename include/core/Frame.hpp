#pragma once

#include <memory>
#include <cstdint>
#include <chrono>
#include <vector>

namespace core {

/**
 * One encoded image (JPEG) as published by the capture producer.
 *
 * The payload bytes are immutable and shared: copying a Frame only copies the
 * pointer, so a consumer can keep writing its copy to a socket while the
 * buffer has already moved on to a newer frame.
 */
struct Frame {
    std::shared_ptr<const std::vector<uint8_t>> payload;

    uint64_t sequence = 0; // 1 for the first published frame, never reused

    std::chrono::steady_clock::time_point producedAt;

    [[nodiscard]] size_t size() const { return payload ? payload->size() : 0; }
    [[nodiscard]] const uint8_t* data() const { return payload ? payload->data() : nullptr; }
};

} // namespace core
